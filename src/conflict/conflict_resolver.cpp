#include "conflict/conflict_resolver.hpp"
#include "fusion/property_merge.hpp"
#include "model/errors.hpp"
#include "similarity/text_utils.hpp"
#include <algorithm>
#include <iomanip>
#include <iostream>
#include <set>
#include <sstream>

namespace kgf {

namespace {

size_t argmax(const std::vector<double>& scores) {
    size_t best = 0;
    for (size_t i = 1; i < scores.size(); ++i) {
        if (scores[i] > scores[best]) best = i;
    }
    return best;
}

// Relations vote by type, values by canonical string
std::string item_key(const ConflictItem& item) {
    if (const auto* value = std::get_if<PropertyValue>(&item)) {
        return value->to_string();
    }
    return std::get<Relation>(item).type;
}

Resolution resolve_by_vote(const Conflict& conflict) {
    std::vector<std::string> keys;
    for (const auto& item : conflict.conflicting_items) {
        keys.push_back(item_key(item));
    }

    size_t count = 0;
    std::string winner = merge::most_frequent_string(keys, &count);

    Resolution resolution;
    for (size_t i = 0; i < keys.size(); ++i) {
        if (keys[i] == winner) {
            resolution.value = conflict.conflicting_items[i];
            break;
        }
    }
    resolution.confidence = static_cast<double>(count) / keys.size();
    return resolution;
}

Resolution resolve_by_longest(const Conflict& conflict, double confidence) {
    size_t best = 0;
    size_t best_length = 0;
    for (size_t i = 0; i < conflict.conflicting_items.size(); ++i) {
        size_t length = text::utf8_length(item_key(conflict.conflicting_items[i]));
        if (i == 0 || length > best_length) {
            best = i;
            best_length = length;
        }
    }
    return Resolution{conflict.conflicting_items[best], confidence, false};
}

std::vector<PropertyValue> value_items(const Conflict& conflict) {
    std::vector<PropertyValue> values;
    for (const auto& item : conflict.conflicting_items) {
        const auto* value = std::get_if<PropertyValue>(&item);
        if (!value) {
            throw ConflictResolutionFailure(
                "Conflict " + conflict.conflict_id + " does not carry property values");
        }
        values.push_back(*value);
    }
    return values;
}

std::string relation_subject(const std::string& head, const std::string& tail) {
    return head + "|" + tail;
}

}  // namespace

ConflictResolver::ConflictResolver(bool verbose) : verbose_(verbose) {
    strategies_[ConflictType::ENTITY_NAME_CONFLICT] = {
        "highest_confidence", "most_frequent", "longest_name", "manual_review"
    };
    strategies_[ConflictType::ENTITY_TYPE_CONFLICT] = {
        "most_specific_type", "highest_confidence", "vote"
    };
    strategies_[ConflictType::PROPERTY_VALUE_CONFLICT] = {
        "highest_confidence", "vote", "average_numeric", "union_lists"
    };
    strategies_[ConflictType::RELATION_TYPE_CONFLICT] = {
        "highest_confidence", "most_frequent", "manual_review"
    };
    strategies_[ConflictType::TEMPORAL_CONFLICT] = {
        "highest_confidence"
    };
    strategies_[ConflictType::CONTRADICTORY_RELATIONS] = {
        "highest_confidence", "source_authority", "manual_review"
    };
}

// ============================================================================
// Detection
// ============================================================================

std::vector<Conflict> ConflictResolver::detect_entity_conflicts(
    const std::vector<Entity>& entities
) const {
    std::vector<std::string> id_order;
    std::map<std::string, std::vector<const Entity*>> groups;
    for (const auto& entity : entities) {
        auto& group = groups[entity.id];
        if (group.empty()) id_order.push_back(entity.id);
        group.push_back(&entity);
    }

    std::vector<Conflict> conflicts;
    for (const auto& id : id_order) {
        const auto& group = groups[id];
        if (group.size() <= 1) continue;

        std::vector<double> confidences;
        std::set<std::string> names;
        std::set<std::string> types;
        for (const auto* entity : group) {
            confidences.push_back(entity->declared_confidence().value_or(1.0));
            names.insert(entity->name);
            types.insert(entity->type);
        }

        if (names.size() > 1) {
            Conflict conflict;
            conflict.conflict_id = "name_conflict_" + id;
            conflict.type = ConflictType::ENTITY_NAME_CONFLICT;
            conflict.description = "Entity " + id + " has multiple names";
            conflict.subject_id = id;
            for (const auto* entity : group) {
                conflict.conflicting_items.push_back(PropertyValue(entity->name));
            }
            conflict.confidence_scores = confidences;
            conflicts.push_back(std::move(conflict));
        }

        if (types.size() > 1) {
            Conflict conflict;
            conflict.conflict_id = "type_conflict_" + id;
            conflict.type = ConflictType::ENTITY_TYPE_CONFLICT;
            conflict.description = "Entity " + id + " has multiple types";
            conflict.subject_id = id;
            for (const auto* entity : group) {
                conflict.conflicting_items.push_back(PropertyValue(entity->type));
            }
            conflict.confidence_scores = confidences;
            conflicts.push_back(std::move(conflict));
        }

        std::map<std::string, std::vector<size_t>> holders;
        for (size_t i = 0; i < group.size(); ++i) {
            for (const auto& [key, value] : group[i]->properties) {
                holders[key].push_back(i);
            }
        }

        for (const auto& [key, members] : holders) {
            std::set<std::string> distinct;
            for (size_t i : members) {
                distinct.insert(group[i]->properties.at(key).to_string());
            }
            if (distinct.size() <= 1) continue;

            Conflict conflict;
            conflict.conflict_id = "property_conflict_" + id + "_" + key;
            conflict.type = ConflictType::PROPERTY_VALUE_CONFLICT;
            conflict.description = "Entity " + id + " has conflicting values for " + key;
            conflict.subject_id = id;
            conflict.property_key = key;
            for (size_t i : members) {
                conflict.conflicting_items.push_back(group[i]->properties.at(key));
                conflict.confidence_scores.push_back(confidences[i]);
            }
            conflicts.push_back(std::move(conflict));
        }
    }

    return conflicts;
}

std::vector<Conflict> ConflictResolver::detect_relation_conflicts(
    const std::vector<Relation>& relations
) const {
    std::vector<std::pair<std::string, std::string>> pair_order;
    std::map<std::pair<std::string, std::string>, std::vector<const Relation*>> groups;
    for (const auto& relation : relations) {
        auto key = std::make_pair(relation.head_entity_id, relation.tail_entity_id);
        auto& group = groups[key];
        if (group.empty()) pair_order.push_back(key);
        group.push_back(&relation);
    }

    std::vector<Conflict> conflicts;
    for (const auto& key : pair_order) {
        const auto& group = groups[key];
        if (group.size() <= 1) continue;

        std::vector<std::string> types;
        std::set<std::string> distinct;
        for (const auto* relation : group) {
            types.push_back(relation->type);
            distinct.insert(relation->type);
        }
        if (distinct.size() <= 1) continue;

        const std::string& head = key.first;
        const std::string& tail = key.second;

        Conflict conflict;
        conflict.subject_id = relation_subject(head, tail);
        for (const auto* relation : group) {
            conflict.confidence_scores.push_back(relation->confidence);
        }

        if (are_contradictory(types)) {
            conflict.conflict_id = "contradictory_relations_" + head + "_" + tail;
            conflict.type = ConflictType::CONTRADICTORY_RELATIONS;
            conflict.description = "Contradictory relations between " + head + " and " + tail;
            for (const auto* relation : group) {
                conflict.conflicting_items.push_back(*relation);
            }
        } else {
            conflict.conflict_id = "relation_type_conflict_" + head + "_" + tail;
            conflict.type = ConflictType::RELATION_TYPE_CONFLICT;
            conflict.description = "Multiple relation types between " + head + " and " + tail;
            for (const auto& type : types) {
                conflict.conflicting_items.push_back(PropertyValue(type));
            }
        }
        conflicts.push_back(std::move(conflict));
    }

    return conflicts;
}

const std::vector<std::pair<std::string, std::string>>& ConflictResolver::contradictory_pairs() {
    static const std::vector<std::pair<std::string, std::string>> pairs = {
        {"parent_of", "child_of"},
        {"spouse_of", "sibling_of"},
        {"works_for", "competes_with"},
        {"located_in", "not_located_in"}
    };
    return pairs;
}

bool ConflictResolver::are_contradictory(const std::vector<std::string>& relation_types) {
    std::set<std::string> types(relation_types.begin(), relation_types.end());
    for (const auto& [first, second] : contradictory_pairs()) {
        if (types.count(first) && types.count(second)) return true;
    }
    return false;
}

// ============================================================================
// Resolution
// ============================================================================

const std::vector<std::string>& ConflictResolver::get_strategies(ConflictType type) const {
    static const std::vector<std::string> empty;
    auto it = strategies_.find(type);
    return it != strategies_.end() ? it->second : empty;
}

void ConflictResolver::set_strategies(ConflictType type, const std::vector<std::string>& strategies) {
    strategies_[type] = strategies;
}

void ConflictResolver::register_strategy(const std::string& name, ConflictStrategy strategy) {
    custom_strategies_[name] = std::move(strategy);
}

bool ConflictResolver::has_strategy(const std::string& name) const {
    static const std::set<std::string> builtin = {
        "highest_confidence", "most_frequent", "vote", "longest_name",
        "most_specific_type", "average_numeric", "union_lists",
        "source_authority", "manual_review"
    };
    return custom_strategies_.count(name) > 0 || builtin.count(name) > 0;
}

Resolution ConflictResolver::apply_strategy(const Conflict& conflict, const std::string& strategy) const {
    if (conflict.conflicting_items.empty()) {
        throw ConflictResolutionFailure("Conflict " + conflict.conflict_id + " has no items");
    }
    if (conflict.confidence_scores.size() != conflict.conflicting_items.size()) {
        throw ConflictResolutionFailure(
            "Conflict " + conflict.conflict_id + " has " +
            std::to_string(conflict.confidence_scores.size()) + " scores for " +
            std::to_string(conflict.conflicting_items.size()) + " items");
    }

    auto custom = custom_strategies_.find(strategy);
    if (custom != custom_strategies_.end()) {
        return custom->second(conflict);
    }

    const auto& items = conflict.conflicting_items;
    const ConflictType type = conflict.type;
    Resolution first_item{items.front(), 0.5, false};

    if (strategy == "highest_confidence") {
        size_t best = argmax(conflict.confidence_scores);
        return Resolution{items[best], conflict.confidence_scores[best], false};
    }

    if (strategy == "most_frequent" || strategy == "vote") {
        return resolve_by_vote(conflict);
    }

    if (strategy == "longest_name") {
        if (type != ConflictType::ENTITY_NAME_CONFLICT) return first_item;
        return resolve_by_longest(conflict, 0.7);
    }

    if (strategy == "most_specific_type") {
        if (type != ConflictType::ENTITY_TYPE_CONFLICT) return first_item;
        return resolve_by_longest(conflict, 0.8);
    }

    if (strategy == "average_numeric") {
        if (type != ConflictType::PROPERTY_VALUE_CONFLICT) return first_item;
        double total = 0.0;
        for (const auto& value : value_items(conflict)) {
            auto number = value.as_number();
            if (!number) return resolve_by_vote(conflict);
            total += *number;
        }
        return Resolution{PropertyValue(total / items.size()), 0.8, false};
    }

    if (strategy == "union_lists") {
        if (type != ConflictType::PROPERTY_VALUE_CONFLICT) return first_item;
        auto values = value_items(conflict);
        if (!merge::all_of_kind(values, PropertyValue::Kind::List)) {
            return resolve_by_vote(conflict);
        }
        return Resolution{merge::list_union(values), 0.9, false};
    }

    if (strategy == "source_authority") {
        if (type != ConflictType::CONTRADICTORY_RELATIONS) return first_item;
        return Resolution{items.front(), 0.6, false};
    }

    if (strategy == "manual_review") {
        return Resolution{std::nullopt, 0.0, true};
    }

    throw ConflictResolutionFailure("Unknown resolution strategy: " + strategy);
}

Conflict ConflictResolver::resolve(Conflict conflict, const std::string& strategy) {
    std::string chosen = strategy;
    if (chosen.empty()) {
        const auto& available = get_strategies(conflict.type);
        chosen = available.empty() ? "highest_confidence" : available.front();
    }
    conflict.resolution_strategy = chosen;

    try {
        Resolution resolution = apply_strategy(conflict, chosen);
        conflict.resolved_value = resolution.value;
        conflict.resolution_confidence = std::max(0.0, std::min(1.0, resolution.confidence));
        conflict.requires_review = resolution.requires_review;

        if (verbose_) {
            std::cout << "Resolved " << conflict.conflict_id << " with " << chosen;
            if (conflict.resolved_value) {
                std::cout << ": " << conflict_item_to_string(*conflict.resolved_value);
            } else {
                std::cout << ": pending review";
            }
            std::cout << "\n";
        }
    } catch (const std::exception& e) {
        std::cerr << "Failed to resolve conflict " << conflict.conflict_id
                  << ": " << e.what() << " (falling back to first item)\n";
        if (conflict.conflicting_items.empty()) {
            conflict.resolved_value.reset();
        } else {
            conflict.resolved_value = conflict.conflicting_items.front();
        }
        conflict.resolution_confidence = 0.1;
        conflict.requires_review = false;
    }

    history_.push_back(conflict);
    return conflict;
}

std::vector<Conflict> ConflictResolver::batch_resolve(
    const std::vector<Conflict>& conflicts,
    const std::map<ConflictType, std::string>& overrides
) {
    std::vector<Conflict> resolved;
    resolved.reserve(conflicts.size());

    for (const auto& conflict : conflicts) {
        auto it = overrides.find(conflict.type);
        resolved.push_back(resolve(conflict, it != overrides.end() ? it->second : ""));
    }
    return resolved;
}

// ============================================================================
// Applying Resolutions
// ============================================================================

std::vector<Entity> ConflictResolver::apply_entity_resolutions(
    const std::vector<Entity>& entities,
    const std::vector<Conflict>& conflicts
) const {
    std::map<std::string, const Conflict*> name_resolutions;
    std::map<std::string, const Conflict*> type_resolutions;
    std::map<std::string, std::map<std::string, const Conflict*>> property_resolutions;

    for (const auto& conflict : conflicts) {
        if (!conflict.is_resolved()) continue;
        if (!std::holds_alternative<PropertyValue>(*conflict.resolved_value)) continue;

        switch (conflict.type) {
            case ConflictType::ENTITY_NAME_CONFLICT:
                name_resolutions[conflict.subject_id] = &conflict;
                break;
            case ConflictType::ENTITY_TYPE_CONFLICT:
                type_resolutions[conflict.subject_id] = &conflict;
                break;
            case ConflictType::PROPERTY_VALUE_CONFLICT:
                property_resolutions[conflict.subject_id][conflict.property_key] = &conflict;
                break;
            default:
                break;
        }
    }

    std::vector<std::string> id_order;
    std::map<std::string, std::vector<const Entity*>> groups;
    for (const auto& entity : entities) {
        auto& group = groups[entity.id];
        if (group.empty()) id_order.push_back(entity.id);
        group.push_back(&entity);
    }

    std::vector<Entity> collapsed;
    collapsed.reserve(id_order.size());

    for (const auto& id : id_order) {
        const auto& group = groups[id];
        Entity merged = *group.front();
        if (group.size() == 1) {
            collapsed.push_back(merged);
            continue;
        }

        auto name_it = name_resolutions.find(id);
        if (name_it != name_resolutions.end()) {
            merged.name = std::get<PropertyValue>(*name_it->second->resolved_value).to_string();
        }
        auto type_it = type_resolutions.find(id);
        if (type_it != type_resolutions.end()) {
            merged.type = std::get<PropertyValue>(*type_it->second->resolved_value).to_string();
        }

        for (size_t i = 1; i < group.size(); ++i) {
            for (const auto& [key, value] : group[i]->properties) {
                merged.properties.emplace(key, value);
            }
        }
        auto props_it = property_resolutions.find(id);
        if (props_it != property_resolutions.end()) {
            for (const auto& [key, conflict] : props_it->second) {
                merged.properties[key] = std::get<PropertyValue>(*conflict->resolved_value);
            }
        }

        std::vector<std::string> aliases;
        for (const auto* entity : group) {
            for (const auto& alias : entity->aliases) {
                if (alias != merged.name) append_unique(aliases, alias);
            }
            if (entity->name != merged.name) append_unique(aliases, entity->name);
        }
        merged.aliases = aliases;

        collapsed.push_back(std::move(merged));
    }

    return collapsed;
}

std::vector<Relation> ConflictResolver::apply_relation_resolutions(
    const std::vector<Relation>& relations,
    const std::vector<Conflict>& conflicts
) const {
    std::set<std::string> dropped;

    for (const auto& conflict : conflicts) {
        if (conflict.type != ConflictType::CONTRADICTORY_RELATIONS) continue;
        if (!conflict.is_resolved()) continue;

        const auto* winner = std::get_if<Relation>(&*conflict.resolved_value);
        if (!winner) continue;

        for (const auto& item : conflict.conflicting_items) {
            const auto* relation = std::get_if<Relation>(&item);
            if (relation && relation->id != winner->id) {
                dropped.insert(relation->id);
            }
        }
    }

    std::vector<Relation> kept;
    for (const auto& relation : relations) {
        if (!dropped.count(relation.id)) kept.push_back(relation);
    }

    if (verbose_ && !dropped.empty()) {
        std::cout << "Dropped " << (relations.size() - kept.size())
                  << " contradicted relations\n";
    }
    return kept;
}

// ============================================================================
// Reporting
// ============================================================================

ConflictStatistics ConflictResolver::get_statistics(const std::vector<Conflict>& conflicts) const {
    ConflictStatistics stats;
    stats.total_conflicts = conflicts.size();

    double total_confidence = 0.0;
    for (const auto& conflict : conflicts) {
        stats.by_type[conflict_type_to_string(conflict.type)]++;
        if (conflict.requires_review) stats.review_count++;
        if (!conflict.is_resolved()) continue;

        stats.resolved_count++;
        total_confidence += conflict.resolution_confidence;
        if (conflict.resolution_confidence > 0.8) {
            stats.high_confidence_resolutions++;
        } else if (conflict.resolution_confidence >= 0.5) {
            stats.medium_confidence_resolutions++;
        } else {
            stats.low_confidence_resolutions++;
        }
    }

    if (stats.resolved_count > 0) {
        stats.average_resolution_confidence = total_confidence / stats.resolved_count;
    }
    return stats;
}

std::string ConflictResolver::generate_report(const std::vector<Conflict>& conflicts) const {
    auto stats = get_statistics(conflicts);
    std::ostringstream report;
    report << std::fixed << std::setprecision(2);

    report << "Conflict Resolution Report\n";
    report << std::string(50, '=') << "\n";
    report << "Total conflicts: " << stats.total_conflicts << "\n";
    report << "Resolved: " << stats.resolved_count << "\n";
    report << "Awaiting review: " << stats.review_count << "\n";
    report << "Average resolution confidence: " << stats.average_resolution_confidence << "\n";
    report << "High confidence resolutions: " << stats.high_confidence_resolutions << "\n\n";

    report << "By type:\n";
    for (const auto& [type, count] : stats.by_type) {
        report << "  " << type << ": " << count << "\n";
    }

    report << "\nExamples:\n";
    for (size_t i = 0; i < conflicts.size() && i < 5; ++i) {
        const auto& conflict = conflicts[i];
        report << "  " << (i + 1) << ". " << conflict.description << " - "
               << (conflict.is_resolved() ? "resolved" : "unresolved") << "\n";
        if (conflict.is_resolved()) {
            report << "     Resolution: " << conflict_item_to_string(*conflict.resolved_value)
                   << " (confidence: " << conflict.resolution_confidence << ")\n";
        }
    }

    return report.str();
}

void ConflictResolver::print_summary(const std::vector<Conflict>& conflicts) const {
    std::cout << generate_report(conflicts);
}

} // namespace kgf
