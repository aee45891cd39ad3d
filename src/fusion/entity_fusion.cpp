#include "fusion/entity_fusion.hpp"
#include "fusion/property_merge.hpp"
#include "similarity/text_utils.hpp"
#include <algorithm>
#include <iostream>
#include <map>
#include <set>
#include <stdexcept>

using json = nlohmann::json;

namespace kgf {

namespace {

bool is_abbreviation(const std::string& name) {
    return text::is_upper(name) && text::utf8_length(name) <= 5;
}

std::vector<std::string> unique_in_order(const std::vector<std::string>& values) {
    std::vector<std::string> unique;
    for (const auto& value : values) {
        append_unique(unique, value);
    }
    return unique;
}

}  // namespace

EntityFusionEngine::EntityFusionEngine(
    double similarity_threshold,
    ClusteringMode mode,
    size_t workers
) : similarity_threshold_(similarity_threshold),
    mode_(mode),
    workers_(workers == 0 ? 1 : workers) {
    if (similarity_threshold < 0.0 || similarity_threshold > 1.0) {
        throw std::invalid_argument("Entity similarity threshold must be between 0.0 and 1.0");
    }
}

void EntityFusionEngine::set_similarity_threshold(double threshold) {
    if (threshold < 0.0 || threshold > 1.0) {
        throw std::invalid_argument("Entity similarity threshold must be between 0.0 and 1.0");
    }
    similarity_threshold_ = threshold;
}

// ============================================================================
// Clustering
// ============================================================================

std::vector<std::vector<size_t>> EntityFusionEngine::group(const std::vector<Entity>& entities) const {
    return cluster_items(
        mode_, entities.size(),
        [&](size_t i, size_t j) {
            return calculator_.entity_similarity(entities[i], entities[j]) >= similarity_threshold_;
        },
        workers_
    );
}

std::vector<std::vector<size_t>> EntityFusionEngine::identify_duplicates(
    const std::vector<Entity>& entities
) const {
    std::vector<std::vector<size_t>> duplicates;
    if (entities.size() <= 1) return duplicates;

    for (auto& cluster : group(entities)) {
        if (cluster.size() > 1) {
            duplicates.push_back(std::move(cluster));
        }
    }
    return duplicates;
}

std::vector<EntityCluster> EntityFusionEngine::cluster_entities(
    const std::vector<Entity>& entities
) const {
    std::vector<EntityCluster> clusters;
    auto groups = group(entities);
    clusters.reserve(groups.size());

    for (size_t c = 0; c < groups.size(); ++c) {
        EntityCluster cluster;
        cluster.cluster_id = "entity_cluster_" + std::to_string(c);
        for (size_t index : groups[c]) {
            cluster.members.push_back(entities[index]);
        }

        if (cluster.members.size() == 1) {
            cluster.representative_index = 0;
            cluster.confidence = 1.0;
            cluster.method = "single_entity";
        } else {
            cluster.representative_index = select_representative(cluster.members);
            cluster.confidence = cluster_confidence(cluster.members);
            cluster.method = "similarity_based";
        }

        clusters.push_back(std::move(cluster));
    }

    return clusters;
}

double EntityFusionEngine::cluster_confidence(const std::vector<Entity>& members) const {
    if (members.size() <= 1) return 1.0;

    double total = 0.0;
    size_t comparisons = 0;
    for (size_t i = 0; i < members.size(); ++i) {
        for (size_t j = i + 1; j < members.size(); ++j) {
            total += calculator_.entity_similarity(members[i], members[j]);
            comparisons++;
        }
    }
    return comparisons > 0 ? total / comparisons : 0.0;
}

double EntityFusionEngine::representative_score(const Entity& entity) {
    double score = 0.0;
    score += 0.1 * static_cast<double>(text::utf8_length(entity.name));
    score += 0.2 * static_cast<double>(entity.properties.size());
    score += 0.1 * static_cast<double>(entity.aliases.size());
    score += 0.5 * entity.declared_confidence().value_or(0.0);
    return score;
}

size_t EntityFusionEngine::select_representative(const std::vector<Entity>& members) const {
    size_t best = 0;
    double best_score = 0.0;

    for (size_t i = 0; i < members.size(); ++i) {
        double score = representative_score(members[i]);
        if (i == 0 || score > best_score) {
            best = i;
            best_score = score;
        }
    }
    return best;
}

// ============================================================================
// Fusion
// ============================================================================

EntityFusionResult EntityFusionEngine::fuse_cluster(const EntityCluster& cluster) const {
    if (cluster.members.empty()) {
        throw std::invalid_argument("Cannot fuse an empty entity cluster");
    }

    EntityFusionResult result;
    result.sources = cluster.members;

    if (cluster.members.size() == 1) {
        result.fused = cluster.members.front();
        result.confidence = 1.0;
        result.evidence = {{"method", "no_fusion_needed"}};
        return result;
    }

    const auto& members = cluster.members;
    std::vector<std::string> names;
    std::vector<std::string> types;
    std::vector<Properties> property_maps;
    std::vector<std::string> source_ids;
    for (const auto& member : members) {
        names.push_back(member.name);
        types.push_back(member.type);
        property_maps.push_back(member.properties);
        source_ids.push_back(member.id);
    }

    Entity fused;
    fused.id = cluster.representative().id;
    fused.name = fuse_names(names);
    fused.type = fuse_types(types);
    fused.properties = fuse_properties(property_maps);
    fused.aliases = fuse_aliases(members, fused.name);

    result.fused = fused;
    result.confidence = fusion_confidence(members, fused);
    result.evidence = {
        {"method", "multi_entity_fusion"},
        {"source_count", members.size()},
        {"cluster_confidence", cluster.confidence},
        {"source_ids", source_ids},
        {"representative_id", fused.id}
    };
    return result;
}

std::vector<EntityFusionResult> EntityFusionEngine::batch_fuse(
    const std::vector<Entity>& entities
) const {
    std::vector<EntityFusionResult> results;
    for (const auto& cluster : cluster_entities(entities)) {
        results.push_back(fuse_cluster(cluster));
    }
    return results;
}

std::string EntityFusionEngine::fuse_names(const std::vector<std::string>& names) const {
    if (names.empty()) return "";

    auto unique = unique_in_order(names);
    if (unique.size() == 1) return unique.front();

    std::string best;
    size_t best_length = 0;
    bool found = false;
    for (const auto& name : unique) {
        if (is_abbreviation(name)) continue;
        size_t length = text::utf8_length(name);
        if (!found || length > best_length) {
            best = name;
            best_length = length;
            found = true;
        }
    }
    if (found) return best;

    return merge::most_frequent_string(names);
}

std::string EntityFusionEngine::fuse_types(const std::vector<std::string>& types) const {
    if (types.empty()) return "Unknown";

    std::map<std::string, size_t> counts;
    for (const auto& type : types) {
        counts[type]++;
    }

    std::string best;
    size_t best_count = 0;
    size_t best_length = 0;
    for (const auto& type : unique_in_order(types)) {
        size_t count = counts[type];
        size_t length = text::utf8_length(type);
        if (count > best_count || (count == best_count && length > best_length)) {
            best = type;
            best_count = count;
            best_length = length;
        }
    }
    return best;
}

Properties EntityFusionEngine::fuse_properties(const std::vector<Properties>& property_maps) const {
    std::map<std::string, std::vector<PropertyValue>> values_by_key;
    for (const auto& properties : property_maps) {
        for (const auto& [key, value] : properties) {
            values_by_key[key].push_back(value);
        }
    }

    Properties fused;
    for (const auto& [key, values] : values_by_key) {
        fused[key] = fuse_property_values(values);
    }
    return fused;
}

PropertyValue EntityFusionEngine::fuse_property_values(const std::vector<PropertyValue>& values) const {
    if (values.empty()) return PropertyValue();
    if (values.size() == 1) return values.front();

    if (merge::all_of_kind(values, PropertyValue::Kind::String)) {
        return merge::longest_string(values);
    }
    if (merge::all_of_kind(values, PropertyValue::Kind::Number)) {
        return merge::mean(values);
    }
    if (merge::all_of_kind(values, PropertyValue::Kind::List)) {
        return merge::list_union(values);
    }
    return merge::most_frequent(values);
}

std::vector<std::string> EntityFusionEngine::fuse_aliases(
    const std::vector<Entity>& members,
    const std::string& fused_name
) const {
    std::vector<std::string> aliases;
    for (const auto& member : members) {
        for (const auto& alias : member.aliases) {
            if (alias != fused_name) append_unique(aliases, alias);
        }
        if (member.name != fused_name) {
            append_unique(aliases, member.name);
        }
    }
    return aliases;
}

double EntityFusionEngine::fusion_confidence(
    const std::vector<Entity>& sources,
    const Entity& fused
) const {
    if (sources.size() <= 1) return 1.0;

    double source_factor = std::min(1.0, static_cast<double>(sources.size()) / 5.0);

    size_t total_properties = 0;
    std::set<std::string> names;
    std::set<std::string> types;
    for (const auto& source : sources) {
        total_properties += source.properties.size();
        names.insert(source.name);
        types.insert(source.type);
    }

    double completeness = total_properties > 0
        ? static_cast<double>(fused.properties.size()) / total_properties
        : 0.5;

    double consistency = ((names.size() == 1 ? 1.0 : 0.0) + (types.size() == 1 ? 1.0 : 0.0)) / 2.0;

    double confidence = 0.3 * source_factor + 0.4 * completeness + 0.3 * consistency;
    return std::max(0.0, std::min(1.0, confidence));
}

// ============================================================================
// Reporting
// ============================================================================

FusionStatistics EntityFusionEngine::get_statistics(
    const std::vector<EntityFusionResult>& results
) const {
    return compute_fusion_statistics(results);
}

void EntityFusionEngine::print_results(
    const std::vector<EntityFusionResult>& results,
    size_t examples
) const {
    get_statistics(results).print_summary("Entity fusion results");

    std::cout << "\nFusion examples:\n";
    for (size_t i = 0; i < results.size() && i < examples; ++i) {
        const auto& result = results[i];
        std::cout << "  " << result.fused.name << " <- ";
        for (size_t s = 0; s < result.sources.size(); ++s) {
            if (s > 0) std::cout << ", ";
            std::cout << result.sources[s].name;
        }
        std::cout << " (confidence: " << result.confidence << ")\n";
    }
}

} // namespace kgf
