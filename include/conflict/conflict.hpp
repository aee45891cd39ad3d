#pragma once

#include "model/types.hpp"
#include <nlohmann/json.hpp>
#include <map>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace kgf {

// Conflict taxonomy
enum class ConflictType {
    ENTITY_NAME_CONFLICT,
    ENTITY_TYPE_CONFLICT,
    PROPERTY_VALUE_CONFLICT,
    RELATION_TYPE_CONFLICT,
    TEMPORAL_CONFLICT,          // Reserved: no detector emits it
    CONTRADICTORY_RELATIONS
};

inline std::string conflict_type_to_string(ConflictType type) {
    switch (type) {
        case ConflictType::ENTITY_NAME_CONFLICT: return "entity_name_conflict";
        case ConflictType::ENTITY_TYPE_CONFLICT: return "entity_type_conflict";
        case ConflictType::PROPERTY_VALUE_CONFLICT: return "property_value_conflict";
        case ConflictType::RELATION_TYPE_CONFLICT: return "relation_type_conflict";
        case ConflictType::TEMPORAL_CONFLICT: return "temporal_conflict";
        case ConflictType::CONTRADICTORY_RELATIONS: return "contradictory_relations";
    }
    return "unknown";
}

inline bool string_to_conflict_type(const std::string& s, ConflictType& type) {
    if (s == "entity_name_conflict" || s == "name") { type = ConflictType::ENTITY_NAME_CONFLICT; return true; }
    if (s == "entity_type_conflict" || s == "type") { type = ConflictType::ENTITY_TYPE_CONFLICT; return true; }
    if (s == "property_value_conflict" || s == "property") { type = ConflictType::PROPERTY_VALUE_CONFLICT; return true; }
    if (s == "relation_type_conflict") { type = ConflictType::RELATION_TYPE_CONFLICT; return true; }
    if (s == "temporal_conflict") { type = ConflictType::TEMPORAL_CONFLICT; return true; }
    if (s == "contradictory_relations") { type = ConflictType::CONTRADICTORY_RELATIONS; return true; }
    return false;
}

inline const std::vector<ConflictType>& all_conflict_types() {
    static const std::vector<ConflictType> types = {
        ConflictType::ENTITY_NAME_CONFLICT,
        ConflictType::ENTITY_TYPE_CONFLICT,
        ConflictType::PROPERTY_VALUE_CONFLICT,
        ConflictType::RELATION_TYPE_CONFLICT,
        ConflictType::TEMPORAL_CONFLICT,
        ConflictType::CONTRADICTORY_RELATIONS
    };
    return types;
}

/**
 * @brief One side of a conflict: a scalar/list value or a whole relation
 *
 * Name, type and property conflicts carry values; contradictory relation
 * conflicts carry the relations themselves.
 */
using ConflictItem = std::variant<PropertyValue, Relation>;

inline std::string conflict_item_to_string(const ConflictItem& item) {
    if (const auto* value = std::get_if<PropertyValue>(&item)) {
        return value->to_string();
    }
    const auto& relation = std::get<Relation>(item);
    return relation.head_entity_id + " -[" + relation.type + "]-> " + relation.tail_entity_id;
}

inline nlohmann::json conflict_item_to_json(const ConflictItem& item) {
    if (const auto* value = std::get_if<PropertyValue>(&item)) {
        return value->to_json();
    }
    return std::get<Relation>(item).to_json();
}

/**
 * @brief A detected contradiction and, once resolved, its outcome
 */
struct Conflict {
    std::string conflict_id;            // "name_conflict_e1", "property_conflict_e1_founded"
    ConflictType type = ConflictType::ENTITY_NAME_CONFLICT;
    std::string description;
    std::string subject_id;             // Entity id, or "head|tail" for relation conflicts
    std::string property_key;           // Property conflicts only
    std::vector<ConflictItem> conflicting_items;
    std::vector<double> confidence_scores;  // One per item

    // Filled in by ConflictResolver::resolve
    std::string resolution_strategy;
    std::optional<ConflictItem> resolved_value;
    double resolution_confidence = 0.0;
    bool requires_review = false;       // manual_review leaves the value unset

    bool is_resolved() const { return resolved_value.has_value(); }

    nlohmann::json to_json() const {
        nlohmann::json j;
        j["conflict_id"] = conflict_id;
        j["type"] = conflict_type_to_string(type);
        j["description"] = description;
        j["subject_id"] = subject_id;
        if (!property_key.empty()) j["property_key"] = property_key;

        j["conflicting_items"] = nlohmann::json::array();
        for (const auto& item : conflicting_items) {
            j["conflicting_items"].push_back(conflict_item_to_json(item));
        }
        j["confidence_scores"] = confidence_scores;

        if (!resolution_strategy.empty()) j["resolution_strategy"] = resolution_strategy;
        j["resolved_value"] = resolved_value ? conflict_item_to_json(*resolved_value) : nlohmann::json();
        j["resolution_confidence"] = resolution_confidence;
        j["requires_review"] = requires_review;
        return j;
    }
};

/**
 * @brief Summary of a set of conflicts
 */
struct ConflictStatistics {
    size_t total_conflicts = 0;
    std::map<std::string, size_t> by_type;
    size_t resolved_count = 0;
    size_t review_count = 0;
    size_t high_confidence_resolutions = 0;    // > 0.8
    size_t medium_confidence_resolutions = 0;  // [0.5, 0.8]
    size_t low_confidence_resolutions = 0;     // < 0.5
    double average_resolution_confidence = 0.0;

    nlohmann::json to_json() const {
        nlohmann::json j;
        j["total_conflicts"] = total_conflicts;
        j["by_type"] = by_type;
        j["resolved_count"] = resolved_count;
        j["review_count"] = review_count;
        j["high_confidence_resolutions"] = high_confidence_resolutions;
        j["medium_confidence_resolutions"] = medium_confidence_resolutions;
        j["low_confidence_resolutions"] = low_confidence_resolutions;
        j["average_resolution_confidence"] = average_resolution_confidence;
        return j;
    }
};

} // namespace kgf
