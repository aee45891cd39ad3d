#pragma once

#include "model/types.hpp"
#include <map>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace kgf {

// ============================================================================
// Extraction Candidates
// ============================================================================

/**
 * @brief Entity mention produced by an upstream extractor
 */
struct ExtractedEntity {
    std::string text;                       ///< Surface form
    std::string type;
    int start_pos = 0;                      ///< Offset of the mention in the source text
    int end_pos = 0;
    double confidence = 1.0;
    std::string context;

    nlohmann::json to_json() const;
    static ExtractedEntity from_json(const nlohmann::json& j);
};

/**
 * @brief Relation mention; endpoints are surface forms, not ids
 */
struct ExtractedRelation {
    std::string head_entity;
    std::string relation_type;
    std::string tail_entity;
    double confidence = 1.0;
    std::string context;
    int start_pos = 0;
    int end_pos = 0;

    nlohmann::json to_json() const;
    static ExtractedRelation from_json(const nlohmann::json& j);
};

/**
 * @brief Canonical records built from one batch of candidates
 */
struct MappingResult {
    std::vector<Entity> entities;
    std::vector<Relation> relations;
    std::map<std::string, std::string> name_to_id;     ///< Surface form -> entity id
    size_t unresolved_relations = 0;                   ///< Skipped: endpoint name not found

    nlohmann::json to_json() const;
};

// ============================================================================
// Candidate Mapper
// ============================================================================

/**
 * @brief Converts extraction candidates into canonical entities and relations
 *
 * Ids are positional ("entity_0", "entity_1", ... and "relation_0", ...), so
 * the same input always maps to the same records. Each entity keeps its
 * extraction confidence, context and "start-end" source position as
 * properties. Relation endpoints are looked up by entity surface form; when
 * two candidates share a surface form the first one owns it.
 */
class CandidateMapper {
public:
    explicit CandidateMapper(
        std::string entity_prefix = "entity_",
        std::string relation_prefix = "relation_"
    );

    std::vector<Entity> map_entities(const std::vector<ExtractedEntity>& candidates) const;

    /**
     * @brief Map relations, resolving endpoints through `name_to_id`
     *
     * @param candidates Relation candidates
     * @param name_to_id Surface form -> entity id
     * @param unresolved Incremented once per skipped candidate (optional)
     * @return Relations whose head and tail both resolved; the id index
     *         counts every candidate, skipped ones included
     */
    std::vector<Relation> map_relations(
        const std::vector<ExtractedRelation>& candidates,
        const std::map<std::string, std::string>& name_to_id,
        size_t* unresolved = nullptr
    ) const;

    /**
     * @brief Map entities, index their names, then map relations
     */
    MappingResult map(
        const std::vector<ExtractedEntity>& entities,
        const std::vector<ExtractedRelation>& relations
    ) const;

    /**
     * @brief Name and alias -> id, first entity wins a shared name
     */
    static std::map<std::string, std::string> build_name_index(const std::vector<Entity>& entities);

    void set_verbose(bool verbose) { verbose_ = verbose; }

private:
    std::string entity_prefix_;
    std::string relation_prefix_;
    bool verbose_ = false;
};

} // namespace kgf
