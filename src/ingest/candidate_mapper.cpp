#include "ingest/candidate_mapper.hpp"
#include <iostream>

namespace kgf {

namespace {

std::string source_position(int start_pos, int end_pos) {
    return std::to_string(start_pos) + "-" + std::to_string(end_pos);
}

}  // namespace

// ============================================================================
// Extraction Candidates
// ============================================================================

nlohmann::json ExtractedEntity::to_json() const {
    return {
        {"text", text},
        {"type", type},
        {"start_pos", start_pos},
        {"end_pos", end_pos},
        {"confidence", confidence},
        {"context", context}
    };
}

ExtractedEntity ExtractedEntity::from_json(const nlohmann::json& j) {
    ExtractedEntity entity;
    entity.text = j.at("text").get<std::string>();
    entity.type = j.value("type", std::string());
    entity.start_pos = j.value("start_pos", 0);
    entity.end_pos = j.value("end_pos", 0);
    entity.confidence = j.value("confidence", 1.0);
    entity.context = j.value("context", std::string());
    return entity;
}

nlohmann::json ExtractedRelation::to_json() const {
    return {
        {"head_entity", head_entity},
        {"relation_type", relation_type},
        {"tail_entity", tail_entity},
        {"confidence", confidence},
        {"context", context},
        {"start_pos", start_pos},
        {"end_pos", end_pos}
    };
}

ExtractedRelation ExtractedRelation::from_json(const nlohmann::json& j) {
    ExtractedRelation relation;
    relation.head_entity = j.at("head_entity").get<std::string>();
    relation.relation_type = j.at("relation_type").get<std::string>();
    relation.tail_entity = j.at("tail_entity").get<std::string>();
    relation.confidence = j.value("confidence", 1.0);
    relation.context = j.value("context", std::string());
    relation.start_pos = j.value("start_pos", 0);
    relation.end_pos = j.value("end_pos", 0);
    return relation;
}

nlohmann::json MappingResult::to_json() const {
    nlohmann::json j;
    j["entities"] = nlohmann::json::array();
    for (const auto& entity : entities) j["entities"].push_back(entity.to_json());
    j["relations"] = nlohmann::json::array();
    for (const auto& relation : relations) j["relations"].push_back(relation.to_json());
    j["unresolved_relations"] = unresolved_relations;
    return j;
}

// ============================================================================
// Candidate Mapper
// ============================================================================

CandidateMapper::CandidateMapper(std::string entity_prefix, std::string relation_prefix)
    : entity_prefix_(std::move(entity_prefix)),
      relation_prefix_(std::move(relation_prefix)) {}

std::vector<Entity> CandidateMapper::map_entities(const std::vector<ExtractedEntity>& candidates) const {
    std::vector<Entity> entities;
    entities.reserve(candidates.size());

    for (size_t i = 0; i < candidates.size(); ++i) {
        const auto& candidate = candidates[i];

        Properties properties;
        properties["confidence"] = candidate.confidence;
        properties["context"] = candidate.context;
        properties["source_position"] = source_position(candidate.start_pos, candidate.end_pos);

        entities.emplace_back(entity_prefix_ + std::to_string(i), candidate.text, candidate.type,
                              std::move(properties));
    }

    return entities;
}

std::vector<Relation> CandidateMapper::map_relations(
    const std::vector<ExtractedRelation>& candidates,
    const std::map<std::string, std::string>& name_to_id,
    size_t* unresolved
) const {
    std::vector<Relation> relations;

    for (size_t i = 0; i < candidates.size(); ++i) {
        const auto& candidate = candidates[i];

        auto head = name_to_id.find(candidate.head_entity);
        auto tail = name_to_id.find(candidate.tail_entity);
        if (head == name_to_id.end() || tail == name_to_id.end()) {
            if (unresolved) (*unresolved)++;
            if (verbose_) {
                std::cerr << "Skipping relation candidate " << candidate.head_entity << " -["
                          << candidate.relation_type << "]-> " << candidate.tail_entity
                          << ": unknown endpoint\n";
            }
            continue;
        }

        Properties properties;
        properties["context"] = candidate.context;
        properties["source_position"] = source_position(candidate.start_pos, candidate.end_pos);

        relations.emplace_back(relation_prefix_ + std::to_string(i), candidate.relation_type,
                               head->second, tail->second, candidate.confidence,
                               std::move(properties));
    }

    return relations;
}

MappingResult CandidateMapper::map(
    const std::vector<ExtractedEntity>& entities,
    const std::vector<ExtractedRelation>& relations
) const {
    MappingResult result;
    result.entities = map_entities(entities);
    result.name_to_id = build_name_index(result.entities);
    result.relations = map_relations(relations, result.name_to_id, &result.unresolved_relations);

    if (verbose_) {
        std::cout << "Mapped " << result.entities.size() << " entities and "
                  << result.relations.size() << " relations ("
                  << result.unresolved_relations << " unresolved)\n";
    }

    return result;
}

std::map<std::string, std::string> CandidateMapper::build_name_index(const std::vector<Entity>& entities) {
    std::map<std::string, std::string> index;
    for (const auto& entity : entities) {
        index.emplace(entity.name, entity.id);
        for (const auto& alias : entity.aliases) {
            index.emplace(alias, entity.id);
        }
    }
    return index;
}

} // namespace kgf
