#include "graph/knowledge_graph.hpp"
#include "model/errors.hpp"
#include <algorithm>
#include <iostream>
#include <queue>
#include <stack>

namespace kgf {

namespace {

std::vector<std::string> entity_names(const Entity& entity) {
    std::vector<std::string> names;
    if (!entity.name.empty()) names.push_back(entity.name);
    for (const auto& alias : entity.aliases) {
        if (!alias.empty()) append_unique(names, alias);
    }
    return names;
}

bool carries_name(const Entity& entity, const std::string& name) {
    if (entity.name == name) return true;
    return std::find(entity.aliases.begin(), entity.aliases.end(), name) != entity.aliases.end();
}

template <typename Key>
void erase_member(std::map<Key, std::set<std::string>>& index, const Key& key, const std::string& member) {
    auto it = index.find(key);
    if (it == index.end()) return;
    it->second.erase(member);
    if (it->second.empty()) index.erase(it);
}

// First "<id>_<n>" not in `taken`; the result is added to `taken`
std::string unique_merge_id(const std::string& id, std::set<std::string>& taken) {
    for (size_t n = 1;; ++n) {
        std::string candidate = id + "_" + std::to_string(n);
        if (taken.insert(candidate).second) return candidate;
    }
}

}  // namespace

// ==========================================
// Report Types
// ==========================================

nlohmann::json GraphStatistics::to_json() const {
    nlohmann::json j;
    j["entity_count"] = num_entities;
    j["relation_count"] = num_relations;
    j["entity_types"] = entity_types;
    j["relation_types"] = relation_types;
    j["avg_degree"] = avg_degree;
    j["max_degree"] = max_degree;
    j["isolated_entities"] = isolated_entities;
    j["connected_components"] = connected_components;
    j["largest_component"] = largest_component;
    j["density"] = density;
    return j;
}

const char* validation_issue_kind_to_string(ValidationIssue::Kind kind) {
    switch (kind) {
        case ValidationIssue::Kind::OrphanedRelation: return "orphaned_relation";
        case ValidationIssue::Kind::OntologyMismatch: return "ontology_mismatch";
    }
    return "unknown";
}

nlohmann::json ValidationIssue::to_json() const {
    nlohmann::json j;
    j["kind"] = validation_issue_kind_to_string(kind);
    j["relation_id"] = relation_id;
    if (!entity_id.empty()) j["entity_id"] = entity_id;
    j["message"] = message;
    return j;
}

size_t ValidationReport::count(ValidationIssue::Kind kind) const {
    return static_cast<size_t>(std::count_if(issues.begin(), issues.end(),
        [kind](const ValidationIssue& issue) { return issue.kind == kind; }));
}

nlohmann::json ValidationReport::to_json() const {
    nlohmann::json j;
    j["valid"] = is_valid();
    j["issues"] = nlohmann::json::array();
    for (const auto& issue : issues) {
        j["issues"].push_back(issue.to_json());
    }
    j["statistics"] = statistics.to_json();
    return j;
}

nlohmann::json IngestReport::to_json() const {
    nlohmann::json j;
    j["entities_added"] = entities_added;
    j["entities_skipped"] = entities_skipped;
    j["relations_added"] = relations_added;
    j["relations_skipped"] = relations_skipped;
    j["skipped_relation_ids"] = skipped_relation_ids;
    return j;
}

nlohmann::json MergeReport::to_json() const {
    nlohmann::json j;
    j["entities_before"] = entities_before;
    j["entities_after"] = entities_after;
    j["relations_before"] = relations_before;
    j["relations_after"] = relations_after;
    j["dropped_relations"] = dropped_relations;
    j["renamed_entities"] = renamed_entities;
    j["renamed_relations"] = renamed_relations;
    j["id_remap"] = id_remap;
    j["other_id_remap"] = other_id_remap;
    j["entity_fusion"] = entity_fusion.to_json();
    j["relation_fusion"] = relation_fusion.to_json();
    return j;
}

// ==========================================
// KnowledgeGraphStore Implementation
// ==========================================

KnowledgeGraphStore::KnowledgeGraphStore(std::shared_ptr<const Ontology> ontology)
    : ontology_(std::move(ontology)) {}

void KnowledgeGraphStore::add_entity(const Entity& entity) {
    auto existing = entities_.find(entity.id);
    if (existing != entities_.end()) {
        unindex_entity(existing->second);
        existing->second = entity;
    } else {
        entities_.emplace(entity.id, entity);
    }
    index_entity(entity);
}

void KnowledgeGraphStore::add_relation(const Relation& relation) {
    // Refuse before touching anything
    if (!has_entity(relation.head_entity_id)) {
        throw ValidationError(relation.id, relation.head_entity_id);
    }
    if (!has_entity(relation.tail_entity_id)) {
        throw ValidationError(relation.id, relation.tail_entity_id);
    }

    auto existing = relations_.find(relation.id);
    if (existing != relations_.end()) {
        unindex_relation(existing->second);
        existing->second = relation;
    } else {
        relations_.emplace(relation.id, relation);
    }
    index_relation(relation);
}

bool KnowledgeGraphStore::remove_entity(const std::string& entity_id) {
    auto it = entities_.find(entity_id);
    if (it == entities_.end()) {
        return false;
    }

    // Remove all incident relations
    std::set<std::string> incident;
    auto out = outgoing_.find(entity_id);
    if (out != outgoing_.end()) incident.insert(out->second.begin(), out->second.end());
    auto in = incoming_.find(entity_id);
    if (in != incoming_.end()) incident.insert(in->second.begin(), in->second.end());

    for (const auto& relation_id : incident) {
        remove_relation(relation_id);
    }

    Entity removed = it->second;
    entities_.erase(it);
    unindex_entity(removed);
    return true;
}

bool KnowledgeGraphStore::remove_relation(const std::string& relation_id) {
    auto it = relations_.find(relation_id);
    if (it == relations_.end()) {
        return false;
    }

    unindex_relation(it->second);
    relations_.erase(it);
    return true;
}

size_t KnowledgeGraphStore::batch_add_entities(const std::vector<Entity>& entities) {
    for (const auto& entity : entities) {
        add_entity(entity);
    }
    return entities.size();
}

IngestReport KnowledgeGraphStore::batch_add_relations(const std::vector<Relation>& relations) {
    IngestReport report;
    for (const auto& relation : relations) {
        try {
            add_relation(relation);
            report.relations_added++;
        } catch (const ValidationError& e) {
            report.relations_skipped++;
            report.skipped_relation_ids.push_back(relation.id);
            if (verbose_) {
                std::cerr << "Skipping relation: " << e.what() << "\n";
            }
        }
    }
    return report;
}

IngestReport KnowledgeGraphStore::ingest(
    const std::vector<Entity>& entities,
    const std::vector<Relation>& relations
) {
    size_t added = batch_add_entities(entities);
    IngestReport report = batch_add_relations(relations);
    report.entities_added = added;
    return report;
}

const Entity* KnowledgeGraphStore::get_entity(const std::string& entity_id) const {
    auto it = entities_.find(entity_id);
    return it != entities_.end() ? &it->second : nullptr;
}

const Entity* KnowledgeGraphStore::get_entity_by_name(const std::string& name) const {
    auto it = name_index_.find(name);
    if (it == name_index_.end()) return nullptr;
    return get_entity(it->second);
}

const Relation* KnowledgeGraphStore::get_relation(const std::string& relation_id) const {
    auto it = relations_.find(relation_id);
    return it != relations_.end() ? &it->second : nullptr;
}

std::vector<Entity> KnowledgeGraphStore::get_entities_by_type(const std::string& type) const {
    std::vector<Entity> result;
    auto it = entity_type_index_.find(type);
    if (it == entity_type_index_.end()) return result;

    for (const auto& id : it->second) {
        result.push_back(entities_.at(id));
    }
    return result;
}

std::vector<Relation> KnowledgeGraphStore::get_relations_by_type(const std::string& type) const {
    std::vector<Relation> result;
    auto it = relation_type_index_.find(type);
    if (it == relation_type_index_.end()) return result;

    for (const auto& id : it->second) {
        result.push_back(relations_.at(id));
    }
    return result;
}

std::vector<Relation> KnowledgeGraphStore::get_relations_between(
    const std::string& head_id,
    const std::string& tail_id
) const {
    std::vector<Relation> result;
    auto it = pair_index_.find(EntityPair(head_id, tail_id));
    if (it == pair_index_.end()) return result;

    for (const auto& id : it->second) {
        result.push_back(relations_.at(id));
    }
    return result;
}

std::vector<Entity> KnowledgeGraphStore::get_all_entities() const {
    std::vector<Entity> result;
    result.reserve(entities_.size());
    for (const auto& [id, entity] : entities_) {
        result.push_back(entity);
    }
    return result;
}

std::vector<Relation> KnowledgeGraphStore::get_all_relations() const {
    std::vector<Relation> result;
    result.reserve(relations_.size());
    for (const auto& [id, relation] : relations_) {
        result.push_back(relation);
    }
    return result;
}

bool KnowledgeGraphStore::has_entity(const std::string& entity_id) const {
    return entities_.find(entity_id) != entities_.end();
}

bool KnowledgeGraphStore::has_relation(const std::string& relation_id) const {
    return relations_.find(relation_id) != relations_.end();
}

void KnowledgeGraphStore::clear() {
    entities_.clear();
    relations_.clear();
    entity_type_index_.clear();
    relation_type_index_.clear();
    pair_index_.clear();
    name_index_.clear();
    outgoing_.clear();
    incoming_.clear();
}

// ==========================================
// Structural Queries
// ==========================================

std::vector<std::string> KnowledgeGraphStore::neighbors(
    const std::string& entity_id,
    const std::string& relation_type
) const {
    std::set<std::string> result;

    auto out = outgoing_.find(entity_id);
    if (out != outgoing_.end()) {
        for (const auto& relation_id : out->second) {
            const auto& relation = relations_.at(relation_id);
            if (relation_type.empty() || relation.type == relation_type) {
                result.insert(relation.tail_entity_id);
            }
        }
    }

    auto in = incoming_.find(entity_id);
    if (in != incoming_.end()) {
        for (const auto& relation_id : in->second) {
            const auto& relation = relations_.at(relation_id);
            if (relation_type.empty() || relation.type == relation_type) {
                result.insert(relation.head_entity_id);
            }
        }
    }

    return std::vector<std::string>(result.begin(), result.end());
}

std::vector<std::vector<std::string>> KnowledgeGraphStore::find_path(
    const std::string& start_id,
    const std::string& end_id,
    size_t max_depth
) const {
    std::vector<std::vector<std::string>> paths;
    if (start_id == end_id || !has_entity(start_id) || !has_entity(end_id) || max_depth == 0) {
        return paths;
    }

    auto adjacency = undirected_adjacency();
    std::vector<std::string> path = {start_id};
    std::set<std::string> on_path = {start_id};
    find_paths_dfs(adjacency, start_id, end_id, max_depth, path, on_path, paths);
    return paths;
}

void KnowledgeGraphStore::find_paths_dfs(
    const std::map<std::string, std::set<std::string>>& adjacency,
    const std::string& current,
    const std::string& end_id,
    size_t max_depth,
    std::vector<std::string>& path,
    std::set<std::string>& on_path,
    std::vector<std::vector<std::string>>& paths
) const {
    auto it = adjacency.find(current);
    if (it == adjacency.end()) return;

    for (const auto& next : it->second) {
        if (on_path.count(next)) continue;

        if (next == end_id) {
            path.push_back(next);
            paths.push_back(path);
            path.pop_back();
            continue;
        }

        // path.size() nodes means path.size() - 1 hops taken so far
        if (path.size() < max_depth) {
            path.push_back(next);
            on_path.insert(next);
            find_paths_dfs(adjacency, next, end_id, max_depth, path, on_path, paths);
            on_path.erase(next);
            path.pop_back();
        }
    }
}

KnowledgeGraphStore KnowledgeGraphStore::query_subgraph(
    const std::vector<std::string>& seed_ids,
    size_t depth
) const {
    std::set<std::string> included;
    for (const auto& id : seed_ids) {
        if (has_entity(id)) included.insert(id);
    }

    std::set<std::string> frontier = included;
    for (size_t round = 0; round < depth && !frontier.empty(); ++round) {
        std::set<std::string> next_frontier;
        for (const auto& id : frontier) {
            for (const auto& neighbor : neighbors(id)) {
                if (included.insert(neighbor).second) {
                    next_frontier.insert(neighbor);
                }
            }
        }
        frontier = std::move(next_frontier);
    }

    KnowledgeGraphStore subgraph(ontology_);
    subgraph.set_verbose(verbose_);
    for (const auto& id : included) {
        subgraph.add_entity(entities_.at(id));
    }
    for (const auto& [id, relation] : relations_) {
        if (included.count(relation.head_entity_id) && included.count(relation.tail_entity_id)) {
            subgraph.add_relation(relation);
        }
    }
    return subgraph;
}

// ==========================================
// Merge, Validation and Conflicts
// ==========================================

MergeReport KnowledgeGraphStore::merge_knowledge_graph(
    const KnowledgeGraphStore& other,
    const EntityFusionEngine& entity_engine,
    const RelationFusionEngine& relation_engine
) {
    MergeReport report;

    // Give colliding incoming ids a fresh name so nothing is overwritten
    std::set<std::string> taken_entity_ids;
    for (const auto& [id, entity] : entities_) taken_entity_ids.insert(id);
    for (const auto& [id, entity] : other.entities_) taken_entity_ids.insert(id);

    std::map<std::string, std::string> incoming_entity_ids;
    std::vector<Entity> all_entities = get_all_entities();
    for (const auto& [id, entity] : other.entities_) {
        Entity incoming = entity;
        if (entities_.count(id)) {
            incoming.id = unique_merge_id(id, taken_entity_ids);
            report.renamed_entities++;
        }
        incoming_entity_ids[id] = incoming.id;
        all_entities.push_back(std::move(incoming));
    }
    report.entities_before = all_entities.size();

    auto entity_results = entity_engine.batch_fuse(all_entities);
    report.entity_fusion = entity_engine.get_statistics(entity_results);

    // Every id in all_entities is distinct, so each fused id is too
    std::map<std::string, Entity> fused_entities;
    std::map<std::string, std::string> fused_id_of;
    for (const auto& result : entity_results) {
        fused_entities[result.fused.id] = result.fused;
        for (const auto& source : result.sources) {
            fused_id_of[source.id] = result.fused.id;
        }
    }
    for (const auto& [id, entity] : entities_) {
        report.id_remap[id] = fused_id_of.at(id);
    }
    for (const auto& [id, merged_id] : incoming_entity_ids) {
        report.other_id_remap[id] = fused_id_of.at(merged_id);
    }

    std::set<std::string> taken_relation_ids;
    for (const auto& [id, relation] : relations_) taken_relation_ids.insert(id);
    for (const auto& [id, relation] : other.relations_) taken_relation_ids.insert(id);

    std::vector<Relation> remapped;
    auto remap = [&](Relation relation, const std::map<std::string, std::string>& ids) {
        auto head = ids.find(relation.head_entity_id);
        auto tail = ids.find(relation.tail_entity_id);
        if (head == ids.end() || tail == ids.end()) {
            report.dropped_relations++;
            return;
        }
        relation.head_entity_id = head->second;
        relation.tail_entity_id = tail->second;
        remapped.push_back(std::move(relation));
    };

    for (const auto& [id, relation] : relations_) {
        remap(relation, report.id_remap);
    }
    for (const auto& [id, relation] : other.relations_) {
        Relation incoming = relation;
        if (relations_.count(id)) {
            incoming.id = unique_merge_id(id, taken_relation_ids);
            report.renamed_relations++;
        }
        remap(std::move(incoming), report.other_id_remap);
    }
    report.relations_before = relations_.size() + other.relations_.size();

    auto relation_results = relation_engine.batch_fuse(remapped);
    report.relation_fusion = relation_engine.get_statistics(relation_results);

    clear();
    for (const auto& [id, entity] : fused_entities) {
        add_entity(entity);
    }
    for (const auto& result : relation_results) {
        try {
            add_relation(result.fused);
        } catch (const ValidationError& e) {
            report.dropped_relations++;
            if (verbose_) {
                std::cerr << "Dropping merged relation: " << e.what() << "\n";
            }
        }
    }

    report.entities_after = entities_.size();
    report.relations_after = relations_.size();

    if (verbose_) {
        std::cout << "Merged graphs: " << report.entities_before << " -> "
                  << report.entities_after << " entities, " << report.relations_before
                  << " -> " << report.relations_after << " relations ("
                  << report.dropped_relations << " dropped)\n";
    }

    return report;
}

ValidationReport KnowledgeGraphStore::validate() const {
    ValidationReport report;

    for (const auto& [id, relation] : relations_) {
        const Entity* head = get_entity(relation.head_entity_id);
        const Entity* tail = get_entity(relation.tail_entity_id);

        if (!head || !tail) {
            ValidationIssue issue;
            issue.kind = ValidationIssue::Kind::OrphanedRelation;
            issue.relation_id = id;
            issue.entity_id = !head ? relation.head_entity_id : relation.tail_entity_id;
            issue.message = "Relation " + id + " references missing entity " + issue.entity_id;
            report.issues.push_back(issue);
            continue;
        }

        if (ontology_ && !ontology_->validate_relation(relation.type, head->type, tail->type)) {
            ValidationIssue issue;
            issue.kind = ValidationIssue::Kind::OntologyMismatch;
            issue.relation_id = id;
            issue.message = "Relation " + id + " (" + relation.type + ") does not accept " +
                            head->type + " -> " + tail->type;
            report.issues.push_back(issue);
        }
    }

    report.statistics = get_statistics();
    return report;
}

std::vector<Conflict> KnowledgeGraphStore::detect_and_resolve_conflicts(
    ConflictResolver& resolver,
    const std::map<ConflictType, std::string>& overrides,
    bool apply
) {
    auto all_relations = get_all_relations();

    // Ids are unique here, so only relation-level conflicts can exist
    auto conflicts = resolver.detect_entity_conflicts(get_all_entities());
    auto relation_conflicts = resolver.detect_relation_conflicts(all_relations);
    conflicts.insert(conflicts.end(), relation_conflicts.begin(), relation_conflicts.end());

    auto resolved = resolver.batch_resolve(conflicts, overrides);

    if (apply) {
        auto kept = resolver.apply_relation_resolutions(all_relations, resolved);
        std::set<std::string> kept_ids;
        for (const auto& relation : kept) kept_ids.insert(relation.id);
        for (const auto& relation : all_relations) {
            if (!kept_ids.count(relation.id)) remove_relation(relation.id);
        }
    }

    return resolved;
}

GraphStatistics KnowledgeGraphStore::get_statistics() const {
    GraphStatistics stats;
    stats.num_entities = entities_.size();
    stats.num_relations = relations_.size();

    for (const auto& [type, ids] : entity_type_index_) {
        stats.entity_types[type] = ids.size();
    }
    for (const auto& [type, ids] : relation_type_index_) {
        stats.relation_types[type] = ids.size();
    }

    if (entities_.empty()) {
        return stats;
    }

    double n = static_cast<double>(entities_.size());
    double e = static_cast<double>(relations_.size());
    stats.avg_degree = 2.0 * e / n;
    stats.density = entities_.size() > 1 ? e / (n * (n - 1.0)) : 0.0;

    for (const auto& [id, entity] : entities_) {
        size_t degree = 0;
        auto out = outgoing_.find(id);
        if (out != outgoing_.end()) degree += out->second.size();
        auto in = incoming_.find(id);
        if (in != incoming_.end()) degree += in->second.size();

        stats.max_degree = std::max(stats.max_degree, degree);
        if (degree == 0) stats.isolated_entities++;
    }

    // Weakly connected components
    auto adjacency = undirected_adjacency();
    std::set<std::string> visited;
    for (const auto& [start, entity] : entities_) {
        if (visited.count(start)) continue;

        size_t size = 0;
        std::stack<std::string> stack;
        stack.push(start);
        while (!stack.empty()) {
            std::string current = stack.top();
            stack.pop();
            if (!visited.insert(current).second) continue;
            size++;

            auto it = adjacency.find(current);
            if (it == adjacency.end()) continue;
            for (const auto& next : it->second) {
                if (!visited.count(next)) stack.push(next);
            }
        }

        stats.connected_components++;
        stats.largest_component = std::max(stats.largest_component, size);
    }

    return stats;
}

bool KnowledgeGraphStore::indices_consistent() const {
    // Rebuild every index from the maps and compare
    std::map<std::string, std::set<std::string>> entity_types;
    std::map<std::string, std::set<std::string>> relation_types;
    std::map<EntityPair, std::set<std::string>> pairs;
    std::map<std::string, std::set<std::string>> outgoing;
    std::map<std::string, std::set<std::string>> incoming;

    for (const auto& [id, entity] : entities_) {
        if (entity.id != id) return false;
        entity_types[entity.type].insert(id);
    }
    for (const auto& [id, relation] : relations_) {
        if (relation.id != id) return false;
        if (!has_entity(relation.head_entity_id) || !has_entity(relation.tail_entity_id)) return false;
        relation_types[relation.type].insert(id);
        pairs[EntityPair(relation.head_entity_id, relation.tail_entity_id)].insert(id);
        outgoing[relation.head_entity_id].insert(id);
        incoming[relation.tail_entity_id].insert(id);
    }

    if (entity_types != entity_type_index_ || relation_types != relation_type_index_ ||
        pairs != pair_index_ || outgoing != outgoing_ || incoming != incoming_) {
        return false;
    }

    // Every indexed name points at an entity carrying it, and every name is indexed
    for (const auto& [name, id] : name_index_) {
        const Entity* entity = get_entity(id);
        if (!entity || !carries_name(*entity, name)) return false;
    }
    for (const auto& [id, entity] : entities_) {
        for (const auto& name : entity_names(entity)) {
            if (!name_index_.count(name)) return false;
        }
    }

    return true;
}

// ==========================================
// Internal Helper Methods
// ==========================================

void KnowledgeGraphStore::index_entity(const Entity& entity) {
    entity_type_index_[entity.type].insert(entity.id);
    for (const auto& name : entity_names(entity)) {
        name_index_[name] = entity.id;
    }
}

void KnowledgeGraphStore::unindex_entity(const Entity& entity) {
    erase_member(entity_type_index_, entity.type, entity.id);

    for (const auto& name : entity_names(entity)) {
        auto it = name_index_.find(name);
        if (it == name_index_.end() || it->second != entity.id) continue;
        name_index_.erase(it);

        // Hand the name to another entity that still carries it
        for (const auto& [id, other] : entities_) {
            if (id != entity.id && carries_name(other, name)) {
                name_index_[name] = id;
                break;
            }
        }
    }

    if (!entities_.count(entity.id)) {
        outgoing_.erase(entity.id);
        incoming_.erase(entity.id);
    }
}

void KnowledgeGraphStore::index_relation(const Relation& relation) {
    relation_type_index_[relation.type].insert(relation.id);
    pair_index_[EntityPair(relation.head_entity_id, relation.tail_entity_id)].insert(relation.id);
    outgoing_[relation.head_entity_id].insert(relation.id);
    incoming_[relation.tail_entity_id].insert(relation.id);
}

void KnowledgeGraphStore::unindex_relation(const Relation& relation) {
    erase_member(relation_type_index_, relation.type, relation.id);
    erase_member(pair_index_, EntityPair(relation.head_entity_id, relation.tail_entity_id), relation.id);
    erase_member(outgoing_, relation.head_entity_id, relation.id);
    erase_member(incoming_, relation.tail_entity_id, relation.id);
}

std::map<std::string, std::set<std::string>> KnowledgeGraphStore::undirected_adjacency() const {
    std::map<std::string, std::set<std::string>> adjacency;
    for (const auto& [id, relation] : relations_) {
        adjacency[relation.head_entity_id].insert(relation.tail_entity_id);
        adjacency[relation.tail_entity_id].insert(relation.head_entity_id);
    }
    return adjacency;
}

} // namespace kgf
