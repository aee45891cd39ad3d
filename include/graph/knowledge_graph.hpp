#ifndef KGF_GRAPH_KNOWLEDGE_GRAPH_HPP
#define KGF_GRAPH_KNOWLEDGE_GRAPH_HPP

#include "conflict/conflict_resolver.hpp"
#include "fusion/entity_fusion.hpp"
#include "fusion/relation_fusion.hpp"
#include "model/types.hpp"
#include "ontology/ontology.hpp"
#include <map>
#include <memory>
#include <set>
#include <string>
#include <utility>
#include <vector>
#include <nlohmann/json.hpp>

namespace kgf {

/**
 * @brief Structural summary of the store
 */
struct GraphStatistics {
    size_t num_entities = 0;
    size_t num_relations = 0;
    std::map<std::string, size_t> entity_types;
    std::map<std::string, size_t> relation_types;

    double avg_degree = 0.0;                           // 2E / N
    size_t max_degree = 0;
    size_t isolated_entities = 0;                      // Degree zero
    size_t connected_components = 0;                   // Weakly connected
    size_t largest_component = 0;
    double density = 0.0;                              // E / (N (N - 1))

    nlohmann::json to_json() const;
};

/**
 * @brief Problem found by KnowledgeGraphStore::validate
 */
struct ValidationIssue {
    enum class Kind {
        OrphanedRelation,                              // Endpoint missing
        OntologyMismatch                               // Domain/range violated
    };

    Kind kind;
    std::string relation_id;
    std::string entity_id;                             // Missing endpoint, if orphaned
    std::string message;

    nlohmann::json to_json() const;
};

const char* validation_issue_kind_to_string(ValidationIssue::Kind kind);

struct ValidationReport {
    std::vector<ValidationIssue> issues;
    GraphStatistics statistics;

    bool is_valid() const { return issues.empty(); }
    size_t count(ValidationIssue::Kind kind) const;
    nlohmann::json to_json() const;
};

/**
 * @brief Outcome of a bulk insert or a JSON load
 */
struct IngestReport {
    size_t entities_added = 0;
    size_t entities_skipped = 0;                       // Unreadable entity records
    size_t relations_added = 0;
    size_t relations_skipped = 0;                      // Missing endpoint or unreadable
    std::vector<std::string> skipped_relation_ids;

    nlohmann::json to_json() const;
};

using LoadReport = IngestReport;

/**
 * @brief Outcome of KnowledgeGraphStore::merge_knowledge_graph
 */
struct MergeReport {
    size_t entities_before = 0;                        // Combined, before fusion
    size_t entities_after = 0;
    size_t relations_before = 0;                       // Combined, before remapping
    size_t relations_after = 0;
    size_t dropped_relations = 0;                      // Endpoint lost in the remap
    size_t renamed_entities = 0;                       // Incoming ids that collided
    size_t renamed_relations = 0;
    std::map<std::string, std::string> id_remap;       // This store's entity id -> fused id
    std::map<std::string, std::string> other_id_remap; // Incoming entity id -> fused id
    FusionStatistics entity_fusion;
    FusionStatistics relation_fusion;

    nlohmann::json to_json() const;
};

/**
 * @brief In-memory knowledge graph with derived indices
 *
 * Owns canonical entities and relations plus these indices, each kept in
 * step with the maps after every mutating call:
 *   - entity type -> entity ids, relation type -> relation ids
 *   - (head, tail) -> relation ids
 *   - name or alias -> entity id (the most recent writer owns a shared name)
 *   - entity id -> outgoing / incoming relation ids
 *
 * Index entries that become empty are erased, so a key is present iff it
 * has at least one member.
 *
 * Not thread-safe: callers serialize access. Each mutation updates several
 * indices in sequence.
 */
class KnowledgeGraphStore {
public:
    KnowledgeGraphStore() = default;
    explicit KnowledgeGraphStore(std::shared_ptr<const Ontology> ontology);

    // ==========================================
    // Entity and Relation Management
    // ==========================================

    /**
     * @brief Insert or replace an entity by id
     *
     * Replacing re-indexes type and names; incident relations are kept.
     */
    void add_entity(const Entity& entity);

    /**
     * @brief Insert or replace a relation by id
     *
     * @throws ValidationError if the head or tail entity is absent; the
     *         store is left untouched
     */
    void add_relation(const Relation& relation);

    /**
     * @brief Remove an entity together with every incident relation
     */
    bool remove_entity(const std::string& entity_id);

    bool remove_relation(const std::string& relation_id);

    size_t batch_add_entities(const std::vector<Entity>& entities);

    /**
     * @brief Add relations one by one, skipping those with a missing endpoint
     */
    IngestReport batch_add_relations(const std::vector<Relation>& relations);

    /**
     * @brief Entities first, then relations
     */
    IngestReport ingest(const std::vector<Entity>& entities, const std::vector<Relation>& relations);

    const Entity* get_entity(const std::string& entity_id) const;
    const Entity* get_entity_by_name(const std::string& name) const;
    const Relation* get_relation(const std::string& relation_id) const;

    std::vector<Entity> get_entities_by_type(const std::string& type) const;
    std::vector<Relation> get_relations_by_type(const std::string& type) const;

    /**
     * @brief Relations from head to tail (direction matters)
     */
    std::vector<Relation> get_relations_between(const std::string& head_id, const std::string& tail_id) const;

    std::vector<Entity> get_all_entities() const;
    std::vector<Relation> get_all_relations() const;

    bool has_entity(const std::string& entity_id) const;
    bool has_relation(const std::string& relation_id) const;

    size_t num_entities() const { return entities_.size(); }
    size_t num_relations() const { return relations_.size(); }
    bool empty() const { return entities_.empty() && relations_.empty(); }

    void clear();

    // ==========================================
    // Structural Queries
    // ==========================================

    /**
     * @brief Successors and predecessors over matching relations
     *
     * @param entity_id Entity to expand
     * @param relation_type Only follow relations of this type (empty = all)
     * @return Sorted, de-duplicated entity ids
     */
    std::vector<std::string> neighbors(
        const std::string& entity_id,
        const std::string& relation_type = ""
    ) const;

    /**
     * @brief Every simple path of at most max_depth hops, ignoring direction
     *
     * Depth-first search with an on-path visited set released on backtrack.
     * Paths list entity ids from start to end. Empty when start == end or
     * either entity is absent.
     */
    std::vector<std::vector<std::string>> find_path(
        const std::string& start_id,
        const std::string& end_id,
        size_t max_depth = 3
    ) const;

    /**
     * @brief Expand the seeds by `depth` rounds of neighbors and return the
     *        induced subgraph as a new store
     */
    KnowledgeGraphStore query_subgraph(const std::vector<std::string>& seed_ids, size_t depth = 1) const;

    // ==========================================
    // Merge, Validation and Conflicts
    // ==========================================

    /**
     * @brief Fuse another store into this one
     *
     * Not incremental: the combined entities are fused again, relation
     * endpoints are rewritten through the resulting id map (relations whose
     * endpoint disappears are dropped), the combined relations are fused,
     * and this store is cleared and re-filled with the result.
     *
     * Ids are only unique per store. An incoming entity or relation whose id
     * is already taken is renamed to "<id>_<n>" before fusion, and the
     * incoming relation endpoints follow the rename. Whether two entities
     * end up as one is decided by the entity engine alone.
     */
    MergeReport merge_knowledge_graph(
        const KnowledgeGraphStore& other,
        const EntityFusionEngine& entity_engine = EntityFusionEngine(),
        const RelationFusionEngine& relation_engine = RelationFusionEngine()
    );

    /**
     * @brief Orphaned relations and ontology violations; never throws
     */
    ValidationReport validate() const;

    /**
     * @brief Detect relation conflicts among stored relations and resolve them
     *
     * @param resolver Resolver to use (its history records the outcome)
     * @param apply Remove the losing relations of resolved contradictions
     */
    std::vector<Conflict> detect_and_resolve_conflicts(
        ConflictResolver& resolver,
        const std::map<ConflictType, std::string>& overrides = {},
        bool apply = false
    );

    GraphStatistics get_statistics() const;

    /**
     * @brief Check every index against the entity and relation maps
     */
    bool indices_consistent() const;

    void set_ontology(std::shared_ptr<const Ontology> ontology) { ontology_ = std::move(ontology); }
    const Ontology* get_ontology() const { return ontology_.get(); }

    void set_verbose(bool verbose) { verbose_ = verbose; }

    // ==========================================
    // Import/Export
    // ==========================================

    /**
     * @brief {"entities": [...], "relations": [...], "statistics": {...}}
     */
    nlohmann::json to_json() const;

    void export_to_json(const std::string& filename) const;

    /**
     * @brief Rebuild a store from a document produced by to_json
     *
     * Unreadable records and relations with a missing endpoint are skipped
     * and counted in `report`.
     *
     * @throws MalformedPersistedState if the document is not a JSON object
     */
    static KnowledgeGraphStore from_json(const nlohmann::json& j, LoadReport* report = nullptr);

    static KnowledgeGraphStore load_from_json(const std::string& filename, LoadReport* report = nullptr);

    /**
     * @brief entities.csv (id,name,type,aliases,properties)
     */
    std::string entities_to_csv() const;

    /**
     * @brief relations.csv (id,type,head_entity_id,tail_entity_id,confidence,properties)
     */
    std::string relations_to_csv() const;

    void export_to_csv(const std::string& entities_file, const std::string& relations_file) const;

private:
    // ==========================================
    // Internal Data Structures
    // ==========================================

    using EntityPair = std::pair<std::string, std::string>;

    std::map<std::string, Entity> entities_;
    std::map<std::string, Relation> relations_;

    std::map<std::string, std::set<std::string>> entity_type_index_;
    std::map<std::string, std::set<std::string>> relation_type_index_;
    std::map<EntityPair, std::set<std::string>> pair_index_;
    std::map<std::string, std::string> name_index_;
    std::map<std::string, std::set<std::string>> outgoing_;
    std::map<std::string, std::set<std::string>> incoming_;

    std::shared_ptr<const Ontology> ontology_;
    bool verbose_ = false;

    // ==========================================
    // Internal Helper Methods
    // ==========================================

    void index_entity(const Entity& entity);
    void unindex_entity(const Entity& entity);
    void index_relation(const Relation& relation);
    void unindex_relation(const Relation& relation);

    /**
     * @brief Undirected adjacency over all relations
     */
    std::map<std::string, std::set<std::string>> undirected_adjacency() const;

    void find_paths_dfs(
        const std::map<std::string, std::set<std::string>>& adjacency,
        const std::string& current,
        const std::string& end_id,
        size_t max_depth,
        std::vector<std::string>& path,
        std::set<std::string>& on_path,
        std::vector<std::vector<std::string>>& paths
    ) const;
};

} // namespace kgf

#endif // KGF_GRAPH_KNOWLEDGE_GRAPH_HPP
