#pragma once

#include "conflict/conflict_resolver.hpp"
#include "fusion/entity_fusion.hpp"
#include "fusion/relation_fusion.hpp"
#include "graph/knowledge_graph.hpp"
#include "ingest/candidate_mapper.hpp"
#include "ontology/ontology.hpp"
#include <functional>
#include <map>
#include <memory>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace kgf {

// ============================================================================
// Pipeline Configuration
// ============================================================================

/**
 * @brief Configuration for the fusion pipeline
 */
struct FusionConfig {
    // Fusion
    double entity_similarity_threshold = 0.8;       ///< Entity dedup threshold
    double relation_similarity_threshold = 0.8;     ///< Relation dedup threshold
    std::string clustering_mode = "seed";           ///< "seed" or "connected"
    std::string confidence_strategy = "weighted_average";  ///< "max", "average", "weighted_average"
    std::string property_strategy = "union";        ///< "union", "intersection", "vote"
    int similarity_workers = 1;                     ///< Threads for pairwise comparisons

    // Conflict resolution
    std::map<std::string, std::string> conflict_strategies;  ///< Conflict type -> strategy name
    bool apply_conflict_resolutions = true;         ///< Collapse same-id entities
    bool drop_contradicted_relations = true;        ///< Remove losers of contradictions

    // Output
    std::string output_directory = "output_json";   ///< Used by FusionPipeline::export_results
    bool verbose = false;                           ///< Verbose logging

    /**
     * @brief Load configuration from JSON file; absent keys keep defaults
     */
    static FusionConfig from_json_file(const std::string& path);

    static FusionConfig from_json(const nlohmann::json& j);
    nlohmann::json to_json() const;

    void to_json_file(const std::string& path) const;

    /**
     * @brief Defaults overridden by KGF_* environment variables
     */
    static FusionConfig from_environment();

    bool validate(std::string& error_message) const;

    /**
     * @brief conflict_strategies keyed by parsed ConflictType
     *
     * Entries whose type name does not parse are ignored (validate reports them).
     */
    std::map<ConflictType, std::string> conflict_overrides() const;
};

// ============================================================================
// Pipeline Statistics
// ============================================================================

/**
 * @brief Counters and timings from pipeline execution
 */
struct PipelineStatistics {
    // Candidate mapping
    int candidate_entities = 0;
    int candidate_relations = 0;
    int unresolved_relations = 0;

    // Fusion
    int entities_before_fusion = 0;
    int entities_after_fusion = 0;
    int entity_clusters_merged = 0;
    int relations_before_fusion = 0;
    int relations_after_fusion = 0;
    int relation_clusters_merged = 0;

    // Conflicts
    int conflicts_detected = 0;
    int conflicts_resolved = 0;
    int conflicts_for_review = 0;
    int relations_contradicted = 0;

    // Ingestion
    int entities_ingested = 0;
    int relations_ingested = 0;
    int relations_skipped = 0;

    // Timing
    double total_time_seconds = 0.0;
    double entity_fusion_time_seconds = 0.0;
    double relation_fusion_time_seconds = 0.0;
    double conflict_time_seconds = 0.0;
    double ingestion_time_seconds = 0.0;

    void print_summary() const;
    nlohmann::json to_json() const;
};

// ============================================================================
// Progress Callbacks
// ============================================================================

using ProgressCallback = std::function<void(
    const std::string& stage,
    int current,
    int total,
    const std::string& message
)>;

// ============================================================================
// Fusion Pipeline
// ============================================================================

/**
 * @brief Runs the fusion phases in strict order
 *
 * Entity fusion → relation endpoint remap → relation fusion → conflict
 * detection and resolution → store ingestion. Each phase starts only after
 * the previous one has produced its complete output.
 */
class FusionPipeline {
public:
    /**
     * @throws std::invalid_argument if the configuration does not validate
     */
    explicit FusionPipeline(
        const FusionConfig& config,
        std::shared_ptr<const Ontology> ontology = nullptr
    );

    /**
     * @brief Fuse the records and ingest them into a new store
     */
    KnowledgeGraphStore run(const std::vector<Entity>& entities, const std::vector<Relation>& relations);

    /**
     * @brief Fuse the records and ingest them into a caller-owned store
     */
    void run_into(
        KnowledgeGraphStore& store,
        const std::vector<Entity>& entities,
        const std::vector<Relation>& relations
    );

    /**
     * @brief Map extraction candidates, then run
     */
    KnowledgeGraphStore run_candidates(
        const std::vector<ExtractedEntity>& entities,
        const std::vector<ExtractedRelation>& relations
    );

    /**
     * @brief Write knowledge_graph.json, entities.csv, relations.csv,
     *        conflicts.txt and pipeline_statistics.json to the output directory
     */
    void export_results(const KnowledgeGraphStore& store) const;

    void set_progress_callback(ProgressCallback callback);

    PipelineStatistics get_statistics() const { return stats_; }
    void reset_statistics();

    const std::vector<Conflict>& get_last_conflicts() const { return last_conflicts_; }

    FusionConfig get_config() const { return config_; }
    void set_config(const FusionConfig& config);

    /**
     * @brief Resolver used by the conflict phase; register custom strategies here
     */
    ConflictResolver& resolver() { return resolver_; }

private:
    FusionConfig config_;
    std::shared_ptr<const Ontology> ontology_;
    PipelineStatistics stats_;
    ProgressCallback progress_callback_;

    std::unique_ptr<EntityFusionEngine> entity_engine_;
    std::unique_ptr<RelationFusionEngine> relation_engine_;
    ConflictResolver resolver_;
    std::vector<Conflict> last_conflicts_;

    void initialize_components();

    std::vector<Entity> fuse_entities(
        const std::vector<Entity>& entities,
        std::map<std::string, std::string>& id_remap
    );

    std::vector<Relation> fuse_relations(
        const std::vector<Relation>& relations,
        const std::map<std::string, std::string>& id_remap
    );

    void resolve_conflicts(std::vector<Entity>& entities, std::vector<Relation>& relations);

    void report_progress(
        const std::string& stage,
        int current,
        int total,
        const std::string& message = ""
    );
};

// ============================================================================
// Utility Functions
// ============================================================================

/**
 * @brief Explicit path, then .kgf_config.json (here and up to two parents),
 *        then the environment
 */
FusionConfig load_config_with_fallback(const std::string& config_path = "");

} // namespace kgf
