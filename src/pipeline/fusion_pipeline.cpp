#include "pipeline/fusion_pipeline.hpp"
#include <nlohmann/json.hpp>
#include <fstream>
#include <iostream>
#include <chrono>
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <sys/stat.h>

using json = nlohmann::json;

namespace {

using Clock = std::chrono::high_resolution_clock;

double seconds_since(Clock::time_point start) {
    return std::chrono::duration<double>(Clock::now() - start).count();
}

void read_env_threshold(const char* name, double& target) {
    const char* value = std::getenv(name);
    if (!value) return;

    try {
        target = std::stod(value);
    } catch (const std::exception& e) {
        std::cerr << "Ignoring " << name << "=" << value << ": " << e.what() << "\n";
    }
}

bool env_flag(const char* value) {
    std::string flag(value);
    std::transform(flag.begin(), flag.end(), flag.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return flag == "1" || flag == "true" || flag == "yes" || flag == "on";
}

bool file_exists(const std::string& path) {
    struct stat st;
    return stat(path.c_str(), &st) == 0;
}

}  // namespace

namespace kgf {

// ============================================================================
// FusionConfig
// ============================================================================

FusionConfig FusionConfig::from_json_file(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to open config file: " + path);
    }

    json j;
    file >> j;

    return from_json(j);
}

FusionConfig FusionConfig::from_json(const json& j) {
    FusionConfig config;

    // Fusion config
    if (j.contains("entity_similarity_threshold")) config.entity_similarity_threshold = j["entity_similarity_threshold"];
    if (j.contains("relation_similarity_threshold")) config.relation_similarity_threshold = j["relation_similarity_threshold"];
    if (j.contains("clustering_mode")) config.clustering_mode = j["clustering_mode"];
    if (j.contains("confidence_strategy")) config.confidence_strategy = j["confidence_strategy"];
    if (j.contains("property_strategy")) config.property_strategy = j["property_strategy"];
    if (j.contains("similarity_workers")) config.similarity_workers = j["similarity_workers"];

    // Conflict config
    if (j.contains("conflict_strategies") && j["conflict_strategies"].is_object()) {
        config.conflict_strategies = j["conflict_strategies"].get<std::map<std::string, std::string>>();
    }
    if (j.contains("apply_conflict_resolutions")) config.apply_conflict_resolutions = j["apply_conflict_resolutions"];
    if (j.contains("drop_contradicted_relations")) config.drop_contradicted_relations = j["drop_contradicted_relations"];

    // Output config
    if (j.contains("output_directory")) config.output_directory = j["output_directory"];
    if (j.contains("verbose")) config.verbose = j["verbose"];

    return config;
}

json FusionConfig::to_json() const {
    json j;

    j["entity_similarity_threshold"] = entity_similarity_threshold;
    j["relation_similarity_threshold"] = relation_similarity_threshold;
    j["clustering_mode"] = clustering_mode;
    j["confidence_strategy"] = confidence_strategy;
    j["property_strategy"] = property_strategy;
    j["similarity_workers"] = similarity_workers;

    j["conflict_strategies"] = conflict_strategies;
    j["apply_conflict_resolutions"] = apply_conflict_resolutions;
    j["drop_contradicted_relations"] = drop_contradicted_relations;

    j["output_directory"] = output_directory;
    j["verbose"] = verbose;

    return j;
}

void FusionConfig::to_json_file(const std::string& path) const {
    std::ofstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to open file for writing: " + path);
    }
    file << to_json().dump(2);
}

FusionConfig FusionConfig::from_environment() {
    FusionConfig config;

    read_env_threshold("KGF_ENTITY_THRESHOLD", config.entity_similarity_threshold);
    read_env_threshold("KGF_RELATION_THRESHOLD", config.relation_similarity_threshold);

    const char* clustering = std::getenv("KGF_CLUSTERING");
    if (clustering) config.clustering_mode = clustering;

    const char* confidence = std::getenv("KGF_CONFIDENCE_STRATEGY");
    if (confidence) config.confidence_strategy = confidence;

    const char* property = std::getenv("KGF_PROPERTY_STRATEGY");
    if (property) config.property_strategy = property;

    const char* verbose = std::getenv("KGF_VERBOSE");
    if (verbose) config.verbose = env_flag(verbose);

    const char* output_dir = std::getenv("KGF_OUTPUT_DIR");
    if (output_dir) config.output_directory = output_dir;

    return config;
}

bool FusionConfig::validate(std::string& error_message) const {
    if (entity_similarity_threshold < 0.0 || entity_similarity_threshold > 1.0) {
        error_message = "Entity similarity threshold must be between 0.0 and 1.0";
        return false;
    }

    if (relation_similarity_threshold < 0.0 || relation_similarity_threshold > 1.0) {
        error_message = "Relation similarity threshold must be between 0.0 and 1.0";
        return false;
    }

    ClusteringMode mode;
    if (!string_to_clustering_mode(clustering_mode, mode)) {
        error_message = "Invalid clustering mode: " + clustering_mode;
        return false;
    }

    ConfidenceStrategy confidence;
    if (!string_to_confidence_strategy(confidence_strategy, confidence)) {
        error_message = "Invalid confidence strategy: " + confidence_strategy;
        return false;
    }

    PropertyStrategy property;
    if (!string_to_property_strategy(property_strategy, property)) {
        error_message = "Invalid property strategy: " + property_strategy;
        return false;
    }

    if (similarity_workers < 1) {
        error_message = "Similarity workers must be at least 1";
        return false;
    }

    for (const auto& [type_name, strategy] : conflict_strategies) {
        ConflictType type;
        if (!string_to_conflict_type(type_name, type)) {
            error_message = "Unknown conflict type: " + type_name;
            return false;
        }
        if (strategy.empty()) {
            error_message = "Empty strategy for conflict type: " + type_name;
            return false;
        }
    }

    return true;
}

std::map<ConflictType, std::string> FusionConfig::conflict_overrides() const {
    std::map<ConflictType, std::string> overrides;
    for (const auto& [type_name, strategy] : conflict_strategies) {
        ConflictType type;
        if (string_to_conflict_type(type_name, type)) {
            overrides[type] = strategy;
        }
    }
    return overrides;
}

// ============================================================================
// PipelineStatistics
// ============================================================================

void PipelineStatistics::print_summary() const {
    std::cout << "\n" << std::string(70, '=') << "\n";
    std::cout << "Fusion Pipeline Summary\n";
    std::cout << std::string(70, '=') << "\n\n";

    if (candidate_entities > 0 || candidate_relations > 0) {
        std::cout << "Candidate Mapping:\n";
        std::cout << "  Entity candidates: " << candidate_entities << "\n";
        std::cout << "  Relation candidates: " << candidate_relations << "\n";
        std::cout << "  Unresolved relations: " << unresolved_relations << "\n\n";
    }

    std::cout << "Fusion:\n";
    std::cout << "  Entities: " << entities_before_fusion << " -> " << entities_after_fusion
              << " (" << entity_clusters_merged << " clusters merged)\n";
    std::cout << "  Relations: " << relations_before_fusion << " -> " << relations_after_fusion
              << " (" << relation_clusters_merged << " clusters merged)\n\n";

    std::cout << "Conflicts:\n";
    std::cout << "  Detected: " << conflicts_detected << "\n";
    std::cout << "  Resolved: " << conflicts_resolved << "\n";
    std::cout << "  Needs review: " << conflicts_for_review << "\n";
    std::cout << "  Contradicted relations removed: " << relations_contradicted << "\n\n";

    std::cout << "Timing:\n";
    std::cout << "  Total time: " << total_time_seconds << " seconds\n";
    std::cout << "  Entity fusion: " << entity_fusion_time_seconds << " seconds\n";
    std::cout << "  Relation fusion: " << relation_fusion_time_seconds << " seconds\n";
    std::cout << "  Conflict resolution: " << conflict_time_seconds << " seconds\n";
    std::cout << "  Ingestion: " << ingestion_time_seconds << " seconds\n\n";

    std::cout << "Final Knowledge Graph:\n";
    std::cout << "  Entities: " << entities_ingested << "\n";
    std::cout << "  Relations: " << relations_ingested << "\n";
    if (relations_skipped > 0) {
        std::cout << "  Relations skipped: " << relations_skipped << "\n";
    }

    std::cout << "\n" << std::string(70, '=') << "\n\n";
}

json PipelineStatistics::to_json() const {
    json j;

    j["candidate_entities"] = candidate_entities;
    j["candidate_relations"] = candidate_relations;
    j["unresolved_relations"] = unresolved_relations;

    j["entities_before_fusion"] = entities_before_fusion;
    j["entities_after_fusion"] = entities_after_fusion;
    j["entity_clusters_merged"] = entity_clusters_merged;
    j["relations_before_fusion"] = relations_before_fusion;
    j["relations_after_fusion"] = relations_after_fusion;
    j["relation_clusters_merged"] = relation_clusters_merged;

    j["conflicts_detected"] = conflicts_detected;
    j["conflicts_resolved"] = conflicts_resolved;
    j["conflicts_for_review"] = conflicts_for_review;
    j["relations_contradicted"] = relations_contradicted;

    j["entities_ingested"] = entities_ingested;
    j["relations_ingested"] = relations_ingested;
    j["relations_skipped"] = relations_skipped;

    j["total_time_seconds"] = total_time_seconds;
    j["entity_fusion_time_seconds"] = entity_fusion_time_seconds;
    j["relation_fusion_time_seconds"] = relation_fusion_time_seconds;
    j["conflict_time_seconds"] = conflict_time_seconds;
    j["ingestion_time_seconds"] = ingestion_time_seconds;

    return j;
}

// ============================================================================
// FusionPipeline
// ============================================================================

FusionPipeline::FusionPipeline(const FusionConfig& config, std::shared_ptr<const Ontology> ontology)
    : config_(config), ontology_(std::move(ontology)) {
    std::string error;
    if (!config_.validate(error)) {
        throw std::invalid_argument("Invalid configuration: " + error);
    }

    initialize_components();
}

void FusionPipeline::initialize_components() {
    ClusteringMode mode = ClusteringMode::Seed;
    ConfidenceStrategy confidence = ConfidenceStrategy::WeightedAverage;
    PropertyStrategy property = PropertyStrategy::Union;
    string_to_clustering_mode(config_.clustering_mode, mode);
    string_to_confidence_strategy(config_.confidence_strategy, confidence);
    string_to_property_strategy(config_.property_strategy, property);

    size_t workers = static_cast<size_t>(config_.similarity_workers);

    entity_engine_ = std::make_unique<EntityFusionEngine>(
        config_.entity_similarity_threshold, mode, workers
    );
    relation_engine_ = std::make_unique<RelationFusionEngine>(
        config_.relation_similarity_threshold, confidence, property, mode, workers
    );
    resolver_.set_verbose(config_.verbose);
}

KnowledgeGraphStore FusionPipeline::run(
    const std::vector<Entity>& entities,
    const std::vector<Relation>& relations
) {
    KnowledgeGraphStore store(ontology_);
    store.set_verbose(config_.verbose);
    run_into(store, entities, relations);
    return store;
}

void FusionPipeline::run_into(
    KnowledgeGraphStore& store,
    const std::vector<Entity>& entities,
    const std::vector<Relation>& relations
) {
    auto start_time = Clock::now();

    std::map<std::string, std::string> id_remap;
    auto fused_entities = fuse_entities(entities, id_remap);
    auto fused_relations = fuse_relations(relations, id_remap);
    resolve_conflicts(fused_entities, fused_relations);

    // Ingest
    report_progress("Ingestion", 0, 1, std::to_string(fused_entities.size()) + " entities");
    auto ingest_start = Clock::now();
    IngestReport report = store.ingest(fused_entities, fused_relations);
    stats_.ingestion_time_seconds += seconds_since(ingest_start);

    stats_.entities_ingested += static_cast<int>(report.entities_added);
    stats_.relations_ingested += static_cast<int>(report.relations_added);
    stats_.relations_skipped += static_cast<int>(report.relations_skipped);
    report_progress("Ingestion", 1, 1, std::to_string(report.relations_added) + " relations");

    if (config_.verbose && report.relations_skipped > 0) {
        std::cerr << "Skipped " << report.relations_skipped
                  << " relations with a missing endpoint\n";
    }

    stats_.total_time_seconds += seconds_since(start_time);
}

KnowledgeGraphStore FusionPipeline::run_candidates(
    const std::vector<ExtractedEntity>& entities,
    const std::vector<ExtractedRelation>& relations
) {
    CandidateMapper mapper;
    mapper.set_verbose(config_.verbose);

    MappingResult mapped = mapper.map(entities, relations);
    stats_.candidate_entities += static_cast<int>(entities.size());
    stats_.candidate_relations += static_cast<int>(relations.size());
    stats_.unresolved_relations += static_cast<int>(mapped.unresolved_relations);

    return run(mapped.entities, mapped.relations);
}

std::vector<Entity> FusionPipeline::fuse_entities(
    const std::vector<Entity>& entities,
    std::map<std::string, std::string>& id_remap
) {
    int total = static_cast<int>(entities.size());
    report_progress("Entity fusion", 0, total);

    auto start = Clock::now();
    auto results = entity_engine_->batch_fuse(entities);
    stats_.entity_fusion_time_seconds += seconds_since(start);

    std::vector<Entity> fused;
    fused.reserve(results.size());
    for (const auto& result : results) {
        fused.push_back(result.fused);
        for (const auto& source : result.sources) {
            id_remap[source.id] = result.fused.id;
        }
    }

    auto fusion_stats = entity_engine_->get_statistics(results);
    stats_.entities_before_fusion += total;
    stats_.entities_after_fusion += static_cast<int>(fused.size());
    stats_.entity_clusters_merged += static_cast<int>(fusion_stats.multi_count);

    report_progress("Entity fusion", total, total, std::to_string(fused.size()) + " fused entities");
    if (config_.verbose) {
        entity_engine_->print_results(results);
    }

    return fused;
}

std::vector<Relation> FusionPipeline::fuse_relations(
    const std::vector<Relation>& relations,
    const std::map<std::string, std::string>& id_remap
) {
    int total = static_cast<int>(relations.size());
    report_progress("Relation fusion", 0, total);

    // Endpoints must name fused entities before relations are compared
    std::vector<Relation> remapped;
    remapped.reserve(relations.size());
    for (const auto& relation : relations) {
        Relation updated = relation;
        auto head = id_remap.find(relation.head_entity_id);
        auto tail = id_remap.find(relation.tail_entity_id);
        if (head != id_remap.end()) updated.head_entity_id = head->second;
        if (tail != id_remap.end()) updated.tail_entity_id = tail->second;
        remapped.push_back(std::move(updated));
    }

    auto start = Clock::now();
    auto results = relation_engine_->batch_fuse(remapped);
    stats_.relation_fusion_time_seconds += seconds_since(start);

    std::vector<Relation> fused;
    fused.reserve(results.size());
    for (const auto& result : results) {
        fused.push_back(result.fused);
    }

    auto fusion_stats = relation_engine_->get_statistics(results);
    stats_.relations_before_fusion += total;
    stats_.relations_after_fusion += static_cast<int>(fused.size());
    stats_.relation_clusters_merged += static_cast<int>(fusion_stats.multi_count);

    report_progress("Relation fusion", total, total, std::to_string(fused.size()) + " fused relations");
    if (config_.verbose) {
        relation_engine_->print_results(results);
    }

    return fused;
}

void FusionPipeline::resolve_conflicts(std::vector<Entity>& entities, std::vector<Relation>& relations) {
    report_progress("Conflict resolution", 0, 1);
    auto start = Clock::now();

    auto conflicts = resolver_.detect_entity_conflicts(entities);
    auto relation_conflicts = resolver_.detect_relation_conflicts(relations);
    conflicts.insert(conflicts.end(), relation_conflicts.begin(), relation_conflicts.end());

    auto resolved = resolver_.batch_resolve(conflicts, config_.conflict_overrides());

    if (config_.apply_conflict_resolutions) {
        entities = resolver_.apply_entity_resolutions(entities, resolved);
    }
    if (config_.drop_contradicted_relations) {
        size_t before = relations.size();
        relations = resolver_.apply_relation_resolutions(relations, resolved);
        stats_.relations_contradicted += static_cast<int>(before - relations.size());
    }

    stats_.conflicts_detected += static_cast<int>(resolved.size());
    for (const auto& conflict : resolved) {
        if (conflict.is_resolved()) stats_.conflicts_resolved++;
        if (conflict.requires_review) stats_.conflicts_for_review++;
    }
    stats_.conflict_time_seconds += seconds_since(start);

    report_progress("Conflict resolution", 1, 1, std::to_string(resolved.size()) + " conflicts");
    if (config_.verbose && !resolved.empty()) {
        resolver_.print_summary(resolved);
    }

    last_conflicts_ = std::move(resolved);
}

void FusionPipeline::export_results(const KnowledgeGraphStore& store) const {
    const std::string& dir = config_.output_directory;

    store.export_to_json(dir + "/knowledge_graph.json");
    store.export_to_csv(dir + "/entities.csv", dir + "/relations.csv");

    std::string report_path = dir + "/conflicts.txt";
    std::ofstream report(report_path);
    if (!report.is_open()) {
        throw std::runtime_error("Failed to open file for writing: " + report_path);
    }
    report << resolver_.generate_report(last_conflicts_);
    report.close();

    std::string stats_path = dir + "/pipeline_statistics.json";
    std::ofstream stats_file(stats_path);
    if (!stats_file.is_open()) {
        throw std::runtime_error("Failed to open file for writing: " + stats_path);
    }
    stats_file << stats_.to_json().dump(2, ' ', false, nlohmann::json::error_handler_t::replace);
    stats_file.close();

    if (config_.verbose) {
        std::cout << "Saved results to: " << dir << "\n";
    }
}

void FusionPipeline::set_progress_callback(ProgressCallback callback) {
    progress_callback_ = callback;
}

void FusionPipeline::reset_statistics() {
    stats_ = PipelineStatistics();
}

void FusionPipeline::set_config(const FusionConfig& config) {
    std::string error;
    if (!config.validate(error)) {
        throw std::invalid_argument("Invalid configuration: " + error);
    }
    config_ = config;
    initialize_components();
}

void FusionPipeline::report_progress(
    const std::string& stage,
    int current,
    int total,
    const std::string& message
) {
    if (progress_callback_) {
        progress_callback_(stage, current, total, message);
    } else if (config_.verbose && total > 0) {
        std::cout << "[" << stage << "] " << current << "/" << total;
        if (!message.empty()) {
            std::cout << " - " << message;
        }
        std::cout << "\n";
    }
}

// ============================================================================
// Utility Functions
// ============================================================================

FusionConfig load_config_with_fallback(const std::string& config_path) {
    std::vector<std::string> paths_to_try;

    if (!config_path.empty()) {
        paths_to_try.push_back(config_path);
    }

    paths_to_try.push_back(".kgf_config.json");
    paths_to_try.push_back("../.kgf_config.json");
    paths_to_try.push_back("../../.kgf_config.json");

    for (const auto& path : paths_to_try) {
        if (!file_exists(path)) continue;

        try {
            auto config = FusionConfig::from_json_file(path);
            std::string error;
            if (config.validate(error)) {
                return config;
            }
            std::cerr << "Ignoring config " << path << ": " << error << "\n";
        } catch (const std::exception& e) {
            std::cerr << "Ignoring config " << path << ": " << e.what() << "\n";
        }
    }

    return FusionConfig::from_environment();
}

} // namespace kgf
