#pragma once

#include "fusion/fusion_result.hpp"
#include "model/types.hpp"
#include "similarity/clustering.hpp"
#include "similarity/similarity_calculator.hpp"
#include <string>
#include <vector>

namespace kgf {

// How member confidences combine into the fused relation confidence
enum class ConfidenceStrategy {
    Max,
    Average,
    WeightedAverage
};

inline std::string confidence_strategy_to_string(ConfidenceStrategy strategy) {
    switch (strategy) {
        case ConfidenceStrategy::Max: return "max";
        case ConfidenceStrategy::Average: return "average";
        case ConfidenceStrategy::WeightedAverage: return "weighted_average";
    }
    return "weighted_average";
}

inline bool string_to_confidence_strategy(const std::string& name, ConfidenceStrategy& strategy) {
    if (name == "max") { strategy = ConfidenceStrategy::Max; return true; }
    if (name == "average") { strategy = ConfidenceStrategy::Average; return true; }
    if (name == "weighted_average") { strategy = ConfidenceStrategy::WeightedAverage; return true; }
    return false;
}

// How member property maps combine into the fused relation properties
enum class PropertyStrategy {
    Union,
    Intersection,
    Vote
};

inline std::string property_strategy_to_string(PropertyStrategy strategy) {
    switch (strategy) {
        case PropertyStrategy::Union: return "union";
        case PropertyStrategy::Intersection: return "intersection";
        case PropertyStrategy::Vote: return "vote";
    }
    return "union";
}

inline bool string_to_property_strategy(const std::string& name, PropertyStrategy& strategy) {
    if (name == "union") { strategy = PropertyStrategy::Union; return true; }
    if (name == "intersection") { strategy = PropertyStrategy::Intersection; return true; }
    if (name == "vote") { strategy = PropertyStrategy::Vote; return true; }
    return false;
}

/**
 * @brief Clusters candidate relations and merges each cluster into one
 *
 * Two relations are duplicates when (type, head, tail) match exactly, or
 * when their match score reaches the threshold. The match score is
 *
 *   (0.6 * type_equal + 0.8 * pair_match + 0.4 * context_similarity) / 1.8
 *
 * where pair_match is 1.0 for the same (head, tail), 0.8 for the swapped
 * pair and 0.0 otherwise, and context_similarity is 0.0 unless both
 * relations carry a "context" property. Grouping uses the same seed-based
 * (or connected) clustering as entity fusion.
 *
 * The fused relation keeps the representative's id, type and endpoints.
 */
class RelationFusionEngine {
public:
    explicit RelationFusionEngine(
        double similarity_threshold = 0.8,
        ConfidenceStrategy confidence_strategy = ConfidenceStrategy::WeightedAverage,
        PropertyStrategy property_strategy = PropertyStrategy::Union,
        ClusteringMode mode = ClusteringMode::Seed,
        size_t workers = 1
    );

    // ==========================================
    // Matching and Clustering
    // ==========================================

    double match_score(const Relation& a, const Relation& b) const;
    bool are_duplicates(const Relation& a, const Relation& b) const;

    /**
     * @brief Index groups of size two or more, in seed order
     */
    std::vector<std::vector<size_t>> identify_duplicates(const std::vector<Relation>& relations) const;

    std::vector<RelationCluster> cluster_relations(const std::vector<Relation>& relations) const;

    /**
     * @brief 0.6 * average pairwise match score + 0.4 * average confidence
     *
     * A single member reports its own confidence.
     */
    double cluster_confidence(const std::vector<Relation>& members) const;

    /**
     * @brief 0.5 * confidence + 0.1 * property count
     *        + 0.3 * "source_quality" + 0.1 if a "timestamp" is present
     */
    static double representative_score(const Relation& relation);

    size_t select_representative(const std::vector<Relation>& members) const;

    // ==========================================
    // Fusion
    // ==========================================

    /**
     * @brief Merge one cluster
     *
     * A single-member cluster is returned unchanged with confidence 1.0.
     */
    RelationFusionResult fuse_cluster(const RelationCluster& cluster) const;

    std::vector<RelationFusionResult> batch_fuse(const std::vector<Relation>& relations) const;

    /**
     * @brief Combine member confidences with the configured strategy
     *
     * weighted_average: mean * (1 + 0.2 * min(1, n/5)), capped at 1.0.
     */
    double fuse_confidence(const std::vector<Relation>& members) const;

    /**
     * @brief Combine member properties with the configured strategy
     *
     * Under intersection, a key whose non-list values disagree is left out.
     */
    Properties fuse_properties(const std::vector<Properties>& property_maps) const;

    /**
     * @brief Keep one relation per (head, tail, type), the most confident
     *
     * Independent of clustering. Earliest wins confidence ties; output keeps
     * the order in which each (head, tail) pair and type first appeared.
     */
    std::vector<Relation> remove_redundant(const std::vector<Relation>& relations) const;

    // ==========================================
    // Reporting
    // ==========================================

    FusionStatistics get_statistics(const std::vector<RelationFusionResult>& results) const;
    void print_results(const std::vector<RelationFusionResult>& results, size_t examples = 5) const;

    double get_similarity_threshold() const { return similarity_threshold_; }
    ConfidenceStrategy get_confidence_strategy() const { return confidence_strategy_; }
    PropertyStrategy get_property_strategy() const { return property_strategy_; }
    ClusteringMode get_clustering_mode() const { return mode_; }

    void set_similarity_threshold(double threshold);
    void set_confidence_strategy(ConfidenceStrategy strategy) { confidence_strategy_ = strategy; }
    void set_property_strategy(PropertyStrategy strategy) { property_strategy_ = strategy; }
    void set_clustering_mode(ClusteringMode mode) { mode_ = mode; }
    void set_workers(size_t workers) { workers_ = workers == 0 ? 1 : workers; }

private:
    double similarity_threshold_;
    ConfidenceStrategy confidence_strategy_;
    PropertyStrategy property_strategy_;
    ClusteringMode mode_;
    size_t workers_;
    SimilarityCalculator calculator_;

    bool merge_values(
        const std::vector<PropertyValue>& values,
        PropertyValue& merged
    ) const;
};

} // namespace kgf
