#pragma once

#include "fusion/fusion_result.hpp"
#include "model/types.hpp"
#include "similarity/clustering.hpp"
#include "similarity/similarity_calculator.hpp"
#include <string>
#include <vector>

namespace kgf {

/**
 * @brief Clusters candidate entities and merges each cluster into one
 *
 * Grouping defaults to seed-based single link: every unclustered entity,
 * taken in input order, seeds a cluster and absorbs each later unclustered
 * entity whose entity_similarity to the seed reaches the threshold. Members
 * are never compared with each other. ClusteringMode::Connected switches to
 * connected components of the same similarity graph.
 *
 * Results come back one per cluster, in seed order. Merge rules:
 *   - name: longest name that is not a short all-caps abbreviation
 *     (<= 5 code points), else the most frequent name; first wins ties
 *   - type: majority vote, ties to the longest type, then first seen
 *   - properties, per key: strings -> longest, numbers -> mean,
 *     lists -> union (first occurrence order), anything else -> most
 *     frequent canonical string mapped back to its typed value
 *   - aliases: member alias lists plus member names, minus the fused name
 *
 * The fused entity keeps the id of the cluster representative.
 */
class EntityFusionEngine {
public:
    /**
     * @param similarity_threshold Duplicate threshold in [0, 1]
     * @param mode Seed (default) or connected-component grouping
     * @param workers Threads used for pairwise comparisons
     */
    explicit EntityFusionEngine(
        double similarity_threshold = 0.8,
        ClusteringMode mode = ClusteringMode::Seed,
        size_t workers = 1
    );

    // ==========================================
    // Clustering
    // ==========================================

    /**
     * @brief Index groups of size two or more, in seed order
     */
    std::vector<std::vector<size_t>> identify_duplicates(const std::vector<Entity>& entities) const;

    /**
     * @brief Every entity lands in exactly one cluster
     */
    std::vector<EntityCluster> cluster_entities(const std::vector<Entity>& entities) const;

    /**
     * @brief Average pairwise entity similarity; 1.0 for a single member
     */
    double cluster_confidence(const std::vector<Entity>& members) const;

    /**
     * @brief 0.1 * name length + 0.2 * property count + 0.1 * alias count
     *        + 0.5 * declared confidence
     */
    static double representative_score(const Entity& entity);

    /**
     * @brief Index of the best-scoring member; earliest wins ties
     */
    size_t select_representative(const std::vector<Entity>& members) const;

    // ==========================================
    // Fusion
    // ==========================================

    /**
     * @brief Merge one cluster
     *
     * A single-member cluster is returned unchanged with confidence 1.0.
     */
    EntityFusionResult fuse_cluster(const EntityCluster& cluster) const;

    /**
     * @brief Cluster then fuse; one result per cluster
     */
    std::vector<EntityFusionResult> batch_fuse(const std::vector<Entity>& entities) const;

    std::string fuse_names(const std::vector<std::string>& names) const;
    std::string fuse_types(const std::vector<std::string>& types) const;
    Properties fuse_properties(const std::vector<Properties>& property_maps) const;
    PropertyValue fuse_property_values(const std::vector<PropertyValue>& values) const;

    std::vector<std::string> fuse_aliases(
        const std::vector<Entity>& members,
        const std::string& fused_name
    ) const;

    /**
     * @brief Confidence of a multi-member fusion
     *
     * 0.3 * min(1, n/5) + 0.4 * fused/total property count (0.5 when the
     * sources carry no properties) + 0.3 * mean of name and type
     * consistency, clamped to [0, 1].
     */
    double fusion_confidence(const std::vector<Entity>& sources, const Entity& fused) const;

    // ==========================================
    // Reporting
    // ==========================================

    FusionStatistics get_statistics(const std::vector<EntityFusionResult>& results) const;

    /**
     * @brief Print statistics and the first few fusions to stdout
     */
    void print_results(const std::vector<EntityFusionResult>& results, size_t examples = 5) const;

    double get_similarity_threshold() const { return similarity_threshold_; }
    ClusteringMode get_clustering_mode() const { return mode_; }
    size_t get_workers() const { return workers_; }

    void set_similarity_threshold(double threshold);
    void set_clustering_mode(ClusteringMode mode) { mode_ = mode; }
    void set_workers(size_t workers) { workers_ = workers == 0 ? 1 : workers; }

    const SimilarityCalculator& calculator() const { return calculator_; }

private:
    double similarity_threshold_;
    ClusteringMode mode_;
    size_t workers_;
    SimilarityCalculator calculator_;

    std::vector<std::vector<size_t>> group(const std::vector<Entity>& entities) const;
};

} // namespace kgf
