#pragma once

#include "model/types.hpp"
#include <iostream>
#include <map>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace kgf {

/**
 * @brief Transient group of candidates judged to be the same item
 *
 * Built and consumed within one fusion pass.
 */
template <typename T>
struct Cluster {
    std::string cluster_id;
    std::vector<T> members;                            // At least one, input order
    size_t representative_index = 0;                   // Index into members
    double confidence = 1.0;
    std::string method;                                // "similarity_based" or "single_*"

    const T& representative() const { return members.at(representative_index); }
};

using EntityCluster = Cluster<Entity>;
using RelationCluster = Cluster<Relation>;

/**
 * @brief Outcome of fusing one cluster
 */
template <typename T>
struct FusionResult {
    T fused;
    std::vector<T> sources;
    double confidence = 1.0;                           // [0, 1]
    nlohmann::json evidence = nlohmann::json::object();
};

using EntityFusionResult = FusionResult<Entity>;
using RelationFusionResult = FusionResult<Relation>;

/**
 * @brief Summary of one fusion pass
 */
struct FusionStatistics {
    size_t total_fusions = 0;
    size_t single_count = 0;                           // Clusters of one
    size_t multi_count = 0;                            // Clusters of two or more
    double average_confidence = 0.0;
    size_t high_confidence_count = 0;                  // > 0.8
    size_t medium_confidence_count = 0;                // [0.5, 0.8]
    size_t low_confidence_count = 0;                   // < 0.5
    std::map<size_t, size_t> source_distribution;      // source count -> clusters
    std::map<std::string, size_t> type_distribution;   // fused type -> clusters

    nlohmann::json to_json() const {
        nlohmann::json j;
        j["total_fusions"] = total_fusions;
        j["single_count"] = single_count;
        j["multi_count"] = multi_count;
        j["average_confidence"] = average_confidence;
        j["high_confidence_count"] = high_confidence_count;
        j["medium_confidence_count"] = medium_confidence_count;
        j["low_confidence_count"] = low_confidence_count;

        nlohmann::json sources = nlohmann::json::object();
        for (const auto& [count, clusters] : source_distribution) {
            sources[std::to_string(count)] = clusters;
        }
        j["source_distribution"] = sources;
        j["type_distribution"] = type_distribution;
        return j;
    }

    void print_summary(const std::string& title) const {
        std::cout << title << " (" << total_fusions << " fused items):\n";
        std::cout << "  Single: " << single_count << "\n";
        std::cout << "  Multi-source: " << multi_count << "\n";
        std::cout << "  Average confidence: " << average_confidence << "\n";
        std::cout << "  High / medium / low: " << high_confidence_count << " / "
                  << medium_confidence_count << " / " << low_confidence_count << "\n";
        for (const auto& [count, clusters] : source_distribution) {
            std::cout << "  " << count << " source(s): " << clusters << "\n";
        }
    }
};

template <typename T>
FusionStatistics compute_fusion_statistics(const std::vector<FusionResult<T>>& results) {
    FusionStatistics stats;
    stats.total_fusions = results.size();

    double total_confidence = 0.0;
    for (const auto& result : results) {
        size_t source_count = result.sources.size();
        if (source_count <= 1) {
            stats.single_count++;
        } else {
            stats.multi_count++;
        }
        stats.source_distribution[source_count]++;
        stats.type_distribution[result.fused.type]++;

        total_confidence += result.confidence;
        if (result.confidence > 0.8) {
            stats.high_confidence_count++;
        } else if (result.confidence >= 0.5) {
            stats.medium_confidence_count++;
        } else {
            stats.low_confidence_count++;
        }
    }

    if (!results.empty()) {
        stats.average_confidence = total_confidence / results.size();
    }

    return stats;
}

} // namespace kgf
