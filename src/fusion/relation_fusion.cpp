#include "fusion/relation_fusion.hpp"
#include "fusion/property_merge.hpp"
#include <algorithm>
#include <iostream>
#include <map>
#include <set>
#include <stdexcept>

namespace kgf {

namespace {

constexpr double TYPE_MATCH_WEIGHT = 0.6;
constexpr double ENTITY_MATCH_WEIGHT = 0.8;
constexpr double CONTEXT_MATCH_WEIGHT = 0.4;
constexpr double SWAPPED_PAIR_SCORE = 0.8;

void check_threshold(double threshold) {
    if (threshold < 0.0 || threshold > 1.0) {
        throw std::invalid_argument("Relation similarity threshold must be between 0.0 and 1.0");
    }
}

}  // namespace

RelationFusionEngine::RelationFusionEngine(
    double similarity_threshold,
    ConfidenceStrategy confidence_strategy,
    PropertyStrategy property_strategy,
    ClusteringMode mode,
    size_t workers
) : similarity_threshold_(similarity_threshold),
    confidence_strategy_(confidence_strategy),
    property_strategy_(property_strategy),
    mode_(mode),
    workers_(workers == 0 ? 1 : workers) {
    check_threshold(similarity_threshold);
}

void RelationFusionEngine::set_similarity_threshold(double threshold) {
    check_threshold(threshold);
    similarity_threshold_ = threshold;
}

// ============================================================================
// Matching and Clustering
// ============================================================================

double RelationFusionEngine::match_score(const Relation& a, const Relation& b) const {
    double type_score = a.type == b.type ? 1.0 : 0.0;

    double pair_score = 0.0;
    if (a.head_entity_id == b.head_entity_id && a.tail_entity_id == b.tail_entity_id) {
        pair_score = 1.0;
    } else if (a.head_entity_id == b.tail_entity_id && a.tail_entity_id == b.head_entity_id) {
        pair_score = SWAPPED_PAIR_SCORE;
    }

    double context_score = 0.0;
    auto context_a = a.properties.find("context");
    auto context_b = b.properties.find("context");
    if (context_a != a.properties.end() && context_b != b.properties.end()) {
        context_score = calculator_.context_similarity(
            context_a->second.to_string(),
            context_b->second.to_string()
        );
    }

    double total_weight = TYPE_MATCH_WEIGHT + ENTITY_MATCH_WEIGHT + CONTEXT_MATCH_WEIGHT;
    double weighted = TYPE_MATCH_WEIGHT * type_score +
                      ENTITY_MATCH_WEIGHT * pair_score +
                      CONTEXT_MATCH_WEIGHT * context_score;
    return weighted / total_weight;
}

bool RelationFusionEngine::are_duplicates(const Relation& a, const Relation& b) const {
    if (a.type == b.type &&
        a.head_entity_id == b.head_entity_id &&
        a.tail_entity_id == b.tail_entity_id) {
        return true;
    }
    return match_score(a, b) >= similarity_threshold_;
}

std::vector<std::vector<size_t>> RelationFusionEngine::identify_duplicates(
    const std::vector<Relation>& relations
) const {
    std::vector<std::vector<size_t>> duplicates;
    if (relations.size() <= 1) return duplicates;

    auto groups = cluster_items(
        mode_, relations.size(),
        [&](size_t i, size_t j) { return are_duplicates(relations[i], relations[j]); },
        workers_
    );
    for (auto& group : groups) {
        if (group.size() > 1) duplicates.push_back(std::move(group));
    }
    return duplicates;
}

std::vector<RelationCluster> RelationFusionEngine::cluster_relations(
    const std::vector<Relation>& relations
) const {
    auto groups = cluster_items(
        mode_, relations.size(),
        [&](size_t i, size_t j) { return are_duplicates(relations[i], relations[j]); },
        workers_
    );

    std::vector<RelationCluster> clusters;
    clusters.reserve(groups.size());

    for (size_t c = 0; c < groups.size(); ++c) {
        RelationCluster cluster;
        cluster.cluster_id = "relation_cluster_" + std::to_string(c);
        for (size_t index : groups[c]) {
            cluster.members.push_back(relations[index]);
        }

        cluster.confidence = cluster_confidence(cluster.members);
        if (cluster.members.size() == 1) {
            cluster.method = "single_relation";
        } else {
            cluster.representative_index = select_representative(cluster.members);
            cluster.method = "similarity_based";
        }
        clusters.push_back(std::move(cluster));
    }

    return clusters;
}

double RelationFusionEngine::cluster_confidence(const std::vector<Relation>& members) const {
    if (members.empty()) return 0.0;
    if (members.size() == 1) return members.front().confidence;

    double total_similarity = 0.0;
    size_t comparisons = 0;
    for (size_t i = 0; i < members.size(); ++i) {
        for (size_t j = i + 1; j < members.size(); ++j) {
            total_similarity += match_score(members[i], members[j]);
            comparisons++;
        }
    }

    double total_confidence = 0.0;
    for (const auto& member : members) {
        total_confidence += member.confidence;
    }

    double average_similarity = total_similarity / comparisons;
    double average_confidence = total_confidence / members.size();
    return 0.6 * average_similarity + 0.4 * average_confidence;
}

double RelationFusionEngine::representative_score(const Relation& relation) {
    double score = 0.5 * relation.confidence;
    score += 0.1 * static_cast<double>(relation.properties.size());

    auto quality = relation.properties.find("source_quality");
    if (quality != relation.properties.end()) {
        score += 0.3 * quality->second.as_number().value_or(0.0);
    }
    if (relation.properties.count("timestamp")) {
        score += 0.1;
    }
    return score;
}

size_t RelationFusionEngine::select_representative(const std::vector<Relation>& members) const {
    size_t best = 0;
    double best_score = 0.0;
    for (size_t i = 0; i < members.size(); ++i) {
        double score = representative_score(members[i]);
        if (i == 0 || score > best_score) {
            best = i;
            best_score = score;
        }
    }
    return best;
}

// ============================================================================
// Fusion
// ============================================================================

RelationFusionResult RelationFusionEngine::fuse_cluster(const RelationCluster& cluster) const {
    if (cluster.members.empty()) {
        throw std::invalid_argument("Cannot fuse an empty relation cluster");
    }

    RelationFusionResult result;
    result.sources = cluster.members;

    if (cluster.members.size() == 1) {
        result.fused = cluster.members.front();
        result.confidence = 1.0;
        result.evidence = {{"method", "no_fusion_needed"}};
        return result;
    }

    const auto& members = cluster.members;
    const Relation& representative = cluster.representative();

    std::vector<Properties> property_maps;
    std::vector<std::string> source_ids;
    for (const auto& member : members) {
        if (!member.properties.empty()) property_maps.push_back(member.properties);
        source_ids.push_back(member.id);
    }

    Relation fused;
    fused.id = representative.id;
    fused.type = representative.type;
    fused.head_entity_id = representative.head_entity_id;
    fused.tail_entity_id = representative.tail_entity_id;
    fused.properties = fuse_properties(property_maps);
    fused.confidence = fuse_confidence(members);

    result.fused = fused;
    result.confidence = fused.confidence;
    result.evidence = {
        {"method", "multi_relation_fusion"},
        {"source_count", members.size()},
        {"cluster_confidence", cluster.confidence},
        {"source_ids", source_ids},
        {"representative_id", representative.id},
        {"confidence_strategy", confidence_strategy_to_string(confidence_strategy_)},
        {"property_strategy", property_strategy_to_string(property_strategy_)}
    };
    return result;
}

std::vector<RelationFusionResult> RelationFusionEngine::batch_fuse(
    const std::vector<Relation>& relations
) const {
    std::vector<RelationFusionResult> results;
    for (const auto& cluster : cluster_relations(relations)) {
        results.push_back(fuse_cluster(cluster));
    }
    return results;
}

double RelationFusionEngine::fuse_confidence(const std::vector<Relation>& members) const {
    if (members.empty()) return 0.0;

    double total = 0.0;
    double highest = 0.0;
    for (const auto& member : members) {
        total += member.confidence;
        highest = std::max(highest, member.confidence);
    }
    double average = total / members.size();

    switch (confidence_strategy_) {
        case ConfidenceStrategy::Max:
            return highest;
        case ConfidenceStrategy::Average:
            return average;
        case ConfidenceStrategy::WeightedAverage:
        default: {
            double source_weight = std::min(1.0, static_cast<double>(members.size()) / 5.0);
            return std::min(1.0, average * (1.0 + source_weight * 0.2));
        }
    }
}

bool RelationFusionEngine::merge_values(
    const std::vector<PropertyValue>& values,
    PropertyValue& merged
) const {
    if (values.size() == 1) {
        merged = values.front();
        return true;
    }

    switch (property_strategy_) {
        case PropertyStrategy::Intersection: {
            if (merge::all_of_kind(values, PropertyValue::Kind::List)) {
                merged = merge::list_intersection(values);
                return true;
            }
            std::string first = values.front().to_string();
            for (const auto& value : values) {
                if (value.to_string() != first) return false;
            }
            merged = values.front();
            return true;
        }
        case PropertyStrategy::Vote:
            merged = merge::most_frequent(values);
            return true;
        case PropertyStrategy::Union:
        default:
            if (merge::all_of_kind(values, PropertyValue::Kind::List)) {
                merged = merge::list_union(values);
            } else if (merge::all_of_kind(values, PropertyValue::Kind::String)) {
                merged = merge::longest_string(values);
            } else {
                merged = merge::most_frequent(values);
            }
            return true;
    }
}

Properties RelationFusionEngine::fuse_properties(const std::vector<Properties>& property_maps) const {
    std::map<std::string, std::vector<PropertyValue>> values_by_key;
    for (const auto& properties : property_maps) {
        for (const auto& [key, value] : properties) {
            values_by_key[key].push_back(value);
        }
    }

    Properties fused;
    for (const auto& [key, values] : values_by_key) {
        PropertyValue merged;
        if (merge_values(values, merged)) {
            fused[key] = merged;
        }
    }
    return fused;
}

std::vector<Relation> RelationFusionEngine::remove_redundant(
    const std::vector<Relation>& relations
) const {
    if (relations.size() <= 1) return relations;

    // (head, tail) -> type -> index of the kept relation, both in first-seen order
    std::vector<std::pair<std::string, std::string>> pair_order;
    std::map<std::pair<std::string, std::string>, std::vector<std::string>> type_order;
    std::map<std::pair<std::string, std::string>, std::map<std::string, size_t>> best;

    for (size_t i = 0; i < relations.size(); ++i) {
        const auto& relation = relations[i];
        auto key = std::make_pair(relation.head_entity_id, relation.tail_entity_id);

        if (!best.count(key)) {
            pair_order.push_back(key);
        }
        auto& by_type = best[key];
        auto found = by_type.find(relation.type);
        if (found == by_type.end()) {
            by_type[relation.type] = i;
            type_order[key].push_back(relation.type);
        } else if (relation.confidence > relations[found->second].confidence) {
            found->second = i;
        }
    }

    std::vector<Relation> filtered;
    for (const auto& key : pair_order) {
        for (const auto& type : type_order[key]) {
            filtered.push_back(relations[best[key][type]]);
        }
    }
    return filtered;
}

// ============================================================================
// Reporting
// ============================================================================

FusionStatistics RelationFusionEngine::get_statistics(
    const std::vector<RelationFusionResult>& results
) const {
    return compute_fusion_statistics(results);
}

void RelationFusionEngine::print_results(
    const std::vector<RelationFusionResult>& results,
    size_t examples
) const {
    auto stats = get_statistics(results);
    stats.print_summary("Relation fusion results");

    std::vector<std::pair<std::string, size_t>> types(
        stats.type_distribution.begin(), stats.type_distribution.end());
    std::stable_sort(types.begin(), types.end(),
        [](const auto& a, const auto& b) { return a.second > b.second; });

    std::cout << "\nRelation types:\n";
    for (size_t i = 0; i < types.size() && i < 5; ++i) {
        std::cout << "  " << types[i].first << ": " << types[i].second << "\n";
    }

    std::cout << "\nFusion examples:\n";
    for (size_t i = 0; i < results.size() && i < examples; ++i) {
        const auto& rel = results[i].fused;
        std::cout << "  " << rel.head_entity_id << " -[" << rel.type << "]-> "
                  << rel.tail_entity_id << " (sources: " << results[i].sources.size()
                  << ", confidence: " << results[i].confidence << ")\n";
    }
}

} // namespace kgf
