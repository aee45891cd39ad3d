#pragma once

#include "model/types.hpp"
#include <string>
#include <vector>
#include <utility>

namespace kgf {

/**
 * @brief String similarity method selector
 */
enum class StringSimilarityMethod {
    Levenshtein,
    Jaccard,
    Cosine,
    LCS,
    Combined
};

std::string similarity_method_to_string(StringSimilarityMethod method);
StringSimilarityMethod string_to_similarity_method(const std::string& name);

/**
 * @brief Lexical and structural similarity functions
 *
 * Every function is pure, symmetric in its two arguments and returns a
 * value in [0, 1]. Strings are compared as sequences of Unicode code points.
 * The calculator holds no state, so one instance may be shared across
 * threads.
 */
class SimilarityCalculator {
public:
    // ==========================================
    // String Similarity
    // ==========================================

    /**
     * @brief Dispatch to one string similarity method
     *
     * Exact equality short-circuits to 1.0, and an empty argument to 0.0,
     * before any method runs.
     */
    double string_similarity(
        const std::string& a,
        const std::string& b,
        StringSimilarityMethod method = StringSimilarityMethod::Combined
    ) const;

    /**
     * @brief 1 - editDistance(a, b) / max(len(a), len(b))
     */
    double levenshtein_similarity(const std::string& a, const std::string& b) const;

    /**
     * @brief Jaccard index over lower-cased character n-gram sets
     *
     * A string shorter than n contributes itself as its only n-gram.
     */
    double jaccard_similarity(const std::string& a, const std::string& b, size_t n = 2) const;

    /**
     * @brief Cosine of lower-cased character frequency vectors
     */
    double cosine_similarity(const std::string& a, const std::string& b) const;

    /**
     * @brief 2 * LCS(a, b) / (len(a) + len(b))
     */
    double lcs_similarity(const std::string& a, const std::string& b) const;

    /**
     * @brief 0.3 edit + 0.3 n-gram Jaccard + 0.2 cosine + 0.2 LCS
     */
    double combined_similarity(const std::string& a, const std::string& b) const;

    /**
     * @brief Keyword-overlap similarity of two free-text contexts
     *
     * Keywords are lower-cased ASCII words of two or more characters plus
     * code-point bigrams of non-ASCII runs. Both empty gives 1.0, one empty 0.0.
     */
    double context_similarity(const std::string& a, const std::string& b) const;

    // ==========================================
    // Structural Similarity
    // ==========================================

    /**
     * @brief Similarity of two property maps
     *
     * 0.5 * key-set Jaccard + 0.5 * average value similarity over common keys.
     * Strings compare with the combined string score, lists as sets, other
     * values by equality. Two empty maps are identical (1.0); one empty
     * map against a non-empty one scores 0.0.
     */
    double structural_similarity(const Properties& a, const Properties& b) const;

    /**
     * @brief Set Jaccard of two lists, compared by canonical string form
     */
    double list_similarity(
        const std::vector<PropertyValue>& a,
        const std::vector<PropertyValue>& b
    ) const;

    /**
     * @brief Jaccard index of two string sets; 0.0 when both are empty
     */
    double set_jaccard(
        const std::vector<std::string>& a,
        const std::vector<std::string>& b
    ) const;

    // ==========================================
    // Entity / Relation Similarity
    // ==========================================

    /**
     * @brief 0.4 name + 0.3 type (exact) + 0.2 properties + 0.1 aliases
     */
    double entity_similarity(const Entity& a, const Entity& b) const;

    /**
     * @brief 0.5 type + 0.25 head + 0.25 tail, each by string similarity
     */
    double relation_similarity(const Relation& a, const Relation& b) const;

    // ==========================================
    // Batch Helpers
    // ==========================================

    /**
     * @brief Best-scoring candidates for a query, highest first
     *
     * Ties keep candidate order.
     */
    std::vector<std::pair<std::string, double>> fuzzy_match(
        const std::string& query,
        const std::vector<std::string>& candidates,
        size_t top_k = 5
    ) const;

    /**
     * @brief Symmetric pairwise matrix with 1.0 on the diagonal
     */
    std::vector<std::vector<double>> similarity_matrix(
        const std::vector<std::string>& items,
        StringSimilarityMethod method = StringSimilarityMethod::Combined
    ) const;

    /**
     * @brief Seed-based duplicate groups (only groups of two or more)
     *
     * Each unvisited item seeds a group and absorbs every later unvisited
     * item whose similarity to the seed reaches the threshold. Members are
     * never compared with each other.
     */
    std::vector<std::vector<size_t>> find_duplicates(
        const std::vector<std::string>& items,
        double threshold = 0.8
    ) const;

    /**
     * @brief Connected components of the thresholded similarity graph
     *
     * Every item lands in exactly one cluster; singletons included.
     * Clusters are ordered by their smallest index, members ascending.
     */
    std::vector<std::vector<size_t>> cluster_by_similarity(
        const std::vector<std::string>& items,
        double threshold = 0.7
    ) const;
};

} // namespace kgf
