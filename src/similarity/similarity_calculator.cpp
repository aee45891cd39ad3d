#include "similarity/similarity_calculator.hpp"
#include "similarity/clustering.hpp"
#include "similarity/text_utils.hpp"
#include <algorithm>
#include <cmath>
#include <map>
#include <set>
#include <stdexcept>

namespace kgf {

namespace {

std::set<std::u32string> char_ngrams(const std::u32string& text, size_t n) {
    std::set<std::u32string> grams;
    if (text.size() < n) {
        grams.insert(text);
        return grams;
    }
    for (size_t i = 0; i + n <= text.size(); ++i) {
        grams.insert(text.substr(i, n));
    }
    return grams;
}

template <typename T>
double set_jaccard_impl(const std::set<T>& a, const std::set<T>& b) {
    size_t intersection = 0;
    for (const auto& item : a) {
        if (b.count(item)) ++intersection;
    }
    size_t union_size = a.size() + b.size() - intersection;
    return union_size > 0 ? static_cast<double>(intersection) / union_size : 0.0;
}

size_t edit_distance(const std::u32string& a, const std::u32string& b) {
    std::vector<size_t> previous(b.size() + 1);
    std::vector<size_t> current(b.size() + 1);

    for (size_t j = 0; j <= b.size(); ++j) previous[j] = j;

    for (size_t i = 1; i <= a.size(); ++i) {
        current[0] = i;
        for (size_t j = 1; j <= b.size(); ++j) {
            size_t cost = (a[i - 1] == b[j - 1]) ? 0 : 1;
            current[j] = std::min({previous[j] + 1, current[j - 1] + 1, previous[j - 1] + cost});
        }
        std::swap(previous, current);
    }

    return previous[b.size()];
}

size_t lcs_length(const std::u32string& a, const std::u32string& b) {
    std::vector<size_t> previous(b.size() + 1, 0);
    std::vector<size_t> current(b.size() + 1, 0);

    for (size_t i = 1; i <= a.size(); ++i) {
        for (size_t j = 1; j <= b.size(); ++j) {
            if (a[i - 1] == b[j - 1]) {
                current[j] = previous[j - 1] + 1;
            } else {
                current[j] = std::max(previous[j], current[j - 1]);
            }
        }
        std::swap(previous, current);
        std::fill(current.begin(), current.end(), 0);
    }

    return previous[b.size()];
}

// Stop words for context keywords (function words that carry no topic)
const std::set<std::u32string>& stop_words() {
    static const std::set<std::u32string> words = {
        U"the", U"of", U"and", U"to", U"in", U"is", U"was", U"for", U"on", U"at",
        U"by", U"an", U"as", U"it", U"be", U"with", U"that", U"this", U"from",
        U"的", U"了", U"在", U"是", U"我", U"有", U"和", U"就", U"不", U"人",
        U"都", U"一", U"个", U"上", U"也", U"很", U"到", U"说", U"要", U"去",
        U"你", U"会", U"着", U"没有"
    };
    return words;
}

bool is_ascii_alnum(char32_t c) {
    return (c >= U'a' && c <= U'z') || (c >= U'A' && c <= U'Z') || (c >= U'0' && c <= U'9');
}

std::set<std::u32string> extract_keywords(const std::string& text) {
    std::u32string lowered = text::to_lower(text::decode_utf8(text));
    std::set<std::u32string> keywords;

    std::u32string ascii_word;
    std::u32string wide_run;

    auto flush_ascii = [&]() {
        if (ascii_word.size() > 1 && !stop_words().count(ascii_word)) {
            keywords.insert(ascii_word);
        }
        ascii_word.clear();
    };
    auto flush_wide = [&]() {
        if (wide_run.size() == 1) {
            wide_run.clear();
            return;
        }
        for (size_t i = 0; i + 2 <= wide_run.size(); ++i) {
            std::u32string gram = wide_run.substr(i, 2);
            if (!stop_words().count(gram)) {
                keywords.insert(gram);
            }
        }
        wide_run.clear();
    };

    for (char32_t c : lowered) {
        if (is_ascii_alnum(c)) {
            flush_wide();
            ascii_word.push_back(c);
        } else if (c >= 0x80 && c != 0x3000 && !(c >= 0x3001 && c <= 0x303F) &&
                   !(c >= 0xFF00 && c <= 0xFF0F)) {
            flush_ascii();
            wide_run.push_back(c);
        } else {
            flush_ascii();
            flush_wide();
        }
    }
    flush_ascii();
    flush_wide();

    return keywords;
}

} // namespace

std::string similarity_method_to_string(StringSimilarityMethod method) {
    switch (method) {
        case StringSimilarityMethod::Levenshtein: return "levenshtein";
        case StringSimilarityMethod::Jaccard: return "jaccard";
        case StringSimilarityMethod::Cosine: return "cosine";
        case StringSimilarityMethod::LCS: return "lcs";
        case StringSimilarityMethod::Combined: return "combined";
    }
    return "combined";
}

StringSimilarityMethod string_to_similarity_method(const std::string& name) {
    if (name == "levenshtein") return StringSimilarityMethod::Levenshtein;
    if (name == "jaccard") return StringSimilarityMethod::Jaccard;
    if (name == "cosine") return StringSimilarityMethod::Cosine;
    if (name == "lcs") return StringSimilarityMethod::LCS;
    if (name == "combined") return StringSimilarityMethod::Combined;
    throw std::invalid_argument("Unknown similarity method: " + name);
}

// ==========================================
// String Similarity
// ==========================================

double SimilarityCalculator::string_similarity(
    const std::string& a,
    const std::string& b,
    StringSimilarityMethod method
) const {
    if (a.empty() || b.empty()) return 0.0;
    if (a == b) return 1.0;

    switch (method) {
        case StringSimilarityMethod::Levenshtein: return levenshtein_similarity(a, b);
        case StringSimilarityMethod::Jaccard: return jaccard_similarity(a, b);
        case StringSimilarityMethod::Cosine: return cosine_similarity(a, b);
        case StringSimilarityMethod::LCS: return lcs_similarity(a, b);
        default: return combined_similarity(a, b);
    }
}

double SimilarityCalculator::levenshtein_similarity(const std::string& a, const std::string& b) const {
    auto ua = text::decode_utf8(a);
    auto ub = text::decode_utf8(b);

    size_t max_len = std::max(ua.size(), ub.size());
    if (max_len == 0) return 1.0;

    return 1.0 - static_cast<double>(edit_distance(ua, ub)) / max_len;
}

double SimilarityCalculator::jaccard_similarity(const std::string& a, const std::string& b, size_t n) const {
    if (n == 0) n = 1;
    auto grams_a = char_ngrams(text::to_lower(text::decode_utf8(a)), n);
    auto grams_b = char_ngrams(text::to_lower(text::decode_utf8(b)), n);
    return set_jaccard_impl(grams_a, grams_b);
}

double SimilarityCalculator::cosine_similarity(const std::string& a, const std::string& b) const {
    std::map<char32_t, long long> freq_a;
    std::map<char32_t, long long> freq_b;
    for (char32_t c : text::to_lower(text::decode_utf8(a))) freq_a[c]++;
    for (char32_t c : text::to_lower(text::decode_utf8(b))) freq_b[c]++;

    // Integer accumulation keeps the score exactly symmetric
    long long dot = 0;
    for (const auto& [c, count] : freq_a) {
        auto it = freq_b.find(c);
        if (it != freq_b.end()) dot += count * it->second;
    }

    long long sq_a = 0;
    long long sq_b = 0;
    for (const auto& [c, count] : freq_a) sq_a += count * count;
    for (const auto& [c, count] : freq_b) sq_b += count * count;

    if (sq_a == 0 || sq_b == 0) return 0.0;

    double score = static_cast<double>(dot) /
                   std::sqrt(static_cast<double>(sq_a) * static_cast<double>(sq_b));
    return std::min(1.0, score);
}

double SimilarityCalculator::lcs_similarity(const std::string& a, const std::string& b) const {
    auto ua = text::decode_utf8(a);
    auto ub = text::decode_utf8(b);

    size_t total = ua.size() + ub.size();
    if (total == 0) return 0.0;

    return (2.0 * lcs_length(ua, ub)) / total;
}

double SimilarityCalculator::combined_similarity(const std::string& a, const std::string& b) const {
    double lev = levenshtein_similarity(a, b);
    double jac = jaccard_similarity(a, b);
    double cos = cosine_similarity(a, b);
    double lcs = lcs_similarity(a, b);

    return lev * 0.3 + jac * 0.3 + cos * 0.2 + lcs * 0.2;
}

double SimilarityCalculator::context_similarity(const std::string& a, const std::string& b) const {
    auto keywords_a = extract_keywords(a);
    auto keywords_b = extract_keywords(b);

    if (keywords_a.empty() && keywords_b.empty()) return 1.0;
    if (keywords_a.empty() || keywords_b.empty()) return 0.0;

    return set_jaccard_impl(keywords_a, keywords_b);
}

// ==========================================
// Structural Similarity
// ==========================================

double SimilarityCalculator::structural_similarity(const Properties& a, const Properties& b) const {
    if (a.empty() && b.empty()) return 1.0;
    if (a.empty() || b.empty()) return 0.0;

    size_t common = 0;
    double value_total = 0.0;

    for (const auto& [key, value_a] : a) {
        auto it = b.find(key);
        if (it == b.end()) continue;

        ++common;
        const auto& value_b = it->second;

        if (value_a.is_string() && value_b.is_string()) {
            value_total += string_similarity(value_a.string_value, value_b.string_value);
        } else if (value_a.is_list() && value_b.is_list()) {
            value_total += list_similarity(value_a.list_value, value_b.list_value);
        } else if (value_a == value_b) {
            value_total += 1.0;
        }
    }

    size_t key_union = a.size() + b.size() - common;
    double key_similarity = key_union > 0 ? static_cast<double>(common) / key_union : 0.0;
    double value_similarity = common > 0 ? value_total / common : 0.0;

    return key_similarity * 0.5 + value_similarity * 0.5;
}

double SimilarityCalculator::list_similarity(
    const std::vector<PropertyValue>& a,
    const std::vector<PropertyValue>& b
) const {
    if (a.empty() && b.empty()) return 1.0;
    if (a.empty() || b.empty()) return 0.0;

    std::set<std::string> set_a;
    std::set<std::string> set_b;
    for (const auto& item : a) set_a.insert(item.to_string());
    for (const auto& item : b) set_b.insert(item.to_string());

    return set_jaccard_impl(set_a, set_b);
}

double SimilarityCalculator::set_jaccard(
    const std::vector<std::string>& a,
    const std::vector<std::string>& b
) const {
    std::set<std::string> set_a(a.begin(), a.end());
    std::set<std::string> set_b(b.begin(), b.end());
    return set_jaccard_impl(set_a, set_b);
}

// ==========================================
// Entity / Relation Similarity
// ==========================================

double SimilarityCalculator::entity_similarity(const Entity& a, const Entity& b) const {
    double name_sim = string_similarity(a.name, b.name);
    double type_sim = (a.type == b.type) ? 1.0 : 0.0;
    double props_sim = structural_similarity(a.properties, b.properties);
    double alias_sim = set_jaccard(a.aliases, b.aliases);

    return name_sim * 0.4 + type_sim * 0.3 + props_sim * 0.2 + alias_sim * 0.1;
}

double SimilarityCalculator::relation_similarity(const Relation& a, const Relation& b) const {
    double type_sim = string_similarity(a.type, b.type);
    double head_sim = string_similarity(a.head_entity_id, b.head_entity_id);
    double tail_sim = string_similarity(a.tail_entity_id, b.tail_entity_id);

    return type_sim * 0.5 + head_sim * 0.25 + tail_sim * 0.25;
}

// ==========================================
// Batch Helpers
// ==========================================

std::vector<std::pair<std::string, double>> SimilarityCalculator::fuzzy_match(
    const std::string& query,
    const std::vector<std::string>& candidates,
    size_t top_k
) const {
    std::vector<std::pair<std::string, double>> scores;
    scores.reserve(candidates.size());

    for (const auto& candidate : candidates) {
        scores.emplace_back(candidate, string_similarity(query, candidate));
    }

    std::stable_sort(scores.begin(), scores.end(),
                     [](const auto& x, const auto& y) { return x.second > y.second; });

    if (scores.size() > top_k) {
        scores.resize(top_k);
    }

    return scores;
}

std::vector<std::vector<double>> SimilarityCalculator::similarity_matrix(
    const std::vector<std::string>& items,
    StringSimilarityMethod method
) const {
    size_t n = items.size();
    std::vector<std::vector<double>> matrix(n, std::vector<double>(n, 0.0));

    for (size_t i = 0; i < n; ++i) {
        matrix[i][i] = 1.0;
        for (size_t j = i + 1; j < n; ++j) {
            double sim = string_similarity(items[i], items[j], method);
            matrix[i][j] = sim;
            matrix[j][i] = sim;
        }
    }

    return matrix;
}

std::vector<std::vector<size_t>> SimilarityCalculator::find_duplicates(
    const std::vector<std::string>& items,
    double threshold
) const {
    auto clusters = seed_clusters(items.size(), [&](size_t i, size_t j) {
        return string_similarity(items[i], items[j]) >= threshold;
    });

    std::vector<std::vector<size_t>> duplicates;
    for (auto& cluster : clusters) {
        if (cluster.size() > 1) {
            duplicates.push_back(std::move(cluster));
        }
    }
    return duplicates;
}

std::vector<std::vector<size_t>> SimilarityCalculator::cluster_by_similarity(
    const std::vector<std::string>& items,
    double threshold
) const {
    return connected_clusters(items.size(), [&](size_t i, size_t j) {
        return string_similarity(items[i], items[j]) >= threshold;
    });
}

} // namespace kgf
