#pragma once

#include "conflict/conflict.hpp"
#include "model/types.hpp"
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace kgf {

/**
 * @brief Outcome returned by a resolution strategy
 */
struct Resolution {
    std::optional<ConflictItem> value;
    double confidence = 0.0;
    bool requires_review = false;
};

/**
 * @brief Pluggable resolution strategy
 *
 * May throw; the resolver turns any exception into the first-item fallback.
 */
using ConflictStrategy = std::function<Resolution(const Conflict& conflict)>;

/**
 * @brief Detects and resolves residual contradictions in a fused item set
 *
 * Each conflict type has an ordered strategy list; the first entry is the
 * default. Built-in strategies:
 *
 *   highest_confidence   item with the highest score (first on ties)
 *   most_frequent, vote  most common item, confidence = count / n
 *   longest_name         names only, confidence 0.7
 *   most_specific_type   entity types only (longest), confidence 0.8
 *   average_numeric      properties only, mean at 0.8, else vote
 *   union_lists          properties only, union at 0.9, else vote
 *   source_authority     contradictory relations only, first item at 0.6
 *   manual_review        no value, confidence 0, flagged for review
 *
 * A built-in strategy used on a type it does not apply to picks the first
 * item at 0.5. Strategies registered with register_strategy take
 * precedence over built-ins of the same name.
 *
 * Any failure (unknown strategy, a throwing custom strategy, malformed
 * conflict) resolves to the first item at 0.1 and is reported on stderr;
 * it never aborts a batch. Every resolved conflict, fallbacks included,
 * is appended to this instance's history.
 */
class ConflictResolver {
public:
    explicit ConflictResolver(bool verbose = false);

    // ==========================================
    // Detection
    // ==========================================

    /**
     * @brief Conflicts among entities sharing an id
     *
     * Per id (in first-seen order): one name conflict, one type conflict,
     * then one property conflict per key (sorted) whose canonical values
     * differ. Item confidences come from each entity's declared confidence,
     * defaulting to 1.0.
     */
    std::vector<Conflict> detect_entity_conflicts(const std::vector<Entity>& entities) const;

    /**
     * @brief Conflicts among relations sharing a (head, tail) pair
     *
     * Two or more distinct types produce CONTRADICTORY_RELATIONS (items are
     * the relations) when a known contradictory pair is present, otherwise
     * RELATION_TYPE_CONFLICT (items are the type names).
     */
    std::vector<Conflict> detect_relation_conflicts(const std::vector<Relation>& relations) const;

    static bool are_contradictory(const std::vector<std::string>& relation_types);
    static const std::vector<std::pair<std::string, std::string>>& contradictory_pairs();

    // ==========================================
    // Resolution
    // ==========================================

    /**
     * @brief Resolve one conflict
     *
     * @param conflict Conflict to resolve (returned with its outcome set)
     * @param strategy Strategy name; empty selects the type's default
     */
    Conflict resolve(Conflict conflict, const std::string& strategy = "");

    /**
     * @brief Resolve many conflicts, with optional per-type strategy overrides
     */
    std::vector<Conflict> batch_resolve(
        const std::vector<Conflict>& conflicts,
        const std::map<ConflictType, std::string>& overrides = {}
    );

    const std::vector<std::string>& get_strategies(ConflictType type) const;
    void set_strategies(ConflictType type, const std::vector<std::string>& strategies);

    void register_strategy(const std::string& name, ConflictStrategy strategy);
    bool has_strategy(const std::string& name) const;

    /**
     * @brief Every conflict resolved by this instance, in resolution order
     */
    const std::vector<Conflict>& get_history() const { return history_; }

    // ==========================================
    // Applying Resolutions
    // ==========================================

    /**
     * @brief Collapse entities sharing an id into one entity per id
     *
     * Resolved name, type and property values win; otherwise the first
     * occurrence wins. Losing names become aliases. Output keeps first-seen
     * id order.
     */
    std::vector<Entity> apply_entity_resolutions(
        const std::vector<Entity>& entities,
        const std::vector<Conflict>& conflicts
    ) const;

    /**
     * @brief Drop the losing relations of resolved contradictory conflicts
     */
    std::vector<Relation> apply_relation_resolutions(
        const std::vector<Relation>& relations,
        const std::vector<Conflict>& conflicts
    ) const;

    // ==========================================
    // Reporting
    // ==========================================

    ConflictStatistics get_statistics(const std::vector<Conflict>& conflicts) const;
    std::string generate_report(const std::vector<Conflict>& conflicts) const;
    void print_summary(const std::vector<Conflict>& conflicts) const;

    void set_verbose(bool verbose) { verbose_ = verbose; }

private:
    bool verbose_;
    std::map<ConflictType, std::vector<std::string>> strategies_;
    std::map<std::string, ConflictStrategy> custom_strategies_;
    std::vector<Conflict> history_;

    Resolution apply_strategy(const Conflict& conflict, const std::string& strategy) const;
};

} // namespace kgf
