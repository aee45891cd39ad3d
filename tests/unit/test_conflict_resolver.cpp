#include <gtest/gtest.h>
#include "conflict/conflict_resolver.hpp"
#include "model/errors.hpp"

using namespace kgf;

class ConflictResolverTest : public ::testing::Test {
protected:
    ConflictResolver resolver;

    static std::string value_text(const ConflictItem& item) {
        return std::get<PropertyValue>(item).to_string();
    }

    static Conflict make_conflict(ConflictType type, std::vector<ConflictItem> items,
                                  std::vector<double> scores) {
        Conflict conflict;
        conflict.conflict_id = "test_conflict";
        conflict.type = type;
        conflict.subject_id = "e1";
        conflict.conflicting_items = std::move(items);
        conflict.confidence_scores = std::move(scores);
        return conflict;
    }
};

// ==========================================
// Detection Tests
// ==========================================

TEST_F(ConflictResolverTest, SharedIdWithTwoNames) {
    std::vector<Entity> entities = {
        Entity("e1", "Tencent", "Organization"),
        Entity("e1", "腾讯公司", "Organization")
    };

    auto conflicts = resolver.detect_entity_conflicts(entities);
    ASSERT_EQ(conflicts.size(), 1);

    const auto& conflict = conflicts[0];
    EXPECT_EQ(conflict.type, ConflictType::ENTITY_NAME_CONFLICT);
    EXPECT_EQ(conflict.conflict_id, "name_conflict_e1");
    EXPECT_EQ(conflict.subject_id, "e1");
    ASSERT_EQ(conflict.conflicting_items.size(), 2);
    EXPECT_EQ(value_text(conflict.conflicting_items[0]), "Tencent");
    EXPECT_EQ(value_text(conflict.conflicting_items[1]), "腾讯公司");
    EXPECT_EQ(conflict.confidence_scores, (std::vector<double>{1.0, 1.0}));
    EXPECT_FALSE(conflict.is_resolved());
}

TEST_F(ConflictResolverTest, TypeAndPropertyConflicts) {
    std::vector<Entity> entities = {
        Entity("e1", "Tencent", "Organization", {{"founded", 1998}, {"city", "Shenzhen"}}),
        Entity("e1", "Tencent", "Company", {{"founded", 1999}, {"city", "Shenzhen"}}),
        Entity("e2", "Alibaba", "Organization")
    };

    auto conflicts = resolver.detect_entity_conflicts(entities);
    ASSERT_EQ(conflicts.size(), 2);

    EXPECT_EQ(conflicts[0].type, ConflictType::ENTITY_TYPE_CONFLICT);
    EXPECT_EQ(conflicts[0].conflict_id, "type_conflict_e1");

    EXPECT_EQ(conflicts[1].type, ConflictType::PROPERTY_VALUE_CONFLICT);
    EXPECT_EQ(conflicts[1].conflict_id, "property_conflict_e1_founded");
    EXPECT_EQ(conflicts[1].property_key, "founded");
}

TEST_F(ConflictResolverTest, DistinctIdsDoNotConflict) {
    std::vector<Entity> entities = {
        Entity("e1", "Tencent", "Organization"),
        Entity("e2", "腾讯公司", "Company")
    };
    EXPECT_TRUE(resolver.detect_entity_conflicts(entities).empty());
}

TEST_F(ConflictResolverTest, ContradictoryRelations) {
    std::vector<Relation> relations = {
        Relation("r1", "works_for", "p", "o", 0.9),
        Relation("r2", "competes_with", "p", "o", 0.6)
    };

    auto conflicts = resolver.detect_relation_conflicts(relations);
    ASSERT_EQ(conflicts.size(), 1);
    EXPECT_EQ(conflicts[0].type, ConflictType::CONTRADICTORY_RELATIONS);
    EXPECT_EQ(conflicts[0].conflict_id, "contradictory_relations_p_o");
    ASSERT_EQ(conflicts[0].conflicting_items.size(), 2);
    EXPECT_TRUE(std::holds_alternative<Relation>(conflicts[0].conflicting_items[0]));
}

TEST_F(ConflictResolverTest, RelationTypeConflict) {
    std::vector<Relation> relations = {
        Relation("r1", "works_for", "p", "o", 0.9),
        Relation("r2", "employed_by", "p", "o", 0.7),
        Relation("r3", "works_for", "p", "x", 0.7)
    };

    auto conflicts = resolver.detect_relation_conflicts(relations);
    ASSERT_EQ(conflicts.size(), 1);
    EXPECT_EQ(conflicts[0].type, ConflictType::RELATION_TYPE_CONFLICT);
    EXPECT_EQ(conflicts[0].subject_id, "p|o");
    EXPECT_EQ(value_text(conflicts[0].conflicting_items[1]), "employed_by");
}

TEST_F(ConflictResolverTest, ContradictoryPairTable) {
    EXPECT_TRUE(ConflictResolver::are_contradictory({"parent_of", "child_of"}));
    EXPECT_TRUE(ConflictResolver::are_contradictory({"not_located_in", "located_in", "x"}));
    EXPECT_FALSE(ConflictResolver::are_contradictory({"parent_of", "sibling_of"}));
}

// ==========================================
// Resolution Tests
// ==========================================

TEST_F(ConflictResolverTest, DefaultStrategyIsFirstInList) {
    auto conflict = make_conflict(ConflictType::ENTITY_NAME_CONFLICT,
                                  {PropertyValue("Tencent"), PropertyValue("腾讯公司")},
                                  {0.6, 0.9});

    auto resolved = resolver.resolve(conflict);
    EXPECT_EQ(resolved.resolution_strategy, "highest_confidence");
    ASSERT_TRUE(resolved.is_resolved());
    EXPECT_EQ(value_text(*resolved.resolved_value), "腾讯公司");
    EXPECT_DOUBLE_EQ(resolved.resolution_confidence, 0.9);
}

TEST_F(ConflictResolverTest, HighestConfidenceTieGoesToFirst) {
    auto conflict = make_conflict(ConflictType::ENTITY_NAME_CONFLICT,
                                  {PropertyValue("Tencent"), PropertyValue("腾讯公司")},
                                  {1.0, 1.0});
    auto resolved = resolver.resolve(conflict);
    EXPECT_EQ(value_text(*resolved.resolved_value), "Tencent");
}

TEST_F(ConflictResolverTest, VoteConfidenceIsShare) {
    auto conflict = make_conflict(ConflictType::ENTITY_NAME_CONFLICT,
                                  {PropertyValue("A"), PropertyValue("B"), PropertyValue("B")},
                                  {0.9, 0.5, 0.5});

    auto resolved = resolver.resolve(conflict, "most_frequent");
    EXPECT_EQ(value_text(*resolved.resolved_value), "B");
    EXPECT_NEAR(resolved.resolution_confidence, 2.0 / 3.0, 1e-9);
}

TEST_F(ConflictResolverTest, LongestNameCountsCodePoints) {
    auto conflict = make_conflict(ConflictType::ENTITY_NAME_CONFLICT,
                                  {PropertyValue("腾讯公司"), PropertyValue("Tencent")},
                                  {1.0, 1.0});

    auto resolved = resolver.resolve(conflict, "longest_name");
    EXPECT_EQ(value_text(*resolved.resolved_value), "Tencent");
    EXPECT_DOUBLE_EQ(resolved.resolution_confidence, 0.7);
}

TEST_F(ConflictResolverTest, AverageNumeric) {
    auto conflict = make_conflict(ConflictType::PROPERTY_VALUE_CONFLICT,
                                  {PropertyValue(1998), PropertyValue(1999)},
                                  {1.0, 1.0});

    auto resolved = resolver.resolve(conflict, "average_numeric");
    EXPECT_DOUBLE_EQ(std::get<PropertyValue>(*resolved.resolved_value).number_value, 1998.5);
    EXPECT_DOUBLE_EQ(resolved.resolution_confidence, 0.8);

    // Non-numeric values fall back to a vote
    auto text = make_conflict(ConflictType::PROPERTY_VALUE_CONFLICT,
                              {PropertyValue("x"), PropertyValue("y"), PropertyValue("y")},
                              {1.0, 1.0, 1.0});
    EXPECT_EQ(value_text(*resolver.resolve(text, "average_numeric").resolved_value), "y");
}

TEST_F(ConflictResolverTest, UnionLists) {
    auto conflict = make_conflict(ConflictType::PROPERTY_VALUE_CONFLICT,
                                  {PropertyValue::make_list({"a"}), PropertyValue::make_list({"a", "b"})},
                                  {1.0, 1.0});

    auto resolved = resolver.resolve(conflict, "union_lists");
    EXPECT_EQ(std::get<PropertyValue>(*resolved.resolved_value), PropertyValue::make_list({"a", "b"}));
    EXPECT_DOUBLE_EQ(resolved.resolution_confidence, 0.9);
}

TEST_F(ConflictResolverTest, StrategyOnWrongTypePicksFirstItem) {
    auto conflict = make_conflict(ConflictType::RELATION_TYPE_CONFLICT,
                                  {PropertyValue("works_for"), PropertyValue("employed_by")},
                                  {0.2, 0.9});

    auto resolved = resolver.resolve(conflict, "longest_name");
    EXPECT_EQ(value_text(*resolved.resolved_value), "works_for");
    EXPECT_DOUBLE_EQ(resolved.resolution_confidence, 0.5);
}

TEST_F(ConflictResolverTest, ManualReviewLeavesValueUnset) {
    auto conflict = make_conflict(ConflictType::ENTITY_NAME_CONFLICT,
                                  {PropertyValue("A"), PropertyValue("B")},
                                  {1.0, 1.0});

    auto resolved = resolver.resolve(conflict, "manual_review");
    EXPECT_FALSE(resolved.is_resolved());
    EXPECT_TRUE(resolved.requires_review);
    EXPECT_DOUBLE_EQ(resolved.resolution_confidence, 0.0);
}

// ==========================================
// Fallback and Extension Tests
// ==========================================

TEST_F(ConflictResolverTest, UnknownStrategyFallsBack) {
    auto conflict = make_conflict(ConflictType::ENTITY_NAME_CONFLICT,
                                  {PropertyValue("first"), PropertyValue("second")},
                                  {0.1, 0.9});

    auto resolved = resolver.resolve(conflict, "no_such_strategy");
    ASSERT_TRUE(resolved.is_resolved());
    EXPECT_EQ(value_text(*resolved.resolved_value), "first");
    EXPECT_DOUBLE_EQ(resolved.resolution_confidence, 0.1);
    EXPECT_EQ(resolved.resolution_strategy, "no_such_strategy");
}

TEST_F(ConflictResolverTest, MismatchedScoresFallBack) {
    auto conflict = make_conflict(ConflictType::ENTITY_NAME_CONFLICT,
                                  {PropertyValue("first"), PropertyValue("second")},
                                  {0.9});

    auto resolved = resolver.resolve(conflict);
    EXPECT_EQ(value_text(*resolved.resolved_value), "first");
    EXPECT_DOUBLE_EQ(resolved.resolution_confidence, 0.1);
}

TEST_F(ConflictResolverTest, CustomStrategy) {
    resolver.register_strategy("last_item", [](const Conflict& conflict) {
        return Resolution{conflict.conflicting_items.back(), 0.65, false};
    });
    EXPECT_TRUE(resolver.has_strategy("last_item"));
    EXPECT_TRUE(resolver.has_strategy("vote"));
    EXPECT_FALSE(resolver.has_strategy("coin_flip"));

    auto conflict = make_conflict(ConflictType::ENTITY_NAME_CONFLICT,
                                  {PropertyValue("first"), PropertyValue("last")},
                                  {1.0, 1.0});
    auto resolved = resolver.resolve(conflict, "last_item");
    EXPECT_EQ(value_text(*resolved.resolved_value), "last");
    EXPECT_DOUBLE_EQ(resolved.resolution_confidence, 0.65);
}

TEST_F(ConflictResolverTest, ThrowingCustomStrategyFallsBack) {
    resolver.register_strategy("broken", [](const Conflict& conflict) -> Resolution {
        throw ConflictResolutionFailure("cannot resolve " + conflict.conflict_id);
    });

    auto conflict = make_conflict(ConflictType::ENTITY_NAME_CONFLICT,
                                  {PropertyValue("first"), PropertyValue("second")},
                                  {0.2, 0.8});
    auto resolved = resolver.resolve(conflict, "broken");
    EXPECT_EQ(value_text(*resolved.resolved_value), "first");
    EXPECT_DOUBLE_EQ(resolved.resolution_confidence, 0.1);
}

TEST_F(ConflictResolverTest, BatchResolveOverridesAndHistory) {
    std::vector<Conflict> conflicts = {
        make_conflict(ConflictType::ENTITY_NAME_CONFLICT,
                      {PropertyValue("IBM"), PropertyValue("International Business Machines")},
                      {0.9, 0.5}),
        make_conflict(ConflictType::PROPERTY_VALUE_CONFLICT,
                      {PropertyValue(10), PropertyValue(20)},
                      {0.9, 0.5})
    };

    auto resolved = resolver.batch_resolve(conflicts, {{ConflictType::ENTITY_NAME_CONFLICT, "longest_name"}});
    ASSERT_EQ(resolved.size(), 2);
    EXPECT_EQ(value_text(*resolved[0].resolved_value), "International Business Machines");
    EXPECT_EQ(resolved[1].resolution_strategy, "highest_confidence");
    EXPECT_DOUBLE_EQ(std::get<PropertyValue>(*resolved[1].resolved_value).number_value, 10.0);

    ASSERT_EQ(resolver.get_history().size(), 2);
    EXPECT_EQ(resolver.get_history()[0].resolution_strategy, "longest_name");
}

TEST_F(ConflictResolverTest, StrategyListsCanBeReplaced) {
    EXPECT_EQ(resolver.get_strategies(ConflictType::ENTITY_TYPE_CONFLICT).front(), "most_specific_type");

    resolver.set_strategies(ConflictType::ENTITY_NAME_CONFLICT, {"longest_name"});
    auto conflict = make_conflict(ConflictType::ENTITY_NAME_CONFLICT,
                                  {PropertyValue("AB"), PropertyValue("ABC")},
                                  {1.0, 0.1});
    EXPECT_EQ(value_text(*resolver.resolve(conflict).resolved_value), "ABC");
}

// ==========================================
// Applying Resolutions
// ==========================================

TEST_F(ConflictResolverTest, ApplyEntityResolutionsCollapsesIds) {
    std::vector<Entity> entities = {
        Entity("e1", "Tencent", "Organization", {{"founded", 1998}}),
        Entity("e1", "腾讯公司", "Organization", {{"founded", 1999}, {"city", "Shenzhen"}}),
        Entity("e2", "Alibaba", "Organization")
    };

    auto conflicts = resolver.batch_resolve(
        resolver.detect_entity_conflicts(entities),
        {{ConflictType::PROPERTY_VALUE_CONFLICT, "average_numeric"}});
    auto collapsed = resolver.apply_entity_resolutions(entities, conflicts);

    ASSERT_EQ(collapsed.size(), 2);
    EXPECT_EQ(collapsed[0].id, "e1");
    EXPECT_EQ(collapsed[0].name, "Tencent");
    EXPECT_EQ(collapsed[0].aliases, (std::vector<std::string>{"腾讯公司"}));
    EXPECT_DOUBLE_EQ(collapsed[0].properties.at("founded").number_value, 1998.5);
    EXPECT_EQ(collapsed[0].properties.at("city").string_value, "Shenzhen");
    EXPECT_EQ(collapsed[1], entities[2]);
}

TEST_F(ConflictResolverTest, ApplyRelationResolutionsDropsLosers) {
    std::vector<Relation> relations = {
        Relation("r1", "works_for", "p", "o", 0.9),
        Relation("r2", "competes_with", "p", "o", 0.6),
        Relation("r3", "located_in", "o", "city", 0.8)
    };

    auto conflicts = resolver.batch_resolve(resolver.detect_relation_conflicts(relations));
    auto kept = resolver.apply_relation_resolutions(relations, conflicts);

    ASSERT_EQ(kept.size(), 2);
    EXPECT_EQ(kept[0].id, "r1");
    EXPECT_EQ(kept[1].id, "r3");
}

TEST_F(ConflictResolverTest, ReviewedContradictionKeepsBoth) {
    std::vector<Relation> relations = {
        Relation("r1", "parent_of", "a", "b", 0.9),
        Relation("r2", "child_of", "a", "b", 0.6)
    };

    auto conflicts = resolver.batch_resolve(
        resolver.detect_relation_conflicts(relations),
        {{ConflictType::CONTRADICTORY_RELATIONS, "manual_review"}});
    EXPECT_EQ(resolver.apply_relation_resolutions(relations, conflicts).size(), 2);
}

// ==========================================
// Reporting Tests
// ==========================================

TEST_F(ConflictResolverTest, StatisticsAndReport) {
    std::vector<Conflict> conflicts = {
        resolver.resolve(make_conflict(ConflictType::ENTITY_NAME_CONFLICT,
                                       {PropertyValue("A"), PropertyValue("B")}, {0.95, 0.5})),
        resolver.resolve(make_conflict(ConflictType::ENTITY_NAME_CONFLICT,
                                       {PropertyValue("A"), PropertyValue("B")}, {1.0, 1.0}),
                         "manual_review"),
        resolver.resolve(make_conflict(ConflictType::PROPERTY_VALUE_CONFLICT,
                                       {PropertyValue(1), PropertyValue(2)}, {1.0, 1.0}),
                         "average_numeric")
    };

    auto stats = resolver.get_statistics(conflicts);
    EXPECT_EQ(stats.total_conflicts, 3);
    EXPECT_EQ(stats.resolved_count, 2);
    EXPECT_EQ(stats.review_count, 1);
    EXPECT_EQ(stats.high_confidence_resolutions, 1);
    EXPECT_EQ(stats.medium_confidence_resolutions, 1);
    EXPECT_EQ(stats.by_type["entity_name_conflict"], 2);
    EXPECT_NEAR(stats.average_resolution_confidence, (0.95 + 0.8) / 2.0, 1e-9);

    std::string report = resolver.generate_report(conflicts);
    EXPECT_NE(report.find("Conflict Resolution Report"), std::string::npos);
    EXPECT_NE(report.find("Total conflicts: 3"), std::string::npos);
    EXPECT_NE(report.find("property_value_conflict: 1"), std::string::npos);
}

TEST(ConflictTypeTest, NamesRoundtrip) {
    for (auto type : all_conflict_types()) {
        ConflictType parsed = ConflictType::ENTITY_NAME_CONFLICT;
        EXPECT_TRUE(string_to_conflict_type(conflict_type_to_string(type), parsed));
        EXPECT_EQ(parsed, type);
    }

    ConflictType shorthand = ConflictType::TEMPORAL_CONFLICT;
    EXPECT_TRUE(string_to_conflict_type("property", shorthand));
    EXPECT_EQ(shorthand, ConflictType::PROPERTY_VALUE_CONFLICT);
    EXPECT_FALSE(string_to_conflict_type("bogus", shorthand));
}

// ==========================================
// Invalid Text Tests
// ==========================================

TEST_F(ConflictResolverTest, InvalidUtf8ListValue) {
    std::vector<Entity> entities = {
        Entity("x1", "Tencent", "Organization", {{"tags", PropertyValue::make_list({"ok\xff"})}}),
        Entity("x1", "Tencent", "Organization", {{"tags", PropertyValue::make_list({"ok"})}})
    };

    std::vector<Conflict> conflicts;
    ASSERT_NO_THROW(conflicts = resolver.detect_entity_conflicts(entities));
    ASSERT_EQ(conflicts.size(), 1);
    EXPECT_EQ(conflicts[0].conflict_id, "property_conflict_x1_tags");

    auto resolved = resolver.batch_resolve(conflicts);
    ASSERT_TRUE(resolved[0].is_resolved());
    EXPECT_NO_THROW(resolver.generate_report(resolved));
}

// ==========================================
// Main
// ==========================================

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
