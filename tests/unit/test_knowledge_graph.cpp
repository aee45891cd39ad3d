#include <gtest/gtest.h>
#include "graph/knowledge_graph.hpp"
#include "model/errors.hpp"
#include <cstdio>
#include <fstream>

using namespace kgf;

class KnowledgeGraphTest : public ::testing::Test {
protected:
    KnowledgeGraphStore store;

    void SetUp() override {
        // p1 -founder_of-> o1 <-works_for- p2, o1 -located_in-> l1, x isolated
        store.add_entity(Entity("p1", "Steve Jobs", "Person"));
        store.add_entity(Entity("p2", "Tim Cook", "Person"));
        store.add_entity(Entity("o1", "Apple Inc", "Organization", {{"founded", 1976}}, {"Apple"}));
        store.add_entity(Entity("l1", "Cupertino", "Location"));
        store.add_entity(Entity("x", "Isolated", "Concept"));

        store.add_relation(Relation("r1", "founder_of", "p1", "o1", 0.9));
        store.add_relation(Relation("r2", "works_for", "p2", "o1", 0.95));
        store.add_relation(Relation("r3", "located_in", "o1", "l1", 0.8));
    }
};

// ==========================================
// Basic Operations Tests
// ==========================================

TEST_F(KnowledgeGraphTest, AddAndLookup) {
    EXPECT_EQ(store.num_entities(), 5);
    EXPECT_EQ(store.num_relations(), 3);

    const auto* entity = store.get_entity("o1");
    ASSERT_NE(entity, nullptr);
    EXPECT_EQ(entity->name, "Apple Inc");
    EXPECT_EQ(store.get_entity("missing"), nullptr);

    const auto* relation = store.get_relation("r2");
    ASSERT_NE(relation, nullptr);
    EXPECT_EQ(relation->head_entity_id, "p2");
}

TEST_F(KnowledgeGraphTest, NameAndAliasIndex) {
    ASSERT_NE(store.get_entity_by_name("Apple"), nullptr);
    EXPECT_EQ(store.get_entity_by_name("Apple")->id, "o1");
    EXPECT_EQ(store.get_entity_by_name("Apple Inc")->id, "o1");
    EXPECT_EQ(store.get_entity_by_name("Banana"), nullptr);
}

TEST_F(KnowledgeGraphTest, SharedNameMovesToLatestAndBack) {
    store.add_entity(Entity("o2", "Apple", "Product"));
    EXPECT_EQ(store.get_entity_by_name("Apple")->id, "o2");

    EXPECT_TRUE(store.remove_entity("o2"));
    ASSERT_NE(store.get_entity_by_name("Apple"), nullptr);
    EXPECT_EQ(store.get_entity_by_name("Apple")->id, "o1");
    EXPECT_TRUE(store.indices_consistent());
}

TEST_F(KnowledgeGraphTest, TypeIndices) {
    EXPECT_EQ(store.get_entities_by_type("Person").size(), 2);
    EXPECT_TRUE(store.get_entities_by_type("Event").empty());
    EXPECT_EQ(store.get_relations_by_type("works_for").size(), 1);

    auto between = store.get_relations_between("p1", "o1");
    ASSERT_EQ(between.size(), 1);
    EXPECT_EQ(between[0].id, "r1");

    // Direction matters
    EXPECT_TRUE(store.get_relations_between("o1", "p1").empty());
}

TEST_F(KnowledgeGraphTest, ReplaceEntityReindexes) {
    store.add_entity(Entity("p2", "Timothy Cook", "Executive"));

    EXPECT_EQ(store.num_entities(), 5);
    EXPECT_EQ(store.get_entity_by_name("Tim Cook"), nullptr);
    EXPECT_EQ(store.get_entity_by_name("Timothy Cook")->id, "p2");
    EXPECT_EQ(store.get_entities_by_type("Person").size(), 1);

    // Incident relations survive
    EXPECT_EQ(store.neighbors("p2"), (std::vector<std::string>{"o1"}));
    EXPECT_TRUE(store.indices_consistent());
}

TEST_F(KnowledgeGraphTest, RelationToMissingEntityIsRejected) {
    auto by_type_before = store.get_relations_by_type("works_for").size();
    auto neighbors_before = store.neighbors("p1");

    try {
        store.add_relation(Relation("r9", "works_for", "p1", "ghost"));
        FAIL() << "Expected ValidationError";
    } catch (const ValidationError& e) {
        EXPECT_EQ(e.relation_id(), "r9");
        EXPECT_EQ(e.missing_entity_id(), "ghost");
    }

    EXPECT_FALSE(store.has_relation("r9"));
    EXPECT_EQ(store.num_relations(), 3);
    EXPECT_EQ(store.get_relations_by_type("works_for").size(), by_type_before);
    EXPECT_TRUE(store.get_relations_between("p1", "ghost").empty());
    EXPECT_EQ(store.neighbors("p1"), neighbors_before);
    EXPECT_TRUE(store.indices_consistent());
}

TEST_F(KnowledgeGraphTest, RemoveEntityCascades) {
    EXPECT_TRUE(store.remove_entity("o1"));
    EXPECT_FALSE(store.has_entity("o1"));
    EXPECT_EQ(store.num_relations(), 0);
    EXPECT_TRUE(store.get_relations_by_type("founder_of").empty());
    EXPECT_TRUE(store.neighbors("p1").empty());
    EXPECT_EQ(store.get_entity_by_name("Apple"), nullptr);
    EXPECT_TRUE(store.indices_consistent());

    EXPECT_FALSE(store.remove_entity("o1"));
}

TEST_F(KnowledgeGraphTest, RemoveRelation) {
    EXPECT_TRUE(store.remove_relation("r3"));
    EXPECT_FALSE(store.remove_relation("r3"));
    EXPECT_TRUE(store.neighbors("l1").empty());
    EXPECT_TRUE(store.has_entity("l1"));
    EXPECT_TRUE(store.indices_consistent());
}

TEST_F(KnowledgeGraphTest, BatchAddRelationsSkipsOrphans) {
    auto report = store.batch_add_relations({
        Relation("r4", "friend_of", "p1", "p2"),
        Relation("r5", "friend_of", "p1", "nobody"),
        Relation("r6", "produces", "o1", "x")
    });

    EXPECT_EQ(report.relations_added, 2);
    EXPECT_EQ(report.relations_skipped, 1);
    EXPECT_EQ(report.skipped_relation_ids, (std::vector<std::string>{"r5"}));
    EXPECT_EQ(store.num_relations(), 5);
}

TEST_F(KnowledgeGraphTest, Clear) {
    store.clear();
    EXPECT_TRUE(store.empty());
    EXPECT_EQ(store.get_entity_by_name("Apple"), nullptr);
    EXPECT_TRUE(store.indices_consistent());
}

// ==========================================
// Structural Query Tests
// ==========================================

TEST_F(KnowledgeGraphTest, Neighbors) {
    EXPECT_EQ(store.neighbors("o1"), (std::vector<std::string>{"l1", "p1", "p2"}));
    EXPECT_EQ(store.neighbors("o1", "works_for"), (std::vector<std::string>{"p2"}));
    EXPECT_TRUE(store.neighbors("x").empty());
    EXPECT_TRUE(store.neighbors("missing").empty());
}

TEST_F(KnowledgeGraphTest, FindPathIgnoresDirection) {
    auto paths = store.find_path("p1", "l1", 3);
    ASSERT_EQ(paths.size(), 1);
    EXPECT_EQ(paths[0], (std::vector<std::string>{"p1", "o1", "l1"}));

    paths = store.find_path("p1", "p2", 2);
    ASSERT_EQ(paths.size(), 1);
    EXPECT_EQ(paths[0], (std::vector<std::string>{"p1", "o1", "p2"}));
}

TEST_F(KnowledgeGraphTest, FindPathRespectsDepth) {
    EXPECT_TRUE(store.find_path("p1", "l1", 1).empty());
    EXPECT_EQ(store.find_path("p1", "l1", 2).size(), 1);
}

TEST_F(KnowledgeGraphTest, FindPathEdgeCases) {
    EXPECT_TRUE(store.find_path("p1", "p1").empty());
    EXPECT_TRUE(store.find_path("p1", "x").empty());
    EXPECT_TRUE(store.find_path("p1", "missing").empty());
}

TEST_F(KnowledgeGraphTest, FindPathEnumeratesAlternatives) {
    store.add_relation(Relation("r4", "born_in", "p1", "l1"));

    auto paths = store.find_path("p1", "l1", 3);
    EXPECT_EQ(paths.size(), 2);
    for (const auto& path : paths) {
        EXPECT_EQ(path.front(), "p1");
        EXPECT_EQ(path.back(), "l1");
    }
}

TEST_F(KnowledgeGraphTest, QuerySubgraph) {
    auto sub = store.query_subgraph({"p1"}, 1);
    EXPECT_EQ(sub.num_entities(), 2);
    EXPECT_EQ(sub.num_relations(), 1);
    EXPECT_TRUE(sub.has_relation("r1"));

    auto wider = store.query_subgraph({"p1"}, 2);
    EXPECT_EQ(wider.num_entities(), 4);
    EXPECT_EQ(wider.num_relations(), 3);
    EXPECT_TRUE(wider.indices_consistent());

    EXPECT_EQ(store.query_subgraph({"p1"}, 0).num_entities(), 1);
    EXPECT_TRUE(store.query_subgraph({"missing"}, 2).empty());
}

// ==========================================
// Statistics and Validation Tests
// ==========================================

TEST_F(KnowledgeGraphTest, Statistics) {
    auto stats = store.get_statistics();
    EXPECT_EQ(stats.num_entities, 5);
    EXPECT_EQ(stats.num_relations, 3);
    EXPECT_EQ(stats.entity_types["Person"], 2);
    EXPECT_EQ(stats.relation_types["located_in"], 1);
    EXPECT_DOUBLE_EQ(stats.avg_degree, 1.2);
    EXPECT_EQ(stats.max_degree, 3);
    EXPECT_EQ(stats.isolated_entities, 1);
    EXPECT_EQ(stats.connected_components, 2);
    EXPECT_EQ(stats.largest_component, 4);
    EXPECT_DOUBLE_EQ(stats.density, 3.0 / 20.0);

    auto j = stats.to_json();
    EXPECT_EQ(j["entity_count"], 5);
    EXPECT_EQ(j["relation_count"], 3);
}

TEST(KnowledgeGraphEmptyTest, EmptyStatistics) {
    KnowledgeGraphStore empty;
    auto stats = empty.get_statistics();
    EXPECT_EQ(stats.num_entities, 0);
    EXPECT_EQ(stats.connected_components, 0);
    EXPECT_DOUBLE_EQ(stats.density, 0.0);
    EXPECT_TRUE(empty.validate().is_valid());
}

TEST_F(KnowledgeGraphTest, ValidateWithoutOntology) {
    auto report = store.validate();
    EXPECT_TRUE(report.is_valid());
    EXPECT_EQ(report.statistics.num_entities, 5);
}

TEST_F(KnowledgeGraphTest, ValidateAgainstOntology) {
    store.set_ontology(std::make_shared<SchemaOntology>());
    EXPECT_TRUE(store.validate().is_valid());

    store.add_relation(Relation("r4", "works_for", "l1", "o1"));
    auto report = store.validate();
    ASSERT_EQ(report.issues.size(), 1);
    EXPECT_EQ(report.count(ValidationIssue::Kind::OntologyMismatch), 1);
    EXPECT_EQ(report.issues[0].relation_id, "r4");
    EXPECT_EQ(report.to_json()["issues"][0]["kind"], "ontology_mismatch");
}

TEST_F(KnowledgeGraphTest, IndicesConsistentAfterMixedMutations) {
    store.add_entity(Entity("o2", "Microsoft", "Organization"));
    store.add_relation(Relation("r4", "works_for", "p1", "o2"));
    store.add_relation(Relation("r4", "founder_of", "p2", "o2"));
    store.remove_relation("r1");
    store.remove_entity("l1");
    EXPECT_TRUE(store.indices_consistent());
    EXPECT_EQ(store.get_relations_by_type("founder_of").size(), 1);
}

// ==========================================
// Merge Tests
// ==========================================

TEST(KnowledgeGraphMergeTest, SameEntityUnderDifferentIds) {
    KnowledgeGraphStore first;
    first.add_entity(Entity("e1", "Apple Inc", "Organization"));
    first.add_entity(Entity("e2", "Tim Cook", "Person"));
    first.add_relation(Relation("r1", "works_for", "e2", "e1", 0.9));

    KnowledgeGraphStore second;
    second.add_entity(Entity("x1", "Apple Inc", "Organization"));
    second.add_entity(Entity("x2", "Cupertino", "Location"));
    second.add_relation(Relation("r2", "located_in", "x1", "x2", 0.8));

    auto report = first.merge_knowledge_graph(second);

    EXPECT_EQ(report.entities_before, 4);
    EXPECT_EQ(report.entities_after, 3);
    EXPECT_EQ(report.relations_after, 2);
    EXPECT_EQ(report.dropped_relations, 0);
    EXPECT_EQ(report.other_id_remap.at("x1"), "e1");
    EXPECT_EQ(report.id_remap.at("e1"), "e1");
    EXPECT_EQ(report.renamed_entities, 0);

    EXPECT_EQ(first.get_entities_by_type("Organization").size(), 1);
    EXPECT_EQ(first.get_entity_by_name("Apple Inc")->id, "e1");

    const auto* located = first.get_relation("r2");
    ASSERT_NE(located, nullptr);
    EXPECT_EQ(located->head_entity_id, "e1");
    EXPECT_EQ(located->tail_entity_id, "x2");
    EXPECT_TRUE(first.validate().is_valid());
    EXPECT_TRUE(first.indices_consistent());
}

TEST(KnowledgeGraphMergeTest, DuplicateRelationsCollapse) {
    KnowledgeGraphStore first;
    first.add_entity(Entity("h", "Larry Page", "Person"));
    first.add_entity(Entity("t", "Google", "Organization"));
    first.add_relation(Relation("r1", "founder_of", "h", "t", 0.90));

    KnowledgeGraphStore second;
    second.add_entity(Entity("h", "Larry Page", "Person"));
    second.add_entity(Entity("t", "Google", "Organization"));
    second.add_relation(Relation("r2", "founder_of", "h", "t", 0.95));

    auto report = first.merge_knowledge_graph(second);
    EXPECT_EQ(report.entities_after, 2);
    EXPECT_EQ(report.relations_after, 1);
    EXPECT_EQ(first.get_relations_between("h", "t").size(), 1);
}

TEST(KnowledgeGraphMergeTest, CollidingIdsKeepBothEntities) {
    KnowledgeGraphStore first;
    first.add_entity(Entity("entity_0", "Apple Inc", "Organization"));
    first.add_entity(Entity("entity_1", "Tim Cook", "Person"));
    first.add_relation(Relation("relation_0", "works_for", "entity_1", "entity_0", 0.9));

    KnowledgeGraphStore second;
    second.add_entity(Entity("entity_0", "Microsoft", "Organization"));
    second.add_entity(Entity("entity_1", "Satya Nadella", "Person"));
    second.add_relation(Relation("relation_0", "works_for", "entity_1", "entity_0", 0.9));

    auto report = first.merge_knowledge_graph(second);

    EXPECT_EQ(report.entities_after, 4);
    EXPECT_EQ(report.relations_after, 2);
    EXPECT_EQ(report.dropped_relations, 0);
    EXPECT_EQ(report.renamed_entities, 2);
    EXPECT_EQ(report.renamed_relations, 1);
    EXPECT_EQ(report.id_remap.at("entity_0"), "entity_0");
    EXPECT_EQ(report.other_id_remap.at("entity_0"), "entity_0_1");
    EXPECT_EQ(report.other_id_remap.at("entity_1"), "entity_1_1");

    EXPECT_EQ(first.get_entity("entity_0")->name, "Apple Inc");
    EXPECT_EQ(first.get_entity("entity_0_1")->name, "Microsoft");
    EXPECT_EQ(first.get_entity("entity_1_1")->name, "Satya Nadella");

    const auto* original = first.get_relation("relation_0");
    ASSERT_NE(original, nullptr);
    EXPECT_EQ(original->head_entity_id, "entity_1");
    EXPECT_EQ(original->tail_entity_id, "entity_0");

    const auto* incoming = first.get_relation("relation_0_1");
    ASSERT_NE(incoming, nullptr);
    EXPECT_EQ(incoming->head_entity_id, "entity_1_1");
    EXPECT_EQ(incoming->tail_entity_id, "entity_0_1");

    EXPECT_TRUE(first.validate().is_valid());
    EXPECT_TRUE(first.indices_consistent());
}

TEST(KnowledgeGraphMergeTest, RenameSkipsTakenSuffix) {
    KnowledgeGraphStore first;
    first.add_entity(Entity("a", "Alpha Centauri", "Location"));

    KnowledgeGraphStore second;
    second.add_entity(Entity("a", "Beta Pictoris", "Location"));
    second.add_entity(Entity("a_1", "Gamma Draconis", "Location"));

    auto report = first.merge_knowledge_graph(second);
    EXPECT_EQ(report.entities_after, 3);
    EXPECT_EQ(report.renamed_entities, 1);
    EXPECT_EQ(report.other_id_remap.at("a"), "a_2");
    EXPECT_EQ(report.other_id_remap.at("a_1"), "a_1");
    EXPECT_EQ(first.get_entity("a_2")->name, "Beta Pictoris");
}

TEST(KnowledgeGraphMergeTest, SharedIdForSameEntityFuses) {
    KnowledgeGraphStore first;
    first.add_entity(Entity("entity_0", "Apple Inc", "Organization"));

    KnowledgeGraphStore second;
    second.add_entity(Entity("entity_0", "Apple Inc", "Organization"));

    auto report = first.merge_knowledge_graph(second);
    EXPECT_EQ(report.renamed_entities, 1);
    EXPECT_EQ(report.entities_after, 1);
    EXPECT_EQ(report.other_id_remap.at("entity_0"), "entity_0");
    EXPECT_FALSE(first.has_entity("entity_0_1"));
}

// ==========================================
// Conflict Tests
// ==========================================

TEST_F(KnowledgeGraphTest, ResolveContradictoryRelations) {
    store.add_relation(Relation("r4", "competes_with", "p2", "o1", 0.5));

    ConflictResolver resolver;
    auto conflicts = store.detect_and_resolve_conflicts(resolver, {}, false);
    ASSERT_EQ(conflicts.size(), 1);
    EXPECT_EQ(conflicts[0].type, ConflictType::CONTRADICTORY_RELATIONS);
    EXPECT_TRUE(store.has_relation("r4"));

    store.detect_and_resolve_conflicts(resolver, {}, true);
    EXPECT_FALSE(store.has_relation("r4"));
    EXPECT_TRUE(store.has_relation("r2"));
    EXPECT_EQ(resolver.get_history().size(), 2);
}

// ==========================================
// Import/Export Tests
// ==========================================

TEST(KnowledgeGraphExportTest, InvalidUtf8IsReplacedOnExport) {
    KnowledgeGraphStore store;
    store.add_entity(Entity("q1", "Tagged", "Concept", {{"tags", PropertyValue::make_list({"bad\xff"})}}));

    std::string path = ::testing::TempDir() + "kgf_invalid_utf8.json";
    ASSERT_NO_THROW(store.export_to_json(path));

    auto loaded = KnowledgeGraphStore::load_from_json(path);
    const auto* entity = loaded.get_entity("q1");
    ASSERT_NE(entity, nullptr);
    EXPECT_EQ(entity->properties.at("tags").list_value.at(0).string_value, "bad\xef\xbf\xbd");

    std::string csv;
    ASSERT_NO_THROW(csv = store.entities_to_csv());
    EXPECT_NE(csv.find("bad\xef\xbf\xbd"), std::string::npos);

    std::remove(path.c_str());
}

TEST_F(KnowledgeGraphTest, JsonRoundtrip) {
    auto j = store.to_json();
    EXPECT_EQ(j["entities"].size(), 5);
    EXPECT_EQ(j["relations"].size(), 3);
    EXPECT_EQ(j["statistics"]["entity_count"], 5);

    LoadReport report;
    auto loaded = KnowledgeGraphStore::from_json(j, &report);
    EXPECT_EQ(report.entities_added, 5);
    EXPECT_EQ(report.relations_added, 3);
    EXPECT_EQ(loaded.get_all_entities(), store.get_all_entities());
    EXPECT_EQ(loaded.get_all_relations(), store.get_all_relations());
    EXPECT_TRUE(loaded.indices_consistent());
}

TEST_F(KnowledgeGraphTest, FileRoundtrip) {
    std::string path = ::testing::TempDir() + "kgf_graph_roundtrip.json";
    store.export_to_json(path);

    auto loaded = KnowledgeGraphStore::load_from_json(path);
    EXPECT_EQ(loaded.num_entities(), 5);
    EXPECT_EQ(loaded.get_entity_by_name("Apple")->id, "o1");

    std::remove(path.c_str());
}

TEST(KnowledgeGraphLoadTest, NonObjectDocumentThrows) {
    EXPECT_THROW(KnowledgeGraphStore::from_json(nlohmann::json::array()), MalformedPersistedState);
    EXPECT_THROW(KnowledgeGraphStore::load_from_json("/nonexistent/graph.json"), std::runtime_error);
}

TEST(KnowledgeGraphLoadTest, UnparseableFileThrows) {
    std::string path = ::testing::TempDir() + "kgf_graph_garbage.json";
    {
        std::ofstream file(path);
        file << "{ not json";
    }
    EXPECT_THROW(KnowledgeGraphStore::load_from_json(path), MalformedPersistedState);
    std::remove(path.c_str());
}

TEST(KnowledgeGraphLoadTest, BadRecordsAreSkipped) {
    nlohmann::json j = {
        {"entities", {
            {{"id", "a"}, {"name", "A"}, {"type", "Person"}},
            {{"name", "no id"}}
        }},
        {"relations", {
            {{"id", "r1"}, {"type", "knows"}, {"head_entity_id", "a"}, {"tail_entity_id", "ghost"}},
            {{"id", "r2"}}
        }}
    };

    LoadReport report;
    auto store = KnowledgeGraphStore::from_json(j, &report);
    EXPECT_EQ(store.num_entities(), 1);
    EXPECT_EQ(store.num_relations(), 0);
    EXPECT_EQ(report.entities_skipped, 1);
    EXPECT_EQ(report.relations_skipped, 2);
    EXPECT_EQ(report.skipped_relation_ids, (std::vector<std::string>{"r1"}));
}

TEST(KnowledgeGraphCsvTest, FieldsAreQuoted) {
    KnowledgeGraphStore store;
    store.add_entity(Entity("q1", "Foo, \"Bar\"", "Concept", {}, {"F", "B"}));
    store.add_entity(Entity("q2", "Plain", "Concept"));
    store.add_relation(Relation("r1", "related_to", "q1", "q2", 0.5));

    std::string entities = store.entities_to_csv();
    EXPECT_EQ(entities,
              "id,name,type,aliases,properties\n"
              "q1,\"Foo, \"\"Bar\"\"\",Concept,\"F,B\",{}\n"
              "q2,Plain,Concept,,{}\n");

    std::string relations = store.relations_to_csv();
    EXPECT_EQ(relations,
              "id,type,head_entity_id,tail_entity_id,confidence,properties\n"
              "r1,related_to,q1,q2,0.5,{}\n");
}

// ==========================================
// Main
// ==========================================

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
