#include <gtest/gtest.h>
#include "ingest/candidate_mapper.hpp"

using namespace kgf;

class CandidateMapperTest : public ::testing::Test {
protected:
    CandidateMapper mapper;
    std::vector<ExtractedEntity> entities;
    std::vector<ExtractedRelation> relations;

    void SetUp() override {
        entities = {
            {"Steve Jobs", "Person", 0, 10, 0.95, "Steve Jobs founded Apple"},
            {"Apple", "Organization", 19, 24, 0.9, "Steve Jobs founded Apple"},
            {"Cupertino", "Location", 40, 49, 0.8, ""}
        };
        relations = {
            {"Steve Jobs", "founder_of", "Apple", 0.85, "Steve Jobs founded Apple", 0, 24},
            {"Apple", "located_in", "Atlantis", 0.5, "", 0, 0},
            {"Apple", "located_in", "Cupertino", 0.7, "", 25, 49}
        };
    }
};

// ==========================================
// Entity Mapping Tests
// ==========================================

TEST_F(CandidateMapperTest, EntitiesGetPositionalIds) {
    auto mapped = mapper.map_entities(entities);
    ASSERT_EQ(mapped.size(), 3);

    EXPECT_EQ(mapped[0].id, "entity_0");
    EXPECT_EQ(mapped[0].name, "Steve Jobs");
    EXPECT_EQ(mapped[0].type, "Person");
    EXPECT_EQ(mapped[2].id, "entity_2");
}

TEST_F(CandidateMapperTest, EntityProvenanceProperties) {
    auto mapped = mapper.map_entities(entities);
    const auto& apple = mapped[1];

    EXPECT_DOUBLE_EQ(apple.properties.at("confidence").number_value, 0.9);
    EXPECT_EQ(apple.properties.at("context").string_value, "Steve Jobs founded Apple");
    EXPECT_EQ(apple.properties.at("source_position").string_value, "19-24");
    EXPECT_DOUBLE_EQ(apple.declared_confidence().value(), 0.9);
}

TEST_F(CandidateMapperTest, CustomPrefixes) {
    CandidateMapper prefixed("doc1_e", "doc1_r");
    auto result = prefixed.map(entities, relations);
    EXPECT_EQ(result.entities[0].id, "doc1_e0");
    EXPECT_EQ(result.relations[0].id, "doc1_r0");
}

// ==========================================
// Relation Mapping Tests
// ==========================================

TEST_F(CandidateMapperTest, RelationsResolveBySurfaceForm) {
    auto result = mapper.map(entities, relations);

    ASSERT_EQ(result.relations.size(), 2);
    EXPECT_EQ(result.unresolved_relations, 1);

    const auto& founded = result.relations[0];
    EXPECT_EQ(founded.id, "relation_0");
    EXPECT_EQ(founded.type, "founder_of");
    EXPECT_EQ(founded.head_entity_id, "entity_0");
    EXPECT_EQ(founded.tail_entity_id, "entity_1");
    EXPECT_DOUBLE_EQ(founded.confidence, 0.85);
    EXPECT_EQ(founded.properties.at("source_position").string_value, "0-24");

    // The skipped candidate still consumes its index
    EXPECT_EQ(result.relations[1].id, "relation_2");
    EXPECT_EQ(result.relations[1].tail_entity_id, "entity_2");
}

TEST_F(CandidateMapperTest, MapRelationsWithExternalIndex) {
    std::map<std::string, std::string> index = {
        {"Steve Jobs", "p1"},
        {"Apple", "o1"}
    };

    size_t unresolved = 0;
    auto mapped = mapper.map_relations(relations, index, &unresolved);
    ASSERT_EQ(mapped.size(), 1);
    EXPECT_EQ(mapped[0].head_entity_id, "p1");
    EXPECT_EQ(unresolved, 2);

    // The counter is optional
    EXPECT_EQ(mapper.map_relations(relations, index).size(), 1);
}

TEST_F(CandidateMapperTest, FirstEntityOwnsSharedName) {
    entities.push_back({"Apple", "Product", 60, 65, 0.6, "the Apple phone"});
    auto result = mapper.map(entities, relations);

    EXPECT_EQ(result.name_to_id.at("Apple"), "entity_1");
    EXPECT_EQ(result.relations[0].tail_entity_id, "entity_1");
}

TEST(CandidateMapperIndexTest, AliasesAreIndexed) {
    std::vector<Entity> entities = {
        Entity("e1", "International Business Machines", "Organization", {}, {"IBM"}),
        Entity("e2", "IBM", "Organization")
    };

    auto index = CandidateMapper::build_name_index(entities);
    EXPECT_EQ(index.at("International Business Machines"), "e1");
    EXPECT_EQ(index.at("IBM"), "e1");
}

TEST(CandidateMapperEmptyTest, EmptyInput) {
    CandidateMapper mapper;
    auto result = mapper.map({}, {});
    EXPECT_TRUE(result.entities.empty());
    EXPECT_TRUE(result.relations.empty());
    EXPECT_EQ(result.unresolved_relations, 0);
}

// ==========================================
// Serialization Tests
// ==========================================

TEST(ExtractedCandidateTest, FromJsonDefaults) {
    auto entity = ExtractedEntity::from_json({{"text", "Tencent"}});
    EXPECT_EQ(entity.text, "Tencent");
    EXPECT_TRUE(entity.type.empty());
    EXPECT_DOUBLE_EQ(entity.confidence, 1.0);

    EXPECT_THROW(ExtractedEntity::from_json({{"type", "Organization"}}), nlohmann::json::exception);

    auto relation = ExtractedRelation::from_json({
        {"head_entity", "Ma Huateng"},
        {"relation_type", "founder_of"},
        {"tail_entity", "Tencent"},
        {"confidence", 0.8}
    });
    EXPECT_EQ(relation.relation_type, "founder_of");
    EXPECT_DOUBLE_EQ(relation.confidence, 0.8);
    EXPECT_EQ(relation.end_pos, 0);
}

TEST_F(CandidateMapperTest, MappingResultJson) {
    auto j = mapper.map(entities, relations).to_json();
    EXPECT_EQ(j["entities"].size(), 3);
    EXPECT_EQ(j["relations"].size(), 2);
    EXPECT_EQ(j["unresolved_relations"], 1);
}

// ==========================================
// Main
// ==========================================

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
