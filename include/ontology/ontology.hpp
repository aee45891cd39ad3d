#pragma once

#include <nlohmann/json.hpp>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace kgf {

// ============================================================================
// Schema Types
// ============================================================================

struct EntityTypeDef {
    std::string name;
    std::string description;
    std::vector<std::string> properties;    // Expected property keys
    std::string parent_type;                // Empty for a root type

    nlohmann::json to_json() const;
    static EntityTypeDef from_json(const std::string& name, const nlohmann::json& j);
};

struct RelationTypeDef {
    std::string name;
    std::string description;
    std::string domain;                     // Required head entity type
    std::string range;                      // Required tail entity type
    std::vector<std::string> properties;

    nlohmann::json to_json() const;
    static RelationTypeDef from_json(const std::string& name, const nlohmann::json& j);
};

// ============================================================================
// Ontology Interface
// ============================================================================

/**
 * @brief Entity and relation type schema consulted by the graph store
 *
 * The store only reads from it, so any schema source can stand behind
 * this interface.
 */
class Ontology {
public:
    virtual ~Ontology() = default;

    virtual std::optional<EntityTypeDef> get_entity_type(const std::string& name) const = 0;
    virtual std::optional<RelationTypeDef> get_relation_type(const std::string& name) const = 0;

    /**
     * @brief True when the relation type exists and accepts the endpoint types
     *
     * @param relation_type Relation type name
     * @param head_type Entity type of the head
     * @param tail_type Entity type of the tail
     */
    virtual bool validate_relation(
        const std::string& relation_type,
        const std::string& head_type,
        const std::string& tail_type
    ) const = 0;

    /**
     * @brief Relation types whose domain and range accept the given types
     */
    virtual std::vector<std::string> get_possible_relations(
        const std::string& head_type,
        const std::string& tail_type
    ) const = 0;
};

// ============================================================================
// Schema Ontology
// ============================================================================

/**
 * @brief In-memory ontology backed by type tables
 *
 * An entity type satisfies a domain or range when it equals it or has it
 * as an ancestor through parent_type.
 */
class SchemaOntology : public Ontology {
public:
    /**
     * @param with_defaults Seed the default schema (Person, Organization,
     *        Location, Event, Product, Concept and their relations)
     */
    explicit SchemaOntology(bool with_defaults = true);

    std::optional<EntityTypeDef> get_entity_type(const std::string& name) const override;
    std::optional<RelationTypeDef> get_relation_type(const std::string& name) const override;

    bool validate_relation(
        const std::string& relation_type,
        const std::string& head_type,
        const std::string& tail_type
    ) const override;

    std::vector<std::string> get_possible_relations(
        const std::string& head_type,
        const std::string& tail_type
    ) const override;

    void add_entity_type(const EntityTypeDef& type);
    void add_relation_type(const RelationTypeDef& type);

    /**
     * @brief True when `type` equals `ancestor` or descends from it
     */
    bool is_a(const std::string& type, const std::string& ancestor) const;

    std::vector<std::string> entity_type_names() const;
    std::vector<std::string> relation_type_names() const;

    // ==========================================
    // Persistence
    // ==========================================

    nlohmann::json to_json() const;

    /**
     * @brief Add (or replace) every type listed in a schema document
     */
    void merge_json(const nlohmann::json& j);

    void export_to_json(const std::string& filename) const;
    static SchemaOntology load_from_json(const std::string& filename);

    void print_summary() const;

private:
    std::map<std::string, EntityTypeDef> entity_types_;
    std::map<std::string, RelationTypeDef> relation_types_;

    void initialize_defaults();
};

} // namespace kgf
