#include "ontology/ontology.hpp"
#include <fstream>
#include <iostream>
#include <set>
#include <stdexcept>

using json = nlohmann::json;

namespace kgf {

// ============================================================================
// Schema Types
// ============================================================================

json EntityTypeDef::to_json() const {
    json j;
    j["description"] = description;
    j["properties"] = properties;
    j["parent_type"] = parent_type.empty() ? json() : json(parent_type);
    return j;
}

EntityTypeDef EntityTypeDef::from_json(const std::string& name, const json& j) {
    EntityTypeDef type;
    type.name = name;
    type.description = j.value("description", "");
    if (j.contains("properties") && j["properties"].is_array()) {
        type.properties = j["properties"].get<std::vector<std::string>>();
    }
    if (j.contains("parent_type") && j["parent_type"].is_string()) {
        type.parent_type = j["parent_type"].get<std::string>();
    }
    return type;
}

json RelationTypeDef::to_json() const {
    json j;
    j["description"] = description;
    j["domain"] = domain;
    j["range"] = range;
    j["properties"] = properties;
    return j;
}

RelationTypeDef RelationTypeDef::from_json(const std::string& name, const json& j) {
    RelationTypeDef type;
    type.name = name;
    type.description = j.value("description", "");
    type.domain = j.value("domain", "");
    type.range = j.value("range", "");
    if (j.contains("properties") && j["properties"].is_array()) {
        type.properties = j["properties"].get<std::vector<std::string>>();
    }
    return type;
}

// ============================================================================
// SchemaOntology
// ============================================================================

SchemaOntology::SchemaOntology(bool with_defaults) {
    if (with_defaults) {
        initialize_defaults();
    }
}

void SchemaOntology::initialize_defaults() {
    add_entity_type({"Person", "A person", {"name", "age", "occupation", "nationality"}, ""});
    add_entity_type({"Organization", "An organization", {"name", "type", "founded_year", "location"}, ""});
    add_entity_type({"Location", "A geographic location", {"name", "type", "coordinates", "population"}, ""});
    add_entity_type({"Event", "An event", {"name", "date", "location", "participants"}, ""});
    add_entity_type({"Product", "A product", {"name", "category", "price", "manufacturer"}, ""});
    add_entity_type({"Concept", "An abstract concept", {"name", "definition", "category"}, ""});

    add_relation_type({"works_for", "Works for", "Person", "Organization", {}});
    add_relation_type({"located_in", "Located in", "Organization", "Location", {}});
    add_relation_type({"born_in", "Born in", "Person", "Location", {}});
    add_relation_type({"participated_in", "Participated in", "Person", "Event", {}});
    add_relation_type({"occurred_at", "Occurred at", "Event", "Location", {}});
    add_relation_type({"produces", "Produces", "Organization", "Product", {}});
    add_relation_type({"founder_of", "Founder of", "Person", "Organization", {}});
    add_relation_type({"parent_of", "Parent of", "Person", "Person", {}});
    add_relation_type({"spouse_of", "Spouse of", "Person", "Person", {}});
    add_relation_type({"friend_of", "Friend of", "Person", "Person", {}});
}

std::optional<EntityTypeDef> SchemaOntology::get_entity_type(const std::string& name) const {
    auto it = entity_types_.find(name);
    if (it == entity_types_.end()) return std::nullopt;
    return it->second;
}

std::optional<RelationTypeDef> SchemaOntology::get_relation_type(const std::string& name) const {
    auto it = relation_types_.find(name);
    if (it == relation_types_.end()) return std::nullopt;
    return it->second;
}

bool SchemaOntology::is_a(const std::string& type, const std::string& ancestor) const {
    std::set<std::string> seen;
    std::string current = type;

    while (!current.empty() && seen.insert(current).second) {
        if (current == ancestor) return true;
        auto it = entity_types_.find(current);
        if (it == entity_types_.end()) break;
        current = it->second.parent_type;
    }
    return false;
}

bool SchemaOntology::validate_relation(
    const std::string& relation_type,
    const std::string& head_type,
    const std::string& tail_type
) const {
    auto it = relation_types_.find(relation_type);
    if (it == relation_types_.end()) return false;
    return is_a(head_type, it->second.domain) && is_a(tail_type, it->second.range);
}

std::vector<std::string> SchemaOntology::get_possible_relations(
    const std::string& head_type,
    const std::string& tail_type
) const {
    std::vector<std::string> possible;
    for (const auto& [name, type] : relation_types_) {
        if (is_a(head_type, type.domain) && is_a(tail_type, type.range)) {
            possible.push_back(name);
        }
    }
    return possible;
}

void SchemaOntology::add_entity_type(const EntityTypeDef& type) {
    entity_types_[type.name] = type;
}

void SchemaOntology::add_relation_type(const RelationTypeDef& type) {
    relation_types_[type.name] = type;
}

std::vector<std::string> SchemaOntology::entity_type_names() const {
    std::vector<std::string> names;
    for (const auto& [name, type] : entity_types_) names.push_back(name);
    return names;
}

std::vector<std::string> SchemaOntology::relation_type_names() const {
    std::vector<std::string> names;
    for (const auto& [name, type] : relation_types_) names.push_back(name);
    return names;
}

// ============================================================================
// Persistence
// ============================================================================

json SchemaOntology::to_json() const {
    json j;
    j["entity_types"] = json::object();
    for (const auto& [name, type] : entity_types_) {
        j["entity_types"][name] = type.to_json();
    }
    j["relation_types"] = json::object();
    for (const auto& [name, type] : relation_types_) {
        j["relation_types"][name] = type.to_json();
    }
    return j;
}

void SchemaOntology::merge_json(const json& j) {
    if (!j.is_object()) {
        throw std::invalid_argument("Ontology document must be a JSON object");
    }

    if (j.contains("entity_types") && j["entity_types"].is_object()) {
        for (const auto& [name, data] : j["entity_types"].items()) {
            add_entity_type(EntityTypeDef::from_json(name, data));
        }
    }
    if (j.contains("relation_types") && j["relation_types"].is_object()) {
        for (const auto& [name, data] : j["relation_types"].items()) {
            add_relation_type(RelationTypeDef::from_json(name, data));
        }
    }
}

void SchemaOntology::export_to_json(const std::string& filename) const {
    std::ofstream file(filename);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to open file for writing: " + filename);
    }
    file << to_json().dump(2);
}

SchemaOntology SchemaOntology::load_from_json(const std::string& filename) {
    std::ifstream file(filename);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to open file for reading: " + filename);
    }

    json j;
    file >> j;

    SchemaOntology ontology(false);
    ontology.merge_json(j);
    return ontology;
}

void SchemaOntology::print_summary() const {
    std::cout << "=== Ontology Summary ===\n";
    std::cout << "\nEntity types (" << entity_types_.size() << "):\n";
    for (const auto& [name, type] : entity_types_) {
        std::cout << "  - " << name << ": " << type.description;
        if (!type.parent_type.empty()) std::cout << " (is a " << type.parent_type << ")";
        std::cout << "\n";
    }

    std::cout << "\nRelation types (" << relation_types_.size() << "):\n";
    for (const auto& [name, type] : relation_types_) {
        std::cout << "  - " << name << ": " << type.domain << " -> " << type.range << "\n";
    }
}

} // namespace kgf
