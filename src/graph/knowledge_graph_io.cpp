#include "graph/knowledge_graph.hpp"
#include "model/errors.hpp"
#include <fstream>
#include <iostream>
#include <sstream>

namespace kgf {

namespace {

// Quote a field only when it contains a separator, quote or line break
std::string csv_field(const std::string& value) {
    if (value.find_first_of(",\"\n\r") == std::string::npos) {
        return value;
    }

    std::string quoted = "\"";
    for (char c : value) {
        if (c == '"') quoted += "\"\"";
        else quoted += c;
    }
    quoted += "\"";
    return quoted;
}

std::string join(const std::vector<std::string>& items, const std::string& separator) {
    std::string result;
    for (size_t i = 0; i < items.size(); ++i) {
        if (i > 0) result += separator;
        result += items[i];
    }
    return result;
}

// Invalid UTF-8 in stored strings becomes U+FFFD instead of throwing
std::string dump_text(const nlohmann::json& j, int indent = -1) {
    return j.dump(indent, ' ', false, nlohmann::json::error_handler_t::replace);
}

void write_file(const std::string& filename, const std::string& content) {
    std::ofstream file(filename);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to open file for writing: " + filename);
    }
    file << content;
    file.close();
}

}  // namespace

// ==========================================
// Export/Import Methods
// ==========================================

nlohmann::json KnowledgeGraphStore::to_json() const {
    nlohmann::json j;

    nlohmann::json entities_json = nlohmann::json::array();
    for (const auto& [id, entity] : entities_) {
        entities_json.push_back(entity.to_json());
    }
    j["entities"] = entities_json;

    nlohmann::json relations_json = nlohmann::json::array();
    for (const auto& [id, relation] : relations_) {
        relations_json.push_back(relation.to_json());
    }
    j["relations"] = relations_json;

    j["statistics"] = get_statistics().to_json();

    return j;
}

void KnowledgeGraphStore::export_to_json(const std::string& filename) const {
    write_file(filename, dump_text(to_json(), 2));
}

KnowledgeGraphStore KnowledgeGraphStore::from_json(const nlohmann::json& j, LoadReport* report) {
    if (!j.is_object()) {
        throw MalformedPersistedState("Graph document must be a JSON object");
    }

    KnowledgeGraphStore store;
    LoadReport local;

    if (j.contains("entities") && j["entities"].is_array()) {
        for (const auto& entity_json : j["entities"]) {
            try {
                store.add_entity(Entity::from_json(entity_json));
                local.entities_added++;
            } catch (const nlohmann::json::exception& e) {
                local.entities_skipped++;
                std::cerr << "Skipping unreadable entity record: " << e.what() << "\n";
            }
        }
    }

    if (j.contains("relations") && j["relations"].is_array()) {
        for (const auto& relation_json : j["relations"]) {
            Relation relation;
            try {
                relation = Relation::from_json(relation_json);
            } catch (const nlohmann::json::exception& e) {
                local.relations_skipped++;
                std::cerr << "Skipping unreadable relation record: " << e.what() << "\n";
                continue;
            }

            try {
                store.add_relation(relation);
                local.relations_added++;
            } catch (const ValidationError& e) {
                local.relations_skipped++;
                local.skipped_relation_ids.push_back(relation.id);
                std::cerr << "Skipping relation on load: " << e.what() << "\n";
            }
        }
    }

    if (report) {
        *report = local;
    }
    return store;
}

KnowledgeGraphStore KnowledgeGraphStore::load_from_json(const std::string& filename, LoadReport* report) {
    std::ifstream file(filename);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to open file for reading: " + filename);
    }

    nlohmann::json j;
    try {
        file >> j;
    } catch (const nlohmann::json::parse_error& e) {
        throw MalformedPersistedState("Failed to parse " + filename + ": " + e.what());
    }
    file.close();

    return from_json(j, report);
}

std::string KnowledgeGraphStore::entities_to_csv() const {
    std::ostringstream out;
    out << "id,name,type,aliases,properties\n";

    for (const auto& [id, entity] : entities_) {
        out << csv_field(entity.id) << ","
            << csv_field(entity.name) << ","
            << csv_field(entity.type) << ","
            << csv_field(join(entity.aliases, ",")) << ","
            << csv_field(dump_text(properties_to_json(entity.properties))) << "\n";
    }

    return out.str();
}

std::string KnowledgeGraphStore::relations_to_csv() const {
    std::ostringstream out;
    out << "id,type,head_entity_id,tail_entity_id,confidence,properties\n";

    for (const auto& [id, relation] : relations_) {
        out << csv_field(relation.id) << ","
            << csv_field(relation.type) << ","
            << csv_field(relation.head_entity_id) << ","
            << csv_field(relation.tail_entity_id) << ","
            << nlohmann::json(relation.confidence).dump() << ","
            << csv_field(dump_text(properties_to_json(relation.properties))) << "\n";
    }

    return out.str();
}

void KnowledgeGraphStore::export_to_csv(
    const std::string& entities_file,
    const std::string& relations_file
) const {
    write_file(entities_file, entities_to_csv());
    write_file(relations_file, relations_to_csv());
}

} // namespace kgf
