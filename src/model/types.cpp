#include "model/types.hpp"
#include <algorithm>
#include <cstdlib>
#include <cerrno>

namespace kgf {

// ==========================================
// PropertyValue Implementation
// ==========================================

PropertyValue PropertyValue::make_list(const std::vector<std::string>& items) {
    std::vector<PropertyValue> values;
    values.reserve(items.size());
    for (const auto& item : items) {
        values.emplace_back(item);
    }
    return PropertyValue(values);
}

std::optional<double> PropertyValue::as_number() const {
    switch (kind) {
        case Kind::Number:
            return number_value;
        case Kind::Bool:
            return bool_value ? 1.0 : 0.0;
        case Kind::String: {
            if (string_value.empty()) return std::nullopt;
            const char* begin = string_value.c_str();
            char* end = nullptr;
            errno = 0;
            double parsed = std::strtod(begin, &end);
            if (errno != 0 || end == begin) return std::nullopt;
            // Allow trailing whitespace only
            while (*end == ' ' || *end == '\t') ++end;
            if (*end != '\0') return std::nullopt;
            return parsed;
        }
        default:
            return std::nullopt;
    }
}

std::string PropertyValue::to_string() const {
    if (kind == Kind::String) {
        return string_value;
    }
    return to_json().dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

nlohmann::json PropertyValue::to_json() const {
    switch (kind) {
        case Kind::String:
            return string_value;
        case Kind::Number:
            return number_value;
        case Kind::Bool:
            return bool_value;
        case Kind::List: {
            nlohmann::json arr = nlohmann::json::array();
            for (const auto& item : list_value) {
                arr.push_back(item.to_json());
            }
            return arr;
        }
        default:
            return nullptr;
    }
}

PropertyValue PropertyValue::from_json(const nlohmann::json& j) {
    if (j.is_string()) {
        return PropertyValue(j.get<std::string>());
    }
    if (j.is_boolean()) {
        return PropertyValue(j.get<bool>());
    }
    if (j.is_number()) {
        return PropertyValue(j.get<double>());
    }
    if (j.is_array()) {
        std::vector<PropertyValue> items;
        items.reserve(j.size());
        for (const auto& item : j) {
            items.push_back(from_json(item));
        }
        return PropertyValue(items);
    }
    if (j.is_object()) {
        // Nested maps are not a property kind; keep their text
        return PropertyValue(j.dump());
    }
    return PropertyValue();
}

bool PropertyValue::operator==(const PropertyValue& other) const {
    if (kind != other.kind) return false;

    switch (kind) {
        case Kind::String: return string_value == other.string_value;
        case Kind::Number: return number_value == other.number_value;
        case Kind::Bool: return bool_value == other.bool_value;
        case Kind::List: return list_value == other.list_value;
        default: return true;
    }
}

const char* property_kind_to_string(PropertyValue::Kind kind) {
    switch (kind) {
        case PropertyValue::Kind::String: return "string";
        case PropertyValue::Kind::Number: return "number";
        case PropertyValue::Kind::Bool: return "bool";
        case PropertyValue::Kind::List: return "list";
        case PropertyValue::Kind::Null: return "null";
    }
    return "null";
}

nlohmann::json properties_to_json(const Properties& properties) {
    nlohmann::json j = nlohmann::json::object();
    for (const auto& [key, value] : properties) {
        j[key] = value.to_json();
    }
    return j;
}

Properties properties_from_json(const nlohmann::json& j) {
    Properties properties;
    if (!j.is_object()) {
        return properties;
    }
    for (auto it = j.begin(); it != j.end(); ++it) {
        properties[it.key()] = PropertyValue::from_json(it.value());
    }
    return properties;
}

void append_unique(std::vector<std::string>& list, const std::string& value) {
    if (std::find(list.begin(), list.end(), value) == list.end()) {
        list.push_back(value);
    }
}

// ==========================================
// Entity Implementation
// ==========================================

Entity::Entity(std::string id_, std::string name_, std::string type_,
               Properties properties_, std::vector<std::string> aliases_)
    : id(std::move(id_)),
      name(std::move(name_)),
      type(std::move(type_)),
      properties(std::move(properties_)) {
    for (const auto& alias : aliases_) {
        append_unique(aliases, alias);
    }
}

std::optional<double> Entity::declared_confidence() const {
    auto it = properties.find("confidence");
    if (it == properties.end()) {
        return std::nullopt;
    }
    return it->second.as_number();
}

nlohmann::json Entity::to_json() const {
    nlohmann::json j;
    j["id"] = id;
    j["name"] = name;
    j["type"] = type;
    j["properties"] = properties_to_json(properties);
    j["aliases"] = aliases;
    return j;
}

Entity Entity::from_json(const nlohmann::json& j) {
    Entity entity;
    entity.id = j.at("id").get<std::string>();
    entity.name = j.at("name").get<std::string>();
    entity.type = j.value("type", std::string());

    if (j.contains("properties")) {
        entity.properties = properties_from_json(j["properties"]);
    }
    if (j.contains("aliases") && j["aliases"].is_array()) {
        for (const auto& alias : j["aliases"]) {
            if (alias.is_string()) {
                append_unique(entity.aliases, alias.get<std::string>());
            }
        }
    }

    return entity;
}

bool Entity::operator==(const Entity& other) const {
    return id == other.id && name == other.name && type == other.type &&
           properties == other.properties && aliases == other.aliases;
}

// ==========================================
// Relation Implementation
// ==========================================

Relation::Relation(std::string id_, std::string type_, std::string head_, std::string tail_,
                   double confidence_, Properties properties_)
    : id(std::move(id_)),
      type(std::move(type_)),
      head_entity_id(std::move(head_)),
      tail_entity_id(std::move(tail_)),
      properties(std::move(properties_)),
      confidence(confidence_) {}

nlohmann::json Relation::to_json() const {
    nlohmann::json j;
    j["id"] = id;
    j["type"] = type;
    j["head_entity_id"] = head_entity_id;
    j["tail_entity_id"] = tail_entity_id;
    j["properties"] = properties_to_json(properties);
    j["confidence"] = confidence;
    return j;
}

Relation Relation::from_json(const nlohmann::json& j) {
    Relation relation;
    relation.id = j.at("id").get<std::string>();
    relation.type = j.at("type").get<std::string>();
    relation.head_entity_id = j.at("head_entity_id").get<std::string>();
    relation.tail_entity_id = j.at("tail_entity_id").get<std::string>();
    relation.confidence = j.value("confidence", 1.0);

    if (j.contains("properties")) {
        relation.properties = properties_from_json(j["properties"]);
    }

    return relation;
}

bool Relation::operator==(const Relation& other) const {
    return id == other.id && type == other.type &&
           head_entity_id == other.head_entity_id &&
           tail_entity_id == other.tail_entity_id &&
           properties == other.properties && confidence == other.confidence;
}

} // namespace kgf
