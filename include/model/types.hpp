#ifndef KGF_MODEL_TYPES_HPP
#define KGF_MODEL_TYPES_HPP

#include <string>
#include <vector>
#include <map>
#include <optional>
#include <nlohmann/json.hpp>

namespace kgf {

/**
 * @brief Tagged property value attached to entities and relations
 *
 * A value is exactly one of string, number, ordered list or boolean.
 * Null only appears when a persisted document carries a JSON null.
 * Each tag has its own merge rule in the fusion engines.
 */
struct PropertyValue {
    enum class Kind {
        Null,
        String,
        Number,
        Bool,
        List
    };

    Kind kind = Kind::Null;
    std::string string_value;
    double number_value = 0.0;
    bool bool_value = false;
    std::vector<PropertyValue> list_value;

    PropertyValue() = default;
    PropertyValue(const char* value) : kind(Kind::String), string_value(value) {}
    PropertyValue(const std::string& value) : kind(Kind::String), string_value(value) {}
    PropertyValue(double value) : kind(Kind::Number), number_value(value) {}
    PropertyValue(int value) : kind(Kind::Number), number_value(value) {}
    PropertyValue(bool value) : kind(Kind::Bool), bool_value(value) {}
    PropertyValue(const std::vector<PropertyValue>& items) : kind(Kind::List), list_value(items) {}

    /**
     * @brief Build a list value from string items
     */
    static PropertyValue make_list(const std::vector<std::string>& items);

    bool is_null() const { return kind == Kind::Null; }
    bool is_string() const { return kind == Kind::String; }
    bool is_number() const { return kind == Kind::Number; }
    bool is_bool() const { return kind == Kind::Bool; }
    bool is_list() const { return kind == Kind::List; }

    /**
     * @brief Numeric view of the value
     *
     * Numbers convert directly, booleans to 1/0, strings only when the whole
     * string parses as a number. Lists and null have no numeric view.
     */
    std::optional<double> as_number() const;

    /**
     * @brief Canonical string form
     *
     * Strings are returned verbatim; every other kind uses its compact JSON
     * encoding. Two values are "the same stringified value" iff their
     * canonical forms are equal.
     */
    std::string to_string() const;

    nlohmann::json to_json() const;
    static PropertyValue from_json(const nlohmann::json& j);

    bool operator==(const PropertyValue& other) const;
    bool operator!=(const PropertyValue& other) const { return !(*this == other); }
};

const char* property_kind_to_string(PropertyValue::Kind kind);

using Properties = std::map<std::string, PropertyValue>;

nlohmann::json properties_to_json(const Properties& properties);
Properties properties_from_json(const nlohmann::json& j);

/**
 * @brief Canonical graph node
 */
struct Entity {
    std::string id;                                    // Unique within a store
    std::string name;                                  // Preferred surface form
    std::string type;                                  // Open type tag
    Properties properties;
    std::vector<std::string> aliases;                  // De-duplicated, first occurrence order

    Entity() = default;
    Entity(std::string id_, std::string name_, std::string type_,
           Properties properties_ = {}, std::vector<std::string> aliases_ = {});

    /**
     * @brief Confidence declared in the "confidence" property, if any
     */
    std::optional<double> declared_confidence() const;

    nlohmann::json to_json() const;
    static Entity from_json(const nlohmann::json& j);

    bool operator==(const Entity& other) const;
    bool operator!=(const Entity& other) const { return !(*this == other); }
};

/**
 * @brief Typed directed edge between two entities
 */
struct Relation {
    std::string id;
    std::string type;
    std::string head_entity_id;
    std::string tail_entity_id;
    Properties properties;
    double confidence = 1.0;                           // [0, 1]

    Relation() = default;
    Relation(std::string id_, std::string type_, std::string head_, std::string tail_,
             double confidence_ = 1.0, Properties properties_ = {});

    nlohmann::json to_json() const;
    static Relation from_json(const nlohmann::json& j);

    bool operator==(const Relation& other) const;
    bool operator!=(const Relation& other) const { return !(*this == other); }
};

/**
 * @brief Append to a string list unless the value is already present
 */
void append_unique(std::vector<std::string>& list, const std::string& value);

} // namespace kgf

#endif // KGF_MODEL_TYPES_HPP
