#pragma once

#include <stdexcept>
#include <string>

namespace kgf {

/**
 * @brief A relation references an entity that is not present in the store
 *
 * Raised by KnowledgeGraphStore::add_relation before any index is touched.
 */
class ValidationError : public std::runtime_error {
public:
    ValidationError(const std::string& relation_id, const std::string& missing_entity_id)
        : std::runtime_error("Relation " + relation_id + " references missing entity " +
                             missing_entity_id),
          relation_id_(relation_id),
          missing_entity_id_(missing_entity_id) {}

    const std::string& relation_id() const { return relation_id_; }
    const std::string& missing_entity_id() const { return missing_entity_id_; }

private:
    std::string relation_id_;
    std::string missing_entity_id_;
};

/**
 * @brief A resolution strategy could not produce a value
 *
 * Always caught by ConflictResolver, which falls back to the first
 * conflicting item.
 */
class ConflictResolutionFailure : public std::runtime_error {
public:
    explicit ConflictResolutionFailure(const std::string& message)
        : std::runtime_error(message) {}
};

/**
 * @brief A persisted graph document cannot be interpreted at all
 *
 * Individual bad records are skipped and reported instead.
 */
class MalformedPersistedState : public std::runtime_error {
public:
    explicit MalformedPersistedState(const std::string& message)
        : std::runtime_error(message) {}
};

} // namespace kgf
