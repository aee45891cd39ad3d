#pragma once

#include "model/types.hpp"
#include <optional>
#include <string>
#include <vector>

namespace kgf {
namespace merge {

/**
 * @brief Value whose canonical string occurs most often
 *
 * Ties go to the string seen first; the first original value with that
 * string is returned, so the tag is preserved.
 */
PropertyValue most_frequent(const std::vector<PropertyValue>& values);

/**
 * @brief Longest string value (code points), first wins ties
 *
 * Every value must be a string.
 */
PropertyValue longest_string(const std::vector<PropertyValue>& values);

/**
 * @brief Arithmetic mean of number values
 */
PropertyValue mean(const std::vector<PropertyValue>& values);

/**
 * @brief Concatenation of list values with duplicates removed
 *
 * Items keep the position of their first occurrence.
 */
PropertyValue list_union(const std::vector<PropertyValue>& values);

/**
 * @brief Items of the first list present in every other list
 */
PropertyValue list_intersection(const std::vector<PropertyValue>& values);

bool all_of_kind(const std::vector<PropertyValue>& values, PropertyValue::Kind kind);

/**
 * @brief Most frequent string in a list, first occurrence wins ties
 */
std::string most_frequent_string(const std::vector<std::string>& values, size_t* count = nullptr);

} // namespace merge
} // namespace kgf
