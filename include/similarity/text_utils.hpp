#pragma once

#include <string>

namespace kgf {
namespace text {

/**
 * @brief Decode UTF-8 into code points
 *
 * Invalid sequences decode to U+FFFD one byte at a time, so every input
 * produces a result.
 */
std::u32string decode_utf8(const std::string& input);

/**
 * @brief Number of code points in a UTF-8 string
 */
size_t utf8_length(const std::string& input);

/**
 * @brief Lower-case ASCII letters, leave everything else untouched
 */
std::u32string to_lower(const std::u32string& input);

/**
 * @brief True when the string has at least one letter and no lower-case ones
 */
bool is_upper(const std::string& input);

} // namespace text
} // namespace kgf
