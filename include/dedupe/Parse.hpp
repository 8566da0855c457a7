/**
 * @file Parse.hpp
 * @brief Typing of untagged YAML plain scalars
 *
 * yaml-cpp hands every scalar back as text. Plain (unquoted) scalars are
 * resolved to a typed Value following the YAML 1.2 core schema:
 *
 * Parsing order (first match wins):
 * - Null ("", "~", "null" | "Null" | "NULL")
 * - Boolean ("true" | "True" | "TRUE", "false" | "False" | "FALSE")
 * - Integer (matches ^[-+]?[0-9]+$, or 0x / 0o prefixed). Values that fit
 *   int64 are signed, larger non-negative values up to 2^64-1 are unsigned,
 *   and anything wider stays a string so no digits are lost.
 * - Float (decimal with fraction and/or exponent, ".inf" | ".Inf" | ".INF",
 *   ".nan" | ".NaN" | ".NAN")
 * - Raw String (fallback)
 *
 * Other spellings such as "tRuE" or "nUlL" are strings.
 */

#ifndef DEDUPE_PARSE_HPP
#define DEDUPE_PARSE_HPP

#include "dedupe/Value.hpp"
#include <string>

namespace dedupe {

/**
 * @brief Resolve a plain scalar to the appropriate type
 *
 * @param str Scalar text as written in the document
 * @return Parsed Value with appropriate type
 *
 * Examples:
 * ```cpp
 * parse_scalar("true")       // → true (boolean)
 * parse_scalar("~")          // → null
 * parse_scalar("42")         // → 42 (integer)
 * parse_scalar("0x1F")       // → 31 (integer)
 * parse_scalar("-2.5e10")    // → -2.5e10 (float)
 * parse_scalar(".inf")       // → +infinity (float)
 * parse_scalar("yes")        // → "yes" (string)
 * parse_scalar("1.2.3")      // → "1.2.3" (string)
 * ```
 */
Value parse_scalar(const std::string& str);

} // namespace dedupe

#endif // DEDUPE_PARSE_HPP
