/**
 * @file Value.hpp
 * @brief Tree value model for documents
 *
 * Uses nlohmann::ordered_json as the underlying value model so that
 * mapping keys keep their insertion order when a document is written back:
 * - Null
 * - Bool (true | false)
 * - Integer (int64_t)
 * - Float (double)
 * - String (std::string, UTF-8)
 * - Sequence ([Value, ...])
 * - Mapping ({String: Value, ...})
 */

#ifndef DEDUPE_VALUE_HPP
#define DEDUPE_VALUE_HPP

#include <nlohmann/json.hpp>
#include <string>

namespace dedupe {

/**
 * @brief Generic document tree
 *
 * Alias for nlohmann::ordered_json. Mapping iteration follows insertion
 * order. Note that the library's operator== compares objects in key
 * order; use deep_equal() for document equality.
 */
using Value = nlohmann::ordered_json;

/**
 * @brief Get human-readable type name for a Value
 * @param val The value to inspect
 * @return Type name string (e.g., "null", "boolean", "integer", "float",
 *         "string", "sequence", "mapping")
 */
inline std::string type_name(const Value& val) {
    if (val.is_null()) return "null";
    if (val.is_boolean()) return "boolean";
    if (val.is_number_integer()) return "integer";
    if (val.is_number_float()) return "float";
    if (val.is_string()) return "string";
    if (val.is_array()) return "sequence";
    if (val.is_object()) return "mapping";
    return "unknown";
}

/**
 * @brief Check if value is a container (sequence or mapping)
 * @param val The value to check
 * @return true if val is array or object, false otherwise
 */
inline bool is_container(const Value& val) {
    return val.is_array() || val.is_object();
}

/**
 * @brief Structural equality of two trees
 *
 * - Scalars: equal value (integers and floats compare numerically)
 * - Mappings: identical key sets, deep-equal value per key; key order
 *   is ignored
 * - Sequences: equal length, pairwise deep-equal in order
 *
 * Values of different kinds are never equal.
 *
 * Examples:
 * ```cpp
 * deep_equal({{"a", 1}, {"b", 2}}, {{"b", 2}, {"a", 1}}) // true
 * deep_equal(Value::array({1, 2}), Value::array({2, 1}))  // false
 * ```
 */
bool deep_equal(const Value& a, const Value& b);

} // namespace dedupe

#endif // DEDUPE_VALUE_HPP
