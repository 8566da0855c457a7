/**
 * @file Intersect.hpp
 * @brief Structural common subset of several documents
 */

#ifndef DEDUPE_INTERSECT_HPP
#define DEDUPE_INTERSECT_HPP

#include "dedupe/Value.hpp"

#include <vector>

namespace dedupe {

/**
 * @brief Compute the structural intersection of N mappings
 *
 * For each key of the first document (in its order) that is present in
 * every document:
 * - All values are mappings: recurse, keep the key only if the nested
 *   intersection is non-empty
 * - All values are sequences: keep the key only if all sequences are
 *   deep-equal (sequences are never partially intersected)
 * - Otherwise (scalars or mixed kinds): keep the key only if all values
 *   are deep-equal
 *
 * The intersection of a single document is that document.
 *
 * @param docs Documents to intersect; non-mapping entries yield no keys
 * @return Common mapping; empty mapping for empty input
 *
 * Example:
 * ```cpp
 * Value d1 = {{"a", 1}, {"b", {{"c", 2}, {"d", 3}}}, {"e", {1, 2}}};
 * Value d2 = {{"a", 1}, {"b", {{"c", 2}, {"d", 4}}}, {"f", 5}};
 * auto common = intersect({d1, d2});
 * // Result: {"a": 1, "b": {"c": 2}}
 * ```
 */
Value intersect(const std::vector<Value>& docs);

} // namespace dedupe

#endif // DEDUPE_INTERSECT_HPP
