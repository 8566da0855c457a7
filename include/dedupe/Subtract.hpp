/**
 * @file Subtract.hpp
 * @brief In-place removal of a known subtree from a document
 */

#ifndef DEDUPE_SUBTRACT_HPP
#define DEDUPE_SUBTRACT_HPP

#include "dedupe/Value.hpp"

namespace dedupe {

/**
 * @brief Remove the keys of @p to_remove from @p target, in place
 *
 * For each key of @p to_remove:
 * - Absent in @p target: nothing happens
 * - Mapping on both sides: recurse, then drop the key from @p target if
 *   it became an empty mapping
 * - Otherwise: drop the key from @p target outright
 *
 * Values are NOT compared on the non-mapping branch: presence of the key
 * in @p to_remove is enough to delete it from @p target, even when the
 * two values differ.
 *
 * @p to_remove is never modified. Either argument not being a mapping
 * makes the call a no-op.
 *
 * Example:
 * ```cpp
 * Value doc = {{"a", 1}, {"b", {{"c", 2}, {"d", 3}}}};
 * subtract(doc, {{"a", 1}, {"b", {{"c", 2}}}});
 * // doc: {"b": {"d": 3}}
 * ```
 */
void subtract(Value& target, const Value& to_remove);

} // namespace dedupe

#endif // DEDUPE_SUBTRACT_HPP
