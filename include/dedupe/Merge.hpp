/**
 * @file Merge.hpp
 * @brief Right-biased deep merge of reference documents
 *
 * Merging rules:
 * - Both mappings: recursive merge
 * - Anything else: the later value replaces the earlier one
 *   (sequences are never merged element-wise)
 */

#ifndef DEDUPE_MERGE_HPP
#define DEDUPE_MERGE_HPP

#include "dedupe/Value.hpp"

#include <vector>

namespace dedupe {

/**
 * @brief Deep merge two mappings
 *
 * Merging rules:
 * - Both mappings: Recursive merge (keys from both are combined)
 * - Non-mapping overrides mapping: Override value replaces base entirely
 * - Mapping overrides non-mapping: Override mapping replaces base entirely
 * - Non-mappings (null included): Override replaces base
 *
 * Keys only present in @p override_val are appended after the keys of
 * @p base, in the order they appear in @p override_val.
 *
 * @param base Base mapping (lower precedence)
 * @param override_val Override mapping (higher precedence)
 * @return Merged result
 *
 * Examples:
 * ```cpp
 * Value base = {{"db", {{"host", "a"}, {"port", 1}}}};
 * Value over = {{"db", {{"port", 2}}}};
 * auto result = deep_merge(base, over);
 * // Result: {"db": {"host": "a", "port": 2}}
 *
 * Value base2 = {{"db", {{"host", "a"}}}};
 * Value over2 = {{"db", nullptr}};
 * auto result2 = deep_merge(base2, over2);
 * // Result: {"db": null}
 * ```
 */
Value deep_merge(const Value& base, const Value& override_val);

/**
 * @brief Deep merge reference documents in order
 *
 * Folds left to right starting from an empty mapping, so later
 * documents win conflicts at the leaf level.
 *
 * @param sources Documents to merge (in precedence order, lowest first)
 * @return Merged mapping; empty mapping for empty input
 *
 * Example:
 * ```cpp
 * Value ref1 = {{"a", 1}, {"b", {{"c", 2}}}};
 * Value ref2 = {{"b", {{"d", 4}}}, {"e", 5}};
 *
 * auto result = deep_merge_all({ref1, ref2});
 * // Result: {"a": 1, "b": {"c": 2, "d": 4}, "e": 5}
 * ```
 */
Value deep_merge_all(const std::vector<Value>& sources);

} // namespace dedupe

#endif // DEDUPE_MERGE_HPP
