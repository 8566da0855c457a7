/**
 * @file Clean.hpp
 * @brief Shallow removal of vacuous top-level entries
 */

#ifndef DEDUPE_CLEAN_HPP
#define DEDUPE_CLEAN_HPP

#include "dedupe/Value.hpp"

namespace dedupe {

/**
 * @brief Check whether a value counts as vacuous
 * @return true for an empty mapping, null, or the empty string
 */
bool is_vacuous(const Value& val);

/**
 * @brief Drop top-level keys of @p doc whose value is vacuous
 *
 * Single pass over the top level only; nested mappings are left alone.
 * Applying it twice is the same as applying it once. A non-mapping
 * @p doc is left untouched.
 */
void clean(Value& doc);

} // namespace dedupe

#endif // DEDUPE_CLEAN_HPP
