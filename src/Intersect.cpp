/**
 * @file Intersect.cpp
 * @brief Implementation of the structural intersection
 */

#include "dedupe/Intersect.hpp"

#include <algorithm>

namespace dedupe {

Value intersect(const std::vector<Value>& docs) {
    Value common = Value::object();
    if (docs.empty()) {
        return common;
    }

    const bool all_mappings = std::all_of(docs.begin(), docs.end(),
        [](const Value& d) { return d.is_object(); });
    if (!all_mappings) {
        return common;
    }

    const Value& first = docs.front();
    for (auto it = first.begin(); it != first.end(); ++it) {
        const auto& key = it.key();

        std::vector<Value> values;
        values.reserve(docs.size());
        for (const auto& doc : docs) {
            auto found = doc.find(key);
            if (found == doc.end()) break;
            values.push_back(*found);
        }
        if (values.size() != docs.size()) {
            continue; // missing from at least one document
        }

        const bool all_objects = std::all_of(values.begin(), values.end(),
            [](const Value& v) { return v.is_object(); });
        if (all_objects) {
            Value nested = intersect(values);
            if (!nested.empty()) {
                common[key] = std::move(nested);
            }
            continue;
        }

        // Sequences and scalars alike are kept only when every document
        // carries the same value; sequences are compared wholesale.
        const Value& value = it.value();
        const bool all_equal = std::all_of(values.begin(), values.end(),
            [&value](const Value& v) { return deep_equal(v, value); });
        if (all_equal) {
            common[key] = value;
        }
    }

    return common;
}

} // namespace dedupe
