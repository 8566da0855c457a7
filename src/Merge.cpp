/**
 * @file Merge.cpp
 * @brief Implementation of deep merge
 */

#include "dedupe/Merge.hpp"

namespace dedupe {

Value deep_merge(const Value& base, const Value& override_val) {
    // Only two mappings merge; everything else is replaced wholesale
    if (!base.is_object() || !override_val.is_object()) {
        return override_val;
    }

    Value result = base; // Start with base

    for (auto it = override_val.begin(); it != override_val.end(); ++it) {
        const auto& key = it.key();
        const auto& override_value = it.value();

        auto existing = result.find(key);
        if (existing != result.end()) {
            // Key exists in both: recursively merge
            *existing = deep_merge(*existing, override_value);
        } else {
            // Key only in override: append it
            result[key] = override_value;
        }
    }

    return result;
}

Value deep_merge_all(const std::vector<Value>& sources) {
    Value result = Value::object();
    for (const auto& source : sources) {
        result = deep_merge(result, source);
    }
    return result;
}

} // namespace dedupe
