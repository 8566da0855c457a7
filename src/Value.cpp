/**
 * @file Value.cpp
 * @brief Implementation of deep equality
 */

#include "dedupe/Value.hpp"

namespace dedupe {

bool deep_equal(const Value& a, const Value& b) {
    if (a.is_object() || b.is_object()) {
        if (!a.is_object() || !b.is_object()) return false;
        if (a.size() != b.size()) return false;

        for (auto it = a.begin(); it != a.end(); ++it) {
            auto other = b.find(it.key());
            if (other == b.end()) return false;
            if (!deep_equal(it.value(), *other)) return false;
        }
        return true;
    }

    if (a.is_array() || b.is_array()) {
        if (!a.is_array() || !b.is_array()) return false;
        if (a.size() != b.size()) return false;

        for (size_t i = 0; i < a.size(); ++i) {
            if (!deep_equal(a[i], b[i])) return false;
        }
        return true;
    }

    // Scalars: nlohmann compares mixed integer/float numerically and
    // treats differing scalar kinds as unequal.
    return a == b;
}

} // namespace dedupe
