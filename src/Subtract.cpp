/**
 * @file Subtract.cpp
 * @brief Implementation of in-place subtraction
 */

#include "dedupe/Subtract.hpp"

#include <string>
#include <vector>

namespace dedupe {

void subtract(Value& target, const Value& to_remove) {
    if (!target.is_object() || !to_remove.is_object()) {
        return;
    }

    // Snapshot the keys; target and to_remove may be the same node.
    std::vector<std::string> keys;
    keys.reserve(to_remove.size());
    for (auto it = to_remove.begin(); it != to_remove.end(); ++it) {
        keys.push_back(it.key());
    }

    for (const auto& key : keys) {
        auto found = target.find(key);
        if (found == target.end()) {
            continue;
        }

        const Value& removal = to_remove.at(key);
        if (removal.is_object() && found->is_object()) {
            subtract(*found, removal);
            if (found->empty()) {
                target.erase(key);
            }
        } else {
            target.erase(key);
        }
    }
}

} // namespace dedupe
