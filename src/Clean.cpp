/**
 * @file Clean.cpp
 * @brief Implementation of the shallow clean pass
 */

#include "dedupe/Clean.hpp"

#include <string>
#include <vector>

namespace dedupe {

bool is_vacuous(const Value& val) {
    if (val.is_null()) return true;
    if (val.is_object()) return val.empty();
    if (val.is_string()) return val.get_ref<const std::string&>().empty();
    return false;
}

void clean(Value& doc) {
    if (!doc.is_object()) {
        return;
    }

    std::vector<std::string> keys_to_delete;
    for (auto it = doc.begin(); it != doc.end(); ++it) {
        if (is_vacuous(it.value())) {
            keys_to_delete.push_back(it.key());
        }
    }

    for (const auto& key : keys_to_delete) {
        doc.erase(key);
    }
}

} // namespace dedupe
