/**
 * @file Parse.cpp
 * @brief Implementation of plain scalar typing
 */

#include "dedupe/Parse.hpp"
#include <algorithm>
#include <cctype>
#include <cstdint>
#include <limits>
#include <regex>
#include <stdexcept>

namespace dedupe {

namespace {
    /**
     * @brief Match a core-schema word in its lower, Capitalized or UPPER form
     *
     * @param word Lower-case spelling (e.g. "true", ".inf")
     *
     * ".nan" is not covered: its mixed form is ".NaN".
     */
    bool core_word(const std::string& str, const std::string& word) {
        if (str == word) return true;

        std::string upper = word;
        std::transform(upper.begin(), upper.end(), upper.begin(),
                      [](unsigned char c) { return std::toupper(c); });
        if (str == upper) return true;

        std::string capitalized = word;
        size_t first = capitalized.find_first_not_of('.');
        if (first != std::string::npos) {
            capitalized[first] = static_cast<char>(
                std::toupper(static_cast<unsigned char>(capitalized[first])));
        }
        return str == capitalized;
    }

    /**
     * @brief Hex/octal digits as int64 when they fit, else uint64, else
     *        the original text
     */
    Value unsigned_integer(const std::string& digits, int base, const std::string& text) {
        try {
            const unsigned long long val = std::stoull(digits, nullptr, base);
            if (val <= static_cast<unsigned long long>(std::numeric_limits<std::int64_t>::max())) {
                return static_cast<std::int64_t>(val);
            }
            return static_cast<std::uint64_t>(val);
        } catch (const std::out_of_range&) {
            return text;
        }
    }

    bool matches_regex(const std::string& str, const std::regex& re) {
        return std::regex_match(str, re);
    }

    const std::regex& decimal_int() {
        static const std::regex re("^[-+]?[0-9]+$");
        return re;
    }

    const std::regex& hex_int() {
        static const std::regex re("^0x[0-9a-fA-F]+$");
        return re;
    }

    const std::regex& octal_int() {
        static const std::regex re("^0o[0-7]+$");
        return re;
    }

    const std::regex& decimal_float() {
        static const std::regex re(
            "^[-+]?(\\.[0-9]+|[0-9]+(\\.[0-9]*)?)([eE][-+]?[0-9]+)?$");
        return re;
    }
}

Value parse_scalar(const std::string& str) {
    // Null
    if (str.empty() || str == "~" || core_word(str, "null")) {
        return nullptr;
    }

    // Boolean
    if (core_word(str, "true")) {
        return true;
    }
    if (core_word(str, "false")) {
        return false;
    }

    // Integer
    if (matches_regex(str, decimal_int())) {
        try {
            return static_cast<std::int64_t>(std::stoll(str, nullptr, 10));
        } catch (const std::out_of_range&) {
            // Above int64: try the unsigned range before giving up
        }
        if (str.front() != '-') {
            const std::string digits = str.front() == '+' ? str.substr(1) : str;
            try {
                return static_cast<std::uint64_t>(std::stoull(digits, nullptr, 10));
            } catch (const std::out_of_range&) {
                // Wider than 64 bits
            }
        }
        return str;
    }
    if (matches_regex(str, hex_int())) {
        return unsigned_integer(str.substr(2), 16, str);
    }
    if (matches_regex(str, octal_int())) {
        return unsigned_integer(str.substr(2), 8, str);
    }

    // Float
    if (str.size() > 1 && (str.front() == '+' || str.front() == '-') &&
        core_word(str.substr(1), ".inf")) {
        return str.front() == '-' ? -std::numeric_limits<double>::infinity()
                                  : std::numeric_limits<double>::infinity();
    }
    if (core_word(str, ".inf")) {
        return std::numeric_limits<double>::infinity();
    }
    if (str == ".nan" || str == ".NaN" || str == ".NAN") {
        return std::numeric_limits<double>::quiet_NaN();
    }
    if (matches_regex(str, decimal_float())) {
        try {
            size_t pos = 0;
            double val = std::stod(str, &pos);
            if (pos == str.size()) {
                return val;
            }
        } catch (const std::out_of_range&) {
            // Fall through to raw string
        }
    }

    // Raw String (fallback)
    return str;
}

} // namespace dedupe
