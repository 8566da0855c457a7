/**
 * @file Loader.cpp
 * @brief Document loading implementation
 *
 * Implements file loading for:
 * - YAML files (using yaml-cpp)
 * - JSON files (using nlohmann::json)
 * - TOML files (using toml++)
 */

#include "dedupe/Loader.hpp"
#include "dedupe/Errors.hpp"
#include "dedupe/Parse.hpp"

#include <nlohmann/json.hpp>
#include <toml++/toml.hpp>
#include <yaml-cpp/yaml.h>

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <sstream>

namespace fs = std::filesystem;

namespace dedupe {

// ============================================================================
// Utility functions
// ============================================================================

namespace {

/**
 * @brief Convert string to lowercase.
 */
std::string to_lower(const std::string& s) {
    std::string result = s;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    return result;
}

/**
 * @brief Check whether text holds nothing but whitespace.
 */
bool is_blank(const std::string& s) {
    return std::all_of(s.begin(), s.end(),
                       [](unsigned char c) { return std::isspace(c); });
}

/**
 * @brief Check if file exists.
 */
bool file_exists(const std::string& path) {
    std::error_code ec;
    return fs::exists(path, ec) && fs::is_regular_file(path, ec);
}

/**
 * @brief Read entire file into string.
 */
std::string read_file(const std::string& path) {
    if (!file_exists(path)) {
        throw IOError(path, "file not found");
    }

    std::ifstream file(path, std::ios::binary);
    if (!file) {
        throw IOError(path, "cannot open for reading");
    }

    std::ostringstream ss;
    ss << file.rdbuf();
    if (file.bad()) {
        throw IOError(path, "read failed");
    }
    return ss.str();
}

/**
 * @brief Documents must be mappings; a missing document is an empty one.
 */
Value require_mapping(Value doc, const std::string& source) {
    if (doc.is_null()) {
        return Value::object();
    }
    if (!doc.is_object()) {
        throw ParseError(source, "top-level value must be a mapping, got " + type_name(doc));
    }
    return doc;
}

/**
 * @brief Convert a yaml-cpp node to a Value.
 */
Value yaml_node_to_value(const YAML::Node& node, const std::string& source) {
    switch (node.Type()) {
        case YAML::NodeType::Undefined:
        case YAML::NodeType::Null:
            return Value(nullptr);

        case YAML::NodeType::Scalar: {
            const std::string& tag = node.Tag();
            // "!" marks a quoted (non-plain) scalar
            if (tag == "!" || tag == "tag:yaml.org,2002:str") {
                return Value(node.Scalar());
            }
            return parse_scalar(node.Scalar());
        }

        case YAML::NodeType::Sequence: {
            Value arr = Value::array();
            for (YAML::const_iterator it = node.begin(); it != node.end(); ++it) {
                arr.push_back(yaml_node_to_value(*it, source));
            }
            return arr;
        }

        case YAML::NodeType::Map: {
            Value obj = Value::object();
            for (YAML::const_iterator it = node.begin(); it != node.end(); ++it) {
                if (!it->first.IsScalar()) {
                    throw ParseError(source, "mapping keys must be scalars (line " +
                                     std::to_string(it->first.Mark().line + 1) + ")");
                }
                obj[it->first.Scalar()] = yaml_node_to_value(it->second, source);
            }
            return obj;
        }
    }
    return Value(nullptr);
}

/**
 * @brief Convert toml++ node to a Value.
 */
Value toml_node_to_value(const toml::node& node) {
    switch (node.type()) {
        case toml::node_type::string:
            return Value(node.as_string()->get());

        case toml::node_type::integer:
            return Value(node.as_integer()->get());

        case toml::node_type::floating_point:
            return Value(node.as_floating_point()->get());

        case toml::node_type::boolean:
            return Value(node.as_boolean()->get());

        case toml::node_type::date: {
            std::ostringstream ss;
            ss << node.as_date()->get();
            return Value(ss.str());
        }

        case toml::node_type::time: {
            std::ostringstream ss;
            ss << node.as_time()->get();
            return Value(ss.str());
        }

        case toml::node_type::date_time: {
            std::ostringstream ss;
            ss << node.as_date_time()->get();
            return Value(ss.str());
        }

        case toml::node_type::array: {
            Value arr = Value::array();
            for (const auto& elem : *node.as_array()) {
                arr.push_back(toml_node_to_value(elem));
            }
            return arr;
        }

        case toml::node_type::table: {
            Value obj = Value::object();
            for (const auto& [key, val] : *node.as_table()) {
                obj[std::string(key.str())] = toml_node_to_value(val);
            }
            return obj;
        }

        default:
            return Value(nullptr);
    }
}

} // anonymous namespace

std::string get_file_extension(const std::string& path) {
    fs::path p(path);
    return to_lower(p.extension().string());
}

DocumentFormat detect_format(const std::string& path) {
    const std::string ext = get_file_extension(path);
    if (ext == ".json") return DocumentFormat::json;
    if (ext == ".toml") return DocumentFormat::toml;
    return DocumentFormat::yaml;
}

// ============================================================================
// YAML
// ============================================================================

Value load_yaml_string(const std::string& text, const std::string& source) {
    YAML::Node root;
    try {
        root = YAML::Load(text);
    } catch (const YAML::Exception& e) {
        throw ParseError(source, e.what());
    }
    return require_mapping(yaml_node_to_value(root, source), source);
}

Value load_yaml_file(const std::string& path) {
    return load_yaml_string(read_file(path), path);
}

// ============================================================================
// JSON
// ============================================================================

Value load_json_file(const std::string& path) {
    std::string content = read_file(path);
    if (is_blank(content)) {
        return Value::object();
    }

    try {
        return require_mapping(Value::parse(content), path);
    } catch (const nlohmann::json::exception& e) {
        throw ParseError(path, e.what());
    }
}

// ============================================================================
// TOML
// ============================================================================

Value load_toml_file(const std::string& path) {
    std::string content = read_file(path);

    toml::table table;
    try {
        table = toml::parse(content, path);
    } catch (const toml::parse_error& e) {
        std::ostringstream details;
        details << e.description() << " (line " << e.source().begin.line
                << ", column " << e.source().begin.column << ")";
        throw ParseError(path, details.str());
    }

    return toml_node_to_value(table);
}

// ============================================================================
// Auto-detect
// ============================================================================

Value load_document(const std::string& path) {
    switch (detect_format(path)) {
        case DocumentFormat::json:
            return load_json_file(path);
        case DocumentFormat::toml:
            return load_toml_file(path);
        case DocumentFormat::yaml:
            break;
    }
    return load_yaml_file(path);
}

} // namespace dedupe
