/**
 * @file Loader.hpp
 * @brief Document loading
 *
 * Implements loading document trees from:
 * - YAML files (using yaml-cpp)
 * - JSON files (using nlohmann::json)
 * - TOML files (using toml++)
 *
 * Every loader returns a mapping: an empty document yields an empty
 * mapping, and a document whose top level is not a mapping is rejected
 * with ParseError.
 */

#ifndef DEDUPE_LOADER_HPP
#define DEDUPE_LOADER_HPP

#include "dedupe/Value.hpp"
#include <string>

namespace dedupe {

/**
 * @brief On-disk document formats
 */
enum class DocumentFormat {
    yaml,
    json,
    toml
};

/**
 * @brief Get file extension (lowercase).
 *
 * @param path File path
 * @return Extension including the dot (e.g., ".yaml"), or empty if none
 */
std::string get_file_extension(const std::string& path);

/**
 * @brief Pick the document format from the file extension.
 *
 * ".json" -> JSON, ".toml" -> TOML, anything else (".yaml", ".yml",
 * no extension, ...) -> YAML.
 */
DocumentFormat detect_format(const std::string& path);

// ============================================================================
// YAML
// ============================================================================

/**
 * @brief Parse YAML text into a mapping.
 *
 * Quoted scalars and scalars tagged !!str stay strings; plain scalars
 * are typed by parse_scalar(). Mapping keys are always strings.
 *
 * @param text YAML document text
 * @param source Name used in error messages
 * @return Parsed mapping
 * @throws ParseError on YAML syntax errors, non-scalar keys, or a
 *         non-mapping top level
 */
Value load_yaml_string(const std::string& text, const std::string& source = "<string>");

/**
 * @brief Load a YAML file.
 *
 * @param path Path to the YAML file
 * @return Parsed mapping
 * @throws IOError if the file doesn't exist or can't be read
 * @throws ParseError if the YAML is invalid or not a mapping
 */
Value load_yaml_file(const std::string& path);

// ============================================================================
// JSON
// ============================================================================

/**
 * @brief Load a JSON file.
 *
 * Object key order is kept as written.
 *
 * @throws IOError if the file doesn't exist or can't be read
 * @throws ParseError if JSON syntax is invalid or not an object
 */
Value load_json_file(const std::string& path);

// ============================================================================
// TOML
// ============================================================================

/**
 * @brief Load a TOML file.
 *
 * Tables map to nested mappings; dates and times become strings.
 * toml++ keeps table keys sorted, so the loaded key order is sorted.
 *
 * @throws IOError if the file doesn't exist
 * @throws ParseError if TOML syntax is invalid
 */
Value load_toml_file(const std::string& path);

// ============================================================================
// Auto-detect
// ============================================================================

/**
 * @brief Load a document, choosing the parser by extension.
 *
 * @param path Path to the document
 * @return Parsed mapping
 * @throws IOError if the file doesn't exist or can't be read
 * @throws ParseError if the document is malformed
 */
Value load_document(const std::string& path);

} // namespace dedupe

#endif // DEDUPE_LOADER_HPP
