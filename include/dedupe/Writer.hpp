/**
 * @file Writer.hpp
 * @brief Document serialization and backup copies
 *
 * Serializes document trees back to:
 * - YAML (block style, 2-space indent, using yaml-cpp)
 * - JSON (2-space indent, using nlohmann::json)
 * - TOML (using toml++)
 *
 * Output keeps mapping key order, sequence order and scalar values.
 * Comments and formatting of the source file are not preserved.
 */

#ifndef DEDUPE_WRITER_HPP
#define DEDUPE_WRITER_HPP

#include "dedupe/Loader.hpp"
#include "dedupe/Value.hpp"
#include <string>

namespace dedupe {

/**
 * @brief Render a tree as YAML text.
 *
 * Strings that would read back as another type ("true", "42", "~", "")
 * are double-quoted; floats always carry a fraction or exponent so they
 * read back as floats.
 */
std::string to_yaml_string(const Value& doc);

/**
 * @brief Render a tree as JSON text with 2-space indent.
 */
std::string to_json_string(const Value& doc, int indent = 2);

/**
 * @brief Render a mapping as TOML text.
 *
 * TOML has no null: nulls are written as empty strings.
 *
 * @throws DedupeError if doc is not a mapping
 */
std::string to_toml_string(const Value& doc);

/**
 * @brief Render a tree in the given format.
 */
std::string to_string(const Value& doc, DocumentFormat format);

/**
 * @brief Write a document, choosing the format by extension.
 *
 * @param path Destination path (truncated if it exists)
 * @param doc Tree to write
 * @throws IOError if the file can't be opened or written
 */
void write_document(const std::string& path, const Value& doc);

/**
 * @brief Path of the backup copy for a document ("<path>.bak").
 */
std::string backup_path_for(const std::string& path);

/**
 * @brief Copy a document to its backup path, replacing an older backup.
 *
 * @param path Document to copy
 * @return Path of the backup written
 * @throws IOError if the copy fails
 */
std::string backup_file(const std::string& path);

} // namespace dedupe

#endif // DEDUPE_WRITER_HPP
