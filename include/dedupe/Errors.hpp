/**
 * @file Errors.hpp
 * @brief Exception types for dedupe runs
 *
 * Error taxonomy:
 * - DedupeError: Base class, also raised for fatal batch failures
 * - ConfigurationError: Invalid run options (e.g. both common and reference)
 * - ParseError: Malformed document or non-mapping top level
 * - IOError: Read, write or copy failure
 */

#ifndef DEDUPE_ERRORS_HPP
#define DEDUPE_ERRORS_HPP

#include <stdexcept>
#include <string>

namespace dedupe {

/**
 * @brief Base class for all dedupe exceptions
 */
class DedupeError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * @brief Run options are inconsistent
 *
 * Always fatal; raised before any document is touched.
 */
class ConfigurationError : public DedupeError {
public:
    explicit ConfigurationError(const std::string& msg)
        : DedupeError("Configuration error: " + msg)
    {}
};

/**
 * @brief Document parse error (YAML/JSON/TOML syntax, or wrong top-level type)
 */
class ParseError : public DedupeError {
public:
    /**
     * @brief Construct with file path and error details
     * @param file Path to the file with parse error
     * @param details Detailed error message from parser
     */
    ParseError(std::string file, std::string details)
        : DedupeError("Parse error in '" + file + "': " + details)
        , file_(std::move(file))
        , details_(std::move(details))
    {}

    /**
     * @brief Get the file path with parse error
     */
    const std::string& file() const noexcept {
        return file_;
    }

    /**
     * @brief Get detailed error message
     */
    const std::string& details() const noexcept {
        return details_;
    }

private:
    std::string file_;
    std::string details_;
};

/**
 * @brief File system failure while reading, writing or copying a document
 */
class IOError : public DedupeError {
public:
    /**
     * @brief Construct with file path and error details
     * @param path Path of the file being accessed
     * @param details What failed (e.g. "cannot open for writing")
     */
    IOError(std::string path, std::string details)
        : DedupeError("I/O error on '" + path + "': " + details)
        , path_(std::move(path))
        , details_(std::move(details))
    {}

    /**
     * @brief Get the file path involved
     */
    const std::string& path() const noexcept {
        return path_;
    }

    const std::string& details() const noexcept {
        return details_;
    }

private:
    std::string path_;
    std::string details_;
};

} // namespace dedupe

#endif // DEDUPE_ERRORS_HPP
