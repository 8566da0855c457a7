/**
 * @file Store.hpp
 * @brief Document load/save/backup capability used by the processor
 */

#ifndef DEDUPE_STORE_HPP
#define DEDUPE_STORE_HPP

#include "dedupe/Logger.hpp"
#include "dedupe/Value.hpp"

#include <string>

namespace dedupe {

/**
 * @brief Where documents come from and go to
 *
 * The processor only talks to documents through this interface, so runs
 * can be driven against an in-memory store in tests.
 */
class DocumentStore {
public:
    virtual ~DocumentStore() = default;

    /**
     * @brief Load a document as a mapping
     * @throws ParseError if the document is malformed
     * @throws IOError if it can't be read
     */
    virtual Value load(const std::string& path) = 0;

    /**
     * @brief Persist a document
     * @throws IOError on write failure
     */
    virtual void save(const std::string& path, const Value& doc) = 0;

    /**
     * @brief Copy a document aside before it is rewritten
     * @throws IOError on copy failure
     */
    virtual void backup(const std::string& path) = 0;
};

/**
 * @brief DocumentStore over the local file system
 *
 * Format follows the file extension (see detect_format()). With
 * @p dry_run set, save() and backup() only log what they would do;
 * load() always reads.
 */
class FileStore : public DocumentStore {
public:
    FileStore(Logger& logger, bool dry_run)
        : logger_(logger), dry_run_(dry_run) {}

    Value load(const std::string& path) override;
    void save(const std::string& path, const Value& doc) override;
    void backup(const std::string& path) override;

    bool dry_run() const noexcept { return dry_run_; }

private:
    Logger& logger_;
    bool dry_run_;
};

} // namespace dedupe

#endif // DEDUPE_STORE_HPP
