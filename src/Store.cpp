/**
 * @file Store.cpp
 * @brief File-system DocumentStore
 */

#include "dedupe/Store.hpp"
#include "dedupe/Loader.hpp"
#include "dedupe/Writer.hpp"

namespace dedupe {

Value FileStore::load(const std::string& path) {
    return load_document(path);
}

void FileStore::save(const std::string& path, const Value& doc) {
    if (dry_run_) {
        logger_.info("Dry-run: Changes to " + path + " would be written.");
        return;
    }
    write_document(path, doc);
    logger_.info("File saved: " + path);
}

void FileStore::backup(const std::string& path) {
    if (dry_run_) {
        logger_.info("Dry-run: Backup from " + path + " to " +
                     backup_path_for(path) + " would be created.");
        return;
    }
    const std::string backup_path = backup_file(path);
    logger_.info("Backup created: " + backup_path);
}

} // namespace dedupe
