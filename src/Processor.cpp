/**
 * @file Processor.cpp
 * @brief Implementation of the batch run
 */

#include "dedupe/Processor.hpp"
#include "dedupe/Clean.hpp"
#include "dedupe/Errors.hpp"
#include "dedupe/Intersect.hpp"
#include "dedupe/Merge.hpp"
#include "dedupe/Subtract.hpp"

namespace dedupe {

void ProcessorOptions::validate() const {
    if (common_file.has_value() && reference_files.has_value()) {
        throw ConfigurationError(
            "the common and reference options are mutually exclusive; use only one");
    }
    if (!common_file.has_value() && !reference_files.has_value()) {
        throw ConfigurationError("either a common file or reference files must be given");
    }
    if (files.empty()) {
        throw ConfigurationError("no files to process");
    }
    if (common_file.has_value() && common_file->empty()) {
        throw ConfigurationError("common file path is empty");
    }
    if (reference_files.has_value() && reference_files->empty()) {
        throw ConfigurationError("reference file list is empty");
    }
}

RunReport Processor::run() {
    options_.validate();

    RunReport report;
    std::vector<LoadedDocument> targets = load_targets(report);

    if (options_.reference_mode()) {
        const Value reference = merge_references();
        logger_.info("Merged reference definitions created.");

        for (auto& [path, doc] : targets) {
            process_target(path, doc, reference, report);
        }
        logger_.info("Removal of keys based on merged reference files completed.");
    } else {
        std::vector<Value> docs;
        docs.reserve(targets.size());
        for (const auto& target : targets) {
            docs.push_back(target.second);
        }
        const Value common = intersect(docs);
        logger_.info("Common definitions determined.");

        for (auto& [path, doc] : targets) {
            process_target(path, doc, common, report);
        }

        try {
            store_.save(*options_.common_file, common);
        } catch (const IOError& e) {
            logger_.error("Error saving common file " + *options_.common_file + ": " + e.what());
            report.failed.push_back(*options_.common_file);
        }
        logger_.info("Processing and extraction of common values completed.");
    }

    if (!report.ok() || !report.skipped.empty()) {
        logger_.warning("Finished with " + std::to_string(report.processed.size()) +
                        " processed, " + std::to_string(report.skipped.size()) +
                        " skipped, " + std::to_string(report.failed.size()) + " failed.");
    }
    return report;
}

std::vector<Processor::LoadedDocument> Processor::load_targets(RunReport& report) {
    std::vector<LoadedDocument> targets;
    targets.reserve(options_.files.size());

    for (const auto& path : options_.files) {
        logger_.info("Loading file: " + path);
        try {
            targets.emplace_back(path, store_.load(path));
        } catch (const ParseError& e) {
            logger_.error("Skipping file " + path + " due to an error: " + e.what());
            report.skipped.push_back(path);
        } catch (const IOError& e) {
            logger_.error("Skipping file " + path + " due to an error: " + e.what());
            report.skipped.push_back(path);
        }
    }

    if (targets.empty()) {
        logger_.error("No files were successfully loaded. Exiting.");
        throw DedupeError("No files were successfully loaded");
    }
    return targets;
}

Value Processor::merge_references() {
    std::vector<Value> references;
    references.reserve(options_.reference_files->size());

    for (const auto& path : *options_.reference_files) {
        logger_.info("Loading reference file: " + path);
        try {
            references.push_back(store_.load(path));
        } catch (const DedupeError& e) {
            logger_.error("Error loading reference file " + path + ": " + e.what());
            throw;
        }
    }
    return deep_merge_all(references);
}

void Processor::process_target(const std::string& path, Value& doc,
                               const Value& shared, RunReport& report) {
    try {
        if (options_.backup) {
            store_.backup(path);
        }
        subtract(doc, shared);
        clean(doc);
        store_.save(path, doc);
        report.processed.push_back(path);
    } catch (const IOError& e) {
        logger_.error("Error writing file " + path + ": " + e.what());
        report.failed.push_back(path);
    }
}

} // namespace dedupe
