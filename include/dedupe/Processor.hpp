/**
 * @file Processor.hpp
 * @brief Batch run: load -> (intersect | merge references) -> subtract -> clean -> save
 *
 * Two modes, exactly one per run:
 * - Common mode: the intersection of all target documents is removed from
 *   each target and written to its own file.
 * - Reference mode: the deep merge of the reference documents is removed
 *   from each target.
 */

#ifndef DEDUPE_PROCESSOR_HPP
#define DEDUPE_PROCESSOR_HPP

#include "dedupe/Logger.hpp"
#include "dedupe/Store.hpp"
#include "dedupe/Value.hpp"

#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace dedupe {

/**
 * @brief Options for one processor run.
 */
struct ProcessorOptions {
    std::vector<std::string> files;                          // target documents
    std::optional<std::string> common_file;                  // common mode output
    std::optional<std::vector<std::string>> reference_files; // reference mode inputs
    bool dry_run = false;
    bool backup = false;

    /**
     * @brief Check that exactly one mode is selected and inputs are present
     * @throws ConfigurationError otherwise
     */
    void validate() const;

    bool reference_mode() const noexcept { return reference_files.has_value(); }
};

/**
 * @brief Outcome of a run that reached the end.
 */
struct RunReport {
    std::vector<std::string> processed; // saved (or would be, in dry-run)
    std::vector<std::string> skipped;   // failed to load, left out of the run
    std::vector<std::string> failed;    // backup or save failed

    bool ok() const noexcept { return failed.empty(); }
};

/**
 * @brief Runs one deduplication batch against a DocumentStore.
 *
 * Fatal conditions throw and leave the remaining stages unrun:
 * - ConfigurationError: invalid options, thrown before any store call
 * - DedupeError: none of the target documents could be loaded
 * - ParseError / IOError: a reference document could not be loaded
 *
 * Per-target backup or save failures are logged and recorded in the
 * returned report; the remaining targets are still processed.
 */
class Processor {
public:
    Processor(ProcessorOptions options, DocumentStore& store, Logger& logger)
        : options_(std::move(options)), store_(store), logger_(logger) {}

    RunReport run();

    const ProcessorOptions& options() const noexcept { return options_; }

private:
    using LoadedDocument = std::pair<std::string, Value>;

    std::vector<LoadedDocument> load_targets(RunReport& report);
    Value merge_references();
    void process_target(const std::string& path, Value& doc,
                        const Value& shared, RunReport& report);

    ProcessorOptions options_;
    DocumentStore& store_;
    Logger& logger_;
};

} // namespace dedupe

#endif // DEDUPE_PROCESSOR_HPP
