#include <iostream>
#include <memory>
#include <string>
#include "dedupe/Cli.hpp"
#include "dedupe/Errors.hpp"
#include "dedupe/Logger.hpp"
#include "dedupe/Processor.hpp"
#include "dedupe/Store.hpp"

using namespace dedupe;

int main(int argc, char** argv) {
    CommandLine cli;
    try {
        cli = parse_command_line(argc, argv);
    } catch (const ConfigurationError& ex) {
        std::cerr << "Error: " << ex.what() << "\n" << usage() << "\n";
        return 1;
    }

    if (cli.help) {
        std::cout << usage() << "\n";
        return 0;
    }

    std::unique_ptr<Logger> logger;
    if (cli.quiet) {
        logger = std::make_unique<NullLogger>();
    } else {
        init_console_logging();
        logger = std::make_unique<BoostLogger>();
    }

    try {
        FileStore store(*logger, cli.options.dry_run);
        Processor processor(std::move(cli.options), store, *logger);
        RunReport report = processor.run();
        for (const auto& path : report.failed) {
            logger->error("Not updated: " + path);
        }
        return 0;
    } catch (const std::exception& ex) {
        logger->critical(std::string("A critical error occurred: ") + ex.what());
        if (cli.quiet) {
            std::cerr << "Error: " << ex.what() << "\n";
        }
        return 1;
    }
}
