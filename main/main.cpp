#include "cli/Args.hpp"
#include "config/Config.hpp"
#include "log/Registry.hpp"
#include "runtime/Runner.hpp"
#include "runtime/SignalScope.hpp"

#include <exception>
#include <filesystem>
#include <iostream>
#include <string>
#include <vector>
#include <yaml-cpp/yaml.h>

using namespace fc;

int main(const int argc, char** argv) {
    const std::string program = argc > 0 ? std::filesystem::path(argv[0]).filename().string() : "fc-consolidate";
    const std::vector<std::string> args(argv + 1, argv + argc);

    const auto parsed = cli::parseArgs(args);
    if (!parsed.ok) {
        std::cerr << program << ": " << parsed.error << "\n\n" << cli::usage(program);
        return cli::EXIT_USAGE;
    }
    if (parsed.options.help) {
        std::cout << cli::usage(program);
        return cli::EXIT_OK;
    }

    config::Config cfg;
    try {
        cfg = cli::resolveConfig(parsed.options);
        cfg.validate();
    } catch (const YAML::Exception& e) {
        std::cerr << program << ": invalid configuration: " << e.what() << std::endl;
        return cli::EXIT_USAGE;
    } catch (const std::exception& e) {
        std::cerr << program << ": " << e.what() << std::endl;
        return cli::EXIT_USAGE;
    }

    try {
        log::Registry::init(cfg.logging, cfg.resolvedLogFile());
    } catch (const std::exception& e) {
        std::cerr << program << ": failed to set up logging: " << e.what() << std::endl;
        return cli::EXIT_USAGE;
    }

    try {
        runtime::Runner runner(cfg, cli::resolveMode(parsed.options));
        const auto report = [&] {
            runtime::SignalScope signals(runner);
            return runner.run();
        }();

        int rc = report.totalErrors() > 0 ? cli::EXIT_WITH_ERRORS : cli::EXIT_OK;

        if (!cfg.report.path.empty()) {
            try {
                runtime::Runner::writeReport(report, cfg.report.path);
                log::Registry::consolidator()->info("Report written to {}", cfg.report.path.string());
            } catch (const std::exception& e) {
                log::Registry::consolidator()->error("Could not write report: {}", e.what());
                rc = cli::EXIT_WITH_ERRORS;
            }
        }

        if (report.interrupted) rc = cli::EXIT_INTERRUPTED;
        log::Registry::shutdown();
        return rc;
    } catch (const std::exception& e) {
        log::Registry::consolidator()->critical("FATAL ERROR: {}", e.what());
        log::Registry::shutdown();
        return cli::EXIT_USAGE;
    }
}
