#include <gtest/gtest.h>
#include <filesystem>
#include <iostream>
#include <unistd.h>

#include "config/Config.hpp"
#include "log/Registry.hpp"

namespace fs = std::filesystem;

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);

    try {
        fc::config::LoggingConfig logging;
        logging.levels.console_log_level = spdlog::level::err;
        logging.levels.subsystem_levels.fs = spdlog::level::debug;

        const auto logFile = fs::temp_directory_path() / ("fc_unit_tests_" + std::to_string(::getpid()) + ".log");
        fc::log::Registry::init(logging, logFile);
    } catch (const std::exception& e) {
        std::cerr << "Failed to initialize test environment: " << e.what() << std::endl;
        return 1;
    }

    const int rc = RUN_ALL_TESTS();
    fc::log::Registry::shutdown();
    return rc;
}
