#include <gtest/gtest.h>
#include "config/Config.hpp"
#include "config/config_yaml.hpp"
#include "TreeFixture.hpp"

#include <filesystem>
#include <stdexcept>
#include <string>
#include <yaml-cpp/yaml.h>

namespace fs = std::filesystem;
using namespace fc::config;
using namespace fc::test;

class ConfigTest : public TreeFixture {};

TEST_F(ConfigTest, EmptyDocumentGivesDefaults) {
    const auto cfg = parseConfig("");

    EXPECT_TRUE(cfg.merge.destination.empty());
    EXPECT_TRUE(cfg.merge.sources.empty());
    EXPECT_TRUE(cfg.cleanup.enabled);
    EXPECT_FALSE(cfg.cleanup.include_root);
    EXPECT_EQ(cfg.hashing.chunk_size, 8192u);
    EXPECT_EQ(cfg.logging.levels.console_log_level, spdlog::level::info);
    EXPECT_EQ(cfg.logging.levels.file_log_level, spdlog::level::debug);
    EXPECT_EQ(cfg.logging.levels.subsystem_levels.fs, spdlog::level::warn);
    EXPECT_TRUE(cfg.report.path.empty());
}

TEST_F(ConfigTest, ParsesFullDocument) {
    const auto cfg = parseConfig(R"(
destination: /data/master
sources:
  - /mnt/old_laptop
  - /mnt/usb stick
cleanup:
  enabled: false
  include_root: true
hashing:
  chunk_size: 65536
logging:
  log_file: /var/log/consolidate.log
  console_log_level: warn
  file_log_level: trace
  subsystem_levels:
    merge: debug
    fs: error
report:
  path: /tmp/report.json
)");

    EXPECT_EQ(cfg.merge.destination, "/data/master");
    ASSERT_EQ(cfg.merge.sources.size(), 2u);
    EXPECT_EQ(cfg.merge.sources[0], "/mnt/old_laptop");
    EXPECT_EQ(cfg.merge.sources[1], "/mnt/usb stick");
    EXPECT_FALSE(cfg.cleanup.enabled);
    EXPECT_TRUE(cfg.cleanup.include_root);
    EXPECT_EQ(cfg.hashing.chunk_size, 65536u);
    EXPECT_EQ(cfg.logging.log_file, "/var/log/consolidate.log");
    EXPECT_EQ(cfg.logging.levels.console_log_level, spdlog::level::warn);
    EXPECT_EQ(cfg.logging.levels.file_log_level, spdlog::level::trace);
    EXPECT_EQ(cfg.logging.levels.subsystem_levels.merge, spdlog::level::debug);
    EXPECT_EQ(cfg.logging.levels.subsystem_levels.fs, spdlog::level::err);
    EXPECT_EQ(cfg.logging.levels.subsystem_levels.consolidator, spdlog::level::info);
    EXPECT_EQ(cfg.report.path, "/tmp/report.json");
}

TEST_F(ConfigTest, LoadsFromFile) {
    writeFile(root / "consolidator.yaml", "destination: " + (root / "out").string() + "\nsources: [" +
                                          (root / "in").string() + "]\n");

    const auto cfg = loadConfig(root / "consolidator.yaml");
    EXPECT_EQ(cfg.merge.destination, root / "out");
    ASSERT_EQ(cfg.merge.sources.size(), 1u);
    EXPECT_NO_THROW(cfg.validate());
}

TEST_F(ConfigTest, MissingFileThrows) {
    EXPECT_THROW(loadConfig(root / "nope.yaml"), YAML::BadFile);
}

TEST_F(ConfigTest, RejectsMalformedValues) {
    EXPECT_THROW(parseConfig("- just\n- a list\n"), std::invalid_argument);
    EXPECT_THROW(parseConfig("destination: /x\nsources: /not/a/list\n"), std::invalid_argument);
    EXPECT_THROW(parseConfig("hashing:\n  chunk_size: 0\n"), std::invalid_argument);
    EXPECT_THROW(parseConfig("logging:\n  console_log_level: loud\n"), std::invalid_argument);
}

TEST_F(ConfigTest, SectionsMustBeMappings) {
    const std::string base = "destination: /d\nsources: [/a]\n";
    EXPECT_THROW(parseConfig(base + "cleanup: false\n"), std::invalid_argument);
    EXPECT_THROW(parseConfig(base + "hashing: 0\n"), std::invalid_argument);
    EXPECT_THROW(parseConfig(base + "logging: verbose\n"), std::invalid_argument);
    EXPECT_THROW(parseConfig(base + "report: out.json\n"), std::invalid_argument);
    EXPECT_NO_THROW(parseConfig(base + "cleanup:\n  enabled: false\n"));
}

TEST_F(ConfigTest, ValidateNeedsDestinationAndSources) {
    Config cfg;
    EXPECT_THROW(cfg.validate(), std::invalid_argument);

    cfg.merge.destination = "/m";
    EXPECT_THROW(cfg.validate(), std::invalid_argument);

    cfg.merge.sources = {"/a"};
    EXPECT_NO_THROW(cfg.validate());

    cfg.hashing.chunk_size = 0;
    EXPECT_THROW(cfg.validate(), std::invalid_argument);
}

TEST_F(ConfigTest, LogFileDefaultsIntoDestination) {
    Config cfg;
    cfg.merge.destination = "/data/master";
    EXPECT_EQ(cfg.resolvedLogFile(), fs::path("/data/master/consolidation_log.txt"));

    cfg.logging.log_file = "/elsewhere.log";
    EXPECT_EQ(cfg.resolvedLogFile(), fs::path("/elsewhere.log"));
}

TEST_F(ConfigTest, LoggingEncodesFlat) {
    LoggingConfig logging;
    logging.levels.console_log_level = spdlog::level::warn;

    const YAML::Node node = YAML::convert<LoggingConfig>::encode(logging);
    EXPECT_EQ(node["console_log_level"].as<std::string>(), "warning");

    LoggingConfig back;
    ASSERT_TRUE(YAML::convert<LoggingConfig>::decode(node, back));
    EXPECT_EQ(back.levels.console_log_level, spdlog::level::warn);
}
