#include "config/Config.hpp"
#include "config/config_yaml.hpp"

#include <stdexcept>
#include <yaml-cpp/yaml.h>

namespace fc::config {

static Config fromNode(const YAML::Node& root) {
    Config cfg;
    if (!root || root.IsNull()) return cfg;
    if (!root.IsMap()) throw std::invalid_argument("Configuration root must be a mapping");

    if (!YAML::convert<MergeConfig>::decode(root, cfg.merge))
        throw std::invalid_argument("'sources' must be a list of directories");

    if (auto node = root["cleanup"]; node && !YAML::convert<CleanupConfig>::decode(node, cfg.cleanup))
        throw std::invalid_argument("'cleanup' must be a mapping");
    if (auto node = root["hashing"]; node && !YAML::convert<HashingConfig>::decode(node, cfg.hashing))
        throw std::invalid_argument("'hashing' must be a mapping");
    if (auto node = root["logging"]; node && !YAML::convert<LoggingConfig>::decode(node, cfg.logging))
        throw std::invalid_argument("'logging' must be a mapping");
    if (auto node = root["report"]; node && !YAML::convert<ReportConfig>::decode(node, cfg.report))
        throw std::invalid_argument("'report' must be a mapping");

    return cfg;
}

Config loadConfig(const std::filesystem::path& path) {
    return fromNode(YAML::LoadFile(path.string()));
}

Config parseConfig(const std::string& yaml) {
    return fromNode(YAML::Load(yaml));
}

void Config::validate() const {
    if (merge.destination.empty())
        throw std::invalid_argument("No destination folder configured");
    if (merge.sources.empty())
        throw std::invalid_argument("No source folders configured");
    if (hashing.chunk_size == 0)
        throw std::invalid_argument("hashing.chunk_size must be greater than zero");
}

std::filesystem::path Config::resolvedLogFile() const {
    if (!logging.log_file.empty()) return logging.log_file;
    return merge.destination / DEFAULT_LOG_FILE_NAME;
}

}
