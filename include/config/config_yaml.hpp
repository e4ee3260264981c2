#pragma once

#include "config/Config.hpp"

#include <stdexcept>
#include <string>
#include <yaml-cpp/yaml.h>

namespace YAML {

using namespace fc::config;

static std::string to_std_string(const spdlog::string_view_t sv) { return {sv.data(), sv.size()}; }

// spdlog maps anything it does not know to "off", which would silently mute a logger.
static spdlog::level::level_enum parse_level(const Node& node, const std::string& def) {
    const auto str = node.as<std::string>(def);
    const auto lvl = spdlog::level::from_str(str);
    if (lvl == spdlog::level::off && str != "off")
        throw std::invalid_argument("Unknown log level: " + str);
    return lvl;
}

template<>
struct convert<MergeConfig> {
    static Node encode(const MergeConfig& rhs) {
        Node node;
        node["destination"] = rhs.destination.string();
        for (const auto& src : rhs.sources) node["sources"].push_back(src.string());
        return node;
    }

    static bool decode(const Node& node, MergeConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.destination = node["destination"].as<std::string>("");
        rhs.sources.clear();
        if (const auto sources = node["sources"]) {
            if (!sources.IsSequence()) return false;
            for (const auto& src : sources) rhs.sources.emplace_back(src.as<std::string>());
        }
        return true;
    }
};

template<>
struct convert<CleanupConfig> {
    static Node encode(const CleanupConfig& rhs) {
        Node node;
        node["enabled"] = rhs.enabled;
        node["include_root"] = rhs.include_root;
        return node;
    }

    static bool decode(const Node& node, CleanupConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.enabled = node["enabled"].as<bool>(true);
        rhs.include_root = node["include_root"].as<bool>(false);
        return true;
    }
};

template<>
struct convert<HashingConfig> {
    static Node encode(const HashingConfig& rhs) {
        Node node;
        node["chunk_size"] = rhs.chunk_size;
        return node;
    }

    static bool decode(const Node& node, HashingConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.chunk_size = node["chunk_size"].as<std::size_t>(fc::crypto::hash::DEFAULT_CHUNK_SIZE);
        if (rhs.chunk_size == 0) throw std::invalid_argument("hashing.chunk_size must be greater than zero");
        return true;
    }
};

template<>
struct convert<SubsystemLogLevelsConfig> {
    static Node encode(const SubsystemLogLevelsConfig& rhs) {
        Node node;
        node["consolidator"] = to_std_string(spdlog::level::to_string_view(rhs.consolidator));
        node["merge"]        = to_std_string(spdlog::level::to_string_view(rhs.merge));
        node["prune"]        = to_std_string(spdlog::level::to_string_view(rhs.prune));
        node["fs"]           = to_std_string(spdlog::level::to_string_view(rhs.fs));
        return node;
    }

    static bool decode(const Node& node, SubsystemLogLevelsConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.consolidator = parse_level(node["consolidator"], "info");
        rhs.merge = parse_level(node["merge"], "info");
        rhs.prune = parse_level(node["prune"], "info");
        rhs.fs = parse_level(node["fs"], "warn");
        return true;
    }
};

template<>
struct convert<LogLevelsConfig> {
    static Node encode(const LogLevelsConfig& rhs) {
        Node node;
        node["console_log_level"] = to_std_string(spdlog::level::to_string_view(rhs.console_log_level));
        node["file_log_level"]    = to_std_string(spdlog::level::to_string_view(rhs.file_log_level));
        node["subsystem_levels"]  = rhs.subsystem_levels;
        return node;
    }

    static bool decode(const Node& node, LogLevelsConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.console_log_level = parse_level(node["console_log_level"], "info");
        rhs.file_log_level = parse_level(node["file_log_level"], "debug");
        if (const auto sub = node["subsystem_levels"]) rhs.subsystem_levels = sub.as<SubsystemLogLevelsConfig>();
        return true;
    }
};

// Levels sit directly under logging: in the file, LoggingConfig nests them for the code.
template<>
struct convert<LoggingConfig> {
    static Node encode(const LoggingConfig& rhs) {
        Node node = convert<LogLevelsConfig>::encode(rhs.levels);
        node["log_file"] = rhs.log_file.string();
        node["journal_to_console"] = rhs.journal_to_console;
        return node;
    }

    static bool decode(const Node& node, LoggingConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.log_file = node["log_file"].as<std::string>("");
        rhs.journal_to_console = node["journal_to_console"].as<bool>(false);
        return convert<LogLevelsConfig>::decode(node, rhs.levels);
    }
};

template<>
struct convert<ReportConfig> {
    static Node encode(const ReportConfig& rhs) {
        Node node;
        node["path"] = rhs.path.string();
        return node;
    }

    static bool decode(const Node& node, ReportConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.path = node["path"].as<std::string>("");
        return true;
    }
};

}
