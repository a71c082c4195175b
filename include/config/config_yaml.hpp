#pragma once

#include "config/Config.hpp"
#include <yaml-cpp/yaml.h>

namespace YAML {

using namespace pglo::config;

static std::string to_std_string(const spdlog::string_view_t sv) { return {sv.data(), sv.size()}; }

template<>
struct convert<DatabaseConfig> {
    static Node encode(const DatabaseConfig& rhs) {
        Node node;
        node["host"] = rhs.host;
        node["port"] = rhs.port;
        node["name"] = rhs.name;
        node["user"] = rhs.user;
        node["pool_size"] = rhs.pool_size;
        return node;
    }

    static bool decode(const Node& node, DatabaseConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.host = node["host"].as<std::string>("localhost");
        rhs.port = node["port"].as<uint16_t>(5432);
        rhs.name = node["name"].as<std::string>("pglo");
        rhs.user = node["user"].as<std::string>("pglo");
        rhs.password = node["password"].as<std::string>("");
        rhs.pool_size = node["pool_size"].as<unsigned int>(4);
        return true;
    }
};

template<>
struct convert<LargeObjectsConfig> {
    static Node encode(const LargeObjectsConfig& rhs) {
        Node node;
        node["buffer_size"] = rhs.buffer_size;
        node["transfer_buffer_size"] = rhs.transfer_buffer_size;
        node["timeout_seconds"] = rhs.timeout.count();
        node["savepoints"] = rhs.savepoints;
        return node;
    }

    static bool decode(const Node& node, LargeObjectsConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.buffer_size = node["buffer_size"].as<size_t>(1024 * 1024);
        rhs.transfer_buffer_size = node["transfer_buffer_size"].as<size_t>(64 * 1024);
        rhs.timeout = std::chrono::seconds(node["timeout_seconds"].as<long>(60));
        rhs.savepoints = node["savepoints"].as<bool>(false);
        return rhs.buffer_size > 0 && rhs.transfer_buffer_size > 0;
    }
};

template<>
struct convert<SubsystemLogLevelsConfig> {
    static Node encode(const SubsystemLogLevelsConfig& rhs) {
        Node node;
        node["pglo"]     = to_std_string(spdlog::level::to_string_view(rhs.pglo));
        node["db"]       = to_std_string(spdlog::level::to_string_view(rhs.db));
        node["lo"]       = to_std_string(spdlog::level::to_string_view(rhs.lo));
        node["transfer"] = to_std_string(spdlog::level::to_string_view(rhs.transfer));
        node["upload"]   = to_std_string(spdlog::level::to_string_view(rhs.upload));
        return node;
    }

    static bool decode(const Node& node, SubsystemLogLevelsConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.pglo = spdlog::level::from_str(node["pglo"].as<std::string>("info"));
        rhs.db = spdlog::level::from_str(node["db"].as<std::string>("warn"));
        rhs.lo = spdlog::level::from_str(node["lo"].as<std::string>("warn"));
        rhs.transfer = spdlog::level::from_str(node["transfer"].as<std::string>("info"));
        rhs.upload = spdlog::level::from_str(node["upload"].as<std::string>("info"));
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
        rhs.console_log_level = spdlog::level::from_str(node["console_log_level"].as<std::string>("info"));
        rhs.file_log_level = spdlog::level::from_str(node["file_log_level"].as<std::string>("warn"));
        if (node["subsystem_levels"]) rhs.subsystem_levels = node["subsystem_levels"].as<SubsystemLogLevelsConfig>();
        return true;
    }
};

template<>
struct convert<LoggingConfig> {
    static Node encode(const LoggingConfig& rhs) {
        Node node;
        node["log_dir"] = rhs.log_dir.string();
        node["log_levels"] = rhs.levels;
        return node;
    }

    static bool decode(const Node& node, LoggingConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.log_dir = node["log_dir"].as<std::string>("");
        if (node["log_levels"]) rhs.levels = node["log_levels"].as<LogLevelsConfig>();
        return true;
    }
};

}
