#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>
#include <spdlog/spdlog.h>

namespace pglo::config {

struct DatabaseConfig {
    std::string host = "localhost";
    uint16_t port = 5432;
    std::string name = "pglo";
    std::string user = "pglo";
    std::string password;   // PGLO_DB_PASSWORD overrides
    unsigned int pool_size = 4;
};

struct LargeObjectsConfig {
    size_t buffer_size = 1024 * 1024;   // handle reads, see lo-interfaces "a few megabytes"
    size_t transfer_buffer_size = 64 * 1024;   // import/export chunking
    std::chrono::seconds timeout = std::chrono::seconds(60);
    bool savepoints = false;   // run each primitive in its own subtransaction
};

struct SubsystemLogLevelsConfig {
    spdlog::level::level_enum pglo     = spdlog::level::info;   // startup, CLI commands
    spdlog::level::level_enum db       = spdlog::level::warn;   // connection failures, rolled back scopes
    spdlog::level::level_enum lo       = spdlog::level::warn;   // per-handle operations (trace is very chatty)
    spdlog::level::level_enum transfer = spdlog::level::info;   // import/export summaries
    spdlog::level::level_enum upload   = spdlog::level::info;   // upload lifecycle
};

struct LogLevelsConfig {
    spdlog::level::level_enum console_log_level = spdlog::level::info;
    spdlog::level::level_enum file_log_level = spdlog::level::warn;
    SubsystemLogLevelsConfig subsystem_levels;
};

struct LoggingConfig {
    std::filesystem::path log_dir;   // empty: console only
    LogLevelsConfig levels;
};

struct Config {
    DatabaseConfig database;
    LargeObjectsConfig large_objects;
    LoggingConfig logging;
};

Config loadConfig(const std::string& path);
Config parseConfig(const std::string& yaml);

}
