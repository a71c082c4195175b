#include "config/Config.hpp"
#include "config/config_yaml.hpp"

#include <cstdlib>
#include <stdexcept>
#include <yaml-cpp/yaml.h>

namespace pglo::config {

namespace {

Config fromNode(const YAML::Node& root) {
    Config cfg;

    if (!root || root.IsNull()) return cfg;
    if (!root.IsMap()) throw std::runtime_error("Config root must be a map");

    if (auto node = root["database"]) {
        if (!YAML::convert<DatabaseConfig>::decode(node, cfg.database))
            throw std::runtime_error("Invalid 'database' section in config");
    }
    if (auto node = root["large_objects"]) {
        if (!YAML::convert<LargeObjectsConfig>::decode(node, cfg.large_objects))
            throw std::runtime_error("Invalid 'large_objects' section in config");
    }
    if (auto node = root["logging"]) {
        if (!YAML::convert<LoggingConfig>::decode(node, cfg.logging))
            throw std::runtime_error("Invalid 'logging' section in config");
    }

    if (const char* pass = std::getenv("PGLO_DB_PASSWORD"); pass && *pass) cfg.database.password = pass;

    return cfg;
}

}

Config loadConfig(const std::string& path) { return fromNode(YAML::LoadFile(path)); }

Config parseConfig(const std::string& yaml) { return fromNode(YAML::Load(yaml)); }

}
