#include "logging/LogRegistry.hpp"
#include "config/ConfigRegistry.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>

#include <stdexcept>
#include <vector>

namespace pglo::logging {

void LogRegistry::init(const std::filesystem::path& logDir) {
    if (initialized_) {
        spdlog::warn("[LogRegistry] Already initialized, ignoring second init()");
        return;
    }

    const auto cnf = config::ConfigRegistry::isInitialized() ? config::ConfigRegistry::get().logging
                                                             : config::LoggingConfig{};

    const auto consoleSink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    consoleSink->set_level(cnf.levels.console_log_level);
    consoleSink->set_color_mode(spdlog::color_mode::automatic);
    consoleSink->set_pattern(LOG_FORMAT);

    std::vector<spdlog::sink_ptr> sinks{consoleSink};

    if (!logDir.empty()) {
        namespace fs = std::filesystem;
        if (!fs::exists(logDir)) fs::create_directories(logDir);

        const auto logFile = logDir / "pglo.log";
        const auto rotatingSink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(logFile.string(), 1024 * 1024 * 10, 5);
        rotatingSink->set_level(cnf.levels.file_log_level);
        rotatingSink->set_pattern(LOG_FORMAT);
        sinks.push_back(rotatingSink);
    }

    auto makeLogger = [&](const std::string& name, const spdlog::level::level_enum lvl) {
        if (spdlog::get(name)) spdlog::drop(name);
        const auto logger = std::make_shared<spdlog::logger>(name, sinks.begin(), sinks.end());
        logger->set_level(lvl);
        logger->flush_on(spdlog::level::warn);
        spdlog::register_logger(logger);
    };

    const auto& sub = cnf.levels.subsystem_levels;

    makeLogger("pglo", sub.pglo);
    makeLogger("db", sub.db);
    makeLogger("lo", sub.lo);
    makeLogger("transfer", sub.transfer);
    makeLogger("upload", sub.upload);

    initialized_ = true;
    get("pglo")->debug("[LogRegistry] Initialized (log dir: {})", logDir.empty() ? "<console>" : logDir.string());
}

std::shared_ptr<spdlog::logger> LogRegistry::get(const std::string& name) {
    auto logger = spdlog::get(name);
    if (!logger) {
        if (!initialized_) throw std::runtime_error("[LogRegistry] LogRegistry not initialized, cannot get logger: " + name);
        throw std::runtime_error("[LogRegistry] Logger not found: " + name);
    }
    return logger;
}

bool LogRegistry::isInitialized() { return initialized_; }

}
