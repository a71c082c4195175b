#pragma once

#include <filesystem>
#include <memory>
#include <string>
#include <spdlog/spdlog.h>

namespace pglo::logging {

class LogRegistry {
public:
    // Empty logDir logs to the console only
    static void init(const std::filesystem::path& logDir = {});

    static std::shared_ptr<spdlog::logger> get(const std::string& name);

    static std::shared_ptr<spdlog::logger> pglo()     { return get("pglo"); }
    static std::shared_ptr<spdlog::logger> db()       { return get("db"); }
    static std::shared_ptr<spdlog::logger> lo()       { return get("lo"); }
    static std::shared_ptr<spdlog::logger> transfer() { return get("transfer"); }
    static std::shared_ptr<spdlog::logger> upload()   { return get("upload"); }

    [[nodiscard]] static bool isInitialized();

private:
    static constexpr const auto* LOG_FORMAT = "[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%n] %v";

    static inline bool initialized_ = false;
};

}
