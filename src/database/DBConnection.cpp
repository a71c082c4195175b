#include "database/DBConnection.hpp"
#include "config/Config.hpp"
#include "lo/PgBackend.hpp"
#include "logging/LogRegistry.hpp"

#include <cctype>
#include <fmt/format.h>
#include <stdexcept>

using namespace pglo::logging;

namespace pglo::database {

std::string escapeUriComponent(const std::string& in) {
    std::string out;
    out.reserve(in.size());
    for (const unsigned char c : in) {
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') out += static_cast<char>(c);
        else out += fmt::format("%{:02X}", c);
    }
    return out;
}

std::string DBConnection::connectionString(const config::DatabaseConfig& cfg) {
    std::string auth = escapeUriComponent(cfg.user);
    if (!cfg.password.empty()) auth += ":" + escapeUriComponent(cfg.password);
    return "postgresql://" + auth + "@" + cfg.host + ":" + std::to_string(cfg.port) + "/" + escapeUriComponent(cfg.name);
}

DBConnection::DBConnection(const config::DatabaseConfig& cfg)
    : conn_(std::make_unique<pqxx::connection>(connectionString(cfg))) {
    LogRegistry::db()->debug("[DBConnection] Connected to {}:{}/{} as {}", cfg.host, cfg.port, cfg.name, cfg.user);
    initPrepared();
}

DBConnection::~DBConnection() { if (conn_ && conn_->is_open()) conn_->close(); }

pqxx::connection& DBConnection::get() const { return *conn_; }

void DBConnection::initPrepared() const {
    if (!conn_ || !conn_->is_open()) throw std::runtime_error("Database connection is not open");
    lo::PgBackend::prepare(*conn_);
}

}
