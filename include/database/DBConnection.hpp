#pragma once

#include <memory>
#include <string>
#include <pqxx/connection>

namespace pglo::config {
struct DatabaseConfig;
}

namespace pglo::database {

class DBConnection {
  public:
    explicit DBConnection(const config::DatabaseConfig& cfg);
    ~DBConnection();

    [[nodiscard]] pqxx::connection& get() const;

    void initPrepared() const;

    [[nodiscard]] static std::string connectionString(const config::DatabaseConfig& cfg);

  private:
    std::unique_ptr<pqxx::connection> conn_;
};

std::string escapeUriComponent(const std::string& in);

}
