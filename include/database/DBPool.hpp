#pragma once

#include "database/DBConnection.hpp"
#include "config/Config.hpp"

#include <condition_variable>
#include <memory>
#include <mutex>
#include <queue>
#include <stdexcept>

namespace pglo::database {

class DBPool {
  public:
    explicit DBPool(const config::DatabaseConfig& cfg) {
        if (cfg.pool_size == 0) throw std::invalid_argument("DBPool size must be positive");
        for (size_t i = 0; i < cfg.pool_size; ++i) {
            pool_.push(std::make_unique<DBConnection>(cfg));
        }
    }

    std::unique_ptr<DBConnection> acquire() {
        std::unique_lock lock(mtx_);
        cv_.wait(lock, [&]() { return !pool_.empty(); });
        auto conn = std::move(pool_.front());
        pool_.pop();
        return conn;
    }

    void release(std::unique_ptr<DBConnection> conn) {
        std::lock_guard lock(mtx_);
        pool_.push(std::move(conn));
        cv_.notify_one();
    }

  private:
    std::queue<std::unique_ptr<DBConnection>> pool_;
    std::mutex mtx_;
    std::condition_variable cv_;
};

}
