#pragma once

#include "database/DBPool.hpp"
#include "logging/LogRegistry.hpp"

#include <chrono>
#include <memory>
#include <pqxx/pqxx>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <utility>

namespace pglo::database {

class Transactions {
  public:
    static inline std::shared_ptr<DBPool> dbPool_;

    static void init(const config::DatabaseConfig& cfg) { dbPool_ = std::make_shared<DBPool>(cfg); }
    static void shutdown() { dbPool_.reset(); }

    template <typename Func>
    static auto exec(const std::string& ctx, Func&& func) -> decltype(func(std::declval<pqxx::work&>())) {
        return exec(ctx, std::chrono::milliseconds::zero(), std::forward<Func>(func));
    }

    // A positive timeout bounds every statement of the transaction (SET LOCAL statement_timeout).
    template <typename Func>
    static auto exec(const std::string& ctx, const std::chrono::milliseconds timeout, Func&& func)
        -> decltype(func(std::declval<pqxx::work&>())) {
        if (!dbPool_) throw std::runtime_error("Transactions not initialized!");

        logging::LogRegistry::db()->trace("[Transactions::exec] Starting transaction: {}", ctx);
        auto conn = dbPool_->acquire();

        // txn must be gone before the connection goes back to the pool
        auto run = [&]() -> decltype(func(std::declval<pqxx::work&>())) {
            pqxx::work txn(conn->get());
            if (timeout.count() > 0)
                txn.exec("SET LOCAL statement_timeout = " + std::to_string(timeout.count()));

            if constexpr (std::is_void_v<decltype(func(txn))>) {
                func(txn);
                txn.commit();
            } else {
                auto result = func(txn);
                txn.commit();
                return result;
            }
        };

        try {
            if constexpr (std::is_void_v<decltype(func(std::declval<pqxx::work&>()))>) {
                run();
                logging::LogRegistry::db()->trace("[Transactions::exec] Transaction committed: {}", ctx);
                dbPool_->release(std::move(conn));
            } else {
                auto result = run();
                logging::LogRegistry::db()->trace("[Transactions::exec] Transaction committed: {}", ctx);
                dbPool_->release(std::move(conn));
                return result;
            }
        } catch (const std::exception& e) {
            logging::LogRegistry::db()->error("[Transactions::exec] Exception in transaction context '{}', rolled back: {}",
                                              ctx, e.what());
            dbPool_->release(std::move(conn));
            throw;
        } catch (...) {
            logging::LogRegistry::db()->error("[Transactions::exec] Unknown exception in transaction context '{}', rolled back", ctx);
            dbPool_->release(std::move(conn));
            throw;
        }

        if constexpr (!std::is_void_v<decltype(func(std::declval<pqxx::work&>()))>) {
            // Compiler satisfaction token
            throw std::logic_error("Unreachable path in Transactions::exec");
        }
    }
};

}
