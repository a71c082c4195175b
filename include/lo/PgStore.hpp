#pragma once

#include "lo/Store.hpp"

namespace pglo::lo {

// Store over database::Transactions: one pooled connection and one pqxx::work per scope.
class PgStore : public Store {
public:
    explicit PgStore(bool savepoints = false) : savepoints_(savepoints) {}

    void transact(const std::string& ctx, std::chrono::milliseconds timeout,
                  const std::function<void(Backend&)>& body) override;

private:
    bool savepoints_;
};

}
