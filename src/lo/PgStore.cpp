#include "lo/PgStore.hpp"
#include "lo/PgBackend.hpp"
#include "database/Transactions.hpp"

namespace pglo::lo {

void PgStore::transact(const std::string& ctx, const std::chrono::milliseconds timeout,
                       const std::function<void(Backend&)>& body) {
    database::Transactions::exec(ctx, timeout, [&](pqxx::work& txn) {
        PgBackend backend(txn, savepoints_);
        body(backend);
    });
}

}
