#pragma once

#include "lo/Backend.hpp"

#include <string>
#include <pqxx/pqxx>

namespace pglo::lo {

// Backend over the server-side large-object functions, executed as prepared
// statements inside one pqxx transaction. With savepoints enabled each primitive
// runs in its own subtransaction, so a failed call leaves the enclosing scope usable.
class PgBackend : public Backend {
public:
    explicit PgBackend(pqxx::dbtransaction& txn, bool savepoints = false);

    // Registers the pglo_* statements on a fresh connection
    static void prepare(pqxx::connection& conn);

    [[nodiscard]] Oid create(Oid desired) override;
    void unlink(Oid oid) override;

    [[nodiscard]] Descriptor open(Oid oid, uint32_t flags) override;
    void close(Descriptor fd) override;

    void write(Descriptor fd, std::span<const uint8_t> data) override;
    [[nodiscard]] Bytes read(Descriptor fd, size_t length) override;

    uint64_t seek(Descriptor fd, int64_t offset, Whence whence) override;
    [[nodiscard]] uint64_t tell(Descriptor fd) override;

    void resize(Descriptor fd, uint64_t size) override;

private:
    pqxx::dbtransaction& txn_;
    bool savepoints_;

    template <typename... Args>
    pqxx::result call(const char* stmt, const std::string& ctx, Args&&... args);
};

}
