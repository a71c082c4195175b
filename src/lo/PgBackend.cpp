#include "lo/PgBackend.hpp"
#include "lo/Error.hpp"
#include "lo/ErrorMap.hpp"
#include "lo/sql.hpp"
#include "logging/LogRegistry.hpp"

#include <algorithm>
#include <cstddef>
#include <limits>
#include <utility>

using namespace pglo::logging;

namespace pglo::lo {

namespace {

constexpr auto STMT_CREATE = "pglo_create";
constexpr auto STMT_UNLINK = "pglo_unlink";
constexpr auto STMT_OPEN = "pglo_open";
constexpr auto STMT_CLOSE = "pglo_close";
constexpr auto STMT_WRITE = "pglo_write";
constexpr auto STMT_READ = "pglo_read";
constexpr auto STMT_SEEK = "pglo_seek";
constexpr auto STMT_TELL = "pglo_tell";
constexpr auto STMT_RESIZE = "pglo_resize";

Error translate(const pqxx::sql_error& e, const std::string& ctx) {
    const auto& state = e.sqlstate();
    const auto kind = kindForSqlState(state);
    if (kind == ErrorKind::Backend)
        LogRegistry::db()->error("[PgBackend] {} failed with unmapped SQLSTATE {}: {}", ctx, state, e.what());
    return {kind, ctx, e.what(), state};
}

std::string fdCtx(const char* op, const Descriptor fd) { return std::string(op) + " fd " + std::to_string(fd); }
std::string oidCtx(const char* op, const Oid oid) { return std::string(op) + " oid " + std::to_string(oid); }

}

PgBackend::PgBackend(pqxx::dbtransaction& txn, const bool savepoints) : txn_(txn), savepoints_(savepoints) {}

void PgBackend::prepare(pqxx::connection& conn) {
    conn.prepare(STMT_CREATE, "SELECT " + sql::lo_create("$1::oid"));
    conn.prepare(STMT_UNLINK, "SELECT " + sql::lo_unlink("$1::oid"));
    conn.prepare(STMT_OPEN, "SELECT " + sql::lo_open("$1::oid", "$2::integer"));
    conn.prepare(STMT_CLOSE, "SELECT " + sql::lo_close("$1::integer"));
    conn.prepare(STMT_WRITE, "SELECT " + sql::lo_write("$1::integer", "$2::bytea"));
    conn.prepare(STMT_READ, "SELECT " + sql::lo_read("$1::integer", "$2::integer"));
    conn.prepare(STMT_SEEK, "SELECT " + sql::lo_lseek64("$1::integer", "$2::bigint", "$3::integer"));
    conn.prepare(STMT_TELL, "SELECT " + sql::lo_tell64("$1::integer"));
    conn.prepare(STMT_RESIZE, "SELECT " + sql::lo_truncate64("$1::integer", "$2::bigint"));
}

template <typename... Args>
pqxx::result PgBackend::call(const char* stmt, const std::string& ctx, Args&&... args) {
    pqxx::params params{std::forward<Args>(args)...};
    try {
        if (!savepoints_) return txn_.exec(pqxx::prepped{stmt}, params);

        pqxx::subtransaction sub(txn_, "pglo_primitive");
        auto res = sub.exec(pqxx::prepped{stmt}, params);
        sub.commit();
        return res;
    } catch (const pqxx::sql_error& e) {
        throw translate(e, ctx);
    } catch (const pqxx::failure& e) {
        throw Error(ErrorKind::Backend, ctx, e.what());
    }
}

Oid PgBackend::create(const Oid desired) {
    return call(STMT_CREATE, oidCtx("lo_create", desired), desired).one_field().as<Oid>();
}

void PgBackend::unlink(const Oid oid) { call(STMT_UNLINK, oidCtx("lo_unlink", oid), oid); }

Descriptor PgBackend::open(const Oid oid, const uint32_t flags) {
    return call(STMT_OPEN, oidCtx("lo_open", oid), oid, static_cast<int>(flags)).one_field().as<Descriptor>();
}

void PgBackend::close(const Descriptor fd) { call(STMT_CLOSE, fdCtx("lo_close", fd), fd); }

void PgBackend::write(const Descriptor fd, const std::span<const uint8_t> data) {
    call(STMT_WRITE, fdCtx("lowrite", fd), fd, pqxx::binary_cast(data.data(), data.size()));
}

Bytes PgBackend::read(const Descriptor fd, const size_t length) {
    // loread takes an int4; asking for less is within "up to length"
    const auto capped = static_cast<int>(std::min<size_t>(length, std::numeric_limits<int>::max()));
    const auto raw = call(STMT_READ, fdCtx("loread", fd), fd, capped).one_field().as<std::basic_string<std::byte>>();
    const auto* begin = reinterpret_cast<const uint8_t*>(raw.data());
    return {begin, begin + raw.size()};
}

uint64_t PgBackend::seek(const Descriptor fd, const int64_t offset, const Whence whence) {
    const auto pos = call(STMT_SEEK, fdCtx("lo_lseek64", fd), fd, offset, static_cast<int>(whence))
                         .one_field().as<int64_t>();
    return static_cast<uint64_t>(pos);
}

uint64_t PgBackend::tell(const Descriptor fd) {
    return static_cast<uint64_t>(call(STMT_TELL, fdCtx("lo_tell64", fd), fd).one_field().as<int64_t>());
}

void PgBackend::resize(const Descriptor fd, const uint64_t size) {
    call(STMT_RESIZE, fdCtx("lo_truncate64", fd), fd, static_cast<int64_t>(size));
}

}
