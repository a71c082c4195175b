#include "lo/ErrorMap.hpp"

#include <algorithm>
#include <array>

namespace pglo::lo {

namespace {

// SQLSTATEs raised by the server-side large-object functions (be-fsstubs.c, inv_api.c)
constexpr std::array<SqlStateMapping, 7> SQLSTATE_TABLE{{
    {"42704", "undefined_object", ErrorKind::NotFound},
    {"23505", "unique_violation", ErrorKind::AlreadyExists},
    {"42710", "duplicate_object", ErrorKind::AlreadyExists},
    {"55000", "object_not_in_prerequisite_state", ErrorKind::ReadOnly},
    {"22023", "invalid_parameter_value", ErrorKind::InvalidOffset},
    {"57014", "query_canceled", ErrorKind::Timeout},
    {"25P03", "idle_in_transaction_session_timeout", ErrorKind::Timeout},
}};

const SqlStateMapping* find(const std::string_view sqlState) {
    const auto it = std::ranges::find_if(SQLSTATE_TABLE, [&](const auto& m) { return m.sqlState == sqlState; });
    return it == SQLSTATE_TABLE.end() ? nullptr : &*it;
}

}

ErrorKind kindForSqlState(const std::string_view sqlState) {
    if (const auto* m = find(sqlState)) return m->kind;
    return ErrorKind::Backend;
}

std::string_view sqlStateName(const std::string_view sqlState) {
    if (const auto* m = find(sqlState)) return m->name;
    return {};
}

}
