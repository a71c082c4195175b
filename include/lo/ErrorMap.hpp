#pragma once

#include "lo/Error.hpp"

#include <string_view>

namespace pglo::lo {

struct SqlStateMapping {
    std::string_view sqlState;
    std::string_view name;
    ErrorKind kind;
};

/// Maps a PostgreSQL SQLSTATE onto the large-object error taxonomy.
/// Unknown states map to ErrorKind::Backend.
[[nodiscard]] ErrorKind kindForSqlState(std::string_view sqlState);

/// Condition name of a known SQLSTATE (e.g. "undefined_object"), empty otherwise.
[[nodiscard]] std::string_view sqlStateName(std::string_view sqlState);

}
