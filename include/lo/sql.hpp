#pragma once

#include <string>
#include <string_view>

// SQL fragments for the server-side large-object functions, for embedding in bulk
// queries, e.g.
//
//   "SELECT " + sql::lo_unlink("object_id") + " FROM uploads WHERE user_id = $1"
//
// Arguments are SQL expressions (column names, placeholders, literals) and are not
// quoted. PgBackend prepares its statements from these same builders.
// See https://www.postgresql.org/docs/current/lo-interfaces.html

namespace pglo::lo::sql {

[[nodiscard]] std::string lo_create(std::string_view desiredOid = "0");
[[nodiscard]] std::string lo_unlink(std::string_view oid);
[[nodiscard]] std::string lo_open(std::string_view oid, std::string_view flags);
[[nodiscard]] std::string lo_close(std::string_view fd);
[[nodiscard]] std::string lo_write(std::string_view fd, std::string_view data);
[[nodiscard]] std::string lo_read(std::string_view fd, std::string_view length = "1048576");
[[nodiscard]] std::string lo_lseek64(std::string_view fd, std::string_view offset, std::string_view whence);
[[nodiscard]] std::string lo_tell64(std::string_view fd);
[[nodiscard]] std::string lo_truncate64(std::string_view fd, std::string_view size);

}
