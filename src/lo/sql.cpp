#include "lo/sql.hpp"

#include <fmt/format.h>

namespace pglo::lo::sql {

std::string lo_create(const std::string_view desiredOid) { return fmt::format("lo_create({})", desiredOid); }

std::string lo_unlink(const std::string_view oid) { return fmt::format("lo_unlink({})", oid); }

std::string lo_open(const std::string_view oid, const std::string_view flags) {
    return fmt::format("lo_open({}, {})", oid, flags);
}

std::string lo_close(const std::string_view fd) { return fmt::format("lo_close({})", fd); }

// server-side names have no underscore after "lo"
std::string lo_write(const std::string_view fd, const std::string_view data) {
    return fmt::format("lowrite({}, {})", fd, data);
}

std::string lo_read(const std::string_view fd, const std::string_view length) {
    return fmt::format("loread({}, {})", fd, length);
}

std::string lo_lseek64(const std::string_view fd, const std::string_view offset, const std::string_view whence) {
    return fmt::format("lo_lseek64({}, {}, {})", fd, offset, whence);
}

std::string lo_tell64(const std::string_view fd) { return fmt::format("lo_tell64({})", fd); }

std::string lo_truncate64(const std::string_view fd, const std::string_view size) {
    return fmt::format("lo_truncate64({}, {})", fd, size);
}

}
