#include "lo/Error.hpp"

#include <utility>

namespace pglo::lo {

std::string_view errorKindName(const ErrorKind kind) {
    switch (kind) {
        case ErrorKind::NotFound: return "not_found";
        case ErrorKind::AlreadyExists: return "already_exists";
        case ErrorKind::ReadOnly: return "read_only";
        case ErrorKind::InvalidOffset: return "invalid_offset";
        case ErrorKind::InvalidMode: return "invalid_mode";
        case ErrorKind::Timeout: return "timeout";
        case ErrorKind::Backend: return "backend";
    }
    return "unknown";
}

Error::Error(const ErrorKind kind, std::string context, const std::string& message,
             std::optional<std::string> sqlState)
    : std::runtime_error("[" + context + "] " + message),
      kind_(kind),
      context_(std::move(context)),
      sqlState_(std::move(sqlState)) {}

}
