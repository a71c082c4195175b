#pragma once

#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>

namespace pglo::lo {

enum class ErrorKind {
    NotFound,
    AlreadyExists,
    ReadOnly,
    InvalidOffset,
    InvalidMode,
    Timeout,
    Backend
};

[[nodiscard]] std::string_view errorKindName(ErrorKind kind);

class Error : public std::runtime_error {
public:
    Error(ErrorKind kind, std::string context, const std::string& message,
          std::optional<std::string> sqlState = std::nullopt);

    [[nodiscard]] ErrorKind kind() const noexcept { return kind_; }
    [[nodiscard]] const std::string& context() const noexcept { return context_; }
    [[nodiscard]] const std::optional<std::string>& sqlState() const noexcept { return sqlState_; }

private:
    ErrorKind kind_;
    std::string context_;
    std::optional<std::string> sqlState_;
};

}
