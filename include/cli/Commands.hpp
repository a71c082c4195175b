#pragma once

#include <chrono>
#include <istream>
#include <optional>
#include <ostream>
#include <stdexcept>
#include <string>
#include <vector>

namespace pglo::lo {
class Store;
}

namespace pglo::cli {

constexpr auto DEFAULT_CONFIG_PATH = "/etc/pglo/config.yaml";

enum class Command { Import, Export, Remove, Size };

struct CliArgs {
    Command command = Command::Import;
    std::vector<std::string> positional;
    std::string configPath = DEFAULT_CONFIG_PATH;
    std::optional<size_t> bufferSize;
    std::optional<std::chrono::seconds> timeout;
};

class UsageError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

[[nodiscard]] std::string usage();

// Throws UsageError
[[nodiscard]] CliArgs parseArgs(const std::vector<std::string>& args);

struct Streams {
    std::istream& in;
    std::ostream& out;
    std::ostream& err;
};

// Exit code: 0 success, 1 runtime failure, 2 usage error
int run(const CliArgs& args, lo::Store& store, size_t defaultBufferSize,
        std::chrono::seconds defaultTimeout, const Streams& io);

}
