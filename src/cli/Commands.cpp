#include "cli/Commands.hpp"
#include "lo/Error.hpp"
#include "lo/LargeObject.hpp"
#include "lo/Scoped.hpp"
#include "lo/Store.hpp"
#include "lo/Transfer.hpp"
#include "lo/ChunkSink.hpp"
#include "lo/ChunkSource.hpp"
#include "logging/LogRegistry.hpp"

#include <charconv>
#include <filesystem>
#include <fmt/ostream.h>
#include <fstream>

using namespace pglo::lo;
using namespace pglo::logging;

namespace pglo::cli {

namespace {

template <typename T>
T parseNumber(const std::string& s, const std::string& what) {
    T value{};
    const auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), value);
    if (ec != std::errc() || ptr != s.data() + s.size()) throw UsageError("invalid " + what + ": " + s);
    return value;
}

Oid parseOid(const std::string& s) {
    const auto oid = parseNumber<Oid>(s, "object id");
    if (oid == 0) throw UsageError("object id must be positive");
    return oid;
}

Command parseCommand(const std::string& s) {
    if (s == "import") return Command::Import;
    if (s == "export") return Command::Export;
    if (s == "remove") return Command::Remove;
    if (s == "size") return Command::Size;
    throw UsageError("unknown command: " + s);
}

size_t maxArgs(const Command cmd) { return cmd == Command::Export ? 2 : 1; }

}

std::string usage() {
    return "usage: pglo [--config <path>] [--buffer-size <bytes>] [--timeout <seconds>] <command> [args]\n"
           "\n"
           "commands:\n"
           "  import <file|->           store a file (or stdin) as a new large object, print its oid\n"
           "  export <oid> [file]       write a large object to a file (default stdout)\n"
           "  remove <oid>              delete a large object\n"
           "  size <oid>                print the size of a large object in bytes\n";
}

CliArgs parseArgs(const std::vector<std::string>& args) {
    CliArgs parsed;
    std::optional<Command> command;

    for (size_t i = 0; i < args.size(); ++i) {
        const auto& arg = args[i];

        auto value = [&]() -> const std::string& {
            if (i + 1 >= args.size()) throw UsageError("missing value for " + arg);
            return args[++i];
        };

        if (arg == "--config") parsed.configPath = value();
        else if (arg == "--buffer-size") {
            const auto n = parseNumber<size_t>(value(), "buffer size");
            if (n == 0) throw UsageError("buffer size must be positive");
            parsed.bufferSize = n;
        } else if (arg == "--timeout") parsed.timeout = std::chrono::seconds(parseNumber<long>(value(), "timeout"));
        else if (arg.size() > 1 && arg.starts_with("-") && arg != "-") throw UsageError("unknown option: " + arg);
        else if (!command) command = parseCommand(arg);
        else parsed.positional.push_back(arg);
    }

    if (!command) throw UsageError("missing command");
    parsed.command = *command;

    if (parsed.positional.empty()) throw UsageError("missing argument");
    if (parsed.positional.size() > maxArgs(parsed.command))
        throw UsageError("too many arguments");

    // validate oids up front so usage errors never reach the database
    if (parsed.command != Command::Import) (void)parseOid(parsed.positional.front());

    return parsed;
}

int run(const CliArgs& args, Store& store, const size_t defaultBufferSize,
        const std::chrono::seconds defaultTimeout, const Streams& io) {
    TransferOptions opts;
    opts.bufferSize = args.bufferSize.value_or(defaultBufferSize);
    opts.timeout = args.timeout.value_or(defaultTimeout);

    try {
        switch (args.command) {
            case Command::Import: {
                const auto& path = args.positional.front();
                Oid oid;
                if (path == "-") {
                    StreamSource source(io.in, opts.bufferSize);
                    oid = Transfer::importObject(store, source, opts);
                } else {
                    std::ifstream file(path, std::ios::binary);
                    if (!file.is_open()) throw std::runtime_error("cannot open " + path);
                    StreamSource source(file, opts.bufferSize);
                    oid = Transfer::importObject(store, source, opts);
                }
                fmt::print(io.out, "{}\n", oid);
                break;
            }
            case Command::Export: {
                const auto oid = parseOid(args.positional.front());
                if (args.positional.size() < 2) {
                    StreamSink sink(io.out);
                    Transfer::exportObject(store, oid, sink, opts);
                } else {
                    const std::filesystem::path path = args.positional[1];
                    std::ofstream file(path, std::ios::binary | std::ios::trunc);
                    if (!file.is_open()) throw std::runtime_error("cannot open " + path.string());
                    StreamSink sink(file);
                    try {
                        Transfer::exportObject(store, oid, sink, opts);
                    } catch (const std::exception&) {
                        // no partial or empty output file for a failed export
                        file.close();
                        std::error_code ec;
                        std::filesystem::remove(path, ec);
                        if (ec) LogRegistry::pglo()->warn("[cli] Failed to remove {}: {}", path.string(), ec.message());
                        throw;
                    }
                }
                break;
            }
            case Command::Remove: {
                const auto oid = parseOid(args.positional.front());
                store.exec("pglo remove", opts.timeout, [&](Backend& backend) { LargeObject::remove(backend, oid); });
                LogRegistry::pglo()->info("[cli] Removed object {}", oid);
                break;
            }
            case Command::Size: {
                const auto oid = parseOid(args.positional.front());
                const auto size = store.exec("pglo size", opts.timeout, [&](Backend& backend) {
                    return withLargeObject(backend, oid, Mode::Read, [](const LargeObject& lob) { return lob.size(); });
                });
                fmt::print(io.out, "{}\n", size);
                break;
            }
        }
    } catch (const lo::Error& e) {
        fmt::print(io.err, "error: {}: {}\n", errorKindName(e.kind()), e.what());
        return 1;
    } catch (const std::exception& e) {
        fmt::print(io.err, "error: {}\n", e.what());
        return 1;
    }

    return 0;
}

}
