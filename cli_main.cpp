#include "cli/Commands.hpp"
#include "config/ConfigRegistry.hpp"
#include "database/Transactions.hpp"
#include "logging/LogRegistry.hpp"
#include "lo/PgStore.hpp"

#include <fmt/core.h>
#include <iostream>
#include <string>
#include <vector>

using namespace pglo;
using namespace pglo::config;
using namespace pglo::database;
using namespace pglo::logging;

int main(int argc, char** argv) {
    cli::CliArgs args;
    try {
        args = cli::parseArgs(std::vector<std::string>(argv + 1, argv + argc));
    } catch (const cli::UsageError& e) {
        fmt::print(stderr, "pglo: {}\n\n{}", e.what(), cli::usage());
        return 2;
    }

    try {
        ConfigRegistry::init(loadConfig(args.configPath));
        LogRegistry::init(ConfigRegistry::get().logging.log_dir);

        const auto& cfg = ConfigRegistry::get();
        LogRegistry::pglo()->debug("[cli] Connecting to {}:{}/{}", cfg.database.host, cfg.database.port, cfg.database.name);
        Transactions::init(cfg.database);
    } catch (const std::exception& e) {
        fmt::print(stderr, "pglo: failed to initialize: {}\n", e.what());
        return 1;
    }

    const auto& lobCfg = ConfigRegistry::get().large_objects;
    lo::PgStore store(lobCfg.savepoints);

    const int rc = cli::run(args, store, lobCfg.transfer_buffer_size, lobCfg.timeout,
                            {std::cin, std::cout, std::cerr});

    Transactions::shutdown();
    return rc;
}
