//! # CLI Command Dispatcher
//!
//! This file implements the main entry point for the forge CLI.
//! It initializes logging, parses command-line arguments and routes to the
//! appropriate command handler.
//!
//! ## Architecture
//!
//! ```text
//! forge_main()
//!   ├─ --help, -h     → print_usage()
//!   ├─ --version, -V  → print_version()
//!   ├─ init           → run_init_command()
//!   ├─ build          → run_build_command()
//!   ├─ status         → run_status_command()
//!   ├─ watch          → run_watch_command()
//!   ├─ clean          → run_clean_command()
//!   └─ cache          → run_cache_command()
//! ```
//!
//! ## Return Codes
//!
//! | Code | Meaning                                   |
//! |------|-------------------------------------------|
//! | 0    | Success                                   |
//! | 2    | Usage, config, discovery or cycle error   |
//! | 3    | Generation failure or budget exceeded     |

#include "cli/driver.hpp"
#include "cli/utils.hpp"
#include "commands/cmd_build.hpp"
#include "commands/cmd_cache.hpp"
#include "commands/cmd_clean.hpp"
#include "commands/cmd_init.hpp"
#include "commands/cmd_watch.hpp"
#include "log/log.hpp"

#include <iostream>
#include <string>

namespace forge::cli {

int forge_main(int argc, char* argv[]) {
    log::Logger::init(log::parse_log_options(argc, argv));

    if (argc < 2) {
        print_usage();
        return EXIT_OK;
    }

    std::string command = argv[1];

    if (command == "--help" || command == "-h" || command == "help") {
        print_usage();
        return EXIT_OK;
    }

    if (command == "--version" || command == "-V") {
        print_version();
        return EXIT_OK;
    }

    auto parsed = parse_command_options(argc, argv);
    if (is_err(parsed)) {
        std::cerr << "error: " << unwrap_err(parsed) << "\n";
        std::cerr << "Run 'forge --help' for usage.\n";
        return EXIT_CONFIG_OR_DISCOVERY;
    }
    const auto& options = unwrap(parsed);

    FORGE_LOG_DEBUG("cli", "Running command '" << command << "'");

    int rc = EXIT_CONFIG_OR_DISCOVERY;
    if (command == "init") {
        rc = run_init_command(options);
    } else if (command == "build") {
        rc = run_build_command(options);
    } else if (command == "status") {
        rc = run_status_command(options);
    } else if (command == "watch") {
        rc = run_watch_command(options);
    } else if (command == "clean") {
        rc = run_clean_command(options);
    } else if (command == "cache") {
        rc = run_cache_command(options);
    } else {
        std::cerr << "error: unknown command '" << command << "'\n";
        std::cerr << "Run 'forge --help' for usage.\n";
    }

    log::Logger::instance().flush();
    return rc;
}

} // namespace forge::cli
