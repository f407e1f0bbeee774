//! # CLI Command Dispatcher
//!
//! Parses the command line and routes to a command handler.
//!
//! ```text
//! jsonapi_main()
//!   ├─ --help, -h     → print_usage()
//!   ├─ --version, -V  → print_version()
//!   ├─ check          → run_check()
//!   └─ fmt            → run_fmt()
//! ```
//!
//! Logging is configured once from argv and `JSONAPI_LOG` before the command
//! runs, so every command accepts the logging flags.

#include "commands/cmd_check.hpp"
#include "commands/cmd_fmt.hpp"
#include "common.hpp"
#include "driver.hpp"
#include "log/log.hpp"
#include "options.hpp"
#include "utils.hpp"

#include <iostream>
#include <string>

namespace jsonapi::cli {

/// Main entry point for the jsonapi tool.
///
/// ## Return Codes
///
/// | Code | Meaning |
/// |------|---------|
/// | 0 | Success |
/// | 1 | Usage error, unreadable input, or an invalid document |
int jsonapi_main(int argc, char* argv[]) {
    if (argc < 2) {
        print_usage();
        return 0;
    }

    std::string command = argv[1];

    if (command == "--help" || command == "-h") {
        print_usage();
        return 0;
    }

    if (command == "--version" || command == "-V") {
        print_version();
        return 0;
    }

    log::Logger::init(log::parse_log_options(argc, argv));

    if (command == "check" || command == "fmt") {
        auto options = parse_command_options(argc, argv, 2);
        if (is_err(options)) {
            std::cerr << "error: " << unwrap_err(options) << "\n";
            std::cerr << "Usage: jsonapi " << command << " <file|-> [options]\n";
            return 1;
        }
        JSONAPI_LOG_DEBUG("cli", "running " << command << " on " << unwrap(options).path);

        int code = command == "check" ? run_check(unwrap(options)) : run_fmt(unwrap(options));
        log::Logger::instance().flush();
        return code;
    }

    std::cerr << "Unknown command: " << command << "\n";
    std::cerr << "Run 'jsonapi --help' for usage.\n";
    return 1;
}

} // namespace jsonapi::cli
