//! # Command Options
//!
//! Arguments shared by `check` and `fmt`. Logging flags are skipped here;
//! `log::parse_log_options` reads those from the same argv.

#pragma once
#include "common.hpp"

#include <string>

namespace jsonapi::cli {

struct CommandOptions {
    std::string path; ///< Input file, or "-" for stdin
    int indent = 0;   ///< --indent=N
    bool alias = false;
    bool verify = false;
};

/// Parses argv[first..argc). Fails on unknown flags, a bad indent, or a
/// missing or repeated input path.
Result<CommandOptions> parse_command_options(int argc, char* argv[], int first);

/// True for the flags `log::parse_log_options` consumes.
bool is_log_flag(const std::string& arg);

} // namespace jsonapi::cli
