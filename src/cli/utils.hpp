//! # CLI Utilities Interface
//!
//! | Function | Description |
//! |----------|-------------|
//! | `read_input()` | Read a file, or stdin for `-`; empty if unreadable |
//! | `print_usage()` | Print CLI help text |
//! | `print_version()` | Print tool version |

#pragma once
#include <optional>
#include <string>

namespace jsonapi::cli {

// File I/O
std::optional<std::string> read_input(const std::string& path);

// Help text
void print_usage();
void print_version();

} // namespace jsonapi::cli
