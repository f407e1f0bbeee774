//! # Format Command Interface
//!
//! `jsonapi fmt <file|->`: decode and re-encode to stdout.

#pragma once
#include "options.hpp"

namespace jsonapi::cli {

int run_fmt(const CommandOptions& options);

} // namespace jsonapi::cli
