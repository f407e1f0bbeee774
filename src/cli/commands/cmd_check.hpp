//! # Check Command Interface
//!
//! `jsonapi check <file|->`: decode, then verify full linkage.

#pragma once
#include "options.hpp"

namespace jsonapi::cli {

int run_check(const CommandOptions& options);

} // namespace jsonapi::cli
