//! # CLI Driver Interface
//!
//! `jsonapi_main()` is the whole tool; `main()` only forwards to it.

#pragma once

namespace jsonapi::cli {

int jsonapi_main(int argc, char* argv[]);

} // namespace jsonapi::cli
