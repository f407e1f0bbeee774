//! # Check Command
//!
//! Decodes a document and, when it ships included resources, verifies that
//! each of them is reachable from primary data.
//!
//! ```bash
//! jsonapi check article.json          # prints "ok" or the first error
//! curl -s $URL | jsonapi check -      # read from stdin
//! ```

#include "cmd_check.hpp"

#include "jsonapi/jsonapi.hpp"
#include "log/log.hpp"
#include "utils.hpp"

#include <iostream>

namespace jsonapi::cli {

int run_check(const CommandOptions& options) {
    auto input = read_input(options.path);
    if (!input) {
        std::cerr << "error: cannot open file: " << options.path << "\n";
        return 1;
    }

    auto decoded = decode_document(*input);
    if (is_err(decoded)) {
        const Error& error = unwrap_err(decoded);
        std::cerr << "error: " << error_kind_name(error.kind) << ": " << error.to_string() << "\n";
        return 1;
    }

    Document& document = unwrap(decoded);
    JSONAPI_LOG_INFO("cli", options.path << ": shape " << data_shape_name(document.shape())
                                         << ", " << document.included.size() << " included");

    auto linked = verify_full_linkage(document, options.alias);
    if (is_err(linked)) {
        const Error& error = unwrap_err(linked);
        std::cerr << "error: " << error_kind_name(error.kind) << ": " << error.to_string() << "\n";
        return 1;
    }

    std::cout << "ok\n";
    return 0;
}

} // namespace jsonapi::cli
