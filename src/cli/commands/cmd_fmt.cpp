//! # Format Command
//!
//! Round-trips a document through the codec, which normalises it: members
//! that are empty are dropped, links are checked, and object keys come out
//! sorted.
//!
//! ```bash
//! jsonapi fmt doc.json --indent=2             # pretty-print
//! jsonapi fmt doc.json --alias                # inline included bodies
//! jsonapi fmt doc.json --verify               # fail on orphaned includes
//! ```
//!
//! `--alias` implies `--verify`, since aliasing only happens after a
//! successful linkage check.

#include "cmd_fmt.hpp"

#include "jsonapi/codec.hpp"
#include "jsonapi/linkage.hpp"
#include "log/log.hpp"
#include "utils.hpp"

#include <iostream>

namespace jsonapi::cli {

static void report(const Error& error) {
    std::cerr << "error: " << error_kind_name(error.kind) << ": " << error.to_string() << "\n";
}

int run_fmt(const CommandOptions& options) {
    auto input = read_input(options.path);
    if (!input) {
        std::cerr << "error: cannot open file: " << options.path << "\n";
        return 1;
    }

    auto decoded = decode_document(*input);
    if (is_err(decoded)) {
        report(unwrap_err(decoded));
        return 1;
    }
    Document& document = unwrap(decoded);

    if (options.verify || options.alias) {
        auto linked = verify_full_linkage(document, options.alias);
        if (is_err(linked)) {
            report(unwrap_err(linked));
            return 1;
        }
    }

    EncodeOptions encode_options;
    encode_options.indent = options.indent;
    auto encoded = encode_document(document, encode_options);
    if (is_err(encoded)) {
        report(unwrap_err(encoded));
        return 1;
    }

    JSONAPI_LOG_DEBUG("cli", "formatted " << options.path << " (" << unwrap(encoded).size()
                                          << " bytes)");
    std::cout << unwrap(encoded) << "\n";
    return 0;
}

} // namespace jsonapi::cli
