//! # jsonapi Entry Point
//!
//! ```bash
//! jsonapi check doc.json        # decode and verify full linkage
//! jsonapi fmt doc.json -vv      # re-encode with debug logging
//! ```

#include "driver.hpp"

int main(int argc, char* argv[]) {
    return jsonapi::cli::jsonapi_main(argc, argv);
}
