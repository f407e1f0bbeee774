#include "utils.hpp"

#include "common.hpp"

#include <fstream>
#include <iostream>
#include <sstream>

namespace jsonapi::cli {

std::optional<std::string> read_input(const std::string& path) {
    std::stringstream buffer;
    if (path == "-") {
        buffer << std::cin.rdbuf();
        return buffer.str();
    }
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        return std::nullopt;
    }
    buffer << file.rdbuf();
    return buffer.str();
}

void print_usage() {
    std::cout << "jsonapi " << VERSION << " (JSON:API " << FORMAT_VERSION << ")\n\n";
    std::cout << "Usage: jsonapi <command> <file|-> [options]\n\n";
    std::cout << "Commands:\n";
    std::cout << "  check     Decode a document and verify full linkage\n";
    std::cout << "  fmt       Decode a document and re-encode it to stdout\n";
    std::cout << "\nOptions:\n";
    std::cout << "  --indent=N       Pretty-print with N spaces (fmt, default compact)\n";
    std::cout << "  --verify         Verify full linkage before printing (fmt)\n";
    std::cout << "  --alias          Copy included bodies into relationships\n";
    std::cout << "  --help, -h       Show this help\n";
    std::cout << "  --version, -V    Show version\n";
    std::cout << "\nLogging:\n";
    std::cout << "  --log-level=L    trace, debug, info, warn, error, off\n";
    std::cout << "  --log-filter=F   Per-module levels, e.g. codec=debug,*=warn\n";
    std::cout << "  --log-file=P     Also write records to P\n";
    std::cout << "  --log-format=F   text or json\n";
    std::cout << "  -v, -vv, -vvv    Info, debug, trace\n";
    std::cout << "  -q, --quiet      Errors only\n";
    std::cout << "\nJSONAPI_LOG is read when no level or filter flag is given.\n";
    std::cout << "Documents use the " << MEDIA_TYPE << " media type.\n";
}

void print_version() {
    std::cout << "jsonapi " << VERSION << "\n";
}

} // namespace jsonapi::cli
