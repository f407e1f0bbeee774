#include "options.hpp"

#include <charconv>
#include <system_error>

namespace jsonapi::cli {

bool is_log_flag(const std::string& arg) {
    return arg.rfind("--log-", 0) == 0 || arg == "-v" || arg == "-vv" || arg == "-vvv" ||
           arg == "--verbose" || arg == "-q" || arg == "--quiet";
}

Result<CommandOptions> parse_command_options(int argc, char* argv[], int first) {
    CommandOptions options;
    bool have_path = false;

    for (int i = first; i < argc; ++i) {
        std::string arg = argv[i];

        if (is_log_flag(arg)) {
            continue;
        }
        if (arg == "--alias") {
            options.alias = true;
        } else if (arg == "--verify") {
            options.verify = true;
        } else if (arg.rfind("--indent=", 0) == 0) {
            std::string value = arg.substr(9);
            int indent = 0;
            auto [end, ec] = std::from_chars(value.data(), value.data() + value.size(), indent);
            if (ec != std::errc() || end != value.data() + value.size() || indent < 0) {
                return "invalid indent: " + value;
            }
            options.indent = indent;
        } else if (arg != "-" && arg.rfind('-', 0) == 0) {
            return "unknown option: " + arg;
        } else if (have_path) {
            return "unexpected argument: " + arg;
        } else {
            options.path = arg;
            have_path = true;
        }
    }

    if (!have_path) {
        return std::string("missing input file (use - for stdin)");
    }
    return options;
}

} // namespace jsonapi::cli
