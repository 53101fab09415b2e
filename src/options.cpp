#include "kalkon/options.h"

#include <ostream>

#include <fmt/format.h>

namespace kalkon {

namespace {

const std::string& requireValue(const std::vector<std::string>& args, std::size_t& index) {
    if (index + 1 >= args.size()) {
        throw OptionsError(fmt::format("Missing value for {} option", args[index]));
    }
    return args[++index];
}

RetentionPolicy parseHistoryLimit(const std::string& text) {
    std::size_t consumed = 0;
    unsigned long long limit = 0;
    try {
        limit = std::stoull(text, &consumed);
    } catch (const std::exception&) {
        consumed = 0;
    }
    if (consumed == 0 || consumed != text.size() || text[0] == '-') {
        throw OptionsError(fmt::format("Invalid history limit '{}'", text));
    }
    if (limit == 0) {
        return RetentionPolicy::unbounded();
    }
    return RetentionPolicy::bounded(static_cast<std::size_t>(limit));
}

}  // namespace

Options parseOptions(const std::vector<std::string>& args) {
    Options options;

    for (std::size_t i = 0; i < args.size(); ++i) {
        const std::string& arg = args[i];
        if (arg == "-h" || arg == "--help") {
            options.show_help = true;
        } else if (arg == "-f" || arg == "--file") {
            options.file = requireValue(args, i);
        } else if (arg == "--history-limit") {
            options.session.retention = parseHistoryLimit(requireValue(args, i));
        } else if (arg == "--system") {
            const std::string& name = requireValue(args, i);
            const auto system = valueSystemFromName(name);
            if (!system) {
                throw OptionsError(fmt::format("Unknown value system '{}' (expected dec, hex or bin)", name));
            }
            options.session.display.system = *system;
        } else if (arg == "--type") {
            const std::string& name = requireValue(args, i);
            const auto type = integerTypeFromName(name);
            if (!type) {
                throw OptionsError(fmt::format("Unknown integer type '{}'", name));
            }
            options.session.display.type = *type;
        } else if (!arg.empty() && arg[0] == '-') {
            throw OptionsError(fmt::format("Unknown option '{}'. Use --help for usage.", arg));
        } else if (!options.file) {
            options.file = arg;
        } else {
            throw OptionsError("Unknown arguments. Use --help for usage.");
        }
    }

    return options;
}

void printUsage(std::ostream& output) {
    output << "Usage:\n";
    output << "  kalkon [options]                 Start interactive REPL\n";
    output << "  kalkon [options] --file <path>   Evaluate expressions from file\n";
    output << "  kalkon [options] <path>          Shortcut for file mode\n\n";
    output << "Options:\n";
    output << "  -h, --help              Show this message\n";
    output << "  --history-limit <N>     Keep only the N newest results (0 keeps all)\n";
    output << "  --system dec|hex|bin    Initial display system\n";
    output << "  --type <type>           Initial integer type: int, i8, i16, i32, i64, u8, u16, u32, u64\n\n";
}

}  // namespace kalkon
