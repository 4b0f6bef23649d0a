#include "CommandLine.hpp"

#include "AppConfig.hpp"
#include "Errors.hpp"

#include <stdexcept>

namespace va::cli {

namespace {

/// Whole-string positive integer, or nullopt.
std::optional<long long> parse_positive(const std::string& text) {
    try {
        size_t used = 0;
        const long long n = std::stoll(text, &used);
        if (used == text.size() && n > 0) return n;
    } catch (const std::logic_error&) {
        // not a number, or out of range
    }
    return std::nullopt;
}

} // namespace

std::optional<options> parse_arguments(int argc, char* argv[]) {
    options opts;
    opts.config_path = AppConfig::default_data_dir() / "settings.json";

    int i = 1;
    for (; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg == "--config" && i + 1 < argc) {
            opts.config_path = argv[++i];
        } else if (arg == "-h" || arg == "--help") {
            return std::nullopt;
        } else {
            break;
        }
    }
    if (i >= argc) return std::nullopt;

    opts.command = argv[i++];
    for (; i < argc; ++i) opts.args.emplace_back(argv[i]);
    return opts;
}

int64_t parse_id(const std::string& text) {
    if (auto id = parse_positive(text)) return *id;
    throw ValidationError("Not a valid analysis id: '" + text + "'");
}

size_t parse_count(const std::string& text) {
    if (auto n = parse_positive(text)) return static_cast<size_t>(*n);
    throw ValidationError("Not a positive count: '" + text + "'");
}

void require_args(const options& opts, size_t min, size_t max) {
    if (opts.args.size() < min || opts.args.size() > max) {
        throw ValidationError("Wrong number of arguments for '" + opts.command +
                              "' (see --help)");
    }
}

} // namespace va::cli
