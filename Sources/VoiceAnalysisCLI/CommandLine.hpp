#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace va::cli {

struct options {
    std::filesystem::path    config_path;
    std::string              command;
    std::vector<std::string> args;
};

/// Global flags, then the command and its arguments.  nullopt means
/// usage should be printed (no command, -h or --help).
std::optional<options> parse_arguments(int argc, char* argv[]);

/// Positive analysis id.  ValidationError otherwise.
int64_t parse_id(const std::string& text);

/// Positive count such as a list limit.  ValidationError otherwise.
size_t parse_count(const std::string& text);

/// ValidationError unless the command got between `min` and `max` arguments.
void require_args(const options& opts, size_t min, size_t max);

} // namespace va::cli
