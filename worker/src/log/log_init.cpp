//! # Logging Options
//!
//! Splits the logging flags out of the process arguments before the worker
//! looks at them. Logging flags are process-wide: they are accepted on the
//! command line, never inside a work request.

#include "log/log.hpp"

#include <algorithm>
#include <cstdlib>
#include <optional>

namespace kiln::log {

namespace {

/// Value of `--name=value` when `arg` has that prefix.
auto value_of(const std::string& arg, std::string_view name) -> std::optional<std::string> {
    if (arg.size() > name.size() && arg.compare(0, name.size(), name) == 0 &&
        arg[name.size()] == '=') {
        return arg.substr(name.size() + 1);
    }
    return std::nullopt;
}

/// Number of `v`s in `-v`, `-vv`, ..., or 0 for any other argument.
auto verbosity_of(const std::string& arg) -> int {
    if (arg.size() < 2 || arg[0] != '-' || arg.find_first_not_of('v', 1) != std::string::npos) {
        return 0;
    }
    return static_cast<int>(arg.size() - 1);
}

auto level_for_verbosity(int count) -> LogLevel {
    switch (count) {
    case 1:
        return LogLevel::Info;
    case 2:
        return LogLevel::Debug;
    default:
        return LogLevel::Trace;
    }
}

} // namespace

auto parse_log_options(const std::vector<std::string>& args, std::vector<std::string>& rest)
    -> LogConfig {
    LogConfig config;
    std::optional<LogLevel> explicit_level;
    int verbosity = 0;

    for (const auto& arg : args) {
        if (auto level = value_of(arg, "--log-level")) {
            explicit_level = parse_level(*level);
        } else if (auto filter = value_of(arg, "--log-filter")) {
            config.filter = *filter;
        } else if (auto file = value_of(arg, "--log-file")) {
            config.log_file = *file;
        } else if (auto format = value_of(arg, "--log-format")) {
            config.format = (*format == "json" || *format == "JSON") ? LogFormat::JSON
                                                                     : LogFormat::Text;
        } else if (arg == "-q" || arg == "--quiet") {
            explicit_level = LogLevel::Error;
        } else if (int count = verbosity_of(arg); count > 0) {
            verbosity = std::max(verbosity, count);
        } else {
            rest.push_back(arg);
        }
    }

    if (explicit_level) {
        config.level = *explicit_level;
    } else if (verbosity > 0) {
        config.level = level_for_verbosity(verbosity);
    } else if (config.filter.empty()) {
        const char* env = std::getenv("KILN_LOG");
        std::string_view value = env != nullptr ? env : "";
        if (value.find_first_of("=,") != std::string_view::npos) {
            config.filter = std::string(value);
        } else if (!value.empty()) {
            config.level = parse_level(value);
        }
    }

    return config;
}

} // namespace kiln::log
