//! # Request Options
//!
//! The closed option table of a compile request and the parser that turns an
//! expanded argument list into `ParsedOptions`.
//!
//! ## Accepted Forms
//!
//! | Form             | Applies to                          |
//! |------------------|-------------------------------------|
//! | `--name=value`   | single and multi options            |
//! | `--name value`   | single and multi options            |
//! | `--flag`         | flags                               |
//! | `--no-flag`      | negatable flags (`summary-only`)    |
//! | `-h`             | `help`                              |
//!
//! Multi options may be repeated; each value is also split on commas.

#pragma once

#include "common.hpp"
#include "diag/diagnostic.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace kiln::args {

enum class OptionKind : uint8_t {
    Flag,   ///< Boolean switch
    Single, ///< One value, last occurrence wins
    Multi,  ///< Repeatable, values accumulate in order
};

struct OptionSpec {
    std::string_view name;
    OptionKind kind;
    std::string_view default_value;
    std::string_view help;
    bool negatable = false;
    char abbreviation = '\0';
};

/// Default logical scheme served by the multi-root overlay.
inline constexpr const char* DEFAULT_MULTI_ROOT_SCHEME = "multi-root";

struct ParsedOptions {
    bool help = false;
    bool summary_only = true;
    bool exclude_non_sources = false;
    std::optional<std::string> platform_summary;
    std::vector<std::string> input_summaries;
    std::vector<std::string> input_linked;
    std::vector<std::string> multi_roots; ///< Duplicates removed, first occurrence kept
    std::string multi_root_scheme = DEFAULT_MULTI_ROOT_SCHEME;
    std::optional<std::string> package_metadata;
    std::vector<std::string> sources;
    std::optional<std::string> output;
};

/// The option table, in usage order.
[[nodiscard]] auto option_table() -> const std::vector<OptionSpec>&;

/// Parses request arguments.
///
/// Positional arguments are ignored; each one adds a warning to `warnings`.
///
/// # Returns
///
/// The parsed options, or an `OptionParseError` diagnostic for the first
/// malformed argument.
[[nodiscard]] auto parse_options(const std::vector<std::string>& args,
                                 std::vector<diag::Diagnostic>& warnings)
    -> Result<ParsedOptions, diag::Diagnostic>;

/// Checks the options a non-help request cannot run without.
[[nodiscard]] auto validate(const ParsedOptions& options) -> std::optional<diag::Diagnostic>;

/// Usage table, one line per option with its default and help text.
[[nodiscard]] auto usage() -> std::string;

} // namespace kiln::args
