//! # Argument Files
//!
//! Build systems pass long argument lists through a trailing `@path`
//! argument. `expand_arguments` replaces that last argument with the lines
//! of the named file.
//!
//! ```text
//! [--output=a.dill, @args.txt]   args.txt = "--source=a.kl\n--source=b.kl\n"
//! => [--output=a.dill, --source=a.kl, --source=b.kl]
//! ```
//!
//! Only the last argument is considered; an `@` anywhere else is an ordinary
//! argument.

#pragma once

#include "common.hpp"
#include "diag/diagnostic.hpp"

#include <string>
#include <vector>

namespace kiln::args {

using ArgList = std::vector<std::string>;

/// Expands a trailing `@file` argument.
///
/// # Returns
///
/// The expanded list, or an `ArgFileUnreadable` diagnostic naming the file.
[[nodiscard]] auto expand_arguments(ArgList args) -> Result<ArgList, diag::Diagnostic>;

} // namespace kiln::args
