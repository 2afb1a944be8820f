//! # Package Metadata
//!
//! Maps package names to root URIs, one `name:uri` entry per line:
//!
//! ```text
//! # generated by the build
//! util:lib/util/
//! core:multi-root:///third_party/core/
//! ```
//!
//! Relative URIs are resolved against the metadata file's own location.
//! Blank lines and lines starting with `#` are ignored. Roots always end in
//! `/` after parsing.

#pragma once

#include "common.hpp"
#include "vfs/uri.hpp"

#include <map>
#include <string>
#include <string_view>

namespace kiln::session {

using PackageMap = std::map<std::string, std::string>;

/// Parses metadata read from `location`.
[[nodiscard]] auto parse_package_metadata(std::string_view text, const vfs::Uri& location)
    -> Result<PackageMap, std::string>;

} // namespace kiln::session
