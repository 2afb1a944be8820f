//! # URIs
//!
//! Minimal URI model used to address modules and files.
//!
//! | Text                        | scheme       | path            |
//! |-----------------------------|--------------|-----------------|
//! | `/tmp/a.kl`                 | `file`       | `/tmp/a.kl`     |
//! | `file:///tmp/a.kl`          | `file`       | `/tmp/a.kl`     |
//! | `multi-root:///lib/a.kl`    | `multi-root` | `/lib/a.kl`     |
//! | `package:util/strings.kl`   | `package`    | `util/strings.kl` |
//!
//! Authorities are not modelled; `scheme://` is followed directly by the
//! path. Single-letter schemes are treated as Windows drive letters, so
//! `C:/x` is a file path.

#pragma once

#include <string>
#include <string_view>

namespace kiln::vfs {

struct Uri {
    std::string scheme;
    std::string path;

    [[nodiscard]] static auto parse(std::string_view text) -> Uri;

    /// A `file` URI for a filesystem path. Relative paths stay relative.
    [[nodiscard]] static auto from_path(std::string_view path) -> Uri;

    [[nodiscard]] auto is_file() const -> bool {
        return scheme == "file";
    }

    /// Resolves `reference` against this URI. References with a scheme are
    /// returned as parsed, absolute paths keep this scheme, relative paths
    /// are joined to this URI's directory. `.` and `..` segments are removed.
    [[nodiscard]] auto resolve(std::string_view reference) const -> Uri;

    /// Canonical text form, used as module identity.
    [[nodiscard]] auto to_string() const -> std::string;

    auto operator==(const Uri& other) const -> bool = default;
};

/// Collapses `.` and `..` segments and duplicate slashes.
[[nodiscard]] auto normalize_path(std::string_view path) -> std::string;

} // namespace kiln::vfs
