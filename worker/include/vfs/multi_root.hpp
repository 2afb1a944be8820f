//! # Multi-Root File System
//!
//! Build systems scatter the inputs of one compilation over several physical
//! directories (source tree, generated files, build outputs). The multi-root
//! overlay hides this: a file is addressed as `<scheme>:///relative/path` and
//! looked up under each configured root in order.
//!
//! ```cpp
//! MultiRootFileSystem overlay("multi-root", {"/src", "/gen"}, delegate);
//! // /src/lib/a.kl exists, /gen/lib/a.kl does not:
//! overlay.resolve(Uri::parse("multi-root:///lib/a.kl"));   // file:///src/lib/a.kl
//! ```
//!
//! When no root contains the file, the first root's candidate is returned so
//! that the missing file is reported by whoever reads it.

#pragma once

#include "common.hpp"
#include "vfs/file_system.hpp"

#include <string>
#include <vector>

namespace kiln::vfs {

class MultiRootFileSystem : public FileSystem {
public:
    /// # Arguments
    ///
    /// * `scheme` - Logical scheme served by the overlay
    /// * `roots` - Root directories (paths or `file` URIs); empty means the
    ///   current working directory
    /// * `delegate` - File system that serves the physical URIs
    MultiRootFileSystem(std::string scheme, const std::vector<std::string>& roots,
                        Rc<const FileSystem> delegate);

    /// Maps a logical URI onto the physical URI that will be read. URIs of
    /// other schemes are returned unchanged.
    [[nodiscard]] auto resolve(const Uri& uri) const -> Uri;

    [[nodiscard]] auto exists(const Uri& uri) const -> bool override;
    [[nodiscard]] auto read_bytes(const Uri& uri) const -> Result<Bytes, std::string> override;

    [[nodiscard]] auto scheme() const -> const std::string& {
        return scheme_;
    }

    [[nodiscard]] auto roots() const -> const std::vector<Uri>& {
        return roots_;
    }

private:
    std::string scheme_;
    std::vector<Uri> roots_;
    Rc<const FileSystem> delegate_;
};

} // namespace kiln::vfs
