//! # File Systems
//!
//! Read-only, URI-addressed file access used by compilation.
//!
//! | Implementation          | Serves                                     |
//! |-------------------------|--------------------------------------------|
//! | `StandardFileSystem`    | `file` URIs on the real filesystem         |
//! | `MemoryFileSystem`      | `file` URIs from an in-memory map          |
//! | `MultiRootFileSystem`   | one logical scheme over several roots      |

#pragma once

#include "common.hpp"
#include "vfs/uri.hpp"

#include <map>
#include <string>

namespace kiln::vfs {

class FileSystem {
public:
    virtual ~FileSystem() = default;

    [[nodiscard]] virtual auto exists(const Uri& uri) const -> bool = 0;

    /// Reads the whole file. The error is a human-readable cause.
    [[nodiscard]] virtual auto read_bytes(const Uri& uri) const -> Result<Bytes, std::string> = 0;
};

class StandardFileSystem : public FileSystem {
public:
    [[nodiscard]] auto exists(const Uri& uri) const -> bool override;
    [[nodiscard]] auto read_bytes(const Uri& uri) const -> Result<Bytes, std::string> override;
};

/// In-memory files keyed by normalized path.
class MemoryFileSystem : public FileSystem {
public:
    void add_file(const std::string& path, std::string_view contents);

    [[nodiscard]] auto exists(const Uri& uri) const -> bool override;
    [[nodiscard]] auto read_bytes(const Uri& uri) const -> Result<Bytes, std::string> override;

private:
    std::map<std::string, Bytes> files_;
};

} // namespace kiln::vfs
