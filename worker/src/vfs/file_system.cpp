#include "vfs/file_system.hpp"

#include <filesystem>
#include <fstream>
#include <iterator>
#include <system_error>

namespace fs = std::filesystem;

namespace kiln::vfs {

// ============================================================================
// StandardFileSystem
// ============================================================================

auto StandardFileSystem::exists(const Uri& uri) const -> bool {
    if (!uri.is_file()) {
        return false;
    }
    std::error_code ec;
    return fs::is_regular_file(uri.path, ec);
}

auto StandardFileSystem::read_bytes(const Uri& uri) const -> Result<Bytes, std::string> {
    if (!uri.is_file()) {
        return "Unsupported URI scheme '" + uri.scheme + "' in " + uri.to_string();
    }

    std::error_code ec;
    if (!fs::is_regular_file(uri.path, ec)) {
        return "File not found: " + uri.path;
    }

    std::ifstream file(uri.path, std::ios::binary);
    if (!file) {
        return "Cannot open file: " + uri.path;
    }
    Bytes data((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
    if (file.bad()) {
        return "Error reading file: " + uri.path;
    }
    return data;
}

// ============================================================================
// MemoryFileSystem
// ============================================================================

void MemoryFileSystem::add_file(const std::string& path, std::string_view contents) {
    files_[normalize_path(path)] = Bytes(contents.begin(), contents.end());
}

auto MemoryFileSystem::exists(const Uri& uri) const -> bool {
    return uri.is_file() && files_.count(normalize_path(uri.path)) > 0;
}

auto MemoryFileSystem::read_bytes(const Uri& uri) const -> Result<Bytes, std::string> {
    if (!uri.is_file()) {
        return "Unsupported URI scheme '" + uri.scheme + "' in " + uri.to_string();
    }
    auto it = files_.find(normalize_path(uri.path));
    if (it == files_.end()) {
        return "File not found: " + uri.path;
    }
    return it->second;
}

} // namespace kiln::vfs
