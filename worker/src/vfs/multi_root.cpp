#include "vfs/multi_root.hpp"

#include "log/log.hpp"

#include <cctype>
#include <filesystem>
#include <system_error>

namespace kiln::vfs {

namespace {

/// Roots are resolved against the working directory, like every other path
/// argument.
auto make_root(const std::string& text) -> Uri {
    Uri root = Uri::parse(text);
    if (root.is_file() && !root.path.empty() && root.path[0] != '/') {
        std::error_code ec;
        auto absolute = std::filesystem::absolute(root.path, ec);
        if (!ec) {
            root.path = absolute.generic_string();
        }
    }
    root.path = normalize_path(root.path);
    return root;
}

} // namespace

MultiRootFileSystem::MultiRootFileSystem(std::string scheme,
                                         const std::vector<std::string>& roots,
                                         Rc<const FileSystem> delegate)
    : scheme_(std::move(scheme)), delegate_(std::move(delegate)) {
    // `Uri::parse` lowercases schemes, so the configured one must match.
    for (auto& c : scheme_) {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    for (const auto& root : roots) {
        roots_.push_back(make_root(root));
    }
    if (roots_.empty()) {
        std::error_code ec;
        auto cwd = std::filesystem::current_path(ec);
        roots_.push_back(make_root(ec ? std::string(".") : cwd.generic_string()));
    }
}

auto MultiRootFileSystem::resolve(const Uri& uri) const -> Uri {
    if (uri.scheme != scheme_) {
        return uri;
    }

    std::string relative = uri.path;
    size_t first = relative.find_first_not_of('/');
    relative = first == std::string::npos ? std::string() : relative.substr(first);

    Uri fallback;
    for (size_t i = 0; i < roots_.size(); ++i) {
        const Uri& root = roots_[i];
        Uri candidate{root.scheme, normalize_path(root.path + "/" + relative)};
        if (delegate_->exists(candidate)) {
            KILN_LOG_TRACE("vfs", uri.to_string() << " -> " << candidate.to_string());
            return candidate;
        }
        if (i == 0) {
            fallback = std::move(candidate);
        }
    }

    KILN_LOG_DEBUG("vfs", uri.to_string() << " not found under any root, using "
                                          << fallback.to_string());
    return fallback;
}

auto MultiRootFileSystem::exists(const Uri& uri) const -> bool {
    return delegate_->exists(resolve(uri));
}

auto MultiRootFileSystem::read_bytes(const Uri& uri) const -> Result<Bytes, std::string> {
    Uri physical = resolve(uri);
    auto result = delegate_->read_bytes(physical);
    if (is_err(result) && physical != uri) {
        return unwrap_err(result) + " (resolved from " + uri.to_string() + ")";
    }
    return result;
}

} // namespace kiln::vfs
