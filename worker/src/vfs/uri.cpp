#include "vfs/uri.hpp"

#include <cctype>
#include <vector>

namespace kiln::vfs {

namespace {

auto scheme_length(std::string_view text) -> size_t {
    if (text.empty() || !std::isalpha(static_cast<unsigned char>(text[0]))) {
        return 0;
    }
    for (size_t i = 1; i < text.size(); ++i) {
        char c = text[i];
        if (c == ':') {
            return i > 1 ? i : 0;
        }
        if (!std::isalnum(static_cast<unsigned char>(c)) && c != '+' && c != '-' && c != '.') {
            return 0;
        }
    }
    return 0;
}

} // namespace

auto normalize_path(std::string_view path) -> std::string {
    bool absolute = !path.empty() && path[0] == '/';
    bool trailing = path.size() > 1 && path.back() == '/';

    std::vector<std::string_view> segments;
    size_t start = 0;
    while (start <= path.size()) {
        size_t slash = path.find('/', start);
        if (slash == std::string_view::npos) {
            slash = path.size();
        }
        std::string_view segment = path.substr(start, slash - start);
        if (segment == "..") {
            if (!segments.empty() && segments.back() != "..") {
                segments.pop_back();
            } else if (!absolute) {
                segments.push_back(segment);
            }
        } else if (!segment.empty() && segment != ".") {
            segments.push_back(segment);
        }
        start = slash + 1;
    }

    std::string result = absolute ? "/" : "";
    for (size_t i = 0; i < segments.size(); ++i) {
        if (i > 0) {
            result += '/';
        }
        result += segments[i];
    }
    if (trailing && !segments.empty()) {
        result += '/';
    }
    if (result.empty()) {
        result = ".";
    }
    return result;
}

auto Uri::parse(std::string_view text) -> Uri {
    size_t len = scheme_length(text);
    if (len == 0) {
        return from_path(text);
    }

    Uri uri;
    uri.scheme = std::string(text.substr(0, len));
    for (auto& c : uri.scheme) {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    std::string_view rest = text.substr(len + 1);
    if (rest.starts_with("//")) {
        rest.remove_prefix(2);
    }
    uri.path = std::string(rest);
    return uri;
}

auto Uri::from_path(std::string_view path) -> Uri {
    return Uri{"file", std::string(path)};
}

auto Uri::resolve(std::string_view reference) const -> Uri {
    if (scheme_length(reference) > 0) {
        return parse(reference);
    }
    if (reference.starts_with("/")) {
        return Uri{scheme, normalize_path(reference)};
    }

    std::string base = path;
    size_t slash = base.rfind('/');
    base = slash == std::string::npos ? std::string() : base.substr(0, slash + 1);
    return Uri{scheme, normalize_path(base + std::string(reference))};
}

auto Uri::to_string() const -> std::string {
    if (!path.empty() && path[0] == '/') {
        return scheme + "://" + path;
    }
    return scheme + ":" + path;
}

} // namespace kiln::vfs
