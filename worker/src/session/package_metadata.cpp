#include "session/package_metadata.hpp"

namespace kiln::session {

auto parse_package_metadata(std::string_view text, const vfs::Uri& location)
    -> Result<PackageMap, std::string> {
    PackageMap packages;
    size_t line_no = 0;
    size_t start = 0;
    while (start <= text.size()) {
        size_t end = text.find('\n', start);
        if (end == std::string_view::npos) {
            end = text.size();
        }
        std::string_view line = text.substr(start, end - start);
        start = end + 1;
        ++line_no;

        while (!line.empty() && (line.back() == '\r' || line.back() == ' ')) {
            line.remove_suffix(1);
        }
        while (!line.empty() && line.front() == ' ') {
            line.remove_prefix(1);
        }
        if (line.empty() || line.front() == '#') {
            continue;
        }

        size_t colon = line.find(':');
        if (colon == std::string_view::npos || colon == 0) {
            return "Malformed package entry on line " + std::to_string(line_no) + ": '" +
                   std::string(line) + "'";
        }
        std::string name(line.substr(0, colon));
        std::string root = location.resolve(line.substr(colon + 1)).to_string();
        if (root.empty() || root.back() != '/') {
            root += '/';
        }
        if (!packages.emplace(name, std::move(root)).second) {
            return "Duplicate package '" + name + "' on line " + std::to_string(line_no);
        }
    }
    return packages;
}

} // namespace kiln::session
