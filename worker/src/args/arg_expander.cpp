#include "args/arg_expander.hpp"

#include "log/log.hpp"

#include <cerrno>
#include <cstring>
#include <fstream>

namespace kiln::args {

auto expand_arguments(ArgList args) -> Result<ArgList, diag::Diagnostic> {
    if (args.empty() || !args.back().starts_with("@")) {
        return args;
    }

    std::string path = args.back().substr(1);
    std::ifstream file(path);
    if (!file) {
        std::string cause = std::strerror(errno);
        KILN_LOG_WARN("request", "Cannot open argument file " << path << ": " << cause);
        return diag::Diagnostic::error(diag::ErrorKind::ArgFileUnreadable,
                                       "Failed to read file specified by @" + path + ": " + cause);
    }

    args.pop_back();
    size_t added = 0;
    std::string line;
    while (std::getline(file, line)) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        args.push_back(std::move(line));
        ++added;
    }
    if (file.bad()) {
        return diag::Diagnostic::error(diag::ErrorKind::ArgFileUnreadable,
                                       "Failed to read file specified by @" + path +
                                           ": read error");
    }

    KILN_LOG_DEBUG("request", "Expanded @" << path << " into " << added << " arguments");
    return args;
}

} // namespace kiln::args
