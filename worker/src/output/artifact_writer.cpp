#include "output/artifact_writer.hpp"

#include "kernel/graph_binary.hpp"
#include "log/log.hpp"

#include <filesystem>
#include <fstream>
#include <system_error>

namespace fs = std::filesystem;

namespace kiln::output {

namespace {

auto write_failed(const std::string& path, const std::string& cause) -> diag::Diagnostic {
    KILN_LOG_ERROR("artifact", "Cannot write " << path << ": " << cause);
    return diag::Diagnostic::error(diag::ErrorKind::ArtifactWriteFailed,
                                   "Cannot write output '" + path + "': " + cause);
}

} // namespace

auto write_bytes_atomic(const Bytes& bytes, const std::string& path)
    -> Result<size_t, diag::Diagnostic> {
    fs::path target(path);
    std::error_code ec;

    if (target.has_parent_path()) {
        fs::create_directories(target.parent_path(), ec);
        if (ec) {
            return write_failed(path, "cannot create directory " +
                                          target.parent_path().string() + ": " + ec.message());
        }
    }

    fs::path temp_file = target;
    temp_file += ".tmp";

    {
        std::ofstream out(temp_file, std::ios::binary | std::ios::trunc);
        if (!out) {
            return write_failed(path, "cannot open " + temp_file.string());
        }
        out.write(reinterpret_cast<const char*>(bytes.data()),
                  static_cast<std::streamsize>(bytes.size()));
        out.flush();
        if (!out) {
            out.close();
            fs::remove(temp_file, ec);
            return write_failed(path, "write to " + temp_file.string() + " failed");
        }
    }

    // Rename is the only step that touches `path`; when it fails the previous
    // artifact, if any, stays as it was.
    fs::rename(temp_file, target, ec);
    if (ec) {
        std::error_code remove_ec;
        fs::remove(temp_file, remove_ec);
        return write_failed(path, "cannot rename " + temp_file.string() + ": " + ec.message());
    }

    return bytes.size();
}

auto write_artifact(const kernel::ModuleGraph& graph, const std::string& path, bool summary)
    -> Result<size_t, diag::Diagnostic> {
    auto encoded = kernel::encode_graph(graph, summary);
    if (is_err(encoded)) {
        return unwrap_err(encoded);
    }

    auto written = write_bytes_atomic(unwrap(encoded), path);
    if (is_ok(written)) {
        KILN_LOG_INFO("artifact", "Wrote " << path << " (" << unwrap(written) << " bytes, "
                                           << graph.top_level().size() << " modules)");
    }
    return written;
}

} // namespace kiln::output
