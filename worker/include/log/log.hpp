//! # kiln Logging
//!
//! Module-tagged, level-filtered logging for the worker. Every record
//! carries the id of the request being served on its thread (see
//! `RequestScope`), so the interleaved output of a long-lived worker can be
//! split back into requests.
//!
//! stdout carries the worker protocol. Sinks write to stderr or to a file,
//! never to stdout.
//!
//! ## Usage
//!
//! ```cpp
//! log::RequestScope scope(request.request_id);
//! KILN_LOG_DEBUG("vfs", "Resolved " << uri << " -> " << path);
//! ```
//!
//! ## Configuration
//!
//! | Source                | Example                          |
//! |-----------------------|----------------------------------|
//! | `--log-level=`        | `--log-level=debug`              |
//! | `--log-filter=`       | `--log-filter=session=trace,*=warn` |
//! | `--log-file=`         | `--log-file=/tmp/kiln.log`       |
//! | `--log-format=`       | `--log-format=json`              |
//! | `-v` / `-vv` / `-vvv` | info / debug / trace             |
//! | `-q`                  | errors only                      |
//! | `KILN_LOG` env        | `KILN_LOG=debug` or a filter     |

#ifndef KILN_LOG_HPP
#define KILN_LOG_HPP

#include <array>
#include <cstdint>
#include <fstream>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <ostream>
#include <sstream>
#include <string>
#include <string_view>
#include <vector>

namespace kiln::log {

// ============================================================================
// Levels
// ============================================================================

enum class LogLevel : int {
    Trace = 0,
    Debug = 1,
    Info = 2,
    Warn = 3,
    Error = 4,
    Fatal = 5,
    Off = 6
};

inline constexpr std::array<const char*, 7> LEVEL_NAMES = {"TRACE", "DEBUG", "INFO", "WARN",
                                                           "ERROR", "FATAL", "OFF"};

inline auto level_name(LogLevel level) -> const char* {
    auto index = static_cast<size_t>(level);
    return index < LEVEL_NAMES.size() ? LEVEL_NAMES[index] : "???";
}

/// Parses a level name in any case; `warning` is accepted for `Warn`.
/// Unknown names yield `Info`.
[[nodiscard]] auto parse_level(std::string_view name) -> LogLevel;

// ============================================================================
// Records
// ============================================================================

struct LogRecord {
    LogLevel level;
    std::string_view module;
    std::string message;
    const char* file;
    int line;
    int64_t timestamp_ms;
    /// Request being served when the record was made, 0 outside a request.
    int64_t request_id = 0;
};

enum class LogFormat {
    Text, ///< `HH:MM:SS.mmm LEVEL [module] #id message`
    JSON  ///< One object per line: ts, level, module, req, msg
};

/// Renders `record` as one line (newline included).
void format_record(std::ostream& os, const LogRecord& record, LogFormat format,
                   bool colors = false);

// ============================================================================
// Request Scope
// ============================================================================

/// Tags every record logged on the current thread with `request_id` for
/// the lifetime of the scope. Scopes nest; the previous id is restored on
/// destruction.
class RequestScope {
public:
    explicit RequestScope(int64_t request_id);
    ~RequestScope();

    RequestScope(const RequestScope&) = delete;
    RequestScope& operator=(const RequestScope&) = delete;

    [[nodiscard]] static auto current() -> int64_t;

private:
    int64_t previous_;
};

// ============================================================================
// Sinks
// ============================================================================

class LogSink {
public:
    virtual ~LogSink() = default;

    virtual void write(const LogRecord& record) = 0;
    virtual void flush() = 0;
};

/// A sink that renders records with `format_record`.
class FormattedSink : public LogSink {
public:
    void set_format(LogFormat format) {
        format_ = format;
    }

    [[nodiscard]] auto format() const -> LogFormat {
        return format_;
    }

protected:
    LogFormat format_ = LogFormat::Text;
};

/// Writes to stderr, colored when stderr is a terminal.
class ConsoleSink : public FormattedSink {
public:
    explicit ConsoleSink(bool use_colors = true);

    void write(const LogRecord& record) override;
    void flush() override;

private:
    bool colors_enabled_;
};

/// Appends to a file. Error and Fatal records are flushed immediately so a
/// crashing worker still leaves them behind.
class FileSink : public FormattedSink {
public:
    explicit FileSink(const std::string& path, bool append = true);

    void write(const LogRecord& record) override;
    void flush() override;

    [[nodiscard]] auto is_open() const -> bool {
        return file_.is_open();
    }

private:
    std::ofstream file_;
};

// ============================================================================
// Filter
// ============================================================================

/// Per-module minimum levels, parsed from `module=level,...,*=level`.
/// A module named without a level is enabled down to Trace.
class LogFilter {
public:
    void parse(std::string_view text);

    [[nodiscard]] auto should_log(LogLevel level, std::string_view module) const -> bool;

    void set_default_level(LogLevel level) {
        default_level_ = level;
    }

    [[nodiscard]] auto default_level() const -> LogLevel {
        return default_level_;
    }

    /// Lowest level any module (or the default) lets through.
    [[nodiscard]] auto min_level() const -> LogLevel;

private:
    LogLevel default_level_ = LogLevel::Info;
    std::map<std::string, LogLevel, std::less<>> module_levels_;
};

// ============================================================================
// Logger
// ============================================================================

struct LogConfig {
    LogLevel level = LogLevel::Warn;
    LogFormat format = LogFormat::Text;
    std::string filter; ///< Module filter, empty for none
    std::string log_file;
    bool console = true;
    bool colors = true;
};

/// Process-wide logger. Until `init()` is called it logs Warn and above to
/// the console.
class Logger {
public:
    /// Replaces the sinks and levels with those described by `config`.
    static void init(const LogConfig& config);

    static auto instance() -> Logger&;

    /// Checked by the macros before the message is built.
    [[nodiscard]] auto should_log(LogLevel level, std::string_view module) const -> bool;

    void log(const LogRecord& record);
    void log(LogLevel level, std::string_view module, const std::string& message,
             const char* file, int line);

    void add_sink(std::unique_ptr<LogSink> sink);
    void clear_sinks();

    void set_level(LogLevel level);
    void set_filter(std::string_view text);

    [[nodiscard]] auto level() const -> LogLevel {
        return level_;
    }

    void flush();

private:
    Logger();

    LogLevel level_ = LogLevel::Warn;
    LogFilter filter_;
    std::vector<std::unique_ptr<LogSink>> sinks_;
    mutable std::mutex mutex_;
};

/// Removes the logging options from `args`, appending everything else to
/// `rest` in order, and builds the matching configuration. `KILN_LOG` is
/// read only when the arguments set neither a level nor a filter.
[[nodiscard]] auto parse_log_options(const std::vector<std::string>& args,
                                     std::vector<std::string>& rest) -> LogConfig;

// ============================================================================
// Macros
// ============================================================================

// 0=Trace .. 6=Off. Calls below this level compile to nothing.
#ifndef KILN_MIN_LOG_LEVEL
#define KILN_MIN_LOG_LEVEL 0
#endif

#define KILN_LOG_IMPL(level, module_str, msg)                                                      \
    do {                                                                                           \
        if (static_cast<int>(level) >= KILN_MIN_LOG_LEVEL) {                                       \
            auto& kiln_logger_ = ::kiln::log::Logger::instance();                                  \
            if (kiln_logger_.should_log(level, module_str)) {                                      \
                std::ostringstream kiln_oss_;                                                      \
                kiln_oss_ << msg;                                                                  \
                kiln_logger_.log(level, module_str, kiln_oss_.str(), __FILE__, __LINE__);          \
            }                                                                                      \
        }                                                                                          \
    } while (0)

#define KILN_LOG_TRACE(module, msg) KILN_LOG_IMPL(::kiln::log::LogLevel::Trace, module, msg)
#define KILN_LOG_DEBUG(module, msg) KILN_LOG_IMPL(::kiln::log::LogLevel::Debug, module, msg)
#define KILN_LOG_INFO(module, msg) KILN_LOG_IMPL(::kiln::log::LogLevel::Info, module, msg)
#define KILN_LOG_WARN(module, msg) KILN_LOG_IMPL(::kiln::log::LogLevel::Warn, module, msg)
#define KILN_LOG_ERROR(module, msg) KILN_LOG_IMPL(::kiln::log::LogLevel::Error, module, msg)
#define KILN_LOG_FATAL(module, msg) KILN_LOG_IMPL(::kiln::log::LogLevel::Fatal, module, msg)

} // namespace kiln::log

#endif // KILN_LOG_HPP
