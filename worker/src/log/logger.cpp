//! # Logger Implementation
//!
//! Record formatting, the request scope, the sinks, the module filter and
//! the process-wide logger.

#include "log/log.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <unistd.h>

namespace kiln::log {

namespace {

thread_local int64_t current_request_id = 0;

auto now_ms() -> int64_t {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
               std::chrono::system_clock::now().time_since_epoch())
        .count();
}

/// `HH:MM:SS.mmm` in local time.
void write_clock(std::ostream& os, int64_t timestamp_ms) {
    std::time_t seconds = static_cast<std::time_t>(timestamp_ms / 1000);
    std::tm local{};
    localtime_r(&seconds, &local);
    os << std::put_time(&local, "%H:%M:%S") << '.' << std::setfill('0') << std::setw(3)
       << (timestamp_ms % 1000) << std::setfill(' ');
}

void write_json_string(std::ostream& os, std::string_view text) {
    os << '"';
    for (char c : text) {
        switch (c) {
        case '"':
            os << "\\\"";
            break;
        case '\\':
            os << "\\\\";
            break;
        case '\n':
            os << "\\n";
            break;
        case '\r':
            os << "\\r";
            break;
        case '\t':
            os << "\\t";
            break;
        default:
            if (static_cast<unsigned char>(c) < 0x20) {
                char buf[8];
                std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned>(c));
                os << buf;
            } else {
                os << c;
            }
        }
    }
    os << '"';
}

auto color_of(LogLevel level) -> const char* {
    switch (level) {
    case LogLevel::Trace:
        return "\033[90m";
    case LogLevel::Debug:
        return "\033[36m";
    case LogLevel::Info:
        return "\033[32m";
    case LogLevel::Warn:
        return "\033[33m";
    case LogLevel::Error:
    case LogLevel::Fatal:
        return "\033[31m";
    case LogLevel::Off:
        break;
    }
    return "";
}

auto stderr_is_color_terminal() -> bool {
    if (isatty(fileno(stderr)) == 0) {
        return false;
    }
    const char* term = std::getenv("TERM");
    return term != nullptr && std::string_view(term) != "dumb";
}

} // namespace

// ============================================================================
// Levels and Formatting
// ============================================================================

auto parse_level(std::string_view name) -> LogLevel {
    std::string upper(name);
    std::transform(upper.begin(), upper.end(), upper.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    if (upper == "WARNING") {
        return LogLevel::Warn;
    }
    for (size_t i = 0; i < LEVEL_NAMES.size(); ++i) {
        if (upper == LEVEL_NAMES[i]) {
            return static_cast<LogLevel>(i);
        }
    }
    return LogLevel::Info;
}

void format_record(std::ostream& os, const LogRecord& record, LogFormat format, bool colors) {
    if (format == LogFormat::JSON) {
        os << "{\"ts\":" << record.timestamp_ms << ",\"level\":\"" << level_name(record.level)
           << "\",\"module\":";
        write_json_string(os, record.module);
        if (record.request_id != 0) {
            os << ",\"req\":" << record.request_id;
        }
        os << ",\"msg\":";
        write_json_string(os, record.message);
        os << "}\n";
        return;
    }

    write_clock(os, record.timestamp_ms);
    os << ' ';
    if (colors) {
        os << color_of(record.level);
    }
    os << std::left << std::setw(5) << level_name(record.level);
    if (colors) {
        os << "\033[0m";
    }
    os << " [" << record.module << "] ";
    if (record.request_id != 0) {
        os << '#' << record.request_id << ' ';
    }
    os << record.message << '\n';
}

// ============================================================================
// RequestScope
// ============================================================================

RequestScope::RequestScope(int64_t request_id) : previous_(current_request_id) {
    current_request_id = request_id;
}

RequestScope::~RequestScope() {
    current_request_id = previous_;
}

auto RequestScope::current() -> int64_t {
    return current_request_id;
}

// ============================================================================
// Sinks
// ============================================================================

ConsoleSink::ConsoleSink(bool use_colors)
    : colors_enabled_(use_colors && stderr_is_color_terminal()) {}

void ConsoleSink::write(const LogRecord& record) {
    // One write per record keeps lines from interleaving with other stderr output.
    std::ostringstream line;
    format_record(line, record, format_, colors_enabled_);
    std::cerr << line.str();
}

void ConsoleSink::flush() {
    std::cerr.flush();
}

FileSink::FileSink(const std::string& path, bool append)
    : file_(path, append ? std::ios::app : std::ios::trunc) {}

void FileSink::write(const LogRecord& record) {
    if (!file_.is_open()) {
        return;
    }
    format_record(file_, record, format_);
    if (record.level >= LogLevel::Error) {
        file_.flush();
    }
}

void FileSink::flush() {
    if (file_.is_open()) {
        file_.flush();
    }
}

// ============================================================================
// LogFilter
// ============================================================================

void LogFilter::parse(std::string_view text) {
    module_levels_.clear();

    while (!text.empty()) {
        size_t comma = text.find(',');
        std::string_view entry = text.substr(0, comma);
        text = comma == std::string_view::npos ? std::string_view{} : text.substr(comma + 1);
        if (entry.empty()) {
            continue;
        }

        size_t eq = entry.find('=');
        std::string_view module = entry.substr(0, eq);
        LogLevel level =
            eq == std::string_view::npos ? LogLevel::Trace : parse_level(entry.substr(eq + 1));
        if (module == "*") {
            default_level_ = level;
        } else {
            module_levels_[std::string(module)] = level;
        }
    }
}

auto LogFilter::should_log(LogLevel level, std::string_view module) const -> bool {
    auto it = module_levels_.find(module);
    LogLevel threshold = it != module_levels_.end() ? it->second : default_level_;
    return level >= threshold;
}

auto LogFilter::min_level() const -> LogLevel {
    LogLevel lowest = default_level_;
    for (const auto& [module, level] : module_levels_) {
        lowest = std::min(lowest, level);
    }
    return lowest;
}

// ============================================================================
// Logger
// ============================================================================

Logger::Logger() {
    filter_.set_default_level(level_);
    sinks_.push_back(std::make_unique<ConsoleSink>());
}

auto Logger::instance() -> Logger& {
    static Logger logger;
    return logger;
}

void Logger::init(const LogConfig& config) {
    auto& logger = instance();
    std::lock_guard<std::mutex> lock(logger.mutex_);

    logger.sinks_.clear();
    logger.filter_ = LogFilter{};
    logger.filter_.set_default_level(config.level);
    logger.level_ = config.level;
    if (!config.filter.empty()) {
        logger.filter_.parse(config.filter);
        // A per-module override may be more verbose than the global level.
        logger.level_ = logger.filter_.min_level();
    }

    if (config.console) {
        auto console = std::make_unique<ConsoleSink>(config.colors);
        console->set_format(config.format);
        logger.sinks_.push_back(std::move(console));
    }

    if (!config.log_file.empty()) {
        auto file = std::make_unique<FileSink>(config.log_file);
        if (file->is_open()) {
            file->set_format(config.format);
            logger.sinks_.push_back(std::move(file));
        } else {
            std::cerr << "kiln: cannot open log file " << config.log_file << "\n";
        }
    }
}

auto Logger::should_log(LogLevel level, std::string_view module) const -> bool {
    return level >= level_ && filter_.should_log(level, module);
}

void Logger::log(const LogRecord& record) {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& sink : sinks_) {
        sink->write(record);
    }
}

void Logger::log(LogLevel level, std::string_view module, const std::string& message,
                 const char* file, int line) {
    log(LogRecord{level, module, message, file, line, now_ms(), RequestScope::current()});
}

void Logger::add_sink(std::unique_ptr<LogSink> sink) {
    std::lock_guard<std::mutex> lock(mutex_);
    sinks_.push_back(std::move(sink));
}

void Logger::clear_sinks() {
    std::lock_guard<std::mutex> lock(mutex_);
    sinks_.clear();
}

void Logger::set_level(LogLevel level) {
    std::lock_guard<std::mutex> lock(mutex_);
    level_ = level;
    filter_.set_default_level(level);
}

void Logger::set_filter(std::string_view text) {
    std::lock_guard<std::mutex> lock(mutex_);
    filter_.parse(text);
    level_ = filter_.min_level();
}

void Logger::flush() {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& sink : sinks_) {
        sink->flush();
    }
}

} // namespace kiln::log
