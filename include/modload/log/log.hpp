//! # modload Logging
//!
//! Structured, module-tagged logging used by the loader and the CLI:
//! - 6 log levels (Trace, Debug, Info, Warn, Error, Fatal)
//! - Per-module filtering ("loader=trace,*=warn")
//! - Console, file and null sinks, text or JSON lines
//! - Compile-time level elision via MODLOAD_MIN_LOG_LEVEL
//!
//! The logger starts with no sinks. A library host that wants loader
//! diagnostics calls `Logger::init()` (or `add_sink()`) first.
//!
//! ## Usage
//!
//! ```cpp
//! MODLOAD_LOG_DEBUG("loader", "resolved " << reference << " -> " << path);
//! MODLOAD_LOG_WARN("cache", "stale cache entry for " << path);
//! ```

#ifndef MODLOAD_LOG_HPP
#define MODLOAD_LOG_HPP

#include <atomic>
#include <chrono>
#include <cstdint>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <memory>
#include <mutex>
#include <sstream>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace modload::log {

// ============================================================================
// Log Levels
// ============================================================================

/// Log severity levels in ascending order.
enum class LogLevel : int {
    Trace = 0,
    Debug = 1,
    Info = 2,
    Warn = 3,
    Error = 4,
    Fatal = 5,
    Off = 6 ///< Disables all logging
};

/// Returns the upper-case name of a level ("TRACE", "DEBUG", ...).
inline const char* level_name(LogLevel level) {
    switch (level) {
    case LogLevel::Trace:
        return "TRACE";
    case LogLevel::Debug:
        return "DEBUG";
    case LogLevel::Info:
        return "INFO";
    case LogLevel::Warn:
        return "WARN";
    case LogLevel::Error:
        return "ERROR";
    case LogLevel::Fatal:
        return "FATAL";
    case LogLevel::Off:
        return "OFF";
    }
    return "???";
}

/// Parses a level name (lower or upper case). Unknown names map to Info.
inline LogLevel parse_level(std::string_view s) {
    if (s == "trace" || s == "TRACE")
        return LogLevel::Trace;
    if (s == "debug" || s == "DEBUG")
        return LogLevel::Debug;
    if (s == "info" || s == "INFO")
        return LogLevel::Info;
    if (s == "warn" || s == "WARN")
        return LogLevel::Warn;
    if (s == "error" || s == "ERROR")
        return LogLevel::Error;
    if (s == "fatal" || s == "FATAL")
        return LogLevel::Fatal;
    if (s == "off" || s == "OFF")
        return LogLevel::Off;
    return LogLevel::Info;
}

// ============================================================================
// Log Record
// ============================================================================

/// A single log message with metadata.
struct LogRecord {
    LogLevel level;
    std::string_view module; ///< Module tag ("loader", "native", "cache", "cli")
    std::string message;
    const char* file;
    int line;
    int64_t timestamp_ms; ///< Milliseconds since epoch
};

/// Output format for log messages.
enum class LogFormat {
    Text, ///< Human-readable text with optional ANSI colors
    JSON  ///< One JSON object per line
};

// ============================================================================
// Log Sinks
// ============================================================================

/// Destination for log records.
class LogSink {
public:
    virtual ~LogSink() = default;

    virtual void write(const LogRecord& record) = 0;
    virtual void flush() = 0;
};

/// Writes to stderr, colored when stderr is a terminal.
class ConsoleSink : public LogSink {
public:
    explicit ConsoleSink(bool use_colors = true);

    void write(const LogRecord& record) override;
    void flush() override;

    void set_format(LogFormat format) {
        format_ = format;
    }

private:
    bool colors_enabled_;
    LogFormat format_ = LogFormat::Text;

    const char* level_color(LogLevel level) const;
};

/// Appends to a file. Flushes after every Error or Fatal record.
class FileSink : public LogSink {
public:
    explicit FileSink(const std::string& path, bool append = true);
    ~FileSink() override;

    void write(const LogRecord& record) override;
    void flush() override;

    bool is_open() const {
        return file_.is_open();
    }

    void set_format(LogFormat format) {
        format_ = format;
    }

private:
    std::ofstream file_;
    LogFormat format_ = LogFormat::Text;
};

/// Discards everything.
class NullSink : public LogSink {
public:
    void write(const LogRecord& /*record*/) override {}
    void flush() override {}
};

/// Renders a record as a single text line (without trailing newline).
std::string format_text(const LogRecord& record);

/// Renders a record as a single JSON object (without trailing newline).
std::string format_json(const LogRecord& record);

// ============================================================================
// Log Filter
// ============================================================================

/// Module-based level filter.
///
/// Spec strings look like "loader=trace,cache=debug,*=warn". A bare module
/// name ("loader") enables everything for that module.
class LogFilter {
public:
    LogFilter() = default;

    void parse(std::string_view spec);

    bool should_log(LogLevel level, std::string_view module) const;

    void set_default_level(LogLevel level) {
        default_level_ = level;
    }

    LogLevel default_level() const {
        return default_level_;
    }

    /// Lowest level any module (or the default) accepts.
    LogLevel min_level() const {
        LogLevel min = default_level_;
        for (const auto& [_, level] : module_levels_) {
            if (level < min)
                min = level;
        }
        return min;
    }

private:
    LogLevel default_level_ = LogLevel::Info;
    std::unordered_map<std::string, LogLevel> module_levels_;
};

// ============================================================================
// Logger Configuration
// ============================================================================

struct LogConfig {
    LogLevel level = LogLevel::Info;
    LogFormat format = LogFormat::Text;
    std::string filter_spec; ///< Module filter string
    std::string log_file;    ///< Empty = no file sink
    bool console = true;
    bool colors = true;
};

// ============================================================================
// Logger Singleton
// ============================================================================

/// Thread-safe process-wide logger.
class Logger {
public:
    /// Replaces the sinks and filter of the global logger.
    static void init(const LogConfig& config);

    static Logger& instance();

    /// Fast-path check used by the macros before building the message.
    bool should_log(LogLevel level, std::string_view module) const;

    void log(const LogRecord& record);

    void log(LogLevel level, std::string_view module, const std::string& message, const char* file,
             int line);

    void add_sink(std::unique_ptr<LogSink> sink);

    /// Removes every sink. Subsequent records are dropped.
    void clear_sinks();

    void set_level(LogLevel level);

    LogLevel level() const {
        return level_.load(std::memory_order_relaxed);
    }

    void set_filter(std::string_view spec);

    void flush();

private:
    Logger() = default;

    std::atomic<LogLevel> level_{LogLevel::Info};
    LogFilter filter_;
    std::vector<std::unique_ptr<LogSink>> sinks_;
    mutable std::mutex mutex_;
};

// ============================================================================
// Timestamp Helpers
// ============================================================================

/// Current local time as "HH:MM:SS.mmm".
inline std::string get_timestamp() {
    auto now = std::chrono::system_clock::now();
    auto now_c = std::chrono::system_clock::to_time_t(now);
    auto now_ms =
        std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()) % 1000;

    std::tm tm_buf;
#ifdef _WIN32
    localtime_s(&tm_buf, &now_c);
#else
    localtime_r(&now_c, &tm_buf);
#endif

    std::ostringstream oss;
    oss << std::put_time(&tm_buf, "%H:%M:%S") << '.' << std::setfill('0') << std::setw(3)
        << now_ms.count();
    return oss.str();
}

inline int64_t epoch_ms() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
               std::chrono::system_clock::now().time_since_epoch())
        .count();
}

// ============================================================================
// CLI Parsing
// ============================================================================

/// Extracts --log-level, --log-filter, --log-file, --log-format, -v/-vv/-vvv
/// and -q from argv. Falls back to the MODLOAD_LOG environment variable.
LogConfig parse_log_options(int argc, char* argv[]);

/// True if `arg` is one of the options `parse_log_options` consumes.
bool is_log_option(std::string_view arg);

// ============================================================================
// Logging Macros
// ============================================================================

// Values: 0=Trace, 1=Debug, 2=Info, 3=Warn, 4=Error, 5=Fatal, 6=Off
#ifndef MODLOAD_MIN_LOG_LEVEL
#define MODLOAD_MIN_LOG_LEVEL 0
#endif

/// Internal macro, do not use directly.
#define MODLOAD_LOG_IMPL(level, module_str, msg)                                                   \
    do {                                                                                           \
        if (static_cast<int>(level) >= MODLOAD_MIN_LOG_LEVEL) {                                    \
            auto& logger_ = ::modload::log::Logger::instance();                                    \
            if (logger_.should_log(level, module_str)) {                                           \
                std::ostringstream oss_;                                                           \
                oss_ << msg;                                                                       \
                logger_.log(level, module_str, oss_.str(), __FILE__, __LINE__);                    \
            }                                                                                      \
        }                                                                                          \
    } while (0)

#define MODLOAD_LOG_TRACE(module, msg) MODLOAD_LOG_IMPL(::modload::log::LogLevel::Trace, module, msg)
#define MODLOAD_LOG_DEBUG(module, msg) MODLOAD_LOG_IMPL(::modload::log::LogLevel::Debug, module, msg)
#define MODLOAD_LOG_INFO(module, msg) MODLOAD_LOG_IMPL(::modload::log::LogLevel::Info, module, msg)
#define MODLOAD_LOG_WARN(module, msg) MODLOAD_LOG_IMPL(::modload::log::LogLevel::Warn, module, msg)
#define MODLOAD_LOG_ERROR(module, msg) MODLOAD_LOG_IMPL(::modload::log::LogLevel::Error, module, msg)
#define MODLOAD_LOG_FATAL(module, msg) MODLOAD_LOG_IMPL(::modload::log::LogLevel::Fatal, module, msg)

} // namespace modload::log

#endif // MODLOAD_LOG_HPP
