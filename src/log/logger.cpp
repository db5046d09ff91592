//! # Logger Implementation
//!
//! Logger singleton, sinks, record formatting and LogFilter.

#include "modload/log/log.hpp"

#include <cstdlib>
#include <iostream>

#ifdef _WIN32
#ifndef NOMINMAX
#define NOMINMAX
#endif
#include <io.h>
#include <windows.h>
#define MODLOAD_ISATTY(fd) _isatty(fd)
#define MODLOAD_FILENO(f) _fileno(f)
#else
#include <unistd.h>
#define MODLOAD_ISATTY(fd) isatty(fd)
#define MODLOAD_FILENO(f) fileno(f)
#endif

namespace modload::log {

// ============================================================================
// Terminal Color Detection
// ============================================================================

static bool detect_terminal_colors() {
#ifdef _WIN32
    HANDLE hOut = GetStdHandle(STD_ERROR_HANDLE);
    if (hOut == INVALID_HANDLE_VALUE)
        return false;

    DWORD dwMode = 0;
    if (!GetConsoleMode(hOut, &dwMode))
        return false;

    dwMode |= ENABLE_VIRTUAL_TERMINAL_PROCESSING;
    if (SetConsoleMode(hOut, dwMode))
        return true;

    return MODLOAD_ISATTY(MODLOAD_FILENO(stderr)) != 0;
#else
    if (!MODLOAD_ISATTY(MODLOAD_FILENO(stderr)))
        return false;

    const char* term = std::getenv("TERM");
    return term && std::string_view(term) != "dumb";
#endif
}

// ============================================================================
// Record Formatting
// ============================================================================

static void append_json_escaped(std::string& out, std::string_view text) {
    for (char c : text) {
        switch (c) {
        case '"':
            out += "\\\"";
            break;
        case '\\':
            out += "\\\\";
            break;
        case '\n':
            out += "\\n";
            break;
        case '\r':
            out += "\\r";
            break;
        case '\t':
            out += "\\t";
            break;
        default:
            out += c;
        }
    }
}

std::string format_text(const LogRecord& record) {
    std::ostringstream oss;
    oss << get_timestamp() << " " << std::left << std::setw(5) << level_name(record.level) << " ["
        << record.module << "] " << record.message;
    return oss.str();
}

std::string format_json(const LogRecord& record) {
    std::string out = "{\"ts\":" + std::to_string(record.timestamp_ms) + ",\"level\":\"" +
                      level_name(record.level) + "\",\"module\":\"";
    append_json_escaped(out, record.module);
    out += "\",\"msg\":\"";
    append_json_escaped(out, record.message);
    out += "\"}";
    return out;
}

// ============================================================================
// ConsoleSink
// ============================================================================

ConsoleSink::ConsoleSink(bool use_colors)
    : colors_enabled_(use_colors && detect_terminal_colors()) {}

const char* ConsoleSink::level_color(LogLevel level) const {
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
        return "\033[31m";
    case LogLevel::Fatal:
        return "\033[1;31m";
    case LogLevel::Off:
        return "";
    }
    return "";
}

void ConsoleSink::write(const LogRecord& record) {
    if (format_ == LogFormat::JSON) {
        std::cerr << format_json(record) << "\n";
        return;
    }

    std::ostringstream oss;
    oss << get_timestamp() << " ";
    if (colors_enabled_) {
        oss << level_color(record.level);
    }
    oss << std::left << std::setw(5) << level_name(record.level);
    if (colors_enabled_) {
        oss << "\033[0m";
    }
    oss << " [" << record.module << "] " << record.message << "\n";
    std::cerr << oss.str();
}

void ConsoleSink::flush() {
    std::cerr.flush();
}

// ============================================================================
// FileSink
// ============================================================================

FileSink::FileSink(const std::string& path, bool append)
    : file_(path, append ? (std::ios::out | std::ios::app) : std::ios::out) {}

FileSink::~FileSink() {
    if (file_.is_open()) {
        file_.flush();
    }
}

void FileSink::write(const LogRecord& record) {
    if (!file_.is_open())
        return;

    file_ << (format_ == LogFormat::JSON ? format_json(record) : format_text(record)) << "\n";

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

void LogFilter::parse(std::string_view spec) {
    module_levels_.clear();

    size_t pos = 0;
    while (pos < spec.size()) {
        size_t comma = spec.find(',', pos);
        if (comma == std::string_view::npos) {
            comma = spec.size();
        }

        auto token = spec.substr(pos, comma - pos);
        size_t eq = token.find('=');

        if (eq != std::string_view::npos) {
            auto mod = token.substr(0, eq);
            auto lvl = parse_level(token.substr(eq + 1));
            if (mod == "*") {
                default_level_ = lvl;
            } else {
                module_levels_[std::string(mod)] = lvl;
            }
        } else if (!token.empty()) {
            module_levels_[std::string(token)] = LogLevel::Trace;
        }

        pos = comma + 1;
    }
}

bool LogFilter::should_log(LogLevel level, std::string_view module) const {
    auto it = module_levels_.find(std::string(module));
    if (it != module_levels_.end()) {
        return level >= it->second;
    }
    return level >= default_level_;
}

// ============================================================================
// Logger
// ============================================================================

Logger& Logger::instance() {
    static Logger logger;
    return logger;
}

void Logger::init(const LogConfig& config) {
    auto& logger = instance();
    std::lock_guard<std::mutex> lock(logger.mutex_);

    logger.sinks_.clear();
    logger.filter_ = LogFilter{};
    logger.filter_.set_default_level(config.level);

    // Without "*=level" the filter keeps config.level as its default.
    if (!config.filter_spec.empty()) {
        logger.filter_.parse(config.filter_spec);
    }
    logger.level_.store(logger.filter_.min_level(), std::memory_order_relaxed);

    if (config.console) {
        auto console = std::make_unique<ConsoleSink>(config.colors);
        console->set_format(config.format);
        logger.sinks_.push_back(std::move(console));
    }

    if (!config.log_file.empty()) {
        auto file = std::make_unique<FileSink>(config.log_file);
        file->set_format(config.format);
        if (file->is_open()) {
            logger.sinks_.push_back(std::move(file));
        } else {
            std::cerr << "warning: could not open log file: " << config.log_file << "\n";
        }
    }
}

bool Logger::should_log(LogLevel level, std::string_view module) const {
    if (level < level_.load(std::memory_order_relaxed))
        return false;

    std::lock_guard<std::mutex> lock(mutex_);
    return !sinks_.empty() && filter_.should_log(level, module);
}

void Logger::log(const LogRecord& record) {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& sink : sinks_) {
        sink->write(record);
    }
}

void Logger::log(LogLevel level, std::string_view module, const std::string& message,
                 const char* file, int line) {
    LogRecord record;
    record.level = level;
    record.module = module;
    record.message = message;
    record.file = file;
    record.line = line;
    record.timestamp_ms = epoch_ms();

    log(record);
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
    level_.store(level, std::memory_order_relaxed);
    filter_.set_default_level(level);
}

void Logger::set_filter(std::string_view spec) {
    std::lock_guard<std::mutex> lock(mutex_);
    filter_.parse(spec);
    level_.store(filter_.min_level(), std::memory_order_relaxed);
}

void Logger::flush() {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& sink : sinks_) {
        sink->flush();
    }
}

} // namespace modload::log
