//! # Logger Implementation
//!
//! Record formatting, the sinks, the module filter and the Logger singleton.

#include "log/log.hpp"

#include <chrono>
#include <cstdlib>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <utility>

#include <unistd.h>

namespace comexe::log {

const char* level_name(LogLevel level) {
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

LogLevel parse_level(std::string_view s) {
    static constexpr std::pair<std::string_view, LogLevel> names[] = {
        {"trace", LogLevel::Trace}, {"debug", LogLevel::Debug}, {"info", LogLevel::Info},
        {"warn", LogLevel::Warn},   {"error", LogLevel::Error}, {"fatal", LogLevel::Fatal},
        {"off", LogLevel::Off},
    };
    std::string lowered(s);
    for (auto& c : lowered) {
        if (c >= 'A' && c <= 'Z')
            c = static_cast<char>(c - 'A' + 'a');
    }
    for (const auto& [name, level] : names) {
        if (lowered == name)
            return level;
    }
    return LogLevel::Info;
}

std::string get_timestamp() {
    auto now = std::chrono::system_clock::now();
    auto now_c = std::chrono::system_clock::to_time_t(now);
    auto now_ms =
        std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()) % 1000;

    std::tm tm_buf;
    localtime_r(&now_c, &tm_buf);

    std::ostringstream oss;
    oss << std::put_time(&tm_buf, "%H:%M:%S") << '.' << std::setfill('0') << std::setw(3)
        << now_ms.count();
    return oss.str();
}

int64_t epoch_ms() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
               std::chrono::system_clock::now().time_since_epoch())
        .count();
}

// ============================================================================
// Formatting
// ============================================================================

static const char* level_color(LogLevel level) {
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

static void append_json_escaped(std::ostringstream& oss, std::string_view text) {
    for (char c : text) {
        switch (c) {
        case '"':
            oss << "\\\"";
            break;
        case '\\':
            oss << "\\\\";
            break;
        case '\n':
            oss << "\\n";
            break;
        case '\r':
            oss << "\\r";
            break;
        case '\t':
            oss << "\\t";
            break;
        default:
            oss << c;
        }
    }
}

std::string format_record(const LogRecord& record, LogFormat format, bool colors) {
    std::ostringstream oss;
    if (format == LogFormat::JSON) {
        oss << "{\"ts\":" << record.timestamp_ms << ",\"level\":\"" << level_name(record.level)
            << "\",\"module\":\"";
        append_json_escaped(oss, record.module);
        oss << "\",\"msg\":\"";
        append_json_escaped(oss, record.message);
        oss << "\"}\n";
        return oss.str();
    }

    oss << get_timestamp() << ' ';
    if (colors)
        oss << level_color(record.level);
    oss << std::left << std::setw(5) << level_name(record.level);
    if (colors)
        oss << "\033[0m";
    oss << " [" << record.module << "] " << record.message << '\n';
    return oss.str();
}

// ============================================================================
// Sinks
// ============================================================================

static bool stderr_supports_colors() {
    if (!isatty(fileno(stderr)))
        return false;
    const char* term = std::getenv("TERM");
    return term && std::string_view(term) != "dumb";
}

ConsoleSink::ConsoleSink(bool use_colors)
    : colors_enabled_(use_colors && stderr_supports_colors()) {}

void ConsoleSink::write(const LogRecord& record) {
    std::cerr << format_record(record, format_, colors_enabled_);
}

void ConsoleSink::flush() {
    std::cerr.flush();
}

FileSink::FileSink(const std::string& path, bool append)
    : file_(path, append ? (std::ios::out | std::ios::app) : std::ios::out) {}

void FileSink::write(const LogRecord& record) {
    if (!file_.is_open())
        return;
    file_ << format_record(record, format_, false);
    if (record.level >= LogLevel::Error)
        file_.flush();
}

void FileSink::flush() {
    if (file_.is_open())
        file_.flush();
}

void MultiSink::write(const LogRecord& record) {
    for (auto& sink : sinks_)
        sink->write(record);
}

void MultiSink::flush() {
    for (auto& sink : sinks_)
        sink->flush();
}

void MultiSink::add(std::unique_ptr<LogSink> sink) {
    sinks_.push_back(std::move(sink));
}

std::unique_ptr<LogSink> make_sink(const LogConfig& config) {
    auto multi = std::make_unique<MultiSink>();

    if (config.console) {
        auto console = std::make_unique<ConsoleSink>(config.colors);
        console->set_format(config.format);
        multi->add(std::move(console));
    }

    if (!config.log_file.empty()) {
        auto file = std::make_unique<FileSink>(config.log_file);
        file->set_format(config.format);
        if (file->is_open()) {
            multi->add(std::move(file));
        } else {
            std::cerr << "warning: could not open log file: " << config.log_file << "\n";
        }
    }

    if (multi->size() == 0)
        return std::make_unique<NullSink>();
    return multi;
}

// ============================================================================
// LogFilter
// ============================================================================

void LogFilter::parse(std::string_view spec) {
    module_levels_.clear();

    size_t pos = 0;
    while (pos < spec.size()) {
        size_t comma = spec.find(',', pos);
        if (comma == std::string_view::npos)
            comma = spec.size();

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
    if (it != module_levels_.end())
        return level >= it->second;
    return level >= default_level_;
}

LogLevel LogFilter::min_level() const {
    LogLevel min = default_level_;
    for (const auto& [_, level] : module_levels_) {
        if (level < min)
            min = level;
    }
    return min;
}

// ============================================================================
// Logger
// ============================================================================

Logger::Logger() {
    filter_.set_default_level(level_);
    sinks_.push_back(std::make_unique<ConsoleSink>());
}

Logger& Logger::instance() {
    static Logger logger;
    return logger;
}

void Logger::init(const LogConfig& config) {
    auto& logger = instance();
    std::lock_guard<std::mutex> lock(logger.mutex_);

    logger.sinks_.clear();
    logger.level_ = config.level;
    logger.filter_ = LogFilter{};
    logger.filter_.set_default_level(config.level);

    if (!config.filter_spec.empty()) {
        logger.filter_.parse(config.filter_spec);
        // A filter without "*=" keeps the requested level as default.
        if (config.level < logger.filter_.default_level())
            logger.filter_.set_default_level(config.level);
        logger.level_ = logger.filter_.min_level();
    }

    logger.sinks_.push_back(make_sink(config));
}

bool Logger::should_log(LogLevel level, std::string_view module) const {
    if (level < level_)
        return false;
    std::lock_guard<std::mutex> lock(mutex_);
    return filter_.should_log(level, module);
}

void Logger::log(const LogRecord& record) {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& sink : sinks_)
        sink->write(record);
}

void Logger::log(LogLevel level, std::string_view module, const std::string& message,
                 const char* file, int line) {
    log(LogRecord{level, module, message, file, line, epoch_ms()});
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

void Logger::set_filter(std::string_view spec) {
    std::lock_guard<std::mutex> lock(mutex_);
    filter_.parse(spec);
    level_ = filter_.min_level();
}

void Logger::flush() {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& sink : sinks_)
        sink->flush();
}

} // namespace comexe::log
