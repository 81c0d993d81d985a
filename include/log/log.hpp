//! # ComEXE Logging
//!
//! Structured, module-tagged logging shared by the loader components:
//! - 6 severities (Trace, Debug, Info, Warn, Error, Fatal)
//! - per-module filtering ("vio=trace,*=warn")
//! - console, file, fan-out and null sinks; text or JSON lines
//! - compile-time elision via COMEXE_MIN_LOG_LEVEL
//!
//! ## Usage
//!
//! ```cpp
//! COMEXE_LOG_DEBUG("loader", "resolved " << module << " from " << location);
//! COMEXE_LOG_TRACE("vio", "READ fd=" << fd << " -> " << n);
//! ```

#ifndef COMEXE_LOG_HPP
#define COMEXE_LOG_HPP

#include <cstdint>
#include <fstream>
#include <memory>
#include <mutex>
#include <sstream>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace comexe::log {

// ============================================================================
// Log Levels
// ============================================================================

enum class LogLevel : int {
    Trace = 0, ///< Per-event tracing (virtual file events, candidate probes)
    Debug = 1, ///< Resolution decisions
    Info = 2,  ///< Configuration changes
    Warn = 3,  ///< Recoverable anomalies
    Error = 4, ///< Failed operations
    Fatal = 5, ///< Process is about to exit
    Off = 6    ///< Disables all logging
};

const char* level_name(LogLevel level);

/// Parses a level name (lower or upper case). Unknown names yield Info.
LogLevel parse_level(std::string_view s);

// ============================================================================
// Log Record
// ============================================================================

struct LogRecord {
    LogLevel level;
    std::string_view module;
    std::string message;
    const char* file;
    int line;
    int64_t timestamp_ms;
};

enum class LogFormat {
    Text, ///< "HH:MM:SS.mmm LEVEL [module] message"
    JSON  ///< One object per line
};

/// Renders a record as one line (with trailing newline).
std::string format_record(const LogRecord& record, LogFormat format, bool colors);

// ============================================================================
// Log Sinks
// ============================================================================

class LogSink {
public:
    virtual ~LogSink() = default;
    virtual void write(const LogRecord& record) = 0;
    virtual void flush() = 0;
};

/// Writes to stderr; colours are used only when stderr is a terminal.
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
};

/// Appends to a file. Flushes after Error and Fatal records.
class FileSink : public LogSink {
public:
    explicit FileSink(const std::string& path, bool append = true);

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

class NullSink : public LogSink {
public:
    void write(const LogRecord& /*record*/) override {}
    void flush() override {}
};

class MultiSink : public LogSink {
public:
    void write(const LogRecord& record) override;
    void flush() override;

    void add(std::unique_ptr<LogSink> sink);

    size_t size() const {
        return sinks_.size();
    }

private:
    std::vector<std::unique_ptr<LogSink>> sinks_;
};

// ============================================================================
// Log Filter
// ============================================================================

/// Module-based level filter.
///
/// Accepts "module=level" pairs separated by commas. "*" sets the default
/// level; a bare module name enables Trace for that module.
class LogFilter {
public:
    void parse(std::string_view spec);

    bool should_log(LogLevel level, std::string_view module) const;

    void set_default_level(LogLevel level) {
        default_level_ = level;
    }
    LogLevel default_level() const {
        return default_level_;
    }

    /// Lowest level accepted by any module, used by the logger's fast path.
    LogLevel min_level() const;

private:
    LogLevel default_level_ = LogLevel::Info;
    std::unordered_map<std::string, LogLevel> module_levels_;
};

// ============================================================================
// Logger
// ============================================================================

struct LogConfig {
    LogLevel level = LogLevel::Warn;
    LogFormat format = LogFormat::Text;
    std::string filter_spec;
    std::string log_file;
    bool console = true;
    bool colors = true;
};

/// Sink for `config`: the console and file sinks it enables behind one
/// MultiSink, or a NullSink when it enables neither.
std::unique_ptr<LogSink> make_sink(const LogConfig& config);

/// Process-wide logger. Usable before `init()`; it then logs Warn and
/// above to the console.
class Logger {
public:
    static void init(const LogConfig& config);
    static Logger& instance();

    bool should_log(LogLevel level, std::string_view module) const;

    void log(const LogRecord& record);
    void log(LogLevel level, std::string_view module, const std::string& message, const char* file,
             int line);

    void add_sink(std::unique_ptr<LogSink> sink);

    /// Drops every sink. Used by tests to capture output.
    void clear_sinks();

    void set_level(LogLevel level);
    LogLevel level() const {
        return level_;
    }

    void set_filter(std::string_view spec);

    void flush();

private:
    Logger();

    LogLevel level_ = LogLevel::Warn;
    LogFilter filter_;
    std::vector<std::unique_ptr<LogSink>> sinks_;
    mutable std::mutex mutex_;
};

/// "HH:MM:SS.mmm" in local time.
std::string get_timestamp();

int64_t epoch_ms();

// ============================================================================
// CLI Parsing
// ============================================================================

/// Extracts --log-level, --log-filter, --log-file, --log-format, -v/-vv/-vvv
/// and -q from argv, falling back to the COMEXE_LOG environment variable.
LogConfig parse_log_options(int argc, char* argv[]);

/// True for the arguments consumed by `parse_log_options`.
bool is_log_option(std::string_view arg);

// ============================================================================
// Logging Macros
// ============================================================================

// Values: 0=Trace, 1=Debug, 2=Info, 3=Warn, 4=Error, 5=Fatal, 6=Off
#ifndef COMEXE_MIN_LOG_LEVEL
#define COMEXE_MIN_LOG_LEVEL 0
#endif

#define COMEXE_LOG_IMPL(level, module_str, msg)                                                    \
    do {                                                                                           \
        if (static_cast<int>(level) >= COMEXE_MIN_LOG_LEVEL) {                                     \
            auto& logger_ = ::comexe::log::Logger::instance();                                     \
            if (logger_.should_log(level, module_str)) {                                           \
                std::ostringstream oss_;                                                           \
                oss_ << msg;                                                                       \
                logger_.log(level, module_str, oss_.str(), __FILE__, __LINE__);                    \
            }                                                                                      \
        }                                                                                          \
    } while (0)

#define COMEXE_LOG_TRACE(module, msg) COMEXE_LOG_IMPL(::comexe::log::LogLevel::Trace, module, msg)
#define COMEXE_LOG_DEBUG(module, msg) COMEXE_LOG_IMPL(::comexe::log::LogLevel::Debug, module, msg)
#define COMEXE_LOG_INFO(module, msg) COMEXE_LOG_IMPL(::comexe::log::LogLevel::Info, module, msg)
#define COMEXE_LOG_WARN(module, msg) COMEXE_LOG_IMPL(::comexe::log::LogLevel::Warn, module, msg)
#define COMEXE_LOG_ERROR(module, msg) COMEXE_LOG_IMPL(::comexe::log::LogLevel::Error, module, msg)
#define COMEXE_LOG_FATAL(module, msg) COMEXE_LOG_IMPL(::comexe::log::LogLevel::Fatal, module, msg)

} // namespace comexe::log

#endif // COMEXE_LOG_HPP
