//! # jsonapi Logging
//!
//! Structured, module-tagged logging for the codec and its tools:
//! - 6 log levels (Trace, Debug, Info, Warn, Error, Fatal) plus Off
//! - Per-module filtering (`"linkage=trace,*=warn"`)
//! - Console (stderr) and file sinks, text or one JSON object per line
//! - Thread-safe dispatch through a global `Logger`
//! - Compile-time elision via `JSONAPI_MIN_LOG_LEVEL`
//!
//! ## Usage
//!
//! ```cpp
//! JSONAPI_LOG_DEBUG("codec", "primary data shape: " << data_shape_name(shape));
//! JSONAPI_LOG_TRACE("linkage", "visit " << identity);
//! ```
//!
//! Module tags used by the library are `codec`, `linkage` and `cli`.

#ifndef JSONAPI_LOG_HPP
#define JSONAPI_LOG_HPP

#include <cstdint>
#include <fstream>
#include <memory>
#include <mutex>
#include <sstream>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace jsonapi::log {

// ============================================================================
// Log Levels
// ============================================================================

/// Log severity levels in ascending order.
enum class LogLevel : int {
    Trace = 0, ///< Per-node traversal detail
    Debug = 1, ///< Decisions such as the resolved primary data shape
    Info = 2,  ///< General informational messages
    Warn = 3,  ///< Suspicious but accepted input
    Error = 4, ///< Failed operations
    Fatal = 5, ///< Unrecoverable errors
    Off = 6    ///< Disables all logging
};

/// Returns the upper-case name of a level (e.g. "DEBUG").
const char* level_name(LogLevel level);

/// Parses a level name, ignoring case. Unknown names map to `LogLevel::Info`.
LogLevel parse_level(std::string_view s);

// ============================================================================
// Log Record
// ============================================================================

/// A single log message with metadata.
struct LogRecord {
    LogLevel level;          ///< Severity level
    std::string_view module; ///< Module tag (e.g. "codec")
    std::string message;     ///< Formatted message text
    const char* file;        ///< Source file (__FILE__)
    int line;                ///< Source line (__LINE__)
    int64_t timestamp_ms;    ///< Milliseconds since epoch
};

/// Output format for log messages.
enum class LogFormat {
    Text, ///< `HH:MM:SS.mmm LEVEL [module] message`
    JSON  ///< `{"ts":...,"level":"...","module":"...","msg":"..."}`
};

/// Renders a record as a single line, including the trailing newline.
std::string format_record(const LogRecord& record, LogFormat format, bool colors = false);

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

/// Writes to stderr, with ANSI colours when stderr is a colour terminal.
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

/// Appends to a file. Flushes immediately on Error and Fatal.
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

// ============================================================================
// Log Filter
// ============================================================================

/// Module-based level filter.
///
/// Filter strings look like `"codec=debug,linkage=trace,*=warn"`. A bare
/// module name enables everything for that module.
class LogFilter {
public:
    void parse(std::string_view text);

    bool should_log(LogLevel level, std::string_view module) const;

    void set_default_level(LogLevel level) {
        default_level_ = level;
    }

    LogLevel default_level() const {
        return default_level_;
    }

    /// Lowest level any module (or the default) accepts.
    LogLevel min_level() const;

private:
    LogLevel default_level_ = LogLevel::Info;
    std::unordered_map<std::string, LogLevel> module_levels_;
};

// ============================================================================
// Logger
// ============================================================================

/// Logger configuration, usually built by `parse_log_options`.
struct LogConfig {
    LogLevel level = LogLevel::Warn;    ///< Global minimum log level
    LogFormat format = LogFormat::Text; ///< Output format
    std::string filter_spec;            ///< Module filter string
    std::string log_file;               ///< Path to log file (empty = none)
    bool console = true;                ///< Enable stderr output
    bool colors = true;                 ///< Enable ANSI colours on stderr
};

/// Thread-safe global logger.
///
/// Usable without `init()`: it then has no sinks and drops every record.
class Logger {
public:
    /// Replaces sinks, level and filter from `config`.
    static void init(const LogConfig& config);

    static Logger& instance();

    /// Fast-path check used by the macros before building the message.
    bool should_log(LogLevel level, std::string_view module) const;

    void log(const LogRecord& record);

    void log(LogLevel level, std::string_view module, const std::string& message, const char* file,
             int line);

    void add_sink(std::unique_ptr<LogSink> sink);

    /// Removes every sink (records are dropped until one is added).
    void clear_sinks();

    void set_level(LogLevel level);

    LogLevel level() const {
        return level_;
    }

    void set_filter(std::string_view text);

    void flush();

private:
    Logger() = default;

    LogLevel level_ = LogLevel::Warn;
    LogFilter filter_;
    std::vector<std::unique_ptr<LogSink>> sinks_;
    mutable std::mutex mutex_;
};

/// Returns current local time formatted as "HH:MM:SS.mmm".
std::string get_timestamp();

/// Returns milliseconds since epoch.
int64_t epoch_ms();

// ============================================================================
// Option Parsing
// ============================================================================

/// Extracts logging options from argv: --log-level=, --log-filter=,
/// --log-file=, --log-format=, -v/-vv/-vvv, -q/--quiet. Falls back to the
/// JSONAPI_LOG environment variable when no level or filter was given.
LogConfig parse_log_options(int argc, char* argv[]);

// ============================================================================
// Logging Macros
// ============================================================================

// 0=Trace, 1=Debug, 2=Info, 3=Warn, 4=Error, 5=Fatal, 6=Off
#ifndef JSONAPI_MIN_LOG_LEVEL
#define JSONAPI_MIN_LOG_LEVEL 0
#endif

/// Internal macro, use the level-specific ones below.
#define JSONAPI_LOG_IMPL(level, module_str, msg)                                                   \
    do {                                                                                           \
        if (static_cast<int>(level) >= JSONAPI_MIN_LOG_LEVEL) {                                    \
            auto& logger_ = ::jsonapi::log::Logger::instance();                                    \
            if (logger_.should_log(level, module_str)) {                                           \
                std::ostringstream oss_;                                                           \
                oss_ << msg;                                                                       \
                logger_.log(level, module_str, oss_.str(), __FILE__, __LINE__);                    \
            }                                                                                      \
        }                                                                                          \
    } while (0)

#define JSONAPI_LOG_TRACE(module, msg)                                                             \
    JSONAPI_LOG_IMPL(::jsonapi::log::LogLevel::Trace, module, msg)

#define JSONAPI_LOG_DEBUG(module, msg)                                                             \
    JSONAPI_LOG_IMPL(::jsonapi::log::LogLevel::Debug, module, msg)

#define JSONAPI_LOG_INFO(module, msg)                                                              \
    JSONAPI_LOG_IMPL(::jsonapi::log::LogLevel::Info, module, msg)

#define JSONAPI_LOG_WARN(module, msg)                                                              \
    JSONAPI_LOG_IMPL(::jsonapi::log::LogLevel::Warn, module, msg)

#define JSONAPI_LOG_ERROR(module, msg)                                                             \
    JSONAPI_LOG_IMPL(::jsonapi::log::LogLevel::Error, module, msg)

} // namespace jsonapi::log

#endif // JSONAPI_LOG_HPP
