//! # vydoc Logging
//!
//! Module-tagged logging used by the extractor, the directory driver and
//! the command line:
//! - 6 log levels (Trace, Debug, Info, Warn, Error, Fatal)
//! - Per-module filtering ("extract=debug,*=warn")
//! - Console, file and null sinks, text or JSON lines
//! - Compile-time level elision via VYDOC_MIN_LOG_LEVEL
//!
//! ## Usage
//!
//! ```cpp
//! VYDOC_LOG_INFO("driver", "Scanning " << root);
//! VYDOC_LOG_WARN("extract", name << ": '" << type << "' is not a known type");
//! ```

#ifndef VYDOC_LOG_HPP
#define VYDOC_LOG_HPP

#include <cstdint>
#include <fstream>
#include <memory>
#include <mutex>
#include <sstream>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace vydoc::log {

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

/// Returns the upper-case name of a level ("TRACE", "WARN", ...).
[[nodiscard]] auto level_name(LogLevel level) -> const char*;

/// Parses a level name in either case. Unknown names map to Info.
[[nodiscard]] auto parse_level(std::string_view s) -> LogLevel;

// ============================================================================
// Log Record
// ============================================================================

/// A single log message with metadata.
struct LogRecord {
    LogLevel level;          ///< Severity level
    std::string_view module; ///< Module tag (e.g., "extract", "driver")
    std::string message;     ///< Formatted message text
    const char* file;        ///< Source file (__FILE__)
    int line;                ///< Source line (__LINE__)
    int64_t timestamp_ms;    ///< Milliseconds since epoch
};

/// Output format for log messages.
enum class LogFormat {
    Text, ///< "HH:MM:SS.mmm LEVEL [module] message"
    JSON  ///< One JSON object per line
};

/// Renders a record as a single line (newline included).
[[nodiscard]] auto format_record(const LogRecord& record, LogFormat format) -> std::string;

// ============================================================================
// Log Sinks
// ============================================================================

/// Abstract base class for log output destinations.
class LogSink {
public:
    virtual ~LogSink() = default;

    virtual void write(const LogRecord& record) = 0;
    virtual void flush() = 0;
};

/// Writes to stderr, colorizing the level when stderr is a terminal.
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

/// Appends to a file. Flushes after every Error or Fatal record.
class FileSink : public LogSink {
public:
    explicit FileSink(const std::string& path, bool append = true);
    ~FileSink() override;

    void write(const LogRecord& record) override;
    void flush() override;

    [[nodiscard]] bool is_open() const {
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

/// Module-based log level filter.
///
/// Parses specs like "extract=trace,driver=debug,*=warn". A bare module
/// name enables Trace for that module.
class LogFilter {
public:
    LogFilter() = default;

    void parse(std::string_view spec);

    [[nodiscard]] bool should_log(LogLevel level, std::string_view module) const;

    void set_default_level(LogLevel level) {
        default_level_ = level;
    }

    [[nodiscard]] LogLevel default_level() const {
        return default_level_;
    }

    /// Lowest level accepted by any module, used for the fast-path check.
    [[nodiscard]] LogLevel min_level() const;

private:
    LogLevel default_level_ = LogLevel::Info;
    std::unordered_map<std::string, LogLevel> module_levels_;
};

// ============================================================================
// Logger
// ============================================================================

/// Configuration for logger initialization.
struct LogConfig {
    LogLevel level = LogLevel::Warn;    ///< Global minimum log level
    LogFormat format = LogFormat::Text; ///< Output format
    std::string filter_spec;            ///< Module filter string
    std::string log_file;               ///< Path to log file (empty = no file)
    bool console = true;                ///< Enable console (stderr) output
    bool colors = true;                 ///< Enable ANSI colors on console
};

/// Thread-safe global logger.
///
/// Starts with a console sink at Warn; `Logger::init()` replaces the sinks.
class Logger {
public:
    static void init(const LogConfig& config);

    static Logger& instance();

    /// Fast-path check used by the macros before building the message.
    [[nodiscard]] bool should_log(LogLevel level, std::string_view module) const;

    void log(LogLevel level, std::string_view module, const std::string& message, const char* file,
             int line);

    void add_sink(std::unique_ptr<LogSink> sink);

    /// Removes every sink. Used by tests that install capture sinks.
    void clear_sinks();

    void set_level(LogLevel level);

    [[nodiscard]] LogLevel level() const {
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

/// Parse logging-related CLI options from argv.
/// Extracts: --log-level, --log-filter, --log-file, --log-format, -v/-vv/-vvv, -q
/// Falls back to the VYDOC_LOG environment variable.
[[nodiscard]] auto parse_log_options(int argc, const char* const argv[]) -> LogConfig;

/// Returns true if `arg` is one of the options consumed by parse_log_options.
[[nodiscard]] bool is_log_option(std::string_view arg);

// ============================================================================
// Logging Macros
// ============================================================================

// Values: 0=Trace, 1=Debug, 2=Info, 3=Warn, 4=Error, 5=Fatal, 6=Off
#ifndef VYDOC_MIN_LOG_LEVEL
#define VYDOC_MIN_LOG_LEVEL 0
#endif

#define VYDOC_LOG_IMPL(level, module_str, msg)                                                     \
    do {                                                                                           \
        if (static_cast<int>(level) >= VYDOC_MIN_LOG_LEVEL) {                                      \
            auto& logger_ = ::vydoc::log::Logger::instance();                                      \
            if (logger_.should_log(level, module_str)) {                                           \
                std::ostringstream oss_;                                                           \
                oss_ << msg;                                                                       \
                logger_.log(level, module_str, oss_.str(), __FILE__, __LINE__);                    \
            }                                                                                      \
        }                                                                                          \
    } while (0)

#define VYDOC_LOG_TRACE(module, msg) VYDOC_LOG_IMPL(::vydoc::log::LogLevel::Trace, module, msg)
#define VYDOC_LOG_DEBUG(module, msg) VYDOC_LOG_IMPL(::vydoc::log::LogLevel::Debug, module, msg)
#define VYDOC_LOG_INFO(module, msg) VYDOC_LOG_IMPL(::vydoc::log::LogLevel::Info, module, msg)
#define VYDOC_LOG_WARN(module, msg) VYDOC_LOG_IMPL(::vydoc::log::LogLevel::Warn, module, msg)
#define VYDOC_LOG_ERROR(module, msg) VYDOC_LOG_IMPL(::vydoc::log::LogLevel::Error, module, msg)
#define VYDOC_LOG_FATAL(module, msg) VYDOC_LOG_IMPL(::vydoc::log::LogLevel::Fatal, module, msg)

} // namespace vydoc::log

#endif // VYDOC_LOG_HPP
