// FILEKIT - Logging System
// Copyright (c) 2024 FILEKIT Developers
// MIT License
//
// Leveled, categorised logging shared by every module:
// - Log levels (TRACE, DEBUG, INFO, WARN, ERROR, FATAL)
// - Categories matching the library modules, for filtering
// - Console, rotating file and callback sinks
// - Stream-style macros and a scoped timer

#ifndef FILEKIT_UTIL_LOGGING_H
#define FILEKIT_UTIL_LOGGING_H

#include <atomic>
#include <chrono>
#include <cstdarg>
#include <fstream>
#include <functional>
#include <memory>
#include <mutex>
#include <sstream>
#include <string>
#include <thread>
#include <unordered_set>
#include <vector>

namespace filekit {
namespace util {

// ============================================================================
// Log Levels
// ============================================================================

enum class LogLevel {
    Trace = 0,
    Debug = 1,
    Info = 2,
    Warn = 3,
    Error = 4,
    Fatal = 5,
    Off = 6
};

/// Convert log level to string
const char* LogLevelToString(LogLevel level);

/// Parse log level from string (unknown text maps to Info)
LogLevel LogLevelFromString(const std::string& str);

// ============================================================================
// Log Categories
// ============================================================================

namespace LogCategory {
    constexpr const char* DEFAULT = "default";
    constexpr const char* PATH = "path";
    constexpr const char* LIST = "list";
    constexpr const char* WALK = "walk";
    constexpr const char* TEXTIO = "textio";
    constexpr const char* TEMP = "temp";
    constexpr const char* CONFIG = "config";
}

// ============================================================================
// Log Entry
// ============================================================================

struct LogEntry {
    LogLevel level;
    std::string category;
    std::string message;
    std::string file;
    int line;
    std::string function;
    std::chrono::system_clock::time_point timestamp;
    std::thread::id threadId;

    LogEntry() : level(LogLevel::Info), line(0) {}
};

/// Which fields a sink prints in front of the message
struct LogFormat {
    bool showTimestamp{true};
    bool showLevel{true};
    bool showCategory{true};
    bool showThread{false};
    bool showLocation{false};
};

/// Render an entry as a single line (no trailing newline)
std::string FormatLogEntry(const LogEntry& entry, const LogFormat& format);

// ============================================================================
// Log Sink Interface
// ============================================================================

class ILogSink {
public:
    virtual ~ILogSink() = default;

    virtual void Write(const LogEntry& entry) = 0;
    virtual void Flush() = 0;
    virtual void SetLevel(LogLevel level) = 0;
    virtual LogLevel GetLevel() const = 0;
};

// ============================================================================
// Console Sink
// ============================================================================

/// Writes to stdout, errors optionally to stderr
class ConsoleSink : public ILogSink {
public:
    struct Config {
        bool useColors{true};
        bool useStderr{true};
        LogFormat format;
        LogLevel level{LogLevel::Info};
    };

    ConsoleSink();
    explicit ConsoleSink(const Config& config);

    void Write(const LogEntry& entry) override;
    void Flush() override;
    void SetLevel(LogLevel level) override { config_.level = level; }
    LogLevel GetLevel() const override { return config_.level; }

    void SetConfig(const Config& config) { config_ = config; }
    const Config& GetConfig() const { return config_; }

private:
    Config config_;
    std::mutex mutex_;

    static const char* ColorCode(LogLevel level);
};

// ============================================================================
// File Sink
// ============================================================================

/// Appends to a log file, rotating it once it grows past maxSize
class FileSink : public ILogSink {
public:
    struct Config {
        std::string path;
        bool append{true};
        bool autoFlush{false};
        size_t maxSize{10 * 1024 * 1024};
        size_t maxFiles{5};
        bool rotate{true};
        LogFormat format{true, true, true, true, true};
        LogLevel level{LogLevel::Debug};
    };

    FileSink();
    explicit FileSink(const std::string& path);
    explicit FileSink(const Config& config);
    ~FileSink() override;

    bool Open(const std::string& path);
    void Close();
    bool IsOpen() const;

    void Write(const LogEntry& entry) override;
    void Flush() override;
    void SetLevel(LogLevel level) override { config_.level = level; }
    LogLevel GetLevel() const override { return config_.level; }

    const Config& GetConfig() const { return config_; }
    size_t GetCurrentSize() const { return currentSize_; }

private:
    Config config_;
    std::ofstream file_;
    mutable std::mutex mutex_;
    size_t currentSize_{0};

    bool OpenLocked();
    void Rotate();
};

// ============================================================================
// Callback Sink
// ============================================================================

class CallbackSink : public ILogSink {
public:
    using Callback = std::function<void(const LogEntry&)>;

    CallbackSink() = default;
    explicit CallbackSink(Callback callback, LogLevel level = LogLevel::Info);

    void Write(const LogEntry& entry) override;
    void Flush() override {}
    void SetLevel(LogLevel level) override { level_ = level; }
    LogLevel GetLevel() const override { return level_; }

private:
    Callback callback_;
    LogLevel level_{LogLevel::Info};
};

// ============================================================================
// Logger
// ============================================================================

/// Process-wide logger; sinks and filters are guarded by mutexes
class Logger {
public:
    static Logger& Instance();

    /// Add a console sink if none has been configured yet
    void Initialize();
    void Shutdown();

    void AddSink(std::shared_ptr<ILogSink> sink);
    void RemoveSink(const std::shared_ptr<ILogSink>& sink);
    void ClearSinks();
    size_t SinkCount() const;

    void SetLevel(LogLevel level);
    LogLevel GetLevel() const { return level_.load(); }

    void EnableCategory(const std::string& category);
    void DisableCategory(const std::string& category);
    bool IsCategoryEnabled(const std::string& category) const;
    void EnableAllCategories();
    void DisableAllCategories();

    void Log(LogLevel level, const std::string& category,
             const std::string& message,
             const char* file = nullptr, int line = 0,
             const char* function = nullptr);

    /// printf-style variant
    void LogF(LogLevel level, const std::string& category,
              const char* file, int line, const char* function,
              const char* format, ...);

    bool WillLog(LogLevel level, const std::string& category) const;

    void Flush();

private:
    Logger();
    ~Logger();

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    std::vector<std::shared_ptr<ILogSink>> sinks_;
    mutable std::mutex sinksMutex_;

    std::atomic<LogLevel> level_{LogLevel::Info};
    std::unordered_set<std::string> enabledCategories_;     // Used when not all enabled
    std::unordered_set<std::string> disabledCategories_;    // Exceptions to "all enabled"
    mutable std::mutex categoriesMutex_;
    std::atomic<bool> allCategoriesEnabled_{true};

    std::atomic<bool> initialized_{false};
};

// ============================================================================
// Log Stream
// ============================================================================

/// Collects a message and hands it to the logger on destruction
class LogStream {
public:
    LogStream(LogLevel level, const std::string& category,
              const char* file, int line, const char* function);
    ~LogStream();

    LogStream(const LogStream&) = delete;
    LogStream& operator=(const LogStream&) = delete;
    LogStream(LogStream&& other) noexcept;
    LogStream& operator=(LogStream&& other) = delete;

    template<typename T>
    LogStream& operator<<(const T& value) {
        if (active_) {
            stream_ << value;
        }
        return *this;
    }

    LogStream& operator<<(std::ostream& (*manip)(std::ostream&)) {
        if (active_) {
            manip(stream_);
        }
        return *this;
    }

private:
    std::ostringstream stream_;
    LogLevel level_;
    std::string category_;
    const char* file_;
    int line_;
    const char* function_;
    bool active_;
};

// ============================================================================
// Logging Macros
// ============================================================================

#define FILEKIT_LOGGER ::filekit::util::Logger::Instance()

#define FILEKIT_LOG_ENABLED(level, category) \
    FILEKIT_LOGGER.WillLog(::filekit::util::LogLevel::level, category)

#define FILEKIT_LOG(level, category) \
    if (FILEKIT_LOG_ENABLED(level, category)) \
        ::filekit::util::LogStream(::filekit::util::LogLevel::level, category, \
                                   __FILE__, __LINE__, __func__)

#define LOG_TRACE(category)   FILEKIT_LOG(Trace, category)
#define LOG_DEBUG(category)   FILEKIT_LOG(Debug, category)
#define LOG_INFO(category)    FILEKIT_LOG(Info, category)
#define LOG_WARN(category)    FILEKIT_LOG(Warn, category)
#define LOG_ERROR(category)   FILEKIT_LOG(Error, category)
#define LOG_FATAL(category)   FILEKIT_LOG(Fatal, category)

#define FILEKIT_LOGF(level, category, ...) \
    do { \
        if (FILEKIT_LOG_ENABLED(level, category)) { \
            FILEKIT_LOGGER.LogF(::filekit::util::LogLevel::level, category, \
                                __FILE__, __LINE__, __func__, __VA_ARGS__); \
        } \
    } while(0)

#define LogDebugF(category, ...)  FILEKIT_LOGF(Debug, category, __VA_ARGS__)
#define LogInfoF(category, ...)   FILEKIT_LOGF(Info, category, __VA_ARGS__)
#define LogWarnF(category, ...)   FILEKIT_LOGF(Warn, category, __VA_ARGS__)

// ============================================================================
// Scoped Log Timer
// ============================================================================

/// Logs start and elapsed time of an operation at Debug level
class ScopedLogTimer {
public:
    ScopedLogTimer(const std::string& category, const std::string& operation);
    ~ScopedLogTimer();

    ScopedLogTimer(const ScopedLogTimer&) = delete;
    ScopedLogTimer& operator=(const ScopedLogTimer&) = delete;

private:
    std::string category_;
    std::string operation_;
    std::chrono::steady_clock::time_point start_;
};

#define FILEKIT_LOG_TIMER_CAT2(a, b) a##b
#define FILEKIT_LOG_TIMER_CAT(a, b) FILEKIT_LOG_TIMER_CAT2(a, b)
#define FILEKIT_LOG_TIMER(category, operation) \
    ::filekit::util::ScopedLogTimer FILEKIT_LOG_TIMER_CAT(_filekit_timer_, __LINE__)(category, operation)

// ============================================================================
// Utility Functions
// ============================================================================

std::string FormatLogTimestamp(std::chrono::system_clock::time_point tp);

/// Truncate or pad string to fixed width
std::string FixedWidth(const std::string& str, size_t width, char pad = ' ');

/// Last component of a source file path
std::string GetBasename(const std::string& path);

} // namespace util
} // namespace filekit

#endif // FILEKIT_UTIL_LOGGING_H
