// SHAREGOV - Logging System
// Copyright (c) 2024 SHAREGOV Developers
// MIT License
//
// Provides the engine-wide logging facility:
// - Log levels (TRACE, DEBUG, INFO, WARN, ERROR, FATAL)
// - Categories for filtering (gov, vote, tally, lock, ...)
// - Console, rotating file and callback sinks
// - Thread-safe stream-style interface

#ifndef SHAREGOV_UTIL_LOGGING_H
#define SHAREGOV_UTIL_LOGGING_H

#include <atomic>
#include <chrono>
#include <fstream>
#include <functional>
#include <memory>
#include <mutex>
#include <sstream>
#include <string>
#include <thread>
#include <unordered_set>
#include <vector>

namespace sharegov {
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

/// Parse log level from string (unknown strings map to Info)
LogLevel LogLevelFromString(const std::string& str);

// ============================================================================
// Log Categories
// ============================================================================

namespace LogCategory {
    constexpr const char* DEFAULT = "default";
    constexpr const char* GOV = "gov";
    constexpr const char* VOTE = "vote";
    constexpr const char* TALLY = "tally";
    constexpr const char* LOCK = "lock";
    constexpr const char* LEDGER = "ledger";
    constexpr const char* DB = "db";
    constexpr const char* EVENTS = "events";
    constexpr const char* CLI = "cli";
}

// ============================================================================
// Log Entry
// ============================================================================

struct LogEntry {
    LogLevel level{LogLevel::Info};
    std::string category;
    std::string message;
    std::string file;
    int line{0};
    std::string function;
    std::chrono::system_clock::time_point timestamp;
    std::thread::id threadId;
};

// ============================================================================
// Log Sinks
// ============================================================================

/// Abstract base class for log output destinations
class ILogSink {
public:
    virtual ~ILogSink() = default;

    virtual void Write(const LogEntry& entry) = 0;
    virtual void Flush() = 0;
    virtual void SetLevel(LogLevel level) = 0;
    virtual LogLevel GetLevel() const = 0;
};

/// Writes to stdout, or stderr for errors when configured
class ConsoleSink : public ILogSink {
public:
    struct Config {
        bool useColors{true};
        bool useStderr{false};
        bool showTimestamp{true};
        bool showCategory{true};
        bool showThread{false};
        LogLevel level{LogLevel::Info};
    };

    ConsoleSink() = default;
    explicit ConsoleSink(const Config& config) : config_(config) {}

    void Write(const LogEntry& entry) override;
    void Flush() override;
    void SetLevel(LogLevel level) override { config_.level = level; }
    LogLevel GetLevel() const override { return config_.level; }

    const Config& GetConfig() const { return config_; }

private:
    Config config_;
    std::mutex mutex_;
};

/// Appends to a file, rotating it once it grows past maxSize
class FileSink : public ILogSink {
public:
    struct Config {
        std::string path;
        bool autoFlush{false};
        size_t maxSize{10 * 1024 * 1024};
        size_t maxFiles{5};
        LogLevel level{LogLevel::Debug};
    };

    explicit FileSink(const Config& config);
    ~FileSink() override;

    bool IsOpen() const;

    void Write(const LogEntry& entry) override;
    void Flush() override;
    void SetLevel(LogLevel level) override { config_.level = level; }
    LogLevel GetLevel() const override { return config_.level; }

    size_t GetCurrentSize() const { return currentSize_; }

private:
    void Rotate();

    Config config_;
    std::ofstream file_;
    mutable std::mutex mutex_;
    size_t currentSize_{0};
};

/// Hands each entry to a callback; used by tests and embedding hosts
class CallbackSink : public ILogSink {
public:
    using Callback = std::function<void(const LogEntry&)>;

    explicit CallbackSink(Callback callback, LogLevel level = LogLevel::Info)
        : callback_(std::move(callback)), level_(level) {}

    void Write(const LogEntry& entry) override;
    void Flush() override {}
    void SetLevel(LogLevel level) override { level_ = level; }
    LogLevel GetLevel() const override { return level_; }

private:
    Callback callback_;
    LogLevel level_;
};

// ============================================================================
// Logger
// ============================================================================

class Logger {
public:
    static Logger& Instance();

    void AddSink(std::shared_ptr<ILogSink> sink);
    void RemoveSink(const std::shared_ptr<ILogSink>& sink);
    void ClearSinks();
    size_t SinkCount() const;

    void SetLevel(LogLevel level) { level_.store(level); }
    LogLevel GetLevel() const { return level_.load(); }

    /// Restrict output to the given category (may be called repeatedly)
    void EnableCategory(const std::string& category);
    void DisableCategory(const std::string& category);
    void EnableAllCategories();
    bool IsCategoryEnabled(const std::string& category) const;

    void Log(LogLevel level, const std::string& category,
             const std::string& message,
             const char* file = nullptr, int line = 0,
             const char* function = nullptr);

    bool WillLog(LogLevel level, const std::string& category) const;

    void Flush();

private:
    Logger() = default;
    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    std::vector<std::shared_ptr<ILogSink>> sinks_;
    mutable std::mutex sinksMutex_;

    std::atomic<LogLevel> level_{LogLevel::Info};
    std::unordered_set<std::string> enabledCategories_;
    std::atomic<bool> allCategoriesEnabled_{true};
    mutable std::mutex categoriesMutex_;
};

// ============================================================================
// Log Stream
// ============================================================================

/// Accumulates a message and emits it on destruction
class LogStream {
public:
    LogStream(LogLevel level, const char* category,
              const char* file, int line, const char* function)
        : level_(level), category_(category), file_(file),
          line_(line), function_(function) {}
    ~LogStream();

    LogStream(const LogStream&) = delete;
    LogStream& operator=(const LogStream&) = delete;

    template<typename T>
    LogStream& operator<<(const T& value) {
        stream_ << value;
        return *this;
    }

private:
    std::ostringstream stream_;
    LogLevel level_;
    const char* category_;
    const char* file_;
    int line_;
    const char* function_;
};

// ============================================================================
// Logging Configuration
// ============================================================================

/// Options applied to the global logger at startup
struct LogOptions {
    LogLevel level{LogLevel::Info};
    std::vector<std::string> categories;  // empty = all
    bool printToConsole{true};
    std::string logFile;                  // empty = no file sink
};

/// Replace the logger's sinks and filters with the given options
void ConfigureLogging(const LogOptions& options);

// ============================================================================
// Logging Macros
// ============================================================================

#define SHAREGOV_LOGGER ::sharegov::util::Logger::Instance()

#define SHAREGOV_LOG_ENABLED(level, category) \
    SHAREGOV_LOGGER.WillLog(::sharegov::util::LogLevel::level, category)

#define SHAREGOV_LOG(level, category) \
    if (!SHAREGOV_LOG_ENABLED(level, category)) {} else \
        ::sharegov::util::LogStream(::sharegov::util::LogLevel::level, category, \
                                    __FILE__, __LINE__, __func__)

#define LOG_TRACE(category)   SHAREGOV_LOG(Trace, category)
#define LOG_DEBUG(category)   SHAREGOV_LOG(Debug, category)
#define LOG_INFO(category)    SHAREGOV_LOG(Info, category)
#define LOG_WARN(category)    SHAREGOV_LOG(Warn, category)
#define LOG_ERROR(category)   SHAREGOV_LOG(Error, category)
#define LOG_FATAL(category)   SHAREGOV_LOG(Fatal, category)

// ============================================================================
// Scoped Log Timer
// ============================================================================

/// RAII timer that logs the duration of a scope at Debug level
class ScopedLogTimer {
public:
    ScopedLogTimer(const char* category, std::string operation);
    ~ScopedLogTimer();

private:
    const char* category_;
    std::string operation_;
    std::chrono::steady_clock::time_point start_;
};

#define SHAREGOV_LOG_TIMER_CONCAT_(a, b) a##b
#define SHAREGOV_LOG_TIMER_NAME_(line) SHAREGOV_LOG_TIMER_CONCAT_(sharegovTimer_, line)
#define SHAREGOV_LOG_TIMER(category, operation) \
    ::sharegov::util::ScopedLogTimer SHAREGOV_LOG_TIMER_NAME_(__LINE__)(category, operation)

// ============================================================================
// Utility Functions
// ============================================================================

/// Format timestamp for logging
std::string FormatLogTimestamp(std::chrono::system_clock::time_point tp);

/// Get basename from file path
std::string GetBasename(const std::string& path);

} // namespace util
} // namespace sharegov

#endif // SHAREGOV_UTIL_LOGGING_H
