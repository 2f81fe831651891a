// COMMONIP - Logging System
// Copyright (c) 2024 COMMONIP Developers
// MIT License
//
// Leveled, categorized logging with pluggable sinks:
// - Levels Trace..Fatal, plus Off
// - One category per ledger component
// - Console, file and callback sinks
// - Stream-style macros: LOG_INFO(LogCategory::REVENUE) << "...";

#ifndef COMMONIP_UTIL_LOGGING_H
#define COMMONIP_UTIL_LOGGING_H

#include <atomic>
#include <chrono>
#include <fstream>
#include <functional>
#include <memory>
#include <mutex>
#include <sstream>
#include <string>
#include <unordered_set>
#include <vector>

namespace commonip {
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

const char* LogLevelToString(LogLevel level);

/// Parse a level name (case-insensitive); unknown names map to Info
LogLevel LogLevelFromString(const std::string& str);

// ============================================================================
// Log Categories
// ============================================================================

namespace LogCategory {
    constexpr const char* DEFAULT = "default";
    constexpr const char* LEDGER = "ledger";
    constexpr const char* OWNERSHIP = "ownership";
    constexpr const char* ASSET = "asset";
    constexpr const char* REVENUE = "revenue";
    constexpr const char* LICENSE = "license";
    constexpr const char* GOVERNANCE = "governance";
    constexpr const char* TOKEN = "token";
    constexpr const char* CONFIG = "config";
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
    std::chrono::system_clock::time_point timestamp;
};

/// Which fields a sink renders
struct LogFormat {
    bool showTimestamp{true};
    bool showLevel{true};
    bool showCategory{true};
    bool showLocation{false};
};

/// Render an entry as a single line
std::string FormatEntry(const LogEntry& entry, const LogFormat& format);

// ============================================================================
// Sinks
// ============================================================================

class ILogSink {
public:
    virtual ~ILogSink() = default;

    virtual void Write(const LogEntry& entry) = 0;
    virtual void Flush() = 0;
    virtual void SetLevel(LogLevel level) = 0;
    virtual LogLevel GetLevel() const = 0;
};

/// Writes to stdout, errors optionally to stderr
class ConsoleSink : public ILogSink {
public:
    explicit ConsoleSink(LogLevel level = LogLevel::Info, bool errorsToStderr = true);

    void Write(const LogEntry& entry) override;
    void Flush() override;
    void SetLevel(LogLevel level) override { level_ = level; }
    LogLevel GetLevel() const override { return level_; }

    void SetFormat(const LogFormat& format) { format_ = format; }

private:
    LogLevel level_;
    bool errorsToStderr_;
    LogFormat format_;
    std::mutex mutex_;
};

/// Appends to a file
class FileSink : public ILogSink {
public:
    explicit FileSink(const std::string& path, LogLevel level = LogLevel::Debug);
    ~FileSink() override;

    bool IsOpen() const { return file_.is_open(); }
    const std::string& Path() const { return path_; }

    void Write(const LogEntry& entry) override;
    void Flush() override;
    void SetLevel(LogLevel level) override { level_ = level; }
    LogLevel GetLevel() const override { return level_; }

private:
    std::string path_;
    LogLevel level_;
    LogFormat format_;
    std::ofstream file_;
    std::mutex mutex_;
};

/// Hands every entry to a callback (tests capture log output this way)
class CallbackSink : public ILogSink {
public:
    using Callback = std::function<void(const LogEntry&)>;

    explicit CallbackSink(Callback callback, LogLevel level = LogLevel::Trace);

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

    /// Install a console sink if no sink is configured yet
    void Initialize();

    /// Flush and drop all sinks
    void Shutdown();

    void AddSink(std::shared_ptr<ILogSink> sink);
    void RemoveSink(const std::shared_ptr<ILogSink>& sink);
    void ClearSinks();
    size_t SinkCount() const;

    void SetLevel(LogLevel level) { level_.store(level); }
    LogLevel GetLevel() const { return level_.load(); }

    /// Restrict output to the given categories (empty set means all)
    void EnableCategory(const std::string& category);
    void DisableCategory(const std::string& category);
    void EnableAllCategories();
    bool IsCategoryEnabled(const std::string& category) const;

    bool WillLog(LogLevel level, const std::string& category) const;

    void Log(LogLevel level, const std::string& category,
             const std::string& message,
             const char* file = nullptr, int line = 0);

    void Flush();

private:
    Logger() = default;
    ~Logger();

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    std::vector<std::shared_ptr<ILogSink>> sinks_;
    mutable std::mutex sinksMutex_;

    std::atomic<LogLevel> level_{LogLevel::Info};
    std::unordered_set<std::string> enabledCategories_;
    mutable std::mutex categoriesMutex_;
};

// ============================================================================
// Log Stream
// ============================================================================

/// Collects a message and emits it on destruction
class LogStream {
public:
    LogStream(LogLevel level, const char* category, const char* file, int line);
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
};

// ============================================================================
// Logging Macros
// ============================================================================

#define COMMONIP_LOGGER ::commonip::util::Logger::Instance()

#define COMMONIP_LOG(level, category) \
    if (COMMONIP_LOGGER.WillLog(::commonip::util::LogLevel::level, category)) \
        ::commonip::util::LogStream(::commonip::util::LogLevel::level, category, \
                                    __FILE__, __LINE__)

#define LOG_TRACE(category)   COMMONIP_LOG(Trace, category)
#define LOG_DEBUG(category)   COMMONIP_LOG(Debug, category)
#define LOG_INFO(category)    COMMONIP_LOG(Info, category)
#define LOG_WARN(category)    COMMONIP_LOG(Warn, category)
#define LOG_ERROR(category)   COMMONIP_LOG(Error, category)

} // namespace util
} // namespace commonip

#endif // COMMONIP_UTIL_LOGGING_H
