// COMMONIP - Logging Implementation
// Copyright (c) 2024 COMMONIP Developers
// MIT License

#include "commonip/util/logging.h"

#include <algorithm>
#include <cstdio>
#include <ctime>
#include <iomanip>

namespace commonip {
namespace util {

// ============================================================================
// Levels and Formatting
// ============================================================================

const char* LogLevelToString(LogLevel level) {
    switch (level) {
        case LogLevel::Trace: return "TRACE";
        case LogLevel::Debug: return "DEBUG";
        case LogLevel::Info:  return "INFO";
        case LogLevel::Warn:  return "WARN";
        case LogLevel::Error: return "ERROR";
        case LogLevel::Fatal: return "FATAL";
        case LogLevel::Off:   return "OFF";
        default:              return "UNKNOWN";
    }
}

LogLevel LogLevelFromString(const std::string& str) {
    std::string upper = str;
    std::transform(upper.begin(), upper.end(), upper.begin(), ::toupper);

    if (upper == "TRACE") return LogLevel::Trace;
    if (upper == "DEBUG") return LogLevel::Debug;
    if (upper == "WARN" || upper == "WARNING") return LogLevel::Warn;
    if (upper == "ERROR") return LogLevel::Error;
    if (upper == "FATAL") return LogLevel::Fatal;
    if (upper == "OFF" || upper == "NONE") return LogLevel::Off;
    return LogLevel::Info;
}

std::string FormatEntry(const LogEntry& entry, const LogFormat& format) {
    std::ostringstream oss;

    if (format.showTimestamp) {
        auto time = std::chrono::system_clock::to_time_t(entry.timestamp);
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            entry.timestamp.time_since_epoch()) % 1000;
        std::tm tmBuf;
        gmtime_r(&time, &tmBuf);
        oss << std::put_time(&tmBuf, "%Y-%m-%d %H:%M:%S") << '.'
            << std::setfill('0') << std::setw(3) << ms.count() << ' ';
    }
    if (format.showLevel) {
        oss << '[' << LogLevelToString(entry.level) << "] ";
    }
    if (format.showCategory && !entry.category.empty() &&
        entry.category != LogCategory::DEFAULT) {
        oss << '[' << entry.category << "] ";
    }
    if (format.showLocation && !entry.file.empty()) {
        size_t slash = entry.file.find_last_of('/');
        oss << (slash == std::string::npos ? entry.file : entry.file.substr(slash + 1))
            << ':' << entry.line << ' ';
    }
    oss << entry.message;
    return oss.str();
}

// ============================================================================
// ConsoleSink
// ============================================================================

ConsoleSink::ConsoleSink(LogLevel level, bool errorsToStderr)
    : level_(level), errorsToStderr_(errorsToStderr) {}

void ConsoleSink::Write(const LogEntry& entry) {
    if (entry.level < level_) {
        return;
    }
    std::string line = FormatEntry(entry, format_);

    std::lock_guard<std::mutex> lock(mutex_);
    FILE* stream = (errorsToStderr_ && entry.level >= LogLevel::Error) ? stderr : stdout;
    std::fprintf(stream, "%s\n", line.c_str());
}

void ConsoleSink::Flush() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::fflush(stdout);
    std::fflush(stderr);
}

// ============================================================================
// FileSink
// ============================================================================

FileSink::FileSink(const std::string& path, LogLevel level)
    : path_(path), level_(level), file_(path, std::ios::out | std::ios::app) {
    format_.showLocation = true;
}

FileSink::~FileSink() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (file_.is_open()) {
        file_.flush();
        file_.close();
    }
}

void FileSink::Write(const LogEntry& entry) {
    if (entry.level < level_) {
        return;
    }
    std::string line = FormatEntry(entry, format_);

    std::lock_guard<std::mutex> lock(mutex_);
    if (file_.is_open()) {
        file_ << line << '\n';
    }
}

void FileSink::Flush() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (file_.is_open()) {
        file_.flush();
    }
}

// ============================================================================
// CallbackSink
// ============================================================================

CallbackSink::CallbackSink(Callback callback, LogLevel level)
    : callback_(std::move(callback)), level_(level) {}

void CallbackSink::Write(const LogEntry& entry) {
    if (entry.level < level_ || !callback_) {
        return;
    }
    callback_(entry);
}

// ============================================================================
// Logger
// ============================================================================

Logger& Logger::Instance() {
    static Logger instance;
    return instance;
}

Logger::~Logger() {
    Shutdown();
}

void Logger::Initialize() {
    std::lock_guard<std::mutex> lock(sinksMutex_);
    if (sinks_.empty()) {
        sinks_.push_back(std::make_shared<ConsoleSink>());
    }
}

void Logger::Shutdown() {
    Flush();
    ClearSinks();
}

void Logger::AddSink(std::shared_ptr<ILogSink> sink) {
    std::lock_guard<std::mutex> lock(sinksMutex_);
    sinks_.push_back(std::move(sink));
}

void Logger::RemoveSink(const std::shared_ptr<ILogSink>& sink) {
    std::lock_guard<std::mutex> lock(sinksMutex_);
    sinks_.erase(std::remove(sinks_.begin(), sinks_.end(), sink), sinks_.end());
}

void Logger::ClearSinks() {
    std::lock_guard<std::mutex> lock(sinksMutex_);
    sinks_.clear();
}

size_t Logger::SinkCount() const {
    std::lock_guard<std::mutex> lock(sinksMutex_);
    return sinks_.size();
}

void Logger::EnableCategory(const std::string& category) {
    std::lock_guard<std::mutex> lock(categoriesMutex_);
    enabledCategories_.insert(category);
}

void Logger::DisableCategory(const std::string& category) {
    std::lock_guard<std::mutex> lock(categoriesMutex_);
    enabledCategories_.erase(category);
}

void Logger::EnableAllCategories() {
    std::lock_guard<std::mutex> lock(categoriesMutex_);
    enabledCategories_.clear();
}

bool Logger::IsCategoryEnabled(const std::string& category) const {
    std::lock_guard<std::mutex> lock(categoriesMutex_);
    return enabledCategories_.empty() ||
           enabledCategories_.find(category) != enabledCategories_.end();
}

bool Logger::WillLog(LogLevel level, const std::string& category) const {
    if (level < level_.load() || level == LogLevel::Off) {
        return false;
    }
    return IsCategoryEnabled(category);
}

void Logger::Log(LogLevel level, const std::string& category,
                 const std::string& message, const char* file, int line) {
    LogEntry entry;
    entry.level = level;
    entry.category = category;
    entry.message = message;
    entry.file = file ? file : "";
    entry.line = line;
    entry.timestamp = std::chrono::system_clock::now();

    std::lock_guard<std::mutex> lock(sinksMutex_);
    for (const auto& sink : sinks_) {
        sink->Write(entry);
    }
}

void Logger::Flush() {
    std::lock_guard<std::mutex> lock(sinksMutex_);
    for (const auto& sink : sinks_) {
        sink->Flush();
    }
}

// ============================================================================
// LogStream
// ============================================================================

LogStream::LogStream(LogLevel level, const char* category, const char* file, int line)
    : level_(level), category_(category), file_(file), line_(line) {}

LogStream::~LogStream() {
    Logger::Instance().Log(level_, category_, stream_.str(), file_, line_);
}

} // namespace util
} // namespace commonip
