#pragma once

#include "object.hpp"

#include <atomic>
#include <chrono>
#include <fmt/core.h>
#include <fstream>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

// Endpoint interface for log destinations
class LogEndpoint {
public:
    virtual ~LogEndpoint() = default;
    virtual void write(const std::string& message) = 0;
    virtual void flush() = 0;
};

// Stdout endpoint
class StdoutEndpoint : public LogEndpoint {
public:
    void write(const std::string& message) override;
    void flush() override;
};

// File endpoint, appends to the given path
class FileEndpoint : public LogEndpoint {
private:
    std::ofstream file;
    std::string filePath;
    mutable std::mutex fileMutex;

public:
    explicit FileEndpoint(const std::string& path);
    ~FileEndpoint() override;
    void write(const std::string& message) override;
    void flush() override;
};

// Keeps every written message in memory
class MemoryEndpoint : public LogEndpoint {
private:
    std::vector<std::string> messages;
    size_t flushCount = 0;
    mutable std::mutex memoryMutex;

public:
    void write(const std::string& message) override;
    void flush() override;

    std::vector<std::string> getMessages() const;
    size_t getFlushCount() const;
    void clear();
};

// Leveled logger buffering formatted lines until a flush
class Logger : public Object {
public:
    enum class LogLevel {
        DEBUG = -1,  // Only in debug builds
        INFO = 0,
        LOG = 1,
        WARN = 2,
        ERROR = 3
    };

private:
    std::vector<std::shared_ptr<LogEndpoint>> endpoints;
    std::string moduleName;
    std::string format;

    // Buffering and flushing configuration
    std::vector<std::string> buffer;
    size_t maxBufferBytes;
    std::chrono::microseconds flushInterval;
    size_t currentBufferBytes;
    std::chrono::steady_clock::time_point lastFlushTime;

    // Current log level
    std::atomic<int> currentLevel;

    // Guards buffer, endpoints and configuration
    mutable std::mutex bufferMutex;

    // Helper methods
    std::string formatMessage(LogLevel level, const std::string& message) const;
    bool shouldFlush() const;
    void flushLocked();
    static std::string levelToString(LogLevel level);

public:
    explicit Logger(const std::string& moduleName = "");

    // Destructor - ensures buffer is flushed
    ~Logger() override;

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    // Override Object methods
    std::string getType() const override;
    void display() const override;

    // Configuration methods
    void setFormat(const std::string& fmt);
    void addEndpoint(std::shared_ptr<LogEndpoint> endpoint);
    void setFlushByteLimit(size_t bytes);
    void setFlushTimeInterval(std::chrono::microseconds interval);

    // Level control
    void setLevel(LogLevel level);
    int getLevel() const;
    bool isEnabled(LogLevel level) const;

    // Logging methods
    void debug(const std::string& message);
    void info(const std::string& message);
    void log(const std::string& message);
    void warn(const std::string& message);
    void error(const std::string& message);

    // Template versions for formatted logging
    template<typename... Args>
    void debug(fmt::format_string<Args...> fmt, Args&&... args) {
#ifndef NDEBUG
        if (isEnabled(LogLevel::DEBUG)) {
            logInternal(LogLevel::DEBUG, fmt::format(fmt, std::forward<Args>(args)...));
        }
#endif
    }

    template<typename... Args>
    void info(fmt::format_string<Args...> fmt, Args&&... args) {
        if (isEnabled(LogLevel::INFO)) {
            logInternal(LogLevel::INFO, fmt::format(fmt, std::forward<Args>(args)...));
        }
    }

    template<typename... Args>
    void log(fmt::format_string<Args...> fmt, Args&&... args) {
        if (isEnabled(LogLevel::LOG)) {
            logInternal(LogLevel::LOG, fmt::format(fmt, std::forward<Args>(args)...));
        }
    }

    template<typename... Args>
    void warn(fmt::format_string<Args...> fmt, Args&&... args) {
        if (isEnabled(LogLevel::WARN)) {
            logInternal(LogLevel::WARN, fmt::format(fmt, std::forward<Args>(args)...));
        }
    }

    template<typename... Args>
    void error(fmt::format_string<Args...> fmt, Args&&... args) {
        if (isEnabled(LogLevel::ERROR)) {
            logInternal(LogLevel::ERROR, fmt::format(fmt, std::forward<Args>(args)...));
        }
    }

    // Manual flush
    void flush();

private:
    void logInternal(LogLevel level, const std::string& message);
};
