#include "logger.hpp"

#include <fmt/chrono.h>
#include <iostream>
#include <stdexcept>

// StdoutEndpoint implementation
void StdoutEndpoint::write(const std::string& message) {
    std::cout << message;
}

void StdoutEndpoint::flush() {
    std::cout.flush();
}

// FileEndpoint implementation
FileEndpoint::FileEndpoint(const std::string& path) : filePath(path) {
    file.open(filePath, std::ios::out | std::ios::app);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to open log file: " + filePath);
    }
}

FileEndpoint::~FileEndpoint() {
    if (file.is_open()) {
        file.flush();
        file.close();
    }
}

void FileEndpoint::write(const std::string& message) {
    std::lock_guard<std::mutex> lock(fileMutex);
    if (file.is_open()) {
        file << message;
    }
}

void FileEndpoint::flush() {
    std::lock_guard<std::mutex> lock(fileMutex);
    if (file.is_open()) {
        file.flush();
    }
}

// MemoryEndpoint implementation
void MemoryEndpoint::write(const std::string& message) {
    std::lock_guard<std::mutex> lock(memoryMutex);
    messages.push_back(message);
}

void MemoryEndpoint::flush() {
    std::lock_guard<std::mutex> lock(memoryMutex);
    ++flushCount;
}

std::vector<std::string> MemoryEndpoint::getMessages() const {
    std::lock_guard<std::mutex> lock(memoryMutex);
    return messages;
}

size_t MemoryEndpoint::getFlushCount() const {
    std::lock_guard<std::mutex> lock(memoryMutex);
    return flushCount;
}

void MemoryEndpoint::clear() {
    std::lock_guard<std::mutex> lock(memoryMutex);
    messages.clear();
    flushCount = 0;
}

// Logger implementation
Logger::Logger(const std::string& moduleName)
    : moduleName(moduleName),
      format("{} - {} - [{}] {}\n"),
      maxBufferBytes(1024 * 1024),  // 1MB default
      flushInterval(std::chrono::seconds(1)),  // 1 second default
      currentBufferBytes(0),
      lastFlushTime(std::chrono::steady_clock::now()),
      currentLevel(static_cast<int>(LogLevel::INFO)) {}

Logger::~Logger() {
    flush();
}

std::string Logger::getType() const {
    return "Logger";
}

void Logger::display() const {
    std::lock_guard<std::mutex> lock(bufferMutex);
    fmt::print("Logger [module: {}, level: {}, endpoints: {}, buffered: {} bytes]\n",
               moduleName, currentLevel.load(), endpoints.size(), currentBufferBytes);
}

void Logger::setFormat(const std::string& fmt) {
    std::lock_guard<std::mutex> lock(bufferMutex);
    format = fmt;
}

void Logger::addEndpoint(std::shared_ptr<LogEndpoint> endpoint) {
    if (!endpoint) {
        throw std::invalid_argument("Logger endpoint must not be null");
    }
    std::lock_guard<std::mutex> lock(bufferMutex);
    endpoints.push_back(std::move(endpoint));
}

void Logger::setFlushByteLimit(size_t bytes) {
    std::lock_guard<std::mutex> lock(bufferMutex);
    maxBufferBytes = bytes;
}

void Logger::setFlushTimeInterval(std::chrono::microseconds interval) {
    std::lock_guard<std::mutex> lock(bufferMutex);
    flushInterval = interval;
}

void Logger::setLevel(LogLevel level) {
    currentLevel.store(static_cast<int>(level));
}

int Logger::getLevel() const {
    return currentLevel.load();
}

bool Logger::isEnabled(LogLevel level) const {
    return static_cast<int>(level) >= currentLevel.load();
}

std::string Logger::levelToString(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO:  return "INFO";
        case LogLevel::LOG:   return "LOG";
        case LogLevel::WARN:  return "WARN";
        case LogLevel::ERROR: return "ERROR";
        default:              return "UNKNOWN";
    }
}

// Called with bufferMutex held
std::string Logger::formatMessage(LogLevel level, const std::string& message) const {
    auto now = std::chrono::system_clock::now();
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()) % 1000;

    std::string dateStr = fmt::format("{:%Y-%m-%d %H:%M:%S}.{:03d}",
                                      std::chrono::time_point_cast<std::chrono::seconds>(now),
                                      ms.count());

    return fmt::format(fmt::runtime(format), dateStr, moduleName, levelToString(level), message);
}

// Called with bufferMutex held
bool Logger::shouldFlush() const {
    if (currentBufferBytes >= maxBufferBytes) {
        return true;
    }

    auto elapsed = std::chrono::duration_cast<std::chrono::microseconds>(
        std::chrono::steady_clock::now() - lastFlushTime);
    return elapsed >= flushInterval;
}

// Called with bufferMutex held
void Logger::flushLocked() {
    lastFlushTime = std::chrono::steady_clock::now();
    if (buffer.empty()) {
        return;
    }

    for (const auto& endpoint : endpoints) {
        for (const auto& message : buffer) {
            endpoint->write(message);
        }
        endpoint->flush();
    }

    buffer.clear();
    currentBufferBytes = 0;
}

void Logger::flush() {
    std::lock_guard<std::mutex> lock(bufferMutex);
    flushLocked();
}

void Logger::logInternal(LogLevel level, const std::string& message) {
    if (!isEnabled(level)) {
        return;
    }

    std::lock_guard<std::mutex> lock(bufferMutex);
    std::string formattedMessage = formatMessage(level, message);
    currentBufferBytes += formattedMessage.size();
    buffer.push_back(std::move(formattedMessage));

    if (shouldFlush()) {
        flushLocked();
    }
}

void Logger::debug(const std::string& message) {
#ifndef NDEBUG
    logInternal(LogLevel::DEBUG, message);
#else
    (void)message;
#endif
}

void Logger::info(const std::string& message) {
    logInternal(LogLevel::INFO, message);
}

void Logger::log(const std::string& message) {
    logInternal(LogLevel::LOG, message);
}

void Logger::warn(const std::string& message) {
    logInternal(LogLevel::WARN, message);
}

void Logger::error(const std::string& message) {
    logInternal(LogLevel::ERROR, message);
}
