#include "log.hpp"
#include <atomic>
#include <iostream>
#include <mutex>

namespace {
    std::atomic<LogLevel> currentLevel{LogLevel::Info};
    std::mutex outputMutex;  // lines from concurrent sessions must not interleave
}

void Log::setLevel(LogLevel level) {
    currentLevel.store(level);
}

LogLevel Log::level() {
    return currentLevel.load();
}

void Log::debug(const std::string& tag, const std::string& message) {
    write(LogLevel::Debug, tag, message);
}

void Log::info(const std::string& tag, const std::string& message) {
    write(LogLevel::Info, tag, message);
}

void Log::warn(const std::string& tag, const std::string& message) {
    write(LogLevel::Warn, tag, message);
}

void Log::error(const std::string& tag, const std::string& message) {
    write(LogLevel::Error, tag, message);
}

void Log::write(LogLevel level, const std::string& tag, const std::string& message) {
    if (level < currentLevel.load()) return;

    std::lock_guard<std::mutex> guard(outputMutex);
    std::ostream& out = (level >= LogLevel::Warn) ? std::cerr : std::cout;
    out << "[" << tag << "] ";
    if (level == LogLevel::Warn) out << "Warning: ";
    if (level == LogLevel::Error) out << "Error: ";
    out << message << '\n';
}
