#include "espanso/ilogger.hpp"

#include <unistd.h>

#include <iomanip>
#include <iostream>
#include <sstream>
#include <stdexcept>

bool espanso::TimeFormatter::setGlobalFormat(const std::string& fmt) {
    try {
        auto now = std::chrono::system_clock::now();
        format(now);
        globalFormat_ = fmt;
        return true;
    } catch (const std::exception& e) {
        std::cerr << "Invalid time format: " << e.what() << std::endl;
        return false;
    }
}

std::string espanso::TimeFormatter::format(
    const std::chrono::system_clock::time_point& tp) {
    try {
        auto now_time = std::chrono::system_clock::to_time_t(tp);
        std::tm now_tm;
        localtime_r(&now_time, &now_tm);

        std::ostringstream oss;
        oss << std::put_time(&now_tm, globalFormat_.c_str());
        return oss.str();
    } catch (const std::exception&) {
        return "[INVALID_TIME]";
    }
}

void espanso::ProcessTag::set(const std::string& role) {
    std::lock_guard lock(mutex_);
    tag_ = role + ":" + std::to_string(::getpid());
}

std::string espanso::ProcessTag::get() {
    std::lock_guard lock(mutex_);
    return tag_;
}

espanso::LogLevel espanso::ILogger::getLogLevel() const {
    return currentLevel_.load(std::memory_order_acquire);
}

void espanso::ILogger::debug(const std::string& message) {
    log(espanso::LogLevel::LOG_DEBUG, message);
}

void espanso::ILogger::info(const std::string& message) {
    log(espanso::LogLevel::LOG_INFO, message);
}

void espanso::ILogger::warning(const std::string& message) {
    log(espanso::LogLevel::LOG_WARNING, message);
}

void espanso::ILogger::error(const std::string& message) {
    log(espanso::LogLevel::LOG_ERROR, message);
}

void espanso::ILogger::critical(const std::string& message) {
    log(espanso::LogLevel::LOG_CRITICAL, message);
}

std::string espanso::leveltoString(LogLevel level) {
    switch (level) {
        case LogLevel::LOG_DEBUG:
            return "DEBUG";
        case LogLevel::LOG_INFO:
            return "INFO";
        case LogLevel::LOG_WARNING:
            return "WARNING";
        case LogLevel::LOG_ERROR:
            return "ERROR";
        case LogLevel::LOG_CRITICAL:
            return "CRITICAL";
    }
    return "";
}

espanso::LogLevel espanso::stringToLogLevel(const std::string& level) {
    if (level == "debug") return LogLevel::LOG_DEBUG;
    if (level == "info") return LogLevel::LOG_INFO;
    if (level == "warning") return LogLevel::LOG_WARNING;
    if (level == "error") return LogLevel::LOG_ERROR;
    if (level == "critical") return LogLevel::LOG_CRITICAL;
    throw std::invalid_argument("Unknown log level: " + level);
}

std::string espanso::formatLogLine(LogLevel level, const std::string& message) {
    std::ostringstream formatted;
    formatted << TimeFormatter::format(std::chrono::system_clock::now());
    const std::string tag = ProcessTag::get();
    if (!tag.empty()) {
        formatted << " [" << tag << "]";
    }
    formatted << " [" << leveltoString(level) << "] " << message;
    return formatted.str();
}
