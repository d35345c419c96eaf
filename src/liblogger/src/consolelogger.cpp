#include "espanso/consolelogger.hpp"

#include <unistd.h>

#include <iostream>

espanso::ConsoleLogger& espanso::ConsoleLogger::instance() {
    static espanso::ConsoleLogger instance;
    return instance;
}

void espanso::ConsoleLogger::init(const LogLevel level) { setLogLevel(level); }

void espanso::ConsoleLogger::setLogLevel(espanso::LogLevel level) {
    currentLevel_.store(level, std::memory_order_release);
}

void espanso::ConsoleLogger::flush() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::cout.flush();
    std::cerr.flush();
}

void espanso::ConsoleLogger::log(LogLevel level, const std::string& message) {
    if (shouldSkipLog(level)) return;

    std::string formattedMsg;
    try {
        formattedMsg = formatLogLine(level, message);
    } catch (const std::exception& e) {
        formattedMsg = "[LOGGER ERROR: " + std::string(e.what()) + "] " + message;
    }

    std::lock_guard lock(mutex_);
    const bool colored = ::isatty(STDOUT_FILENO) == 1;
    if (colored) {
        std::cout << colorFor(level) << formattedMsg << ANSI_COLOR_RESET
                  << std::endl;
    } else {
        std::cout << formattedMsg << std::endl;
    }
}

bool espanso::ConsoleLogger::shouldSkipLog(LogLevel level) const {
    return static_cast<int>(level) <
           static_cast<int>(currentLevel_.load(std::memory_order_acquire));
}

const char* espanso::ConsoleLogger::colorFor(LogLevel level) const {
    switch (level) {
        case LogLevel::LOG_DEBUG:
            return "\033[36m";  // Cyan
        case LogLevel::LOG_INFO:
            return "\033[32m";  // Green
        case LogLevel::LOG_WARNING:
            return "\033[33m";  // Yellow
        case LogLevel::LOG_ERROR:
            return "\033[31m";  // Red
        case LogLevel::LOG_CRITICAL:
            return "\033[41m\033[37m";  // White on Red
    }
    return ANSI_COLOR_RESET;
}
