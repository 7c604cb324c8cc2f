#include "common/logger.h"
#include "common/text_utils.h"
#include <iostream>
#include <iomanip>
#include <chrono>
#include <ctime>

namespace paw {

Logger& Logger::getInstance() {
    static Logger instance;
    return instance;
}

Logger::Logger() : verbose_(false), console_level_(LogLevel::WARNING) {}

void Logger::setVerbose(bool verbose) {
    std::lock_guard<std::mutex> lock(mutex_);
    verbose_ = verbose;
    if (verbose) {
        console_level_ = LogLevel::DEBUG;
    }
}

void Logger::setConsoleLevel(LogLevel level) {
    std::lock_guard<std::mutex> lock(mutex_);
    console_level_ = level;
}

bool Logger::setLogFile(const std::string& path) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (file_.is_open()) {
        file_.close();
    }
    if (path.empty()) {
        return true;
    }
    file_.open(path, std::ios::app);
    return file_.is_open();
}

void Logger::closeLogFile() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (file_.is_open()) {
        file_.flush();
        file_.close();
    }
}

void Logger::info(const std::string& message) {
    log(LogLevel::INFO, message);
}

void Logger::warning(const std::string& message) {
    log(LogLevel::WARNING, message);
}

void Logger::error(const std::string& message) {
    log(LogLevel::ERROR, message);
}

void Logger::debug(const std::string& message) {
    log(LogLevel::DEBUG, message);
}

bool Logger::parseLevel(const std::string& text, LogLevel& level) {
    std::string value = toLower(trim(text));
    if (value == "debug") {
        level = LogLevel::DEBUG;
    } else if (value == "info") {
        level = LogLevel::INFO;
    } else if (value == "warning" || value == "warn") {
        level = LogLevel::WARNING;
    } else if (value == "error") {
        level = LogLevel::ERROR;
    } else {
        return false;
    }
    return true;
}

void Logger::log(LogLevel level, const std::string& message) {
    std::lock_guard<std::mutex> lock(mutex_);

    // Debug lines never reach the file either unless verbose
    if (level == LogLevel::DEBUG && !verbose_) {
        return;
    }

    auto now = std::chrono::system_clock::now();
    auto time_t = std::chrono::system_clock::to_time_t(now);
    std::tm tm{};
    localtime_r(&time_t, &tm);

    std::string level_str;
    switch (level) {
        case LogLevel::INFO:    level_str = "INFO"; break;
        case LogLevel::WARNING: level_str = "WARN"; break;
        case LogLevel::ERROR:   level_str = "ERROR"; break;
        case LogLevel::DEBUG:   level_str = "DEBUG"; break;
    }

    if (level >= console_level_) {
        std::cout << "[" << std::put_time(&tm, "%H:%M:%S") << "] "
                  << "[" << level_str << "] " << message << std::endl;
    }

    if (file_.is_open()) {
        file_ << "[" << std::put_time(&tm, "%Y-%m-%d %H:%M:%S") << "] "
              << "[" << level_str << "] " << message << "\n";
        file_.flush();
    }
}

} // namespace paw
