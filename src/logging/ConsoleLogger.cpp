#include <iostream>
#include <mutex>
#include <string>

#include "ConsoleLogger.hpp"

// Define static members
std::shared_ptr<ConsoleLogger> ConsoleLogger::instance = nullptr;
std::once_flag ConsoleLogger::init_flag;

std::shared_ptr<ConsoleLogger> ConsoleLogger::getInstance(LogUtils::LogLevel logLevel) {
    std::call_once(init_flag, [logLevel]() {
        instance.reset(new ConsoleLogger(logLevel));
    });
    return instance;
}

void ConsoleLogger::write(const std::string& prefix, const std::string& message) {
    std::lock_guard<std::mutex> lock(cerr_mutex_);
    std::cerr << prefix << message << std::endl;
}

void ConsoleLogger::info(const std::string& message) {
    if (logLevel.load() <= LogUtils::LogLevel::INFO) {
        write(LogUtils::INFO_LOG_PREFIX, message);
    }
}

void ConsoleLogger::debug(const std::string& message) {
    if (logLevel.load() <= LogUtils::LogLevel::DEBUG) {
        write(LogUtils::DEBUG_LOG_PREFIX, message);
    }
}

void ConsoleLogger::warn(const std::string& message) {
    if (logLevel.load() <= LogUtils::LogLevel::WARN) {
        write(LogUtils::WARN_LOG_PREFIX, message);
    }
}

void ConsoleLogger::error(const std::string& message) {
    if (logLevel.load() <= LogUtils::LogLevel::CERROR) {
        write(LogUtils::CERROR_LOG_PREFIX, message);
    }
}

// Setup messages are startup diagnostics; they only show when debugging.
void ConsoleLogger::setup(const std::string& message) {
    if (logLevel.load() <= LogUtils::LogLevel::DEBUG) {
        write(LogUtils::SETUP_LOG_PREFIX, message);
    }
}
