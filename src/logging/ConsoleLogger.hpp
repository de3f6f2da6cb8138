#pragma once

#include <atomic>
#include <iostream>
#include <memory>
#include <mutex>

#include "../config/AppConfig.hpp"
#include "../interfaces/ILogger.hpp"

// Process-wide logger writing to stderr. stdout is reserved for command output.
class ConsoleLogger : public ILogger {
public:
    static std::shared_ptr<ConsoleLogger> getInstance(LogUtils::LogLevel logLevel);
    ~ConsoleLogger() override = default;

    void info(const std::string& message) override;
    void debug(const std::string& message) override;
    void warn(const std::string& message) override;
    void error(const std::string& message) override;
    void setup(const std::string& message) override;
    int getLogLevel() override { return logLevel.load(); }
    bool isDebugEnabled() override { return logLevel.load() <= LogUtils::LogLevel::DEBUG; }

    // The instance is created before the configuration is read, so the level
    // has to be adjustable afterwards.
    void setLogLevel(LogUtils::LogLevel level) { logLevel.store(level); }

private:
    explicit ConsoleLogger(LogUtils::LogLevel logLevel) : logLevel(logLevel) {}
    void write(const std::string& prefix, const std::string& message);

    std::atomic<LogUtils::LogLevel> logLevel;
    std::mutex cerr_mutex_;

    static std::shared_ptr<ConsoleLogger> instance;
    static std::once_flag init_flag;

    ConsoleLogger(const ConsoleLogger&) = delete;
    ConsoleLogger& operator=(const ConsoleLogger&) = delete;
    ConsoleLogger(ConsoleLogger&&) = delete;
    ConsoleLogger& operator=(ConsoleLogger&&) = delete;
};
