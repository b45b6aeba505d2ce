#pragma once

#include <atomic>
#include <iostream>
#include <memory>
#include <mutex>
#include <string>

#include "../config/AppConfig.hpp"
#include "../interfaces/ILogger.hpp"

// Process-wide logger. Info and debug lines go to stdout, warnings and errors to stderr,
// each stamped with UTC time and the id of the calling thread.
class ConsoleLogger : public ILogger {
public:
    // The level passed on the first call wins; later calls may adjust it with setLogLevel().
    static std::shared_ptr<ConsoleLogger> getInstance(LogUtils::LogLevel logLevel);
    ~ConsoleLogger() override = default;

    void info(const std::string& message) override;
    void debug(const std::string& message) override;
    void warn(const std::string& message) override;
    void error(const std::string& message) override;
    void setup(const std::string& message) override;
    int getLogLevel() override { return log_level_; }
    void setLogLevel(LogUtils::LogLevel level) { log_level_ = level; }

private:
    explicit ConsoleLogger(LogUtils::LogLevel logLevel) : log_level_(logLevel) {}

    bool enabled(LogUtils::LogLevel level) const { return level == LogUtils::LogLevel::SETUP || log_level_ <= level; }
    void log(LogUtils::LogLevel level, const std::string& message);

    std::atomic<int> log_level_;
    std::mutex output_mutex_;

    static std::shared_ptr<ConsoleLogger> instance;
    static std::once_flag init_flag;

    ConsoleLogger(const ConsoleLogger&) = delete;
    ConsoleLogger& operator=(const ConsoleLogger&) = delete;
};
