#include "ConsoleLogger.hpp"

#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <thread>

std::shared_ptr<ConsoleLogger> ConsoleLogger::instance = nullptr;
std::once_flag ConsoleLogger::init_flag;

namespace {
    const std::string& prefixFor(LogUtils::LogLevel level) {
        switch (level) {
            case LogUtils::LogLevel::DEBUG: return LogUtils::DEBUG_LOG_PREFIX;
            case LogUtils::LogLevel::INFO: return LogUtils::INFO_LOG_PREFIX;
            case LogUtils::LogLevel::WARN: return LogUtils::WARN_LOG_PREFIX;
            case LogUtils::LogLevel::CERROR: return LogUtils::CERROR_LOG_PREFIX;
            case LogUtils::LogLevel::SETUP: break;
        }
        return LogUtils::SETUP_LOG_PREFIX;
    }
}

std::shared_ptr<ConsoleLogger> ConsoleLogger::getInstance(LogUtils::LogLevel logLevel) {
    std::call_once(init_flag, [logLevel]() {
        instance.reset(new ConsoleLogger(logLevel));
    });
    return instance;
}

void ConsoleLogger::log(LogUtils::LogLevel level, const std::string& message) {
    if (!enabled(level)) {
        return;
    }
    const auto now = std::chrono::system_clock::now();
    const std::time_t t = std::chrono::system_clock::to_time_t(now);
    const auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count() % 1000;
    std::tm tm{};
    gmtime_r(&t, &tm);

    std::ostringstream line;
    line << std::put_time(&tm, Constants::TIME_FORMAT) << '.'
         << std::setfill('0') << std::setw(3) << millis << "Z "
         << "[tid " << std::this_thread::get_id() << "] "
         << prefixFor(level) << message << '\n';

    std::ostream& out = (level == LogUtils::LogLevel::WARN || level == LogUtils::LogLevel::CERROR) ? std::cerr : std::cout;
    std::lock_guard<std::mutex> lock(output_mutex_);
    out << line.str() << std::flush;
}

void ConsoleLogger::info(const std::string& message) {
    log(LogUtils::LogLevel::INFO, message);
}

void ConsoleLogger::debug(const std::string& message) {
    log(LogUtils::LogLevel::DEBUG, message);
}

void ConsoleLogger::warn(const std::string& message) {
    log(LogUtils::LogLevel::WARN, message);
}

void ConsoleLogger::error(const std::string& message) {
    log(LogUtils::LogLevel::CERROR, message);
}

void ConsoleLogger::setup(const std::string& message) {
    log(LogUtils::LogLevel::SETUP, message);
}
