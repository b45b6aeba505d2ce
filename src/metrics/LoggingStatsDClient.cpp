#include "LoggingStatsDClient.hpp"

#include <stdexcept>

#include "StatsDClient.hpp"

LoggingStatsDClient::LoggingStatsDClient(std::shared_ptr<ILogger> logger) : logger_(std::move(logger)) {
    if (!logger_) {
        throw std::invalid_argument("Logger pointer cannot be null");
    }
}

void LoggingStatsDClient::record(const std::string& line) {
    ++recorded_;
    logger_->debug("metric (not sent): " + line);
}

void LoggingStatsDClient::increment(const std::string& key, int value) {
    record(StatsDClient::formatMetric(key, std::to_string(value), "c"));
}

void LoggingStatsDClient::decrement(const std::string& key, int value) {
    increment(key, -value);
}

void LoggingStatsDClient::gauge(const std::string& key, double value) {
    record(StatsDClient::formatMetric(key, StatsDClient::formatNumber(value), "g"));
}

void LoggingStatsDClient::timing(const std::string& key, std::chrono::milliseconds value) {
    record(StatsDClient::formatMetric(key, std::to_string(value.count()), "ms"));
}

void LoggingStatsDClient::set(const std::string& key, const std::string& value) {
    record(StatsDClient::formatMetric(key, value, "s"));
}
