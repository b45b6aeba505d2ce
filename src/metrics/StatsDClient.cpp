#include "StatsDClient.hpp"

#include <sstream>
#include <stdexcept>

#include "LoggingStatsDClient.hpp"
#include "../utils/Utils.hpp"

StatsDClient::StatsDClient(const AppConfig& config, std::shared_ptr<ILogger> logger, const std::string& endpoint)
    : logger_(std::move(logger)) {
    if (!logger_) {
        throw std::invalid_argument("Logger pointer cannot be null");
    }
    const std::string trimmed = Utils::trim(endpoint);
    auto colon_pos = trimmed.rfind(':');
    if (colon_pos == std::string::npos || colon_pos == 0) {
        throw std::runtime_error("StatsD endpoint must be in the format <host>:<port>, got '" + endpoint + "'");
    }
    host_ = trimmed.substr(0, colon_pos);
    if (host_ == "localhost") {
        host_ = "127.0.0.1";
    }
    auto parsed = Utils::stringToInt(trimmed.substr(colon_pos + 1));
    if (!parsed || *parsed <= 0 || *parsed > 65535) {
        throw std::runtime_error("Invalid port in StatsD endpoint '" + endpoint + "'");
    }
    port_ = static_cast<std::uint16_t>(*parsed);

    udp_sender_ = std::make_unique<Statsd::UDPSender>(
        host_, port_,
        static_cast<uint64_t>(config.metrics_batch_size),
        static_cast<uint64_t>(config.metrics_send_interval_in_millis));
    if (!udp_sender_->initialized()) {
        throw std::runtime_error("Failed to initialize UDPSender: " + udp_sender_->errorMessage());
    }
    logger_->setup("StatsD metrics go to " + host_ + ":" + std::to_string(port_) +
                   " (batch " + std::to_string(config.metrics_batch_size) + ", every " +
                   std::to_string(config.metrics_send_interval_in_millis) + "ms)");
}

StatsDClient::~StatsDClient() {
    logger_->debug("StatsDClient for " + host_ + ":" + std::to_string(port_) + " destroyed.");
}

std::string StatsDClient::formatMetric(const std::string& key, const std::string& value, const std::string& type) {
    std::string line;
    line.reserve(key.size() + value.size() + type.size() + 2);
    for (char c : key) {
        const bool reserved = c == ':' || c == '|' || c == '@' || c == ' ' || c == '\t' || c == '\n';
        line.push_back(reserved ? '_' : c);
    }
    line += ":";
    line += value;
    line += "|";
    line += type;
    return line;
}

std::string StatsDClient::formatNumber(double value) {
    std::ostringstream ss;
    ss << value;
    return ss.str();
}

void StatsDClient::send(const std::string& line) {
    udp_sender_->send(line);
}

void StatsDClient::increment(const std::string& key, int value) {
    send(formatMetric(key, std::to_string(value), "c"));
}

void StatsDClient::decrement(const std::string& key, int value) {
    increment(key, -value);
}

void StatsDClient::gauge(const std::string& key, double value) {
    send(formatMetric(key, formatNumber(value), "g"));
}

void StatsDClient::timing(const std::string& key, std::chrono::milliseconds value) {
    send(formatMetric(key, std::to_string(value.count()), "ms"));
}

void StatsDClient::set(const std::string& key, const std::string& value) {
    send(formatMetric(key, value, "s"));
}

std::shared_ptr<IStatsDClient> makeStatsDClient(const AppConfig& config,
                                                std::shared_ptr<ILogger> logger,
                                                const std::string& endpoint) {
    if (Utils::trim(endpoint).empty()) {
        logger->setup("No StatsD endpoint configured, metrics are written to the debug log.");
        return std::make_shared<LoggingStatsDClient>(logger);
    }
    try {
        return std::make_shared<StatsDClient>(config, logger, endpoint);
    } catch (const std::exception& e) {
        logger->error("StatsD client could not be created: " + std::string(e.what()) +
                      ". Metrics are written to the debug log instead.");
    }
    return std::make_shared<LoggingStatsDClient>(logger);
}
