#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <string>

#include <cpp-statsd-client/UDPSender.hpp>

#include "../config/AppConfig.hpp"
#include "../interfaces/ILogger.hpp"
#include "../interfaces/IStatsDClient.hpp"

// Batches metrics over UDP through Statsd::UDPSender.
class StatsDClient : public IStatsDClient {
public:
    // endpoint is "<host>:<port>"; throws std::runtime_error when it cannot be parsed
    // or the socket cannot be set up.
    StatsDClient(const AppConfig& config, std::shared_ptr<ILogger> logger, const std::string& endpoint);
    ~StatsDClient() override;

    StatsDClient(const StatsDClient&) = delete;
    StatsDClient& operator=(const StatsDClient&) = delete;

    void increment(const std::string& key, int value = 1) override;
    void decrement(const std::string& key, int value = 1) override;
    void gauge(const std::string& key, double value) override;
    void timing(const std::string& key, std::chrono::milliseconds value) override;
    void set(const std::string& key, const std::string& value) override;

    // "<key>:<value>|<type>". Characters that would break the line protocol
    // (':', '|', '@', whitespace) in the key become '_'.
    static std::string formatMetric(const std::string& key, const std::string& value, const std::string& type);
    static std::string formatNumber(double value);

    const std::string& host() const { return host_; }
    std::uint16_t port() const { return port_; }

private:
    void send(const std::string& line);

    std::shared_ptr<ILogger> logger_;
    std::string host_;
    std::uint16_t port_ = 0;
    std::unique_ptr<Statsd::UDPSender> udp_sender_;
};

// StatsDClient for a configured endpoint, LoggingStatsDClient when none is set or the
// endpoint is unusable.
std::shared_ptr<IStatsDClient> makeStatsDClient(const AppConfig& config,
                                                std::shared_ptr<ILogger> logger,
                                                const std::string& endpoint);
