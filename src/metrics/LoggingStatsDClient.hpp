#pragma once

#include <atomic>
#include <cstdint>
#include <memory>
#include <string>

#include "../interfaces/ILogger.hpp"
#include "../interfaces/IStatsDClient.hpp"

// Stand-in when no StatsD endpoint is configured. Each metric is written to the
// debug log in wire format instead of being sent.
class LoggingStatsDClient : public IStatsDClient {
public:
    explicit LoggingStatsDClient(std::shared_ptr<ILogger> logger);
    ~LoggingStatsDClient() override = default;

    void increment(const std::string& key, int value = 1) override;
    void decrement(const std::string& key, int value = 1) override;
    void gauge(const std::string& key, double value) override;
    void timing(const std::string& key, std::chrono::milliseconds value) override;
    void set(const std::string& key, const std::string& value) override;

    std::uint64_t recorded() const { return recorded_.load(); }

private:
    void record(const std::string& line);

    std::shared_ptr<ILogger> logger_;
    std::atomic<std::uint64_t> recorded_{0};
};
