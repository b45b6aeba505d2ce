#pragma once

#include <memory>
#include <string>

#include "../config/AppConfig.hpp"
#include "../interfaces/ICacheObserver.hpp"
#include "../interfaces/IStatsDClient.hpp"

// Forwards engine events to StatsD as "<metrics_prefix>.<event>[.<tier>]" counters.
class StatsDCacheObserver : public ICacheObserver {
public:
    StatsDCacheObserver(std::shared_ptr<IStatsDClient> statsd_client, const AppConfig& config);
    ~StatsDCacheObserver() override = default;

    void onCacheEvent(const CacheEvent& event) override;

private:
    std::string metricName(const std::string& name) const;

    std::shared_ptr<IStatsDClient> statsd_client_;
    std::string prefix_;
};
