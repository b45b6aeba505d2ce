#include "StatsDCacheObserver.hpp"

#include <chrono>
#include <stdexcept>

StatsDCacheObserver::StatsDCacheObserver(std::shared_ptr<IStatsDClient> statsd_client, const AppConfig& config)
    : statsd_client_(std::move(statsd_client)), prefix_(config.metrics_prefix) {
    if (!statsd_client_) {
        throw std::invalid_argument("StatsDClient pointer cannot be null");
    }
}

std::string StatsDCacheObserver::metricName(const std::string& name) const {
    if (prefix_.empty()) {
        return name;
    }
    return prefix_ + "." + name;
}

void StatsDCacheObserver::onCacheEvent(const CacheEvent& event) {
    switch (event.type) {
        case CacheEventType::Hit:
            statsd_client_->increment(metricName(MetricsDefinitions::CACHE_HIT));
            if (event.tier) {
                statsd_client_->increment(metricName(MetricsDefinitions::CACHE_HIT + "." + tierToString(*event.tier)));
            }
            statsd_client_->timing(metricName(MetricsDefinitions::OPERATION_LATENCY),
                                   std::chrono::milliseconds(static_cast<long long>(event.latency_ms)));
            break;
        case CacheEventType::Miss:
            statsd_client_->increment(metricName(MetricsDefinitions::CACHE_MISS));
            statsd_client_->timing(metricName(MetricsDefinitions::OPERATION_LATENCY),
                                   std::chrono::milliseconds(static_cast<long long>(event.latency_ms)));
            break;
        case CacheEventType::Set:
            statsd_client_->increment(metricName(MetricsDefinitions::CACHE_SET));
            break;
        case CacheEventType::Delete:
            statsd_client_->increment(metricName(MetricsDefinitions::CACHE_DELETE));
            break;
        case CacheEventType::Error:
            statsd_client_->increment(metricName(MetricsDefinitions::CACHE_ERROR));
            break;
        case CacheEventType::Evict:
            statsd_client_->increment(metricName(MetricsDefinitions::CACHE_EVICT + "." + event.detail));
            break;
        case CacheEventType::Expire:
            statsd_client_->increment(metricName(MetricsDefinitions::CACHE_EXPIRE));
            break;
        case CacheEventType::Clear:
            statsd_client_->increment(metricName(MetricsDefinitions::CACHE_CLEAR), static_cast<int>(event.count));
            break;
        case CacheEventType::Invalidate:
            statsd_client_->increment(metricName(MetricsDefinitions::CACHE_INVALIDATE), static_cast<int>(event.count));
            break;
        case CacheEventType::WarmUp:
            statsd_client_->increment(metricName(MetricsDefinitions::CACHE_WARMUP), static_cast<int>(event.count));
            break;
        case CacheEventType::HealthChange:
            statsd_client_->increment(metricName(MetricsDefinitions::REMOTE_HEALTH_CHANGE + "." + event.detail));
            break;
        case CacheEventType::ReconnectExhausted:
            statsd_client_->increment(metricName(MetricsDefinitions::REMOTE_RECONNECT_EXHAUSTED));
            break;
    }
}
