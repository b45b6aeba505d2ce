#ifndef APPCONFIG_HPP
#define APPCONFIG_HPP

#include <cstddef>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

#include "../models/RemoteNode.hpp"

namespace LogUtils {
    enum LogLevel {
        DEBUG = 0,
        INFO = 1,
        WARN = 2,
        CERROR = 3,
        SETUP = 4
    };

    static std::string DEBUG_LOG_PREFIX = "[Debug] ";
    static std::string INFO_LOG_PREFIX = "[Info] ";
    static std::string WARN_LOG_PREFIX = "[Warning] ";
    static std::string CERROR_LOG_PREFIX = "[Error] ";
    static std::string SETUP_LOG_PREFIX = "[Setup] ";
}

// Counter names are appended to AppConfig::metrics_prefix.
namespace MetricsDefinitions {
    static std::string CACHE_HIT = "hit";
    static std::string CACHE_MISS = "miss";
    static std::string CACHE_SET = "set";
    static std::string CACHE_DELETE = "delete";
    static std::string CACHE_ERROR = "error";
    static std::string CACHE_EVICT = "evict";
    static std::string CACHE_EXPIRE = "expire";
    static std::string CACHE_CLEAR = "clear";
    static std::string CACHE_INVALIDATE = "invalidate";
    static std::string CACHE_WARMUP = "warmup";
    static std::string REMOTE_HEALTH_CHANGE = "remote.health_change";
    static std::string REMOTE_RECONNECT_EXHAUSTED = "remote.reconnect_exhausted";
    static std::string OPERATION_LATENCY = "latency";
    static std::string ADMIN_REQUEST = "admin.request";
    static std::string ADMIN_ERROR = "admin.error";
}

namespace Constants {
    static constexpr auto TIME_FORMAT = "%Y-%m-%dT%H:%M:%S";
    static constexpr auto CONFIG_FILE_NAME = "tiercache.config";
    static constexpr auto ENV_PREFIX = "TIERCACHE_";
    static constexpr auto ANONYMOUS_PRINCIPAL = "anonymous";
};

// --- Configuration Struct ---
class AppConfig {
public:
    // Admin server configuration
    int admin_port;
    unsigned int num_io_threads;
    int admin_worker_threads;
    std::size_t max_response_queue_size;

    // Logging Level
    LogUtils::LogLevel log_level;

    // Metrics
    std::string metrics_prefix;
    // "<host>:<port>"; empty writes metrics to the debug log.
    std::string statsd_endpoint;
    int metrics_batch_size;
    int metrics_send_interval_in_millis;

    // --- Engine ---
    std::string key_namespace;
    int default_ttl_seconds;
    int max_key_length;
    bool read_through;
    int sweep_interval_seconds;
    std::size_t latency_window_size;
    int backfill_threads;
    bool drain_backfill_on_shutdown;
    int shutdown_drain_timeout_ms;

    // --- Memory tier ---
    bool memory_enabled;
    std::size_t memory_max_bytes;
    std::size_t memory_max_items;
    std::string eviction_policy;

    // --- Remote tier ---
    bool use_remote;
    std::vector<RemoteNode> remote_nodes;
    bool remote_cluster_mode;
    std::string remote_username;
    std::string remote_password;
    int remote_database;
    int remote_connect_timeout_ms;
    int remote_command_timeout_ms;
    int remote_io_threads;
    int remote_max_redirects;
    bool remote_compression;
    std::size_t compression_min_bytes;

    // Health monitor
    int health_check_interval_ms;
    int health_failure_threshold;
    // Consecutive failures before a healthy tier reports degraded.
    int health_degrade_threshold;
    int health_success_threshold;

    // Reconnect backoff
    int reconnect_initial_delay_ms;
    double reconnect_multiplier;
    int reconnect_max_delay_ms;
    int reconnect_max_attempts;

    // Startup / HTTP response cache
    std::string warmup_file;
    int response_cache_ttl_seconds;

    AppConfig() {
        // --- Set Defaults  ---
        admin_port = 9100;
        num_io_threads = 2;
        admin_worker_threads = 2;
        max_response_queue_size = 32;
        log_level = LogUtils::LogLevel::INFO;

        metrics_prefix = "tiercache";
        metrics_batch_size = 100;
        metrics_send_interval_in_millis = 1000;

        key_namespace = "tiercache";
        default_ttl_seconds = 3600; // 1 hour
        max_key_length = 512;
        read_through = true;
        sweep_interval_seconds = 60;
        latency_window_size = 1000;
        backfill_threads = 1;
        drain_backfill_on_shutdown = true;
        shutdown_drain_timeout_ms = 5000;

        memory_enabled = true;
        memory_max_bytes = 100 * 1024 * 1024; // 100MB
        memory_max_items = 10000;
        eviction_policy = "lru";

        use_remote = true;
        remote_nodes = {RemoteNode{"localhost", 6379}};
        remote_cluster_mode = false;
        remote_database = 0;
        remote_connect_timeout_ms = 1000;
        remote_command_timeout_ms = 250;
        remote_io_threads = 2;
        remote_max_redirects = 16;
        remote_compression = false;
        compression_min_bytes = 256;

        health_check_interval_ms = 30000;
        health_failure_threshold = 3;
        health_degrade_threshold = 2;
        health_success_threshold = 2;

        reconnect_initial_delay_ms = 1000;
        reconnect_multiplier = 2.0;
        reconnect_max_delay_ms = 30000;
        reconnect_max_attempts = 5;

        response_cache_ttl_seconds = 300; // 5 minutes
    }

    std::string to_string() const {
        std::stringstream ss;
        ss << "// --- Configuration Params Start --- //" << std::endl
            << "admin_port: " << admin_port << std::endl
            << "num_io_threads: " << num_io_threads << std::endl
            << "admin_worker_threads: " << admin_worker_threads << std::endl
            << "max_response_queue_size: " << max_response_queue_size << std::endl
            << "// --- Engine --- //" << std::endl
            << "key_namespace: " << key_namespace << std::endl
            << "default_ttl_seconds: " << default_ttl_seconds << std::endl
            << "max_key_length: " << max_key_length << std::endl
            << "read_through: " << std::boolalpha << read_through << std::noboolalpha << std::endl
            << "sweep_interval_seconds: " << sweep_interval_seconds << std::endl
            << "latency_window_size: " << latency_window_size << std::endl
            << "backfill_threads: " << backfill_threads << std::endl
            << "drain_backfill_on_shutdown: " << std::boolalpha << drain_backfill_on_shutdown << std::noboolalpha << std::endl
            << "shutdown_drain_timeout_ms: " << shutdown_drain_timeout_ms << std::endl
            << "// --- Memory Tier --- //" << std::endl
            << "memory_enabled: " << std::boolalpha << memory_enabled << std::noboolalpha << std::endl
            << "memory_max_bytes: " << memory_max_bytes << std::endl
            << "memory_max_items: " << memory_max_items << std::endl
            << "eviction_policy: " << eviction_policy << std::endl
            << "// --- Remote Tier --- //" << std::endl
            << "use_remote: " << std::boolalpha << use_remote << std::noboolalpha << std::endl
            << "remote_nodes: " << remoteNodesToString() << std::endl
            << "remote_cluster_mode: " << std::boolalpha << remote_cluster_mode << std::noboolalpha << std::endl
            << "remote_username: " << remote_username << std::endl
            << "remote_password: " << (remote_password.empty() ? "" : "********") << std::endl
            << "remote_database: " << remote_database << std::endl
            << "remote_connect_timeout_ms: " << remote_connect_timeout_ms << std::endl
            << "remote_command_timeout_ms: " << remote_command_timeout_ms << std::endl
            << "remote_io_threads: " << remote_io_threads << std::endl
            << "remote_max_redirects: " << remote_max_redirects << std::endl
            << "remote_compression: " << std::boolalpha << remote_compression << std::noboolalpha << std::endl
            << "compression_min_bytes: " << compression_min_bytes << std::endl
            << "health_check_interval_ms: " << health_check_interval_ms << std::endl
            << "health_failure_threshold: " << health_failure_threshold << std::endl
            << "health_degrade_threshold: " << health_degrade_threshold << std::endl
            << "health_success_threshold: " << health_success_threshold << std::endl
            << "reconnect_initial_delay_ms: " << reconnect_initial_delay_ms << std::endl
            << "reconnect_multiplier: " << reconnect_multiplier << std::endl
            << "reconnect_max_delay_ms: " << reconnect_max_delay_ms << std::endl
            << "reconnect_max_attempts: " << reconnect_max_attempts << std::endl
            << "// --- Logging & Metrics --- //" << std::endl
            << "log_level: " << static_cast<int>(log_level) << std::endl
            << "metrics_prefix: " << metrics_prefix << std::endl
            << "statsd_endpoint: " << statsd_endpoint << std::endl
            << "metrics_batch_size: " << metrics_batch_size << std::endl
            << "metrics_send_interval_in_millis: " << metrics_send_interval_in_millis << std::endl
            << "// --- Startup --- //" << std::endl
            << "warmup_file: " << warmup_file << std::endl
            << "response_cache_ttl_seconds: " << response_cache_ttl_seconds << std::endl
            << "// --- Configuration Params End --- //" << std::endl;
        return ss.str();
    }

    std::string remoteNodesToString() const {
        std::string joined;
        for (const auto& node : remote_nodes) {
            if (!joined.empty()) joined += ",";
            joined += node.address();
        }
        return joined;
    }
};

#endif // APPCONFIG_HPP
