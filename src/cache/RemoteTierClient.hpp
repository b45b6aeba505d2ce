#ifndef REMOTETIERCLIENT_HPP
#define REMOTETIERCLIENT_HPP

#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>

#include "../config/AppConfig.hpp"
#include "../core/ThreadPoolQueue.hpp"
#include "../interfaces/ILogger.hpp"
#include "../interfaces/IRedisConnection.hpp"
#include "../models/RemoteHealth.hpp"
#include "RemoteHealthTracker.hpp"

enum class RemoteDeleteStatus {
    Deleted,
    NotFound,
    Failed
};

// Client for the remote tier (a single Redis node or a cluster).
//
// Every call runs on an I/O worker and the caller waits at most
// remote_command_timeout_ms for it; a slow store turns into a miss or a failed
// write, never an exception. While the tracker reports Unreachable, calls fail
// immediately without touching the network and a reconnect loop runs on the
// timer thread.
class RemoteTierClient {
public:
    using HealthChangeCallback = std::function<void(RemoteHealthState from, RemoteHealthState to)>;
    using ReconnectExhaustedCallback = std::function<void(int attempts)>;

    RemoteTierClient(const AppConfig& config,
                     std::shared_ptr<ILogger> logger,
                     std::shared_ptr<IRedisConnectionFactory> factory);
    ~RemoteTierClient();

    RemoteTierClient(const RemoteTierClient&) = delete;
    RemoteTierClient& operator=(const RemoteTierClient&) = delete;

    // Fails fast when no node is reachable; the reconnect loop (or the caller) retries.
    bool connect();
    // Starts the timer thread: periodic health checks and pending reconnects.
    void startMonitoring();
    void shutdown();

    std::optional<std::string> get(const std::string& key);
    // only_if_absent maps to SET ... NX.
    bool set(const std::string& key, const std::string& payload, int ttl_seconds, bool only_if_absent = false);
    RemoteDeleteStatus remove(const std::string& key);
    // Round-trip latency in milliseconds.
    std::optional<double> ping();
    // SCAN MATCH on every node, then DEL. Returns the removed keys without namespace.
    std::optional<std::vector<std::string>> removeMatching(const std::string& glob);
    std::optional<std::int64_t> databaseSize();

    // One health check (PING, then DBSIZE when healthy). Also kicks the reconnect
    // loop when Unreachable.
    void checkHealthNow();

    RemoteHealthStatus healthStatus() const;
    RemoteHealthState state() const { return tracker_.state(); }
    bool isAvailable() const;

    void setHealthChangeCallback(HealthChangeCallback callback);
    void setReconnectExhaustedCallback(ReconnectExhaustedCallback callback);

    std::string namespaced(const std::string& key) const;

private:
    using ConnectionTask = std::function<std::optional<RedisReply>(IRedisConnection&)>;

    std::optional<RedisReply> runCommand(const std::string& operation,
                                         ConnectionTask task,
                                         std::chrono::milliseconds timeout,
                                         bool error_reply_is_failure = false);
    void recordOutcome(bool success, const std::string& error);
    void onTransition(const HealthTransition& transition);

    std::unique_ptr<IRedisConnection> openConnection();
    void scheduleReconnect();
    void attemptReconnect();
    void armHealthTimer();

    AppConfig config_;
    std::shared_ptr<ILogger> logger_;
    std::shared_ptr<IRedisConnectionFactory> factory_;
    std::chrono::milliseconds command_timeout_;
    std::chrono::milliseconds bulk_timeout_;

    mutable std::mutex connection_mutex_;
    std::unique_ptr<IRedisConnection> connection_;

    RemoteHealthTracker tracker_;
    mutable std::mutex backoff_mutex_;
    ReconnectBackoff backoff_;
    std::atomic<bool> reconnect_scheduled_{false};
    std::atomic<bool> monitoring_{false};
    std::atomic<bool> stopped_{false};

    std::unique_ptr<ThreadPoolQueue> io_pool_;

    boost::asio::io_context timer_ioc_;
    boost::asio::executor_work_guard<boost::asio::io_context::executor_type> timer_work_;
    boost::asio::steady_timer health_timer_;
    boost::asio::steady_timer reconnect_timer_;
    std::thread timer_thread_;

    mutable std::mutex status_mutex_;
    double last_latency_ms_ = 0.0;
    std::string last_error_;
    std::optional<std::chrono::system_clock::time_point> last_check_;
    std::optional<std::int64_t> key_count_;

    std::mutex callback_mutex_;
    HealthChangeCallback health_callback_;
    ReconnectExhaustedCallback exhausted_callback_;
};

#endif // REMOTETIERCLIENT_HPP
