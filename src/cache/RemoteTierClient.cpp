#include "RemoteTierClient.hpp"

#include <future>
#include <stdexcept>

#include <boost/asio/post.hpp>

#include "RedisClusterRouter.hpp"

namespace {
    // SCAN + DEL sweeps get this many command timeouts.
    const int BULK_TIMEOUT_MULTIPLIER = 20;
    const char* SCAN_BATCH = "500";
}

RemoteTierClient::RemoteTierClient(const AppConfig& config,
                                   std::shared_ptr<ILogger> logger,
                                   std::shared_ptr<IRedisConnectionFactory> factory)
    : config_(config),
      logger_(std::move(logger)),
      factory_(std::move(factory)),
      command_timeout_(config.remote_command_timeout_ms),
      bulk_timeout_(config.remote_command_timeout_ms * BULK_TIMEOUT_MULTIPLIER),
      tracker_(config.health_failure_threshold, config.health_success_threshold, config.health_degrade_threshold),
      backoff_(std::chrono::milliseconds(config.reconnect_initial_delay_ms),
               config.reconnect_multiplier,
               std::chrono::milliseconds(config.reconnect_max_delay_ms),
               config.reconnect_max_attempts),
      timer_work_(boost::asio::make_work_guard(timer_ioc_)),
      health_timer_(timer_ioc_),
      reconnect_timer_(timer_ioc_) {
    if (!logger_) {
        throw std::invalid_argument("Logger pointer cannot be null");
    }
    if (!factory_) {
        throw std::invalid_argument("Connection factory pointer cannot be null");
    }
    if (config_.remote_nodes.empty()) {
        throw std::invalid_argument("At least one remote node must be configured");
    }
    if (config_.remote_command_timeout_ms <= 0) {
        throw std::invalid_argument("remote_command_timeout_ms must be positive");
    }
    io_pool_ = std::make_unique<ThreadPoolQueue>(
        static_cast<size_t>(config_.remote_io_threads), logger_, "RemoteTierIOPool");
}

RemoteTierClient::~RemoteTierClient() {
    shutdown();
}

std::string RemoteTierClient::namespaced(const std::string& key) const {
    if (config_.key_namespace.empty()) {
        return key;
    }
    return config_.key_namespace + ":" + key;
}

std::unique_ptr<IRedisConnection> RemoteTierClient::openConnection() {
    if (config_.remote_cluster_mode) {
        auto router = std::make_unique<RedisClusterRouter>(
            config_.remote_nodes, factory_, logger_, config_.remote_max_redirects);
        if (!router->connect()) {
            return nullptr;
        }
        return router;
    }
    // Single-node mode: the first reachable node wins, later ones are fallbacks.
    for (const auto& node : config_.remote_nodes) {
        auto connection = factory_->connect(node);
        if (connection) {
            return connection;
        }
    }
    return nullptr;
}

bool RemoteTierClient::connect() {
    if (stopped_) {
        return false;
    }
    auto fresh = openConnection();
    if (!fresh) {
        {
            std::lock_guard<std::mutex> lock(status_mutex_);
            last_error_ = "no remote node reachable (" + config_.remoteNodesToString() + ")";
        }
        logger_->error("Remote tier connect failed: no node reachable among " + config_.remoteNodesToString());
        if (auto transition = tracker_.markUnreachable()) {
            onTransition(*transition);
        } else {
            scheduleReconnect();
        }
        return false;
    }

    {
        std::lock_guard<std::mutex> lock(connection_mutex_);
        connection_ = std::move(fresh);
    }
    {
        std::lock_guard<std::mutex> lock(backoff_mutex_);
        backoff_.reset();
    }
    if (tracker_.state() == RemoteHealthState::Unreachable) {
        if (auto transition = tracker_.markReconnected()) {
            onTransition(*transition);
        }
    }
    logger_->info("Remote tier connected (" + std::string(config_.remote_cluster_mode ? "cluster" : "single node") +
                  ", " + config_.remoteNodesToString() + ")");
    return true;
}

void RemoteTierClient::startMonitoring() {
    if (stopped_ || monitoring_.exchange(true)) {
        return;
    }
    timer_thread_ = std::thread([this]() {
        logger_->debug("Remote tier timer thread started.");
        try {
            timer_ioc_.run();
        } catch (const std::exception& e) {
            logger_->error("Exception in remote tier timer thread: " + std::string(e.what()));
        }
        logger_->debug("Remote tier timer thread exiting.");
    });
    boost::asio::post(timer_ioc_, [this]() { armHealthTimer(); });
    logger_->setup("Remote tier health monitor started, interval " +
                   std::to_string(config_.health_check_interval_ms) + "ms.");
}

void RemoteTierClient::armHealthTimer() {
    if (stopped_) {
        return;
    }
    health_timer_.expires_after(std::chrono::milliseconds(config_.health_check_interval_ms));
    health_timer_.async_wait([this](const boost::system::error_code& ec) {
        if (ec == boost::asio::error::operation_aborted || stopped_) {
            return;
        }
        checkHealthNow();
        armHealthTimer();
    });
}

void RemoteTierClient::shutdown() {
    if (stopped_.exchange(true)) {
        return;
    }
    logger_->debug("RemoteTierClient shutting down...");
    boost::asio::post(timer_ioc_, [this]() {
        health_timer_.cancel();
        reconnect_timer_.cancel();
    });
    timer_work_.reset();
    if (timer_thread_.joinable()) {
        timer_ioc_.stop();
        timer_thread_.join();
    }
    // In-flight commands finish or hit their socket timeout before connections go away.
    io_pool_->shutdown(true);
    {
        std::lock_guard<std::mutex> lock(connection_mutex_);
        connection_.reset();
    }
    logger_->debug("RemoteTierClient shut down complete.");
}

std::optional<RedisReply> RemoteTierClient::runCommand(const std::string& operation,
                                                       ConnectionTask task,
                                                       std::chrono::milliseconds timeout,
                                                       bool error_reply_is_failure) {
    if (stopped_ || tracker_.state() == RemoteHealthState::Unreachable) {
        return std::nullopt;
    }

    struct Outcome {
        std::optional<RedisReply> reply;
        std::string error;
    };
    auto promise = std::make_shared<std::promise<Outcome>>();
    auto future = promise->get_future();
    bool queued = io_pool_->enqueue([this, promise, task]() {
        Outcome outcome;
        {
            std::lock_guard<std::mutex> lock(connection_mutex_);
            if (connection_ && connection_->isConnected()) {
                outcome.reply = task(*connection_);
                if (!outcome.reply) {
                    outcome.error = connection_->lastError();
                }
            } else {
                outcome.error = "not connected";
            }
        }
        promise->set_value(std::move(outcome));
    });
    if (!queued) {
        return std::nullopt;
    }

    if (future.wait_for(timeout) != std::future_status::ready) {
        logger_->warn("Remote " + operation + " timed out after " + std::to_string(timeout.count()) + "ms");
        recordOutcome(false, operation + " timed out");
        return std::nullopt;
    }

    Outcome outcome = future.get();
    std::optional<RedisReply>& reply = outcome.reply;
    if (!reply) {
        logger_->warn("Remote " + operation + " failed: " + outcome.error);
        recordOutcome(false, operation + ": " + outcome.error);
        return std::nullopt;
    }
    if (reply->isError()) {
        logger_->warn("Remote " + operation + " returned error: " + reply->str);
        if (error_reply_is_failure) {
            recordOutcome(false, operation + ": " + reply->str);
            return std::nullopt;
        }
    }
    recordOutcome(true, "");
    return reply;
}

void RemoteTierClient::recordOutcome(bool success, const std::string& error) {
    if (!success) {
        std::lock_guard<std::mutex> lock(status_mutex_);
        last_error_ = error;
    }
    auto transition = success ? tracker_.recordSuccess() : tracker_.recordFailure();
    if (transition) {
        onTransition(*transition);
    }
}

void RemoteTierClient::onTransition(const HealthTransition& transition) {
    const std::string message = "Remote tier health " + healthStateToString(transition.from) +
                                " -> " + healthStateToString(transition.to);
    if (transition.to == RemoteHealthState::Healthy) {
        logger_->info(message);
    } else {
        logger_->warn(message);
    }

    HealthChangeCallback callback;
    {
        std::lock_guard<std::mutex> lock(callback_mutex_);
        callback = health_callback_;
    }
    if (callback) {
        callback(transition.from, transition.to);
    }

    if (transition.to == RemoteHealthState::Unreachable) {
        scheduleReconnect();
    }
}

void RemoteTierClient::scheduleReconnect() {
    if (stopped_ || reconnect_scheduled_.exchange(true)) {
        return;
    }

    std::chrono::milliseconds delay;
    bool exhausted;
    int attempts;
    {
        std::lock_guard<std::mutex> lock(backoff_mutex_);
        delay = backoff_.nextDelay();
        exhausted = backoff_.consumeExhausted();
        attempts = backoff_.attempts();
    }

    if (exhausted) {
        logger_->error("Remote tier reconnect attempts exhausted after " + std::to_string(attempts - 1) +
                       " tries; retrying every " + std::to_string(delay.count()) + "ms.");
        ReconnectExhaustedCallback callback;
        {
            std::lock_guard<std::mutex> lock(callback_mutex_);
            callback = exhausted_callback_;
        }
        if (callback) {
            callback(attempts - 1);
        }
    } else {
        logger_->info("Remote tier reconnect attempt " + std::to_string(attempts) + " in " +
                      std::to_string(delay.count()) + "ms.");
    }

    boost::asio::post(timer_ioc_, [this, delay]() {
        if (stopped_) {
            return;
        }
        reconnect_timer_.expires_after(delay);
        reconnect_timer_.async_wait([this](const boost::system::error_code& ec) {
            if (ec == boost::asio::error::operation_aborted || stopped_) {
                return;
            }
            reconnect_scheduled_ = false;
            attemptReconnect();
        });
    });
}

void RemoteTierClient::attemptReconnect() {
    auto fresh = openConnection();
    if (!fresh) {
        {
            std::lock_guard<std::mutex> lock(status_mutex_);
            last_error_ = "reconnect failed";
        }
        logger_->warn("Remote tier reconnect failed.");
        scheduleReconnect();
        return;
    }

    {
        std::lock_guard<std::mutex> lock(connection_mutex_);
        connection_ = std::move(fresh);
    }
    {
        std::lock_guard<std::mutex> lock(backoff_mutex_);
        backoff_.reset();
    }
    logger_->info("Remote tier reconnected.");
    if (auto transition = tracker_.markReconnected()) {
        onTransition(*transition);
    }
}

void RemoteTierClient::checkHealthNow() {
    if (stopped_) {
        return;
    }
    if (tracker_.state() == RemoteHealthState::Unreachable) {
        scheduleReconnect();
        return;
    }
    if (!ping()) {
        return;
    }
    auto size = databaseSize();
    std::lock_guard<std::mutex> lock(status_mutex_);
    if (size) {
        key_count_ = size;
    }
}

std::optional<std::string> RemoteTierClient::get(const std::string& key) {
    const std::string remote_key = namespaced(key);
    auto reply = runCommand("GET", [remote_key](IRedisConnection& connection) {
        return connection.command({"GET", remote_key});
    }, command_timeout_);
    if (!reply || reply->type != RedisReply::Type::String) {
        return std::nullopt;
    }
    return reply->str;
}

bool RemoteTierClient::set(const std::string& key, const std::string& payload, int ttl_seconds, bool only_if_absent) {
    std::vector<std::string> args = {"SET", namespaced(key), payload};
    if (ttl_seconds > 0) {
        args.push_back("EX");
        args.push_back(std::to_string(ttl_seconds));
    }
    if (only_if_absent) {
        args.push_back("NX");
    }
    auto reply = runCommand("SET", [args](IRedisConnection& connection) {
        return connection.command(args);
    }, command_timeout_);
    return reply && reply->isStatus("OK");
}

RemoteDeleteStatus RemoteTierClient::remove(const std::string& key) {
    const std::string remote_key = namespaced(key);
    auto reply = runCommand("DEL", [remote_key](IRedisConnection& connection) {
        return connection.command({"DEL", remote_key});
    }, command_timeout_);
    if (!reply || reply->type != RedisReply::Type::Integer) {
        return RemoteDeleteStatus::Failed;
    }
    return reply->integer > 0 ? RemoteDeleteStatus::Deleted : RemoteDeleteStatus::NotFound;
}

std::optional<double> RemoteTierClient::ping() {
    const auto start = std::chrono::steady_clock::now();
    auto reply = runCommand("PING", [](IRedisConnection& connection) {
        return connection.command({"PING"});
    }, command_timeout_, true);
    const auto now = std::chrono::system_clock::now();
    if (!reply) {
        std::lock_guard<std::mutex> lock(status_mutex_);
        last_check_ = now;
        return std::nullopt;
    }
    double latency = std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - start).count();
    std::lock_guard<std::mutex> lock(status_mutex_);
    last_latency_ms_ = latency;
    last_check_ = now;
    return latency;
}

std::optional<std::int64_t> RemoteTierClient::databaseSize() {
    auto reply = runCommand("DBSIZE", [](IRedisConnection& connection) -> std::optional<RedisReply> {
        long long total = 0;
        for (std::size_t node = 0; node < connection.nodeCount(); ++node) {
            auto node_reply = connection.commandOnNode(node, {"DBSIZE"});
            if (!node_reply) {
                return std::nullopt;
            }
            if (node_reply->type == RedisReply::Type::Integer) {
                total += node_reply->integer;
            }
        }
        return RedisReply::number(total);
    }, command_timeout_);
    if (!reply || reply->type != RedisReply::Type::Integer) {
        return std::nullopt;
    }
    return static_cast<std::int64_t>(reply->integer);
}

std::optional<std::vector<std::string>> RemoteTierClient::removeMatching(const std::string& glob) {
    const std::string pattern = namespaced(glob.empty() ? "*" : glob);
    const std::size_t prefix_length = config_.key_namespace.empty() ? 0 : config_.key_namespace.size() + 1;

    auto reply = runCommand("SCAN/DEL", [pattern](IRedisConnection& connection) -> std::optional<RedisReply> {
        std::vector<RedisReply> removed;
        for (std::size_t node = 0; node < connection.nodeCount(); ++node) {
            std::string cursor = "0";
            do {
                auto page = connection.commandOnNode(node, {"SCAN", cursor, "MATCH", pattern, "COUNT", SCAN_BATCH});
                if (!page) {
                    return std::nullopt;
                }
                if (page->type != RedisReply::Type::Array || page->elements.size() != 2) {
                    return RedisReply::error("ERR unexpected SCAN reply");
                }
                cursor = page->elements[0].str;
                for (const auto& key : page->elements[1].elements) {
                    // Routed per key so cluster slots are respected.
                    auto deleted = connection.command({"DEL", key.str});
                    if (!deleted) {
                        return std::nullopt;
                    }
                    if (deleted->type == RedisReply::Type::Integer && deleted->integer > 0) {
                        removed.push_back(RedisReply::string(key.str));
                    }
                }
            } while (cursor != "0");
        }
        return RedisReply::array(std::move(removed));
    }, bulk_timeout_, true);

    if (!reply || reply->type != RedisReply::Type::Array) {
        return std::nullopt;
    }
    std::vector<std::string> keys;
    keys.reserve(reply->elements.size());
    for (const auto& element : reply->elements) {
        keys.push_back(element.str.size() >= prefix_length ? element.str.substr(prefix_length) : element.str);
    }
    return keys;
}

RemoteHealthStatus RemoteTierClient::healthStatus() const {
    RemoteHealthStatus status;
    status.enabled = true;
    status.state = tracker_.state();
    status.cluster_mode = config_.remote_cluster_mode;
    status.consecutive_failures = tracker_.consecutiveFailures();
    status.consecutive_successes = tracker_.consecutiveSuccesses();
    {
        // try_lock: a command blocked on the socket must not stall a metrics snapshot.
        std::unique_lock<std::mutex> lock(connection_mutex_, std::try_to_lock);
        if (lock.owns_lock()) {
            status.connected = connection_ && connection_->isConnected();
            status.node_count = connection_ ? connection_->nodeCount() : 0;
        } else {
            status.connected = status.state != RemoteHealthState::Unreachable;
            status.node_count = config_.remote_cluster_mode ? config_.remote_nodes.size() : 1;
        }
    }
    {
        std::lock_guard<std::mutex> lock(backoff_mutex_);
        status.reconnect_attempts = backoff_.attempts();
        status.reconnect_exhausted = backoff_.exhausted();
    }
    std::lock_guard<std::mutex> lock(status_mutex_);
    status.last_latency_ms = last_latency_ms_;
    status.last_error = last_error_;
    status.last_check = last_check_;
    status.key_count = key_count_;
    return status;
}

bool RemoteTierClient::isAvailable() const {
    return !stopped_ && tracker_.state() != RemoteHealthState::Unreachable;
}

void RemoteTierClient::setHealthChangeCallback(HealthChangeCallback callback) {
    std::lock_guard<std::mutex> lock(callback_mutex_);
    health_callback_ = std::move(callback);
}

void RemoteTierClient::setReconnectExhaustedCallback(ReconnectExhaustedCallback callback) {
    std::lock_guard<std::mutex> lock(callback_mutex_);
    exhausted_callback_ = std::move(callback);
}
