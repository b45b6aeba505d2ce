#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "../config/AppConfig.hpp"
#include "../interfaces/ILogger.hpp"
#include "../interfaces/IRedisConnection.hpp"

// Forward declarations
struct redisContext;
struct redisReply;

// One blocking hiredis connection to a single node. Marks itself broken after a
// transport error; the owner replaces it rather than reusing it.
class HiredisConnection : public IRedisConnection {
public:
    HiredisConnection(const RemoteNode& node, redisContext* context, std::shared_ptr<ILogger> logger);
    ~HiredisConnection() override;

    HiredisConnection(const HiredisConnection&) = delete;
    HiredisConnection& operator=(const HiredisConnection&) = delete;

    std::optional<RedisReply> command(const std::vector<std::string>& args) override;
    std::optional<RedisReply> commandOnNode(std::size_t node_index, const std::vector<std::string>& args) override;
    std::size_t nodeCount() const override { return 1; }
    bool isConnected() const override { return context_ != nullptr && !broken_; }
    std::string lastError() const override { return last_error_; }

    static RedisReply convertReply(const redisReply* reply);

private:
    RemoteNode node_;
    redisContext* context_;
    std::shared_ptr<ILogger> logger_;
    bool broken_ = false;
    std::string last_error_;
};

class HiredisConnectionFactory : public IRedisConnectionFactory {
public:
    // select_database is false for cluster nodes, which only have database 0.
    HiredisConnectionFactory(const AppConfig& config, std::shared_ptr<ILogger> logger, bool select_database = true);

    std::unique_ptr<IRedisConnection> connect(const RemoteNode& node) override;

private:
    int connect_timeout_ms_;
    int command_timeout_ms_;
    std::string username_;
    std::string password_;
    int database_;
    bool select_database_;
    std::shared_ptr<ILogger> logger_;
};
