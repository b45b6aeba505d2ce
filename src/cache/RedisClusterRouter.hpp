#pragma once

#include <array>
#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "../interfaces/ILogger.hpp"
#include "../interfaces/IRedisConnection.hpp"

// Presents a Redis Cluster as one IRedisConnection. Key commands are routed by hash
// slot (args[1] is taken as the key); MOVED and ASK replies are followed up to
// max_redirects times. Not thread-safe.
class RedisClusterRouter : public IRedisConnection {
public:
    static constexpr int SLOT_COUNT = 16384;

    RedisClusterRouter(std::vector<RemoteNode> seeds,
                       std::shared_ptr<IRedisConnectionFactory> factory,
                       std::shared_ptr<ILogger> logger,
                       int max_redirects);
    ~RedisClusterRouter() override = default;

    // Connects every seed and loads the slot map. False when no seed is reachable
    // or no seed answers CLUSTER SLOTS.
    bool connect();
    bool refreshTopology();

    std::optional<RedisReply> command(const std::vector<std::string>& args) override;
    std::optional<RedisReply> commandOnNode(std::size_t node_index, const std::vector<std::string>& args) override;
    std::size_t nodeCount() const override { return masters_.size(); }
    bool isConnected() const override;
    std::string lastError() const override { return last_error_; }

    std::vector<RemoteNode> masters() const { return masters_; }
    std::optional<RemoteNode> nodeForSlot(int slot) const;

    static std::uint16_t crc16(const std::string& data);
    // Honors "{hash tag}" sections so related keys land on the same slot.
    static int keySlot(const std::string& key);

private:
    struct Redirect {
        bool ask = false;
        int slot = 0;
        RemoteNode node;
    };

    static std::optional<Redirect> parseRedirect(const std::string& error);
    static std::optional<RemoteNode> parseAddress(const std::string& address);

    IRedisConnection* connectionFor(const RemoteNode& node);
    void dropConnection(const RemoteNode& node);
    std::size_t masterIndex(const RemoteNode& node);
    bool loadSlots(const RedisReply& reply, const RemoteNode& answering_node);

    std::vector<RemoteNode> seeds_;
    std::shared_ptr<IRedisConnectionFactory> factory_;
    std::shared_ptr<ILogger> logger_;
    int max_redirects_;

    std::map<std::string, std::unique_ptr<IRedisConnection>> connections_;
    std::vector<RemoteNode> masters_;
    std::array<int, SLOT_COUNT> slot_owner_;
    std::string last_error_;
};
