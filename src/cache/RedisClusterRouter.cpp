#include "RedisClusterRouter.hpp"

#include <sstream>
#include <stdexcept>

RedisClusterRouter::RedisClusterRouter(std::vector<RemoteNode> seeds,
                                       std::shared_ptr<IRedisConnectionFactory> factory,
                                       std::shared_ptr<ILogger> logger,
                                       int max_redirects)
    : seeds_(std::move(seeds)),
      factory_(std::move(factory)),
      logger_(std::move(logger)),
      max_redirects_(max_redirects) {
    if (!factory_) {
        throw std::invalid_argument("Connection factory pointer cannot be null");
    }
    if (!logger_) {
        throw std::invalid_argument("Logger pointer cannot be null");
    }
    slot_owner_.fill(-1);
}

std::uint16_t RedisClusterRouter::crc16(const std::string& data) {
    std::uint16_t crc = 0;
    for (unsigned char byte : data) {
        crc ^= static_cast<std::uint16_t>(byte) << 8;
        for (int bit = 0; bit < 8; ++bit) {
            if (crc & 0x8000) {
                crc = static_cast<std::uint16_t>((crc << 1) ^ 0x1021);
            } else {
                crc = static_cast<std::uint16_t>(crc << 1);
            }
        }
    }
    return crc;
}

int RedisClusterRouter::keySlot(const std::string& key) {
    auto open = key.find('{');
    if (open != std::string::npos) {
        auto close = key.find('}', open + 1);
        if (close != std::string::npos && close > open + 1) {
            return crc16(key.substr(open + 1, close - open - 1)) % SLOT_COUNT;
        }
    }
    return crc16(key) % SLOT_COUNT;
}

std::optional<RemoteNode> RedisClusterRouter::parseAddress(const std::string& address) {
    auto colon = address.rfind(':');
    if (colon == std::string::npos || colon == 0) {
        return std::nullopt;
    }
    try {
        RemoteNode node;
        node.host = address.substr(0, colon);
        node.port = std::stoi(address.substr(colon + 1));
        return node;
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

// "MOVED 3999 127.0.0.1:6381" or "ASK 3999 127.0.0.1:6381"
std::optional<RedisClusterRouter::Redirect> RedisClusterRouter::parseRedirect(const std::string& error) {
    std::istringstream in(error);
    std::string kind;
    std::string address;
    Redirect redirect;
    if (!(in >> kind >> redirect.slot >> address)) {
        return std::nullopt;
    }
    if (kind == "ASK") {
        redirect.ask = true;
    } else if (kind != "MOVED") {
        return std::nullopt;
    }
    if (redirect.slot < 0 || redirect.slot >= SLOT_COUNT) {
        return std::nullopt;
    }
    auto node = parseAddress(address);
    if (!node) {
        return std::nullopt;
    }
    redirect.node = *node;
    return redirect;
}

IRedisConnection* RedisClusterRouter::connectionFor(const RemoteNode& node) {
    auto it = connections_.find(node.address());
    if (it != connections_.end() && it->second->isConnected()) {
        return it->second.get();
    }
    auto connection = factory_->connect(node);
    if (!connection) {
        last_error_ = "cannot connect to cluster node " + node.address();
        if (it != connections_.end()) connections_.erase(it);
        return nullptr;
    }
    IRedisConnection* raw = connection.get();
    connections_[node.address()] = std::move(connection);
    return raw;
}

void RedisClusterRouter::dropConnection(const RemoteNode& node) {
    connections_.erase(node.address());
}

std::size_t RedisClusterRouter::masterIndex(const RemoteNode& node) {
    for (std::size_t i = 0; i < masters_.size(); ++i) {
        if (masters_[i] == node) return i;
    }
    masters_.push_back(node);
    return masters_.size() - 1;
}

bool RedisClusterRouter::connect() {
    std::size_t reachable = 0;
    for (const auto& seed : seeds_) {
        if (connectionFor(seed)) {
            ++reachable;
        } else {
            logger_->warn("Cluster seed " + seed.address() + " is unreachable");
        }
    }
    if (reachable == 0) {
        last_error_ = "no cluster seed node reachable";
        logger_->error(last_error_);
        return false;
    }
    return refreshTopology();
}

bool RedisClusterRouter::loadSlots(const RedisReply& reply, const RemoteNode& answering_node) {
    if (reply.type != RedisReply::Type::Array || reply.elements.empty()) {
        return false;
    }
    std::vector<RemoteNode> masters;
    std::array<int, SLOT_COUNT> owners;
    owners.fill(-1);

    for (const auto& range : reply.elements) {
        if (range.type != RedisReply::Type::Array || range.elements.size() < 3) {
            return false;
        }
        const auto& master = range.elements[2];
        if (master.type != RedisReply::Type::Array || master.elements.size() < 2) {
            return false;
        }
        RemoteNode node;
        node.host = master.elements[0].str.empty() ? answering_node.host : master.elements[0].str;
        node.port = static_cast<int>(master.elements[1].integer);

        int index = -1;
        for (std::size_t i = 0; i < masters.size(); ++i) {
            if (masters[i] == node) index = static_cast<int>(i);
        }
        if (index < 0) {
            masters.push_back(node);
            index = static_cast<int>(masters.size() - 1);
        }

        long long start = range.elements[0].integer;
        long long end = range.elements[1].integer;
        if (start < 0 || end >= SLOT_COUNT || start > end) {
            return false;
        }
        for (long long slot = start; slot <= end; ++slot) {
            owners[static_cast<std::size_t>(slot)] = index;
        }
    }

    masters_ = std::move(masters);
    slot_owner_ = owners;
    return true;
}

bool RedisClusterRouter::refreshTopology() {
    for (const auto& seed : seeds_) {
        IRedisConnection* connection = connectionFor(seed);
        if (!connection) continue;
        auto reply = connection->command({"CLUSTER", "SLOTS"});
        if (!reply) {
            dropConnection(seed);
            continue;
        }
        if (reply->isError()) {
            last_error_ = "CLUSTER SLOTS failed on " + seed.address() + ": " + reply->str;
            logger_->warn(last_error_);
            continue;
        }
        if (loadSlots(*reply, seed)) {
            logger_->info("Cluster topology loaded: " + std::to_string(masters_.size()) + " master node(s)");
            return true;
        }
        logger_->warn("Malformed CLUSTER SLOTS reply from " + seed.address());
    }
    last_error_ = "could not load cluster topology";
    logger_->error(last_error_);
    return false;
}

std::optional<RemoteNode> RedisClusterRouter::nodeForSlot(int slot) const {
    if (slot < 0 || slot >= SLOT_COUNT) return std::nullopt;
    int owner = slot_owner_[static_cast<std::size_t>(slot)];
    if (owner < 0 || static_cast<std::size_t>(owner) >= masters_.size()) return std::nullopt;
    return masters_[static_cast<std::size_t>(owner)];
}

bool RedisClusterRouter::isConnected() const {
    if (masters_.empty()) return false;
    for (const auto& pair : connections_) {
        if (pair.second->isConnected()) return true;
    }
    return false;
}

std::optional<RedisReply> RedisClusterRouter::command(const std::vector<std::string>& args) {
    if (masters_.empty()) {
        last_error_ = "cluster topology not loaded";
        return std::nullopt;
    }

    RemoteNode target = masters_.front();
    if (args.size() > 1) {
        if (auto owner = nodeForSlot(keySlot(args[1]))) {
            target = *owner;
        }
    }

    bool asking = false;
    for (int attempt = 0; attempt <= max_redirects_; ++attempt) {
        IRedisConnection* connection = connectionFor(target);
        if (!connection) {
            return std::nullopt;
        }
        if (asking) {
            auto ack = connection->command({"ASKING"});
            if (!ack) {
                last_error_ = connection->lastError();
                dropConnection(target);
                return std::nullopt;
            }
            asking = false;
        }

        auto reply = connection->command(args);
        if (!reply) {
            last_error_ = connection->lastError();
            dropConnection(target);
            return std::nullopt;
        }
        if (!reply->isError()) {
            return reply;
        }

        auto redirect = parseRedirect(reply->str);
        if (!redirect) {
            return reply;
        }
        if (redirect->ask) {
            asking = true;
        } else {
            slot_owner_[static_cast<std::size_t>(redirect->slot)] = static_cast<int>(masterIndex(redirect->node));
            logger_->debug("Slot " + std::to_string(redirect->slot) + " moved to " + redirect->node.address());
        }
        target = redirect->node;
    }

    last_error_ = "too many cluster redirects for " + (args.empty() ? std::string() : args[0]);
    logger_->warn(last_error_);
    return RedisReply::error("ERR " + last_error_);
}

std::optional<RedisReply> RedisClusterRouter::commandOnNode(std::size_t node_index, const std::vector<std::string>& args) {
    if (node_index >= masters_.size()) {
        return RedisReply::error("ERR no such node");
    }
    const RemoteNode node = masters_[node_index];
    IRedisConnection* connection = connectionFor(node);
    if (!connection) {
        return std::nullopt;
    }
    auto reply = connection->command(args);
    if (!reply) {
        last_error_ = connection->lastError();
        dropConnection(node);
    }
    return reply;
}
