#ifndef IREDISCONNECTION_HPP
#define IREDISCONNECTION_HPP

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "../models/RemoteNode.hpp"

// Transport-independent copy of a RESP reply.
struct RedisReply {
    enum class Type {
        Nil,
        Status,
        Error,
        Integer,
        String,
        Array
    };

    Type type = Type::Nil;
    std::string str;
    long long integer = 0;
    std::vector<RedisReply> elements;

    bool isError() const { return type == Type::Error; }
    bool isNil() const { return type == Type::Nil; }
    bool isStatus(const std::string& expected) const { return type == Type::Status && str == expected; }

    static RedisReply status(const std::string& s) { RedisReply r; r.type = Type::Status; r.str = s; return r; }
    static RedisReply error(const std::string& s) { RedisReply r; r.type = Type::Error; r.str = s; return r; }
    static RedisReply string(const std::string& s) { RedisReply r; r.type = Type::String; r.str = s; return r; }
    static RedisReply number(long long n) { RedisReply r; r.type = Type::Integer; r.integer = n; return r; }
    static RedisReply array(std::vector<RedisReply> items) { RedisReply r; r.type = Type::Array; r.elements = std::move(items); return r; }
    static RedisReply nil() { return RedisReply{}; }
};

// A (possibly clustered) connection to the remote store. Not thread-safe; callers serialize access.
class IRedisConnection {
public:
    virtual ~IRedisConnection() = default;

    // nullopt on transport failure (timeout, reset, protocol error). Server-side
    // errors come back as a reply of Type::Error.
    virtual std::optional<RedisReply> command(const std::vector<std::string>& args) = 0;

    // Node-addressed commands (SCAN, DBSIZE, FLUSHDB) for fan-out across a cluster.
    virtual std::optional<RedisReply> commandOnNode(std::size_t node_index, const std::vector<std::string>& args) = 0;
    virtual std::size_t nodeCount() const = 0;

    virtual bool isConnected() const = 0;
    virtual std::string lastError() const = 0;
};

class IRedisConnectionFactory {
public:
    virtual ~IRedisConnectionFactory() = default;
    // Returns nullptr when the node cannot be reached.
    virtual std::unique_ptr<IRedisConnection> connect(const RemoteNode& node) = 0;
};

#endif // IREDISCONNECTION_HPP
