#include "HiredisConnection.hpp"

#include <sys/time.h>

#include <hiredis/hiredis.h>

namespace {

struct timeval toTimeval(int millis) {
    struct timeval tv;
    tv.tv_sec = millis / 1000;
    tv.tv_usec = (millis % 1000) * 1000;
    return tv;
}

} // namespace

HiredisConnection::HiredisConnection(const RemoteNode& node, redisContext* context, std::shared_ptr<ILogger> logger)
    : node_(node), context_(context), logger_(std::move(logger)) {}

HiredisConnection::~HiredisConnection() {
    if (context_) {
        redisFree(context_);
    }
}

RedisReply HiredisConnection::convertReply(const redisReply* reply) {
    RedisReply converted;
    switch (reply->type) {
        case REDIS_REPLY_STRING:
            converted.type = RedisReply::Type::String;
            converted.str.assign(reply->str, reply->len);
            break;
        case REDIS_REPLY_STATUS:
            converted.type = RedisReply::Type::Status;
            converted.str.assign(reply->str, reply->len);
            break;
        case REDIS_REPLY_ERROR:
            converted.type = RedisReply::Type::Error;
            converted.str.assign(reply->str, reply->len);
            break;
        case REDIS_REPLY_INTEGER:
            converted.type = RedisReply::Type::Integer;
            converted.integer = reply->integer;
            break;
        case REDIS_REPLY_ARRAY:
            converted.type = RedisReply::Type::Array;
            converted.elements.reserve(reply->elements);
            for (size_t i = 0; i < reply->elements; ++i) {
                converted.elements.push_back(convertReply(reply->element[i]));
            }
            break;
        default:
            converted.type = RedisReply::Type::Nil;
            break;
    }
    return converted;
}

std::optional<RedisReply> HiredisConnection::command(const std::vector<std::string>& args) {
    if (!isConnected()) {
        last_error_ = "not connected to " + node_.address();
        return std::nullopt;
    }
    if (args.empty()) {
        return RedisReply::error("ERR empty command");
    }

    std::vector<const char*> argv;
    std::vector<size_t> argvlen;
    argv.reserve(args.size());
    argvlen.reserve(args.size());
    for (const auto& arg : args) {
        argv.push_back(arg.data());
        argvlen.push_back(arg.size());
    }

    auto* reply = static_cast<redisReply*>(
        redisCommandArgv(context_, static_cast<int>(argv.size()), argv.data(), argvlen.data()));
    if (reply == nullptr) {
        // Context is unusable after an I/O or protocol error.
        broken_ = true;
        last_error_ = context_->errstr[0] != '\0' ? std::string(context_->errstr) : "no reply";
        logger_->warn("Redis " + node_.address() + " command " + args[0] + " failed: " + last_error_);
        return std::nullopt;
    }

    RedisReply converted = convertReply(reply);
    freeReplyObject(reply);
    return converted;
}

std::optional<RedisReply> HiredisConnection::commandOnNode(std::size_t node_index, const std::vector<std::string>& args) {
    if (node_index != 0) {
        return RedisReply::error("ERR no such node");
    }
    return command(args);
}

HiredisConnectionFactory::HiredisConnectionFactory(const AppConfig& config, std::shared_ptr<ILogger> logger, bool select_database)
    : connect_timeout_ms_(config.remote_connect_timeout_ms),
      command_timeout_ms_(config.remote_command_timeout_ms),
      username_(config.remote_username),
      password_(config.remote_password),
      database_(config.remote_database),
      select_database_(select_database),
      logger_(std::move(logger)) {}

std::unique_ptr<IRedisConnection> HiredisConnectionFactory::connect(const RemoteNode& node) {
    redisContext* context = redisConnectWithTimeout(node.host.c_str(), node.port, toTimeval(connect_timeout_ms_));
    if (context == nullptr || context->err) {
        std::string error_msg;
        if (context) {
            error_msg = "Redis connection error (" + node.address() + "): " + std::string(context->errstr);
            redisFree(context);
        } else {
            error_msg = "Redis connection error (" + node.address() + "): can't allocate redis context";
        }
        logger_->error(error_msg);
        return nullptr;
    }

    if (redisSetTimeout(context, toTimeval(command_timeout_ms_)) != REDIS_OK) {
        logger_->warn("Could not set command timeout on " + node.address());
    }

    auto connection = std::make_unique<HiredisConnection>(node, context, logger_);

    if (!password_.empty()) {
        std::vector<std::string> auth = {"AUTH"};
        if (!username_.empty()) auth.push_back(username_);
        auth.push_back(password_);
        auto reply = connection->command(auth);
        if (!reply || reply->isError()) {
            logger_->error("Redis AUTH failed on " + node.address() + ": " + (reply ? reply->str : connection->lastError()));
            return nullptr;
        }
    }

    if (select_database_ && database_ != 0) {
        auto reply = connection->command({"SELECT", std::to_string(database_)});
        if (!reply || reply->isError()) {
            logger_->error("Redis SELECT " + std::to_string(database_) + " failed on " + node.address());
            return nullptr;
        }
    }

    logger_->debug("Connected to Redis node " + node.address());
    return connection;
}
