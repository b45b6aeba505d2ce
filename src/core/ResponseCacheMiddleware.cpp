#include "ResponseCacheMiddleware.hpp"

#include <algorithm>
#include <cstdint>
#include <stdexcept>

#include <nlohmann/json.hpp>

#include "../utils/Utils.hpp"

using json = nlohmann::json;

namespace {
    // Separators of the fingerprint; re-encoded inside components so decoded
    // values can never forge another request's key.
    const std::string KEY_RESERVED = ":&=";

    // Connection-level or per-delivery fields a stored response must not replay.
    bool isReplayableField(const http::fields::value_type& field) {
        switch (field.name()) {
            case http::field::connection:
            case http::field::content_length:
            case http::field::keep_alive:
            case http::field::set_cookie:
            case http::field::transfer_encoding:
            case http::field::upgrade:
                return false;
            default:
                break;
        }
        const std::string name = Utils::toLower(std::string(field.name_string()));
        return name != Utils::toLower(ResponseCacheMiddleware::CACHE_STATUS_HEADER) &&
               name != Utils::toLower(ResponseCacheMiddleware::CACHE_KEY_HEADER);
    }

    std::string keyComponent(const std::string& text) {
        return Utils::percentEncode(text, KEY_RESERVED);
    }
}

ResponseCacheMiddleware::ResponseCacheMiddleware(std::shared_ptr<CacheEngine> engine,
                                                 const AppConfig& config,
                                                 std::shared_ptr<ILogger> logger,
                                                 std::string principal_header)
    : engine_(std::move(engine)),
      config_(config),
      logger_(std::move(logger)),
      principal_header_(std::move(principal_header)),
      request_predicate_(&ResponseCacheMiddleware::isSafeMethod),
      response_predicate_(&ResponseCacheMiddleware::isSuccessful) {
    if (!engine_) {
        throw std::invalid_argument("CacheEngine pointer cannot be null");
    }
    if (!logger_) {
        throw std::invalid_argument("Logger pointer cannot be null");
    }
}

HttpRequestDescriptor ResponseCacheMiddleware::describe(const Request& req) const {
    HttpRequestDescriptor descriptor;
    descriptor.method = Utils::toUpper(std::string(req.method_string()));

    auto target = Utils::splitTarget(std::string(req.target()));
    descriptor.path = target.first.empty() ? "/" : target.first;
    descriptor.query = Utils::parseQuery(target.second);
    std::sort(descriptor.query.begin(), descriptor.query.end());

    auto principal = req.find(principal_header_);
    if (principal != req.end() && !Utils::trim(std::string(principal->value())).empty()) {
        descriptor.principal_id = Utils::trim(std::string(principal->value()));
    } else {
        descriptor.principal_id = Constants::ANONYMOUS_PRINCIPAL;
    }
    return descriptor;
}

std::string ResponseCacheMiddleware::fingerprint(const HttpRequestDescriptor& descriptor) {
    std::string query;
    for (const auto& param : descriptor.query) {
        if (!query.empty()) query += "&";
        query += keyComponent(param.first) + "=" + keyComponent(param.second);
    }
    return std::string(KEY_PREFIX) + ":" + keyComponent(descriptor.method) + ":" + keyComponent(descriptor.path) + ":" +
           query + ":" + keyComponent(descriptor.principal_id);
}

ResponseCacheMiddleware::Response ResponseCacheMiddleware::handle(const Request& req,
                                                                  const Handler& next,
                                                                  std::optional<int> ttl_override) {
    const HttpRequestDescriptor descriptor = describe(req);
    if (!request_predicate_ || !request_predicate_(descriptor)) {
        return next(req);
    }
    const std::string key = fingerprint(descriptor);

    try {
        if (auto cached = lookup(key, req)) {
            logger_->debug("Response cache HIT for " + key);
            return std::move(*cached);
        }
    } catch (const std::exception& e) {
        logger_->warn("Response cache lookup failed for " + key + ", running handler: " + e.what());
    }

    Response res = next(req);
    if (response_predicate_ && response_predicate_(res)) {
        try {
            store(key, res, ttl_override.value_or(config_.response_cache_ttl_seconds));
        } catch (const std::exception& e) {
            logger_->warn("Response cache store failed for " + key + ": " + e.what());
        }
    }
    res.set(CACHE_STATUS_HEADER, "MISS");
    res.set(CACHE_KEY_HEADER, key);
    logger_->debug("Response cache MISS for " + key);
    return res;
}

std::optional<ResponseCacheMiddleware::Response> ResponseCacheMiddleware::lookup(const std::string& key, const Request& req) {
    auto value = engine_->get(key);
    if (!value) {
        return std::nullopt;
    }
    if (value->type != RESPONSE_VALUE_TYPE) {
        logger_->warn("Ignoring cached value of type '" + value->type + "' under response key " + key);
        return std::nullopt;
    }

    json stored;
    try {
        stored = json::from_msgpack(value->data);
    } catch (const json::exception& e) {
        logger_->warn("Discarding unreadable cached response for " + key + ": " + e.what());
        return std::nullopt;
    }

    Response res{static_cast<http::status>(stored.value("status", 200)), req.version()};
    const auto& body = stored.at("body").get_binary();
    res.body().assign(body.begin(), body.end());
    for (const auto& field : stored.value("headers", json::array())) {
        res.insert(field.at("name").get<std::string>(), field.at("value").get<std::string>());
    }
    res.set(CACHE_STATUS_HEADER, "HIT");
    res.set(CACHE_KEY_HEADER, key);
    res.keep_alive(req.keep_alive());
    res.prepare_payload();
    return res;
}

void ResponseCacheMiddleware::store(const std::string& key, const Response& res, int ttl_seconds) {
    json stored;
    stored["status"] = res.result_int();
    json headers = json::array();
    for (const auto& field : res) {
        if (isReplayableField(field)) {
            headers.push_back({{"name", std::string(field.name_string())}, {"value", std::string(field.value())}});
        }
    }
    stored["headers"] = std::move(headers);
    stored["body"] = json::binary(std::vector<std::uint8_t>(res.body().begin(), res.body().end()));

    const auto packed = json::to_msgpack(stored);
    CacheValue value{std::string(packed.begin(), packed.end()), RESPONSE_VALUE_TYPE};

    SetOptions options;
    options.ttl_seconds = ttl_seconds;
    options.tags = {RESPONSE_TAG};
    auto result = engine_->set(key, value, options);
    if (!result.ok) {
        logger_->debug("Response for " + key + " was not cached" +
                       std::string(result.capacity_rejected ? " (too large for the memory tier)" : ""));
    }
}

std::size_t ResponseCacheMiddleware::invalidateResource(const std::string& path_prefix, const std::string& method) {
    const std::string pattern = std::string(KEY_PREFIX) + ":" + Utils::escapeGlob(keyComponent(Utils::toUpper(method))) + ":" +
                                Utils::escapeGlob(keyComponent(path_prefix)) + "*";
    return invalidatePattern(pattern);
}

std::size_t ResponseCacheMiddleware::invalidatePattern(const std::string& glob) {
    ClearCriteria criteria;
    criteria.pattern = glob;
    std::size_t removed = engine_->clear(criteria);
    logger_->info("Response cache invalidated " + std::to_string(removed) + " entries matching " + glob);
    return removed;
}
