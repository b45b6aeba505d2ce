#include "CacheAdminService.hpp"

#include <algorithm>
#include <stdexcept>
#include <utility>
#include <vector>

#include <boost/beast/version.hpp>

#include "../utils/Utils.hpp"

namespace {
    const std::string ENTRY_PATH_PREFIX = "/cache/entries/";
    const std::size_t DEFAULT_ENTRY_LIMIT = 100;

    std::optional<std::string> queryParam(const std::vector<std::pair<std::string, std::string>>& params,
                                          const std::string& name) {
        for (const auto& param : params) {
            if (param.first == name) {
                return param.second;
            }
        }
        return std::nullopt;
    }

    std::optional<CacheTier> parseTierParam(const std::vector<std::pair<std::string, std::string>>& params) {
        auto tier_name = queryParam(params, "tier");
        if (!tier_name || tier_name->empty() || Utils::toLower(*tier_name) == "all") {
            return std::nullopt;
        }
        auto tier = tierFromString(Utils::toLower(*tier_name));
        if (!tier) {
            throw std::invalid_argument("Unknown tier: " + *tier_name);
        }
        return tier;
    }
}

CacheAdminService::CacheAdminService(std::shared_ptr<CacheEngine> engine,
                                     std::shared_ptr<ResponseCacheMiddleware> middleware,
                                     std::shared_ptr<IStatsDClient> statsd_client,
                                     const AppConfig& config,
                                     std::shared_ptr<ILogger> logger)
    : engine_(std::move(engine)),
      middleware_(std::move(middleware)),
      statsd_client_(std::move(statsd_client)),
      config_(config),
      logger_(std::move(logger)),
      started_at_(std::chrono::steady_clock::now()) {
    if (!engine_) {
        throw std::invalid_argument("CacheEngine pointer cannot be null");
    }
    if (!statsd_client_) {
        throw std::invalid_argument("StatsDClient pointer cannot be null");
    }
    if (!logger_) {
        throw std::invalid_argument("Logger pointer cannot be null");
    }
    worker_pool_ = std::make_unique<ThreadPoolQueue>(
        static_cast<size_t>(std::max(1, config_.admin_worker_threads)), logger_, "AdminWorkerPool");
    logger_->debug("CacheAdminService initialized");
}

CacheAdminService::~CacheAdminService() {
    shutdown();
}

void CacheAdminService::shutdown() {
    worker_pool_->shutdown(true);
}

void CacheAdminService::processRequest(http::request<http::string_body> req, ResponseCallback send_response_cb) const {
    auto shared_req = std::make_shared<Request>(std::move(req));
    bool queued = worker_pool_->enqueue([this, shared_req, send_response_cb]() {
        send_response_cb(handleRequest(*shared_req));
    });
    if (!queued) {
        send_response_cb(std::nullopt);
    }
}

http::response<http::string_body> CacheAdminService::handleRequest(const Request& req) const {
    const auto target = Utils::splitTarget(std::string(req.target()));
    const std::string& path = target.first;
    const std::string& query = target.second;
    const http::verb method = req.method();
    statsd_client_->increment(config_.metrics_prefix + "." + MetricsDefinitions::ADMIN_REQUEST);

    try {
        if (path == "/cache/status") {
            if (method == http::verb::get) return handleStatus(req);
        } else if (path == "/cache/metrics") {
            if (method == http::verb::get) return handleMetrics(req);
        } else if (path == "/cache/health") {
            if (method == http::verb::get) return handleHealth(req);
        } else if (path == "/cache/entries") {
            if (method == http::verb::get) return handleEntries(req, query);
        } else if (path.compare(0, ENTRY_PATH_PREFIX.size(), ENTRY_PATH_PREFIX) == 0 && path.size() > ENTRY_PATH_PREFIX.size()) {
            if (method == http::verb::delete_) {
                return handleDeleteEntry(req, Utils::percentDecode(path.substr(ENTRY_PATH_PREFIX.size()), false), query);
            }
        } else if (path == "/cache/clear") {
            if (method == http::verb::post) return handleClear(req, query);
        } else if (path == "/cache/invalidate") {
            if (method == http::verb::post) return handleInvalidate(req, query);
        } else if (path == "/cache/warmup") {
            if (method == http::verb::post) return handleWarmUp(req);
        } else {
            logger_->debug("Admin request for unknown path " + path);
            return failure(req, http::status::not_found, "Not Found");
        }
        return failure(req, http::status::method_not_allowed,
                       "Method " + std::string(req.method_string()) + " not allowed on " + path);
    } catch (const std::invalid_argument& e) {
        logger_->debug("Rejecting admin request for " + path + ": " + e.what());
        return failure(req, http::status::bad_request, e.what());
    } catch (const std::exception& e) {
        logger_->error("Unexpected exception handling admin request for " + path + ": " + e.what());
        statsd_client_->increment(config_.metrics_prefix + "." + MetricsDefinitions::ADMIN_ERROR);
        return failure(req, http::status::internal_server_error, "Internal Error");
    }
}

// --- Handlers ---

CacheAdminService::Response CacheAdminService::handleStatus(const Request& req) const {
    const CacheStatistics stats = engine_->getMetrics();
    const auto uptime = std::chrono::duration_cast<std::chrono::seconds>(std::chrono::steady_clock::now() - started_at_);
    json data = {
        {"status", overallStatus(stats.remote)},
        {"uptime_seconds", uptime.count()},
        {"timestamp", formatTimestamp(std::chrono::system_clock::now())},
        {"tiers", {
            {"memory", engine_->isTierEnabled(CacheTier::Memory)},
            {"remote", engine_->isTierEnabled(CacheTier::Remote)},
            {"persistent", engine_->isTierEnabled(CacheTier::Persistent)}
        }},
        {"remote", toJson(stats.remote)},
        {"statistics", toJson(stats)}
    };
    return success(req, data);
}

CacheAdminService::Response CacheAdminService::handleMetrics(const Request& req) const {
    return success(req, toJson(engine_->getMetrics()));
}

CacheAdminService::Response CacheAdminService::handleHealth(const Request& req) const {
    const RemoteHealthStatus remote = engine_->remoteHealth();
    const std::string status = overallStatus(remote);
    json data = {
        {"status", status},
        {"remote", toJson(remote)}
    };
    if (status == "healthy" || status == "memory-only") {
        return success(req, data);
    }
    json body = {
        {"success", false},
        {"error", "Remote tier is " + status},
        {"data", data}
    };
    return makeResponse(req, http::status::service_unavailable, body);
}

CacheAdminService::Response CacheAdminService::handleEntries(const Request& req, const std::string& query) const {
    const auto params = Utils::parseQuery(query);
    CacheQuery cache_query;
    cache_query.pattern = queryParam(params, "pattern").value_or("");
    cache_query.tags = Utils::splitCsv(queryParam(params, "tags").value_or(""));
    cache_query.limit = DEFAULT_ENTRY_LIMIT;

    if (auto min_access = queryParam(params, "min_access")) {
        auto parsed = Utils::stringToSize(*min_access);
        if (!parsed) {
            throw std::invalid_argument("Invalid min_access: " + *min_access);
        }
        cache_query.min_access = *parsed;
    }
    if (auto max_age = queryParam(params, "max_age")) {
        auto parsed = Utils::stringToInt(*max_age);
        if (!parsed || *parsed < 0) {
            throw std::invalid_argument("Invalid max_age: " + *max_age);
        }
        cache_query.max_age_seconds = *parsed;
    }
    if (auto limit = queryParam(params, "limit")) {
        auto parsed = Utils::stringToSize(*limit);
        if (!parsed) {
            throw std::invalid_argument("Invalid limit: " + *limit);
        }
        cache_query.limit = *parsed;
    }

    json entries = json::array();
    for (const auto& entry : engine_->query(cache_query)) {
        entries.push_back(entryToJson(entry));
    }
    json data = {
        {"count", entries.size()},
        {"entries", entries}
    };
    return success(req, data);
}

CacheAdminService::Response CacheAdminService::handleDeleteEntry(const Request& req,
                                                                 const std::string& key,
                                                                 const std::string& query) const {
    DeleteOptions options;
    options.tier = parseTierParam(Utils::parseQuery(query));
    const bool removed = engine_->remove(key, options);
    logger_->info("Admin delete of key " + key + (removed ? " removed it." : " found nothing."));
    return success(req, {{"key", key}, {"removed", removed}});
}

CacheAdminService::Response CacheAdminService::handleClear(const Request& req, const std::string& query) const {
    const auto params = Utils::parseQuery(query);

    if (auto resource = queryParam(params, "resource")) {
        if (!middleware_) {
            return failure(req, http::status::bad_request, "Response cache is not configured");
        }
        const std::string method = queryParam(params, "method").value_or("GET");
        const std::size_t cleared = middleware_->invalidateResource(*resource, method);
        return success(req, {{"cleared", cleared}, {"resource", *resource}, {"method", Utils::toUpper(method)}});
    }

    ClearCriteria criteria;
    criteria.tier = parseTierParam(params);
    criteria.pattern = queryParam(params, "pattern").value_or("");
    criteria.tags = Utils::splitCsv(queryParam(params, "tags").value_or(""));
    const std::size_t cleared = engine_->clear(criteria);
    return success(req, {
        {"cleared", cleared},
        {"tier", criteria.tier ? tierToString(*criteria.tier) : std::string("all")}
    });
}

CacheAdminService::Response CacheAdminService::handleInvalidate(const Request& req, const std::string& query) const {
    std::vector<std::string> dependencies = Utils::splitCsv(queryParam(Utils::parseQuery(query), "dependencies").value_or(""));

    if (dependencies.empty() && !Utils::trim(req.body()).empty()) {
        json body;
        try {
            body = json::parse(req.body());
        } catch (const json::parse_error& e) {
            return failure(req, http::status::bad_request, "Invalid JSON body: " + std::string(e.what()));
        }
        const json& list = body.is_object() ? body.value("dependencies", json::array()) : body;
        if (!list.is_array()) {
            return failure(req, http::status::bad_request, "Expected a JSON array of dependencies");
        }
        for (const auto& dependency : list) {
            if (!dependency.is_string()) {
                return failure(req, http::status::bad_request, "Dependencies must be strings");
            }
            dependencies.push_back(dependency.get<std::string>());
        }
    }
    if (dependencies.empty()) {
        return failure(req, http::status::bad_request, "No dependencies given");
    }

    const std::size_t invalidated = engine_->invalidateByDependencies(dependencies);
    return success(req, {{"invalidated", invalidated}, {"dependencies", dependencies}});
}

CacheAdminService::Response CacheAdminService::handleWarmUp(const Request& req) const {
    json body;
    try {
        body = json::parse(req.body());
    } catch (const json::parse_error& e) {
        return failure(req, http::status::bad_request, "Invalid JSON body: " + std::string(e.what()));
    }
    std::vector<std::string> errors;
    const auto items = Utils::parseWarmUpItems(body, &errors);
    const std::size_t loaded = engine_->warmUp(items);
    return success(req, {
        {"loaded", loaded},
        {"failed", errors.size() + (items.size() - loaded)},
        {"errors", errors}
    });
}

// --- Helpers ---

std::string CacheAdminService::overallStatus(const RemoteHealthStatus& remote) const {
    if (!engine_->isTierEnabled(CacheTier::Remote)) {
        return "memory-only";
    }
    return healthStateToString(remote.state);
}

CacheAdminService::Response CacheAdminService::makeResponse(const Request& req, http::status status, const json& body) {
    Response res{status, req.version()};
    res.set(http::field::server, BOOST_BEAST_VERSION_STRING);
    res.set(http::field::content_type, "application/json");
    res.keep_alive(req.keep_alive());
    // Keys are arbitrary bytes; invalid UTF-8 is replaced rather than failing the reply.
    res.body() = body.dump(-1, ' ', false, json::error_handler_t::replace);
    res.prepare_payload();
    return res;
}

CacheAdminService::Response CacheAdminService::success(const Request& req, const json& data, http::status status) {
    return makeResponse(req, status, {{"success", true}, {"data", data}});
}

CacheAdminService::Response CacheAdminService::failure(const Request& req, http::status status, const std::string& message) {
    return makeResponse(req, status, {{"success", false}, {"error", message}});
}

json CacheAdminService::entryToJson(const CacheEntry& entry) {
    const auto now = std::chrono::system_clock::now();
    return {
        {"key", entry.key},
        {"type", entry.value.type},
        {"tier", tierToString(entry.tier)},
        {"size_bytes", entry.size_bytes},
        {"access_count", entry.access_count},
        {"ttl_seconds", entry.ttl_seconds},
        {"remaining_ttl_seconds", entry.remainingTtlSeconds(now)},
        {"created_at", formatTimestamp(entry.created_at)},
        {"last_accessed_at", formatTimestamp(entry.last_accessed_at)},
        {"tags", entry.tags},
        {"dependencies", entry.dependencies}
    };
}
