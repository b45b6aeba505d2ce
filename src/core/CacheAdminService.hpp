#ifndef CACHEADMINSERVICE_HPP
#define CACHEADMINSERVICE_HPP

#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <string>

#include <boost/beast/http.hpp>
#include <nlohmann/json.hpp>

#include "CacheEngine.hpp"
#include "ResponseCacheMiddleware.hpp"
#include "ThreadPoolQueue.hpp"
#include "../config/AppConfig.hpp"
#include "../interfaces/ILogger.hpp"
#include "../interfaces/IStatsDClient.hpp"

namespace beast = boost::beast;
namespace http = beast::http;

using json = nlohmann::json;

// Operator endpoints over the engine. Every response is JSON {success, data | error}.
//
//   GET    /cache/status        health plus statistics
//   GET    /cache/metrics       statistics
//   GET    /cache/health        200 when healthy or memory-only, 503 otherwise
//   GET    /cache/entries       ?pattern=&tags=a,b&min_access=&max_age=&limit=
//   DELETE /cache/entries/<key> ?tier=
//   POST   /cache/clear         ?tier=&pattern=&tags=a,b  or  ?resource=/path&method=GET
//   POST   /cache/invalidate    ?dependencies=a,b  or body {"dependencies": [...]}
//   POST   /cache/warmup        body: JSON array of warm-up items
class CacheAdminService {
public:
    using ResponseCallback = std::function<void(std::optional<http::response<http::string_body>>)>;

    CacheAdminService(std::shared_ptr<CacheEngine> engine,
                      std::shared_ptr<ResponseCacheMiddleware> middleware,
                      std::shared_ptr<IStatsDClient> statsd_client,
                      const AppConfig& config,
                      std::shared_ptr<ILogger> logger);
    ~CacheAdminService();

    CacheAdminService(const CacheAdminService&) = delete;
    CacheAdminService& operator=(const CacheAdminService&) = delete;
    CacheAdminService(CacheAdminService&&) = delete;
    CacheAdminService& operator=(CacheAdminService&&) = delete;

    // Handles the request on the worker pool and hands the response to send_response_cb
    // from a worker thread. nullopt means the service is shutting down.
    void processRequest(http::request<http::string_body> req, ResponseCallback send_response_cb) const;

    // Synchronous routing, used by the worker pool.
    http::response<http::string_body> handleRequest(const http::request<http::string_body>& req) const;

    void shutdown();

private:
    using Response = http::response<http::string_body>;
    using Request = http::request<http::string_body>;

    Response handleStatus(const Request& req) const;
    Response handleMetrics(const Request& req) const;
    Response handleHealth(const Request& req) const;
    Response handleEntries(const Request& req, const std::string& query) const;
    Response handleDeleteEntry(const Request& req, const std::string& key, const std::string& query) const;
    Response handleClear(const Request& req, const std::string& query) const;
    Response handleInvalidate(const Request& req, const std::string& query) const;
    Response handleWarmUp(const Request& req) const;

    // "healthy", "degraded", "unreachable" or "memory-only".
    std::string overallStatus(const RemoteHealthStatus& remote) const;

    static Response makeResponse(const Request& req, http::status status, const json& body);
    static Response success(const Request& req, const json& data, http::status status = http::status::ok);
    static Response failure(const Request& req, http::status status, const std::string& message);
    static json entryToJson(const CacheEntry& entry);

    std::shared_ptr<CacheEngine> engine_;
    std::shared_ptr<ResponseCacheMiddleware> middleware_;
    std::shared_ptr<IStatsDClient> statsd_client_;
    const AppConfig& config_;
    std::shared_ptr<ILogger> logger_;
    std::unique_ptr<ThreadPoolQueue> worker_pool_;
    std::chrono::steady_clock::time_point started_at_;
};

#endif // CACHEADMINSERVICE_HPP
