#ifndef RESPONSECACHEMIDDLEWARE_HPP
#define RESPONSECACHEMIDDLEWARE_HPP

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include <boost/beast/http.hpp>

#include "CacheEngine.hpp"
#include "../config/AppConfig.hpp"
#include "../interfaces/ILogger.hpp"

namespace beast = boost::beast;
namespace http = beast::http;

struct HttpRequestDescriptor {
    std::string method;
    std::string path;
    // Decoded and sorted, so parameter order never changes the fingerprint.
    std::vector<std::pair<std::string, std::string>> query;
    std::string principal_id;
};

// Caches whole responses under a fingerprint of method, path, query and principal.
// Any cache failure falls through to the wrapped handler.
class ResponseCacheMiddleware {
public:
    using Request = http::request<http::string_body>;
    using Response = http::response<http::string_body>;
    using Handler = std::function<Response(const Request&)>;
    using RequestPredicate = std::function<bool(const HttpRequestDescriptor&)>;
    using ResponsePredicate = std::function<bool(const Response&)>;

    static constexpr auto CACHE_STATUS_HEADER = "X-Cache";
    static constexpr auto CACHE_KEY_HEADER = "X-Cache-Key";
    static constexpr auto DEFAULT_PRINCIPAL_HEADER = "X-User-Id";
    static constexpr auto KEY_PREFIX = "http";
    static constexpr auto RESPONSE_VALUE_TYPE = "application/x-http-response+msgpack";
    static constexpr auto RESPONSE_TAG = "http-response";

    ResponseCacheMiddleware(std::shared_ptr<CacheEngine> engine,
                            const AppConfig& config,
                            std::shared_ptr<ILogger> logger,
                            std::string principal_header = DEFAULT_PRINCIPAL_HEADER);

    HttpRequestDescriptor describe(const Request& req) const;
    // http:<METHOD>:<path>:<k=v&...>:<principal>, each component percent-encoded
    // for '%', ':', '&', '=', control and non-ASCII bytes.
    static std::string fingerprint(const HttpRequestDescriptor& descriptor);

    // Serves a stored response (X-Cache: HIT) or runs next and stores its result
    // (X-Cache: MISS). Requests the predicate rejects pass straight through untouched.
    Response handle(const Request& req, const Handler& next, std::optional<int> ttl_override = std::nullopt);

    // Drops cached responses for every path starting with path_prefix.
    std::size_t invalidateResource(const std::string& path_prefix, const std::string& method = "GET");
    std::size_t invalidatePattern(const std::string& glob);

    void setRequestPredicate(RequestPredicate predicate) { request_predicate_ = std::move(predicate); }
    void setResponsePredicate(ResponsePredicate predicate) { response_predicate_ = std::move(predicate); }

    static bool isSafeMethod(const HttpRequestDescriptor& descriptor) { return descriptor.method == "GET"; }
    static bool isSuccessful(const Response& res) { return res.result_int() >= 200 && res.result_int() < 300; }

private:
    std::optional<Response> lookup(const std::string& key, const Request& req);
    void store(const std::string& key, const Response& res, int ttl_seconds);

    std::shared_ptr<CacheEngine> engine_;
    const AppConfig& config_;
    std::shared_ptr<ILogger> logger_;
    std::string principal_header_;
    RequestPredicate request_predicate_;
    ResponsePredicate response_predicate_;
};

#endif // RESPONSECACHEMIDDLEWARE_HPP
