// tests/test_responsecachemiddleware.cpp
#include <memory>
#include <string>

#include "gtest/gtest.h"
#include "gmock/gmock.h"

#include "TestDoubles.hpp"
#include "../src/core/ResponseCacheMiddleware.hpp"

using ::testing::NiceMock;

using Request = ResponseCacheMiddleware::Request;
using Response = ResponseCacheMiddleware::Response;

class ResponseCacheMiddlewareTest : public ::testing::Test {
protected:
    void SetUp() override {
        logger = std::make_shared<NiceMock<MockLogger>>();
        config.use_remote = false;
        engine = std::make_shared<CacheEngine>(config, logger);
        middleware = std::make_unique<ResponseCacheMiddleware>(engine, config, logger);

        handler = [this](const Request& req) {
            ++handler_calls;
            Response res{status, req.version()};
            res.set(http::field::content_type, "application/json");
            res.body() = "{\"call\":" + std::to_string(handler_calls) + "}";
            res.prepare_payload();
            return res;
        };
    }

    static Request makeRequest(http::verb method, const std::string& target, const std::string& user = "") {
        Request req{method, target, 11};
        if (!user.empty()) {
            req.set("X-User-Id", user);
        }
        return req;
    }

    AppConfig config;
    std::shared_ptr<NiceMock<MockLogger>> logger;
    std::shared_ptr<CacheEngine> engine;
    std::unique_ptr<ResponseCacheMiddleware> middleware;
    ResponseCacheMiddleware::Handler handler;
    int handler_calls = 0;
    http::status status = http::status::ok;
};

TEST_F(ResponseCacheMiddlewareTest, SecondRequestIsServedFromCache) {
    auto first = middleware->handle(makeRequest(http::verb::get, "/api/users?page=1"), handler);
    EXPECT_EQ(first[ResponseCacheMiddleware::CACHE_STATUS_HEADER], "MISS");
    EXPECT_EQ(first.body(), "{\"call\":1}");

    auto second = middleware->handle(makeRequest(http::verb::get, "/api/users?page=1"), handler);
    EXPECT_EQ(second[ResponseCacheMiddleware::CACHE_STATUS_HEADER], "HIT");
    EXPECT_EQ(second.body(), "{\"call\":1}");
    EXPECT_EQ(second.result(), http::status::ok);
    EXPECT_EQ(second[http::field::content_type], "application/json");
    EXPECT_EQ(second[ResponseCacheMiddleware::CACHE_KEY_HEADER], "http:GET:/api/users:page=1:anonymous");
    EXPECT_EQ(handler_calls, 1);
}

TEST_F(ResponseCacheMiddlewareTest, HitReplaysTheHandlersHeaders) {
    auto with_headers = [this](const Request& req) {
        Response res = handler(req);
        res.set(http::field::cache_control, "max-age=60");
        res.set(http::field::etag, "\"v1\"");
        res.set("X-Trace", "abc");
        res.set(http::field::set_cookie, "session=secret");
        return res;
    };
    middleware->handle(makeRequest(http::verb::get, "/profile"), with_headers);
    auto hit = middleware->handle(makeRequest(http::verb::get, "/profile"), with_headers);

    EXPECT_EQ(hit[ResponseCacheMiddleware::CACHE_STATUS_HEADER], "HIT");
    EXPECT_EQ(hit[http::field::cache_control], "max-age=60");
    EXPECT_EQ(hit[http::field::etag], "\"v1\"");
    EXPECT_EQ(hit["X-Trace"], "abc");
    EXPECT_EQ(hit[http::field::content_type], "application/json");
    EXPECT_EQ(hit.find(http::field::set_cookie), hit.end());
    EXPECT_EQ(hit[http::field::content_length], std::to_string(hit.body().size()));
    EXPECT_EQ(handler_calls, 1);
}

TEST_F(ResponseCacheMiddlewareTest, CachedResponseIsTaggedAndTyped) {
    middleware->handle(makeRequest(http::verb::get, "/api/users"), handler);
    auto entry = engine->getEntry("http:GET:/api/users::anonymous");
    ASSERT_TRUE(entry.has_value());
    EXPECT_EQ(entry->value.type, ResponseCacheMiddleware::RESPONSE_VALUE_TYPE);
    EXPECT_EQ(entry->tags.count(ResponseCacheMiddleware::RESPONSE_TAG), 1u);
    EXPECT_EQ(entry->ttl_seconds, config.response_cache_ttl_seconds);
}

TEST_F(ResponseCacheMiddlewareTest, TtlOverrideIsApplied) {
    middleware->handle(makeRequest(http::verb::get, "/short"), handler, 5);
    auto entry = engine->getEntry("http:GET:/short::anonymous");
    ASSERT_TRUE(entry.has_value());
    EXPECT_EQ(entry->ttl_seconds, 5);
}

TEST_F(ResponseCacheMiddlewareTest, PrincipalsDoNotShareEntries) {
    middleware->handle(makeRequest(http::verb::get, "/me", "alice"), handler);
    auto bob = middleware->handle(makeRequest(http::verb::get, "/me", "bob"), handler);
    EXPECT_EQ(bob[ResponseCacheMiddleware::CACHE_STATUS_HEADER], "MISS");
    EXPECT_EQ(bob[ResponseCacheMiddleware::CACHE_KEY_HEADER], "http:GET:/me::bob");

    auto alice = middleware->handle(makeRequest(http::verb::get, "/me", "alice"), handler);
    EXPECT_EQ(alice[ResponseCacheMiddleware::CACHE_STATUS_HEADER], "HIT");
    EXPECT_EQ(handler_calls, 2);
}

TEST_F(ResponseCacheMiddlewareTest, QueryOrderDoesNotChangeTheFingerprint) {
    middleware->handle(makeRequest(http::verb::get, "/search?b=2&a=1"), handler);
    auto res = middleware->handle(makeRequest(http::verb::get, "/search?a=1&b=2"), handler);
    EXPECT_EQ(res[ResponseCacheMiddleware::CACHE_STATUS_HEADER], "HIT");
    EXPECT_EQ(res[ResponseCacheMiddleware::CACHE_KEY_HEADER], "http:GET:/search:a=1&b=2:anonymous");
}

TEST_F(ResponseCacheMiddlewareTest, EncodedSeparatorsDoNotCollideWithRealOnes) {
    auto encoded = middleware->handle(makeRequest(http::verb::get, "/cars?a=1%26b%3D2", "u"), handler);
    auto split = middleware->handle(makeRequest(http::verb::get, "/cars?a=1&b=2", "u"), handler);
    EXPECT_EQ(split[ResponseCacheMiddleware::CACHE_STATUS_HEADER], "MISS");
    EXPECT_NE(encoded[ResponseCacheMiddleware::CACHE_KEY_HEADER], split[ResponseCacheMiddleware::CACHE_KEY_HEADER]);
    EXPECT_EQ(encoded[ResponseCacheMiddleware::CACHE_KEY_HEADER], "http:GET:/cars:a=1%26b%3D2:u");
    EXPECT_EQ(handler_calls, 2);

    HttpRequestDescriptor one{"GET", "/cars", {{"a", "1&b=2"}}, "u"};
    HttpRequestDescriptor two{"GET", "/cars", {{"a", "1"}, {"b", "2"}}, "u"};
    EXPECT_NE(ResponseCacheMiddleware::fingerprint(one), ResponseCacheMiddleware::fingerprint(two));

    HttpRequestDescriptor colon_path{"GET", "/a:b", {}, "u"};
    HttpRequestDescriptor colon_principal{"GET", "/a", {}, "b:u"};
    EXPECT_EQ(ResponseCacheMiddleware::fingerprint(colon_path), "http:GET:/a%3Ab::u");
    EXPECT_NE(ResponseCacheMiddleware::fingerprint(colon_path), ResponseCacheMiddleware::fingerprint(colon_principal));
}

TEST_F(ResponseCacheMiddlewareTest, NonGetRequestsPassThroughUntouched) {
    auto first = middleware->handle(makeRequest(http::verb::post, "/api/users"), handler);
    auto second = middleware->handle(makeRequest(http::verb::post, "/api/users"), handler);
    EXPECT_EQ(handler_calls, 2);
    EXPECT_EQ(first.find(ResponseCacheMiddleware::CACHE_STATUS_HEADER), first.end());
    EXPECT_EQ(second.body(), "{\"call\":2}");
    EXPECT_EQ(engine->getMetrics().memory_entries, 0u);
}

TEST_F(ResponseCacheMiddlewareTest, ErrorResponsesAreNotCached) {
    status = http::status::internal_server_error;
    middleware->handle(makeRequest(http::verb::get, "/flaky"), handler);
    status = http::status::ok;
    auto res = middleware->handle(makeRequest(http::verb::get, "/flaky"), handler);
    EXPECT_EQ(res[ResponseCacheMiddleware::CACHE_STATUS_HEADER], "MISS");
    EXPECT_EQ(res.result(), http::status::ok);
    EXPECT_EQ(handler_calls, 2);
}

TEST_F(ResponseCacheMiddlewareTest, InvalidateResourceDropsMatchingPaths) {
    middleware->handle(makeRequest(http::verb::get, "/api/users?page=1"), handler);
    middleware->handle(makeRequest(http::verb::get, "/api/users/7"), handler);
    middleware->handle(makeRequest(http::verb::get, "/api/orders"), handler);

    EXPECT_EQ(middleware->invalidateResource("/api/users"), 2u);

    auto users = middleware->handle(makeRequest(http::verb::get, "/api/users/7"), handler);
    EXPECT_EQ(users[ResponseCacheMiddleware::CACHE_STATUS_HEADER], "MISS");
    auto orders = middleware->handle(makeRequest(http::verb::get, "/api/orders"), handler);
    EXPECT_EQ(orders[ResponseCacheMiddleware::CACHE_STATUS_HEADER], "HIT");
}

TEST_F(ResponseCacheMiddlewareTest, InvalidatePatternUsesGlob) {
    middleware->handle(makeRequest(http::verb::get, "/a", "alice"), handler);
    middleware->handle(makeRequest(http::verb::get, "/b", "alice"), handler);
    middleware->handle(makeRequest(http::verb::get, "/a", "bob"), handler);
    EXPECT_EQ(middleware->invalidatePattern("http:*:alice"), 2u);
    EXPECT_EQ(engine->getMetrics().memory_entries, 1u);
}

TEST_F(ResponseCacheMiddlewareTest, ForeignValueUnderResponseKeyIsAMiss) {
    engine->set("http:GET:/x::anonymous", CacheValue{"not a response", "text/plain"});
    auto res = middleware->handle(makeRequest(http::verb::get, "/x"), handler);
    EXPECT_EQ(res[ResponseCacheMiddleware::CACHE_STATUS_HEADER], "MISS");
    EXPECT_EQ(handler_calls, 1);
}

TEST_F(ResponseCacheMiddlewareTest, CustomRequestPredicate) {
    middleware->setRequestPredicate([](const HttpRequestDescriptor& d) {
        return d.method == "GET" && d.path.rfind("/static/", 0) == 0;
    });
    middleware->handle(makeRequest(http::verb::get, "/api/live"), handler);
    middleware->handle(makeRequest(http::verb::get, "/api/live"), handler);
    EXPECT_EQ(handler_calls, 2);
}

TEST(ResponseCacheFingerprintTest, DescribesMethodPathQueryAndPrincipal) {
    auto logger = std::make_shared<NiceMock<MockLogger>>();
    AppConfig config;
    config.use_remote = false;
    auto engine = std::make_shared<CacheEngine>(config, logger);
    ResponseCacheMiddleware middleware(engine, config, logger, "X-Tenant");

    Request req{http::verb::get, "/items?q=red%20shoes&limit=5", 11};
    req.set("X-Tenant", "  acme ");
    auto descriptor = middleware.describe(req);
    EXPECT_EQ(descriptor.method, "GET");
    EXPECT_EQ(descriptor.path, "/items");
    EXPECT_EQ(descriptor.principal_id, "acme");
    EXPECT_EQ(ResponseCacheMiddleware::fingerprint(descriptor), "http:GET:/items:limit=5&q=red shoes:acme");

    EXPECT_THROW(ResponseCacheMiddleware(nullptr, config, logger), std::invalid_argument);
}
