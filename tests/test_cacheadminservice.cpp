// tests/test_cacheadminservice.cpp
#include <chrono>
#include <future>
#include <memory>
#include <string>

#include "gtest/gtest.h"
#include "gmock/gmock.h"

#include <nlohmann/json.hpp>

#include "FakeRedis.hpp"
#include "TestDoubles.hpp"
#include "../src/core/CacheAdminService.hpp"

using ::testing::_;
using ::testing::AnyNumber;
using ::testing::NiceMock;

using json = nlohmann::json;
using Request = http::request<http::string_body>;
using Response = http::response<http::string_body>;

class CacheAdminServiceTest : public ::testing::Test {
protected:
    void SetUp() override {
        logger = std::make_shared<NiceMock<MockLogger>>();
        statsd = std::make_shared<NiceMock<MockStatsDClient>>();
        config.use_remote = false;
        config.admin_worker_threads = 1;
        engine = std::make_shared<CacheEngine>(config, logger);
        middleware = std::make_shared<ResponseCacheMiddleware>(engine, config, logger);
        service = std::make_unique<CacheAdminService>(engine, middleware, statsd, config, logger);
    }

    static Request makeRequest(http::verb method, const std::string& target, const std::string& body = "") {
        Request req{method, target, 11};
        if (!body.empty()) {
            req.set(http::field::content_type, "application/json");
            req.body() = body;
            req.prepare_payload();
        }
        return req;
    }

    Response send(http::verb method, const std::string& target, const std::string& body = "") {
        return service->handleRequest(makeRequest(method, target, body));
    }

    static json bodyOf(const Response& res) {
        return json::parse(res.body());
    }

    AppConfig config;
    std::shared_ptr<NiceMock<MockLogger>> logger;
    std::shared_ptr<NiceMock<MockStatsDClient>> statsd;
    std::shared_ptr<CacheEngine> engine;
    std::shared_ptr<ResponseCacheMiddleware> middleware;
    std::unique_ptr<CacheAdminService> service;
};

TEST_F(CacheAdminServiceTest, StatusReportsMemoryOnlyEngine) {
    engine->set("k", CacheValue{"v", "text/plain"});
    auto res = send(http::verb::get, "/cache/status");
    ASSERT_EQ(res.result(), http::status::ok);
    EXPECT_EQ(res[http::field::content_type], "application/json");

    auto body = bodyOf(res);
    EXPECT_TRUE(body["success"].get<bool>());
    EXPECT_EQ(body["data"]["status"], "memory-only");
    EXPECT_TRUE(body["data"]["tiers"]["memory"].get<bool>());
    EXPECT_FALSE(body["data"]["tiers"]["remote"].get<bool>());
    EXPECT_EQ(body["data"]["statistics"]["sets"], 1);
    EXPECT_EQ(body["data"]["statistics"]["entries"]["memory"], 1);
}

TEST_F(CacheAdminServiceTest, MetricsAndHealth) {
    engine->set("k", CacheValue{"v", "text/plain"});
    engine->get("k");
    engine->get("missing");

    auto metrics = bodyOf(send(http::verb::get, "/cache/metrics"));
    EXPECT_EQ(metrics["data"]["hits"], 1);
    EXPECT_EQ(metrics["data"]["misses"], 1);
    EXPECT_DOUBLE_EQ(metrics["data"]["hit_rate"].get<double>(), 0.5);

    auto health = send(http::verb::get, "/cache/health");
    EXPECT_EQ(health.result(), http::status::ok);
    EXPECT_EQ(bodyOf(health)["data"]["status"], "memory-only");
}

TEST_F(CacheAdminServiceTest, EveryRequestIsCounted) {
    EXPECT_CALL(*statsd, increment("tiercache.admin.request", 1)).Times(2);
    send(http::verb::get, "/cache/status");
    send(http::verb::get, "/nowhere");
}

TEST_F(CacheAdminServiceTest, ListsEntriesWithFilters) {
    SetOptions tagged;
    tagged.tags = {"users"};
    engine->set("user:1", CacheValue{"a", "text/plain"}, tagged);
    engine->set("user:2", CacheValue{"b", "text/plain"}, tagged);
    engine->set("order:1", CacheValue{"c", "text/plain"});
    engine->get("user:2");

    auto all = bodyOf(send(http::verb::get, "/cache/entries"));
    EXPECT_EQ(all["data"]["count"], 3);
    EXPECT_EQ(all["data"]["entries"][0]["key"], "user:2");
    EXPECT_EQ(all["data"]["entries"][0]["tier"], "memory");

    auto users = bodyOf(send(http::verb::get, "/cache/entries?pattern=user%3A*&tags=users&limit=1"));
    ASSERT_EQ(users["data"]["count"], 1);
    EXPECT_EQ(users["data"]["entries"][0]["key"], "user:2");
    EXPECT_EQ(users["data"]["entries"][0]["tags"], json::array({"users"}));

    auto busy = bodyOf(send(http::verb::get, "/cache/entries?min_access=1"));
    EXPECT_EQ(busy["data"]["count"], 1);

    EXPECT_EQ(send(http::verb::get, "/cache/entries?limit=many").result(), http::status::bad_request);
    EXPECT_EQ(send(http::verb::get, "/cache/entries?max_age=-1").result(), http::status::bad_request);
}

TEST_F(CacheAdminServiceTest, DeletesEncodedKey) {
    engine->set("user:1/profile", CacheValue{"v", "text/plain"});

    auto res = send(http::verb::delete_, "/cache/entries/user%3A1%2Fprofile");
    ASSERT_EQ(res.result(), http::status::ok);
    auto body = bodyOf(res);
    EXPECT_EQ(body["data"]["key"], "user:1/profile");
    EXPECT_TRUE(body["data"]["removed"].get<bool>());
    EXPECT_FALSE(engine->get("user:1/profile").has_value());

    auto again = bodyOf(send(http::verb::delete_, "/cache/entries/user%3A1%2Fprofile?tier=memory"));
    EXPECT_FALSE(again["data"]["removed"].get<bool>());

    EXPECT_EQ(send(http::verb::delete_, "/cache/entries/k?tier=disk").result(), http::status::bad_request);
}

TEST_F(CacheAdminServiceTest, NonUtf8KeysDoNotBreakJsonReplies) {
    const std::string raw_key("bad\xFFkey");
    engine->set(raw_key, CacheValue{"v", "text/plain"});
    engine->get(raw_key);
    const std::string replaced = "bad\xEF\xBF\xBDkey";

    auto metrics = send(http::verb::get, "/cache/metrics");
    ASSERT_EQ(metrics.result(), http::status::ok);
    EXPECT_EQ(bodyOf(metrics)["data"]["top_keys"][0]["key"], replaced);

    EXPECT_EQ(send(http::verb::get, "/cache/status").result(), http::status::ok);
    auto entries = send(http::verb::get, "/cache/entries");
    ASSERT_EQ(entries.result(), http::status::ok);
    EXPECT_EQ(bodyOf(entries)["data"]["entries"][0]["key"], replaced);

    auto removed = send(http::verb::delete_, "/cache/entries/bad%FFkey");
    ASSERT_EQ(removed.result(), http::status::ok);
    EXPECT_TRUE(bodyOf(removed)["data"]["removed"].get<bool>());
    EXPECT_FALSE(engine->get(raw_key).has_value());
}

TEST_F(CacheAdminServiceTest, ClearByCriteria) {
    engine->set("user:1", CacheValue{"a", "text/plain"});
    engine->set("user:2", CacheValue{"b", "text/plain"});
    engine->set("order:1", CacheValue{"c", "text/plain"});

    auto res = bodyOf(send(http::verb::post, "/cache/clear?pattern=user:*&tier=memory"));
    EXPECT_EQ(res["data"]["cleared"], 2);
    EXPECT_EQ(res["data"]["tier"], "memory");

    auto rest = bodyOf(send(http::verb::post, "/cache/clear"));
    EXPECT_EQ(rest["data"]["cleared"], 1);
    EXPECT_EQ(rest["data"]["tier"], "all");

    EXPECT_EQ(send(http::verb::post, "/cache/clear?tier=tape").result(), http::status::bad_request);
}

TEST_F(CacheAdminServiceTest, ClearByResourceUsesResponseCache) {
    auto handler = [](const Request& req) {
        Response res{http::status::ok, req.version()};
        res.body() = "ok";
        return res;
    };
    middleware->handle(makeRequest(http::verb::get, "/api/users?page=1"), handler);
    middleware->handle(makeRequest(http::verb::get, "/api/orders"), handler);

    auto res = bodyOf(send(http::verb::post, "/cache/clear?resource=/api/users&method=get"));
    EXPECT_EQ(res["data"]["cleared"], 1);
    EXPECT_EQ(res["data"]["method"], "GET");
    EXPECT_EQ(engine->getMetrics().memory_entries, 1u);
}

TEST_F(CacheAdminServiceTest, ClearByResourceWithoutMiddlewareIsRejected) {
    CacheAdminService bare(engine, nullptr, statsd, config, logger);
    auto res = bare.handleRequest(makeRequest(http::verb::post, "/cache/clear?resource=/api"));
    EXPECT_EQ(res.result(), http::status::bad_request);
}

TEST_F(CacheAdminServiceTest, InvalidateFromQueryOrBody) {
    SetOptions users;
    users.dependencies = {"db:users"};
    SetOptions orders;
    orders.dependencies = {"db:orders"};
    engine->set("profile:1", CacheValue{"a", "text/plain"}, users);
    engine->set("order:1", CacheValue{"b", "text/plain"}, orders);

    auto by_query = bodyOf(send(http::verb::post, "/cache/invalidate?dependencies=db:users"));
    EXPECT_EQ(by_query["data"]["invalidated"], 1);

    auto by_body = bodyOf(send(http::verb::post, "/cache/invalidate", R"({"dependencies": ["db:orders"]})"));
    EXPECT_EQ(by_body["data"]["invalidated"], 1);
    EXPECT_EQ(engine->getMetrics().memory_entries, 0u);

    EXPECT_EQ(send(http::verb::post, "/cache/invalidate").result(), http::status::bad_request);
    EXPECT_EQ(send(http::verb::post, "/cache/invalidate", "[]").result(), http::status::bad_request);
    EXPECT_EQ(send(http::verb::post, "/cache/invalidate", "{oops").result(), http::status::bad_request);
    EXPECT_EQ(send(http::verb::post, "/cache/invalidate", "[1, 2]").result(), http::status::bad_request);
}

TEST_F(CacheAdminServiceTest, WarmUpLoadsItemsAndReportsFailures) {
    const std::string items = R"([
        {"key": "greeting", "value": "hello", "ttl": 60},
        {"key": "", "value": "empty key"},
        {"value": "no key at all"}
    ])";
    auto res = send(http::verb::post, "/cache/warmup", items);
    ASSERT_EQ(res.result(), http::status::ok);
    auto body = bodyOf(res);
    EXPECT_EQ(body["data"]["loaded"], 1);
    EXPECT_EQ(body["data"]["failed"], 2);
    EXPECT_EQ(body["data"]["errors"].size(), 1u);
    EXPECT_EQ(engine->get("greeting")->data, "hello");

    EXPECT_EQ(send(http::verb::post, "/cache/warmup", "{\"not\": \"an array\"}").result(), http::status::bad_request);
    EXPECT_EQ(send(http::verb::post, "/cache/warmup", "nope").result(), http::status::bad_request);
}

TEST_F(CacheAdminServiceTest, UnknownPathAndWrongMethod) {
    auto missing = send(http::verb::get, "/nowhere");
    EXPECT_EQ(missing.result(), http::status::not_found);
    auto body = bodyOf(missing);
    EXPECT_FALSE(body["success"].get<bool>());
    EXPECT_EQ(body["error"], "Not Found");

    EXPECT_EQ(send(http::verb::post, "/cache/status").result(), http::status::method_not_allowed);
    EXPECT_EQ(send(http::verb::get, "/cache/clear").result(), http::status::method_not_allowed);
    EXPECT_EQ(send(http::verb::get, "/cache/entries/k").result(), http::status::method_not_allowed);
}

TEST_F(CacheAdminServiceTest, ProcessRequestRespondsFromWorkerPool) {
    std::promise<std::optional<Response>> promise;
    auto future = promise.get_future();
    service->processRequest(makeRequest(http::verb::get, "/cache/health"),
                            [&promise](std::optional<Response> res) { promise.set_value(std::move(res)); });

    ASSERT_EQ(future.wait_for(std::chrono::seconds(2)), std::future_status::ready);
    auto res = future.get();
    ASSERT_TRUE(res.has_value());
    EXPECT_EQ(res->result(), http::status::ok);
}

TEST_F(CacheAdminServiceTest, ProcessRequestAfterShutdownReportsNothing) {
    service->shutdown();
    bool called = false;
    bool had_response = true;
    service->processRequest(makeRequest(http::verb::get, "/cache/status"),
                            [&](std::optional<Response> res) {
                                called = true;
                                had_response = res.has_value();
                            });
    EXPECT_TRUE(called);
    EXPECT_FALSE(had_response);
}

TEST_F(CacheAdminServiceTest, ConstructorRejectsNulls) {
    EXPECT_THROW(CacheAdminService(nullptr, middleware, statsd, config, logger), std::invalid_argument);
    EXPECT_THROW(CacheAdminService(engine, middleware, nullptr, config, logger), std::invalid_argument);
}

TEST(CacheAdminServiceRemoteTest, HealthIsUnavailableWhileRemoteIsDown) {
    auto logger = std::make_shared<NiceMock<MockLogger>>();
    auto statsd = std::make_shared<NiceMock<MockStatsDClient>>();
    auto factory = std::make_shared<FakeRedisFactory>();
    auto server = factory->addServer(RemoteNode{"127.0.0.1", 6379});
    server->down = true;

    AppConfig config;
    config.remote_nodes = {RemoteNode{"127.0.0.1", 6379}};
    config.health_check_interval_ms = 60000;
    config.reconnect_initial_delay_ms = 60000;
    config.reconnect_max_delay_ms = 60000;

    auto remote = std::make_shared<RemoteTierClient>(config, logger, factory);
    auto engine = std::make_shared<CacheEngine>(config, logger, remote);
    engine->init();
    CacheAdminService service(engine, nullptr, statsd, config, logger);

    auto res = service.handleRequest(Request{http::verb::get, "/cache/health", 11});
    EXPECT_EQ(res.result(), http::status::service_unavailable);
    auto body = json::parse(res.body());
    EXPECT_FALSE(body["success"].get<bool>());
    EXPECT_EQ(body["data"]["status"], "unreachable");

    auto status = json::parse(service.handleRequest(Request{http::verb::get, "/cache/status", 11}).body());
    EXPECT_EQ(status["data"]["status"], "unreachable");

    // The memory tier keeps working.
    EXPECT_TRUE(engine->set("k", CacheValue{"v", "text/plain"}).ok);
    engine->shutdown(false);
}
