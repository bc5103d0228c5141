#include <gtest/gtest.h>

#include "fake_transport.H"

#include "gateway/backoff.H"
#include "gateway/clob_api.H"
#include "gateway/clob_auth.H"
#include "gateway/market_ref.H"
#include "gateway/rate_limiter.H"
#include "gateway/response_schema.H"
#include "gateway/retrying_gateway.H"

#include <thread>

using namespace predex;
using namespace predex::gateway;
using namespace std::chrono_literals;

static double elapsed_ms(std::chrono::steady_clock::time_point start) {
    return std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - start).count();
}

TEST(RateLimiterTest, BurstWithinCapacityDoesNotBlock) {
    RateLimiter limiter(5, 1);

    auto start = std::chrono::steady_clock::now();
    limiter.acquire(2);
    limiter.acquire(2);
    limiter.acquire(1);
    EXPECT_LT(elapsed_ms(start), 50);
    EXPECT_LT(limiter.available(), 1.0);
}

TEST(RateLimiterTest, BlocksUntilRefill) {
    RateLimiter limiter(5, 10);
    for (int i = 0; i < 5; ++i) {
        limiter.acquire();
    }

    auto start = std::chrono::steady_clock::now();
    limiter.acquire();
    // one token at 10 per second
    EXPECT_GE(elapsed_ms(start), 80);
}

TEST(RateLimiterTest, TryAcquire) {
    RateLimiter limiter(2, 0.5);
    EXPECT_TRUE(limiter.try_acquire());
    EXPECT_TRUE(limiter.try_acquire());
    EXPECT_FALSE(limiter.try_acquire());
}

TEST(RateLimiterTest, RejectsWeightAboveCapacity) {
    RateLimiter limiter(3, 1);
    EXPECT_THROW(limiter.acquire(4), std::invalid_argument);
    EXPECT_THROW(limiter.try_acquire(0), std::invalid_argument);
    EXPECT_THROW(RateLimiter(0, 1), std::invalid_argument);
}

TEST(RateLimiterTest, StopCancelsWaiter) {
    RateLimiter limiter(1, 0.01);
    limiter.acquire();

    StopToken stop;
    std::thread stopper([stop]() mutable {
        std::this_thread::sleep_for(30ms);
        stop.request_stop();
    });

    auto start = std::chrono::steady_clock::now();
    try {
        limiter.acquire(1, stop);
        FAIL() << "acquire should have been cancelled";
    } catch (const GatewayError& e) {
        EXPECT_EQ(e.get_kind(), GATEWAY_ERROR::CANCELLED);
    }
    EXPECT_LT(elapsed_ms(start), 1000);
    stopper.join();
}

TEST(RateLimiterTest, ConcurrentCallersShareBudget) {
    RateLimiter limiter(4, 20);
    std::atomic<int> done{0};

    auto start = std::chrono::steady_clock::now();
    std::vector<std::thread> threads;
    for (int i = 0; i < 8; ++i) {
        threads.emplace_back([&] {
            limiter.acquire();
            done++;
        });
    }
    for (auto& t : threads) {
        t.join();
    }

    EXPECT_EQ(done.load(), 8);
    // four beyond the burst at 20 per second
    EXPECT_GE(elapsed_ms(start), 150);
}

TEST(BackoffTest, DoublesUpToMax) {
    Backoff backoff(100ms, 1000ms, 0ms);
    EXPECT_EQ(backoff.delay(0), 100ms);
    EXPECT_EQ(backoff.delay(1), 200ms);
    EXPECT_EQ(backoff.delay(3), 800ms);
    EXPECT_EQ(backoff.delay(4), 1000ms);
    EXPECT_EQ(backoff.delay(200), 1000ms);
}

TEST(BackoffTest, JitterStaysInRange) {
    Backoff backoff(100ms, 1000ms, 50ms);
    for (int i = 0; i < 100; ++i) {
        auto delay = backoff.delay(1);
        EXPECT_GE(delay, 200ms);
        EXPECT_LE(delay, 250ms);
    }
}

TEST(SchemaTest, AcceptsMatchingShape) {
    auto schema = ResponseSchema::object()
        .require("mid", JSON_TYPE::NUMERIC)
        .optional("note", JSON_TYPE::STRING);

    EXPECT_NO_THROW(schema.validate(nlohmann::json::parse(R"({"mid": "0.52"})")));
    EXPECT_NO_THROW(schema.validate(nlohmann::json::parse(R"({"mid": 0.52, "note": "x"})")));
}

TEST(SchemaTest, RejectsMismatches) {
    auto schema = ResponseSchema::object().require("mid", JSON_TYPE::NUMERIC);

    EXPECT_THROW(schema.validate(nlohmann::json::parse(R"({})")), SchemaViolation);
    EXPECT_THROW(schema.validate(nlohmann::json::parse(R"({"mid": "abc"})")), SchemaViolation);
    EXPECT_THROW(schema.validate(nlohmann::json::parse(R"([1, 2])")), SchemaViolation);

    auto list = ResponseSchema::array_of(ResponseSchema::object().require("id", JSON_TYPE::ANY));
    EXPECT_NO_THROW(list.validate(nlohmann::json::parse(R"([{"id": 1}, {"id": "2"}])")));
    try {
        list.validate(nlohmann::json::parse(R"([{"id": 1}, {"name": "x"}])"));
        FAIL() << "expected a schema violation";
    } catch (const SchemaViolation& e) {
        EXPECT_EQ(e.get_kind(), GATEWAY_ERROR::CLIENT_ERROR);
        EXPECT_TRUE(e.is_schema_violation());
        EXPECT_NE(std::string(e.what()).find("$[1].id"), std::string::npos);
    }
}

TEST(GatewayErrorTest, ClassifiesStatus) {
    EXPECT_EQ(classify_status(429), GATEWAY_ERROR::RATE_LIMITED);
    EXPECT_EQ(classify_status(408), GATEWAY_ERROR::TIMEOUT);
    EXPECT_EQ(classify_status(404), GATEWAY_ERROR::CLIENT_ERROR);
    EXPECT_EQ(classify_status(503), GATEWAY_ERROR::SERVER_ERROR);
    EXPECT_FALSE(GatewayError(GATEWAY_ERROR::CLIENT_ERROR, "x").is_retryable());
    EXPECT_TRUE(GatewayError(GATEWAY_ERROR::NETWORK_ERROR, "x").is_retryable());
}

class RetryingGatewayTest : public ::testing::Test {
protected:
    void SetUp() override {
        config.max_attempts = 3;
        config.base_delay = 1ms;
        config.max_delay = 5ms;
        config.jitter = 0ms;
        config.timeout = 250ms;
    }

    HttpRequest request() {
        HttpRequest req;
        req.url = "https://venue.test/thing";
        return req;
    }

    FakeTransport transport;
    RateLimiter limiter{100, 100};
    RetryConfig config;
};

TEST_F(RetryingGatewayTest, ReturnsParsedBody) {
    RetryingGateway gateway(transport, limiter, config, spdlog::default_logger());
    transport.push(FakeTransport::respond(200, R"({"mid": "0.5"})"));

    auto body = gateway.call(request(), ResponseSchema::object().require("mid", JSON_TYPE::NUMERIC));
    EXPECT_EQ(body["mid"], "0.5");
    EXPECT_EQ(transport.call_count(), 1u);
    EXPECT_EQ(transport.timeouts[0], 250ms);
}

TEST_F(RetryingGatewayTest, ClientErrorIsNotRetried) {
    RetryingGateway gateway(transport, limiter, config, spdlog::default_logger());
    transport.set_fallback(FakeTransport::respond(400, R"({"error": "bad order"})"));

    try {
        gateway.call(request(), ResponseSchema::any());
        FAIL() << "expected a client error";
    } catch (const GatewayError& e) {
        EXPECT_EQ(e.get_kind(), GATEWAY_ERROR::CLIENT_ERROR);
        EXPECT_EQ(e.get_status_code(), 400);
    }
    EXPECT_EQ(transport.call_count(), 1u);
}

TEST_F(RetryingGatewayTest, ServerErrorExhaustsAttempts) {
    RetryingGateway gateway(transport, limiter, config, spdlog::default_logger());
    transport.set_fallback(FakeTransport::respond(503, "unavailable"));

    try {
        gateway.call(request(), ResponseSchema::any());
        FAIL() << "expected a server error";
    } catch (const GatewayError& e) {
        EXPECT_EQ(e.get_kind(), GATEWAY_ERROR::SERVER_ERROR);
    }
    EXPECT_EQ(transport.call_count(), 3u);
    EXPECT_EQ(gateway.get_attempt_count(), 3u);
}

TEST_F(RetryingGatewayTest, RecoversAfterTransientFailures) {
    RetryingGateway gateway(transport, limiter, config, spdlog::default_logger());
    transport.push(FakeTransport::fail(GATEWAY_ERROR::NETWORK_ERROR));
    transport.push(FakeTransport::fail(GATEWAY_ERROR::TIMEOUT));
    transport.push(FakeTransport::respond(200, "[]"));

    auto body = gateway.call(request(), ResponseSchema::array());
    EXPECT_TRUE(body.is_array());
    EXPECT_EQ(transport.call_count(), 3u);
}

TEST_F(RetryingGatewayTest, LastErrorKindSurfaces) {
    RetryingGateway gateway(transport, limiter, config, spdlog::default_logger());
    transport.push(FakeTransport::respond(500, ""));
    transport.push(FakeTransport::respond(500, ""));
    transport.push(FakeTransport::fail(GATEWAY_ERROR::TIMEOUT));

    try {
        gateway.call(request(), ResponseSchema::any());
        FAIL() << "expected a timeout";
    } catch (const GatewayError& e) {
        EXPECT_EQ(e.get_kind(), GATEWAY_ERROR::TIMEOUT);
    }
}

TEST_F(RetryingGatewayTest, HonorsRetryAfter) {
    RetryingGateway gateway(transport, limiter, config, spdlog::default_logger());
    transport.push(FakeTransport::respond(429, "slow down", {{"retry-after", "0.2"}}));
    transport.push(FakeTransport::respond(200, "{}"));

    auto start = std::chrono::steady_clock::now();
    gateway.call(request(), ResponseSchema::object());
    EXPECT_GE(elapsed_ms(start), 190);
    EXPECT_EQ(transport.call_count(), 2u);
}

TEST_F(RetryingGatewayTest, MalformedBodyIsSchemaViolation) {
    RetryingGateway gateway(transport, limiter, config, spdlog::default_logger());
    transport.set_fallback(FakeTransport::respond(200, "<html>"));

    try {
        gateway.call(request(), ResponseSchema::object());
        FAIL() << "expected a schema violation";
    } catch (const GatewayError& e) {
        EXPECT_EQ(e.get_kind(), GATEWAY_ERROR::CLIENT_ERROR);
        EXPECT_TRUE(e.is_schema_violation());
    }
    EXPECT_EQ(transport.call_count(), 1u);
}

TEST_F(RetryingGatewayTest, TakesRateLimiterCapacityPerAttempt) {
    RateLimiter tight(3, 0.01);
    RetryingGateway gateway(transport, tight, config, spdlog::default_logger());
    transport.set_fallback(FakeTransport::respond(502, ""));

    EXPECT_THROW(gateway.call(request(), ResponseSchema::any()), GatewayError);
    EXPECT_LT(tight.available(), 1.0);
}

TEST_F(RetryingGatewayTest, StopAbortsBackoff) {
    config.base_delay = 10000ms;
    config.max_delay = 10000ms;
    RetryingGateway gateway(transport, limiter, config, spdlog::default_logger());
    transport.set_fallback(FakeTransport::respond(500, ""));

    StopToken stop;
    std::thread stopper([stop]() mutable {
        std::this_thread::sleep_for(50ms);
        stop.request_stop();
    });

    auto start = std::chrono::steady_clock::now();
    try {
        gateway.call(request(), ResponseSchema::any(), stop);
        FAIL() << "expected cancellation";
    } catch (const GatewayError& e) {
        EXPECT_EQ(e.get_kind(), GATEWAY_ERROR::CANCELLED);
    }
    EXPECT_LT(elapsed_ms(start), 5000);
    EXPECT_EQ(transport.call_count(), 1u);
    stopper.join();
}

TEST_F(RetryingGatewayTest, StoppedBeforeCallMakesNoAttempt) {
    RetryingGateway gateway(transport, limiter, config, spdlog::default_logger());
    StopToken stop;
    stop.request_stop();

    EXPECT_THROW(gateway.call(request(), ResponseSchema::any(), stop), GatewayError);
    EXPECT_EQ(transport.call_count(), 0u);
}

TEST(ClobAuthTest, SignsLikeTheVenue) {
    ApiConfig config;
    config.address = "0xabc";
    config.api_key = "key-1";
    config.api_secret = "cHJlZGV4LXRlc3Qtc2VjcmV0LTAxMjM0NTY3ODk=";
    config.api_passphrase = "phrase";
    ClobAuth auth(config);

    EXPECT_EQ(auth.sign(1700000000, "GET", "/balance-allowance", ""),
              "EwRaP1hlnvj-FJUTG___quDKAOgixQdtlBAw7sLwfSQ=");
    EXPECT_EQ(auth.sign(1700000000, "POST", "/order", R"({"orderID":"abc"})"),
              "Gebl3HmYicZJK_XRjEy7-v63zm9CZF9tt81ZohG7kvM=");

    auto headers = auth.headers("GET", "/balance-allowance", "", 1700000000);
    ASSERT_EQ(headers.size(), 5u);
    EXPECT_EQ(headers[0].first, "POLY_ADDRESS");
    EXPECT_EQ(headers[3].second, "1700000000");
    EXPECT_EQ(headers[4].second, "EwRaP1hlnvj-FJUTG___quDKAOgixQdtlBAw7sLwfSQ=");
}

TEST(ClobAuthTest, RequiresCredentials) {
    ClobAuth auth(ApiConfig{});
    EXPECT_FALSE(auth.has_credentials());
    EXPECT_THROW(auth.headers("GET", "/order", ""), std::runtime_error);
}

TEST(ClobAuthTest, Base64Alphabets) {
    std::string raw("\xfb\xff\xfe", 3);
    EXPECT_EQ(base64_encode(raw, false), "+//+");
    EXPECT_EQ(base64_encode(raw, true), "-__-");
    EXPECT_EQ(base64_decode("-__-"), raw);
    EXPECT_EQ(base64_decode("cHJlZGV4"), "predex");
    EXPECT_EQ(base64_decode("cHJlZA"), "pred");
}

TEST(MarketRefTest, ParsesReferences) {
    auto id = parse_market_ref("512345");
    EXPECT_EQ(id.type, REF_TYPE::ID);
    EXPECT_EQ(id.value, "512345");

    auto event = parse_market_ref("https://polymarket.com/event/fed-decision-in-october?tid=1758818660485");
    EXPECT_EQ(event.type, REF_TYPE::EVENT);
    EXPECT_EQ(event.value, "fed-decision-in-october");
    EXPECT_EQ(event.tid, "1758818660485");

    auto market = parse_market_ref("https://polymarket.com/market/will-bitcoin-reach-100k");
    EXPECT_EQ(market.type, REF_TYPE::MARKET);
    EXPECT_EQ(market.value, "will-bitcoin-reach-100k");

    EXPECT_EQ(parse_market_ref("https://example.com/event/x").type, REF_TYPE::INVALID);
    EXPECT_EQ(parse_market_ref("https://polymarket.com/profile/x").type, REF_TYPE::INVALID);
    EXPECT_EQ(parse_market_ref("https://polymarket.com/event").type, REF_TYPE::INVALID);
    EXPECT_EQ(parse_market_ref("").type, REF_TYPE::INVALID);
    EXPECT_TRUE(is_market_url("polymarket.com/event/some-slug"));
}

static const char* GAMMA_MARKET = R"({
    "id": "512345",
    "question": "Will it rain?",
    "conditionId": "0xcond",
    "slug": "will-it-rain",
    "clobTokenIds": "[\"111\", \"222\"]",
    "outcomePrices": "[\"0.25\", \"0.75\"]",
    "volume": "1500.5",
    "liquidity": 200,
    "closed": false
})";

class ClobApiTest : public ::testing::Test {
protected:
    void SetUp() override {
        retry.max_attempts = 2;
        retry.base_delay = 1ms;
        retry.jitter = 0ms;
        api.gamma_host = "https://gamma.test";
        api.clob_host = "https://clob.test";
        api.address = "0xabc";
        api.api_key = "key-1";
        api.api_secret = "cHJlZGV4LXRlc3Qtc2VjcmV0LTAxMjM0NTY3ODk=";
        api.api_passphrase = "phrase";
        gateway = std::make_unique<RetryingGateway>(transport, limiter, retry, spdlog::default_logger());
        client = std::make_unique<ClobApi>(*gateway, api, StopToken(), spdlog::default_logger());
    }

    FakeTransport transport;
    RateLimiter limiter{100, 100};
    RetryConfig retry;
    ApiConfig api;
    std::unique_ptr<RetryingGateway> gateway;
    std::unique_ptr<ClobApi> client;
};

TEST_F(ClobApiTest, ParsesEncodedMarketFields) {
    Market market = ClobApi::parse_market(nlohmann::json::parse(GAMMA_MARKET));
    EXPECT_EQ(market.id, "512345");
    EXPECT_EQ(market.token_id_yes, "111");
    EXPECT_EQ(market.token_id_no, "222");
    EXPECT_DOUBLE_EQ(market.price_yes, 0.25);
    EXPECT_DOUBLE_EQ(market.price_no, 0.75);
    EXPECT_DOUBLE_EQ(market.volume, 1500.5);
    EXPECT_DOUBLE_EQ(market.liquidity, 200);
    EXPECT_EQ(market.status, MARKET_STATUS::OPEN);
}

TEST_F(ClobApiTest, ListMarkets) {
    transport.push(FakeTransport::respond(200, std::string("[") + GAMMA_MARKET + "]"));

    auto markets = client->list_markets(5, 10, false);
    ASSERT_EQ(markets.size(), 1u);
    EXPECT_EQ(markets[0].question, "Will it rain?");
    EXPECT_EQ(transport.last_request().url,
              "https://gamma.test/markets?closed=false&limit=5&offset=10&order=volume24hr&ascending=false");
}

TEST_F(ClobApiTest, ResolvesEventUrlToFirstMarket) {
    transport.push(FakeTransport::respond(200, std::string(R"({"markets": [)") + GAMMA_MARKET + "]}"));

    Market market = client->resolve_market_ref("https://polymarket.com/event/rain-event");
    EXPECT_EQ(market.slug, "will-it-rain");
    EXPECT_EQ(transport.last_request().url, "https://gamma.test/events/slug/rain-event");

    EXPECT_THROW(client->resolve_market_ref("not a market"), std::invalid_argument);
}

TEST_F(ClobApiTest, MidpointAndBook) {
    transport.push(FakeTransport::respond(200, R"({"mid": "0.455"})"));
    EXPECT_DOUBLE_EQ(client->get_midpoint("111"), 0.455);
    EXPECT_EQ(transport.last_request().url, "https://clob.test/midpoint?token_id=111");

    transport.push(FakeTransport::respond(200, R"({
        "market": "0xcond", "asset_id": "111", "hash": "h1", "timestamp": "1700000000000",
        "bids": [{"price": "0.44", "size": "10"}, {"price": "0.45", "size": "3"}],
        "asks": [{"price": "0.47", "size": "8"}]
    })"));
    OrderBookUpdate book = client->get_order_book("111");
    EXPECT_EQ(book.bids.size(), 2u);
    EXPECT_DOUBLE_EQ(book.best_bid()->price, 0.45);
    EXPECT_DOUBLE_EQ(book.best_ask()->size, 8);
    EXPECT_EQ(book.timestamp, 1700000000000ULL * 1000000ULL);
}

TEST_F(ClobApiTest, SubmitOrderAcceptedAndRejected) {
    Order order;
    order.token_id = "111";
    order.side = SIDE::BUY;
    order.size = 10;
    order.price = 0.25;

    transport.push(FakeTransport::respond(200, R"({"success": true, "orderID": "0xorder", "status": "live"})"));
    SubmitResult ok = client->submit_order(order);
    EXPECT_TRUE(ok.accepted);
    EXPECT_EQ(ok.order_id, "0xorder");

    HttpRequest sent = transport.last_request();
    EXPECT_EQ(sent.method, "POST");
    EXPECT_EQ(sent.url, "https://clob.test/order");
    auto body = nlohmann::json::parse(sent.body);
    EXPECT_EQ(body["order"]["tokenID"], "111");
    EXPECT_EQ(body["orderType"], "GTC");
    bool signed_request = false;
    for (const auto& header : sent.headers) {
        if (header.first == "POLY_SIGNATURE") signed_request = true;
    }
    EXPECT_TRUE(signed_request);

    transport.push(FakeTransport::respond(200, R"({"success": false, "errorMsg": "not enough balance"})"));
    SubmitResult rejected = client->submit_order(order);
    EXPECT_FALSE(rejected.accepted);
    EXPECT_EQ(rejected.error, "not enough balance");
}

TEST_F(ClobApiTest, SubmitRejectWithNullFields) {
    Order order;
    order.token_id = "111";
    order.side = SIDE::BUY;
    order.size = 10;
    order.price = 0.25;

    transport.push(FakeTransport::respond(200,
        R"({"success": false, "orderID": null, "errorMsg": "not enough balance", "status": null})"));
    SubmitResult rejected = client->submit_order(order);
    EXPECT_FALSE(rejected.accepted);
    EXPECT_EQ(rejected.order_id, "");
    EXPECT_EQ(rejected.error, "not enough balance");

    transport.push(FakeTransport::respond(200, R"({"success": null, "orderID": null, "errorMsg": null})"));
    SubmitResult bare = client->submit_order(order);
    EXPECT_FALSE(bare.accepted);
    EXPECT_EQ(bare.error, "order not accepted by venue");
}

TEST_F(ClobApiTest, NullClosedFlagMeansOpen) {
    auto data = nlohmann::json::parse(GAMMA_MARKET);
    data["closed"] = nullptr;
    EXPECT_EQ(ClobApi::parse_market(data).status, MARKET_STATUS::OPEN);

    data["closed"] = true;
    EXPECT_EQ(ClobApi::parse_market(data).status, MARKET_STATUS::CLOSED);
}

TEST_F(ClobApiTest, CancelAndBalance) {
    transport.push(FakeTransport::respond(200, R"({"canceled": ["0xorder"], "not_canceled": {}})"));
    EXPECT_TRUE(client->cancel_order("0xorder"));
    EXPECT_EQ(transport.last_request().method, "DELETE");

    transport.push(FakeTransport::respond(200, R"({"canceled": [], "not_canceled": {"0xother": "matched"}})"));
    EXPECT_FALSE(client->cancel_order("0xother"));

    transport.push(FakeTransport::respond(200, R"({"balance": "1234560000", "allowance": "0"})"));
    EXPECT_DOUBLE_EQ(client->get_balance(), 1234.56);
    EXPECT_EQ(transport.last_request().url, "https://clob.test/balance-allowance?asset_type=COLLATERAL");
}
