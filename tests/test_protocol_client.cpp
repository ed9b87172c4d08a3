#include <doctest/doctest.h>

#include "protocol_client.hpp"
#include "test_support.hpp"

#include <atomic>
#include <future>
#include <string>
#include <vector>

namespace {

struct ClientFixture {
    std::shared_ptr<MockPeer> peer = std::make_shared<MockPeer>();
    std::shared_ptr<EventEngine> engine = std::make_shared<EventEngine>(test_logger(), 10ms);
    std::shared_ptr<RecordingListener> events = std::make_shared<RecordingListener>(
        "recorder", std::set<EventKind>(std::begin(ALL_EVENT_KINDS), std::end(ALL_EVENT_KINDS)));
    ClientConfig config;
    std::unique_ptr<ProtocolClient> client;

    ClientFixture() {
        config.host = "localhost";
        config.port = 15888;
        config.api_key = "test-key";
        config.request_timeout = 300ms;
        config.retry_attempts = 0;
        config.retry_delay = 10ms;

        engine->register_listener(events);
        engine->start();
    }

    ~ClientFixture() {
        client.reset();
        engine->stop();
    }

    ProtocolClient& make_client() {
        client = std::make_unique<ProtocolClient>(engine, config, test_logger(),
                                                  [peer = peer]() { return std::make_unique<MockTransport>(peer); });
        return *client;
    }

    ProtocolClient& connected_client() {
        auto& c = make_client();
        c.connect();
        return c;
    }

    // First System event carrying the given "event" field.
    std::optional<Event> wait_for_system(const std::string& name) {
        std::optional<Event> found;
        eventually([&] {
            for (const auto& e : events->events()) {
                if (e.kind() == EventKind::System && get_string(e.payload(), "event") == name) {
                    found = e;
                    return true;
                }
            }
            return false;
        });
        return found;
    }
};

json::object ticker_data() {
    return json::object{{"bid", "41999.5"}, {"ask", "42000.5"}, {"last", "42000"}};
}

} // namespace

//////////////////////////////////////////////////////////////////////////
// Construction and connection lifecycle
//////////////////////////////////////////////////////////////////////////

TEST_CASE_FIXTURE(ClientFixture, "ProtocolClient rejects invalid construction arguments") {
    CHECK_THROWS_AS(ProtocolClient(nullptr, config, test_logger()), ValidationError);
    CHECK_THROWS_AS(ProtocolClient(engine, config, nullptr), ValidationError);

    ClientConfig bad = config;
    bad.api_key.clear();
    CHECK_THROWS_AS(ProtocolClient(engine, bad, test_logger()), ValidationError);

    bad = config;
    bad.port = -1;
    CHECK_THROWS_AS(ProtocolClient(engine, bad, test_logger()), ValidationError);

    CHECK(peer->open_attempts() == 0);
}

TEST_CASE_FIXTURE(ClientFixture, "connect authenticates and reports Connected") {
    auto& c = make_client();
    CHECK(c.state() == ConnectionState::Disconnected);

    c.connect();
    CHECK(c.state() == ConnectionState::Connected);
    CHECK(c.pending_requests() == 0);

    auto auth = peer->sent_of_type("authenticate");
    REQUIRE(auth.size() == 1);
    CHECK(auth[0].at("api_key").as_string() == "test-key");
    CHECK(auth[0].contains("id"));

    auto connected = wait_for_system("connected");
    REQUIRE(connected.has_value());
    CHECK(connected->origin() == std::optional<std::string>("protocol_client"));

    // A second connect is a no-op
    c.connect();
    CHECK(peer->open_attempts() == 1);
}

TEST_CASE_FIXTURE(ClientFixture, "connect fails when authentication is rejected") {
    peer->responder = [](const json::object& request) -> std::optional<json::object> {
        if (request.at("type").as_string() == "authenticate") {
            return json::object{{"status", "error"}, {"message", "Invalid API key"}};
        }
        return MockPeer::default_reply(request);
    };
    auto& c = make_client();

    try {
        c.connect();
        FAIL("connect should have thrown");
    } catch (const ConnectionError& e) {
        CHECK(std::string(e.what()).find("Invalid API key") != std::string::npos);
    }
    CHECK(c.state() == ConnectionState::Disconnected);
    CHECK(peer->close_count() == 1);
    // Authentication is never retried.
    CHECK(peer->sent_of_type("authenticate").size() == 1);
    CHECK(events->wait_for_kind(EventKind::Error).has_value());
}

TEST_CASE_FIXTURE(ClientFixture, "connect fails when authentication is never answered") {
    peer->responder = [](const json::object&) -> std::optional<json::object> { return std::nullopt; };
    auto& c = make_client();

    CHECK_THROWS_AS(c.connect(), ConnectionError);
    CHECK(c.state() == ConnectionState::Disconnected);
    CHECK(c.pending_requests() == 0);
}

TEST_CASE_FIXTURE(ClientFixture, "transport lost right after the authentication ack never leaves the client Connected") {
    auto first_attempt = std::make_shared<std::atomic<bool>>(true);
    MockPeer* remote = peer.get();
    peer->responder = [remote, first_attempt](const json::object& request) -> std::optional<json::object> {
        if (request.at("type").as_string() == "authenticate" && first_attempt->exchange(false)) {
            remote->emit(json::object{{"status", "success"}});
            remote->drop_connection("reset during authentication");
            return std::nullopt;
        }
        return MockPeer::default_reply(request);
    };
    auto& c = make_client();

    bool threw = false;
    try {
        c.connect();
    } catch (const ConnectionError&) {
        threw = true;
    }

    if (threw) {
        CHECK(c.state() == ConnectionState::Disconnected);
        CHECK_FALSE(wait_for_system("connected").has_value());
    } else {
        // The ack won the race: the loss is then reported like any other.
        CHECK(wait_for_system("connection_lost").has_value());
    }
    REQUIRE(eventually([&] { return c.state() == ConnectionState::Disconnected; }));
    CHECK(c.pending_requests() == 0);

    // A dead transport is never mistaken for a live one.
    c.connect();
    CHECK(c.state() == ConnectionState::Connected);
    CHECK(peer->open_attempts() == 2);
    c.get_balances("binance");
}

TEST_CASE_FIXTURE(ClientFixture, "connect retries opening the transport") {
    config.retry_attempts = 2;
    peer->fail_opens = 2;
    auto& c = make_client();

    c.connect();
    CHECK(c.state() == ConnectionState::Connected);
    CHECK(peer->open_attempts() == 3);
}

TEST_CASE_FIXTURE(ClientFixture, "connect gives up after the configured retries") {
    config.retry_attempts = 2;
    peer->fail_opens = 10;
    auto& c = make_client();

    CHECK_THROWS_AS(c.connect(), ConnectionError);
    CHECK(peer->open_attempts() == 3);
    CHECK(c.state() == ConnectionState::Disconnected);
    CHECK(peer->sent().empty());

    auto error = events->wait_for_kind(EventKind::Error);
    REQUIRE(error.has_value());
    CHECK(get_string(error->payload(), "message").find("localhost:15888") != std::string::npos);
}

TEST_CASE_FIXTURE(ClientFixture, "disconnect closes the transport and publishes a System event") {
    auto& c = connected_client();
    c.disconnect();

    CHECK(c.state() == ConnectionState::Disconnected);
    CHECK(peer->close_count() == 1);
    CHECK(wait_for_system("disconnected").has_value());

    // Idempotent
    c.disconnect();
    CHECK(peer->close_count() == 1);

    CHECK_THROWS_AS(c.get_ticker("binance", "BTC-USDT"), ConnectionError);
}

TEST_CASE_FIXTURE(ClientFixture, "operations fail with ConnectionError before connect") {
    auto& c = make_client();
    CHECK_THROWS_AS(c.get_ticker("binance", "BTC-USDT"), ConnectionError);
    json::object request{{"type", "get_balances"}, {"exchange", "binance"}};
    CHECK_THROWS_AS(c.send_request(request), ConnectionError);
    CHECK(peer->sent().empty());
}

TEST_CASE_FIXTURE(ClientFixture, "request ids keep increasing across reconnects") {
    auto& c = connected_client();
    c.get_ticker("binance", "BTC-USDT");
    c.disconnect();
    c.connect();
    c.get_ticker("binance", "BTC-USDT");

    std::vector<long long> ids;
    for (const auto& frame : peer->sent()) {
        ids.push_back(std::stoll(std::string(frame.at("id").as_string())));
    }
    REQUIRE(ids.size() == 4);
    for (std::size_t i = 1; i < ids.size(); ++i) {
        CHECK(ids[i] > ids[i - 1]);
    }
}

//////////////////////////////////////////////////////////////////////////
// Orders
//////////////////////////////////////////////////////////////////////////

TEST_CASE_FIXTURE(ClientFixture, "limit order without a price is rejected before sending") {
    auto& c = connected_client();
    CHECK_THROWS_AS(c.create_order("binance", "BTC-USDT", OrderSide::Buy, OrderType::Limit, 0.5), ValidationError);
    CHECK(peer->sent_of_type("create_order").empty());
}

TEST_CASE_FIXTURE(ClientFixture, "create_order returns the order and publishes an OrderUpdate") {
    peer->responder = [](const json::object& request) -> std::optional<json::object> {
        if (request.at("type").as_string() == "create_order") {
            return MockPeer::reply(request, "success",
                                   json::object{{"order_id", "abc123"}, {"status", "open"},
                                                {"price", request.at("price")}});
        }
        return MockPeer::default_reply(request);
    };
    auto& c = connected_client();

    auto order = c.create_order("binance", "BTC-USDT", OrderSide::Buy, OrderType::Limit, 0.5, 42000.0);
    CHECK(order.at("order_id").as_string() == "abc123");
    CHECK(c.pending_requests() == 0);

    auto sent = peer->sent_of_type("create_order");
    REQUIRE(sent.size() == 1);
    CHECK(sent[0].at("side").as_string() == "buy");
    CHECK(sent[0].at("order_type").as_string() == "limit");
    CHECK(sent[0].at("amount").as_string() == "0.5");
    CHECK(sent[0].at("price").as_string() == "42000");

    auto update = events->wait_for_kind(EventKind::OrderUpdate);
    REQUIRE(update.has_value());
    CHECK(update->payload().at("order_id").as_string() == "abc123");
    CHECK(update->origin() == std::optional<std::string>("remote"));
}

TEST_CASE_FIXTURE(ClientFixture, "create_order surfaces a remote error and publishes an Error event") {
    peer->responder = [](const json::object& request) -> std::optional<json::object> {
        if (request.at("type").as_string() == "create_order") {
            return MockPeer::reply(request, "error", json::value(nullptr), "Insufficient funds");
        }
        return MockPeer::default_reply(request);
    };
    auto& c = connected_client();

    try {
        c.create_order("binance", "BTC-USDT", OrderSide::Sell, OrderType::Market, 2.0);
        FAIL("create_order should have thrown");
    } catch (const RemoteError& e) {
        CHECK(e.remote_message() == "Insufficient funds");
        CHECK(std::string(e.what()) == "Failed to create order: Insufficient funds");
    }

    auto error = events->wait_for_kind(EventKind::Error);
    REQUIRE(error.has_value());
    CHECK(get_string(error->payload(), "error").find("Insufficient funds") != std::string::npos);
    CHECK(error->origin() == std::optional<std::string>("protocol_client"));
    CHECK(events->count_of(EventKind::OrderUpdate) == 0);
}

TEST_CASE_FIXTURE(ClientFixture, "cancel_order publishes a cancelled OrderUpdate") {
    auto& c = connected_client();
    c.cancel_order("binance", "BTC-USDT", "abc123");

    auto sent = peer->sent_of_type("cancel_order");
    REQUIRE(sent.size() == 1);
    CHECK(sent[0].at("order_id").as_string() == "abc123");

    auto update = events->wait_for_kind(EventKind::OrderUpdate);
    REQUIRE(update.has_value());
    CHECK(update->payload().at("order_id").as_string() == "abc123");
    CHECK(update->payload().at("status").as_string() == "cancelled");
}

TEST_CASE_FIXTURE(ClientFixture, "cancel_order failure raises and publishes an Error event") {
    peer->responder = [](const json::object& request) -> std::optional<json::object> {
        if (request.at("type").as_string() == "cancel_order") {
            return MockPeer::reply(request, "error", json::value(nullptr), "Order not found");
        }
        return MockPeer::default_reply(request);
    };
    auto& c = connected_client();

    CHECK_THROWS_AS(c.cancel_order("binance", "BTC-USDT", "missing"), RemoteError);
    auto error = events->wait_for_kind(EventKind::Error);
    REQUIRE(error.has_value());
    CHECK(error->payload().at("order_id").as_string() == "missing");
    CHECK(events->count_of(EventKind::OrderUpdate) == 0);
}

//////////////////////////////////////////////////////////////////////////
// Queries and subscriptions
//////////////////////////////////////////////////////////////////////////

TEST_CASE_FIXTURE(ClientFixture, "get_ticker returns the fields echoed by the peer") {
    peer->responder = [](const json::object& request) -> std::optional<json::object> {
        if (request.at("type").as_string() == "get_ticker") {
            json::object data = ticker_data();
            data["exchange"] = request.at("exchange");
            data["market"] = request.at("market");
            return MockPeer::reply(request, "success", data);
        }
        return MockPeer::default_reply(request);
    };
    auto& c = connected_client();

    auto ticker = c.get_ticker("binance", "BTC-USDT");
    CHECK(ticker.at("exchange").as_string() == "binance");
    CHECK(ticker.at("market").as_string() == "BTC-USDT");
    CHECK(ticker.at("last").as_string() == "42000");
}

TEST_CASE_FIXTURE(ClientFixture, "query operations send their documented fields") {
    peer->responder = [](const json::object& request) -> std::optional<json::object> {
        const auto& type = request.at("type").as_string();
        if (type == "get_open_orders" || type == "get_order_history") {
            return MockPeer::reply(request, "success", json::array{json::object{{"order_id", "1"}}});
        }
        return MockPeer::default_reply(request);
    };
    auto& c = connected_client();

    c.get_order_book("binance", "BTC-USDT");
    auto book = peer->sent_of_type("get_order_book");
    REQUIRE(book.size() == 1);
    CHECK(book[0].at("depth").as_int64() == 10);

    c.get_order_status("binance", "BTC-USDT", "o-9");
    CHECK(peer->sent_of_type("get_order").at(0).at("order_id").as_string() == "o-9");

    c.get_balances("binance");
    CHECK(peer->sent_of_type("get_balances").size() == 1);

    auto open = c.get_open_orders("binance", "BTC-USDT");
    CHECK(open.size() == 1);

    auto history = c.get_order_history("binance", "BTC-USDT");
    CHECK(history.size() == 1);
    CHECK(peer->sent_of_type("get_order_history").at(0).at("limit").as_int64() == 50);

    auto ack = c.subscribe_to_trades("binance", "BTC-USDT");
    CHECK(ack.at("status").as_string() == "success");
    c.subscribe_to_order_book("binance", "ETH-USDT");
    auto subs = peer->sent_of_type("subscribe");
    REQUIRE(subs.size() == 2);
    CHECK(subs[0].at("channel").as_string() == "trades");
    CHECK(subs[1].at("channel").as_string() == "order_book");
    CHECK(subs[1].at("market").as_string() == "ETH-USDT");
}

TEST_CASE_FIXTURE(ClientFixture, "send_request keeps a caller-supplied id and returns error statuses") {
    peer->responder = [](const json::object& request) -> std::optional<json::object> {
        if (request.at("type").as_string() == "get_balances") {
            return MockPeer::reply(request, "error", json::value(nullptr), "Unknown exchange");
        }
        return MockPeer::default_reply(request);
    };
    auto& c = connected_client();

    Response response = c.send_request(json::object{{"type", "get_balances"}, {"exchange", "nowhere"}, {"id", "custom-7"}});
    CHECK(response.id == "custom-7");
    CHECK_FALSE(response.ok());
    CHECK(response.message == "Unknown exchange");
    CHECK(peer->sent_of_type("get_balances").at(0).at("id").as_string() == "custom-7");
}

//////////////////////////////////////////////////////////////////////////
// Correlation, timeouts and push traffic
//////////////////////////////////////////////////////////////////////////

TEST_CASE_FIXTURE(ClientFixture, "responses arriving out of order reach the right caller") {
    peer->responder = [](const json::object& request) -> std::optional<json::object> {
        if (request.at("type").as_string() == "get_ticker") {
            return std::nullopt;
        }
        return MockPeer::default_reply(request);
    };
    config.request_timeout = 2000ms;
    auto& c = connected_client();

    auto first = std::async(std::launch::async, [&c] { return c.get_ticker("binance", "BTC-USDT"); });
    REQUIRE(eventually([&] { return peer->sent_of_type("get_ticker").size() == 1; }));
    auto second = std::async(std::launch::async, [&c] { return c.get_ticker("kraken", "ETH-USDT"); });
    REQUIRE(eventually([&] { return peer->sent_of_type("get_ticker").size() == 2; }));
    CHECK(c.pending_requests() == 2);

    auto sent = peer->sent_of_type("get_ticker");
    peer->emit(MockPeer::reply(sent[1], "success", json::object{{"market", "ETH-USDT"}}));
    peer->emit(MockPeer::reply(sent[0], "success", json::object{{"market", "BTC-USDT"}}));

    CHECK(first.get().at("market").as_string() == "BTC-USDT");
    CHECK(second.get().at("market").as_string() == "ETH-USDT");
    CHECK(c.pending_requests() == 0);
}

TEST_CASE_FIXTURE(ClientFixture, "a timed out request is removed and its late response dropped") {
    peer->responder = [](const json::object& request) -> std::optional<json::object> {
        if (request.at("type").as_string() == "get_ticker") {
            return std::nullopt;
        }
        return MockPeer::default_reply(request);
    };
    auto& c = connected_client();

    CHECK_THROWS_AS(c.get_ticker("binance", "BTC-USDT"), RequestTimeout);
    CHECK(c.pending_requests() == 0);

    auto sent = peer->sent_of_type("get_ticker");
    REQUIRE(sent.size() == 1);
    peer->emit(MockPeer::reply(sent[0], "success", ticker_data()));

    // The client keeps working and nothing was published for the late frame.
    peer->responder = MockPeer::Responder([](const json::object& request) { return MockPeer::default_reply(request); });
    c.get_balances("binance");
    CHECK(c.state() == ConnectionState::Connected);
    CHECK(c.pending_requests() == 0);
    CHECK(events->count_of(EventKind::MarketData) == 0);
}

TEST_CASE_FIXTURE(ClientFixture, "push messages are published by type") {
    auto& c = connected_client();

    peer->emit(json::object{{"type", "order_update"}, {"data", json::object{{"order_id", "1"}, {"status", "filled"}}}});
    peer->emit(json::object{{"type", "trade"}, {"data", json::object{{"price", "42000"}, {"amount", "0.1"}}}});
    peer->emit(json::object{{"type", "order_book_update"}, {"data", json::object{{"bids", json::array{}}}}});
    peer->emit(json::object{{"type", "ticker_update"}, {"data", json::object{{"last", "42001"}}}});
    peer->emit(json::object{{"type", "heartbeat"}});
    peer->emit_raw("{not json");
    peer->emit_raw("[1,2]");
    peer->emit(json::object{{"type", "info"}, {"data", "maintenance at 02:00"}});

    auto info = events->wait_for_kind(EventKind::Info);
    REQUIRE(info.has_value());
    CHECK(info->payload().at("data").as_string() == "maintenance at 02:00");
    // Dispatch is FIFO, so every earlier push is recorded once the info event is.
    REQUIRE(events->wait_for(6));

    CHECK(events->count_of(EventKind::OrderUpdate) == 1);
    CHECK(events->count_of(EventKind::TradeUpdate) == 1);
    CHECK(events->count_of(EventKind::MarketData) == 2);
    CHECK(events->count_of(EventKind::Error) == 0);

    auto order = events->wait_for_kind(EventKind::OrderUpdate);
    REQUIRE(order.has_value());
    CHECK(order->payload().at("status").as_string() == "filled");
    CHECK(order->origin() == std::optional<std::string>("remote"));
    CHECK(c.state() == ConnectionState::Connected);
}

TEST_CASE_FIXTURE(ClientFixture, "push error messages become Error events") {
    connected_client();
    peer->emit(json::object{{"type", "error"}, {"data", json::object{{"message", "rate limited"}}}});

    auto error = events->wait_for_kind(EventKind::Error);
    REQUIRE(error.has_value());
    CHECK(error->payload().at("message").as_string() == "rate limited");
}

TEST_CASE_FIXTURE(ClientFixture, "transport loss fails every pending request") {
    peer->responder = [](const json::object& request) -> std::optional<json::object> {
        if (request.at("type").as_string() == "get_ticker") {
            return std::nullopt;
        }
        return MockPeer::default_reply(request);
    };
    config.request_timeout = 5000ms;
    auto& c = connected_client();

    auto first = std::async(std::launch::async, [&c] { return c.get_ticker("binance", "BTC-USDT"); });
    auto second = std::async(std::launch::async, [&c] { return c.get_ticker("binance", "ETH-USDT"); });
    REQUIRE(eventually([&] { return c.pending_requests() == 2; }));

    peer->drop_connection("connection reset by peer");

    CHECK_THROWS_AS(first.get(), ConnectionError);
    CHECK_THROWS_AS(second.get(), ConnectionError);
    CHECK(c.pending_requests() == 0);
    CHECK(c.state() == ConnectionState::Disconnected);

    auto lost = wait_for_system("connection_lost");
    REQUIRE(lost.has_value());
    CHECK(lost->payload().at("reason").as_string() == "connection reset by peer");

    CHECK_THROWS_AS(c.get_balances("binance"), ConnectionError);

    // A later connect opens a fresh transport.
    peer->responder = MockPeer::Responder([](const json::object& request) { return MockPeer::default_reply(request); });
    c.connect();
    CHECK(c.state() == ConnectionState::Connected);
    CHECK(peer->open_attempts() == 2);
}
