#include <gtest/gtest.h>

#include "engine/book_service.hpp"
#include "orderbook/book_metrics.hpp"
#include "support/fakes.hpp"

#include <boost/asio/io_context.hpp>
#include <nlohmann/json.hpp>

using namespace booksync;
using namespace std::chrono_literals;
using booksync::feed::BootstrapCoordinator;
using booksync::network::ConnectionState;
using booksync::testing::FakeSnapshotFetcher;
using booksync::testing::FakeTransportFactory;
using booksync::testing::make_snapshot;

// ============================================================================
// Pipeline Integration Tests
// ============================================================================

class PipelineIntegrationTest : public ::testing::Test {
protected:
    static constexpr const char* kToken = "111";

    PipelineIntegrationTest() {
        config.network.linger = 20ms;
        config.network.reconnect_delay_initial = 5ms;
        config.network.reconnect_jitter_factor = 0.0;
        config.network.heartbeat_interval = 60s;
        config.book.eviction_grace = 20ms;
        config.book.snapshot_timeout = 5s;
        config.book.snapshot_retry_delay = 5ms;
        config.book.snapshot_max_retries = 1;

        service = std::make_unique<BookService>(
            ioc, config, BookService::Collaborators{factory.factory(), fetcher});
        service->init();
    }

    void TearDown() override {
        service->teardown();
    }

    void run(std::chrono::milliseconds duration) {
        ioc.restart();
        ioc.run_for(duration);
    }

    static std::string bid_delta(const char* price, const char* size) {
        return std::string(R"({"event_type":"price_change","market":"0xm","price_changes":[{"asset_id":"111","side":"BUY","price":")")
            + price + R"(","size":")" + size + R"("}]})";
    }

    boost::asio::io_context ioc;
    Config config;
    FakeTransportFactory factory;
    std::shared_ptr<FakeSnapshotFetcher> fetcher = std::make_shared<FakeSnapshotFetcher>();
    std::unique_ptr<BookService> service;
};

TEST_F(PipelineIntegrationTest, SnapshotThenDelta) {
    auto handle = service->subscribe({kToken});
    ASSERT_EQ(factory.count(), 1u);
    auto& transport = factory.latest();
    transport.fire_open();
    ASSERT_EQ(service->connection_state(), ConnectionState::Connected);

    auto subscribe = nlohmann::json::parse(transport.sent.at(0));
    EXPECT_EQ(subscribe["assets_ids"], nlohmann::json::array({kToken}));

    fetcher->succeed(kToken, make_snapshot(kToken, {{"0.52", "120"}}, {{"0.54", "90"}}));
    transport.fire_message(bid_delta("0.53", "40"));

    auto best = service->best_prices(kToken);
    EXPECT_EQ(best.best_bid, Price(0.53));
    EXPECT_EQ(best.best_ask, Price(0.54));
    EXPECT_EQ(best.best_bid_size, Size(40.0));

    auto depth = service->depth(kToken);
    ASSERT_EQ(depth.bids.size(), 2u);
    EXPECT_EQ(depth.bids[1].price, Price(0.52));
    EXPECT_FALSE(service->is_stale(kToken));
    EXPECT_EQ(service->bootstrap_state(kToken), BootstrapCoordinator::State::Seeded);
}

TEST_F(PipelineIntegrationTest, DeltaBeforeSnapshotIsReplayed) {
    auto handle = service->subscribe({kToken});
    auto& transport = factory.latest();
    transport.fire_open();

    transport.fire_message(bid_delta("0.53", "40"));
    EXPECT_FALSE(service->best_prices(kToken).best_bid.has_value());
    EXPECT_TRUE(service->is_stale(kToken));

    fetcher->succeed(kToken, make_snapshot(kToken, {{"0.52", "120"}}, {{"0.54", "90"}}));

    auto best = service->best_prices(kToken);
    EXPECT_EQ(best.best_bid, Price(0.53));
    EXPECT_EQ(best.best_ask, Price(0.54));
}

TEST_F(PipelineIntegrationTest, TradesAndFillEstimate) {
    auto handle = service->subscribe({kToken});
    auto& transport = factory.latest();
    transport.fire_open();
    fetcher->succeed(kToken, make_snapshot(kToken, {{"0.52", "120"}}, {{"0.54", "90"}, {"0.56", "100"}}));

    transport.fire_message(
        R"({"event_type":"last_trade_price","asset_id":"111","price":"0.54","size":"5","side":"BUY","timestamp":"1"})");

    auto trade = service->last_trade(kToken);
    ASSERT_TRUE(trade.has_value());
    EXPECT_EQ(trade->price, Price(0.54));

    auto fill = book_metrics::simulate_fill(service->depth(kToken), Side::Bid, Size(100.0));
    EXPECT_TRUE(fill.can_fill());
    EXPECT_NEAR(fill.avg_price, (90 * 0.54 + 10 * 0.56) / 100.0, 1e-9);
}

TEST_F(PipelineIntegrationTest, ReconnectKeepsBooksAndResubscribes) {
    auto handle = service->subscribe({kToken, "222"});
    factory.latest().fire_open();
    fetcher->succeed(kToken, make_snapshot(kToken, {{"0.52", "120"}}, {{"0.54", "90"}}));

    factory.latest().fire_close("network down");
    EXPECT_EQ(service->connection_state(), ConnectionState::Reconnecting);
    EXPECT_EQ(service->best_prices(kToken).best_bid, Price(0.52));

    run(200ms);
    ASSERT_EQ(factory.count(), 2u);
    factory.latest().fire_open();

    EXPECT_EQ(service->connection_state(), ConnectionState::Connected);
    auto frame = nlohmann::json::parse(factory.latest().sent.at(0));
    EXPECT_EQ(frame["assets_ids"], nlohmann::json::array({kToken, "222"}));
}

TEST_F(PipelineIntegrationTest, FailedSnapshotCanBeRetried) {
    auto handle = service->subscribe({kToken});
    fetcher->fail(kToken);
    run(100ms);
    fetcher->fail(kToken);
    ASSERT_EQ(service->bootstrap_state(kToken), BootstrapCoordinator::State::Failed);
    EXPECT_FALSE(service->is_seeded(kToken));

    service->retry_snapshot(kToken);
    fetcher->succeed(kToken, make_snapshot(kToken, {{"0.52", "120"}}, {}));

    EXPECT_TRUE(service->is_seeded(kToken));
}

TEST_F(PipelineIntegrationTest, ReleasingLastHandleTearsDownInstrument) {
    std::vector<ConnectionState> states;
    service->add_connection_listener([&states](ConnectionState s) { states.push_back(s); });

    auto handle = service->subscribe({kToken});
    factory.latest().fire_open();
    fetcher->succeed(kToken, make_snapshot(kToken, {{"0.52", "120"}}, {}));

    handle.release();
    EXPECT_EQ(service->ref_count(kToken), 0u);
    EXPECT_TRUE(service->active_instruments().empty());

    run(200ms);

    EXPECT_EQ(service->connection_state(), ConnectionState::Disconnected);
    EXPECT_FALSE(service->store().contains(kToken));
    EXPECT_EQ(states.back(), ConnectionState::Disconnected);
}

TEST_F(PipelineIntegrationTest, RetryForUnsubscribedInstrumentIsIgnored) {
    service->retry_snapshot("999");
    EXPECT_TRUE(fetcher->fetches.empty());
}

TEST_F(PipelineIntegrationTest, TeardownIsIdempotent) {
    auto handle = service->subscribe({kToken});
    factory.latest().fire_open();

    service->teardown();
    service->teardown();

    EXPECT_EQ(service->connection_state(), ConnectionState::Disconnected);
    EXPECT_FALSE(service->store().contains(kToken));
    handle.release();
}
