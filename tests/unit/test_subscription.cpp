#include <gtest/gtest.h>
#include "feed/subscription.hpp"
#include "support/fakes.hpp"

using namespace booksync;
using namespace std::chrono_literals;
using booksync::feed::SubscriptionHandle;
using booksync::network::ConnectionState;
using booksync::testing::FakeSnapshotFetcher;
using booksync::testing::FakeTransportFactory;
using booksync::testing::make_snapshot;

class SubscriptionTest : public ::testing::Test {
protected:
    SubscriptionTest() {
        config.book.eviction_grace = 30ms;
        config.book.snapshot_timeout = 5s;
        config.network.linger = 0ms;
        config.network.heartbeat_interval = 60s;

        store = std::make_unique<OrderBookStore>(config.book);
        connection = std::make_shared<feed::ConnectionManager>(ioc, config.network, *store, factory.factory());
        bootstrap = std::make_shared<feed::BootstrapCoordinator>(ioc, config.book, *store, fetcher);
        registry = std::make_shared<feed::SubscriptionRegistry>(ioc, config.book, *store, connection, bootstrap);
        connection->init();
    }

    void TearDown() override {
        registry->shutdown();
        bootstrap->cancel_all();
        connection->teardown();
    }

    void run(std::chrono::milliseconds duration) {
        ioc.restart();
        ioc.run_for(duration);
    }

    boost::asio::io_context ioc;
    Config config;
    FakeTransportFactory factory;
    std::shared_ptr<FakeSnapshotFetcher> fetcher = std::make_shared<FakeSnapshotFetcher>();
    std::unique_ptr<OrderBookStore> store;
    std::shared_ptr<feed::ConnectionManager> connection;
    std::shared_ptr<feed::BootstrapCoordinator> bootstrap;
    std::shared_ptr<feed::SubscriptionRegistry> registry;
};

// ============================================================================
// Reference counting
// ============================================================================

TEST_F(SubscriptionTest, FirstSubscribeStartsEverything) {
    auto handle = registry->subscribe({"111"});

    EXPECT_TRUE(handle.active());
    EXPECT_EQ(registry->ref_count("111"), 1u);
    EXPECT_TRUE(store->contains("111"));
    EXPECT_EQ(fetcher->count("111"), 1u);
    EXPECT_TRUE(connection->is_subscribed("111"));
    EXPECT_EQ(factory.count(), 1u);
}

TEST_F(SubscriptionTest, SecondHandleSharesFetchAndConnection) {
    auto first = registry->subscribe({"111"});
    auto second = registry->subscribe({"111", "222"});

    EXPECT_EQ(registry->ref_count("111"), 2u);
    EXPECT_EQ(registry->ref_count("222"), 1u);
    EXPECT_EQ(fetcher->count("111"), 1u);
    EXPECT_EQ(fetcher->count("222"), 1u);
    EXPECT_EQ(factory.count(), 1u);
    EXPECT_EQ(registry->active_instruments(), (std::vector<InstrumentId>{"111", "222"}));
}

TEST_F(SubscriptionTest, ReleasingOneOfTwoKeepsInstrument) {
    auto first = registry->subscribe({"111"});
    auto second = registry->subscribe({"111"});

    first.release();

    EXPECT_EQ(registry->ref_count("111"), 1u);
    EXPECT_TRUE(connection->is_subscribed("111"));
    EXPECT_FALSE(registry->eviction_pending("111"));
    EXPECT_FALSE(fetcher->fetches.front().request->cancelled);
}

TEST_F(SubscriptionTest, ReleaseIsIdempotent) {
    auto first = registry->subscribe({"111"});
    auto second = registry->subscribe({"111"});

    first.release();
    first.release();

    EXPECT_FALSE(first.active());
    EXPECT_EQ(registry->ref_count("111"), 1u);
}

TEST_F(SubscriptionTest, LastReleaseLeavesLiveSetAndCancelsFetch) {
    auto handle = registry->subscribe({"111"});

    handle.release();

    EXPECT_EQ(registry->ref_count("111"), 0u);
    EXPECT_FALSE(connection->is_subscribed("111"));
    EXPECT_TRUE(fetcher->fetches.front().request->cancelled);
    EXPECT_EQ(connection->state(), ConnectionState::Disconnected);
}

TEST_F(SubscriptionTest, EvictionWaitsForGracePeriod) {
    auto handle = registry->subscribe({"111"});
    fetcher->succeed("111", make_snapshot("111", {{"0.45", "10"}}, {}));

    handle.release();

    EXPECT_TRUE(registry->eviction_pending("111"));
    EXPECT_TRUE(store->contains("111"));
    EXPECT_EQ(store->best_prices("111").best_bid, Price(0.45));

    run(200ms);

    EXPECT_FALSE(store->contains("111"));
    EXPECT_FALSE(registry->eviction_pending("111"));
}

TEST_F(SubscriptionTest, ResubscribeWithinGraceRefetches) {
    auto handle = registry->subscribe({"111"});
    fetcher->succeed("111", make_snapshot("111", {{"0.45", "10"}}, {}));
    handle.release();

    auto again = registry->subscribe({"111"});

    EXPECT_FALSE(registry->eviction_pending("111"));
    EXPECT_FALSE(store->is_seeded("111"));
    EXPECT_EQ(fetcher->count("111"), 2u);

    run(100ms);
    EXPECT_TRUE(store->contains("111"));

    fetcher->succeed("111", make_snapshot("111", {{"0.47", "3"}}, {}));
    EXPECT_EQ(store->best_prices("111").best_bid, Price(0.47));
}

TEST_F(SubscriptionTest, LateResponseAfterReleaseIsIgnored) {
    auto handle = registry->subscribe({"111"});
    handle.release();

    fetcher->respond(fetcher->fetches.front(),
                     Result<BookSnapshot, Error>::Ok(make_snapshot("111", {{"0.45", "10"}}, {})));

    EXPECT_FALSE(store->is_seeded("111"));
}

// ============================================================================
// Handle semantics
// ============================================================================

TEST_F(SubscriptionTest, DestructorReleases) {
    {
        auto handle = registry->subscribe({"111"});
        EXPECT_EQ(registry->ref_count("111"), 1u);
    }
    EXPECT_EQ(registry->ref_count("111"), 0u);
    EXPECT_FALSE(connection->is_subscribed("111"));
}

TEST_F(SubscriptionTest, MoveTransfersOwnership) {
    auto handle = registry->subscribe({"111"});
    SubscriptionHandle moved = std::move(handle);

    EXPECT_FALSE(handle.active());
    EXPECT_TRUE(moved.active());

    handle.release();
    EXPECT_EQ(registry->ref_count("111"), 1u);

    moved.release();
    EXPECT_EQ(registry->ref_count("111"), 0u);
}

TEST_F(SubscriptionTest, MoveAssignmentReleasesPreviousInterest) {
    auto handle = registry->subscribe({"111"});
    handle = registry->subscribe({"222"});

    EXPECT_EQ(registry->ref_count("111"), 0u);
    EXPECT_EQ(registry->ref_count("222"), 1u);
    EXPECT_EQ(handle.instruments(), (std::vector<InstrumentId>{"222"}));
}

TEST_F(SubscriptionTest, BlankAndDuplicateIdsAreDropped) {
    auto empty = registry->subscribe({"", "   "});
    EXPECT_FALSE(empty.active());
    EXPECT_TRUE(registry->active_instruments().empty());
    EXPECT_EQ(factory.count(), 0u);

    auto handle = registry->subscribe({"111", "", "111"});
    EXPECT_EQ(handle.instruments(), (std::vector<InstrumentId>{"111"}));
    EXPECT_EQ(registry->ref_count("111"), 1u);
}

TEST_F(SubscriptionTest, HandleOutlivingShutdownIsHarmless) {
    auto handle = registry->subscribe({"111"});

    registry->shutdown();
    EXPECT_FALSE(store->contains("111"));

    handle.release();
    EXPECT_EQ(registry->ref_count("111"), 0u);
}

TEST_F(SubscriptionTest, HandleOutlivingRegistryIsHarmless) {
    auto handle = registry->subscribe({"111"});
    registry->shutdown();
    std::weak_ptr<feed::SubscriptionRegistry> weak = registry;
    registry = std::make_shared<feed::SubscriptionRegistry>(ioc, config.book, *store, connection, bootstrap);

    EXPECT_TRUE(weak.expired());
    handle.release();
    EXPECT_FALSE(handle.active());
}
