#include <gtest/gtest.h>
#include "output/json_formatter.hpp"
#include "support/fakes.hpp"

using namespace booksync;
using namespace booksync::output;
using booksync::testing::levels;

TEST(JsonFormatterTest, FormatsSeededBook) {
    BestPrices best;
    best.best_bid = Price(0.53);
    best.best_bid_size = Size(40.0);
    best.best_ask = Price(0.54);
    best.best_ask_size = Size(90.0);
    DepthView depth{levels({{"0.53", "40"}, {"0.52", "120"}}), levels({{"0.54", "90"}})};

    auto j = JsonFormatter::format_book("111", best, depth, std::nullopt, false);

    EXPECT_EQ(j["type"], "book");
    EXPECT_EQ(j["instrument"], "111");
    EXPECT_EQ(j["bestBid"], "0.53");
    EXPECT_EQ(j["bestBidSize"], "40");
    EXPECT_EQ(j["bestAsk"], "0.54");
    EXPECT_EQ(j["spread"], "0.01");
    EXPECT_EQ(j["totalBidSize"], "160");
    ASSERT_EQ(j["bids"].size(), 2u);
    EXPECT_EQ(j["bids"][1]["price"], "0.52");
    EXPECT_EQ(j["asks"][0]["size"], "90");
    EXPECT_FALSE(j["stale"].get<bool>());
    EXPECT_TRUE(j["lastTrade"].is_null());
}

TEST(JsonFormatterTest, UnseededBookHasNulls) {
    auto j = JsonFormatter::format_book("111", BestPrices{}, DepthView{}, std::nullopt, true);

    EXPECT_TRUE(j["bestBid"].is_null());
    EXPECT_TRUE(j["bestAsk"].is_null());
    EXPECT_TRUE(j["spread"].is_null());
    EXPECT_TRUE(j["midpoint"].is_null());
    EXPECT_TRUE(j["bids"].empty());
    EXPECT_TRUE(j["stale"].get<bool>());
}

TEST(JsonFormatterTest, IncludesLastTrade) {
    LastTrade trade{Price(0.55), Size(12.5), Side::Ask, "1700000000002"};

    auto j = JsonFormatter::format_book("111", BestPrices{}, DepthView{}, trade, false);

    ASSERT_TRUE(j["lastTrade"].is_object());
    EXPECT_EQ(j["lastTrade"]["price"], "0.55");
    EXPECT_EQ(j["lastTrade"]["size"], "12.5");
    EXPECT_EQ(j["lastTrade"]["side"], "SELL");
}

TEST(JsonFormatterTest, FormatsFill) {
    DepthView depth{{}, levels({{"0.54", "90"}})};
    auto fill = book_metrics::simulate_fill(depth, Side::Bid, Size(100.0));

    auto j = JsonFormatter::format_fill(fill);

    EXPECT_EQ(j["requested"], "100");
    EXPECT_EQ(j["filled"], "90");
    EXPECT_EQ(j["unfilled"], "10");
    EXPECT_EQ(j["bestPrice"], "0.54");
    EXPECT_FALSE(j["canFill"].get<bool>());
}

TEST(JsonFormatterTest, FormatsStatus) {
    auto live = JsonFormatter::format_status(network::ConnectionState::Connected);
    EXPECT_EQ(live["type"], "status");
    EXPECT_TRUE(live["connected"].get<bool>());
    EXPECT_EQ(live["label"], "Live");

    auto down = JsonFormatter::format_status(network::ConnectionState::Reconnecting);
    EXPECT_FALSE(down["connected"].get<bool>());
    EXPECT_EQ(down["state"], "Reconnecting");
}

TEST(JsonFormatterTest, TimestampIsIso8601Utc) {
    auto ts = JsonFormatter::iso_timestamp();
    ASSERT_EQ(ts.size(), 24u);
    EXPECT_EQ(ts[10], 'T');
    EXPECT_EQ(ts.back(), 'Z');
}
