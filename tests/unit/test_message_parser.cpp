#include <gtest/gtest.h>
#include "clob/endpoints.hpp"
#include "clob/message_parser.hpp"
#include <chrono>
#include <nlohmann/json.hpp>
#include <variant>

using namespace booksync;
using namespace booksync::clob;

class MessageParserTest : public ::testing::Test {
protected:
    Timestamp now = std::chrono::steady_clock::now();

    std::vector<FeedEvent> parse_ok(std::string_view frame) {
        auto result = MessageParser::parse_market_frame(frame, now);
        EXPECT_TRUE(result.is_ok()) << (result.is_err() ? result.error() : "");
        return result.is_ok() ? result.value() : std::vector<FeedEvent>{};
    }
};

// ============================================================================
// Stream frames
// ============================================================================

TEST_F(MessageParserTest, ParseBookEvent) {
    auto events = parse_ok(R"({
        "event_type": "book",
        "asset_id": "111",
        "market": "0xmarket",
        "hash": "abc",
        "timestamp": "1700000000000",
        "bids": [{"price": "0.52", "size": "120"}, {"price": "0.50", "size": "10"}],
        "asks": [{"price": "0.54", "size": "90"}]
    })");

    ASSERT_EQ(events.size(), 1u);
    ASSERT_TRUE(std::holds_alternative<BookMsg>(events[0]));
    const auto& snapshot = std::get<BookMsg>(events[0]).snapshot;
    EXPECT_EQ(snapshot.instrument_id, "111");
    EXPECT_EQ(snapshot.market, "0xmarket");
    EXPECT_EQ(snapshot.hash, "abc");
    ASSERT_EQ(snapshot.bids.size(), 2u);
    EXPECT_EQ(snapshot.bids[0].price, Price(0.52));
    EXPECT_EQ(snapshot.bids[0].size, Size(120.0));
    ASSERT_EQ(snapshot.asks.size(), 1u);
    EXPECT_EQ(snapshot.asks[0].price, Price(0.54));
}

TEST_F(MessageParserTest, BookEventWithoutAssetIdIsDropped) {
    auto events = parse_ok(R"({"event_type": "book", "bids": [], "asks": []})");
    EXPECT_TRUE(events.empty());
}

TEST_F(MessageParserTest, MalformedLevelsAreSkipped) {
    auto events = parse_ok(R"({
        "event_type": "book", "asset_id": "111",
        "bids": [{"price": "abc", "size": "1"}, {"price": "0.4"}, {"price": "0.41", "size": "2"}],
        "asks": []
    })");

    ASSERT_EQ(events.size(), 1u);
    const auto& bids = std::get<BookMsg>(events[0]).snapshot.bids;
    ASSERT_EQ(bids.size(), 1u);
    EXPECT_EQ(bids[0].price, Price(0.41));
}

TEST_F(MessageParserTest, ParsePriceChanges) {
    auto events = parse_ok(R"({
        "event_type": "price_change",
        "market": "0xmarket",
        "timestamp": "1700000000001",
        "price_changes": [
            {"asset_id": "111", "side": "BUY", "price": "0.53", "size": "40"},
            {"asset_id": "222", "side": "SELL", "price": "0.47", "size": "0"}
        ]
    })");

    ASSERT_EQ(events.size(), 1u);
    const auto& msg = std::get<PriceChangeMsg>(events[0]);
    EXPECT_EQ(msg.market, "0xmarket");
    ASSERT_EQ(msg.deltas.size(), 2u);
    EXPECT_EQ(msg.deltas[0].instrument_id, "111");
    EXPECT_EQ(msg.deltas[0].side, Side::Bid);
    EXPECT_EQ(msg.deltas[0].price, Price(0.53));
    EXPECT_EQ(msg.deltas[0].size, Size(40.0));
    EXPECT_EQ(msg.deltas[1].side, Side::Ask);
    EXPECT_TRUE(msg.deltas[1].size.is_zero());
    EXPECT_EQ(msg.deltas[0].received_at, now);
}

TEST_F(MessageParserTest, ParseLegacyChangesWithTopLevelAsset) {
    auto events = parse_ok(R"({
        "event_type": "price_change",
        "asset_id": "111",
        "changes": [{"side": "sell", "price": "0.6", "size": "3"}]
    })");

    ASSERT_EQ(events.size(), 1u);
    const auto& msg = std::get<PriceChangeMsg>(events[0]);
    ASSERT_EQ(msg.deltas.size(), 1u);
    EXPECT_EQ(msg.deltas[0].instrument_id, "111");
    EXPECT_EQ(msg.deltas[0].side, Side::Ask);
}

TEST_F(MessageParserTest, BadPriceChangeEntriesAreSkipped) {
    auto events = parse_ok(R"({
        "event_type": "price_change",
        "price_changes": [
            {"asset_id": "111", "side": "HOLD", "price": "0.5", "size": "1"},
            {"asset_id": "111", "side": "BUY", "price": "0.5", "size": "1"}
        ]
    })");

    ASSERT_EQ(events.size(), 1u);
    EXPECT_EQ(std::get<PriceChangeMsg>(events[0]).deltas.size(), 1u);
}

TEST_F(MessageParserTest, ParsePlainDelta) {
    auto events = parse_ok(R"({"instrumentId": "111", "side": "bid", "price": 0.53, "size": 40})");

    ASSERT_EQ(events.size(), 1u);
    const auto& msg = std::get<PriceChangeMsg>(events[0]);
    ASSERT_EQ(msg.deltas.size(), 1u);
    EXPECT_EQ(msg.deltas[0].instrument_id, "111");
    EXPECT_EQ(msg.deltas[0].price, Price(0.53));
}

TEST_F(MessageParserTest, ParseLastTrade) {
    auto events = parse_ok(R"({
        "event_type": "last_trade_price", "asset_id": "111",
        "price": "0.55", "size": "12.5", "side": "BUY", "timestamp": "1700000000002"
    })");

    ASSERT_EQ(events.size(), 1u);
    const auto& msg = std::get<LastTradeMsg>(events[0]);
    EXPECT_EQ(msg.instrument_id, "111");
    EXPECT_EQ(msg.trade.price, Price(0.55));
    EXPECT_EQ(msg.trade.size, Size(12.5));
    EXPECT_EQ(msg.trade.aggressor, Side::Bid);
    EXPECT_EQ(msg.trade.timestamp, "1700000000002");
}

TEST_F(MessageParserTest, ParseTickSizeChange) {
    auto events = parse_ok(R"({
        "event_type": "tick_size_change", "asset_id": "111",
        "old_tick_size": "0.01", "new_tick_size": "0.001"
    })");

    ASSERT_EQ(events.size(), 1u);
    const auto& msg = std::get<TickSizeChangeMsg>(events[0]);
    EXPECT_EQ(msg.old_tick_size, Price(0.01));
    EXPECT_EQ(msg.new_tick_size, Price(0.001));
}

TEST_F(MessageParserTest, ArrayFrameKeepsGoodEntries) {
    auto events = parse_ok(R"([
        {"event_type": "book", "asset_id": "111", "bids": [], "asks": []},
        42,
        {"event_type": "last_trade_price", "asset_id": "111"},
        {"event_type": "book", "asset_id": "222", "bids": [], "asks": []}
    ])");

    ASSERT_EQ(events.size(), 2u);
    EXPECT_EQ(std::get<BookMsg>(events[0]).snapshot.instrument_id, "111");
    EXPECT_EQ(std::get<BookMsg>(events[1]).snapshot.instrument_id, "222");
}

TEST_F(MessageParserTest, UnknownEventTypeIsIgnored) {
    auto events = parse_ok(R"({"event_type": "new_market", "asset_id": "111"})");
    EXPECT_TRUE(events.empty());
}

TEST_F(MessageParserTest, PongFrame) {
    for (const char* frame : {"PONG", "pong", "  PONG\n"}) {
        auto events = parse_ok(frame);
        ASSERT_EQ(events.size(), 1u) << frame;
        EXPECT_TRUE(std::holds_alternative<PongMsg>(events[0]));
    }
}

TEST_F(MessageParserTest, EmptyFrameYieldsNothing) {
    EXPECT_TRUE(parse_ok("   ").empty());
}

TEST_F(MessageParserTest, RejectsNonJsonFrame) {
    auto result = MessageParser::parse_market_frame("INVALID OPERATION", now);
    ASSERT_TRUE(result.is_err());
    EXPECT_NE(result.error().find("Non-JSON"), std::string::npos);
}

TEST_F(MessageParserTest, RejectsBrokenJson) {
    auto result = MessageParser::parse_market_frame(R"({"event_type": "book", )", now);
    ASSERT_TRUE(result.is_err());
    EXPECT_NE(result.error().find("JSON parse error"), std::string::npos);
}

// ============================================================================
// REST book responses
// ============================================================================

TEST_F(MessageParserTest, ParseRestBook) {
    auto result = MessageParser::parse_book_snapshot(R"({
        "market": "0xmarket", "asset_id": "111", "hash": "h",
        "timestamp": "1700000000000",
        "bids": [{"price": "0.52", "size": "120"}],
        "asks": [{"price": "0.54", "size": "90"}],
        "tick_size": "0.01", "min_order_size": "5", "neg_risk": true
    })", "111", now);

    ASSERT_TRUE(result.is_ok()) << result.error();
    const auto& snapshot = result.value();
    EXPECT_EQ(snapshot.instrument_id, "111");
    EXPECT_EQ(snapshot.fetched_at, now);
    EXPECT_EQ(snapshot.tick_size, Price(0.01));
    EXPECT_EQ(snapshot.min_order_size, Size(5.0));
    EXPECT_TRUE(snapshot.neg_risk);
    ASSERT_EQ(snapshot.bids.size(), 1u);
    ASSERT_EQ(snapshot.asks.size(), 1u);
}

TEST_F(MessageParserTest, RestBookForOtherInstrumentIsRejected) {
    auto result = MessageParser::parse_book_snapshot(
        R"({"asset_id": "222", "bids": [], "asks": []})", "111", now);
    EXPECT_TRUE(result.is_err());
}

TEST_F(MessageParserTest, RestBookWithoutLaddersIsRejected) {
    EXPECT_TRUE(MessageParser::parse_book_snapshot(R"({"error": "not found"})", "111", now).is_err());
    EXPECT_TRUE(MessageParser::parse_book_snapshot("[]", "111", now).is_err());
    EXPECT_TRUE(MessageParser::parse_book_snapshot("<html>", "111", now).is_err());
}

// ============================================================================
// Helpers
// ============================================================================

TEST_F(MessageParserTest, ParseSide) {
    EXPECT_EQ(MessageParser::parse_side("BUY"), Side::Bid);
    EXPECT_EQ(MessageParser::parse_side("bid"), Side::Bid);
    EXPECT_EQ(MessageParser::parse_side("Sell"), Side::Ask);
    EXPECT_EQ(MessageParser::parse_side("ASK"), Side::Ask);
    EXPECT_FALSE(MessageParser::parse_side("both").has_value());
}

TEST_F(MessageParserTest, SubscribeFrameCarriesFullSet) {
    auto frame = nlohmann::json::parse(MessageParser::build_subscribe_frame({"111", "222"}));

    EXPECT_EQ(frame["type"], "market");
    ASSERT_TRUE(frame["assets_ids"].is_array());
    EXPECT_EQ(frame["assets_ids"].size(), 2u);
    EXPECT_EQ(frame["assets_ids"][0], "111");
    EXPECT_EQ(frame["assets_ids"][1], "222");
}

// ============================================================================
// Endpoints
// ============================================================================

TEST(EndpointsTest, BookPathKeepsNumericTokenIds) {
    EXPECT_EQ(endpoints::rest_book_path("71321045679252212594626385532706912750332728571942532289631379312455583992563"),
              "/book?token_id=71321045679252212594626385532706912750332728571942532289631379312455583992563");
}

TEST(EndpointsTest, BookPathEncodesReservedCharacters) {
    EXPECT_EQ(endpoints::rest_book_path("a&b=c#d e"), "/book?token_id=a%26b%3Dc%23d%20e");
    EXPECT_EQ(endpoints::rest_book_path("x/y?z"), "/book?token_id=x%2Fy%3Fz");
    EXPECT_EQ(endpoints::rest_book_path("ok-_.~"), "/book?token_id=ok-_.~");
}
