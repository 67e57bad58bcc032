#include "clob/message_parser.hpp"
#include "clob/endpoints.hpp"
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cctype>

namespace booksync::clob {

using json = nlohmann::json;

namespace {

std::string_view trim(std::string_view s) noexcept {
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front()))) {
        s.remove_prefix(1);
    }
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) {
        s.remove_suffix(1);
    }
    return s;
}

bool iequals(std::string_view a, std::string_view b) noexcept {
    return a.size() == b.size() &&
           std::equal(a.begin(), a.end(), b.begin(), [](char x, char y) {
               return std::tolower(static_cast<unsigned char>(x)) ==
                      std::tolower(static_cast<unsigned char>(y));
           });
}

/// Decimal fields arrive as strings; tolerate bare JSON numbers too
std::optional<std::string> text_field(const json& obj, const char* key) {
    auto it = obj.find(key);
    if (it == obj.end() || it->is_null()) {
        return std::nullopt;
    }
    if (it->is_string()) {
        return it->get<std::string>();
    }
    if (it->is_number()) {
        return it->dump();
    }
    return std::nullopt;
}

/// Token id under either wire name
std::optional<std::string> instrument_field(const json& obj) {
    auto id = text_field(obj, "asset_id");
    if (!id) {
        id = text_field(obj, "instrumentId");
    }
    if (id && trim(*id).empty()) {
        return std::nullopt;
    }
    return id;
}

/// Parse level array: [{"price": "0.52", "size": "120"}, ...]
/// Malformed levels are skipped
PriceLevels parse_price_levels(const json& arr, std::string_view instrument_id) {
    PriceLevels levels;
    levels.reserve(arr.size());

    for (const auto& level : arr) {
        if (!level.is_object()) {
            spdlog::warn("ProtocolError: non-object level for {}", instrument_id);
            continue;
        }
        auto price_text = text_field(level, "price");
        auto size_text = text_field(level, "size");
        auto price = price_text ? convert::parse_price(*price_text) : std::nullopt;
        auto size = size_text ? convert::parse_size(*size_text) : std::nullopt;
        if (!price || !size) {
            spdlog::warn("ProtocolError: malformed level {} for {}", level.dump(), instrument_id);
            continue;
        }
        levels.push_back(PriceLevel{*price, *size});
    }

    return levels;
}

/// Shared by stream "book" events and REST /book responses
Result<BookSnapshot, std::string> parse_book_object(const json& j, std::string_view instrument_id,
                                                    Timestamp fetched_at) {
    if (!j.contains("bids") || !j.contains("asks") ||
        !j["bids"].is_array() || !j["asks"].is_array()) {
        return Result<BookSnapshot, std::string>::Err("Missing bids/asks arrays in book");
    }

    BookSnapshot snapshot;
    snapshot.instrument_id = std::string(instrument_id);
    snapshot.fetched_at = fetched_at;
    snapshot.bids = parse_price_levels(j["bids"], instrument_id);
    snapshot.asks = parse_price_levels(j["asks"], instrument_id);
    snapshot.market = text_field(j, "market").value_or("");
    snapshot.hash = text_field(j, "hash").value_or("");
    snapshot.timestamp = text_field(j, "timestamp").value_or("");
    if (auto tick = text_field(j, "tick_size")) {
        snapshot.tick_size = convert::parse_price(*tick);
    }
    if (auto min_size = text_field(j, "min_order_size")) {
        snapshot.min_order_size = convert::parse_size(*min_size);
    }
    if (auto it = j.find("neg_risk"); it != j.end() && it->is_boolean()) {
        snapshot.neg_risk = it->get<bool>();
    }

    return Result<BookSnapshot, std::string>::Ok(std::move(snapshot));
}

/// One {asset_id, side, price, size} entry
std::optional<Delta> parse_delta(const json& entry, const std::optional<std::string>& fallback_id,
                                 Timestamp received_at) {
    if (!entry.is_object()) {
        return std::nullopt;
    }
    auto id = instrument_field(entry);
    if (!id) {
        id = fallback_id;
    }
    auto side_text = text_field(entry, "side");
    auto price_text = text_field(entry, "price");
    auto size_text = text_field(entry, "size");
    if (!id || !side_text || !price_text || !size_text) {
        return std::nullopt;
    }

    auto side = MessageParser::parse_side(*side_text);
    auto price = convert::parse_price(*price_text);
    auto size = convert::parse_size(*size_text);
    if (!side || !price || !size) {
        return std::nullopt;
    }

    return Delta{std::move(*id), *side, *price, *size, received_at};
}

void parse_price_change(const json& j, Timestamp received_at, std::vector<FeedEvent>& out) {
    PriceChangeMsg msg;
    msg.market = text_field(j, "market").value_or("");
    msg.timestamp = text_field(j, "timestamp").value_or("");

    // Current format lists per-asset changes; the older one put asset_id on the event
    const char* key = j.contains("price_changes") ? "price_changes" : "changes";
    auto it = j.find(key);
    if (it == j.end() || !it->is_array()) {
        spdlog::warn("ProtocolError: price_change without {} array", key);
        return;
    }

    auto fallback_id = instrument_field(j);
    for (const auto& entry : *it) {
        if (auto delta = parse_delta(entry, fallback_id, received_at)) {
            msg.deltas.push_back(std::move(*delta));
        } else {
            spdlog::warn("ProtocolError: dropping malformed price change {}", entry.dump());
        }
    }

    if (!msg.deltas.empty()) {
        out.emplace_back(std::move(msg));
    }
}

void parse_last_trade(const json& j, std::vector<FeedEvent>& out) {
    auto id = instrument_field(j);
    auto price = text_field(j, "price");
    auto size = text_field(j, "size");
    auto side = text_field(j, "side");

    auto parsed_price = price ? convert::parse_price(*price) : std::nullopt;
    auto parsed_size = size ? convert::parse_size(*size) : std::nullopt;
    auto parsed_side = side ? MessageParser::parse_side(*side) : std::nullopt;
    if (!id || !parsed_price || !parsed_size || !parsed_side) {
        spdlog::warn("ProtocolError: dropping malformed last_trade_price {}", j.dump());
        return;
    }

    LastTrade trade{*parsed_price, *parsed_size, *parsed_side, text_field(j, "timestamp").value_or("")};
    out.emplace_back(LastTradeMsg{std::move(*id), std::move(trade)});
}

void parse_tick_size_change(const json& j, std::vector<FeedEvent>& out) {
    auto id = instrument_field(j);
    auto old_tick = text_field(j, "old_tick_size");
    auto new_tick = text_field(j, "new_tick_size");

    auto parsed_old = old_tick ? convert::parse_price(*old_tick) : std::nullopt;
    auto parsed_new = new_tick ? convert::parse_price(*new_tick) : std::nullopt;
    if (!id || !parsed_new) {
        spdlog::warn("ProtocolError: dropping malformed tick_size_change {}", j.dump());
        return;
    }

    out.emplace_back(TickSizeChangeMsg{std::move(*id), parsed_old.value_or(Price{}), *parsed_new});
}

void parse_event(const json& j, Timestamp received_at, std::vector<FeedEvent>& out) {
    if (!j.is_object()) {
        spdlog::warn("ProtocolError: non-object event {}", j.dump());
        return;
    }

    const std::string event_type = j.value("event_type", std::string{});

    if (event_type == "book") {
        auto id = instrument_field(j);
        if (!id) {
            spdlog::warn("ProtocolError: book event without asset_id");
            return;
        }
        auto result = parse_book_object(j, *id, received_at);
        if (result.is_err()) {
            spdlog::warn("ProtocolError: book event for {}: {}", *id, result.error());
            return;
        }
        out.emplace_back(BookMsg{std::move(result).take_value()});
    } else if (event_type == "price_change") {
        parse_price_change(j, received_at, out);
    } else if (event_type == "last_trade_price") {
        parse_last_trade(j, out);
    } else if (event_type == "tick_size_change") {
        parse_tick_size_change(j, out);
    } else if (event_type.empty() && j.contains("side") && j.contains("price")) {
        // Plain delta object without an envelope
        if (auto delta = parse_delta(j, std::nullopt, received_at)) {
            PriceChangeMsg msg;
            msg.deltas.push_back(std::move(*delta));
            out.emplace_back(std::move(msg));
        } else {
            spdlog::warn("ProtocolError: dropping malformed delta {}", j.dump());
        }
    } else {
        spdlog::debug("Ignoring event_type '{}'", event_type);
    }
}

}  // namespace

Result<std::vector<FeedEvent>, std::string> MessageParser::parse_market_frame(
    std::string_view frame,
    Timestamp received_at
) {
    using FrameResult = Result<std::vector<FeedEvent>, std::string>;

    auto text = trim(frame);
    std::vector<FeedEvent> events;

    if (text.empty()) {
        return FrameResult::Ok(std::move(events));
    }
    if (is_pong(text)) {
        events.emplace_back(PongMsg{});
        return FrameResult::Ok(std::move(events));
    }
    if (text.front() != '{' && text.front() != '[') {
        return FrameResult::Err("Non-JSON frame: " + std::string(text.substr(0, 64)));
    }

    try {
        auto j = json::parse(text);

        if (j.is_object()) {
            parse_event(j, received_at, events);
        } else if (j.is_array()) {
            for (const auto& entry : j) {
                try {
                    parse_event(entry, received_at, events);
                } catch (const json::exception& e) {
                    spdlog::warn("ProtocolError: dropping event: {}", e.what());
                }
            }
        } else {
            return FrameResult::Err("Unexpected top-level JSON type");
        }

        return FrameResult::Ok(std::move(events));

    } catch (const json::exception& e) {
        return FrameResult::Err(std::string("JSON parse error: ") + e.what());
    }
}

Result<BookSnapshot, std::string> MessageParser::parse_book_snapshot(
    std::string_view body,
    std::string_view instrument_id,
    Timestamp fetched_at
) {
    try {
        auto j = json::parse(body);

        if (!j.is_object()) {
            return Result<BookSnapshot, std::string>::Err("Book response is not an object");
        }
        if (auto id = instrument_field(j); id && *id != instrument_id) {
            return Result<BookSnapshot, std::string>::Err(
                "Book response for " + *id + " does not match request for " + std::string(instrument_id)
            );
        }

        return parse_book_object(j, instrument_id, fetched_at);

    } catch (const json::exception& e) {
        return Result<BookSnapshot, std::string>::Err(
            std::string("JSON parse error: ") + e.what()
        );
    }
}

std::optional<Side> MessageParser::parse_side(std::string_view side) noexcept {
    if (iequals(side, "BUY") || iequals(side, "bid")) {
        return Side::Bid;
    }
    if (iequals(side, "SELL") || iequals(side, "ask")) {
        return Side::Ask;
    }
    return std::nullopt;
}

bool MessageParser::is_pong(std::string_view frame) noexcept {
    return iequals(trim(frame), endpoints::PONG_FRAME);
}

std::string MessageParser::build_subscribe_frame(const std::vector<InstrumentId>& instrument_ids) {
    json frame;
    frame["type"] = "market";
    frame["assets_ids"] = instrument_ids;
    return frame.dump();
}

}  // namespace booksync::clob
