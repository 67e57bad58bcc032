#include "feed/connection_manager.hpp"
#include "clob/endpoints.hpp"
#include "clob/message_parser.hpp"
#include <algorithm>
#include <chrono>
#include <spdlog/spdlog.h>
#include <type_traits>

namespace booksync::feed {

using network::ConnectionState;

ConnectionManager::ConnectionManager(
    boost::asio::io_context& ioc,
    const Config::Network& config,
    OrderBookStore& store,
    network::TransportFactory transport_factory
)
    : config_(config)
    , store_(store)
    , transport_factory_(std::move(transport_factory))
    , reconnect_strategy_(
        config.reconnect_delay_initial,
        config.reconnect_delay_max,
        config.reconnect_backoff_multiplier,
        config.reconnect_jitter_factor,
        config.max_reconnect_attempts,
        config.reconnect_reset_window
    )
    , reconnect_timer_(ioc)
    , heartbeat_timer_(ioc)
    , pong_timer_(ioc)
    , linger_timer_(ioc)
{}

ConnectionManager::~ConnectionManager() {
    if (transport_) {
        transport_->close();
    }
}

void ConnectionManager::init() {
    running_ = true;
    spdlog::info("ConnectionManager ready for {}:{}{}", config_.ws_host, config_.ws_port, config_.ws_path);

    if (!subscriptions_.empty() && state_ == ConnectionState::Disconnected) {
        open_transport();
    }
}

void ConnectionManager::teardown() {
    spdlog::info("ConnectionManager tearing down");
    running_ = false;
    close_connection("teardown");
    subscriptions_.clear();
    listeners_.clear();
}

void ConnectionManager::acquire(const std::vector<InstrumentId>& instrument_ids) {
    bool grew = false;
    for (const auto& id : instrument_ids) {
        if (subscriptions_.insert(id).second) {
            grew = true;
        }
    }
    if (subscriptions_.empty()) {
        return;
    }

    cancel_linger();
    if (!running_) {
        return;
    }

    switch (state_) {
        case ConnectionState::Disconnected:
            reconnect_strategy_.reset();
            open_transport();
            break;
        case ConnectionState::Connected:
            if (grew) {
                send_subscription();
            }
            break;
        case ConnectionState::Connecting:
        case ConnectionState::Reconnecting:
            // The full set goes out once the connection opens
            break;
    }
}

void ConnectionManager::release(const std::vector<InstrumentId>& instrument_ids) {
    bool shrank = false;
    for (const auto& id : instrument_ids) {
        if (subscriptions_.erase(id) > 0) {
            shrank = true;
        }
    }
    if (!shrank) {
        return;
    }

    if (!subscriptions_.empty()) {
        send_subscription();
        return;
    }

    switch (state_) {
        case ConnectionState::Disconnected:
            break;
        case ConnectionState::Reconnecting:
            close_connection("no subscriptions left while reconnecting");
            break;
        case ConnectionState::Connecting:
        case ConnectionState::Connected:
            start_linger();
            break;
    }
}

void ConnectionManager::reconnect() {
    spdlog::info("Manual reconnect requested");
    reconnect_strategy_.reset();
    cancel_linger();
    reconnect_timer_.cancel();

    if (!running_ || subscriptions_.empty()) {
        close_connection("reconnect with no subscriptions");
        return;
    }

    drop_transport();
    const auto generation = generation_;
    set_state(ConnectionState::Reconnecting);
    if (generation != generation_) {
        return;  // A listener changed course
    }
    open_transport();
}

ConnectionState ConnectionManager::state() const noexcept {
    return state_;
}

ConnectionManager::ListenerId ConnectionManager::add_state_listener(StateListener listener) {
    const auto id = next_listener_id_++;
    auto& stored = listeners_.emplace(id, std::move(listener)).first->second;
    notify(stored, state_);
    return id;
}

void ConnectionManager::remove_state_listener(ListenerId id) {
    listeners_.erase(id);
}

std::vector<InstrumentId> ConnectionManager::subscribed() const {
    std::vector<InstrumentId> ids(subscriptions_.begin(), subscriptions_.end());
    std::sort(ids.begin(), ids.end());
    return ids;
}

bool ConnectionManager::is_subscribed(const InstrumentId& instrument_id) const {
    return subscriptions_.count(instrument_id) > 0;
}

bool ConnectionManager::is_healthy(Timestamp now) const {
    if (state_ != ConnectionState::Connected || !last_pong_at_) {
        return false;
    }
    return now - *last_pong_at_ < config_.heartbeat_interval * 5 / 2;
}

std::optional<Timestamp> ConnectionManager::last_pong_at() const noexcept {
    return last_pong_at_;
}

std::size_t ConnectionManager::reconnect_attempts() const noexcept {
    return reconnect_strategy_.attempt_count();
}

void ConnectionManager::open_transport() {
    drop_transport();
    const auto generation = generation_;

    set_state(ConnectionState::Connecting);
    if (generation != generation_) {
        return;
    }

    std::weak_ptr<ConnectionManager> weak = weak_from_this();
    network::TransportCallbacks callbacks;
    callbacks.on_open = [weak, generation]() {
        if (auto self = weak.lock()) {
            self->on_transport_open(generation);
        }
    };
    callbacks.on_message = [weak, generation](std::string_view frame) {
        if (auto self = weak.lock()) {
            self->on_transport_message(generation, frame);
        }
    };
    callbacks.on_close = [weak, generation](std::string_view reason) {
        if (auto self = weak.lock()) {
            self->on_transport_close(generation, reason);
        }
    };

    transport_ = transport_factory_(std::move(callbacks));
    if (!transport_) {
        spdlog::error("ConnectionError: transport factory produced no transport");
        on_connection_lost("transport unavailable");
        return;
    }
    transport_->open();
}

void ConnectionManager::drop_transport() {
    ++generation_;
    stop_heartbeat();
    if (transport_) {
        auto transport = std::move(transport_);
        transport->close();
    }
}

void ConnectionManager::close_connection(std::string_view reason) {
    spdlog::info("Closing market channel: {}", reason);
    cancel_linger();
    reconnect_timer_.cancel();
    drop_transport();
    set_state(ConnectionState::Disconnected);
}

void ConnectionManager::on_transport_open(std::uint64_t generation) {
    if (generation != generation_) {
        return;
    }

    spdlog::info("Market channel connected ({} instruments)", subscriptions_.size());
    reconnect_strategy_.reset();

    set_state(ConnectionState::Connected);
    if (generation != generation_) {
        return;
    }

    send_subscription();
    start_heartbeat();
}

void ConnectionManager::on_transport_message(std::uint64_t generation, std::string_view frame) {
    if (generation != generation_) {
        return;
    }

    auto result = clob::MessageParser::parse_market_frame(frame, std::chrono::steady_clock::now());
    if (result.is_err()) {
        spdlog::warn("ProtocolError: dropping frame: {}", result.error());
        return;
    }

    for (const auto& event : result.value()) {
        handle_event(event);
    }
}

void ConnectionManager::on_transport_close(std::uint64_t generation, std::string_view reason) {
    if (generation != generation_) {
        return;
    }

    spdlog::warn("ConnectionError: market channel lost: {}", reason);
    on_connection_lost(reason);
}

void ConnectionManager::on_connection_lost(std::string_view reason) {
    spdlog::debug("Connection lost ({}), {} instruments subscribed", reason, subscriptions_.size());
    drop_transport();
    schedule_reconnect();
}

void ConnectionManager::handle_event(const FeedEvent& event) {
    std::visit([this](const auto& msg) {
        using T = std::decay_t<decltype(msg)>;
        if constexpr (std::is_same_v<T, BookMsg>) {
            if (is_subscribed(msg.snapshot.instrument_id)) {
                store_.seed_from_snapshot(msg.snapshot, SeedSource::Stream);
            } else {
                spdlog::debug("Dropping book for unsubscribed {}", msg.snapshot.instrument_id);
            }
        } else if constexpr (std::is_same_v<T, PriceChangeMsg>) {
            for (const auto& delta : msg.deltas) {
                if (is_subscribed(delta.instrument_id)) {
                    store_.apply_delta(delta);
                }
            }
        } else if constexpr (std::is_same_v<T, LastTradeMsg>) {
            if (is_subscribed(msg.instrument_id)) {
                store_.record_trade(msg.instrument_id, msg.trade);
            }
        } else if constexpr (std::is_same_v<T, TickSizeChangeMsg>) {
            if (is_subscribed(msg.instrument_id)) {
                store_.set_tick_size(msg.instrument_id, msg.new_tick_size);
            }
        } else if constexpr (std::is_same_v<T, PongMsg>) {
            on_pong();
        }
    }, event);
}

void ConnectionManager::send_subscription() {
    if (!transport_ || state_ != ConnectionState::Connected || subscriptions_.empty()) {
        return;
    }

    transport_->send(clob::MessageParser::build_subscribe_frame(subscribed()));
    spdlog::info("Subscribed to {} instruments", subscriptions_.size());
}

void ConnectionManager::schedule_reconnect() {
    const auto generation = generation_;
    set_state(ConnectionState::Reconnecting);
    if (generation != generation_ || state_ != ConnectionState::Reconnecting) {
        return;
    }

    if (!running_ || subscriptions_.empty()) {
        spdlog::info("No subscriptions, not reconnecting");
        set_state(ConnectionState::Disconnected);
        return;
    }

    if (reconnect_strategy_.exhausted()) {
        spdlog::warn("Max reconnection attempts ({}) reached, giving up until reconnect() or a new subscription",
                     reconnect_strategy_.max_attempts());
        set_state(ConnectionState::Disconnected);
        return;
    }

    auto delay = reconnect_strategy_.next_delay();
    spdlog::info("Reconnecting in {}ms (attempt {}/{})",
                 delay.count(), reconnect_strategy_.attempt_count(), reconnect_strategy_.max_attempts());

    reconnect_timer_.expires_after(delay);
    reconnect_timer_.async_wait([self = shared_from_this(), generation](auto ec) {
        if (!ec && generation == self->generation_) {
            self->on_reconnect_timer();
        }
    });
}

void ConnectionManager::on_reconnect_timer() {
    if (state_ != ConnectionState::Reconnecting) {
        return;  // Released or torn down while waiting
    }

    open_transport();
}

void ConnectionManager::start_heartbeat() {
    awaiting_pong_ = false;
    last_pong_at_ = std::chrono::steady_clock::now();
    arm_heartbeat();
    spdlog::debug("Heartbeat monitoring started");
}

void ConnectionManager::stop_heartbeat() {
    heartbeat_timer_.cancel();
    pong_timer_.cancel();
    awaiting_pong_ = false;
}

void ConnectionManager::arm_heartbeat() {
    heartbeat_timer_.expires_after(config_.heartbeat_interval);
    heartbeat_timer_.async_wait([self = shared_from_this(), generation = generation_](auto ec) {
        if (!ec && generation == self->generation_) {
            self->send_ping();
        }
    });
}

void ConnectionManager::send_ping() {
    if (state_ != ConnectionState::Connected || !transport_) {
        return;
    }

    if (awaiting_pong_) {
        spdlog::warn("ConnectionError: heartbeat timeout, no PONG for previous PING");
        on_connection_lost("heartbeat timeout");
        return;
    }

    transport_->send(std::string(clob::endpoints::PING_FRAME));
    awaiting_pong_ = true;

    const auto generation = generation_;
    pong_timer_.expires_after(config_.heartbeat_timeout);
    pong_timer_.async_wait([self = shared_from_this(), generation](auto ec) {
        if (ec || generation != self->generation_ || !self->awaiting_pong_) {
            return;
        }
        spdlog::warn("ConnectionError: heartbeat timeout, no PONG within {}ms",
                     self->config_.heartbeat_timeout.count());
        self->on_connection_lost("heartbeat timeout");
    });

    arm_heartbeat();
}

void ConnectionManager::on_pong() {
    awaiting_pong_ = false;
    pong_timer_.cancel();
    last_pong_at_ = std::chrono::steady_clock::now();
    spdlog::debug("Heartbeat PONG received");
}

void ConnectionManager::start_linger() {
    if (config_.linger.count() <= 0) {
        close_connection("no subscriptions");
        return;
    }

    spdlog::debug("No subscriptions, closing in {}ms unless reacquired", config_.linger.count());
    linger_pending_ = true;
    const auto epoch = ++linger_epoch_;
    linger_timer_.expires_after(config_.linger);
    linger_timer_.async_wait([self = shared_from_this(), epoch](auto ec) {
        if (ec || !self->linger_pending_ || epoch != self->linger_epoch_) {
            return;
        }
        self->linger_pending_ = false;
        if (self->subscriptions_.empty()) {
            self->close_connection("linger elapsed with no subscriptions");
        }
    });
}

void ConnectionManager::cancel_linger() {
    if (linger_pending_) {
        linger_pending_ = false;
        ++linger_epoch_;
        linger_timer_.cancel();
    }
}

void ConnectionManager::set_state(ConnectionState new_state) {
    if (state_ == new_state) {
        return;
    }

    auto old_state = state_;
    state_ = new_state;
    spdlog::info("Connection state: {} -> {}", network::to_string(old_state), network::to_string(new_state));

    // Listeners may add or remove listeners
    auto listeners = listeners_;
    for (const auto& [id, listener] : listeners) {
        notify(listener, new_state);
    }
}

void ConnectionManager::notify(const StateListener& listener, ConnectionState state) {
    if (!listener) {
        return;
    }
    try {
        listener(state);
    } catch (const std::exception& e) {
        spdlog::error("Connection listener error: {}", e.what());
    }
}

}  // namespace booksync::feed
