#pragma once

#include "core/config.hpp"
#include "core/messages.hpp"
#include "engine/reconnect_strategy.hpp"
#include "network/connection_state.hpp"
#include "network/transport.hpp"
#include "orderbook/order_book_store.hpp"
#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string_view>
#include <unordered_set>
#include <vector>

namespace booksync::feed {

/// Owns the single shared market-channel connection
/// Multiplexes the subscription set of every instrument any consumer holds,
/// forwards stream events into the store and drives reconnection and heartbeat.
/// Create with std::make_shared; all calls must come from the io_context thread.
class ConnectionManager : public std::enable_shared_from_this<ConnectionManager> {
public:
    using StateListener = std::function<void(network::ConnectionState)>;
    using ListenerId = std::uint64_t;

    /// @param ioc Event loop every callback and timer runs on
    /// @param config Endpoints, backoff, heartbeat and linger policy
    /// @param store Receives deltas, stream books, trades and tick sizes
    /// @param transport_factory Creates one transport per connection attempt
    ConnectionManager(
        boost::asio::io_context& ioc,
        const Config::Network& config,
        OrderBookStore& store,
        network::TransportFactory transport_factory
    );

    ~ConnectionManager();

    // Non-copyable, non-movable
    ConnectionManager(const ConnectionManager&) = delete;
    ConnectionManager& operator=(const ConnectionManager&) = delete;

    /// Allow connecting; opens at once if ids were acquired beforehand
    void init();

    /// Close the connection, cancel every timer and forget the subscription set
    void teardown();

    /// Add ids to the subscription set, opening the connection if needed
    void acquire(const std::vector<InstrumentId>& instrument_ids);

    /// Remove ids from the subscription set; an empty set closes after the linger period
    void release(const std::vector<InstrumentId>& instrument_ids);

    /// User-initiated reconnect with a fresh backoff budget
    void reconnect();

    [[nodiscard]] network::ConnectionState state() const noexcept;

    /// Register a state listener; it is called immediately with the current state
    ListenerId add_state_listener(StateListener listener);
    void remove_state_listener(ListenerId id);

    /// Current subscription set, sorted
    [[nodiscard]] std::vector<InstrumentId> subscribed() const;
    [[nodiscard]] bool is_subscribed(const InstrumentId& instrument_id) const;

    /// Connected and a PONG arrived within 2.5 heartbeat intervals
    [[nodiscard]] bool is_healthy(Timestamp now) const;

    /// Time of the last PONG on the current connection
    [[nodiscard]] std::optional<Timestamp> last_pong_at() const noexcept;

    /// Reconnect attempts in the current backoff window
    [[nodiscard]] std::size_t reconnect_attempts() const noexcept;

private:
    void open_transport();
    void drop_transport();
    void close_connection(std::string_view reason);

    void on_transport_open(std::uint64_t generation);
    void on_transport_message(std::uint64_t generation, std::string_view frame);
    void on_transport_close(std::uint64_t generation, std::string_view reason);
    void on_connection_lost(std::string_view reason);

    void handle_event(const FeedEvent& event);
    void send_subscription();

    void schedule_reconnect();
    void on_reconnect_timer();

    void start_heartbeat();
    void stop_heartbeat();
    void arm_heartbeat();
    void send_ping();
    void on_pong();

    void start_linger();
    void cancel_linger();

    void set_state(network::ConnectionState new_state);
    void notify(const StateListener& listener, network::ConnectionState state);

    Config::Network config_;
    OrderBookStore& store_;
    network::TransportFactory transport_factory_;

    std::shared_ptr<network::Transport> transport_;
    std::uint64_t generation_{0};
    bool running_{false};

    network::ConnectionState state_{network::ConnectionState::Disconnected};
    std::unordered_set<InstrumentId> subscriptions_;

    ReconnectStrategy reconnect_strategy_;
    boost::asio::steady_timer reconnect_timer_;
    boost::asio::steady_timer heartbeat_timer_;
    boost::asio::steady_timer pong_timer_;
    boost::asio::steady_timer linger_timer_;
    bool linger_pending_{false};
    std::uint64_t linger_epoch_{0};
    bool awaiting_pong_{false};
    std::optional<Timestamp> last_pong_at_;

    std::map<ListenerId, StateListener> listeners_;
    ListenerId next_listener_id_{1};
};

}  // namespace booksync::feed
