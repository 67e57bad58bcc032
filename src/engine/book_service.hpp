#pragma once

#include "clob/snapshot_fetcher.hpp"
#include "core/config.hpp"
#include "feed/bootstrap_coordinator.hpp"
#include "feed/connection_manager.hpp"
#include "feed/subscription.hpp"
#include "network/transport.hpp"
#include "orderbook/order_book_store.hpp"
#include <boost/asio/io_context.hpp>
#include <memory>
#include <optional>
#include <vector>

namespace booksync {

/// Order book synchronization service
/// Wires the store, the shared connection, snapshot bootstrap and
/// subscription bookkeeping on one io_context, and exposes the consumer contract.
class BookService {
public:
    /// Replaceable network collaborators; empty members get the production ones
    struct Collaborators {
        network::TransportFactory transport_factory;
        std::shared_ptr<clob::SnapshotFetcher> snapshot_fetcher;
    };

    using ConnectionListener = feed::ConnectionManager::StateListener;
    using ListenerId = feed::ConnectionManager::ListenerId;

    /// Create a book service
    /// @param ioc Event loop all components run on
    /// @param config Application configuration
    /// @param collaborators Transport factory and snapshot fetcher overrides
    BookService(boost::asio::io_context& ioc, Config config, Collaborators collaborators = {});

    ~BookService();

    // Non-copyable, non-movable
    BookService(const BookService&) = delete;
    BookService& operator=(const BookService&) = delete;

    /// Allow connecting; idempotent
    void init();

    /// Drop every subscription, close the connection and cancel all timers; idempotent
    void teardown();

    /// Subscribe to instruments; keep the handle for as long as data is needed
    [[nodiscard]] feed::SubscriptionHandle subscribe(const std::vector<InstrumentId>& instrument_ids);

    [[nodiscard]] BestPrices best_prices(const InstrumentId& instrument_id) const;
    [[nodiscard]] DepthView depth(const InstrumentId& instrument_id,
                                  std::optional<std::size_t> max_levels = std::nullopt) const;
    [[nodiscard]] std::optional<LastTrade> last_trade(const InstrumentId& instrument_id) const;
    [[nodiscard]] std::optional<BookMetadata> metadata(const InstrumentId& instrument_id) const;
    [[nodiscard]] bool is_seeded(const InstrumentId& instrument_id) const;
    [[nodiscard]] bool is_stale(const InstrumentId& instrument_id) const;

    [[nodiscard]] network::ConnectionState connection_state() const noexcept;
    ListenerId add_connection_listener(ConnectionListener listener);
    void remove_connection_listener(ListenerId id);

    /// User-initiated reconnect of the shared connection
    void reconnect();

    /// Fetch a fresh snapshot for a subscribed instrument
    void retry_snapshot(const InstrumentId& instrument_id);

    [[nodiscard]] feed::BootstrapCoordinator::State bootstrap_state(const InstrumentId& instrument_id) const;
    [[nodiscard]] std::size_t ref_count(const InstrumentId& instrument_id) const;
    [[nodiscard]] std::vector<InstrumentId> active_instruments() const;

    [[nodiscard]] const OrderBookStore& store() const noexcept;
    [[nodiscard]] const Config& config() const noexcept;

private:
    Config config_;
    OrderBookStore store_;
    std::shared_ptr<feed::ConnectionManager> connection_;
    std::shared_ptr<feed::BootstrapCoordinator> bootstrap_;
    std::shared_ptr<feed::SubscriptionRegistry> subscriptions_;
    bool initialized_{false};
};

}  // namespace booksync
