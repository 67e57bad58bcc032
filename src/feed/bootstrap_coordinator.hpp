#pragma once

#include "clob/snapshot_fetcher.hpp"
#include "core/config.hpp"
#include "core/errors.hpp"
#include "engine/reconnect_strategy.hpp"
#include "orderbook/order_book_store.hpp"
#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>
#include <cstdint>
#include <memory>
#include <optional>
#include <string_view>
#include <unordered_map>

namespace booksync::feed {

/// Per-instrument snapshot bootstrap
/// Fetches the REST book with a timeout, retries with backoff and seeds the
/// store, unless a newer stream book got there first.
/// Create with std::make_shared; all calls must come from the io_context thread.
class BootstrapCoordinator : public std::enable_shared_from_this<BootstrapCoordinator> {
public:
    enum class State {
        Idle,            // Nothing in flight, never seeded
        Fetching,        // Request outstanding
        RetryScheduled,  // Waiting out the backoff before the next attempt
        Seeded,          // Store entry seeded (REST or stream)
        Failed           // Retries exhausted; waits for retry()
    };

    BootstrapCoordinator(
        boost::asio::io_context& ioc,
        const Config::Book& config,
        OrderBookStore& store,
        std::shared_ptr<clob::SnapshotFetcher> fetcher
    );

    ~BootstrapCoordinator();

    // Non-copyable, non-movable
    BootstrapCoordinator(const BootstrapCoordinator&) = delete;
    BootstrapCoordinator& operator=(const BootstrapCoordinator&) = delete;

    /// Begin bootstrapping; reuses an in-flight fetch or an already seeded entry
    void start(const InstrumentId& instrument_id);

    /// Abort the fetch and any scheduled retry; late responses are ignored
    void cancel(const InstrumentId& instrument_id);

    /// Fetch again with a fresh retry budget (no-op while a fetch is in flight)
    void retry(const InstrumentId& instrument_id);

    /// Cancel every bootstrap
    void cancel_all();

    [[nodiscard]] State state(const InstrumentId& instrument_id) const;

    /// Fetch attempts made for the current bootstrap
    [[nodiscard]] std::size_t attempts(const InstrumentId& instrument_id) const;

    [[nodiscard]] std::optional<Error> last_error(const InstrumentId& instrument_id) const;

private:
    struct Bootstrap {
        Bootstrap(boost::asio::io_context& ioc, const Config::Book& config);

        State state{State::Idle};
        std::uint64_t generation{0};
        std::size_t attempts{0};
        std::shared_ptr<clob::SnapshotRequest> request;
        boost::asio::steady_timer timer;  // fetch timeout, then retry delay
        ReconnectStrategy backoff;
        std::optional<Error> last_error;
    };

    Bootstrap& entry(const InstrumentId& instrument_id);
    [[nodiscard]] bool seeded_from_stream(const InstrumentId& instrument_id) const;

    void issue_fetch(const InstrumentId& instrument_id);
    void on_fetch_complete(const InstrumentId& instrument_id, std::uint64_t generation,
                           Result<BookSnapshot, Error> result);
    void on_timeout(const InstrumentId& instrument_id, std::uint64_t generation);
    void on_failure(const InstrumentId& instrument_id, Error error);
    void abort(Bootstrap& bootstrap);

    boost::asio::io_context& ioc_;
    Config::Book config_;
    OrderBookStore& store_;
    std::shared_ptr<clob::SnapshotFetcher> fetcher_;

    std::unordered_map<InstrumentId, std::unique_ptr<Bootstrap>> bootstraps_;
    std::uint64_t next_generation_{0};
};

/// Convert State to string for logging
[[nodiscard]] constexpr std::string_view to_string(BootstrapCoordinator::State state) noexcept {
    switch (state) {
        case BootstrapCoordinator::State::Idle:           return "idle";
        case BootstrapCoordinator::State::Fetching:       return "fetching";
        case BootstrapCoordinator::State::RetryScheduled: return "retry_scheduled";
        case BootstrapCoordinator::State::Seeded:         return "seeded";
        case BootstrapCoordinator::State::Failed:         return "failed";
    }
    return "unknown";
}

}  // namespace booksync::feed
