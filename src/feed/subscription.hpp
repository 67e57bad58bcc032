#pragma once

#include "core/config.hpp"
#include "feed/bootstrap_coordinator.hpp"
#include "feed/connection_manager.hpp"
#include "orderbook/order_book_store.hpp"
#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>
#include <cstdint>
#include <memory>
#include <unordered_map>
#include <vector>

namespace booksync::feed {

class SubscriptionRegistry;

/// A consumer's interest in a set of instruments
/// Move-only; releases its references exactly once, on release() or destruction.
class SubscriptionHandle {
public:
    /// An empty handle that holds nothing
    SubscriptionHandle() = default;
    ~SubscriptionHandle();

    SubscriptionHandle(const SubscriptionHandle&) = delete;
    SubscriptionHandle& operator=(const SubscriptionHandle&) = delete;

    SubscriptionHandle(SubscriptionHandle&& other) noexcept;
    SubscriptionHandle& operator=(SubscriptionHandle&& other) noexcept;

    /// Drop this handle's references; idempotent
    void release();

    /// True until released (false for an empty handle)
    [[nodiscard]] bool active() const noexcept;

    /// Validated, deduplicated ids this handle holds
    [[nodiscard]] const std::vector<InstrumentId>& instruments() const noexcept;

private:
    friend class SubscriptionRegistry;

    SubscriptionHandle(std::weak_ptr<SubscriptionRegistry> registry, std::vector<InstrumentId> instruments);

    std::weak_ptr<SubscriptionRegistry> registry_;
    std::vector<InstrumentId> instruments_;
    bool active_{false};
};

/// Reference counts per instrument and the entry lifecycle they drive
/// 0 -> 1 creates or resets the store entry, starts the bootstrap and joins
/// the live set; 1 -> 0 cancels the bootstrap, leaves the live set and
/// evicts the entry after the grace period.
/// Create with std::make_shared; all calls must come from the io_context thread.
class SubscriptionRegistry : public std::enable_shared_from_this<SubscriptionRegistry> {
public:
    SubscriptionRegistry(
        boost::asio::io_context& ioc,
        const Config::Book& config,
        OrderBookStore& store,
        std::shared_ptr<ConnectionManager> connection,
        std::shared_ptr<BootstrapCoordinator> bootstrap
    );

    // Non-copyable, non-movable
    SubscriptionRegistry(const SubscriptionRegistry&) = delete;
    SubscriptionRegistry& operator=(const SubscriptionRegistry&) = delete;

    /// Register interest; empty or whitespace-only ids are dropped with a warning
    /// @return Handle holding one reference per valid distinct id (empty if none)
    [[nodiscard]] SubscriptionHandle subscribe(const std::vector<InstrumentId>& instrument_ids);

    [[nodiscard]] std::size_t ref_count(const InstrumentId& instrument_id) const;

    /// Instruments with at least one reference, sorted
    [[nodiscard]] std::vector<InstrumentId> active_instruments() const;

    [[nodiscard]] bool eviction_pending(const InstrumentId& instrument_id) const;

    /// Forget every reference and pending eviction; outstanding handles become no-ops
    void shutdown();

private:
    friend class SubscriptionHandle;

    struct PendingEviction {
        std::unique_ptr<boost::asio::steady_timer> timer;
        std::uint64_t epoch;
    };

    void release(const std::vector<InstrumentId>& instrument_ids);
    void schedule_eviction(const InstrumentId& instrument_id);
    bool cancel_eviction(const InstrumentId& instrument_id);

    boost::asio::io_context& ioc_;
    Config::Book config_;
    OrderBookStore& store_;
    std::shared_ptr<ConnectionManager> connection_;
    std::shared_ptr<BootstrapCoordinator> bootstrap_;

    std::unordered_map<InstrumentId, std::size_t> ref_counts_;
    std::unordered_map<InstrumentId, PendingEviction> evictions_;
    std::uint64_t next_epoch_{0};
};

}  // namespace booksync::feed
