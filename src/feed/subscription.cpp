#include "feed/subscription.hpp"
#include <algorithm>
#include <cctype>
#include <spdlog/spdlog.h>
#include <unordered_set>

namespace booksync::feed {

namespace {

bool is_blank(const InstrumentId& id) {
    return std::all_of(id.begin(), id.end(), [](char c) {
        return std::isspace(static_cast<unsigned char>(c)) != 0;
    });
}

}  // namespace

// SubscriptionHandle

SubscriptionHandle::SubscriptionHandle(std::weak_ptr<SubscriptionRegistry> registry,
                                       std::vector<InstrumentId> instruments)
    : registry_(std::move(registry))
    , instruments_(std::move(instruments))
    , active_(true)
{}

SubscriptionHandle::~SubscriptionHandle() {
    release();
}

SubscriptionHandle::SubscriptionHandle(SubscriptionHandle&& other) noexcept
    : registry_(std::move(other.registry_))
    , instruments_(std::move(other.instruments_))
    , active_(other.active_)
{
    other.active_ = false;
    other.instruments_.clear();
}

SubscriptionHandle& SubscriptionHandle::operator=(SubscriptionHandle&& other) noexcept {
    if (this != &other) {
        release();
        registry_ = std::move(other.registry_);
        instruments_ = std::move(other.instruments_);
        active_ = other.active_;
        other.active_ = false;
        other.instruments_.clear();
    }
    return *this;
}

void SubscriptionHandle::release() {
    if (!active_) {
        return;
    }
    active_ = false;
    if (auto registry = registry_.lock()) {
        registry->release(instruments_);
    }
}

bool SubscriptionHandle::active() const noexcept {
    return active_;
}

const std::vector<InstrumentId>& SubscriptionHandle::instruments() const noexcept {
    return instruments_;
}

// SubscriptionRegistry

SubscriptionRegistry::SubscriptionRegistry(
    boost::asio::io_context& ioc,
    const Config::Book& config,
    OrderBookStore& store,
    std::shared_ptr<ConnectionManager> connection,
    std::shared_ptr<BootstrapCoordinator> bootstrap
)
    : ioc_(ioc)
    , config_(config)
    , store_(store)
    , connection_(std::move(connection))
    , bootstrap_(std::move(bootstrap))
{}

SubscriptionHandle SubscriptionRegistry::subscribe(const std::vector<InstrumentId>& instrument_ids) {
    std::vector<InstrumentId> valid;
    std::unordered_set<InstrumentId> seen;
    for (const auto& id : instrument_ids) {
        if (is_blank(id)) {
            spdlog::warn("Ignoring empty instrument id in subscribe");
            continue;
        }
        if (seen.insert(id).second) {
            valid.push_back(id);
        }
    }

    if (valid.empty()) {
        return SubscriptionHandle{};
    }

    std::vector<InstrumentId> added;
    for (const auto& id : valid) {
        if (++ref_counts_[id] == 1) {
            added.push_back(id);
        }
    }

    for (const auto& id : added) {
        // Inside the grace period the old entry is still there: start it over
        bool was_pending = cancel_eviction(id);
        if (!store_.ensure_entry(id)) {
            store_.reset(id);
        }
        spdlog::debug("Instrument {} active{}", id, was_pending ? " (eviction cancelled)" : "");
        bootstrap_->start(id);
    }

    if (!added.empty()) {
        connection_->acquire(added);
    }

    return SubscriptionHandle(weak_from_this(), std::move(valid));
}

void SubscriptionRegistry::release(const std::vector<InstrumentId>& instrument_ids) {
    std::vector<InstrumentId> removed;
    for (const auto& id : instrument_ids) {
        auto it = ref_counts_.find(id);
        if (it == ref_counts_.end()) {
            continue;
        }
        if (--it->second == 0) {
            ref_counts_.erase(it);
            removed.push_back(id);
        }
    }

    if (removed.empty()) {
        return;
    }

    for (const auto& id : removed) {
        bootstrap_->cancel(id);
    }
    connection_->release(removed);
    for (const auto& id : removed) {
        schedule_eviction(id);
    }
}

std::size_t SubscriptionRegistry::ref_count(const InstrumentId& instrument_id) const {
    auto it = ref_counts_.find(instrument_id);
    return it != ref_counts_.end() ? it->second : 0;
}

std::vector<InstrumentId> SubscriptionRegistry::active_instruments() const {
    std::vector<InstrumentId> ids;
    ids.reserve(ref_counts_.size());
    for (const auto& [id, count] : ref_counts_) {
        ids.push_back(id);
    }
    std::sort(ids.begin(), ids.end());
    return ids;
}

bool SubscriptionRegistry::eviction_pending(const InstrumentId& instrument_id) const {
    return evictions_.count(instrument_id) > 0;
}

void SubscriptionRegistry::shutdown() {
    for (auto& [id, eviction] : evictions_) {
        eviction.timer->cancel();
    }
    evictions_.clear();

    for (const auto& [id, count] : ref_counts_) {
        bootstrap_->cancel(id);
        store_.evict(id);
    }
    ref_counts_.clear();
}

void SubscriptionRegistry::schedule_eviction(const InstrumentId& instrument_id) {
    if (config_.eviction_grace.count() <= 0) {
        store_.evict(instrument_id);
        return;
    }

    cancel_eviction(instrument_id);

    const auto epoch = ++next_epoch_;
    auto timer = std::make_unique<boost::asio::steady_timer>(ioc_, config_.eviction_grace);
    timer->async_wait([self = shared_from_this(), instrument_id, epoch](auto ec) {
        if (ec) {
            return;
        }
        auto it = self->evictions_.find(instrument_id);
        if (it == self->evictions_.end() || it->second.epoch != epoch) {
            return;
        }
        self->evictions_.erase(it);
        if (self->ref_counts_.count(instrument_id) == 0) {
            self->store_.evict(instrument_id);
        }
    });
    evictions_[instrument_id] = PendingEviction{std::move(timer), epoch};
}

bool SubscriptionRegistry::cancel_eviction(const InstrumentId& instrument_id) {
    auto it = evictions_.find(instrument_id);
    if (it == evictions_.end()) {
        return false;
    }
    it->second.timer->cancel();
    evictions_.erase(it);
    return true;
}

}  // namespace booksync::feed
