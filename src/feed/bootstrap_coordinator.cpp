#include "feed/bootstrap_coordinator.hpp"
#include <spdlog/spdlog.h>

namespace booksync::feed {

namespace {

// Upper bound for the delay between snapshot attempts
constexpr std::chrono::milliseconds kMaxRetryDelay{30000};

// Retry budget never refills on its own, only through retry()
constexpr std::chrono::hours kNoBudgetReset{24};

}  // namespace

BootstrapCoordinator::Bootstrap::Bootstrap(boost::asio::io_context& ioc, const Config::Book& config)
    : timer(ioc)
    , backoff(config.snapshot_retry_delay, kMaxRetryDelay, 2.0, 0.0,
              config.snapshot_max_retries, kNoBudgetReset)
{}

BootstrapCoordinator::BootstrapCoordinator(
    boost::asio::io_context& ioc,
    const Config::Book& config,
    OrderBookStore& store,
    std::shared_ptr<clob::SnapshotFetcher> fetcher
)
    : ioc_(ioc)
    , config_(config)
    , store_(store)
    , fetcher_(std::move(fetcher))
{}

BootstrapCoordinator::~BootstrapCoordinator() {
    for (auto& [id, bootstrap] : bootstraps_) {
        if (bootstrap->request) {
            bootstrap->request->cancel();
        }
    }
}

void BootstrapCoordinator::start(const InstrumentId& instrument_id) {
    auto& bootstrap = entry(instrument_id);

    switch (bootstrap.state) {
        case State::Fetching:
        case State::RetryScheduled:
            spdlog::debug("Snapshot for {} already in progress", instrument_id);
            return;
        case State::Seeded:
            if (store_.is_seeded(instrument_id)) {
                spdlog::debug("Snapshot for {} already seeded", instrument_id);
                return;
            }
            break;
        case State::Idle:
        case State::Failed:
            break;
    }

    bootstrap.attempts = 0;
    bootstrap.backoff.reset();
    bootstrap.last_error.reset();
    issue_fetch(instrument_id);
}

void BootstrapCoordinator::cancel(const InstrumentId& instrument_id) {
    auto it = bootstraps_.find(instrument_id);
    if (it == bootstraps_.end()) {
        return;
    }

    if (it->second->state == State::Fetching || it->second->state == State::RetryScheduled) {
        spdlog::debug("Cancelling snapshot bootstrap for {}", instrument_id);
    }
    abort(*it->second);
    bootstraps_.erase(it);
}

void BootstrapCoordinator::retry(const InstrumentId& instrument_id) {
    if (!store_.contains(instrument_id)) {
        spdlog::warn("Snapshot retry for untracked instrument {} ignored", instrument_id);
        return;
    }

    auto& bootstrap = entry(instrument_id);
    if (bootstrap.state == State::Fetching) {
        spdlog::debug("Snapshot for {} already in flight", instrument_id);
        return;
    }

    spdlog::info("Retrying snapshot for {}", instrument_id);
    abort(bootstrap);
    bootstrap.attempts = 0;
    bootstrap.backoff.reset();
    bootstrap.last_error.reset();
    issue_fetch(instrument_id);
}

void BootstrapCoordinator::cancel_all() {
    for (auto& [id, bootstrap] : bootstraps_) {
        abort(*bootstrap);
    }
    bootstraps_.clear();
}

BootstrapCoordinator::State BootstrapCoordinator::state(const InstrumentId& instrument_id) const {
    auto it = bootstraps_.find(instrument_id);
    return it != bootstraps_.end() ? it->second->state : State::Idle;
}

std::size_t BootstrapCoordinator::attempts(const InstrumentId& instrument_id) const {
    auto it = bootstraps_.find(instrument_id);
    return it != bootstraps_.end() ? it->second->attempts : 0;
}

std::optional<Error> BootstrapCoordinator::last_error(const InstrumentId& instrument_id) const {
    auto it = bootstraps_.find(instrument_id);
    return it != bootstraps_.end() ? it->second->last_error : std::nullopt;
}

BootstrapCoordinator::Bootstrap& BootstrapCoordinator::entry(const InstrumentId& instrument_id) {
    auto it = bootstraps_.find(instrument_id);
    if (it == bootstraps_.end()) {
        it = bootstraps_.emplace(instrument_id, std::make_unique<Bootstrap>(ioc_, config_)).first;
    }
    return *it->second;
}

bool BootstrapCoordinator::seeded_from_stream(const InstrumentId& instrument_id) const {
    auto metadata = store_.metadata(instrument_id);
    return store_.is_seeded(instrument_id) && metadata && metadata->source == SeedSource::Stream;
}

void BootstrapCoordinator::issue_fetch(const InstrumentId& instrument_id) {
    auto& bootstrap = entry(instrument_id);

    // A stream book already seeded the entry, no REST round trip needed
    if (seeded_from_stream(instrument_id)) {
        bootstrap.state = State::Seeded;
        return;
    }

    const auto generation = ++next_generation_;
    bootstrap.generation = generation;
    bootstrap.state = State::Fetching;
    ++bootstrap.attempts;

    spdlog::debug("Fetching snapshot for {} (attempt {})", instrument_id, bootstrap.attempts);

    bootstrap.timer.expires_after(config_.snapshot_timeout);
    bootstrap.timer.async_wait([self = shared_from_this(), instrument_id, generation](auto ec) {
        if (!ec) {
            self->on_timeout(instrument_id, generation);
        }
    });

    std::weak_ptr<BootstrapCoordinator> weak = weak_from_this();
    auto request = fetcher_->fetch(
        instrument_id,
        [weak, instrument_id, generation](Result<BookSnapshot, Error> result) {
            if (auto self = weak.lock()) {
                self->on_fetch_complete(instrument_id, generation, std::move(result));
            }
        }
    );

    // The fetcher may have completed synchronously and moved us on
    auto it = bootstraps_.find(instrument_id);
    if (it != bootstraps_.end() && it->second->generation == generation &&
        it->second->state == State::Fetching) {
        it->second->request = std::move(request);
    }
}

void BootstrapCoordinator::on_fetch_complete(
    const InstrumentId& instrument_id,
    std::uint64_t generation,
    Result<BookSnapshot, Error> result
) {
    auto it = bootstraps_.find(instrument_id);
    if (it == bootstraps_.end() || it->second->generation != generation ||
        it->second->state != State::Fetching) {
        spdlog::debug("Ignoring late snapshot response for {}", instrument_id);
        return;
    }

    auto& bootstrap = *it->second;
    bootstrap.timer.cancel();
    bootstrap.request.reset();

    if (result.is_err()) {
        on_failure(instrument_id, result.error());
        return;
    }

    if (seeded_from_stream(instrument_id)) {
        spdlog::info("Stream book for {} is newer, discarding REST snapshot", instrument_id);
        bootstrap.state = State::Seeded;
        return;
    }

    if (!store_.seed_from_snapshot(result.value(), SeedSource::Rest)) {
        // Entry evicted while the request was in flight
        bootstraps_.erase(it);
        return;
    }

    bootstrap.state = State::Seeded;
    bootstrap.last_error.reset();
}

void BootstrapCoordinator::on_timeout(const InstrumentId& instrument_id, std::uint64_t generation) {
    auto it = bootstraps_.find(instrument_id);
    if (it == bootstraps_.end() || it->second->generation != generation ||
        it->second->state != State::Fetching) {
        return;
    }

    if (it->second->request) {
        it->second->request->cancel();
        it->second->request.reset();
    }

    on_failure(instrument_id, Error::network(
        "snapshot timed out after " + std::to_string(config_.snapshot_timeout.count()) + "ms"
    ));
}

void BootstrapCoordinator::on_failure(const InstrumentId& instrument_id, Error error) {
    auto& bootstrap = entry(instrument_id);

    spdlog::warn("{} while fetching snapshot for {} (attempt {}/{})",
                 error.describe(), instrument_id, bootstrap.attempts, config_.snapshot_max_retries + 1);
    bootstrap.last_error = std::move(error);

    if (config_.snapshot_max_retries == 0 || bootstrap.backoff.exhausted()) {
        bootstrap.state = State::Failed;
        spdlog::error("Snapshot for {} failed after {} attempts, book stays unseeded until retried",
                      instrument_id, bootstrap.attempts);
        return;
    }

    const auto delay = bootstrap.backoff.next_delay();
    const auto generation = ++next_generation_;
    bootstrap.generation = generation;
    bootstrap.state = State::RetryScheduled;

    spdlog::info("Retrying snapshot for {} in {}ms", instrument_id, delay.count());

    bootstrap.timer.expires_after(delay);
    bootstrap.timer.async_wait([self = shared_from_this(), instrument_id, generation](auto ec) {
        if (ec) {
            return;
        }
        auto it = self->bootstraps_.find(instrument_id);
        if (it != self->bootstraps_.end() && it->second->generation == generation &&
            it->second->state == State::RetryScheduled) {
            self->issue_fetch(instrument_id);
        }
    });
}

void BootstrapCoordinator::abort(Bootstrap& bootstrap) {
    bootstrap.generation = ++next_generation_;
    bootstrap.timer.cancel();
    if (bootstrap.request) {
        bootstrap.request->cancel();
        bootstrap.request.reset();
    }
    bootstrap.state = State::Idle;
}

}  // namespace booksync::feed
