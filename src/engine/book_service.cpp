#include "engine/book_service.hpp"
#include "network/ssl_context.hpp"
#include "network/websocket_client.hpp"
#include <chrono>
#include <spdlog/spdlog.h>

namespace booksync {

namespace {

/// Fill in the Boost.Beast transports for anything the caller left empty
BookService::Collaborators with_defaults(boost::asio::io_context& ioc, const Config& config,
                                         BookService::Collaborators collaborators) {
    if (collaborators.transport_factory && collaborators.snapshot_fetcher) {
        return collaborators;
    }

    auto ssl_ctx = network::create_ssl_context();
    if (!collaborators.transport_factory) {
        collaborators.transport_factory = network::make_websocket_factory(
            ioc, ssl_ctx,
            network::WebSocketEndpoint{config.network.ws_host, config.network.ws_port, config.network.ws_path}
        );
    }
    if (!collaborators.snapshot_fetcher) {
        collaborators.snapshot_fetcher = std::make_shared<clob::RestSnapshotFetcher>(
            ioc, ssl_ctx, config.network.rest_host, config.network.rest_port
        );
    }
    return collaborators;
}

}  // namespace

BookService::BookService(boost::asio::io_context& ioc, Config config, Collaborators collaborators)
    : config_(std::move(config))
    , store_(config_.book)
{
    auto wired = with_defaults(ioc, config_, std::move(collaborators));

    connection_ = std::make_shared<feed::ConnectionManager>(
        ioc, config_.network, store_, std::move(wired.transport_factory)
    );
    bootstrap_ = std::make_shared<feed::BootstrapCoordinator>(
        ioc, config_.book, store_, std::move(wired.snapshot_fetcher)
    );
    subscriptions_ = std::make_shared<feed::SubscriptionRegistry>(
        ioc, config_.book, store_, connection_, bootstrap_
    );
}

BookService::~BookService() {
    teardown();
}

void BookService::init() {
    if (initialized_) {
        return;
    }
    initialized_ = true;
    spdlog::info("BookService started");
    connection_->init();
}

void BookService::teardown() {
    subscriptions_->shutdown();
    bootstrap_->cancel_all();
    connection_->teardown();

    if (initialized_) {
        initialized_ = false;
        spdlog::info("BookService stopped");
    }
}

feed::SubscriptionHandle BookService::subscribe(const std::vector<InstrumentId>& instrument_ids) {
    return subscriptions_->subscribe(instrument_ids);
}

BestPrices BookService::best_prices(const InstrumentId& instrument_id) const {
    return store_.best_prices(instrument_id);
}

DepthView BookService::depth(const InstrumentId& instrument_id, std::optional<std::size_t> max_levels) const {
    return store_.depth(instrument_id, max_levels);
}

std::optional<LastTrade> BookService::last_trade(const InstrumentId& instrument_id) const {
    return store_.last_trade(instrument_id);
}

std::optional<BookMetadata> BookService::metadata(const InstrumentId& instrument_id) const {
    return store_.metadata(instrument_id);
}

bool BookService::is_seeded(const InstrumentId& instrument_id) const {
    return store_.is_seeded(instrument_id);
}

bool BookService::is_stale(const InstrumentId& instrument_id) const {
    return store_.is_stale(instrument_id, std::chrono::steady_clock::now());
}

network::ConnectionState BookService::connection_state() const noexcept {
    return connection_->state();
}

BookService::ListenerId BookService::add_connection_listener(ConnectionListener listener) {
    return connection_->add_state_listener(std::move(listener));
}

void BookService::remove_connection_listener(ListenerId id) {
    connection_->remove_state_listener(id);
}

void BookService::reconnect() {
    connection_->reconnect();
}

void BookService::retry_snapshot(const InstrumentId& instrument_id) {
    if (subscriptions_->ref_count(instrument_id) == 0) {
        spdlog::warn("retry_snapshot for unsubscribed instrument {} ignored", instrument_id);
        return;
    }
    bootstrap_->retry(instrument_id);
}

feed::BootstrapCoordinator::State BookService::bootstrap_state(const InstrumentId& instrument_id) const {
    return bootstrap_->state(instrument_id);
}

std::size_t BookService::ref_count(const InstrumentId& instrument_id) const {
    return subscriptions_->ref_count(instrument_id);
}

std::vector<InstrumentId> BookService::active_instruments() const {
    return subscriptions_->active_instruments();
}

const OrderBookStore& BookService::store() const noexcept {
    return store_;
}

const Config& BookService::config() const noexcept {
    return config_;
}

}  // namespace booksync
