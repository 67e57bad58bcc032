#pragma once

#include "core/errors.hpp"
#include "core/status.hpp"
#include "orderbook/book_types.hpp"
#include <boost/asio/io_context.hpp>
#include <boost/asio/ssl/context.hpp>
#include <functional>
#include <memory>
#include <string>

namespace booksync::clob {

/// Handle to one in-flight snapshot fetch
class SnapshotRequest {
public:
    virtual ~SnapshotRequest() = default;

    /// Abort the fetch; its callback will not be invoked afterwards
    virtual void cancel() = 0;
};

/// Completion for a snapshot fetch: the parsed book, or a Network/Protocol error
using SnapshotCallback = std::function<void(Result<BookSnapshot, Error>)>;

/// Source of authoritative full books
class SnapshotFetcher {
public:
    virtual ~SnapshotFetcher() = default;

    /// Start fetching the book for one instrument
    /// The callback runs on the io_context, at most once.
    [[nodiscard]] virtual std::shared_ptr<SnapshotRequest>
    fetch(const InstrumentId& instrument_id, SnapshotCallback callback) = 0;
};

/// Fetches GET /book?token_id=<id> over HTTPS
class RestSnapshotFetcher : public SnapshotFetcher {
public:
    RestSnapshotFetcher(
        boost::asio::io_context& ioc,
        std::shared_ptr<boost::asio::ssl::context> ssl_ctx,
        std::string host,
        std::string port
    );

    [[nodiscard]] std::shared_ptr<SnapshotRequest>
    fetch(const InstrumentId& instrument_id, SnapshotCallback callback) override;

private:
    boost::asio::io_context& ioc_;
    std::shared_ptr<boost::asio::ssl::context> ssl_ctx_;
    std::string host_;
    std::string port_;
};

}  // namespace booksync::clob
