#include "clob/snapshot_fetcher.hpp"
#include "clob/endpoints.hpp"
#include "clob/message_parser.hpp"
#include "network/rest_client.hpp"
#include <chrono>
#include <spdlog/spdlog.h>

namespace booksync::clob {

namespace {

class RestSnapshotRequest : public SnapshotRequest {
public:
    explicit RestSnapshotRequest(std::shared_ptr<network::RestClient> client)
        : client_(std::move(client))
    {}

    void cancel() override {
        client_->cancel();
    }

private:
    std::shared_ptr<network::RestClient> client_;
};

}  // namespace

RestSnapshotFetcher::RestSnapshotFetcher(
    boost::asio::io_context& ioc,
    std::shared_ptr<boost::asio::ssl::context> ssl_ctx,
    std::string host,
    std::string port
)
    : ioc_(ioc)
    , ssl_ctx_(std::move(ssl_ctx))
    , host_(std::move(host))
    , port_(std::move(port))
{}

std::shared_ptr<SnapshotRequest> RestSnapshotFetcher::fetch(
    const InstrumentId& instrument_id,
    SnapshotCallback callback
) {
    auto client = std::make_shared<network::RestClient>(ioc_, ssl_ctx_);

    client->get(
        host_,
        port_,
        endpoints::rest_book_path(instrument_id),
        [instrument_id, callback = std::move(callback)](Result<std::string, std::string> response) {
            if (response.is_err()) {
                callback(Result<BookSnapshot, Error>::Err(Error::network(response.error())));
                return;
            }

            auto parsed = MessageParser::parse_book_snapshot(
                response.value(), instrument_id, std::chrono::steady_clock::now()
            );
            if (parsed.is_err()) {
                callback(Result<BookSnapshot, Error>::Err(Error::protocol(parsed.error())));
                return;
            }

            callback(Result<BookSnapshot, Error>::Ok(std::move(parsed).take_value()));
        }
    );

    return std::make_shared<RestSnapshotRequest>(std::move(client));
}

}  // namespace booksync::clob
