#pragma once

#include <functional>
#include <memory>
#include <string>
#include <string_view>

namespace booksync::network {

/// Callbacks a transport reports through; all run on the owning io_context
struct TransportCallbacks {
    std::function<void()> on_open;
    std::function<void(std::string_view)> on_message;
    /// Unexpected close or error; not called after close()
    std::function<void(std::string_view reason)> on_close;
};

/// One attempt at a message-oriented streaming connection
/// A transport is opened at most once; reconnecting creates a new one.
class Transport {
public:
    virtual ~Transport() = default;

    /// Start connecting; completion is reported through on_open or on_close
    virtual void open() = 0;

    /// Queue a text frame; dropped with a warning if not open
    virtual void send(std::string message) = 0;

    /// Close intentionally; no further callbacks are delivered
    virtual void close() = 0;
};

/// Creates a fresh transport bound to the given callbacks
using TransportFactory =
    std::function<std::shared_ptr<Transport>(TransportCallbacks callbacks)>;

}  // namespace booksync::network
