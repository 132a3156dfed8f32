#pragma once

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>

#include "server/webhook_handler.h"

namespace server {

// Minimal HTTP/1.1 front end. The accept loop polls a non-blocking acceptor
// so stop() takes effect within one poll interval; every accepted connection
// is served to completion on its own thread, so alerts are handled
// concurrently. One request per connection. Reading the request and writing
// the reply are each bounded by the I/O timeout; a peer that stalls is
// disconnected.
class HttpServer {
public:
    static constexpr std::size_t kBodyLimitBytes = 64 * 1024;
    static constexpr std::chrono::milliseconds kDefaultIoTimeout{10000};

    HttpServer(std::string address,
               std::uint16_t port,
               const WebhookHandler& handler,
               std::chrono::milliseconds ioTimeout = kDefaultIoTimeout);

    HttpServer(const HttpServer&) = delete;
    HttpServer& operator=(const HttpServer&) = delete;

    // Blocks until stop() is called and in-flight connections have finished.
    void run();
    void stop();

private:
    struct Connection;

    void serveConnection(Connection& connection) const;

    std::string address_;
    std::uint16_t port_;
    const WebhookHandler& handler_;
    std::chrono::milliseconds ioTimeout_;

    std::atomic<bool> running_{false};
    std::atomic<bool> stopRequested_{false};
    mutable std::atomic<int> activeConnections_{0};
};

}  // namespace server
