#include "server/http_server.h"

#include <boost/asio.hpp>
#include <boost/beast.hpp>

#include <chrono>
#include <exception>
#include <memory>
#include <stdexcept>
#include <thread>
#include <utility>

#include "common/logging.h"

namespace server {
namespace asio = boost::asio;
namespace beast = boost::beast;
namespace http = beast::http;
using tcp = asio::ip::tcp;

namespace {
constexpr auto kAcceptPollInterval = std::chrono::milliseconds(50);
// Exchange calls made while handling one alert are each bounded by their own
// timeouts; this covers them with margin.
constexpr auto kHandlerAllowance = std::chrono::seconds(30);
constexpr const char* kServerName = "bybit-webhook-trader";

// Runs the connection's pending operation for at most `timeout`. On expiry the
// socket is closed and the aborted handler drained before returning false.
bool completeWithin(asio::io_context& ioc, tcp::socket& socket, const bool& done,
                    std::chrono::milliseconds timeout) {
    ioc.restart();
    ioc.run_for(timeout);
    if (done) {
        return true;
    }
    beast::error_code ignored;
    socket.close(ignored);
    ioc.restart();
    ioc.run();
    return false;
}
}  // namespace

struct HttpServer::Connection {
    asio::io_context ioc;
    tcp::socket socket{ioc};
};

HttpServer::HttpServer(std::string address,
                       std::uint16_t port,
                       const WebhookHandler& handler,
                       std::chrono::milliseconds ioTimeout)
    : address_(std::move(address)), port_(port), handler_(handler), ioTimeout_(ioTimeout) {
    if (ioTimeout_ <= std::chrono::milliseconds::zero()) {
        throw std::invalid_argument("HttpServer I/O timeout must be positive");
    }
}

void HttpServer::stop() {
    stopRequested_.store(true);
}

void HttpServer::run() {
    if (running_.exchange(true)) {
        return;
    }
    stopRequested_.store(false);

    asio::io_context ioc;
    tcp::acceptor acceptor(ioc);
    const tcp::endpoint endpoint(asio::ip::make_address(address_), port_);
    acceptor.open(endpoint.protocol());
    acceptor.set_option(tcp::acceptor::reuse_address(true));
    acceptor.bind(endpoint);
    acceptor.listen();
    acceptor.non_blocking(true);

    LOG_INFO("HTTP server listening on " + address_ + ":" + std::to_string(port_));

    auto pending = std::make_unique<Connection>();
    while (!stopRequested_.load()) {
        beast::error_code ec;
        acceptor.accept(pending->socket, ec);

        if (ec == asio::error::would_block || ec == asio::error::try_again) {
            std::this_thread::sleep_for(kAcceptPollInterval);
            continue;
        }
        if (ec) {
            LOG_WARN("Accept failed: " + ec.message());
            continue;
        }

        ++activeConnections_;
        std::thread([this, connection = std::move(pending)]() mutable {
            serveConnection(*connection);
            connection.reset();
            --activeConnections_;
        }).detach();
        pending = std::make_unique<Connection>();
    }

    beast::error_code ignored;
    acceptor.close(ignored);

    const auto drainDeadline = std::chrono::steady_clock::now() + 2 * ioTimeout_ + kHandlerAllowance;
    while (activeConnections_.load() > 0) {
        if (std::chrono::steady_clock::now() >= drainDeadline) {
            LOG_ERROR(std::to_string(activeConnections_.load()) +
                      " connection(s) still active at shutdown; no longer waiting");
            break;
        }
        std::this_thread::sleep_for(kAcceptPollInterval);
    }
    running_.store(false);
    LOG_INFO("HTTP server stopped");
}

void HttpServer::serveConnection(Connection& connection) const {
    tcp::socket& socket = connection.socket;
    try {
        beast::flat_buffer buffer;
        http::request_parser<http::string_body> parser;
        parser.body_limit(kBodyLimitBytes);

        beast::error_code ec;
        bool done = false;
        http::async_read(socket, buffer, parser, [&](beast::error_code readEc, std::size_t) {
            ec = readEc;
            done = true;
        });
        if (!completeWithin(connection.ioc, socket, done, ioTimeout_)) {
            LOG_WARN("Closed HTTP connection: no complete request within " +
                     std::to_string(ioTimeout_.count()) + " ms");
            return;
        }
        if (ec) {
            throw beast::system_error(ec);
        }
        const auto& req = parser.get();

        InboundRequest inbound;
        const auto method = req.method_string();
        const auto target = req.target();
        inbound.method.assign(method.data(), method.size());
        inbound.target.assign(target.data(), target.size());
        inbound.body = req.body();

        const HttpReply reply = handler_.handle(inbound);

        http::response<http::string_body> res;
        res.version(req.version());
        res.result(static_cast<unsigned>(reply.status));
        res.set(http::field::server, kServerName);
        res.set(http::field::content_type, reply.contentType);
        res.keep_alive(false);
        if (req.method() != http::verb::head) {
            res.body() = reply.body;
        }
        res.prepare_payload();

        done = false;
        http::async_write(socket, res, [&](beast::error_code writeEc, std::size_t) {
            ec = writeEc;
            done = true;
        });
        if (!completeWithin(connection.ioc, socket, done, ioTimeout_)) {
            LOG_WARN("Closed HTTP connection: reply not written within " +
                     std::to_string(ioTimeout_.count()) + " ms");
            return;
        }
        if (ec) {
            throw beast::system_error(ec);
        }

        socket.shutdown(tcp::socket::shutdown_send, ec);
    } catch (const std::exception& ex) {
        LOG_WARN(std::string("Dropped HTTP connection: ") + ex.what());
    }
}

}  // namespace server
