#include "server/http_server.h"

#include <boost/asio.hpp>

#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <exception>
#include <future>
#include <iostream>
#include <memory>
#include <string>
#include <thread>

#include "support/fakes.h"

namespace {

namespace asio = boost::asio;
using tcp = asio::ip::tcp;

using test_support::Expect;
using test_support::RecordingSink;
using test_support::ScriptedTransport;

constexpr auto kIoTimeout = std::chrono::milliseconds(300);
constexpr auto kShutdownBudget = std::chrono::seconds(5);

std::uint16_t UnusedLoopbackPort() {
    asio::io_context ioc;
    tcp::acceptor reservation(ioc, tcp::endpoint(asio::ip::make_address("127.0.0.1"), 0));
    return reservation.local_endpoint().port();
}

// Only liveness routes are exercised, so the exchange is never reached.
struct Service {
    RecordingSink sink;
    ScriptedTransport exchangeStub{[](const exchange::HttpRequest&) -> exchange::HttpResponse {
        return {503, "unexpected exchange call"};
    }};
    market_data::BybitMarketClient marketClient{"https://api.example.com", "SOLUSDT.P", "key", "secret",
                                                exchangeStub.transport(), sink};
    trading::PositionSizer sizer{trading::SizingParameters{3.0, 0.0035}};
    trading::DuplicateSuppressor suppressor;
    trading::OrderExecutor executor{"https://api.example.com", "key", "secret", exchangeStub.transport()};
    server::WebhookHandler handler{marketClient, sizer, suppressor, executor, sink};

    std::uint16_t port = UnusedLoopbackPort();
    server::HttpServer httpServer{"127.0.0.1", port, handler, kIoTimeout};
};

bool Connect(asio::io_context& ioc, tcp::socket& socket, std::uint16_t port) {
    const tcp::endpoint endpoint(asio::ip::make_address("127.0.0.1"), port);
    for (int attempt = 0; attempt < 100; ++attempt) {
        boost::system::error_code ec;
        socket.connect(endpoint, ec);
        if (!ec) {
            return true;
        }
        socket = tcp::socket(ioc);
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
    }
    return false;
}

bool TestPingOverSocket(std::uint16_t port) {
    asio::io_context ioc;
    tcp::socket socket(ioc);
    if (!Expect(Connect(ioc, socket, port), "Server never accepted a connection")) {
        return false;
    }

    const std::string request = "GET /ping HTTP/1.1\r\nHost: localhost\r\n\r\n";
    asio::write(socket, asio::buffer(request));

    std::string response;
    boost::system::error_code ec;
    asio::read(socket, asio::dynamic_buffer(response), ec);

    bool ok = Expect(ec == asio::error::eof, "Server should close after one response: " + ec.message());
    ok &= Expect(response.rfind("HTTP/1.1 200", 0) == 0, "Unexpected status line: " + response);
    ok &= Expect(response.find("\"status\":\"alive\"") != std::string::npos, "Ping body missing");
    return ok;
}

bool TestIdleClientIsDisconnected(std::uint16_t port) {
    asio::io_context ioc;
    tcp::socket socket(ioc);
    if (!Expect(Connect(ioc, socket, port), "Server never accepted a connection")) {
        return false;
    }

    const auto started = std::chrono::steady_clock::now();
    std::string response;
    boost::system::error_code ec;
    asio::read(socket, asio::dynamic_buffer(response), ec);
    const auto waited = std::chrono::steady_clock::now() - started;

    bool ok = Expect(static_cast<bool>(ec), "A silent client should be disconnected");
    ok &= Expect(response.empty(), "A silent client should get no response");
    ok &= Expect(waited < kShutdownBudget, "Silent client held the connection past the I/O timeout");
    return ok;
}

}  // namespace

int main() {
    common::Logger::instance().setMinimumLevel(common::LogLevel::Error);

    auto service = std::make_unique<Service>();
    std::promise<void> stopped;
    auto stoppedFuture = stopped.get_future();
    std::thread serverThread([&]() {
        try {
            service->httpServer.run();
        } catch (const std::exception& ex) {
            std::cerr << "Server failed: " << ex.what() << std::endl;
        }
        stopped.set_value();
    });

    bool ok = TestPingOverSocket(service->port);
    ok = ok && TestIdleClientIsDisconnected(service->port);

    // A connection that never sends anything must not keep run() alive.
    asio::io_context ioc;
    tcp::socket idle(ioc);
    ok = ok && Expect(Connect(ioc, idle, service->port), "Idle connection was refused");

    service->httpServer.stop();
    if (stoppedFuture.wait_for(kShutdownBudget) != std::future_status::ready) {
        std::cerr << "run() did not return after stop() with an idle client connected" << std::endl;
        std::_Exit(1);
    }
    serverThread.join();

    return ok ? 0 : 1;
}
