#include "telemetry/TelemetryServer.hpp"
#include <boost/asio.hpp>
#include <boost/beast.hpp>
#include <iostream>
#include <memory>

using namespace champ;
namespace asio  = boost::asio;
namespace beast = boost::beast;
namespace http  = beast::http;
using tcp = asio::ip::tcp;

namespace {

using Request  = http::request<http::string_body>;
using Response = http::response<http::string_body>;

constexpr auto POLL_SLICE = std::chrono::milliseconds(100);

Response route(const Request& req, const HealthMonitor& monitor) {
    Response res{http::status::ok, req.version()};
    res.set(http::field::server, "champ");
    res.keep_alive(false);

    if (req.method() != http::verb::get) {
        res.result(http::status::method_not_allowed);
        res.set(http::field::content_type, "text/plain");
        res.body() = "GET only\n";
    } else if (req.target() == "/metrics") {
        res.set(http::field::content_type, "text/plain; version=0.0.4");
        res.body() = monitor.to_prometheus();
    } else if (req.target() == "/health" || req.target() == "/") {
        res.set(http::field::content_type, "application/json");
        // Health checks may quote endpoint output verbatim.
        res.body() = monitor.health_check().dump(-1, ' ', false,
                                                 nlohmann::json::error_handler_t::replace);
    } else {
        res.result(http::status::not_found);
        res.set(http::field::content_type, "text/plain");
        res.body() = "not found\n";
    }
    res.prepare_payload();
    return res;
}

// One connection: read a request, answer it, close. The stream deadline
// covers both directions, so a silent or stalled client cannot pin it.
class Session : public std::enable_shared_from_this<Session> {
public:
    Session(tcp::socket socket, const HealthMonitor& monitor, std::chrono::milliseconds timeout)
        : stream_(std::move(socket)), monitor_(monitor), timeout_(timeout) {}

    void start() {
        stream_.expires_after(timeout_);
        http::async_read(stream_, buffer_, req_,
            [self = shared_from_this()](beast::error_code ec, std::size_t) {
                self->on_read(ec);
            });
    }

private:
    void on_read(beast::error_code ec) {
        if (ec == http::error::end_of_stream) return;
        if (ec == beast::error::timeout) {
            std::cerr << "[TELEMETRY] Idle client dropped\n";
            return;
        }
        if (ec) {
            std::cerr << "[TELEMETRY] Dropped request: " << ec.message() << "\n";
            return;
        }

        res_ = route(req_, monitor_);
        stream_.expires_after(timeout_);
        http::async_write(stream_, res_,
            [self = shared_from_this()](beast::error_code wec, std::size_t) {
                self->on_write(wec);
            });
    }

    void on_write(beast::error_code ec) {
        if (ec) {
            std::cerr << "[TELEMETRY] Reply not delivered: " << ec.message() << "\n";
            return;
        }
        stream_.socket().shutdown(tcp::socket::shutdown_send, ec);
        if (ec && ec != beast::errc::not_connected) {
            std::cerr << "[TELEMETRY] Shutdown: " << ec.message() << "\n";
        }
    }

    beast::tcp_stream         stream_;
    beast::flat_buffer        buffer_;
    Request                   req_;
    Response                  res_;
    const HealthMonitor&      monitor_;
    std::chrono::milliseconds timeout_;
};

void accept_next(tcp::acceptor& acceptor, const HealthMonitor& monitor,
                 std::chrono::milliseconds timeout) {
    acceptor.async_accept([&acceptor, &monitor, timeout](beast::error_code ec,
                                                         tcp::socket socket) {
        if (ec == asio::error::operation_aborted) return;
        if (ec) {
            std::cerr << "[TELEMETRY] Accept failed: " << ec.message() << "\n";
        } else {
            std::make_shared<Session>(std::move(socket), monitor, timeout)->start();
        }
        accept_next(acceptor, monitor, timeout);
    });
}

} // namespace

TelemetryServer::TelemetryServer(uint16_t port, const HealthMonitor& monitor,
                                 std::chrono::milliseconds read_timeout)
    : port_(port), monitor_(monitor), read_timeout_(read_timeout) {}

TelemetryServer::~TelemetryServer() {
    stop();
}

void TelemetryServer::start() {
    if (running_.exchange(true)) return;
    worker_ = std::thread([this]() { run(); });
}

void TelemetryServer::stop() {
    running_.store(false);
    if (worker_.joinable()) worker_.join();
}

void TelemetryServer::run() {
    try {
        asio::io_context ioc;
        tcp::endpoint    endpoint{tcp::v4(), port_};
        tcp::acceptor    acceptor(ioc);
        acceptor.open(endpoint.protocol());
        acceptor.set_option(tcp::acceptor::reuse_address(true));
        acceptor.bind(endpoint);
        acceptor.listen();

        std::cout << "[TELEMETRY] Listening on " << port_ << "\n";
        accept_next(acceptor, monitor_, read_timeout_);

        // run_for slices keep stop() responsive. The pending accept keeps
        // the context busy, so it only stops if the acceptor dies.
        while (running_.load() && !ioc.stopped()) ioc.run_for(POLL_SLICE);

        // Open sessions are released with the context's pending handlers.
        beast::error_code ec;
        acceptor.close(ec);
        if (ec) std::cerr << "[TELEMETRY] Close: " << ec.message() << "\n";
    } catch (const std::exception& e) {
        std::cerr << "[TELEMETRY] " << e.what() << "\n";
    }
}
