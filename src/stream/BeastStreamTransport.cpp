#include "stream/BeastStreamTransport.hpp"
#include <iostream>
#include <stdexcept>
#include <openssl/err.h>
#include <openssl/ssl.h>

using namespace champ;

namespace asio      = boost::asio;
namespace ssl       = asio::ssl;
namespace beast     = boost::beast;
namespace websocket = beast::websocket;

static constexpr auto HANDSHAKE_TIMEOUT = std::chrono::seconds(30);

// ---------------------------------------------------------------------------
// URL parsing
// ---------------------------------------------------------------------------
WsEndpoint WsEndpoint::parse(const std::string& url) {
    WsEndpoint ep;
    std::string rest;
    if (url.compare(0, 6, "wss://") == 0) {
        ep.tls = true;
        rest   = url.substr(6);
    } else if (url.compare(0, 5, "ws://") == 0) {
        ep.tls = false;
        rest   = url.substr(5);
    } else {
        throw std::invalid_argument("unsupported stream url: " + url);
    }

    size_t slash = rest.find('/');
    std::string authority = rest.substr(0, slash);
    ep.target = (slash == std::string::npos) ? "/" : rest.substr(slash);

    size_t colon = authority.rfind(':');
    if (colon != std::string::npos) {
        ep.host = authority.substr(0, colon);
        ep.port = authority.substr(colon + 1);
    } else {
        ep.host = authority;
        ep.port = ep.tls ? "443" : "80";
    }
    if (ep.host.empty() || ep.port.empty())
        throw std::invalid_argument("malformed stream url: " + url);
    return ep;
}

// ---------------------------------------------------------------------------
// Transport
// ---------------------------------------------------------------------------
BeastStreamTransport::BeastStreamTransport(const std::string& url,
                                           std::chrono::seconds ping_interval,
                                           std::chrono::seconds ping_timeout)
    : ep_(WsEndpoint::parse(url)),
      idle_timeout_(ping_interval + ping_timeout) {
    // OS CA bundle (/etc/ssl/certs on Ubuntu).
    ssl_ctx_.set_default_verify_paths();
}

BeastStreamTransport::~BeastStreamTransport() {
    close();
}

template <class Ws>
void BeastStreamTransport::configure(Ws& ws) {
    websocket::stream_base::timeout opt{};
    opt.handshake_timeout = HANDSHAKE_TIMEOUT;
    opt.idle_timeout      = idle_timeout_;
    opt.keep_alive_pings  = true;
    ws.set_option(opt);

    ws.set_option(websocket::stream_base::decorator(
        [](websocket::request_type& req) {
            req.set(beast::http::field::user_agent, "champ-stream");
        }));
}

void BeastStreamTransport::open() {
    tcp::resolver resolver(ioc_);
    auto const results = resolver.resolve(ep_.host, ep_.port);

    // Host header carries the port, as RFC 7230 wants for non-default ports.
    const std::string host_hdr = ep_.host + ":" + ep_.port;

    if (ep_.tls) {
        tls_ws_ = std::make_unique<TlsWs>(ioc_, ssl_ctx_);
        beast::get_lowest_layer(*tls_ws_).connect(results);

        // SNI must be set on the native handle before the TLS handshake.
        if (!SSL_set_tlsext_host_name(tls_ws_->next_layer().native_handle(),
                                      ep_.host.c_str())) {
            beast::error_code ec{static_cast<int>(::ERR_get_error()),
                                 asio::error::get_ssl_category()};
            throw beast::system_error{ec};
        }
        tls_ws_->next_layer().set_verify_mode(ssl::verify_peer);
        tls_ws_->next_layer().handshake(ssl::stream_base::client);

        configure(*tls_ws_);
        tls_ws_->handshake(host_hdr, ep_.target);
    } else {
        plain_ws_ = std::make_unique<PlainWs>(ioc_);
        beast::get_lowest_layer(*plain_ws_).connect(results);

        configure(*plain_ws_);
        plain_ws_->handshake(host_hdr, ep_.target);
    }

    std::cout << "[STREAM] Connected " << (ep_.tls ? "wss://" : "ws://")
              << host_hdr << ep_.target << "\n";
}

template <class Ws>
bool BeastStreamTransport::read_impl(Ws& ws, std::string& out,
                                     std::chrono::milliseconds timeout) {
    if (!read_pending_) {
        buffer_.clear();
        read_done_    = false;
        read_pending_ = true;
        ws.async_read(buffer_, [this](beast::error_code ec, std::size_t) {
            read_ec_      = ec;
            read_done_    = true;
            read_pending_ = false;
            // Idle/ping timers keep the context busy; stop it explicitly.
            ioc_.stop();
        });
    }

    ioc_.restart();
    ioc_.run_for(timeout);

    if (!read_done_) return false;
    read_done_ = false;

    if (read_ec_) throw beast::system_error{read_ec_};

    out = beast::buffers_to_string(buffer_.data());
    buffer_.consume(buffer_.size());
    return true;
}

bool BeastStreamTransport::read(std::string& out, std::chrono::milliseconds timeout) {
    if (tls_ws_)   return read_impl(*tls_ws_, out, timeout);
    if (plain_ws_) return read_impl(*plain_ws_, out, timeout);
    throw std::logic_error("BeastStreamTransport::read before open");
}

void BeastStreamTransport::close() noexcept {
    beast::error_code ec;
    if (tls_ws_) {
        if (!read_pending_ && tls_ws_->is_open())
            tls_ws_->close(websocket::close_code::normal, ec);
        beast::get_lowest_layer(*tls_ws_).socket().close(ec);
    }
    if (plain_ws_) {
        if (!read_pending_ && plain_ws_->is_open())
            plain_ws_->close(websocket::close_code::normal, ec);
        beast::get_lowest_layer(*plain_ws_).socket().close(ec);
    }
}
