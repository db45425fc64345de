#pragma once
#include <chrono>
#include <cstdint>
#include <memory>
#include <string>

#include <boost/asio.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/beast.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/beast/websocket.hpp>
#include <boost/beast/websocket/ssl.hpp>

#include "stream/StreamTransport.hpp"

namespace champ {

struct WsEndpoint {
    bool        tls{true};
    std::string host;
    std::string port;
    std::string target;

    // Accepts ws://host[:port]/path and wss://host[:port]/path.
    // Throws std::invalid_argument on anything else.
    static WsEndpoint parse(const std::string& url);
};

// ---------------------------------------------------------------------------
// Boost.Beast websocket client. TLS (wss) or plain TCP (ws), chosen from the
// URL scheme. Reads are async_read driven by io_context::run_for so a quiet
// feed returns control to the caller without cancelling the pending read:
// the same read is resumed on the next call.
// Keepalive: Beast sends a ping after half of `idle_timeout` of silence and
// drops the connection if nothing comes back before the full timeout.
// ---------------------------------------------------------------------------
class BeastStreamTransport : public StreamTransport {
public:
    BeastStreamTransport(const std::string& url,
                         std::chrono::seconds ping_interval,
                         std::chrono::seconds ping_timeout);
    ~BeastStreamTransport() override;

    void open() override;
    bool read(std::string& out, std::chrono::milliseconds timeout) override;
    void close() noexcept override;

private:
    using tcp        = boost::asio::ip::tcp;
    using TlsSocket  = boost::beast::ssl_stream<boost::beast::tcp_stream>;
    using TlsWs      = boost::beast::websocket::stream<TlsSocket>;
    using PlainWs    = boost::beast::websocket::stream<boost::beast::tcp_stream>;

    template <class Ws> void configure(Ws& ws);
    template <class Ws> bool read_impl(Ws& ws, std::string& out,
                                       std::chrono::milliseconds timeout);

    WsEndpoint             ep_;
    std::chrono::seconds   idle_timeout_;

    boost::asio::io_context  ioc_;
    boost::asio::ssl::context ssl_ctx_{boost::asio::ssl::context::tls_client};
    std::unique_ptr<TlsWs>   tls_ws_;
    std::unique_ptr<PlainWs> plain_ws_;

    boost::beast::flat_buffer buffer_;
    boost::beast::error_code  read_ec_;
    bool                      read_pending_{false};
    bool                      read_done_{false};
};

} // namespace champ
