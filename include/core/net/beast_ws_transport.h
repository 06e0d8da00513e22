/**
 * @file beast_ws_transport.h
 * @brief Boost.Beast implementation of WsTransport (TLS with SNI, or plain TCP).
 */

#pragma once

#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <string>

#include <boost/beast/core.hpp>
#include <boost/beast/websocket.hpp>
#include <boost/beast/websocket/ssl.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/connect.hpp>
#include <boost/asio/ssl/stream.hpp>

#include "core/net/ws_transport.h"

namespace dhanstream::netws {

namespace beast = boost::beast;
namespace websocket = beast::websocket;
namespace net = boost::asio;
namespace ssl = boost::asio::ssl;
using tcp = boost::asio::ip::tcp;

class BeastWsTransport : public WsTransport {
public:
    BeastWsTransport();
    ~BeastWsTransport() override;

    // Connect to ws url: e.g. wss://api-feed.dhan.co?version=2&...
    ConnectResult connect(const std::string& ws_url, std::chrono::milliseconds timeout) override;
    bool send_text(const std::string& payload) override;
    ReadResult read() override;
    void close(uint16_t code, const std::string& reason) override;
    void abort() override;
    bool is_connected() const override { return connected_.load(std::memory_order_acquire); }

    static void parse_ws_url(const std::string& url, std::string& host, std::string& port,
                             std::string& target, bool& tls);

private:
    bool resolve_with_deadline(std::chrono::steady_clock::time_point deadline,
                               tcp::resolver::results_type& results, ConnectResult& out);
    bool handshake_with_deadline(const tcp::resolver::results_type& results,
                                 std::chrono::steady_clock::time_point deadline, ConnectResult& out);
    void cancel_lowest_layer_locked();
    void reset_streams();

    std::atomic<bool> connected_{false};
    std::atomic<bool> aborted_{false};

    std::unique_ptr<net::io_context> ioc_;
    std::unique_ptr<ssl::context> ssl_ctx_;
    std::unique_ptr<websocket::stream<ssl::stream<tcp::socket>>> wss_;
    std::unique_ptr<websocket::stream<tcp::socket>> ws_;
    bool use_tls_{true};
    std::string host_;
    std::string port_;
    std::string target_;

    std::mutex stream_mutex_;   // guards stream pointers against abort()
    std::mutex tx_mutex_;       // serializes writes
    beast::flat_buffer buffer_;
    websocket::response_type upgrade_response_;
};

} // namespace dhanstream::netws
