/**
 * @file beast_ws_transport.cpp
 */

#include "core/net/beast_ws_transport.h"

#include <algorithm>
#include <condition_variable>
#include <optional>
#include <thread>

#include <fmt/format.h>

#include <openssl/err.h>
#include <openssl/ssl.h>
#include <spdlog/spdlog.h>

#include "utils/string_utils.h"

namespace dhanstream::netws {

BeastWsTransport::BeastWsTransport() {}
BeastWsTransport::~BeastWsTransport() {
    abort();
    reset_streams();
}

void BeastWsTransport::parse_ws_url(const std::string& url, std::string& host, std::string& port,
                                    std::string& target, bool& tls) {
    tls = true; host.clear(); port = "443"; target = "/";
    std::string scheme = "wss";
    auto pos = url.find("://");
    std::string rest = url;
    if (pos != std::string::npos) { scheme = url.substr(0, pos); rest = url.substr(pos + 3); }
    tls = (scheme == "wss");
    // Feed urls put the query straight after the host ("host?version=2&...")
    auto cut = rest.find_first_of("/?");
    std::string hostport = (cut == std::string::npos) ? rest : rest.substr(0, cut);
    if (cut != std::string::npos) {
        target = rest.substr(cut);
        if (target.front() == '?') target.insert(target.begin(), '/');
    }
    auto colon = hostport.find(':');
    if (colon == std::string::npos) { host = hostport; port = tls ? "443" : "80"; }
    else { host = hostport.substr(0, colon); port = hostport.substr(colon + 1); }
}

void BeastWsTransport::cancel_lowest_layer_locked() {
    beast::error_code ec;
    if (wss_) {
        beast::get_lowest_layer(*wss_).cancel(ec);
        beast::get_lowest_layer(*wss_).close(ec);
    }
    if (ws_) {
        beast::get_lowest_layer(*ws_).cancel(ec);
        beast::get_lowest_layer(*ws_).close(ec);
    }
}

void BeastWsTransport::reset_streams() {
    std::lock_guard<std::mutex> lk(stream_mutex_);
    wss_.reset();
    ws_.reset();
    ssl_ctx_.reset();
    ioc_.reset();
    buffer_.consume(buffer_.size());
}

ConnectResult BeastWsTransport::connect(const std::string& ws_url, std::chrono::milliseconds timeout) {
    ConnectResult out;
    connected_.store(false, std::memory_order_release);
    reset_streams();
    aborted_.store(false, std::memory_order_release);

    parse_ws_url(ws_url, host_, port_, target_, use_tls_);
    spdlog::info("[WS] connect attempt url={} host={} port={} tls={}",
                 utils::redact_url(ws_url), host_, port_, (use_tls_ ? "yes" : "no"));

    const auto deadline = std::chrono::steady_clock::now() + timeout;
    tcp::resolver::results_type results;
    if (!resolve_with_deadline(deadline, results, out)) {
        spdlog::error("[WS] connect failed (host={}): {}", host_, out.error);
        return out;
    }

    {
        std::lock_guard<std::mutex> lk(stream_mutex_);
        ioc_ = std::make_unique<net::io_context>();
        if (use_tls_) {
            ssl_ctx_ = std::make_unique<ssl::context>(ssl::context::tls_client);
            ssl_ctx_->set_default_verify_paths();
            ssl_ctx_->set_verify_mode(ssl::verify_peer);
            wss_ = std::make_unique<websocket::stream<ssl::stream<tcp::socket>>>(*ioc_, *ssl_ctx_);
        } else {
            ws_ = std::make_unique<websocket::stream<tcp::socket>>(*ioc_);
        }
    }

    if (!handshake_with_deadline(results, deadline, out)) {
        std::lock_guard<std::mutex> lk(stream_mutex_);
        cancel_lowest_layer_locked();
        spdlog::error("[WS] connect failed (host={}, tls={}): {}", host_, use_tls_, out.error);
        return out;
    }
    if (aborted_.load(std::memory_order_acquire)) {
        out.error = "aborted";
        return out;
    }
    connected_.store(true, std::memory_order_release);
    out.connected = true;
    spdlog::info("[WS] connected host={} tls={}", host_, (use_tls_ ? "yes" : "no"));
    return out;
}

namespace {

struct ResolveState {
    std::mutex mutex;
    std::condition_variable cv;
    bool done{false};
    tcp::resolver::results_type results;
    std::string error;
};

} // namespace

bool BeastWsTransport::resolve_with_deadline(std::chrono::steady_clock::time_point deadline,
                                             tcp::resolver::results_type& results, ConnectResult& out) {
    // getaddrinfo cannot be cancelled, so the lookup runs on a detached thread that
    // owns its state. A lookup that outlives the deadline is abandoned.
    auto state = std::make_shared<ResolveState>();
    std::thread([state, host = host_, port = port_]() {
        net::io_context rio;
        tcp::resolver resolver(rio);
        beast::error_code ec;
        auto found = resolver.resolve(host, port, ec);
        std::lock_guard<std::mutex> lk(state->mutex);
        state->results = std::move(found);
        if (ec) state->error = ec.message();
        state->done = true;
        state->cv.notify_all();
    }).detach();

    std::unique_lock<std::mutex> lk(state->mutex);
    while (!state->done) {
        if (aborted_.load(std::memory_order_acquire)) {
            out.error = "aborted";
            return false;
        }
        const auto now = std::chrono::steady_clock::now();
        if (now >= deadline) {
            out.error = "connect timeout while resolving " + host_;
            spdlog::warn("[WS] {}", out.error);
            return false;
        }
        state->cv.wait_for(lk, std::min<std::chrono::steady_clock::duration>(
                                   deadline - now, std::chrono::milliseconds(50)));
    }
    if (!state->error.empty()) {
        out.error = "resolve " + host_ + ": " + state->error;
        return false;
    }
    results = state->results;
    return true;
}

bool BeastWsTransport::handshake_with_deadline(const tcp::resolver::results_type& results,
                                               std::chrono::steady_clock::time_point deadline,
                                               ConnectResult& out) {
    // TCP connect, TLS and the upgrade run as one async chain on ioc_; the loop below
    // drives it until it finishes, the deadline passes or abort() is called.
    std::optional<beast::error_code> outcome;
    auto finish = [&outcome](beast::error_code ec) {
        if (!outcome) outcome = ec;
    };
    auto configure = [](auto& stream) {
        stream.set_option(websocket::stream_base::timeout::suggested(beast::role_type::client));
        stream.set_option(websocket::stream_base::decorator([](websocket::request_type& req) {
            req.set(beast::http::field::user_agent, std::string("dhanstream/1.0"));
        }));
        stream.binary(false);
        stream.text(true);
    };
    auto tune_socket = [](tcp::socket& socket) {
        beast::error_code ignored;
        socket.set_option(net::socket_base::keep_alive(true), ignored);
        socket.set_option(tcp::no_delay(true), ignored);
    };
    upgrade_response_ = {};

    if (use_tls_) {
        net::async_connect(beast::get_lowest_layer(*wss_), results,
            [&](beast::error_code ec, const tcp::endpoint&) {
                if (ec) return finish(ec);
                tune_socket(beast::get_lowest_layer(*wss_));
                // SNI
                if (!::SSL_set_tlsext_host_name(wss_->next_layer().native_handle(), host_.c_str())) {
                    return finish(beast::error_code{static_cast<int>(::ERR_get_error()),
                                                    net::error::get_ssl_category()});
                }
                wss_->next_layer().async_handshake(ssl::stream_base::client, [&](beast::error_code tls_ec) {
                    if (tls_ec) return finish(tls_ec);
                    configure(*wss_);
                    wss_->async_handshake(upgrade_response_, host_, target_,
                                          [&](beast::error_code ws_ec) { finish(ws_ec); });
                });
            });
    } else {
        net::async_connect(beast::get_lowest_layer(*ws_), results,
            [&](beast::error_code ec, const tcp::endpoint&) {
                if (ec) return finish(ec);
                tune_socket(beast::get_lowest_layer(*ws_));
                configure(*ws_);
                ws_->async_handshake(upgrade_response_, host_, target_,
                                     [&](beast::error_code ws_ec) { finish(ws_ec); });
            });
    }

    bool timed_out = false;
    while (!outcome) {
        if (aborted_.load(std::memory_order_acquire)) break;
        const auto now = std::chrono::steady_clock::now();
        if (now >= deadline) {
            timed_out = true;
            break;
        }
        if (ioc_->stopped()) ioc_->restart();
        ioc_->run_for(std::min<std::chrono::steady_clock::duration>(
            deadline - now, std::chrono::milliseconds(50)));
    }
    if (!outcome) {
        // Closing the socket completes the pending operation with operation_aborted,
        // so draining the context returns promptly.
        {
            std::lock_guard<std::mutex> lk(stream_mutex_);
            cancel_lowest_layer_locked();
        }
        if (ioc_->stopped()) ioc_->restart();
        ioc_->run();
        out.error = timed_out ? "connect timeout after handshake deadline" : "aborted";
        if (timed_out) {
            spdlog::warn("[WS] connect timeout during handshake host={}", host_);
        }
        return false;
    }
    if (*outcome) {
        if (*outcome == websocket::error::upgrade_declined && upgrade_response_.result_int() != 0) {
            out.http_status = upgrade_response_.result_int();
            const auto reason = upgrade_response_.reason();
            out.error = fmt::format("HTTP {} {}", out.http_status, std::string(reason.data(), reason.size()));
        } else {
            out.error = outcome->message();
        }
        return false;
    }
    return true;
}

bool BeastWsTransport::send_text(const std::string& payload) {
    if (!connected_.load(std::memory_order_acquire)) {
        return false;
    }
    std::lock_guard<std::mutex> lk(tx_mutex_);
    try {
        if (wss_) {
            wss_->write(net::buffer(payload));
        } else if (ws_) {
            ws_->write(net::buffer(payload));
        } else {
            return false;
        }
        return true;
    } catch (const std::exception& e) {
        spdlog::warn("[WS] write error: {}", e.what());
        connected_.store(false, std::memory_order_release);
        return false;
    }
}

ReadResult BeastWsTransport::read() {
    ReadResult result;
    if (!wss_ && !ws_) {
        result.error = "not connected";
        return result;
    }
    try {
        buffer_.consume(buffer_.size());
        if (wss_) {
            wss_->read(buffer_);
            result.binary = wss_->got_binary();
        } else {
            ws_->read(buffer_);
            result.binary = ws_->got_binary();
        }
        result.payload = beast::buffers_to_string(buffer_.cdata());
        buffer_.consume(buffer_.size());
        result.status = ReadStatus::MESSAGE;
        return result;
    } catch (const beast::system_error& se) {
        connected_.store(false, std::memory_order_release);
        if (se.code() == websocket::error::closed) {
            const auto& reason = wss_ ? wss_->reason() : ws_->reason();
            result.status = ReadStatus::CLOSED;
            result.close.code = static_cast<uint16_t>(reason.code);
            result.close.reason = std::string(reason.reason.data(), reason.reason.size());
            return result;
        }
        result.status = ReadStatus::FAILED;
        result.error = aborted_.load(std::memory_order_acquire) ? "aborted" : se.code().message();
        return result;
    } catch (const std::exception& e) {
        connected_.store(false, std::memory_order_release);
        result.status = ReadStatus::FAILED;
        result.error = e.what();
        return result;
    }
}

void BeastWsTransport::close(uint16_t code, const std::string& reason) {
    if (connected_.exchange(false, std::memory_order_acq_rel)) {
        std::lock_guard<std::mutex> lk(tx_mutex_);
        beast::error_code ec;
        websocket::close_reason cr(static_cast<websocket::close_code>(code), reason);
        if (wss_) {
            wss_->close(cr, ec);
        } else if (ws_) {
            ws_->close(cr, ec);
        }
        if (ec && ec != net::error::operation_aborted) {
            spdlog::debug("[WS] close handshake: {}", ec.message());
        }
    }
    std::lock_guard<std::mutex> lk(stream_mutex_);
    cancel_lowest_layer_locked();
}

void BeastWsTransport::abort() {
    aborted_.store(true, std::memory_order_release);
    connected_.store(false, std::memory_order_release);
    // websocket::close() is not safe against a concurrent read; drop the socket instead
    std::lock_guard<std::mutex> lk(stream_mutex_);
    cancel_lowest_layer_locked();
}

} // namespace dhanstream::netws
