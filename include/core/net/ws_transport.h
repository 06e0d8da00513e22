/**
 * @file ws_transport.h
 * @brief Blocking WebSocket transport seam used by the streaming sessions.
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>

namespace dhanstream::netws {

struct WsCloseInfo {
    uint16_t code{0};
    std::string reason;
};

enum class ReadStatus {
    MESSAGE,    // payload holds one complete frame
    CLOSED,     // peer sent a close frame; close holds code and reason
    FAILED      // transport error or local abort; error holds the description
};

struct ReadResult {
    ReadStatus status{ReadStatus::FAILED};
    std::string payload;
    bool binary{false};
    WsCloseInfo close;
    std::string error;
};

/// Outcome of connect(). When the server answers the upgrade request with a
/// non-101 status, http_status carries it and error holds "HTTP <status> <reason>".
struct ConnectResult {
    bool connected{false};
    unsigned http_status{0};
    std::string error;

    explicit operator bool() const { return connected; }
};

/**
 * @class WsTransport
 * @brief One connection at a time, driven by a single owning thread.
 *
 * connect(), read() and close() belong to the owning thread. send_text() may be
 * called from any thread concurrently with a blocked read(). abort() may be called
 * from any thread and makes a blocked read() return FAILED promptly.
 */
class WsTransport {
public:
    virtual ~WsTransport() = default;

    /// Establish the connection. Name resolution, TCP, TLS and the upgrade
    /// together are bounded by @p timeout.
    virtual ConnectResult connect(const std::string& url, std::chrono::milliseconds timeout) = 0;

    virtual bool send_text(const std::string& payload) = 0;

    /// Block until the next frame, a close or an error.
    virtual ReadResult read() = 0;

    /// Graceful close handshake from the owning thread.
    virtual void close(uint16_t code, const std::string& reason) = 0;

    /// Tear the socket down from any thread.
    virtual void abort() = 0;

    virtual bool is_connected() const = 0;
};

using WsTransportFactory = std::function<std::unique_ptr<WsTransport>()>;

} // namespace dhanstream::netws
