/**
 * @file frame_decoder.h
 * @brief Stateless decoder for the binary market feed and the JSON push envelopes
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>

#include "stream/events.h"

namespace dhanstream::stream {

enum class DecodeErrorKind {
    EMPTY,            // zero-length input
    TRUNCATED,        // shorter than the header or the fixed payload for its code
    MALFORMED_JSON,   // envelope text did not parse as a JSON object
    MISSING_FIELD     // envelope lacks "Type" or a "Data" object
};

struct DecodeError {
    DecodeErrorKind kind = DecodeErrorKind::TRUNCATED;
    std::string message;
};

/**
 * @brief Exactly one of event / error is set
 */
struct DecodeResult {
    std::optional<DecodedEvent> event;
    std::optional<DecodeError> error;

    bool ok() const { return event.has_value(); }

    static DecodeResult success(DecodedEvent ev) {
        DecodeResult r;
        r.event = std::move(ev);
        return r;
    }
    static DecodeResult failure(DecodeErrorKind kind, std::string message) {
        DecodeResult r;
        r.error = DecodeError{kind, std::move(message)};
        return r;
    }
};

/**
 * @class FrameDecoder
 * @brief Pure transform from wire bytes to DecodedEvent. Never throws.
 *
 * Binary header (8 bytes): response code (u8), declared length (u16 big-endian),
 * exchange segment (u8), security id (i32 little-endian). Payload fields are
 * little-endian. A declared length that disagrees with the received size is
 * tolerated; a payload too short for its response code is a DecodeError.
 */
class FrameDecoder {
public:
    static constexpr std::size_t HEADER_SIZE = 8;
    static constexpr std::size_t DEPTH_LEVEL_SIZE = 20;
    static constexpr std::size_t TICKER_PAYLOAD = 8;
    static constexpr std::size_t QUOTE_PAYLOAD = 42;
    static constexpr std::size_t FULL_PAYLOAD = 154;
    static constexpr std::size_t OI_PAYLOAD = 4;
    static constexpr std::size_t PREV_CLOSE_PAYLOAD = 8;
    static constexpr std::size_t DISCONNECT_PAYLOAD = 2;

    // Response codes
    static constexpr uint8_t CODE_INDEX = 1;
    static constexpr uint8_t CODE_TICKER = 2;
    static constexpr uint8_t CODE_QUOTE = 4;
    static constexpr uint8_t CODE_OI = 5;
    static constexpr uint8_t CODE_PREV_CLOSE = 6;
    static constexpr uint8_t CODE_MARKET_STATUS = 7;
    static constexpr uint8_t CODE_FULL = 8;
    static constexpr uint8_t CODE_DEPTH_BID = 41;
    static constexpr uint8_t CODE_DISCONNECT = 50;
    static constexpr uint8_t CODE_DEPTH_ASK = 51;

    /// Decode one binary feed frame.
    static DecodeResult decode(std::span<const uint8_t> bytes);

    /// Decode one JSON envelope ({"Type": ..., "Data": {...}}) from the depth or order channel.
    static DecodeResult decode_json(std::string_view text);

    static std::optional<PacketHeader> parse_header(std::span<const uint8_t> bytes);

    /// Reads one 20 byte depth level; caller guarantees the span is large enough.
    static DepthLevel read_depth_level(std::span<const uint8_t> bytes);
};

std::string to_string(DecodeErrorKind kind);

} // namespace dhanstream::stream
