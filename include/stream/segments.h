/**
 * @file segments.h
 * @brief Exchange segment naming: wire strings, header byte codes and probe order.
 */

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace dhanstream::stream {

/**
 * @enum ExchangeSegment
 * @brief Segments understood by the streaming endpoints (value = header byte code)
 */
enum class ExchangeSegment : uint8_t {
    IDX_I        = 0,
    NSE_EQ       = 1,
    NSE_FNO      = 2,
    NSE_CURRENCY = 3,
    BSE_EQ       = 4,
    MCX_COMM     = 5,
    BSE_CURRENCY = 7,
    BSE_FNO      = 8
};

/**
 * @brief Canonical wire name ("NSE_EQ", "IDX_I", ...)
 */
std::string to_string(ExchangeSegment segment);

/**
 * @brief Map a frame header byte to a segment
 */
std::optional<ExchangeSegment> segment_from_code(uint8_t code);

/**
 * @brief Parse "NSE_FNO", "nse_fno" or a numeric code ("2") into a segment
 */
std::optional<ExchangeSegment> parse_segment(std::string_view text);

/**
 * @brief Normalize a caller-supplied segment into the string the subscribe command expects.
 *
 * Known names and numeric codes map to the canonical name; anything else is upper-cased
 * and passed through unchanged.
 */
std::string to_request_string(std::string_view text);

/**
 * @brief Header byte rendered as a segment name, or the decimal code when unknown
 */
std::string segment_name_from_code(uint8_t code);

/**
 * @brief All configured segments in canonical order
 */
const std::vector<std::string>& all_segments();

/**
 * @brief Probe order used when a reference carries no segment hint:
 * NSE_EQ, BSE_EQ, NSE_FNO, BSE_FNO, IDX_I, then every remaining segment.
 */
const std::vector<std::string>& segment_priority();

/// Segment for exchange/segment letters (e.g. "NSE"/"D"), or nullopt if the pair is unknown.
std::optional<std::string> find_segment_for_exchange_letters(std::string_view exchange, std::string_view segment);

/**
 * @brief Map order-alert exchange/segment letters (e.g. "NSE"/"D") to a segment name.
 * Unknown combinations fall back to NSE_EQ.
 */
std::string segment_from_exchange_letters(std::string_view exchange, std::string_view segment);

} // namespace dhanstream::stream
