/**
 * @file instrument_directory.h
 * @brief Source of per-segment instrument universes
 */

#pragma once

#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include "stream/instrument.h"

namespace dhanstream::nethttp { class RestExecutor; }

namespace dhanstream::stream {

class IInstrumentDirectory {
public:
    virtual ~IInstrumentDirectory() = default;

    /// Full instrument list for @p segment. May throw on transport failure.
    virtual std::vector<InstrumentRecord> by_segment(const std::string& segment) = 0;
};

/**
 * @brief Parse the broker's instrument CSV (header row first).
 *
 * Reads SECURITY_ID, SYMBOL_NAME, DISPLAY_NAME, SERIES and derives the exchange segment
 * from EXCH_ID (or EXCHANGE) plus SEGMENT; rows without a security id are skipped.
 * @p fallback_segment is used when the row's exchange letters are missing.
 */
std::vector<InstrumentRecord> parse_instrument_csv(std::string_view csv, const std::string& fallback_segment);

/**
 * @class RestInstrumentDirectory
 * @brief Downloads /v2/instrument/{segment} through the throttled REST path (DATA tier)
 */
class RestInstrumentDirectory : public IInstrumentDirectory {
public:
    explicit RestInstrumentDirectory(std::shared_ptr<nethttp::RestExecutor> rest);

    std::vector<InstrumentRecord> by_segment(const std::string& segment) override;

private:
    std::shared_ptr<nethttp::RestExecutor> rest_;
};

} // namespace dhanstream::stream
