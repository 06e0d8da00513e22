/**
 * @file instrument.h
 * @brief Instrument identity types shared by the resolver, sessions and directories
 */

#pragma once

#include <optional>
#include <string>
#include <variant>

namespace dhanstream::stream {

/**
 * @brief A resolved subscription target. Immutable once resolved.
 */
struct InstrumentRef {
    std::string exchange_segment;   // wire name, e.g. "NSE_EQ"
    std::string security_id;        // decimal string as sent in InstrumentList
    std::string display_label;      // upper-case label used as the subscription key
    std::string original_input;     // what the caller passed

    bool same_instrument(const InstrumentRef& other) const {
        return exchange_segment == other.exchange_segment && security_id == other.security_id;
    }
};

/**
 * @brief One row of an instrument universe as served by the directory
 */
struct InstrumentRecord {
    std::string symbol_name;
    std::string display_name;
    std::string security_id;
    std::string exchange_segment;
    std::string series;
};

/**
 * @brief Structured subscription reference.
 *
 * Carrying both segment and security id bypasses the directory; carrying only one of
 * security id / symbol triggers a lookup with the segment (if any) as hint.
 */
struct InstrumentDescriptor {
    std::optional<std::string> exchange_segment;
    std::optional<std::string> security_id;
    std::optional<std::string> symbol;
};

/// Caller-facing reference: "NSE_EQ:RELIANCE", "RELIANCE", "1333" or a descriptor.
using SymbolRef = std::variant<std::string, InstrumentDescriptor>;

} // namespace dhanstream::stream
