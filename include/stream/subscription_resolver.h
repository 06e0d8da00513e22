/**
 * @file subscription_resolver.h
 * @brief Maps caller symbol references to (exchange segment, security id) pairs
 */

#pragma once

#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <vector>

#include "stream/instrument.h"
#include "stream/instrument_directory.h"

namespace dhanstream::stream {

class ResolutionError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * @class SubscriptionResolver
 * @brief Resolves "SEGMENT:CODE", bare codes, security ids and descriptors.
 *
 * Each segment universe is fetched from the directory once, on first use, and indexed
 * by symbol name, display name, security id and "SYMBOL:SERIES". Concurrent first
 * lookups of the same segment share a single fetch. A failed fetch is not cached.
 * Thread-safe.
 */
class SubscriptionResolver {
public:
    explicit SubscriptionResolver(std::shared_ptr<IInstrumentDirectory> directory);
    SubscriptionResolver(std::shared_ptr<IInstrumentDirectory> directory,
                         std::vector<std::string> probe_order);

    /// Throws ResolutionError when no instrument matches.
    InstrumentRef resolve(const SymbolRef& ref);

    /// Upper-case subscription key for @p ref ("SEG:SYM" for descriptors).
    static std::string label_for(const SymbolRef& ref);

    std::size_t cached_segment_count() const;

private:
    using Index = std::unordered_map<std::string, InstrumentRecord>;
    using IndexPtr = std::shared_ptr<const Index>;

    InstrumentRef resolve_descriptor(const InstrumentDescriptor& desc, const std::string& label);
    InstrumentRef resolve_string(const std::string& input, const std::string& label);

    std::optional<InstrumentRecord> find_instrument(const std::string& code,
                                                    const std::optional<std::string>& segment_hint);
    IndexPtr index_for(const std::string& segment);
    static IndexPtr build_index(const std::vector<InstrumentRecord>& records);

    InstrumentRef remember(const std::string& label, InstrumentRef ref);

    std::shared_ptr<IInstrumentDirectory> directory_;
    std::vector<std::string> probe_order_;

    mutable std::mutex mutex_;
    std::unordered_map<std::string, std::shared_future<IndexPtr>> indexes_;
    std::unordered_map<std::string, InstrumentRef> resolved_;
};

} // namespace dhanstream::stream
