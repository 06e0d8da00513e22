/**
 * @file subscription_resolver.cpp
 */

#include "stream/subscription_resolver.h"

#include <utility>

#include <spdlog/spdlog.h>

#include "stream/segments.h"
#include "utils/string_utils.h"

namespace dhanstream::stream {

namespace {

std::vector<std::string> keys_for(const InstrumentRecord& rec) {
    std::vector<std::string> keys;
    const std::string symbol = utils::to_upper_ascii(utils::trim(rec.symbol_name));
    const std::string display = utils::to_upper_ascii(utils::trim(rec.display_name));
    const std::string sid = utils::to_upper_ascii(utils::trim(rec.security_id));
    if (!symbol.empty()) keys.push_back(symbol);
    if (!display.empty() && display != symbol) keys.push_back(display);
    if (!sid.empty()) keys.push_back(sid);
    const std::string series = utils::to_upper_ascii(utils::trim(rec.series));
    if (!series.empty()) keys.push_back(symbol + ":" + series);
    return keys;
}

} // namespace

SubscriptionResolver::SubscriptionResolver(std::shared_ptr<IInstrumentDirectory> directory)
    : SubscriptionResolver(std::move(directory), segment_priority()) {}

SubscriptionResolver::SubscriptionResolver(std::shared_ptr<IInstrumentDirectory> directory,
                                           std::vector<std::string> probe_order)
    : directory_(std::move(directory)), probe_order_(std::move(probe_order)) {
    if (!directory_) throw std::invalid_argument("SubscriptionResolver requires an instrument directory");
}

std::string SubscriptionResolver::label_for(const SymbolRef& ref) {
    if (const auto* s = std::get_if<std::string>(&ref)) {
        return utils::to_upper_ascii(utils::trim(*s));
    }
    const auto& desc = std::get<InstrumentDescriptor>(ref);
    std::string base = desc.symbol ? *desc.symbol : desc.security_id.value_or("");
    std::string label = desc.exchange_segment ? *desc.exchange_segment + ":" + base : base;
    return utils::to_upper_ascii(utils::trim(label));
}

InstrumentRef SubscriptionResolver::resolve(const SymbolRef& ref) {
    const std::string label = label_for(ref);
    {
        std::lock_guard<std::mutex> lk(mutex_);
        auto it = resolved_.find(label);
        if (it != resolved_.end()) return it->second;
    }
    if (const auto* desc = std::get_if<InstrumentDescriptor>(&ref)) {
        return resolve_descriptor(*desc, label);
    }
    return resolve_string(std::get<std::string>(ref), label);
}

InstrumentRef SubscriptionResolver::resolve_descriptor(const InstrumentDescriptor& desc, const std::string& label) {
    std::optional<std::string> hint;
    if (desc.exchange_segment && !utils::trim(*desc.exchange_segment).empty()) {
        hint = to_request_string(*desc.exchange_segment);
    }

    if (hint && desc.security_id && !utils::trim(*desc.security_id).empty()) {
        InstrumentRef ref;
        ref.exchange_segment = *hint;
        ref.security_id = utils::trim(*desc.security_id);
        ref.display_label = label;
        ref.original_input = desc.symbol ? *desc.symbol : ref.security_id;
        return remember(label, std::move(ref));
    }

    std::string code;
    if (desc.security_id && !utils::trim(*desc.security_id).empty()) {
        code = *desc.security_id;
    } else if (desc.symbol && !utils::trim(*desc.symbol).empty()) {
        code = *desc.symbol;
    } else {
        throw ResolutionError("descriptor carries neither security id nor symbol");
    }

    auto rec = find_instrument(code, hint);
    if (!rec) {
        throw ResolutionError("no instrument for " + code + " (segment hint: " + hint.value_or("AUTO") + ")");
    }
    InstrumentRef ref;
    ref.exchange_segment = rec->exchange_segment.empty() ? hint.value_or("") : rec->exchange_segment;
    ref.security_id = rec->security_id;
    ref.display_label = label;
    ref.original_input = code;
    return remember(label, std::move(ref));
}

InstrumentRef SubscriptionResolver::resolve_string(const std::string& input, const std::string& label) {
    std::optional<std::string> hint;
    std::string code = utils::trim(input);

    // "NSE_EQ:RELIANCE" carries a hint; "RELIANCE:EQ" is a symbol:series key
    if (auto parts = utils::split_once(input, ':')) {
        if (auto seg = parse_segment(parts->first)) {
            hint = to_string(*seg);
            code = parts->second;
        }
    }
    if (code.empty()) {
        throw ResolutionError("empty instrument reference: '" + input + "'");
    }

    auto rec = find_instrument(code, hint);
    if (!rec) {
        throw ResolutionError("no instrument for " + code + " (segment hint: " + hint.value_or("AUTO") + ")");
    }
    InstrumentRef ref;
    ref.exchange_segment = rec->exchange_segment.empty() ? hint.value_or("") : rec->exchange_segment;
    ref.security_id = rec->security_id;
    ref.display_label = label;
    ref.original_input = input;
    return remember(label, std::move(ref));
}

InstrumentRef SubscriptionResolver::remember(const std::string& label, InstrumentRef ref) {
    std::lock_guard<std::mutex> lk(mutex_);
    auto [it, inserted] = resolved_.emplace(label, std::move(ref));
    if (inserted) {
        spdlog::debug("[Resolver] {} -> {}:{}", label, it->second.exchange_segment, it->second.security_id);
    }
    return it->second;
}

std::optional<InstrumentRecord> SubscriptionResolver::find_instrument(const std::string& code,
                                                                      const std::optional<std::string>& segment_hint) {
    const std::vector<std::string> candidates = segment_hint
        ? std::vector<std::string>{*segment_hint}
        : probe_order_;

    const std::string normalized = utils::to_upper_ascii(utils::trim(code));
    const std::string alt = utils::collapse_whitespace(normalized);

    for (const auto& segment : candidates) {
        if (segment.empty()) continue;
        IndexPtr index = index_for(segment);
        if (!index) continue;

        auto it = index->find(normalized);
        if (it == index->end() && alt != normalized) {
            it = index->find(alt);
        }
        if (it != index->end()) {
            InstrumentRecord rec = it->second;
            if (rec.exchange_segment.empty()) rec.exchange_segment = segment;
            return rec;
        }
    }
    spdlog::warn("[Resolver] unable to locate instrument for {} (segment hint: {})",
                 code, segment_hint.value_or("AUTO"));
    return std::nullopt;
}

SubscriptionResolver::IndexPtr SubscriptionResolver::index_for(const std::string& segment) {
    std::promise<IndexPtr> promise;
    std::shared_future<IndexPtr> future;
    bool owner = false;
    {
        std::lock_guard<std::mutex> lk(mutex_);
        auto it = indexes_.find(segment);
        if (it != indexes_.end()) {
            future = it->second;
        } else {
            future = promise.get_future().share();
            indexes_.emplace(segment, future);
            owner = true;
        }
    }

    if (owner) {
        try {
            auto records = directory_->by_segment(segment);
            auto index = build_index(records);
            spdlog::info("[Resolver] indexed {} keys for {}", index->size(), segment);
            promise.set_value(std::move(index));
        } catch (const std::exception& e) {
            spdlog::error("[Resolver] failed to download instruments for {}: {}", segment, e.what());
            {
                std::lock_guard<std::mutex> lk(mutex_);
                indexes_.erase(segment);
            }
            promise.set_value(nullptr);
        }
    }
    return future.get();
}

SubscriptionResolver::IndexPtr SubscriptionResolver::build_index(const std::vector<InstrumentRecord>& records) {
    auto index = std::make_shared<Index>();
    for (const auto& rec : records) {
        for (const auto& key : keys_for(rec)) {
            index->emplace(key, rec);
        }
    }
    return index;
}

std::size_t SubscriptionResolver::cached_segment_count() const {
    std::lock_guard<std::mutex> lk(mutex_);
    return indexes_.size();
}

} // namespace dhanstream::stream
