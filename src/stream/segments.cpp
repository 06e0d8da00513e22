/**
 * @file segments.cpp
 */

#include "stream/segments.h"
#include "utils/string_utils.h"
#include <algorithm>
#include <array>
#include <utility>

namespace dhanstream::stream {

namespace {

constexpr std::array<std::pair<std::string_view, ExchangeSegment>, 8> kSegments = {{
    {"IDX_I", ExchangeSegment::IDX_I},
    {"NSE_EQ", ExchangeSegment::NSE_EQ},
    {"NSE_FNO", ExchangeSegment::NSE_FNO},
    {"NSE_CURRENCY", ExchangeSegment::NSE_CURRENCY},
    {"BSE_EQ", ExchangeSegment::BSE_EQ},
    {"MCX_COMM", ExchangeSegment::MCX_COMM},
    {"BSE_CURRENCY", ExchangeSegment::BSE_CURRENCY},
    {"BSE_FNO", ExchangeSegment::BSE_FNO},
}};

} // namespace

std::string to_string(ExchangeSegment segment) {
    for (const auto& [name, seg] : kSegments) {
        if (seg == segment) return std::string(name);
    }
    return std::to_string(static_cast<int>(segment));
}

std::optional<ExchangeSegment> segment_from_code(uint8_t code) {
    for (const auto& [name, seg] : kSegments) {
        if (static_cast<uint8_t>(seg) == code) return seg;
    }
    return std::nullopt;
}

std::optional<ExchangeSegment> parse_segment(std::string_view text) {
    const std::string upper = utils::to_upper_ascii(utils::trim(text));
    if (upper.empty()) return std::nullopt;
    if (utils::is_all_digits(upper)) {
        if (upper.size() > 3) return std::nullopt;
        const int code = std::stoi(upper);
        if (code > 255) return std::nullopt;
        return segment_from_code(static_cast<uint8_t>(code));
    }
    for (const auto& [name, seg] : kSegments) {
        if (name == upper) return seg;
    }
    return std::nullopt;
}

std::string to_request_string(std::string_view text) {
    if (auto seg = parse_segment(text)) return to_string(*seg);
    return utils::to_upper_ascii(utils::trim(text));
}

std::string segment_name_from_code(uint8_t code) {
    if (auto seg = segment_from_code(code)) return to_string(*seg);
    return std::to_string(code);
}

const std::vector<std::string>& all_segments() {
    static const std::vector<std::string> segments = {
        "NSE_EQ", "NSE_FNO", "NSE_CURRENCY", "BSE_EQ", "BSE_FNO", "BSE_CURRENCY", "MCX_COMM", "IDX_I"
    };
    return segments;
}

const std::vector<std::string>& segment_priority() {
    static const std::vector<std::string> priority = [] {
        std::vector<std::string> out = {"NSE_EQ", "BSE_EQ", "NSE_FNO", "BSE_FNO", "IDX_I"};
        for (const auto& seg : all_segments()) {
            if (std::find(out.begin(), out.end(), seg) == out.end()) out.push_back(seg);
        }
        return out;
    }();
    return priority;
}

std::optional<std::string> find_segment_for_exchange_letters(std::string_view exchange, std::string_view segment) {
    const std::string ex = utils::to_upper_ascii(utils::trim(exchange));
    const std::string sg = utils::to_upper_ascii(utils::trim(segment));
    if (ex == "NSE" && sg == "E") return "NSE_EQ";
    if (ex == "BSE" && sg == "E") return "BSE_EQ";
    if (ex == "NSE" && sg == "D") return "NSE_FNO";
    if (ex == "BSE" && sg == "D") return "BSE_FNO";
    if (ex == "NSE" && sg == "C") return "NSE_CURRENCY";
    if (ex == "BSE" && sg == "C") return "BSE_CURRENCY";
    if (ex == "MCX" && sg == "M") return "MCX_COMM";
    if (sg == "I") return "IDX_I";
    return std::nullopt;
}

std::string segment_from_exchange_letters(std::string_view exchange, std::string_view segment) {
    return find_segment_for_exchange_letters(exchange, segment).value_or("NSE_EQ");
}

} // namespace dhanstream::stream
