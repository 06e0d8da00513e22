/**
 * @file instrument_directory.cpp
 */

#include "stream/instrument_directory.h"

#include <stdexcept>
#include <unordered_map>
#include <utility>

#include <spdlog/spdlog.h>

#include "core/net/rest_executor.h"
#include "stream/segments.h"
#include "utils/string_utils.h"

namespace dhanstream::stream {

std::vector<InstrumentRecord> parse_instrument_csv(std::string_view csv, const std::string& fallback_segment) {
    std::vector<InstrumentRecord> out;
    std::unordered_map<std::string, std::size_t> columns;
    bool header_seen = false;

    auto column = [&](const std::vector<std::string>& row, const char* name) -> std::string {
        auto it = columns.find(name);
        if (it == columns.end() || it->second >= row.size()) return {};
        return utils::trim(row[it->second]);
    };

    std::size_t pos = 0;
    while (pos < csv.size()) {
        auto nl = csv.find('\n', pos);
        std::string_view line = csv.substr(pos, nl == std::string_view::npos ? std::string_view::npos : nl - pos);
        pos = (nl == std::string_view::npos) ? csv.size() : nl + 1;
        if (utils::trim(line).empty()) continue;

        auto fields = utils::split_csv_line(line);
        if (!header_seen) {
            for (std::size_t i = 0; i < fields.size(); ++i) {
                columns[utils::to_upper_ascii(utils::trim(fields[i]))] = i;
            }
            header_seen = true;
            continue;
        }

        InstrumentRecord rec;
        rec.security_id = column(fields, "SECURITY_ID");
        if (rec.security_id.empty()) continue;
        rec.symbol_name = column(fields, "SYMBOL_NAME");
        rec.display_name = column(fields, "DISPLAY_NAME");
        rec.series = column(fields, "SERIES");

        std::string exch = column(fields, "EXCH_ID");
        if (exch.empty()) exch = column(fields, "EXCHANGE");
        const std::string seg = column(fields, "SEGMENT");
        rec.exchange_segment = fallback_segment;
        if (!exch.empty() && !seg.empty()) {
            if (auto mapped = find_segment_for_exchange_letters(exch, seg)) {
                rec.exchange_segment = std::move(*mapped);
            }
        }
        out.push_back(std::move(rec));
    }
    return out;
}

RestInstrumentDirectory::RestInstrumentDirectory(std::shared_ptr<nethttp::RestExecutor> rest)
    : rest_(std::move(rest)) {
    if (!rest_) throw std::invalid_argument("RestInstrumentDirectory requires a RestExecutor");
}

std::vector<InstrumentRecord> RestInstrumentDirectory::by_segment(const std::string& segment) {
    const std::string body = rest_->get("/v2/instrument/" + segment, throttle::RateTier::DATA);
    auto records = parse_instrument_csv(body, segment);
    spdlog::info("[Instruments] {} instruments downloaded for {}", records.size(), segment);
    return records;
}

} // namespace dhanstream::stream
