#include "utils/string_utils.h"
#include <algorithm>
#include <array>
#include <cctype>

namespace dhanstream {
namespace utils {

std::string to_lower_ascii(std::string_view input) {
    std::string out(input.begin(), input.end());
    std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return out;
}

std::string to_upper_ascii(std::string_view input) {
    std::string out(input.begin(), input.end());
    std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) {
        return static_cast<char>(std::toupper(c));
    });
    return out;
}

std::string trim(std::string_view input) {
    size_t begin = 0;
    size_t end = input.size();
    while (begin < end && std::isspace(static_cast<unsigned char>(input[begin]))) ++begin;
    while (end > begin && std::isspace(static_cast<unsigned char>(input[end - 1]))) --end;
    return std::string(input.substr(begin, end - begin));
}

std::string collapse_whitespace(std::string_view input) {
    std::string trimmed = trim(input);
    std::string out;
    out.reserve(trimmed.size());
    bool in_space = false;
    for (char c : trimmed) {
        if (std::isspace(static_cast<unsigned char>(c))) {
            if (!in_space) out.push_back(' ');
            in_space = true;
        } else {
            out.push_back(c);
            in_space = false;
        }
    }
    return out;
}

std::optional<std::pair<std::string,std::string>> split_once(std::string_view input, char delim) {
    auto pos = input.find(delim);
    if (pos == std::string_view::npos) return std::nullopt;
    return std::make_pair(trim(input.substr(0, pos)), trim(input.substr(pos + 1)));
}

std::vector<std::string> split_csv_line(std::string_view line) {
    std::vector<std::string> fields;
    std::string current;
    bool quoted = false;
    for (size_t i = 0; i < line.size(); ++i) {
        const char c = line[i];
        if (quoted) {
            if (c == '"') {
                if (i + 1 < line.size() && line[i + 1] == '"') {
                    current.push_back('"');
                    ++i;
                } else {
                    quoted = false;
                }
            } else {
                current.push_back(c);
            }
        } else if (c == '"') {
            quoted = true;
        } else if (c == ',') {
            fields.push_back(std::move(current));
            current.clear();
        } else if (c != '\r') {
            current.push_back(c);
        }
    }
    fields.push_back(std::move(current));
    return fields;
}

bool is_all_digits(std::string_view input) {
    if (input.empty()) return false;
    return std::all_of(input.begin(), input.end(), [](unsigned char c) { return std::isdigit(c) != 0; });
}

std::string redact_url(std::string_view url) {
    static const std::array<std::string_view, 4> sensitive = {"token", "clientid", "client_id", "access_token"};
    auto q = url.find('?');
    if (q == std::string_view::npos) return std::string(url);

    std::string out(url.substr(0, q));
    std::string_view query = url.substr(q + 1);
    bool first = true;
    while (!query.empty()) {
        auto amp = query.find('&');
        std::string_view param = query.substr(0, amp);
        std::string_view key = param.substr(0, param.find('='));
        const std::string lowered = to_lower_ascii(key);
        if (std::find(sensitive.begin(), sensitive.end(), lowered) == sensitive.end()) {
            out += first ? '?' : '&';
            out.append(param.begin(), param.end());
            first = false;
        }
        if (amp == std::string_view::npos) break;
        query.remove_prefix(amp + 1);
    }
    return out;
}

} // namespace utils
} // namespace dhanstream
