#pragma once

#include <string>
#include <string_view>
#include <optional>
#include <utility>
#include <vector>

namespace dhanstream {
namespace utils {

/**
 * @brief Convert string to lowercase ASCII
 */
std::string to_lower_ascii(std::string_view input);

/**
 * @brief Convert string to uppercase ASCII
 */
std::string to_upper_ascii(std::string_view input);

/**
 * @brief Strip leading and trailing ASCII whitespace
 */
std::string trim(std::string_view input);

/**
 * @brief Collapse runs of whitespace into a single space (after trimming)
 */
std::string collapse_whitespace(std::string_view input);

/**
 * @brief Split on the first occurrence of a delimiter
 * @return Pair of trimmed (left, right), or nullopt if the delimiter is absent
 */
std::optional<std::pair<std::string,std::string>> split_once(std::string_view input, char delim);

/**
 * @brief Split a single CSV line, honouring double-quoted fields
 */
std::vector<std::string> split_csv_line(std::string_view line);

/**
 * @brief Check if a string is a non-empty run of decimal digits
 */
bool is_all_digits(std::string_view input);

/**
 * @brief Remove credential query parameters (token, clientId, ...) from a URL for logging
 */
std::string redact_url(std::string_view url);

} // namespace utils
} // namespace dhanstream
