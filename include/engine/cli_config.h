#pragma once

#include "engine/stream_config.h"
#include <string>

namespace dhanstream {
namespace cli {

/**
 * @brief Parse command line arguments, loading --config first and applying flags over it
 * @param argc Argument count
 * @param argv Argument vector
 * @return Parsed configuration (credentials not yet resolved)
 */
StreamConfig parse_command_line_args(int argc, char* argv[]);

/**
 * @brief Resolve credentials from the environment and validate
 * @param config Configuration to complete and validate in place
 * @return true if valid, false otherwise (errors printed to stderr)
 */
bool validate_config(StreamConfig& config);

/**
 * @brief Initialize logging system (console + rotating file)
 * @return true if successful, false otherwise
 */
bool initialize_logging(const LogSettings& settings);

} // namespace cli
} // namespace dhanstream
