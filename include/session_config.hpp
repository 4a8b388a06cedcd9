/**
 * Pymon Engine - Session Configuration
 *
 * Startup options for a game session, filled from defaults and the
 * console's command line.
 */

#pragma once

#include "types.hpp"

namespace pymon {

/**
 * SessionConfig - Startup options.
 */
struct SessionConfig {
    std::string world_file = "data/world.json";

    // Fixed seed for reproducible sessions; time-seeded when empty
    std::optional<uint32_t> seed;

    // X-Ray trace log
    bool xray_enabled = false;
    std::string xray_dir = "xrays";

    // Starting Pymon
    std::string starter_nickname = "Kimimon";
    std::string starter_description = "White and yellow with a long tail. It can be a loyal companion.";

    bool show_help = false;
};

/**
 * Result of command line parsing.
 */
struct ConfigParseResult {
    bool success = false;
    std::string error;
    SessionConfig config;
};

/**
 * Parse console arguments.
 *
 * Usage: pymon_console [world.json] [--world FILE] [--seed N] [--xray] [--xray-dir DIR] [--help]
 */
ConfigParseResult parse_args(const std::vector<std::string>& args);

/**
 * Usage text for --help and argument errors.
 */
std::string usage_text(const std::string& program);

} // namespace pymon
