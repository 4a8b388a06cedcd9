/**
 * Pymon Engine - Session Configuration Implementation
 */

#include "session_config.hpp"
#include <cctype>
#include <limits>
#include <sstream>
#include <stdexcept>

namespace pymon {

ConfigParseResult parse_args(const std::vector<std::string>& args) {
    ConfigParseResult result;
    SessionConfig& config = result.config;
    bool world_set = false;

    for (size_t i = 0; i < args.size(); i++) {
        const std::string& arg = args[i];

        if (arg == "--help" || arg == "-h") {
            config.show_help = true;
        } else if (arg == "--world") {
            if (i + 1 >= args.size()) {
                result.error = "--world requires a file path";
                return result;
            }
            config.world_file = args[++i];
            world_set = true;
        } else if (arg == "--seed") {
            if (i + 1 >= args.size()) {
                result.error = "--seed requires a number";
                return result;
            }
            const std::string& value = args[++i];
            if (value.empty() || !std::isdigit(static_cast<unsigned char>(value[0]))) {
                result.error = "Invalid seed: " + value;
                return result;
            }
            try {
                size_t used = 0;
                unsigned long long parsed = std::stoull(value, &used);
                if (used != value.size() || parsed > std::numeric_limits<uint32_t>::max()) {
                    result.error = "Invalid seed: " + value;
                    return result;
                }
                config.seed = static_cast<uint32_t>(parsed);
            } catch (const std::exception&) {
                result.error = "Invalid seed: " + value;
                return result;
            }
        } else if (arg == "--xray") {
            config.xray_enabled = true;
        } else if (arg == "--xray-dir") {
            if (i + 1 >= args.size()) {
                result.error = "--xray-dir requires a directory";
                return result;
            }
            config.xray_dir = args[++i];
            config.xray_enabled = true;
        } else if (!arg.empty() && arg[0] == '-') {
            result.error = "Unknown option: " + arg;
            return result;
        } else if (!world_set) {
            config.world_file = arg;
            world_set = true;
        } else {
            result.error = "Unexpected argument: " + arg;
            return result;
        }
    }

    result.success = true;
    return result;
}

std::string usage_text(const std::string& program) {
    std::ostringstream out;
    out << "Usage: " << program << " [world.json] [options]\n"
        << "  --world FILE     World definition (default: data/world.json)\n"
        << "  --seed N         Seed the random generator for a reproducible game\n"
        << "  --xray           Write an X-Ray trace log\n"
        << "  --xray-dir DIR   Directory for X-Ray logs (implies --xray, default: xrays)\n"
        << "  --help           Show this message\n";
    return out.str();
}

} // namespace pymon
