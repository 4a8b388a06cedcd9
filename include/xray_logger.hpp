/**
 * Pymon Engine - X-Ray Logger
 *
 * Complete session visibility for debugging.
 * Logs every location with its doors, occupants and items, the player's
 * roster (including benched pets) and the battle ledger after each command.
 * Shows instance IDs so creature movement can be tracked exactly.
 */

#pragma once

#include "types.hpp"
#include <string>
#include <fstream>

namespace pymon {

// Forward declarations
class GameSession;
struct Actor;
struct Location;

/**
 * XRayLogger - Complete session state visibility for debugging.
 *
 * Unlike the console output, the trace includes locations the player has
 * never visited and creatures the player cannot see.
 */
class XRayLogger {
public:
    /**
     * Constructor - creates timestamped log file.
     *
     * @param output_dir Directory for log files (default: xrays)
     */
    explicit XRayLogger(const std::string& output_dir = "xrays");

    ~XRayLogger();

    /**
     * Log a command header.
     *
     * @param command_count Running command number
     * @param command Command as entered (e.g. "move north")
     * @param outcome Effect description returned for it
     */
    void log_command(int command_count, const std::string& command, const std::string& outcome);

    /**
     * Log complete session snapshot (including hidden locations).
     *
     * @param session Current session
     */
    void log_state(const GameSession& session);

    /**
     * Log game end.
     *
     * @param reason Reason for game end
     */
    void log_game_end(const std::string& reason);

    /**
     * Get the log file path.
     */
    const std::string& get_log_path() const { return log_path_; }

    /**
     * Check if logging is enabled.
     */
    bool is_enabled() const { return enabled_; }

    /**
     * Enable/disable logging.
     */
    void set_enabled(bool enabled) { enabled_ = enabled; }

private:
    std::string log_path_;
    std::ofstream log_file_;
    bool enabled_ = true;

    /**
     * Format ID only as "(short_id)".
     * Uses last 8 characters of instance ID for brevity.
     */
    std::string fmt_id(const std::string& id) const;

    /**
     * Format a Pymon line with energy, immunity and inventory.
     * Format: "ACTIVE:  Kimimon (pymon_1) | Energy: 3/3 | Immune: no | At: Forest | Items: [...]"
     */
    std::string format_pymon_line(const Actor& pymon, const std::string& label) const;

    /**
     * Format a location line with doors, occupants and items.
     */
    std::string format_location_line(const Location& location) const;
};

} // namespace pymon
