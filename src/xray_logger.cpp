/**
 * Pymon Engine - X-Ray Logger Implementation
 */

#include "xray_logger.hpp"
#include "game_session.hpp"
#include <filesystem>
#include <chrono>
#include <iomanip>
#include <sstream>
#include <iostream>

namespace pymon {

XRayLogger::XRayLogger(const std::string& output_dir) {
    // Create output directory if it doesn't exist
    std::error_code ec;
    std::filesystem::create_directories(output_dir, ec);
    if (ec) {
        std::cerr << "[X-Ray Logger] Failed to create directory " << output_dir
                  << ": " << ec.message() << std::endl;
        enabled_ = false;
        return;
    }

    // Create timestamped log file
    auto now = std::chrono::system_clock::now();
    auto time_t = std::chrono::system_clock::to_time_t(now);
    std::tm tm = *std::localtime(&time_t);

    std::ostringstream filename;
    filename << output_dir << "/xray_session_"
             << std::put_time(&tm, "%Y%m%d_%H%M%S") << ".log";
    log_path_ = filename.str();

    log_file_.open(log_path_);
    if (!log_file_.is_open()) {
        std::cerr << "[X-Ray Logger] Failed to open log file: " << log_path_ << std::endl;
        enabled_ = false;
        return;
    }

    // Write header
    log_file_ << std::string(80, '=') << "\n";
    log_file_ << "X-RAY SESSION LOG - LINEAR STATE TRACE\n";

    std::ostringstream timestamp;
    timestamp << std::put_time(&tm, "%Y-%m-%d %H:%M:%S");
    log_file_ << "Started: " << timestamp.str() << "\n";
    log_file_ << std::string(80, '=') << "\n\n";

    std::cout << "[X-Ray Logger] Logging to: " << log_path_ << std::endl;
}

XRayLogger::~XRayLogger() {
    if (log_file_.is_open()) {
        log_file_.close();
    }
}

std::string XRayLogger::fmt_id(const std::string& id) const {
    std::string short_id = id;
    if (short_id.length() > 8) {
        short_id = short_id.substr(short_id.length() - 8);
    }
    return "(" + short_id + ")";
}

std::string XRayLogger::format_pymon_line(const Actor& pymon, const std::string& label) const {
    std::ostringstream line;

    line << label << ":  " << pymon.nickname << " " << fmt_id(pymon.id);
    line << " | Energy: " << pymon.energy() << "/" << MAX_ENERGY;

    if (pymon.player.has_value()) {
        line << " | Moves: " << pymon.player->move_counter << "/" << MOVES_PER_ENERGY_DROP;
        line << " | Immune: " << (pymon.player->immune ? "yes" : "no");
    }

    line << " | At: " << (pymon.location.empty() ? "(nowhere)" : pymon.location);

    line << " | Items: [";
    if (pymon.player.has_value()) {
        const auto& items = pymon.player->inventory.items;
        for (size_t i = 0; i < items.size(); i++) {
            if (i > 0) line << ", ";
            line << items[i].name;
        }
    }
    line << "]";

    return line.str();
}

std::string XRayLogger::format_location_line(const Location& location) const {
    std::ostringstream line;

    line << location.name << "\n";

    line << "  Doors: ";
    bool any_door = false;
    for (Direction dir : ALL_DIRECTIONS) {
        if (!location.has_door(dir)) continue;
        if (any_door) line << ", ";
        line << to_string(dir) << " -> " << *location.door(dir);
        any_door = true;
    }
    if (!any_door) line << "(none)";
    line << "\n";

    line << "  Occupants (" << location.occupants.size() << "): [";
    for (size_t i = 0; i < location.occupants.size(); i++) {
        if (i > 0) line << ", ";
        line << location.occupants[i].nickname << " " << fmt_id(location.occupants[i].id);
    }
    line << "]\n";

    line << "  Items (" << location.items.count() << "): [";
    for (size_t i = 0; i < location.items.items.size(); i++) {
        const Item& item = location.items.items[i];
        if (i > 0) line << ", ";
        line << item.name;
        if (!item.pickable) line << " {fixed}";
        if (item.consumable) line << " {consumable}";
    }
    line << "]";

    return line.str();
}

void XRayLogger::log_command(int command_count, const std::string& command, const std::string& outcome) {
    if (!enabled_ || !log_file_.is_open()) return;

    log_file_ << std::string(80, '#') << "\n";
    log_file_ << "[COMMAND " << command_count << "] " << command << "\n";
    log_file_ << "RESULT: " << outcome << "\n";
    log_file_ << std::string(80, '#') << "\n\n";

    log_file_.flush();
}

void XRayLogger::log_state(const GameSession& session) {
    if (!enabled_ || !log_file_.is_open()) return;

    log_file_ << std::string(80, '=') << "\n";

    // Roster
    const CreatureRoster& roster = session.roster();
    log_file_ << "[ROSTER]\n";

    if (const Actor* active = roster.active()) {
        log_file_ << format_pymon_line(*active, "ACTIVE") << "\n";
    } else {
        log_file_ << "ACTIVE:  (Empty)\n";
    }

    const auto& bench = roster.bench();
    for (size_t i = 0; i < bench.size(); i++) {
        std::string label = "BENCH " + std::to_string(i + 1);
        log_file_ << format_pymon_line(bench[i], label) << "\n";
    }

    // World
    const WorldGraph& world = session.world();
    log_file_ << "\n[WORLD] " << world.location_count() << " location(s), "
              << world.creature_count() << " wild creature(s)\n";

    for (const auto& name : world.location_names()) {
        const Location* loc = world.find_location(name);
        if (loc) {
            log_file_ << format_location_line(*loc) << "\n";
        }
    }

    // Battle ledger
    log_file_ << "\n[BATTLES]\n";
    const BattleStats& stats = session.stats();
    if (stats.is_empty()) {
        log_file_ << "(None)\n";
    }
    for (const auto& summary : stats.report()) {
        log_file_ << summary.nickname << ": " << summary.battles.size() << " battle(s)"
                  << " | W " << summary.total_wins
                  << " D " << summary.total_draws
                  << " L " << summary.total_losses << "\n";
    }

    log_file_ << "\nStatus: " << to_string(session.status())
              << " | Commands: " << session.command_count() << "\n";

    log_file_ << std::string(80, '=') << "\n\n";

    log_file_.flush();
}

void XRayLogger::log_game_end(const std::string& reason) {
    if (!enabled_ || !log_file_.is_open()) return;

    auto now = std::chrono::system_clock::now();
    auto time_t = std::chrono::system_clock::to_time_t(now);
    std::tm tm = *std::localtime(&time_t);

    log_file_ << "\n" << std::string(80, '=') << "\n";
    log_file_ << "GAME END\n";
    log_file_ << std::string(80, '=') << "\n";

    log_file_ << "Reason: " << reason << "\n";

    std::ostringstream timestamp;
    timestamp << std::put_time(&tm, "%Y-%m-%d %H:%M:%S");
    log_file_ << "Ended: " << timestamp.str() << "\n";

    log_file_ << std::string(80, '=') << "\n";

    log_file_.flush();
}

} // namespace pymon
