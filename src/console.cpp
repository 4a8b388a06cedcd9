/**
 * Pymon Engine - Interactive Console
 *
 * Line-oriented REPL over a GameSession.
 * All rules live in the engine; this file only reads commands and prints results.
 */

#include <iostream>
#include <sstream>
#include <string>
#include <vector>
#include <memory>

#include <nlohmann/json.hpp>
#include "pymon_engine.hpp"
#include "items/item_effects.hpp"
#include "xray_logger.hpp"

using namespace pymon;

// ============================================================================
// HELPER FUNCTIONS
// ============================================================================

std::vector<std::string> split(const std::string& s, char delim = ' ') {
    std::vector<std::string> tokens;
    std::istringstream iss(s);
    std::string token;
    while (std::getline(iss, token, delim)) {
        if (!token.empty()) {
            tokens.push_back(token);
        }
    }
    return tokens;
}

// Join args[first..last) with single spaces
std::string join(const std::vector<std::string>& args, size_t first, size_t last) {
    std::string out;
    for (size_t i = first; i < last && i < args.size(); i++) {
        if (!out.empty()) out += " ";
        out += args[i];
    }
    return out;
}

std::string join_list(const std::vector<std::string>& items) {
    if (items.empty()) {
        return "(none)";
    }
    return join(items, 0, items.size());
}

void print_help() {
    std::cout << R"(
=== Pymon Console ===

Commands:
  help                    - Show this help
  quit / exit             - Exit console

Your Pymon:
  pymon / p               - Show your active Pymon
  pets                    - List your benched pets
  switch <number>         - Make a pet from 'pets' your active Pymon

World:
  look / l                - Inspect the current location
  move <direction>        - Move west, north, east or south
  pick <item>             - Pick up an item here
  inventory / i           - View your inventory
  use <item> [direction]  - Use an item (binocular takes 'current' or a direction)
  items                   - List usable items

Battles:
  challenge <creature>    - Challenge a creature here (rock/paper/scissors)
  stats                   - Show battle statistics
  stats json              - Show battle statistics as JSON

Examples:
  move north
  pick magic potion
  use binocular east
  challenge Sheep
)" << std::endl;
}

// ============================================================================
// DISPLAY
// ============================================================================

void show_location(const LocationView& view) {
    std::cout << "You are at: " << view.name << std::endl;
    std::cout << "  " << view.description << std::endl;
    std::cout << "  Creatures: " << join_list(view.creatures) << std::endl;
    std::cout << "  Items: " << join_list(view.items) << std::endl;

    std::cout << "  Doors:";
    if (view.doors.empty()) {
        std::cout << " (none)";
    }
    for (const auto& [dir, target] : view.doors) {
        std::cout << " " << to_string(dir) << " -> " << target << ";";
    }
    std::cout << std::endl;
}

void show_pymon(const PymonView& pymon, const std::string& label) {
    std::cout << label << pymon.nickname << std::endl;
    if (!pymon.description.empty()) {
        std::cout << "  " << pymon.description << std::endl;
    }
    std::cout << "  Energy: " << pymon.energy << "/" << MAX_ENERGY
              << (pymon.immune ? " (immune)" : "") << std::endl;
    std::cout << "  Location: " << pymon.location << std::endl;
    std::cout << "  Inventory: " << join_list(pymon.inventory) << std::endl;
}

void show_stats(const std::vector<PymonBattleSummary>& report) {
    if (report.empty()) {
        std::cout << "No battles fought yet." << std::endl;
        return;
    }

    for (const auto& summary : report) {
        std::cout << "Pymon Nickname: \"" << summary.nickname << "\"" << std::endl;
        for (size_t i = 0; i < summary.battles.size(); i++) {
            const auto& b = summary.battles[i];
            std::cout << "  Battle " << (i + 1) << ", "
                      << BattleStats::format_timestamp(b.timestamp)
                      << " Opponent: \"" << b.opponent << "\", "
                      << "W: " << b.wins << " D: " << b.draws << " L: " << b.losses << std::endl;
        }
        std::cout << "  Total: W: " << summary.total_wins
                  << " D: " << summary.total_draws
                  << " L: " << summary.total_losses << std::endl;
    }
}

// ============================================================================
// CONSOLE
// ============================================================================

class Console {
public:
    explicit Console(GameSession& session) : session_(session) {}

    void run() {
        std::cout << "Welcome to Pymon World " << get_version() << std::endl;
        std::cout << "=====================================\n" << std::endl;

        if (auto view = session_.current_location()) {
            show_location(*view);
        }

        std::string line;
        while (!session_.is_game_over()) {
            std::cout << "\n> ";
            if (!std::getline(std::cin, line)) {
                break;
            }

            auto args = split(line);
            if (args.empty()) continue;

            const std::string cmd = to_lower(args[0]);

            if (cmd == "quit" || cmd == "exit" || cmd == "q") {
                break;
            } else if (cmd == "help" || cmd == "h" || cmd == "?") {
                print_help();
            } else if (cmd == "look" || cmd == "l") {
                cmd_look();
            } else if (cmd == "pymon" || cmd == "p") {
                cmd_pymon();
            } else if (cmd == "pets") {
                cmd_pets();
            } else if (cmd == "switch") {
                cmd_switch(args);
            } else if (cmd == "move" || cmd == "m") {
                cmd_move(args);
            } else if (cmd == "pick") {
                cmd_pick(args);
            } else if (cmd == "inventory" || cmd == "i") {
                cmd_inventory();
            } else if (cmd == "use") {
                cmd_use(args);
            } else if (cmd == "items") {
                cmd_items();
            } else if (cmd == "challenge" || cmd == "c") {
                cmd_challenge(args);
            } else if (cmd == "stats") {
                cmd_stats(args);
            } else {
                std::cout << "Unknown command: '" << args[0] << "'. Type 'help' for commands." << std::endl;
            }
        }

        if (session_.is_game_over()) {
            std::cout << "\nGAME OVER" << std::endl;
            show_stats(session_.battle_report());
        }
        std::cout << "Goodbye!" << std::endl;
    }

private:
    GameSession& session_;

    void cmd_look() {
        auto view = session_.current_location();
        if (!view.has_value()) {
            std::cout << "You dont have an active Pymon." << std::endl;
            return;
        }
        show_location(*view);
    }

    void cmd_pymon() {
        auto pymon = session_.active_pymon();
        if (!pymon.has_value()) {
            std::cout << "You dont have an active Pymon." << std::endl;
            return;
        }
        show_pymon(*pymon, "Active Pymon: ");
    }

    void cmd_pets() {
        auto bench = session_.bench();
        if (bench.empty()) {
            std::cout << "You have no other Pymons yet." << std::endl;
            return;
        }
        for (size_t i = 0; i < bench.size(); i++) {
            show_pymon(bench[i], std::to_string(i + 1) + ") ");
        }
    }

    void cmd_switch(const std::vector<std::string>& args) {
        if (args.size() < 2) {
            std::cout << "Usage: switch <number>" << std::endl;
            return;
        }

        int choice = 0;
        try {
            choice = std::stoi(args[1]);
        } catch (const std::exception&) {
            std::cout << "Invalid selection." << std::endl;
            return;
        }
        if (choice < 1) {
            std::cout << "Invalid selection." << std::endl;
            return;
        }

        auto result = session_.switch_active(static_cast<size_t>(choice - 1));
        std::cout << result.effect_description << std::endl;
    }

    void cmd_move(const std::vector<std::string>& args) {
        if (args.size() < 2) {
            std::cout << "Usage: move <west|north|east|south>" << std::endl;
            return;
        }

        auto result = session_.move(args[1]);
        std::cout << result.effect_description << std::endl;
        if (!result.success) {
            return;
        }

        if (result.energy_dropped) {
            std::cout << "Your Pymon is getting tired. Energy: " << result.energy_after
                      << "/" << MAX_ENERGY << std::endl;
        }
        if (result.escaped) {
            std::cout << "Out of energy! Your Pymon ran off to " << result.escape_destination << "." << std::endl;
        } else if (result.escape_blocked) {
            std::cout << "Out of energy, and there is nowhere to run." << std::endl;
        }

        cmd_look();
    }

    void cmd_pick(const std::vector<std::string>& args) {
        if (args.size() < 2) {
            std::cout << "Usage: pick <item>" << std::endl;
            return;
        }
        auto result = session_.pick(join(args, 1, args.size()));
        std::cout << result.effect_description << std::endl;
    }

    void cmd_inventory() {
        auto items = session_.inventory();
        if (items.empty()) {
            std::cout << "Your inventory is empty." << std::endl;
            return;
        }
        std::cout << "Inventory:" << std::endl;
        for (const auto& item : items) {
            std::cout << "  - " << item.name;
            if (!item.description.empty()) {
                std::cout << ": " << item.description;
            }
            std::cout << std::endl;
        }
    }

    void cmd_use(const std::vector<std::string>& args) {
        if (args.size() < 2) {
            std::cout << "Usage: use <item> [direction]" << std::endl;
            return;
        }

        std::string name = join(args, 1, args.size());
        std::string argument;

        // "use binocular north": trailing word is the argument
        if (!items::requires_direction(name) && args.size() > 2) {
            std::string head = join(args, 1, args.size() - 1);
            if (items::requires_direction(head)) {
                name = head;
                argument = args.back();
            }
        }

        if (items::requires_direction(name) && argument.empty()) {
            std::cout << "Enter 'current' or a direction (west, north, east, south): ";
            if (!std::getline(std::cin, argument)) {
                return;
            }
            auto tokens = split(argument);
            argument = tokens.empty() ? "" : tokens[0];
        }

        auto result = session_.use_item(name, argument);
        std::cout << result.effect_description << std::endl;
    }

    void cmd_items() {
        std::cout << "Usable items:" << std::endl;
        for (const auto& info : items::get_item_info()) {
            std::cout << "  " << info.name << " - " << info.description << std::endl;
        }
    }

    void cmd_challenge(const std::vector<std::string>& args) {
        if (args.size() < 2) {
            std::cout << "Usage: challenge <creature>" << std::endl;
            return;
        }

        MoveSource next_move = []() -> std::optional<std::string> {
            std::cout << "Your move (rock, paper, scissors): ";
            std::string line;
            if (!std::getline(std::cin, line)) {
                return std::nullopt;
            }
            auto tokens = split(line);
            return tokens.empty() ? std::string() : tokens[0];
        };

        RoundObserver observer = [](const RoundReport& round) {
            if (round.accepted) {
                std::cout << "Opponent chose " << to_string(round.opponent_move) << ". ";
            }
            std::cout << round.effect_description << std::endl;
        };

        auto result = session_.challenge(join(args, 1, args.size()), next_move, nullptr, observer);
        std::cout << result.effect_description << std::endl;

        if (result.state == ChallengeState::RESOLVED) {
            std::cout << "Result: W: " << result.wins << " D: " << result.draws
                      << " L: " << result.losses << std::endl;
        }
    }

    void cmd_stats(const std::vector<std::string>& args) {
        if (args.size() > 1 && to_lower(args[1]) == "json") {
            std::cout << session_.stats().to_json().dump(2) << std::endl;
            return;
        }
        show_stats(session_.battle_report());
    }
};

// ============================================================================
// MAIN
// ============================================================================

int main(int argc, char* argv[]) {
    std::vector<std::string> args(argv + 1, argv + argc);
    std::string program = argc > 0 ? argv[0] : "pymon_console";

    auto parsed = parse_args(args);
    if (!parsed.success) {
        std::cerr << parsed.error << "\n" << usage_text(program);
        return 1;
    }

    const SessionConfig& config = parsed.config;
    if (config.show_help) {
        std::cout << usage_text(program);
        return 0;
    }

    WorldLoader loader;
    if (!loader.load_from_json(config.world_file)) {
        std::cerr << "Cannot start: " << loader.error_message() << std::endl;
        return 1;
    }

    std::unique_ptr<GameSession> session = config.seed.has_value()
        ? std::make_unique<GameSession>(*config.seed)
        : std::make_unique<GameSession>();

    if (!session->setup(loader.definition(), config.starter_nickname, config.starter_description)) {
        std::cerr << "Cannot start: the world in " << config.world_file << " is not playable" << std::endl;
        return 1;
    }

    std::unique_ptr<XRayLogger> xray_logger;
    if (config.xray_enabled) {
        xray_logger = std::make_unique<XRayLogger>(config.xray_dir);
        session->set_logger(xray_logger.get());
        xray_logger->log_state(*session);
    }

    Console console(*session);
    console.run();
    return 0;
}
