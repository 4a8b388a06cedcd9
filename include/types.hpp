/**
 * Pymon Engine - Core Type Definitions
 *
 * This file defines all enums, constants and basic types used throughout the engine.
 */

#pragma once

#include <algorithm>
#include <array>
#include <cctype>
#include <cstdint>
#include <string>
#include <vector>
#include <unordered_map>
#include <optional>

namespace pymon {

// ============================================================================
// ENUMS
// ============================================================================

enum class Direction : uint8_t {
    WEST,
    NORTH,
    EAST,
    SOUTH
};

enum class RpsMove : uint8_t {
    ROCK,
    PAPER,
    SCISSORS
};

enum class RoundOutcome : uint8_t {
    WIN,
    DRAW,
    LOSS
};

enum class ChallengeState : uint8_t {
    SEARCHING_OPPONENT,
    DIALOGUE_ONLY,
    IN_PROGRESS,
    RESOLVED
};

enum class MatchOutcome : uint8_t {
    NONE,
    CAPTURED,
    SUBSTITUTED,
    GAME_OVER
};

enum class SessionStatus : uint8_t {
    NOT_STARTED,
    ONGOING,
    GAME_OVER
};

enum class ErrorCode : uint8_t {
    NONE,
    INVALID_DIRECTION,
    INVALID_INPUT_FORMAT,
    INVALID_SELECTION,
    GAME_OVER
};

// ============================================================================
// TYPE ALIASES
// ============================================================================

using ActorID = std::string;        // Unique instance ID (e.g., "creature_3")
using LocationName = std::string;   // Locations are keyed by their unique name

// ============================================================================
// GAME CONSTANTS
// ============================================================================

constexpr int MAX_ENERGY = 3;
constexpr int MOVES_PER_ENERGY_DROP = 2;
constexpr int WINS_TO_CAPTURE = 2;
constexpr int LOSSES_TO_FORFEIT = 2;
constexpr double DUPLICATE_CONSUMABLE_CHANCE = 0.5;

constexpr std::array<Direction, 4> ALL_DIRECTIONS = {
    Direction::WEST, Direction::NORTH, Direction::EAST, Direction::SOUTH
};

// ============================================================================
// UTILITY FUNCTIONS
// ============================================================================

inline std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

inline bool iequals(const std::string& a, const std::string& b) {
    if (a.size() != b.size()) return false;
    for (size_t i = 0; i < a.size(); i++) {
        if (std::tolower(static_cast<unsigned char>(a[i])) !=
            std::tolower(static_cast<unsigned char>(b[i]))) {
            return false;
        }
    }
    return true;
}

inline const char* to_string(Direction dir) {
    switch (dir) {
        case Direction::WEST: return "west";
        case Direction::NORTH: return "north";
        case Direction::EAST: return "east";
        case Direction::SOUTH: return "south";
        default: return "unknown";
    }
}

inline const char* to_string(RpsMove move) {
    switch (move) {
        case RpsMove::ROCK: return "rock";
        case RpsMove::PAPER: return "paper";
        case RpsMove::SCISSORS: return "scissors";
        default: return "unknown";
    }
}

inline const char* to_string(RoundOutcome outcome) {
    switch (outcome) {
        case RoundOutcome::WIN: return "win";
        case RoundOutcome::DRAW: return "draw";
        case RoundOutcome::LOSS: return "loss";
        default: return "unknown";
    }
}

inline const char* to_string(ChallengeState state) {
    switch (state) {
        case ChallengeState::SEARCHING_OPPONENT: return "searching_opponent";
        case ChallengeState::DIALOGUE_ONLY: return "dialogue_only";
        case ChallengeState::IN_PROGRESS: return "in_progress";
        case ChallengeState::RESOLVED: return "resolved";
        default: return "unknown";
    }
}

inline const char* to_string(MatchOutcome outcome) {
    switch (outcome) {
        case MatchOutcome::NONE: return "none";
        case MatchOutcome::CAPTURED: return "captured";
        case MatchOutcome::SUBSTITUTED: return "substituted";
        case MatchOutcome::GAME_OVER: return "game_over";
        default: return "unknown";
    }
}

inline const char* to_string(SessionStatus status) {
    switch (status) {
        case SessionStatus::NOT_STARTED: return "not_started";
        case SessionStatus::ONGOING: return "ongoing";
        case SessionStatus::GAME_OVER: return "game_over";
        default: return "unknown";
    }
}

inline const char* to_string(ErrorCode code) {
    switch (code) {
        case ErrorCode::NONE: return "none";
        case ErrorCode::INVALID_DIRECTION: return "invalid_direction";
        case ErrorCode::INVALID_INPUT_FORMAT: return "invalid_input_format";
        case ErrorCode::INVALID_SELECTION: return "invalid_selection";
        case ErrorCode::GAME_OVER: return "game_over";
        default: return "unknown";
    }
}

/**
 * Parse a direction name (case-insensitive).
 * Returns nullopt for anything other than west/north/east/south.
 */
inline std::optional<Direction> parse_direction(const std::string& s) {
    std::string lower = to_lower(s);
    if (lower == "west") return Direction::WEST;
    if (lower == "north") return Direction::NORTH;
    if (lower == "east") return Direction::EAST;
    if (lower == "south") return Direction::SOUTH;
    return std::nullopt;
}

inline std::optional<RpsMove> parse_rps_move(const std::string& s) {
    std::string lower = to_lower(s);
    if (lower == "rock") return RpsMove::ROCK;
    if (lower == "paper") return RpsMove::PAPER;
    if (lower == "scissors") return RpsMove::SCISSORS;
    return std::nullopt;
}

inline Direction opposite(Direction dir) {
    switch (dir) {
        case Direction::WEST: return Direction::EAST;
        case Direction::NORTH: return Direction::SOUTH;
        case Direction::EAST: return Direction::WEST;
        case Direction::SOUTH: return Direction::NORTH;
    }
    return dir;
}

// Rock beats scissors, scissors beats paper, paper beats rock.
inline RoundOutcome judge_round(RpsMove player, RpsMove opponent) {
    if (player == opponent) {
        return RoundOutcome::DRAW;
    }
    bool player_wins = (player == RpsMove::ROCK && opponent == RpsMove::SCISSORS) ||
                       (player == RpsMove::SCISSORS && opponent == RpsMove::PAPER) ||
                       (player == RpsMove::PAPER && opponent == RpsMove::ROCK);
    return player_wins ? RoundOutcome::WIN : RoundOutcome::LOSS;
}

} // namespace pymon
