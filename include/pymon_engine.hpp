/**
 * Pymon Engine - C++ Implementation
 *
 * Text adventure engine: a graph of locations, creatures to befriend through
 * rock/paper/scissors battles, and items that change energy, immunity or sight.
 *
 * Include this header to get access to the complete engine API.
 */

#pragma once

// Core types
#include "types.hpp"

// Data structures
#include "item.hpp"
#include "inventory.hpp"
#include "player_state.hpp"
#include "actor.hpp"
#include "location.hpp"

// World
#include "world_graph.hpp"
#include "world_loader.hpp"

// Rules
#include "item_registry.hpp"
#include "creature_roster.hpp"
#include "battle_stats.hpp"
#include "battle_engine.hpp"

// Session
#include "session_config.hpp"
#include "game_session.hpp"

namespace pymon {

/**
 * Version information.
 */
constexpr int VERSION_MAJOR = 1;
constexpr int VERSION_MINOR = 0;
constexpr int VERSION_PATCH = 0;

inline std::string get_version() {
    return std::to_string(VERSION_MAJOR) + "." +
           std::to_string(VERSION_MINOR) + "." +
           std::to_string(VERSION_PATCH);
}

} // namespace pymon
