/**
 * Pymon Engine - Game Session
 *
 * The primary interface of the engine. Owns the world, the player's roster,
 * the battle ledger and the random generator, and turns external commands
 * into structured results. Never prints game output itself.
 */

#pragma once

#include "world_graph.hpp"
#include "creature_roster.hpp"
#include "battle_engine.hpp"
#include "battle_stats.hpp"
#include "item_registry.hpp"
#include "world_loader.hpp"
#include <random>

namespace pymon {

// Forward declaration
class XRayLogger;

/**
 * GameSession - One game, from setup to game over.
 *
 * Not thread-safe; a session is driven by a single command loop.
 */
class GameSession {
public:
    GameSession();
    explicit GameSession(uint32_t seed);
    ~GameSession() = default;

    GameSession(const GameSession&) = delete;
    GameSession& operator=(const GameSession&) = delete;

    // ========================================================================
    // SETUP
    // ========================================================================

    /**
     * Build the world from parsed records.
     *
     * Locations are connected as their records describe. The starting Pymon,
     * every creature and every item go to uniformly random locations; each
     * consumable item is duplicated into a second random location with
     * probability DUPLICATE_CONSUMABLE_CHANCE.
     *
     * @return false if the records cannot form a world (no locations, bad doors)
     */
    bool setup(const WorldDefinition& definition,
               const std::string& starter_nickname = "Kimimon",
               const std::string& starter_description = "");

    /**
     * Put a starting Pymon into an already built world at a chosen location.
     * Used when the world is assembled by hand (tests, bindings). Fails once
     * the game is over.
     */
    bool spawn_starter(const std::string& nickname,
                       const std::string& description,
                       const LocationName& where);

    /**
     * Add a wild creature at a chosen location. Returns its instance ID.
     */
    std::optional<ActorID> spawn_creature(const std::string& nickname,
                                          const std::string& description,
                                          bool adoptable,
                                          const LocationName& where);

    // ========================================================================
    // COMMANDS
    // ========================================================================

    MoveResult move(const std::string& direction);

    PickResult pick(const std::string& item_name);

    ItemResult use_item(const std::string& item_name, const std::string& argument = "");

    /**
     * Challenge a creature in the active Pymon's location.
     *
     * @param next_move Player input for each round
     * @param opponent Opponent policy; uniform random when empty
     * @param observer Called after each round (optional)
     */
    ChallengeResult challenge(const std::string& opponent_name,
                              const MoveSource& next_move,
                              const OpponentPolicy& opponent = nullptr,
                              const RoundObserver& observer = nullptr);

    /**
     * Make a benched Pymon active (0-based bench index).
     */
    SwitchResult switch_active(size_t bench_index);

    // ========================================================================
    // QUERIES
    // ========================================================================

    std::optional<LocationView> current_location() const;
    std::vector<Item> inventory() const;
    std::optional<PymonView> active_pymon() const;
    std::vector<PymonView> bench() const;
    std::vector<PymonBattleSummary> battle_report() const;

    SessionStatus status() const { return status_; }
    bool is_game_over() const { return status_ == SessionStatus::GAME_OVER; }
    int command_count() const { return command_count_; }

    // ========================================================================
    // COMPONENT ACCESS
    // ========================================================================

    WorldGraph& world() { return world_; }
    const WorldGraph& world() const { return world_; }

    CreatureRoster& roster() { return roster_; }
    const CreatureRoster& roster() const { return roster_; }

    const BattleStats& stats() const { return stats_; }

    ItemRegistry& item_registry() { return item_registry_; }
    const ItemRegistry& item_registry() const { return item_registry_; }

    std::mt19937& rng() { return rng_; }

    /**
     * Attach an X-Ray logger (not owned). Every command is traced while set.
     */
    void set_logger(XRayLogger* logger) { logger_ = logger; }

private:
    WorldGraph world_;
    CreatureRoster roster_;
    BattleStats stats_;
    ItemRegistry item_registry_;
    BattleEngine battle_engine_;
    std::mt19937 rng_;

    SessionStatus status_ = SessionStatus::NOT_STARTED;
    int command_count_ = 0;
    int next_actor_id_ = 1;
    XRayLogger* logger_ = nullptr;

    ActorID make_actor_id(const std::string& prefix);
    const LocationName& random_location();

    /**
     * Check that commands may run. Fills error and description otherwise.
     */
    bool ready_for_command(ErrorCode& error, std::string& description) const;

    void trace_command(const std::string& command, const std::string& outcome);
};

} // namespace pymon
