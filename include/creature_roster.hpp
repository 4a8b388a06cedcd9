/**
 * Pymon Engine - Creature Roster
 *
 * The player's owned Pymons: one active Pymon walking the world and an
 * ordered bench of captured pets.
 */

#pragma once

#include "world_graph.hpp"

namespace pymon {

/**
 * Result of a manual switch request.
 */
struct SwitchResult {
    bool success = false;
    ErrorCode error = ErrorCode::NONE;
    std::string effect_description;
};

/**
 * Read-only summary of one owned Pymon.
 */
struct PymonView {
    std::string nickname;
    std::string description;
    LocationName location;
    int energy = 0;
    bool immune = false;
    std::vector<std::string> inventory;
};

/**
 * CreatureRoster - Active Pymon plus bench.
 *
 * Captures are pushed to the back of the bench; substitution after a lost
 * battle takes the pet at the front. Only the active Pymon is listed as an
 * occupant of a location; benched pets remember where they were last.
 */
class CreatureRoster {
public:
    CreatureRoster() = default;
    ~CreatureRoster() = default;

    // ========================================================================
    // ACTIVE PYMON
    // ========================================================================

    void set_active(Actor pymon) { active_ = std::move(pymon); }

    bool has_active() const { return active_.has_value(); }

    Actor* active() { return active_.has_value() ? &active_.value() : nullptr; }
    const Actor* active() const { return active_.has_value() ? &active_.value() : nullptr; }

    // ========================================================================
    // BENCH
    // ========================================================================

    void add_pet(Actor pet) { bench_.push_back(std::move(pet)); }

    const std::vector<Actor>& bench() const { return bench_; }

    int bench_count() const { return static_cast<int>(bench_.size()); }

    bool has_pets() const { return !bench_.empty(); }

    // ========================================================================
    // SUBSTITUTION
    // ========================================================================

    /**
     * Make bench[index] the active Pymon; the previous active goes to the
     * back of the bench. The new active appears at its own recorded location.
     *
     * @param index 0-based bench index
     * @return INVALID_SELECTION for a bad index, with no state change
     */
    SwitchResult switch_active(size_t index, WorldGraph& world);

    /**
     * Replace a defeated active Pymon with the pet at the front of the bench.
     *
     * The defeated Pymon hands its whole inventory to the successor and leaves
     * the game. Returns false (and changes nothing) if the bench is empty.
     */
    bool promote_next(WorldGraph& world);

    // ========================================================================
    // QUERIES
    // ========================================================================

    std::optional<PymonView> active_view() const;
    std::vector<PymonView> bench_view() const;

    static PymonView make_view(const Actor& pymon);

private:
    std::optional<Actor> active_;
    std::vector<Actor> bench_;

    void bring_into_world(Actor& pymon, const LocationName& fallback, WorldGraph& world);
};

} // namespace pymon
