/**
 * Pymon Engine - Player State
 *
 * The payload carried only by player-controlled creatures (Pymons):
 * energy, inventory, movement decay counter and battle immunity.
 */

#pragma once

#include "inventory.hpp"

namespace pymon {

/**
 * PlayerState - Mutable state of one owned Pymon.
 *
 * Energy is kept within [0, MAX_ENERGY] by every mutator.
 */
struct PlayerState {
    int energy = MAX_ENERGY;
    Inventory inventory;

    // Successful moves since the last energy drop
    int move_counter = 0;

    // Set by Magic Potion, cleared when the next battle resolves
    bool immune = false;

    // ========================================================================
    // CONSTRUCTORS
    // ========================================================================

    PlayerState() = default;

    explicit PlayerState(int energy_)
        : energy(std::clamp(energy_, 0, MAX_ENERGY))
    {}

    // ========================================================================
    // ENERGY
    // ========================================================================

    bool has_full_energy() const {
        return energy >= MAX_ENERGY;
    }

    bool is_exhausted() const {
        return energy <= 0;
    }

    void set_energy(int value) {
        energy = std::clamp(value, 0, MAX_ENERGY);
    }

    void gain_energy(int amount = 1) {
        set_energy(energy + amount);
    }

    void drain_energy(int amount = 1) {
        set_energy(energy - amount);
    }

    /**
     * Count one successful move.
     *
     * @return true if this move crossed the decay threshold and cost energy
     */
    bool register_move() {
        move_counter++;
        if (move_counter >= MOVES_PER_ENERGY_DROP) {
            move_counter = 0;
            drain_energy();
            return true;
        }
        return false;
    }
};

} // namespace pymon
