/**
 * Pymon Engine - Location
 *
 * A node of the world graph: four directional doors, the creatures
 * currently standing here and the items lying on the ground.
 */

#pragma once

#include "inventory.hpp"

namespace pymon {

/**
 * Occupant - Presence record of a creature in a location.
 */
struct Occupant {
    ActorID id;
    std::string nickname;
};

/**
 * Location - One room of the world.
 *
 * Doors reference other locations by name; an empty slot means no exit.
 */
struct Location {
    LocationName name;
    std::string description;
    std::array<std::optional<LocationName>, 4> doors;
    std::vector<Occupant> occupants;
    Inventory items;

    // ========================================================================
    // CONSTRUCTORS
    // ========================================================================

    Location() = default;

    Location(LocationName name_, std::string description_)
        : name(std::move(name_))
        , description(std::move(description_))
    {}

    // ========================================================================
    // DOORS
    // ========================================================================

    const std::optional<LocationName>& door(Direction dir) const {
        return doors[static_cast<size_t>(dir)];
    }

    void set_door(Direction dir, const LocationName& target) {
        doors[static_cast<size_t>(dir)] = target;
    }

    bool has_door(Direction dir) const {
        const auto& d = door(dir);
        return d.has_value() && !d->empty();
    }

    // Names of every non-empty neighbor, in west/north/east/south order
    std::vector<LocationName> neighbors() const {
        std::vector<LocationName> result;
        for (Direction dir : ALL_DIRECTIONS) {
            if (has_door(dir)) {
                result.push_back(*door(dir));
            }
        }
        return result;
    }

    // ========================================================================
    // OCCUPANTS
    // ========================================================================

    void add_occupant(const ActorID& id, const std::string& nickname) {
        occupants.push_back(Occupant{id, nickname});
    }

    bool remove_occupant(const ActorID& id) {
        for (auto it = occupants.begin(); it != occupants.end(); ++it) {
            if (it->id == id) {
                occupants.erase(it);
                return true;
            }
        }
        return false;
    }

    bool has_occupant(const ActorID& id) const {
        for (const auto& o : occupants) {
            if (o.id == id) return true;
        }
        return false;
    }

    // Exact (case-sensitive) nickname match, first occupant wins
    const Occupant* find_occupant_by_nickname(const std::string& nickname) const {
        for (const auto& o : occupants) {
            if (o.nickname == nickname) {
                return &o;
            }
        }
        return nullptr;
    }
};

} // namespace pymon
