/**
 * Pymon Engine - Actor
 *
 * Any creature placeable in a location. Player-controlled creatures
 * (Pymons) carry an additional PlayerState payload.
 */

#pragma once

#include <optional>
#include "player_state.hpp"

namespace pymon {

/**
 * Actor - A creature instance.
 *
 * The location field is a lookup relation only; the occupant list of the
 * location is the authoritative record of presence.
 */
struct Actor {
    ActorID id;
    std::string nickname;
    std::string description;
    LocationName location;
    bool adoptable = false;

    // Present only for Pymons (active or benched)
    std::optional<PlayerState> player;

    // ========================================================================
    // CONSTRUCTORS
    // ========================================================================

    Actor() = default;

    Actor(ActorID id_, std::string nickname_, std::string description_, bool adoptable_)
        : id(std::move(id_))
        , nickname(std::move(nickname_))
        , description(std::move(description_))
        , adoptable(adoptable_)
    {}

    /**
     * Create a Pymon at full energy.
     */
    static Actor make_pymon(ActorID id, std::string nickname, std::string description,
                            LocationName location = "") {
        Actor a(std::move(id), std::move(nickname), std::move(description), false);
        a.location = std::move(location);
        a.player = PlayerState(MAX_ENERGY);
        return a;
    }

    // ========================================================================
    // QUERIES
    // ========================================================================

    bool is_pymon() const {
        return player.has_value();
    }

    int energy() const {
        return player.has_value() ? player->energy : 0;
    }
};

} // namespace pymon
