/**
 * Pymon Engine - World Graph
 *
 * Owns every location and every wild creature, the directional adjacency
 * between locations, and the movement rules (energy decay, forced escape).
 */

#pragma once

#include "location.hpp"
#include "actor.hpp"
#include <random>

namespace pymon {

/**
 * Result of a move request.
 */
struct MoveResult {
    bool success = false;
    ErrorCode error = ErrorCode::NONE;
    std::string effect_description;

    LocationName from;
    LocationName to;

    bool energy_dropped = false;
    int energy_after = 0;

    // Forced relocation after energy ran out
    bool escaped = false;
    bool escape_blocked = false;
    LocationName escape_destination;
};

/**
 * Read-only snapshot of a location for the presentation layer.
 */
struct LocationView {
    LocationName name;
    std::string description;
    std::vector<std::string> creatures;
    std::vector<std::string> items;
    std::vector<std::pair<Direction, LocationName>> doors;

    bool is_empty() const {
        return creatures.empty() && items.empty();
    }
};

/**
 * WorldGraph - Locations, doors and placement.
 *
 * Locations are never destroyed during a session, so references to them by
 * name stay valid for the lifetime of the graph.
 */
class WorldGraph {
public:
    WorldGraph() = default;
    ~WorldGraph() = default;

    // ========================================================================
    // CONSTRUCTION
    // ========================================================================

    /**
     * Register a new location.
     *
     * @return INVALID_SELECTION if the name is empty or already taken
     */
    ErrorCode add_location(const LocationName& name, const std::string& description);

    /**
     * Connect two locations in both directions.
     *
     * Sets from.doors[direction] = to and to.doors[opposite(direction)] = from.
     *
     * @return INVALID_DIRECTION for a non-cardinal direction,
     *         INVALID_SELECTION for an unknown location
     */
    ErrorCode connect(const LocationName& from, const std::string& direction, const LocationName& to);
    ErrorCode connect(const LocationName& from, Direction direction, const LocationName& to);

    /**
     * Assign a single door slot without touching the reciprocal one (one-way door).
     */
    ErrorCode set_door(const LocationName& from, Direction direction, const LocationName& to);

    // ========================================================================
    // LOOKUP
    // ========================================================================

    Location* find_location(const LocationName& name);
    const Location* find_location(const LocationName& name) const;

    bool has_location(const LocationName& name) const {
        return locations_.find(name) != locations_.end();
    }

    // Names in insertion order
    const std::vector<LocationName>& location_names() const { return order_; }

    size_t location_count() const { return locations_.size(); }

    /**
     * Build a view of a location, leaving out one occupant (usually the viewer).
     */
    std::optional<LocationView> view(const LocationName& name, const ActorID& exclude_id = "") const;

    // ========================================================================
    // PLACEMENT
    // ========================================================================

    /**
     * Put an actor into a location's occupant list and update its location field.
     */
    bool place_actor(Actor& actor, const LocationName& where);

    /**
     * Remove an actor from the occupant list of its recorded location.
     */
    bool remove_actor(const Actor& actor);

    bool add_item(const LocationName& where, Item item);

    // ========================================================================
    // WILD CREATURES
    // ========================================================================

    /**
     * Take ownership of a wild creature and place it.
     *
     * @return pointer to the stored creature, nullptr if the location is unknown
     */
    Actor* add_creature(Actor creature, const LocationName& where);

    Actor* find_creature(const ActorID& id);
    const Actor* find_creature(const ActorID& id) const;

    /**
     * Remove a wild creature from the world (table and occupant list).
     */
    std::optional<Actor> take_creature(const ActorID& id);

    size_t creature_count() const { return creatures_.size(); }

    // ========================================================================
    // MOVEMENT
    // ========================================================================

    /**
     * Move a Pymon through a door.
     *
     * Every MOVES_PER_ENERGY_DROP successful moves cost one energy. When energy
     * reaches zero the Pymon escapes to a random non-empty neighbor of the
     * location it just entered. With no neighbor the escape is blocked and the
     * Pymon stays put.
     */
    MoveResult move(Actor& pymon, const std::string& direction, std::mt19937& rng);

private:
    std::unordered_map<LocationName, Location> locations_;
    std::vector<LocationName> order_;
    std::unordered_map<ActorID, Actor> creatures_;

    void relocate(Actor& actor, Location& from, Location& to);
};

} // namespace pymon
