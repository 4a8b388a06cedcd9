/**
 * Pymon Engine - World Graph Implementation
 */

#include "world_graph.hpp"
#include <iostream>

namespace pymon {

// ============================================================================
// CONSTRUCTION
// ============================================================================

ErrorCode WorldGraph::add_location(const LocationName& name, const std::string& description) {
    if (name.empty() || has_location(name)) {
        return ErrorCode::INVALID_SELECTION;
    }
    locations_.emplace(name, Location(name, description));
    order_.push_back(name);
    return ErrorCode::NONE;
}

ErrorCode WorldGraph::connect(const LocationName& from, const std::string& direction,
                              const LocationName& to) {
    auto dir = parse_direction(direction);
    if (!dir.has_value()) {
        return ErrorCode::INVALID_DIRECTION;
    }
    return connect(from, *dir, to);
}

ErrorCode WorldGraph::connect(const LocationName& from, Direction direction, const LocationName& to) {
    Location* a = find_location(from);
    Location* b = find_location(to);
    if (!a || !b) {
        return ErrorCode::INVALID_SELECTION;
    }

    a->set_door(direction, b->name);
    b->set_door(opposite(direction), a->name);
    return ErrorCode::NONE;
}

ErrorCode WorldGraph::set_door(const LocationName& from, Direction direction, const LocationName& to) {
    Location* a = find_location(from);
    if (!a || !has_location(to)) {
        return ErrorCode::INVALID_SELECTION;
    }
    a->set_door(direction, to);
    return ErrorCode::NONE;
}

// ============================================================================
// LOOKUP
// ============================================================================

Location* WorldGraph::find_location(const LocationName& name) {
    auto it = locations_.find(name);
    return it != locations_.end() ? &it->second : nullptr;
}

const Location* WorldGraph::find_location(const LocationName& name) const {
    auto it = locations_.find(name);
    return it != locations_.end() ? &it->second : nullptr;
}

std::optional<LocationView> WorldGraph::view(const LocationName& name, const ActorID& exclude_id) const {
    const Location* loc = find_location(name);
    if (!loc) {
        return std::nullopt;
    }

    LocationView v;
    v.name = loc->name;
    v.description = loc->description;

    for (const auto& o : loc->occupants) {
        if (!exclude_id.empty() && o.id == exclude_id) continue;
        v.creatures.push_back(o.nickname);
    }
    v.items = loc->items.names();

    for (Direction dir : ALL_DIRECTIONS) {
        if (loc->has_door(dir)) {
            v.doors.emplace_back(dir, *loc->door(dir));
        }
    }

    return v;
}

// ============================================================================
// PLACEMENT
// ============================================================================

bool WorldGraph::place_actor(Actor& actor, const LocationName& where) {
    Location* loc = find_location(where);
    if (!loc) {
        return false;
    }
    loc->add_occupant(actor.id, actor.nickname);
    actor.location = loc->name;
    return true;
}

bool WorldGraph::remove_actor(const Actor& actor) {
    Location* loc = find_location(actor.location);
    if (!loc) {
        return false;
    }
    return loc->remove_occupant(actor.id);
}

bool WorldGraph::add_item(const LocationName& where, Item item) {
    Location* loc = find_location(where);
    if (!loc) {
        return false;
    }
    loc->items.add_item(std::move(item));
    return true;
}

// ============================================================================
// WILD CREATURES
// ============================================================================

Actor* WorldGraph::add_creature(Actor creature, const LocationName& where) {
    if (!has_location(where) || creature.id.empty() || creatures_.count(creature.id) > 0) {
        return nullptr;
    }

    ActorID id = creature.id;
    auto [it, inserted] = creatures_.emplace(id, std::move(creature));
    place_actor(it->second, where);
    return &it->second;
}

Actor* WorldGraph::find_creature(const ActorID& id) {
    auto it = creatures_.find(id);
    return it != creatures_.end() ? &it->second : nullptr;
}

const Actor* WorldGraph::find_creature(const ActorID& id) const {
    auto it = creatures_.find(id);
    return it != creatures_.end() ? &it->second : nullptr;
}

std::optional<Actor> WorldGraph::take_creature(const ActorID& id) {
    auto it = creatures_.find(id);
    if (it == creatures_.end()) {
        return std::nullopt;
    }

    Actor removed = std::move(it->second);
    creatures_.erase(it);
    remove_actor(removed);
    return removed;
}

// ============================================================================
// MOVEMENT
// ============================================================================

void WorldGraph::relocate(Actor& actor, Location& from, Location& to) {
    from.remove_occupant(actor.id);
    to.add_occupant(actor.id, actor.nickname);
    actor.location = to.name;
}

MoveResult WorldGraph::move(Actor& pymon, const std::string& direction, std::mt19937& rng) {
    MoveResult result;
    result.from = pymon.location;
    result.energy_after = pymon.energy();

    auto dir = parse_direction(direction);
    if (!dir.has_value()) {
        result.error = ErrorCode::INVALID_DIRECTION;
        result.effect_description = "Direction - " + direction + " does not contain any location";
        return result;
    }

    Location* current = find_location(pymon.location);
    if (!current || !current->has_door(*dir) || !has_location(*current->door(*dir))) {
        result.error = ErrorCode::INVALID_DIRECTION;
        result.effect_description = "Direction - " + direction + " does not contain any location";
        return result;
    }

    if (!pymon.player.has_value()) {
        result.error = ErrorCode::INVALID_SELECTION;
        result.effect_description = pymon.nickname + " cannot be moved";
        return result;
    }

    Location* destination = find_location(*current->door(*dir));
    relocate(pymon, *current, *destination);

    result.success = true;
    result.to = destination->name;
    result.effect_description = "You moved to: " + destination->name;

    PlayerState& ps = *pymon.player;
    result.energy_dropped = ps.register_move();
    result.energy_after = ps.energy;

    if (result.energy_dropped && ps.is_exhausted()) {
        std::vector<LocationName> exits = destination->neighbors();
        if (exits.empty()) {
            result.escape_blocked = true;
            std::cerr << "[WorldGraph] " << pymon.nickname << " is exhausted in "
                      << destination->name << " but there is no exit to escape through" << std::endl;
        } else {
            std::uniform_int_distribution<size_t> pick(0, exits.size() - 1);
            Location* escape_to = find_location(exits[pick(rng)]);
            if (escape_to) {
                relocate(pymon, *destination, *escape_to);
                result.escaped = true;
                result.escape_destination = escape_to->name;
            } else {
                result.escape_blocked = true;
            }
        }
    }

    return result;
}

} // namespace pymon
