/**
 * Pymon Engine - Creature Roster Implementation
 */

#include "creature_roster.hpp"

namespace pymon {

void CreatureRoster::bring_into_world(Actor& pymon, const LocationName& fallback, WorldGraph& world) {
    if (!world.place_actor(pymon, pymon.location)) {
        world.place_actor(pymon, fallback);
    }
}

// ============================================================================
// SUBSTITUTION
// ============================================================================

SwitchResult CreatureRoster::switch_active(size_t index, WorldGraph& world) {
    SwitchResult result;

    if (!active_.has_value()) {
        result.error = ErrorCode::INVALID_SELECTION;
        result.effect_description = "You dont have an active Pymon";
        return result;
    }

    if (index >= bench_.size()) {
        result.error = ErrorCode::INVALID_SELECTION;
        result.effect_description = "Invalid selection.";
        return result;
    }

    Actor chosen = std::move(bench_[index]);
    bench_.erase(bench_.begin() + static_cast<std::ptrdiff_t>(index));

    Actor previous = std::move(*active_);
    world.remove_actor(previous);
    LocationName fallback = previous.location;
    bench_.push_back(std::move(previous));

    bring_into_world(chosen, fallback, world);
    active_ = std::move(chosen);

    result.success = true;
    result.effect_description = "Your Primary Pymon is now: " + active_->nickname;
    return result;
}

bool CreatureRoster::promote_next(WorldGraph& world) {
    if (!active_.has_value() || bench_.empty()) {
        return false;
    }

    Actor next = std::move(bench_.front());
    bench_.erase(bench_.begin());

    Actor defeated = std::move(*active_);
    active_.reset();
    world.remove_actor(defeated);

    if (defeated.player.has_value() && next.player.has_value()) {
        defeated.player->inventory.transfer_all_to(next.player->inventory);
    }

    bring_into_world(next, defeated.location, world);
    active_ = std::move(next);
    return true;
}

// ============================================================================
// QUERIES
// ============================================================================

PymonView CreatureRoster::make_view(const Actor& pymon) {
    PymonView v;
    v.nickname = pymon.nickname;
    v.description = pymon.description;
    v.location = pymon.location;
    if (pymon.player.has_value()) {
        v.energy = pymon.player->energy;
        v.immune = pymon.player->immune;
        v.inventory = pymon.player->inventory.names();
    }
    return v;
}

std::optional<PymonView> CreatureRoster::active_view() const {
    if (!active_.has_value()) {
        return std::nullopt;
    }
    return make_view(*active_);
}

std::vector<PymonView> CreatureRoster::bench_view() const {
    std::vector<PymonView> result;
    result.reserve(bench_.size());
    for (const auto& pet : bench_) {
        result.push_back(make_view(pet));
    }
    return result;
}

} // namespace pymon
