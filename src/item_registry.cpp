/**
 * Pymon Engine - Item Registry Implementation
 */

#include "item_registry.hpp"

namespace pymon {

// ============================================================================
// REGISTRATION
// ============================================================================

void ItemRegistry::register_effect(const std::string& item_name, ItemEffectCallback callback) {
    effects_[to_lower(item_name)] = std::move(callback);
}

bool ItemRegistry::has_effect(const std::string& item_name) const {
    return effects_.find(to_lower(item_name)) != effects_.end();
}

// ============================================================================
// INVOCATION
// ============================================================================

ItemResult ItemRegistry::use_item(const WorldGraph& world,
                                  Actor& pymon,
                                  const std::string& item_name,
                                  const std::string& argument) const {
    ItemResult result;

    if (!pymon.player.has_value()) {
        result.error = ErrorCode::INVALID_SELECTION;
        result.effect_description = pymon.nickname + " cannot carry items.";
        return result;
    }

    Inventory& inventory = pymon.player->inventory;
    const Item* held = inventory.find_item(item_name);
    if (!held) {
        result.error = ErrorCode::INVALID_SELECTION;
        result.effect_description = "This " + item_name + " is not in your inventory.";
        return result;
    }

    auto it = effects_.find(to_lower(held->name));
    if (it == effects_.end()) {
        // Default: item has no use effect and is kept
        result.success = true;
        result.effect_description = "Nothing happens when using " + held->name + ".";
        return result;
    }

    // Copy before the effect runs; the inventory may be touched by it
    Item item = *held;
    ItemContext ctx{pymon, world, item, argument};
    result = it->second(ctx);

    if (result.consumed) {
        pymon.player->inventory.take_item(item.name);
    }

    return result;
}

PickResult ItemRegistry::pick_item(WorldGraph& world, Actor& pymon, const std::string& item_name) {
    PickResult result;

    if (!pymon.player.has_value()) {
        result.error = ErrorCode::INVALID_SELECTION;
        result.effect_description = pymon.nickname + " cannot carry items.";
        return result;
    }

    Location* here = world.find_location(pymon.location);
    const Item* found = here ? here->items.find_item(item_name) : nullptr;
    if (!found) {
        result.effect_description = item_name + " is not available here.";
        return result;
    }

    if (!found->pickable) {
        result.effect_description = item_name + " cannot be picked up.";
        return result;
    }

    auto taken = here->items.take_item(item_name);
    if (!taken.has_value()) {
        result.effect_description = item_name + " is not available here.";
        return result;
    }

    result.effect_description = taken->name + " has been added to your inventory.";
    pymon.player->inventory.add_item(std::move(*taken));
    result.success = true;
    return result;
}

} // namespace pymon
