/**
 * Apple - Consumable
 *
 * "Eat to restore one point of energy."
 *
 * Only eaten when the Pymon is below maximum energy; otherwise it stays
 * in the inventory.
 */

#include "items/item_effects.hpp"

namespace pymon {
namespace items {

namespace {

ItemResult execute_apple(ItemContext& ctx) {
    ItemResult result;
    PlayerState& ps = *ctx.pymon.player;

    if (ps.has_full_energy()) {
        result.success = true;
        result.consumed = false;
        result.effect_description = "Energy is already at maximum.";
        return result;
    }

    ps.gain_energy(1);
    result.success = true;
    result.consumed = true;
    result.effect_description = "Your pymon ate the apple. Energy increased by 1";
    return result;
}

} // anonymous namespace

void register_apple(ItemRegistry& registry) {
    registry.register_effect("apple", [](ItemContext& ctx) -> ItemResult {
        return execute_apple(ctx);
    });
}

} // namespace items
} // namespace pymon
