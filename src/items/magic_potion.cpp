/**
 * Magic Potion - Consumable
 *
 * "Grants temporary immunity for the next battle."
 *
 * Always consumed. The immunity flag is read and cleared by the battle engine.
 */

#include "items/item_effects.hpp"

namespace pymon {
namespace items {

void register_magic_potion(ItemRegistry& registry) {
    registry.register_effect("magic potion", [](ItemContext& ctx) -> ItemResult {
        ItemResult result;
        ctx.pymon.player->immune = true;
        result.success = true;
        result.consumed = true;
        result.effect_description = "Drank a magic potion. Temporary immunity activated for the next battle";
        return result;
    });
}

} // namespace items
} // namespace pymon
