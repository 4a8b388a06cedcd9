/**
 * Binocular - Single use
 *
 * "Look at the current location or into an adjacent one."
 *
 * Argument: "current" or a direction (west, north, east, south).
 * Read-only: nothing moves. The binocular is used up even if the chosen
 * direction leads nowhere.
 */

#include "items/item_effects.hpp"

namespace pymon {
namespace items {

namespace {

std::string describe_contents(const LocationView& view) {
    if (view.is_empty()) {
        return "nothing.";
    }

    std::string text = "Creatures: ";
    for (size_t i = 0; i < view.creatures.size(); i++) {
        if (i > 0) text += ", ";
        text += view.creatures[i];
    }
    text += "; Items: ";
    for (size_t i = 0; i < view.items.size(); i++) {
        if (i > 0) text += ", ";
        text += view.items[i];
    }
    return text;
}

ItemResult execute_binocular(ItemContext& ctx) {
    ItemResult result;
    result.success = true;
    result.consumed = true;

    const std::string where = to_lower(ctx.argument);

    if (where == "current") {
        result.inspected = ctx.world.view(ctx.pymon.location, ctx.pymon.id);
        if (result.inspected.has_value()) {
            result.effect_description = "In the current location, you see: " +
                                        describe_contents(*result.inspected);
        }
        return result;
    }

    auto dir = parse_direction(where);
    const Location* here = ctx.world.find_location(ctx.pymon.location);
    if (!dir.has_value() || !here || !here->has_door(*dir)) {
        result.effect_description = "This direction (" + ctx.argument + ") leads nowhere.";
        return result;
    }

    result.inspected = ctx.world.view(*here->door(*dir));
    if (!result.inspected.has_value()) {
        result.effect_description = "This direction (" + ctx.argument + ") leads nowhere.";
        return result;
    }

    result.effect_description = "In the " + where + " direction, there are " +
                                result.inspected->description + ". " +
                                (result.inspected->is_empty()
                                     ? std::string("No creatures or items in this location.")
                                     : describe_contents(*result.inspected));
    return result;
}

} // anonymous namespace

void register_binocular(ItemRegistry& registry) {
    registry.register_effect("binocular", [](ItemContext& ctx) -> ItemResult {
        return execute_binocular(ctx);
    });
}

} // namespace items
} // namespace pymon
