/**
 * Pymon Engine - Item Effects Registration
 */

#include "items/item_effects.hpp"

namespace pymon {
namespace items {

namespace {

const std::vector<ItemInfo> g_item_info = {
    {"apple", "Restore 1 energy (consumed only if energy is below maximum)", false},
    {"magic potion", "Immunity to the energy loss of the next lost round in the next battle", false},
    {"binocular", "Look at the current or an adjacent location without moving", true},
};

} // anonymous namespace

void register_all_items(ItemRegistry& registry) {
    register_apple(registry);
    register_magic_potion(registry);
    register_binocular(registry);
}

std::vector<ItemInfo> get_item_info() {
    return g_item_info;
}

bool requires_direction(const std::string& item_name) {
    for (const auto& info : g_item_info) {
        if (iequals(info.name, item_name)) {
            return info.requires_direction;
        }
    }
    return false;
}

} // namespace items
} // namespace pymon
