/**
 * Pymon Engine - Item Effects
 *
 * Central registration point for all item use effects.
 * Provides a function to register all known items at startup
 * and metadata about each one for the presentation layer.
 */

#pragma once

#include "../item_registry.hpp"
#include <string>
#include <vector>

namespace pymon {
namespace items {

// ============================================================================
// ITEM INFO STRUCTURE
// ============================================================================

/**
 * ItemInfo - Metadata about a registered item effect.
 */
struct ItemInfo {
    std::string name;
    std::string description;       // What using the item does
    bool requires_direction = false;
};

// ============================================================================
// REGISTRATION FUNCTIONS
// ============================================================================

/**
 * Register all implemented item effects.
 *
 * Call this once per registry before the session starts.
 */
void register_all_items(ItemRegistry& registry);

/**
 * Get list of all items with a use effect.
 */
std::vector<ItemInfo> get_item_info();

/**
 * Check whether using an item needs a direction argument.
 */
bool requires_direction(const std::string& item_name);

// ============================================================================
// INDIVIDUAL ITEM REGISTRATIONS
// ============================================================================

void register_apple(ItemRegistry& registry);
void register_magic_potion(ItemRegistry& registry);
void register_binocular(ItemRegistry& registry);

} // namespace items
} // namespace pymon
