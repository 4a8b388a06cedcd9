/**
 * Pymon Engine - Item Registry
 *
 * Central registry for item-specific use effects.
 *
 * Architecture:
 * - Each usable item name maps to one effect handler
 * - Lookup is case-insensitive on the item name
 * - An item held in the inventory with no registered effect does nothing
 *   and is NOT consumed
 *
 * Example usage:
 *   // Register handler
 *   registry.register_effect("apple", apple_effect);
 *
 *   // Use item held by the active Pymon
 *   auto result = registry.use_item(world, pymon, "Apple", "");
 */

#pragma once

#include "world_graph.hpp"
#include <functional>

namespace pymon {

// ============================================================================
// EFFECT RESULT TYPES
// ============================================================================

/**
 * Result of using an item.
 */
struct ItemResult {
    bool success = false;
    bool consumed = false;
    ErrorCode error = ErrorCode::NONE;
    std::string effect_description;

    // Filled by inspection effects (Binocular)
    std::optional<LocationView> inspected;
};

/**
 * Result of picking an item up from the ground.
 */
struct PickResult {
    bool success = false;
    ErrorCode error = ErrorCode::NONE;
    std::string effect_description;
};

/**
 * ItemContext - Everything an item effect may look at or change.
 */
struct ItemContext {
    Actor& pymon;
    const WorldGraph& world;
    const Item& item;
    const std::string& argument;   // free-form extra input (e.g. a direction)
};

// ============================================================================
// CALLBACK TYPES
// ============================================================================

// Effect: (ctx) -> ItemResult; result.consumed decides whether the item is removed
using ItemEffectCallback = std::function<ItemResult(ItemContext&)>;

// ============================================================================
// ITEM REGISTRY
// ============================================================================

/**
 * ItemRegistry - Name to effect table.
 *
 * Not thread-safe for registration (call before the session starts).
 */
class ItemRegistry {
public:
    ItemRegistry() = default;
    ~ItemRegistry() = default;

    // ========================================================================
    // REGISTRATION
    // ========================================================================

    /**
     * Register an item effect handler.
     *
     * @param item_name Item name (any case, e.g. "Magic Potion")
     * @param callback Effect handler function
     */
    void register_effect(const std::string& item_name, ItemEffectCallback callback);

    // ========================================================================
    // LOOKUP
    // ========================================================================

    bool has_effect(const std::string& item_name) const;

    size_t effect_count() const { return effects_.size(); }

    // ========================================================================
    // INVOCATION
    // ========================================================================

    /**
     * Use an item from the Pymon's inventory.
     *
     * Fails with INVALID_SELECTION if the item is not held. Items without a
     * registered effect succeed with no change and stay in the inventory.
     * The item is removed only when the effect reports it consumed.
     */
    ItemResult use_item(const WorldGraph& world,
                        Actor& pymon,
                        const std::string& item_name,
                        const std::string& argument = "") const;

    /**
     * Move an item from the Pymon's current location into its inventory.
     *
     * Missing or unpickable items fail softly with a message.
     */
    static PickResult pick_item(WorldGraph& world, Actor& pymon, const std::string& item_name);

private:
    // Key: lowercase item name
    std::unordered_map<std::string, ItemEffectCallback> effects_;
};

} // namespace pymon
