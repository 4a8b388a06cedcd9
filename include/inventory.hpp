/**
 * Pymon Engine - Inventory Container
 *
 * Ordered container of items owned by a single Pymon (or lying in a location).
 */

#pragma once

#include "item.hpp"

namespace pymon {

/**
 * Inventory - Ordered container for items.
 *
 * Every lookup is case-insensitive on the item name and returns the first match.
 * Items leave the container only by move (take / transfer).
 */
struct Inventory {
    std::vector<Item> items;

    // ========================================================================
    // BASIC OPERATIONS
    // ========================================================================

    void add_item(Item item) {
        items.push_back(std::move(item));
    }

    // Remove and return item (move semantics)
    std::optional<Item> take_item(const std::string& name) {
        for (auto it = items.begin(); it != items.end(); ++it) {
            if (it->matches_name(name)) {
                Item removed = std::move(*it);
                items.erase(it);
                return removed;
            }
        }
        return std::nullopt;
    }

    Item* find_item(const std::string& name) {
        for (auto& item : items) {
            if (item.matches_name(name)) {
                return &item;
            }
        }
        return nullptr;
    }

    const Item* find_item(const std::string& name) const {
        for (const auto& item : items) {
            if (item.matches_name(name)) {
                return &item;
            }
        }
        return nullptr;
    }

    bool has_item(const std::string& name) const {
        return find_item(name) != nullptr;
    }

    int count() const {
        return static_cast<int>(items.size());
    }

    bool is_empty() const {
        return items.empty();
    }

    // Move every item to the end of another inventory, leaving this one empty.
    void transfer_all_to(Inventory& other) {
        for (auto& item : items) {
            other.items.push_back(std::move(item));
        }
        items.clear();
    }

    std::vector<std::string> names() const {
        std::vector<std::string> result;
        result.reserve(items.size());
        for (const auto& item : items) {
            result.push_back(item.name);
        }
        return result;
    }
};

} // namespace pymon
