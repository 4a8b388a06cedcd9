/**
 * Pymon Engine - Item
 *
 * A collectible object that lives either in a location or in a Pymon's inventory.
 */

#pragma once

#include "types.hpp"

namespace pymon {

/**
 * Item - A single owned item instance.
 *
 * Identity is the name, matched case-insensitively everywhere.
 * Copies are only made on purpose (consumable duplication during world setup).
 */
struct Item {
    std::string name;
    std::string description;
    bool pickable = true;
    bool consumable = false;

    Item() = default;

    Item(std::string name_, std::string description_, bool pickable_, bool consumable_)
        : name(std::move(name_))
        , description(std::move(description_))
        , pickable(pickable_)
        , consumable(consumable_)
    {}

    bool matches_name(const std::string& other) const {
        return iequals(name, other);
    }

    Item clone() const {
        return *this;
    }
};

} // namespace pymon
