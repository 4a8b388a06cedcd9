/**
 * Pymon Engine - World Loader
 *
 * Reads location, creature and item definitions from a JSON world file
 * and validates them before a session is built.
 */

#pragma once

#include "types.hpp"
#include <nlohmann/json_fwd.hpp>

namespace pymon {

/**
 * Location definition. Door values name another location or are empty.
 */
struct LocationRecord {
    LocationName name;
    std::string description;
    std::array<std::optional<LocationName>, 4> doors;
};

struct CreatureRecord {
    std::string nickname;
    std::string description;
    bool adoptable = false;
};

struct ItemRecord {
    std::string name;
    std::string description;
    bool pickable = true;
    bool consumable = false;
};

/**
 * WorldDefinition - Everything needed to build a session.
 */
struct WorldDefinition {
    std::vector<LocationRecord> locations;
    std::vector<CreatureRecord> creatures;
    std::vector<ItemRecord> items;
};

/**
 * WorldLoader - JSON world file parsing.
 *
 * Any structural problem is reported as INVALID_INPUT_FORMAT with a message
 * naming the offending entry; nothing is partially loaded on failure.
 */
class WorldLoader {
public:
    WorldLoader() = default;
    ~WorldLoader() = default;

    /**
     * Load a world from a JSON file.
     */
    bool load_from_json(const std::string& filepath);

    /**
     * Load a world from a JSON document already in memory.
     */
    bool load_from_string(const std::string& text);

    const WorldDefinition& definition() const { return definition_; }

    ErrorCode error() const { return error_; }
    const std::string& error_message() const { return error_message_; }

private:
    WorldDefinition definition_;
    ErrorCode error_ = ErrorCode::NONE;
    std::string error_message_;

    bool parse(const nlohmann::json& data);
    bool fail(const std::string& message);

    bool parse_location(const nlohmann::json& location_json, size_t index, LocationRecord& out);
    bool parse_creature(const nlohmann::json& creature_json, size_t index, CreatureRecord& out);
    bool parse_item(const nlohmann::json& item_json, size_t index, ItemRecord& out);
    bool validate(const WorldDefinition& def);
};

} // namespace pymon
