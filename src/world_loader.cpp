/**
 * Pymon Engine - World Loader Implementation
 *
 * Loads world definitions from JSON files using nlohmann/json.
 */

#include "world_loader.hpp"
#include <nlohmann/json.hpp>
#include <fstream>
#include <iostream>
#include <unordered_set>

using json = nlohmann::json;

namespace pymon {

namespace {

// Read an optional boolean; accepts true/false or "yes"/"no" strings
bool read_flag(const json& j, const char* key, bool fallback, bool& ok) {
    if (!j.contains(key) || j[key].is_null()) {
        return fallback;
    }
    if (j[key].is_boolean()) {
        return j[key].get<bool>();
    }
    if (j[key].is_string()) {
        std::string value = to_lower(j[key].get<std::string>());
        if (value == "yes" || value == "true") return true;
        if (value == "no" || value == "false") return false;
    }
    ok = false;
    return fallback;
}

bool read_string(const json& j, const char* key, std::string& out) {
    if (!j.contains(key) || !j[key].is_string()) {
        return false;
    }
    out = j[key].get<std::string>();
    return true;
}

} // anonymous namespace

bool WorldLoader::fail(const std::string& message) {
    error_ = ErrorCode::INVALID_INPUT_FORMAT;
    error_message_ = message;
    definition_ = WorldDefinition{};
    std::cerr << "[WorldLoader] " << message << std::endl;
    return false;
}

bool WorldLoader::load_from_json(const std::string& filepath) {
    std::ifstream file(filepath);
    if (!file.is_open()) {
        return fail("Failed to open: " + filepath);
    }

    try {
        json data = json::parse(file);
        if (!parse(data)) {
            return false;
        }
    } catch (const json::parse_error& e) {
        return fail(filepath + " has invalid content or is in an incorrect format: " + e.what());
    }

    std::cout << "[WorldLoader] Loaded " << definition_.locations.size() << " locations, "
              << definition_.creatures.size() << " creatures, "
              << definition_.items.size() << " items" << std::endl;
    return true;
}

bool WorldLoader::load_from_string(const std::string& text) {
    try {
        json data = json::parse(text);
        return parse(data);
    } catch (const json::parse_error& e) {
        return fail(std::string("Invalid world document: ") + e.what());
    }
}

bool WorldLoader::parse(const json& data) {
    error_ = ErrorCode::NONE;
    error_message_.clear();
    WorldDefinition def;

    if (!data.is_object() || !data.contains("locations") || !data["locations"].is_array()) {
        return fail("No 'locations' array found");
    }

    for (size_t i = 0; i < data["locations"].size(); i++) {
        LocationRecord record;
        if (!parse_location(data["locations"][i], i, record)) {
            return false;
        }
        def.locations.push_back(std::move(record));
    }

    if (data.contains("creatures")) {
        if (!data["creatures"].is_array()) {
            return fail("'creatures' must be an array");
        }
        for (size_t i = 0; i < data["creatures"].size(); i++) {
            CreatureRecord record;
            if (!parse_creature(data["creatures"][i], i, record)) {
                return false;
            }
            def.creatures.push_back(std::move(record));
        }
    }

    if (data.contains("items")) {
        if (!data["items"].is_array()) {
            return fail("'items' must be an array");
        }
        for (size_t i = 0; i < data["items"].size(); i++) {
            ItemRecord record;
            if (!parse_item(data["items"][i], i, record)) {
                return false;
            }
            def.items.push_back(std::move(record));
        }
    }

    if (!validate(def)) {
        return false;
    }

    definition_ = std::move(def);
    return true;
}

bool WorldLoader::parse_location(const json& location_json, size_t index, LocationRecord& out) {
    const std::string where = "Location " + std::to_string(index + 1);

    if (!location_json.is_object()) {
        return fail(where + ": expected an object");
    }
    if (!read_string(location_json, "name", out.name) || out.name.empty()) {
        return fail(where + ": name cannot be empty");
    }
    if (!read_string(location_json, "description", out.description) || out.description.empty()) {
        return fail(where + " (" + out.name + "): description cannot be empty");
    }

    for (Direction dir : ALL_DIRECTIONS) {
        const char* key = to_string(dir);
        if (!location_json.contains(key) || location_json[key].is_null()) {
            continue;
        }
        if (!location_json[key].is_string()) {
            return fail(where + " (" + out.name + "): door '" + key + "' must be a location name");
        }
        std::string target = location_json[key].get<std::string>();
        if (!target.empty() && target != "None") {
            out.doors[static_cast<size_t>(dir)] = target;
        }
    }

    return true;
}

bool WorldLoader::parse_creature(const json& creature_json, size_t index, CreatureRecord& out) {
    const std::string where = "Creature " + std::to_string(index + 1);

    if (!creature_json.is_object()) {
        return fail(where + ": expected an object");
    }
    if (!read_string(creature_json, "nickname", out.nickname) || out.nickname.empty()) {
        return fail(where + ": nickname cannot be empty");
    }
    read_string(creature_json, "description", out.description);

    bool ok = true;
    out.adoptable = read_flag(creature_json, "adoptable", false, ok);
    if (!ok) {
        return fail(where + " (" + out.nickname + "): 'adoptable' must be a boolean");
    }
    return true;
}

bool WorldLoader::parse_item(const json& item_json, size_t index, ItemRecord& out) {
    const std::string where = "Item " + std::to_string(index + 1);

    if (!item_json.is_object()) {
        return fail(where + ": expected an object");
    }
    if (!read_string(item_json, "name", out.name) || out.name.empty()) {
        return fail(where + ": name cannot be empty");
    }
    read_string(item_json, "description", out.description);

    bool ok = true;
    out.pickable = read_flag(item_json, "pickable", true, ok);
    out.consumable = read_flag(item_json, "consumable", false, ok);
    if (!ok) {
        return fail(where + " (" + out.name + "): 'pickable' and 'consumable' must be booleans");
    }
    return true;
}

bool WorldLoader::validate(const WorldDefinition& def) {
    if (def.locations.empty()) {
        return fail("No locations found in world file");
    }

    std::unordered_set<std::string> names;
    for (const auto& loc : def.locations) {
        if (!names.insert(loc.name).second) {
            return fail("Duplicate location name: " + loc.name);
        }
    }

    for (const auto& loc : def.locations) {
        for (Direction dir : ALL_DIRECTIONS) {
            const auto& door = loc.doors[static_cast<size_t>(dir)];
            if (door.has_value() && names.count(*door) == 0) {
                return fail("Location " + loc.name + ": door '" + to_string(dir) +
                            "' leads to unknown location " + *door);
            }
        }
    }

    return true;
}

} // namespace pymon
