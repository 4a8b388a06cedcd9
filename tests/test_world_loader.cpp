/**
 * Tests for WorldLoader (JSON world files)
 */

#include <sstream>
#include "world_loader.hpp"

using namespace pymon;

namespace {

const char* kSmallWorld = R"({
    "locations": [
        {"name": "Forest", "description": "a dense forest", "north": "Cave", "east": "None"},
        {"name": "Cave", "description": "a dark cave", "south": "Forest", "west": null}
    ],
    "creatures": [
        {"nickname": "Sheep", "description": "fluffy", "adoptable": "yes"},
        {"nickname": "Rocky", "description": "a boulder", "adoptable": false}
    ],
    "items": [
        {"name": "Apple", "description": "red", "consumable": true},
        {"name": "Tree", "description": "tall", "pickable": "no"}
    ]
})";

} // anonymous namespace

TEST(WorldLoader, LoadsSmallWorld) {
    WorldLoader loader;
    TEST_ASSERT_TRUE(loader.load_from_string(kSmallWorld));
    TEST_ASSERT_TRUE(loader.error() == ErrorCode::NONE);

    const auto& def = loader.definition();
    TEST_ASSERT_EQ(2u, def.locations.size());
    TEST_ASSERT_EQ(2u, def.creatures.size());
    TEST_ASSERT_EQ(2u, def.items.size());

    const auto& forest = def.locations[0];
    TEST_ASSERT_EQ("Forest", forest.name);
    TEST_ASSERT_TRUE(forest.doors[static_cast<size_t>(Direction::NORTH)].has_value());
    TEST_ASSERT_EQ("Cave", *forest.doors[static_cast<size_t>(Direction::NORTH)]);
    TEST_ASSERT_FALSE(forest.doors[static_cast<size_t>(Direction::EAST)].has_value());
    TEST_ASSERT_FALSE(def.locations[1].doors[static_cast<size_t>(Direction::WEST)].has_value());

    TEST_ASSERT_TRUE(def.creatures[0].adoptable);
    TEST_ASSERT_FALSE(def.creatures[1].adoptable);

    TEST_ASSERT_TRUE(def.items[0].pickable);
    TEST_ASSERT_TRUE(def.items[0].consumable);
    TEST_ASSERT_FALSE(def.items[1].pickable);
    TEST_ASSERT_FALSE(def.items[1].consumable);
}

TEST(WorldLoader, RejectsMalformedJson) {
    WorldLoader loader;
    TEST_ASSERT_FALSE(loader.load_from_string("{ \"locations\": [ "));
    TEST_ASSERT_TRUE(loader.error() == ErrorCode::INVALID_INPUT_FORMAT);
    TEST_ASSERT_FALSE(loader.error_message().empty());
}

TEST(WorldLoader, RejectsMissingLocations) {
    WorldLoader loader;
    TEST_ASSERT_FALSE(loader.load_from_string(R"({"creatures": []})"));
    TEST_ASSERT_TRUE(loader.error() == ErrorCode::INVALID_INPUT_FORMAT);

    TEST_ASSERT_FALSE(loader.load_from_string(R"({"locations": []})"));
    TEST_ASSERT_TRUE(loader.error() == ErrorCode::INVALID_INPUT_FORMAT);
}

TEST(WorldLoader, RejectsUnknownDoorTarget) {
    WorldLoader loader;
    bool ok = loader.load_from_string(R"({
        "locations": [{"name": "Forest", "description": "trees", "north": "Moon"}]
    })");

    TEST_ASSERT_FALSE(ok);
    TEST_ASSERT_TRUE(loader.error_message().find("Moon") != std::string::npos);
    TEST_ASSERT_EQ(0u, loader.definition().locations.size());
}

TEST(WorldLoader, RejectsDuplicateLocation) {
    WorldLoader loader;
    bool ok = loader.load_from_string(R"({
        "locations": [
            {"name": "Forest", "description": "trees"},
            {"name": "Forest", "description": "more trees"}
        ]
    })");
    TEST_ASSERT_FALSE(ok);
}

TEST(WorldLoader, RejectsEmptyDescription) {
    WorldLoader loader;
    TEST_ASSERT_FALSE(loader.load_from_string(R"({"locations": [{"name": "Forest", "description": ""}]})"));
}

TEST(WorldLoader, RejectsBadFlag) {
    WorldLoader loader;
    bool ok = loader.load_from_string(R"({
        "locations": [{"name": "Forest", "description": "trees"}],
        "creatures": [{"nickname": "Sheep", "adoptable": "maybe"}]
    })");
    TEST_ASSERT_FALSE(ok);
}

TEST(WorldLoader, MissingFile) {
    WorldLoader loader;
    TEST_ASSERT_FALSE(loader.load_from_json("does/not/exist.json"));
    TEST_ASSERT_TRUE(loader.error() == ErrorCode::INVALID_INPUT_FORMAT);
}
