/**
 * Tests for GameSession (setup, command flow, game over)
 */

#include <sstream>
#include "game_session.hpp"

using namespace pymon;
using namespace pymon::testing;

namespace {

// Forest -north-> Cave, Cave -east-> Lake
WorldDefinition make_definition() {
    WorldDefinition def;

    LocationRecord forest;
    forest.name = "Forest";
    forest.description = "a dense forest";
    forest.doors[static_cast<size_t>(Direction::NORTH)] = "Cave";

    LocationRecord cave;
    cave.name = "Cave";
    cave.description = "a dark cave";
    cave.doors[static_cast<size_t>(Direction::EAST)] = "Lake";

    LocationRecord lake;
    lake.name = "Lake";
    lake.description = "a quiet lake";

    def.locations = {forest, cave, lake};
    def.creatures = {
        {"Sheep", "fluffy", true},
        {"Rocky", "a boulder", false},
        {"Bubbles", "a fish", true},
    };
    def.items = {
        {"Apple", "red", true, true},
        {"Magic Potion", "sparkly", true, true},
        {"Binocular", "far sight", true, false},
        {"Tree", "tall", false, false},
    };
    return def;
}

// Session with a hand-built world and Kimimon standing in the Forest
void build_small_session(GameSession& session) {
    session.world().add_location("Forest", "a dense forest");
    session.world().add_location("Cave", "a dark cave");
    session.world().connect("Forest", "north", "Cave");
    session.spawn_starter("Kimimon", "", "Forest");
}

size_t count_items(const WorldGraph& world) {
    size_t total = 0;
    for (const auto& name : world.location_names()) {
        total += static_cast<size_t>(world.find_location(name)->items.count());
    }
    return total;
}

} // anonymous namespace

// ============================================================================
// SETUP TESTS
// ============================================================================

TEST(GameSession, NotStartedRejectsCommands) {
    GameSession session(1);
    TEST_ASSERT_TRUE(session.status() == SessionStatus::NOT_STARTED);

    auto result = session.move("north");
    TEST_ASSERT_FALSE(result.success);
    TEST_ASSERT_TRUE(result.error == ErrorCode::INVALID_SELECTION);
    TEST_ASSERT_EQ(0, session.command_count());
}

TEST(GameSession, SetupPlacesEverything) {
    GameSession session(2024);
    TEST_ASSERT_TRUE(session.setup(make_definition()));

    TEST_ASSERT_TRUE(session.status() == SessionStatus::ONGOING);
    TEST_ASSERT_EQ(3u, session.world().location_count());
    TEST_ASSERT_EQ(3u, session.world().creature_count());

    auto active = session.active_pymon();
    TEST_ASSERT_TRUE(active.has_value());
    TEST_ASSERT_EQ("Kimimon", active->nickname);
    TEST_ASSERT_EQ(MAX_ENERGY, active->energy);
    TEST_ASSERT_TRUE(session.world().has_location(active->location));

    // Doors from the records are made two-way
    const Location* cave = session.world().find_location("Cave");
    TEST_ASSERT_TRUE(cave->has_door(Direction::SOUTH));
    TEST_ASSERT_TRUE(cave->has_door(Direction::EAST));
    TEST_ASSERT_TRUE(session.world().find_location("Lake")->has_door(Direction::WEST));

    // Every item is placed; only the two consumables may be duplicated
    size_t items = count_items(session.world());
    TEST_ASSERT_TRUE(items >= 4 && items <= 6);
}

TEST(GameSession, SetupIsReproducibleWithSeed) {
    GameSession a(99);
    GameSession b(99);
    a.setup(make_definition());
    b.setup(make_definition());

    TEST_ASSERT_EQ(a.active_pymon()->location, b.active_pymon()->location);
    TEST_ASSERT_EQ(count_items(a.world()), count_items(b.world()));
    for (const auto& name : a.world().location_names()) {
        TEST_ASSERT_EQ(a.world().view(name)->creatures.size(), b.world().view(name)->creatures.size());
    }
}

TEST(GameSession, SetupRejectsEmptyWorld) {
    GameSession session(5);
    TEST_ASSERT_FALSE(session.setup(WorldDefinition{}));
    TEST_ASSERT_TRUE(session.status() == SessionStatus::NOT_STARTED);
}

// ============================================================================
// COMMAND TESTS
// ============================================================================

TEST(GameSession, MoveAndLook) {
    GameSession session(3);
    build_small_session(session);
    session.spawn_creature("Sheep", "fluffy", true, "Cave");

    auto moved = session.move("north");
    TEST_ASSERT_TRUE(moved.success);
    TEST_ASSERT_EQ(1, session.command_count());

    auto here = session.current_location();
    TEST_ASSERT_TRUE(here.has_value());
    TEST_ASSERT_EQ("Cave", here->name);
    // The player's own Pymon is not listed
    TEST_ASSERT_EQ(1u, here->creatures.size());
    TEST_ASSERT_EQ("Sheep", here->creatures[0]);
}

TEST(GameSession, PickAndUse) {
    GameSession session(3);
    build_small_session(session);
    session.world().add_item("Forest", Item("Apple", "red", true, true));

    TEST_ASSERT_TRUE(session.pick("apple").success);
    TEST_ASSERT_EQ(1u, session.inventory().size());

    auto full = session.use_item("Apple");
    TEST_ASSERT_FALSE(full.consumed);
    TEST_ASSERT_EQ(1u, session.inventory().size());

    session.roster().active()->player->set_energy(2);
    auto eaten = session.use_item("Apple");
    TEST_ASSERT_TRUE(eaten.consumed);
    TEST_ASSERT_EQ(3, session.active_pymon()->energy);
    TEST_ASSERT_EQ(0u, session.inventory().size());
}

TEST(GameSession, CaptureThenSwitch) {
    GameSession session(3);
    build_small_session(session);
    session.spawn_creature("Sheep", "fluffy", true, "Forest");

    auto result = session.challenge("Sheep", scripted_moves({"rock", "rock"}),
                                    scripted_opponent({RpsMove::SCISSORS}));
    TEST_ASSERT_TRUE(result.outcome == MatchOutcome::CAPTURED);
    TEST_ASSERT_EQ(1u, session.bench().size());
    TEST_ASSERT_EQ(1u, session.battle_report().size());

    auto bad = session.switch_active(3);
    TEST_ASSERT_FALSE(bad.success);

    auto swapped = session.switch_active(0);
    TEST_ASSERT_TRUE(swapped.success);
    TEST_ASSERT_EQ("Sheep", session.active_pymon()->nickname);
    TEST_ASSERT_EQ("Kimimon", session.bench()[0].nickname);
}

TEST(GameSession, GameOverEndsSession) {
    GameSession session(3);
    build_small_session(session);
    session.spawn_creature("Sheep", "fluffy", true, "Forest");
    session.roster().active()->player->set_energy(1);

    auto result = session.challenge("Sheep", scripted_moves({"rock"}),
                                    scripted_opponent({RpsMove::PAPER}));
    TEST_ASSERT_TRUE(result.is_game_over());
    TEST_ASSERT_TRUE(session.is_game_over());

    auto move = session.move("north");
    TEST_ASSERT_FALSE(move.success);
    TEST_ASSERT_TRUE(move.error == ErrorCode::GAME_OVER);

    auto pick = session.pick("Apple");
    TEST_ASSERT_TRUE(pick.error == ErrorCode::GAME_OVER);

    // History stays readable after the game ends
    TEST_ASSERT_EQ(1u, session.battle_report().size());
}

TEST(GameSession, SpawnStarterCannotReviveFinishedGame) {
    GameSession session(3);
    build_small_session(session);
    session.spawn_creature("Sheep", "fluffy", true, "Forest");
    session.roster().active()->player->set_energy(1);

    auto result = session.challenge("Sheep", scripted_moves({"rock"}),
                                    scripted_opponent({RpsMove::PAPER}));
    TEST_ASSERT_TRUE(result.is_game_over());

    TEST_ASSERT_FALSE(session.spawn_starter("Kimimon", "", "Forest"));
    TEST_ASSERT_TRUE(session.status() == SessionStatus::GAME_OVER);

    auto move = session.move("north");
    TEST_ASSERT_FALSE(move.success);
    TEST_ASSERT_TRUE(move.error == ErrorCode::GAME_OVER);
}

TEST(GameSession, DialogueDoesNotCountAsBattle) {
    GameSession session(3);
    build_small_session(session);
    session.spawn_creature("Rocky", "a boulder", false, "Forest");

    auto result = session.challenge("Rocky", scripted_moves({"rock"}));
    TEST_ASSERT_TRUE(result.state == ChallengeState::DIALOGUE_ONLY);
    TEST_ASSERT_EQ(0u, session.battle_report().size());
    TEST_ASSERT_TRUE(session.status() == SessionStatus::ONGOING);
}
