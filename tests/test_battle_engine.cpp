/**
 * Tests for BattleEngine (challenge state machine and outcomes)
 */

#include <sstream>
#include "battle_engine.hpp"

using namespace pymon;
using namespace pymon::testing;

namespace {

struct BattleFixture {
    WorldGraph world = make_forest_and_cave();
    CreatureRoster roster;
    BattleStats stats;
    BattleEngine engine;
    std::mt19937 rng{42};

    BattleFixture() {
        place_active(world, roster, "Kimimon", "Forest");
        world.add_creature(Actor("creature_1", "Sheep", "fluffy", true), "Forest");
        world.add_creature(Actor("creature_2", "Rocky", "a boulder", false), "Forest");
    }

    PlayerState& kimi() { return *roster.active()->player; }

    ChallengeResult run(const std::string& opponent,
                        const std::vector<std::string>& inputs,
                        const std::vector<RpsMove>& hands) {
        return engine.run(world, roster, stats, opponent,
                          scripted_moves(inputs), rng, scripted_opponent(hands));
    }
};

} // anonymous namespace

// ============================================================================
// ROUND RULES
// ============================================================================

TEST(BattleRules, JudgeRound) {
    TEST_ASSERT_TRUE(judge_round(RpsMove::ROCK, RpsMove::SCISSORS) == RoundOutcome::WIN);
    TEST_ASSERT_TRUE(judge_round(RpsMove::SCISSORS, RpsMove::PAPER) == RoundOutcome::WIN);
    TEST_ASSERT_TRUE(judge_round(RpsMove::PAPER, RpsMove::ROCK) == RoundOutcome::WIN);
    TEST_ASSERT_TRUE(judge_round(RpsMove::ROCK, RpsMove::PAPER) == RoundOutcome::LOSS);
    TEST_ASSERT_TRUE(judge_round(RpsMove::PAPER, RpsMove::PAPER) == RoundOutcome::DRAW);
}

TEST(BattleRules, ParseMoveIsCaseInsensitive) {
    TEST_ASSERT_TRUE(parse_rps_move("Rock") == RpsMove::ROCK);
    TEST_ASSERT_TRUE(parse_rps_move("SCISSORS") == RpsMove::SCISSORS);
    TEST_ASSERT_FALSE(parse_rps_move("lizard").has_value());
    TEST_ASSERT_FALSE(parse_rps_move("").has_value());
}

// ============================================================================
// OPPONENT LOOKUP
// ============================================================================

TEST(BattleEngine, OpponentNotHere) {
    BattleFixture f;
    auto result = f.run("Ghost", {"rock"}, {RpsMove::SCISSORS});

    TEST_ASSERT_FALSE(result.success);
    TEST_ASSERT_TRUE(result.error == ErrorCode::INVALID_SELECTION);
    TEST_ASSERT_EQ("Ghost is not available here.", result.effect_description);
    TEST_ASSERT_TRUE(f.stats.is_empty());
}

TEST(BattleEngine, NicknameMatchIsExact) {
    BattleFixture f;
    auto result = f.run("sheep", {"rock"}, {RpsMove::SCISSORS});
    TEST_ASSERT_FALSE(result.success);
}

TEST(BattleEngine, CannotChallengeOwnPymon) {
    BattleFixture f;
    auto result = f.run("Kimimon", {"rock"}, {RpsMove::SCISSORS});

    TEST_ASSERT_FALSE(result.success);
    TEST_ASSERT_EQ("You cannot challenge your own Pymon.", result.effect_description);
}

TEST(BattleEngine, NonAdoptableOnlyTalks) {
    BattleFixture f;
    auto result = f.run("Rocky", {"rock", "rock"}, {RpsMove::SCISSORS});

    TEST_ASSERT_TRUE(result.success);
    TEST_ASSERT_TRUE(result.state == ChallengeState::DIALOGUE_ONLY);
    TEST_ASSERT_TRUE(result.outcome == MatchOutcome::NONE);
    TEST_ASSERT_FALSE(result.dialogue.empty());
    TEST_ASSERT_TRUE(result.dialogue.rfind("Rocky", 0) == 0);
    TEST_ASSERT_EQ(0u, result.rounds.size());

    // No state change anywhere
    TEST_ASSERT_EQ(3, f.kimi().energy);
    TEST_ASSERT_TRUE(f.world.find_creature("creature_2") != nullptr);
    TEST_ASSERT_FALSE(f.roster.has_pets());
    TEST_ASSERT_TRUE(f.stats.is_empty());
}

// ============================================================================
// OUTCOMES
// ============================================================================

TEST(BattleEngine, TwoWinsCaptureOpponent) {
    BattleFixture f;
    auto result = f.run("Sheep", {"rock", "rock"}, {RpsMove::SCISSORS});

    TEST_ASSERT_TRUE(result.success);
    TEST_ASSERT_TRUE(result.state == ChallengeState::RESOLVED);
    TEST_ASSERT_TRUE(result.outcome == MatchOutcome::CAPTURED);
    TEST_ASSERT_EQ(2, result.wins);
    TEST_ASSERT_EQ(0, result.losses);

    // Sheep leaves the world and joins the bench at full energy
    TEST_ASSERT_NULL(f.world.find_creature("creature_1"));
    TEST_ASSERT_FALSE(f.world.find_location("Forest")->has_occupant("creature_1"));
    TEST_ASSERT_EQ(1, f.roster.bench_count());
    TEST_ASSERT_EQ("Sheep", f.roster.bench()[0].nickname);
    TEST_ASSERT_EQ(MAX_ENERGY, f.roster.bench()[0].energy());
    TEST_ASSERT_EQ("Forest", f.roster.bench()[0].location);

    auto report = f.stats.report();
    TEST_ASSERT_EQ(1u, report.size());
    TEST_ASSERT_EQ("Kimimon", report[0].nickname);
    TEST_ASSERT_EQ("Sheep", report[0].battles[0].opponent);
    TEST_ASSERT_EQ(2, report[0].total_wins);
}

TEST(BattleEngine, DrawsDoNotEndTheMatch) {
    BattleFixture f;
    auto result = f.run("Sheep", {"paper", "rock", "rock"},
                        {RpsMove::PAPER, RpsMove::SCISSORS, RpsMove::SCISSORS});

    TEST_ASSERT_TRUE(result.outcome == MatchOutcome::CAPTURED);
    TEST_ASSERT_EQ(1, result.draws);
    TEST_ASSERT_EQ(2, result.wins);
    TEST_ASSERT_EQ(3u, result.rounds.size());
}

TEST(BattleEngine, LossCostsEnergy) {
    BattleFixture f;
    auto result = f.run("Sheep", {"rock", "rock", "rock"},
                        {RpsMove::PAPER, RpsMove::SCISSORS, RpsMove::SCISSORS});

    TEST_ASSERT_TRUE(result.outcome == MatchOutcome::CAPTURED);
    TEST_ASSERT_EQ(1, result.losses);
    TEST_ASSERT_EQ(2, f.kimi().energy);
    TEST_ASSERT_EQ(2, result.rounds[0].energy_after);
}

TEST(BattleEngine, InvalidInputIsRepromptedWithoutConsumingRound) {
    BattleFixture f;
    auto result = f.run("Sheep", {"lizard", "rock", "rock"},
                        {RpsMove::SCISSORS, RpsMove::SCISSORS});

    TEST_ASSERT_TRUE(result.outcome == MatchOutcome::CAPTURED);
    TEST_ASSERT_EQ(3u, result.rounds.size());
    TEST_ASSERT_FALSE(result.rounds[0].accepted);
    TEST_ASSERT_EQ("Invalid choice. Try again", result.rounds[0].effect_description);
    TEST_ASSERT_EQ(2, result.wins + result.draws + result.losses);
}

TEST(BattleEngine, LostMatchPromotesFrontPet) {
    BattleFixture f;
    f.roster.add_pet(Actor::make_pymon("pet_1", "Bubbles", ""));
    f.roster.add_pet(Actor::make_pymon("pet_2", "Fuzz", ""));
    f.roster.active()->player->inventory.add_item(Item("Apple", "", true, true));

    auto result = f.run("Sheep", {"rock", "rock"}, {RpsMove::PAPER});

    TEST_ASSERT_TRUE(result.outcome == MatchOutcome::SUBSTITUTED);
    TEST_ASSERT_EQ("Bubbles", result.new_active);
    TEST_ASSERT_EQ(2, result.losses);

    const Actor* active = f.roster.active();
    TEST_ASSERT_EQ("Bubbles", active->nickname);
    TEST_ASSERT_EQ("Forest", active->location);
    TEST_ASSERT_TRUE(active->player->inventory.has_item("Apple"));
    TEST_ASSERT_FALSE(f.world.find_location("Forest")->has_occupant("pymon_Kimimon"));
    TEST_ASSERT_TRUE(f.world.find_location("Forest")->has_occupant("pet_1"));

    // Sheep stays wild
    TEST_ASSERT_TRUE(f.world.find_creature("creature_1") != nullptr);

    // The battle is recorded under the Pymon that fought it
    TEST_ASSERT_TRUE(f.stats.battles_of("Kimimon") != nullptr);
    TEST_ASSERT_NULL(f.stats.battles_of("Bubbles"));
}

TEST(BattleEngine, LastPymonOutOfEnergyIsGameOver) {
    BattleFixture f;
    f.kimi().set_energy(1);

    auto result = f.run("Sheep", {"rock", "rock"}, {RpsMove::PAPER});

    TEST_ASSERT_TRUE(result.is_game_over());
    TEST_ASSERT_EQ(1, result.losses);
    TEST_ASSERT_EQ(1u, result.rounds.size());
    TEST_ASSERT_EQ(0, f.kimi().energy);
    TEST_ASSERT_EQ(1u, f.stats.total_battles());
}

TEST(BattleEngine, ImmunityAbsorbsFirstLoss) {
    BattleFixture f;
    f.kimi().immune = true;

    auto result = f.run("Sheep", {"rock", "rock", "rock"},
                        {RpsMove::PAPER, RpsMove::SCISSORS, RpsMove::SCISSORS});

    TEST_ASSERT_TRUE(result.outcome == MatchOutcome::CAPTURED);
    TEST_ASSERT_TRUE(result.rounds[0].immunity_absorbed);
    TEST_ASSERT_EQ(3, f.kimi().energy);
    // Immunity is spent once the battle resolves
    TEST_ASSERT_FALSE(f.kimi().immune);
}

TEST(BattleEngine, ImmunityOnlyCoversOneLoss) {
    BattleFixture f;
    f.kimi().immune = true;
    f.roster.add_pet(Actor::make_pymon("pet_1", "Bubbles", ""));

    auto result = f.run("Sheep", {"rock", "rock"}, {RpsMove::PAPER});

    TEST_ASSERT_TRUE(result.outcome == MatchOutcome::SUBSTITUTED);
    TEST_ASSERT_TRUE(result.rounds[0].immunity_absorbed);
    TEST_ASSERT_FALSE(result.rounds[1].immunity_absorbed);
    TEST_ASSERT_EQ(2, result.rounds[1].energy_after);
}

TEST(BattleEngine, InputRunningDryForfeits) {
    BattleFixture f;
    f.roster.add_pet(Actor::make_pymon("pet_1", "Bubbles", ""));

    auto result = f.run("Sheep", {"rock"}, {RpsMove::ROCK});

    TEST_ASSERT_TRUE(result.outcome == MatchOutcome::SUBSTITUTED);
    TEST_ASSERT_EQ(1, result.draws);
    TEST_ASSERT_EQ("Bubbles", f.roster.active()->nickname);
}

// ============================================================================
// STEP-WISE API
// ============================================================================

TEST(BattleEngineSteps, ResolveBeforeEndIsRejected) {
    BattleFixture f;
    Encounter enc;
    auto opened = f.engine.begin(enc, f.world, f.roster, "Sheep", f.rng);
    TEST_ASSERT_TRUE(opened.state == ChallengeState::IN_PROGRESS);
    TEST_ASSERT_EQ("You started the challenge with Sheep!", opened.effect_description);

    f.engine.play_round(enc, f.roster, "rock", RpsMove::SCISSORS);
    TEST_ASSERT_FALSE(f.engine.is_match_over(enc, f.roster));

    auto early = f.engine.resolve(enc, f.world, f.roster, f.stats);
    TEST_ASSERT_FALSE(early.success);
    TEST_ASSERT_TRUE(f.stats.is_empty());

    f.engine.play_round(enc, f.roster, "rock", RpsMove::SCISSORS);
    TEST_ASSERT_TRUE(f.engine.is_match_over(enc, f.roster));

    // No rounds after the match is decided
    auto extra = f.engine.play_round(enc, f.roster, "rock", RpsMove::SCISSORS);
    TEST_ASSERT_FALSE(extra.accepted);

    auto done = f.engine.resolve(enc, f.world, f.roster, f.stats);
    TEST_ASSERT_TRUE(done.success);
    TEST_ASSERT_TRUE(enc.state == ChallengeState::RESOLVED);
}

TEST(BattleEngineSteps, RejectedInputKeptInHistory) {
    BattleFixture f;
    Encounter enc;
    f.engine.begin(enc, f.world, f.roster, "Sheep", f.rng);

    auto rejected = f.engine.play_round(enc, f.roster, "lizard", RpsMove::SCISSORS);
    TEST_ASSERT_FALSE(rejected.accepted);
    TEST_ASSERT_EQ(0, enc.wins + enc.draws + enc.losses);

    f.engine.play_round(enc, f.roster, "rock", RpsMove::SCISSORS);
    f.engine.play_round(enc, f.roster, "rock", RpsMove::SCISSORS);
    auto stepped = f.engine.resolve(enc, f.world, f.roster, f.stats);

    // Same inputs through run() give the same history
    BattleFixture g;
    auto driven = g.run("Sheep", {"lizard", "rock", "rock"}, {RpsMove::SCISSORS});

    TEST_ASSERT_EQ(3u, stepped.rounds.size());
    TEST_ASSERT_EQ(stepped.rounds.size(), driven.rounds.size());
    for (size_t i = 0; i < stepped.rounds.size(); i++) {
        TEST_ASSERT_EQ(stepped.rounds[i].accepted, driven.rounds[i].accepted);
        TEST_ASSERT_EQ(stepped.rounds[i].effect_description, driven.rounds[i].effect_description);
    }
}

TEST(BattleEngineSteps, ObserverSeesEveryRound) {
    BattleFixture f;
    std::vector<bool> seen;

    f.engine.run(f.world, f.roster, f.stats, "Sheep",
                 scripted_moves({"nope", "rock", "rock"}), f.rng,
                 scripted_opponent({RpsMove::SCISSORS}),
                 [&seen](const RoundReport& r) { seen.push_back(r.accepted); });

    TEST_ASSERT_EQ(3u, seen.size());
    TEST_ASSERT_FALSE(seen[0]);
    TEST_ASSERT_TRUE(seen[1]);
}
