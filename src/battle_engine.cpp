/**
 * Pymon Engine - Battle Engine Implementation
 */

#include "battle_engine.hpp"

namespace pymon {

namespace {

void copy_tally(const Encounter& encounter, ChallengeResult& result) {
    result.state = encounter.state;
    result.opponent = encounter.opponent_name;
    result.wins = encounter.wins;
    result.draws = encounter.draws;
    result.losses = encounter.losses;
    result.rounds = encounter.rounds;
}

} // anonymous namespace

// ============================================================================
// RANDOMNESS
// ============================================================================

RpsMove BattleEngine::random_move(std::mt19937& rng) {
    std::uniform_int_distribution<int> dist(0, 2);
    return static_cast<RpsMove>(dist(rng));
}

std::string BattleEngine::random_dialogue(const std::string& opponent_name, std::mt19937& rng) {
    const std::array<std::string, 3> lines = {
        opponent_name + " just ignored you.",
        opponent_name + " just laughed at you.",
        opponent_name + " ran away.",
    };
    std::uniform_int_distribution<size_t> dist(0, lines.size() - 1);
    return lines[dist(rng)];
}

// ============================================================================
// ENCOUNTER SETUP
// ============================================================================

ChallengeResult BattleEngine::begin(Encounter& encounter,
                                    const WorldGraph& world,
                                    const CreatureRoster& roster,
                                    const std::string& opponent_name,
                                    std::mt19937& rng) const {
    ChallengeResult result;
    encounter = Encounter{};
    encounter.opponent_name = opponent_name;

    const Actor* challenger = roster.active();
    if (!challenger) {
        result.error = ErrorCode::INVALID_SELECTION;
        result.effect_description = "You dont have an active Pymon.";
        return result;
    }

    encounter.challenger_id = challenger->id;
    encounter.challenger_name = challenger->nickname;

    const Location* here = world.find_location(challenger->location);
    const Occupant* occupant = here ? here->find_occupant_by_nickname(opponent_name) : nullptr;
    if (!occupant) {
        result.error = ErrorCode::INVALID_SELECTION;
        result.effect_description = opponent_name + " is not available here.";
        return result;
    }

    if (occupant->id == challenger->id) {
        result.error = ErrorCode::INVALID_SELECTION;
        result.effect_description = "You cannot challenge your own Pymon.";
        return result;
    }

    const Actor* opponent = world.find_creature(occupant->id);
    if (!opponent) {
        result.error = ErrorCode::INVALID_SELECTION;
        result.effect_description = opponent_name + " is not available here.";
        return result;
    }

    encounter.opponent_id = opponent->id;

    if (!opponent->adoptable) {
        encounter.state = ChallengeState::DIALOGUE_ONLY;
        result.success = true;
        result.dialogue = random_dialogue(opponent->nickname, rng);
        result.effect_description = result.dialogue;
        copy_tally(encounter, result);
        return result;
    }

    encounter.state = ChallengeState::IN_PROGRESS;
    result.success = true;
    result.effect_description = "You started the challenge with " + opponent->nickname + "!";
    copy_tally(encounter, result);
    return result;
}

// ============================================================================
// ROUNDS
// ============================================================================

bool BattleEngine::is_match_over(const Encounter& encounter, const CreatureRoster& roster) const {
    if (encounter.wins >= WINS_TO_CAPTURE || encounter.losses >= LOSSES_TO_FORFEIT) {
        return true;
    }
    if (encounter.forfeited) {
        return true;
    }
    const Actor* challenger = roster.active();
    return !challenger || challenger->energy() <= 0;
}

RoundReport BattleEngine::play_round(Encounter& encounter,
                                     CreatureRoster& roster,
                                     const std::string& input,
                                     RpsMove opponent_move) const {
    RoundReport report;

    Actor* challenger = roster.active();
    if (encounter.state != ChallengeState::IN_PROGRESS || !challenger ||
        challenger->id != encounter.challenger_id || !challenger->player.has_value() ||
        is_match_over(encounter, roster)) {
        report.error = ErrorCode::INVALID_SELECTION;
        report.effect_description = "No battle is in progress.";
        return report;
    }

    auto player_move = parse_rps_move(input);
    if (!player_move.has_value()) {
        report.error = ErrorCode::INVALID_SELECTION;
        report.effect_description = "Invalid choice. Try again";
        report.energy_after = challenger->energy();
        encounter.rounds.push_back(report);
        return report;
    }

    PlayerState& ps = *challenger->player;

    report.accepted = true;
    report.player_move = *player_move;
    report.opponent_move = opponent_move;
    report.outcome = judge_round(*player_move, opponent_move);

    switch (report.outcome) {
        case RoundOutcome::DRAW:
            encounter.draws++;
            report.effect_description = "Draw, no one wins this encounter";
            break;

        case RoundOutcome::WIN:
            encounter.wins++;
            report.effect_description = "Your Pymon " + challenger->nickname + " won this encounter!";
            break;

        case RoundOutcome::LOSS:
            encounter.losses++;
            if (ps.immune && !encounter.immunity_used) {
                encounter.immunity_used = true;
                report.immunity_absorbed = true;
                report.effect_description = "Your Pymon " + challenger->nickname +
                                            " lost this encounter, but the magic potion protected its energy.";
            } else {
                ps.drain_energy();
                report.effect_description = "Your Pymon " + challenger->nickname +
                                            " lost this encounter. Remaining Energy: " +
                                            std::to_string(ps.energy);
            }
            break;
    }

    report.energy_after = ps.energy;
    encounter.rounds.push_back(report);
    return report;
}

// ============================================================================
// RESOLUTION
// ============================================================================

ChallengeResult BattleEngine::resolve(Encounter& encounter,
                                      WorldGraph& world,
                                      CreatureRoster& roster,
                                      BattleStats& stats) const {
    ChallengeResult result;

    if (encounter.state != ChallengeState::IN_PROGRESS || !is_match_over(encounter, roster)) {
        result.error = ErrorCode::INVALID_SELECTION;
        result.effect_description = "The battle is not finished.";
        copy_tally(encounter, result);
        return result;
    }

    // Immunity lasts for one battle only
    Actor* challenger = roster.active();
    if (challenger && challenger->player.has_value()) {
        challenger->player->immune = false;
    }

    if (encounter.wins >= WINS_TO_CAPTURE) {
        auto captured = world.take_creature(encounter.opponent_id);
        if (captured.has_value()) {
            Actor pet = Actor::make_pymon(captured->id, captured->nickname,
                                          captured->description, captured->location);
            roster.add_pet(std::move(pet));
        }
        result.outcome = MatchOutcome::CAPTURED;
        result.effect_description = "You won the battle against " + encounter.opponent_name + "!";
    } else if (roster.promote_next(world)) {
        result.outcome = MatchOutcome::SUBSTITUTED;
        result.new_active = roster.active()->nickname;
        result.effect_description = "Lost the battle. " + encounter.challenger_name +
                                    " ran away into the wild. " + result.new_active +
                                    " is now your primary Pymon.";
    } else {
        result.outcome = MatchOutcome::GAME_OVER;
        result.effect_description = "Lost the battle. You dont have any Pymon left to help you in this game. GAME OVER!";
    }

    stats.record(encounter.challenger_name, encounter.opponent_name,
                 encounter.wins, encounter.draws, encounter.losses);

    encounter.state = ChallengeState::RESOLVED;
    result.success = true;
    copy_tally(encounter, result);
    return result;
}

ChallengeResult BattleEngine::run(WorldGraph& world,
                                  CreatureRoster& roster,
                                  BattleStats& stats,
                                  const std::string& opponent_name,
                                  const MoveSource& next_move,
                                  std::mt19937& rng,
                                  const OpponentPolicy& opponent,
                                  const RoundObserver& observer) const {
    Encounter encounter;
    ChallengeResult opened = begin(encounter, world, roster, opponent_name, rng);
    if (!opened.success || encounter.state != ChallengeState::IN_PROGRESS) {
        return opened;
    }

    while (!is_match_over(encounter, roster)) {
        std::optional<std::string> input = next_move ? next_move() : std::nullopt;
        if (!input.has_value()) {
            encounter.forfeited = true;
            break;
        }

        // Rejected input is re-prompted without the opponent showing a hand
        if (!parse_rps_move(*input).has_value()) {
            RoundReport rejected = play_round(encounter, roster, *input, RpsMove::ROCK);
            if (observer) observer(rejected);
            continue;
        }

        RpsMove opponent_move = opponent ? opponent() : random_move(rng);
        RoundReport report = play_round(encounter, roster, *input, opponent_move);
        if (observer) observer(report);
    }

    return resolve(encounter, world, roster, stats);
}

} // namespace pymon
