/**
 * Pymon Engine - Battle Engine
 *
 * Resolves a challenge against a creature in the active Pymon's location.
 *
 * State machine:
 *   SEARCHING_OPPONENT -> DIALOGUE_ONLY                (opponent not adoptable)
 *   SEARCHING_OPPONENT -> IN_PROGRESS -> RESOLVED      (best-of rock/paper/scissors)
 *
 * The step-wise API (begin / play_round / resolve) lets a caller drive the
 * match one input at a time; run() drives it end-to-end from callbacks.
 */

#pragma once

#include "creature_roster.hpp"
#include "battle_stats.hpp"
#include <functional>
#include <random>

namespace pymon {

// ============================================================================
// CALLBACK TYPES
// ============================================================================

// Player input for the next round; nullopt when input has run dry
using MoveSource = std::function<std::optional<std::string>()>;

// Opponent's hand for the next round
using OpponentPolicy = std::function<RpsMove()>;

// Notified after every submitted round, accepted or not
struct RoundReport;
using RoundObserver = std::function<void(const RoundReport&)>;

// ============================================================================
// RESULT TYPES
// ============================================================================

/**
 * Outcome of a single submitted round.
 *
 * Rejected input (accepted == false) does not count as a round.
 */
struct RoundReport {
    bool accepted = false;
    ErrorCode error = ErrorCode::NONE;
    std::string effect_description;

    RpsMove player_move = RpsMove::ROCK;
    RpsMove opponent_move = RpsMove::ROCK;
    RoundOutcome outcome = RoundOutcome::DRAW;
    int energy_after = 0;
    bool immunity_absorbed = false;
};

/**
 * Encounter - Live state of one challenge.
 */
struct Encounter {
    ChallengeState state = ChallengeState::SEARCHING_OPPONENT;

    ActorID challenger_id;
    std::string challenger_name;
    ActorID opponent_id;
    std::string opponent_name;

    int wins = 0;
    int draws = 0;
    int losses = 0;

    bool immunity_used = false;
    bool forfeited = false;

    std::vector<RoundReport> rounds;
};

/**
 * Result of a challenge command (begin, resolve or a full run).
 */
struct ChallengeResult {
    bool success = false;
    ErrorCode error = ErrorCode::NONE;
    std::string effect_description;

    ChallengeState state = ChallengeState::SEARCHING_OPPONENT;
    std::string opponent;
    std::string dialogue;          // flavor line for non-adoptable opponents

    int wins = 0;
    int draws = 0;
    int losses = 0;

    MatchOutcome outcome = MatchOutcome::NONE;
    std::string new_active;        // promoted pet after a lost match
    std::vector<RoundReport> rounds;

    bool is_game_over() const { return outcome == MatchOutcome::GAME_OVER; }
};

// ============================================================================
// BATTLE ENGINE
// ============================================================================

/**
 * BattleEngine - Stateless rules for challenges.
 *
 * All randomness comes from the generator passed in by the caller.
 */
class BattleEngine {
public:
    BattleEngine() = default;
    ~BattleEngine() = default;

    /**
     * Look up the opponent and open the encounter.
     *
     * Fails with INVALID_SELECTION if no creature with that exact nickname is
     * in the active Pymon's location, or if it is the active Pymon itself.
     * A non-adoptable opponent ends the encounter in DIALOGUE_ONLY with a
     * random flavor line and no state change.
     */
    ChallengeResult begin(Encounter& encounter,
                          const WorldGraph& world,
                          const CreatureRoster& roster,
                          const std::string& opponent_name,
                          std::mt19937& rng) const;

    /**
     * Play one round with the player's raw input.
     *
     * Input other than rock/paper/scissors (any case) is rejected without
     * consuming a round; the rejected report is still kept in the encounter
     * history. A lost round costs the challenger one energy unless
     * immunity absorbs it.
     */
    RoundReport play_round(Encounter& encounter,
                           CreatureRoster& roster,
                           const std::string& input,
                           RpsMove opponent_move) const;

    /**
     * True once wins or losses reach their limit, the challenger is out of
     * energy, or the player forfeited.
     */
    bool is_match_over(const Encounter& encounter, const CreatureRoster& roster) const;

    /**
     * Apply the match outcome and append the battle record.
     *
     * Win: the opponent joins the bench as a full-energy Pymon.
     * Loss: the front pet replaces the active Pymon, or GAME_OVER if there is none.
     */
    ChallengeResult resolve(Encounter& encounter,
                            WorldGraph& world,
                            CreatureRoster& roster,
                            BattleStats& stats) const;

    /**
     * Drive a whole challenge from callbacks.
     *
     * @param next_move Player input source; running dry forfeits the match
     * @param opponent Opponent policy; defaults to a uniform random hand
     * @param observer Called after each round (optional)
     */
    ChallengeResult run(WorldGraph& world,
                        CreatureRoster& roster,
                        BattleStats& stats,
                        const std::string& opponent_name,
                        const MoveSource& next_move,
                        std::mt19937& rng,
                        const OpponentPolicy& opponent = nullptr,
                        const RoundObserver& observer = nullptr) const;

    static RpsMove random_move(std::mt19937& rng);

    static std::string random_dialogue(const std::string& opponent_name, std::mt19937& rng);
};

} // namespace pymon
