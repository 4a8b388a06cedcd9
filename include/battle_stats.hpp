/**
 * Pymon Engine - Battle Stats
 *
 * Append-only ledger of finished battles, keyed by Pymon nickname.
 */

#pragma once

#include "types.hpp"
#include <chrono>
#include <nlohmann/json_fwd.hpp>

namespace pymon {

using Timestamp = std::chrono::system_clock::time_point;

/**
 * One finished battle (immutable once recorded).
 */
struct BattleRecord {
    Timestamp timestamp;
    std::string opponent;
    int wins = 0;
    int draws = 0;
    int losses = 0;
};

/**
 * Aggregated history of a single Pymon.
 */
struct PymonBattleSummary {
    std::string nickname;
    std::vector<BattleRecord> battles;
    int total_wins = 0;
    int total_draws = 0;
    int total_losses = 0;
};

/**
 * BattleStats - The battle ledger.
 *
 * Entries are never modified or removed after insertion. Nicknames are
 * reported in the order they were first recorded.
 */
class BattleStats {
public:
    BattleStats() = default;
    ~BattleStats() = default;

    /**
     * Append a battle stamped with the current time.
     */
    void record(const std::string& nickname, const std::string& opponent,
                int wins, int draws, int losses);

    /**
     * Append a battle with an explicit timestamp.
     */
    void record(const std::string& nickname, const std::string& opponent,
                int wins, int draws, int losses, Timestamp timestamp);

    /**
     * Per-nickname history with running totals. Pure read.
     */
    std::vector<PymonBattleSummary> report() const;

    const std::vector<BattleRecord>* battles_of(const std::string& nickname) const;

    size_t total_battles() const;

    bool is_empty() const { return order_.empty(); }

    nlohmann::json to_json() const;

    /**
     * Format as "dd/mm/YYYY hh:mmAM" in local time.
     */
    static std::string format_timestamp(Timestamp timestamp);

private:
    std::unordered_map<std::string, std::vector<BattleRecord>> battles_;
    std::vector<std::string> order_;
};

} // namespace pymon
