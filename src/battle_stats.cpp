/**
 * Pymon Engine - Battle Stats Implementation
 *
 * Report serialization uses nlohmann/json.
 */

#include "battle_stats.hpp"
#include <nlohmann/json.hpp>
#include <ctime>
#include <iomanip>
#include <sstream>

using json = nlohmann::json;

namespace pymon {

void BattleStats::record(const std::string& nickname, const std::string& opponent,
                         int wins, int draws, int losses) {
    record(nickname, opponent, wins, draws, losses, std::chrono::system_clock::now());
}

void BattleStats::record(const std::string& nickname, const std::string& opponent,
                         int wins, int draws, int losses, Timestamp timestamp) {
    if (battles_.find(nickname) == battles_.end()) {
        order_.push_back(nickname);
    }

    BattleRecord entry;
    entry.timestamp = timestamp;
    entry.opponent = opponent;
    entry.wins = wins;
    entry.draws = draws;
    entry.losses = losses;
    battles_[nickname].push_back(std::move(entry));
}

std::vector<PymonBattleSummary> BattleStats::report() const {
    std::vector<PymonBattleSummary> result;
    result.reserve(order_.size());

    for (const auto& nickname : order_) {
        PymonBattleSummary summary;
        summary.nickname = nickname;
        summary.battles = battles_.at(nickname);

        for (const auto& b : summary.battles) {
            summary.total_wins += b.wins;
            summary.total_draws += b.draws;
            summary.total_losses += b.losses;
        }

        result.push_back(std::move(summary));
    }

    return result;
}

const std::vector<BattleRecord>* BattleStats::battles_of(const std::string& nickname) const {
    auto it = battles_.find(nickname);
    return it != battles_.end() ? &it->second : nullptr;
}

size_t BattleStats::total_battles() const {
    size_t count = 0;
    for (const auto& [nickname, battles] : battles_) {
        count += battles.size();
    }
    return count;
}

json BattleStats::to_json() const {
    json pymons = json::array();

    for (const auto& summary : report()) {
        json battles = json::array();
        for (const auto& b : summary.battles) {
            battles.push_back({
                {"timestamp", format_timestamp(b.timestamp)},
                {"opponent", b.opponent},
                {"wins", b.wins},
                {"draws", b.draws},
                {"losses", b.losses}
            });
        }

        pymons.push_back({
            {"nickname", summary.nickname},
            {"battles", battles},
            {"total", {
                {"wins", summary.total_wins},
                {"draws", summary.total_draws},
                {"losses", summary.total_losses}
            }}
        });
    }

    return json{{"pymons", pymons}};
}

std::string BattleStats::format_timestamp(Timestamp timestamp) {
    auto time_t = std::chrono::system_clock::to_time_t(timestamp);
    std::tm tm = *std::localtime(&time_t);

    std::ostringstream out;
    out << std::put_time(&tm, "%d/%m/%Y %I:%M%p");
    return out.str();
}

} // namespace pymon
