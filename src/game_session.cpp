/**
 * Pymon Engine - Game Session Implementation
 */

#include "game_session.hpp"
#include "items/item_effects.hpp"
#include "xray_logger.hpp"
#include <chrono>

namespace pymon {

GameSession::GameSession() {
    // Seed RNG with current time
    auto seed = std::chrono::high_resolution_clock::now().time_since_epoch().count();
    rng_.seed(static_cast<std::mt19937::result_type>(seed));
    items::register_all_items(item_registry_);
}

GameSession::GameSession(uint32_t seed) : rng_(seed) {
    items::register_all_items(item_registry_);
}

// ============================================================================
// SETUP
// ============================================================================

ActorID GameSession::make_actor_id(const std::string& prefix) {
    return prefix + "_" + std::to_string(next_actor_id_++);
}

const LocationName& GameSession::random_location() {
    const auto& names = world_.location_names();
    std::uniform_int_distribution<size_t> dist(0, names.size() - 1);
    return names[dist(rng_)];
}

bool GameSession::setup(const WorldDefinition& definition,
                        const std::string& starter_nickname,
                        const std::string& starter_description) {
    world_ = WorldGraph{};
    roster_ = CreatureRoster{};
    stats_ = BattleStats{};
    status_ = SessionStatus::NOT_STARTED;
    command_count_ = 0;
    next_actor_id_ = 1;

    if (definition.locations.empty()) {
        return false;
    }

    for (const auto& record : definition.locations) {
        if (world_.add_location(record.name, record.description) != ErrorCode::NONE) {
            return false;
        }
    }

    for (const auto& record : definition.locations) {
        for (Direction dir : ALL_DIRECTIONS) {
            const auto& door = record.doors[static_cast<size_t>(dir)];
            if (!door.has_value()) continue;
            if (world_.connect(record.name, dir, *door) != ErrorCode::NONE) {
                return false;
            }
        }
    }

    if (!spawn_starter(starter_nickname, starter_description, random_location())) {
        return false;
    }

    for (const auto& record : definition.creatures) {
        Actor creature(make_actor_id("creature"), record.nickname, record.description, record.adoptable);
        world_.add_creature(std::move(creature), random_location());
    }

    std::uniform_real_distribution<double> chance(0.0, 1.0);
    for (const auto& record : definition.items) {
        Item item(record.name, record.description, record.pickable, record.consumable);
        world_.add_item(random_location(), item.clone());

        if (item.consumable && chance(rng_) < DUPLICATE_CONSUMABLE_CHANCE) {
            world_.add_item(random_location(), std::move(item));
        }
    }

    return true;
}

bool GameSession::spawn_starter(const std::string& nickname,
                                const std::string& description,
                                const LocationName& where) {
    // Only setup() may restart a finished game
    if (status_ == SessionStatus::GAME_OVER || !world_.has_location(where)) {
        return false;
    }

    if (const Actor* previous = roster_.active()) {
        world_.remove_actor(*previous);
    }

    Actor starter = Actor::make_pymon(make_actor_id("pymon"), nickname, description);
    world_.place_actor(starter, where);
    roster_.set_active(std::move(starter));
    status_ = SessionStatus::ONGOING;
    return true;
}

std::optional<ActorID> GameSession::spawn_creature(const std::string& nickname,
                                                   const std::string& description,
                                                   bool adoptable,
                                                   const LocationName& where) {
    Actor creature(make_actor_id("creature"), nickname, description, adoptable);
    const Actor* stored = world_.add_creature(std::move(creature), where);
    if (!stored) {
        return std::nullopt;
    }
    return stored->id;
}

// ============================================================================
// COMMANDS
// ============================================================================

bool GameSession::ready_for_command(ErrorCode& error, std::string& description) const {
    if (status_ == SessionStatus::GAME_OVER) {
        error = ErrorCode::GAME_OVER;
        description = "The game is over.";
        return false;
    }
    if (status_ != SessionStatus::ONGOING || !roster_.has_active()) {
        error = ErrorCode::INVALID_SELECTION;
        description = "The game has not started.";
        return false;
    }
    return true;
}

void GameSession::trace_command(const std::string& command, const std::string& outcome) {
    command_count_++;
    if (logger_) {
        logger_->log_command(command_count_, command, outcome);
        logger_->log_state(*this);
    }
}

MoveResult GameSession::move(const std::string& direction) {
    MoveResult result;
    if (!ready_for_command(result.error, result.effect_description)) {
        return result;
    }

    result = world_.move(*roster_.active(), direction, rng_);
    trace_command("move " + direction, result.effect_description);
    return result;
}

PickResult GameSession::pick(const std::string& item_name) {
    PickResult result;
    if (!ready_for_command(result.error, result.effect_description)) {
        return result;
    }

    result = ItemRegistry::pick_item(world_, *roster_.active(), item_name);
    trace_command("pick " + item_name, result.effect_description);
    return result;
}

ItemResult GameSession::use_item(const std::string& item_name, const std::string& argument) {
    ItemResult result;
    if (!ready_for_command(result.error, result.effect_description)) {
        return result;
    }

    result = item_registry_.use_item(world_, *roster_.active(), item_name, argument);
    trace_command("use " + item_name + (argument.empty() ? "" : " " + argument),
                  result.effect_description);
    return result;
}

ChallengeResult GameSession::challenge(const std::string& opponent_name,
                                       const MoveSource& next_move,
                                       const OpponentPolicy& opponent,
                                       const RoundObserver& observer) {
    ChallengeResult result;
    if (!ready_for_command(result.error, result.effect_description)) {
        return result;
    }

    result = battle_engine_.run(world_, roster_, stats_, opponent_name, next_move, rng_,
                                opponent, observer);

    if (result.is_game_over()) {
        status_ = SessionStatus::GAME_OVER;
    }

    trace_command("challenge " + opponent_name, result.effect_description);

    if (result.is_game_over() && logger_) {
        logger_->log_game_end(result.effect_description);
    }
    return result;
}

SwitchResult GameSession::switch_active(size_t bench_index) {
    SwitchResult result;
    if (!ready_for_command(result.error, result.effect_description)) {
        return result;
    }

    result = roster_.switch_active(bench_index, world_);
    trace_command("switch " + std::to_string(bench_index), result.effect_description);
    return result;
}

// ============================================================================
// QUERIES
// ============================================================================

std::optional<LocationView> GameSession::current_location() const {
    const Actor* active = roster_.active();
    if (!active) {
        return std::nullopt;
    }
    return world_.view(active->location, active->id);
}

std::vector<Item> GameSession::inventory() const {
    const Actor* active = roster_.active();
    if (!active || !active->player.has_value()) {
        return {};
    }
    return active->player->inventory.items;
}

std::optional<PymonView> GameSession::active_pymon() const {
    return roster_.active_view();
}

std::vector<PymonView> GameSession::bench() const {
    return roster_.bench_view();
}

std::vector<PymonBattleSummary> GameSession::battle_report() const {
    return stats_.report();
}

} // namespace pymon
