/**
 * Pymon Engine - Python Bindings
 *
 * pybind11 wrapper for the C++ engine.
 * Lets a Python front end or test harness drive a full session.
 */

#include <pybind11/pybind11.h>
#include <pybind11/stl.h>
#include <pybind11/chrono.h>
#include <pybind11/functional.h>

#include <nlohmann/json.hpp>

#include "pymon_engine.hpp"
#include "items/item_effects.hpp"

namespace py = pybind11;

PYBIND11_MODULE(pymon_engine_cpp, m) {
    m.doc() = "Pymon text adventure engine";

    // ========================================================================
    // ENUMS
    // ========================================================================

    py::enum_<pymon::Direction>(m, "Direction")
        .value("WEST", pymon::Direction::WEST)
        .value("NORTH", pymon::Direction::NORTH)
        .value("EAST", pymon::Direction::EAST)
        .value("SOUTH", pymon::Direction::SOUTH)
        .export_values();

    py::enum_<pymon::RpsMove>(m, "RpsMove")
        .value("ROCK", pymon::RpsMove::ROCK)
        .value("PAPER", pymon::RpsMove::PAPER)
        .value("SCISSORS", pymon::RpsMove::SCISSORS)
        .export_values();

    py::enum_<pymon::RoundOutcome>(m, "RoundOutcome")
        .value("WIN", pymon::RoundOutcome::WIN)
        .value("DRAW", pymon::RoundOutcome::DRAW)
        .value("LOSS", pymon::RoundOutcome::LOSS)
        .export_values();

    py::enum_<pymon::ChallengeState>(m, "ChallengeState")
        .value("SEARCHING_OPPONENT", pymon::ChallengeState::SEARCHING_OPPONENT)
        .value("DIALOGUE_ONLY", pymon::ChallengeState::DIALOGUE_ONLY)
        .value("IN_PROGRESS", pymon::ChallengeState::IN_PROGRESS)
        .value("RESOLVED", pymon::ChallengeState::RESOLVED)
        .export_values();

    py::enum_<pymon::MatchOutcome>(m, "MatchOutcome")
        .value("NONE", pymon::MatchOutcome::NONE)
        .value("CAPTURED", pymon::MatchOutcome::CAPTURED)
        .value("SUBSTITUTED", pymon::MatchOutcome::SUBSTITUTED)
        .value("GAME_OVER", pymon::MatchOutcome::GAME_OVER)
        .export_values();

    py::enum_<pymon::SessionStatus>(m, "SessionStatus")
        .value("NOT_STARTED", pymon::SessionStatus::NOT_STARTED)
        .value("ONGOING", pymon::SessionStatus::ONGOING)
        .value("GAME_OVER", pymon::SessionStatus::GAME_OVER)
        .export_values();

    py::enum_<pymon::ErrorCode>(m, "ErrorCode")
        .value("NONE", pymon::ErrorCode::NONE)
        .value("INVALID_DIRECTION", pymon::ErrorCode::INVALID_DIRECTION)
        .value("INVALID_INPUT_FORMAT", pymon::ErrorCode::INVALID_INPUT_FORMAT)
        .value("INVALID_SELECTION", pymon::ErrorCode::INVALID_SELECTION)
        .value("GAME_OVER", pymon::ErrorCode::GAME_OVER)
        .export_values();

    // ========================================================================
    // ITEM
    // ========================================================================

    py::class_<pymon::Item>(m, "Item")
        .def(py::init<>())
        .def(py::init<std::string, std::string, bool, bool>())
        .def_readwrite("name", &pymon::Item::name)
        .def_readwrite("description", &pymon::Item::description)
        .def_readwrite("pickable", &pymon::Item::pickable)
        .def_readwrite("consumable", &pymon::Item::consumable)
        .def("matches_name", &pymon::Item::matches_name);

    // ========================================================================
    // VIEWS
    // ========================================================================

    py::class_<pymon::LocationView>(m, "LocationView")
        .def_readonly("name", &pymon::LocationView::name)
        .def_readonly("description", &pymon::LocationView::description)
        .def_readonly("creatures", &pymon::LocationView::creatures)
        .def_readonly("items", &pymon::LocationView::items)
        .def_readonly("doors", &pymon::LocationView::doors)
        .def("is_empty", &pymon::LocationView::is_empty);

    py::class_<pymon::PymonView>(m, "PymonView")
        .def_readonly("nickname", &pymon::PymonView::nickname)
        .def_readonly("description", &pymon::PymonView::description)
        .def_readonly("location", &pymon::PymonView::location)
        .def_readonly("energy", &pymon::PymonView::energy)
        .def_readonly("immune", &pymon::PymonView::immune)
        .def_readonly("inventory", &pymon::PymonView::inventory);

    py::class_<pymon::BattleRecord>(m, "BattleRecord")
        .def_readonly("timestamp", &pymon::BattleRecord::timestamp)
        .def_readonly("opponent", &pymon::BattleRecord::opponent)
        .def_readonly("wins", &pymon::BattleRecord::wins)
        .def_readonly("draws", &pymon::BattleRecord::draws)
        .def_readonly("losses", &pymon::BattleRecord::losses);

    py::class_<pymon::PymonBattleSummary>(m, "PymonBattleSummary")
        .def_readonly("nickname", &pymon::PymonBattleSummary::nickname)
        .def_readonly("battles", &pymon::PymonBattleSummary::battles)
        .def_readonly("total_wins", &pymon::PymonBattleSummary::total_wins)
        .def_readonly("total_draws", &pymon::PymonBattleSummary::total_draws)
        .def_readonly("total_losses", &pymon::PymonBattleSummary::total_losses);

    // ========================================================================
    // RESULTS
    // ========================================================================

    py::class_<pymon::MoveResult>(m, "MoveResult")
        .def_readonly("success", &pymon::MoveResult::success)
        .def_readonly("error", &pymon::MoveResult::error)
        .def_readonly("effect_description", &pymon::MoveResult::effect_description)
        .def_readonly("from_location", &pymon::MoveResult::from)
        .def_readonly("to_location", &pymon::MoveResult::to)
        .def_readonly("energy_dropped", &pymon::MoveResult::energy_dropped)
        .def_readonly("energy_after", &pymon::MoveResult::energy_after)
        .def_readonly("escaped", &pymon::MoveResult::escaped)
        .def_readonly("escape_blocked", &pymon::MoveResult::escape_blocked)
        .def_readonly("escape_destination", &pymon::MoveResult::escape_destination);

    py::class_<pymon::PickResult>(m, "PickResult")
        .def_readonly("success", &pymon::PickResult::success)
        .def_readonly("error", &pymon::PickResult::error)
        .def_readonly("effect_description", &pymon::PickResult::effect_description);

    py::class_<pymon::ItemResult>(m, "ItemResult")
        .def_readonly("success", &pymon::ItemResult::success)
        .def_readonly("consumed", &pymon::ItemResult::consumed)
        .def_readonly("error", &pymon::ItemResult::error)
        .def_readonly("effect_description", &pymon::ItemResult::effect_description)
        .def_readonly("inspected", &pymon::ItemResult::inspected);

    py::class_<pymon::SwitchResult>(m, "SwitchResult")
        .def_readonly("success", &pymon::SwitchResult::success)
        .def_readonly("error", &pymon::SwitchResult::error)
        .def_readonly("effect_description", &pymon::SwitchResult::effect_description);

    py::class_<pymon::RoundReport>(m, "RoundReport")
        .def_readonly("accepted", &pymon::RoundReport::accepted)
        .def_readonly("error", &pymon::RoundReport::error)
        .def_readonly("effect_description", &pymon::RoundReport::effect_description)
        .def_readonly("player_move", &pymon::RoundReport::player_move)
        .def_readonly("opponent_move", &pymon::RoundReport::opponent_move)
        .def_readonly("outcome", &pymon::RoundReport::outcome)
        .def_readonly("energy_after", &pymon::RoundReport::energy_after)
        .def_readonly("immunity_absorbed", &pymon::RoundReport::immunity_absorbed);

    py::class_<pymon::ChallengeResult>(m, "ChallengeResult")
        .def_readonly("success", &pymon::ChallengeResult::success)
        .def_readonly("error", &pymon::ChallengeResult::error)
        .def_readonly("effect_description", &pymon::ChallengeResult::effect_description)
        .def_readonly("state", &pymon::ChallengeResult::state)
        .def_readonly("opponent", &pymon::ChallengeResult::opponent)
        .def_readonly("dialogue", &pymon::ChallengeResult::dialogue)
        .def_readonly("wins", &pymon::ChallengeResult::wins)
        .def_readonly("draws", &pymon::ChallengeResult::draws)
        .def_readonly("losses", &pymon::ChallengeResult::losses)
        .def_readonly("outcome", &pymon::ChallengeResult::outcome)
        .def_readonly("new_active", &pymon::ChallengeResult::new_active)
        .def_readonly("rounds", &pymon::ChallengeResult::rounds)
        .def("is_game_over", &pymon::ChallengeResult::is_game_over);

    // ========================================================================
    // WORLD LOADER
    // ========================================================================

    py::class_<pymon::WorldDefinition>(m, "WorldDefinition")
        .def(py::init<>());

    py::class_<pymon::WorldLoader>(m, "WorldLoader")
        .def(py::init<>())
        .def("load_from_json", &pymon::WorldLoader::load_from_json)
        .def("load_from_string", &pymon::WorldLoader::load_from_string)
        .def("definition", &pymon::WorldLoader::definition, py::return_value_policy::copy)
        .def("error", &pymon::WorldLoader::error)
        .def("error_message", &pymon::WorldLoader::error_message);

    // ========================================================================
    // GAME SESSION
    // ========================================================================

    py::class_<pymon::GameSession>(m, "GameSession")
        .def(py::init<>())
        .def(py::init<uint32_t>())
        .def("setup", &pymon::GameSession::setup,
             py::arg("definition"),
             py::arg("starter_nickname") = "Kimimon",
             py::arg("starter_description") = "")
        .def("spawn_starter", &pymon::GameSession::spawn_starter)
        .def("spawn_creature", &pymon::GameSession::spawn_creature)
        .def("add_location", [](pymon::GameSession& s, const std::string& name, const std::string& description) {
            return s.world().add_location(name, description);
        })
        .def("connect", [](pymon::GameSession& s, const std::string& from,
                           const std::string& direction, const std::string& to) {
            return s.world().connect(from, direction, to);
        })
        .def("add_item", [](pymon::GameSession& s, const std::string& where, const pymon::Item& item) {
            return s.world().add_item(where, item);
        })
        .def("move", &pymon::GameSession::move)
        .def("pick", &pymon::GameSession::pick)
        .def("use_item", &pymon::GameSession::use_item,
             py::arg("item_name"), py::arg("argument") = "")
        .def("challenge", &pymon::GameSession::challenge,
             py::arg("opponent_name"),
             py::arg("next_move"),
             py::arg("opponent") = nullptr,
             py::arg("observer") = nullptr)
        .def("switch_active", &pymon::GameSession::switch_active)
        .def("current_location", &pymon::GameSession::current_location)
        .def("inventory", &pymon::GameSession::inventory)
        .def("active_pymon", &pymon::GameSession::active_pymon)
        .def("bench", &pymon::GameSession::bench)
        .def("battle_report", &pymon::GameSession::battle_report)
        .def("battle_report_json", [](const pymon::GameSession& s) {
            return s.stats().to_json().dump();
        })
        .def("status", &pymon::GameSession::status)
        .def("is_game_over", &pymon::GameSession::is_game_over)
        .def("command_count", &pymon::GameSession::command_count);

    // ========================================================================
    // UTILITIES
    // ========================================================================

    m.def("get_version", &pymon::get_version, "Get engine version");
    m.def("usable_items", []() {
        std::vector<std::string> names;
        for (const auto& info : pymon::items::get_item_info()) {
            names.push_back(info.name);
        }
        return names;
    }, "Names of items with a use effect");
}
