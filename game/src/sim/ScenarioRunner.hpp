#pragma once

/**
 * @file ScenarioRunner.hpp
 * @brief Replays a scenario through the hill rules and reports the outcome
 */

#include "Scenario.hpp"
#include "ScenarioHost.hpp"
#include "rules/HillProgress.hpp"
#include "rules/HillRules.hpp"
#include <nlohmann/json.hpp>
#include <optional>
#include <vector>

namespace Hillkeeper {
namespace Sim {

/**
 * @brief One king transition
 */
struct KingChange {
    Tick tick = 0;
    std::optional<AllianceId> previousKing;
    std::optional<AllianceId> newKing;
};

/**
 * @brief Outcome of a replayed match
 */
struct MatchReport {
    std::string scenario;
    bool rulesActive = false;
    bool gameOver = false;
    std::optional<AllianceId> winner;
    Tick endTick = 0;

    std::vector<KingChange> kingHistory;
    std::vector<AllianceId> disqualified;
    nlohmann::json possession = nlohmann::json::object();
    nlohmann::json finalProgress = nlohmann::json::array();

    int deniedBuilds = 0;
    int blockedDamage = 0;
    int eventsApplied = 0;

    [[nodiscard]] nlohmann::json ToJson() const;
};

/**
 * @brief Adapter between scenario events and the hill rules
 *
 * Translates each scenario event into the matching typed rules call,
 * in the order the engine would raise them, and drives OnGameFrame()
 * once per tick.
 *
 * Example usage:
 * @code
 * ScenarioRunner runner(scenario);
 * MatchReport report = runner.Run();
 * std::cout << report.ToJson().dump(2);
 * @endcode
 */
class ScenarioRunner {
public:
    explicit ScenarioRunner(const Scenario& scenario);

    // Non-copyable: the rules hold a reference to the host
    ScenarioRunner(const ScenarioRunner&) = delete;
    ScenarioRunner& operator=(const ScenarioRunner&) = delete;

    /**
     * @brief Replay every event up to durationTicks or game over
     */
    MatchReport Run();

    /**
     * @brief Advance the match by one tick
     * @return false once the match is over or the duration is reached
     */
    bool Step();

    [[nodiscard]] Tick GetCurrentTick() const noexcept { return m_tick; }
    [[nodiscard]] const ScenarioHost& GetHost() const noexcept { return m_host; }
    [[nodiscard]] const Rules::HillRules& GetRules() const noexcept { return m_rules; }
    [[nodiscard]] const MatchReport& GetReport() const noexcept { return m_report; }

private:
    void ApplyEvent(const ScenarioEvent& event);
    void ApplySpawn(UnitId unit, const std::string& defName, TeamId team, const glm::vec2& position, bool finished);
    void ApplyBuild(const ScenarioEvent& event);
    void ApplyDamage(const ScenarioEvent& event);
    void Destroy(UnitId unit);
    void FlushDestructions();
    void Finish();

    const Scenario& m_scenario;
    ScenarioHost m_host;
    Rules::HillRules m_rules;

    Tick m_tick = 0;
    size_t m_nextEvent = 0;
    bool m_finished = false;
    MatchReport m_report;
};

} // namespace Sim
} // namespace Hillkeeper
