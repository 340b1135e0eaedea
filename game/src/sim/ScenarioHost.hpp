#pragma once

#include "Scenario.hpp"
#include "events/PublishedValue.hpp"
#include "events/RulesParamStore.hpp"
#include "rules/HostSimulation.hpp"
#include <map>
#include <optional>
#include <set>
#include <string>
#include <unordered_map>
#include <vector>

namespace Hillkeeper {
namespace Sim {

/**
 * @brief A unit living in the scenario host
 */
struct SimUnit {
    UnitId id = 0;
    Rules::UnitDefId def = 0;
    TeamId team = 0;
    glm::vec2 position{0.0f, 0.0f};
    Rules::UnitHealth health;
};

/**
 * @brief In-memory host simulation for headless replays
 *
 * Implements the host queries and side effects the hill rules need, and
 * receives the published rules parameters into a RulesParamStore.
 *
 * DestroyUnit() only queues the unit; the runner removes it and reports
 * the destruction back to the rules once the current rules call has
 * returned, like an engine that destroys units at the end of a frame.
 */
class ScenarioHost : public Rules::IHostSimulation, public Events::IRulesParamSink {
public:
    explicit ScenarioHost(const Scenario& scenario);

    // =========================================================================
    // IHostSimulation
    // =========================================================================

    [[nodiscard]] Rules::MatchSetup GetMatchSetup() const override { return m_setup; }
    [[nodiscard]] const Rules::UnitDef* GetUnitDef(Rules::UnitDefId id) const override;
    [[nodiscard]] std::optional<Rules::UnitDefId> FindUnitDefByName(std::string_view name) const override;
    [[nodiscard]] glm::vec2 GetUnitPosition(UnitId unit) const override;
    [[nodiscard]] Rules::UnitHealth GetUnitHealth(UnitId unit) const override;
    void SetUnitMaxHealth(UnitId unit, float maxHealth) override;
    void SetUnitHealth(UnitId unit, float health) override;
    void SetGlobalLos(AllianceId alliance, bool enabled) override;
    void DestroyUnit(UnitId unit) override;
    void GameOver(const std::vector<AllianceId>& winners) override;

    // =========================================================================
    // IRulesParamSink
    // =========================================================================

    void SetRulesParam(std::string_view name, const nlohmann::json& value) override;

    // =========================================================================
    // Unit Management
    // =========================================================================

    /**
     * @brief Create a unit at full health
     * @return false if the id is taken or the def is unknown
     */
    bool AddUnit(UnitId unit, Rules::UnitDefId def, TeamId team, const glm::vec2& position);

    bool MoveUnit(UnitId unit, const glm::vec2& position);
    bool SetUnitTeam(UnitId unit, TeamId team);

    /**
     * @brief Remove a unit
     * @return false if it did not exist
     */
    bool RemoveUnit(UnitId unit);

    [[nodiscard]] const SimUnit* FindUnit(UnitId unit) const;
    [[nodiscard]] size_t GetUnitCount() const noexcept { return m_units.size(); }

    /**
     * @brief Take the units queued by DestroyUnit() since the last call
     */
    std::vector<UnitId> TakePendingDestructions();

    // =========================================================================
    // Observed Side Effects
    // =========================================================================

    [[nodiscard]] bool HasGlobalLos(AllianceId alliance) const { return m_globalLos.count(alliance) > 0; }
    [[nodiscard]] bool IsGameOver() const noexcept { return m_winners.has_value(); }
    [[nodiscard]] const std::optional<std::vector<AllianceId>>& GetWinners() const noexcept { return m_winners; }
    [[nodiscard]] const Events::RulesParamStore& GetParams() const noexcept { return m_params; }

private:
    Rules::MatchSetup m_setup;
    std::map<Rules::UnitDefId, ScenarioUnitDef> m_defs;
    std::unordered_map<std::string, Rules::UnitDefId> m_defsByName;
    std::map<UnitId, SimUnit> m_units;
    std::vector<UnitId> m_pendingDestructions;
    std::set<AllianceId> m_globalLos;
    std::optional<std::vector<AllianceId>> m_winners;
    Events::RulesParamStore m_params;
};

} // namespace Sim
} // namespace Hillkeeper
