#include "ScenarioHost.hpp"
#include "core/Logger.hpp"
#include <algorithm>
#include <utility>

namespace Hillkeeper {
namespace Sim {

ScenarioHost::ScenarioHost(const Scenario& scenario)
    : m_setup(scenario.setup) {
    for (const auto& def : scenario.unitDefs) {
        m_defs[def.def.id] = def;
        m_defsByName[def.def.name] = def.def.id;
    }
}

// =========================================================================
// IHostSimulation
// =========================================================================

const Rules::UnitDef* ScenarioHost::GetUnitDef(Rules::UnitDefId id) const {
    auto it = m_defs.find(id);
    return it != m_defs.end() ? &it->second.def : nullptr;
}

std::optional<Rules::UnitDefId> ScenarioHost::FindUnitDefByName(std::string_view name) const {
    auto it = m_defsByName.find(std::string(name));
    if (it == m_defsByName.end()) {
        return std::nullopt;
    }
    return it->second;
}

glm::vec2 ScenarioHost::GetUnitPosition(UnitId unit) const {
    const SimUnit* u = FindUnit(unit);
    return u ? u->position : glm::vec2(0.0f);
}

Rules::UnitHealth ScenarioHost::GetUnitHealth(UnitId unit) const {
    const SimUnit* u = FindUnit(unit);
    return u ? u->health : Rules::UnitHealth{};
}

void ScenarioHost::SetUnitMaxHealth(UnitId unit, float maxHealth) {
    auto it = m_units.find(unit);
    if (it != m_units.end()) {
        it->second.health.maxHealth = maxHealth;
    }
}

void ScenarioHost::SetUnitHealth(UnitId unit, float health) {
    auto it = m_units.find(unit);
    if (it != m_units.end()) {
        it->second.health.health = std::min(health, it->second.health.maxHealth);
    }
}

void ScenarioHost::SetGlobalLos(AllianceId alliance, bool enabled) {
    SIM_LOG_DEBUG("Global LOS {} for alliance {}", enabled ? "granted" : "revoked", alliance);
    if (enabled) {
        m_globalLos.insert(alliance);
    } else {
        m_globalLos.erase(alliance);
    }
}

void ScenarioHost::DestroyUnit(UnitId unit) {
    if (m_units.count(unit) == 0) {
        SIM_LOG_WARN("Destroy requested for unknown unit {}", unit);
        return;
    }
    if (std::find(m_pendingDestructions.begin(), m_pendingDestructions.end(), unit) == m_pendingDestructions.end()) {
        m_pendingDestructions.push_back(unit);
    }
}

void ScenarioHost::GameOver(const std::vector<AllianceId>& winners) {
    if (m_winners) {
        SIM_LOG_WARN("GameOver called again after the match ended");
        return;
    }
    m_winners = winners;
    SIM_LOG_INFO("Game over, {} winning alliance(s)", winners.size());
}

void ScenarioHost::SetRulesParam(std::string_view name, const nlohmann::json& value) {
    SIM_LOG_TRACE("Rules param {} = {}", name, value.dump());
    m_params.SetRulesParam(name, value);
}

// =========================================================================
// Unit Management
// =========================================================================

bool ScenarioHost::AddUnit(UnitId unit, Rules::UnitDefId def, TeamId team, const glm::vec2& position) {
    auto defIt = m_defs.find(def);
    if (defIt == m_defs.end()) {
        SIM_LOG_WARN("Cannot create unit {}: unknown unit def {}", unit, def);
        return false;
    }

    SimUnit u;
    u.id = unit;
    u.def = def;
    u.team = team;
    u.position = position;
    u.health = {defIt->second.maxHealth, defIt->second.maxHealth};

    if (!m_units.emplace(unit, u).second) {
        SIM_LOG_WARN("Cannot create unit {}: id already in use", unit);
        return false;
    }
    return true;
}

bool ScenarioHost::MoveUnit(UnitId unit, const glm::vec2& position) {
    auto it = m_units.find(unit);
    if (it == m_units.end()) {
        return false;
    }
    it->second.position = position;
    return true;
}

bool ScenarioHost::SetUnitTeam(UnitId unit, TeamId team) {
    auto it = m_units.find(unit);
    if (it == m_units.end()) {
        return false;
    }
    it->second.team = team;
    return true;
}

bool ScenarioHost::RemoveUnit(UnitId unit) {
    return m_units.erase(unit) > 0;
}

const SimUnit* ScenarioHost::FindUnit(UnitId unit) const {
    auto it = m_units.find(unit);
    return it != m_units.end() ? &it->second : nullptr;
}

std::vector<UnitId> ScenarioHost::TakePendingDestructions() {
    return std::exchange(m_pendingDestructions, {});
}

} // namespace Sim
} // namespace Hillkeeper
