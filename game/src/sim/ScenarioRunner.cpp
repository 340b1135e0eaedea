#include "ScenarioRunner.hpp"
#include "core/Logger.hpp"

namespace Hillkeeper {
namespace Sim {

namespace {

nlohmann::json OptionalToJson(const std::optional<AllianceId>& alliance) {
    return alliance ? nlohmann::json(*alliance) : nlohmann::json(nullptr);
}

} // namespace

// ============================================================================
// MatchReport
// ============================================================================

nlohmann::json MatchReport::ToJson() const {
    nlohmann::json j;
    j["scenario"] = scenario;
    j["rulesActive"] = rulesActive;
    j["gameOver"] = gameOver;
    j["winner"] = OptionalToJson(winner);
    j["endTick"] = endTick;

    j["kingHistory"] = nlohmann::json::array();
    for (const auto& change : kingHistory) {
        j["kingHistory"].push_back({
            {"tick", change.tick},
            {"previousKing", OptionalToJson(change.previousKing)},
            {"newKing", OptionalToJson(change.newKing)}
        });
    }

    j["disqualified"] = disqualified;
    j["possession"] = possession;
    j["progress"] = finalProgress;
    j["deniedBuilds"] = deniedBuilds;
    j["blockedDamage"] = blockedDamage;
    j["eventsApplied"] = eventsApplied;
    return j;
}

// ============================================================================
// ScenarioRunner
// ============================================================================

ScenarioRunner::ScenarioRunner(const Scenario& scenario)
    : m_scenario(scenario)
    , m_host(scenario)
    , m_rules(m_host, &m_host) {
    m_report.scenario = scenario.name;

    m_rules.SetOnKingChanged([this](std::optional<AllianceId> previousKing,
                                    std::optional<AllianceId> newKing,
                                    Tick tick) {
        m_report.kingHistory.push_back({tick, previousKing, newKing});
    });
    m_rules.SetOnDisqualified([this](AllianceId alliance, Tick) {
        m_report.disqualified.push_back(alliance);
    });

    m_report.rulesActive = m_rules.Initialize(scenario.modOptions);
}

MatchReport ScenarioRunner::Run() {
    SIM_LOG_INFO("Running scenario \"{}\" for up to {} ticks", m_scenario.name, m_scenario.durationTicks);
    while (Step()) {
    }
    return m_report;
}

bool ScenarioRunner::Step() {
    if (m_finished) {
        return false;
    }

    const auto& events = m_scenario.events;
    while (m_nextEvent < events.size() && events[m_nextEvent].tick <= m_tick) {
        ApplyEvent(events[m_nextEvent++]);
    }

    m_rules.OnGameFrame(m_tick);
    FlushDestructions();

    if (m_host.IsGameOver() || m_tick >= m_scenario.durationTicks) {
        Finish();
        return false;
    }
    ++m_tick;
    return true;
}

void ScenarioRunner::ApplyEvent(const ScenarioEvent& event) {
    SIM_LOG_TRACE("Tick {}: {} unit {} team {}", m_tick, EventTypeToString(event.type), event.unit, event.team);

    switch (event.type) {
        case EventType::Spawn:
            ApplySpawn(event.unit, event.unitDef, event.team, event.position, event.finished);
            break;

        case EventType::Move:
            if (!m_host.MoveUnit(event.unit, event.position)) {
                SIM_LOG_WARN("Tick {}: move of unknown unit {}", m_tick, event.unit);
            }
            break;

        case EventType::Give: {
            const SimUnit* unit = m_host.FindUnit(event.unit);
            if (!unit) {
                SIM_LOG_WARN("Tick {}: give of unknown unit {}", m_tick, event.unit);
                break;
            }
            const TeamId oldTeam = unit->team;
            const Rules::UnitDefId def = unit->def;
            m_host.SetUnitTeam(event.unit, event.team);
            m_rules.OnUnitGiven(event.unit, def, event.team, oldTeam);
            break;
        }

        case EventType::Destroy:
            Destroy(event.unit);
            break;

        case EventType::TeamDied:
            m_rules.OnTeamDied(event.team, m_tick);
            break;

        case EventType::Build:
            ApplyBuild(event);
            break;

        case EventType::Damage:
            ApplyDamage(event);
            break;
    }

    FlushDestructions();
    ++m_report.eventsApplied;
}

void ScenarioRunner::ApplySpawn(UnitId unit, const std::string& defName, TeamId team,
                                const glm::vec2& position, bool finished) {
    const auto def = m_host.FindUnitDefByName(defName);
    if (!def) {
        SIM_LOG_WARN("Tick {}: unknown unit def \"{}\" for unit {}", m_tick, defName, unit);
        return;
    }
    if (!m_host.AddUnit(unit, *def, team, position)) {
        return;
    }

    m_rules.OnUnitCreated(unit, *def, team);
    if (finished) {
        m_rules.OnUnitFinished(unit, *def, team);
    }
}

void ScenarioRunner::ApplyBuild(const ScenarioEvent& event) {
    const auto def = m_host.FindUnitDefByName(event.unitDef);
    if (!def) {
        SIM_LOG_WARN("Tick {}: build order for unknown unit def \"{}\"", m_tick, event.unitDef);
        return;
    }

    Rules::BuildCommand command;
    command.team = event.team;
    command.buildDef = *def;
    command.x = event.position.x;
    command.z = event.position.y;
    command.facing = event.facing;

    if (!m_rules.AllowBuildCommand(command)) {
        ++m_report.deniedBuilds;
        SIM_LOG_INFO("Tick {}: team {} may not build {} at ({}, {})",
                     m_tick, event.team, event.unitDef, event.position.x, event.position.y);
        return;
    }

    // A build order without a unit id only tests admission
    if (event.unit != 0) {
        ApplySpawn(event.unit, event.unitDef, event.team, event.position, true);
    }
}

void ScenarioRunner::ApplyDamage(const ScenarioEvent& event) {
    const SimUnit* unit = m_host.FindUnit(event.unit);
    if (!unit) {
        SIM_LOG_WARN("Tick {}: damage to unknown unit {}", m_tick, event.unit);
        return;
    }

    Rules::DamageEvent hit;
    hit.unit = event.unit;
    hit.unitTeam = unit->team;
    hit.hasAttacker = event.attackerTeam.has_value();
    hit.attackerTeam = event.attackerTeam.value_or(0);
    hit.damage = event.damage;

    float damage = event.damage;
    if (const auto replaced = m_rules.FilterDamage(hit)) {
        damage = replaced->damage;
        ++m_report.blockedDamage;
        SIM_LOG_DEBUG("Tick {}: damage to unit {} blocked inside its start box", m_tick, event.unit);
    }

    const float remaining = unit->health.health - damage;
    if (remaining <= 0.0f) {
        Destroy(event.unit);
    } else {
        m_host.SetUnitHealth(event.unit, remaining);
    }
}

void ScenarioRunner::Destroy(UnitId unit) {
    if (m_host.RemoveUnit(unit)) {
        m_rules.OnUnitDestroyed(unit);
    }
}

void ScenarioRunner::FlushDestructions() {
    for (auto pending = m_host.TakePendingDestructions(); !pending.empty();
         pending = m_host.TakePendingDestructions()) {
        for (UnitId unit : pending) {
            Destroy(unit);
        }
    }
}

void ScenarioRunner::Finish() {
    m_finished = true;
    m_report.endTick = m_tick;
    m_report.gameOver = m_host.IsGameOver();

    const auto& winners = m_host.GetWinners();
    if (winners && winners->size() == 1) {
        m_report.winner = winners->front();
    }

    m_report.possession = m_rules.GetPossession().ToJson();

    const auto& config = m_rules.GetConfig();
    Rules::HillProgressView view(m_host.GetParams(), m_rules.GetRoster().GetAlliances(),
                                 config.winKingTicks, config.captureDelayTicks);
    m_report.finalProgress = nlohmann::json::array();
    for (const auto& progress : view.Refresh(m_tick).alliances) {
        m_report.finalProgress.push_back({
            {"alliance", progress.alliance},
            {"fraction", progress.fraction},
            {"disqualified", progress.disqualified},
            {"isKing", progress.isKing}
        });
    }

    if (m_report.winner) {
        SIM_LOG_INFO("Scenario \"{}\" finished at tick {}: alliance {} wins",
                     m_scenario.name, m_tick, *m_report.winner);
    } else {
        SIM_LOG_INFO("Scenario \"{}\" finished at tick {} without a winner", m_scenario.name, m_tick);
    }
}

} // namespace Sim
} // namespace Hillkeeper
