#include "HillRules.hpp"
#include "config/Config.hpp"
#include "core/Logger.hpp"
#include <algorithm>
#include <vector>

namespace Hillkeeper {
namespace Rules {

HillRules::HillRules(IHostSimulation& host, Events::IRulesParamSink* sink)
    : m_host(host)
    , m_sink(sink)
    , m_publishedKing(std::string(ParamNames::KingAlliance), sink)
    , m_publishedKingStart(std::string(ParamNames::KingStartTick), sink, 0)
    , m_publishedContesting(std::string(ParamNames::ContestingAlliance), sink)
    , m_publishedDeadline(std::string(ParamNames::ContestDeadlineTick), sink, 0)
    , m_publishedProgressing(std::string(ParamNames::ContestProgressing), sink, false) {
}

bool HillRules::Initialize(const Config& modOptions) {
    const MatchSetup setup = m_host.GetMatchSetup();
    return Initialize(HillConfig::FromOptions(modOptions, setup.map), setup);
}

bool HillRules::Initialize(const HillConfig& config, const MatchSetup& setup) {
    m_config = config;
    m_config.ticksPerUpdate = std::max(1, m_config.ticksPerUpdate);
    m_map = setup.map;
    m_active = false;

    if (!m_config.enabled) {
        HILLKEEPER_LOG_DEBUG("King of the Hill is not enabled, rules stay inert");
        return false;
    }

    m_roster = AllianceRoster(setup);
    m_possession = PossessionTracker{};
    m_state = MatchState{};
    m_publishedPossession.clear();

    for (AllianceId alliance : m_roster.GetAlliances()) {
        m_possession.Register(alliance);
        m_publishedPossession.try_emplace(alliance, ParamNames::Possession(alliance), m_sink, 0.0);
    }

    ResolveCaptureQualifiedDefs();

    m_active = true;
    PublishState();

    HILLKEEPER_LOG_INFO("King of the Hill rules active for {} alliances, {} capture-qualified unit kinds",
                        m_roster.GetAlliances().size(), m_captureQualifiedDefs.size());
    return true;
}

void HillRules::Shutdown() {
    m_active = false;
    m_state.captureUnits.clear();
    m_state.hillBuildings.clear();
}

void HillRules::ResolveCaptureQualifiedDefs() {
    m_captureQualifiedDefs.clear();
    for (std::string_view name : CaptureQualifiedUnitNames) {
        // Kinds that are not loaded are skipped
        if (auto def = m_host.FindUnitDefByName(name)) {
            m_captureQualifiedDefs.insert(*def);
        }
    }
}

bool HillRules::IsCaptureQualified(UnitDefId def) const {
    return m_captureQualifiedDefs.count(def) > 0;
}

// =========================================================================
// Simulation
// =========================================================================

void HillRules::OnGameFrame(Tick tick) {
    if (!m_active || tick % m_config.ticksPerUpdate != 0) {
        return;
    }
    Evaluate(tick);
}

std::set<AllianceId> HillRules::CollectAlliancesInHill() const {
    std::set<AllianceId> alliancesInHill;
    for (const auto& [unit, alliance] : m_state.captureUnits) {
        if (alliancesInHill.count(alliance) > 0 || m_possession.IsDisqualified(alliance)) {
            continue;
        }
        if (m_config.hillArea.ContainsPoint(m_host.GetUnitPosition(unit))) {
            alliancesInHill.insert(alliance);
        }
    }
    return alliancesInHill;
}

void HillRules::Evaluate(Tick tick) {
    if (!m_active || m_state.gameOver) {
        return;
    }

    const std::set<AllianceId> alliancesInHill = CollectAlliancesInHill();

    if (m_state.king) {
        SetContestProgressing(alliancesInHill.count(*m_state.king) > 0, tick);
    } else if (alliancesInHill.size() == 1 &&
               (tick >= m_state.contestDeadlineTick ||
                m_state.contestingAlliance == *alliancesInHill.begin())) {
        const AllianceId challenger = *alliancesInHill.begin();
        SetContestProgressing(true, tick);
        if (m_state.contestingAlliance != challenger) {
            HILLKEEPER_LOG_DEBUG("Alliance {} started capturing the hill at tick {}", challenger, tick);
        }
        m_state.contestingAlliance = challenger;
    } else {
        SetContestProgressing(false, tick);
    }

    if (m_state.king && m_state.kingWinTick && tick >= *m_state.kingWinTick) {
        m_state.gameOver = true;
        PublishState();
        HILLKEEPER_LOG_INFO("Alliance {} wins by holding the hill (tick {})", *m_state.king, tick);
        m_host.GameOver({*m_state.king});
        return;
    }

    if (tick >= m_state.contestDeadlineTick) {
        if (m_state.king && !m_state.contestProgressing) {
            Dethrone(tick);
        } else if (!m_state.king && m_state.contestProgressing) {
            Crown(tick);
        }
    }

    PublishState();
}

void HillRules::SetContestProgressing(bool progressing, Tick tick) {
    if (progressing == m_state.contestProgressing) {
        return;
    }
    m_state.contestProgressing = progressing;

    // Resume from the progress made so far instead of restarting the full delay
    const Tick remaining = std::max<Tick>(m_state.contestDeadlineTick - tick, 0);
    m_state.contestDeadlineTick = tick + m_config.captureDelayTicks - remaining;
}

void HillRules::Crown(Tick tick) {
    if (!m_state.contestingAlliance || m_possession.IsDisqualified(*m_state.contestingAlliance)) {
        return;
    }

    const AllianceId king = *m_state.contestingAlliance;
    m_state.king = king;
    m_state.kingStartTick = tick;
    SetKingGlobalLos(true);
    m_state.kingWinTick = tick + m_config.winKingTicks - m_possession.GetTicks(king);

    HILLKEEPER_LOG_INFO("Alliance {} is now king of the hill (tick {}, wins at tick {})",
                        king, tick, *m_state.kingWinTick);

    if (m_onKingChanged) {
        m_onKingChanged(std::nullopt, king, tick);
    }
}

void HillRules::Dethrone(Tick tick) {
    const AllianceId previousKing = *m_state.king;

    m_possession.AddReign(previousKing, tick - m_state.kingStartTick);
    SetKingGlobalLos(false);
    m_state.king.reset();
    m_state.kingStartTick = tick;
    DestroyHillBuildings();
    m_state.kingWinTick.reset();

    HILLKEEPER_LOG_INFO("Alliance {} lost the hill (tick {}, total possession {} ticks)",
                        previousKing, tick, m_possession.GetTicks(previousKing));

    if (m_onKingChanged) {
        m_onKingChanged(previousKing, std::nullopt, tick);
    }
}

void HillRules::ResetKingAndContest(Tick tick) {
    const std::optional<AllianceId> previousKing = m_state.king;

    SetKingGlobalLos(false);
    m_state.king.reset();
    m_state.kingStartTick = tick;
    m_state.contestingAlliance.reset();
    m_state.contestDeadlineTick = 0;
    m_state.contestProgressing = false;
    m_state.kingWinTick.reset();
    DestroyHillBuildings();

    if (previousKing && m_onKingChanged) {
        m_onKingChanged(previousKing, std::nullopt, tick);
    }
}

void HillRules::SetKingGlobalLos(bool enabled) {
    if (m_config.kingGlobalLos && m_state.king) {
        m_host.SetGlobalLos(*m_state.king, enabled);
    }
}

void HillRules::DestroyHillBuildings() {
    // The host may report destructions back synchronously, so detach first
    const std::vector<UnitId> buildings(m_state.hillBuildings.begin(), m_state.hillBuildings.end());
    m_state.hillBuildings.clear();
    for (UnitId building : buildings) {
        m_host.DestroyUnit(building);
    }
}

void HillRules::PublishState() {
    m_publishedKing.SetAndSend(m_state.king);
    m_publishedKingStart.SetAndSend(m_state.kingStartTick);
    m_publishedContesting.SetAndSend(m_state.contestingAlliance);
    m_publishedDeadline.SetAndSend(m_state.contestDeadlineTick);
    m_publishedProgressing.SetAndSend(m_state.contestProgressing);
    for (auto& [alliance, published] : m_publishedPossession) {
        published.SetAndSend(m_possession.GetSigned(alliance));
    }
}

// =========================================================================
// Unit Lifecycle
// =========================================================================

void HillRules::OnUnitCreated(UnitId unit, UnitDefId def, TeamId team) {
    if (!m_active) {
        return;
    }

    if (m_config.healthMultiplier != 1.0 && IsCaptureQualified(def)) {
        const UnitHealth health = m_host.GetUnitHealth(unit);
        const auto multiplier = static_cast<float>(m_config.healthMultiplier);
        m_host.SetUnitMaxHealth(unit, health.maxHealth * multiplier);
        m_host.SetUnitHealth(unit, health.health * multiplier);
    }

    if (!m_state.king || m_roster.GetAlliance(team) != m_state.king) {
        return;
    }
    const UnitDef* unitDef = m_host.GetUnitDef(def);
    if (unitDef && unitDef->IsStructure() &&
        m_config.hillArea.ContainsPoint(m_host.GetUnitPosition(unit))) {
        m_state.hillBuildings.insert(unit);
    }
}

void HillRules::OnUnitFinished(UnitId unit, UnitDefId def, TeamId team) {
    if (!m_active || !IsCaptureQualified(def)) {
        return;
    }
    if (auto alliance = m_roster.GetAlliance(team)) {
        m_state.captureUnits[unit] = *alliance;
    }
}

void HillRules::OnUnitGiven(UnitId unit, UnitDefId def, TeamId newTeam, TeamId /* oldTeam */) {
    if (!m_active) {
        return;
    }

    const auto alliance = m_roster.GetAlliance(newTeam);

    if (m_state.hillBuildings.count(unit) > 0 && alliance != m_state.king) {
        m_state.hillBuildings.erase(unit);
    }

    if (!IsCaptureQualified(def)) {
        return;
    }
    if (alliance) {
        m_state.captureUnits[unit] = *alliance;
    } else {
        m_state.captureUnits.erase(unit);
    }
}

void HillRules::OnUnitDestroyed(UnitId unit) {
    m_state.captureUnits.erase(unit);
    m_state.hillBuildings.erase(unit);
}

void HillRules::OnTeamDied(TeamId team, Tick tick) {
    if (!m_active) {
        return;
    }

    const auto eliminated = m_roster.OnTeamDied(team);
    if (!eliminated) {
        return;
    }

    if (m_state.king == *eliminated) {
        // Instant dethronement, no decay delay
        m_possession.AddReign(*eliminated, tick - m_state.kingStartTick);
        ResetKingAndContest(tick);
    } else if (!m_state.king && m_state.contestingAlliance == *eliminated) {
        m_state.contestingAlliance.reset();
        SetContestProgressing(false, tick);
    }

    m_possession.Disqualify(*eliminated);
    PublishState();

    HILLKEEPER_LOG_INFO("Alliance {} eliminated and disqualified (tick {}, possession {} ticks)",
                        *eliminated, tick, m_possession.GetTicks(*eliminated));

    if (m_onDisqualified) {
        m_onDisqualified(*eliminated, tick);
    }
}

// =========================================================================
// Interception
// =========================================================================

bool HillRules::AllowBuildCommand(const BuildCommand& command) const {
    if (!m_active || m_config.buildOutsideBoxes) {
        return true;
    }

    const UnitDef* def = m_host.GetUnitDef(command.buildDef);
    if (!def || !def->IsStructure()) {
        return true;
    }

    const auto alliance = m_roster.GetAlliance(command.team);
    if (!alliance) {
        return true;
    }

    // Footprint sizes refer to north/south facing
    const bool rotated = command.facing % 2 != 0;
    const float sizeX = static_cast<float>(rotated ? def->zsize : def->xsize) * m_map.squareSize;
    const float sizeZ = static_cast<float>(rotated ? def->xsize : def->zsize) * m_map.squareSize;

    const MapRegion* startBox = m_roster.GetStartBox(*alliance);
    if (startBox && startBox->ContainsFootprint(command.x, command.z, sizeX, sizeZ)) {
        return true;
    }
    if (m_state.king == *alliance &&
        m_config.hillArea.ContainsFootprint(command.x, command.z, sizeX, sizeZ)) {
        return true;
    }

    HILLKEEPER_LOG_DEBUG("Denied {} placement at ({}, {}) for team {}",
                         def->name, command.x, command.z, command.team);
    return false;
}

std::optional<DamageOverride> HillRules::FilterDamage(const DamageEvent& event) const {
    if (!m_active) {
        return std::nullopt;
    }

    const auto alliance = m_roster.GetAlliance(event.unitTeam);
    if (!alliance) {
        return std::nullopt;
    }
    if (event.hasAttacker && m_roster.GetAlliance(event.attackerTeam) == alliance) {
        return std::nullopt;
    }

    const MapRegion* startBox = m_roster.GetStartBox(*alliance);
    if (startBox && startBox->ContainsPoint(m_host.GetUnitPosition(event.unit))) {
        return DamageOverride{0.0f, 0.0f};
    }
    return std::nullopt;
}

} // namespace Rules
} // namespace Hillkeeper
