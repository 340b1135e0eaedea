#pragma once

/**
 * @file HillRules.hpp
 * @brief King of the Hill ownership state machine
 *
 * Handles:
 * - Tracking capture-eligible units per alliance
 * - Capture/decay contests and king changes
 * - Possession time and disqualification of eliminated alliances
 * - Build restrictions and start box damage immunity
 * - Change-gated publication of the state to observers
 */

#include "AllianceRoster.hpp"
#include "HillConfig.hpp"
#include "HillState.hpp"
#include "HostSimulation.hpp"
#include "PossessionTracker.hpp"
#include "RulesTypes.hpp"
#include "events/PublishedValue.hpp"
#include <array>
#include <functional>
#include <map>
#include <optional>
#include <set>
#include <string_view>
#include <unordered_set>

namespace Hillkeeper {

class Config;

namespace Rules {

/**
 * @brief Unit kinds allowed to contest the hill (all commanders)
 */
inline constexpr auto CaptureQualifiedUnitNames = std::to_array<std::string_view>({
    "armcom", "armcomboss", "armcomlvl2", "armcomlvl3", "armcomlvl4", "armcomlvl5",
    "armcomlvl6", "armcomlvl7", "armcomlvl8", "armcomlvl9", "armcomlvl10",
    "corcom", "corcomboss", "corcomlvl2", "corcomlvl3", "corcomlvl4", "corcomlvl5",
    "corcomlvl6", "corcomlvl7", "corcomlvl8", "corcomlvl9", "corcomlvl10",
    "legcom", "legcomecon", "legcomdef", "legcomoff", "legcomt2def", "legcomt2off", "legcomt2com",
    "legcomlvl2", "legcomlvl3", "legcomlvl4", "legcomlvl5", "legcomlvl6", "legcomlvl7",
    "legcomlvl8", "legcomlvl9", "legcomlvl10"
});

/**
 * @brief The hill ownership state machine
 *
 * The host adapter forwards its lifecycle callbacks to the On* methods
 * and calls OnGameFrame() every simulation frame. All calls happen on
 * the simulation thread, never concurrently.
 *
 * Example usage:
 * @code
 * HillRules rules(host, &paramSink);
 * if (rules.Initialize(modOptions)) {
 *     // from the host loop
 *     rules.OnGameFrame(frame);
 * }
 * @endcode
 */
class HillRules {
public:
    using KingChangedCallback = std::function<void(std::optional<AllianceId> previousKing,
                                                   std::optional<AllianceId> newKing,
                                                   Tick tick)>;
    using DisqualifiedCallback = std::function<void(AllianceId alliance, Tick tick)>;

    HillRules(IHostSimulation& host, Events::IRulesParamSink* sink);

    // Non-copyable
    HillRules(const HillRules&) = delete;
    HillRules& operator=(const HillRules&) = delete;

    /**
     * @brief Read mod options and the match setup
     * @return true if the game mode is enabled; otherwise the rules stay inert
     */
    bool Initialize(const Config& modOptions);

    /**
     * @brief Initialize from an already parsed configuration
     */
    bool Initialize(const HillConfig& config, const MatchSetup& setup);

    void Shutdown();

    [[nodiscard]] bool IsActive() const noexcept { return m_active; }

    // =========================================================================
    // Simulation
    // =========================================================================

    /**
     * @brief Per-frame entry point, evaluates every ticksPerUpdate frames
     */
    void OnGameFrame(Tick tick);

    /**
     * @brief Evaluate occupancy and advance the contest at this tick
     */
    void Evaluate(Tick tick);

    /**
     * @brief Alliances with at least one capture unit inside the hill
     *
     * Disqualified alliances are never reported.
     */
    [[nodiscard]] std::set<AllianceId> CollectAlliancesInHill() const;

    // =========================================================================
    // Unit Lifecycle
    // =========================================================================

    void OnUnitCreated(UnitId unit, UnitDefId def, TeamId team);
    void OnUnitFinished(UnitId unit, UnitDefId def, TeamId team);
    void OnUnitGiven(UnitId unit, UnitDefId def, TeamId newTeam, TeamId oldTeam);
    void OnUnitDestroyed(UnitId unit);

    /**
     * @brief A team was defeated; disqualifies its alliance once all its teams are dead
     */
    void OnTeamDied(TeamId team, Tick tick);

    // =========================================================================
    // Interception
    // =========================================================================

    /**
     * @brief Admission check for building placement orders
     */
    [[nodiscard]] bool AllowBuildCommand(const BuildCommand& command) const;

    /**
     * @brief Start box immunity against other alliances
     * @return Zero damage/impulse when the hit must be blocked, nullopt to leave it unchanged
     */
    [[nodiscard]] std::optional<DamageOverride> FilterDamage(const DamageEvent& event) const;

    [[nodiscard]] bool IsCaptureQualified(UnitDefId def) const;

    // =========================================================================
    // Accessors
    // =========================================================================

    [[nodiscard]] const MatchState& GetState() const noexcept { return m_state; }
    [[nodiscard]] const PossessionTracker& GetPossession() const noexcept { return m_possession; }
    [[nodiscard]] const AllianceRoster& GetRoster() const noexcept { return m_roster; }
    [[nodiscard]] const HillConfig& GetConfig() const noexcept { return m_config; }

    void SetOnKingChanged(KingChangedCallback callback) { m_onKingChanged = std::move(callback); }
    void SetOnDisqualified(DisqualifiedCallback callback) { m_onDisqualified = std::move(callback); }

private:
    void ResolveCaptureQualifiedDefs();
    void SetContestProgressing(bool progressing, Tick tick);
    void Crown(Tick tick);
    void Dethrone(Tick tick);
    void ResetKingAndContest(Tick tick);
    void SetKingGlobalLos(bool enabled);
    void DestroyHillBuildings();
    void PublishState();

    IHostSimulation& m_host;
    Events::IRulesParamSink* m_sink = nullptr;

    HillConfig m_config;
    MapInfo m_map;
    AllianceRoster m_roster;
    PossessionTracker m_possession;
    MatchState m_state;
    std::unordered_set<UnitDefId> m_captureQualifiedDefs;
    bool m_active = false;

    // Published state
    Events::PublishedValue<std::optional<AllianceId>> m_publishedKing;
    Events::PublishedValue<Tick> m_publishedKingStart;
    Events::PublishedValue<std::optional<AllianceId>> m_publishedContesting;
    Events::PublishedValue<Tick> m_publishedDeadline;
    Events::PublishedValue<bool> m_publishedProgressing;
    std::map<AllianceId, Events::PublishedValue<double>> m_publishedPossession;

    KingChangedCallback m_onKingChanged;
    DisqualifiedCallback m_onDisqualified;
};

} // namespace Rules
} // namespace Hillkeeper
