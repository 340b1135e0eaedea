#pragma once

/**
 * @file HillState.hpp
 * @brief Authoritative hill ownership state and its published names
 */

#include "RulesTypes.hpp"
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <unordered_map>

namespace Hillkeeper {
namespace Rules {

// ============================================================================
// Published Parameter Names
// ============================================================================

namespace ParamNames {
    inline constexpr std::string_view KingAlliance = "kingAlliance";
    inline constexpr std::string_view KingStartTick = "kingStartTick";
    inline constexpr std::string_view ContestingAlliance = "contestingAlliance";
    inline constexpr std::string_view ContestDeadlineTick = "contestDeadlineTick";
    inline constexpr std::string_view ContestProgressing = "contestProgressing";
    inline constexpr std::string_view PossessionPrefix = "possessionTime.";

    inline std::string Possession(AllianceId alliance) {
        return std::string(PossessionPrefix) + std::to_string(alliance);
    }
}

// ============================================================================
// Match State
// ============================================================================

/**
 * @brief Mutable King of the Hill state for one match
 *
 * Owned by HillRules; possession totals live in PossessionTracker.
 */
struct MatchState {
    std::optional<AllianceId> king;
    Tick kingStartTick = 0;
    std::optional<Tick> kingWinTick;

    std::optional<AllianceId> contestingAlliance;
    Tick contestDeadlineTick = 0;
    bool contestProgressing = false;   ///< true = counting up toward capture

    /// Buildings the current king started inside the hill
    std::set<UnitId> hillBuildings;

    /// Capture-eligible units and the alliance that owns them
    std::unordered_map<UnitId, AllianceId> captureUnits;

    bool gameOver = false;
};

} // namespace Rules
} // namespace Hillkeeper
