#pragma once

/**
 * @file HillConfig.hpp
 * @brief King of the Hill mod options
 */

#include "RulesTypes.hpp"
#include "spatial/MapRegion.hpp"
#include <nlohmann/json.hpp>
#include <optional>
#include <string_view>

namespace Hillkeeper {

class Config;

namespace Rules {

// ============================================================================
// Option Keys
// ============================================================================

namespace OptionKeys {
    inline constexpr std::string_view Enabled = "kingofthehillenabled";
    inline constexpr std::string_view Area = "kingofthehillarea";
    inline constexpr std::string_view BuildOutsideBoxes = "kingofthehillbuildoutsideboxes";
    inline constexpr std::string_view WinKingTime = "kingofthehillwinkingtime";
    inline constexpr std::string_view CaptureDelay = "kingofthehillcapturedelay";
    inline constexpr std::string_view HealthMultiplier = "kingofthehillhealthmultiplier";
    inline constexpr std::string_view KingGlobalLos = "kingofthehillkinggloballos";
    inline constexpr std::string_view UpdateInterval = "kingofthehillupdateinterval";
}

/// Maximum value of the coordinate system used by the area option
inline constexpr float MapAreaScale = 200.0f;

/// Upper bound for derived tick counts, leaves headroom for deadline arithmetic
inline constexpr Tick MaxOptionTicks = Tick{1} << 40;

// ============================================================================
// Hill Area Parsing
// ============================================================================

/**
 * @brief Hill used when the area option is missing or malformed
 *
 * The centered rectangle "rect 75 125 125 75".
 */
[[nodiscard]] MapRegion DefaultHillArea(const MapInfo& map);

/**
 * @brief Parse "rect L T R B" or "circle X Z R"
 *
 * Each number must lie in [0, 200] and is scaled against the map size;
 * circle radii scale with the larger map side.
 *
 * @return The region, or nullopt (with a logged warning) when malformed
 */
[[nodiscard]] std::optional<MapRegion> ParseHillArea(std::string_view text, const MapInfo& map);

// ============================================================================
// Hill Configuration
// ============================================================================

/**
 * @brief Typed King of the Hill options plus derived tick counts
 */
struct HillConfig {
    bool enabled = false;
    MapRegion hillArea;
    bool buildOutsideBoxes = true;          ///< false restricts builds to start box / held hill
    double winKingTimeMinutes = 10.0;
    double captureDelaySeconds = 20.0;
    double healthMultiplier = 1.0;
    bool kingGlobalLos = false;
    int ticksPerUpdate = 6;
    int ticksPerSecond = 30;

    // Derived
    Tick winKingTicks = 0;
    Tick captureDelayTicks = 0;

    /**
     * @brief Build from mod options
     *
     * Malformed or missing values fall back to their defaults with a
     * warning. Never fails.
     */
    static HillConfig FromOptions(const Config& options, const MapInfo& map);

    /**
     * @brief Recompute winKingTicks and captureDelayTicks
     *
     * Both are clamped to [0, MaxOptionTicks].
     */
    void UpdateDerived();

    [[nodiscard]] nlohmann::json ToJson() const;
};

} // namespace Rules
} // namespace Hillkeeper
