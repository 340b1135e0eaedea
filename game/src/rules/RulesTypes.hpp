#pragma once

/**
 * @file RulesTypes.hpp
 * @brief Identifiers and match description shared by the hill rules
 */

#include "spatial/MapRegion.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace Hillkeeper {
namespace Rules {

using AllianceId = int32_t;
using TeamId = int32_t;
using UnitId = int32_t;
using UnitDefId = int32_t;

/// Simulation frame number
using Tick = int64_t;

// ============================================================================
// Unit Definitions
// ============================================================================

/**
 * @brief The subset of a host unit definition the rules care about
 */
struct UnitDef {
    UnitDefId id = 0;
    std::string name;
    bool isBuilding = false;
    bool isStaticBuilder = false;
    int xsize = 1;                 ///< Footprint in map squares, north/south facing
    int zsize = 1;

    [[nodiscard]] bool IsStructure() const noexcept { return isBuilding || isStaticBuilder; }
};

/**
 * @brief Current and maximum health of a unit
 */
struct UnitHealth {
    float health = 0.0f;
    float maxHealth = 0.0f;
};

// ============================================================================
// Match Setup
// ============================================================================

/**
 * @brief Map dimensions and simulation rate
 */
struct MapInfo {
    float sizeX = 0.0f;
    float sizeZ = 0.0f;
    float squareSize = 8.0f;       ///< World units per footprint square
    int ticksPerSecond = 30;
};

/**
 * @brief One alliance as set up by the host lobby
 */
struct AllianceSetup {
    AllianceId id = 0;
    std::vector<TeamId> teams;
    MapRegion startBox;
};

/**
 * @brief Everything the host knows about the match at start
 *
 * If the host lists its neutral (gaia) alliance, it is skipped by the
 * roster when gaiaAlliance names it.
 */
struct MatchSetup {
    MapInfo map;
    std::vector<AllianceSetup> alliances;
    std::optional<AllianceId> gaiaAlliance;
};

// ============================================================================
// Intercepted Commands
// ============================================================================

/**
 * @brief A building placement order issued by a team
 */
struct BuildCommand {
    UnitId builder = 0;
    TeamId team = 0;
    UnitDefId buildDef = 0;
    float x = 0.0f;
    float z = 0.0f;
    int facing = 0;                ///< 0=south, 1=east, 2=north, 3=west
};

/**
 * @brief Damage about to be applied to a unit
 */
struct DamageEvent {
    UnitId unit = 0;
    TeamId unitTeam = 0;
    bool hasAttacker = false;
    TeamId attackerTeam = 0;
    float damage = 0.0f;
};

/**
 * @brief Replacement damage and impulse for an intercepted hit
 */
struct DamageOverride {
    float damage = 0.0f;
    float impulseMultiplier = 0.0f;
};

} // namespace Rules
} // namespace Hillkeeper
