#pragma once

/**
 * @file Scenario.hpp
 * @brief Headless match description replayed through the hill rules
 */

#include "config/Config.hpp"
#include "rules/RulesTypes.hpp"
#include <filesystem>
#include <glm/glm.hpp>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace Hillkeeper {
namespace Sim {

using Rules::AllianceId;
using Rules::TeamId;
using Rules::Tick;
using Rules::UnitId;

// ============================================================================
// Scenario Events
// ============================================================================

enum class EventType {
    Spawn,      ///< Unit created (and finished unless "finished": false)
    Move,       ///< Unit teleported to a new position
    Give,       ///< Unit transferred to another team
    Destroy,    ///< Unit destroyed
    TeamDied,   ///< Team defeated
    Build,      ///< Building placement order, spawns the building if admitted
    Damage      ///< Hit on a unit, optionally by another team
};

[[nodiscard]] const char* EventTypeToString(EventType type);
[[nodiscard]] std::optional<EventType> EventTypeFromString(std::string_view name);

/**
 * @brief One tick-stamped scenario event
 *
 * Fields not used by an event type keep their defaults.
 */
struct ScenarioEvent {
    Tick tick = 0;
    EventType type = EventType::Spawn;
    UnitId unit = 0;
    std::string unitDef;
    TeamId team = 0;
    glm::vec2 position{0.0f, 0.0f};
    int facing = 0;
    bool finished = true;
    std::optional<TeamId> attackerTeam;
    float damage = 0.0f;

    /**
     * @brief Parse from JSON
     * @throws nlohmann::json::exception on missing or mistyped fields
     * @throws std::invalid_argument on an unknown event type
     */
    static ScenarioEvent FromJson(const nlohmann::json& j);
    [[nodiscard]] nlohmann::json ToJson() const;
};

/**
 * @brief Unit kind known to the scenario host
 */
struct ScenarioUnitDef {
    Rules::UnitDef def;
    float maxHealth = 100.0f;
};

// ============================================================================
// Scenario
// ============================================================================

/**
 * @brief A complete match to replay
 *
 * File layout:
 * @code
 * {
 *   "map": { "sizeX": 8192, "sizeZ": 8192, "squareSize": 8, "ticksPerSecond": 30 },
 *   "modOptions": { "kingofthehillenabled": true, ... },
 *   "unitDefs": [ { "name": "armcom", "health": 3700 }, { "name": "armsolar", "building": true, "xsize": 5, "zsize": 5 } ],
 *   "alliances": [ { "id": 0, "teams": [0, 1], "startBox": [0, 0, 1024, 1024] } ],
 *   "events": [ { "tick": 0, "type": "spawn", "unit": 1, "def": "armcom", "team": 0, "x": 4096, "z": 4096 } ],
 *   "durationTicks": 36000
 * }
 * @endcode
 *
 * startBox is [left, bottom, right, top] in world units. An optional
 * "gaiaAlliance" names a listed alliance that takes no part in the hill.
 */
struct Scenario {
    std::string name;
    Rules::MatchSetup setup;
    std::vector<ScenarioUnitDef> unitDefs;
    Config modOptions;
    std::vector<ScenarioEvent> events;     ///< Sorted by tick, file order kept within a tick
    Tick durationTicks = 0;

    /**
     * @brief Load a scenario file
     * @return false (with an error logged) if the file cannot be read or is malformed
     */
    bool Load(const std::filesystem::path& path);

    /**
     * @brief Load from an already parsed configuration document
     */
    bool LoadFromConfig(const Config& document);
};

} // namespace Sim
} // namespace Hillkeeper
