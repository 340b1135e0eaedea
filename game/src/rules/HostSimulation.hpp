#pragma once

#include "RulesTypes.hpp"
#include <glm/glm.hpp>
#include <optional>
#include <string_view>
#include <vector>

namespace Hillkeeper {
namespace Rules {

/**
 * @brief The host simulation as seen by the hill rules
 *
 * Implemented by the engine adapter in a running game and by
 * Sim::ScenarioHost for headless replays. Queries are expected to
 * succeed for any unit the host has announced.
 */
class IHostSimulation {
public:
    virtual ~IHostSimulation() = default;

    [[nodiscard]] virtual MatchSetup GetMatchSetup() const = 0;

    [[nodiscard]] virtual const UnitDef* GetUnitDef(UnitDefId id) const = 0;
    [[nodiscard]] virtual std::optional<UnitDefId> FindUnitDefByName(std::string_view name) const = 0;

    /**
     * @brief Map position of a unit on the x/z plane
     */
    [[nodiscard]] virtual glm::vec2 GetUnitPosition(UnitId unit) const = 0;

    [[nodiscard]] virtual UnitHealth GetUnitHealth(UnitId unit) const = 0;
    virtual void SetUnitMaxHealth(UnitId unit, float maxHealth) = 0;
    virtual void SetUnitHealth(UnitId unit, float health) = 0;

    virtual void SetGlobalLos(AllianceId alliance, bool enabled) = 0;

    /**
     * @brief Destroy a unit; the host reports it back through OnUnitDestroyed
     */
    virtual void DestroyUnit(UnitId unit) = 0;

    virtual void GameOver(const std::vector<AllianceId>& winners) = 0;
};

} // namespace Rules
} // namespace Hillkeeper
