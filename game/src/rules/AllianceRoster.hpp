#pragma once

#include "RulesTypes.hpp"
#include <map>
#include <optional>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace Hillkeeper {
namespace Rules {

/**
 * @brief Team to alliance mapping, start boxes and alive-team counts
 *
 * Built once from the host's match setup.
 */
class AllianceRoster {
public:
    AllianceRoster() = default;
    explicit AllianceRoster(const MatchSetup& setup);

    [[nodiscard]] std::optional<AllianceId> GetAlliance(TeamId team) const;

    /**
     * @brief Start box of an alliance, nullptr if unknown
     */
    [[nodiscard]] const MapRegion* GetStartBox(AllianceId alliance) const;

    [[nodiscard]] int GetAliveTeams(AllianceId alliance) const;
    [[nodiscard]] bool IsEliminated(AllianceId alliance) const;

    /**
     * @brief Record a team death
     *
     * Repeated deaths of the same team are ignored.
     * @return The alliance if this death eliminated it, nullopt otherwise
     */
    std::optional<AllianceId> OnTeamDied(TeamId team);

    [[nodiscard]] const std::vector<AllianceId>& GetAlliances() const noexcept { return m_alliances; }

private:
    std::vector<AllianceId> m_alliances;
    std::unordered_map<TeamId, AllianceId> m_teamToAlliance;
    std::map<AllianceId, MapRegion> m_startBoxes;
    std::map<AllianceId, int> m_aliveTeams;
    std::unordered_set<TeamId> m_deadTeams;
};

} // namespace Rules
} // namespace Hillkeeper
