#include "AllianceRoster.hpp"

namespace Hillkeeper {
namespace Rules {

AllianceRoster::AllianceRoster(const MatchSetup& setup) {
    for (const auto& alliance : setup.alliances) {
        if (alliance.id == setup.gaiaAlliance) {
            continue;
        }
        m_alliances.push_back(alliance.id);
        m_startBoxes[alliance.id] = alliance.startBox;
        int numTeams = 0;
        for (TeamId team : alliance.teams) {
            m_teamToAlliance[team] = alliance.id;
            ++numTeams;
        }
        m_aliveTeams[alliance.id] = numTeams;
    }
}

std::optional<AllianceId> AllianceRoster::GetAlliance(TeamId team) const {
    auto it = m_teamToAlliance.find(team);
    if (it == m_teamToAlliance.end()) {
        return std::nullopt;
    }
    return it->second;
}

const MapRegion* AllianceRoster::GetStartBox(AllianceId alliance) const {
    auto it = m_startBoxes.find(alliance);
    return it != m_startBoxes.end() ? &it->second : nullptr;
}

int AllianceRoster::GetAliveTeams(AllianceId alliance) const {
    auto it = m_aliveTeams.find(alliance);
    return it != m_aliveTeams.end() ? it->second : 0;
}

bool AllianceRoster::IsEliminated(AllianceId alliance) const {
    return GetAliveTeams(alliance) <= 0;
}

std::optional<AllianceId> AllianceRoster::OnTeamDied(TeamId team) {
    auto alliance = GetAlliance(team);
    if (!alliance || !m_deadTeams.insert(team).second) {
        return std::nullopt;
    }

    int& lives = m_aliveTeams[*alliance];
    if (lives <= 0) {
        return std::nullopt;
    }
    --lives;
    if (lives == 0) {
        return alliance;
    }
    return std::nullopt;
}

} // namespace Rules
} // namespace Hillkeeper
