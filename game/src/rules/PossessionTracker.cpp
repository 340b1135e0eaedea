#include "PossessionTracker.hpp"
#include <string>

namespace Hillkeeper {
namespace Rules {

void PossessionTracker::Register(AllianceId alliance) {
    m_records.try_emplace(alliance);
}

bool PossessionTracker::IsRegistered(AllianceId alliance) const {
    return m_records.count(alliance) > 0;
}

void PossessionTracker::AddReign(AllianceId alliance, Tick duration) {
    auto it = m_records.find(alliance);
    if (it == m_records.end() || it->second.disqualified || duration < 0) {
        return;
    }
    it->second.ticks += duration;
}

bool PossessionTracker::Disqualify(AllianceId alliance) {
    auto it = m_records.find(alliance);
    if (it == m_records.end() || it->second.disqualified) {
        return false;
    }
    it->second.disqualified = true;
    return true;
}

bool PossessionTracker::IsDisqualified(AllianceId alliance) const {
    auto it = m_records.find(alliance);
    return it != m_records.end() && it->second.disqualified;
}

Tick PossessionTracker::GetTicks(AllianceId alliance) const {
    auto it = m_records.find(alliance);
    return it != m_records.end() ? it->second.ticks : 0;
}

double PossessionTracker::GetSigned(AllianceId alliance) const {
    auto it = m_records.find(alliance);
    return it != m_records.end() ? it->second.Signed() : 0.0;
}

nlohmann::json PossessionTracker::ToJson() const {
    nlohmann::json j = nlohmann::json::object();
    for (const auto& [alliance, record] : m_records) {
        j[std::to_string(alliance)] = {
            {"ticks", record.ticks},
            {"disqualified", record.disqualified}
        };
    }
    return j;
}

} // namespace Rules
} // namespace Hillkeeper
