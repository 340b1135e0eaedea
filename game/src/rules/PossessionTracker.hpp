#pragma once

#include "RulesTypes.hpp"
#include <map>
#include <nlohmann/json.hpp>

namespace Hillkeeper {
namespace Rules {

/// Published possession for a disqualified alliance that never held the hill
inline constexpr double DisqualifiedEpsilon = 1e-16;

/**
 * @brief Possession time of one alliance
 *
 * ticks excludes the reign of the current king; it is folded in when
 * the king changes.
 */
struct PossessionRecord {
    Tick ticks = 0;
    bool disqualified = false;

    /**
     * @brief Signed transport encoding
     *
     * Negative means disqualified. A disqualified alliance with zero
     * possession is published as -DisqualifiedEpsilon so it stays
     * distinguishable from zero.
     */
    [[nodiscard]] double Signed() const noexcept {
        if (!disqualified) {
            return static_cast<double>(ticks);
        }
        return ticks > 0 ? -static_cast<double>(ticks) : -DisqualifiedEpsilon;
    }
};

/**
 * @brief Accumulated possession per alliance and disqualification
 */
class PossessionTracker {
public:
    void Register(AllianceId alliance);

    [[nodiscard]] bool IsRegistered(AllianceId alliance) const;

    /**
     * @brief Fold a finished reign into the alliance's possession
     *
     * Ignored for disqualified or unknown alliances and for negative
     * durations.
     */
    void AddReign(AllianceId alliance, Tick duration);

    /**
     * @brief Permanently remove an alliance from win eligibility
     * @return false if it was already disqualified or unknown
     */
    bool Disqualify(AllianceId alliance);

    [[nodiscard]] bool IsDisqualified(AllianceId alliance) const;

    /**
     * @brief Prior possession in ticks, zero if unknown
     */
    [[nodiscard]] Tick GetTicks(AllianceId alliance) const;

    [[nodiscard]] double GetSigned(AllianceId alliance) const;

    [[nodiscard]] const std::map<AllianceId, PossessionRecord>& GetRecords() const noexcept { return m_records; }

    [[nodiscard]] nlohmann::json ToJson() const;

private:
    std::map<AllianceId, PossessionRecord> m_records;
};

} // namespace Rules
} // namespace Hillkeeper
