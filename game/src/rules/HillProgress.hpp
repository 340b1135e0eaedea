#pragma once

/**
 * @file HillProgress.hpp
 * @brief Observer-side interpretation of the published hill state
 */

#include "RulesTypes.hpp"
#include "events/RulesParamStore.hpp"
#include <optional>
#include <vector>

namespace Hillkeeper {
namespace Rules {

/**
 * @brief Possession bar of one alliance
 */
struct AllianceProgress {
    AllianceId alliance = 0;
    double fraction = 0.0;         ///< Share of the win duration held, 0 when disqualified
    bool disqualified = false;
    bool isKing = false;
};

/**
 * @brief Everything a hill UI draws for one frame
 */
struct HillProgressSnapshot {
    Tick tick = 0;
    std::optional<AllianceId> king;
    std::vector<AllianceProgress> alliances;

    std::optional<AllianceId> contestingAlliance;
    bool contestProgressing = false;
    double captureProgress = 0.0;  ///< Fill of the capture bar in [0, 1]

    [[nodiscard]] const AllianceProgress* Find(AllianceId alliance) const;
};

/**
 * @brief Turns published rules parameters into progress fractions
 *
 * Reads only from the parameter store, never from the rules object, so
 * it sees exactly what a remote observer would see.
 *
 * Example usage:
 * @code
 * HillProgressView view(params, roster.GetAlliances(), config.winKingTicks, config.captureDelayTicks);
 * const auto& snapshot = view.Refresh(frame);
 * DrawCaptureBar(snapshot.captureProgress);
 * @endcode
 */
class HillProgressView {
public:
    HillProgressView(const Events::RulesParamStore& params,
                     std::vector<AllianceId> alliances,
                     Tick winKingTicks,
                     Tick captureDelayTicks);

    /**
     * @brief Recompute the snapshot for the given frame
     */
    const HillProgressSnapshot& Refresh(Tick tick);

    [[nodiscard]] const HillProgressSnapshot& GetSnapshot() const noexcept { return m_snapshot; }

    /**
     * @brief true when the last Refresh() saw a different kingStartTick than the one before
     *
     * The king may be the same alliance if it lost and regained the hill
     * between two refreshes.
     */
    [[nodiscard]] bool KingChanged() const noexcept { return m_kingChanged; }

private:
    [[nodiscard]] double ToFraction(double ticks) const;

    const Events::RulesParamStore& m_params;
    std::vector<AllianceId> m_alliances;
    Tick m_winKingTicks = 0;
    Tick m_captureDelayTicks = 0;

    std::optional<Tick> m_kingStartTick;
    bool m_kingChanged = false;
    HillProgressSnapshot m_snapshot;
};

} // namespace Rules
} // namespace Hillkeeper
