#include "HillProgress.hpp"
#include "HillState.hpp"
#include <algorithm>
#include <utility>

namespace Hillkeeper {
namespace Rules {

const AllianceProgress* HillProgressSnapshot::Find(AllianceId alliance) const {
    auto it = std::find_if(alliances.begin(), alliances.end(),
                           [alliance](const AllianceProgress& p) { return p.alliance == alliance; });
    return it != alliances.end() ? &*it : nullptr;
}

HillProgressView::HillProgressView(const Events::RulesParamStore& params,
                                   std::vector<AllianceId> alliances,
                                   Tick winKingTicks,
                                   Tick captureDelayTicks)
    : m_params(params)
    , m_alliances(std::move(alliances))
    , m_winKingTicks(winKingTicks)
    , m_captureDelayTicks(captureDelayTicks) {
}

double HillProgressView::ToFraction(double ticks) const {
    if (m_winKingTicks <= 0) {
        return ticks > 0.0 ? 1.0 : 0.0;
    }
    return std::clamp(ticks / static_cast<double>(m_winKingTicks), 0.0, 1.0);
}

const HillProgressSnapshot& HillProgressView::Refresh(Tick tick) {
    HillProgressSnapshot snapshot;
    snapshot.tick = tick;

    if (auto king = m_params.GetInteger(ParamNames::KingAlliance)) {
        snapshot.king = static_cast<AllianceId>(*king);
    }

    const auto kingStartTick = m_params.GetInteger(ParamNames::KingStartTick);
    m_kingChanged = kingStartTick != m_kingStartTick;
    m_kingStartTick = kingStartTick;

    for (AllianceId alliance : m_alliances) {
        AllianceProgress progress;
        progress.alliance = alliance;
        progress.isKing = snapshot.king == alliance;

        const double possession = m_params.GetNumber(ParamNames::Possession(alliance)).value_or(0.0);
        if (possession < 0.0) {
            // Negative encodes disqualification, not a reduced share
            progress.disqualified = true;
            progress.fraction = 0.0;
        } else {
            double held = possession;
            if (progress.isKing && kingStartTick) {
                held += static_cast<double>(tick - *kingStartTick);
            }
            progress.fraction = ToFraction(held);
        }
        snapshot.alliances.push_back(progress);
    }

    if (auto contesting = m_params.GetInteger(ParamNames::ContestingAlliance)) {
        snapshot.contestingAlliance = static_cast<AllianceId>(*contesting);
    }
    snapshot.contestProgressing = m_params.GetBool(ParamNames::ContestProgressing);

    const Tick deadline = m_params.GetInteger(ParamNames::ContestDeadlineTick).value_or(0);
    double remaining = 0.0;
    if (m_captureDelayTicks > 0) {
        remaining = std::max(static_cast<double>(deadline - tick) / static_cast<double>(m_captureDelayTicks), 0.0);
    }
    snapshot.captureProgress = snapshot.contestProgressing ? 1.0 - remaining : remaining;

    m_snapshot = std::move(snapshot);
    return m_snapshot;
}

} // namespace Rules
} // namespace Hillkeeper
