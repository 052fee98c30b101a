#pragma once

#include "common/Types.h"
#include "engine/EngineConfig.h"
#include <vector>

namespace auctionheat {
namespace analytics {

// Labels the trading day's character from the rolling PeriodStat window.
// Fewer days than requested -> NEUTRAL; the covered day count is reported.
class RegimeClassifier {
public:
    explicit RegimeClassifier(const engine::RegimeConfig& config);

    MarketRegimeState classify(const std::vector<PeriodStat>& window, int requested_days) const;

    // Date-ordered, keeping only the last requested_days entries
    static std::vector<PeriodStat> recentWindow(const std::vector<PeriodStat>& window, int requested_days);

    static RegimeStatistics computeStatistics(const std::vector<PeriodStat>& window);

private:
    engine::RegimeConfig config_;
};

} // namespace analytics
} // namespace auctionheat
