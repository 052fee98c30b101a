#pragma once

#include "common/Types.h"
#include "engine/EngineConfig.h"
#include <vector>

namespace auctionheat {
namespace analytics {

// Batch-wide caps; built once so every stock shares one scale
struct MetricScale {
    double volume_ratio_cap = 10.0;
    double turnover_rate_cap = 20.0;
    double amount_cap = 1000.0;         // in amount_unit
    double amount_unit = 1000000.0;
    double gap_ceiling_percent = 10.0;
};

// Each in [0, 1]
struct SubScores {
    double volume_ratio = 0.0;
    double turnover_rate = 0.0;
    double gap_percent = 0.0;
    double amount = 0.0;
};

class MetricNormalizer {
public:
    explicit MetricNormalizer(const engine::NormalizerConfig& config);

    MetricScale buildScale(const std::vector<AuctionSnapshot>& population) const;
    SubScores normalize(const AuctionSnapshot& snapshot, const MetricScale& scale) const;

    // clamp(log1p(x) / log1p(cap), 0, 1); non-finite or negative x -> 0
    static double logSquash(double value, double cap);
    // Linear interpolation between closest ranks; finite values only
    static double percentile(std::vector<double> values, double q);

private:
    engine::NormalizerConfig config_;
};

} // namespace analytics
} // namespace auctionheat
