#pragma once

#include "analytics/MetricNormalizer.h"
#include "common/Types.h"
#include "engine/EngineConfig.h"

namespace auctionheat {
namespace engine {

// heat = clamp(100 * sum(w_i * s_i) * (1 + alpha * (hotness - 1)), 0, 100)
class CompositeScorer {
public:
    CompositeScorer(const ScoreWeights& weights, const ProbabilityConfig& probability);

    CandidateResult score(const AuctionSnapshot& snapshot,
                          const analytics::SubScores& sub_scores,
                          double hotness,
                          double alpha_effective,
                          bool exclude_auction_limit_up) const;

    double baseScore(const analytics::SubScores& sub_scores) const;

    // 1.0 at auction limit-up; otherwise logistic in heat and gap, floored
    // when the breakout rule fires
    double limitUpProbability(const AuctionSnapshot& snapshot, double heat_score, bool breakout) const;

    // Not sealed yet, gap >= 7%, volume ratio >= 1.5, >= 2% room to the limit
    bool breakoutSignal(const AuctionSnapshot& snapshot) const;

private:
    ScoreWeights weights_;
    ProbabilityConfig probability_;
};

} // namespace engine
} // namespace auctionheat
