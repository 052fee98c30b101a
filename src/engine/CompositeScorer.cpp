#include "engine/CompositeScorer.h"
#include "analytics/ThemeProfileResolver.h"
#include "common/BoardRules.h"

#include <algorithm>
#include <cmath>

namespace auctionheat {
namespace engine {

CompositeScorer::CompositeScorer(const ScoreWeights& weights, const ProbabilityConfig& probability)
    : weights_(weights)
    , probability_(probability)
{
}

CandidateResult CompositeScorer::score(const AuctionSnapshot& snapshot,
                                       const analytics::SubScores& sub_scores,
                                       double hotness,
                                       double alpha_effective,
                                       bool exclude_auction_limit_up) const {
    CandidateResult out;
    out.snapshot = snapshot;
    out.base_score = baseScore(sub_scores);
    out.theme_enhance_factor = analytics::ThemeProfileResolver::enhanceFactor(hotness, alpha_effective);
    out.heat_score = std::clamp(out.base_score * out.theme_enhance_factor, 0.0, 100.0);

    out.breakout_signal = breakoutSignal(snapshot);
    out.likely_limit_up_prob = limitUpProbability(snapshot, out.heat_score, out.breakout_signal);
    out.likely_limit_up = out.likely_limit_up_prob > probability_.likely_threshold ||
                          (snapshot.auction_limit_up && !exclude_auction_limit_up);
    return out;
}

double CompositeScorer::baseScore(const analytics::SubScores& s) const {
    const double raw = weights_.volume_ratio * s.volume_ratio +
                       weights_.turnover_rate * s.turnover_rate +
                       weights_.gap_percent * s.gap_percent +
                       weights_.amount * s.amount;
    if (!std::isfinite(raw)) {
        return 0.0;
    }
    return std::clamp(100.0 * raw, 0.0, 100.0);
}

double CompositeScorer::limitUpProbability(const AuctionSnapshot& snapshot, double heat_score, bool breakout) const {
    if (snapshot.auction_limit_up) {
        return 1.0;
    }

    const double heat = std::isfinite(heat_score) ? heat_score : 0.0;
    const double gap = std::isfinite(snapshot.gap_percent) ? snapshot.gap_percent : 0.0;
    const double z = probability_.heat_slope * (heat - probability_.heat_midpoint) +
                     probability_.gap_slope * (gap - probability_.gap_midpoint);
    double p = 1.0 / (1.0 + std::exp(-z));

    if (breakout) {
        p = std::max(p, probability_.breakout_probability_floor);
    }
    return std::clamp(p, 0.0, 1.0);
}

bool CompositeScorer::breakoutSignal(const AuctionSnapshot& snapshot) const {
    if (snapshot.auction_limit_up) return false;
    if (!std::isfinite(snapshot.gap_percent) || !std::isfinite(snapshot.volume_ratio)) return false;
    if (snapshot.gap_percent < probability_.breakout_min_gap_percent) return false;
    if (snapshot.volume_ratio < probability_.breakout_min_volume_ratio) return false;

    const double limit_pct = common::limitPercent(snapshot.ts_code, snapshot.name);
    const double room = common::limitRoomPercent(snapshot.price, snapshot.pre_close, limit_pct);
    return room >= probability_.breakout_min_limit_room_percent;
}

} // namespace engine
} // namespace auctionheat
