#include "analytics/MetricNormalizer.h"
#include <algorithm>
#include <cmath>

namespace auctionheat {
namespace analytics {

MetricNormalizer::MetricNormalizer(const engine::NormalizerConfig& config)
    : config_(config)
{
}

MetricScale MetricNormalizer::buildScale(const std::vector<AuctionSnapshot>& population) const {
    std::vector<double> volume_ratios;
    std::vector<double> turnover_rates;
    std::vector<double> amounts;
    volume_ratios.reserve(population.size());
    turnover_rates.reserve(population.size());
    amounts.reserve(population.size());

    const double unit = (config_.amount_unit > 0.0) ? config_.amount_unit : 1.0;
    for (const auto& s : population) {
        volume_ratios.push_back(s.volume_ratio);
        turnover_rates.push_back(s.turnover_rate);
        amounts.push_back(s.amount / unit);
    }

    const double q = std::clamp(config_.cap_percentile, 0.0, 1.0);

    MetricScale scale;
    scale.volume_ratio_cap = std::max(config_.volume_ratio_cap_floor, percentile(std::move(volume_ratios), q));
    scale.turnover_rate_cap = std::max(config_.turnover_rate_cap_floor, percentile(std::move(turnover_rates), q));
    scale.amount_cap = std::max(config_.amount_cap_floor, percentile(std::move(amounts), q));
    scale.amount_unit = unit;
    scale.gap_ceiling_percent = config_.gap_ceiling_percent;
    return scale;
}

SubScores MetricNormalizer::normalize(const AuctionSnapshot& snapshot, const MetricScale& scale) const {
    SubScores out;
    out.volume_ratio = logSquash(snapshot.volume_ratio, scale.volume_ratio_cap);
    out.turnover_rate = logSquash(snapshot.turnover_rate, scale.turnover_rate_cap);
    out.amount = logSquash(snapshot.amount / scale.amount_unit, scale.amount_cap);

    // Below the previous close scores zero
    if (std::isfinite(snapshot.gap_percent) && scale.gap_ceiling_percent > 0.0) {
        out.gap_percent = std::clamp(snapshot.gap_percent / scale.gap_ceiling_percent, 0.0, 1.0);
    }
    return out;
}

double MetricNormalizer::logSquash(double value, double cap) {
    if (!std::isfinite(value) || value <= 0.0) return 0.0;
    if (!std::isfinite(cap) || cap <= 0.0) return 0.0;
    return std::clamp(std::log1p(value) / std::log1p(cap), 0.0, 1.0);
}

double MetricNormalizer::percentile(std::vector<double> values, double q) {
    values.erase(std::remove_if(values.begin(), values.end(),
                                [](double v) { return !std::isfinite(v); }),
                 values.end());
    if (values.empty()) return 0.0;

    std::sort(values.begin(), values.end());
    const double pos = std::clamp(q, 0.0, 1.0) * static_cast<double>(values.size() - 1);
    const size_t lower = static_cast<size_t>(std::floor(pos));
    const size_t upper = std::min(lower + 1, values.size() - 1);
    const double frac = pos - static_cast<double>(lower);
    return values[lower] + (values[upper] - values[lower]) * frac;
}

} // namespace analytics
} // namespace auctionheat
