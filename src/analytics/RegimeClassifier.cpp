#include "analytics/RegimeClassifier.h"
#include <algorithm>
#include <cmath>
#include <numeric>

namespace auctionheat {
namespace analytics {

RegimeClassifier::RegimeClassifier(const engine::RegimeConfig& config)
    : config_(config)
{
}

MarketRegimeState RegimeClassifier::classify(const std::vector<PeriodStat>& window,
                                             int requested_days) const {
    MarketRegimeState result;
    result.label = MarketRegimeLabel::NEUTRAL;
    result.days_requested = requested_days;

    const std::vector<PeriodStat> recent = recentWindow(window, requested_days);

    result.days_covered = static_cast<int>(recent.size());
    if (!recent.empty()) {
        result.window_start = recent.front().trade_date;
        result.window_end = recent.back().trade_date;
    }
    result.stats = computeStatistics(recent);

    if (recent.empty() || result.days_covered < requested_days) {
        result.description = "Insufficient History";
        return result;
    }

    const auto& st = result.stats;

    // 1. Volatility first: any one signal is enough
    if (st.gap_volatility >= config_.volatile_gap_stddev ||
        st.mean_heat_dispersion >= config_.volatile_heat_dispersion ||
        st.breadth_ratio <= config_.panic_breadth_ratio) {
        result.label = MarketRegimeLabel::VOLATILE;
        result.description = "Volatile (gap swings / dispersion / weak breadth)";
        return result;
    }

    // 2. Broad participation with either opening strength or limit-up activity
    if (st.breadth_ratio >= config_.active_breadth_ratio &&
        (st.mean_gap_percent >= config_.active_mean_gap_percent ||
         st.mean_market_limit_up_rate >= config_.active_limit_up_rate)) {
        result.label = MarketRegimeLabel::ACTIVE;
        result.description = "Active (broad advance)";
        return result;
    }

    result.label = MarketRegimeLabel::CALM;
    result.description = "Calm";
    return result;
}

std::vector<PeriodStat> RegimeClassifier::recentWindow(const std::vector<PeriodStat>& window,
                                                       int requested_days) {
    std::vector<PeriodStat> recent = window;
    std::sort(recent.begin(), recent.end(),
              [](const PeriodStat& a, const PeriodStat& b) { return a.trade_date < b.trade_date; });
    if (requested_days > 0 && static_cast<int>(recent.size()) > requested_days) {
        recent.erase(recent.begin(), recent.end() - requested_days);
    }
    return recent;
}

RegimeStatistics RegimeClassifier::computeStatistics(const std::vector<PeriodStat>& window) {
    RegimeStatistics st;
    if (window.empty()) {
        return st;
    }

    long long advancers = 0;
    long long decliners = 0;
    double gap_sum = 0.0;
    double dispersion_sum = 0.0;
    double limit_up_sum = 0.0;
    for (const auto& day : window) {
        advancers += std::max(0, day.advancers);
        decliners += std::max(0, day.decliners);
        gap_sum += std::isfinite(day.avg_gap_percent) ? day.avg_gap_percent : 0.0;
        dispersion_sum += std::isfinite(day.heat_dispersion) ? day.heat_dispersion : 0.0;
        limit_up_sum += std::isfinite(day.market_limit_up_rate) ? day.market_limit_up_rate : 0.0;
    }

    const double n = static_cast<double>(window.size());
    const long long breadth_total = advancers + decliners;
    st.breadth_ratio = (breadth_total > 0)
        ? static_cast<double>(advancers) / static_cast<double>(breadth_total)
        : 0.5;
    st.mean_gap_percent = gap_sum / n;
    st.mean_heat_dispersion = dispersion_sum / n;
    st.mean_market_limit_up_rate = limit_up_sum / n;

    double sq_sum = 0.0;
    for (const auto& day : window) {
        const double gap = std::isfinite(day.avg_gap_percent) ? day.avg_gap_percent : 0.0;
        sq_sum += (gap - st.mean_gap_percent) * (gap - st.mean_gap_percent);
    }
    st.gap_volatility = std::sqrt(sq_sum / n);
    return st;
}

} // namespace analytics
} // namespace auctionheat
