#include "engine/PeriodStatBuilder.h"
#include "common/BoardRules.h"

#include <algorithm>
#include <cmath>
#include <unordered_map>

namespace auctionheat {
namespace engine {
namespace {
struct DecileBucket {
    int samples = 0;
    int limit_ups = 0;

    double rate() const {
        return (samples > 0) ? (static_cast<double>(limit_ups) / static_cast<double>(samples)) : 0.0;
    }
};

struct ScoredOutcome {
    std::string ts_code;
    double heat = 0.0;
    bool limit_up = false;
};
}

PeriodStat PeriodStatBuilder::build(const std::string& trade_date,
                                    const std::vector<CandidateResult>& scored,
                                    const std::vector<DailyOutcome>& outcomes) {
    PeriodStat stat;
    stat.trade_date = trade_date;

    // Market breadth over every realized close
    std::unordered_map<std::string, const DailyOutcome*> by_code;
    int market_limit_ups = 0;
    int market_total = 0;
    for (const auto& o : outcomes) {
        if (!std::isfinite(o.change_percent)) {
            continue;
        }
        by_code.emplace(o.ts_code, &o);
        market_total++;
        if (o.change_percent > 0.0) {
            stat.advancers++;
        } else if (o.change_percent < 0.0) {
            stat.decliners++;
        }
        if (isLimitUpClose(o.ts_code, o.name, o.change_percent)) {
            market_limit_ups++;
        }
    }
    stat.market_limit_up_rate = (market_total > 0)
        ? static_cast<double>(market_limit_ups) / static_cast<double>(market_total)
        : 0.0;

    // Scored stocks that have an outcome
    std::vector<ScoredOutcome> matched;
    matched.reserve(scored.size());
    double gap_sum = 0.0;
    int gap_count = 0;
    for (const auto& c : scored) {
        if (std::isfinite(c.snapshot.gap_percent)) {
            gap_sum += c.snapshot.gap_percent;
            gap_count++;
        }
        const auto it = by_code.find(c.snapshot.ts_code);
        if (it == by_code.end()) {
            continue;
        }
        const auto& o = *it->second;
        matched.push_back(ScoredOutcome{
            c.snapshot.ts_code, c.heat_score,
            isLimitUpClose(c.snapshot.ts_code, c.snapshot.name, o.change_percent)
        });
    }
    stat.avg_gap_percent = (gap_count > 0) ? gap_sum / gap_count : 0.0;
    stat.sample_count = static_cast<int>(matched.size());
    if (matched.empty()) {
        return stat;
    }

    double heat_mean = 0.0;
    for (const auto& m : matched) heat_mean += m.heat;
    heat_mean /= static_cast<double>(matched.size());
    double sq_sum = 0.0;
    for (const auto& m : matched) sq_sum += (m.heat - heat_mean) * (m.heat - heat_mean);
    stat.heat_dispersion = std::sqrt(sq_sum / static_cast<double>(matched.size()));

    // Coldest first; equal heat keeps identifier order
    std::sort(matched.begin(), matched.end(),
              [](const ScoredOutcome& a, const ScoredOutcome& b) {
                  if (a.heat != b.heat) return a.heat < b.heat;
                  return a.ts_code < b.ts_code;
              });

    std::array<DecileBucket, PeriodStat::kDeciles> buckets{};
    const size_t n = matched.size();
    for (size_t i = 0; i < n; ++i) {
        const size_t decile = std::min<size_t>(PeriodStat::kDeciles - 1, i * PeriodStat::kDeciles / n);
        buckets[decile].samples++;
        if (matched[i].limit_up) {
            buckets[decile].limit_ups++;
        }
    }
    for (int d = 0; d < PeriodStat::kDeciles; ++d) {
        stat.decile_limit_up_rate[d] = buckets[d].rate();
    }
    return stat;
}

bool PeriodStatBuilder::isLimitUpClose(const std::string& ts_code, const std::string& name, double change_percent) {
    if (!std::isfinite(change_percent)) return false;
    return change_percent >= common::limitPercent(ts_code, name) - 0.5;
}

} // namespace engine
} // namespace auctionheat
