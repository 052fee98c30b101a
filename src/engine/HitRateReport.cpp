#include "engine/HitRateReport.h"

#include <algorithm>
#include <cmath>
#include <map>
#include <set>
#include <unordered_map>

namespace auctionheat {
namespace engine {

HitRateReport HitRateReporter::build(const std::vector<DailySelection>& days, int medal_count) {
    HitRateReport report;

    std::set<std::string> trade_dates;
    std::set<std::string> selected;
    std::set<std::string> hit;
    std::map<std::string, Medal> best_by_code;
    int market_total = 0;
    int market_limit_ups = 0;

    for (const auto& day : days) {
        if (day.items.empty()) {
            continue;
        }
        trade_dates.insert(day.trade_date);

        std::unordered_map<std::string, const DailyOutcome*> outcome_by_code;
        for (const auto& o : day.next_day_outcomes) {
            if (!std::isfinite(o.change_percent)) {
                continue;
            }
            outcome_by_code.emplace(o.ts_code, &o);
            market_total++;
            if (PeriodStatBuilder::isLimitUpClose(o.ts_code, o.name, o.change_percent)) {
                market_limit_ups++;
            }
        }

        for (const auto& c : day.items) {
            const auto& s = c.snapshot;
            selected.insert(s.ts_code);

            const auto it = outcome_by_code.find(s.ts_code);
            if (it != outcome_by_code.end() &&
                PeriodStatBuilder::isLimitUpClose(s.ts_code, s.name, it->second->change_percent)) {
                hit.insert(s.ts_code);
            }

            auto& best = best_by_code[s.ts_code];
            if (best.ts_code.empty() || c.heat_score > best.heat_score) {
                best = Medal{s.ts_code, s.name, s.industry, day.trade_date, c.heat_score};
            }
        }
    }

    report.stats_days = static_cast<int>(trade_dates.size());
    if (!trade_dates.empty()) {
        report.start_date = *trade_dates.begin();
        report.end_date = *trade_dates.rbegin();
    }
    report.selected_count = static_cast<int>(selected.size());
    report.limit_up_count = static_cast<int>(hit.size());
    report.limit_up_rate = (report.selected_count > 0)
        ? roundOneDecimal(100.0 * report.limit_up_count / report.selected_count)
        : 0.0;
    report.market_limit_up_rate = (market_total > 0)
        ? roundOneDecimal(100.0 * market_limit_ups / market_total)
        : 0.0;
    report.difference = roundOneDecimal(report.limit_up_rate - report.market_limit_up_rate);

    std::vector<Medal> medals;
    medals.reserve(best_by_code.size());
    for (auto& [code, medal] : best_by_code) {
        medals.push_back(medal);
    }
    std::sort(medals.begin(), medals.end(),
              [](const Medal& a, const Medal& b) {
                  if (a.heat_score != b.heat_score) return a.heat_score > b.heat_score;
                  return a.ts_code < b.ts_code;
              });
    if (medal_count >= 0 && static_cast<int>(medals.size()) > medal_count) {
        medals.resize(static_cast<size_t>(medal_count));
    }
    report.medals = std::move(medals);
    return report;
}

double HitRateReporter::roundOneDecimal(double value) {
    return std::round(value * 10.0) / 10.0;
}

} // namespace engine
} // namespace auctionheat
