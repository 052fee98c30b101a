#pragma once

#include "common/Types.h"
#include "engine/PeriodStatBuilder.h"
#include <string>
#include <vector>

namespace auctionheat {
namespace engine {

// One day's ranked selection with the following session's closes
struct DailySelection {
    std::string trade_date;
    std::vector<CandidateResult> items;
    std::vector<DailyOutcome> next_day_outcomes;
};

struct Medal {
    std::string ts_code;
    std::string name;
    std::string industry;
    std::string trade_date;
    double heat_score = 0.0;
};

struct HitRateReport {
    std::string start_date;
    std::string end_date;
    int stats_days = 0;
    int selected_count = 0;             // distinct stocks
    int limit_up_count = 0;             // distinct stocks that closed limit-up next day
    double limit_up_rate = 0.0;         // %, one decimal
    double market_limit_up_rate = 0.0;  // %, one decimal
    double difference = 0.0;            // percentage points
    std::vector<Medal> medals;          // hottest distinct stocks, best first
};

class HitRateReporter {
public:
    static HitRateReport build(const std::vector<DailySelection>& days, int medal_count = 3);

    // 12.345 -> 12.3
    static double roundOneDecimal(double value);
};

} // namespace engine
} // namespace auctionheat
