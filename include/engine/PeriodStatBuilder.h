#pragma once

#include "common/Types.h"
#include <map>
#include <string>
#include <vector>

namespace auctionheat {
namespace engine {

// Realized close for one stock on the scored trade date
struct DailyOutcome {
    std::string ts_code;
    std::string name;
    double change_percent = 0.0;
};

// Turns one scored day plus its realized closes into the PeriodStat the
// regime classifier and alpha calibrator read back later.
class PeriodStatBuilder {
public:
    static PeriodStat build(const std::string& trade_date,
                            const std::vector<CandidateResult>& scored,
                            const std::vector<DailyOutcome>& outcomes);

    // Closed within 0.5 points of the board limit (9.5% on the main board)
    static bool isLimitUpClose(const std::string& ts_code, const std::string& name, double change_percent);
};

} // namespace engine
} // namespace auctionheat
