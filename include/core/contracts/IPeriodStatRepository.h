#pragma once

#include <string>
#include <vector>

#include "common/Types.h"

namespace auctionheat {
namespace core {

class IPeriodStatRepository {
public:
    virtual ~IPeriodStatRepository() = default;

    // At most window_days entries strictly before trade_date, oldest first.
    // May return fewer near the start of history.
    virtual std::vector<PeriodStat> getPeriodStats(const std::string& trade_date, int window_days) = 0;
    virtual bool append(const PeriodStat& stat) = 0;
};

} // namespace core
} // namespace auctionheat
