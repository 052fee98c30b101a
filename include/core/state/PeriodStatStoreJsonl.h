#pragma once

#include <filesystem>
#include <mutex>

#include "core/contracts/IPeriodStatRepository.h"

namespace auctionheat {
namespace core {

// One PeriodStat per line. A later line for the same date replaces earlier ones.
class PeriodStatStoreJsonl : public IPeriodStatRepository {
public:
    explicit PeriodStatStoreJsonl(std::filesystem::path file_path);

    std::vector<PeriodStat> getPeriodStats(const std::string& trade_date, int window_days) override;
    bool append(const PeriodStat& stat) override;

private:
    std::filesystem::path file_path_;
    mutable std::mutex mutex_;
};

} // namespace core
} // namespace auctionheat
