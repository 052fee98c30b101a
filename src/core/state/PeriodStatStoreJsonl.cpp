#include "core/state/PeriodStatStoreJsonl.h"
#include "core/state/ResultJson.h"
#include "common/Logger.h"

#include <algorithm>
#include <fstream>
#include <iterator>
#include <map>

namespace auctionheat {
namespace core {

PeriodStatStoreJsonl::PeriodStatStoreJsonl(std::filesystem::path file_path)
    : file_path_(std::move(file_path)) {}

std::vector<PeriodStat> PeriodStatStoreJsonl::getPeriodStats(const std::string& trade_date, int window_days) {
    std::lock_guard<std::mutex> lock(mutex_);

    std::vector<PeriodStat> out;
    if (window_days <= 0) {
        return out;
    }

    std::ifstream in(file_path_, std::ios::binary);
    if (!in.is_open()) {
        return out;
    }

    // ISO dates order lexicographically
    std::map<std::string, PeriodStat> by_date;
    std::string row;
    int malformed = 0;
    while (std::getline(in, row)) {
        if (row.empty()) {
            continue;
        }

        PeriodStat stat;
        try {
            const auto line = nlohmann::json::parse(row);
            if (!line.is_object()) {
                malformed++;
                continue;
            }
            stat = periodStatFromJson(line);
        } catch (const nlohmann::json::exception&) {
            malformed++;
            continue;
        }

        if (stat.trade_date.empty() || stat.trade_date >= trade_date) {
            continue;
        }
        by_date[stat.trade_date] = std::move(stat);
    }
    if (malformed > 0) {
        LOG_WARN("Skipped {} malformed lines in {}", malformed, file_path_.string());
    }

    out.reserve(std::min<size_t>(by_date.size(), static_cast<size_t>(window_days)));
    auto it = by_date.begin();
    if (by_date.size() > static_cast<size_t>(window_days)) {
        std::advance(it, by_date.size() - static_cast<size_t>(window_days));
    }
    for (; it != by_date.end(); ++it) {
        out.push_back(it->second);
    }
    return out;
}

bool PeriodStatStoreJsonl::append(const PeriodStat& stat) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (file_path_.has_parent_path()) {
        std::filesystem::create_directories(file_path_.parent_path());
    }
    std::ofstream out(file_path_, std::ios::binary | std::ios::app);
    if (!out.is_open()) {
        LOG_ERROR("Cannot append to {}", file_path_.string());
        return false;
    }

    out << toJson(stat).dump() << "\n";
    return true;
}

} // namespace core
} // namespace auctionheat
