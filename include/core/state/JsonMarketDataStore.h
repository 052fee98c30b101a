#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "core/contracts/ISnapshotRepository.h"
#include "core/contracts/IThemeProfileSource.h"
#include "engine/PeriodStatBuilder.h"

namespace auctionheat {
namespace core {

// Read-only view over the collector's output directory:
//   <root>/auction/<date>.json    snapshot rows (array, or {"rows": [...]})
//   <root>/themes/<date>.json     {"theme": hotness, ...} or {"hotness": {...}}
//   <root>/outcomes/<date>.json   [{"ts_code", "name", "change_percent"}, ...]
class JsonMarketDataStore : public ISnapshotRepository, public IThemeProfileSource {
public:
    explicit JsonMarketDataStore(std::filesystem::path root);

    SnapshotBatch getSnapshots(const std::string& trade_date) override;
    ThemeProfile getThemeHotness(const std::string& trade_date) override;

    // nullopt when the session has not been recorded
    std::optional<std::vector<engine::DailyOutcome>> getOutcomes(const std::string& trade_date);

    std::filesystem::path snapshotPath(const std::string& trade_date) const;
    std::filesystem::path themePath(const std::string& trade_date) const;
    std::filesystem::path outcomePath(const std::string& trade_date) const;

private:
    std::filesystem::path root_;
};

} // namespace core
} // namespace auctionheat
