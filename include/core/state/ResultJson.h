#pragma once

#include <nlohmann/json.hpp>

#include "common/Types.h"
#include "engine/HitRateReport.h"
#include "engine/PeriodStatBuilder.h"

namespace auctionheat {
namespace core {

// snake_case JSON; NaN fields are written as null and read back as NaN
nlohmann::json toJson(const AuctionSnapshot& snapshot);
nlohmann::json toJson(const CandidateResult& candidate);
nlohmann::json toJson(const Summary& summary);
nlohmann::json toJson(const RatioDiagnostics& diagnostics);
nlohmann::json toJson(const Diagnostics& diagnostics);
nlohmann::json toJson(const RankedResultSet& result);
nlohmann::json toJson(const PeriodStat& stat);
nlohmann::json toJson(const engine::HitRateReport& report);

AuctionSnapshot snapshotFromJson(const nlohmann::json& row);
PeriodStat periodStatFromJson(const nlohmann::json& row);
engine::DailyOutcome outcomeFromJson(const nlohmann::json& row);
CandidateResult candidateFromJson(const nlohmann::json& row);

} // namespace core
} // namespace auctionheat
