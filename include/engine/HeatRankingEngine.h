#pragma once

#include "analytics/MetricNormalizer.h"
#include "analytics/RegimeClassifier.h"
#include "core/contracts/IPeriodStatRepository.h"
#include "core/contracts/ISnapshotRepository.h"
#include "core/contracts/IThemeProfileSource.h"
#include "engine/AlphaCalibrator.h"
#include "engine/CandidateRanker.h"
#include "engine/CompositeScorer.h"
#include "engine/EngineConfig.h"
#include "engine/RankRequest.h"
#include <memory>
#include <vector>

namespace auctionheat {
namespace engine {

// Caller-facing entry point. Holds only immutable configuration and
// read-only repository handles, so concurrent rank() calls are safe.
class HeatRankingEngine {
public:
    HeatRankingEngine(const EngineConfig& config,
                      std::shared_ptr<core::ISnapshotRepository> snapshots,
                      std::shared_ptr<core::IThemeProfileSource> themes,
                      std::shared_ptr<core::IPeriodStatRepository> period_stats);

    // Throws InvalidParameterError; "no data" is a normal result
    RankedResultSet rank(const RankRequest& request) const;

    // Same pipeline over inputs the caller already holds
    RankedResultSet rankBatch(const RankRequest& request,
                              const core::SnapshotBatch& batch,
                              const ThemeProfile& themes,
                              const std::vector<PeriodStat>& window) const;

    // Identifier plus positive, finite price and previous close
    static bool isWellFormed(const AuctionSnapshot& snapshot);
    // Fills a missing gap percent from price / previous close
    static AuctionSnapshot prepare(AuctionSnapshot snapshot);

    const EngineConfig& config() const { return config_; }

private:
    EngineConfig config_;
    std::shared_ptr<core::ISnapshotRepository> snapshots_;
    std::shared_ptr<core::IThemeProfileSource> themes_;
    std::shared_ptr<core::IPeriodStatRepository> period_stats_;

    analytics::MetricNormalizer normalizer_;
    analytics::RegimeClassifier regime_classifier_;
    AlphaCalibrator alpha_calibrator_;
    CompositeScorer scorer_;
    CandidateRanker ranker_;
};

} // namespace engine
} // namespace auctionheat
