#include "engine/HeatRankingEngine.h"
#include "analytics/ThemeProfileResolver.h"
#include "common/Logger.h"

#include <cmath>
#include <unordered_set>

namespace auctionheat {
namespace engine {

HeatRankingEngine::HeatRankingEngine(const EngineConfig& config,
                                     std::shared_ptr<core::ISnapshotRepository> snapshots,
                                     std::shared_ptr<core::IThemeProfileSource> themes,
                                     std::shared_ptr<core::IPeriodStatRepository> period_stats)
    : config_(config)
    , snapshots_(std::move(snapshots))
    , themes_(std::move(themes))
    , period_stats_(std::move(period_stats))
    , normalizer_(config.normalizer)
    , regime_classifier_(config.regime)
    , alpha_calibrator_(config.calibration)
    , scorer_(config.weights, config.probability)
    , ranker_(config.filters)
{
}

RankedResultSet HeatRankingEngine::rank(const RankRequest& request) const {
    validateRequest(request, config_.weights);

    core::SnapshotBatch batch;
    if (snapshots_) {
        batch = snapshots_->getSnapshots(request.trade_date);
    }
    if (!batch.collected) {
        // Skip the other lookups; the caller decides whether to collect
        return rankBatch(request, batch, ThemeProfile{}, {});
    }

    ThemeProfile profile;
    if (themes_) {
        profile = themes_->getThemeHotness(request.trade_date);
    }

    std::vector<PeriodStat> window;
    if (period_stats_) {
        window = period_stats_->getPeriodStats(request.trade_date, request.rolling_window_days);
    }

    return rankBatch(request, batch, profile, window);
}

RankedResultSet HeatRankingEngine::rankBatch(const RankRequest& request,
                                             const core::SnapshotBatch& batch,
                                             const ThemeProfile& themes,
                                             const std::vector<PeriodStat>& window) const {
    validateRequest(request, config_.weights);

    RankedResultSet result;
    result.trade_date = request.trade_date;
    result.summary.theme_alpha_input = request.theme_alpha;
    result.summary.history_days_requested = request.rolling_window_days;

    if (!batch.collected) {
        LOG_WARN("[{}] no auction snapshot collected", request.trade_date);
        result.data_source = DataSource::NONE;
        return result;
    }
    result.data_source = DataSource::SNAPSHOT;

    // 1. Drop malformed rows, then duplicates (first occurrence wins)
    std::vector<AuctionSnapshot> population;
    population.reserve(batch.rows.size());
    std::unordered_set<std::string> seen;
    int skipped = 0;
    int duplicates = 0;
    for (const auto& row : batch.rows) {
        if (!isWellFormed(row)) {
            skipped++;
            LOG_WARN("[{}] skipping malformed snapshot '{}'", request.trade_date, row.ts_code);
            continue;
        }
        if (!seen.insert(row.ts_code).second) {
            duplicates++;
            continue;
        }
        population.push_back(prepare(row));
    }
    if (duplicates > 0) {
        LOG_WARN("[{}] dropped {} duplicate snapshot rows", request.trade_date, duplicates);
    }

    // 2. Regime and alpha from the same trimmed history
    const std::vector<PeriodStat> recent =
        analytics::RegimeClassifier::recentWindow(window, request.rolling_window_days);
    const MarketRegimeState regime = regime_classifier_.classify(recent, request.rolling_window_days);

    CalibrationInput calib_in;
    calib_in.requested_alpha = request.theme_alpha;
    calib_in.dynamic_alpha = request.dynamic_alpha;
    calib_in.regime = regime.label;
    calib_in.window = &recent;
    const CalibrationOutput calib = alpha_calibrator_.calibrate(calib_in);

    LOG_DEBUG("[{}] regime {} ({}), breadth {:.2f}, gap vol {:.2f}; alpha evidence {:.3f} corr {:.3f} lift {:.2f} over {} days",
              request.trade_date, toString(regime.label), regime.description,
              regime.stats.breadth_ratio, regime.stats.gap_volatility,
              calib.evidence, calib.mean_correlation, calib.mean_lift, calib.days_used);
    if (regime.label == MarketRegimeLabel::NEUTRAL) {
        LOG_INFO("[{}] history {}/{} days, regime neutral", request.trade_date,
                 regime.days_covered, regime.days_requested);
    }

    // 3. One scale for the whole day, then score
    const analytics::MetricScale scale = normalizer_.buildScale(population);
    const analytics::ThemeProfileResolver resolver(themes);

    std::vector<CandidateResult> scored;
    scored.reserve(population.size());
    for (const auto& snapshot : population) {
        const auto sub_scores = normalizer_.normalize(snapshot, scale);
        scored.push_back(scorer_.score(snapshot, sub_scores, resolver.resolve(snapshot),
                                       calib.effective_alpha, request.exclude_auction_limit_up));
    }

    // 4. Rank
    RankerOptions options;
    options.exclude_auction_limit_up = request.exclude_auction_limit_up;
    options.pe_filter_enabled = request.pe_filter_enabled;
    options.exclude_special_treatment = config_.filters.exclude_special_treatment;
    options.low_gap_only = request.low_gap_only;
    options.sort_mode = request.sort_mode;
    options.limit = request.limit;
    RankerOutput ranked = ranker_.rank(std::move(scored), options);

    result.items = std::move(ranked.items);
    result.summary = ranked.summary;
    result.diagnostics = ranked.diagnostics;
    result.summary.market_regime = regime.label;
    result.summary.theme_alpha_input = request.theme_alpha;
    result.summary.theme_alpha_effective = calib.effective_alpha;
    result.summary.skipped_rows = skipped;
    result.summary.history_days_covered = regime.days_covered;
    result.summary.history_days_requested = request.rolling_window_days;

    LOG_INFO("[{}] ranked {} of {} (regime={}, alpha {:.3f}->{:.3f} {}, ST={}, limit-up={}, pe={}, gap={})",
             request.trade_date, result.summary.count, population.size(), toString(regime.label),
             request.theme_alpha, calib.effective_alpha, calib.reason,
             ranked.dropped_special_treatment, ranked.dropped_auction_limit_up,
             ranked.dropped_pe, ranked.dropped_high_gap);
    Logger::getInstance().logRanking(request.trade_date, result.summary.count, result.summary.avg_heat,
                                     request.theme_alpha, calib.effective_alpha, toString(regime.label));
    return result;
}

bool HeatRankingEngine::isWellFormed(const AuctionSnapshot& snapshot) {
    if (snapshot.ts_code.empty()) return false;
    if (!std::isfinite(snapshot.price) || snapshot.price <= 0.0) return false;
    if (!std::isfinite(snapshot.pre_close) || snapshot.pre_close <= 0.0) return false;
    return true;
}

AuctionSnapshot HeatRankingEngine::prepare(AuctionSnapshot snapshot) {
    if (!std::isfinite(snapshot.gap_percent)) {
        snapshot.gap_percent = (snapshot.price - snapshot.pre_close) / snapshot.pre_close * 100.0;
    }
    return snapshot;
}

} // namespace engine
} // namespace auctionheat
