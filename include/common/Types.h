#pragma once

#include <array>
#include <limits>
#include <map>
#include <string>
#include <vector>

namespace auctionheat {

// Missing numeric fields are carried as NaN.
constexpr double kMissing = std::numeric_limits<double>::quiet_NaN();

// 09:25 call-auction state of one stock (one row per stock per trade date)
struct AuctionSnapshot {
    std::string ts_code;              // 000001.SZ
    std::string name;
    std::string industry;
    std::string theme;
    double price = kMissing;          // auction match price
    double pre_close = kMissing;
    double gap_percent = kMissing;    // (price - pre_close) / pre_close * 100
    double vol = kMissing;            // auction volume
    double amount = kMissing;         // auction amount
    double turnover_rate = kMissing;  // %
    double volume_ratio = kMissing;
    double float_share = kMissing;
    double pe = kMissing;             // only consulted by the PE filter
    double pe_ttm = kMissing;
    double auction_volume_ratio = kMissing;  // auction vol / 5-day avg auction vol
    bool auction_limit_up = false;
};

// Scored, pre-rank or ranked candidate
struct CandidateResult {
    AuctionSnapshot snapshot;
    double base_score = 0.0;           // pre-boost composite (0-100)
    double heat_score = 0.0;           // final (0-100)
    double theme_enhance_factor = 1.0; // >= 1.0
    bool likely_limit_up = false;
    double likely_limit_up_prob = 0.0; // 0-1
    bool breakout_signal = false;
    int rank = 0;                      // 1-based after ranking
};

enum class DataSource {
    NONE,       // nothing collected for the date yet
    SNAPSHOT    // auction snapshot collected (possibly empty)
};

enum class SortMode {
    CANDIDATE_FIRST,
    HEAT_DESC
};

enum class MarketRegimeLabel {
    NEUTRAL,    // not enough history to judge
    CALM,
    ACTIVE,
    VOLATILE
};

// Realized outcome of one historical trade date
struct PeriodStat {
    static constexpr int kDeciles = 10;

    std::string trade_date;
    int advancers = 0;
    int decliners = 0;
    double avg_gap_percent = 0.0;
    double heat_dispersion = 0.0;       // stddev of heat scores
    double market_limit_up_rate = 0.0;  // 0-1
    // realized limit-up rate per heat decile, [0] = coldest
    std::array<double, kDeciles> decile_limit_up_rate{};
    int sample_count = 0;
};

// theme -> hotness (>= 1.0) for a single trade date
struct ThemeProfile {
    std::string trade_date;
    std::map<std::string, double> hotness;
};

struct RegimeStatistics {
    double breadth_ratio = 0.5;         // advancers / (advancers + decliners)
    double mean_gap_percent = 0.0;
    double gap_volatility = 0.0;        // stddev of daily avg gap
    double mean_heat_dispersion = 0.0;
    double mean_market_limit_up_rate = 0.0;
};

struct MarketRegimeState {
    MarketRegimeLabel label = MarketRegimeLabel::NEUTRAL;
    RegimeStatistics stats;
    std::string window_start;
    std::string window_end;
    int days_covered = 0;
    int days_requested = 0;
    std::string description;
};

struct Summary {
    int count = 0;
    double avg_heat = 0.0;
    double total_amount = 0.0;
    int limit_up_candidates = 0;
    MarketRegimeLabel market_regime = MarketRegimeLabel::NEUTRAL;
    double theme_alpha_input = 0.0;
    double theme_alpha_effective = 0.0;
    int total_candidates = 0;           // post-filter, before limit
    int skipped_rows = 0;
    int history_days_covered = 0;
    int history_days_requested = 0;
};

struct RatioDiagnostics {
    double min = 0.0;
    double max = 0.0;
    double avg = 0.0;
    int below_one_count = 0;
    int at_least_one_count = 0;
    int missing_count = 0;
};

// pe and pe_ttm are counted separately, so a row can land in two buckets
struct PeDiagnostics {
    int negative_count = 0;
    int zero_count = 0;
    int above_range_count = 0;
    int in_range_count = 0;
    int missing_count = 0;            // rows with neither pe nor pe_ttm
    bool filter_enabled = false;
};

// Ratio spreads over the returned rows; PE counts before the PE filter
struct Diagnostics {
    RatioDiagnostics volume_ratio;
    RatioDiagnostics auction_volume_ratio;
    PeDiagnostics pe;
};

struct RankedResultSet {
    std::string trade_date;
    DataSource data_source = DataSource::NONE;
    std::vector<CandidateResult> items;
    Summary summary;
    Diagnostics diagnostics;
};

const char* toString(DataSource source);
const char* toString(SortMode mode);
const char* toString(MarketRegimeLabel label);

} // namespace auctionheat
