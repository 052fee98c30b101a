#pragma once

#include "common/Types.h"
#include <string>

namespace auctionheat {
namespace engine {

// Composite weights over the four auction metrics (must sum to 1.0)
struct ScoreWeights {
    double volume_ratio = 0.4;
    double turnover_rate = 0.2;
    double gap_percent = 0.3;
    double amount = 0.1;

    double sum() const { return volume_ratio + turnover_rate + gap_percent + amount; }
};

// Log-squash caps. The effective cap is max(floor, population percentile).
struct NormalizerConfig {
    double cap_percentile = 0.95;
    double volume_ratio_cap_floor = 10.0;
    double turnover_rate_cap_floor = 20.0;   // %
    double amount_unit = 1000000.0;          // amount is squashed in units of 1M
    double amount_cap_floor = 1000.0;        // in amount_unit
    double gap_ceiling_percent = 10.0;       // gap that scores 1.0
};

// Limit-up probability curve
struct ProbabilityConfig {
    double heat_midpoint = 60.0;
    double heat_slope = 0.12;
    double gap_midpoint = 5.0;
    double gap_slope = 0.35;
    double likely_threshold = 0.5;

    // "Board-chasing" rule signal
    double breakout_min_gap_percent = 7.0;
    double breakout_min_volume_ratio = 1.5;
    double breakout_min_limit_room_percent = 2.0;
    double breakout_probability_floor = 0.6;
};

struct RegimeConfig {
    double volatile_gap_stddev = 1.5;        // stddev of daily avg gap, %
    double volatile_heat_dispersion = 28.0;
    double panic_breadth_ratio = 0.30;
    double active_breadth_ratio = 0.55;
    double active_mean_gap_percent = 0.3;
    double active_limit_up_rate = 0.03;
};

struct CalibrationConfig {
    double correlation_weight = 0.6;
    double lift_weight = 0.4;
    double lift_strong = 3.0;                // top decile rate / mean rate
    double weak_evidence = 0.1;
    double strong_evidence = 0.6;
    double calm_multiplier = 1.0;
    double active_multiplier = 1.0;
    double volatile_multiplier = 0.5;
};

struct FilterConfig {
    double pe_max = 300.0;
    double low_gap_threshold_percent = 5.0;
    bool exclude_special_treatment = true;
};

// Request defaults applied when the caller leaves a field unset
struct RequestDefaults {
    int limit = 20;
    double theme_alpha = 0.25;
    bool exclude_auction_limit_up = true;
    bool pe_filter_enabled = false;
    bool dynamic_alpha = true;
    int rolling_window_days = 20;
    SortMode sort_mode = SortMode::CANDIDATE_FIRST;
};

struct EngineConfig {
    ScoreWeights weights;
    NormalizerConfig normalizer;
    ProbabilityConfig probability;
    RegimeConfig regime;
    CalibrationConfig calibration;
    FilterConfig filters;
    RequestDefaults defaults;
    std::string data_dir = "data";
};

} // namespace engine
} // namespace auctionheat
