#include "engine/AlphaCalibrator.h"

#include <algorithm>
#include <cmath>

namespace auctionheat {
namespace engine {

namespace {
double finiteOr(double value, double fallback) {
    return std::isfinite(value) ? value : fallback;
}

bool isUsable(const PeriodStat& day) {
    return day.sample_count > 0;
}
}

AlphaCalibrator::AlphaCalibrator(const CalibrationConfig& config)
    : config_(config)
{
}

CalibrationOutput AlphaCalibrator::calibrate(const CalibrationInput& input) const {
    CalibrationOutput out;
    const double ceiling = std::clamp(finiteOr(input.requested_alpha, 0.0), 0.0, kMaxThemeAlpha);
    out.effective_alpha = ceiling;

    if (!input.dynamic_alpha) {
        out.reason = "static";
        return out;
    }
    if (input.regime == MarketRegimeLabel::NEUTRAL || input.window == nullptr) {
        out.reason = "insufficient_history";
        return out;
    }

    double corr_sum = 0.0;
    double lift_sum = 0.0;
    for (const auto& day : *input.window) {
        if (!isUsable(day)) {
            continue;
        }
        corr_sum += decileCorrelation(day);
        lift_sum += topDecileLift(day);
        out.days_used++;
    }

    if (out.days_used == 0) {
        out.reason = "no_usable_days";
        return out;
    }

    out.mean_correlation = corr_sum / out.days_used;
    out.mean_lift = lift_sum / out.days_used;

    const double lift_span = std::max(1e-9, config_.lift_strong - 1.0);
    const double lift_score = std::clamp((out.mean_lift - 1.0) / lift_span, -1.0, 1.0);
    const double weight_total = std::max(0.0, config_.correlation_weight) + std::max(0.0, config_.lift_weight);
    out.evidence = (weight_total > 1e-12)
        ? (std::max(0.0, config_.correlation_weight) * out.mean_correlation +
           std::max(0.0, config_.lift_weight) * lift_score) / weight_total
        : out.mean_correlation;

    double strength = 0.0;
    if (config_.strong_evidence > config_.weak_evidence) {
        strength = std::clamp((out.evidence - config_.weak_evidence) /
                              (config_.strong_evidence - config_.weak_evidence), 0.0, 1.0);
    } else {
        strength = (out.evidence > config_.weak_evidence) ? 1.0 : 0.0;
    }

    out.effective_alpha = std::clamp(ceiling * strength * regimeMultiplier(input.regime), 0.0, ceiling);
    out.reason = "calibrated";
    return out;
}

double AlphaCalibrator::decileCorrelation(const PeriodStat& day) {
    const int n = PeriodStat::kDeciles;
    double mean_x = 0.0;
    double mean_y = 0.0;
    for (int i = 0; i < n; ++i) {
        mean_x += i;
        mean_y += finiteOr(day.decile_limit_up_rate[i], 0.0);
    }
    mean_x /= n;
    mean_y /= n;

    double cov = 0.0;
    double var_x = 0.0;
    double var_y = 0.0;
    for (int i = 0; i < n; ++i) {
        const double dx = i - mean_x;
        const double dy = finiteOr(day.decile_limit_up_rate[i], 0.0) - mean_y;
        cov += dx * dy;
        var_x += dx * dx;
        var_y += dy * dy;
    }
    if (var_x < 1e-12 || var_y < 1e-12) {
        return 0.0;
    }
    return std::clamp(cov / std::sqrt(var_x * var_y), -1.0, 1.0);
}

double AlphaCalibrator::topDecileLift(const PeriodStat& day) {
    double sum = 0.0;
    for (double rate : day.decile_limit_up_rate) {
        sum += finiteOr(rate, 0.0);
    }
    const double mean = sum / PeriodStat::kDeciles;
    if (mean < 1e-12) {
        return 1.0;
    }
    return finiteOr(day.decile_limit_up_rate[PeriodStat::kDeciles - 1], 0.0) / mean;
}

double AlphaCalibrator::regimeMultiplier(MarketRegimeLabel regime) const {
    double m = 1.0;
    switch (regime) {
        case MarketRegimeLabel::VOLATILE:
            m = config_.volatile_multiplier;
            break;
        case MarketRegimeLabel::ACTIVE:
            m = config_.active_multiplier;
            break;
        case MarketRegimeLabel::CALM:
            m = config_.calm_multiplier;
            break;
        default:
            m = 1.0;
            break;
    }
    // Never amplifies the request
    return std::clamp(finiteOr(m, 1.0), 0.0, 1.0);
}

} // namespace engine
} // namespace auctionheat
