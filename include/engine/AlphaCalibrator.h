#pragma once

#include "common/Types.h"
#include "engine/EngineConfig.h"
#include <string>
#include <vector>

namespace auctionheat {
namespace engine {

constexpr double kMaxThemeAlpha = 0.5;

struct CalibrationInput {
    double requested_alpha = 0.0;
    bool dynamic_alpha = true;
    MarketRegimeLabel regime = MarketRegimeLabel::NEUTRAL;
    const std::vector<PeriodStat>* window = nullptr;
};

struct CalibrationOutput {
    double effective_alpha = 0.0;
    double evidence = 0.0;          // weighted correlation/lift score, -1..1
    double mean_correlation = 0.0;
    double mean_lift = 1.0;
    int days_used = 0;
    std::string reason;             // static|insufficient_history|no_usable_days|calibrated
};

// Shrinks the requested theme alpha toward 0 when past heat deciles did not
// separate limit-up outcomes. Never exceeds the request or 0.5, never
// negative. Stateless: the window is the only history.
class AlphaCalibrator {
public:
    explicit AlphaCalibrator(const CalibrationConfig& config);

    CalibrationOutput calibrate(const CalibrationInput& input) const;

    // Pearson correlation between decile index and realized limit-up rate
    static double decileCorrelation(const PeriodStat& day);
    // Top-decile limit-up rate over the mean decile rate (1.0 when undefined)
    static double topDecileLift(const PeriodStat& day);

private:
    double regimeMultiplier(MarketRegimeLabel regime) const;

    CalibrationConfig config_;
};

} // namespace engine
} // namespace auctionheat
