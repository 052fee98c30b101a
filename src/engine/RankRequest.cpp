#include "engine/RankRequest.h"
#include "engine/AlphaCalibrator.h"
#include "common/Errors.h"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <regex>

namespace auctionheat {
namespace engine {

RankRequest RankRequest::fromDefaults(const RequestDefaults& defaults, const std::string& trade_date) {
    RankRequest request;
    request.trade_date = trade_date;
    request.limit = defaults.limit;
    request.exclude_auction_limit_up = defaults.exclude_auction_limit_up;
    request.theme_alpha = defaults.theme_alpha;
    request.pe_filter_enabled = defaults.pe_filter_enabled;
    request.sort_mode = defaults.sort_mode;
    request.dynamic_alpha = defaults.dynamic_alpha;
    request.rolling_window_days = defaults.rolling_window_days;
    return request;
}

SortMode parseSortMode(const std::string& value) {
    std::string s = value;
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (s == "candidate_first") return SortMode::CANDIDATE_FIRST;
    if (s == "heat_desc") return SortMode::HEAT_DESC;
    throw InvalidParameterError("sort_mode", "unknown value '" + value + "'");
}

bool isValidTradeDate(const std::string& value) {
    static const std::regex pattern(R"(^\d{4}-(0[1-9]|1[0-2])-(0[1-9]|[12]\d|3[01])$)");
    return std::regex_match(value, pattern);
}

void validateRequest(const RankRequest& request, const ScoreWeights& weights) {
    if (!isValidTradeDate(request.trade_date)) {
        throw InvalidParameterError("trade_date", "expected YYYY-MM-DD, got '" + request.trade_date + "'");
    }
    if (!std::isfinite(request.theme_alpha) ||
        request.theme_alpha < 0.0 || request.theme_alpha > kMaxThemeAlpha) {
        throw InvalidParameterError("theme_alpha", "must be within [0, 0.5], got " + std::to_string(request.theme_alpha));
    }
    if (request.limit < 0) {
        throw InvalidParameterError("limit", "must not be negative, got " + std::to_string(request.limit));
    }
    if (request.rolling_window_days <= 0) {
        throw InvalidParameterError("rolling_window_days", "must be positive, got " + std::to_string(request.rolling_window_days));
    }
    if (request.sort_mode != SortMode::CANDIDATE_FIRST && request.sort_mode != SortMode::HEAT_DESC) {
        throw InvalidParameterError("sort_mode", "unknown value");
    }

    const double parts[] = {weights.volume_ratio, weights.turnover_rate, weights.gap_percent, weights.amount};
    for (double w : parts) {
        if (!std::isfinite(w) || w < 0.0) {
            throw InvalidParameterError("weights", "each weight must be finite and non-negative");
        }
    }
    if (std::abs(weights.sum() - 1.0) > 1e-6) {
        throw InvalidParameterError("weights", "must sum to 1.0, got " + std::to_string(weights.sum()));
    }
}

} // namespace engine
} // namespace auctionheat
