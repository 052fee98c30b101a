#pragma once

#include "common/Types.h"
#include "engine/EngineConfig.h"
#include <string>

namespace auctionheat {
namespace engine {

// Immutable per-call parameters of HeatRankingEngine::rank
struct RankRequest {
    std::string trade_date;             // YYYY-MM-DD
    int limit = 20;                     // 0 = no truncation
    bool exclude_auction_limit_up = true;
    double theme_alpha = 0.25;          // requested, [0, 0.5]
    bool pe_filter_enabled = false;
    SortMode sort_mode = SortMode::CANDIDATE_FIRST;
    bool dynamic_alpha = true;
    int rolling_window_days = 20;
    bool low_gap_only = false;

    static RankRequest fromDefaults(const RequestDefaults& defaults, const std::string& trade_date);
};

// Throws InvalidParameterError for anything but candidate_first / heat_desc
SortMode parseSortMode(const std::string& value);

bool isValidTradeDate(const std::string& value);

// Rejects out-of-contract parameters; never clamps them
void validateRequest(const RankRequest& request, const ScoreWeights& weights);

} // namespace engine
} // namespace auctionheat
