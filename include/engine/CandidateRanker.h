#pragma once

#include "common/Types.h"
#include "engine/EngineConfig.h"
#include <vector>

namespace auctionheat {
namespace engine {

struct RankerOptions {
    bool exclude_auction_limit_up = true;
    bool pe_filter_enabled = false;
    bool exclude_special_treatment = true;
    bool low_gap_only = false;
    SortMode sort_mode = SortMode::CANDIDATE_FIRST;
    int limit = 0;                      // 0 = keep all
};

struct RankerOutput {
    std::vector<CandidateResult> items;
    Summary summary;                    // count/heat/amount/candidates only
    Diagnostics diagnostics;
    int dropped_duplicate = 0;
    int dropped_special_treatment = 0;
    int dropped_auction_limit_up = 0;
    int dropped_pe = 0;
    int dropped_high_gap = 0;
    int dropped_by_limit = 0;
};

// dedupe -> filter -> sort -> rank -> truncate -> summarize
class CandidateRanker {
public:
    explicit CandidateRanker(const FilterConfig& config);

    RankerOutput rank(std::vector<CandidateResult> candidates, const RankerOptions& options) const;

    // Aggregates over exactly the given list
    static Summary summarize(const std::vector<CandidateResult>& items);

    // Both PE fields missing, or either present one outside (0, pe_max], fails
    bool passesPeFilter(const AuctionSnapshot& snapshot) const;
    PeDiagnostics peDiagnostics(const std::vector<CandidateResult>& items) const;
    static RatioDiagnostics ratioDiagnostics(const std::vector<double>& values);

    static bool candidateFirstLess(const CandidateResult& a, const CandidateResult& b);
    static bool heatDescLess(const CandidateResult& a, const CandidateResult& b);

private:
    FilterConfig config_;
};

} // namespace engine
} // namespace auctionheat
