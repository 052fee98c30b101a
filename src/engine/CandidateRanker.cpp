#include "engine/CandidateRanker.h"
#include "common/BoardRules.h"

#include <algorithm>
#include <cmath>
#include <unordered_set>

namespace auctionheat {
namespace engine {

CandidateRanker::CandidateRanker(const FilterConfig& config)
    : config_(config)
{
}

RankerOutput CandidateRanker::rank(std::vector<CandidateResult> candidates, const RankerOptions& options) const {
    RankerOutput out;
    std::vector<CandidateResult> kept;
    kept.reserve(candidates.size());

    // 1. Dedupe (first occurrence wins), 2. exclusion filters
    std::unordered_set<std::string> seen;
    std::vector<CandidateResult> unique;
    unique.reserve(candidates.size());
    for (auto& c : candidates) {
        if (!seen.insert(c.snapshot.ts_code).second) {
            out.dropped_duplicate++;
            continue;
        }
        unique.push_back(std::move(c));
    }

    out.diagnostics.pe = peDiagnostics(unique);
    out.diagnostics.pe.filter_enabled = options.pe_filter_enabled;

    for (auto& c : unique) {
        const auto& s = c.snapshot;
        if (options.exclude_special_treatment && common::isSpecialTreatment(s.name)) {
            out.dropped_special_treatment++;
            continue;
        }
        if (options.exclude_auction_limit_up && s.auction_limit_up) {
            out.dropped_auction_limit_up++;
            continue;
        }
        if (options.pe_filter_enabled && !passesPeFilter(s)) {
            out.dropped_pe++;
            continue;
        }
        if (options.low_gap_only &&
            !(std::isfinite(s.gap_percent) && s.gap_percent < config_.low_gap_threshold_percent)) {
            out.dropped_high_gap++;
            continue;
        }
        kept.push_back(std::move(c));
    }

    // 3. Sort; identifiers are unique here so the order is total
    if (options.sort_mode == SortMode::HEAT_DESC) {
        std::sort(kept.begin(), kept.end(), &CandidateRanker::heatDescLess);
    } else {
        std::sort(kept.begin(), kept.end(), &CandidateRanker::candidateFirstLess);
    }

    // 4. Rank over the full filtered order, 5. truncate afterwards
    for (size_t i = 0; i < kept.size(); ++i) {
        kept[i].rank = static_cast<int>(i) + 1;
    }
    const int total = static_cast<int>(kept.size());
    if (options.limit > 0 && total > options.limit) {
        out.dropped_by_limit = total - options.limit;
        kept.resize(static_cast<size_t>(options.limit));
    }

    out.summary = summarize(kept);
    out.summary.total_candidates = total;

    std::vector<double> volume_ratios;
    std::vector<double> auction_ratios;
    for (const auto& c : kept) {
        volume_ratios.push_back(c.snapshot.volume_ratio);
        auction_ratios.push_back(c.snapshot.auction_volume_ratio);
    }
    out.diagnostics.volume_ratio = ratioDiagnostics(volume_ratios);
    out.diagnostics.auction_volume_ratio = ratioDiagnostics(auction_ratios);
    out.items = std::move(kept);
    return out;
}

Summary CandidateRanker::summarize(const std::vector<CandidateResult>& items) {
    Summary summary;
    summary.count = static_cast<int>(items.size());
    if (items.empty()) {
        return summary;
    }

    double heat_sum = 0.0;
    for (const auto& c : items) {
        heat_sum += c.heat_score;
        if (std::isfinite(c.snapshot.amount)) {
            summary.total_amount += c.snapshot.amount;
        }
        if (c.likely_limit_up) {
            summary.limit_up_candidates++;
        }
    }
    summary.avg_heat = heat_sum / static_cast<double>(items.size());
    return summary;
}

bool CandidateRanker::passesPeFilter(const AuctionSnapshot& snapshot) const {
    const bool has_pe = std::isfinite(snapshot.pe);
    const bool has_pe_ttm = std::isfinite(snapshot.pe_ttm);
    if (!has_pe && !has_pe_ttm) {
        return false;
    }
    const auto inRange = [this](double pe) { return pe > 0.0 && pe <= config_.pe_max; };
    if (has_pe && !inRange(snapshot.pe)) return false;
    if (has_pe_ttm && !inRange(snapshot.pe_ttm)) return false;
    return true;
}

PeDiagnostics CandidateRanker::peDiagnostics(const std::vector<CandidateResult>& items) const {
    PeDiagnostics d;
    for (const auto& c : items) {
        const double values[] = {c.snapshot.pe, c.snapshot.pe_ttm};
        bool any = false;
        for (double pe : values) {
            if (!std::isfinite(pe)) continue;
            any = true;
            if (pe < 0.0) {
                d.negative_count++;
            } else if (pe == 0.0) {
                d.zero_count++;
            } else if (pe > config_.pe_max) {
                d.above_range_count++;
            } else {
                d.in_range_count++;
            }
        }
        if (!any) {
            d.missing_count++;
        }
    }
    return d;
}

RatioDiagnostics CandidateRanker::ratioDiagnostics(const std::vector<double>& values) {
    RatioDiagnostics d;
    double sum = 0.0;
    int present = 0;
    for (double v : values) {
        if (!std::isfinite(v)) {
            d.missing_count++;
            continue;
        }
        if (present == 0) {
            d.min = v;
            d.max = v;
        } else {
            d.min = std::min(d.min, v);
            d.max = std::max(d.max, v);
        }
        sum += v;
        present++;
        if (v < 1.0) {
            d.below_one_count++;
        } else {
            d.at_least_one_count++;
        }
    }
    if (present > 0) {
        d.avg = sum / present;
    }
    return d;
}

bool CandidateRanker::candidateFirstLess(const CandidateResult& a, const CandidateResult& b) {
    if (a.likely_limit_up != b.likely_limit_up) {
        return a.likely_limit_up;
    }
    return heatDescLess(a, b);
}

bool CandidateRanker::heatDescLess(const CandidateResult& a, const CandidateResult& b) {
    if (a.heat_score != b.heat_score) {
        return a.heat_score > b.heat_score;
    }
    return a.snapshot.ts_code < b.snapshot.ts_code;
}

} // namespace engine
} // namespace auctionheat
