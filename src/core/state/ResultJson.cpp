#include "core/state/ResultJson.h"
#include "common/BoardRules.h"

#include <cmath>

namespace auctionheat {
namespace core {

namespace {
// Numbers may arrive as strings from some collectors
double numberOr(const nlohmann::json& row, const char* key, double fallback = kMissing) {
    if (!row.contains(key)) {
        return fallback;
    }
    const auto& v = row[key];
    if (v.is_number()) {
        return v.get<double>();
    }
    if (v.is_string()) {
        try {
            size_t used = 0;
            const std::string s = v.get<std::string>();
            const double parsed = std::stod(s, &used);
            return (used == s.size()) ? parsed : fallback;
        } catch (const std::exception&) {
            return fallback;
        }
    }
    return fallback;
}

std::string stringOr(const nlohmann::json& row, const char* key, const char* alt = nullptr) {
    if (row.contains(key) && row[key].is_string()) {
        return row[key].get<std::string>();
    }
    if (alt != nullptr && row.contains(alt) && row[alt].is_string()) {
        return row[alt].get<std::string>();
    }
    return "";
}

nlohmann::json finiteOrNull(double value) {
    return std::isfinite(value) ? nlohmann::json(value) : nlohmann::json(nullptr);
}
}

nlohmann::json toJson(const AuctionSnapshot& s) {
    nlohmann::json j;
    j["ts_code"] = s.ts_code;
    j["name"] = s.name;
    j["industry"] = s.industry;
    j["theme"] = s.theme;
    j["price"] = finiteOrNull(s.price);
    j["pre_close"] = finiteOrNull(s.pre_close);
    j["gap_percent"] = finiteOrNull(s.gap_percent);
    j["vol"] = finiteOrNull(s.vol);
    j["amount"] = finiteOrNull(s.amount);
    j["turnover_rate"] = finiteOrNull(s.turnover_rate);
    j["volume_ratio"] = finiteOrNull(s.volume_ratio);
    j["float_share"] = finiteOrNull(s.float_share);
    j["pe"] = finiteOrNull(s.pe);
    j["pe_ttm"] = finiteOrNull(s.pe_ttm);
    j["auction_volume_ratio"] = finiteOrNull(s.auction_volume_ratio);
    j["auction_limit_up"] = s.auction_limit_up;
    return j;
}

nlohmann::json toJson(const CandidateResult& c) {
    nlohmann::json j = toJson(c.snapshot);
    j["rank"] = c.rank;
    j["base_score"] = c.base_score;
    j["heat_score"] = c.heat_score;
    j["theme_enhance_factor"] = c.theme_enhance_factor;
    j["likely_limit_up"] = c.likely_limit_up;
    j["likely_limit_up_prob"] = c.likely_limit_up_prob;
    j["breakout_signal"] = c.breakout_signal;
    return j;
}

nlohmann::json toJson(const Summary& s) {
    nlohmann::json j;
    j["count"] = s.count;
    j["avg_heat"] = s.avg_heat;
    j["total_amount"] = s.total_amount;
    j["limit_up_candidates"] = s.limit_up_candidates;
    j["market_regime"] = toString(s.market_regime);
    j["theme_alpha_input"] = s.theme_alpha_input;
    j["theme_alpha_effective"] = s.theme_alpha_effective;
    j["total_candidates"] = s.total_candidates;
    j["skipped_rows"] = s.skipped_rows;
    j["history_days_covered"] = s.history_days_covered;
    j["history_days_requested"] = s.history_days_requested;
    return j;
}

nlohmann::json toJson(const RatioDiagnostics& d) {
    return {
        {"min", d.min},
        {"max", d.max},
        {"avg", d.avg},
        {"below_one_count", d.below_one_count},
        {"at_least_one_count", d.at_least_one_count},
        {"missing_count", d.missing_count}
    };
}

nlohmann::json toJson(const Diagnostics& d) {
    nlohmann::json j;
    j["volume_ratio"] = toJson(d.volume_ratio);
    j["auction_volume_ratio"] = toJson(d.auction_volume_ratio);
    j["pe"] = {
        {"negative_count", d.pe.negative_count},
        {"zero_count", d.pe.zero_count},
        {"above_range_count", d.pe.above_range_count},
        {"in_range_count", d.pe.in_range_count},
        {"missing_count", d.pe.missing_count},
        {"filter_enabled", d.pe.filter_enabled}
    };
    return j;
}

nlohmann::json toJson(const RankedResultSet& result) {
    nlohmann::json j;
    j["trade_date"] = result.trade_date;
    j["data_source"] = toString(result.data_source);
    j["items"] = nlohmann::json::array();
    for (const auto& item : result.items) {
        j["items"].push_back(toJson(item));
    }
    j["summary"] = toJson(result.summary);
    j["diagnostics"] = toJson(result.diagnostics);
    return j;
}

nlohmann::json toJson(const PeriodStat& stat) {
    nlohmann::json j;
    j["trade_date"] = stat.trade_date;
    j["advancers"] = stat.advancers;
    j["decliners"] = stat.decliners;
    j["avg_gap_percent"] = stat.avg_gap_percent;
    j["heat_dispersion"] = stat.heat_dispersion;
    j["market_limit_up_rate"] = stat.market_limit_up_rate;
    j["decile_limit_up_rate"] = stat.decile_limit_up_rate;
    j["sample_count"] = stat.sample_count;
    return j;
}

nlohmann::json toJson(const engine::HitRateReport& report) {
    nlohmann::json j;
    j["period"] = {
        {"start", report.start_date},
        {"end", report.end_date},
        {"days", report.stats_days}
    };
    j["statistics"] = {
        {"selected_count", report.selected_count},
        {"limit_up_count", report.limit_up_count},
        {"limit_up_rate", report.limit_up_rate},
        {"market_limit_up_rate", report.market_limit_up_rate},
        {"difference", report.difference}
    };
    j["medals"] = nlohmann::json::array();
    for (const auto& m : report.medals) {
        j["medals"].push_back({
            {"ts_code", m.ts_code},
            {"name", m.name},
            {"industry", m.industry},
            {"trade_date", m.trade_date},
            {"heat_score", m.heat_score}
        });
    }
    return j;
}

AuctionSnapshot snapshotFromJson(const nlohmann::json& row) {
    AuctionSnapshot s;
    s.ts_code = stringOr(row, "ts_code", "stock");
    s.name = stringOr(row, "name");
    s.industry = stringOr(row, "industry");
    s.theme = stringOr(row, "theme", "theme_name");
    s.price = numberOr(row, "price");
    s.pre_close = numberOr(row, "pre_close");
    s.gap_percent = numberOr(row, "gap_percent");
    s.vol = numberOr(row, "vol");
    s.amount = numberOr(row, "amount");
    s.turnover_rate = numberOr(row, "turnover_rate");
    s.volume_ratio = numberOr(row, "volume_ratio");
    s.float_share = numberOr(row, "float_share");
    s.pe = numberOr(row, "pe");
    s.pe_ttm = numberOr(row, "pe_ttm");
    s.auction_volume_ratio = numberOr(row, "auction_volume_ratio");
    if (!std::isfinite(s.auction_volume_ratio)) {
        // 5-day average auction volume, when the collector supplies it
        const double avg_vol = numberOr(row, "avg_auction_vol");
        if (std::isfinite(s.vol) && std::isfinite(avg_vol) && avg_vol > 0.0) {
            s.auction_volume_ratio = s.vol / avg_vol;
        }
    }

    if (row.contains("auction_limit_up") && row["auction_limit_up"].is_boolean()) {
        s.auction_limit_up = row["auction_limit_up"].get<bool>();
    } else {
        s.auction_limit_up = common::isAtLimitUp(s.price, s.pre_close,
                                                 common::limitPercent(s.ts_code, s.name));
    }
    return s;
}

PeriodStat periodStatFromJson(const nlohmann::json& row) {
    PeriodStat stat;
    stat.trade_date = row.value("trade_date", std::string());
    stat.advancers = row.value("advancers", 0);
    stat.decliners = row.value("decliners", 0);
    stat.avg_gap_percent = numberOr(row, "avg_gap_percent", 0.0);
    stat.heat_dispersion = numberOr(row, "heat_dispersion", 0.0);
    stat.market_limit_up_rate = numberOr(row, "market_limit_up_rate", 0.0);
    stat.sample_count = row.value("sample_count", 0);
    if (row.contains("decile_limit_up_rate") && row["decile_limit_up_rate"].is_array()) {
        const auto& rates = row["decile_limit_up_rate"];
        for (size_t i = 0; i < rates.size() && i < stat.decile_limit_up_rate.size(); ++i) {
            stat.decile_limit_up_rate[i] = rates[i].is_number() ? rates[i].get<double>() : 0.0;
        }
    }
    return stat;
}

engine::DailyOutcome outcomeFromJson(const nlohmann::json& row) {
    engine::DailyOutcome o;
    o.ts_code = stringOr(row, "ts_code", "stock");
    o.name = stringOr(row, "name");
    o.change_percent = numberOr(row, "change_percent");
    return o;
}

CandidateResult candidateFromJson(const nlohmann::json& row) {
    CandidateResult c;
    c.snapshot = snapshotFromJson(row);
    c.rank = row.value("rank", 0);
    c.base_score = numberOr(row, "base_score", 0.0);
    c.heat_score = numberOr(row, "heat_score", 0.0);
    c.theme_enhance_factor = numberOr(row, "theme_enhance_factor", 1.0);
    c.likely_limit_up = row.value("likely_limit_up", false);
    c.likely_limit_up_prob = numberOr(row, "likely_limit_up_prob", 0.0);
    c.breakout_signal = row.value("breakout_signal", false);
    return c;
}

} // namespace core
} // namespace auctionheat
