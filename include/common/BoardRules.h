#pragma once
// ===================================================================
// A-share board rules: daily price-limit percent per board and
// special-treatment (ST) detection.
//
// | Board                       | Limit |
// |-----------------------------|-------|
// | ST / *ST (any board)        | 5%    |
// | ChiNext (300/301 .SZ)       | 20%   |
// | STAR (688/689 .SH)          | 20%   |
// | Beijing (.BJ, 4xx/8xx/92x)  | 30%   |
// | Main board                  | 10%   |
//
// Prices tick at 0.01.
// ===================================================================

#include <cmath>
#include <string>

namespace auctionheat {
namespace common {

constexpr double kPriceTick = 0.01;

inline bool startsWith(const std::string& value, const std::string& prefix) {
    return value.size() >= prefix.size() && value.compare(0, prefix.size(), prefix) == 0;
}

inline bool endsWith(const std::string& value, const std::string& suffix) {
    return value.size() >= suffix.size() &&
           value.compare(value.size() - suffix.size(), suffix.size(), suffix) == 0;
}

// Leading "ST", "*ST" or "SST", or the delisting marker anywhere
inline bool isSpecialTreatment(const std::string& name) {
    const size_t start = name.find_first_not_of(" \t");
    if (start == std::string::npos) return false;
    const std::string trimmed = name.substr(start);
    return startsWith(trimmed, "ST") || startsWith(trimmed, "*ST") || startsWith(trimmed, "SST") ||
           name.find("\xE9\x80\x80") != std::string::npos;  // U+9000
}

inline double limitPercent(const std::string& ts_code, const std::string& name) {
    if (isSpecialTreatment(name)) return 5.0;
    if (endsWith(ts_code, ".BJ")) return 30.0;
    if (startsWith(ts_code, "300") || startsWith(ts_code, "301")) return 20.0;
    if (startsWith(ts_code, "688") || startsWith(ts_code, "689")) return 20.0;
    if (startsWith(ts_code, "92") || startsWith(ts_code, "8") || startsWith(ts_code, "43")) return 30.0;
    return 10.0;
}

inline double roundToTick(double price) {
    return std::round(price / kPriceTick) * kPriceTick;
}

inline double limitUpPrice(double pre_close, double limit_pct) {
    return roundToTick(pre_close * (1.0 + limit_pct / 100.0));
}

// Percent still available before the limit price, relative to pre_close
inline double limitRoomPercent(double price, double pre_close, double limit_pct) {
    if (!(pre_close > 0.0) || !std::isfinite(price)) return 0.0;
    const double limit_price = limitUpPrice(pre_close, limit_pct);
    return (limit_price - price) / pre_close * 100.0;
}

inline bool isAtLimitUp(double price, double pre_close, double limit_pct) {
    if (!(pre_close > 0.0) || !std::isfinite(price)) return false;
    return price >= limitUpPrice(pre_close, limit_pct) - kPriceTick / 2.0;
}

} // namespace common
} // namespace auctionheat
