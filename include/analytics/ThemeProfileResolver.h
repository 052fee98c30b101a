#pragma once

#include "common/Types.h"
#include <map>
#include <string>
#include <vector>

namespace auctionheat {
namespace analytics {

// Maps a stock's theme (or, failing that, its industry) to the day's
// hotness multiplier. Unknown themes resolve to 1.0 (no boost).
class ThemeProfileResolver {
public:
    explicit ThemeProfileResolver(const ThemeProfile& profile);

    // A theme label may list several themes ("chip,AI"); the hottest wins
    double resolve(const AuctionSnapshot& snapshot) const;
    double hotnessOf(const std::string& theme) const;

    size_t size() const { return hotness_.size(); }

    static double enhanceFactor(double hotness, double alpha);
    static std::vector<std::string> splitThemes(const std::string& label);

private:
    std::map<std::string, double> hotness_;
};

} // namespace analytics
} // namespace auctionheat
