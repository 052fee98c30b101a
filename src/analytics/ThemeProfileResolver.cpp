#include "analytics/ThemeProfileResolver.h"
#include "common/Logger.h"
#include <algorithm>
#include <cctype>
#include <cmath>

namespace auctionheat {
namespace analytics {

namespace {
std::string trimCopy(const std::string& s) {
    const auto first = s.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) {
        return "";
    }
    const auto last = s.find_last_not_of(" \t\r\n");
    return s.substr(first, last - first + 1);
}
}

ThemeProfileResolver::ThemeProfileResolver(const ThemeProfile& profile) {
    for (const auto& [theme, hotness] : profile.hotness) {
        const std::string key = trimCopy(theme);
        if (key.empty()) continue;
        if (!std::isfinite(hotness) || hotness < 1.0) {
            // A theme can only boost, never dampen
            LOG_WARN("Theme '{}' hotness {} out of range, treated as 1.0", key, hotness);
            hotness_[key] = 1.0;
            continue;
        }
        hotness_[key] = hotness;
    }
}

double ThemeProfileResolver::resolve(const AuctionSnapshot& snapshot) const {
    double best = 0.0;
    bool found = false;
    for (const auto& theme : splitThemes(snapshot.theme)) {
        const auto it = hotness_.find(theme);
        if (it != hotness_.end()) {
            best = std::max(best, it->second);
            found = true;
        }
    }
    if (found) return best;

    const auto it = hotness_.find(trimCopy(snapshot.industry));
    return (it != hotness_.end()) ? it->second : 1.0;
}

double ThemeProfileResolver::hotnessOf(const std::string& theme) const {
    const auto it = hotness_.find(trimCopy(theme));
    return (it != hotness_.end()) ? it->second : 1.0;
}

double ThemeProfileResolver::enhanceFactor(double hotness, double alpha) {
    if (!std::isfinite(hotness) || hotness < 1.0) hotness = 1.0;
    if (!std::isfinite(alpha) || alpha < 0.0) alpha = 0.0;
    return 1.0 + alpha * (hotness - 1.0);
}

std::vector<std::string> ThemeProfileResolver::splitThemes(const std::string& label) {
    std::vector<std::string> out;
    size_t start = 0;
    while (start <= label.size()) {
        const size_t sep = label.find_first_of(",;|", start);
        std::string token = (sep == std::string::npos)
            ? label.substr(start)
            : label.substr(start, sep - start);
        token = trimCopy(token);
        if (!token.empty()) {
            out.push_back(token);
        }
        if (sep == std::string::npos) {
            break;
        }
        start = sep + 1;
    }
    return out;
}

} // namespace analytics
} // namespace auctionheat
