#include "analytics/ThemeProfileResolver.h"

#include <cmath>
#include <iostream>

using namespace auctionheat;

int main() {
    std::cout << "[TEST] Starting ThemeProfileResolver Test..." << std::endl;

    ThemeProfile profile;
    profile.trade_date = "2024-03-01";
    profile.hotness["chip"] = 1.4;
    profile.hotness[" AI "] = 1.8;
    profile.hotness["banking"] = 0.7;          // dampening is not allowed
    profile.hotness["robotics"] = kMissing;

    analytics::ThemeProfileResolver resolver(profile);

    AuctionSnapshot s;
    s.ts_code = "000001.SZ";

    // 1. Direct hit
    s.theme = "chip";
    if (std::abs(resolver.resolve(s) - 1.4) > 1e-12) {
        std::cerr << "[TEST] chip should resolve to 1.4\n";
        return 1;
    }

    // 2. Multi-theme label takes the hottest; keys are trimmed
    s.theme = "chip, AI";
    if (std::abs(resolver.resolve(s) - 1.8) > 1e-12) {
        std::cerr << "[TEST] multi-theme label should resolve to 1.8, got " << resolver.resolve(s) << "\n";
        return 1;
    }

    // 3. Unknown theme falls back to industry, then to 1.0
    s.theme = "shipping";
    s.industry = "chip";
    if (std::abs(resolver.resolve(s) - 1.4) > 1e-12) {
        std::cerr << "[TEST] industry fallback failed\n";
        return 1;
    }
    s.industry = "retail";
    if (resolver.resolve(s) != 1.0) {
        std::cerr << "[TEST] unknown theme should resolve to 1.0\n";
        return 1;
    }

    // 4. Out-of-range hotness is neutralized
    if (resolver.hotnessOf("banking") != 1.0 || resolver.hotnessOf("robotics") != 1.0) {
        std::cerr << "[TEST] sub-1 or missing hotness should be 1.0\n";
        return 1;
    }

    // 5. Enhance factor
    if (std::abs(analytics::ThemeProfileResolver::enhanceFactor(1.4, 0.25) - 1.1) > 1e-12) {
        std::cerr << "[TEST] enhanceFactor(1.4, 0.25) should be 1.1\n";
        return 1;
    }
    if (analytics::ThemeProfileResolver::enhanceFactor(1.4, 0.0) != 1.0 ||
        analytics::ThemeProfileResolver::enhanceFactor(0.5, 0.5) != 1.0) {
        std::cerr << "[TEST] enhanceFactor should never dampen\n";
        return 1;
    }

    // 6. Splitting
    const auto parts = analytics::ThemeProfileResolver::splitThemes("a;b| c ,,");
    if (parts.size() != 3 || parts[2] != "c") {
        std::cerr << "[TEST] splitThemes unexpected size " << parts.size() << "\n";
        return 1;
    }

    std::cout << "[TEST] ThemeProfileResolver Test PASSED!" << std::endl;
    return 0;
}
