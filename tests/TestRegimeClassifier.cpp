#include "analytics/RegimeClassifier.h"

#include <cstdio>
#include <iostream>
#include <vector>

using namespace auctionheat;

namespace {
std::string dateOf(int day) {
    char buf[16];
    std::snprintf(buf, sizeof(buf), "2024-01-%02d", day);
    return buf;
}

std::vector<PeriodStat> makeWindow(int days, int advancers, int decliners,
                                   double gap, double gap_swing, double dispersion, double limit_up_rate) {
    std::vector<PeriodStat> window;
    for (int i = 0; i < days; ++i) {
        PeriodStat day;
        day.trade_date = dateOf(i + 1);
        day.advancers = advancers;
        day.decliners = decliners;
        day.avg_gap_percent = gap + ((i % 2 == 0) ? gap_swing : -gap_swing);
        day.heat_dispersion = dispersion;
        day.market_limit_up_rate = limit_up_rate;
        day.sample_count = 100;
        window.push_back(day);
    }
    return window;
}
}

int main() {
    std::cout << "[TEST] Starting RegimeClassifier Test..." << std::endl;

    engine::RegimeConfig config;
    analytics::RegimeClassifier classifier(config);

    // 1. Empty and short history -> NEUTRAL, coverage reported
    auto empty = classifier.classify({}, 20);
    if (empty.label != MarketRegimeLabel::NEUTRAL || empty.days_covered != 0 || empty.days_requested != 20) {
        std::cerr << "[TEST] empty window should be neutral\n";
        return 1;
    }
    auto short_window = classifier.classify(makeWindow(5, 700, 300, 1.0, 0.0, 10.0, 0.05), 20);
    if (short_window.label != MarketRegimeLabel::NEUTRAL || short_window.days_covered != 5) {
        std::cerr << "[TEST] short window should be neutral with 5 days covered\n";
        return 1;
    }

    // 2. Broad advance with opening strength -> ACTIVE
    auto active = classifier.classify(makeWindow(20, 700, 300, 0.8, 0.2, 12.0, 0.02), 20);
    if (active.label != MarketRegimeLabel::ACTIVE) {
        std::cerr << "[TEST] expected active, got " << toString(active.label) << "\n";
        return 1;
    }
    if (active.window_start != "2024-01-01" || active.window_end != "2024-01-20") {
        std::cerr << "[TEST] unexpected window bounds\n";
        return 1;
    }

    // 3. Large swings in the daily average gap -> VOLATILE
    auto swinging = classifier.classify(makeWindow(20, 700, 300, 0.0, 2.0, 12.0, 0.02), 20);
    if (swinging.label != MarketRegimeLabel::VOLATILE) {
        std::cerr << "[TEST] expected volatile from gap swings, got " << toString(swinging.label) << "\n";
        return 1;
    }

    // 4. Weak breadth -> VOLATILE
    auto panic = classifier.classify(makeWindow(20, 200, 800, -0.5, 0.1, 12.0, 0.01), 20);
    if (panic.label != MarketRegimeLabel::VOLATILE) {
        std::cerr << "[TEST] expected volatile from weak breadth\n";
        return 1;
    }

    // 5. Balanced and quiet -> CALM
    auto calm = classifier.classify(makeWindow(20, 500, 500, 0.1, 0.1, 12.0, 0.01), 20);
    if (calm.label != MarketRegimeLabel::CALM) {
        std::cerr << "[TEST] expected calm, got " << toString(calm.label) << "\n";
        return 1;
    }

    // 6. Only the most recent requested days count
    auto longer = makeWindow(25, 500, 500, 0.1, 0.1, 12.0, 0.01);
    auto trimmed = classifier.classify(longer, 20);
    if (trimmed.days_covered != 20 || trimmed.window_start != "2024-01-06") {
        std::cerr << "[TEST] window should keep the last 20 days\n";
        return 1;
    }

    // 7. No breadth data -> neutral 0.5 ratio
    auto stats = analytics::RegimeClassifier::computeStatistics(makeWindow(3, 0, 0, 0.0, 0.0, 0.0, 0.0));
    if (stats.breadth_ratio != 0.5 || stats.gap_volatility != 0.0) {
        std::cerr << "[TEST] unexpected statistics for flat window\n";
        return 1;
    }

    std::cout << "[TEST] RegimeClassifier Test PASSED!" << std::endl;
    return 0;
}
