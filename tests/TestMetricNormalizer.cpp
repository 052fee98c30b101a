#include "analytics/MetricNormalizer.h"

#include <cmath>
#include <iostream>
#include <vector>

using namespace auctionheat;

namespace {
AuctionSnapshot makeSnapshot(const std::string& code, double volume_ratio, double turnover,
                             double gap, double amount) {
    AuctionSnapshot s;
    s.ts_code = code;
    s.price = 10.0 * (1.0 + gap / 100.0);
    s.pre_close = 10.0;
    s.gap_percent = gap;
    s.volume_ratio = volume_ratio;
    s.turnover_rate = turnover;
    s.amount = amount;
    return s;
}

bool near(double a, double b, double eps = 1e-6) {
    return std::abs(a - b) < eps;
}
}

int main() {
    std::cout << "[TEST] Starting MetricNormalizer Test..." << std::endl;

    // 1. logSquash bounds
    if (analytics::MetricNormalizer::logSquash(0.0, 10.0) != 0.0 ||
        analytics::MetricNormalizer::logSquash(-3.0, 10.0) != 0.0 ||
        analytics::MetricNormalizer::logSquash(kMissing, 10.0) != 0.0) {
        std::cerr << "[TEST] non-positive or missing input should squash to 0\n";
        return 1;
    }
    if (!near(analytics::MetricNormalizer::logSquash(10.0, 10.0), 1.0) ||
        analytics::MetricNormalizer::logSquash(500.0, 10.0) != 1.0) {
        std::cerr << "[TEST] value at or above the cap should squash to 1\n";
        return 1;
    }
    const double mid = analytics::MetricNormalizer::logSquash(5.0, 10.0);
    if (!near(mid, std::log(6.0) / std::log(11.0))) {
        std::cerr << "[TEST] logSquash(5, 10) unexpected: " << mid << "\n";
        return 1;
    }

    // 2. percentile: interpolation, NaN skipped, empty -> 0
    const double p50 = analytics::MetricNormalizer::percentile({1.0, 2.0, 3.0, 4.0, kMissing}, 0.5);
    if (!near(p50, 2.5)) {
        std::cerr << "[TEST] percentile median unexpected: " << p50 << "\n";
        return 1;
    }
    if (analytics::MetricNormalizer::percentile({}, 0.95) != 0.0) {
        std::cerr << "[TEST] percentile of empty set should be 0\n";
        return 1;
    }

    engine::NormalizerConfig config;
    analytics::MetricNormalizer normalizer(config);

    // 3. Caps never fall below the configured floors
    std::vector<AuctionSnapshot> quiet = {
        makeSnapshot("000001.SZ", 1.0, 1.0, 0.5, 1e7),
        makeSnapshot("000002.SZ", 2.0, 2.0, 1.0, 2e7),
    };
    const auto quiet_scale = normalizer.buildScale(quiet);
    if (quiet_scale.volume_ratio_cap != config.volume_ratio_cap_floor ||
        quiet_scale.turnover_rate_cap != config.turnover_rate_cap_floor ||
        quiet_scale.amount_cap != config.amount_cap_floor) {
        std::cerr << "[TEST] quiet day should use floor caps\n";
        return 1;
    }

    // 4. A hot day widens the volume ratio cap
    std::vector<AuctionSnapshot> hot;
    for (int i = 0; i < 20; ++i) {
        hot.push_back(makeSnapshot("6000" + std::to_string(10 + i) + ".SH", 5.0 + i * 2.0, 3.0, 2.0, 5e7));
    }
    const auto hot_scale = normalizer.buildScale(hot);
    if (!(hot_scale.volume_ratio_cap > config.volume_ratio_cap_floor)) {
        std::cerr << "[TEST] hot day cap should exceed floor, got " << hot_scale.volume_ratio_cap << "\n";
        return 1;
    }

    // 5. Sub-scores in [0, 1]; negative gap scores zero; missing metric is neutral
    auto gapped_down = makeSnapshot("000003.SZ", 3.0, kMissing, -4.0, 3e7);
    const auto sub = normalizer.normalize(gapped_down, quiet_scale);
    if (sub.gap_percent != 0.0 || sub.turnover_rate != 0.0) {
        std::cerr << "[TEST] negative gap / missing turnover should score 0\n";
        return 1;
    }
    if (sub.volume_ratio <= 0.0 || sub.volume_ratio > 1.0 || sub.amount <= 0.0 || sub.amount > 1.0) {
        std::cerr << "[TEST] sub-scores out of range\n";
        return 1;
    }

    auto big_gap = makeSnapshot("000004.SZ", 3.0, 3.0, 25.0, 3e7);
    if (normalizer.normalize(big_gap, quiet_scale).gap_percent != 1.0) {
        std::cerr << "[TEST] gap above ceiling should score 1\n";
        return 1;
    }

    // 6. Monotone in volume ratio on a fixed scale
    double previous = -1.0;
    for (double vr = 0.5; vr <= 40.0; vr += 0.5) {
        auto s = makeSnapshot("000005.SZ", vr, 3.0, 2.0, 5e7);
        const double v = normalizer.normalize(s, hot_scale).volume_ratio;
        if (v < previous) {
            std::cerr << "[TEST] volume ratio sub-score decreased at " << vr << "\n";
            return 1;
        }
        previous = v;
    }

    std::cout << "[TEST] MetricNormalizer Test PASSED!" << std::endl;
    return 0;
}
