#include "common/Config.h"
#include "common/Logger.h"
#include <iostream>
#include <cmath>
#include <filesystem>

// Simple manual test runner
int main() {
    using namespace auctionheat;

    spdlog::set_level(spdlog::level::debug);

    std::cout << "[TEST] Starting Config Test..." << std::endl;

    Config& config = Config::getInstance();
    config.reset();

    // 1. Defaults
    auto defaults = config.getEngineConfig();
    if (std::abs(defaults.weights.sum() - 1.0) > 1e-9 ||
        defaults.defaults.limit != 20 ||
        defaults.defaults.theme_alpha != 0.25 ||
        defaults.defaults.sort_mode != SortMode::CANDIDATE_FIRST ||
        !defaults.defaults.exclude_auction_limit_up ||
        !defaults.defaults.dynamic_alpha ||
        defaults.defaults.rolling_window_days != 20) {
        std::cerr << "[TEST] unexpected engine defaults\n";
        return 1;
    }
    if (config.getLogLevel() != "info" || config.getDataDir() != "data") {
        std::cerr << "[TEST] unexpected logging/data defaults\n";
        return 1;
    }

    // 2. Shipped config.json (run from the repo root or the build dir)
    std::string config_path = "config/config.json";
    if (std::filesystem::exists(config_path)) {
        std::cout << "[TEST] Found config.json, loading..." << std::endl;
        config.load(config_path);
        auto loaded = config.getEngineConfig();
        std::cout << "Window: " << loaded.defaults.rolling_window_days << std::endl;
        std::cout << "Alpha: " << loaded.defaults.theme_alpha << std::endl;
        if (std::abs(loaded.weights.sum() - 1.0) > 1e-6 || loaded.defaults.theme_alpha > 0.5) {
            std::cerr << "[TEST] shipped config out of contract\n";
            return 1;
        }
    } else {
        std::cout << "[TEST] config.json not found, checking overrides only..." << std::endl;
    }

    // 3. Partial override keeps everything else
    config.reset();
    config.apply(nlohmann::json::parse(R"({
        "logging": {"level": "debug"},
        "engine": {"theme_alpha": 0.1, "sort_mode": "HEAT_DESC", "weights": {"amount": 0.1}},
        "filters": {"pe_max": 60},
        "calibration": {"volatile_multiplier": 0.25}
    })"));
    auto overridden = config.getEngineConfig();
    if (config.getLogLevel() != "debug" ||
        overridden.defaults.theme_alpha != 0.1 ||
        overridden.defaults.sort_mode != SortMode::HEAT_DESC ||
        overridden.filters.pe_max != 60.0 ||
        overridden.calibration.volatile_multiplier != 0.25 ||
        overridden.weights.volume_ratio != 0.4 ||
        overridden.defaults.limit != 20) {
        std::cerr << "[TEST] partial override mismatch\n";
        return 1;
    }

    // 4. Unknown sort mode keeps the current value
    config.apply(nlohmann::json::parse(R"({"engine": {"sort_mode": "random"}})"));
    if (config.getEngineConfig().defaults.sort_mode != SortMode::HEAT_DESC) {
        std::cerr << "[TEST] unknown sort mode should be ignored\n";
        return 1;
    }

    config.reset();
    std::cout << "[TEST] Config Test PASSED!" << std::endl;

    return 0;
}
