#include "common/Config.h"
#include "common/PathUtils.h"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <iostream>

namespace auctionheat {

namespace {
std::string normalizeToken(std::string name) {
    std::transform(name.begin(), name.end(), name.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    auto not_space = [](unsigned char c) { return !std::isspace(c); };
    name.erase(name.begin(), std::find_if(name.begin(), name.end(), not_space));
    name.erase(std::find_if(name.rbegin(), name.rend(), not_space).base(), name.end());
    return name;
}
}

Config& Config::getInstance() {
    static Config instance;
    return instance;
}

void Config::load(const std::string& path) {
    try {
        std::filesystem::path config_path;
        if (std::filesystem::path(path).is_absolute()) {
            config_path = path;
        } else {
            config_path = utils::PathUtils::resolveRelativePath(path);
        }

        std::cerr << "Config path: " << config_path << std::endl;

        if (!std::filesystem::exists(config_path)) {
            std::cerr << "Warning: config file not found: " << config_path << std::endl;
            std::cerr << "Using defaults." << std::endl;
            return;
        }

        std::ifstream file(config_path);
        if (!file.is_open()) {
            std::cerr << "Warning: cannot open config file." << std::endl;
            return;
        }

        nlohmann::json j;
        file >> j;
        apply(j);

        std::cerr << "Config loaded: window=" << engine_config_.defaults.rolling_window_days
                  << ", alpha=" << engine_config_.defaults.theme_alpha << std::endl;
    } catch (const std::exception& e) {
        std::cerr << "Config load error: " << e.what() << std::endl;
    }
}

void Config::apply(const nlohmann::json& j) {
    if (j.contains("logging")) {
        auto& l = j["logging"];
        log_level_ = l.value("level", log_level_);
        log_dir_ = l.value("dir", log_dir_);
    }

    auto& cfg = engine_config_;

    if (j.contains("engine")) {
        auto& e = j["engine"];
        cfg.data_dir = e.value("data_dir", cfg.data_dir);
        cfg.defaults.limit = e.value("limit", cfg.defaults.limit);
        cfg.defaults.theme_alpha = e.value("theme_alpha", cfg.defaults.theme_alpha);
        cfg.defaults.exclude_auction_limit_up = e.value("exclude_auction_limit_up", cfg.defaults.exclude_auction_limit_up);
        cfg.defaults.pe_filter_enabled = e.value("pe_filter_enabled", cfg.defaults.pe_filter_enabled);
        cfg.defaults.dynamic_alpha = e.value("dynamic_alpha", cfg.defaults.dynamic_alpha);
        cfg.defaults.rolling_window_days = e.value("rolling_window_days", cfg.defaults.rolling_window_days);

        const std::string mode = normalizeToken(e.value("sort_mode", std::string(toString(cfg.defaults.sort_mode))));
        if (mode == "heat_desc") {
            cfg.defaults.sort_mode = SortMode::HEAT_DESC;
        } else if (mode == "candidate_first") {
            cfg.defaults.sort_mode = SortMode::CANDIDATE_FIRST;
        } else {
            std::cerr << "Warning: unknown engine.sort_mode '" << mode << "', keeping "
                      << toString(cfg.defaults.sort_mode) << std::endl;
        }

        if (e.contains("weights")) {
            auto& w = e["weights"];
            cfg.weights.volume_ratio = w.value("volume_ratio", cfg.weights.volume_ratio);
            cfg.weights.turnover_rate = w.value("turnover_rate", cfg.weights.turnover_rate);
            cfg.weights.gap_percent = w.value("gap_percent", cfg.weights.gap_percent);
            cfg.weights.amount = w.value("amount", cfg.weights.amount);
        }
    }

    if (j.contains("normalizer")) {
        auto& n = j["normalizer"];
        cfg.normalizer.cap_percentile = n.value("cap_percentile", cfg.normalizer.cap_percentile);
        cfg.normalizer.volume_ratio_cap_floor = n.value("volume_ratio_cap_floor", cfg.normalizer.volume_ratio_cap_floor);
        cfg.normalizer.turnover_rate_cap_floor = n.value("turnover_rate_cap_floor", cfg.normalizer.turnover_rate_cap_floor);
        cfg.normalizer.amount_unit = n.value("amount_unit", cfg.normalizer.amount_unit);
        cfg.normalizer.amount_cap_floor = n.value("amount_cap_floor", cfg.normalizer.amount_cap_floor);
        cfg.normalizer.gap_ceiling_percent = n.value("gap_ceiling_percent", cfg.normalizer.gap_ceiling_percent);
    }

    if (j.contains("probability")) {
        auto& p = j["probability"];
        cfg.probability.heat_midpoint = p.value("heat_midpoint", cfg.probability.heat_midpoint);
        cfg.probability.heat_slope = p.value("heat_slope", cfg.probability.heat_slope);
        cfg.probability.gap_midpoint = p.value("gap_midpoint", cfg.probability.gap_midpoint);
        cfg.probability.gap_slope = p.value("gap_slope", cfg.probability.gap_slope);
        cfg.probability.likely_threshold = p.value("likely_threshold", cfg.probability.likely_threshold);
        cfg.probability.breakout_min_gap_percent = p.value("breakout_min_gap_percent", cfg.probability.breakout_min_gap_percent);
        cfg.probability.breakout_min_volume_ratio = p.value("breakout_min_volume_ratio", cfg.probability.breakout_min_volume_ratio);
        cfg.probability.breakout_min_limit_room_percent = p.value("breakout_min_limit_room_percent", cfg.probability.breakout_min_limit_room_percent);
        cfg.probability.breakout_probability_floor = p.value("breakout_probability_floor", cfg.probability.breakout_probability_floor);
    }

    if (j.contains("regime")) {
        auto& r = j["regime"];
        cfg.regime.volatile_gap_stddev = r.value("volatile_gap_stddev", cfg.regime.volatile_gap_stddev);
        cfg.regime.volatile_heat_dispersion = r.value("volatile_heat_dispersion", cfg.regime.volatile_heat_dispersion);
        cfg.regime.panic_breadth_ratio = r.value("panic_breadth_ratio", cfg.regime.panic_breadth_ratio);
        cfg.regime.active_breadth_ratio = r.value("active_breadth_ratio", cfg.regime.active_breadth_ratio);
        cfg.regime.active_mean_gap_percent = r.value("active_mean_gap_percent", cfg.regime.active_mean_gap_percent);
        cfg.regime.active_limit_up_rate = r.value("active_limit_up_rate", cfg.regime.active_limit_up_rate);
    }

    if (j.contains("calibration")) {
        auto& c = j["calibration"];
        cfg.calibration.correlation_weight = c.value("correlation_weight", cfg.calibration.correlation_weight);
        cfg.calibration.lift_weight = c.value("lift_weight", cfg.calibration.lift_weight);
        cfg.calibration.lift_strong = c.value("lift_strong", cfg.calibration.lift_strong);
        cfg.calibration.weak_evidence = c.value("weak_evidence", cfg.calibration.weak_evidence);
        cfg.calibration.strong_evidence = c.value("strong_evidence", cfg.calibration.strong_evidence);
        cfg.calibration.calm_multiplier = c.value("calm_multiplier", cfg.calibration.calm_multiplier);
        cfg.calibration.active_multiplier = c.value("active_multiplier", cfg.calibration.active_multiplier);
        cfg.calibration.volatile_multiplier = c.value("volatile_multiplier", cfg.calibration.volatile_multiplier);
    }

    if (j.contains("filters")) {
        auto& f = j["filters"];
        cfg.filters.pe_max = f.value("pe_max", cfg.filters.pe_max);
        cfg.filters.low_gap_threshold_percent = f.value("low_gap_threshold_percent", cfg.filters.low_gap_threshold_percent);
        cfg.filters.exclude_special_treatment = f.value("exclude_special_treatment", cfg.filters.exclude_special_treatment);
    }
}

} // namespace auctionheat
