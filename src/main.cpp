#include "common/Config.h"
#include "common/Errors.h"
#include "common/Logger.h"
#include "core/state/JsonMarketDataStore.h"
#include "core/state/PeriodStatStoreJsonl.h"
#include "core/state/ResultJson.h"
#include "engine/HeatRankingEngine.h"
#include "engine/HitRateReport.h"
#include "engine/PeriodStatBuilder.h"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

using namespace auctionheat;

namespace {

void printUsage() {
    std::cout
        << "Usage:\n"
        << "  auctionheat rank --date YYYY-MM-DD [options]\n"
        << "      --limit N                 keep top N (0 = all)\n"
        << "      --alpha A                 requested theme alpha, 0..0.5\n"
        << "      --include-auction-limit-up\n"
        << "      --pe-filter\n"
        << "      --low-gap                 only gap < 5%\n"
        << "      --sort candidate_first|heat_desc\n"
        << "      --static-alpha            skip rolling calibration\n"
        << "      --window N                rolling window in trading days\n"
        << "      --save                    write <data>/results/<date>.json\n"
        << "      --json                    print JSON instead of a table\n"
        << "  auctionheat record --date YYYY-MM-DD\n"
        << "      score the full day and append its realized PeriodStat\n"
        << "  auctionheat report --from YYYY-MM-DD --to YYYY-MM-DD\n"
        << "      hit rate of saved selections against next-session closes\n"
        << "Common: --data-dir DIR --config PATH\n";
}

struct CliOptions {
    std::string command;
    std::string config_path = "config/config.json";
    std::string data_dir;
    std::string date;
    std::string from;
    std::string to;
    bool json_mode = false;
    bool save = false;
    // Overrides applied on top of config defaults
    std::vector<std::pair<std::string, std::string>> overrides;
};

int parseIntArg(const std::string& name, const std::string& value) {
    try {
        size_t used = 0;
        const int parsed = std::stoi(value, &used);
        if (used != value.size()) {
            throw InvalidParameterError(name, "not an integer: '" + value + "'");
        }
        return parsed;
    } catch (const std::logic_error&) {
        throw InvalidParameterError(name, "not an integer: '" + value + "'");
    }
}

double parseDoubleArg(const std::string& name, const std::string& value) {
    try {
        size_t used = 0;
        const double parsed = std::stod(value, &used);
        if (used != value.size()) {
            throw InvalidParameterError(name, "not a number: '" + value + "'");
        }
        return parsed;
    } catch (const std::logic_error&) {
        throw InvalidParameterError(name, "not a number: '" + value + "'");
    }
}

CliOptions parseArgs(int argc, char* argv[]) {
    CliOptions opts;
    if (argc > 1) {
        opts.command = argv[1];
    }
    for (int i = 2; i < argc; ++i) {
        const std::string arg = argv[i];
        auto next = [&](const std::string& flag) -> std::string {
            if (i + 1 >= argc) {
                throw InvalidParameterError(flag, "missing value");
            }
            return argv[++i];
        };

        if (arg == "--json") { opts.json_mode = true; continue; }
        if (arg == "--save") { opts.save = true; continue; }
        if (arg == "--config") { opts.config_path = next(arg); continue; }
        if (arg == "--data-dir") { opts.data_dir = next(arg); continue; }
        if (arg == "--date") { opts.date = next(arg); continue; }
        if (arg == "--from") { opts.from = next(arg); continue; }
        if (arg == "--to") { opts.to = next(arg); continue; }
        if (arg == "--include-auction-limit-up" || arg == "--pe-filter" ||
            arg == "--low-gap" || arg == "--static-alpha") {
            opts.overrides.emplace_back(arg, "");
            continue;
        }
        if (arg == "--limit" || arg == "--alpha" || arg == "--sort" || arg == "--window") {
            opts.overrides.emplace_back(arg, next(arg));
            continue;
        }
        throw InvalidParameterError(arg, "unknown option");
    }
    return opts;
}

engine::RankRequest buildRequest(const CliOptions& opts, const engine::EngineConfig& config) {
    auto request = engine::RankRequest::fromDefaults(config.defaults, opts.date);
    for (const auto& [flag, value] : opts.overrides) {
        if (flag == "--include-auction-limit-up") request.exclude_auction_limit_up = false;
        else if (flag == "--pe-filter") request.pe_filter_enabled = true;
        else if (flag == "--low-gap") request.low_gap_only = true;
        else if (flag == "--static-alpha") request.dynamic_alpha = false;
        else if (flag == "--limit") request.limit = parseIntArg("limit", value);
        else if (flag == "--alpha") request.theme_alpha = parseDoubleArg("theme_alpha", value);
        else if (flag == "--sort") request.sort_mode = engine::parseSortMode(value);
        else if (flag == "--window") request.rolling_window_days = parseIntArg("rolling_window_days", value);
    }
    return request;
}

void printTable(const RankedResultSet& result) {
    std::cout << "Trade date: " << result.trade_date
              << "  source: " << toString(result.data_source) << "\n";
    if (result.data_source == DataSource::NONE) {
        std::cout << "No auction snapshot collected for this date.\n";
        return;
    }

    std::cout << std::left
              << std::setw(6) << "rank"
              << std::setw(12) << "code"
              << std::setw(16) << "theme"
              << std::right
              << std::setw(8) << "gap%"
              << std::setw(8) << "vr"
              << std::setw(8) << "heat"
              << std::setw(8) << "xTheme"
              << std::setw(8) << "prob"
              << "  flags\n";
    for (const auto& c : result.items) {
        const auto& s = c.snapshot;
        std::cout << std::left
                  << std::setw(6) << c.rank
                  << std::setw(12) << s.ts_code
                  << std::setw(16) << s.theme
                  << std::right << std::fixed
                  << std::setw(8) << std::setprecision(2) << s.gap_percent
                  << std::setw(8) << std::setprecision(2) << s.volume_ratio
                  << std::setw(8) << std::setprecision(1) << c.heat_score
                  << std::setw(8) << std::setprecision(2) << c.theme_enhance_factor
                  << std::setw(8) << std::setprecision(2) << c.likely_limit_up_prob
                  << "  "
                  << (s.auction_limit_up ? "[auction-limit] " : "")
                  << (c.likely_limit_up ? "[candidate] " : "")
                  << (c.breakout_signal ? "[breakout]" : "")
                  << "\n";
    }

    const auto& sm = result.summary;
    std::cout << "\ncount=" << sm.count << "/" << sm.total_candidates
              << " candidates=" << sm.limit_up_candidates
              << " avg_heat=" << std::setprecision(1) << sm.avg_heat
              << " total_amount=" << std::setprecision(2) << sm.total_amount / 1e8 << "e8"
              << " regime=" << toString(sm.market_regime)
              << " alpha=" << std::setprecision(3) << sm.theme_alpha_input
              << "->" << sm.theme_alpha_effective
              << " history=" << sm.history_days_covered << "/" << sm.history_days_requested
              << " skipped=" << sm.skipped_rows << "\n";

    const auto& dg = result.diagnostics;
    std::cout << "vr " << std::setprecision(2) << dg.volume_ratio.min << ".." << dg.volume_ratio.max
              << " avg=" << dg.volume_ratio.avg << " below1=" << dg.volume_ratio.below_one_count
              << " | auction vr " << dg.auction_volume_ratio.min << ".." << dg.auction_volume_ratio.max
              << " avg=" << dg.auction_volume_ratio.avg << " above1=" << dg.auction_volume_ratio.at_least_one_count
              << " | pe in=" << dg.pe.in_range_count << " neg=" << dg.pe.negative_count
              << " zero=" << dg.pe.zero_count << " high=" << dg.pe.above_range_count
              << " missing=" << dg.pe.missing_count << "\n";
}

bool writeJsonFile(const std::filesystem::path& path, const nlohmann::json& body) {
    std::filesystem::create_directories(path.parent_path());
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out.is_open()) {
        return false;
    }
    out << body.dump(2);
    return true;
}

int runRank(const CliOptions& opts, const engine::EngineConfig& config,
            const std::filesystem::path& data_dir) {
    auto store = std::make_shared<core::JsonMarketDataStore>(data_dir);
    auto stats = std::make_shared<core::PeriodStatStoreJsonl>(data_dir / "period_stats.jsonl");
    engine::HeatRankingEngine ranking(config, store, store, stats);

    const auto request = buildRequest(opts, config);
    const auto result = ranking.rank(request);

    if (opts.save && result.data_source == DataSource::SNAPSHOT) {
        const auto path = data_dir / "results" / (result.trade_date + ".json");
        if (!writeJsonFile(path, core::toJson(result))) {
            LOG_ERROR("Failed to save result to {}", path.string());
            return 1;
        }
        LOG_INFO("Saved result to {}", path.string());
    }

    if (opts.json_mode) {
        std::cout << core::toJson(result).dump(2) << std::endl;
    } else {
        printTable(result);
    }
    return 0;
}

int runRecord(const CliOptions& opts, const engine::EngineConfig& config,
              const std::filesystem::path& data_dir) {
    auto store = std::make_shared<core::JsonMarketDataStore>(data_dir);
    auto stats = std::make_shared<core::PeriodStatStoreJsonl>(data_dir / "period_stats.jsonl");
    engine::HeatRankingEngine ranking(config, store, store, stats);

    // Whole population, heat order, no truncation
    auto request = engine::RankRequest::fromDefaults(config.defaults, opts.date);
    request.limit = 0;
    request.exclude_auction_limit_up = false;
    request.pe_filter_enabled = false;
    request.sort_mode = SortMode::HEAT_DESC;

    const auto result = ranking.rank(request);
    if (result.data_source == DataSource::NONE) {
        std::cerr << "No auction snapshot for " << opts.date << "\n";
        return 1;
    }

    const auto outcomes = store->getOutcomes(opts.date);
    if (!outcomes) {
        std::cerr << "No outcomes recorded for " << opts.date << " ("
                  << store->outcomePath(opts.date).string() << ")\n";
        return 1;
    }

    const PeriodStat stat = engine::PeriodStatBuilder::build(opts.date, result.items, *outcomes);
    if (!stats->append(stat)) {
        return 1;
    }
    LOG_INFO("Recorded period stat for {} ({} samples)", stat.trade_date, stat.sample_count);
    std::cout << core::toJson(stat).dump(2) << std::endl;
    return 0;
}

int runReport(const CliOptions& opts, const std::filesystem::path& data_dir) {
    if (!engine::isValidTradeDate(opts.from)) {
        throw InvalidParameterError("from", "expected YYYY-MM-DD");
    }
    if (!engine::isValidTradeDate(opts.to)) {
        throw InvalidParameterError("to", "expected YYYY-MM-DD");
    }

    core::JsonMarketDataStore store(data_dir);

    std::vector<std::string> result_dates;
    std::vector<std::string> outcome_dates;
    auto listDates = [](const std::filesystem::path& dir, std::vector<std::string>& out) {
        std::error_code ec;
        if (!std::filesystem::is_directory(dir, ec)) {
            return;
        }
        for (const auto& entry : std::filesystem::directory_iterator(dir, ec)) {
            if (entry.is_regular_file() && entry.path().extension() == ".json") {
                const std::string stem = entry.path().stem().string();
                if (engine::isValidTradeDate(stem)) {
                    out.push_back(stem);
                }
            }
        }
        std::sort(out.begin(), out.end());
    };
    listDates(data_dir / "results", result_dates);
    listDates(data_dir / "outcomes", outcome_dates);

    std::vector<engine::DailySelection> days;
    for (const auto& date : result_dates) {
        if (date < opts.from || date > opts.to) {
            continue;
        }
        // Next recorded session after the selection date
        const auto next = std::upper_bound(outcome_dates.begin(), outcome_dates.end(), date);
        if (next == outcome_dates.end()) {
            continue;
        }

        std::ifstream in(data_dir / "results" / (date + ".json"), std::ios::binary);
        if (!in.is_open()) {
            continue;
        }
        engine::DailySelection day;
        day.trade_date = date;
        try {
            nlohmann::json raw;
            in >> raw;
            for (const auto& row : raw.value("items", nlohmann::json::array())) {
                day.items.push_back(core::candidateFromJson(row));
            }
        } catch (const nlohmann::json::exception& e) {
            LOG_WARN("Skipping unreadable result {}: {}", date, e.what());
            continue;
        }
        if (auto outcomes = store.getOutcomes(*next)) {
            day.next_day_outcomes = std::move(*outcomes);
        }
        days.push_back(std::move(day));
    }

    const auto report = engine::HitRateReporter::build(days);
    std::cout << core::toJson(report).dump(2) << std::endl;
    return 0;
}

} // namespace

int main(int argc, char* argv[]) {
    try {
        const CliOptions opts = parseArgs(argc, argv);
        if (opts.command.empty() || opts.command == "--help" || opts.command == "help") {
            printUsage();
            return opts.command.empty() ? 1 : 0;
        }

        auto& config = Config::getInstance();
        config.load(opts.config_path);
        Logger::getInstance().initialize(config.getLogDir(), config.getLogLevel());

        auto engine_config = config.getEngineConfig();
        const std::filesystem::path data_dir = opts.data_dir.empty()
            ? std::filesystem::path(engine_config.data_dir)
            : std::filesystem::path(opts.data_dir);

        if (opts.command == "rank") {
            return runRank(opts, engine_config, data_dir);
        }
        if (opts.command == "record") {
            return runRecord(opts, engine_config, data_dir);
        }
        if (opts.command == "report") {
            return runReport(opts, data_dir);
        }

        std::cerr << "Unknown command: " << opts.command << "\n";
        printUsage();
        return 1;

    } catch (const InvalidParameterError& e) {
        std::cerr << "Invalid parameter " << e.what() << "\n";
        return 2;
    } catch (const std::exception& e) {
        LOG_ERROR("Fatal: {}", e.what());
        std::cerr << "Fatal: " << e.what() << "\n";
        return 1;
    }
}
