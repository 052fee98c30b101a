#include "core/state/JsonMarketDataStore.h"
#include "core/state/ResultJson.h"

#include <cmath>
#include <filesystem>
#include <fstream>
#include <iostream>

using namespace auctionheat;

namespace {
void writeFile(const std::filesystem::path& path, const std::string& body) {
    std::filesystem::create_directories(path.parent_path());
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    out << body;
}
}

int main() {
    std::cout << "[TEST] Starting MarketDataStore Test..." << std::endl;

    const auto root = std::filesystem::temp_directory_path() / "auctionheat_store_test";
    std::error_code ec;
    std::filesystem::remove_all(root, ec);

    core::JsonMarketDataStore store(root);

    // 1. Nothing collected yet
    if (store.getSnapshots("2024-03-01").collected || store.getOutcomes("2024-03-01").has_value() ||
        !store.getThemeHotness("2024-03-01").hotness.empty()) {
        std::cerr << "[TEST] empty root should report nothing collected\n";
        return 1;
    }

    // 2. Array layout with aliases, string numbers and derived limit-up flag
    writeFile(store.snapshotPath("2024-03-01"), R"([
        {"ts_code": "000001.SZ", "name": "Sample", "theme": "chip", "price": 11.0, "pre_close": 10.0,
         "volume_ratio": "3.5", "turnover_rate": 4.0, "amount": 1.5e8,
         "pe_ttm": 18.5, "vol": 300, "avg_auction_vol": 150},
        {"stock": "300001.SZ", "name": "Growth", "theme_name": "AI", "price": 11.0, "pre_close": 10.0,
         "auction_limit_up": false, "pe": null, "auction_volume_ratio": "0.7"},
        "not a row"
    ])");
    const auto batch = store.getSnapshots("2024-03-01");
    if (!batch.collected || batch.rows.size() != 2) {
        std::cerr << "[TEST] expected 2 rows\n";
        return 1;
    }
    const auto& first = batch.rows[0];
    if (!first.auction_limit_up || first.volume_ratio != 3.5 || !std::isnan(first.gap_percent)) {
        std::cerr << "[TEST] first row decode failed\n";
        return 1;
    }
    if (first.pe_ttm != 18.5 || first.auction_volume_ratio != 2.0) {
        std::cerr << "[TEST] pe_ttm / derived auction volume ratio decode failed\n";
        return 1;
    }
    const auto& second = batch.rows[1];
    if (second.auction_volume_ratio != 0.7 || !std::isnan(second.pe_ttm)) {
        std::cerr << "[TEST] explicit auction volume ratio decode failed\n";
        return 1;
    }
    if (second.ts_code != "300001.SZ" || second.theme != "AI" || second.auction_limit_up || !std::isnan(second.pe)) {
        std::cerr << "[TEST] alias decode failed\n";
        return 1;
    }

    // 3. Object layout, collected but empty
    writeFile(store.snapshotPath("2024-03-04"), R"({"rows": []})");
    const auto empty = store.getSnapshots("2024-03-04");
    if (!empty.collected || !empty.rows.empty()) {
        std::cerr << "[TEST] empty rows should still count as collected\n";
        return 1;
    }

    // 4. Malformed file is treated as not collected
    writeFile(store.snapshotPath("2024-03-05"), "{oops");
    if (store.getSnapshots("2024-03-05").collected) {
        std::cerr << "[TEST] malformed snapshot file should not count as collected\n";
        return 1;
    }

    // 5. Themes in both layouts
    writeFile(store.themePath("2024-03-01"), R"({"chip": 1.4, "AI": 1.8, "note": "x"})");
    writeFile(store.themePath("2024-03-04"), R"({"hotness": {"power": 1.2}})");
    const auto themes = store.getThemeHotness("2024-03-01");
    if (themes.hotness.size() != 2 || themes.hotness.at("chip") != 1.4 || themes.trade_date != "2024-03-01") {
        std::cerr << "[TEST] flat theme table decode failed\n";
        return 1;
    }
    if (store.getThemeHotness("2024-03-04").hotness.at("power") != 1.2) {
        std::cerr << "[TEST] nested theme table decode failed\n";
        return 1;
    }

    // 6. Outcomes
    writeFile(store.outcomePath("2024-03-01"), R"([{"ts_code": "000001.SZ", "name": "Sample", "change_percent": 10.01}])");
    const auto outcomes = store.getOutcomes("2024-03-01");
    if (!outcomes || outcomes->size() != 1 || outcomes->front().change_percent != 10.01) {
        std::cerr << "[TEST] outcome decode failed\n";
        return 1;
    }

    // 7. Result rows read back as candidates; NaN written as null
    CandidateResult c;
    c.snapshot = first;
    c.rank = 4;
    c.heat_score = 72.5;
    c.likely_limit_up = true;
    const auto row = core::toJson(c);
    if (!row["gap_percent"].is_null() || row["rank"] != 4) {
        std::cerr << "[TEST] candidate encode failed\n";
        return 1;
    }
    const auto back = core::candidateFromJson(row);
    if (row["pe_ttm"] != 18.5 || row["auction_volume_ratio"] != 2.0) {
        std::cerr << "[TEST] pe_ttm / auction volume ratio encode failed\n";
        return 1;
    }
    if (back.snapshot.auction_volume_ratio != 2.0 || back.rank != 4 || back.heat_score != 72.5 || !back.likely_limit_up || !back.snapshot.auction_limit_up) {
        std::cerr << "[TEST] candidate decode failed\n";
        return 1;
    }

    std::filesystem::remove_all(root, ec);
    std::cout << "[TEST] MarketDataStore Test PASSED!" << std::endl;
    return 0;
}
