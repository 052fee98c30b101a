#include "core/state/JsonMarketDataStore.h"
#include "core/state/ResultJson.h"
#include "common/Logger.h"

#include <fstream>

namespace auctionheat {
namespace core {

namespace {
std::optional<nlohmann::json> readJsonFile(const std::filesystem::path& path) {
    if (!std::filesystem::exists(path)) {
        return std::nullopt;
    }
    std::ifstream in(path, std::ios::binary);
    if (!in.is_open()) {
        LOG_ERROR("Cannot open {}", path.string());
        return std::nullopt;
    }
    try {
        nlohmann::json raw;
        in >> raw;
        return raw;
    } catch (const nlohmann::json::exception& e) {
        LOG_ERROR("Malformed JSON in {}: {}", path.string(), e.what());
        return std::nullopt;
    }
}
}

JsonMarketDataStore::JsonMarketDataStore(std::filesystem::path root)
    : root_(std::move(root)) {}

SnapshotBatch JsonMarketDataStore::getSnapshots(const std::string& trade_date) {
    SnapshotBatch batch;
    const auto raw = readJsonFile(snapshotPath(trade_date));
    if (!raw) {
        return batch;
    }

    const nlohmann::json* rows = nullptr;
    if (raw->is_array()) {
        rows = &(*raw);
    } else if (raw->is_object() && raw->contains("rows") && (*raw)["rows"].is_array()) {
        rows = &(*raw)["rows"];
    } else {
        LOG_ERROR("Unexpected snapshot layout for {}", trade_date);
        return batch;
    }

    batch.collected = true;
    batch.rows.reserve(rows->size());
    for (const auto& row : *rows) {
        if (!row.is_object()) {
            continue;
        }
        batch.rows.push_back(snapshotFromJson(row));
    }
    return batch;
}

ThemeProfile JsonMarketDataStore::getThemeHotness(const std::string& trade_date) {
    ThemeProfile profile;
    profile.trade_date = trade_date;

    const auto raw = readJsonFile(themePath(trade_date));
    if (!raw || !raw->is_object()) {
        return profile;
    }

    const nlohmann::json& table = (raw->contains("hotness") && (*raw)["hotness"].is_object())
        ? (*raw)["hotness"]
        : *raw;
    for (auto it = table.begin(); it != table.end(); ++it) {
        if (it.value().is_number()) {
            profile.hotness[it.key()] = it.value().get<double>();
        }
    }
    return profile;
}

std::optional<std::vector<engine::DailyOutcome>> JsonMarketDataStore::getOutcomes(const std::string& trade_date) {
    const auto raw = readJsonFile(outcomePath(trade_date));
    if (!raw || !raw->is_array()) {
        return std::nullopt;
    }

    std::vector<engine::DailyOutcome> out;
    out.reserve(raw->size());
    for (const auto& row : *raw) {
        if (row.is_object()) {
            out.push_back(outcomeFromJson(row));
        }
    }
    return out;
}

std::filesystem::path JsonMarketDataStore::snapshotPath(const std::string& trade_date) const {
    return root_ / "auction" / (trade_date + ".json");
}

std::filesystem::path JsonMarketDataStore::themePath(const std::string& trade_date) const {
    return root_ / "themes" / (trade_date + ".json");
}

std::filesystem::path JsonMarketDataStore::outcomePath(const std::string& trade_date) const {
    return root_ / "outcomes" / (trade_date + ".json");
}

} // namespace core
} // namespace auctionheat
