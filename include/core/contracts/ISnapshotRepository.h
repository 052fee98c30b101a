#pragma once

#include <string>
#include <vector>

#include "common/Types.h"

namespace auctionheat {
namespace core {

struct SnapshotBatch {
    bool collected = false;             // collection has run for the date
    std::vector<AuctionSnapshot> rows;
};

class ISnapshotRepository {
public:
    virtual ~ISnapshotRepository() = default;

    virtual SnapshotBatch getSnapshots(const std::string& trade_date) = 0;
};

} // namespace core
} // namespace auctionheat
