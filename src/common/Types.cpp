#include "common/Types.h"

namespace auctionheat {

const char* toString(DataSource source) {
    switch (source) {
        case DataSource::NONE: return "none";
        case DataSource::SNAPSHOT: return "snapshot";
    }
    return "none";
}

const char* toString(SortMode mode) {
    switch (mode) {
        case SortMode::CANDIDATE_FIRST: return "candidate_first";
        case SortMode::HEAT_DESC: return "heat_desc";
    }
    return "candidate_first";
}

const char* toString(MarketRegimeLabel label) {
    switch (label) {
        case MarketRegimeLabel::NEUTRAL: return "neutral";
        case MarketRegimeLabel::CALM: return "calm";
        case MarketRegimeLabel::ACTIVE: return "active";
        case MarketRegimeLabel::VOLATILE: return "volatile";
    }
    return "neutral";
}

} // namespace auctionheat
