#pragma once

#include <string>

#include "common/Types.h"

namespace auctionheat {
namespace core {

class IThemeProfileSource {
public:
    virtual ~IThemeProfileSource() = default;

    // Empty profile when nothing is known for the date
    virtual ThemeProfile getThemeHotness(const std::string& trade_date) = 0;
};

} // namespace core
} // namespace auctionheat
