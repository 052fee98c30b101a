#pragma once

#include <stdexcept>
#include <string>

namespace auctionheat {

// Caller-supplied tunable out of contract. The only error the ranking
// engine surfaces; everything else is recovered locally.
class InvalidParameterError : public std::invalid_argument {
public:
    InvalidParameterError(const std::string& parameter, const std::string& message)
        : std::invalid_argument(parameter + ": " + message)
        , parameter_(parameter) {}

    const std::string& parameter() const { return parameter_; }

private:
    std::string parameter_;
};

} // namespace auctionheat
