#pragma once

#include <cstdint>

namespace qbot {

struct QuotingParams {
    double  base_spread   = 1.0;     // total quoted width, price units
    double  skew_factor   = 0.5;     // price shift at a full position limit
    double  default_price = 1000.0;  // reference price for an empty book
    int64_t base_size     = 5;       // quote size before inventory reduction
};

} // namespace qbot
