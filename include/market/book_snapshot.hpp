#pragma once

#include "config/instrument_config.hpp"

#include <cstdint>
#include <optional>
#include <unordered_map>
#include <vector>

namespace qbot {

struct BookLevel {
    double  price = 0.0;
    int64_t size  = 0;
};

// Resting liquidity for one instrument, best price first on each side.
struct InstrumentBook {
    std::vector<BookLevel> bids;
    std::vector<BookLevel> asks;

    std::optional<double> best_bid() const {
        if (bids.empty()) return std::nullopt;
        return bids.front().price;
    }

    std::optional<double> best_ask() const {
        if (asks.empty()) return std::nullopt;
        return asks.front().price;
    }
};

using BookSnapshot = std::unordered_map<Ticker, InstrumentBook>;

} // namespace qbot
