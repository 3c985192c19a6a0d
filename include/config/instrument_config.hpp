#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace qbot {

using Ticker = std::string;

struct InstrumentConfig {
    Ticker                 ticker;
    std::optional<int64_t> position_limit;       // nullopt = unbounded
    double                 tick_size       = 1.0;
    bool                   quoting_enabled = true;

    // Limits of zero or below are treated as unbounded.
    std::optional<int64_t> effective_limit() const {
        if (position_limit && *position_limit > 0) return position_limit;
        return std::nullopt;
    }

    double effective_tick() const {
        return tick_size > 0.0 ? tick_size : 1.0;
    }
};

} // namespace qbot
