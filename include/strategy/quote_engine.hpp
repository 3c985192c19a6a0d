#pragma once

#include "config/instrument_config.hpp"
#include "market/book_snapshot.hpp"
#include "strategy/quoting_params.hpp"

#include <cstdint>
#include <optional>

namespace qbot {

struct Quote {
    Ticker  ticker;
    double  bid_price = 0.0;
    double  ask_price = 0.0;
    int64_t size      = 0;
};

// Stateless two-sided quoting around the top of book. Prices are skewed
// against inventory and sizes shrink as the position nears its limit.
class QuoteEngine {
public:
    explicit QuoteEngine(QuotingParams params);

    // Returns nullopt only for instruments configured not to quote.
    std::optional<Quote> compute_quote(const InstrumentConfig& instrument,
                                       const InstrumentBook& book,
                                       int64_t position) const;

    double reference_price(const InstrumentBook& book) const;
    double compute_skew(const InstrumentConfig& instrument, int64_t position) const;
    int64_t compute_size(const InstrumentConfig& instrument, int64_t position) const;

    // Nearest multiple of tick, halves rounded up.
    static double align_to_tick(double price, double tick);

    const QuotingParams& params() const { return params_; }

private:
    QuotingParams params_;
};

} // namespace qbot
