#include "strategy/quote_engine.hpp"

#include <algorithm>
#include <cmath>
#include <cstdlib>

namespace qbot {

QuoteEngine::QuoteEngine(QuotingParams params)
    : params_(params) {}

std::optional<Quote> QuoteEngine::compute_quote(const InstrumentConfig& instrument,
                                                const InstrumentBook& book,
                                                int64_t position) const {
    if (!instrument.quoting_enabled) {
        return std::nullopt;
    }

    double mid  = reference_price(book);
    double skew = compute_skew(instrument, position);

    double half_spread = params_.base_spread / 2.0;
    double bid_price = mid - half_spread - skew;
    double ask_price = mid + half_spread - skew;

    double tick = instrument.effective_tick();

    return Quote{
        .ticker    = instrument.ticker,
        .bid_price = align_to_tick(bid_price, tick),
        .ask_price = align_to_tick(ask_price, tick),
        .size      = compute_size(instrument, position),
    };
}

double QuoteEngine::reference_price(const InstrumentBook& book) const {
    auto bid = book.best_bid();
    auto ask = book.best_ask();

    if (bid && ask) return (*bid + *ask) / 2.0;
    if (bid) return *bid;
    if (ask) return *ask;
    return params_.default_price;
}

double QuoteEngine::compute_skew(const InstrumentConfig& instrument,
                                 int64_t position) const {
    auto limit = instrument.effective_limit();
    if (!limit) return 0.0;

    // Normalized inventory: q / Q_max. Positive skew lowers both sides.
    double q_tilde = static_cast<double>(position) / static_cast<double>(*limit);
    return q_tilde * params_.skew_factor;
}

int64_t QuoteEngine::compute_size(const InstrumentConfig& instrument,
                                  int64_t position) const {
    int64_t size = params_.base_size;

    auto limit = instrument.effective_limit();
    if (!limit) return size;

    // |pos| > 0.8 * limit and |pos| > 0.9 * limit, kept in integers
    int64_t abs_pos = std::abs(position);
    if (10 * abs_pos > 8 * *limit) {
        size = std::max<int64_t>(1, params_.base_size / 2);
    }
    if (10 * abs_pos > 9 * *limit) {
        size = 1;
    }
    return size;
}

double QuoteEngine::align_to_tick(double price, double tick) {
    if (tick <= 0.0) return price;
    return std::floor(price / tick + 0.5) * tick;
}

} // namespace qbot
