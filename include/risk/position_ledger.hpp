#pragma once

#include "config/instrument_config.hpp"
#include "execution/order_messages.hpp"

#include <cstdint>
#include <map>
#include <unordered_map>
#include <vector>

namespace qbot {

struct RestingOrder {
    OrderId   id     = 0;
    Ticker    ticker;
    OrderSide side   = OrderSide::Buy;
    int64_t   size   = 0;
    double    price  = 0.0;
};

// Orders the bot currently has live at the exchange and its net position
// per instrument. Not synchronized; see MarketMakerBot.
class PositionLedger {
public:
    explicit PositionLedger(const std::vector<InstrumentConfig>& instruments);

    // Update position on fill. qty is signed: positive = bought, negative = sold.
    void on_fill(const Ticker& ticker, int64_t qty);

    void record_order(const RestingOrder& order);

    // Returns false if the id was not open.
    bool remove_order(OrderId id);

    // Empties the open set, returning the ids that were live in ascending order.
    std::vector<OrderId> release_open_orders();

    int64_t position(const Ticker& ticker) const;
    const std::unordered_map<Ticker, int64_t>& positions() const { return positions_; }

    bool has_open_order(OrderId id) const { return open_orders_.count(id) > 0; }
    size_t open_order_count() const { return open_orders_.size(); }
    const std::map<OrderId, RestingOrder>& open_orders() const { return open_orders_; }

private:
    std::unordered_map<Ticker, int64_t> positions_;
    std::map<OrderId, RestingOrder>     open_orders_;
};

} // namespace qbot
