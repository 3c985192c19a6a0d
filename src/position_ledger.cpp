#include "risk/position_ledger.hpp"

namespace qbot {

PositionLedger::PositionLedger(const std::vector<InstrumentConfig>& instruments) {
    for (const auto& inst : instruments) {
        positions_[inst.ticker] = 0;
    }
}

void PositionLedger::on_fill(const Ticker& ticker, int64_t qty) {
    positions_[ticker] += qty;
}

void PositionLedger::record_order(const RestingOrder& order) {
    open_orders_[order.id] = order;
}

bool PositionLedger::remove_order(OrderId id) {
    return open_orders_.erase(id) > 0;
}

std::vector<OrderId> PositionLedger::release_open_orders() {
    std::vector<OrderId> ids;
    ids.reserve(open_orders_.size());
    for (const auto& [id, _] : open_orders_) {
        ids.push_back(id);
    }
    open_orders_.clear();
    return ids;
}

int64_t PositionLedger::position(const Ticker& ticker) const {
    auto it = positions_.find(ticker);
    if (it != positions_.end()) {
        return it->second;
    }
    return 0;
}

} // namespace qbot
