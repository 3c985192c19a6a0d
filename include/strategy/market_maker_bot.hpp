#pragma once

#include "config/bot_config.hpp"
#include "config/instrument_config.hpp"
#include "execution/order_messages.hpp"
#include "market/book_snapshot.hpp"
#include "risk/position_ledger.hpp"
#include "strategy/quote_engine.hpp"
#include "strategy/quoting_params.hpp"

#include <spdlog/spdlog.h>

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace qbot {

// Harness-facing market maker. Every turn it pulls all of its resting
// orders and re-quotes both sides of every instrument.
//
// Precondition: the harness calls set_next_order_id, refresh_quotes and
// on_trades strictly sequentially. The bot holds no lock; a concurrent
// caller must serialize access to the whole object.
class MarketMakerBot {
public:
    MarketMakerBot(std::vector<InstrumentConfig> instruments,
                   QuotingParams params,
                   std::string name = kDefaultBotName,
                   std::shared_ptr<spdlog::logger> logger = spdlog::default_logger());

    // Seeds the order id counter. Called once before the first turn.
    void set_next_order_id(OrderId id) { next_order_id_ = id; }

    // Cancels every open order, then places a buy and a sell per instrument.
    // Returns all cancels first, then new orders in instrument order.
    std::vector<Message> refresh_quotes(const BookSnapshot& book);

    // Applies settled trades to positions and drops filled orders.
    void on_trades(const std::vector<Trade>& trades);

    const std::string& name() const { return name_; }
    OrderId next_order_id() const { return next_order_id_; }
    uint64_t turns_processed() const { return turns_processed_; }

    int64_t position(const Ticker& ticker) const { return ledger_.position(ticker); }
    const PositionLedger& ledger() const { return ledger_; }
    const std::vector<InstrumentConfig>& instruments() const { return instruments_; }

private:
    Message place_order(const Ticker& ticker, OrderSide side, double price, int64_t size);
    void apply_trade(const Trade& trade);

    std::vector<InstrumentConfig> instruments_;
    QuoteEngine    engine_;
    PositionLedger ledger_;
    std::string    name_;
    std::shared_ptr<spdlog::logger> logger_;
    OrderId  next_order_id_   = 0;
    uint64_t turns_processed_ = 0;
};

} // namespace qbot
