#include "strategy/market_maker_bot.hpp"

#include <utility>

namespace qbot {

MarketMakerBot::MarketMakerBot(std::vector<InstrumentConfig> instruments,
                               QuotingParams params,
                               std::string name,
                               std::shared_ptr<spdlog::logger> logger)
    : instruments_(std::move(instruments)),
      engine_(params),
      ledger_(instruments_),
      name_(std::move(name)),
      logger_(std::move(logger)) {}

std::vector<Message> MarketMakerBot::refresh_quotes(const BookSnapshot& book) {
    std::vector<Message> messages;

    // Pull everything we have resting before quoting again
    for (OrderId id : ledger_.release_open_orders()) {
        logger_->debug("{} cancel order_id={}", name_, id);
        messages.push_back(Message::make_remove(id));
    }
    size_t cancels = messages.size();

    static const InstrumentBook kEmptyBook{};

    for (const auto& inst : instruments_) {
        auto book_it = book.find(inst.ticker);
        const auto& inst_book = (book_it != book.end()) ? book_it->second : kEmptyBook;

        int64_t pos = ledger_.position(inst.ticker);
        auto quote = engine_.compute_quote(inst, inst_book, pos);
        if (!quote) {
            logger_->debug("{} quoting disabled for {}", name_, inst.ticker);
            continue;
        }

        messages.push_back(place_order(inst.ticker, OrderSide::Buy, quote->bid_price, quote->size));
        messages.push_back(place_order(inst.ticker, OrderSide::Sell, quote->ask_price, quote->size));
    }

    ++turns_processed_;
    logger_->info("{} turn {}: {} cancels, {} orders, {} open",
                  name_, turns_processed_, cancels, messages.size() - cancels,
                  ledger_.open_order_count());
    return messages;
}

Message MarketMakerBot::place_order(const Ticker& ticker, OrderSide side,
                                    double price, int64_t size) {
    OrderId id = next_order_id_++;

    ledger_.record_order(RestingOrder{
        .id     = id,
        .ticker = ticker,
        .side   = side,
        .size   = size,
        .price  = price,
    });

    logger_->debug("{} order order_id={} {} {} {}@{}",
                   name_, id, ticker, to_string(side), size, price);

    return Message::make_order(OrderMessage{
        .ticker   = ticker,
        .price    = price,
        .size     = size,
        .order_id = id,
        .side     = side,
        .bot_name = name_,
    });
}

void MarketMakerBot::on_trades(const std::vector<Trade>& trades) {
    for (const auto& trade : trades) {
        apply_trade(trade);
    }
}

void MarketMakerBot::apply_trade(const Trade& trade) {
    // A self-trade matches both branches and is applied twice
    if (trade.aggressor_bot == name_) {
        int64_t qty = (trade.aggressor_side == OrderSide::Buy) ? trade.size : -trade.size;
        ledger_.on_fill(trade.ticker, qty);
        if (!ledger_.remove_order(trade.aggressor_order_id)) {
            logger_->debug("{} order_id={} no longer open", name_, trade.aggressor_order_id);
        }
        logger_->debug("{} aggressor fill {} qty={} order_id={} position={}",
                       name_, trade.ticker, qty, trade.aggressor_order_id,
                       ledger_.position(trade.ticker));
    }

    if (trade.resting_bot == name_) {
        // The resting side trades opposite to the aggressor
        int64_t qty = (trade.aggressor_side == OrderSide::Buy) ? -trade.size : trade.size;
        ledger_.on_fill(trade.ticker, qty);
        if (!ledger_.remove_order(trade.resting_order_id)) {
            logger_->debug("{} order_id={} no longer open", name_, trade.resting_order_id);
        }
        logger_->debug("{} resting fill {} qty={} order_id={} position={}",
                       name_, trade.ticker, qty, trade.resting_order_id,
                       ledger_.position(trade.ticker));
    }
}

} // namespace qbot
