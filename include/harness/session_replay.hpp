#pragma once

#include "execution/order_messages.hpp"
#include "market/book_snapshot.hpp"
#include "strategy/market_maker_bot.hpp"

#include <spdlog/spdlog.h>

#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

namespace qbot {

// One recorded exchange turn: the book the bot was shown and the trades
// settled afterwards.
struct SessionTurn {
    BookSnapshot       book;
    std::vector<Trade> trades;
};

struct TurnResult {
    std::vector<Message>                messages;
    std::unordered_map<Ticker, int64_t> positions;   // after trades settled
    size_t                              open_orders = 0;
};

// Session file: {"turns": [{"book": {...}, "trades": [...]}, ...]}
// Throws std::runtime_error on malformed input.
std::vector<SessionTurn> parse_session(const std::string& json_text);
std::vector<SessionTurn> load_session(const std::string& path);

// Stands in for the exchange harness: feeds each recorded turn to the bot
// in harness order. No matching is done; trades are taken as recorded.
class SessionReplay {
public:
    explicit SessionReplay(MarketMakerBot& bot,
                           std::shared_ptr<spdlog::logger> logger = spdlog::default_logger());

    TurnResult play_turn(const SessionTurn& turn);
    std::vector<TurnResult> run(const std::vector<SessionTurn>& turns);

private:
    MarketMakerBot& bot_;
    std::shared_ptr<spdlog::logger> logger_;
};

} // namespace qbot
