#include "harness/session_replay.hpp"
#include "config/bot_config.hpp"
#include "config/json_value.hpp"

#include <stdexcept>
#include <utility>

namespace qbot {

namespace {

// Levels are either [price, size] pairs or {"price": p, "size": s} objects
std::vector<BookLevel> parse_levels(const JsonValue* side) {
    std::vector<BookLevel> levels;
    if (!side) return levels;

    for (const auto& lvl : side->arr) {
        if (lvl.type == JsonValue::Array && lvl.arr.size() >= 2 &&
            lvl.arr[0].type == JsonValue::Number && lvl.arr[1].type == JsonValue::Number) {
            levels.push_back(BookLevel{lvl.arr[0].number,
                                       json_to_int64(lvl.arr[1].number, "session: level size")});
        } else if (lvl.type == JsonValue::Object) {
            levels.push_back(BookLevel{lvl.get_number("price"),
                                       json_to_int64(lvl.get_number("size"), "session: level size")});
        } else {
            throw std::runtime_error("session: malformed book level");
        }
    }
    return levels;
}

OrderSide parse_side(const std::string& dir) {
    if (dir == "Buy") return OrderSide::Buy;
    if (dir == "Sell") return OrderSide::Sell;
    throw std::runtime_error("session: unknown direction '" + dir + "'");
}

Trade parse_trade(const JsonValue& t) {
    return Trade{
        .ticker             = t.get_string("ticker"),
        .size               = json_to_int64(t.get_number("size"), "session: trade size"),
        .aggressor_bot      = t.get_string("agg_bot"),
        .aggressor_side     = parse_side(t.get_string("agg_dir")),
        .aggressor_order_id = json_to_uint64(t.get_number("agg_order_id"), "session: agg_order_id"),
        .resting_bot        = t.get_string("rest_bot"),
        .resting_order_id   = json_to_uint64(t.get_number("rest_order_id"), "session: rest_order_id"),
    };
}

} // anonymous namespace

std::vector<SessionTurn> parse_session(const std::string& json_text) {
    auto root = parse_json(json_text);
    auto* turns = root.get_array("turns");
    if (!turns) {
        throw std::runtime_error("session: missing 'turns' array");
    }

    std::vector<SessionTurn> result;
    result.reserve(turns->arr.size());

    for (const auto& turn : turns->arr) {
        SessionTurn st;
        if (auto* book = turn.get_object("book")) {
            for (const auto& [ticker, sides] : book->obj) {
                InstrumentBook ib;
                ib.bids = parse_levels(sides.get_array("bids"));
                ib.asks = parse_levels(sides.get_array("asks"));
                st.book[ticker] = std::move(ib);
            }
        }
        if (auto* trades = turn.get_array("trades")) {
            for (const auto& t : trades->arr) {
                st.trades.push_back(parse_trade(t));
            }
        }
        result.push_back(std::move(st));
    }

    return result;
}

std::vector<SessionTurn> load_session(const std::string& path) {
    auto text = read_text_file(path);
    try {
        return parse_session(text);
    } catch (const std::runtime_error& e) {
        throw std::runtime_error(path + ": " + e.what());
    }
}

SessionReplay::SessionReplay(MarketMakerBot& bot, std::shared_ptr<spdlog::logger> logger)
    : bot_(bot), logger_(std::move(logger)) {}

TurnResult SessionReplay::play_turn(const SessionTurn& turn) {
    TurnResult result;
    result.messages = bot_.refresh_quotes(turn.book);
    bot_.on_trades(turn.trades);

    result.positions   = bot_.ledger().positions();
    result.open_orders = bot_.ledger().open_order_count();
    return result;
}

std::vector<TurnResult> SessionReplay::run(const std::vector<SessionTurn>& turns) {
    std::vector<TurnResult> results;
    results.reserve(turns.size());

    for (const auto& turn : turns) {
        results.push_back(play_turn(turn));
        logger_->debug("replayed turn {} with {} trades", results.size(), turn.trades.size());
    }

    logger_->info("replayed {} turns, {} orders still open",
                  turns.size(), bot_.ledger().open_order_count());
    return results;
}

} // namespace qbot
