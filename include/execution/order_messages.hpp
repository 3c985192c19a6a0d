#pragma once

#include "config/instrument_config.hpp"

#include <cstdint>
#include <string>
#include <string_view>
#include <utility>

namespace qbot {

using OrderId = uint64_t;

enum class OrderSide { Buy, Sell };

inline std::string_view to_string(OrderSide side) {
    return side == OrderSide::Buy ? "Buy" : "Sell";
}

struct OrderMessage {
    Ticker      ticker;
    double      price    = 0.0;
    int64_t     size     = 0;
    OrderId     order_id = 0;
    OrderSide   side     = OrderSide::Buy;
    std::string bot_name;
};

enum class MessageKind { Order, Remove };

// One instruction for the exchange. For Remove only order_id is meaningful.
struct Message {
    MessageKind  kind     = MessageKind::Order;
    OrderMessage order;
    OrderId      order_id = 0;

    static Message make_order(OrderMessage order) {
        OrderId id = order.order_id;
        return Message{.kind = MessageKind::Order, .order = std::move(order), .order_id = id};
    }

    static Message make_remove(OrderId id) {
        return Message{.kind = MessageKind::Remove, .order = {}, .order_id = id};
    }
};

// A settled execution as reported by the exchange after matching.
struct Trade {
    Ticker      ticker;
    int64_t     size               = 0;
    std::string aggressor_bot;
    OrderSide   aggressor_side     = OrderSide::Buy;
    OrderId     aggressor_order_id = 0;
    std::string resting_bot;
    OrderId     resting_order_id   = 0;
};

} // namespace qbot
