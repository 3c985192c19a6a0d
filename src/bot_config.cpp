#include "config/bot_config.hpp"
#include "config/json_value.hpp"

#include <cmath>
#include <fstream>
#include <iterator>
#include <stdexcept>

namespace qbot {

namespace {

QuotingParams parse_params(const JsonValue* p) {
    QuotingParams params;
    if (!p) return params;

    params.base_spread   = p->get_number("base_spread", params.base_spread);
    params.skew_factor   = p->get_number("skew_factor", params.skew_factor);
    params.default_price = p->get_number("default_price", params.default_price);
    params.base_size     = json_to_int64(
        p->get_number("base_size", static_cast<double>(params.base_size)),
        "config: params.base_size");

    if (params.base_size < 1) {
        throw std::runtime_error("config: params.base_size must be at least 1");
    }
    return params;
}

InstrumentConfig parse_instrument(const JsonValue& inst) {
    InstrumentConfig ic;
    ic.ticker = inst.get_string("ticker");
    if (ic.ticker.empty()) {
        throw std::runtime_error("config: instrument without a ticker");
    }

    // Absent or null limit means unbounded
    if (const auto* limit = inst.find("position_limit"); limit && limit->type == JsonValue::Number) {
        ic.position_limit = json_to_int64(std::round(limit->number),
                                          "config: " + ic.ticker + ".position_limit");
    }

    ic.tick_size       = inst.get_number("tick_size", 1.0);
    ic.quoting_enabled = inst.get_bool("quoting_enabled", true);
    return ic;
}

} // anonymous namespace

BotConfig parse_bot_config(const std::string& json_text) {
    auto root = parse_json(json_text);
    if (root.type != JsonValue::Object) {
        throw std::runtime_error("config: top level must be an object");
    }

    BotConfig config;
    config.bot_name = root.get_string("bot_name", config.bot_name);
    config.start_order_id = json_to_uint64(
        root.get_number("start_order_id", static_cast<double>(config.start_order_id)),
        "config: start_order_id");
    config.params = parse_params(root.get_object("params"));

    auto* insts = root.get_array("instruments");
    if (!insts) {
        throw std::runtime_error("config: missing 'instruments' array");
    }
    for (const auto& inst : insts->arr) {
        config.instruments.push_back(parse_instrument(inst));
    }

    return config;
}

BotConfig load_bot_config(const std::string& path) {
    auto text = read_text_file(path);
    try {
        return parse_bot_config(text);
    } catch (const std::runtime_error& e) {
        throw std::runtime_error(path + ": " + e.what());
    }
}

std::string read_text_file(const std::string& path) {
    std::ifstream f(path);
    if (!f.is_open()) {
        throw std::runtime_error("cannot open " + path);
    }
    return std::string((std::istreambuf_iterator<char>(f)),
                        std::istreambuf_iterator<char>());
}

} // namespace qbot
