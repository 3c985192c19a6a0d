#pragma once

#include "config/instrument_config.hpp"
#include "execution/order_messages.hpp"
#include "strategy/quoting_params.hpp"

#include <string>
#include <vector>

namespace qbot {

inline constexpr const char* kDefaultBotName = "MarketMakerBot";

struct BotConfig {
    std::string                   bot_name       = kDefaultBotName;
    OrderId                       start_order_id = 1;
    QuotingParams                 params;
    std::vector<InstrumentConfig> instruments;
};

// Both throw std::runtime_error on unreadable input or missing fields.
BotConfig parse_bot_config(const std::string& json_text);
BotConfig load_bot_config(const std::string& path);

// Whole file as a string; throws std::runtime_error if it cannot be opened.
std::string read_text_file(const std::string& path);

} // namespace qbot
