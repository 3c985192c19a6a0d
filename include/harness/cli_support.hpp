#pragma once

#include "execution/order_messages.hpp"

#include <spdlog/spdlog.h>

#include <optional>
#include <string>

namespace qbot {

// One CSV row of the CLI output:
//   turn,REMOVE,order_id
//   turn,ORDER,order_id,ticker,side,size,price
// Prices are printed in shortest round-trip form.
std::string format_message_csv(size_t turn, const Message& msg);

// Like spdlog::level::from_str, but an unrecognised name yields nullopt
// instead of silently turning logging off.
std::optional<spdlog::level::level_enum> parse_log_level(const std::string& name);

} // namespace qbot
