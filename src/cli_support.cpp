#include "harness/cli_support.hpp"

#include <spdlog/fmt/fmt.h>

namespace qbot {

std::string format_message_csv(size_t turn, const Message& msg) {
    if (msg.kind == MessageKind::Remove) {
        return fmt::format("{},REMOVE,{}", turn, msg.order_id);
    }
    const auto& o = msg.order;
    return fmt::format("{},ORDER,{},{},{},{},{}",
                       turn, o.order_id, o.ticker, to_string(o.side), o.size, o.price);
}

std::optional<spdlog::level::level_enum> parse_log_level(const std::string& name) {
    auto lvl = spdlog::level::from_str(name);
    if (lvl == spdlog::level::off && name != "off") {
        return std::nullopt;
    }
    return lvl;
}

} // namespace qbot
