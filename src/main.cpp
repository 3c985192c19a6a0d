#include "config/bot_config.hpp"
#include "harness/cli_support.hpp"
#include "harness/session_replay.hpp"
#include "strategy/market_maker_bot.hpp"

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <iostream>
#include <stdexcept>
#include <string>

namespace {

void print_usage(const char* argv0) {
    std::cout << "Usage: " << argv0 << " [options]\n"
              << "  --config <path>     Bot config (default: data/config.json)\n"
              << "  --session <path>    Recorded harness turns to replay (required)\n"
              << "  --log-level <lvl>   trace|debug|info|warn|error (default: info)\n"
              << "  --help              Show this help\n";
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    std::string config_path = "data/config.json";
    std::string session_path;
    std::string log_level = "info";

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--config" && i + 1 < argc) {
            config_path = argv[++i];
        } else if (arg == "--session" && i + 1 < argc) {
            session_path = argv[++i];
        } else if (arg == "--log-level" && i + 1 < argc) {
            log_level = argv[++i];
        } else if (arg == "--help") {
            print_usage(argv[0]);
            return 0;
        } else {
            std::cerr << "Unknown argument: " << arg << "\n";
            print_usage(argv[0]);
            return 1;
        }
    }

    if (session_path.empty()) {
        print_usage(argv[0]);
        return 1;
    }

    auto level = qbot::parse_log_level(log_level);
    if (!level) {
        std::cerr << "Unknown log level: " << log_level << "\n";
        print_usage(argv[0]);
        return 1;
    }

    // Logs go to stderr so stdout carries only the emitted messages
    auto logger = spdlog::stderr_color_mt("quotebot");
    logger->set_level(*level);
    spdlog::set_default_logger(logger);

    try {
        logger->info("loading config from {}", config_path);
        auto config = qbot::load_bot_config(config_path);
        auto turns = qbot::load_session(session_path);

        qbot::MarketMakerBot bot(config.instruments, config.params, config.bot_name, logger);
        bot.set_next_order_id(config.start_order_id);

        logger->info("{} quoting {} instruments over {} turns",
                     bot.name(), config.instruments.size(), turns.size());

        qbot::SessionReplay replay(bot, logger);
        auto results = replay.run(turns);

        std::cout << "turn,kind,order_id,ticker,side,size,price\n";
        for (size_t t = 0; t < results.size(); ++t) {
            for (const auto& msg : results[t].messages) {
                std::cout << qbot::format_message_csv(t + 1, msg) << "\n";
            }
        }

        for (const auto& inst : bot.instruments()) {
            logger->info("final position {} = {}", inst.ticker, bot.position(inst.ticker));
        }
    } catch (const std::runtime_error& e) {
        logger->error("{}", e.what());
        return 1;
    }

    return 0;
}
