#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include "trade_pilot/advisory/http_advisory_client.hpp"
#include "trade_pilot/core/engine_config.hpp"
#include "trade_pilot/core/logger.hpp"
#include "trade_pilot/core/state_manager.hpp"
#include "trade_pilot/data/binance_ticker_feed.hpp"
#include "trade_pilot/data/persistence_store.hpp"
#include "trade_pilot/engine/trading_engine.hpp"

using namespace trade_pilot;

namespace {

std::atomic<bool> g_stop_requested{false};

void handle_signal(int) {
    g_stop_requested = true;
}

void print_usage(const char* program) {
    std::cerr << "Usage: " << program
              << " [--config FILE] [--duration SECONDS] [--mode TRIAL|LIVE] [--autopilot]"
                 " [--offline]"
              << std::endl;
    std::cerr << "Example: " << program << " --config trade_pilot.json --duration 600 --autopilot"
              << std::endl;
}

}  // namespace

int main(int argc, char* argv[]) {
    try {
        std::string config_path;
        int duration_seconds = 0;  // 0 runs until interrupted
        bool enable_autopilot = false;
        bool offline = false;
        AccountMode mode = AccountMode::TRIAL;

        for (int i = 1; i < argc; i++) {
            std::string arg = argv[i];
            if (arg == "--config" && i + 1 < argc) {
                config_path = argv[++i];
            } else if (arg == "--duration" && i + 1 < argc) {
                duration_seconds = std::stoi(argv[++i]);
            } else if (arg == "--mode" && i + 1 < argc) {
                auto parsed = account_mode_from_string(argv[++i]);
                if (!parsed) {
                    std::cerr << "Invalid mode: " << argv[i] << std::endl;
                    print_usage(argv[0]);
                    return 1;
                }
                mode = *parsed;
            } else if (arg == "--autopilot") {
                enable_autopilot = true;
            } else if (arg == "--offline") {
                offline = true;
            } else {
                std::cerr << "Invalid argument: " << arg << std::endl;
                print_usage(argv[0]);
                return 1;
            }
        }

        EngineConfig config;
        if (!config_path.empty()) {
            auto loaded = config.load_from_file(config_path);
            if (loaded.is_error()) {
                std::cerr << "Failed to load config: " << loaded.error()->to_string()
                          << std::endl;
                return 1;
            }
        }

        Logger::instance().initialize(config.logging);
        Logger::register_component("APP");
        INFO("trade_pilot starting with " << config.assets.size() << " pairs");

        std::shared_ptr<MarketDataFeed> feed;
        std::shared_ptr<AdvisoryService> advisory;
        if (!offline) {
            feed = std::make_shared<BinanceTickerFeed>(config.feed);
            advisory = std::make_shared<HttpAdvisoryClient>(config.advisory);
        } else {
            INFO("Offline mode: synthetic prices and local advisory only");
        }
        auto store = std::make_shared<JsonFileStore>(config.state_file);

        TradingEngine engine(config, feed, advisory, store);
        auto init = engine.initialize();
        if (init.is_error()) {
            std::cerr << "Engine initialization failed: " << init.error()->to_string()
                      << std::endl;
            ERROR("Engine initialization failed: " << init.error()->to_string());
            return 1;
        }
        engine.set_mode(mode);
        engine.toggle_autopilot(enable_autopilot);

        std::signal(SIGINT, handle_signal);
        std::signal(SIGTERM, handle_signal);

        auto started = engine.start();
        if (started.is_error()) {
            std::cerr << "Engine start failed: " << started.error()->to_string() << std::endl;
            ERROR("Engine start failed: " << started.error()->to_string());
            return 1;
        }

        auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(duration_seconds);
        bool healthy = true;
        while (!g_stop_requested) {
            if (duration_seconds > 0 && std::chrono::steady_clock::now() >= deadline) {
                break;
            }
            bool now_healthy = StateManager::instance().is_healthy();
            if (now_healthy != healthy) {
                if (now_healthy) {
                    INFO("All components healthy again");
                } else {
                    WARN("A component left the RUNNING state");
                }
                healthy = now_healthy;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(200));
        }

        engine.stop();

        auto safety = engine.safety_state();
        INFO("Final balances TRIAL=" << engine.balance(AccountMode::TRIAL)
                                     << " LIVE=" << engine.balance(AccountMode::LIVE)
                                     << " cumulative_pnl=" << safety.cumulative_pnl);
        for (const auto& entry : engine.events()) {
            std::cout << "[" << event_kind_to_string(entry.kind) << "] " << entry.message
                      << std::endl;
        }
        return 0;

    } catch (const std::exception& e) {
        std::cerr << "Unexpected error: " << e.what() << std::endl;
        if (Logger::instance().is_initialized()) {
            ERROR("Unexpected error: " << e.what());
        }
        return 1;
    }
}
