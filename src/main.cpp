#include <atomic>
#include <chrono>
#include <csignal>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <memory>
#include <thread>

#include <CLI/CLI.hpp>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include "config/config.hpp"
#include "core/arbitrage_engine.hpp"
#include "arbitrage/opportunity.hpp"
#include "market/outcome_pair.hpp"
#include "persistence/ledger_store.hpp"
#include "venue/kalshi_client.hpp"
#include "venue/polymarket_client.hpp"
#include "venue/simulated_venue_client.hpp"

using namespace crossarb;

std::atomic<bool> g_shutdown{false};

void signal_handler(int signal) {
    (void)signal;
    g_shutdown = true;
}

void setup_logging(const LoggingConfig& config) {
    std::vector<spdlog::sink_ptr> sinks;

    if (config.log_to_console) {
        auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
        console_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");
        sinks.push_back(console_sink);
    }

    if (config.log_to_file) {
        std::filesystem::create_directories(config.log_dir);
        auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            config.log_dir + "/crossarb.log",
            static_cast<size_t>(config.max_log_file_size_mb) * 1024 * 1024,
            static_cast<size_t>(config.max_log_files)
        );
        file_sink->set_pattern(R"({"time":"%Y-%m-%dT%H:%M:%S.%e","level":"%l","msg":"%v"})");
        sinks.push_back(file_sink);
    }

    auto logger = std::make_shared<spdlog::logger>("crossarb", sinks.begin(), sinks.end());

    if (config.log_level == "debug") {
        logger->set_level(spdlog::level::debug);
    } else if (config.log_level == "warn") {
        logger->set_level(spdlog::level::warn);
    } else if (config.log_level == "error") {
        logger->set_level(spdlog::level::err);
    } else {
        logger->set_level(spdlog::level::info);
    }

    spdlog::set_default_logger(logger);
}

void build_venues(const Config& config, const std::string& resolutions_path, VenueRegistry& venues) {
    if (config.mode == TradingMode::SIMULATED) {
        for (Venue v : {Venue::POLYMARKET, Venue::KALSHI}) {
            auto client = std::make_shared<SimulatedVenueClient>(v);
            if (!resolutions_path.empty()) {
                size_t n = client->load_resolutions(resolutions_path);
                spdlog::info("{}: loaded {} simulated resolutions", venue_to_string(v), n);
            }
            venues.add(client);
        }
        return;
    }

    PolymarketClient::Config poly_config;
    poly_config.clob_url = config.venues.polymarket_clob_url;
    poly_config.chain_id = config.venues.polymarket_chain_id;
    poly_config.timeout_ms = config.execution.leg_timeout_ms;
    auto poly = std::make_shared<PolymarketClient>(poly_config, PolymarketClient::Credentials::from_environment());

    KalshiClient::Config kalshi_config;
    kalshi_config.api_url = config.venues.kalshi_api_url;
    kalshi_config.timeout_ms = config.execution.leg_timeout_ms;
    auto kalshi = std::make_shared<KalshiClient>(kalshi_config, KalshiClient::Credentials::from_environment());

    if (!poly->is_ready()) {
        spdlog::warn("Polymarket credentials incomplete, orders on Polymarket will fail");
    }
    if (!kalshi->is_ready()) {
        spdlog::warn("Kalshi credentials incomplete, orders on Kalshi will fail");
    }

    venues.add(poly);
    venues.add(kalshi);
}

void print_summary(const LedgerSummary& s) {
    std::cout << "\n";
    std::cout << "┌──────────────────────────────────────────────────────────────┐\n";
    std::cout << "│ LEDGER                                                       │\n";
    std::cout << "├──────────────────────────────────────────────────────────────┤\n";
    std::cout << std::fixed << std::setprecision(2);
    std::cout << "│ Balance:          $" << s.balance << " (start $" << s.initial_balance << ")\n";
    std::cout << "│ Realized profit:  $" << s.total_realized_profit << "\n";
    std::cout << "│ Pending profit:   $" << s.pending_expected_profit << "\n";
    std::cout << "│ Trades:           " << s.trade_count << " (" << s.pending_count << " pending)\n";
    std::cout << "│ Today:            " << s.daily_trades << " trades, $" << s.daily_loss << " loss\n";
    std::cout << "└──────────────────────────────────────────────────────────────┘\n";

    for (const auto& t : s.trades) {
        std::cout << "  " << std::left << std::setw(14) << t.id
                  << std::setw(11) << trade_status_to_string(t.status)
                  << std::setw(8) << quality_to_string(t.arb_type)
                  << std::right << std::setw(9) << t.quantity << " units  cost $"
                  << t.cost_usd << "  profit $"
                  << (t.is_open() ? t.expected_profit : t.realized_profit) << "\n";
    }
    std::cout << std::endl;
}

void run_feed(ArbitrageEngine& engine, const std::string& feed_path) {
    auto pairs = load_outcome_pairs(feed_path);
    auto results = engine.evaluate_all(pairs, wall_now());

    for (const auto& r : results) {
        if (r.placed()) {
            spdlog::info("{}: placed {:.2f} units, roi={:.2f}%", r.pair_id,
                         r.trade->quantity, r.trade->roi_percent);
        } else if (r.stage != EvaluationStage::DETECTION) {
            spdlog::info("{}: stopped at {} ({}): {}", r.pair_id,
                         evaluation_stage_to_string(r.stage), error_kind_to_string(r.error), r.reason);
        }
    }
}

int main(int argc, char* argv[]) {
    CLI::App app{"crossarb - Cross-venue prediction market arbitrage engine"};

    std::string config_path = "configs/crossarb.json";
    std::string mode_arg;
    std::string feed_path;
    std::string resolutions_path;
    bool settle = false;
    bool status = false;
    bool reset = false;
    bool loop = false;
    int interval_secs = 60;
    bool show_version = false;

    app.add_option("-c,--config", config_path, "Path to configuration file");
    app.add_option("--mode", mode_arg, "Trading mode: simulated or live")
        ->check(CLI::IsMember({"simulated", "live"}));
    app.add_option("-f,--feed", feed_path, "Outcome pair feed (JSON array)")
        ->check(CLI::ExistingFile);
    app.add_option("-r,--resolutions", resolutions_path, "Simulated settlement table (JSON)")
        ->check(CLI::ExistingFile);
    app.add_flag("--settle", settle, "Run one settlement pass");
    app.add_flag("--status", status, "Print ledger summary");
    app.add_flag("--reset", reset, "Start a fresh ledger at the configured balance");
    app.add_flag("--loop", loop, "Re-read feed and settle periodically until interrupted");
    app.add_option("-i,--interval", interval_secs, "Loop interval in seconds")
        ->check(CLI::PositiveNumber);
    app.add_flag("-v,--version", show_version, "Show version information");

    CLI11_PARSE(app, argc, argv);

    if (show_version) {
        std::cout << "crossarb v1.0.0\n";
        return 0;
    }

    Config config;
    try {
        if (std::filesystem::exists(config_path)) {
            config = Config::load(config_path);
        } else {
            config = Config::from_environment();
        }
    } catch (const std::exception& e) {
        std::cerr << "Failed to load config: " << e.what() << "\n";
        return 1;
    }

    if (!mode_arg.empty()) {
        config.mode = *mode_from_string(mode_arg);
    }

    setup_logging(config.logging);

    if (!config.validate()) {
        spdlog::critical("Invalid configuration");
        return 1;
    }

    spdlog::info("crossarb starting: mode={}, ledger={}", mode_to_string(config.mode), config.ledger_path);
    if (config.mode == TradingMode::LIVE) {
        spdlog::warn("LIVE MODE: real orders will be placed");
    }

    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    try {
        VenueRegistry venues;
        build_venues(config, resolutions_path, venues);

        JsonFileLedgerStore::Config store_config;
        store_config.path = config.ledger_path;
        JsonFileLedgerStore store(store_config);

        ArbitrageEngine engine(config, venues, store,
                               ArbitrageEngine::load_or_create(store, config, wall_now()));

        if (reset && !engine.reset(wall_now())) {
            spdlog::error("Ledger reset could not be saved");
            return 1;
        }

        if (!loop) {
            if (!feed_path.empty()) {
                run_feed(engine, feed_path);
            }
            if (settle) {
                engine.run_settlement_pass(wall_now());
            }
            if (status || (feed_path.empty() && !settle && !reset)) {
                print_summary(engine.summary(wall_now()));
            }
            return 0;
        }

        spdlog::info("Looping every {}s, Ctrl+C to stop", interval_secs);
        while (!g_shutdown) {
            if (!feed_path.empty()) {
                try {
                    run_feed(engine, feed_path);
                } catch (const std::runtime_error& e) {
                    spdlog::error("Feed read failed: {}", e.what());
                }
            }
            engine.run_settlement_pass(wall_now());

            auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(interval_secs);
            while (!g_shutdown && std::chrono::steady_clock::now() < deadline) {
                std::this_thread::sleep_for(std::chrono::milliseconds(200));
            }
        }

        spdlog::info("Shutting down...");
        if (status) {
            print_summary(engine.summary(wall_now()));
        }
    } catch (const std::exception& e) {
        spdlog::critical("Fatal: {}", e.what());
        return 1;
    }

    spdlog::info("crossarb shutdown complete.");
    return 0;
}
