#pragma once

#include <string>
#include <optional>
#include <nlohmann/json.hpp>
#include "common/types.hpp"

namespace crossarb {

struct FeeConfig {
    double polymarket_fee_rate{0.02};        // 2% taker fee
    double kalshi_fee_rate{0.07};            // 7% taker fee
    double slippage_estimate{0.005};         // 0.5%, added to every venue's fee rate
};

struct RiskConfig {
    double target_units{100.0};              // Payout units per trade before quality scaling
    double min_roi_percent{0.0};             // Reject at or below this ROI
    double daily_loss_limit{500.0};          // USD
    double max_position_size{1000.0};        // USD cost of a single trade
    int max_daily_trades{10};
    double near_size_multiplier{0.5};
    double partial_size_multiplier{0.3};
    double liquidity_threshold_units{200.0}; // Discount applies above this many units
    double liquidity_discount{0.01};         // 1%
};

struct ExecutionConfig {
    int leg_timeout_ms{10000};               // Venue placement call timeout
    int persist_retries{3};                  // Ledger save attempts after placement
    int persist_retry_backoff_ms{200};
    double settlement_timeout_hours{24.0};
    int settlement_concurrency{8};           // Settlement queries in flight at once
};

struct VenueConfig {
    std::string polymarket_clob_url{"https://clob.polymarket.com"};
    int polymarket_chain_id{137};
    std::string kalshi_api_url{"https://api.elections.kalshi.com/trade-api/v2"};
};

struct LoggingConfig {
    std::string log_dir{"./logs"};
    std::string log_level{"info"};           // debug, info, warn, error
    bool log_to_console{true};
    bool log_to_file{true};
    int max_log_file_size_mb{50};
    int max_log_files{5};
};

struct Config {
    TradingMode mode{TradingMode::SIMULATED};
    double initial_balance{10000.0};

    FeeConfig fees;
    RiskConfig risk;
    ExecutionConfig execution;
    VenueConfig venues;
    LoggingConfig logging;

    std::string ledger_path{"./data/ledger.json"};

    // Load from file, then apply environment overrides
    static Config load(const std::string& path);

    // Defaults plus environment overrides
    static Config from_environment();

    // Save to file
    void save(const std::string& path) const;

    // Override fields from TRADING_* environment variables
    void apply_env_overrides();

    // Validate configuration
    bool validate() const;

    // Get environment variable with default
    static std::string get_env(const std::string& name, const std::string& default_val = "");
};

// JSON serialization
void to_json(nlohmann::json& j, const FeeConfig& c);
void from_json(const nlohmann::json& j, FeeConfig& c);
void to_json(nlohmann::json& j, const RiskConfig& c);
void from_json(const nlohmann::json& j, RiskConfig& c);
void to_json(nlohmann::json& j, const ExecutionConfig& c);
void from_json(const nlohmann::json& j, ExecutionConfig& c);
void to_json(nlohmann::json& j, const VenueConfig& c);
void from_json(const nlohmann::json& j, VenueConfig& c);
void to_json(nlohmann::json& j, const LoggingConfig& c);
void from_json(const nlohmann::json& j, LoggingConfig& c);
void to_json(nlohmann::json& j, const Config& c);
void from_json(const nlohmann::json& j, Config& c);

} // namespace crossarb
