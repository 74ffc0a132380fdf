#include "config/config.hpp"
#include <fstream>
#include <cstdlib>
#include <cmath>
#include <stdexcept>
#include <spdlog/spdlog.h>

namespace crossarb {

void to_json(nlohmann::json& j, const FeeConfig& c) {
    j = nlohmann::json{
        {"polymarket_fee_rate", c.polymarket_fee_rate},
        {"kalshi_fee_rate", c.kalshi_fee_rate},
        {"slippage_estimate", c.slippage_estimate}
    };
}

void from_json(const nlohmann::json& j, FeeConfig& c) {
    if (j.contains("polymarket_fee_rate")) j.at("polymarket_fee_rate").get_to(c.polymarket_fee_rate);
    if (j.contains("kalshi_fee_rate")) j.at("kalshi_fee_rate").get_to(c.kalshi_fee_rate);
    if (j.contains("slippage_estimate")) j.at("slippage_estimate").get_to(c.slippage_estimate);
}

void to_json(nlohmann::json& j, const RiskConfig& c) {
    j = nlohmann::json{
        {"target_units", c.target_units},
        {"min_roi_percent", c.min_roi_percent},
        {"daily_loss_limit", c.daily_loss_limit},
        {"max_position_size", c.max_position_size},
        {"max_daily_trades", c.max_daily_trades},
        {"near_size_multiplier", c.near_size_multiplier},
        {"partial_size_multiplier", c.partial_size_multiplier},
        {"liquidity_threshold_units", c.liquidity_threshold_units},
        {"liquidity_discount", c.liquidity_discount}
    };
}

void from_json(const nlohmann::json& j, RiskConfig& c) {
    if (j.contains("target_units")) j.at("target_units").get_to(c.target_units);
    if (j.contains("min_roi_percent")) j.at("min_roi_percent").get_to(c.min_roi_percent);
    if (j.contains("daily_loss_limit")) j.at("daily_loss_limit").get_to(c.daily_loss_limit);
    if (j.contains("max_position_size")) j.at("max_position_size").get_to(c.max_position_size);
    if (j.contains("max_daily_trades")) j.at("max_daily_trades").get_to(c.max_daily_trades);
    if (j.contains("near_size_multiplier")) j.at("near_size_multiplier").get_to(c.near_size_multiplier);
    if (j.contains("partial_size_multiplier")) j.at("partial_size_multiplier").get_to(c.partial_size_multiplier);
    if (j.contains("liquidity_threshold_units")) j.at("liquidity_threshold_units").get_to(c.liquidity_threshold_units);
    if (j.contains("liquidity_discount")) j.at("liquidity_discount").get_to(c.liquidity_discount);
}

void to_json(nlohmann::json& j, const ExecutionConfig& c) {
    j = nlohmann::json{
        {"leg_timeout_ms", c.leg_timeout_ms},
        {"persist_retries", c.persist_retries},
        {"persist_retry_backoff_ms", c.persist_retry_backoff_ms},
        {"settlement_timeout_hours", c.settlement_timeout_hours},
        {"settlement_concurrency", c.settlement_concurrency}
    };
}

void from_json(const nlohmann::json& j, ExecutionConfig& c) {
    if (j.contains("leg_timeout_ms")) j.at("leg_timeout_ms").get_to(c.leg_timeout_ms);
    if (j.contains("persist_retries")) j.at("persist_retries").get_to(c.persist_retries);
    if (j.contains("persist_retry_backoff_ms")) j.at("persist_retry_backoff_ms").get_to(c.persist_retry_backoff_ms);
    if (j.contains("settlement_timeout_hours")) j.at("settlement_timeout_hours").get_to(c.settlement_timeout_hours);
    if (j.contains("settlement_concurrency")) j.at("settlement_concurrency").get_to(c.settlement_concurrency);
}

void to_json(nlohmann::json& j, const VenueConfig& c) {
    j = nlohmann::json{
        {"polymarket_clob_url", c.polymarket_clob_url},
        {"polymarket_chain_id", c.polymarket_chain_id},
        {"kalshi_api_url", c.kalshi_api_url}
    };
}

void from_json(const nlohmann::json& j, VenueConfig& c) {
    if (j.contains("polymarket_clob_url")) j.at("polymarket_clob_url").get_to(c.polymarket_clob_url);
    if (j.contains("polymarket_chain_id")) j.at("polymarket_chain_id").get_to(c.polymarket_chain_id);
    if (j.contains("kalshi_api_url")) j.at("kalshi_api_url").get_to(c.kalshi_api_url);
}

void to_json(nlohmann::json& j, const LoggingConfig& c) {
    j = nlohmann::json{
        {"log_dir", c.log_dir},
        {"log_level", c.log_level},
        {"log_to_console", c.log_to_console},
        {"log_to_file", c.log_to_file},
        {"max_log_file_size_mb", c.max_log_file_size_mb},
        {"max_log_files", c.max_log_files}
    };
}

void from_json(const nlohmann::json& j, LoggingConfig& c) {
    if (j.contains("log_dir")) j.at("log_dir").get_to(c.log_dir);
    if (j.contains("log_level")) j.at("log_level").get_to(c.log_level);
    if (j.contains("log_to_console")) j.at("log_to_console").get_to(c.log_to_console);
    if (j.contains("log_to_file")) j.at("log_to_file").get_to(c.log_to_file);
    if (j.contains("max_log_file_size_mb")) j.at("max_log_file_size_mb").get_to(c.max_log_file_size_mb);
    if (j.contains("max_log_files")) j.at("max_log_files").get_to(c.max_log_files);
}

void to_json(nlohmann::json& j, const Config& c) {
    j = nlohmann::json{
        {"mode", c.mode == TradingMode::LIVE ? "live" : "simulated"},
        {"initial_balance", c.initial_balance},
        {"fees", c.fees},
        {"risk", c.risk},
        {"execution", c.execution},
        {"venues", c.venues},
        {"logging", c.logging},
        {"ledger_path", c.ledger_path}
    };
}

void from_json(const nlohmann::json& j, Config& c) {
    if (j.contains("mode")) {
        std::string mode_str = j.at("mode").get<std::string>();
        auto mode = mode_from_string(mode_str);
        if (!mode) {
            throw std::runtime_error("Unknown trading mode: " + mode_str);
        }
        c.mode = *mode;
    }
    if (j.contains("initial_balance")) j.at("initial_balance").get_to(c.initial_balance);
    if (j.contains("fees")) j.at("fees").get_to(c.fees);
    if (j.contains("risk")) j.at("risk").get_to(c.risk);
    if (j.contains("execution")) j.at("execution").get_to(c.execution);
    if (j.contains("venues")) j.at("venues").get_to(c.venues);
    if (j.contains("logging")) j.at("logging").get_to(c.logging);
    if (j.contains("ledger_path")) j.at("ledger_path").get_to(c.ledger_path);
}

Config Config::load(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to open config file: " + path);
    }

    Config config;
    try {
        nlohmann::json j;
        file >> j;
        from_json(j, config);
    } catch (const nlohmann::json::exception& e) {
        throw std::runtime_error("Malformed config file " + path + ": " + e.what());
    }

    config.apply_env_overrides();

    if (!config.validate()) {
        throw std::runtime_error("Invalid configuration in: " + path);
    }

    return config;
}

Config Config::from_environment() {
    Config config;
    config.apply_env_overrides();

    if (!config.validate()) {
        throw std::runtime_error("Invalid configuration from environment");
    }

    return config;
}

void Config::save(const std::string& path) const {
    std::ofstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to create config file: " + path);
    }

    nlohmann::json j;
    to_json(j, *this);
    file << j.dump(2);
}

namespace {

void override_double(const char* name, double& target) {
    std::string raw = Config::get_env(name);
    if (raw.empty()) return;
    try {
        size_t consumed = 0;
        double value = std::stod(raw, &consumed);
        if (consumed != raw.size() || !std::isfinite(value)) {
            throw std::invalid_argument("trailing characters");
        }
        target = value;
    } catch (const std::exception&) {
        spdlog::warn("Ignoring unparseable {}='{}'", name, raw);
    }
}

void override_int(const char* name, int& target) {
    std::string raw = Config::get_env(name);
    if (raw.empty()) return;
    try {
        size_t consumed = 0;
        int value = std::stoi(raw, &consumed);
        if (consumed != raw.size()) {
            throw std::invalid_argument("trailing characters");
        }
        target = value;
    } catch (const std::exception&) {
        spdlog::warn("Ignoring unparseable {}='{}'", name, raw);
    }
}

} // namespace

void Config::apply_env_overrides() {
    std::string mode_str = get_env("TRADING_MODE");
    if (!mode_str.empty()) {
        auto parsed = mode_from_string(mode_str);
        if (parsed) {
            mode = *parsed;
        } else {
            spdlog::warn("Ignoring unknown TRADING_MODE='{}'", mode_str);
        }
    }

    override_double("TRADING_INITIAL_BALANCE", initial_balance);
    override_double("TRADING_BET_AMOUNT", risk.target_units);
    override_double("TRADING_MIN_ROI", risk.min_roi_percent);
    override_double("TRADING_DAILY_LOSS_LIMIT", risk.daily_loss_limit);
    override_double("TRADING_MAX_POSITION_SIZE", risk.max_position_size);
    override_int("TRADING_MAX_DAILY_TRADES", risk.max_daily_trades);

    std::string ledger = get_env("TRADING_LEDGER_PATH");
    if (!ledger.empty()) {
        ledger_path = ledger;
    }
}

bool Config::validate() const {
    if (initial_balance <= 0) {
        spdlog::error("initial_balance must be positive");
        return false;
    }

    if (fees.polymarket_fee_rate < 0 || fees.polymarket_fee_rate >= 1 ||
        fees.kalshi_fee_rate < 0 || fees.kalshi_fee_rate >= 1) {
        spdlog::error("fee rates must be within [0, 1)");
        return false;
    }

    if (fees.slippage_estimate < 0) {
        spdlog::error("slippage_estimate must be non-negative");
        return false;
    }

    if (risk.target_units <= 0) {
        spdlog::error("target_units must be positive");
        return false;
    }

    if (risk.daily_loss_limit <= 0 || risk.max_position_size <= 0) {
        spdlog::error("daily_loss_limit and max_position_size must be positive");
        return false;
    }

    if (risk.max_daily_trades <= 0) {
        spdlog::error("max_daily_trades must be positive");
        return false;
    }

    if (risk.liquidity_discount < 0 || risk.liquidity_discount >= 1) {
        spdlog::error("liquidity_discount must be within [0, 1)");
        return false;
    }

    if (risk.max_position_size > initial_balance * 0.5) {
        spdlog::warn("max_position_size is > 50% of balance, this is risky");
    }

    if (execution.leg_timeout_ms <= 0 || execution.persist_retries <= 0) {
        spdlog::error("leg_timeout_ms and persist_retries must be positive");
        return false;
    }

    if (execution.settlement_timeout_hours <= 0) {
        spdlog::error("settlement_timeout_hours must be positive");
        return false;
    }

    if (execution.settlement_concurrency <= 0) {
        spdlog::error("settlement_concurrency must be positive");
        return false;
    }

    return true;
}

std::string Config::get_env(const std::string& name, const std::string& default_val) {
    const char* val = std::getenv(name.c_str());
    return val ? std::string(val) : default_val;
}

} // namespace crossarb
