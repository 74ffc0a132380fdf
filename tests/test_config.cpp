#include <gtest/gtest.h>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include "config/config.hpp"
#include "utils/crypto.hpp"

using namespace crossarb;

class ConfigTest : public ::testing::Test {
protected:
    void SetUp() override {
        path_ = (std::filesystem::temp_directory_path() /
                 ("crossarb_config_" + crypto::random_hex(4) + ".json")).string();
    }

    void TearDown() override {
        std::filesystem::remove(path_);
        for (const char* name : {"TRADING_MODE", "TRADING_INITIAL_BALANCE", "TRADING_MIN_ROI",
                                 "TRADING_MAX_DAILY_TRADES", "TRADING_LEDGER_PATH"}) {
            unsetenv(name);
        }
    }

    void write(const std::string& content) {
        std::ofstream f(path_);
        f << content;
    }

    std::string path_;
};

TEST_F(ConfigTest, Defaults) {
    Config config;
    EXPECT_EQ(config.mode, TradingMode::SIMULATED);
    EXPECT_DOUBLE_EQ(config.initial_balance, 10000.0);
    EXPECT_DOUBLE_EQ(config.fees.polymarket_fee_rate, 0.02);
    EXPECT_DOUBLE_EQ(config.fees.kalshi_fee_rate, 0.07);
    EXPECT_DOUBLE_EQ(config.fees.slippage_estimate, 0.005);
    EXPECT_DOUBLE_EQ(config.risk.target_units, 100.0);
    EXPECT_DOUBLE_EQ(config.risk.daily_loss_limit, 500.0);
    EXPECT_DOUBLE_EQ(config.risk.max_position_size, 1000.0);
    EXPECT_EQ(config.risk.max_daily_trades, 10);
    EXPECT_DOUBLE_EQ(config.execution.settlement_timeout_hours, 24.0);
    EXPECT_EQ(config.execution.settlement_concurrency, 8);
    EXPECT_TRUE(config.validate());
}

TEST_F(ConfigTest, LoadsPartialFile) {
    write(R"({
        "mode": "live",
        "initial_balance": 2500,
        "fees": {"kalshi_fee_rate": 0.05},
        "risk": {"max_daily_trades": 4},
        "ledger_path": "/tmp/crossarb-ledger.json"
    })");

    auto config = Config::load(path_);
    EXPECT_EQ(config.mode, TradingMode::LIVE);
    EXPECT_DOUBLE_EQ(config.initial_balance, 2500.0);
    EXPECT_DOUBLE_EQ(config.fees.kalshi_fee_rate, 0.05);
    EXPECT_DOUBLE_EQ(config.fees.polymarket_fee_rate, 0.02);
    EXPECT_EQ(config.risk.max_daily_trades, 4);
    EXPECT_EQ(config.ledger_path, "/tmp/crossarb-ledger.json");
}

TEST_F(ConfigTest, SaveAndLoad) {
    Config config;
    config.initial_balance = 1234.5;
    config.risk.min_roi_percent = 1.5;
    config.save(path_);

    auto loaded = Config::load(path_);
    EXPECT_DOUBLE_EQ(loaded.initial_balance, 1234.5);
    EXPECT_DOUBLE_EQ(loaded.risk.min_roi_percent, 1.5);
}

TEST_F(ConfigTest, EnvironmentOverridesFile) {
    write(R"({"initial_balance": 2500})");
    setenv("TRADING_INITIAL_BALANCE", "7500", 1);
    setenv("TRADING_MODE", "live", 1);
    setenv("TRADING_LEDGER_PATH", "/tmp/env-ledger.json", 1);

    auto config = Config::load(path_);
    EXPECT_DOUBLE_EQ(config.initial_balance, 7500.0);
    EXPECT_EQ(config.mode, TradingMode::LIVE);
    EXPECT_EQ(config.ledger_path, "/tmp/env-ledger.json");
}

TEST_F(ConfigTest, UnparseableEnvironmentValueIgnored) {
    setenv("TRADING_MIN_ROI", "lots", 1);
    setenv("TRADING_MAX_DAILY_TRADES", "3x", 1);
    setenv("TRADING_MODE", "yolo", 1);

    auto config = Config::from_environment();
    EXPECT_DOUBLE_EQ(config.risk.min_roi_percent, 0.0);
    EXPECT_EQ(config.risk.max_daily_trades, 10);
    EXPECT_EQ(config.mode, TradingMode::SIMULATED);
}

TEST_F(ConfigTest, RejectsInvalidValues) {
    Config config;
    config.fees.kalshi_fee_rate = 1.0;
    EXPECT_FALSE(config.validate());

    config = Config{};
    config.fees.slippage_estimate = -0.01;
    EXPECT_FALSE(config.validate());

    config = Config{};
    config.initial_balance = 0;
    EXPECT_FALSE(config.validate());

    config = Config{};
    config.risk.max_daily_trades = 0;
    EXPECT_FALSE(config.validate());

    config = Config{};
    config.execution.settlement_concurrency = 0;
    EXPECT_FALSE(config.validate());
}

TEST_F(ConfigTest, MalformedFileThrows) {
    write("{ \"mode\": ");
    EXPECT_THROW(Config::load(path_), std::runtime_error);

    write(R"({"mode": "paperless"})");
    EXPECT_THROW(Config::load(path_), std::runtime_error);

    write(R"({"initial_balance": -5})");
    EXPECT_THROW(Config::load(path_), std::runtime_error);
}
