#pragma once

#include <array>
#include <string>
#include <vector>
#include <optional>
#include <nlohmann/json.hpp>
#include "common/types.hpp"
#include "arbitrage/opportunity.hpp"

namespace crossarb {

enum class TradeStatus {
    PENDING,     // Both legs placed, awaiting settlement
    LOCKED,      // Non-terminal, held by an external operator
    SETTLED,     // All legs resolved, payout applied
    INCOMPLETE   // Timed out with some legs unresolved, partial payout applied
};

inline std::string trade_status_to_string(TradeStatus s) {
    switch (s) {
        case TradeStatus::PENDING: return "pending";
        case TradeStatus::LOCKED: return "locked";
        case TradeStatus::SETTLED: return "settled";
        case TradeStatus::INCOMPLETE: return "incomplete";
    }
    return "pending";
}

std::optional<TradeStatus> trade_status_from_string(const std::string& s);

/**
 * One side of a Trade, placed at one venue.
 */
struct Leg {
    Venue venue{Venue::POLYMARKET};
    std::string code;
    std::string team;
    std::string market_id;
    std::string url;

    Price price{0.0};               // Raw quoted price, 0-100
    Price effective_price{0.0};
    double fee_rate{0.0};

    Usd cost_usd{0.0};
    Usd fee_usd{0.0};
    Usd slippage_usd{0.0};
    Usd payout_if_win{0.0};

    std::string order_id;
    std::string order_status;

    // Settlement winners may be reported by code or by display name
    bool matches_winner(const std::string& winner) const {
        return !winner.empty() && (winner == code || (!team.empty() && winner == team));
    }
};

struct Trade {
    std::string id;                 // Outcome-pair id, AWAY@HOME
    std::string display_name;
    std::string sport;
    std::string game_time;
    Quality arb_type{Quality::NONE};

    std::array<Leg, 2> legs;

    Quantity quantity{0.0};
    Price total_effective_cost{0.0};
    Usd bet_amount{0.0};
    Usd cost_usd{0.0};
    Usd expected_payout{0.0};
    Usd expected_profit{0.0};
    double roi_percent{0.0};
    Usd total_fees{0.0};
    Usd total_slippage{0.0};

    TradeStatus status{TradeStatus::PENDING};
    WallClock placed_at;
    std::optional<WallClock> settled_at;
    Usd settlement_amount{0.0};
    Usd realized_profit{0.0};

    bool is_open() const {
        return status == TradeStatus::PENDING || status == TradeStatus::LOCKED;
    }
};

struct DailyTradeEntry {
    std::string date;
    std::string trade_id;
    WallClock timestamp;
};

/**
 * Counters consulted by the risk checks. Reset lazily when a new UTC day
 * is first observed.
 */
struct DailyRiskCounters {
    std::string reset_date;         // YYYY-MM-DD (UTC)
    Usd daily_loss{0.0};
    std::vector<DailyTradeEntry> trades;
};

struct ErrorRecord {
    std::string trade_id;
    std::string error;
    WallClock timestamp;
};

struct LedgerSummary {
    Usd balance{0.0};
    Usd initial_balance{0.0};
    Usd total_realized_profit{0.0};
    Usd pending_expected_profit{0.0};
    size_t trade_count{0};
    size_t pending_count{0};
    Usd daily_loss{0.0};
    size_t daily_trades{0};
    std::vector<Trade> trades;      // Newest first
};

/**
 * Complete persisted trading state. Not synchronized; the owner serializes
 * access.
 *
 * balance = initial_balance - sum(trade costs) + sum(payouts applied)
 */
struct Ledger {
    static constexpr size_t MAX_ERRORS = 100;

    Usd balance{0.0};
    Usd initial_balance{0.0};
    std::vector<Trade> trades;      // Insertion order
    DailyRiskCounters daily;
    std::vector<ErrorRecord> errors;

    static Ledger fresh(Usd initial_balance, WallClock now);

    bool has_open_trade(const std::string& trade_id) const;
    const Trade* find_trade(const std::string& trade_id) const;
    Trade* find_trade(const std::string& trade_id);

    // Returns false (and leaves the ledger untouched) if an open trade with
    // the same id already exists.
    bool append_trade(Trade trade);

    void debit(Usd amount) { balance -= amount; }
    void credit(Usd amount) { balance += amount; }

    // Returns true if the counters were reset for a new day
    bool roll_daily_counters(WallClock now);
    void record_daily_trade(const std::string& trade_id, WallClock now);
    void add_daily_loss(Usd amount);
    size_t daily_trade_count() const { return daily.trades.size(); }

    // Keeps the most recent MAX_ERRORS entries
    void record_error(const std::string& trade_id, const std::string& error, WallClock now);

    LedgerSummary summary(WallClock now) const;

    bool is_valid() const { return validation_error().empty(); }
    std::string validation_error() const;
};

// JSON serialization
void to_json(nlohmann::json& j, const Leg& l);
void from_json(const nlohmann::json& j, Leg& l);
void to_json(nlohmann::json& j, const Trade& t);
void from_json(const nlohmann::json& j, Trade& t);
void to_json(nlohmann::json& j, const DailyTradeEntry& e);
void from_json(const nlohmann::json& j, DailyTradeEntry& e);
void to_json(nlohmann::json& j, const DailyRiskCounters& d);
void from_json(const nlohmann::json& j, DailyRiskCounters& d);
void to_json(nlohmann::json& j, const ErrorRecord& e);
void from_json(const nlohmann::json& j, ErrorRecord& e);
void to_json(nlohmann::json& j, const Ledger& l);
void from_json(const nlohmann::json& j, Ledger& l);

} // namespace crossarb
