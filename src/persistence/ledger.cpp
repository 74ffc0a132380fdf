#include "persistence/ledger.hpp"
#include "utils/time_utils.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cmath>
#include <set>
#include <stdexcept>

namespace crossarb {

std::optional<TradeStatus> trade_status_from_string(const std::string& s) {
    if (s == "pending") return TradeStatus::PENDING;
    if (s == "locked") return TradeStatus::LOCKED;
    if (s == "settled") return TradeStatus::SETTLED;
    if (s == "incomplete") return TradeStatus::INCOMPLETE;
    return std::nullopt;
}

Ledger Ledger::fresh(Usd initial_balance, WallClock now) {
    Ledger ledger;
    ledger.balance = initial_balance;
    ledger.initial_balance = initial_balance;
    ledger.daily.reset_date = time_utils::utc_date(now);
    return ledger;
}

bool Ledger::has_open_trade(const std::string& trade_id) const {
    return std::any_of(trades.begin(), trades.end(), [&](const Trade& t) {
        return t.id == trade_id && t.is_open();
    });
}

// Latest record wins when an id was traded again after settling
const Trade* Ledger::find_trade(const std::string& trade_id) const {
    for (auto it = trades.rbegin(); it != trades.rend(); ++it) {
        if (it->id == trade_id) return &*it;
    }
    return nullptr;
}

Trade* Ledger::find_trade(const std::string& trade_id) {
    for (auto it = trades.rbegin(); it != trades.rend(); ++it) {
        if (it->id == trade_id) return &*it;
    }
    return nullptr;
}

bool Ledger::append_trade(Trade trade) {
    if (trade.id.empty() || has_open_trade(trade.id)) {
        return false;
    }
    trades.push_back(std::move(trade));
    return true;
}

bool Ledger::roll_daily_counters(WallClock now) {
    std::string today = time_utils::utc_date(now);
    if (daily.reset_date == today) {
        return false;
    }

    spdlog::info("New trading day {}: resetting daily counters (loss=${:.2f}, trades={})",
                 today, daily.daily_loss, daily.trades.size());
    daily.reset_date = today;
    daily.daily_loss = 0.0;
    daily.trades.clear();
    return true;
}

void Ledger::record_daily_trade(const std::string& trade_id, WallClock now) {
    daily.trades.push_back(DailyTradeEntry{time_utils::utc_date(now), trade_id, now});
}

void Ledger::add_daily_loss(Usd amount) {
    daily.daily_loss += std::abs(amount);
}

void Ledger::record_error(const std::string& trade_id, const std::string& error, WallClock now) {
    errors.push_back(ErrorRecord{trade_id, error, now});
    if (errors.size() > MAX_ERRORS) {
        errors.erase(errors.begin(),
                     errors.begin() + static_cast<std::ptrdiff_t>(errors.size() - MAX_ERRORS));
    }
}

LedgerSummary Ledger::summary(WallClock now) const {
    LedgerSummary s;
    s.balance = balance;
    s.initial_balance = initial_balance;
    s.trade_count = trades.size();

    for (const auto& t : trades) {
        if (t.is_open()) {
            s.pending_count++;
            s.pending_expected_profit += t.expected_profit;
        } else {
            s.total_realized_profit += t.realized_profit;
        }
    }

    // Stale counters read as zero until the next risk check rolls them
    if (daily.reset_date == time_utils::utc_date(now)) {
        s.daily_loss = daily.daily_loss;
        s.daily_trades = daily.trades.size();
    }

    s.trades = trades;
    std::stable_sort(s.trades.begin(), s.trades.end(), [](const Trade& a, const Trade& b) {
        return a.placed_at > b.placed_at;
    });
    return s;
}

std::string Ledger::validation_error() const {
    if (!std::isfinite(balance)) {
        return "Non-finite balance";
    }
    if (!(initial_balance > 0)) {
        return "Invalid initial balance";
    }

    std::set<std::string> open_ids;
    for (const auto& t : trades) {
        if (t.id.empty()) return "Trade without id";
        if (t.legs[0].venue == t.legs[1].venue) {
            return "Trade " + t.id + " has both legs on one venue";
        }
        if (t.is_open() && !open_ids.insert(t.id).second) {
            return "Duplicate open trade " + t.id;
        }
    }
    if (errors.size() > MAX_ERRORS) {
        return "Error log exceeds bound";
    }
    return "";
}

// JSON serialization

namespace {

std::string ts(WallClock t) {
    return time_utils::to_iso8601(t);
}

WallClock parse_ts(const nlohmann::json& j, const char* key) {
    if (!j.contains(key) || !j[key].is_string()) {
        return WallClock{};
    }
    return time_utils::from_iso8601(j[key].get<std::string>());
}

} // namespace

void to_json(nlohmann::json& j, const Leg& l) {
    j = nlohmann::json{
        {"platform", venue_to_string(l.venue)},
        {"code", l.code},
        {"team", l.team},
        {"market_id", l.market_id},
        {"url", l.url},
        {"price", l.price},
        {"effective_price", l.effective_price},
        {"fee_rate", l.fee_rate},
        {"cost_usd", l.cost_usd},
        {"fee_usd", l.fee_usd},
        {"slippage_usd", l.slippage_usd},
        {"payout_if_win", l.payout_if_win},
        {"order_id", l.order_id},
        {"order_status", l.order_status}
    };
}

void from_json(const nlohmann::json& j, Leg& l) {
    auto venue = venue_from_string(j.at("platform").get<std::string>());
    if (!venue) {
        throw std::runtime_error("Unknown leg platform: " + j.at("platform").get<std::string>());
    }
    l.venue = *venue;
    j.at("code").get_to(l.code);
    l.team = j.value("team", "");
    j.at("market_id").get_to(l.market_id);
    l.url = j.value("url", "");
    j.at("price").get_to(l.price);
    l.effective_price = j.value("effective_price", l.price);
    l.fee_rate = j.value("fee_rate", 0.0);
    l.cost_usd = j.value("cost_usd", 0.0);
    l.fee_usd = j.value("fee_usd", 0.0);
    l.slippage_usd = j.value("slippage_usd", 0.0);
    l.payout_if_win = j.value("payout_if_win", 0.0);
    l.order_id = j.value("order_id", "");
    l.order_status = j.value("order_status", "");
}

void to_json(nlohmann::json& j, const Trade& t) {
    j = nlohmann::json{
        {"id", t.id},
        {"game", t.display_name},
        {"sport", t.sport},
        {"game_time", t.game_time},
        {"arb_type", quality_to_string(t.arb_type)},
        {"legs", t.legs},
        {"quantity", t.quantity},
        {"total_effective_cost", t.total_effective_cost},
        {"bet_amount", t.bet_amount},
        {"cost_usd", t.cost_usd},
        {"expected_payout", t.expected_payout},
        {"expected_profit", t.expected_profit},
        {"roi_percent", t.roi_percent},
        {"total_fees", t.total_fees},
        {"total_slippage", t.total_slippage},
        {"status", trade_status_to_string(t.status)},
        {"timestamp", ts(t.placed_at)},
        {"settlement_amount", t.settlement_amount},
        {"realized_profit", t.realized_profit}
    };

    if (t.settled_at) {
        j["settled_at"] = ts(*t.settled_at);
    }
}

void from_json(const nlohmann::json& j, Trade& t) {
    j.at("id").get_to(t.id);
    t.display_name = j.value("game", "");
    t.sport = j.value("sport", "");
    t.game_time = j.value("game_time", "");
    t.arb_type = quality_from_string(j.value("arb_type", "none"));

    const auto& legs = j.at("legs");
    if (!legs.is_array() || legs.size() != 2) {
        throw std::runtime_error("Trade " + t.id + " must have exactly two legs");
    }
    t.legs[0] = legs[0].get<Leg>();
    t.legs[1] = legs[1].get<Leg>();

    j.at("quantity").get_to(t.quantity);
    t.total_effective_cost = j.value("total_effective_cost", 0.0);
    t.bet_amount = j.value("bet_amount", 0.0);
    j.at("cost_usd").get_to(t.cost_usd);
    t.expected_payout = j.value("expected_payout", t.quantity);
    t.expected_profit = j.value("expected_profit", 0.0);
    t.roi_percent = j.value("roi_percent", 0.0);
    t.total_fees = j.value("total_fees", 0.0);
    t.total_slippage = j.value("total_slippage", 0.0);

    auto status = trade_status_from_string(j.at("status").get<std::string>());
    if (!status) {
        throw std::runtime_error("Unknown trade status: " + j.at("status").get<std::string>());
    }
    t.status = *status;

    t.placed_at = parse_ts(j, "timestamp");
    if (j.contains("settled_at") && !j["settled_at"].is_null()) {
        t.settled_at = parse_ts(j, "settled_at");
    }
    t.settlement_amount = j.value("settlement_amount", 0.0);
    t.realized_profit = j.value("realized_profit", 0.0);
}

void to_json(nlohmann::json& j, const DailyTradeEntry& e) {
    j = nlohmann::json{
        {"date", e.date},
        {"trade_id", e.trade_id},
        {"timestamp", ts(e.timestamp)}
    };
}

void from_json(const nlohmann::json& j, DailyTradeEntry& e) {
    j.at("date").get_to(e.date);
    e.trade_id = j.value("trade_id", "");
    e.timestamp = parse_ts(j, "timestamp");
}

void to_json(nlohmann::json& j, const DailyRiskCounters& d) {
    j = nlohmann::json{
        {"last_reset_date", d.reset_date},
        {"daily_loss", d.daily_loss},
        {"daily_trades", d.trades}
    };
}

void from_json(const nlohmann::json& j, DailyRiskCounters& d) {
    d.reset_date = j.value("last_reset_date", "");
    d.daily_loss = j.value("daily_loss", 0.0);
    if (j.contains("daily_trades")) {
        d.trades = j["daily_trades"].get<std::vector<DailyTradeEntry>>();
    }
}

void to_json(nlohmann::json& j, const ErrorRecord& e) {
    j = nlohmann::json{
        {"trade_id", e.trade_id},
        {"error", e.error},
        {"timestamp", ts(e.timestamp)}
    };
}

void from_json(const nlohmann::json& j, ErrorRecord& e) {
    e.trade_id = j.value("trade_id", "");
    e.error = j.value("error", "");
    e.timestamp = parse_ts(j, "timestamp");
}

void to_json(nlohmann::json& j, const Ledger& l) {
    j = nlohmann::json{
        {"balance", l.balance},
        {"initial_balance", l.initial_balance},
        {"trades", l.trades},
        {"risk_tracking", l.daily},
        {"errors", l.errors}
    };
}

void from_json(const nlohmann::json& j, Ledger& l) {
    j.at("balance").get_to(l.balance);
    l.initial_balance = j.value("initial_balance", l.balance);

    if (j.contains("trades")) {
        l.trades = j["trades"].get<std::vector<Trade>>();
    }
    if (j.contains("risk_tracking")) {
        l.daily = j["risk_tracking"].get<DailyRiskCounters>();
    }
    if (j.contains("errors")) {
        l.errors = j["errors"].get<std::vector<ErrorRecord>>();
    }
}

} // namespace crossarb
