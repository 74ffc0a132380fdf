#include "execution/execution_coordinator.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <chrono>
#include <thread>

namespace crossarb {

ExecutionCoordinator::ExecutionCoordinator(VenueRegistry& venues,
                                           LedgerStore& store,
                                           const FeeModel& fees,
                                           const ExecutionConfig& config,
                                           Usd bet_amount)
    : venues_(venues)
    , store_(store)
    , fees_(fees)
    , config_(config)
    , bet_amount_(bet_amount)
{
    spdlog::info("ExecutionCoordinator initialized: leg_timeout={}ms, persist_retries={}, backoff={}ms",
                 config.leg_timeout_ms, config.persist_retries, config.persist_retry_backoff_ms);
}

std::optional<std::string> ExecutionCoordinator::validate(const Opportunity& opp, const Sizing& sizing) {
    if (!(sizing.quantity > 0)) {
        return fmt::format("Quantity must be positive, got {:.4f}", sizing.quantity);
    }
    for (const auto* leg : {&opp.away_leg, &opp.home_leg}) {
        double p = leg->native_price();
        if (!(p > 0.0 && p < 1.0)) {
            return fmt::format("{} leg price {:.4f} outside (0, 1)", leg->code, p);
        }
    }
    if (!opp.is_cross_venue()) {
        return std::string("Both legs on the same venue");
    }
    return std::nullopt;
}

PlaceOrderResponse ExecutionCoordinator::place_leg(const OpportunityLeg& leg, Quantity quantity) {
    PlaceOrderResponse response;

    VenueClient* client = venues_.get(leg.venue);
    if (!client) {
        response.error = "No client for " + venue_to_string(leg.venue);
        return response;
    }
    if (!client->is_ready()) {
        response.error = venue_to_string(leg.venue) + " client not ready";
        return response;
    }

    OrderRequest request;
    request.market_id = leg.market_id;
    request.side = ContractSide::YES;
    request.quantity = quantity;
    request.price = leg.native_price();
    request.outcome = leg.name.empty() ? leg.code : leg.name;

    response = client->place_order(request);
    if (response.success && response.order_id.empty()) {
        response.success = false;
        response.error = "Venue accepted order without an order id";
    }
    return response;
}

Leg ExecutionCoordinator::make_leg(const OpportunityLeg& leg, Quantity quantity,
                                   const PlaceOrderResponse& placed) const {
    Leg out;
    out.venue = leg.venue;
    out.code = leg.code;
    out.team = leg.name.empty() ? leg.code : leg.name;
    out.market_id = leg.market_id;
    out.url = leg.url;
    out.price = leg.raw_price;
    out.effective_price = leg.effective_price;
    out.fee_rate = leg.fee_rate;
    out.cost_usd = leg.effective_price * quantity / 100.0;
    out.fee_usd = fees_.fee_usd(leg.venue, leg.raw_price, quantity);
    out.slippage_usd = fees_.slippage_usd(leg.raw_price, quantity);
    out.payout_if_win = quantity;
    out.order_id = placed.order_id;
    out.order_status = placed.status;
    return out;
}

Trade ExecutionCoordinator::make_trade(const Opportunity& opp, const Sizing& sizing,
                                       const PlaceOrderResponse& first,
                                       const PlaceOrderResponse& second,
                                       WallClock now) const {
    Trade trade;
    trade.id = opp.pair_id;
    trade.display_name = opp.display_name;
    trade.sport = opp.sport;
    trade.game_time = opp.game_time;
    trade.arb_type = opp.quality;
    trade.legs[0] = make_leg(opp.away_leg, sizing.quantity, first);
    trade.legs[1] = make_leg(opp.home_leg, sizing.quantity, second);

    trade.quantity = sizing.quantity;
    trade.total_effective_cost = opp.total_effective_cost;
    trade.bet_amount = bet_amount_;
    trade.cost_usd = sizing.cost_usd;
    trade.expected_payout = sizing.quantity;
    trade.expected_profit = sizing.profit_usd;
    trade.roi_percent = sizing.roi_percent;
    trade.total_fees = trade.legs[0].fee_usd + trade.legs[1].fee_usd;
    trade.total_slippage = trade.legs[0].slippage_usd + trade.legs[1].slippage_usd;

    trade.status = TradeStatus::PENDING;
    trade.placed_at = now;
    return trade;
}

void ExecutionCoordinator::fail(ExecutionResult& result, Ledger& ledger, const std::string& trade_id,
                                PlacementState state, ErrorKind error, const std::string& reason,
                                WallClock now) {
    result.success = false;
    result.final_state = state;
    result.error = error;
    result.reason = reason;

    ledger.record_error(trade_id, reason, now);
    if (!store_.save(ledger)) {
        spdlog::warn("Could not persist error log entry for {}", trade_id);
    }
}

ExecutionResult ExecutionCoordinator::execute(const Opportunity& opp, const Sizing& sizing,
                                              Ledger& ledger, WallClock now) {
    ExecutionResult result;

    if (auto invalid = validate(opp, sizing)) {
        result.final_state = PlacementState::REJECTED;
        result.error = ErrorKind::INVALID_INPUT;
        result.reason = *invalid;
        spdlog::warn("Execution of {} rejected: {}", opp.pair_id, result.reason);
        return result;
    }

    spdlog::info("Executing {}: {} {}@{:.2f} + {} {}@{:.2f} x {:.2f} units, cost=${:.2f}",
                 opp.pair_id,
                 opp.away_leg.code, venue_to_string(opp.away_leg.venue), opp.away_leg.raw_price,
                 opp.home_leg.code, venue_to_string(opp.home_leg.venue), opp.home_leg.raw_price,
                 sizing.quantity, sizing.cost_usd);

    // Leg 1
    auto first = place_leg(opp.away_leg, sizing.quantity);
    if (!first.success) {
        std::string reason = fmt::format("Leg 1 ({} {}) placement failed: {}",
                                         venue_to_string(opp.away_leg.venue),
                                         opp.away_leg.market_id, first.error);
        spdlog::error("{}: {}", opp.pair_id, reason);
        fail(result, ledger, opp.pair_id, PlacementState::LEG1_FAILED,
             ErrorKind::PLACEMENT_FAILED, reason, now);
        return result;
    }

    // Leg 2
    auto second = place_leg(opp.home_leg, sizing.quantity);
    if (!second.success) {
        std::string reason = fmt::format("Leg 2 ({} {}) placement failed: {}",
                                         venue_to_string(opp.home_leg.venue),
                                         opp.home_leg.market_id, second.error);
        spdlog::error("{}: {}, canceling leg 1 order {}", opp.pair_id, reason, first.order_id);

        // Exactly one compensating cancel, no retry
        result.compensation_attempted = true;
        VenueClient* client = venues_.get(opp.away_leg.venue);
        CancelResponse cancel = client ? client->cancel_order(first.order_id) : CancelResponse{};
        result.compensation_succeeded = cancel.success;

        PlacementState state = PlacementState::UNWOUND;
        if (!cancel.success) {
            state = PlacementState::ORPHANED;
            reason += fmt::format("; cancel of leg 1 order {} on {} FAILED ({}), orphaned position "
                                  "needs manual reconciliation",
                                  first.order_id, venue_to_string(opp.away_leg.venue), cancel.error);
            spdlog::critical("{}: {}", opp.pair_id, reason);
        } else {
            reason += fmt::format("; leg 1 order {} canceled", first.order_id);
        }

        fail(result, ledger, opp.pair_id, state, ErrorKind::PLACEMENT_FAILED, reason, now);
        return result;
    }

    // Both legs live
    Trade trade = make_trade(opp, sizing, first, second, now);
    if (!ledger.append_trade(trade)) {
        // Nothing debited yet
        std::string reason = fmt::format("Both legs placed ({} / {}) but trade could not be appended",
                                         first.order_id, second.order_id);
        spdlog::critical("{}: {}", opp.pair_id, reason);
        fail(result, ledger, opp.pair_id, PlacementState::ORPHANED,
             ErrorKind::PERSISTENCE_FAILED, reason, now);
        return result;
    }

    ledger.debit(trade.cost_usd);
    ledger.record_daily_trade(trade.id, now);

    result.success = true;
    result.final_state = PlacementState::PLACED;
    result.trade = trade;

    spdlog::info("Trade {} placed: {:.2f} units, cost=${:.2f}, expected_profit=${:.2f}, roi={:.2f}%, "
                 "balance=${:.2f}",
                 trade.id, trade.quantity, trade.cost_usd, trade.expected_profit,
                 trade.roi_percent, ledger.balance);

    result.persisted = persist(ledger, trade.id, now);
    if (!result.persisted) {
        result.error = ErrorKind::PERSISTENCE_FAILED;
        result.reason = "Trade placed but ledger could not be saved";
    }
    return result;
}

bool ExecutionCoordinator::persist(Ledger& ledger, const std::string& trade_id, WallClock now) {
    int attempts = std::max(1, config_.persist_retries);

    for (int attempt = 1; attempt <= attempts; ++attempt) {
        if (store_.save(ledger)) {
            return true;
        }
        spdlog::warn("Ledger save failed for {} (attempt {}/{})", trade_id, attempt, attempts);
        if (attempt < attempts && config_.persist_retry_backoff_ms > 0) {
            std::this_thread::sleep_for(
                std::chrono::milliseconds(config_.persist_retry_backoff_ms * attempt));
        }
    }

    // In-memory trade and debit stay; the next successful save carries them
    std::string reason = fmt::format("Ledger persistence failed after {} attempts; "
                                     "in-memory state holds committed trade", attempts);
    spdlog::critical("{}: {}", trade_id, reason);
    ledger.record_error(trade_id, reason, now);
    return false;
}

} // namespace crossarb
