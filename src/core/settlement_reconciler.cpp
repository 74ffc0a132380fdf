#include "core/settlement_reconciler.hpp"
#include "utils/time_utils.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <future>
#include <map>
#include <system_error>
#include <utility>

namespace crossarb {

SettlementReconciler::SettlementReconciler(VenueRegistry& venues, const ExecutionConfig& config)
    : venues_(venues)
    , timeout_hours_(config.settlement_timeout_hours)
    , max_in_flight_(static_cast<size_t>(std::max(1, config.settlement_concurrency)))
{
    spdlog::info("SettlementReconciler initialized: timeout={:.1f}h, concurrency={}",
                 timeout_hours_, max_in_flight_);
}

std::vector<SettlementReconciler::LegQuery> SettlementReconciler::collect(const Ledger& ledger) const {
    std::vector<LegQuery> queries;

    for (size_t i = 0; i < ledger.trades.size(); ++i) {
        const auto& trade = ledger.trades[i];
        if (trade.status != TradeStatus::PENDING) continue;

        for (size_t l = 0; l < trade.legs.size(); ++l) {
            LegQuery q;
            q.trade_index = i;
            q.trade_id = trade.id;
            q.leg_index = l;
            q.venue = trade.legs[l].venue;
            q.market_id = trade.legs[l].market_id;
            queries.push_back(std::move(q));
        }
    }
    return queries;
}

SettlementStatus SettlementReconciler::query(const LegQuery& q) const {
    VenueClient* client = venues_.get(q.venue);
    if (!client) {
        SettlementStatus status;
        status.error = "No client for " + venue_to_string(q.venue);
        return status;
    }
    return client->get_settlement_status(q.market_id);
}

std::vector<SettlementReconciler::LegStatus> SettlementReconciler::poll(
    const std::vector<LegQuery>& queries) const {

    std::vector<LegStatus> statuses(queries.size());
    for (size_t i = 0; i < queries.size(); ++i) {
        statuses[i].query = queries[i];
    }

    // At most max_in_flight_ queries run at once
    for (size_t start = 0; start < queries.size(); start += max_in_flight_) {
        size_t end = std::min(queries.size(), start + max_in_flight_);

        std::vector<std::pair<size_t, std::future<SettlementStatus>>> batch;
        batch.reserve(end - start);
        for (size_t i = start; i < end; ++i) {
            try {
                const LegQuery& q = queries[i];
                batch.emplace_back(i, std::async(std::launch::async, [this, &q] { return query(q); }));
            } catch (const std::system_error& e) {
                statuses[i].status.error = fmt::format("Could not start settlement query: {}", e.what());
            }
        }

        for (auto& [i, pending] : batch) {
            try {
                statuses[i].status = pending.get();
            } catch (const std::exception& e) {
                statuses[i].status = SettlementStatus{};
                statuses[i].status.error = e.what();
            }
        }
    }
    return statuses;
}

ReconciliationReport SettlementReconciler::apply(Ledger& ledger, const std::vector<LegStatus>& statuses,
                                                 WallClock now) const {
    ReconciliationReport report;

    ledger.roll_daily_counters(now);

    // Group by trade, preserving ledger order
    std::map<size_t, std::vector<const LegStatus*>> by_trade;
    for (const auto& s : statuses) {
        by_trade[s.query.trade_index].push_back(&s);
    }

    for (const auto& [index, legs] : by_trade) {
        if (index >= ledger.trades.size()) continue;
        Trade& trade = ledger.trades[index];

        // Settled concurrently or replaced since collect()
        if (trade.id != legs.front()->query.trade_id || trade.status != TradeStatus::PENDING) {
            continue;
        }
        report.checked++;

        size_t resolved = 0;
        Usd payout = 0.0;

        for (const auto* ls : legs) {
            if (ls->query.leg_index >= trade.legs.size()) continue;
            const Leg& leg = trade.legs[ls->query.leg_index];

            if (!ls->status.error.empty()) {
                report.query_errors++;
                spdlog::warn("Settlement query for {} leg {} ({} {}) failed: {}",
                             trade.id, ls->query.leg_index + 1, venue_to_string(leg.venue),
                             leg.market_id, ls->status.error);
                ledger.record_error(trade.id, "Settlement query failed: " + ls->status.error, now);
                continue;
            }
            if (!ls->status.resolved) continue;

            // Resolved without a winner: this leg's market settled against it
            const std::string& winner = ls->status.winner;
            bool decided = winner.empty();
            for (const auto& l : trade.legs) {
                if (l.matches_winner(winner)) decided = true;
            }
            if (!decided) {
                spdlog::warn("{} leg {}: winner '{}' matches no outcome, leaving unresolved",
                             trade.id, ls->query.leg_index + 1, winner);
                continue;
            }

            resolved++;
            if (leg.matches_winner(winner)) {
                payout += trade.quantity;
            }
        }

        bool all_resolved = resolved == trade.legs.size();
        double age_hours = time_utils::hours_between(trade.placed_at, now);
        bool timed_out = resolved > 0 && !all_resolved && age_hours >= timeout_hours_;

        if (!all_resolved && !timed_out) {
            report.still_pending++;
            continue;
        }

        trade.status = all_resolved ? TradeStatus::SETTLED : TradeStatus::INCOMPLETE;
        trade.settled_at = now;
        trade.settlement_amount = payout;
        trade.realized_profit = payout - trade.cost_usd;
        ledger.credit(payout);
        report.payout_applied += payout;

        if (trade.realized_profit < 0) {
            ledger.add_daily_loss(trade.realized_profit);
        }

        if (all_resolved) {
            report.settled++;
            report.settled_ids.push_back(trade.id);
            spdlog::info("Trade {} settled: payout=${:.2f}, profit=${:.2f}, balance=${:.2f}",
                         trade.id, payout, trade.realized_profit, ledger.balance);
        } else {
            report.incomplete++;
            report.incomplete_ids.push_back(trade.id);
            std::string reason = fmt::format("Forced incomplete after {:.1f}h with {}/{} legs resolved",
                                             age_hours, resolved, trade.legs.size());
            ledger.record_error(trade.id, reason, now);
            spdlog::warn("Trade {} {}: payout=${:.2f}, profit=${:.2f}, balance=${:.2f}",
                         trade.id, reason, payout, trade.realized_profit, ledger.balance);
        }
    }

    return report;
}

ReconciliationReport SettlementReconciler::run_pass(Ledger& ledger, WallClock now) const {
    auto statuses = poll(collect(ledger));
    return apply(ledger, statuses, now);
}

} // namespace crossarb
