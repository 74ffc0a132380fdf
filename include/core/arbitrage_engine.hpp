#pragma once

#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include "common/types.hpp"
#include "config/config.hpp"
#include "arbitrage/fee_model.hpp"
#include "arbitrage/opportunity_detector.hpp"
#include "core/settlement_reconciler.hpp"
#include "execution/execution_coordinator.hpp"
#include "market/outcome_pair.hpp"
#include "persistence/ledger.hpp"
#include "persistence/ledger_store.hpp"
#include "risk/risk_manager.hpp"
#include "venue/venue_client.hpp"

namespace crossarb {

enum class EvaluationStage {
    DETECTION,
    RISK,
    EXECUTION,
    PLACED
};

inline std::string evaluation_stage_to_string(EvaluationStage s) {
    switch (s) {
        case EvaluationStage::DETECTION: return "DETECTION";
        case EvaluationStage::RISK: return "RISK";
        case EvaluationStage::EXECUTION: return "EXECUTION";
        case EvaluationStage::PLACED: return "PLACED";
    }
    return "UNKNOWN";
}

/**
 * Outcome of evaluating one outcome pair: the stage reached and either the
 * reason it stopped there or the trade that was placed.
 */
struct EvaluationResult {
    std::string pair_id;
    EvaluationStage stage{EvaluationStage::DETECTION};
    ErrorKind error{ErrorKind::NONE};
    std::string reason;

    std::optional<Opportunity> opportunity;
    std::optional<Sizing> sizing;
    std::optional<Trade> trade;
    bool persisted{false};

    bool placed() const { return trade.has_value(); }
};

/**
 * Detector -> risk -> coordinator -> ledger, plus settlement.
 *
 * Every ledger mutation happens under one mutex. Evaluations are processed
 * one at a time; settlement queries run outside the lock and their results
 * are applied under it.
 *
 * Assumes it is the only process writing its ledger.
 */
class ArbitrageEngine {
public:
    ArbitrageEngine(const Config& config, VenueRegistry& venues, LedgerStore& store, Ledger ledger);

    // Stored ledger if present, otherwise a fresh one at the configured balance
    static Ledger load_or_create(LedgerStore& store, const Config& config, WallClock now);

    EvaluationResult evaluate(const OutcomePair& pair, WallClock now);
    std::vector<EvaluationResult> evaluate_all(const std::vector<OutcomePair>& pairs, WallClock now);

    ReconciliationReport run_settlement_pass(WallClock now);

    // Replace the ledger with a fresh one and persist it
    bool reset(WallClock now);

    LedgerSummary summary(WallClock now) const;
    Ledger ledger_snapshot() const;

private:
    Config config_;
    LedgerStore& store_;
    FeeModel fees_;
    OpportunityDetector detector_;
    RiskManager risk_;
    ExecutionCoordinator coordinator_;
    SettlementReconciler reconciler_;

    mutable std::mutex mutex_;
    Ledger ledger_;
};

} // namespace crossarb
