#include "core/arbitrage_engine.hpp"
#include <spdlog/spdlog.h>

namespace crossarb {

ArbitrageEngine::ArbitrageEngine(const Config& config, VenueRegistry& venues,
                                 LedgerStore& store, Ledger ledger)
    : config_(config)
    , store_(store)
    , fees_(config.fees)
    , detector_(fees_)
    , risk_(config.risk)
    , coordinator_(venues, store, fees_, config.execution, config.risk.target_units)
    , reconciler_(venues, config.execution)
    , ledger_(std::move(ledger))
{
    spdlog::info("ArbitrageEngine initialized: mode={}, balance=${:.2f}, trades={}",
                 mode_to_string(config_.mode), ledger_.balance, ledger_.trades.size());
}

Ledger ArbitrageEngine::load_or_create(LedgerStore& store, const Config& config, WallClock now) {
    auto loaded = store.load();
    if (loaded) {
        return std::move(*loaded);
    }

    spdlog::info("No ledger found, starting fresh with ${:.2f}", config.initial_balance);
    Ledger fresh = Ledger::fresh(config.initial_balance, now);
    if (!store.save(fresh)) {
        spdlog::warn("Could not write initial ledger");
    }
    return fresh;
}

EvaluationResult ArbitrageEngine::evaluate(const OutcomePair& pair, WallClock now) {
    EvaluationResult result;
    result.pair_id = pair.pair_id();

    auto detection = detector_.detect(pair);
    if (!detection.found()) {
        result.stage = EvaluationStage::DETECTION;
        result.error = detection.error;
        result.reason = detection.reason;
        spdlog::debug("{}: no opportunity ({})", result.pair_id, detection.reason);
        return result;
    }
    result.opportunity = detection.opportunity;
    const Opportunity& opp = *result.opportunity;

    std::lock_guard<std::mutex> lock(mutex_);

    auto decision = risk_.evaluate(opp, ledger_, now);
    if (!decision.approved) {
        result.stage = EvaluationStage::RISK;
        result.error = ErrorKind::RISK_REJECTED;
        result.reason = decision.reason;
        if (decision.rejection == RiskRejection::DUPLICATE_TRADE) {
            spdlog::debug("{}: {}", result.pair_id, decision.reason);
        } else {
            spdlog::warn("{} ({}) rejected by risk: {}", result.pair_id,
                         quality_to_string(opp.quality), decision.reason);
        }
        return result;
    }
    result.sizing = decision.sizing;

    auto execution = coordinator_.execute(opp, decision.sizing, ledger_, now);
    result.persisted = execution.persisted;
    result.error = execution.error;
    result.reason = execution.reason;

    if (!execution.success) {
        result.stage = EvaluationStage::EXECUTION;
        return result;
    }

    result.stage = EvaluationStage::PLACED;
    result.trade = execution.trade;
    return result;
}

std::vector<EvaluationResult> ArbitrageEngine::evaluate_all(const std::vector<OutcomePair>& pairs,
                                                            WallClock now) {
    std::vector<EvaluationResult> results;
    results.reserve(pairs.size());

    int placed = 0;
    for (const auto& pair : pairs) {
        results.push_back(evaluate(pair, now));
        if (results.back().placed()) placed++;
    }

    spdlog::info("Evaluated {} outcome pairs, placed {} trades", pairs.size(), placed);
    return results;
}

ReconciliationReport ArbitrageEngine::run_settlement_pass(WallClock now) {
    std::vector<SettlementReconciler::LegQuery> queries;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        queries = reconciler_.collect(ledger_);
    }

    if (queries.empty()) {
        return ReconciliationReport{};
    }

    auto statuses = reconciler_.poll(queries);

    std::lock_guard<std::mutex> lock(mutex_);
    auto report = reconciler_.apply(ledger_, statuses, now);

    if (report.settled > 0 || report.incomplete > 0 || report.query_errors > 0) {
        coordinator_.persist(ledger_, "settlement", now);
    }

    spdlog::info("Settlement pass: checked={}, settled={}, incomplete={}, pending={}, payout=${:.2f}",
                 report.checked, report.settled, report.incomplete,
                 report.still_pending, report.payout_applied);
    return report;
}

bool ArbitrageEngine::reset(WallClock now) {
    std::lock_guard<std::mutex> lock(mutex_);
    ledger_ = Ledger::fresh(config_.initial_balance, now);
    spdlog::warn("Ledger reset to ${:.2f}", config_.initial_balance);
    return store_.save(ledger_);
}

LedgerSummary ArbitrageEngine::summary(WallClock now) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return ledger_.summary(now);
}

Ledger ArbitrageEngine::ledger_snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return ledger_;
}

} // namespace crossarb
