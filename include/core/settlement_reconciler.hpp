#pragma once

#include <string>
#include <vector>
#include "common/types.hpp"
#include "config/config.hpp"
#include "persistence/ledger.hpp"
#include "venue/venue_client.hpp"

namespace crossarb {

struct ReconciliationReport {
    int checked{0};
    int settled{0};
    int incomplete{0};
    int still_pending{0};
    int query_errors{0};
    Usd payout_applied{0.0};
    std::vector<std::string> settled_ids;
    std::vector<std::string> incomplete_ids;
};

/**
 * Settles pending trades from venue resolution data.
 *
 * A pass is split so the engine can query venues without holding its lock:
 *   collect()  snapshot of legs to query        (under lock)
 *   poll()     concurrent settlement queries    (no lock, bounded batches)
 *   apply()    status and balance updates       (under lock)
 *
 * A leg counts as resolved when its venue reports resolved and either names
 * a winner matching one of the trade's outcomes or names none, meaning the
 * leg's own market settled against it. A winner matching neither outcome
 * leaves the leg unresolved. Each leg whose outcome won pays `quantity`. A trade settles when every leg is resolved in the same
 * pass; once the settlement timeout has elapsed with some but not all legs
 * resolved, it is closed as incomplete with only the resolved payout.
 * Only pending trades are touched, so re-running a pass is idempotent.
 */
class SettlementReconciler {
public:
    struct LegQuery {
        size_t trade_index{0};
        std::string trade_id;
        size_t leg_index{0};
        Venue venue{Venue::POLYMARKET};
        std::string market_id;
    };

    struct LegStatus {
        LegQuery query;
        SettlementStatus status;
    };

    SettlementReconciler(VenueRegistry& venues, const ExecutionConfig& config);

    std::vector<LegQuery> collect(const Ledger& ledger) const;
    std::vector<LegStatus> poll(const std::vector<LegQuery>& queries) const;
    ReconciliationReport apply(Ledger& ledger, const std::vector<LegStatus>& statuses,
                               WallClock now) const;

    // collect + poll + apply on the calling thread
    ReconciliationReport run_pass(Ledger& ledger, WallClock now) const;

private:
    VenueRegistry& venues_;
    double timeout_hours_;
    size_t max_in_flight_;

    SettlementStatus query(const LegQuery& q) const;
};

} // namespace crossarb
