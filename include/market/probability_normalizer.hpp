#pragma once

#include <utility>

namespace crossarb {

/**
 * Integer probability pair that always sums to 100.
 */
struct NormalizedPair {
    int away{0};
    int home{0};
};

/**
 * Scales two non-negative raw values proportionally to 100 and floors both.
 * The whole remainder goes to the side with the smaller raw value; on a tie
 * it goes to the away side. Returns {0, 0} when both inputs are zero.
 *
 * Only meaningful for two-outcome markets. Callers must not apply it to
 * markets with a third outcome (draw), where forcing a two-way sum to 100
 * hides the third outcome's mass.
 */
NormalizedPair normalize_probabilities(double away_raw, double home_raw);

} // namespace crossarb
