#include "market/probability_normalizer.hpp"
#include <cmath>
#include <algorithm>

namespace crossarb {

NormalizedPair normalize_probabilities(double away_raw, double home_raw) {
    NormalizedPair result;

    away_raw = std::max(0.0, away_raw);
    home_raw = std::max(0.0, home_raw);

    double total = away_raw + home_raw;
    if (total <= 0.0) {
        return result;
    }

    int away_floor = static_cast<int>(std::floor(away_raw / total * 100.0));
    int home_floor = static_cast<int>(std::floor(home_raw / total * 100.0));
    int remainder = 100 - (away_floor + home_floor);

    if (away_raw <= home_raw) {
        result.away = away_floor + remainder;
        result.home = home_floor;
    } else {
        result.away = away_floor;
        result.home = home_floor + remainder;
    }

    return result;
}

} // namespace crossarb
