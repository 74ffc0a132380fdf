#pragma once

#include <string>
#include <chrono>
#include <optional>
#include <cstdint>

namespace crossarb {

// Time types
using Timestamp = std::chrono::time_point<std::chrono::steady_clock>;
using WallClock = std::chrono::time_point<std::chrono::system_clock>;
using Duration = std::chrono::nanoseconds;

inline Timestamp now() {
    return std::chrono::steady_clock::now();
}

inline WallClock wall_now() {
    return std::chrono::system_clock::now();
}

inline int64_t now_ms() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()
    ).count();
}

// Prices are quoted on the 0-100 scale (cents per $1 payout unit).
// Venues take orders on the native 0-1 scale.
using Price = double;
using Quantity = double;
using Usd = double;

// Trading venues
enum class Venue {
    POLYMARKET,
    KALSHI
};

inline std::string venue_to_string(Venue v) {
    switch (v) {
        case Venue::POLYMARKET: return "Polymarket";
        case Venue::KALSHI: return "Kalshi";
    }
    return "Unknown";
}

inline std::optional<Venue> venue_from_string(const std::string& s) {
    if (s == "Polymarket" || s == "polymarket" || s == "POLYMARKET") return Venue::POLYMARKET;
    if (s == "Kalshi" || s == "kalshi" || s == "KALSHI") return Venue::KALSHI;
    return std::nullopt;
}

// Contract side of a binary market
enum class ContractSide {
    YES,
    NO
};

inline std::string contract_side_to_string(ContractSide s) {
    return s == ContractSide::YES ? "Yes" : "No";
}

// Trading mode
enum class TradingMode {
    SIMULATED,  // Same engine, fills assumed immediate, no venue calls
    LIVE        // Real orders
};

inline std::string mode_to_string(TradingMode m) {
    switch (m) {
        case TradingMode::SIMULATED: return "SIMULATED";
        case TradingMode::LIVE: return "LIVE";
    }
    return "UNKNOWN";
}

inline std::optional<TradingMode> mode_from_string(const std::string& s) {
    if (s == "simulated" || s == "paper" || s == "SIMULATED") return TradingMode::SIMULATED;
    if (s == "live" || s == "LIVE") return TradingMode::LIVE;
    return std::nullopt;
}

// Engine outcome taxonomy
enum class ErrorKind {
    NONE,
    INVALID_INPUT,       // Bad price/quantity or non-cross-venue pairing
    NO_OPPORTUNITY,      // Prices do not qualify
    RISK_REJECTED,       // Limits, ROI or duplicate trade
    PLACEMENT_FAILED,    // A venue refused or timed out a leg
    PERSISTENCE_FAILED   // Ledger save failed after placement
};

inline std::string error_kind_to_string(ErrorKind k) {
    switch (k) {
        case ErrorKind::NONE: return "NONE";
        case ErrorKind::INVALID_INPUT: return "INVALID_INPUT";
        case ErrorKind::NO_OPPORTUNITY: return "NO_OPPORTUNITY";
        case ErrorKind::RISK_REJECTED: return "RISK_REJECTED";
        case ErrorKind::PLACEMENT_FAILED: return "PLACEMENT_FAILED";
        case ErrorKind::PERSISTENCE_FAILED: return "PERSISTENCE_FAILED";
    }
    return "UNKNOWN";
}

} // namespace crossarb
