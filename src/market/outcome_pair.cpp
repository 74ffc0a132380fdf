#include "market/outcome_pair.hpp"
#include <spdlog/spdlog.h>
#include <fstream>
#include <cmath>
#include <stdexcept>

namespace crossarb {

std::string OutcomePair::display_name() const {
    std::string away_name = away.name.empty() ? away.code : away.name;
    std::string home_name = home.name.empty() ? home.code : home.name;
    return away_name + " vs " + home_name;
}

namespace {

bool valid_price(const nlohmann::json& v) {
    if (!v.is_number()) return false;
    double p = v.get<double>();
    return std::isfinite(p) && p >= 0.0 && p <= 100.0;
}

std::optional<std::string> parse_side(const nlohmann::json& j, const char* key, OutcomeSide& out) {
    if (!j.contains(key) || !j[key].is_object()) {
        return fmt::format("missing '{}' outcome", key);
    }
    const auto& side = j[key];
    out.code = side.value("code", "");
    out.name = side.value("name", "");
    if (out.code.empty()) {
        return fmt::format("missing '{}.code'", key);
    }
    return std::nullopt;
}

std::optional<std::string> parse_quote(const nlohmann::json& q, bool three_way, VenueQuote& out) {
    if (!q.is_object()) {
        return std::string("quote is not an object");
    }

    auto venue = venue_from_string(q.value("venue", ""));
    if (!venue) {
        return fmt::format("unknown venue '{}'", q.value("venue", ""));
    }
    out.venue = *venue;

    if (!q.contains("away_price") || !valid_price(q["away_price"]) ||
        !q.contains("home_price") || !valid_price(q["home_price"])) {
        return fmt::format("{} prices missing or outside [0, 100]", venue_to_string(out.venue));
    }
    out.away_price = q["away_price"].get<double>();
    out.home_price = q["home_price"].get<double>();

    out.away_market_id = q.value("away_market_id", "");
    out.home_market_id = q.value("home_market_id", "");
    if (out.away_market_id.empty() || out.home_market_id.empty()) {
        return fmt::format("{} market ids missing", venue_to_string(out.venue));
    }
    out.url = q.value("url", "");

    if (!three_way) {
        out.normalized = normalize_probabilities(out.away_price, out.home_price);
    }
    return std::nullopt;
}

} // namespace

OutcomePairParseResult parse_outcome_pair(const nlohmann::json& j) {
    OutcomePairParseResult result;

    if (!j.is_object()) {
        result.error = "record is not an object";
        return result;
    }

    OutcomePair pair;
    try {
        if (auto err = parse_side(j, "away", pair.away)) {
            result.error = *err;
            return result;
        }
        if (auto err = parse_side(j, "home", pair.home)) {
            result.error = *err;
            return result;
        }
        if (pair.away.code == pair.home.code) {
            result.error = "away and home codes are identical";
            return result;
        }

        pair.sport = j.value("sport", "unknown");
        pair.game_time = j.value("game_time", "");
        pair.three_way = j.value("three_way", false);

        if (!j.contains("quotes") || !j["quotes"].is_array() || j["quotes"].size() != 2) {
            result.error = "expected exactly two venue quotes";
            return result;
        }
        if (auto err = parse_quote(j["quotes"][0], pair.three_way, pair.first)) {
            result.error = *err;
            return result;
        }
        if (auto err = parse_quote(j["quotes"][1], pair.three_way, pair.second)) {
            result.error = *err;
            return result;
        }
        if (pair.first.venue == pair.second.venue) {
            result.error = "both quotes come from the same venue";
            return result;
        }
    } catch (const nlohmann::json::exception& e) {
        result.error = fmt::format("malformed record: {}", e.what());
        return result;
    }

    result.pair = std::move(pair);
    return result;
}

std::vector<OutcomePair> load_outcome_pairs(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to open feed file: " + path);
    }

    nlohmann::json j;
    try {
        file >> j;
    } catch (const nlohmann::json::exception& e) {
        throw std::runtime_error("Malformed feed file " + path + ": " + e.what());
    }
    if (!j.is_array()) {
        throw std::runtime_error("Feed file must contain a JSON array: " + path);
    }

    std::vector<OutcomePair> pairs;
    for (size_t i = 0; i < j.size(); ++i) {
        auto parsed = parse_outcome_pair(j[i]);
        if (!parsed.ok()) {
            spdlog::warn("Skipping feed record {}: {}", i, parsed.error);
            continue;
        }
        pairs.push_back(std::move(*parsed.pair));
    }

    spdlog::info("Loaded {} outcome pairs from {}", pairs.size(), path);
    return pairs;
}

} // namespace crossarb
