#include "venue/simulated_venue_client.hpp"
#include <spdlog/spdlog.h>
#include <nlohmann/json.hpp>
#include <fstream>
#include <stdexcept>

namespace crossarb {

SimulatedVenueClient::SimulatedVenueClient(Venue venue)
    : venue_(venue)
{
    spdlog::info("SimulatedVenueClient initialized for {}", venue_to_string(venue_));
}

PlaceOrderResponse SimulatedVenueClient::place_order(const OrderRequest& request) {
    PlaceOrderResponse response;

    if (request.quantity <= 0 || request.price <= 0.0 || request.price >= 1.0) {
        response.error = fmt::format("Invalid order: qty={:.2f}, price={:.4f}",
                                     request.quantity, request.price);
        return response;
    }

    int seq = ++orders_placed_;
    response.order_id = fmt::format("SIM-{}-{}-{}", venue_to_string(venue_), now_ms(), seq);
    response.status = "filled";
    response.filled = request.quantity;
    response.success = true;

    {
        std::lock_guard<std::mutex> lock(mutex_);
        orders_[response.order_id] = SimOrder{request.quantity, response.status};
    }

    spdlog::debug("[SIM] {} BUY {} {:.2f} @ {:.4f} -> {}", venue_to_string(venue_),
                  request.market_id, request.quantity, request.price, response.order_id);
    return response;
}

CancelResponse SimulatedVenueClient::cancel_order(const std::string& order_id) {
    CancelResponse response;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = orders_.find(order_id);
        if (it != orders_.end()) {
            it->second.status = "canceled";
        }
    }
    response.success = true;
    response.cancelled_at = wall_now();
    return response;
}

OrderStatusResponse SimulatedVenueClient::get_order_status(const std::string& order_id) {
    OrderStatusResponse response;

    std::lock_guard<std::mutex> lock(mutex_);
    auto it = orders_.find(order_id);
    if (it == orders_.end()) {
        response.error = "Unknown order " + order_id;
        return response;
    }

    response.success = true;
    response.status = it->second.status;
    response.filled = it->second.quantity;
    response.remaining = 0.0;
    return response;
}

SettlementStatus SimulatedVenueClient::get_settlement_status(const std::string& market_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = resolutions_.find(market_id);
    if (it == resolutions_.end()) {
        return SettlementStatus{};
    }
    return it->second;
}

void SimulatedVenueClient::set_resolution(const std::string& market_id, bool resolved,
                                          const std::string& winner) {
    std::lock_guard<std::mutex> lock(mutex_);
    SettlementStatus status;
    status.resolved = resolved;
    status.winner = winner;
    resolutions_[market_id] = status;
}

size_t SimulatedVenueClient::load_resolutions(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to open resolutions file: " + path);
    }

    nlohmann::json j;
    try {
        file >> j;
    } catch (const nlohmann::json::exception& e) {
        throw std::runtime_error("Malformed resolutions file " + path + ": " + e.what());
    }
    if (!j.is_object()) {
        throw std::runtime_error("Resolutions file must contain a JSON object: " + path);
    }

    size_t loaded = 0;
    for (auto it = j.begin(); it != j.end(); ++it) {
        if (!it.value().is_object()) {
            spdlog::warn("Skipping resolution for {}: not an object", it.key());
            continue;
        }
        std::string winner;
        const auto& w = it.value().contains("winner") ? it.value()["winner"] : nlohmann::json();
        if (w.is_string()) {
            winner = w.get<std::string>();
        }
        set_resolution(it.key(), it.value().value("resolved", false), winner);
        ++loaded;
    }

    spdlog::info("[SIM] {} loaded {} settlement results from {}",
                 venue_to_string(venue_), loaded, path);
    return loaded;
}

} // namespace crossarb
