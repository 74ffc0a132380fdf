#pragma once

#include <atomic>
#include <map>
#include <mutex>
#include <string>
#include "venue/venue_client.hpp"

namespace crossarb {

/**
 * Venue stand-in for simulated mode. Orders fill immediately at the
 * requested price and cancels always succeed. Settlement results come from
 * a table supplied by the operator.
 */
class SimulatedVenueClient : public VenueClient {
public:
    explicit SimulatedVenueClient(Venue venue);

    Venue venue() const override { return venue_; }
    bool is_ready() const override { return true; }

    PlaceOrderResponse place_order(const OrderRequest& request) override;
    CancelResponse cancel_order(const std::string& order_id) override;
    OrderStatusResponse get_order_status(const std::string& order_id) override;
    SettlementStatus get_settlement_status(const std::string& market_id) override;

    void set_resolution(const std::string& market_id, bool resolved, const std::string& winner);

    /**
     * Load resolutions from a JSON object keyed by market id:
     *   {"KXNBA-LAL": {"resolved": true, "winner": "LAL"}, ...}
     * Returns the number of entries loaded. Throws std::runtime_error if the
     * file cannot be read or parsed.
     */
    size_t load_resolutions(const std::string& path);

    int orders_placed() const { return orders_placed_.load(); }

private:
    Venue venue_;
    std::atomic<int> orders_placed_{0};

    struct SimOrder {
        Quantity quantity{0.0};
        std::string status;
    };

    mutable std::mutex mutex_;
    std::map<std::string, SimOrder> orders_;
    std::map<std::string, SettlementStatus> resolutions_;
};

} // namespace crossarb
