#pragma once

#include <map>
#include <memory>
#include <string>
#include "common/types.hpp"

namespace crossarb {

struct OrderRequest {
    std::string market_id;
    ContractSide side{ContractSide::YES};
    Quantity quantity{0.0};      // Payout units (contracts)
    double price{0.0};           // Native venue scale, strictly within (0, 1)
    std::string outcome;         // Outcome label, for venues quoting several outcomes per market
};

struct PlaceOrderResponse {
    bool success{false};
    std::string order_id;
    std::string status;
    double filled{0.0};
    std::string error;
};

struct CancelResponse {
    bool success{false};
    WallClock cancelled_at;
    std::string error;
};

struct OrderStatusResponse {
    bool success{false};
    std::string status;
    double filled{0.0};
    double remaining{0.0};
    std::string error;
};

struct SettlementStatus {
    bool resolved{false};
    std::string winner;          // Empty when unresolved or no outcome matched
    std::string error;           // Query failure; treated as unresolved
};

/**
 * Order placement, cancellation and settlement queries for one venue.
 *
 * Implementations never throw: transport, HTTP and parse failures come back
 * as success=false with an error. Authentication is internal to each client.
 */
class VenueClient {
public:
    virtual ~VenueClient() = default;

    virtual Venue venue() const = 0;

    // Credentials present and usable
    virtual bool is_ready() const = 0;

    virtual PlaceOrderResponse place_order(const OrderRequest& request) = 0;
    virtual CancelResponse cancel_order(const std::string& order_id) = 0;
    virtual OrderStatusResponse get_order_status(const std::string& order_id) = 0;
    virtual SettlementStatus get_settlement_status(const std::string& market_id) = 0;
};

/**
 * One client per venue.
 */
class VenueRegistry {
public:
    void add(std::shared_ptr<VenueClient> client) {
        Venue v = client->venue();
        clients_[v] = std::move(client);
    }

    VenueClient* get(Venue venue) const {
        auto it = clients_.find(venue);
        return it != clients_.end() ? it->second.get() : nullptr;
    }

    bool has(Venue venue) const { return clients_.count(venue) > 0; }

private:
    std::map<Venue, std::shared_ptr<VenueClient>> clients_;
};

} // namespace crossarb
