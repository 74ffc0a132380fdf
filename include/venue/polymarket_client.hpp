#pragma once

#include <string>
#include <optional>
#include <nlohmann/json.hpp>
#include "venue/venue_client.hpp"
#include "utils/http_client.hpp"

namespace crossarb {

/**
 * Polymarket CLOB client.
 *
 * Authenticated calls carry L2 headers (POLY_ADDRESS, POLY_SIGNATURE,
 * POLY_TIMESTAMP, POLY_API_KEY, POLY_PASSPHRASE). The L2 credentials are
 * derived beforehand from a wallet-signed attestation; this client only
 * consumes them.
 */
class PolymarketClient : public VenueClient {
public:
    struct Credentials {
        std::string api_key;
        std::string api_secret;     // base64
        std::string passphrase;
        std::string address;

        bool complete() const {
            return !api_key.empty() && !api_secret.empty() &&
                   !passphrase.empty() && !address.empty();
        }

        // POLYMARKET_API_KEY, POLYMARKET_API_SECRET, POLYMARKET_API_PASSPHRASE, POLYMARKET_ADDRESS
        static Credentials from_environment();
    };

    struct Config {
        std::string clob_url{"https://clob.polymarket.com"};
        int chain_id{137};
        long timeout_ms{10000};
    };

    PolymarketClient(const Config& config, const Credentials& credentials);

    Venue venue() const override { return Venue::POLYMARKET; }
    bool is_ready() const override { return credentials_.complete(); }

    PlaceOrderResponse place_order(const OrderRequest& request) override;
    CancelResponse cancel_order(const std::string& order_id) override;
    OrderStatusResponse get_order_status(const std::string& order_id) override;
    SettlementStatus get_settlement_status(const std::string& market_id) override;

    // Message signed for an L2 request: timestamp + METHOD + path (+ body)
    static std::string l2_message(const std::string& timestamp, const std::string& method,
                                  const std::string& path, const std::string& body);

private:
    Config config_;
    Credentials credentials_;
    HttpClient http_;

    HttpClient::Headers l2_headers(const std::string& method, const std::string& path,
                                   const std::string& body) const;
    std::optional<nlohmann::json> fetch_market(const std::string& market_id, std::string& error) const;
    std::optional<std::string> resolve_token(const nlohmann::json& market, const OrderRequest& request) const;
};

} // namespace crossarb
