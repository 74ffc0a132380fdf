#pragma once

#include <string>
#include <optional>
#include <nlohmann/json.hpp>
#include "venue/venue_client.hpp"
#include "utils/http_client.hpp"

namespace crossarb {

/**
 * Kalshi trade API client.
 *
 * Every request is signed with RSA-PSS/SHA-256 over
 * timestamp_ms + METHOD + /trade-api/v2 + path.
 */
class KalshiClient : public VenueClient {
public:
    static constexpr const char* SIGNING_PREFIX = "/trade-api/v2";

    struct Credentials {
        std::string key_id;
        std::string private_key_pem;

        bool complete() const { return !key_id.empty() && !private_key_pem.empty(); }

        // KALSHI_API_KEY_ID plus KALSHI_PRIVATE_KEY (PEM, "\n" escapes allowed)
        // or KALSHI_PRIVATE_KEY_PATH
        static Credentials from_environment();
    };

    struct Config {
        std::string api_url{"https://api.elections.kalshi.com/trade-api/v2"};
        long timeout_ms{10000};
    };

    KalshiClient(const Config& config, const Credentials& credentials);

    Venue venue() const override { return Venue::KALSHI; }
    bool is_ready() const override { return credentials_.complete(); }

    PlaceOrderResponse place_order(const OrderRequest& request) override;
    CancelResponse cancel_order(const std::string& order_id) override;
    OrderStatusResponse get_order_status(const std::string& order_id) override;
    SettlementStatus get_settlement_status(const std::string& ticker) override;

    static std::string signing_message(const std::string& timestamp_ms, const std::string& method,
                                       const std::string& path);

    // "KXNBAGAME-25OCT21LALGSW-LAL" -> "LAL"
    static std::string ticker_outcome(const std::string& ticker);

private:
    Config config_;
    Credentials credentials_;
    HttpClient http_;

    struct ApiResult {
        bool success{false};
        nlohmann::json data;
        std::string error;
    };

    ApiResult call(const std::string& method, const std::string& path,
                   const std::string& body = "") const;
};

} // namespace crossarb
