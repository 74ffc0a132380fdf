#include "venue/polymarket_client.hpp"
#include "config/config.hpp"
#include "utils/crypto.hpp"
#include <spdlog/spdlog.h>
#include <chrono>

namespace crossarb {

PolymarketClient::Credentials PolymarketClient::Credentials::from_environment() {
    Credentials c;
    c.api_key = crossarb::Config::get_env("POLYMARKET_API_KEY");
    c.api_secret = crossarb::Config::get_env("POLYMARKET_API_SECRET");
    c.passphrase = crossarb::Config::get_env("POLYMARKET_API_PASSPHRASE");
    c.address = crossarb::Config::get_env("POLYMARKET_ADDRESS");
    return c;
}

PolymarketClient::PolymarketClient(const Config& config, const Credentials& credentials)
    : config_(config)
    , credentials_(credentials)
    , http_(config.timeout_ms)
{
    if (credentials_.complete()) {
        spdlog::info("PolymarketClient initialized: url={}, chain_id={}, key={}...",
                     config_.clob_url, config_.chain_id, credentials_.api_key.substr(0, 8));
    } else {
        spdlog::warn("PolymarketClient initialized without L2 credentials; orders will be refused");
    }
}

std::string PolymarketClient::l2_message(const std::string& timestamp, const std::string& method,
                                         const std::string& path, const std::string& body) {
    return timestamp + method + path + body;
}

HttpClient::Headers PolymarketClient::l2_headers(const std::string& method, const std::string& path,
                                                 const std::string& body) const {
    std::string timestamp = std::to_string(
        std::chrono::duration_cast<std::chrono::seconds>(
            std::chrono::system_clock::now().time_since_epoch()).count());

    std::string signature = crypto::polymarket_l2_signature(
        credentials_.api_secret, l2_message(timestamp, method, path, body));

    return {
        {"POLY_ADDRESS", credentials_.address},
        {"POLY_SIGNATURE", signature},
        {"POLY_TIMESTAMP", timestamp},
        {"POLY_API_KEY", credentials_.api_key},
        {"POLY_PASSPHRASE", credentials_.passphrase}
    };
}

std::optional<nlohmann::json> PolymarketClient::fetch_market(const std::string& market_id,
                                                              std::string& error) const {
    auto response = http_.get(config_.clob_url + "/markets/" + market_id);
    if (!response.ok()) {
        error = response.error.empty()
            ? fmt::format("HTTP {} fetching market {}", response.status, market_id)
            : response.error;
        return std::nullopt;
    }

    try {
        return nlohmann::json::parse(response.body);
    } catch (const nlohmann::json::exception& e) {
        error = fmt::format("Malformed market response: {}", e.what());
        return std::nullopt;
    }
}

// Team markets list one token per team; plain binary markets list Yes/No
std::optional<std::string> PolymarketClient::resolve_token(const nlohmann::json& market,
                                                           const OrderRequest& request) const {
    if (!market.contains("tokens") || !market["tokens"].is_array()) {
        return std::nullopt;
    }

    std::string side_label = contract_side_to_string(request.side);
    std::optional<std::string> by_side;

    for (const auto& token : market["tokens"]) {
        std::string outcome = token.value("outcome", "");
        std::string token_id = token.value("token_id", "");
        if (token_id.empty()) continue;

        if (!request.outcome.empty() && outcome == request.outcome) {
            return token_id;
        }
        if (outcome == side_label) {
            by_side = token_id;
        }
    }
    return by_side;
}

PlaceOrderResponse PolymarketClient::place_order(const OrderRequest& request) {
    PlaceOrderResponse response;

    if (!is_ready()) {
        response.error = "Polymarket L2 credentials not configured";
        return response;
    }

    try {
        std::string error;
        auto market = fetch_market(request.market_id, error);
        if (!market) {
            response.error = error;
            return response;
        }

        auto token_id = resolve_token(*market, request);
        if (!token_id) {
            response.error = fmt::format("No token for outcome '{}' in market {}",
                                         request.outcome, request.market_id);
            return response;
        }

        nlohmann::json body = {
            {"order", {
                {"tokenID", *token_id},
                {"price", request.price},
                {"size", request.quantity},
                {"side", "BUY"}
            }},
            {"owner", credentials_.api_key},
            {"orderType", "FOK"}
        };
        std::string payload = body.dump();

        auto result = http_.request("POST", config_.clob_url + "/order",
                                    l2_headers("POST", "/order", payload), payload);
        if (!result.error.empty()) {
            response.error = result.error;
            return response;
        }

        auto j = nlohmann::json::parse(result.body);
        std::string order_id = j.value("orderID", j.value("orderId", ""));
        if (!result.ok() || order_id.empty() || !j.value("success", true)) {
            response.error = j.value("errorMsg", j.value("error", fmt::format("HTTP {}", result.status)));
            return response;
        }

        response.success = true;
        response.order_id = order_id;
        response.status = j.value("status", "");
        response.filled = response.status == "matched" ? request.quantity : 0.0;

    } catch (const std::exception& e) {
        response.error = e.what();
    }

    if (!response.success) {
        spdlog::error("Polymarket order on {} failed: {}", request.market_id, response.error);
    }
    return response;
}

CancelResponse PolymarketClient::cancel_order(const std::string& order_id) {
    CancelResponse response;

    if (!is_ready()) {
        response.error = "Polymarket L2 credentials not configured";
        return response;
    }

    try {
        std::string payload = nlohmann::json{{"orderID", order_id}}.dump();
        auto result = http_.request("DELETE", config_.clob_url + "/order",
                                    l2_headers("DELETE", "/order", payload), payload);
        if (!result.ok()) {
            response.error = result.error.empty() ? fmt::format("HTTP {}: {}", result.status, result.body)
                                                  : result.error;
            return response;
        }

        auto j = nlohmann::json::parse(result.body);
        bool canceled = false;
        if (j.contains("canceled") && j["canceled"].is_array()) {
            for (const auto& id : j["canceled"]) {
                if (id.is_string() && id.get<std::string>() == order_id) {
                    canceled = true;
                }
            }
        }
        if (!canceled) {
            response.error = "Order not canceled: " + result.body;
            return response;
        }

        response.success = true;
        response.cancelled_at = wall_now();

    } catch (const std::exception& e) {
        response.error = e.what();
    }
    return response;
}

OrderStatusResponse PolymarketClient::get_order_status(const std::string& order_id) {
    OrderStatusResponse response;

    if (!is_ready()) {
        response.error = "Polymarket L2 credentials not configured";
        return response;
    }

    try {
        std::string path = "/data/order/" + order_id;
        auto result = http_.request("GET", config_.clob_url + path, l2_headers("GET", path, ""));
        if (!result.ok()) {
            response.error = result.error.empty() ? fmt::format("HTTP {}", result.status) : result.error;
            return response;
        }

        auto j = nlohmann::json::parse(result.body);
        auto number = [&j](const char* key) {
            if (!j.contains(key)) return 0.0;
            const auto& v = j[key];
            return v.is_string() ? std::stod(v.get<std::string>()) : v.get<double>();
        };

        double original = number("original_size");
        response.success = true;
        response.status = j.value("status", "");
        response.filled = number("size_matched");
        response.remaining = original - response.filled;

    } catch (const std::exception& e) {
        response.error = e.what();
    }
    return response;
}

SettlementStatus PolymarketClient::get_settlement_status(const std::string& market_id) {
    SettlementStatus status;

    try {
        auto market = fetch_market(market_id, status.error);
        if (!market) {
            return status;
        }

        if (!market->value("closed", false)) {
            return status;
        }

        if (market->contains("tokens") && (*market)["tokens"].is_array()) {
            for (const auto& token : (*market)["tokens"]) {
                if (token.value("winner", false)) {
                    status.resolved = true;
                    status.winner = token.value("outcome", "");
                    break;
                }
            }
        }

    } catch (const std::exception& e) {
        status.resolved = false;
        status.error = e.what();
    }
    return status;
}

} // namespace crossarb
