#include "venue/kalshi_client.hpp"
#include "config/config.hpp"
#include "utils/crypto.hpp"
#include <spdlog/spdlog.h>
#include <chrono>
#include <cmath>
#include <fstream>
#include <sstream>

namespace crossarb {

namespace {

std::string unescape_newlines(std::string pem) {
    std::string out;
    out.reserve(pem.size());
    for (size_t i = 0; i < pem.size(); ++i) {
        if (pem[i] == '\\' && i + 1 < pem.size() && pem[i + 1] == 'n') {
            out.push_back('\n');
            ++i;
        } else {
            out.push_back(pem[i]);
        }
    }
    return out;
}

} // namespace

KalshiClient::Credentials KalshiClient::Credentials::from_environment() {
    Credentials c;
    c.key_id = crossarb::Config::get_env("KALSHI_API_KEY_ID");

    std::string inline_key = crossarb::Config::get_env("KALSHI_PRIVATE_KEY");
    if (!inline_key.empty()) {
        c.private_key_pem = unescape_newlines(inline_key);
        return c;
    }

    std::string key_path = crossarb::Config::get_env("KALSHI_PRIVATE_KEY_PATH");
    if (!key_path.empty()) {
        std::ifstream file(key_path);
        if (!file) {
            spdlog::warn("Cannot read Kalshi private key at {}", key_path);
            return c;
        }
        std::stringstream ss;
        ss << file.rdbuf();
        c.private_key_pem = ss.str();
    }
    return c;
}

KalshiClient::KalshiClient(const Config& config, const Credentials& credentials)
    : config_(config)
    , credentials_(credentials)
    , http_(config.timeout_ms)
{
    if (credentials_.complete()) {
        spdlog::info("KalshiClient initialized: url={}, key_id={}", config_.api_url, credentials_.key_id);
    } else {
        spdlog::warn("KalshiClient initialized without RSA credentials; orders will be refused");
    }
}

std::string KalshiClient::signing_message(const std::string& timestamp_ms, const std::string& method,
                                          const std::string& path) {
    return timestamp_ms + method + SIGNING_PREFIX + path;
}

std::string KalshiClient::ticker_outcome(const std::string& ticker) {
    auto pos = ticker.rfind('-');
    return pos == std::string::npos ? ticker : ticker.substr(pos + 1);
}

KalshiClient::ApiResult KalshiClient::call(const std::string& method, const std::string& path,
                                           const std::string& body) const {
    ApiResult result;

    if (!is_ready()) {
        result.error = "Kalshi RSA credentials not configured";
        return result;
    }

    try {
        std::string timestamp = std::to_string(now_ms());
        // Query strings are not part of the signed path
        std::string signed_path = path.substr(0, path.find('?'));
        std::string signature = crypto::rsa_pss_sha256_sign(
            credentials_.private_key_pem, signing_message(timestamp, method, signed_path));

        HttpClient::Headers headers = {
            {"KALSHI-ACCESS-KEY", credentials_.key_id},
            {"KALSHI-ACCESS-TIMESTAMP", timestamp},
            {"KALSHI-ACCESS-SIGNATURE", signature}
        };

        auto response = http_.request(method, config_.api_url + path, headers, body);
        if (!response.error.empty()) {
            result.error = response.error;
            return result;
        }
        if (!response.ok()) {
            result.error = fmt::format("HTTP {}: {}", response.status, response.body);
            return result;
        }

        result.data = response.body.empty() ? nlohmann::json::object()
                                            : nlohmann::json::parse(response.body);
        result.success = true;

    } catch (const std::exception& e) {
        result.error = e.what();
    }
    return result;
}

PlaceOrderResponse KalshiClient::place_order(const OrderRequest& request) {
    PlaceOrderResponse response;

    // Kalshi takes whole contracts and integer cents
    auto count = std::llround(request.quantity);
    auto price_cents = static_cast<int>(std::lround(request.price * 100.0));
    if (std::fabs(request.quantity - static_cast<double>(count)) > 1e-9) {
        response.error = fmt::format("Quantity {:.4f} is not a whole number of contracts", request.quantity);
        return response;
    }
    if (count < 1) {
        response.error = fmt::format("Quantity {:.2f} is below one contract", request.quantity);
        return response;
    }
    if (std::fabs(request.price * 100.0 - price_cents) > 1e-6) {
        response.error = fmt::format("Price {:.4f} is not a whole cent", request.price);
        return response;
    }
    if (price_cents < 1 || price_cents > 99) {
        response.error = fmt::format("Price {:.4f} outside tradable range", request.price);
        return response;
    }

    bool yes = request.side == ContractSide::YES;
    nlohmann::json body = {
        {"ticker", request.market_id},
        {"action", "buy"},
        {"side", yes ? "yes" : "no"},
        {"count", count},
        {"type", "limit"},
        {yes ? "yes_price" : "no_price", price_cents}
    };
    try {
        body["client_order_id"] = crypto::random_hex(16);
    } catch (const std::exception& e) {
        response.error = e.what();
        return response;
    }

    auto result = call("POST", "/portfolio/orders", body.dump());
    if (!result.success) {
        response.error = result.error;
        spdlog::error("Kalshi order on {} failed: {}", request.market_id, response.error);
        return response;
    }

    try {
        const auto order = result.data.value("order", nlohmann::json::object());
        response.order_id = order.value("order_id", "");
        if (response.order_id.empty()) {
            response.error = "Order response without order_id";
            return response;
        }
        response.success = true;
        response.status = order.value("status", "");
        response.filled = order.value("fill_count", order.value("filled_count", 0.0));
    } catch (const nlohmann::json::exception& e) {
        // The venue may hold a live order we cannot identify
        response.success = false;
        response.error = fmt::format("Unreadable order response: {}", e.what());
    }
    return response;
}

CancelResponse KalshiClient::cancel_order(const std::string& order_id) {
    CancelResponse response;

    auto result = call("DELETE", "/portfolio/orders/" + order_id);
    if (!result.success) {
        response.error = result.error;
        return response;
    }

    response.success = true;
    response.cancelled_at = wall_now();
    return response;
}

OrderStatusResponse KalshiClient::get_order_status(const std::string& order_id) {
    OrderStatusResponse response;

    auto result = call("GET", "/portfolio/orders/" + order_id);
    if (!result.success) {
        response.error = result.error;
        return response;
    }

    try {
        const auto order = result.data.value("order", nlohmann::json::object());
        response.success = true;
        response.status = order.value("status", "");
        response.filled = order.value("fill_count", order.value("filled_count", 0.0));
        response.remaining = order.value("remaining_count",
                                         order.value("count", 0.0) - response.filled);
    } catch (const nlohmann::json::exception& e) {
        response.success = false;
        response.error = e.what();
    }
    return response;
}

SettlementStatus KalshiClient::get_settlement_status(const std::string& ticker) {
    SettlementStatus status;

    auto result = call("GET", "/markets/" + ticker);
    if (!result.success) {
        status.error = result.error;
        return status;
    }

    try {
        const auto market = result.data.value("market", nlohmann::json::object());
        std::string market_status = market.value("status", "");
        if (market_status != "settled" && market_status != "finalized") {
            return status;
        }

        status.resolved = true;
        // A "no" result on a team market names no winner
        if (market.value("result", "") == "yes") {
            status.winner = ticker_outcome(ticker);
        }
    } catch (const nlohmann::json::exception& e) {
        status.resolved = false;
        status.error = e.what();
    }
    return status;
}

} // namespace crossarb
