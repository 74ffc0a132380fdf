#pragma once

#include <string>
#include <vector>
#include <cstdint>

namespace crossarb {
namespace crypto {

/**
 * Raw HMAC-SHA256 digest.
 */
std::vector<uint8_t> hmac_sha256(const std::vector<uint8_t>& key, const std::string& message);

/**
 * Polymarket L2 request signature: HMAC-SHA256 keyed with the
 * base64-decoded API secret, URL-safe base64 output.
 */
std::string polymarket_l2_signature(const std::string& secret_b64, const std::string& message);

/**
 * RSA-PSS (SHA-256, MGF1-SHA-256, salt = digest length) signature over
 * `message` with a PEM private key, standard base64 output.
 * Throws std::runtime_error if the key cannot be loaded or signing fails.
 */
std::string rsa_pss_sha256_sign(const std::string& private_key_pem, const std::string& message);

/**
 * Base64 encoding/decoding.
 */
std::string base64_encode(const std::vector<uint8_t>& data);
std::string base64url_encode(const std::vector<uint8_t>& data);
std::vector<uint8_t> base64_decode(const std::string& encoded);

/**
 * Hex encoding.
 */
std::string hex_encode(const std::vector<uint8_t>& data);

/**
 * Generate random bytes.
 */
std::vector<uint8_t> random_bytes(size_t count);
std::string random_hex(size_t bytes);

} // namespace crypto
} // namespace crossarb
