#include "utils/crypto.hpp"
#include <openssl/hmac.h>
#include <openssl/rand.h>
#include <openssl/evp.h>
#include <openssl/pem.h>
#include <openssl/rsa.h>
#include <openssl/err.h>
#include <memory>
#include <stdexcept>
#include <sstream>
#include <iomanip>

namespace crossarb {
namespace crypto {

namespace {

std::string openssl_error() {
    unsigned long code = ERR_get_error();
    if (code == 0) return "unknown OpenSSL error";
    char buf[256];
    ERR_error_string_n(code, buf, sizeof(buf));
    return buf;
}

} // namespace

std::vector<uint8_t> hmac_sha256(const std::vector<uint8_t>& key, const std::string& message) {
    unsigned char hash[EVP_MAX_MD_SIZE];
    unsigned int hash_len = 0;

    HMAC(EVP_sha256(),
         key.data(), static_cast<int>(key.size()),
         reinterpret_cast<const unsigned char*>(message.data()), message.size(),
         hash, &hash_len);

    return std::vector<uint8_t>(hash, hash + hash_len);
}

std::string polymarket_l2_signature(const std::string& secret_b64, const std::string& message) {
    // Secrets are issued URL-safe; the decoder accepts both alphabets
    return base64url_encode(hmac_sha256(base64_decode(secret_b64), message));
}

std::string rsa_pss_sha256_sign(const std::string& private_key_pem, const std::string& message) {
    std::unique_ptr<BIO, decltype(&BIO_free)> bio(
        BIO_new_mem_buf(private_key_pem.data(), static_cast<int>(private_key_pem.size())),
        &BIO_free);
    if (!bio) {
        throw std::runtime_error("Failed to allocate key buffer");
    }

    std::unique_ptr<EVP_PKEY, decltype(&EVP_PKEY_free)> pkey(
        PEM_read_bio_PrivateKey(bio.get(), nullptr, nullptr, nullptr),
        &EVP_PKEY_free);
    if (!pkey) {
        throw std::runtime_error("Failed to load RSA private key: " + openssl_error());
    }

    std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)> ctx(EVP_MD_CTX_new(), &EVP_MD_CTX_free);
    EVP_PKEY_CTX* pctx = nullptr;  // Owned by ctx

    if (!ctx ||
        EVP_DigestSignInit(ctx.get(), &pctx, EVP_sha256(), nullptr, pkey.get()) != 1 ||
        EVP_PKEY_CTX_set_rsa_padding(pctx, RSA_PKCS1_PSS_PADDING) != 1 ||
        EVP_PKEY_CTX_set_rsa_mgf1_md(pctx, EVP_sha256()) != 1 ||
        EVP_PKEY_CTX_set_rsa_pss_saltlen(pctx, RSA_PSS_SALTLEN_DIGEST) != 1) {
        throw std::runtime_error("Failed to initialize RSA-PSS signer: " + openssl_error());
    }

    size_t sig_len = 0;
    const auto* data = reinterpret_cast<const unsigned char*>(message.data());
    if (EVP_DigestSign(ctx.get(), nullptr, &sig_len, data, message.size()) != 1) {
        throw std::runtime_error("RSA-PSS signing failed: " + openssl_error());
    }

    std::vector<uint8_t> sig(sig_len);
    if (EVP_DigestSign(ctx.get(), sig.data(), &sig_len, data, message.size()) != 1) {
        throw std::runtime_error("RSA-PSS signing failed: " + openssl_error());
    }
    sig.resize(sig_len);

    return base64_encode(sig);
}

std::string base64_encode(const std::vector<uint8_t>& data) {
    static const char* chars = "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

    std::string result;
    uint32_t val = 0;
    int bits = -6;

    for (uint8_t c : data) {
        val = ((val << 8) + c) & 0xFFFFFF;
        bits += 8;
        while (bits >= 0) {
            result.push_back(chars[(val >> bits) & 0x3F]);
            bits -= 6;
        }
    }

    if (bits > -6) {
        result.push_back(chars[((val << 8) >> (bits + 8)) & 0x3F]);
    }

    while (result.size() % 4) {
        result.push_back('=');
    }

    return result;
}

// Padding is kept, matching what the CLOB expects
std::string base64url_encode(const std::vector<uint8_t>& data) {
    std::string result = base64_encode(data);
    for (char& c : result) {
        if (c == '+') c = '-';
        else if (c == '/') c = '_';
    }
    return result;
}

std::vector<uint8_t> base64_decode(const std::string& encoded) {
    static const int lookup[] = {
        -1,-1,-1,-1,-1,-1,-1,-1,-1,-1,-1,-1,-1,-1,-1,-1,
        -1,-1,-1,-1,-1,-1,-1,-1,-1,-1,-1,-1,-1,-1,-1,-1,
        -1,-1,-1,-1,-1,-1,-1,-1,-1,-1,-1,62,-1,62,-1,63,
        52,53,54,55,56,57,58,59,60,61,-1,-1,-1,-1,-1,-1,
        -1, 0, 1, 2, 3, 4, 5, 6, 7, 8, 9,10,11,12,13,14,
        15,16,17,18,19,20,21,22,23,24,25,-1,-1,-1,-1,63,
        -1,26,27,28,29,30,31,32,33,34,35,36,37,38,39,40,
        41,42,43,44,45,46,47,48,49,50,51,-1,-1,-1,-1,-1
    };

    std::vector<uint8_t> result;
    uint32_t val = 0;
    int bits = -8;

    for (char c : encoded) {
        if (c == '=') break;
        if (c < 0 || lookup[static_cast<int>(c)] == -1) continue;

        val = ((val << 6) + static_cast<uint32_t>(lookup[static_cast<int>(c)])) & 0xFFFFFF;
        bits += 6;

        if (bits >= 0) {
            result.push_back(static_cast<uint8_t>((val >> bits) & 0xFF));
            bits -= 8;
        }
    }

    return result;
}

std::string hex_encode(const std::vector<uint8_t>& data) {
    std::stringstream ss;
    for (uint8_t b : data) {
        ss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(b);
    }
    return ss.str();
}

std::vector<uint8_t> random_bytes(size_t count) {
    std::vector<uint8_t> bytes(count);
    if (RAND_bytes(bytes.data(), static_cast<int>(count)) != 1) {
        throw std::runtime_error("Failed to generate random bytes");
    }
    return bytes;
}

std::string random_hex(size_t bytes) {
    return hex_encode(random_bytes(bytes));
}

} // namespace crypto
} // namespace crossarb
