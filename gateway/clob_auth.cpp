#include "clob_auth.H"

#include <algorithm>
#include <chrono>
#include <stdexcept>

#include <openssl/bio.h>
#include <openssl/buffer.h>
#include <openssl/evp.h>
#include <openssl/hmac.h>

namespace predex::gateway {

std::string base64_encode(const std::string& data, bool url_safe) {
    BIO* b64 = BIO_new(BIO_f_base64());
    BIO* mem = BIO_new(BIO_s_mem());
    BIO_set_flags(b64, BIO_FLAGS_BASE64_NO_NL);
    BIO_push(b64, mem);
    BIO_write(b64, data.data(), static_cast<int>(data.size()));
    BIO_flush(b64);

    BUF_MEM* buf;
    BIO_get_mem_ptr(mem, &buf);
    std::string result(buf->data, buf->length);
    BIO_free_all(b64);

    if (url_safe) {
        std::replace(result.begin(), result.end(), '+', '-');
        std::replace(result.begin(), result.end(), '/', '_');
    }
    return result;
}

std::string base64_decode(const std::string& text) {
    std::string normalized = text;
    std::replace(normalized.begin(), normalized.end(), '-', '+');
    std::replace(normalized.begin(), normalized.end(), '_', '/');
    while (normalized.size() % 4 != 0) {
        normalized += '=';
    }
    if (normalized.empty()) {
        return "";
    }

    std::string out(normalized.size() / 4 * 3, '\0');
    int len = EVP_DecodeBlock(reinterpret_cast<unsigned char*>(&out[0]),
                              reinterpret_cast<const unsigned char*>(normalized.data()),
                              static_cast<int>(normalized.size()));
    if (len < 0) {
        throw std::runtime_error("Invalid base64 input");
    }

    // EVP_DecodeBlock counts padding as zero bytes
    size_t padding = 0;
    if (normalized[normalized.size() - 1] == '=') padding++;
    if (normalized[normalized.size() - 2] == '=') padding++;
    out.resize(static_cast<size_t>(len) - padding);
    return out;
}

ClobAuth::ClobAuth(const ApiConfig& config)
    : address(config.address), api_key(config.api_key), api_secret(config.api_secret),
      passphrase(config.api_passphrase) {}

bool ClobAuth::has_credentials() const {
    return !api_key.empty() && !api_secret.empty() && !passphrase.empty();
}

std::string ClobAuth::sign(uint64_t timestamp, const std::string& method, const std::string& path,
                           const std::string& body) const {
    std::string message = std::to_string(timestamp) + method + path + body;
    std::string key = base64_decode(api_secret);

    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int digest_len = 0;
    if (HMAC(EVP_sha256(), key.data(), static_cast<int>(key.size()),
             reinterpret_cast<const unsigned char*>(message.data()), message.size(),
             digest, &digest_len) == nullptr) {
        throw std::runtime_error("HMAC-SHA256 failed");
    }

    return base64_encode(std::string(reinterpret_cast<const char*>(digest), digest_len), true);
}

HeaderList ClobAuth::headers(const std::string& method, const std::string& path, const std::string& body,
                             uint64_t timestamp) const {
    if (!has_credentials()) {
        throw std::runtime_error("API credentials are required for authenticated requests");
    }
    return {
        {"POLY_ADDRESS", address},
        {"POLY_API_KEY", api_key},
        {"POLY_PASSPHRASE", passphrase},
        {"POLY_TIMESTAMP", std::to_string(timestamp)},
        {"POLY_SIGNATURE", sign(timestamp, method, path, body)},
    };
}

HeaderList ClobAuth::headers(const std::string& method, const std::string& path, const std::string& body) const {
    auto now = std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
    return headers(method, path, body, static_cast<uint64_t>(now));
}

} // namespace predex::gateway
