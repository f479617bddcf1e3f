#include "crypto_utils.h"
#include "common/logging.h"

#include <openssl/evp.h>
#include <openssl/rand.h>

#include <cstdio>
#include <random>

namespace GreenWatch::Ledger {

auto sha256Hex(std::string_view data) noexcept -> std::string {
    unsigned char hash[EVP_MAX_MD_SIZE];
    unsigned int hash_len = 0;

    if (EVP_Digest(data.data(), data.size(), hash, &hash_len, EVP_sha256(), nullptr) != 1) {
        LOG_ERROR("SHA-256 digest failed");
        return {};
    }

    char hex[EVP_MAX_MD_SIZE * 2 + 1];
    for (unsigned int i = 0; i < hash_len; ++i) {
        snprintf(hex + (i * 2), 3, "%02x", hash[i]);
    }
    hex[hash_len * 2] = '\0';
    return std::string(hex, hash_len * 2);
}

auto generateUuidV4() -> std::string {
    unsigned char bytes[16];
    if (RAND_bytes(bytes, sizeof(bytes)) != 1) {
        // CSPRNG unavailable; ids need uniqueness, not secrecy
        LOG_WARN("RAND_bytes failed; falling back to std::random_device for UUID");
        std::random_device rd;
        for (auto& b : bytes) {
            b = static_cast<unsigned char>(rd() & 0xFF);
        }
    }
    bytes[6] = static_cast<unsigned char>((bytes[6] & 0x0F) | 0x40);
    bytes[8] = static_cast<unsigned char>((bytes[8] & 0x3F) | 0x80);

    char out[37];
    snprintf(out, sizeof(out),
             "%02x%02x%02x%02x-%02x%02x-%02x%02x-%02x%02x-%02x%02x%02x%02x%02x%02x",
             bytes[0], bytes[1], bytes[2], bytes[3], bytes[4], bytes[5], bytes[6], bytes[7],
             bytes[8], bytes[9], bytes[10], bytes[11], bytes[12], bytes[13], bytes[14], bytes[15]);
    return std::string(out, 36);
}

} // namespace GreenWatch::Ledger
