/**
 * @file hash_utils.cpp
 * @brief SHA-256 digest implementation
 */

#include "guardrails/utils/hash_utils.h"
#include "guardrails/utils/string_utils.h"
#include <openssl/evp.h>
#include <stdexcept>

namespace guardrails {
namespace utils {

std::string sha256Hex(const std::string& content) {
    unsigned char hash[EVP_MAX_MD_SIZE];
    unsigned int hashLen = 0;

    EVP_MD_CTX* ctx = EVP_MD_CTX_new();
    if (!ctx) {
        throw std::runtime_error("Failed to allocate digest context");
    }

    bool ok = EVP_DigestInit_ex(ctx, EVP_sha256(), nullptr) == 1 &&
              EVP_DigestUpdate(ctx, content.data(), content.size()) == 1 &&
              EVP_DigestFinal_ex(ctx, hash, &hashLen) == 1;
    EVP_MD_CTX_free(ctx);

    if (!ok) {
        throw std::runtime_error("SHA-256 digest computation failed");
    }

    return bytesToHex(hash, hashLen);
}

} // namespace utils
} // namespace guardrails
