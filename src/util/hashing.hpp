#ifndef PIIGUARD_UTIL_HASHING_HPP
#define PIIGUARD_UTIL_HASHING_HPP

#include <string>
#include <stdexcept>
#include <cstdint>
#include <sstream>
#include <iomanip>
#include <openssl/evp.h>
#include <openssl/sha.h>
#include <openssl/rand.h>

/**
 * @file hashing.hpp
 * @brief Cryptographic helpers for PiiGuard, backed by OpenSSL (libcrypto).
 *
 * DESIGN:
 *   - sha256() digests a value into lowercase hex. The synthetic cache keys on
 *     this digest instead of holding the original sensitive value.
 *   - randomSeed() draws a 64-bit seed from the OpenSSL CSPRNG for the
 *     synthetic value generator.
 *
 * USAGE:
 *   @code
 *   #include "hashing.hpp"
 *   using namespace piiguard::util::hashing;
 *
 *   std::string digest = sha256("alice@example.com");
 *   // digest is a 64-hex-character string of the SHA-256 digest.
 *   @endcode
 */

namespace piiguard {
namespace util {
namespace hashing {

/**
 * @brief Compute a SHA-256 hash of a byte range, return as lowercase hex.
 * @throw std::runtime_error if OpenSSL fails somehow.
 */
inline std::string sha256(const unsigned char *data, size_t size)
{
    unsigned char hash[SHA256_DIGEST_LENGTH];

    EVP_MD_CTX* mdctx = EVP_MD_CTX_new();
    if (mdctx == nullptr) {
        throw std::runtime_error("hashing::sha256: Failed to create EVP_MD_CTX.");
    }
    if (EVP_DigestInit_ex(mdctx, EVP_sha256(), nullptr) != 1
        || EVP_DigestUpdate(mdctx, data, size) != 1
        || EVP_DigestFinal_ex(mdctx, hash, nullptr) != 1)
    {
        EVP_MD_CTX_free(mdctx);
        throw std::runtime_error("hashing::sha256: SHA-256 computation failed.");
    }
    EVP_MD_CTX_free(mdctx);

    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    for (int i = 0; i < SHA256_DIGEST_LENGTH; ++i) {
        oss << std::setw(2) << static_cast<unsigned>(hash[i]);
    }
    return oss.str();
}

inline std::string sha256(const std::string &input)
{
    return sha256(reinterpret_cast<const unsigned char*>(input.data()), input.size());
}


/**
 * @brief Draw a 64-bit seed from the OpenSSL CSPRNG.
 * @param seedOut Receives the seed on success.
 * @return false if the CSPRNG could not produce bytes (e.g. not seeded).
 */
inline bool randomSeed(uint64_t &seedOut)
{
    unsigned char buf[sizeof(uint64_t)];
    if (RAND_bytes(buf, static_cast<int>(sizeof(buf))) != 1) {
        return false;
    }
    uint64_t seed = 0;
    for (size_t i = 0; i < sizeof(buf); ++i) {
        seed = (seed << 8) | buf[i];
    }
    seedOut = seed;
    return true;
}

} // namespace hashing
} // namespace util
} // namespace piiguard

#endif // PIIGUARD_UTIL_HASHING_HPP
