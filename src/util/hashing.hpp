#ifndef IDREDACT_UTIL_HASHING_HPP
#define IDREDACT_UTIL_HASHING_HPP

#include <string>
#include <vector>
#include <stdexcept>
#include <sstream>
#include <iomanip>
#include <openssl/evp.h>
#include <openssl/sha.h>

/**
 * @file hashing.hpp
 * @brief SHA-256 helpers used to fingerprint pattern catalogs.
 *
 * REQUIREMENTS:
 *   - Links against OpenSSL libcrypto.
 *
 * USAGE:
 *   @code
 *   #include "hashing.hpp"
 *   using namespace idredact::util::hashing;
 *
 *   std::string hashVal = sha256("RUT_CHI=\\b\\d{1,2}...");
 *   // hashVal is a 64-hex-character string of the SHA-256 digest.
 *   @endcode
 */

namespace idredact {
namespace util {
namespace hashing {

/**
 * @brief Lowercase hex encoding of a raw digest.
 */
inline std::string toHex(const unsigned char *digest, size_t len)
{
    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    for (size_t i = 0; i < len; ++i) {
        oss << std::setw(2) << static_cast<unsigned>(digest[i]);
    }
    return oss.str();
}

/**
 * @brief Compute a SHA-256 hash of the input string, return as lowercase hex.
 * @throw std::runtime_error if OpenSSL fails somehow.
 */
inline std::string sha256(const std::string &input)
{
    unsigned char hash[SHA256_DIGEST_LENGTH];
    if (!SHA256(reinterpret_cast<const unsigned char*>(input.data()),
                input.size(),
                hash))
    {
        throw std::runtime_error("hashing::sha256: SHA256 computation failed.");
    }
    return toHex(hash, SHA256_DIGEST_LENGTH);
}

/**
 * @brief SHA-256 over a sequence of chunks, each terminated by '\n'.
 *        Equivalent to sha256() of the chunks joined with trailing newlines,
 *        without building the joined string.
 * @throw std::runtime_error if any EVP call fails.
 */
inline std::string sha256Lines(const std::vector<std::string> &lines)
{
    EVP_MD_CTX* mdctx = EVP_MD_CTX_new();
    if (mdctx == nullptr) {
        throw std::runtime_error("hashing::sha256Lines: Failed to create EVP_MD_CTX.");
    }

    if (EVP_DigestInit_ex(mdctx, EVP_sha256(), nullptr) != 1) {
        EVP_MD_CTX_free(mdctx);
        throw std::runtime_error("hashing::sha256Lines: EVP_DigestInit_ex failed.");
    }

    static const char newline = '\n';
    for (const auto &line : lines) {
        if (EVP_DigestUpdate(mdctx, line.data(), line.size()) != 1 ||
            EVP_DigestUpdate(mdctx, &newline, 1) != 1)
        {
            EVP_MD_CTX_free(mdctx);
            throw std::runtime_error("hashing::sha256Lines: EVP_DigestUpdate failed.");
        }
    }

    unsigned char hash[SHA256_DIGEST_LENGTH];
    if (EVP_DigestFinal_ex(mdctx, hash, nullptr) != 1) {
        EVP_MD_CTX_free(mdctx);
        throw std::runtime_error("hashing::sha256Lines: EVP_DigestFinal_ex failed.");
    }
    EVP_MD_CTX_free(mdctx);

    return toHex(hash, SHA256_DIGEST_LENGTH);
}

} // namespace hashing
} // namespace util
} // namespace idredact

#endif // IDREDACT_UTIL_HASHING_HPP
