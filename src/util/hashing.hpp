#ifndef SAFEINTAKE_UTIL_HASHING_HPP
#define SAFEINTAKE_UTIL_HASHING_HPP

#include <cstdint>
#include <iomanip>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>
#include <openssl/evp.h>

/**
 * @file hashing.hpp
 * @brief SHA-256 content digests (OpenSSL EVP), recorded with every submission
 *        so a stored upload can be matched to its index row.
 *
 * USAGE:
 *   @code
 *   std::string digest = safeintake::util::hashing::sha256Hex(uploadBytes);
 *   // 64 lowercase hex characters
 *   @endcode
 */

namespace safeintake {
namespace util {
namespace hashing {

/**
 * @throw std::runtime_error if OpenSSL fails.
 */
inline std::string sha256Hex(const uint8_t *data, std::size_t size)
{
    std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)> ctx(EVP_MD_CTX_new(), &EVP_MD_CTX_free);
    if (!ctx) {
        throw std::runtime_error("hashing::sha256Hex: failed to create EVP_MD_CTX.");
    }
    if (EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1) {
        throw std::runtime_error("hashing::sha256Hex: EVP_DigestInit_ex failed.");
    }
    if (size > 0 && EVP_DigestUpdate(ctx.get(), data, size) != 1) {
        throw std::runtime_error("hashing::sha256Hex: EVP_DigestUpdate failed.");
    }

    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int digestLen = 0;
    if (EVP_DigestFinal_ex(ctx.get(), digest, &digestLen) != 1) {
        throw std::runtime_error("hashing::sha256Hex: EVP_DigestFinal_ex failed.");
    }

    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    for (unsigned int i = 0; i < digestLen; ++i) {
        oss << std::setw(2) << static_cast<unsigned>(digest[i]);
    }
    return oss.str();
}

inline std::string sha256Hex(const std::vector<uint8_t> &input)
{
    return sha256Hex(input.data(), input.size());
}

inline std::string sha256Hex(const std::string &input)
{
    return sha256Hex(reinterpret_cast<const uint8_t *>(input.data()), input.size());
}

} // namespace hashing
} // namespace util
} // namespace safeintake

#endif // SAFEINTAKE_UTIL_HASHING_HPP
