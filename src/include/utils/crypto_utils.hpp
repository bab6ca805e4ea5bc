#pragma once
/**
 * @file crypto_utils.hpp
 * @brief Cryptographic helpers: random numbers and constant-time comparison.
 *
 * All primitives are provided by libsodium, which is initialized lazily on
 * first use (sodium_init() is idempotent and thread-safe).
 *
 * Used by:
 * - Publisher: random starting offset when probing a port range
 * - Authenticator: constant-time comparison of CURVE client keys
 */
#include "pubhub_utils_export.h"

#include <cstddef>
#include <cstdint>

namespace pubhub::crypto
{

/**
 * @brief Ensures libsodium is initialized.
 * @return True if libsodium is usable, false on catastrophic failure.
 */
PUBHUB_UTILS_EXPORT bool ensure_sodium_init() noexcept;

/**
 * @brief Returns an unpredictable value uniformly distributed in [0, upper_bound).
 * @details Uses randombytes_uniform(), which avoids modulo bias.
 *          Returns 0 when upper_bound < 2.
 */
PUBHUB_UTILS_EXPORT uint32_t random_uniform(uint32_t upper_bound) noexcept;

/**
 * @brief Constant-time equality check of two equally sized buffers.
 * @note Uses sodium_memcmp(); timing does not depend on where the buffers differ.
 */
PUBHUB_UTILS_EXPORT bool constant_time_equal(const void *lhs, const void *rhs,
                                             size_t len) noexcept;

} // namespace pubhub::crypto
