/**
 * @file crypto_utils.cpp
 * @brief Implementation of cryptographic helpers using libsodium.
 */
#include "utils/crypto_utils.hpp"
#include "utils/logger.hpp"

#include <sodium.h>

#include <atomic>

namespace pubhub::crypto
{

namespace
{
/**
 * @brief Tracks libsodium initialization status.
 * @details sodium_init() is idempotent and thread-safe; the flag only keeps
 *          the fast path lock-free and the log line single.
 */
std::atomic<bool> g_sodium_initialized{false};
} // anonymous namespace

bool ensure_sodium_init() noexcept
{
    if (g_sodium_initialized.load(std::memory_order_acquire))
    {
        return true;
    }

    int result = sodium_init();
    if (result == -1)
    {
        LOGGER_ERROR("[CryptoUtils] FATAL: sodium_init() failed!");
        return false;
    }

    // result == 0: first initialization; result == 1: already initialized
    if (!g_sodium_initialized.exchange(true, std::memory_order_acq_rel) && result == 0)
    {
        LOGGER_DEBUG("[CryptoUtils] libsodium initialized");
    }
    return true;
}

uint32_t random_uniform(uint32_t upper_bound) noexcept
{
    if (upper_bound < 2)
    {
        return 0;
    }
    if (!ensure_sodium_init())
    {
        LOGGER_ERROR("[CryptoUtils] random_uniform: libsodium unavailable, returning 0");
        return 0;
    }
    return randombytes_uniform(upper_bound);
}

bool constant_time_equal(const void *lhs, const void *rhs, size_t len) noexcept
{
    if (lhs == nullptr || rhs == nullptr)
    {
        LOGGER_ERROR("[CryptoUtils] constant_time_equal: null pointer argument");
        return false;
    }
    if (!ensure_sodium_init())
    {
        return false;
    }
    return sodium_memcmp(lhs, rhs, len) == 0;
}

} // namespace pubhub::crypto
