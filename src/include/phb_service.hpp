#pragma once
/**
 * @file phb_service.hpp
 * @brief Layer 2: Service modules built on phb_base.
 *
 * Provides logging, configuration and cryptographic utilities (libsodium
 * helpers, CURVE keys and certificates).
 */
#include "phb_base.hpp"

#include "utils/crypto_utils.hpp"
#include "utils/curve_keys.hpp"
#include "utils/logger.hpp"
#include "utils/transport_config.hpp"
