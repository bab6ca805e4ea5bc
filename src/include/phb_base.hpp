#pragma once
/**
 * @file phb_base.hpp
 * @brief Layer 1: Basic modules built on phb_platform.
 *
 * Provides format_tools (timestamps, trimming, integer parsing) and the
 * endpoint parser used by every socket owner.
 */
#include "phb_platform.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include <fmt/format.h>

#include "utils/format_tools.hpp"
#include "utils/bind_target.hpp"
