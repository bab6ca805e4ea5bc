#pragma once
/**
 * @file tcp_keepalive.hpp
 * @brief TCP keepalive settings read from TransportConfig and applied to sockets.
 *
 * Four settings are recognized:
 *
 * | Config key            | Socket option             |
 * |-----------------------|---------------------------|
 * | `tcp_keepalive`       | `ZMQ_TCP_KEEPALIVE`       |
 * | `tcp_keepalive_cnt`   | `ZMQ_TCP_KEEPALIVE_CNT`   |
 * | `tcp_keepalive_idle`  | `ZMQ_TCP_KEEPALIVE_IDLE`  |
 * | `tcp_keepalive_intvl` | `ZMQ_TCP_KEEPALIVE_INTVL` |
 *
 * A setting that is absent, or whose value is not an integer, is left out of
 * the result: the socket keeps the libzmq default (-1, "use the OS value").
 */
#include "pubhub_utils_export.h"
#include "utils/transport_config.hpp"

#include <zmq.hpp>

#include <map>
#include <string_view>

namespace pubhub::hub
{

enum class KeepaliveOption
{
    Keepalive,
    Count,
    Idle,
    Interval,
};

using KeepaliveOptions = std::map<KeepaliveOption, int>;

/// Config key for @p option (e.g. "tcp_keepalive_idle").
[[nodiscard]] PUBHUB_UTILS_EXPORT std::string_view keepalive_config_key(KeepaliveOption option) noexcept;

/**
 * @brief Extracts the keepalive settings present in @p config.
 *
 * JSON integers and booleans are taken as-is, floating point values only when
 * integral, strings only when they hold a base-10 integer (surrounding
 * whitespace allowed). Anything else is skipped and logged at DEBUG.
 */
[[nodiscard]] PUBHUB_UTILS_EXPORT KeepaliveOptions
get_tcp_keepalive_options(const TransportConfig &config);

/// Sets every option in @p options on @p socket. Call before bind/connect.
PUBHUB_UTILS_EXPORT void apply_tcp_keepalive(zmq::socket_t &socket,
                                             const KeepaliveOptions &options);

/// get_tcp_keepalive_options() followed by apply_tcp_keepalive().
PUBHUB_UTILS_EXPORT void set_tcp_keepalive(zmq::socket_t &socket, const TransportConfig &config);

} // namespace pubhub::hub
