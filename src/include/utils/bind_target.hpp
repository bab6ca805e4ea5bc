#pragma once
/**
 * @file bind_target.hpp
 * @brief Endpoint addresses of the form `scheme://host:port/path?query#fragment`.
 *
 * Only the pieces a bind needs are interpreted: the host (IPv6 hosts keep their
 * brackets, e.g. `[::1]`) and the optional numeric port. Path, query and
 * fragment are carried through unchanged so that rewriting the port of a
 * destination preserves everything else.
 */
#include "pubhub_utils_export.h"

#include <optional>
#include <string>
#include <string_view>

namespace pubhub::hub
{

struct PUBHUB_UTILS_EXPORT BindTarget
{
    std::string scheme;
    std::string host;
    std::optional<int> port;
    std::string path;
    std::string query;
    std::string fragment;

    /**
     * @brief Splits @p address into its components.
     * @throws std::invalid_argument when the scheme separator is missing, an
     *         IPv6 bracket is unterminated, or the port is not in [0, 65535].
     */
    static BindTarget parse(std::string_view address);

    /// `host:port`, or just `host` when no port is set.
    [[nodiscard]] std::string netloc() const;

    /// Re-assembled address.
    [[nodiscard]] std::string to_string() const;

    /// Copy of this target with the port replaced by @p new_port.
    [[nodiscard]] BindTarget with_port(int new_port) const;

    /// True when the port was given explicitly as 0 (ask for a dynamic port).
    [[nodiscard]] bool wants_dynamic_port() const noexcept { return port && *port == 0; }
};

} // namespace pubhub::hub
