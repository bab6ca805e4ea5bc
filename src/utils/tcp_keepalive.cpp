#include "utils/tcp_keepalive.hpp"
#include "utils/format_tools.hpp"
#include "utils/logger.hpp"

#include <array>
#include <cmath>
#include <limits>
#include <optional>

namespace pubhub::hub
{

namespace
{

constexpr std::array<KeepaliveOption, 4> kAllOptions{
    KeepaliveOption::Keepalive,
    KeepaliveOption::Count,
    KeepaliveOption::Idle,
    KeepaliveOption::Interval,
};

bool fits_int(int64_t value) noexcept
{
    return value >= std::numeric_limits<int>::min() && value <= std::numeric_limits<int>::max();
}

std::optional<int> to_int(const nlohmann::json &value)
{
    if (value.is_boolean())
    {
        return value.get<bool>() ? 1 : 0;
    }
    if (value.is_number_unsigned())
    {
        const auto v = value.get<uint64_t>();
        if (v <= static_cast<uint64_t>(std::numeric_limits<int>::max()))
            return static_cast<int>(v);
        return std::nullopt;
    }
    if (value.is_number_integer())
    {
        const auto v = value.get<int64_t>();
        if (fits_int(v))
            return static_cast<int>(v);
        return std::nullopt;
    }
    if (value.is_number_float())
    {
        // Truncated toward zero, like an int() conversion.
        const double v = std::trunc(value.get<double>());
        if (std::isfinite(v) && v >= static_cast<double>(std::numeric_limits<int>::min()) &&
            v <= static_cast<double>(std::numeric_limits<int>::max()))
        {
            return static_cast<int>(v);
        }
        return std::nullopt;
    }
    if (value.is_string())
    {
        auto parsed = format_tools::parse_integer(value.get_ref<const std::string &>());
        if (parsed && fits_int(*parsed))
            return static_cast<int>(*parsed);
    }
    return std::nullopt;
}

} // anonymous namespace

std::string_view keepalive_config_key(KeepaliveOption option) noexcept
{
    switch (option)
    {
    case KeepaliveOption::Keepalive:
        return "tcp_keepalive";
    case KeepaliveOption::Count:
        return "tcp_keepalive_cnt";
    case KeepaliveOption::Idle:
        return "tcp_keepalive_idle";
    case KeepaliveOption::Interval:
        return "tcp_keepalive_intvl";
    }
    return "";
}

KeepaliveOptions get_tcp_keepalive_options(const TransportConfig &config)
{
    KeepaliveOptions options;
    for (KeepaliveOption option : kAllOptions)
    {
        const std::string key(keepalive_config_key(option));
        const nlohmann::json *raw = config.find(key);
        if (raw == nullptr)
        {
            continue;
        }
        if (auto value = to_int(*raw))
        {
            options.emplace(option, *value);
        }
        else
        {
            LOGGER_DEBUG("Keepalive: ignoring non-integer value {} for '{}'.", raw->dump(), key);
        }
    }
    return options;
}

void apply_tcp_keepalive(zmq::socket_t &socket, const KeepaliveOptions &options)
{
    for (const auto &[option, value] : options)
    {
        switch (option)
        {
        case KeepaliveOption::Keepalive:
            socket.set(zmq::sockopt::tcp_keepalive, value);
            break;
        case KeepaliveOption::Count:
            socket.set(zmq::sockopt::tcp_keepalive_cnt, value);
            break;
        case KeepaliveOption::Idle:
            socket.set(zmq::sockopt::tcp_keepalive_idle, value);
            break;
        case KeepaliveOption::Interval:
            socket.set(zmq::sockopt::tcp_keepalive_intvl, value);
            break;
        }
        LOGGER_TRACE("Keepalive: {} = {}.", keepalive_config_key(option), value);
    }
}

void set_tcp_keepalive(zmq::socket_t &socket, const TransportConfig &config)
{
    apply_tcp_keepalive(socket, get_tcp_keepalive_options(config));
}

} // namespace pubhub::hub
