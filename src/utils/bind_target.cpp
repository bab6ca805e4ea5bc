#include "utils/bind_target.hpp"
#include "utils/format_tools.hpp"

#include <fmt/format.h>

#include <stdexcept>

namespace pubhub::hub
{

namespace
{

int parse_port(std::string_view text, std::string_view address)
{
    const bool all_digits =
        !text.empty() && text.find_first_not_of("0123456789") == std::string_view::npos;
    std::optional<int64_t> value;
    if (all_digits)
        value = format_tools::parse_integer(text);
    if (!value || *value > 65535)
    {
        throw std::invalid_argument(
            fmt::format("BindTarget: invalid port '{}' in '{}'", text, address));
    }
    return static_cast<int>(*value);
}

} // anonymous namespace

BindTarget BindTarget::parse(std::string_view address)
{
    BindTarget target;

    const auto scheme_end = address.find("://");
    if (scheme_end == std::string_view::npos || scheme_end == 0)
    {
        throw std::invalid_argument(
            fmt::format("BindTarget: '{}' is missing a 'scheme://' prefix", address));
    }
    target.scheme = std::string(address.substr(0, scheme_end));
    std::string_view rest = address.substr(scheme_end + 3);

    // Fragment, then query, then path: each is cut off the tail in turn.
    if (auto hash = rest.find('#'); hash != std::string_view::npos)
    {
        target.fragment = std::string(rest.substr(hash + 1));
        rest = rest.substr(0, hash);
    }
    if (auto qmark = rest.find('?'); qmark != std::string_view::npos)
    {
        target.query = std::string(rest.substr(qmark + 1));
        rest = rest.substr(0, qmark);
    }
    std::string_view netloc = rest;
    if (auto slash = rest.find('/'); slash != std::string_view::npos)
    {
        target.path = std::string(rest.substr(slash));
        netloc = rest.substr(0, slash);
    }

    std::string_view port_text;
    bool has_port = false;
    if (!netloc.empty() && netloc.front() == '[')
    {
        const auto close = netloc.find(']');
        if (close == std::string_view::npos)
        {
            throw std::invalid_argument(
                fmt::format("BindTarget: unterminated IPv6 host in '{}'", address));
        }
        target.host = std::string(netloc.substr(0, close + 1));
        std::string_view after = netloc.substr(close + 1);
        if (!after.empty())
        {
            if (after.front() != ':')
            {
                throw std::invalid_argument(
                    fmt::format("BindTarget: unexpected text after IPv6 host in '{}'", address));
            }
            port_text = after.substr(1);
            has_port = true;
        }
    }
    else if (auto colon = netloc.rfind(':'); colon != std::string_view::npos)
    {
        target.host = std::string(netloc.substr(0, colon));
        port_text = netloc.substr(colon + 1);
        has_port = true;
    }
    else
    {
        target.host = std::string(netloc);
    }

    if (has_port)
    {
        target.port = parse_port(port_text, address);
    }
    return target;
}

std::string BindTarget::netloc() const
{
    if (port)
    {
        return fmt::format("{}:{}", host, *port);
    }
    return host;
}

std::string BindTarget::to_string() const
{
    std::string out = fmt::format("{}://{}{}", scheme, netloc(), path);
    if (!query.empty())
    {
        out += '?';
        out += query;
    }
    if (!fragment.empty())
    {
        out += '#';
        out += fragment;
    }
    return out;
}

BindTarget BindTarget::with_port(int new_port) const
{
    BindTarget copy = *this;
    copy.port = new_port;
    return copy;
}

} // namespace pubhub::hub
