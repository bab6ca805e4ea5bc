/**
 * @file transport_config.cpp
 * @brief TransportConfig implementation.
 *
 * Config loading strategy (priority low → high):
 *  1. Built-in C++ defaults
 *  2. JSON file (explicit path or PUBHUB_CONFIG_FILE)
 *  3. PUBHUB_* environment overrides
 */
#include "utils/transport_config.hpp"
#include "utils/format_tools.hpp"
#include "utils/logger.hpp"

#include <array>
#include <cstdint>
#include <cstdlib>
#include <fstream>
#include <stdexcept>
#include <utility>

namespace pubhub
{

namespace fs = std::filesystem;

namespace
{

struct EnvOverride
{
    const char *env_name;
    const char *key;
};

constexpr std::array<EnvOverride, 5> kEnvOverrides{{
    {"PUBHUB_TCP_KEEPALIVE", "tcp_keepalive"},
    {"PUBHUB_TCP_KEEPALIVE_CNT", "tcp_keepalive_cnt"},
    {"PUBHUB_TCP_KEEPALIVE_IDLE", "tcp_keepalive_idle"},
    {"PUBHUB_TCP_KEEPALIVE_INTVL", "tcp_keepalive_intvl"},
    {"PUBHUB_ADDRESS_PUBLISH_PORT", "address_publish_port"},
}};

/// Recursively merges `overrides` into `base` (object keys override, arrays replace).
void json_merge(nlohmann::json &base, const nlohmann::json &overrides)
{
    if (!overrides.is_object())
        return;
    for (auto it = overrides.begin(); it != overrides.end(); ++it)
    {
        if (it.value().is_object() && base.contains(it.key()) && base.at(it.key()).is_object())
        {
            json_merge(base[it.key()], it.value());
        }
        else
        {
            base[it.key()] = it.value();
        }
    }
}

} // anonymous namespace

TransportConfig::TransportConfig()
    : m_values(nlohmann::json{{"address_publish_port", kDefaultAddressPublishPort}})
{
}

TransportConfig TransportConfig::from_json(const nlohmann::json &overrides)
{
    if (!overrides.is_object() && !overrides.is_null())
    {
        throw std::invalid_argument("TransportConfig: overrides must be a JSON object");
    }
    TransportConfig cfg;
    json_merge(cfg.m_values, overrides);
    return cfg;
}

TransportConfig TransportConfig::load(const fs::path &path)
{
    TransportConfig cfg;

    std::ifstream file(path);
    if (!file.is_open())
    {
        LOGGER_WARN("TransportConfig: config file '{}' not readable; using defaults.",
                    path.string());
    }
    else
    {
        nlohmann::json parsed;
        try
        {
            file >> parsed;
        }
        catch (const nlohmann::json::parse_error &e)
        {
            throw std::runtime_error("TransportConfig: malformed JSON in '" + path.string() +
                                     "': " + e.what());
        }
        if (!parsed.is_object())
        {
            throw std::runtime_error("TransportConfig: '" + path.string() +
                                     "' does not contain a JSON object");
        }
        json_merge(cfg.m_values, parsed);
        LOGGER_DEBUG("TransportConfig: loaded '{}'.", path.string());
    }

    cfg.apply_env_overrides();
    return cfg;
}

TransportConfig TransportConfig::load_default()
{
    if (const char *env_path = std::getenv("PUBHUB_CONFIG_FILE"); env_path != nullptr &&
                                                                  *env_path != '\0')
    {
        return load(fs::path(env_path));
    }
    TransportConfig cfg;
    cfg.apply_env_overrides();
    return cfg;
}

void TransportConfig::apply_env_overrides()
{
    for (const auto &ov : kEnvOverrides)
    {
        if (const char *value = std::getenv(ov.env_name); value != nullptr)
        {
            m_values[ov.key] = std::string(value);
            LOGGER_DEBUG("TransportConfig: {} overridden by {}.", ov.key, ov.env_name);
        }
    }
}

const nlohmann::json *TransportConfig::find(const std::string &key) const noexcept
{
    auto it = m_values.find(key);
    if (it == m_values.end() || it->is_null())
    {
        return nullptr;
    }
    return &(*it);
}

void TransportConfig::set(const std::string &key, nlohmann::json value)
{
    m_values[key] = std::move(value);
}

bool TransportConfig::erase(const std::string &key)
{
    return m_values.erase(key) > 0;
}

int TransportConfig::address_publish_port() const noexcept
{
    const nlohmann::json *value = find("address_publish_port");
    if (value != nullptr)
    {
        if (value->is_number_integer())
        {
            if (const auto port = value->get<int64_t>(); port > 0 && port <= 65535)
            {
                return static_cast<int>(port);
            }
        }
        if (value->is_string())
        {
            if (auto parsed = format_tools::parse_integer(value->get_ref<const std::string &>());
                parsed && *parsed > 0 && *parsed <= 65535)
            {
                return static_cast<int>(*parsed);
            }
        }
    }
    return kDefaultAddressPublishPort;
}

} // namespace pubhub
