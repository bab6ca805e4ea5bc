#pragma once

/**
 * @file transport_config.hpp
 * @brief TransportConfig: layered settings read by the transport layer.
 *
 * ## Config loading: layered (priority low → high)
 *
 *  1. Built-in C++ defaults (`address_publish_port` = 16543, no keepalive values)
 *  2. A JSON file: the path given to load(), or `PUBHUB_CONFIG_FILE` when
 *     load_default() is used
 *  3. Environment overrides, applied after file loading:
 *     - `PUBHUB_TCP_KEEPALIVE`         : overrides tcp_keepalive
 *     - `PUBHUB_TCP_KEEPALIVE_CNT`     : overrides tcp_keepalive_cnt
 *     - `PUBHUB_TCP_KEEPALIVE_IDLE`    : overrides tcp_keepalive_idle
 *     - `PUBHUB_TCP_KEEPALIVE_INTVL`   : overrides tcp_keepalive_intvl
 *     - `PUBHUB_ADDRESS_PUBLISH_PORT`  : overrides address_publish_port
 *
 * Values are kept as raw JSON; readers (keepalive, address receiver) decide how
 * to convert them. Environment values are stored as strings.
 *
 * Example file:
 * @code
 * {
 *   "tcp_keepalive": 1,
 *   "tcp_keepalive_idle": "60",
 *   "address_publish_port": 16543
 * }
 * @endcode
 */

#include "pubhub_utils_export.h"

#include <nlohmann/json.hpp>

#include <filesystem>
#include <string>

namespace pubhub
{

/**
 * @class TransportConfig
 * @brief Value type holding the merged transport settings.
 *
 * Copyable. Not synchronized: build it once, then share it read-only.
 */
class PUBHUB_UTILS_EXPORT TransportConfig
{
  public:
    static constexpr int kDefaultAddressPublishPort = 16543;

    /// Built-in defaults only.
    TransportConfig();

    /// Defaults merged with @p overrides (object keys override, nested objects merge).
    static TransportConfig from_json(const nlohmann::json &overrides);

    /**
     * @brief Defaults, then the JSON file at @p path, then environment overrides.
     *
     * A missing file is logged and skipped. A file that exists but does not
     * hold a JSON object throws std::runtime_error.
     */
    static TransportConfig load(const std::filesystem::path &path);

    /**
     * @brief Like load(), with the path taken from `PUBHUB_CONFIG_FILE`.
     * Without the variable, defaults plus environment overrides.
     */
    static TransportConfig load_default();

    /// Applies the `PUBHUB_*` environment overrides on top of the current values.
    void apply_env_overrides();

    /// Raw value for @p key, or nullptr when absent (or JSON null).
    [[nodiscard]] const nlohmann::json *find(const std::string &key) const noexcept;

    /// Sets a single value (tests and programmatic configuration).
    void set(const std::string &key, nlohmann::json value);

    /// Removes @p key, returning whether it was present.
    bool erase(const std::string &key);

    /// `address_publish_port` as an integer; falls back to the default when invalid.
    [[nodiscard]] int address_publish_port() const noexcept;

    [[nodiscard]] const nlohmann::json &json() const noexcept { return m_values; }

  private:
    nlohmann::json m_values;
};

} // namespace pubhub
