#pragma once
/**
 * @file secure_publisher.hpp
 * @brief Publisher whose subscribers must authenticate with CURVE.
 *
 * start() brings up an Authenticator on the process context before the
 * socket binds: only subscribers holding a public key from
 * `public_keys_directory` (and, when `authorized_sub_addresses` is not empty,
 * connecting from one of those addresses) are admitted. The socket serves
 * CURVE with the keypair read from `server_secret_key`.
 *
 * The socket is always closed before the authenticator stops.
 */
#include "pubhub_utils_export.h"
#include "utils/authenticator.hpp"
#include "utils/publisher.hpp"

#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace pubhub::hub
{

class PUBHUB_UTILS_EXPORT SecurePublisher
{
  public:
    struct Config
    {
        std::string address;
        std::string name;
        std::optional<int> min_port;
        std::optional<int> max_port;
        /// Certificate holding the server's public and secret key.
        std::string server_secret_key;
        /// Directory of `*.key` certificates of admitted subscribers.
        std::string public_keys_directory;
        std::vector<std::string> authorized_sub_addresses;
    };

    /**
     * @throws std::invalid_argument if `server_secret_key` or
     *         `public_keys_directory` is empty, or the address is invalid.
     */
    explicit SecurePublisher(Config config,
                             ContextRegistry &registry = ContextRegistry::process_default(),
                             TransportConfig transport = TransportConfig::load_default());
    ~SecurePublisher();

    SecurePublisher(const SecurePublisher &) = delete;
    SecurePublisher &operator=(const SecurePublisher &) = delete;

    /**
     * @brief Starts the authenticator, loads the server keypair and binds.
     * @throws std::logic_error if not Unstarted.
     * @throws std::runtime_error if the server certificate cannot be loaded or
     *         has no secret key.
     * @throws BindError, zmq::error_t as Publisher::start().
     * The authenticator is stopped again on any failure.
     */
    SecurePublisher &start();

    void send(std::string_view message) { m_publisher.send(message); }

    /// Closes the socket, then stops the authenticator.
    void stop();

    [[nodiscard]] const std::string &name() const noexcept { return m_publisher.name(); }
    [[nodiscard]] std::string destination() const { return m_publisher.destination(); }
    [[nodiscard]] std::optional<int> port_number() const { return m_publisher.port_number(); }
    [[nodiscard]] Publisher::State state() const { return m_publisher.state(); }
    [[nodiscard]] bool is_running() const { return m_publisher.is_running(); }

  private:
    static Publisher::Config publisher_config(const Config &config);

    ContextRegistry &m_registry;
    std::string m_server_secret_key;
    std::string m_public_keys_directory;
    std::vector<std::string> m_authorized_addresses;

    // Declared before m_publisher: destroyed after the socket is closed.
    std::unique_ptr<Authenticator> m_authenticator;
    Publisher m_publisher;
};

} // namespace pubhub::hub
