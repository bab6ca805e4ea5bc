#include "utils/secure_publisher.hpp"
#include "utils/curve_keys.hpp"
#include "utils/logger.hpp"

#include <fmt/format.h>

#include <stdexcept>

namespace pubhub::hub
{

namespace
{

void require_non_empty(const std::string &value, const char *what)
{
    if (value.empty())
    {
        throw std::invalid_argument(fmt::format("SecurePublisher: {} must be given", what));
    }
}

} // anonymous namespace

Publisher::Config SecurePublisher::publisher_config(const Config &config)
{
    require_non_empty(config.server_secret_key, "server_secret_key");
    require_non_empty(config.public_keys_directory, "public_keys_directory");
    return Publisher::Config{config.address, config.name, config.min_port, config.max_port};
}

SecurePublisher::SecurePublisher(Config config, ContextRegistry &registry,
                                 TransportConfig transport)
    : m_registry(registry), m_server_secret_key(config.server_secret_key),
      m_public_keys_directory(config.public_keys_directory),
      m_authorized_addresses(std::move(config.authorized_sub_addresses)),
      m_publisher(publisher_config(config), registry, std::move(transport))
{
}

SecurePublisher::~SecurePublisher() = default;

SecurePublisher &SecurePublisher::start()
{
    if (m_publisher.state() != Publisher::State::Unstarted)
    {
        throw std::logic_error(
            fmt::format("SecurePublisher '{}': start() called twice", m_publisher.name()));
    }

    auto authenticator = std::make_unique<Authenticator>(m_registry.get());
    authenticator->start();
    try
    {
        if (!m_authorized_addresses.empty())
        {
            authenticator->allow(m_authorized_addresses);
        }
        authenticator->configure_curve("*", m_public_keys_directory);

        const crypto::CurveKeyPair server_keys = crypto::load_certificate(m_server_secret_key);
        if (!server_keys.secret_key)
        {
            throw std::runtime_error(fmt::format(
                "SecurePublisher: certificate '{}' holds no secret key", m_server_secret_key));
        }
        m_publisher.set_socket_setup(
            [public_key = server_keys.public_key,
             secret_key = *server_keys.secret_key](zmq::socket_t &socket)
            {
                socket.set(zmq::sockopt::curve_secretkey, secret_key);
                socket.set(zmq::sockopt::curve_publickey, public_key);
                socket.set(zmq::sockopt::curve_server, true);
            });

        m_publisher.start();
        m_authenticator = std::move(authenticator);
    }
    catch (const std::exception &e)
    {
        LOGGER_ERROR("SecurePublisher '{}': start failed: {}", m_publisher.name(), e.what());
        authenticator->stop();
        throw;
    }
    return *this;
}

void SecurePublisher::stop()
{
    m_publisher.stop();
    if (m_authenticator)
    {
        m_authenticator->stop();
        m_authenticator.reset();
    }
}

} // namespace pubhub::hub
