#include "utils/publisher.hpp"
#include "utils/crypto_utils.hpp"
#include "utils/logger.hpp"
#include "utils/tcp_keepalive.hpp"

#include <fmt/format.h>

#include <cerrno>

namespace pubhub::hub
{

namespace
{
constexpr int kLowestPort = 1;
constexpr int kHighestPort = 65535;
// Linger applied on stop(): queued messages get a last chance to flush.
constexpr int kStopLingerMs = 1;

void check_port_bound(const std::optional<int> &bound, const char *which)
{
    if (bound && (*bound < kLowestPort || *bound > kHighestPort))
    {
        throw std::invalid_argument(
            fmt::format("Publisher: {} {} is outside [{}, {}]", which, *bound, kLowestPort,
                        kHighestPort));
    }
}

const char *state_name(Publisher::State state) noexcept
{
    switch (state)
    {
    case Publisher::State::Unstarted:
        return "unstarted";
    case Publisher::State::Starting:
        return "starting";
    case Publisher::State::Running:
        return "running";
    case Publisher::State::Stopped:
        return "stopped";
    }
    return "unknown";
}

void close_with_linger(zmq::socket_t &socket, const std::string &name) noexcept
{
    try
    {
        socket.set(zmq::sockopt::linger, kStopLingerMs);
    }
    catch (const zmq::error_t &e)
    {
        LOGGER_WARN("Publisher '{}': could not set linger before close: {}", name, e.what());
    }
    socket.close();
}

} // anonymous namespace

Publisher::Publisher(Config config, ContextRegistry &registry, TransportConfig transport)
    : m_name(std::move(config.name)), m_target(BindTarget::parse(config.address)),
      m_min_port(config.min_port), m_max_port(config.max_port), m_registry(registry),
      m_transport(std::move(transport))
{
    check_port_bound(m_min_port, "min_port");
    check_port_bound(m_max_port, "max_port");
    if (m_min_port && m_max_port && *m_min_port > *m_max_port)
    {
        throw std::invalid_argument(fmt::format("Publisher: min_port {} is above max_port {}",
                                                *m_min_port, *m_max_port));
    }
}

Publisher::~Publisher()
{
    std::lock_guard<std::mutex> lock(m_mu);
    if (m_state == State::Running)
    {
        close_socket();
        m_state = State::Stopped;
    }
}

Publisher &Publisher::start()
{
    SocketSetup setup;
    {
        std::lock_guard<std::mutex> lock(m_mu);
        if (m_state != State::Unstarted)
        {
            throw std::logic_error(fmt::format("Publisher '{}': start() called while {}", m_name,
                                               state_name(m_state)));
        }
        m_state = State::Starting;
        setup = m_socket_setup;
    }

    // m_mu is not held from here on: the setup hook may query this Publisher.
    // Starting keeps m_target and m_socket_setup unchanged until Running.
    ContextRegistry::ContextPtr context;
    std::optional<zmq::socket_t> socket;
    BindTarget target = m_target;
    std::optional<int> port;
    try
    {
        context = m_registry.get();
        socket.emplace(*context, zmq::socket_type::pub);
        if (setup)
        {
            setup(*socket);
        }
        set_tcp_keepalive(*socket, m_transport);

        if (target.wants_dynamic_port())
        {
            const int bound = (m_min_port || m_max_port)
                                  ? bind_in_range(*socket, m_min_port.value_or(kLowestPort),
                                                  m_max_port.value_or(kHighestPort))
                                  : bind_any_port(*socket);
            target = target.with_port(bound);
            port = bound;
        }
        else
        {
            socket->bind(target.to_string());
            port = target.port;
        }
    }
    catch (const std::exception &e)
    {
        LOGGER_ERROR("Publisher '{}': failed to start on {}: {}", m_name, target.to_string(),
                     e.what());
        if (socket)
        {
            close_with_linger(*socket, m_name);
        }
        std::lock_guard<std::mutex> lock(m_mu);
        m_state = State::Stopped;
        throw;
    }

    {
        std::lock_guard<std::mutex> lock(m_mu);
        m_context = std::move(context);
        m_socket = std::move(socket);
        m_target = std::move(target);
        m_port = port;
        m_state = State::Running;
    }
    LOGGER_INFO("Publisher for {} started on port {}.", destination(),
                port ? fmt::to_string(*port) : std::string("(none)"));
    return *this;
}

int Publisher::bind_any_port(zmq::socket_t &socket)
{
    socket.bind(fmt::format("{}://{}:*", m_target.scheme, m_target.host));
    const BindTarget bound = BindTarget::parse(socket.get(zmq::sockopt::last_endpoint));
    if (!bound.port)
    {
        throw BindError(fmt::format("Publisher '{}': OS-assigned endpoint has no port", m_name));
    }
    return *bound.port;
}

int Publisher::bind_in_range(zmq::socket_t &socket, int min_port, int max_port)
{
    const auto span = static_cast<uint32_t>(max_port - min_port + 1);
    const uint32_t offset = crypto::random_uniform(span);
    for (uint32_t i = 0; i < span; ++i)
    {
        const int port = min_port + static_cast<int>((offset + i) % span);
        try
        {
            socket.bind(fmt::format("{}://{}:{}", m_target.scheme, m_target.host, port));
            return port;
        }
        catch (const zmq::error_t &e)
        {
            // Privileged ports (EACCES) count as unavailable, like ports in use.
            if (e.num() != EADDRINUSE && e.num() != EACCES)
            {
                throw;
            }
            LOGGER_TRACE("Publisher '{}': port {} unavailable: {}", m_name, port, e.what());
        }
    }
    throw BindError(fmt::format("Publisher '{}': no free port in [{}, {}] on {}", m_name,
                                min_port, max_port, m_target.host));
}

void Publisher::send(std::string_view message)
{
    std::lock_guard<std::mutex> lock(m_mu);
    if (m_state != State::Running)
    {
        throw std::logic_error(
            fmt::format("Publisher '{}': send() called while {}", m_name, state_name(m_state)));
    }
    static_cast<void>(m_socket->send(zmq::buffer(message), zmq::send_flags::none));
}

void Publisher::stop()
{
    std::lock_guard<std::mutex> lock(m_mu);
    if (m_state != State::Running)
    {
        throw std::logic_error(
            fmt::format("Publisher '{}': stop() called while {}", m_name, state_name(m_state)));
    }
    close_socket();
    m_state = State::Stopped;
    LOGGER_DEBUG("Publisher for {} stopped.", m_target.to_string());
}

void Publisher::close_socket() noexcept
{
    if (m_socket)
    {
        close_with_linger(*m_socket, m_name);
        m_socket.reset();
    }
    m_context.reset();
}

void Publisher::set_socket_setup(SocketSetup setup)
{
    std::lock_guard<std::mutex> lock(m_mu);
    if (m_state != State::Unstarted)
    {
        throw std::logic_error(fmt::format(
            "Publisher '{}': set_socket_setup() called while {}", m_name, state_name(m_state)));
    }
    m_socket_setup = std::move(setup);
}

std::string Publisher::destination() const
{
    std::lock_guard<std::mutex> lock(m_mu);
    return m_target.to_string();
}

std::optional<int> Publisher::port_number() const
{
    std::lock_guard<std::mutex> lock(m_mu);
    return m_port;
}

Publisher::State Publisher::state() const
{
    std::lock_guard<std::mutex> lock(m_mu);
    return m_state;
}

} // namespace pubhub::hub
