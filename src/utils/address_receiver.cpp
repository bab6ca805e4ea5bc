#include "utils/address_receiver.hpp"
#include "utils/logger.hpp"

#include <fmt/format.h>

#include <stdexcept>

namespace pubhub::hub
{

namespace
{
constexpr int kCloseLingerMs = 1;
constexpr std::string_view kAck = "ok";
} // anonymous namespace

AddressReceiver::AddressReceiver(std::optional<int> port, ContextRegistry &registry,
                                 const TransportConfig &transport)
    : m_port(port.value_or(transport.address_publish_port())), m_context(registry.get())
{
    m_socket.emplace(*m_context, zmq::socket_type::rep);
    try
    {
        m_socket->bind(fmt::format("tcp://*:{}", m_port));
    }
    catch (const zmq::error_t &e)
    {
        LOGGER_ERROR("AddressReceiver: cannot bind port {}: {}", m_port, e.what());
        close();
        throw;
    }
    LOGGER_DEBUG("AddressReceiver: listening on port {}.", m_port);
}

AddressReceiver::~AddressReceiver()
{
    close();
}

std::string AddressReceiver::receive()
{
    if (!m_socket)
    {
        throw std::logic_error("AddressReceiver: receive() after close()");
    }
    zmq::message_t message;
    static_cast<void>(m_socket->recv(message, zmq::recv_flags::none));
    std::string payload = message.to_string();
    static_cast<void>(m_socket->send(zmq::buffer(kAck), zmq::send_flags::none));
    LOGGER_TRACE("AddressReceiver: received {} byte(s).", payload.size());
    return payload;
}

void AddressReceiver::close() noexcept
{
    if (!m_socket)
    {
        return;
    }
    try
    {
        m_socket->set(zmq::sockopt::linger, kCloseLingerMs);
    }
    catch (const zmq::error_t &e)
    {
        LOGGER_WARN("AddressReceiver: could not set linger before close: {}", e.what());
    }
    m_socket->close();
    m_socket.reset();
    m_context.reset();
}

} // namespace pubhub::hub
