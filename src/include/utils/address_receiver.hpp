#pragma once
/**
 * @file address_receiver.hpp
 * @brief Reply socket collecting address announcements.
 *
 * Binds `tcp://*:<port>` at construction. Each receive() takes one message
 * and acknowledges it with `"ok"`, so senders use a plain request socket.
 */
#include "pubhub_utils_export.h"
#include "utils/transport_config.hpp"
#include "utils/zmq_context.hpp"

#include <zmq.hpp>

#include <optional>
#include <string>

namespace pubhub::hub
{

class PUBHUB_UTILS_EXPORT AddressReceiver
{
  public:
    /**
     * @param port Port to bind; when empty, `address_publish_port` of
     *        @p transport (default 16543).
     * @throws zmq::error_t if the port cannot be bound.
     */
    explicit AddressReceiver(std::optional<int> port = std::nullopt,
                             ContextRegistry &registry = ContextRegistry::process_default(),
                             const TransportConfig &transport = TransportConfig::load_default());
    ~AddressReceiver();

    AddressReceiver(const AddressReceiver &) = delete;
    AddressReceiver &operator=(const AddressReceiver &) = delete;

    /**
     * @brief Blocks for one message, replies "ok" and returns the message.
     * @throws std::logic_error after close().
     */
    std::string receive();

    /// Closes the socket with a 1 ms linger. Idempotent.
    void close() noexcept;

    [[nodiscard]] int port() const noexcept { return m_port; }
    [[nodiscard]] bool is_open() const noexcept { return m_socket.has_value(); }

  private:
    int m_port;
    ContextRegistry::ContextPtr m_context;
    std::optional<zmq::socket_t> m_socket;
};

} // namespace pubhub::hub
