#pragma once
/**
 * @file publisher.hpp
 * @brief Publisher: one PUB socket bound to a TCP endpoint.
 *
 * Bind resolution in start():
 *  - destination port explicitly `0` → dynamic port. Without bounds the
 *    socket binds `host:*` and reads back the port the OS picked. With
 *    `min_port` and/or `max_port` (inclusive, missing bounds default to
 *    1 and 65535) every port in the range is tried once, starting from a
 *    random offset; ports in use or privileged are skipped. The destination
 *    is rewritten to `host:<port>`.
 *  - otherwise the destination is bound as given.
 *
 * Lifecycle: `Unstarted → Starting → Running → Stopped` (a failed start goes
 * from Starting to Stopped). A stopped Publisher stays stopped; create a new
 * one to bind again.
 *
 * Usage:
 * @code
 *   Publisher pub({.address = "tcp://*:0", .name = "sensor", .min_port = 5000,
 *                  .max_port = 5010});
 *   pub.start();
 *   pub.send("sensor.temperature 21.5");
 *   pub.stop();
 * @endcode
 */
#include "pubhub_utils_export.h"
#include "utils/bind_target.hpp"
#include "utils/transport_config.hpp"
#include "utils/zmq_context.hpp"

#include <zmq.hpp>

#include <functional>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>

namespace pubhub::hub
{

/// No free port was found in the requested range.
class PUBHUB_UTILS_EXPORT BindError : public std::runtime_error
{
  public:
    using std::runtime_error::runtime_error;
};

class PUBHUB_UTILS_EXPORT Publisher
{
  public:
    struct Config
    {
        std::string address;
        std::string name;
        std::optional<int> min_port;
        std::optional<int> max_port;
    };

    enum class State
    {
        Unstarted,
        Starting,
        Running,
        Stopped,
    };

    /// Called on the freshly created socket before keepalive and bind. It runs
    /// without the Publisher's lock held and may call its accessors.
    using SocketSetup = std::function<void(zmq::socket_t &)>;

    /**
     * @param config Destination, name and optional port range.
     * @param registry Source of the process context.
     * @param transport Keepalive settings.
     * @throws std::invalid_argument if the address cannot be parsed or the
     *         port bounds are outside [1, 65535] or inverted.
     */
    explicit Publisher(Config config,
                       ContextRegistry &registry = ContextRegistry::process_default(),
                       TransportConfig transport = TransportConfig::load_default());
    ~Publisher();

    Publisher(const Publisher &) = delete;
    Publisher &operator=(const Publisher &) = delete;

    /**
     * @brief Creates the socket and binds it.
     * @throws std::logic_error if not Unstarted (including a start() already
     *         in progress on another thread).
     * @throws BindError if no port of the range is free.
     * @throws zmq::error_t for any other bind failure.
     * On failure the socket is closed and the Publisher is Stopped.
     */
    Publisher &start();

    /**
     * @brief Sends @p message as one frame. Serialized across threads.
     * @throws std::logic_error if not Running.
     */
    void send(std::string_view message);

    /**
     * @brief Closes the socket with a 1 ms linger.
     * @throws std::logic_error if not Running.
     */
    void stop();

    /// @throws std::logic_error if not Unstarted.
    void set_socket_setup(SocketSetup setup);

    [[nodiscard]] const std::string &name() const noexcept { return m_name; }
    /// Destination; after a dynamic bind it names the bound port.
    [[nodiscard]] std::string destination() const;
    /// Bound port; empty until start() succeeded.
    [[nodiscard]] std::optional<int> port_number() const;
    [[nodiscard]] State state() const;
    [[nodiscard]] bool is_running() const { return state() == State::Running; }

  private:
    int bind_in_range(zmq::socket_t &socket, int min_port, int max_port);
    int bind_any_port(zmq::socket_t &socket);
    void close_socket() noexcept;

    std::string m_name;
    BindTarget m_target;
    std::optional<int> m_min_port;
    std::optional<int> m_max_port;
    ContextRegistry &m_registry;
    TransportConfig m_transport;
    SocketSetup m_socket_setup;

    mutable std::mutex m_mu;
    ContextRegistry::ContextPtr m_context;
    std::optional<zmq::socket_t> m_socket;
    std::optional<int> m_port;
    State m_state = State::Unstarted;
};

} // namespace pubhub::hub
