#pragma once
/**
 * @file zmq_context.hpp
 * @brief Process-keyed registry of ZeroMQ contexts.
 *
 * A ZeroMQ context (and every socket created from it) is invalid in a forked
 * child. The registry keys contexts by process id so that each process,
 * original or forked, lazily gets its own context on first use and never
 * touches the one inherited from its parent.
 *
 * Contexts are handed out as `std::shared_ptr<zmq::context_t>`: a socket owner
 * keeps its context alive after the registry entry is destroyed, and the
 * context terminates when the last owner lets go.
 *
 * Usage:
 * @code
 *   auto ctx = pubhub::hub::get_zmq_context();          // this process
 *   zmq::socket_t sock(*ctx, zmq::socket_type::pub);
 *   ...
 *   pubhub::hub::destroy_zmq_context();                  // throws if never created
 * @endcode
 */
#include "pubhub_utils_export.h"

#include <zmq.hpp>

#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <unordered_map>

namespace pubhub::hub
{

/// Thrown when destroying a context that was never created for a process.
class PUBHUB_UTILS_EXPORT ContextNotFoundError : public std::out_of_range
{
  public:
    explicit ContextNotFoundError(uint64_t pid);

    [[nodiscard]] uint64_t pid() const noexcept { return m_pid; }

  private:
    uint64_t m_pid;
};

class PUBHUB_UTILS_EXPORT ContextRegistry
{
  public:
    using ContextPtr = std::shared_ptr<zmq::context_t>;

    ContextRegistry() = default;

    /// Contexts inherited from a parent process across fork() are abandoned, not terminated.
    ~ContextRegistry();

    ContextRegistry(const ContextRegistry &) = delete;
    ContextRegistry &operator=(const ContextRegistry &) = delete;

    /**
     * @brief Returns the context registered for @p pid, creating it if absent.
     * Thread-safe; concurrent first access creates exactly one context.
     */
    ContextPtr get_or_create(uint64_t pid);

    /// Context for the calling process (`platform::get_pid()`).
    ContextPtr get();

    /**
     * @brief Removes and releases the context registered for @p pid.
     *
     * @param linger When zero, the context is switched to non-blocking
     *        termination so messages still queued on open sockets are dropped
     *        when it terminates. Any other value (or none) keeps the default
     *        blocking termination governed by each socket's ZMQ_LINGER.
     * @throws ContextNotFoundError if no context is registered for @p pid.
     */
    void destroy(uint64_t pid, std::optional<std::chrono::milliseconds> linger = std::nullopt);

    /// destroy() for the calling process.
    void destroy(std::optional<std::chrono::milliseconds> linger = std::nullopt);

    [[nodiscard]] bool contains(uint64_t pid) const;
    [[nodiscard]] size_t size() const;

    /// The registry shared by the whole process.
    static ContextRegistry &process_default();

  private:
    mutable std::mutex m_mu;
    std::unordered_map<uint64_t, ContextPtr> m_contexts;
};

/// Context of the calling process from the process-wide registry.
[[nodiscard]] PUBHUB_UTILS_EXPORT ContextRegistry::ContextPtr get_zmq_context();

/// Destroys the calling process's context in the process-wide registry.
PUBHUB_UTILS_EXPORT void
destroy_zmq_context(std::optional<std::chrono::milliseconds> linger = std::nullopt);

} // namespace pubhub::hub
