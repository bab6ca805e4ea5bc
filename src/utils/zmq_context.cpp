#include "utils/zmq_context.hpp"

#include "phb_platform.hpp"
#include "utils/logger.hpp"

#include <fmt/format.h>

namespace pubhub::hub
{

ContextNotFoundError::ContextNotFoundError(uint64_t pid)
    : std::out_of_range(fmt::format("ZMQContext: no context registered for PID {}", pid)),
      m_pid(pid)
{
}

ContextRegistry::~ContextRegistry()
{
    const uint64_t self = platform::get_pid();
    for (auto &[pid, ctx] : m_contexts)
    {
        if (pid != self)
        {
            // Terminating a parent's context here would wait on I/O threads that
            // do not exist in this process.
            static_cast<void>(new ContextPtr(std::move(ctx)));
        }
    }
}

ContextRegistry::ContextPtr ContextRegistry::get_or_create(uint64_t pid)
{
    std::lock_guard<std::mutex> lock(m_mu);
    auto it = m_contexts.find(pid);
    if (it != m_contexts.end())
    {
        return it->second;
    }
    auto ctx = std::make_shared<zmq::context_t>(1);
    m_contexts.emplace(pid, ctx);
    LOGGER_DEBUG("ZMQContext: renewed context for PID {}.", pid);
    return ctx;
}

ContextRegistry::ContextPtr ContextRegistry::get()
{
    return get_or_create(platform::get_pid());
}

void ContextRegistry::destroy(uint64_t pid, std::optional<std::chrono::milliseconds> linger)
{
    ContextPtr ctx;
    {
        std::lock_guard<std::mutex> lock(m_mu);
        auto it = m_contexts.find(pid);
        if (it == m_contexts.end())
        {
            LOGGER_ERROR("ZMQContext: destroy requested for PID {} but no context exists.", pid);
            throw ContextNotFoundError(pid);
        }
        ctx = std::move(it->second);
        m_contexts.erase(it);
    }

    if (linger && linger->count() == 0)
    {
        ctx->set(zmq::ctxopt::blocky, false);
    }
    const long use_count = ctx.use_count();
    // Terminates here unless sockets' owners still share it (outside the lock:
    // zmq_ctx_term may block on open sockets).
    ctx.reset();
    LOGGER_DEBUG("ZMQContext: released context for PID {} ({} other owner(s)).", pid,
                 use_count - 1);
}

void ContextRegistry::destroy(std::optional<std::chrono::milliseconds> linger)
{
    destroy(platform::get_pid(), linger);
}

bool ContextRegistry::contains(uint64_t pid) const
{
    std::lock_guard<std::mutex> lock(m_mu);
    return m_contexts.count(pid) != 0;
}

size_t ContextRegistry::size() const
{
    std::lock_guard<std::mutex> lock(m_mu);
    return m_contexts.size();
}

ContextRegistry &ContextRegistry::process_default()
{
    static ContextRegistry registry;
    return registry;
}

ContextRegistry::ContextPtr get_zmq_context()
{
    return ContextRegistry::process_default().get();
}

void destroy_zmq_context(std::optional<std::chrono::milliseconds> linger)
{
    ContextRegistry::process_default().destroy(linger);
}

} // namespace pubhub::hub
