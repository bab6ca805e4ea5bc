#include "utils/authenticator.hpp"
#include "utils/crypto_utils.hpp"
#include "utils/curve_keys.hpp"
#include "utils/logger.hpp"

#include <zmq_addon.hpp>

#include <algorithm>
#include <array>
#include <chrono>
#include <stdexcept>

namespace pubhub::hub
{

namespace
{
// Handler poll timeout; bounds how long stop() waits for the thread.
constexpr std::chrono::milliseconds kPollTimeout{100};
constexpr const char *kZapVersion = "1.0";
// Minimum ZAP request: version, request id, domain, address, identity, mechanism.
constexpr size_t kMinRequestFrames = 6;

ZapReply make_reply(const ZapRequest &request, bool allowed, const std::string &reason)
{
    ZapReply reply;
    reply.request_id = request.request_id;
    if (allowed)
    {
        reply.status_code = "200";
        reply.status_text = "OK";
        reply.user_id = "anonymous";
    }
    else
    {
        reply.status_code = "400";
        reply.status_text = reason;
    }
    return reply;
}

void send_reply(zmq::socket_t &socket, const ZapReply &reply)
{
    const std::string metadata;
    std::array<zmq::const_buffer, 6> frames = {
        zmq::buffer(reply.version),     zmq::buffer(reply.request_id),
        zmq::buffer(reply.status_code), zmq::buffer(reply.status_text),
        zmq::buffer(reply.user_id),     zmq::buffer(metadata),
    };
    static_cast<void>(zmq::send_multipart(socket, frames));
}

} // anonymous namespace

Authenticator::Authenticator(std::shared_ptr<zmq::context_t> context)
    : m_context(std::move(context))
{
    if (!m_context)
    {
        throw std::invalid_argument("Authenticator: context must not be null");
    }
}

Authenticator::~Authenticator()
{
    stop();
}

void Authenticator::start()
{
    if (m_thread.joinable())
    {
        throw std::logic_error("Authenticator: already started");
    }
    m_stop_requested.store(false, std::memory_order_release);

    std::promise<void> ready;
    auto ready_future = ready.get_future();
    m_thread = std::thread([this, p = std::move(ready)]() mutable { run(std::move(p)); });

    try
    {
        ready_future.get();
    }
    catch (const zmq::error_t &e)
    {
        m_thread.join();
        LOGGER_ERROR("Authenticator: cannot bind {}: {}", kZapEndpoint, e.what());
        throw;
    }
    m_running.store(true);
    LOGGER_DEBUG("Authenticator: ZAP handler listening on {}.", kZapEndpoint);
}

void Authenticator::stop()
{
    if (!m_thread.joinable())
    {
        return;
    }
    m_stop_requested.store(true, std::memory_order_release);
    m_thread.join();
    m_running.store(false);
    LOGGER_DEBUG("Authenticator: stopped.");
}

void Authenticator::allow(const std::vector<std::string> &addresses)
{
    std::lock_guard<std::mutex> lock(m_policy_mu);
    for (const auto &address : addresses)
    {
        m_allowed.insert(address);
        LOGGER_DEBUG("Authenticator: allowing {}.", address);
    }
}

void Authenticator::configure_curve(const std::string &domain, const std::string &location)
{
    CurveDomain entry;
    if (location == kCurveAllowAny)
    {
        entry.allow_any = true;
        LOGGER_DEBUG("Authenticator: domain '{}' accepts any CURVE key.", domain);
    }
    else
    {
        try
        {
            entry.keys = crypto::load_certificates(location);
        }
        catch (const std::runtime_error &e)
        {
            LOGGER_ERROR("Authenticator: failed to load CURVE keys for domain '{}' from '{}': {}",
                         domain, location, e.what());
        }
    }

    std::lock_guard<std::mutex> lock(m_policy_mu);
    m_curve_domains[domain] = std::move(entry);
}

ZapReply Authenticator::authenticate(const ZapRequest &request) const
{
    if (request.version != kZapVersion)
    {
        LOGGER_WARN("Authenticator: invalid ZAP version '{}'.", request.version);
        return make_reply(request, false, "Invalid version");
    }

    bool allowed = false;
    bool denied = false;
    std::string reason = "NO ACCESS";
    {
        std::lock_guard<std::mutex> lock(m_policy_mu);
        if (!m_allowed.empty())
        {
            if (m_allowed.count(request.address) != 0)
            {
                allowed = true;
            }
            else
            {
                denied = true;
                reason = "Address not allowed";
            }
        }
    }

    if (!denied)
    {
        if (request.mechanism == "NULL")
        {
            allowed = true;
        }
        else if (request.mechanism == "CURVE")
        {
            allowed = check_curve(request, reason);
        }
        else
        {
            allowed = false;
            reason = "Unsupported mechanism";
        }
    }

    if (allowed)
    {
        LOGGER_DEBUG("Authenticator: allowed {} ({}).", request.address, request.mechanism);
    }
    else
    {
        LOGGER_INFO("Authenticator: denied {} ({}): {}.", request.address, request.mechanism,
                    reason);
    }
    return make_reply(request, allowed, reason);
}

bool Authenticator::check_curve(const ZapRequest &request, std::string &reason) const
{
    if (request.credentials.empty() || request.credentials.front().size() != crypto::kCurveKeyBytes)
    {
        reason = "Unknown key";
        return false;
    }
    crypto::CurveKeyBytes raw{};
    std::copy(request.credentials.front().begin(), request.credentials.front().end(),
              reinterpret_cast<char *>(raw.data()));
    const std::string client_key = crypto::z85_encode_key(raw);

    // Only the empty domain maps to the catch-all key set.
    const std::string domain = request.domain.empty() ? std::string(kCurveAllowAny) : request.domain;

    std::lock_guard<std::mutex> lock(m_policy_mu);
    auto it = m_curve_domains.find(domain);
    if (it == m_curve_domains.end())
    {
        reason = "Unknown domain";
        return false;
    }
    if (it->second.allow_any)
    {
        return true;
    }
    bool found = false;
    for (const auto &key : it->second.keys)
    {
        if (key.size() == client_key.size() &&
            crypto::constant_time_equal(key.data(), client_key.data(), key.size()))
        {
            found = true;
        }
    }
    if (!found)
    {
        reason = "Unknown key";
    }
    return found;
}

void Authenticator::run(std::promise<void> ready)
{
    zmq::socket_t handler(*m_context, zmq::socket_type::rep);
    handler.set(zmq::sockopt::linger, 0);
    try
    {
        handler.bind(kZapEndpoint);
    }
    catch (const zmq::error_t &)
    {
        ready.set_exception(std::current_exception());
        return;
    }
    ready.set_value();

    try
    {
        while (!m_stop_requested.load(std::memory_order_acquire))
        {
            std::vector<zmq::pollitem_t> items = {{handler.handle(), 0, ZMQ_POLLIN, 0}};
            zmq::poll(items, kPollTimeout);
            if ((items[0].revents & ZMQ_POLLIN) != 0)
            {
                handle_request(handler);
            }
        }
    }
    catch (const zmq::error_t &e)
    {
        // ETERM: the context is being torn down underneath us.
        if (e.num() != ETERM)
        {
            LOGGER_ERROR("Authenticator: handler loop failed: {}", e.what());
        }
    }
    handler.close();
}

void Authenticator::handle_request(zmq::socket_t &socket)
{
    std::vector<zmq::message_t> frames;
    static_cast<void>(zmq::recv_multipart(socket, std::back_inserter(frames)));

    ZapRequest request;
    if (frames.size() >= 2)
    {
        request.version = frames[0].to_string();
        request.request_id = frames[1].to_string();
    }
    if (frames.size() < kMinRequestFrames)
    {
        LOGGER_WARN("Authenticator: malformed ZAP request (expected >={} frames, got {})",
                    kMinRequestFrames, frames.size());
        send_reply(socket, make_reply(request, false, "Malformed request"));
        return;
    }
    request.domain = frames[2].to_string();
    request.address = frames[3].to_string();
    request.identity = frames[4].to_string();
    request.mechanism = frames[5].to_string();
    for (size_t i = kMinRequestFrames; i < frames.size(); ++i)
    {
        request.credentials.push_back(frames[i].to_string());
    }

    send_reply(socket, authenticate(request));
}

} // namespace pubhub::hub
