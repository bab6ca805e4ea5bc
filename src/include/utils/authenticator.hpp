#pragma once
/**
 * @file authenticator.hpp
 * @brief ZAP (ZeroMQ Authentication Protocol, RFC 27) handler.
 *
 * libzmq asks the socket bound to `inproc://zeromq.zap.01` of a context to
 * approve every incoming connection on that context's secured sockets. The
 * Authenticator binds that endpoint on a background thread and answers each
 * request from its policy:
 *
 *  - **Allow-list**: once any address is allowed, peers from other addresses
 *    are refused before their credentials are looked at.
 *  - **NULL** mechanism: accepted unless refused by the allow-list.
 *  - **CURVE** mechanism: the client's public key must be one of the keys
 *    configured for the ZAP domain. Requests with an empty domain use the
 *    keys configured for `"*"`; other domains need their own keys.
 *  - **PLAIN** and **GSSAPI**: refused.
 *
 * Policy calls (`allow`, `configure_curve`) may be made before or after
 * `start()`; they are synchronized with the handler thread.
 *
 * Usage:
 * @code
 *   Authenticator auth(get_zmq_context());
 *   auth.start();
 *   auth.allow({"127.0.0.1"});
 *   auth.configure_curve("*", "/etc/pubhub/public_keys");
 *   ...
 *   auth.stop();
 * @endcode
 */
#include "pubhub_utils_export.h"

#include <zmq.hpp>

#include <atomic>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

namespace pubhub::hub
{

/// One ZAP request, frame for frame.
struct ZapRequest
{
    std::string version;
    std::string request_id;
    std::string domain;
    std::string address;
    std::string identity;
    std::string mechanism;
    std::vector<std::string> credentials;
};

/// The reply frames sent back to libzmq (metadata is always empty).
struct ZapReply
{
    std::string version{"1.0"};
    std::string request_id;
    std::string status_code;
    std::string status_text;
    std::string user_id;

    [[nodiscard]] bool ok() const noexcept { return status_code == "200"; }
};

class PUBHUB_UTILS_EXPORT Authenticator
{
  public:
    /// Location passed to configure_curve() to accept any client key.
    static constexpr std::string_view kCurveAllowAny = "*";
    static constexpr const char *kZapEndpoint = "inproc://zeromq.zap.01";

    explicit Authenticator(std::shared_ptr<zmq::context_t> context);
    ~Authenticator();

    Authenticator(const Authenticator &) = delete;
    Authenticator &operator=(const Authenticator &) = delete;

    /**
     * @brief Starts the handler thread; returns once the ZAP endpoint is bound.
     * @throws std::logic_error if already running.
     * @throws zmq::error_t if the endpoint cannot be bound (e.g. another
     *         handler already serves this context).
     */
    void start();

    /// Stops and joins the handler thread. Safe to call when not running.
    void stop();

    [[nodiscard]] bool is_running() const noexcept { return m_running.load(); }

    /// Adds @p addresses (peer IP addresses) to the allow-list.
    void allow(const std::vector<std::string> &addresses);

    /**
     * @brief Sets the trusted CURVE keys of @p domain.
     *
     * @param domain ZAP domain, `"*"` for requests without a domain.
     * @param location Directory of `*.key` certificates, or kCurveAllowAny.
     *        If the directory cannot be loaded the error is logged and the
     *        domain is left with no trusted key.
     */
    void configure_curve(const std::string &domain, const std::string &location);

    /// The decision for @p request under the current policy.
    [[nodiscard]] ZapReply authenticate(const ZapRequest &request) const;

  private:
    struct CurveDomain
    {
        bool allow_any = false;
        std::set<std::string> keys;
    };

    void run(std::promise<void> ready);
    void handle_request(zmq::socket_t &socket);
    bool check_curve(const ZapRequest &request, std::string &reason) const;

    std::shared_ptr<zmq::context_t> m_context;
    std::thread m_thread;
    std::atomic<bool> m_running{false};
    std::atomic<bool> m_stop_requested{false};

    mutable std::mutex m_policy_mu;
    std::set<std::string> m_allowed;
    std::map<std::string, CurveDomain> m_curve_domains;
};

} // namespace pubhub::hub
