/**
 * @file test_authenticator.cpp
 * @brief Layer 3 tests for the ZAP handler: policy decisions and the
 *        request/reply exchange on inproc://zeromq.zap.01.
 */
#include "phb_transport.hpp"
#include "shared_test_helpers.h"
#include <gtest/gtest.h>

#include <zmq_addon.hpp>

using namespace pubhub::hub;
using namespace pubhub::tests::helper;
namespace crypto = pubhub::crypto;

namespace
{

ZapRequest make_request(std::string mechanism, std::string address = "127.0.0.1",
                        std::vector<std::string> credentials = {})
{
    ZapRequest r;
    r.version = "1.0";
    r.request_id = "7";
    r.domain = "";
    r.address = std::move(address);
    r.identity = "";
    r.mechanism = std::move(mechanism);
    r.credentials = std::move(credentials);
    return r;
}

/// CURVE credentials frame (raw 32-byte key) for a Z85 public key.
std::string raw_key(const std::string &z85)
{
    const crypto::CurveKeyBytes bytes = crypto::z85_decode_key(z85);
    return std::string(reinterpret_cast<const char *>(bytes.data()), bytes.size());
}

} // namespace

class AuthenticatorTest : public ::testing::Test
{
  protected:
    void SetUp() override
    {
        const auto [pub, sec] = crypto::generate_certificate(keys_.path(), "client");
        static_cast<void>(sec);
        client_key_ = crypto::load_certificate(pub).public_key;
        const auto [other_pub, other_sec] = crypto::generate_certificate(other_.path(), "other");
        static_cast<void>(other_sec);
        other_key_ = crypto::load_certificate(other_pub).public_key;
    }

    TempDir keys_{"pubhub_auth_keys"};
    TempDir other_{"pubhub_auth_other"};
    std::string client_key_;
    std::string other_key_;
    std::shared_ptr<zmq::context_t> ctx_ = std::make_shared<zmq::context_t>(1);
};

TEST_F(AuthenticatorTest, NullMechanismAllowedWithoutAllowList)
{
    Authenticator auth(ctx_);
    const ZapReply reply = auth.authenticate(make_request("NULL"));
    EXPECT_TRUE(reply.ok());
    EXPECT_EQ(reply.status_text, "OK");
    EXPECT_EQ(reply.user_id, "anonymous");
    EXPECT_EQ(reply.request_id, "7");
}

TEST_F(AuthenticatorTest, InvalidVersionRejected)
{
    Authenticator auth(ctx_);
    ZapRequest request = make_request("NULL");
    request.version = "2.0";
    const ZapReply reply = auth.authenticate(request);
    EXPECT_EQ(reply.status_code, "400");
    EXPECT_EQ(reply.status_text, "Invalid version");
}

TEST_F(AuthenticatorTest, AllowListRejectsOtherAddresses)
{
    Authenticator auth(ctx_);
    auth.allow({"10.0.0.5"});
    auth.configure_curve("*", keys_.path().string());

    const ZapReply denied = auth.authenticate(make_request("CURVE", "127.0.0.1", {raw_key(client_key_)}));
    EXPECT_FALSE(denied.ok());
    EXPECT_EQ(denied.status_text, "Address not allowed");

    const ZapReply allowed = auth.authenticate(make_request("CURVE", "10.0.0.5", {raw_key(client_key_)}));
    EXPECT_TRUE(allowed.ok());

    // NULL peers are refused by the allow-list as well.
    EXPECT_FALSE(auth.authenticate(make_request("NULL", "127.0.0.1")).ok());
}

TEST_F(AuthenticatorTest, CurveChecksTrustedKeys)
{
    Authenticator auth(ctx_);
    auth.configure_curve("*", keys_.path().string());

    EXPECT_TRUE(auth.authenticate(make_request("CURVE", "127.0.0.1", {raw_key(client_key_)})).ok());

    const ZapReply unknown =
        auth.authenticate(make_request("CURVE", "127.0.0.1", {raw_key(other_key_)}));
    EXPECT_FALSE(unknown.ok());
    EXPECT_EQ(unknown.status_text, "Unknown key");

    const ZapReply malformed = auth.authenticate(make_request("CURVE", "127.0.0.1", {"short"}));
    EXPECT_EQ(malformed.status_text, "Unknown key");
}

TEST_F(AuthenticatorTest, CurveWithoutConfiguredDomain)
{
    Authenticator auth(ctx_);
    const ZapReply reply =
        auth.authenticate(make_request("CURVE", "127.0.0.1", {raw_key(client_key_)}));
    EXPECT_FALSE(reply.ok());
    EXPECT_EQ(reply.status_text, "Unknown domain");
}

TEST_F(AuthenticatorTest, CurveNamedDomainNeedsItsOwnKeys)
{
    Authenticator auth(ctx_);
    auth.configure_curve("*", keys_.path().string());

    ZapRequest named = make_request("CURVE", "127.0.0.1", {raw_key(client_key_)});
    named.domain = "sensors";
    const ZapReply unknown = auth.authenticate(named);
    EXPECT_FALSE(unknown.ok());
    EXPECT_EQ(unknown.status_text, "Unknown domain");

    auth.configure_curve("sensors", keys_.path().string());
    EXPECT_TRUE(auth.authenticate(named).ok());
}

TEST_F(AuthenticatorTest, CurveAllowAnyAcceptsEveryKey)
{
    Authenticator auth(ctx_);
    auth.configure_curve("*", std::string(Authenticator::kCurveAllowAny));
    EXPECT_TRUE(auth.authenticate(make_request("CURVE", "127.0.0.1", {raw_key(other_key_)})).ok());
}

TEST_F(AuthenticatorTest, UnloadableKeyDirectoryRejectsEveryKey)
{
    Authenticator auth(ctx_);
    auth.configure_curve("*", (keys_.path() / "does_not_exist").string());
    const ZapReply reply =
        auth.authenticate(make_request("CURVE", "127.0.0.1", {raw_key(client_key_)}));
    EXPECT_FALSE(reply.ok());
    EXPECT_EQ(reply.status_text, "Unknown key");
}

TEST_F(AuthenticatorTest, PlainAndGssapiUnsupported)
{
    Authenticator auth(ctx_);
    EXPECT_EQ(auth.authenticate(make_request("PLAIN", "127.0.0.1", {"user", "pw"})).status_text,
              "Unsupported mechanism");
    EXPECT_EQ(auth.authenticate(make_request("GSSAPI")).status_text, "Unsupported mechanism");
}

TEST_F(AuthenticatorTest, HandlerAnswersZapRequests)
{
    Authenticator auth(ctx_);
    auth.start();
    ASSERT_TRUE(auth.is_running());
    auth.configure_curve("*", keys_.path().string());

    zmq::socket_t client(*ctx_, zmq::socket_type::req);
    client.set(zmq::sockopt::linger, 0);
    client.set(zmq::sockopt::rcvtimeo, 5000);
    client.connect(Authenticator::kZapEndpoint);

    const std::string key = raw_key(client_key_);
    std::array<zmq::const_buffer, 7> request = {
        zmq::str_buffer("1.0"), zmq::str_buffer("42"),        zmq::str_buffer(""),
        zmq::str_buffer("127.0.0.1"), zmq::str_buffer(""), zmq::str_buffer("CURVE"),
        zmq::buffer(key),
    };
    ASSERT_TRUE(zmq::send_multipart(client, request).has_value());

    std::vector<zmq::message_t> reply;
    ASSERT_TRUE(zmq::recv_multipart(client, std::back_inserter(reply)).has_value())
        << "ZAP handler did not answer";
    ASSERT_EQ(reply.size(), 6u);
    EXPECT_EQ(reply[0].to_string(), "1.0");
    EXPECT_EQ(reply[1].to_string(), "42");
    EXPECT_EQ(reply[2].to_string(), "200");
    EXPECT_EQ(reply[4].to_string(), "anonymous");

    client.close();
    auth.stop();
    EXPECT_FALSE(auth.is_running());
}

TEST_F(AuthenticatorTest, StartStopRules)
{
    Authenticator auth(ctx_);
    auth.start();
    EXPECT_THROW(auth.start(), std::logic_error);

    Authenticator second(ctx_);
    EXPECT_THROW(second.start(), zmq::error_t) << "Only one ZAP handler may bind per context";

    auth.stop();
    EXPECT_FALSE(auth.is_running());
    EXPECT_NO_THROW(auth.stop());
}

TEST_F(AuthenticatorTest, NullContextRejected)
{
    EXPECT_THROW(Authenticator(nullptr), std::invalid_argument);
}
