/**
 * @file test_secure_publisher.cpp
 * @brief Layer 3 tests for SecurePublisher: construction checks, start
 *        failures and CURVE admission of subscribers.
 */
#include "phb_transport.hpp"
#include "shared_test_helpers.h"
#include <gtest/gtest.h>

#include <cerrno>
#include <thread>

using namespace pubhub::hub;
using namespace pubhub::tests::helper;
using namespace std::chrono_literals;
namespace crypto = pubhub::crypto;
using pubhub::TransportConfig;

class SecurePublisherTest : public ::testing::Test
{
  protected:
    void SetUp() override
    {
        const auto [server_pub, server_sec] =
            crypto::generate_certificate(certs_.path() / "server", "server");
        server_public_path_ = server_pub;
        server_secret_path_ = server_sec;
        trusted_dir_ = certs_.path() / "trusted";
        const auto [client_pub, client_sec] =
            crypto::generate_certificate(trusted_dir_, "client");
        static_cast<void>(client_pub);
        client_ = crypto::load_certificate(client_sec);
        const auto [stranger_pub, stranger_sec] =
            crypto::generate_certificate(certs_.path() / "untrusted", "stranger");
        static_cast<void>(stranger_pub);
        stranger_ = crypto::load_certificate(stranger_sec);
        server_public_key_ = crypto::load_certificate(server_public_path_).public_key;
    }

    SecurePublisher::Config MakeConfig(std::vector<std::string> allowed = {}) const
    {
        SecurePublisher::Config cfg;
        cfg.address = "tcp://127.0.0.1:0";
        cfg.name = "secure";
        cfg.server_secret_key = server_secret_path_.string();
        cfg.public_keys_directory = trusted_dir_.string();
        cfg.authorized_sub_addresses = std::move(allowed);
        return cfg;
    }

    /// Subscriber using @p keys as its CURVE identity; true if it receives anything.
    bool SubscriberReceives(SecurePublisher &pub, const crypto::CurveKeyPair &keys,
                            std::chrono::milliseconds timeout)
    {
        zmq::context_t ctx(1);
        zmq::socket_t sub(ctx, zmq::socket_type::sub);
        sub.set(zmq::sockopt::linger, 0);
        sub.set(zmq::sockopt::curve_serverkey, server_public_key_);
        sub.set(zmq::sockopt::curve_publickey, keys.public_key);
        sub.set(zmq::sockopt::curve_secretkey, keys.secret_key.value());
        sub.set(zmq::sockopt::subscribe, "");
        sub.connect(pub.destination());

        const auto deadline = std::chrono::steady_clock::now() + timeout;
        while (std::chrono::steady_clock::now() < deadline)
        {
            pub.send("secure-ping");
            std::vector<zmq::pollitem_t> items = {{sub.handle(), 0, ZMQ_POLLIN, 0}};
            zmq::poll(items, 50ms);
            if ((items[0].revents & ZMQ_POLLIN) != 0)
            {
                zmq::message_t msg;
                static_cast<void>(sub.recv(msg, zmq::recv_flags::none));
                return msg.to_string() == "secure-ping";
            }
        }
        return false;
    }

    TempDir certs_{"pubhub_secure"};
    fs::path server_public_path_;
    fs::path server_secret_path_;
    fs::path trusted_dir_;
    std::string server_public_key_;
    crypto::CurveKeyPair client_;
    crypto::CurveKeyPair stranger_;
    ContextRegistry registry_;
    TransportConfig transport_;
};

TEST_F(SecurePublisherTest, ConstructionRequiresKeyMaterial)
{
    auto no_secret = MakeConfig();
    no_secret.server_secret_key.clear();
    EXPECT_THROW(SecurePublisher(no_secret, registry_, transport_), std::invalid_argument);

    auto no_dir = MakeConfig();
    no_dir.public_keys_directory.clear();
    EXPECT_THROW(SecurePublisher(no_dir, registry_, transport_), std::invalid_argument);
}

TEST_F(SecurePublisherTest, TrustedSubscriberIsAdmitted)
{
    SecurePublisher pub(MakeConfig(), registry_, transport_);
    pub.start();
    ASSERT_TRUE(pub.is_running());
    ASSERT_TRUE(pub.port_number().has_value());
    EXPECT_TRUE(SubscriberReceives(pub, client_, 5s));
    pub.stop();
    EXPECT_EQ(pub.state(), Publisher::State::Stopped);
}

TEST_F(SecurePublisherTest, UntrustedKeyIsRejected)
{
    SecurePublisher pub(MakeConfig(), registry_, transport_);
    pub.start();
    EXPECT_FALSE(SubscriberReceives(pub, stranger_, 1500ms));
    pub.stop();
}

TEST_F(SecurePublisherTest, AllowListRejectsOtherAddresses)
{
    SecurePublisher pub(MakeConfig({"10.255.255.1"}), registry_, transport_);
    pub.start();
    EXPECT_FALSE(SubscriberReceives(pub, client_, 1500ms))
        << "A trusted key from a non-listed address must be refused";
    pub.stop();
}

TEST_F(SecurePublisherTest, AllowListAdmitsListedAddress)
{
    SecurePublisher pub(MakeConfig({"127.0.0.1"}), registry_, transport_);
    pub.start();
    EXPECT_TRUE(SubscriberReceives(pub, client_, 5s));
    pub.stop();
}

TEST_F(SecurePublisherTest, MissingCertificateFailsAndStopsAuthenticator)
{
    auto cfg = MakeConfig();
    cfg.server_secret_key = (certs_.path() / "absent.key_secret").string();
    SecurePublisher pub(cfg, registry_, transport_);
    EXPECT_THROW(pub.start(), std::runtime_error);
    EXPECT_FALSE(pub.is_running());

    // The ZAP endpoint was released: another secure publisher can start.
    SecurePublisher next(MakeConfig(), registry_, transport_);
    bool started = false;
    for (int attempt = 0; attempt < 50 && !started; ++attempt)
    {
        try
        {
            next.start();
            started = true;
        }
        catch (const zmq::error_t &e)
        {
            ASSERT_EQ(e.num(), EADDRINUSE) << e.what();
            std::this_thread::sleep_for(20ms);
        }
    }
    EXPECT_TRUE(started);
    if (started)
        next.stop();
}

TEST_F(SecurePublisherTest, PublicOnlyCertificateIsRejected)
{
    auto cfg = MakeConfig();
    cfg.server_secret_key = server_public_path_.string();
    SecurePublisher pub(cfg, registry_, transport_);
    EXPECT_THROW(pub.start(), std::runtime_error);
}

TEST_F(SecurePublisherTest, StateRules)
{
    SecurePublisher pub(MakeConfig(), registry_, transport_);
    EXPECT_THROW(pub.send("early"), std::logic_error);
    EXPECT_THROW(pub.stop(), std::logic_error);
    pub.start();
    EXPECT_THROW(pub.start(), std::logic_error);
    pub.stop();
    EXPECT_THROW(pub.stop(), std::logic_error);
}
