/**
 * @file test_bind_target.cpp
 * @brief Layer 1 tests for BindTarget parsing and re-assembly.
 */
#include "phb_base.hpp"
#include <gtest/gtest.h>

using pubhub::hub::BindTarget;

TEST(BindTargetTest, ParsesHostAndPort)
{
    const auto target = BindTarget::parse("tcp://127.0.0.1:5555");
    EXPECT_EQ(target.scheme, "tcp");
    EXPECT_EQ(target.host, "127.0.0.1");
    ASSERT_TRUE(target.port.has_value());
    EXPECT_EQ(*target.port, 5555);
    EXPECT_FALSE(target.wants_dynamic_port());
    EXPECT_EQ(target.to_string(), "tcp://127.0.0.1:5555");
}

TEST(BindTargetTest, PortZeroRequestsDynamicPort)
{
    const auto target = BindTarget::parse("tcp://*:0");
    EXPECT_EQ(target.host, "*");
    EXPECT_TRUE(target.wants_dynamic_port());
}

TEST(BindTargetTest, MissingPortIsEmpty)
{
    const auto target = BindTarget::parse("ipc:///tmp/feed");
    EXPECT_EQ(target.scheme, "ipc");
    EXPECT_EQ(target.host, "");
    EXPECT_FALSE(target.port.has_value());
    EXPECT_EQ(target.path, "/tmp/feed");
    EXPECT_EQ(target.to_string(), "ipc:///tmp/feed");
}

TEST(BindTargetTest, KeepsPathQueryAndFragment)
{
    const auto target = BindTarget::parse("tcp://host:0/p/q?x=1#frag");
    EXPECT_EQ(target.host, "host");
    EXPECT_EQ(target.path, "/p/q");
    EXPECT_EQ(target.query, "x=1");
    EXPECT_EQ(target.fragment, "frag");
    EXPECT_EQ(target.with_port(4000).to_string(), "tcp://host:4000/p/q?x=1#frag");
}

TEST(BindTargetTest, ParsesBracketedIPv6)
{
    const auto target = BindTarget::parse("tcp://[::1]:6000");
    EXPECT_EQ(target.host, "[::1]");
    EXPECT_EQ(target.port, 6000);
    EXPECT_EQ(target.netloc(), "[::1]:6000");

    const auto no_port = BindTarget::parse("tcp://[fe80::1]");
    EXPECT_EQ(no_port.host, "[fe80::1]");
    EXPECT_FALSE(no_port.port.has_value());
}

TEST(BindTargetTest, RejectsMalformedAddresses)
{
    EXPECT_THROW(BindTarget::parse("127.0.0.1:5555"), std::invalid_argument);
    EXPECT_THROW(BindTarget::parse("tcp://host:port"), std::invalid_argument);
    EXPECT_THROW(BindTarget::parse("tcp://host:70000"), std::invalid_argument);
    EXPECT_THROW(BindTarget::parse("tcp://host:-1"), std::invalid_argument);
    EXPECT_THROW(BindTarget::parse("tcp://[::1:5000"), std::invalid_argument);
    EXPECT_THROW(BindTarget::parse("tcp://[::1]x"), std::invalid_argument);
}
