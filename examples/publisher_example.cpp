/**
 * @file publisher_example.cpp
 * @brief Example: plain and CURVE-secured publishers.
 *
 * Usage:
 *   publisher_example                      # plain PUB on a port in [5000, 5010]
 *   publisher_example <server.key_secret> <public_keys_dir> [allowed-ip...]
 *
 * Keepalive and the config file are taken from the environment
 * (PUBHUB_CONFIG_FILE, PUBHUB_TCP_KEEPALIVE*). Ten messages are sent, one per
 * second, then the publisher stops and the process context is released.
 */
#include "phb_transport.hpp"

#include <chrono>
#include <iostream>
#include <thread>
#include <vector>

using namespace pubhub::hub;
using namespace pubhub::utils;
using namespace std::chrono_literals;

namespace
{

template <typename Pub> void publish_ticks(Pub &pub)
{
    for (int i = 0; i < 10; ++i)
    {
        pub.send(fmt::format("example.tick {}", i));
        std::this_thread::sleep_for(1s);
    }
}

} // namespace

int main(int argc, char **argv)
{
    Logger::instance().set_console();
    Logger::instance().set_level(Logger::Level::L_INFO);

    int rc = 0;
    try
    {
        if (argc >= 3)
        {
            SecurePublisher::Config cfg;
            cfg.address = "tcp://*:0";
            cfg.name = "secure-example";
            cfg.min_port = 5000;
            cfg.max_port = 5010;
            cfg.server_secret_key = argv[1];
            cfg.public_keys_directory = argv[2];
            cfg.authorized_sub_addresses.assign(argv + 3, argv + argc);

            SecurePublisher pub(std::move(cfg));
            pub.start();
            std::cout << "Publishing (CURVE) on " << pub.destination() << std::endl;
            publish_ticks(pub);
            pub.stop();
        }
        else
        {
            Publisher pub({"tcp://*:0", "example", 5000, 5010});
            pub.start();
            std::cout << "Publishing on " << pub.destination() << std::endl;
            publish_ticks(pub);
            pub.stop();
        }
        destroy_zmq_context(0ms);
    }
    catch (const std::exception &e)
    {
        LOGGER_ERROR("publisher_example: {}", e.what());
        rc = 1;
    }

    Logger::instance().shutdown();
    return rc;
}
