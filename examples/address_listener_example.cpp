/**
 * @file address_listener_example.cpp
 * @brief Example: print address announcements received on the publish port.
 *
 * Usage:
 *   address_listener_example [port] [count]
 *
 * The port defaults to address_publish_port (16543). Each announcement is
 * acknowledged with "ok"; the program exits after `count` messages (default 5).
 */
#include "phb_transport.hpp"

#include <iostream>
#include <optional>

using namespace pubhub::hub;
using namespace pubhub::utils;

int main(int argc, char **argv)
{
    Logger::instance().set_console();

    std::optional<int> port;
    int count = 5;
    if (argc >= 2)
    {
        if (auto parsed = pubhub::format_tools::parse_integer(argv[1]))
            port = static_cast<int>(*parsed);
    }
    if (argc >= 3)
    {
        if (auto parsed = pubhub::format_tools::parse_integer(argv[2]))
            count = static_cast<int>(*parsed);
    }

    int rc = 0;
    try
    {
        AddressReceiver receiver(port);
        std::cout << "Listening for announcements on port " << receiver.port() << std::endl;
        for (int i = 0; i < count; ++i)
        {
            std::cout << receiver.receive() << std::endl;
        }
        receiver.close();
    }
    catch (const std::exception &e)
    {
        LOGGER_ERROR("address_listener_example: {}", e.what());
        rc = 1;
    }

    Logger::instance().shutdown();
    return rc;
}
