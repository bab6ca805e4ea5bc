#pragma once
/**
 * @file phb_transport.hpp
 * @brief Layer 3: ZeroMQ transport endpoints built on phb_service.
 *
 * Process-keyed contexts, keepalive, the ZAP authenticator and the publisher
 * and receiver sockets.
 */
#include "phb_service.hpp"

#include "utils/zmq_context.hpp"
#include "utils/tcp_keepalive.hpp"
#include "utils/authenticator.hpp"
#include "utils/publisher.hpp"
#include "utils/secure_publisher.hpp"
#include "utils/address_receiver.hpp"
