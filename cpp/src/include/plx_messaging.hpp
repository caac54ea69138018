#pragma once
/**
 * @file plx_messaging.hpp
 * @brief Layer 3: Typed messages and the pattern endpoints.
 *
 * Message and its wire codec, the ErrorKind taxonomy, SocketOptions, the shared
 * ZeroMQ context, and the six endpoints:
 *
 * | Pattern   | Binds     | Connects   |
 * |-----------|-----------|------------|
 * | Pub/Sub   | Publisher | Subscriber |
 * | Req/Rep   | Replier   | Requester  |
 * | Pipeline  | either Pusher or Puller | the other |
 */
#include "plx_service.hpp"

#include "messaging/error.hpp"
#include "messaging/message.hpp"
#include "messaging/pipeline.hpp"
#include "messaging/pubsub.hpp"
#include "messaging/reqrep.hpp"
#include "messaging/socket_options.hpp"
#include "messaging/transport_socket.hpp"
#include "messaging/wire_codec.hpp"
#include "messaging/zmq_context.hpp"
