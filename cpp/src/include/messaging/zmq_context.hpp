#pragma once
/**
 * @file zmq_context.hpp
 * @brief Process-wide ZeroMQ context shared by every endpoint.
 *
 * All endpoint sockets are created from this context so that inproc:// addresses
 * resolve between endpoints of the same process. The context is created lazily on
 * first use; zmq_context_startup() may be called earlier to choose the I/O thread count.
 */
#include "plexus_msg_export.h"

#include <zmq.hpp>

namespace plexus::msg
{

/**
 * @brief Returns the shared ZeroMQ context, creating it on first use.
 * @throws zmq::error_t if the context cannot be created.
 */
[[nodiscard]] PLEXUS_MSG_EXPORT zmq::context_t &get_zmq_context();

/**
 * @brief Creates the shared context with @p io_threads I/O threads.
 * Has no effect (other than a warning) if the context already exists.
 */
PLEXUS_MSG_EXPORT void zmq_context_startup(int io_threads = 1);

/**
 * @brief Interrupts and destroys the shared context.
 *
 * Every blocking send/receive/poll on a socket of this context returns at once and
 * the pending operation fails with SendError/ReceiveError (ETERM). The call then
 * blocks until the owners of all endpoints have closed them, and destroys the
 * context. A later get_zmq_context() creates a fresh one. Idempotent.
 */
PLEXUS_MSG_EXPORT void zmq_context_shutdown();

} // namespace plexus::msg
