#include "messaging/zmq_context.hpp"

#include "utils/logger.hpp"

#include <mutex>

namespace plexus::msg
{

namespace
{
std::mutex g_context_mu;
zmq::context_t *g_context = nullptr;

zmq::context_t &create_context_locked(int io_threads)
{
    g_context = new zmq::context_t(io_threads);
    LOGGER_DEBUG("ZMQContext: ZeroMQ context created ({} I/O thread(s)).", io_threads);
    return *g_context;
}
} // namespace

zmq::context_t &get_zmq_context()
{
    std::lock_guard<std::mutex> lock(g_context_mu);
    if (g_context == nullptr)
    {
        return create_context_locked(1);
    }
    return *g_context;
}

void zmq_context_startup(int io_threads)
{
    std::lock_guard<std::mutex> lock(g_context_mu);
    if (g_context != nullptr)
    {
        LOGGER_WARN("ZMQContext: startup({}) ignored, context already exists.", io_threads);
        return;
    }
    static_cast<void>(create_context_locked(io_threads));
}

void zmq_context_shutdown()
{
    zmq::context_t *ctx = nullptr;
    {
        std::lock_guard<std::mutex> lock(g_context_mu);
        ctx = g_context;
        g_context = nullptr;
    }
    if (ctx == nullptr)
    {
        return;
    }
    ctx->shutdown();
    delete ctx; // zmq_ctx_term: waits for every socket of this context to be closed
    LOGGER_DEBUG("ZMQContext: ZeroMQ context destroyed.");
}

} // namespace plexus::msg
