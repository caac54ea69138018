#include "messaging/pipeline.hpp"

#include "utils/logger.hpp"

#include <utility>

namespace plexus::msg
{

namespace
{
MsgResult<TransportSocket> open_pipeline_socket(const char *name, SocketPattern pattern,
                                                SocketRole role, const std::string &address,
                                                const SocketOptions &options)
{
    auto socket = TransportSocket::open(pattern, role, {address}, options);
    if (socket.is_ok())
    {
        LOGGER_INFO("{}: {} '{}'.", name, role == SocketRole::Bind ? "bound to" : "connected to",
                    socket.content().endpoint());
    }
    return socket;
}
} // namespace

MsgResult<Pusher> Pusher::bind(const std::string &address, const SocketOptions &options)
{
    auto socket =
        open_pipeline_socket("Pusher", SocketPattern::Push, SocketRole::Bind, address, options);
    if (socket.is_error())
    {
        return MsgResult<Pusher>::error_from(socket);
    }
    return MsgResult<Pusher>::ok(Pusher(std::move(socket).content()));
}

MsgResult<Pusher> Pusher::connect(const std::string &address, const SocketOptions &options)
{
    auto socket = open_pipeline_socket("Pusher", SocketPattern::Push, SocketRole::Connect,
                                       address, options);
    if (socket.is_error())
    {
        return MsgResult<Pusher>::error_from(socket);
    }
    return MsgResult<Pusher>::ok(Pusher(std::move(socket).content()));
}

Status Pusher::push(const Message &message)
{
    return m_socket.send(message);
}

MsgResult<Puller> Puller::bind(const std::string &address, const SocketOptions &options)
{
    auto socket =
        open_pipeline_socket("Puller", SocketPattern::Pull, SocketRole::Bind, address, options);
    if (socket.is_error())
    {
        return MsgResult<Puller>::error_from(socket);
    }
    return MsgResult<Puller>::ok(Puller(std::move(socket).content()));
}

MsgResult<Puller> Puller::connect(const std::string &address, const SocketOptions &options)
{
    auto socket = open_pipeline_socket("Puller", SocketPattern::Pull, SocketRole::Connect,
                                       address, options);
    if (socket.is_error())
    {
        return MsgResult<Puller>::error_from(socket);
    }
    return MsgResult<Puller>::ok(Puller(std::move(socket).content()));
}

} // namespace plexus::msg
