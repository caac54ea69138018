#include "messaging/reqrep.hpp"

#include "utils/logger.hpp"

#include <utility>

namespace plexus::msg
{

namespace
{
template <typename R>
R protocol_error(const char *endpoint, const char *operation, ExchangeState state)
{
    LOGGER_WARN("{}: {}() not allowed in state {}.", endpoint, operation, to_string(state));
    return R::error(ErrorKind::ProtocolStateError,
                    fmt::format("{}: {}() not allowed in state {}", endpoint, operation,
                                to_string(state)));
}
} // namespace

const char *to_string(ExchangeState state) noexcept
{
    switch (state)
    {
    case ExchangeState::Ready:
        return "Ready";
    case ExchangeState::AwaitingReply:
        return "AwaitingReply";
    default:
        return "Unknown";
    }
}

// ============================================================================
// Requester
// ============================================================================

MsgResult<Requester> Requester::connect(const std::string &address, const SocketOptions &options)
{
    return connect(std::vector<std::string>{address}, options);
}

MsgResult<Requester> Requester::connect(const std::vector<std::string> &addresses,
                                        const SocketOptions &options)
{
    auto socket = TransportSocket::open(SocketPattern::Req, SocketRole::Connect, addresses, options);
    if (socket.is_error())
    {
        return MsgResult<Requester>::error_from(socket);
    }
    LOGGER_INFO("Requester: connected to {} replier(s), last '{}'.", addresses.size(),
                socket.content().endpoint());
    return MsgResult<Requester>::ok(Requester(std::move(socket).content()));
}

Status Requester::send_request(const Message &message)
{
    if (m_state != ExchangeState::Ready)
    {
        return protocol_error<Status>("Requester", "send_request", m_state);
    }
    auto status = m_socket.send(message);
    if (status.is_ok())
    {
        m_state = ExchangeState::AwaitingReply;
    }
    return status;
}

MsgResult<Message> Requester::receive_reply()
{
    if (m_state != ExchangeState::AwaitingReply)
    {
        return protocol_error<MsgResult<Message>>("Requester", "receive_reply", m_state);
    }
    // Success, malformed reply and transport failure all end this exchange.
    auto reply = m_socket.receive();
    m_state = ExchangeState::Ready;
    return reply;
}

MsgResult<std::optional<Message>> Requester::receive_reply_timeout(int timeout_ms)
{
    if (m_state != ExchangeState::AwaitingReply)
    {
        return protocol_error<MsgResult<std::optional<Message>>>(
            "Requester", "receive_reply_timeout", m_state);
    }
    auto reply = m_socket.receive_timeout(timeout_ms);
    if (reply.is_error() || reply.content().has_value())
    {
        m_state = ExchangeState::Ready;
    }
    return reply;
}

MsgResult<Message> Requester::request(const Message &message)
{
    auto sent = send_request(message);
    if (sent.is_error())
    {
        return MsgResult<Message>::error_from(sent);
    }
    return receive_reply();
}

MsgResult<std::optional<Message>> Requester::request_timeout(const Message &message,
                                                             int timeout_ms)
{
    auto sent = send_request(message);
    if (sent.is_error())
    {
        return MsgResult<std::optional<Message>>::error_from(sent);
    }
    auto reply = receive_reply_timeout(timeout_ms);
    if (reply.is_ok() && !reply.content().has_value())
    {
        LOGGER_DEBUG("Requester: no reply on '{}' within {} ms, request abandoned.",
                     m_socket.endpoint(), timeout_ms);
        m_state = ExchangeState::Ready;
    }
    return reply;
}

// ============================================================================
// Replier
// ============================================================================

MsgResult<Replier> Replier::bind(const std::string &address, const SocketOptions &options)
{
    auto socket = TransportSocket::open(SocketPattern::Rep, SocketRole::Bind, {address}, options);
    if (socket.is_error())
    {
        return MsgResult<Replier>::error_from(socket);
    }
    LOGGER_INFO("Replier: bound to '{}'.", socket.content().endpoint());
    return MsgResult<Replier>::ok(Replier(std::move(socket).content()));
}

MsgResult<std::optional<Message>> Replier::receive_request(const ReceiveDeadline &deadline)
{
    auto request = m_socket.receive_until(deadline);
    if (request.is_ok())
    {
        if (request.content().has_value())
        {
            m_state = ExchangeState::AwaitingReply;
        }
    }
    else if (request.error() == ErrorKind::MalformedMessage)
    {
        // The REP socket consumed the envelope; the next send goes back to that requester.
        m_state = ExchangeState::AwaitingReply;
    }
    return request;
}

MsgResult<Message> Replier::receive()
{
    if (m_state != ExchangeState::Ready)
    {
        return protocol_error<MsgResult<Message>>("Replier", "receive", m_state);
    }
    auto request = receive_request(ReceiveDeadline::forever());
    if (request.is_error())
    {
        return MsgResult<Message>::error_from(request);
    }
    if (!request.content().has_value())
    {
        return MsgResult<Message>::error(ErrorKind::ReceiveError,
                                         "blocking receive returned without a message");
    }
    return MsgResult<Message>::ok(std::move(*request.content()));
}

MsgResult<std::optional<Message>> Replier::receive_timeout(int timeout_ms)
{
    if (m_state != ExchangeState::Ready)
    {
        return protocol_error<MsgResult<std::optional<Message>>>("Replier", "receive_timeout",
                                                                 m_state);
    }
    return receive_request(ReceiveDeadline::after(std::chrono::milliseconds(timeout_ms)));
}

MsgResult<std::optional<Message>> Replier::try_receive()
{
    if (m_state != ExchangeState::Ready)
    {
        return protocol_error<MsgResult<std::optional<Message>>>("Replier", "try_receive",
                                                                 m_state);
    }
    return receive_request(ReceiveDeadline::immediate());
}

Status Replier::reply(const Message &message)
{
    if (m_state != ExchangeState::AwaitingReply)
    {
        return protocol_error<Status>("Replier", "reply", m_state);
    }
    auto status = m_socket.send(message);
    if (status.is_ok())
    {
        m_state = ExchangeState::Ready;
    }
    return status;
}

} // namespace plexus::msg
