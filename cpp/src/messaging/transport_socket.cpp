// src/messaging/transport_socket.cpp
#include "messaging/transport_socket.hpp"
#include "messaging/zmq_context.hpp"

#include "utils/logger.hpp"

#include <zmq_addon.hpp>

#include <cerrno>
#include <chrono>
#include <iterator>
#include <utility>

namespace plexus::msg
{

namespace
{
using Clock = std::chrono::steady_clock;

zmq::socket_type to_zmq_type(SocketPattern pattern)
{
    switch (pattern)
    {
    case SocketPattern::Pub:
        return zmq::socket_type::pub;
    case SocketPattern::Sub:
        return zmq::socket_type::sub;
    case SocketPattern::Req:
        return zmq::socket_type::req;
    case SocketPattern::Rep:
        return zmq::socket_type::rep;
    case SocketPattern::Push:
        return zmq::socket_type::push;
    case SocketPattern::Pull:
    default:
        return zmq::socket_type::pull;
    }
}

void apply_options(zmq::socket_t &socket, SocketPattern pattern, const SocketOptions &opts)
{
    socket.set(zmq::sockopt::linger, opts.linger_ms);
    socket.set(zmq::sockopt::sndhwm, opts.send_hwm);
    socket.set(zmq::sockopt::rcvhwm, opts.recv_hwm);
    socket.set(zmq::sockopt::sndtimeo, opts.send_timeout_ms);
    socket.set(zmq::sockopt::reconnect_ivl, opts.reconnect_interval_ms);
    socket.set(zmq::sockopt::ipv6, opts.ipv6);
    if (pattern == SocketPattern::Req)
    {
        // Strict alternation is enforced by Requester itself; relaxed + correlated lets an
        // abandoned request be followed by a new one and drops the stale reply.
        socket.set(zmq::sockopt::req_relaxed, 1);
        socket.set(zmq::sockopt::req_correlate, 1);
    }
}

/// Poll a socket for incoming data within @p timeout (-1 = forever).
/// Returns true if data is available. Throws zmq::error_t (EINTR, ETERM, ...).
bool poll_readable(zmq::socket_t &socket, std::chrono::milliseconds timeout)
{
    std::vector<zmq::pollitem_t> items = {{socket.handle(), 0, ZMQ_POLLIN, 0}};
    zmq::poll(items, timeout);
    return (items[0].revents & ZMQ_POLLIN) != 0;
}

template <typename R>
R closed_error(ErrorKind kind, const char *operation)
{
    LOGGER_WARN("TransportSocket: {} on a closed socket.", operation);
    return R::error(kind, fmt::format("{} on a closed socket", operation));
}
} // namespace

const char *to_string(SocketPattern pattern) noexcept
{
    switch (pattern)
    {
    case SocketPattern::Pub:
        return "PUB";
    case SocketPattern::Sub:
        return "SUB";
    case SocketPattern::Req:
        return "REQ";
    case SocketPattern::Rep:
        return "REP";
    case SocketPattern::Push:
        return "PUSH";
    case SocketPattern::Pull:
        return "PULL";
    default:
        return "UNKNOWN";
    }
}

const char *to_string(SocketRole role) noexcept
{
    return role == SocketRole::Bind ? "bind" : "connect";
}

// ============================================================================
// Construction / destruction
// ============================================================================

TransportSocket::TransportSocket(SocketPattern pattern, SocketRole role,
                                 std::vector<std::string> addresses, zmq::socket_t &&socket,
                                 std::string endpoint)
    : m_pattern(pattern), m_role(role), m_addresses(std::move(addresses)),
      m_endpoint(std::move(endpoint))
{
    m_socket.emplace(std::move(socket));
}

TransportSocket::~TransportSocket()
{
    close();
}

TransportSocket::TransportSocket(TransportSocket &&other) noexcept
    : m_pattern(other.m_pattern), m_role(other.m_role),
      m_addresses(std::move(other.m_addresses)), m_endpoint(std::move(other.m_endpoint)),
      m_socket(std::move(other.m_socket))
{
    other.m_socket.reset();
}

TransportSocket &TransportSocket::operator=(TransportSocket &&other) noexcept
{
    if (this != &other)
    {
        close();
        m_pattern = other.m_pattern;
        m_role = other.m_role;
        m_addresses = std::move(other.m_addresses);
        m_endpoint = std::move(other.m_endpoint);
        m_socket = std::move(other.m_socket);
        other.m_socket.reset();
    }
    return *this;
}

MsgResult<TransportSocket> TransportSocket::open(zmq::context_t &context, SocketPattern pattern,
                                                 SocketRole role,
                                                 const std::vector<std::string> &addresses,
                                                 const SocketOptions &options)
{
    const ErrorKind attach_error =
        role == SocketRole::Bind ? ErrorKind::BindError : ErrorKind::ConnectError;
    if (addresses.empty())
    {
        LOGGER_ERROR("TransportSocket: {} {} called without an address.", to_string(pattern),
                     to_string(role));
        return MsgResult<TransportSocket>::error(attach_error, "no address given");
    }

    std::optional<zmq::socket_t> socket;
    try
    {
        socket.emplace(context, to_zmq_type(pattern));
        apply_options(*socket, pattern, options);
    }
    catch (const zmq::error_t &e)
    {
        LOGGER_ERROR("TransportSocket: failed to create {} socket: {} ({})", to_string(pattern),
                     e.what(), e.num());
        return MsgResult<TransportSocket>::error(
            ErrorKind::SocketError,
            fmt::format("cannot create {} socket: {}", to_string(pattern), e.what()), e.num());
    }

    for (const auto &address : addresses)
    {
        try
        {
            if (role == SocketRole::Bind)
                socket->bind(address);
            else
                socket->connect(address);
        }
        catch (const zmq::error_t &e)
        {
            LOGGER_ERROR("TransportSocket: {} {} to '{}' failed: {} ({})", to_string(pattern),
                         to_string(role), address, e.what(), e.num());
            return MsgResult<TransportSocket>::error(
                attach_error, fmt::format("'{}': {}", address, e.what()), e.num());
        }
    }

    std::string endpoint = addresses.back();
    try
    {
        endpoint = socket->get(zmq::sockopt::last_endpoint);
    }
    catch (const zmq::error_t &e)
    {
        LOGGER_DEBUG("TransportSocket: last_endpoint unavailable ({}), using '{}'.", e.what(),
                     endpoint);
    }

    LOGGER_DEBUG("TransportSocket: {} socket {} '{}'.", to_string(pattern),
                 role == SocketRole::Bind ? "bound to" : "connected to", endpoint);
    return MsgResult<TransportSocket>::ok(
        TransportSocket(pattern, role, addresses, std::move(*socket), std::move(endpoint)));
}

MsgResult<TransportSocket> TransportSocket::open(SocketPattern pattern, SocketRole role,
                                                 const std::vector<std::string> &addresses,
                                                 const SocketOptions &options)
{
    zmq::context_t *context = nullptr;
    try
    {
        context = &get_zmq_context();
    }
    catch (const zmq::error_t &e)
    {
        LOGGER_ERROR("TransportSocket: cannot create ZeroMQ context: {}", e.what());
        return MsgResult<TransportSocket>::error(ErrorKind::SocketError, e.what(), e.num());
    }
    return open(*context, pattern, role, addresses, options);
}

void TransportSocket::close() noexcept
{
    if (m_socket.has_value())
    {
        m_socket->close();
        m_socket.reset();
        LOGGER_TRACE("TransportSocket: {} socket on '{}' closed.", to_string(m_pattern),
                     m_endpoint);
    }
}

const std::string &TransportSocket::address() const noexcept
{
    static const std::string kEmpty;
    return m_addresses.empty() ? kEmpty : m_addresses.front();
}

// ============================================================================
// Send
// ============================================================================

Status TransportSocket::send(const Message &message)
{
    auto frames = wire::encode(message);
    if (frames.is_error())
    {
        LOGGER_WARN("TransportSocket: cannot encode message: {}", frames.error_message());
        return Status::error_from(frames);
    }
    return send_frames(frames.content());
}

Status TransportSocket::send_frames(const wire::Frames &frames)
{
    if (!m_socket.has_value())
    {
        return closed_error<Status>(ErrorKind::SendError, "send");
    }
    if (frames.empty())
    {
        return Status::error(ErrorKind::SendError, "no frames to send");
    }

    try
    {
        for (size_t i = 0; i < frames.size(); ++i)
        {
            const auto flags =
                (i + 1 < frames.size()) ? zmq::send_flags::sndmore : zmq::send_flags::none;
            // Once the first part is queued the rest of a multi-part message never blocks,
            // so only i == 0 can report EAGAIN (send timeout).
            if (!m_socket->send(zmq::buffer(frames[i]), flags))
            {
                LOGGER_WARN("TransportSocket: send on '{}' timed out.", m_endpoint);
                return Status::error(ErrorKind::SendError,
                                     fmt::format("'{}': send timed out", m_endpoint), EAGAIN);
            }
        }
    }
    catch (const zmq::error_t &e)
    {
        if (e.num() == ETERM)
        {
            LOGGER_DEBUG("TransportSocket: send on '{}' interrupted by context shutdown.",
                         m_endpoint);
        }
        else
        {
            LOGGER_ERROR("TransportSocket: send on '{}' failed: {} ({})", m_endpoint, e.what(),
                         e.num());
        }
        return Status::error(ErrorKind::SendError, fmt::format("'{}': {}", m_endpoint, e.what()),
                             e.num());
    }
    return Status::ok();
}

// ============================================================================
// Receive: one poll-with-deadline algorithm
// ============================================================================

MsgResult<std::optional<wire::Frames>>
TransportSocket::receive_frames(const ReceiveDeadline &deadline)
{
    using FramesResult = MsgResult<std::optional<wire::Frames>>;
    if (!m_socket.has_value())
    {
        return closed_error<FramesResult>(ErrorKind::ReceiveError, "receive");
    }

    const auto until = Clock::now() + deadline.timeout();
    auto remaining = [&]() -> std::chrono::milliseconds {
        if (deadline.is_forever())
            return std::chrono::milliseconds(-1);
        const auto left = std::chrono::duration_cast<std::chrono::milliseconds>(until - Clock::now());
        return left.count() > 0 ? left : std::chrono::milliseconds(0);
    };
    auto expired = [&]() { return !deadline.is_forever() && Clock::now() >= until; };

    try
    {
        while (true)
        {
            bool readable = false;
            try
            {
                readable = poll_readable(*m_socket, remaining());
            }
            catch (const zmq::error_t &e)
            {
                if (e.num() != EINTR)
                    throw;
                if (expired())
                    return FramesResult::ok(std::nullopt);
                continue; // interrupted by a signal: retry with the remaining budget
            }

            if (!readable)
            {
                if (deadline.is_forever())
                    continue;
                return FramesResult::ok(std::nullopt);
            }

            std::vector<zmq::message_t> parts;
            const auto received =
                zmq::recv_multipart(*m_socket, std::back_inserter(parts), zmq::recv_flags::dontwait);
            if (!received)
            {
                // Readiness was spurious; keep waiting if the budget allows.
                if (deadline.is_immediate() || expired())
                    return FramesResult::ok(std::nullopt);
                continue;
            }

            wire::Frames frames;
            frames.reserve(parts.size());
            for (const auto &part : parts)
            {
                frames.emplace_back(static_cast<const char *>(part.data()), part.size());
            }
            return FramesResult::ok(std::move(frames));
        }
    }
    catch (const zmq::error_t &e)
    {
        if (e.num() == ETERM)
        {
            LOGGER_DEBUG("TransportSocket: receive on '{}' interrupted by context shutdown.",
                         m_endpoint);
        }
        else
        {
            LOGGER_ERROR("TransportSocket: receive on '{}' failed: {} ({})", m_endpoint,
                         e.what(), e.num());
        }
        return FramesResult::error(ErrorKind::ReceiveError,
                                   fmt::format("'{}': {}", m_endpoint, e.what()), e.num());
    }
}

MsgResult<std::optional<Message>> TransportSocket::receive_until(const ReceiveDeadline &deadline)
{
    using MessageResult = MsgResult<std::optional<Message>>;
    auto frames = receive_frames(deadline);
    if (frames.is_error())
    {
        return MessageResult::error_from(frames);
    }
    if (!frames.content().has_value())
    {
        return MessageResult::ok(std::nullopt);
    }

    auto message = wire::decode(*frames.content());
    if (message.is_error())
    {
        LOGGER_WARN("TransportSocket: malformed message on '{}': {}", m_endpoint,
                    message.error_message());
        return MessageResult::error_from(message);
    }
    return MessageResult::ok(std::move(message).content());
}

MsgResult<Message> TransportSocket::receive()
{
    auto result = receive_until(ReceiveDeadline::forever());
    if (result.is_error())
    {
        return MsgResult<Message>::error_from(result);
    }
    if (!result.content().has_value())
    {
        // Unreachable with a forever deadline; reported rather than asserted.
        return MsgResult<Message>::error(ErrorKind::ReceiveError,
                                         "blocking receive returned without a message");
    }
    return MsgResult<Message>::ok(std::move(*result.content()));
}

MsgResult<std::optional<Message>> TransportSocket::receive_timeout(int timeout_ms)
{
    return receive_until(ReceiveDeadline::after(std::chrono::milliseconds(timeout_ms)));
}

MsgResult<std::optional<Message>> TransportSocket::try_receive()
{
    return receive_until(ReceiveDeadline::immediate());
}

// ============================================================================
// Subscription
// ============================================================================

Status TransportSocket::subscribe(std::string_view prefix)
{
    if (!m_socket.has_value())
    {
        return closed_error<Status>(ErrorKind::SocketError, "subscribe");
    }
    if (m_pattern != SocketPattern::Sub)
    {
        return Status::error(ErrorKind::SocketError,
                             fmt::format("subscribe on a {} socket", to_string(m_pattern)));
    }
    try
    {
        m_socket->set(zmq::sockopt::subscribe, prefix);
    }
    catch (const zmq::error_t &e)
    {
        LOGGER_ERROR("TransportSocket: subscribe('{}') failed: {}", prefix, e.what());
        return Status::error(ErrorKind::SocketError, e.what(), e.num());
    }
    return Status::ok();
}

Status TransportSocket::unsubscribe(std::string_view prefix)
{
    if (!m_socket.has_value())
    {
        return closed_error<Status>(ErrorKind::SocketError, "unsubscribe");
    }
    if (m_pattern != SocketPattern::Sub)
    {
        return Status::error(ErrorKind::SocketError,
                             fmt::format("unsubscribe on a {} socket", to_string(m_pattern)));
    }
    try
    {
        m_socket->set(zmq::sockopt::unsubscribe, prefix);
    }
    catch (const zmq::error_t &e)
    {
        LOGGER_ERROR("TransportSocket: unsubscribe('{}') failed: {}", prefix, e.what());
        return Status::error(ErrorKind::SocketError, e.what(), e.num());
    }
    return Status::ok();
}

} // namespace plexus::msg
