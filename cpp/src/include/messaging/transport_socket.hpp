#pragma once
/**
 * @file transport_socket.hpp
 * @brief RAII wrapper owning one ZeroMQ socket with uniform send/receive semantics.
 *
 * A TransportSocket is created by TransportSocket::open(), which creates the socket,
 * applies SocketOptions and binds or connects it. The pattern endpoints (Publisher,
 * Subscriber, Requester, Replier, Pusher, Puller) each own exactly one.
 *
 * **Threading**: single-threaded. Use one TransportSocket from one thread at a time.
 * It may be moved to another thread.
 *
 * **Receive variants**: receive(), receive_timeout() and try_receive() are all
 * receive_until() with a different ReceiveDeadline:
 *
 * | Call                 | Deadline        | Absent result possible |
 * |----------------------|-----------------|------------------------|
 * | receive()            | forever()       | no                     |
 * | receive_timeout(ms)  | after(ms)       | yes, after ~ms         |
 * | try_receive()        | immediate()     | yes, without blocking  |
 */
#include "plexus_msg_export.h"
#include "messaging/error.hpp"
#include "messaging/message.hpp"
#include "messaging/socket_options.hpp"
#include "messaging/wire_codec.hpp"

#include <chrono>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <zmq.hpp>

namespace plexus::msg
{

/// ZeroMQ socket type used by each pattern role.
enum class SocketPattern
{
    Pub,  ///< Publisher  (ZMQ_PUB)
    Sub,  ///< Subscriber (ZMQ_SUB)
    Req,  ///< Requester  (ZMQ_REQ, relaxed + correlated)
    Rep,  ///< Replier    (ZMQ_REP)
    Push, ///< Pusher     (ZMQ_PUSH)
    Pull, ///< Puller     (ZMQ_PULL)
};

enum class SocketRole
{
    Bind,
    Connect,
};

PLEXUS_MSG_EXPORT const char *to_string(SocketPattern pattern) noexcept;
PLEXUS_MSG_EXPORT const char *to_string(SocketRole role) noexcept;

/**
 * @brief How long a receive may wait: forever, not at all, or a bounded time.
 */
class ReceiveDeadline
{
  public:
    [[nodiscard]] static constexpr ReceiveDeadline forever() noexcept
    {
        return ReceiveDeadline(std::chrono::milliseconds(-1));
    }
    [[nodiscard]] static constexpr ReceiveDeadline immediate() noexcept
    {
        return ReceiveDeadline(std::chrono::milliseconds(0));
    }
    /// Negative values are clamped to immediate().
    [[nodiscard]] static constexpr ReceiveDeadline after(std::chrono::milliseconds timeout) noexcept
    {
        return ReceiveDeadline(timeout.count() < 0 ? std::chrono::milliseconds(0) : timeout);
    }

    [[nodiscard]] constexpr bool is_forever() const noexcept { return m_timeout.count() < 0; }
    [[nodiscard]] constexpr bool is_immediate() const noexcept { return m_timeout.count() == 0; }
    [[nodiscard]] constexpr std::chrono::milliseconds timeout() const noexcept { return m_timeout; }

  private:
    constexpr explicit ReceiveDeadline(std::chrono::milliseconds timeout) noexcept
        : m_timeout(timeout)
    {
    }

    std::chrono::milliseconds m_timeout;
};

class PLEXUS_MSG_EXPORT TransportSocket
{
  public:
    /**
     * @brief Creates a socket of @p pattern on @p context and binds or connects it to
     *        every address in @p addresses.
     * @return BindError / ConnectError naming the failing address; SocketError if the
     *         socket cannot be created or configured.
     */
    [[nodiscard]] static MsgResult<TransportSocket> open(zmq::context_t &context,
                                                         SocketPattern pattern, SocketRole role,
                                                         const std::vector<std::string> &addresses,
                                                         const SocketOptions &options = {});

    /// Same as above on the process-wide context (get_zmq_context()).
    [[nodiscard]] static MsgResult<TransportSocket> open(SocketPattern pattern, SocketRole role,
                                                         const std::vector<std::string> &addresses,
                                                         const SocketOptions &options = {});

    ~TransportSocket();

    TransportSocket(const TransportSocket &) = delete;
    TransportSocket &operator=(const TransportSocket &) = delete;
    TransportSocket(TransportSocket &&) noexcept;
    TransportSocket &operator=(TransportSocket &&) noexcept;

    // ── Send ───────────────────────────────────────────────────────────────────

    /// Encodes @p message and sends its frames. SerializationError or SendError on failure.
    [[nodiscard]] Status send(const Message &message);

    /// Sends pre-built frames as one multi-part message. SendError on failure.
    [[nodiscard]] Status send_frames(const wire::Frames &frames);

    // ── Receive ────────────────────────────────────────────────────────────────

    /// Blocks until a full message arrives.
    [[nodiscard]] MsgResult<Message> receive();

    /// Blocks at most @p timeout_ms; an empty optional means nothing arrived in time.
    [[nodiscard]] MsgResult<std::optional<Message>> receive_timeout(int timeout_ms);

    /// Never blocks; an empty optional means nothing was pending.
    [[nodiscard]] MsgResult<std::optional<Message>> try_receive();

    /// The single poll-then-receive algorithm behind the three variants above.
    [[nodiscard]] MsgResult<std::optional<Message>> receive_until(const ReceiveDeadline &deadline);

    /// Same algorithm, returning the raw frames without decoding.
    [[nodiscard]] MsgResult<std::optional<wire::Frames>>
    receive_frames(const ReceiveDeadline &deadline);

    // ── Subscription (SUB sockets only) ───────────────────────────────────────

    [[nodiscard]] Status subscribe(std::string_view prefix);
    [[nodiscard]] Status unsubscribe(std::string_view prefix);

    // ── Lifetime / introspection ──────────────────────────────────────────────

    /// Closes the socket. Safe to call more than once.
    void close() noexcept;

    [[nodiscard]] bool is_open() const noexcept { return m_socket.has_value(); }
    [[nodiscard]] SocketPattern pattern() const noexcept { return m_pattern; }
    [[nodiscard]] SocketRole role() const noexcept { return m_role; }

    /// The first address given to open().
    [[nodiscard]] const std::string &address() const noexcept;
    [[nodiscard]] const std::vector<std::string> &addresses() const noexcept { return m_addresses; }

    /**
     * @brief The endpoint ZeroMQ last bound/connected, with wildcards resolved
     *        (e.g. "tcp://127.0.0.1:*" becomes "tcp://127.0.0.1:41235").
     */
    [[nodiscard]] const std::string &endpoint() const noexcept { return m_endpoint; }

  private:
    TransportSocket(SocketPattern pattern, SocketRole role, std::vector<std::string> addresses,
                    zmq::socket_t &&socket, std::string endpoint);

    SocketPattern m_pattern{SocketPattern::Pub};
    SocketRole m_role{SocketRole::Bind};
    std::vector<std::string> m_addresses;
    std::string m_endpoint;
    std::optional<zmq::socket_t> m_socket;
};

} // namespace plexus::msg
