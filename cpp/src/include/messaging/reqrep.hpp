#pragma once
/**
 * @file reqrep.hpp
 * @brief Requester (connects) and Replier (binds) with strict request/reply alternation.
 *
 * Each endpoint tracks an ExchangeState. Calls made in the wrong state fail with
 * ProtocolStateError and touch neither the socket nor the state.
 *
 * Requester:
 *
 *     Ready --send_request()--> AwaitingReply --receive_reply()--> Ready
 *
 *  - receive_reply_timeout() expiring leaves the request outstanding (AwaitingReply).
 *  - request_timeout() expiring abandons the request (Ready); the late reply is dropped.
 *
 * Replier:
 *
 *     Ready --receive()--> AwaitingReply --reply()--> Ready
 *
 *  - A request that fails to decode (MalformedMessage) still has to be answered.
 *  - A failed reply() leaves the Replier in AwaitingReply so the caller may retry.
 *
 * A Requester may connect to several Repliers; ZeroMQ round-robins requests across them.
 */
#include "plexus_msg_export.h"
#include "messaging/error.hpp"
#include "messaging/message.hpp"
#include "messaging/socket_options.hpp"
#include "messaging/transport_socket.hpp"

#include <optional>
#include <string>
#include <vector>

namespace plexus::msg
{

enum class ExchangeState
{
    Ready,
    AwaitingReply,
};

PLEXUS_MSG_EXPORT const char *to_string(ExchangeState state) noexcept;

class PLEXUS_MSG_EXPORT Requester
{
  public:
    [[nodiscard]] static MsgResult<Requester> connect(const std::string &address,
                                                      const SocketOptions &options = {});
    [[nodiscard]] static MsgResult<Requester> connect(const std::vector<std::string> &addresses,
                                                      const SocketOptions &options = {});

    Requester(const Requester &) = delete;
    Requester &operator=(const Requester &) = delete;
    Requester(Requester &&) noexcept = default;
    Requester &operator=(Requester &&) noexcept = default;
    ~Requester() = default;

    /// Sends @p message and blocks until its reply arrives.
    [[nodiscard]] MsgResult<Message> request(const Message &message);

    /**
     * @brief Sends @p message and waits at most @p timeout_ms for the reply.
     * @return An empty optional on expiry; the request is then abandoned and the
     *         endpoint is Ready again.
     */
    [[nodiscard]] MsgResult<std::optional<Message>> request_timeout(const Message &message,
                                                                    int timeout_ms);

    /// First half of request(). ProtocolStateError while a reply is outstanding.
    [[nodiscard]] Status send_request(const Message &message);

    /// Second half of request(). ProtocolStateError if no request is outstanding.
    [[nodiscard]] MsgResult<Message> receive_reply();

    /// As receive_reply(), bounded. Expiry keeps the request outstanding.
    [[nodiscard]] MsgResult<std::optional<Message>> receive_reply_timeout(int timeout_ms);

    [[nodiscard]] ExchangeState state() const noexcept { return m_state; }
    [[nodiscard]] bool awaiting_reply() const noexcept
    {
        return m_state == ExchangeState::AwaitingReply;
    }

    void close() noexcept { m_socket.close(); }
    [[nodiscard]] bool is_open() const noexcept { return m_socket.is_open(); }
    [[nodiscard]] const std::vector<std::string> &addresses() const noexcept
    {
        return m_socket.addresses();
    }
    [[nodiscard]] const std::string &endpoint() const noexcept { return m_socket.endpoint(); }

  private:
    explicit Requester(TransportSocket &&socket) : m_socket(std::move(socket)) {}

    TransportSocket m_socket;
    ExchangeState m_state{ExchangeState::Ready};
};

class PLEXUS_MSG_EXPORT Replier
{
  public:
    [[nodiscard]] static MsgResult<Replier> bind(const std::string &address,
                                                 const SocketOptions &options = {});

    Replier(const Replier &) = delete;
    Replier &operator=(const Replier &) = delete;
    Replier(Replier &&) noexcept = default;
    Replier &operator=(Replier &&) noexcept = default;
    ~Replier() = default;

    /// Blocks for the next request. ProtocolStateError if the previous one is unanswered.
    [[nodiscard]] MsgResult<Message> receive();
    [[nodiscard]] MsgResult<std::optional<Message>> receive_timeout(int timeout_ms);
    [[nodiscard]] MsgResult<std::optional<Message>> try_receive();

    /// Answers the request returned by the last receive. ProtocolStateError if there is none.
    [[nodiscard]] Status reply(const Message &message);

    [[nodiscard]] ExchangeState state() const noexcept { return m_state; }
    [[nodiscard]] bool awaiting_reply() const noexcept
    {
        return m_state == ExchangeState::AwaitingReply;
    }

    void close() noexcept { m_socket.close(); }
    [[nodiscard]] bool is_open() const noexcept { return m_socket.is_open(); }
    [[nodiscard]] const std::string &address() const noexcept { return m_socket.address(); }
    [[nodiscard]] const std::string &endpoint() const noexcept { return m_socket.endpoint(); }

  private:
    explicit Replier(TransportSocket &&socket) : m_socket(std::move(socket)) {}

    MsgResult<std::optional<Message>> receive_request(const ReceiveDeadline &deadline);

    TransportSocket m_socket;
    ExchangeState m_state{ExchangeState::Ready};
};

} // namespace plexus::msg
