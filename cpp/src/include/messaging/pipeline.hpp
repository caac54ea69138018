#pragma once
/**
 * @file pipeline.hpp
 * @brief Pusher / Puller: one-way task distribution.
 *
 * Either side may bind, so both endpoints have explicit bind() and connect()
 * factories. ZeroMQ load-balances pushed messages across connected Pullers; each
 * message reaches exactly one of them. There is no reply path.
 */
#include "plexus_msg_export.h"
#include "messaging/error.hpp"
#include "messaging/message.hpp"
#include "messaging/socket_options.hpp"
#include "messaging/transport_socket.hpp"

#include <optional>
#include <string>

namespace plexus::msg
{

class PLEXUS_MSG_EXPORT Pusher
{
  public:
    [[nodiscard]] static MsgResult<Pusher> bind(const std::string &address,
                                                const SocketOptions &options = {});
    [[nodiscard]] static MsgResult<Pusher> connect(const std::string &address,
                                                   const SocketOptions &options = {});

    Pusher(const Pusher &) = delete;
    Pusher &operator=(const Pusher &) = delete;
    Pusher(Pusher &&) noexcept = default;
    Pusher &operator=(Pusher &&) noexcept = default;
    ~Pusher() = default;

    /// Blocks while no Puller is connected or every Puller's queue is full,
    /// unless SocketOptions::send_timeout_ms bounds the wait (SendError on expiry).
    [[nodiscard]] Status push(const Message &message);

    void close() noexcept { m_socket.close(); }
    [[nodiscard]] bool is_open() const noexcept { return m_socket.is_open(); }
    [[nodiscard]] SocketRole role() const noexcept { return m_socket.role(); }
    [[nodiscard]] const std::string &address() const noexcept { return m_socket.address(); }
    [[nodiscard]] const std::string &endpoint() const noexcept { return m_socket.endpoint(); }

  private:
    explicit Pusher(TransportSocket &&socket) : m_socket(std::move(socket)) {}

    TransportSocket m_socket;
};

class PLEXUS_MSG_EXPORT Puller
{
  public:
    [[nodiscard]] static MsgResult<Puller> bind(const std::string &address,
                                                const SocketOptions &options = {});
    [[nodiscard]] static MsgResult<Puller> connect(const std::string &address,
                                                   const SocketOptions &options = {});

    Puller(const Puller &) = delete;
    Puller &operator=(const Puller &) = delete;
    Puller(Puller &&) noexcept = default;
    Puller &operator=(Puller &&) noexcept = default;
    ~Puller() = default;

    [[nodiscard]] MsgResult<Message> pull() { return m_socket.receive(); }
    [[nodiscard]] MsgResult<std::optional<Message>> pull_timeout(int timeout_ms)
    {
        return m_socket.receive_timeout(timeout_ms);
    }
    [[nodiscard]] MsgResult<std::optional<Message>> try_pull() { return m_socket.try_receive(); }

    void close() noexcept { m_socket.close(); }
    [[nodiscard]] bool is_open() const noexcept { return m_socket.is_open(); }
    [[nodiscard]] SocketRole role() const noexcept { return m_socket.role(); }
    [[nodiscard]] const std::string &address() const noexcept { return m_socket.address(); }
    [[nodiscard]] const std::string &endpoint() const noexcept { return m_socket.endpoint(); }

  private:
    explicit Puller(TransportSocket &&socket) : m_socket(std::move(socket)) {}

    TransportSocket m_socket;
};

} // namespace plexus::msg
