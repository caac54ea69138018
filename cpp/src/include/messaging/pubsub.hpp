#pragma once
/**
 * @file pubsub.hpp
 * @brief Publisher (binds, sends) and Subscriber (connects, prefix-filters, receives).
 *
 * Fan-out to many subscribers and per-subscriber queuing are done by ZeroMQ.
 * A Subscriber that connects after a message was published never sees it (slow joiner).
 *
 * | Endpoint   | Socket | Role    |
 * |------------|--------|---------|
 * | Publisher  | PUB    | bind    |
 * | Subscriber | SUB    | connect |
 */
#include "plexus_msg_export.h"
#include "messaging/error.hpp"
#include "messaging/message.hpp"
#include "messaging/socket_options.hpp"
#include "messaging/transport_socket.hpp"

#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <vector>

namespace plexus::msg
{

/// Topic plus undecoded payload bytes, as sent by Publisher::publish_raw().
struct RawMessage
{
    std::string topic;
    std::string bytes;
};

class PLEXUS_MSG_EXPORT Publisher
{
  public:
    /// Binds a PUB socket to @p address. BindError names the address on failure.
    [[nodiscard]] static MsgResult<Publisher> bind(const std::string &address,
                                                   const SocketOptions &options = {});

    Publisher(const Publisher &) = delete;
    Publisher &operator=(const Publisher &) = delete;
    Publisher(Publisher &&) noexcept = default;
    Publisher &operator=(Publisher &&) noexcept = default;
    ~Publisher() = default;

    /// Fire-and-forget. Messages with no matching subscriber are dropped by ZeroMQ.
    [[nodiscard]] Status publish(const Message &message);

    /// Sends @p bytes verbatim under @p topic, without JSON encoding.
    [[nodiscard]] Status publish_raw(std::string_view topic, std::string_view bytes);

    void close() noexcept { m_socket.close(); }
    [[nodiscard]] bool is_open() const noexcept { return m_socket.is_open(); }
    [[nodiscard]] const std::string &address() const noexcept { return m_socket.address(); }
    [[nodiscard]] const std::string &endpoint() const noexcept { return m_socket.endpoint(); }

  private:
    explicit Publisher(TransportSocket &&socket) : m_socket(std::move(socket)) {}

    TransportSocket m_socket;
};

class PLEXUS_MSG_EXPORT Subscriber
{
  public:
    /// Connects a SUB socket to one publisher. Starts with no subscriptions.
    [[nodiscard]] static MsgResult<Subscriber> connect(const std::string &address,
                                                       const SocketOptions &options = {});

    /// Connects to several publishers (fan-in).
    [[nodiscard]] static MsgResult<Subscriber> connect(const std::vector<std::string> &addresses,
                                                       const SocketOptions &options = {});

    Subscriber(const Subscriber &) = delete;
    Subscriber &operator=(const Subscriber &) = delete;
    Subscriber(Subscriber &&) noexcept = default;
    Subscriber &operator=(Subscriber &&) noexcept = default;
    ~Subscriber() = default;

    /**
     * @brief Adds a topic prefix to the filter. An empty prefix matches every topic.
     *        Subscribing to a prefix already in the filter is a no-op.
     */
    [[nodiscard]] Status subscribe(std::string_view prefix);

    /// Removes a prefix. Unsubscribing from a prefix not in the filter is a no-op.
    [[nodiscard]] Status unsubscribe(std::string_view prefix);

    [[nodiscard]] const std::set<std::string> &subscriptions() const noexcept
    {
        return m_subscriptions;
    }

    [[nodiscard]] MsgResult<Message> receive() { return m_socket.receive(); }
    [[nodiscard]] MsgResult<std::optional<Message>> receive_timeout(int timeout_ms)
    {
        return m_socket.receive_timeout(timeout_ms);
    }
    [[nodiscard]] MsgResult<std::optional<Message>> try_receive()
    {
        return m_socket.try_receive();
    }

    /**
     * @brief Receives without JSON decoding. Frames after the topic are concatenated.
     * @return MalformedMessage if fewer than two frames arrive.
     */
    [[nodiscard]] MsgResult<std::optional<RawMessage>> receive_raw_timeout(int timeout_ms);

    void close() noexcept { m_socket.close(); }
    [[nodiscard]] bool is_open() const noexcept { return m_socket.is_open(); }
    [[nodiscard]] const std::vector<std::string> &addresses() const noexcept
    {
        return m_socket.addresses();
    }
    [[nodiscard]] const std::string &endpoint() const noexcept { return m_socket.endpoint(); }

  private:
    explicit Subscriber(TransportSocket &&socket) : m_socket(std::move(socket)) {}

    TransportSocket m_socket;
    std::set<std::string> m_subscriptions;
};

} // namespace plexus::msg
