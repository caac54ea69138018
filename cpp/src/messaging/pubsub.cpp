#include "messaging/pubsub.hpp"

#include "utils/format_tools.hpp"
#include "utils/logger.hpp"

#include <utility>

namespace plexus::msg
{

// ============================================================================
// Publisher
// ============================================================================

MsgResult<Publisher> Publisher::bind(const std::string &address, const SocketOptions &options)
{
    auto socket = TransportSocket::open(SocketPattern::Pub, SocketRole::Bind, {address}, options);
    if (socket.is_error())
    {
        return MsgResult<Publisher>::error_from(socket);
    }
    LOGGER_INFO("Publisher: bound to '{}'.", socket.content().endpoint());
    return MsgResult<Publisher>::ok(Publisher(std::move(socket).content()));
}

Status Publisher::publish(const Message &message)
{
    return m_socket.send(message);
}

Status Publisher::publish_raw(std::string_view topic, std::string_view bytes)
{
    if (!Message::is_valid_topic(topic))
    {
        LOGGER_WARN("Publisher: publish_raw with invalid topic '{}'.",
                    format_tools::printable_bytes(topic));
        return Status::error(ErrorKind::InvalidTopic,
                             fmt::format("invalid topic '{}'", format_tools::printable_bytes(topic)));
    }
    return m_socket.send_frames({std::string(topic), std::string(bytes)});
}

// ============================================================================
// Subscriber
// ============================================================================

MsgResult<Subscriber> Subscriber::connect(const std::string &address,
                                          const SocketOptions &options)
{
    return connect(std::vector<std::string>{address}, options);
}

MsgResult<Subscriber> Subscriber::connect(const std::vector<std::string> &addresses,
                                          const SocketOptions &options)
{
    auto socket = TransportSocket::open(SocketPattern::Sub, SocketRole::Connect, addresses, options);
    if (socket.is_error())
    {
        return MsgResult<Subscriber>::error_from(socket);
    }
    LOGGER_INFO("Subscriber: connected to {} publisher(s), last '{}'.", addresses.size(),
                socket.content().endpoint());
    return MsgResult<Subscriber>::ok(Subscriber(std::move(socket).content()));
}

Status Subscriber::subscribe(std::string_view prefix)
{
    std::string key(prefix);
    if (m_subscriptions.count(key) != 0)
    {
        return Status::ok();
    }
    auto status = m_socket.subscribe(prefix);
    if (status.is_ok())
    {
        LOGGER_DEBUG("Subscriber: subscribed to '{}'.", format_tools::printable_bytes(prefix));
        m_subscriptions.insert(std::move(key));
    }
    return status;
}

Status Subscriber::unsubscribe(std::string_view prefix)
{
    auto it = m_subscriptions.find(std::string(prefix));
    if (it == m_subscriptions.end())
    {
        return Status::ok();
    }
    auto status = m_socket.unsubscribe(prefix);
    if (status.is_ok())
    {
        LOGGER_DEBUG("Subscriber: unsubscribed from '{}'.", format_tools::printable_bytes(prefix));
        m_subscriptions.erase(it);
    }
    return status;
}

MsgResult<std::optional<RawMessage>> Subscriber::receive_raw_timeout(int timeout_ms)
{
    using RawResult = MsgResult<std::optional<RawMessage>>;
    auto frames =
        m_socket.receive_frames(ReceiveDeadline::after(std::chrono::milliseconds(timeout_ms)));
    if (frames.is_error())
    {
        return RawResult::error_from(frames);
    }
    if (!frames.content().has_value())
    {
        return RawResult::ok(std::nullopt);
    }

    auto &parts = *frames.content();
    if (parts.size() < wire::kMinFrames)
    {
        LOGGER_WARN("Subscriber: raw receive got {} frame(s), expected at least {}.", parts.size(),
                    wire::kMinFrames);
        return RawResult::error(ErrorKind::MalformedMessage,
                                fmt::format("expected at least {} frames, got {}", wire::kMinFrames,
                                            parts.size()));
    }

    RawMessage raw;
    raw.topic = std::move(parts[wire::kTopicFrame]);
    for (size_t i = wire::kPayloadFrame; i < parts.size(); ++i)
    {
        raw.bytes += parts[i];
    }
    return RawResult::ok(std::move(raw));
}

} // namespace plexus::msg
