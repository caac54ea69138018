#pragma once
/**
 * @file message.hpp
 * @brief Message: an immutable topic + structured payload envelope.
 *
 * The payload is an nlohmann::json value. Any application type with nlohmann
 * `to_json` / `from_json` overloads can be carried via from_value() and recovered
 * via payload_as<T>().
 *
 * A Message is immutable once constructed: the only way to change a topic or
 * payload is to build a new Message.
 */
#include "plexus_msg_export.h"
#include "messaging/error.hpp"

#include <exception>
#include <string>
#include <string_view>
#include <utility>

#include <fmt/format.h>
#include <nlohmann/json.hpp>

namespace plexus::msg
{

namespace detail
{
/// True if @p text is well-formed UTF-8 (no overlongs, no surrogates, <= U+10FFFF).
PLEXUS_MSG_EXPORT bool is_valid_utf8(std::string_view text) noexcept;
} // namespace detail

class PLEXUS_MSG_EXPORT Message
{
  public:
    using Payload = nlohmann::json;

    /**
     * @brief Builds a Message from a topic and an already-structured payload.
     * @return InvalidTopic if @p topic is empty or not valid UTF-8.
     */
    [[nodiscard]] static MsgResult<Message> create(std::string topic, Payload payload);

    /**
     * @brief Builds a Message by converting @p value through its nlohmann `to_json`.
     * @return InvalidTopic for a bad topic; SerializationError if the conversion throws.
     */
    template <typename T>
    [[nodiscard]] static MsgResult<Message> from_value(std::string topic, const T &value);

    /**
     * @brief Converts the payload back into @p T through its nlohmann `from_json`.
     * @return DeserializationError with the diagnostic if the shape does not match or the
     *         type's from_json throws.
     */
    template <typename T>
    [[nodiscard]] MsgResult<T> payload_as() const;

    [[nodiscard]] const std::string &topic() const noexcept { return m_topic; }
    [[nodiscard]] const Payload &payload() const noexcept { return m_payload; }

    /// Whole envelope as one JSON document: {"topic": ..., "payload": ...}.
    [[nodiscard]] MsgResult<std::string> to_json_bytes() const;
    [[nodiscard]] static MsgResult<Message> from_json_bytes(std::string_view bytes);

    [[nodiscard]] static bool is_valid_topic(std::string_view topic) noexcept;

    friend bool operator==(const Message &a, const Message &b)
    {
        return a.m_topic == b.m_topic && a.m_payload == b.m_payload;
    }
    friend bool operator!=(const Message &a, const Message &b) { return !(a == b); }

  private:
    Message(std::string topic, Payload payload)
        : m_topic(std::move(topic)), m_payload(std::move(payload))
    {
    }

    static MsgResult<Message> invalid_topic(std::string_view topic);

    std::string m_topic;
    Payload m_payload;
};

// ----------------- Template implementation -----------------

template <typename T>
MsgResult<Message> Message::from_value(std::string topic, const T &value)
{
    if (!is_valid_topic(topic))
    {
        return invalid_topic(topic);
    }
    try
    {
        Payload payload = value;
        return MsgResult<Message>::ok(Message(std::move(topic), std::move(payload)));
    }
    catch (const nlohmann::json::exception &e)
    {
        return MsgResult<Message>::error(ErrorKind::SerializationError,
                                         fmt::format("topic '{}': {}", topic, e.what()), e.id);
    }
    catch (const std::exception &e)
    {
        return MsgResult<Message>::error(ErrorKind::SerializationError,
                                         fmt::format("topic '{}': {}", topic, e.what()));
    }
}

template <typename T>
MsgResult<T> Message::payload_as() const
{
    try
    {
        return MsgResult<T>::ok(m_payload.get<T>());
    }
    catch (const nlohmann::json::exception &e)
    {
        return MsgResult<T>::error(ErrorKind::DeserializationError,
                                   fmt::format("topic '{}': {}", m_topic, e.what()), e.id);
    }
    catch (const std::exception &e)
    {
        return MsgResult<T>::error(ErrorKind::DeserializationError,
                                   fmt::format("topic '{}': {}", m_topic, e.what()));
    }
}

} // namespace plexus::msg
