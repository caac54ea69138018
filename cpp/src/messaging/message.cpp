#include "messaging/message.hpp"
#include "messaging/wire_codec.hpp"

#include "utils/format_tools.hpp"

#include <cstdint>

namespace plexus::msg
{

namespace detail
{
bool is_valid_utf8(std::string_view text) noexcept
{
    size_t i = 0;
    const size_t n = text.size();
    while (i < n)
    {
        const auto c = static_cast<uint8_t>(text[i]);
        size_t len = 0;
        uint32_t cp = 0;
        if (c < 0x80)
        {
            ++i;
            continue;
        }
        if ((c & 0xE0) == 0xC0)
        {
            len = 2;
            cp = c & 0x1F;
        }
        else if ((c & 0xF0) == 0xE0)
        {
            len = 3;
            cp = c & 0x0F;
        }
        else if ((c & 0xF8) == 0xF0)
        {
            len = 4;
            cp = c & 0x07;
        }
        else
        {
            return false;
        }
        if (i + len > n)
            return false;
        for (size_t k = 1; k < len; ++k)
        {
            const auto cc = static_cast<uint8_t>(text[i + k]);
            if ((cc & 0xC0) != 0x80)
                return false;
            cp = (cp << 6) | (cc & 0x3F);
        }
        // Reject overlong encodings, UTF-16 surrogates and out-of-range code points.
        if ((len == 2 && cp < 0x80) || (len == 3 && cp < 0x800) || (len == 4 && cp < 0x10000) ||
            (cp >= 0xD800 && cp <= 0xDFFF) || cp > 0x10FFFF)
            return false;
        i += len;
    }
    return true;
}
} // namespace detail

bool Message::is_valid_topic(std::string_view topic) noexcept
{
    return !topic.empty() && detail::is_valid_utf8(topic);
}

MsgResult<Message> Message::invalid_topic(std::string_view topic)
{
    if (topic.empty())
    {
        return MsgResult<Message>::error(ErrorKind::InvalidTopic, "topic must not be empty");
    }
    return MsgResult<Message>::error(
        ErrorKind::InvalidTopic,
        fmt::format("topic '{}' is not valid UTF-8", format_tools::printable_bytes(topic)));
}

MsgResult<Message> Message::create(std::string topic, Payload payload)
{
    if (!is_valid_topic(topic))
    {
        return invalid_topic(topic);
    }
    return MsgResult<Message>::ok(Message(std::move(topic), std::move(payload)));
}

MsgResult<std::string> Message::to_json_bytes() const
{
    return wire::encode_payload(Payload{{"topic", m_topic}, {"payload", m_payload}});
}

MsgResult<Message> Message::from_json_bytes(std::string_view bytes)
{
    Payload doc;
    try
    {
        doc = nlohmann::json::parse(bytes);
    }
    catch (const nlohmann::json::exception &e)
    {
        return MsgResult<Message>::error(ErrorKind::DeserializationError, e.what(), e.id);
    }

    if (!doc.is_object() || !doc.contains("topic") || !doc["topic"].is_string() ||
        !doc.contains("payload"))
    {
        return MsgResult<Message>::error(ErrorKind::DeserializationError,
                                         "expected an object with 'topic' and 'payload'");
    }
    return create(doc["topic"].get<std::string>(), std::move(doc["payload"]));
}

} // namespace plexus::msg
