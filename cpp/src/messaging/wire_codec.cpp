#include "messaging/wire_codec.hpp"

#include "utils/format_tools.hpp"

#include <cmath>

namespace plexus::msg::wire
{

namespace
{
/// Returns a description of the first value that JSON text cannot carry
/// unchanged, or nullptr when the whole document is representable.
const char *unrepresentable_value(const nlohmann::json &value)
{
    if (value.is_number_float() && !std::isfinite(value.get<double>()))
    {
        return "payload contains a non-finite number";
    }
    if (value.is_binary())
    {
        return "payload contains a binary value";
    }
    if (value.is_discarded())
    {
        return "payload contains a discarded value";
    }
    if (value.is_structured())
    {
        for (const auto &child : value)
        {
            if (const char *reason = unrepresentable_value(child))
                return reason;
        }
    }
    return nullptr;
}
} // namespace

MsgResult<std::string> encode_payload(const Message::Payload &payload)
{
    if (const char *reason = unrepresentable_value(payload))
    {
        return MsgResult<std::string>::error(ErrorKind::SerializationError, reason);
    }
    try
    {
        return MsgResult<std::string>::ok(
            payload.dump(-1, ' ', false, nlohmann::json::error_handler_t::strict));
    }
    catch (const nlohmann::json::exception &e)
    {
        return MsgResult<std::string>::error(ErrorKind::SerializationError, e.what(), e.id);
    }
}

MsgResult<Frames> encode(const Message &message)
{
    auto payload = encode_payload(message.payload());
    if (payload.is_error())
    {
        return MsgResult<Frames>::error(
            payload.error(), fmt::format("topic '{}': {}", message.topic(), payload.error_message()),
            payload.error_code());
    }
    Frames frames;
    frames.reserve(kMinFrames);
    frames.push_back(message.topic());
    frames.push_back(std::move(payload).content());
    return MsgResult<Frames>::ok(std::move(frames));
}

MsgResult<Message> decode(const Frames &frames)
{
    if (frames.size() < kMinFrames)
    {
        return MsgResult<Message>::error(
            ErrorKind::MalformedMessage,
            fmt::format("expected at least {} frames, got {}", kMinFrames, frames.size()));
    }

    const std::string &topic = frames[kTopicFrame];
    if (!Message::is_valid_topic(topic))
    {
        return MsgResult<Message>::error(
            ErrorKind::MalformedMessage,
            fmt::format("invalid topic frame '{}'", format_tools::printable_bytes(topic)));
    }

    std::string joined;
    const std::string *payload_bytes = &frames[kPayloadFrame];
    if (frames.size() > kMinFrames)
    {
        for (size_t i = kPayloadFrame; i < frames.size(); ++i)
            joined += frames[i];
        payload_bytes = &joined;
    }

    Message::Payload payload;
    try
    {
        payload = nlohmann::json::parse(*payload_bytes);
    }
    catch (const nlohmann::json::exception &e)
    {
        return MsgResult<Message>::error(ErrorKind::MalformedMessage,
                                         fmt::format("topic '{}': undecodable payload: {}", topic,
                                                     e.what()),
                                         e.id);
    }

    auto message = Message::create(topic, std::move(payload));
    if (message.is_error())
    {
        return MsgResult<Message>::error(ErrorKind::MalformedMessage, message.error_message());
    }
    return message;
}

} // namespace plexus::msg::wire
