#pragma once
/**
 * @file wire_codec.hpp
 * @brief Multi-frame wire encoding of a Message.
 *
 * Framing:
 *  - Frame 1: UTF-8 topic (sent first so SUB sockets can prefix-filter on it)
 *  - Frame 2: compact JSON text of the payload
 *
 * decode() concatenates frames 2..n before parsing, so a peer that splits a large
 * payload across frames is still understood. There is no header and no version field.
 */
#include "plexus_msg_export.h"
#include "messaging/error.hpp"
#include "messaging/message.hpp"

#include <cstddef>
#include <string>
#include <vector>

namespace plexus::msg::wire
{

using Frames = std::vector<std::string>;

inline constexpr size_t kMinFrames = 2;
inline constexpr size_t kTopicFrame = 0;
inline constexpr size_t kPayloadFrame = 1;

/**
 * @brief Serializes a payload to compact JSON text.
 * @return SerializationError for non-finite numbers, binary or discarded values, or
 *         strings that are not valid UTF-8, which JSON text cannot carry losslessly.
 */
[[nodiscard]] PLEXUS_MSG_EXPORT MsgResult<std::string> encode_payload(const Message::Payload &payload);

[[nodiscard]] PLEXUS_MSG_EXPORT MsgResult<Frames> encode(const Message &message);

/**
 * @brief Rebuilds a Message from received frames.
 * @return MalformedMessage on fewer than two frames, an empty or non-UTF-8 topic frame,
 *         or payload bytes that are not a JSON document.
 */
[[nodiscard]] PLEXUS_MSG_EXPORT MsgResult<Message> decode(const Frames &frames);

} // namespace plexus::msg::wire
