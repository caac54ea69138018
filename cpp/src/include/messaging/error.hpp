#pragma once
/**
 * @file error.hpp
 * @brief Unified error taxonomy for the messaging layer.
 *
 * Every fallible messaging operation returns MsgResult<T> or Status. Timeout expiry
 * and "no message available" are not errors; they are reported as an empty
 * std::optional inside a successful result.
 */
#include "plexus_msg_export.h"
#include "utils/result.hpp"

#include <string_view>

#include <fmt/format.h>

namespace plexus::msg
{

enum class ErrorKind
{
    InvalidTopic,         ///< Empty or malformed topic supplied to Message construction.
    SerializationError,   ///< Payload cannot be converted to the wire representation.
    DeserializationError, ///< Payload cannot be converted back into the requested type.
    MalformedMessage,     ///< Received frames do not decode into a well-formed Message.
    BindError,            ///< Transport failure while binding; message carries the address.
    ConnectError,         ///< Transport failure while connecting; message carries the address.
    SendError,            ///< Transport failure during send.
    ReceiveError,         ///< Transport failure during receive.
    ProtocolStateError,   ///< Request/reply strict alternation violated by the caller.
    ConfigurationError,   ///< Invalid socket-options document.
    SocketError,          ///< Socket creation/option failure, or subscription on a closed/non-SUB socket.
};

/**
 * @brief Convert ErrorKind to string for logging/debugging
 */
PLEXUS_MSG_EXPORT const char *to_string(ErrorKind kind) noexcept;

template <typename T>
using MsgResult = Result<T, ErrorKind>;

using Status = Result<void, ErrorKind>;

} // namespace plexus::msg

template <>
struct fmt::formatter<plexus::msg::ErrorKind> : fmt::formatter<std::string_view>
{
    template <typename FormatContext>
    auto format(plexus::msg::ErrorKind kind, FormatContext &ctx) const
    {
        return fmt::formatter<std::string_view>::format(plexus::msg::to_string(kind), ctx);
    }
};
