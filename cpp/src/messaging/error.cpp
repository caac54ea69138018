#include "messaging/error.hpp"

namespace plexus::msg
{

const char *to_string(ErrorKind kind) noexcept
{
    switch (kind)
    {
    case ErrorKind::InvalidTopic:
        return "InvalidTopic";
    case ErrorKind::SerializationError:
        return "SerializationError";
    case ErrorKind::DeserializationError:
        return "DeserializationError";
    case ErrorKind::MalformedMessage:
        return "MalformedMessage";
    case ErrorKind::BindError:
        return "BindError";
    case ErrorKind::ConnectError:
        return "ConnectError";
    case ErrorKind::SendError:
        return "SendError";
    case ErrorKind::ReceiveError:
        return "ReceiveError";
    case ErrorKind::ProtocolStateError:
        return "ProtocolStateError";
    case ErrorKind::ConfigurationError:
        return "ConfigurationError";
    case ErrorKind::SocketError:
        return "SocketError";
    default:
        return "Unknown";
    }
}

} // namespace plexus::msg
