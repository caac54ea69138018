#pragma once
/**
 * @file socket_options.hpp
 * @brief Per-endpoint transport tuning, optionally loaded from a JSON document.
 *
 * Every key is optional; missing keys keep the built-in default. Options may sit at
 * the top level of the document or under a "socket" object:
 *
 * @code
 *   { "socket": { "linger_ms": 0, "send_hwm": 10000, "send_timeout_ms": 500 } }
 * @endcode
 */
#include "plexus_msg_export.h"
#include "messaging/error.hpp"

#include <filesystem>

#include <nlohmann/json.hpp>

namespace plexus::msg
{

struct SocketOptions
{
    int linger_ms{1000};             ///< ZMQ_LINGER; -1 waits forever for unsent messages on close.
    int send_hwm{1000};              ///< ZMQ_SNDHWM; 0 means no limit.
    int recv_hwm{1000};              ///< ZMQ_RCVHWM; 0 means no limit.
    int send_timeout_ms{-1};         ///< ZMQ_SNDTIMEO; -1 blocks until the send can proceed.
    int reconnect_interval_ms{100};  ///< ZMQ_RECONNECT_IVL for connecting sockets.
    bool ipv6{false};                ///< ZMQ_IPV6

    friend bool operator==(const SocketOptions &, const SocketOptions &) = default;
};

PLEXUS_MSG_EXPORT void to_json(nlohmann::json &j, const SocketOptions &opts);
/// Throws nlohmann::json::exception on a wrong value type; prefer socket_options_from_json().
PLEXUS_MSG_EXPORT void from_json(const nlohmann::json &j, SocketOptions &opts);

/**
 * @brief Parses and validates options from an already loaded document.
 * @return ConfigurationError for a non-object document, wrong value types, or negative
 *         high-water marks / reconnect interval.
 */
[[nodiscard]] PLEXUS_MSG_EXPORT MsgResult<SocketOptions>
socket_options_from_json(const nlohmann::json &doc);

/// Reads @p path and forwards to socket_options_from_json().
[[nodiscard]] PLEXUS_MSG_EXPORT MsgResult<SocketOptions>
load_socket_options(const std::filesystem::path &path);

} // namespace plexus::msg
