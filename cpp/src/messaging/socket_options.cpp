#include "messaging/socket_options.hpp"

#include "utils/logger.hpp"

#include <fstream>

namespace plexus::msg
{

void to_json(nlohmann::json &j, const SocketOptions &opts)
{
    j = nlohmann::json{{"linger_ms", opts.linger_ms},
                       {"send_hwm", opts.send_hwm},
                       {"recv_hwm", opts.recv_hwm},
                       {"send_timeout_ms", opts.send_timeout_ms},
                       {"reconnect_interval_ms", opts.reconnect_interval_ms},
                       {"ipv6", opts.ipv6}};
}

void from_json(const nlohmann::json &j, SocketOptions &opts)
{
    const SocketOptions defaults;
    opts.linger_ms = j.value("linger_ms", defaults.linger_ms);
    opts.send_hwm = j.value("send_hwm", defaults.send_hwm);
    opts.recv_hwm = j.value("recv_hwm", defaults.recv_hwm);
    opts.send_timeout_ms = j.value("send_timeout_ms", defaults.send_timeout_ms);
    opts.reconnect_interval_ms = j.value("reconnect_interval_ms", defaults.reconnect_interval_ms);
    opts.ipv6 = j.value("ipv6", defaults.ipv6);
}

MsgResult<SocketOptions> socket_options_from_json(const nlohmann::json &doc)
{
    if (!doc.is_object())
    {
        return MsgResult<SocketOptions>::error(ErrorKind::ConfigurationError,
                                               "socket options must be a JSON object");
    }
    const nlohmann::json &section =
        (doc.contains("socket") && doc["socket"].is_object()) ? doc["socket"] : doc;

    SocketOptions opts;
    try
    {
        opts = section.get<SocketOptions>();
    }
    catch (const nlohmann::json::exception &e)
    {
        return MsgResult<SocketOptions>::error(ErrorKind::ConfigurationError, e.what(), e.id);
    }

    if (opts.send_hwm < 0 || opts.recv_hwm < 0)
    {
        return MsgResult<SocketOptions>::error(ErrorKind::ConfigurationError,
                                               "high-water marks must be >= 0");
    }
    if (opts.reconnect_interval_ms < 0)
    {
        return MsgResult<SocketOptions>::error(ErrorKind::ConfigurationError,
                                               "reconnect_interval_ms must be >= 0");
    }
    return MsgResult<SocketOptions>::ok(opts);
}

MsgResult<SocketOptions> load_socket_options(const std::filesystem::path &path)
{
    std::ifstream f(path);
    if (!f.is_open())
    {
        LOGGER_ERROR("SocketOptions: cannot open '{}'.", path.string());
        return MsgResult<SocketOptions>::error(ErrorKind::ConfigurationError,
                                               fmt::format("cannot open '{}'", path.string()));
    }

    nlohmann::json doc;
    try
    {
        f >> doc;
    }
    catch (const nlohmann::json::exception &e)
    {
        LOGGER_ERROR("SocketOptions: bad JSON in '{}': {}", path.string(), e.what());
        return MsgResult<SocketOptions>::error(
            ErrorKind::ConfigurationError, fmt::format("'{}': {}", path.string(), e.what()), e.id);
    }

    auto opts = socket_options_from_json(doc);
    if (opts.is_error())
    {
        LOGGER_ERROR("SocketOptions: invalid options in '{}': {}", path.string(),
                     opts.error_message());
    }
    return opts;
}

} // namespace plexus::msg
