#pragma once
/**
 * @file endpoint.hpp
 * @brief Transport address parsing and binding with ephemeral port discovery.
 *
 * Accepted forms:
 *   - `tcp://host:port`        fixed address
 *   - `tcp://host:lo-hi`       ephemeral: a free port chosen from the inclusive range
 *   - `tcp://host:*`, `:0`     ephemeral: the OS chooses the port
 *   - `ipc://...`, `inproc://...` passed through as fixed addresses
 *
 * After binding, the true endpoint is read back from the socket (`last_endpoint`) so
 * it can be handed to peers. A wildcard host is replaced by this machine's host name.
 */
#include "zworkers_pool_export.h"

#include "pool/result.hpp"

#include <zmq.hpp>

#include <string>
#include <string_view>

namespace zworkers::pool
{

enum class EndpointError
{
    InvalidScheme, ///< Not tcp://, ipc:// or inproc://
    MissingPort,   ///< tcp URL without a ':port' part
    InvalidPort,   ///< Port is not a number in 1..65535
    InvalidRange,  ///< 'lo-hi' with lo > hi or an invalid bound
    EmptyHost      ///< tcp URL with nothing before ':port'
};

ZWORKERS_POOL_EXPORT const char *to_string(EndpointError err) noexcept;

struct EndpointSpec
{
    std::string scheme; ///< "tcp", "ipc" or "inproc"
    std::string host;   ///< tcp only; empty for ipc/inproc
    int port_lo = 0;    ///< tcp only; 0 means the OS chooses
    int port_hi = 0;    ///< equal to port_lo for a fixed port
    std::string raw;    ///< the URL as given

    [[nodiscard]] bool is_tcp() const noexcept { return scheme == "tcp"; }
    [[nodiscard]] bool is_ephemeral() const noexcept
    {
        return is_tcp() && (port_lo == 0 || port_lo != port_hi);
    }
};

/**
 * @brief Parses an endpoint URL.
 * @return The spec, or an EndpointError whose error_code() is the offending
 *         character offset (0 when not applicable).
 */
[[nodiscard]] ZWORKERS_POOL_EXPORT Result<EndpointSpec, EndpointError>
parse_endpoint(std::string_view url);

/**
 * @brief Binds @p socket to @p url and returns the endpoint peers should connect to.
 * @details For a port range, ports are tried in random order and ports in use
 *          (EADDRINUSE) are skipped. A tcp host that is not a numeric address
 *          (`localhost`, a node name) is bound on `*` and advertised under its name.
 * @throws std::invalid_argument if @p url does not parse.
 * @throws std::runtime_error if every port of a range is in use.
 * @throws zmq::error_t for any other bind failure.
 */
ZWORKERS_POOL_EXPORT std::string bind_endpoint(zmq::socket_t &socket, std::string_view url);

/// True for `*` and numeric IPv4/IPv6 addresses, the hosts libzmq can bind directly.
[[nodiscard]] ZWORKERS_POOL_EXPORT bool is_bindable_host(std::string_view host) noexcept;

/**
 * @brief Builds `tcp://host:port`.
 */
[[nodiscard]] ZWORKERS_POOL_EXPORT std::string make_tcp_url(std::string_view host, int port);

/**
 * @brief Replaces a wildcard host (`*`, `0.0.0.0`) in a bound tcp endpoint with the
 *        local host name; other endpoints are returned unchanged.
 */
[[nodiscard]] ZWORKERS_POOL_EXPORT std::string advertised_endpoint(std::string_view bound);

} // namespace zworkers::pool
