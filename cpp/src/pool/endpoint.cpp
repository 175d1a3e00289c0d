#include "pool/endpoint.hpp"
#include "zw_service.hpp"

#include <algorithm>
#include <charconv>
#include <numeric>
#include <random>
#include <stdexcept>
#include <vector>

#include <cerrno>

#include <arpa/inet.h>
#include <netinet/in.h>

namespace zworkers::pool
{

namespace
{
constexpr int kMaxPort = 65535;

bool parse_port(std::string_view text, int &out) noexcept
{
    if (text.empty())
    {
        return false;
    }
    int value = 0;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc{} || ptr != text.data() + text.size())
    {
        return false;
    }
    if (value < 0 || value > kMaxPort)
    {
        return false;
    }
    out = value;
    return true;
}

std::string tcp_with_port(const EndpointSpec &spec, int port)
{
    return port == 0 ? fmt::format("tcp://{}:*", spec.host) : make_tcp_url(spec.host, port);
}

int port_of(std::string_view endpoint) noexcept
{
    int port = 0;
    const size_t colon = endpoint.rfind(':');
    if (colon != std::string_view::npos)
    {
        (void)parse_port(endpoint.substr(colon + 1), port);
    }
    return port;
}
} // namespace

bool is_bindable_host(std::string_view host) noexcept
{
    if (host == "*")
    {
        return true;
    }
    if (host.size() > 2 && host.front() == '[' && host.back() == ']')
    {
        host = host.substr(1, host.size() - 2);
    }
    const std::string text(host);
    in6_addr addr{};
    return ::inet_pton(AF_INET, text.c_str(), &addr) == 1 ||
           ::inet_pton(AF_INET6, text.c_str(), &addr) == 1;
}

const char *to_string(EndpointError err) noexcept
{
    switch (err)
    {
    case EndpointError::InvalidScheme:
        return "InvalidScheme";
    case EndpointError::MissingPort:
        return "MissingPort";
    case EndpointError::InvalidPort:
        return "InvalidPort";
    case EndpointError::InvalidRange:
        return "InvalidRange";
    case EndpointError::EmptyHost:
        return "EmptyHost";
    default:
        return "Unknown";
    }
}

Result<EndpointSpec, EndpointError> parse_endpoint(std::string_view url)
{
    using R = Result<EndpointSpec, EndpointError>;

    const size_t sep = url.find("://");
    if (sep == std::string_view::npos || sep == 0)
    {
        return R::error(EndpointError::InvalidScheme);
    }

    EndpointSpec spec;
    spec.raw = std::string(url);
    spec.scheme = std::string(url.substr(0, sep));

    if (spec.scheme == "ipc" || spec.scheme == "inproc")
    {
        if (url.size() == sep + 3)
        {
            return R::error(EndpointError::EmptyHost, static_cast<int>(sep + 3));
        }
        return R::ok(std::move(spec));
    }
    if (spec.scheme != "tcp")
    {
        return R::error(EndpointError::InvalidScheme);
    }

    const std::string_view rest = url.substr(sep + 3);
    const size_t colon = rest.rfind(':');
    if (colon == std::string_view::npos)
    {
        return R::error(EndpointError::MissingPort, static_cast<int>(url.size()));
    }
    if (colon == 0)
    {
        return R::error(EndpointError::EmptyHost, static_cast<int>(sep + 3));
    }
    spec.host = std::string(rest.substr(0, colon));

    const std::string_view port_text = rest.substr(colon + 1);
    const int port_offset = static_cast<int>(sep + 3 + colon + 1);
    if (port_text == "*")
    {
        return R::ok(std::move(spec));
    }

    const size_t dash = port_text.find('-');
    if (dash == std::string_view::npos)
    {
        int port = 0;
        if (!parse_port(port_text, port))
        {
            return R::error(EndpointError::InvalidPort, port_offset);
        }
        spec.port_lo = port;
        spec.port_hi = port;
        return R::ok(std::move(spec));
    }

    int lo = 0;
    int hi = 0;
    if (!parse_port(port_text.substr(0, dash), lo) || !parse_port(port_text.substr(dash + 1), hi) ||
        lo == 0 || lo > hi)
    {
        return R::error(EndpointError::InvalidRange, port_offset);
    }
    spec.port_lo = lo;
    spec.port_hi = hi;
    return R::ok(std::move(spec));
}

std::string make_tcp_url(std::string_view host, int port)
{
    return fmt::format("tcp://{}:{}", host, port);
}

std::string advertised_endpoint(std::string_view bound)
{
    constexpr std::string_view kWildcards[] = {"tcp://0.0.0.0:", "tcp://*:"};
    for (const auto prefix : kWildcards)
    {
        if (bound.substr(0, prefix.size()) == prefix)
        {
            return fmt::format("tcp://{}:{}", platform::get_hostname(),
                               bound.substr(prefix.size()));
        }
    }
    return std::string(bound);
}

std::string bind_endpoint(zmq::socket_t &socket, std::string_view url)
{
    auto parsed = parse_endpoint(url);
    if (parsed.is_error())
    {
        throw std::invalid_argument(fmt::format("invalid endpoint '{}': {}", url,
                                                to_string(parsed.error())));
    }
    EndpointSpec spec = std::move(parsed).content();

    // libzmq binds only numeric addresses; a host name listens on every interface
    // and is still the name handed to peers.
    std::string named_host;
    if (spec.is_tcp() && !is_bindable_host(spec.host))
    {
        named_host = std::move(spec.host);
        spec.host = "*";
    }
    auto bound_endpoint = [&]()
    {
        const std::string last = socket.get(zmq::sockopt::last_endpoint);
        if (named_host.empty())
        {
            return advertised_endpoint(last);
        }
        return make_tcp_url(named_host, port_of(last));
    };

    if (!spec.is_tcp() || spec.port_lo == spec.port_hi)
    {
        socket.bind(spec.is_tcp() ? tcp_with_port(spec, spec.port_lo) : spec.raw);
        return bound_endpoint();
    }

    std::vector<int> ports(static_cast<size_t>(spec.port_hi - spec.port_lo + 1));
    std::iota(ports.begin(), ports.end(), spec.port_lo);
    std::mt19937 rng{std::random_device{}()};
    std::shuffle(ports.begin(), ports.end(), rng);

    for (const int port : ports)
    {
        try
        {
            socket.bind(make_tcp_url(spec.host, port));
            return bound_endpoint();
        }
        catch (const zmq::error_t &e)
        {
            if (e.num() != EADDRINUSE)
            {
                throw;
            }
            LOGGER_DEBUG("Endpoint: port {} in use, trying next.", port);
        }
    }
    throw std::runtime_error(
        fmt::format("no free port in range {}-{} for '{}'", spec.port_lo, spec.port_hi, url));
}

} // namespace zworkers::pool
