#include "address.hpp"
#include <asio/ip/address.hpp>
#include <charconv>
#include <cstdlib>
#include <exception>

namespace svidsource {

namespace {

struct uri_parts {
    std::string_view scheme;
    bool has_authority = false;
    std::string_view authority;
    std::string_view path;
    std::optional<std::string_view> query;
    std::optional<std::string_view> fragment;
    bool opaque = false;
};

bool is_scheme_char(char c, bool first) {
    bool alpha = (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z');
    if (first) return alpha;
    return alpha || (c >= '0' && c <= '9') || c == '+' || c == '-' || c == '.';
}

// Minimal RFC 3986 split; enough to validate Workload API addresses.
std::optional<uri_parts> split_uri(std::string_view s) {
    auto colon = s.find(':');
    if (colon == std::string_view::npos || colon == 0) return std::nullopt;

    uri_parts parts;
    parts.scheme = s.substr(0, colon);
    for (std::size_t i = 0; i < parts.scheme.size(); ++i) {
        if (!is_scheme_char(parts.scheme[i], i == 0)) return std::nullopt;
    }

    auto rest = s.substr(colon + 1);

    auto hash = rest.find('#');
    if (hash != std::string_view::npos) {
        parts.fragment = rest.substr(hash + 1);
        rest = rest.substr(0, hash);
    }
    auto question = rest.find('?');
    if (question != std::string_view::npos) {
        parts.query = rest.substr(question + 1);
        rest = rest.substr(0, question);
    }

    if (rest.substr(0, 2) == "//") {
        rest = rest.substr(2);
        auto slash = rest.find('/');
        parts.has_authority = true;
        parts.authority = rest.substr(0, slash);
        parts.path = slash == std::string_view::npos ? std::string_view{} : rest.substr(slash);
    } else if (!rest.empty() && rest.front() != '/') {
        parts.opaque = true;
    } else {
        parts.path = rest;
    }
    return parts;
}

error config_error(const std::string& what) {
    return make_error(errc::configuration, "workload endpoint socket URI " + what);
}

result<workload_endpoint> parse_unix(const uri_parts& parts) {
    if (parts.opaque)                  return config_error("must not be opaque");
    if (!parts.authority.empty())      return config_error("must not include an authority or user info");
    if (parts.path.empty())            return config_error("must include a path");
    if (parts.query)                   return config_error("must not include query values");
    if (parts.fragment)                return config_error("must not include a fragment");

    try {
        return workload_endpoint(asio::local::stream_protocol::endpoint(std::string(parts.path)));
    } catch (const std::exception& e) {
        return config_error(std::string("has an invalid socket path: ") + e.what());
    }
}

result<workload_endpoint> parse_tcp(const uri_parts& parts) {
    if (parts.opaque)                  return config_error("must not be opaque");
    if (parts.authority.find('@') != std::string_view::npos) {
        return config_error("must not include user info");
    }
    if (!parts.path.empty())           return config_error("must not include a path");
    if (parts.query)                   return config_error("must not include query values");
    if (parts.fragment)                return config_error("must not include a fragment");

    std::string_view host;
    std::string_view port;
    auto authority = parts.authority;
    if (!authority.empty() && authority.front() == '[') {
        // [v6]:port
        auto close = authority.find(']');
        if (close == std::string_view::npos) return config_error("host is not a valid IP address");
        host = authority.substr(1, close - 1);
        auto after = authority.substr(close + 1);
        if (!after.empty()) {
            if (after.front() != ':') return config_error("host is not a valid IP address");
            port = after.substr(1);
        }
    } else {
        auto colon = authority.rfind(':');
        host = authority.substr(0, colon);
        if (colon != std::string_view::npos) port = authority.substr(colon + 1);
    }

    asio::error_code ec;
    auto ip = asio::ip::make_address(std::string(host), ec);
    if (ec || host.empty()) return config_error("host is not an IP address");

    if (port.empty()) return config_error("must include a port");

    unsigned int port_num = 0;
    auto [ptr, perr] = std::from_chars(port.data(), port.data() + port.size(), port_num);
    if (perr != std::errc{} || ptr != port.data() + port.size() || port_num > 65535) {
        return config_error("port is not valid");
    }

    return workload_endpoint(asio::ip::tcp::endpoint(ip, static_cast<unsigned short>(port_num)));
}

} // anonymous namespace

std::optional<std::string> default_endpoint_address() {
    const char* value = std::getenv(k_endpoint_socket_env);
    if (value == nullptr || *value == '\0') return std::nullopt;
    return std::string(value);
}

result<workload_endpoint> parse_endpoint_address(std::string_view address) {
    auto parts = split_uri(address);
    if (!parts) {
        return make_error(errc::configuration,
            "workload endpoint socket is not a valid URI: " + std::string(address));
    }

    if (parts->scheme == "unix") return parse_unix(*parts);
    if (parts->scheme == "tcp")  return parse_tcp(*parts);

    return config_error("must have a \"tcp\" or \"unix\" scheme");
}

result<workload_endpoint> resolve_endpoint(const std::optional<std::string>& address) {
    if (address && !address->empty()) {
        return parse_endpoint_address(*address);
    }

    auto env = default_endpoint_address();
    if (!env) {
        return make_error(errc::configuration,
            std::string("workload endpoint socket address is not configured; set ")
            + k_endpoint_socket_env);
    }
    return parse_endpoint_address(*env);
}

std::string to_string(const workload_endpoint& endpoint) {
    if (auto* local = std::get_if<asio::local::stream_protocol::endpoint>(&endpoint)) {
        return "unix://" + local->path();
    }

    const auto& tcp = std::get<asio::ip::tcp::endpoint>(endpoint);
    auto addr = tcp.address();
    std::string host = addr.is_v6() ? "[" + addr.to_string() + "]" : addr.to_string();
    return "tcp://" + host + ":" + std::to_string(tcp.port());
}

} // namespace svidsource
