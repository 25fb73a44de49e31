#pragma once

#include "errors.hpp"
#include <asio/ip/tcp.hpp>
#include <asio/local/stream_protocol.hpp>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

namespace svidsource {

// Environment variable holding the default Workload API address.
inline constexpr const char* k_endpoint_socket_env = "SPIFFE_ENDPOINT_SOCKET";

// Parsed Workload API address: a unix domain socket or a TCP endpoint.
using workload_endpoint = std::variant<asio::local::stream_protocol::endpoint,
                                       asio::ip::tcp::endpoint>;

// Value of SPIFFE_ENDPOINT_SOCKET, or nullopt if unset or empty.
std::optional<std::string> default_endpoint_address();

// Parse "unix:///path/to/socket" or "tcp://<ip>:<port>".
// Fails with errc::configuration on any malformed address.
result<workload_endpoint> parse_endpoint_address(std::string_view address);

// Explicit address if given, otherwise the environment default.
result<workload_endpoint> resolve_endpoint(const std::optional<std::string>& address);

std::string to_string(const workload_endpoint& endpoint);

} // namespace svidsource
