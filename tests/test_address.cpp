#include "address.hpp"
#include <gtest/gtest.h>
#include <cstdlib>

using namespace svidsource;

TEST(endpoint_address, parse_unix) {
    auto ep = parse_endpoint_address("unix:///tmp/spire-agent/public/api.sock");
    ASSERT_TRUE(ep.ok()) << ep.err().message;

    auto* local = std::get_if<asio::local::stream_protocol::endpoint>(&ep.value());
    ASSERT_NE(local, nullptr);
    EXPECT_EQ(local->path(), "/tmp/spire-agent/public/api.sock");
    EXPECT_EQ(to_string(ep.value()), "unix:///tmp/spire-agent/public/api.sock");
}

TEST(endpoint_address, parse_tcp_v4) {
    auto ep = parse_endpoint_address("tcp://127.0.0.1:8000");
    ASSERT_TRUE(ep.ok()) << ep.err().message;

    auto* tcp = std::get_if<asio::ip::tcp::endpoint>(&ep.value());
    ASSERT_NE(tcp, nullptr);
    EXPECT_EQ(tcp->address().to_string(), "127.0.0.1");
    EXPECT_EQ(tcp->port(), 8000);
}

TEST(endpoint_address, parse_tcp_v6) {
    auto ep = parse_endpoint_address("tcp://[::1]:8000");
    ASSERT_TRUE(ep.ok()) << ep.err().message;
    EXPECT_EQ(to_string(ep.value()), "tcp://[::1]:8000");
}

TEST(endpoint_address, rejects_malformed) {
    const char* bad[] = {
        "",
        "/tmp/agent.sock",
        "://missing-scheme",
        "http://127.0.0.1:8000",
        "unix:opaque/path",
        "unix://",
        "unix://host/tmp/agent.sock",
        "unix:///tmp/agent.sock?x=1",
        "unix:///tmp/agent.sock#frag",
        "tcp:127.0.0.1:8000",
        "tcp://localhost:8000",
        "tcp://127.0.0.1",
        "tcp://127.0.0.1:",
        "tcp://127.0.0.1:port",
        "tcp://127.0.0.1:70000",
        "tcp://127.0.0.1:8000/path",
        "tcp://127.0.0.1:8000?x=1",
        "tcp://127.0.0.1:8000#frag",
        "tcp://user@127.0.0.1:8000",
    };

    for (const char* address : bad) {
        auto ep = parse_endpoint_address(address);
        EXPECT_TRUE(ep.failed()) << address;
        if (ep.failed()) EXPECT_EQ(ep.code(), errc::configuration) << address;
    }
}

TEST(endpoint_address, resolve_prefers_explicit_address) {
    ::setenv(k_endpoint_socket_env, "tcp://127.0.0.1:9000", 1);

    auto ep = resolve_endpoint(std::string("unix:///run/agent.sock"));
    ASSERT_TRUE(ep.ok());
    EXPECT_EQ(to_string(ep.value()), "unix:///run/agent.sock");

    auto from_env = resolve_endpoint(std::nullopt);
    ASSERT_TRUE(from_env.ok());
    EXPECT_EQ(to_string(from_env.value()), "tcp://127.0.0.1:9000");

    ::unsetenv(k_endpoint_socket_env);
}

TEST(endpoint_address, resolve_without_address_fails) {
    ::unsetenv(k_endpoint_socket_env);
    EXPECT_FALSE(default_endpoint_address().has_value());

    auto ep = resolve_endpoint(std::nullopt);
    ASSERT_TRUE(ep.failed());
    EXPECT_EQ(ep.code(), errc::configuration);
}
