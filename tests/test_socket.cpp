#include <catch2/catch_test_macros.hpp>
#include "server/socket.hpp"

#include <chrono>
#include <string>

using namespace rsproxy;
using namespace std::chrono_literals;

namespace {

// Listen on host, connect through address_of(port), exchange one byte
void check_round_trip(const std::string& host, const std::string& connect_host) {
    auto listener = Socket::listen_tcp(host, 0);
    REQUIRE(listener.is_ok());
    const uint16_t port = listener.value().local_port();
    REQUIRE(port != 0);

    auto client = Socket::connect_tcp(connect_host + ":" + std::to_string(port), 1000ms);
    REQUIRE(client.is_ok());

    std::string remote;
    Socket accepted = listener.value().accept(remote);
    REQUIRE(accepted.is_open());
    CHECK_FALSE(remote.empty());

    const uint8_t out = 0x2A;
    REQUIRE(client.value().write_all(&out, 1).ok());
    uint8_t in = 0;
    REQUIRE(accepted.read_exact(&in, 1).ok());
    CHECK(in == out);
}

} // namespace

TEST_CASE("Socket: IPv4 listen and connect", "[socket]") {
    check_round_trip("127.0.0.1", "127.0.0.1");
}

TEST_CASE("Socket: listen on a host name", "[socket]") {
    check_round_trip("localhost", "localhost");
}

TEST_CASE("Socket: IPv6 literal listen and connect", "[socket]") {
    if (Socket::listen_tcp("::1", 0).is_error()) SKIP("IPv6 loopback not available");

    SECTION("plain literal") {
        check_round_trip("::1", "[::1]");
    }
    SECTION("bracketed literal") {
        check_round_trip("[::1]", "[::1]");
    }
}

TEST_CASE("Socket: unresolvable listen host is a configuration error", "[socket]") {
    auto listener = Socket::listen_tcp("not a host!", 0);
    REQUIRE(listener.is_error());
    CHECK(listener.error_category() == ErrorCategory::CONFIGURATION_ERROR);
}

TEST_CASE("Socket: pair is connected both ways", "[socket]") {
    auto [a, b] = Socket::pair();
    REQUIRE(a.is_open());
    REQUIRE(b.is_open());

    const uint8_t ping = 1;
    REQUIRE(a.write_all(&ping, 1).ok());
    uint8_t got = 0;
    REQUIRE(b.read_exact(&got, 1).ok());
    CHECK(got == ping);
}
