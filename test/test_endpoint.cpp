#include <doctest/doctest.h>
#include <takpipe/endpoint.hpp>

namespace {
    const auto INVALID = dp::Error::invalid_argument("").code;
}

TEST_CASE("TcpEndpoint") {
    takpipe::TcpEndpoint endpoint{"127.0.0.1", 8087};
    CHECK(endpoint.to_string() == "127.0.0.1:8087");
}

TEST_CASE("SocketAddress") {
    SUBCASE("From UDP endpoint") {
        takpipe::SocketAddress addr = takpipe::UdpEndpoint{"127.0.0.1", 6969};
        CHECK_FALSE(addr.is_local());
        CHECK(addr.to_string() == "127.0.0.1:6969");
    }

    SUBCASE("From IPC endpoint") {
        takpipe::SocketAddress addr = takpipe::IpcEndpoint{"/tmp/takpipe.sock"};
        CHECK(addr.is_local());
        CHECK(addr.to_string() == "/tmp/takpipe.sock");
    }

    SUBCASE("From kernel address") {
        sockaddr_storage storage = {};
        auto *in = reinterpret_cast<sockaddr_in *>(&storage);
        in->sin_family = AF_INET;
        in->sin_port = htons(4242);
        ::inet_pton(AF_INET, "192.0.2.7", &in->sin_addr);

        auto addr = takpipe::SocketAddress::from_sockaddr(storage, sizeof(sockaddr_in));
        CHECK(addr.host == "192.0.2.7");
        CHECK(addr.port == 4242);
        CHECK(addr == takpipe::SocketAddress(takpipe::UdpEndpoint{"192.0.2.7", 4242}));
    }
}

TEST_CASE("is_multicast_host") {
    CHECK(takpipe::is_multicast_host("239.2.3.1"));
    CHECK(takpipe::is_multicast_host("224.0.0.1"));
    CHECK(takpipe::is_multicast_host("ff02::1"));
    CHECK(takpipe::is_multicast_host("[ff02::1]"));
    CHECK_FALSE(takpipe::is_multicast_host("192.0.2.1"));
    CHECK_FALSE(takpipe::is_multicast_host("::1"));
    CHECK_FALSE(takpipe::is_multicast_host("takserver.example.com"));
    CHECK_FALSE(takpipe::is_multicast_host(""));
}

TEST_CASE("parse_url") {
    SUBCASE("Explicit port") {
        auto res = takpipe::parse_url("tcp://takserver.example.com:8089");
        REQUIRE(res.is_ok());
        CHECK(res.value().scheme == "tcp");
        CHECK(res.value().host == "takserver.example.com");
        CHECK(res.value().port == 8089);
    }

    SUBCASE("Stream family default port") {
        auto res = takpipe::parse_url("tls://takserver.example.com");
        REQUIRE(res.is_ok());
        CHECK(res.value().port == 8087);
    }

    SUBCASE("Broadcast family default port") {
        auto broadcast = takpipe::parse_url("udp+broadcast://192.0.2.255");
        REQUIRE(broadcast.is_ok());
        CHECK(broadcast.value().port == 6969);

        auto multicast = takpipe::parse_url("udp+multicast://239.2.3.1");
        REQUIRE(multicast.is_ok());
        CHECK(multicast.value().port == 6969);
    }

    SUBCASE("Scheme is lower-cased") {
        auto res = takpipe::parse_url("UDP+WO://239.2.3.1:6969");
        REQUIRE(res.is_ok());
        CHECK(res.value().scheme == "udp+wo");
    }

    SUBCASE("Bracketed IPv6") {
        auto res = takpipe::parse_url("udp://[ff02::1]:4242");
        REQUIRE(res.is_ok());
        CHECK(res.value().host == "ff02::1");
        CHECK(res.value().port == 4242);
    }

    SUBCASE("Path is kept") {
        auto res = takpipe::parse_url("file://out/events.xml");
        REQUIRE(res.is_ok());
        CHECK(res.value().host == "out");
        CHECK(res.value().path == "/events.xml");
    }

    SUBCASE("Missing scheme separator") {
        auto res = takpipe::parse_url("takserver.example.com:8087");
        REQUIRE(res.is_err());
        CHECK(res.error().code == INVALID);
    }

    SUBCASE("Empty scheme") {
        auto res = takpipe::parse_url("://takserver.example.com");
        CHECK(res.is_err());
    }

    SUBCASE("Bad port") {
        CHECK(takpipe::parse_url("tcp://host:http").is_err());
        CHECK(takpipe::parse_url("tcp://host:70000").is_err());
    }
}

TEST_CASE("split_host") {
    SUBCASE("With port") {
        auto res = takpipe::split_host("takserver:8443");
        REQUIRE(res.is_ok());
        CHECK(res.value().host == "takserver");
        CHECK(res.value().port == 8443);
    }

    SUBCASE("Default port") {
        auto res = takpipe::split_host("takserver");
        REQUIRE(res.is_ok());
        CHECK(res.value().port == 8087);
    }

    SUBCASE("Bare IPv6 keeps default port") {
        auto res = takpipe::split_host("ff02::1", 6969);
        REQUIRE(res.is_ok());
        CHECK(res.value().host == "ff02::1");
        CHECK(res.value().port == 6969);
    }
}
