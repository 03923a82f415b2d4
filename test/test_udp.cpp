#include <doctest/doctest.h>
#include <takpipe/datagram/udp.hpp>

#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>

#include <atomic>
#include <thread>

namespace {
    const auto NOT_FOUND = dp::Error::not_found("").code;
    const auto INVALID = dp::Error::invalid_argument("").code;
} // namespace

TEST_CASE("Datagram streams") {
    auto server_res = takpipe::datagram::bind(takpipe::UdpEndpoint{"127.0.0.1", 0});
    REQUIRE(server_res.is_ok());
    auto server = server_res.value();
    CHECK_FALSE(server->is_client());
    REQUIRE(server->sockname().port != 0);

    auto client_res = takpipe::datagram::connect(takpipe::UdpEndpoint{"127.0.0.1", server->sockname().port});
    REQUIRE(client_res.is_ok());
    auto client = client_res.value();
    CHECK(client->is_client());
    CHECK(client->peername().port == server->sockname().port);

    SUBCASE("Client to server carries the sender address") {
        REQUIRE(client->send(takpipe::to_message("<event uid=\"1\"/>")).is_ok());

        auto recv_res = server->recv();
        REQUIRE(recv_res.is_ok());
        auto [msg, src] = std::move(recv_res.value());
        CHECK(takpipe::to_string(msg) == "<event uid=\"1\"/>");
        CHECK(src.host == "127.0.0.1");
        CHECK(src.port == client->sockname().port);

        SUBCASE("Server replies to the sender") {
            REQUIRE(server->send(takpipe::to_message("<event uid=\"2\"/>"), src).is_ok());
            auto reply = client->recv();
            REQUIRE(reply.is_ok());
            auto [reply_msg, reply_src] = std::move(reply.value());
            CHECK(takpipe::to_string(reply_msg) == "<event uid=\"2\"/>");
            CHECK(reply_src.port == server->sockname().port);
        }
    }

    SUBCASE("Close is idempotent") {
        client->close();
        client->close();
        CHECK(client->is_closing());

        auto res = client->send(takpipe::to_message("<event/>"));
        REQUIRE(res.is_err());
        CHECK(res.error().code == NOT_FOUND);
        CHECK(res.error().message == takpipe::TRANSPORT_CLOSED);
    }

    SUBCASE("Close wakes a blocked recv") {
        std::thread closer([&server] {
            std::this_thread::sleep_for(std::chrono::milliseconds(20));
            server->close();
        });
        auto res = server->recv();
        closer.join();
        REQUIRE(res.is_err());
        CHECK(res.error().message == takpipe::TRANSPORT_CLOSED);

        // Stays closed
        CHECK(server->recv().is_err());
    }

    SUBCASE("Errors surface on a later call") {
        // Nothing listens here once this socket is gone
        auto gone = takpipe::datagram::bind(takpipe::UdpEndpoint{"127.0.0.1", 0});
        REQUIRE(gone.is_ok());
        dp::u16 dead_port = gone.value()->sockname().port;
        gone.value()->close();
        gone.value().reset();

        auto lonely = takpipe::datagram::connect(takpipe::UdpEndpoint{"127.0.0.1", dead_port});
        REQUIRE(lonely.is_ok());
        REQUIRE(lonely.value()->send(takpipe::to_message("<event/>")).is_ok());

        // ICMP port unreachable arrives asynchronously
        bool raised = false;
        for (int i = 0; i < 50 && !raised; ++i) {
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
            raised = lonely.value()->exception().is_err();
        }
        CHECK(raised);
    }
}

TEST_CASE("DatagramProtocol callbacks") {
    auto recvq = std::make_shared<takpipe::Channel<takpipe::Datagram>>();
    auto excq = std::make_shared<takpipe::Channel<takpipe::TransportFault>>();
    auto drained = std::make_shared<takpipe::Event>();
    auto protocol = std::make_shared<takpipe::DatagramProtocol>(recvq, excq, drained);

    // Writers may proceed until the transport says otherwise
    CHECK(drained->is_set());
    CHECK_FALSE(protocol->has_transport());

    SUBCASE("Pause and resume writing") {
        protocol->pause_writing();
        CHECK_FALSE(drained->is_set());
        CHECK_FALSE(drained->wait_for(10));

        protocol->resume_writing();
        CHECK(drained->is_set());
    }

    SUBCASE("Connection lost with an error") {
        takpipe::DatagramTransport transport(::socket(AF_INET, SOCK_DGRAM, 0), protocol);
        protocol->connection_made(&transport);
        CHECK(protocol->transport() == &transport);

        protocol->pause_writing();
        protocol->connection_lost(dp::result::err(dp::Error::io_error("network down")));

        CHECK(drained->is_set());
        CHECK_FALSE(protocol->has_transport());
        REQUIRE(excq->size() == 1);
        CHECK(excq->try_pop().value().error.message == "network down");
        REQUIRE(recvq->size() == 1);
        CHECK(recvq->try_pop().value().eof);
    }

    SUBCASE("Clean connection loss leaves no fault") {
        protocol->connection_lost(dp::result::ok());
        CHECK(excq->empty());
        CHECK(recvq->size() == 1);
    }

    SUBCASE("A second transport replaces the first") {
        takpipe::DatagramTransport first(::socket(AF_INET, SOCK_DGRAM, 0), protocol);
        takpipe::DatagramTransport second(::socket(AF_INET, SOCK_DGRAM, 0), protocol);
        protocol->connection_made(&first);
        protocol->connection_made(&second);
        CHECK(protocol->transport() == &second);
    }

    SUBCASE("Bounded receive queue keeps the newest datagrams") {
        auto bounded = std::make_shared<takpipe::Channel<takpipe::Datagram>>(2);
        takpipe::DatagramProtocol small(bounded, excq, drained);
        small.datagram_received(takpipe::to_message("1"), takpipe::SocketAddress());
        small.datagram_received(takpipe::to_message("2"), takpipe::SocketAddress());
        small.datagram_received(takpipe::to_message("3"), takpipe::SocketAddress());
        CHECK(bounded->size() == 2);

        // The close marker always gets in
        small.connection_lost(dp::result::ok());
        REQUIRE(bounded->size() == 2);
        CHECK(takpipe::to_string(bounded->try_pop().value().data) == "3");
        CHECK(bounded->try_pop().value().eof);
    }
}

TEST_CASE("Datagram write flow control") {
    // The peer end of a local datagram pair only drains when the test reads it
    int sv[2];
    REQUIRE(::socketpair(AF_UNIX, SOCK_DGRAM, 0, sv) == 0);
    timeval tv = {2, 0};
    ::setsockopt(sv[1], SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));

    auto stream = takpipe::datagram::from_socket(sv[0]);
    REQUIRE(stream.is_ok());
    REQUIRE(stream.value()->is_client());
    auto client = std::static_pointer_cast<takpipe::DatagramClient>(stream.value());

    // Far more than the socket buffer plus the transport's write backlog
    const int count = 200;
    const takpipe::Message chunk(8192);
    std::atomic<int> sent{0};
    dp::Res<void> last = dp::result::ok();

    std::thread writer([&]() {
        for (int i = 0; i < count; ++i) {
            auto res = client->send(chunk);
            if (res.is_err()) {
                last = res;
                return;
            }
            ++sent;
        }
    });

    SUBCASE("Writer blocks until the peer drains") {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
        CHECK(sent.load() < count);

        int received = 0;
        char buf[16384];
        while (received < count) {
            dp::isize n = ::recv(sv[1], buf, sizeof(buf), 0);
            if (n <= 0) {
                break;
            }
            CHECK(n == 8192);
            ++received;
        }
        writer.join();

        CHECK(received == count);
        CHECK(sent.load() == count);
        CHECK(last.is_ok());
    }

    SUBCASE("Close releases a blocked writer") {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
        CHECK(sent.load() < count);

        client->close();
        writer.join();

        REQUIRE(last.is_err());
        CHECK(last.error().message == takpipe::TRANSPORT_CLOSED);
        CHECK(sent.load() < count);
    }

    ::close(sv[1]);
}

TEST_CASE("Datagram over a local-domain socket") {
    std::string path = "/tmp/takpipe_test_" + std::to_string(::getpid()) + ".sock";
    auto server = takpipe::datagram::bind(takpipe::IpcEndpoint{dp::String(path.c_str())});
    REQUIRE(server.is_ok());
    CHECK(server.value()->sockname().is_local());

    auto client = takpipe::datagram::connect(takpipe::IpcEndpoint{dp::String(path.c_str())});
    REQUIRE(client.is_ok());
    REQUIRE(client.value()->send(takpipe::to_message("<event/>")).is_ok());

    auto res = server.value()->recv();
    REQUIRE(res.is_ok());
    CHECK(takpipe::to_string(res.value().first) == "<event/>");

    ::unlink(path.c_str());
}

TEST_CASE("from_socket") {
    SUBCASE("Rejects a stream socket") {
        dp::i32 fd = ::socket(AF_INET, SOCK_STREAM, 0);
        REQUIRE(fd >= 0);
        auto res = takpipe::datagram::from_socket(fd);
        REQUIRE(res.is_err());
        CHECK(res.error().code == INVALID);
        // Caller still owns fd
        CHECK(::close(fd) == 0);
    }

    SUBCASE("Unconnected socket becomes a server") {
        dp::i32 fd = ::socket(AF_INET, SOCK_DGRAM, 0);
        REQUIRE(fd >= 0);
        auto res = takpipe::datagram::from_socket(fd);
        REQUIRE(res.is_ok());
        CHECK_FALSE(res.value()->is_client());
    }

    SUBCASE("Connected socket becomes a client") {
        auto peer = takpipe::datagram::bind(takpipe::UdpEndpoint{"127.0.0.1", 0});
        REQUIRE(peer.is_ok());

        dp::i32 fd = ::socket(AF_INET, SOCK_DGRAM, 0);
        REQUIRE(fd >= 0);
        sockaddr_in addr = {};
        addr.sin_family = AF_INET;
        addr.sin_port = htons(peer.value()->sockname().port);
        ::inet_pton(AF_INET, "127.0.0.1", &addr.sin_addr);
        REQUIRE(::connect(fd, reinterpret_cast<sockaddr *>(&addr), sizeof(addr)) == 0);

        auto res = takpipe::datagram::from_socket(fd);
        REQUIRE(res.is_ok());
        CHECK(res.value()->is_client());
        CHECK(res.value()->peername().port == peer.value()->sockname().port);
    }
}

TEST_CASE("UdpOptions") {
    auto opts_for = [](const char *raw) { return takpipe::UdpOptions::from_url(takpipe::parse_url(raw).value()); };

    auto plain = opts_for("udp://192.0.2.1:6969");
    CHECK_FALSE(plain.write_only);
    CHECK_FALSE(plain.broadcast);
    CHECK_FALSE(plain.multicast);

    auto wo = opts_for("udp+wo://239.2.3.1:6969");
    CHECK(wo.write_only);
    CHECK(wo.multicast);

    CHECK(opts_for("udp+broadcast://192.0.2.255").broadcast);
    CHECK(opts_for("udp+multicast://takserver.example.com").multicast);
    CHECK(dp::String(takpipe::DEFAULT_MULTICAST_LOCAL_ADDR) == plain.local_addr);
}

TEST_CASE("create_udp_client") {
    SUBCASE("Write-only destination has no reader") {
        auto url = takpipe::parse_url("udp+wo://127.0.0.1:16969").value();
        auto res = takpipe::create_udp_client(url, takpipe::UdpOptions::from_url(url));
        REQUIRE(res.is_ok());
        CHECK(res.value().writer != nullptr);
        CHECK(res.value().reader == nullptr);
        res.value().writer->close();
    }

    SUBCASE("Replies to the writer are bounded") {
        auto url = takpipe::parse_url("udp+wo://127.0.0.1:16973").value();
        auto res = takpipe::create_udp_client(url, takpipe::UdpOptions::from_url(url));
        REQUIRE(res.is_ok());
        auto writer = res.value().writer;

        // A connected writer only accepts datagrams from its destination
        auto peer = takpipe::datagram::bind(takpipe::UdpEndpoint{"127.0.0.1", 16973});
        REQUIRE(peer.is_ok());
        const int count = static_cast<int>(takpipe::WRITER_RECV_CAPACITY) * 3;
        for (int i = 0; i < count; ++i) {
            std::string text = "<event uid=\"" + std::to_string(i) + "\"/>";
            REQUIRE(peer.value()->send(takpipe::to_message(text.c_str()), writer->sockname()).is_ok());
        }

        for (int i = 0; i < 100 && writer->pending() < takpipe::WRITER_RECV_CAPACITY; ++i) {
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
        CHECK(writer->pending() == takpipe::WRITER_RECV_CAPACITY);

        // Only the newest ones are kept
        std::string newest;
        while (writer->pending() > 0) {
            auto got = writer->recv();
            REQUIRE(got.is_ok());
            newest = takpipe::to_string(got.value().first).c_str();
        }
        CHECK(newest == "<event uid=\"" + std::to_string(count - 1) + "\"/>");
        writer->close();
    }

    SUBCASE("Multicast reader joins the group") {
        auto url = takpipe::parse_url("udp://239.2.3.9:16977").value();
        auto opts = takpipe::UdpOptions::from_url(url);
        REQUIRE(opts.multicast);
        opts.local_addr = "127.0.0.1";

        auto res = takpipe::create_udp_client(url, opts);
        REQUIRE(res.is_ok());
        auto reader = res.value().reader;
        REQUIRE(reader != nullptr);
        CHECK(reader->sockname().host == "239.2.3.9");

        // Looped back through the interface the group was joined on
        REQUIRE(res.value().writer->send(takpipe::to_message("<event uid=\"group\"/>")).is_ok());
        for (int i = 0; i < 100 && reader->pending() == 0; ++i) {
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
        }
        REQUIRE(reader->pending() > 0);
        auto got = reader->recv();
        REQUIRE(got.is_ok());
        CHECK(takpipe::to_string(got.value().first) == "<event uid=\"group\"/>");

        reader->close();
        res.value().writer->close();
    }

    SUBCASE("Unicast destination reads on the same port") {
        auto url = takpipe::parse_url("udp://127.0.0.1:16970").value();
        auto res = takpipe::create_udp_client(url, takpipe::UdpOptions::from_url(url));
        REQUIRE(res.is_ok());
        REQUIRE(res.value().reader != nullptr);

        REQUIRE(res.value().writer->send(takpipe::to_message("<event/>")).is_ok());
        auto got = res.value().reader->recv();
        REQUIRE(got.is_ok());
        CHECK(takpipe::to_string(got.value().first) == "<event/>");

        res.value().reader->close();
        res.value().writer->close();
    }
}
