#include <chrono>
#include <takpipe/takpipe.hpp>
#include <thread>

// Raw datagram streams without the worker pipeline
//   ./udp_datagram server
//   ./udp_datagram client

void server() {
    echo::info("Datagram server starting...");

    auto bind_res = takpipe::datagram::bind(takpipe::UdpEndpoint{"0.0.0.0", 7447});
    if (bind_res.is_err()) {
        echo::error("Bind failed: ", bind_res.error().message.c_str());
        return;
    }
    auto stream = bind_res.value();
    echo::info("Listening on ", stream->sockname().to_string());

    for (int i = 0; i < 5; i++) {
        auto recv_res = stream->recv();
        if (recv_res.is_err()) {
            echo::error("Recv failed: ", recv_res.error().message.c_str());
            break;
        }

        auto [msg, src] = std::move(recv_res.value());
        echo::info("Received from ", src.to_string(), ": ", takpipe::to_string(msg).c_str());

        // Echo back to the sender
        auto send_res = stream->send(msg, src);
        if (send_res.is_err()) {
            echo::error("Reply failed: ", send_res.error().message.c_str());
        }
    }

    stream->close();
    echo::info("Server done");
}

void client() {
    echo::info("Datagram client starting...");

    auto connect_res = takpipe::datagram::connect(takpipe::UdpEndpoint{"127.0.0.1", 7447});
    if (connect_res.is_err()) {
        echo::error("Connect failed: ", connect_res.error().message.c_str());
        return;
    }
    auto stream = connect_res.value();

    for (int i = 0; i < 5; i++) {
        dp::String text = dp::String("<event uid=\"client-") + dp::String(std::to_string(i).c_str()) + "\"/>";
        auto res = stream->send(takpipe::to_message(text));
        if (res.is_err()) {
            // Errors from an earlier send (e.g. nobody listening) show up here
            echo::error("Send failed: ", res.error().message.c_str());
            break;
        }

        auto reply = stream->recv();
        if (reply.is_err()) {
            echo::error("Recv failed: ", reply.error().message.c_str());
            break;
        }
        echo::info("Echo: ", takpipe::to_string(reply.value().first).c_str());
        std::this_thread::sleep_for(std::chrono::seconds(1));
    }

    stream->close();
    echo::info("Client done");
}

int main(int argc, char **argv) {
    if (argc < 2) {
        echo::info("Usage: ", argv[0], " [server|client]");
        return 1;
    }

    dp::String mode(argv[1]);
    if (mode == "server") {
        server();
    } else if (mode == "client") {
        client();
    } else {
        echo::error("Unknown mode: ", mode.c_str());
        return 1;
    }

    return 0;
}
