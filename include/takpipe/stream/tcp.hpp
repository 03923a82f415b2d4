#pragma once

#include <takpipe/stream.hpp>

#include <arpa/inet.h>
#include <netdb.h>
#include <sys/socket.h>
#include <sys/types.h>
#include <unistd.h>

#include <atomic>
#include <mutex>

namespace takpipe {

    // Plain TCP connection; one object serves as both the reader's source and the writer's sink
    // Reads and writes may run on different threads
    class TcpConnection : public StreamSink, public ByteSource {
      private:
        dp::i32 fd_;
        std::atomic<bool> connected_;
        TcpEndpoint remote_endpoint_;
        std::mutex write_mutex_;
        Message pending_;

      public:
        TcpConnection() : fd_(-1), connected_(false) { echo::trace("TcpConnection constructed"); }

        // Adopt an already connected socket (accepted connections)
        TcpConnection(dp::i32 fd, const TcpEndpoint &remote) : fd_(fd), connected_(true), remote_endpoint_(remote) {
            echo::debug("TcpConnection created from accepted connection fd=", fd);
        }

        ~TcpConnection() override {
            if (fd_ >= 0) {
                ::close(fd_);
                fd_ = -1;
            }
        }

        TcpConnection(const TcpConnection &) = delete;
        TcpConnection &operator=(const TcpConnection &) = delete;

        // Client side: connect to remote endpoint, trying every resolved address
        dp::Res<void> connect(const TcpEndpoint &endpoint) {
            echo::trace("connecting to ", endpoint.to_string());

            struct addrinfo hints = {};
            hints.ai_family = AF_UNSPEC;
            hints.ai_socktype = SOCK_STREAM;

            struct addrinfo *result = nullptr;
            dp::String port_str(std::to_string(endpoint.port).c_str());
            dp::i32 ret = ::getaddrinfo(endpoint.host.c_str(), port_str.c_str(), &hints, &result);
            if (ret != 0) {
                echo::error("getaddrinfo failed for ", endpoint.host.c_str(), ": ", gai_strerror(ret));
                return dp::result::err(dp::Error::io_error(dp::String("getaddrinfo failed: ") + gai_strerror(ret)));
            }

            dp::i32 last_errno = 0;
            for (struct addrinfo *ai = result; ai != nullptr; ai = ai->ai_next) {
                dp::i32 fd = ::socket(ai->ai_family, ai->ai_socktype | SOCK_CLOEXEC, ai->ai_protocol);
                if (fd < 0) {
                    last_errno = errno;
                    continue;
                }
                echo::trace("socket created fd=", fd);

                if (::connect(fd, ai->ai_addr, ai->ai_addrlen) == 0) {
                    fd_ = fd;
                    break;
                }
                last_errno = errno;
                echo::trace("connect attempt failed: ", strerror(last_errno));
                ::close(fd);
            }
            ::freeaddrinfo(result);

            if (fd_ < 0) {
                echo::error("connect to ", endpoint.to_string(), " failed: ", strerror(last_errno));
                return dp::result::err(
                    dp::Error::io_error(dp::String("connect failed: ") + endpoint.to_string() + ": " + strerror(last_errno)));
            }

            connected_ = true;
            remote_endpoint_ = endpoint;
            echo::info("TcpConnection connected to ", endpoint.to_string());

            return dp::result::ok();
        }

        dp::Res<void> write(const Message &msg) override {
            std::lock_guard<std::mutex> lock(write_mutex_);
            if (!connected_) {
                return dp::result::err(dp::Error::not_found("not connected"));
            }
            pending_.insert(pending_.end(), msg.begin(), msg.end());
            return dp::result::ok();
        }

        dp::Res<void> drain() override {
            std::lock_guard<std::mutex> lock(write_mutex_);
            if (pending_.empty()) {
                return dp::result::ok();
            }
            if (!connected_) {
                return dp::result::err(dp::Error::not_found("not connected"));
            }

            auto res = write_exact(fd_, pending_.data(), pending_.size(), true);
            if (res.is_err()) {
                connected_ = false;
                echo::error("tcp send to ", remote_endpoint_.to_string(), " failed: ", res.error().message.c_str());
                return res;
            }
            echo::debug("sent ", pending_.size(), " bytes to ", remote_endpoint_.to_string());
            pending_.clear();
            return dp::result::ok();
        }

        dp::Res<dp::usize> read_some(dp::u8 *buffer, dp::usize count) override {
            if (fd_ < 0) {
                return dp::result::err(dp::Error::not_found("not connected"));
            }
            return takpipe::read_some(fd_, buffer, count);
        }

        // Shut the socket down so that blocked readers and writers return
        // The descriptor itself is released on destruction
        void close() override {
            if (fd_ >= 0 && connected_.exchange(false)) {
                echo::trace("shutting down fd=", fd_);
                ::shutdown(fd_, SHUT_RDWR);
                echo::debug("TcpConnection closed");
            }
        }

        bool is_connected() const { return connected_; }

        dp::i32 fd() const { return fd_; }

        const TcpEndpoint &remote_endpoint() const { return remote_endpoint_; }
    };

    // Listening socket, used to accept TcpConnections (test servers, local relays)
    class TcpListener {
      private:
        dp::i32 fd_;
        TcpEndpoint local_endpoint_;

      public:
        TcpListener() : fd_(-1) {}

        ~TcpListener() { close(); }

        TcpListener(const TcpListener &) = delete;
        TcpListener &operator=(const TcpListener &) = delete;

        // Bind and listen; port 0 picks an ephemeral port (see port())
        dp::Res<void> listen(const TcpEndpoint &endpoint) {
            echo::trace("listening on ", endpoint.to_string());

            fd_ = ::socket(AF_INET, SOCK_STREAM | SOCK_CLOEXEC, 0);
            if (fd_ < 0) {
                echo::error("socket creation failed: ", strerror(errno));
                return dp::result::err(dp::Error::io_error("io error"));
            }

            // Set SO_REUSEADDR to avoid "address already in use" errors
            dp::i32 opt = 1;
            if (::setsockopt(fd_, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt)) < 0) {
                echo::warn("setsockopt SO_REUSEADDR failed: ", strerror(errno));
            }

            struct sockaddr_in addr = {};
            addr.sin_family = AF_INET;
            addr.sin_port = htons(endpoint.port);

            if (endpoint.host == "0.0.0.0" || endpoint.host.empty()) {
                addr.sin_addr.s_addr = INADDR_ANY;
            } else if (::inet_pton(AF_INET, endpoint.host.c_str(), &addr.sin_addr) <= 0) {
                close();
                echo::error("invalid address: ", endpoint.host.c_str());
                return dp::result::err(dp::Error::invalid_argument("invalid argument"));
            }

            if (::bind(fd_, (struct sockaddr *)&addr, sizeof(addr)) < 0 || ::listen(fd_, SOMAXCONN) < 0) {
                echo::error("bind/listen failed: ", strerror(errno));
                close();
                return dp::result::err(dp::Error::io_error("io error"));
            }

            socklen_t len = sizeof(addr);
            ::getsockname(fd_, (struct sockaddr *)&addr, &len);
            local_endpoint_ = TcpEndpoint{endpoint.host, ntohs(addr.sin_port)};
            echo::info("TcpListener listening on ", local_endpoint_.to_string());
            return dp::result::ok();
        }

        // Blocks until a client connects
        dp::Res<std::shared_ptr<TcpConnection>> accept() {
            if (fd_ < 0) {
                echo::error("accept called but not listening");
                return dp::result::err(dp::Error::invalid_argument("not listening"));
            }

            struct sockaddr_in client_addr = {};
            socklen_t client_len = sizeof(client_addr);
            dp::i32 client_fd = ::accept4(fd_, (struct sockaddr *)&client_addr, &client_len, SOCK_CLOEXEC);
            if (client_fd < 0) {
                echo::error("accept failed: ", strerror(errno));
                return dp::result::err(dp::Error::io_error("io error"));
            }

            char client_ip[INET_ADDRSTRLEN];
            ::inet_ntop(AF_INET, &client_addr.sin_addr, client_ip, sizeof(client_ip));
            TcpEndpoint client_endpoint{dp::String(client_ip), ntohs(client_addr.sin_port)};
            echo::info("TcpListener accepted connection from ", client_endpoint.to_string());

            return dp::result::ok(std::make_shared<TcpConnection>(client_fd, client_endpoint));
        }

        dp::u16 port() const { return local_endpoint_.port; }

        void close() {
            if (fd_ >= 0) {
                ::close(fd_);
                fd_ = -1;
            }
        }
    };

} // namespace takpipe
