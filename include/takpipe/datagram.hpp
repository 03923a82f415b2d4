#pragma once

#include <takpipe/channel.hpp>
#include <takpipe/endpoint.hpp>

#include <fcntl.h>
#include <netdb.h>
#include <poll.h>
#include <sys/eventfd.h>
#include <sys/socket.h>
#include <sys/un.h>
#include <unistd.h>

#include <atomic>
#include <deque>
#include <memory>
#include <mutex>
#include <thread>

namespace takpipe {

    // Datagram streams
    //
    // UDP delivery is callback driven: the kernel reports readiness, datagrams and
    // (retrospective) errors whenever it likes. A DatagramTransport runs one I/O thread
    // that turns those events into DatagramProtocol callbacks; the protocol feeds a
    // receive queue, an error queue and a "drained" event. DatagramStream then offers
    // blocking send()/recv() on top of those three primitives.
    //
    // Errors are lazy: a failure caused by one send() (e.g. ICMP port unreachable)
    // surfaces on a later send() or recv() call, not the one that caused it.

    inline constexpr const char *TRANSPORT_CLOSED = "transport closed";

    // One received datagram; eof marks the sentinel pushed when the transport closes
    struct Datagram {
        Message data;
        SocketAddress addr;
        bool eof = false;
    };

    // Error noticed by the transport, waiting to be re-raised by the stream
    struct TransportFault {
        dp::Error error;
    };

    class DatagramTransport;

    // Callback adapter: the only writer into the stream's queues
    class DatagramProtocol {
      private:
        std::shared_ptr<Channel<Datagram>> recvq_;
        std::shared_ptr<Channel<TransportFault>> excq_;
        std::shared_ptr<Event> drained_;
        DatagramTransport *transport_;

      public:
        DatagramProtocol(std::shared_ptr<Channel<Datagram>> recvq, std::shared_ptr<Channel<TransportFault>> excq,
                         std::shared_ptr<Event> drained)
            : recvq_(std::move(recvq)), excq_(std::move(excq)), drained_(std::move(drained)), transport_(nullptr) {
            drained_->set();
        }

        inline void connection_made(DatagramTransport *transport);

        void datagram_received(Message data, SocketAddress addr) {
            echo::trace("datagram received: ", data.size(), " bytes from ", addr.to_string());
            if (recvq_->push_evicting(Datagram{std::move(data), std::move(addr), false})) {
                echo::trace("receive queue full, dropped oldest datagram");
            }
        }

        void error_received(dp::Error error) {
            echo::debug("datagram transport error: ", error.message.c_str());
            excq_->push_nowait(TransportFault{std::move(error)});
        }

        void connection_lost(const dp::Res<void> &reason) {
            if (reason.is_err()) {
                excq_->push_nowait(TransportFault{reason.error()});
            }
            recvq_->push_evicting(Datagram{Message(), SocketAddress(), true});
            // Release a writer waiting for the buffer to drain
            drained_->set();
            transport_ = nullptr;
            echo::trace("datagram connection lost");
        }

        void pause_writing() {
            echo::debug("datagram write buffer above high-water mark, pausing writers");
            drained_->clear();
        }

        void resume_writing() {
            echo::debug("datagram write buffer drained, resuming writers");
            drained_->set();
        }

        bool has_transport() const { return transport_ != nullptr; }

        DatagramTransport *transport() const { return transport_; }
    };

    namespace detail {

        // Resolve a SocketAddress into a kernel address for the given family
        inline dp::Res<void> resolve_address(const SocketAddress &addr, dp::i32 family, sockaddr_storage &out,
                                             socklen_t &out_len, bool passive = false) {
            out = {};
            if (addr.is_local()) {
                auto *un = reinterpret_cast<sockaddr_un *>(&out);
                if (addr.path.size() >= sizeof(un->sun_path)) {
                    echo::error("path too long: ", addr.path.c_str());
                    return dp::result::err(dp::Error::invalid_argument("path too long"));
                }
                un->sun_family = AF_UNIX;
                std::memcpy(un->sun_path, addr.path.c_str(), addr.path.size());
                out_len = static_cast<socklen_t>(offsetof(sockaddr_un, sun_path) + addr.path.size() + 1);
                return dp::result::ok();
            }

            struct addrinfo hints = {};
            hints.ai_family = family;
            hints.ai_socktype = SOCK_DGRAM;
            hints.ai_flags = passive ? AI_PASSIVE : 0;

            struct addrinfo *result = nullptr;
            dp::String port_str(std::to_string(addr.port).c_str());
            const char *host = addr.host.empty() ? nullptr : addr.host.c_str();
            dp::i32 ret = ::getaddrinfo(host, port_str.c_str(), &hints, &result);
            if (ret != 0 || result == nullptr) {
                echo::error("getaddrinfo failed for ", addr.to_string(), ": ", gai_strerror(ret));
                return dp::result::err(dp::Error::io_error(dp::String("cannot resolve ") + addr.to_string()));
            }
            std::memcpy(&out, result->ai_addr, result->ai_addrlen);
            out_len = result->ai_addrlen;
            ::freeaddrinfo(result);
            return dp::result::ok();
        }

        inline dp::i32 socket_family(dp::i32 fd) {
            dp::i32 family = 0;
            socklen_t len = sizeof(family);
            if (::getsockopt(fd, SOL_SOCKET, SO_DOMAIN, &family, &len) < 0) {
                return -1;
            }
            return family;
        }

    } // namespace detail

    // Owns one datagram socket and the I/O thread that drives its protocol callbacks
    class DatagramTransport {
      private:
        struct Pending {
            Message data;
            sockaddr_storage addr;
            socklen_t addr_len;
        };

        dp::i32 fd_;
        dp::i32 wake_fd_;
        dp::i32 family_;
        std::shared_ptr<DatagramProtocol> protocol_;
        std::thread io_thread_;
        std::mutex mutex_;
        std::deque<Pending> backlog_;
        dp::usize backlog_bytes_;
        bool paused_;
        std::atomic<bool> closing_;
        SocketAddress sockname_;
        SocketAddress peername_;
        bool has_peer_;

        static constexpr dp::usize HIGH_WATER = 64 * 1024;
        static constexpr dp::usize LOW_WATER = 16 * 1024;
        static constexpr dp::usize MAX_DATAGRAM = 65535;

        void wake() {
            dp::u64 one = 1;
            if (::write(wake_fd_, &one, sizeof(one)) < 0 && errno != EAGAIN) {
                echo::warn("eventfd write failed: ", strerror(errno));
            }
        }

        void read_ready(Message &buffer) {
            while (!closing_) {
                sockaddr_storage from = {};
                socklen_t from_len = sizeof(from);
                dp::isize n = ::recvfrom(fd_, buffer.data(), buffer.size(), MSG_DONTWAIT,
                                         reinterpret_cast<sockaddr *>(&from), &from_len);
                if (n >= 0) {
                    protocol_->datagram_received(Message(buffer.begin(), buffer.begin() + n),
                                                 SocketAddress::from_sockaddr(from, from_len));
                    continue;
                }
                if (errno == EINTR) {
                    continue;
                }
                if (errno == EAGAIN || errno == EWOULDBLOCK) {
                    return;
                }
                // Pending socket error (ICMP unreachable and friends); recvfrom consumed it
                protocol_->error_received(dp::Error::io_error(dp::String("recvfrom failed: ") + strerror(errno)));
            }
        }

        void write_ready() {
            std::lock_guard<std::mutex> lock(mutex_);
            while (!backlog_.empty()) {
                Pending &front = backlog_.front();
                const sockaddr *addr = front.addr_len > 0 ? reinterpret_cast<const sockaddr *>(&front.addr) : nullptr;
                dp::isize n = ::sendto(fd_, front.data.data(), front.data.size(), MSG_DONTWAIT | MSG_NOSIGNAL, addr,
                                       front.addr_len);
                if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK || errno == ENOBUFS)) {
                    break;
                }
                if (n < 0 && errno == EINTR) {
                    continue;
                }
                if (n < 0) {
                    protocol_->error_received(dp::Error::io_error(dp::String("sendto failed: ") + strerror(errno)));
                }
                backlog_bytes_ -= front.data.size();
                backlog_.pop_front();
            }
            if (paused_ && backlog_bytes_ <= LOW_WATER) {
                paused_ = false;
                protocol_->resume_writing();
            }
        }

        void io_loop() {
            echo::debug("datagram transport io thread started fd=", fd_);
            dp::Res<void> reason = dp::result::ok();
            Message buffer(MAX_DATAGRAM);

            while (!closing_) {
                struct pollfd fds[2] = {{fd_, POLLIN, 0}, {wake_fd_, POLLIN, 0}};
                {
                    std::lock_guard<std::mutex> lock(mutex_);
                    if (!backlog_.empty()) {
                        fds[0].events |= POLLOUT;
                    }
                }

                dp::i32 n = ::poll(fds, 2, -1);
                if (n < 0) {
                    if (errno == EINTR) {
                        continue;
                    }
                    echo::error("poll failed: ", strerror(errno));
                    reason = dp::result::err(dp::Error::io_error(dp::String("poll failed: ") + strerror(errno)));
                    break;
                }

                if (fds[1].revents & POLLIN) {
                    dp::u64 count = 0;
                    if (::read(wake_fd_, &count, sizeof(count)) < 0 && errno != EAGAIN) {
                        echo::warn("eventfd read failed: ", strerror(errno));
                    }
                }
                if (closing_) {
                    break;
                }
                if (fds[0].revents & POLLNVAL) {
                    reason = dp::result::err(dp::Error::io_error("socket descriptor became invalid"));
                    break;
                }
                if (fds[0].revents & (POLLIN | POLLERR)) {
                    read_ready(buffer);
                }
                if (fds[0].revents & POLLOUT) {
                    write_ready();
                }
            }

            {
                // Under mutex_ so no sendto() can queue and pause after connection_lost
                std::lock_guard<std::mutex> lock(mutex_);
                closing_ = true;
            }
            protocol_->connection_lost(reason);
            echo::debug("datagram transport io thread stopped fd=", fd_);
        }

      public:
        DatagramTransport(dp::i32 fd, std::shared_ptr<DatagramProtocol> protocol)
            : fd_(fd), wake_fd_(-1), family_(detail::socket_family(fd)), protocol_(std::move(protocol)),
              backlog_bytes_(0), paused_(false), closing_(false), has_peer_(false) {
            echo::trace("DatagramTransport constructed fd=", fd);
        }

        ~DatagramTransport() {
            close();
            if (io_thread_.joinable()) {
                io_thread_.join();
            }
            if (wake_fd_ >= 0) {
                ::close(wake_fd_);
            }
            if (fd_ >= 0) {
                echo::trace("closing fd=", fd_);
                ::close(fd_);
            }
        }

        DatagramTransport(const DatagramTransport &) = delete;
        DatagramTransport &operator=(const DatagramTransport &) = delete;

        // Put the socket in non-blocking mode, announce the connection and start the I/O thread
        dp::Res<void> start() {
            dp::i32 flags = ::fcntl(fd_, F_GETFL, 0);
            if (flags < 0 || ::fcntl(fd_, F_SETFL, flags | O_NONBLOCK) < 0) {
                echo::error("fcntl O_NONBLOCK failed: ", strerror(errno));
                return dp::result::err(dp::Error::io_error("cannot make socket non-blocking"));
            }

            wake_fd_ = ::eventfd(0, EFD_NONBLOCK | EFD_CLOEXEC);
            if (wake_fd_ < 0) {
                echo::error("eventfd failed: ", strerror(errno));
                return dp::result::err(dp::Error::io_error("eventfd failed"));
            }

            sockaddr_storage addr = {};
            socklen_t len = sizeof(addr);
            if (::getsockname(fd_, reinterpret_cast<sockaddr *>(&addr), &len) == 0) {
                sockname_ = SocketAddress::from_sockaddr(addr, len);
            }
            addr = {};
            len = sizeof(addr);
            if (::getpeername(fd_, reinterpret_cast<sockaddr *>(&addr), &len) == 0) {
                peername_ = SocketAddress::from_sockaddr(addr, len);
                has_peer_ = true;
            }

            protocol_->connection_made(this);
            io_thread_ = std::thread(&DatagramTransport::io_loop, this);
            return dp::result::ok();
        }

        // Queue one datagram for sending; dest == nullptr uses the connected peer
        // Send failures are reported through the protocol's error callback, not here
        dp::Res<void> sendto(const Message &data, const SocketAddress *dest) {
            Pending pending{data, {}, 0};
            if (dest != nullptr) {
                auto res = detail::resolve_address(*dest, family_, pending.addr, pending.addr_len);
                if (res.is_err()) {
                    return res;
                }
            }

            std::lock_guard<std::mutex> lock(mutex_);
            if (closing_) {
                return dp::result::err(dp::Error::not_found(TRANSPORT_CLOSED));
            }

            if (backlog_.empty()) {
                const sockaddr *addr =
                    pending.addr_len > 0 ? reinterpret_cast<const sockaddr *>(&pending.addr) : nullptr;
                dp::isize n = ::sendto(fd_, data.data(), data.size(), MSG_DONTWAIT | MSG_NOSIGNAL, addr,
                                       pending.addr_len);
                if (n >= 0) {
                    echo::trace("sendto wrote ", n, " bytes");
                    return dp::result::ok();
                }
                if (errno != EAGAIN && errno != EWOULDBLOCK && errno != ENOBUFS && errno != EINTR) {
                    protocol_->error_received(dp::Error::io_error(dp::String("sendto failed: ") + strerror(errno)));
                    return dp::result::ok();
                }
            }

            backlog_bytes_ += data.size();
            backlog_.push_back(std::move(pending));
            if (!paused_ && backlog_bytes_ > HIGH_WATER) {
                paused_ = true;
                protocol_->pause_writing();
            }
            wake();
            return dp::result::ok();
        }

        bool is_closing() const { return closing_; }

        // Idempotent; the I/O thread reports connection_lost and exits
        void close() {
            std::lock_guard<std::mutex> lock(mutex_);
            if (closing_.exchange(true)) {
                return;
            }
            echo::trace("closing datagram transport fd=", fd_);
            if (wake_fd_ >= 0) {
                wake();
            }
        }

        dp::i32 fd() const { return fd_; }

        dp::i32 family() const { return family_; }

        const SocketAddress &sockname() const { return sockname_; }

        const SocketAddress &peername() const { return peername_; }

        bool has_peer() const { return has_peer_; }

        // Give the socket back to the caller; only valid before start() succeeded
        dp::i32 release() {
            dp::i32 fd = fd_;
            fd_ = -1;
            return fd;
        }
    };

    inline void DatagramProtocol::connection_made(DatagramTransport *transport) {
        if (transport_ != nullptr) {
            echo::warn("reinitializing datagram transport from ", transport_->peername().to_string(), " to ",
                       transport->peername().to_string());
        }
        transport_ = transport;
    }

    // Receive half of a datagram transport, as seen by an RX worker
    class DatagramSource {
      public:
        virtual ~DatagramSource() = default;

        virtual dp::Res<dp::Pair<Message, SocketAddress>> recv() = 0;

        virtual void close() = 0;
    };

    // Send half of a connected datagram transport, as seen by a TX worker
    class DatagramSink {
      public:
        virtual ~DatagramSink() = default;

        virtual dp::Res<void> send(const Message &data) = 0;

        virtual void close() = 0;
    };

    // Blocking send/receive over one datagram transport
    class DatagramStream : public DatagramSource {
      protected:
        std::shared_ptr<DatagramTransport> transport_;
        std::shared_ptr<Channel<Datagram>> recvq_;
        std::shared_ptr<Channel<TransportFault>> excq_;
        std::shared_ptr<Event> drained_;

        dp::Res<void> send_to(const Message &data, const SocketAddress *addr) {
            if (transport_->is_closing()) {
                return dp::result::err(dp::Error::not_found(TRANSPORT_CLOSED));
            }
            auto exc = exception();
            if (exc.is_err()) {
                return exc;
            }
            auto res = transport_->sendto(data, addr);
            if (res.is_err()) {
                return res;
            }
            drained_->wait();
            return dp::result::ok();
        }

      public:
        DatagramStream(std::shared_ptr<DatagramTransport> transport, std::shared_ptr<Channel<Datagram>> recvq,
                       std::shared_ptr<Channel<TransportFault>> excq, std::shared_ptr<Event> drained)
            : transport_(std::move(transport)), recvq_(std::move(recvq)), excq_(std::move(excq)),
              drained_(std::move(drained)) {}

        ~DatagramStream() override { transport_->close(); }

        DatagramStream(const DatagramStream &) = delete;
        DatagramStream &operator=(const DatagramStream &) = delete;

        // First unconsumed transport error, if any
        dp::Res<void> exception() {
            auto fault = excq_->try_pop();
            if (fault.is_ok()) {
                return dp::result::err(fault.value().error);
            }
            return dp::result::ok();
        }

        // Block until a datagram arrives
        // Fails with "transport closed" once the transport shuts down
        dp::Res<dp::Pair<Message, SocketAddress>> recv() override {
            if (transport_->is_closing()) {
                return dp::result::err(dp::Error::not_found(TRANSPORT_CLOSED));
            }
            auto exc = exception();
            if (exc.is_err()) {
                return dp::result::err(exc.error());
            }

            auto item = recvq_->pop();
            if (item.is_err() || item.value().eof) {
                return dp::result::err(dp::Error::not_found(TRANSPORT_CLOSED));
            }
            Datagram datagram = std::move(item.value());
            return dp::result::ok(dp::Pair<Message, SocketAddress>(std::move(datagram.data), std::move(datagram.addr)));
        }

        void close() override { transport_->close(); }

        bool is_closing() const { return transport_->is_closing(); }

        // Received datagrams not yet taken by recv()
        dp::usize pending() const { return recvq_->size(); }

        virtual bool is_client() const = 0;

        // Local address of the socket
        const SocketAddress &sockname() const { return transport_->sockname(); }

        // Connected peer; empty for servers
        const SocketAddress &peername() const { return transport_->peername(); }

        // The underlying socket, for setsockopt after creation
        dp::i32 socket() const { return transport_->fd(); }
    };

    // Datagram socket bound to a local address; every send names its destination
    class DatagramServer : public DatagramStream {
      public:
        using DatagramStream::DatagramStream;

        dp::Res<void> send(const Message &data, const SocketAddress &addr) { return send_to(data, &addr); }

        bool is_client() const override { return false; }
    };

    // Datagram socket connected to one remote peer
    class DatagramClient : public DatagramStream, public DatagramSink {
      public:
        using DatagramStream::DatagramStream;

        dp::Res<void> send(const Message &data) override { return send_to(data, nullptr); }

        void close() override { DatagramStream::close(); }

        bool is_client() const override { return true; }
    };

    namespace datagram {

        namespace detail {

            template <typename T> dp::Res<std::shared_ptr<T>> open_stream(dp::i32 fd, dp::usize recv_capacity = 0) {
                auto recvq = std::make_shared<Channel<Datagram>>(recv_capacity);
                auto excq = std::make_shared<Channel<TransportFault>>();
                auto drained = std::make_shared<Event>();
                auto protocol = std::make_shared<DatagramProtocol>(recvq, excq, drained);
                auto transport = std::make_shared<DatagramTransport>(fd, protocol);

                auto res = transport->start();
                if (res.is_err()) {
                    // fd stays with the caller
                    transport->release();
                    return dp::result::err(res.error());
                }
                return dp::result::ok(std::make_shared<T>(transport, recvq, excq, drained));
            }

            inline dp::Res<dp::i32> open_socket(const SocketAddress &addr, sockaddr_storage &storage, socklen_t &len,
                                                bool passive) {
                dp::i32 family = addr.is_local() ? AF_UNIX : AF_UNSPEC;
                auto res = takpipe::detail::resolve_address(addr, family, storage, len, passive);
                if (res.is_err()) {
                    return dp::result::err(res.error());
                }
                dp::i32 fd = ::socket(storage.ss_family, SOCK_DGRAM | SOCK_CLOEXEC, 0);
                if (fd < 0) {
                    echo::error("socket creation failed: ", strerror(errno));
                    return dp::result::err(dp::Error::io_error("socket creation failed"));
                }
                echo::trace("datagram socket created fd=", fd);
                return dp::result::ok(fd);
            }

        } // namespace detail

        /// Server stream bound to a local address
        /// Local-domain path -> AF_UNIX, host/port -> AF_INET or AF_INET6 as resolved (port 0 = any free port)
        inline dp::Res<std::shared_ptr<DatagramServer>> bind(const SocketAddress &addr) {
            echo::trace("binding datagram stream to ", addr.to_string());
            sockaddr_storage storage = {};
            socklen_t len = 0;
            auto fd_res = detail::open_socket(addr, storage, len, true);
            if (fd_res.is_err()) {
                return dp::result::err(fd_res.error());
            }
            dp::i32 fd = fd_res.value();

            if (addr.is_local() && ::unlink(addr.path.c_str()) < 0 && errno != ENOENT) {
                echo::warn("unlink failed for ", addr.path.c_str());
            }

            if (::bind(fd, reinterpret_cast<sockaddr *>(&storage), len) < 0) {
                echo::error("bind to ", addr.to_string(), " failed: ", strerror(errno));
                ::close(fd);
                return dp::result::err(dp::Error::io_error(dp::String("bind failed: ") + addr.to_string()));
            }

            auto stream = detail::open_stream<DatagramServer>(fd);
            if (stream.is_err()) {
                ::close(fd);
                return stream;
            }
            echo::info("DatagramServer listening on ", addr.to_string());
            return stream;
        }

        /// Client stream connected to a remote address
        inline dp::Res<std::shared_ptr<DatagramClient>> connect(const SocketAddress &addr) {
            echo::trace("connecting datagram stream to ", addr.to_string());
            sockaddr_storage storage = {};
            socklen_t len = 0;
            auto fd_res = detail::open_socket(addr, storage, len, false);
            if (fd_res.is_err()) {
                return dp::result::err(fd_res.error());
            }
            dp::i32 fd = fd_res.value();

            if (::connect(fd, reinterpret_cast<sockaddr *>(&storage), len) < 0) {
                echo::error("connect to ", addr.to_string(), " failed: ", strerror(errno));
                ::close(fd);
                return dp::result::err(dp::Error::io_error(dp::String("connect failed: ") + addr.to_string()));
            }

            auto stream = detail::open_stream<DatagramClient>(fd);
            if (stream.is_err()) {
                ::close(fd);
                return stream;
            }
            echo::debug("DatagramClient connected to ", addr.to_string());
            return stream;
        }

        /// Adopt a socket the caller has already configured (options, group membership, bind, connect)
        /// Connected sockets become a DatagramClient, everything else a DatagramServer.
        /// The stream owns fd on success; on failure the caller keeps it.
        /// recv_capacity > 0 bounds the receive queue, dropping the oldest datagram when full.
        inline dp::Res<std::shared_ptr<DatagramStream>> from_socket(dp::i32 fd, dp::usize recv_capacity = 0) {
            dp::i32 family = takpipe::detail::socket_family(fd);
            if (family != AF_INET && family != AF_INET6 && family != AF_UNIX) {
                echo::error("from_socket: unsupported socket family ", family);
                return dp::result::err(
                    dp::Error::invalid_argument("socket family must be AF_INET, AF_INET6 or AF_UNIX"));
            }

            dp::i32 type = 0;
            socklen_t type_len = sizeof(type);
            if (::getsockopt(fd, SOL_SOCKET, SO_TYPE, &type, &type_len) < 0 || type != SOCK_DGRAM) {
                echo::error("from_socket: socket type is not SOCK_DGRAM");
                return dp::result::err(dp::Error::invalid_argument("socket type must be SOCK_DGRAM"));
            }

            sockaddr_storage peer = {};
            socklen_t peer_len = sizeof(peer);
            if (::getpeername(fd, reinterpret_cast<sockaddr *>(&peer), &peer_len) == 0) {
                auto client = detail::open_stream<DatagramClient>(fd, recv_capacity);
                if (client.is_err()) {
                    return dp::result::err(client.error());
                }
                return dp::result::ok(std::shared_ptr<DatagramStream>(client.value()));
            }

            auto server = detail::open_stream<DatagramServer>(fd, recv_capacity);
            if (server.is_err()) {
                return dp::result::err(server.error());
            }
            return dp::result::ok(std::shared_ptr<DatagramStream>(server.value()));
        }

    } // namespace datagram

} // namespace takpipe
