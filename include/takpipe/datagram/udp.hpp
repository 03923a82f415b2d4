#pragma once

#include <takpipe/datagram.hpp>

#include <arpa/inet.h>
#include <netinet/in.h>

namespace takpipe {

    // Socket options for one udp* destination, derived from the scheme and host
    struct UdpOptions {
        bool write_only = false;
        bool broadcast = false;
        bool multicast = false;
        dp::String local_addr = DEFAULT_MULTICAST_LOCAL_ADDR; // interface used for group membership
        dp::i32 multicast_ttl = DEFAULT_MULTICAST_TTL;

        /// Flags from a udp scheme; multicast is also switched on by a multicast host literal
        static UdpOptions from_url(const CotUrl &url) {
            std::string scheme(url.scheme.c_str());
            UdpOptions opts;
            opts.write_only = scheme.find("+wo") != std::string::npos;
            opts.broadcast = scheme.find("broadcast") != std::string::npos;
            opts.multicast = scheme.find("multicast") != std::string::npos || is_multicast_host(url.host);
            return opts;
        }
    };

    // Reader/writer pair for a UDP destination; reader is empty for write-only destinations
    struct UdpClient {
        std::shared_ptr<DatagramStream> reader;
        std::shared_ptr<DatagramClient> writer;
    };

    namespace detail {

        inline void set_flag(dp::i32 fd, dp::i32 level, dp::i32 name, const char *label) {
            dp::i32 opt = 1;
            if (::setsockopt(fd, level, name, &opt, sizeof(opt)) < 0) {
                echo::warn("setsockopt ", label, " failed: ", strerror(errno));
            }
        }

        inline dp::Res<std::shared_ptr<DatagramClient>> open_udp_writer(const CotUrl &url, const UdpOptions &opts) {
            SocketAddress dest = UdpEndpoint{url.host, url.port};
            sockaddr_storage storage = {};
            socklen_t len = 0;
            auto res = resolve_address(dest, AF_UNSPEC, storage, len);
            if (res.is_err()) {
                return dp::result::err(res.error());
            }

            dp::i32 fd = ::socket(storage.ss_family, SOCK_DGRAM | SOCK_CLOEXEC, 0);
            if (fd < 0) {
                echo::error("socket creation failed: ", strerror(errno));
                return dp::result::err(dp::Error::io_error("socket creation failed"));
            }
            echo::trace("udp writer socket created fd=", fd);

            if (opts.broadcast) {
                set_flag(fd, SOL_SOCKET, SO_BROADCAST, "SO_BROADCAST");
            }

            if (opts.multicast) {
                if (storage.ss_family == AF_INET6) {
                    dp::i32 hops = opts.multicast_ttl;
                    if (::setsockopt(fd, IPPROTO_IPV6, IPV6_MULTICAST_HOPS, &hops, sizeof(hops)) < 0) {
                        echo::warn("setsockopt IPV6_MULTICAST_HOPS failed: ", strerror(errno));
                    }
                } else {
                    dp::u8 ttl = static_cast<dp::u8>(opts.multicast_ttl);
                    if (::setsockopt(fd, IPPROTO_IP, IP_MULTICAST_TTL, &ttl, sizeof(ttl)) < 0) {
                        echo::warn("setsockopt IP_MULTICAST_TTL failed: ", strerror(errno));
                    }

                    // Send through the configured interface rather than the default route
                    in_addr iface = {};
                    if (!(opts.local_addr == DEFAULT_MULTICAST_LOCAL_ADDR) &&
                        ::inet_pton(AF_INET, opts.local_addr.c_str(), &iface) == 1 &&
                        ::setsockopt(fd, IPPROTO_IP, IP_MULTICAST_IF, &iface, sizeof(iface)) < 0) {
                        echo::warn("setsockopt IP_MULTICAST_IF failed: ", strerror(errno));
                    }
                }
                echo::debug("multicast writer ttl=", opts.multicast_ttl);
            }

            if (::connect(fd, reinterpret_cast<sockaddr *>(&storage), len) < 0) {
                echo::error("udp connect to ", dest.to_string(), " failed: ", strerror(errno));
                ::close(fd);
                return dp::result::err(dp::Error::io_error(dp::String("connect failed: ") + dest.to_string()));
            }

            // Replies to the writer's ephemeral port are never read
            auto stream = datagram::from_socket(fd, WRITER_RECV_CAPACITY);
            if (stream.is_err()) {
                ::close(fd);
                return dp::result::err(stream.error());
            }
            return dp::result::ok(std::static_pointer_cast<DatagramClient>(stream.value()));
        }

        inline dp::Res<std::shared_ptr<DatagramStream>> open_udp_reader(const CotUrl &url, const UdpOptions &opts) {
            dp::i32 fd = ::socket(AF_INET, SOCK_DGRAM | SOCK_CLOEXEC, 0);
            if (fd < 0) {
                echo::error("socket creation failed: ", strerror(errno));
                return dp::result::err(dp::Error::io_error("socket creation failed"));
            }
            echo::trace("udp reader socket created fd=", fd);

            // Address sharing must be in place before bind
            if (opts.broadcast) {
                set_flag(fd, SOL_SOCKET, SO_BROADCAST, "SO_BROADCAST");
            }
            if (opts.broadcast || opts.multicast) {
                set_flag(fd, SOL_SOCKET, SO_REUSEADDR, "SO_REUSEADDR");
                set_flag(fd, SOL_SOCKET, SO_REUSEPORT, "SO_REUSEPORT");
            }

            struct sockaddr_in addr = {};
            addr.sin_family = AF_INET;
            addr.sin_port = htons(url.port);
            addr.sin_addr.s_addr = INADDR_ANY;

            in_addr group = {};
            bool have_group = opts.multicast && ::inet_pton(AF_INET, url.host.c_str(), &group) == 1;
            if (have_group) {
                // Bound to the group, the socket only sees traffic addressed to it
                addr.sin_addr = group;
            }

            if (::bind(fd, reinterpret_cast<sockaddr *>(&addr), sizeof(addr)) < 0) {
                echo::error("udp bind to port ", url.port, " failed: ", strerror(errno));
                ::close(fd);
                return dp::result::err(
                    dp::Error::io_error(dp::String("bind failed: ") + std::to_string(url.port).c_str()));
            }

            if (have_group) {
                struct ip_mreq mreq = {};
                mreq.imr_multiaddr = group;
                if (::inet_pton(AF_INET, opts.local_addr.c_str(), &mreq.imr_interface) != 1) {
                    mreq.imr_interface.s_addr = INADDR_ANY;
                }
                if (::setsockopt(fd, IPPROTO_IP, IP_ADD_MEMBERSHIP, &mreq, sizeof(mreq)) < 0) {
                    echo::error("IP_ADD_MEMBERSHIP ", url.host.c_str(), " failed: ", strerror(errno));
                    ::close(fd);
                    return dp::result::err(
                        dp::Error::io_error(dp::String("cannot join multicast group ") + url.host));
                }
                echo::info("joined multicast group ", url.host.c_str(), " on ", opts.local_addr.c_str());
            } else if (opts.multicast) {
                echo::warn("multicast reader for non-IPv4 host ", url.host.c_str(), " has no group membership");
            }

            auto stream = datagram::from_socket(fd);
            if (stream.is_err()) {
                ::close(fd);
                return dp::result::err(stream.error());
            }
            return dp::result::ok(stream.value());
        }

    } // namespace detail

    /// Build the datagram reader and writer for a udp, udp+broadcast, udp+multicast or udp+wo destination
    /// The writer is connected to host:port. The reader listens on port (all interfaces, or the group
    /// address for multicast) and is skipped for write-only destinations.
    inline dp::Res<UdpClient> create_udp_client(const CotUrl &url, const UdpOptions &opts) {
        echo::debug("creating udp client for ", url.to_string(), " broadcast=", opts.broadcast,
                    " multicast=", opts.multicast, " write_only=", opts.write_only);

        auto writer = detail::open_udp_writer(url, opts);
        if (writer.is_err()) {
            return dp::result::err(writer.error());
        }

        UdpClient client;
        client.writer = writer.value();
        if (opts.write_only) {
            return dp::result::ok(client);
        }

        auto reader = detail::open_udp_reader(url, opts);
        if (reader.is_err()) {
            client.writer->close();
            return dp::result::err(reader.error());
        }
        client.reader = reader.value();
        return dp::result::ok(client);
    }

} // namespace takpipe
