#pragma once

#include <takpipe/common.hpp>

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <sys/un.h>

#include <algorithm>
#include <cctype>
#include <cstddef>
#include <string>

namespace takpipe {

    // TCP endpoint - host and port
    struct TcpEndpoint {
        dp::String host; // IP address or hostname
        dp::u16 port;

        inline dp::String to_string() const { return host + ":" + dp::String(std::to_string(port).c_str()); }
    };

    // UDP endpoint - host and port
    struct UdpEndpoint {
        dp::String host; // IP address or hostname
        dp::u16 port;

        inline dp::String to_string() const { return host + ":" + dp::String(std::to_string(port).c_str()); }
    };

    // IPC endpoint - Unix domain socket path
    struct IpcEndpoint {
        dp::String path; // Filesystem path like /tmp/myapp.sock

        inline dp::String to_string() const { return path; }
    };

    // Address of a datagram peer: either host/port (INET, INET6) or a local-domain path
    struct SocketAddress {
        dp::String host;
        dp::u16 port = 0;
        dp::String path;
        bool local = false;

        SocketAddress() = default;
        SocketAddress(const UdpEndpoint &endpoint) : host(endpoint.host), port(endpoint.port) {}
        SocketAddress(const IpcEndpoint &endpoint) : path(endpoint.path), local(true) {}

        bool is_local() const { return local; }

        inline dp::String to_string() const {
            if (local) {
                return path;
            }
            return host + ":" + dp::String(std::to_string(port).c_str());
        }

        bool operator==(const SocketAddress &other) const {
            if (local != other.local) {
                return false;
            }
            return local ? path == other.path : (host == other.host && port == other.port);
        }

        // Build from a kernel-supplied address (recvfrom, getsockname, getpeername)
        static SocketAddress from_sockaddr(const sockaddr_storage &storage, socklen_t len) {
            SocketAddress addr;
            if (storage.ss_family == AF_INET) {
                auto *in = reinterpret_cast<const sockaddr_in *>(&storage);
                char ip[INET_ADDRSTRLEN] = {};
                ::inet_ntop(AF_INET, &in->sin_addr, ip, sizeof(ip));
                addr.host = dp::String(ip);
                addr.port = ntohs(in->sin_port);
            } else if (storage.ss_family == AF_INET6) {
                auto *in6 = reinterpret_cast<const sockaddr_in6 *>(&storage);
                char ip[INET6_ADDRSTRLEN] = {};
                ::inet_ntop(AF_INET6, &in6->sin6_addr, ip, sizeof(ip));
                addr.host = dp::String(ip);
                addr.port = ntohs(in6->sin6_port);
            } else if (storage.ss_family == AF_UNIX) {
                auto *un = reinterpret_cast<const sockaddr_un *>(&storage);
                addr.local = true;
                dp::usize path_len = len > offsetof(sockaddr_un, sun_path) ? len - offsetof(sockaddr_un, sun_path) : 0;
                std::string path(un->sun_path, ::strnlen(un->sun_path, path_len));
                addr.path = dp::String(path.c_str());
            }
            return addr;
        }
    };

    // Parsed destination descriptor: scheme://host[:port][/path]
    struct CotUrl {
        dp::String scheme; // lower-cased, e.g. "udp+broadcast"
        dp::String host;
        dp::u16 port = 0;
        dp::String path; // everything after host[:port], used by file://

        inline dp::String to_string() const {
            return scheme + "://" + host + ":" + dp::String(std::to_string(port).c_str()) + path;
        }
    };

    namespace detail {

        inline std::string lower(std::string value) {
            std::transform(value.begin(), value.end(), value.begin(),
                           [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
            return value;
        }

        inline dp::Res<dp::u16> parse_port(const std::string &text) {
            if (text.empty() || text.size() > 5 ||
                !std::all_of(text.begin(), text.end(), [](unsigned char c) { return std::isdigit(c); })) {
                return dp::result::err(dp::Error::invalid_argument(dp::String("invalid port: ") + text.c_str()));
            }
            unsigned long value = std::stoul(text);
            if (value > 65535) {
                return dp::result::err(dp::Error::invalid_argument(dp::String("invalid port: ") + text.c_str()));
            }
            return dp::result::ok(static_cast<dp::u16>(value));
        }

    } // namespace detail

    // True if host is an IPv4 or IPv6 literal in the multicast range
    // DNS names are never multicast
    inline bool is_multicast_host(const dp::String &host) {
        std::string text(host.c_str());
        if (text.size() > 2 && text.front() == '[' && text.back() == ']') {
            text = text.substr(1, text.size() - 2);
        }

        in_addr v4 = {};
        if (::inet_pton(AF_INET, text.c_str(), &v4) == 1) {
            return IN_MULTICAST(ntohl(v4.s_addr));
        }
        in6_addr v6 = {};
        if (::inet_pton(AF_INET6, text.c_str(), &v6) == 1) {
            return IN6_IS_ADDR_MULTICAST(&v6);
        }
        return false;
    }

    // Split "host[:port]" into a TCP endpoint, falling back to default_port
    inline dp::Res<TcpEndpoint> split_host(const dp::String &host, dp::u16 default_port = DEFAULT_COT_PORT) {
        std::string text(host.c_str());
        auto colon = text.rfind(':');
        if (colon == std::string::npos || text.find(':') != colon) {
            return dp::result::ok(TcpEndpoint{host, default_port});
        }
        auto port_res = detail::parse_port(text.substr(colon + 1));
        if (port_res.is_err()) {
            return dp::result::err(port_res.error());
        }
        return dp::result::ok(TcpEndpoint{dp::String(text.substr(0, colon).c_str()), port_res.value()});
    }

    // Parse a destination descriptor
    // Port defaults: 6969 for broadcast/multicast schemes, 8087 for everything else
    inline dp::Res<CotUrl> parse_url(const dp::String &raw) {
        std::string text(raw.c_str());
        auto sep = text.find("://");
        if (sep == std::string::npos) {
            echo::error("invalid COT_URL: ", raw.c_str());
            return dp::result::err(dp::Error::invalid_argument(
                dp::String("Specify COT_URL as a full URL, for example tcp://tak.example.com:8087 (got: ") +
                raw.c_str() + ")"));
        }

        CotUrl url;
        std::string scheme = detail::lower(text.substr(0, sep));
        if (scheme.empty()) {
            return dp::result::err(dp::Error::invalid_argument(dp::String("missing scheme in COT_URL: ") + raw.c_str()));
        }
        url.scheme = dp::String(scheme.c_str());

        std::string rest = text.substr(sep + 3);
        auto slash = rest.find('/');
        std::string netloc = rest.substr(0, slash);
        if (slash != std::string::npos) {
            url.path = dp::String(rest.substr(slash).c_str());
        }

        bool broadcast_family =
            scheme.find("broadcast") != std::string::npos || scheme.find("multicast") != std::string::npos;
        dp::u16 default_port = broadcast_family ? DEFAULT_BROADCAST_PORT : DEFAULT_COT_PORT;

        std::string host = netloc;
        std::string port;
        if (!netloc.empty() && netloc.front() == '[') {
            // Bracketed IPv6 literal
            auto close = netloc.find(']');
            if (close == std::string::npos) {
                return dp::result::err(dp::Error::invalid_argument(dp::String("invalid IPv6 host: ") + raw.c_str()));
            }
            host = netloc.substr(1, close - 1);
            if (close + 1 < netloc.size()) {
                if (netloc[close + 1] != ':') {
                    return dp::result::err(dp::Error::invalid_argument(dp::String("invalid host: ") + raw.c_str()));
                }
                port = netloc.substr(close + 2);
            }
        } else {
            auto colon = netloc.rfind(':');
            if (colon != std::string::npos) {
                host = netloc.substr(0, colon);
                port = netloc.substr(colon + 1);
            }
        }

        url.host = dp::String(host.c_str());
        if (port.empty()) {
            url.port = default_port;
        } else {
            auto port_res = detail::parse_port(port);
            if (port_res.is_err()) {
                echo::error("invalid port in COT_URL: ", raw.c_str());
                return dp::result::err(port_res.error());
            }
            url.port = port_res.value();
        }

        if (scheme.find("multicast") != std::string::npos && is_multicast_host(url.host)) {
            echo::warn("'+multicast' is no longer needed in COT_URL, multicast groups are detected from the host");
        }

        echo::trace("parsed COT_URL ", url.to_string());
        return dp::result::ok(url);
    }

} // namespace takpipe
