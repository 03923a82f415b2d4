#pragma once

#include <datapod/datapod.hpp>
#include <echo/echo.hpp>

#include <cerrno>
#include <cstring>
#include <sys/socket.h>
#include <unistd.h>

namespace takpipe {

    // Opaque payload - one CoT event (XML or binary framed)
    using Message = dp::Vector<dp::u8>;

    // Default destination: ATAK multicast group, write-only
    inline constexpr const char *DEFAULT_COT_URL = "udp+wo://239.2.3.1:6969";
    inline constexpr dp::u16 DEFAULT_COT_PORT = 8087;
    inline constexpr dp::u16 DEFAULT_BROADCAST_PORT = 6969;

    inline constexpr dp::usize DEFAULT_MAX_OUT_QUEUE = 100;
    inline constexpr dp::usize DEFAULT_MAX_IN_QUEUE = 500;

    inline constexpr const char *DEFAULT_MULTICAST_LOCAL_ADDR = "0.0.0.0";
    inline constexpr dp::i32 DEFAULT_MULTICAST_TTL = 1;
    // Datagrams kept for a UDP writer socket; nothing reads them, the oldest are dropped
    inline constexpr dp::usize WRITER_RECV_CAPACITY = 16;

    // Upper bound of the FTS_COMPAT random delay, seconds
    inline constexpr dp::u32 DEFAULT_SLEEP = 5;

    inline constexpr const char *DEFAULT_TLS_CIPHERS = "ALL";
    inline constexpr dp::usize DEFAULT_ENROLLMENT_PASSPHRASE_LENGTH = 16;

    // Closing tag of a CoT XML document, used to frame TCP/TLS streams
    inline constexpr const char *COT_EVENT_END = "</event>";

    inline Message to_message(const char *text) {
        return Message(text, text + std::strlen(text));
    }

    inline Message to_message(const dp::String &text) { return Message(text.begin(), text.end()); }

    inline dp::String to_string(const Message &msg) {
        return dp::String(reinterpret_cast<const char *>(msg.data()), msg.size());
    }

    // Read whatever is available (at most count bytes) from a file descriptor
    // Returns the number of bytes read, 0 on EOF
    // ERROR CATEGORIZATION:
    // - timeout: EAGAIN/EWOULDBLOCK (expected, recoverable)
    // - not_found: connection closed (ECONNRESET, EPIPE, EBADF, ENOTCONN)
    // - io_error: other I/O errors
    inline dp::Res<dp::usize> read_some(dp::i32 fd, dp::u8 *buffer, dp::usize count) {
        while (true) {
            dp::isize n = ::read(fd, buffer, count);
            if (n >= 0) {
                echo::trace("read ", n, " bytes (fd=", fd, ")");
                return dp::result::ok(static_cast<dp::usize>(n));
            }

            if (errno == EINTR) {
                echo::trace("read interrupted by signal, retrying");
                continue;
            }
            if (errno == EAGAIN || errno == EWOULDBLOCK) {
                echo::trace("read would block (fd=", fd, ")");
                return dp::result::err(dp::Error::timeout("read timeout"));
            }
            if (errno == ECONNRESET) {
                echo::trace("read failed: connection reset by peer (fd=", fd, ")");
                return dp::result::err(dp::Error::not_found("connection reset by peer"));
            }
            if (errno == EPIPE || errno == EBADF || errno == ENOTCONN) {
                echo::trace("read failed: ", strerror(errno), " (fd=", fd, ")");
                return dp::result::err(dp::Error::not_found("connection closed"));
            }

            echo::trace("read failed: ", strerror(errno), " (errno=", errno, ", fd=", fd, ")");
            return dp::result::err(dp::Error::io_error(dp::String("read error: ") + strerror(errno)));
        }
    }

    // Helper to write exactly n bytes to a file descriptor
    // Sockets go through send(MSG_NOSIGNAL) so a vanished peer is EPIPE, not SIGPIPE
    // Returns dp::Res<void> - ok if all bytes written, error otherwise
    // ERROR CATEGORIZATION:
    // - not_found: connection closed (ECONNRESET, EPIPE, EBADF)
    // - io_error: other I/O errors (unexpected, may be recoverable)
    inline dp::Res<void> write_exact(dp::i32 fd, const dp::u8 *buffer, dp::usize count, bool is_socket = false) {
        dp::usize total_written = 0;
        while (total_written < count) {
            dp::isize n = is_socket ? ::send(fd, buffer + total_written, count - total_written, MSG_NOSIGNAL)
                                    : ::write(fd, buffer + total_written, count - total_written);
            if (n < 0) {
                // EINTR: Interrupted by signal - retry transparently
                if (errno == EINTR) {
                    echo::trace("write interrupted by signal, retrying");
                    continue;
                }

                // Connection closed errors - fatal, not recoverable
                if (errno == ECONNRESET) {
                    echo::trace("write failed: connection reset by peer (fd=", fd, ")");
                    return dp::result::err(dp::Error::not_found("connection reset by peer"));
                }
                if (errno == EPIPE) {
                    echo::trace("write failed: broken pipe (fd=", fd, ")");
                    return dp::result::err(dp::Error::not_found("broken pipe"));
                }
                if (errno == EBADF) {
                    echo::trace("write failed: bad file descriptor (fd=", fd, ")");
                    return dp::result::err(dp::Error::not_found("bad file descriptor"));
                }
                if (errno == ENOTCONN) {
                    echo::trace("write failed: socket not connected (fd=", fd, ")");
                    return dp::result::err(dp::Error::not_found("socket not connected"));
                }

                if (errno == EAGAIN || errno == EWOULDBLOCK) {
                    echo::trace("write would block (fd=", fd, ", wanted=", count, ", wrote=", total_written, ")");
                    return dp::result::err(dp::Error::io_error("write would block"));
                }

                echo::trace("write failed: ", strerror(errno), " (errno=", errno, ", fd=", fd, ")");
                return dp::result::err(dp::Error::io_error(dp::String("write error: ") + strerror(errno)));
            }

            total_written += static_cast<dp::usize>(n);
            echo::trace("wrote ", n, " bytes, total=", total_written, "/", count, " (fd=", fd, ")");
        }
        return dp::result::ok();
    }

} // namespace takpipe
