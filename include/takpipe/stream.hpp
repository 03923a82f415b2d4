#pragma once

#include <memory>
#include <takpipe/endpoint.hpp>

#include <algorithm>

namespace takpipe {

    // Write half of a stream-oriented transport (TCP, TLS, file, process stream)
    // write() buffers, drain() hands everything buffered to the OS, flush() pushes it further
    // where the medium supports it (file sync). Reliable and ordered.
    class StreamSink {
      public:
        virtual ~StreamSink() = default;

        virtual dp::Res<void> write(const Message &msg) = 0;

        virtual dp::Res<void> drain() = 0;

        virtual dp::Res<void> flush() { return dp::result::ok(); }

        virtual void close() = 0;
    };

    // Read half of a stream-oriented transport
    class ByteSource {
      public:
        virtual ~ByteSource() = default;

        // Blocks until at least one byte is available
        // Returns the number of bytes read, 0 on orderly shutdown by the peer
        virtual dp::Res<dp::usize> read_some(dp::u8 *buffer, dp::usize count) = 0;

        virtual void close() = 0;
    };

    // Buffered reader that splits a byte stream on a delimiter
    class StreamReader {
      private:
        std::shared_ptr<ByteSource> source_;
        Message buffer_;
        bool eof_;

        static constexpr dp::usize CHUNK_SIZE = 4096;
        static constexpr dp::usize MAX_FRAME_SIZE = 16 * 1024 * 1024;

      public:
        explicit StreamReader(std::shared_ptr<ByteSource> source) : source_(std::move(source)), eof_(false) {}

        // Read up to and including the delimiter
        // Returns an empty message if the stream ends before the delimiter is seen (incomplete read);
        // the partial bytes are discarded. Once the stream has ended, further reads fail with not_found.
        dp::Res<Message> read_until(const Message &delimiter) {
            if (delimiter.empty()) {
                return dp::result::err(dp::Error::invalid_argument("empty delimiter"));
            }

            dp::usize search_from = 0;
            while (true) {
                auto it = std::search(buffer_.begin() + static_cast<std::ptrdiff_t>(search_from), buffer_.end(),
                                      delimiter.begin(), delimiter.end());
                if (it != buffer_.end()) {
                    auto end = it + static_cast<std::ptrdiff_t>(delimiter.size());
                    Message frame(buffer_.begin(), end);
                    buffer_.erase(buffer_.begin(), end);
                    echo::trace("read_until framed ", frame.size(), " bytes, ", buffer_.size(), " buffered");
                    return dp::result::ok(std::move(frame));
                }

                if (eof_) {
                    if (!buffer_.empty()) {
                        echo::debug("stream ended mid-frame, discarding ", buffer_.size(), " bytes");
                        buffer_.clear();
                        return dp::result::ok(Message());
                    }
                    return dp::result::err(dp::Error::not_found("connection closed by peer"));
                }

                if (buffer_.size() > MAX_FRAME_SIZE) {
                    echo::error("no delimiter within ", MAX_FRAME_SIZE, " bytes");
                    return dp::result::err(dp::Error::io_error("frame too large"));
                }

                // Only the tail can still contain the start of a delimiter
                search_from = buffer_.size() >= delimiter.size() ? buffer_.size() - delimiter.size() + 1 : 0;

                dp::u8 chunk[CHUNK_SIZE];
                auto res = source_->read_some(chunk, sizeof(chunk));
                if (res.is_err()) {
                    return dp::result::err(res.error());
                }
                if (res.value() == 0) {
                    echo::trace("read_until hit end of stream");
                    eof_ = true;
                    continue;
                }
                buffer_.insert(buffer_.end(), chunk, chunk + res.value());
            }
        }

        // Bytes received but not yet returned
        dp::usize buffered() const { return buffer_.size(); }

        bool at_eof() const { return eof_; }

        void close() { source_->close(); }
    };

} // namespace takpipe
