#pragma once

#include <takpipe/codec.hpp>
#include <takpipe/config.hpp>
#include <takpipe/datagram/udp.hpp>
#include <takpipe/enrollment.hpp>
#include <takpipe/stream.hpp>
#include <takpipe/stream/file.hpp>
#include <takpipe/stream/tcp.hpp>
#include <takpipe/stream/tls.hpp>

#include <string>
#include <vector>

namespace takpipe {

    // Read half of a TransportEndpoint: nothing, a delimited byte stream, or a datagram source
    class Reader {
      public:
        enum class Kind { None, Stream, Datagram };

      private:
        Kind kind_;
        std::shared_ptr<StreamReader> stream_;
        std::shared_ptr<DatagramSource> datagram_;

      public:
        Reader() : kind_(Kind::None) {}

        static Reader stream(std::shared_ptr<StreamReader> reader) {
            Reader r;
            r.kind_ = Kind::Stream;
            r.stream_ = std::move(reader);
            return r;
        }

        static Reader datagram(std::shared_ptr<DatagramSource> source) {
            Reader r;
            r.kind_ = Kind::Datagram;
            r.datagram_ = std::move(source);
            return r;
        }

        Kind kind() const { return kind_; }

        bool present() const { return kind_ != Kind::None; }

        StreamReader &as_stream() const { return *stream_; }

        DatagramSource &as_datagram() const { return *datagram_; }

        void close() const {
            if (stream_) {
                stream_->close();
            }
            if (datagram_) {
                datagram_->close();
            }
        }
    };

    // Write half of a TransportEndpoint: nothing, a stream sink, or a connected datagram sink
    class Writer {
      public:
        enum class Kind { None, Stream, Datagram };

      private:
        Kind kind_;
        std::shared_ptr<StreamSink> stream_;
        std::shared_ptr<DatagramSink> datagram_;

      public:
        Writer() : kind_(Kind::None) {}

        static Writer stream(std::shared_ptr<StreamSink> sink) {
            Writer w;
            w.kind_ = Kind::Stream;
            w.stream_ = std::move(sink);
            return w;
        }

        static Writer datagram(std::shared_ptr<DatagramSink> sink) {
            Writer w;
            w.kind_ = Kind::Datagram;
            w.datagram_ = std::move(sink);
            return w;
        }

        Kind kind() const { return kind_; }

        bool present() const { return kind_ != Kind::None; }

        StreamSink &as_stream() const { return *stream_; }

        DatagramSink &as_datagram() const { return *datagram_; }

        void close() const {
            if (stream_) {
                stream_->close();
            }
            if (datagram_) {
                datagram_->close();
            }
        }
    };

    // Reader/writer pair for one destination; either half may be absent
    struct TransportEndpoint {
        Reader reader;
        Writer writer;

        void close() const {
            reader.close();
            writer.close();
        }
    };

    namespace detail {

        inline const std::vector<std::string> &known_schemes() {
            static const std::vector<std::string> schemes = {"tcp", "tls", "ssl", "udp", "log", "file"};
            return schemes;
        }

        // "udp+broadcast+wo" -> base "udp", suffixes checked against the udp flags
        inline dp::Res<std::string> scheme_base(const std::string &scheme) {
            auto plus = scheme.find('+');
            std::string base = scheme.substr(0, plus);
            const auto &schemes = known_schemes();
            if (std::find(schemes.begin(), schemes.end(), base) == schemes.end()) {
                return dp::result::err(dp::Error::invalid_argument(
                    dp::String("Invalid COT_URL protocol specified: ") + scheme.c_str()));
            }

            while (plus != std::string::npos) {
                auto next = scheme.find('+', plus + 1);
                std::string suffix = scheme.substr(plus + 1, next == std::string::npos ? next : next - plus - 1);
                if (base != "udp" || (suffix != "broadcast" && suffix != "multicast" && suffix != "wo")) {
                    return dp::result::err(dp::Error::invalid_argument(
                        dp::String("Invalid COT_URL protocol specified: ") + scheme.c_str()));
                }
                plus = next;
            }
            return dp::result::ok(base);
        }

        inline dp::Res<TransportEndpoint> open_tcp(const CotUrl &url) {
            auto conn = std::make_shared<TcpConnection>();
            auto res = conn->connect(TcpEndpoint{url.host, url.port});
            if (res.is_err()) {
                return dp::result::err(res.error());
            }
            TransportEndpoint endpoint;
            endpoint.reader = Reader::stream(std::make_shared<StreamReader>(conn));
            endpoint.writer = Writer::stream(conn);
            return dp::result::ok(endpoint);
        }

        inline dp::Res<TransportEndpoint> open_tls(const Config &config, const CotUrl &url,
                                                   const CertificateEnrollment *enrollment) {
            auto tls_res = TlsConfig::from_config(config);
            if (tls_res.is_err()) {
                return dp::result::err(tls_res.error());
            }
            TlsConfig tls = tls_res.value();

            if (tls.wants_enrollment()) {
                auto enrolled = enroll(tls, url.host, enrollment);
                if (enrolled.is_err()) {
                    return dp::result::err(enrolled.error());
                }
                tls = enrolled.value();
            }

            auto ctx = TlsContext::create(tls);
            if (ctx.is_err()) {
                return dp::result::err(ctx.error());
            }

            auto conn = std::make_shared<TlsConnection>(ctx.value());
            dp::String expected = ctx.value()->check_hostname() ? tls.server_expected_hostname : dp::String();
            auto res = conn->connect(TcpEndpoint{url.host, url.port}, expected);
            if (res.is_err()) {
                return dp::result::err(res.error());
            }

            TransportEndpoint endpoint;
            endpoint.reader = Reader::stream(std::make_shared<StreamReader>(conn));
            endpoint.writer = Writer::stream(conn);
            return dp::result::ok(endpoint);
        }

        inline dp::Res<TransportEndpoint> open_udp(const Config &config, const CotUrl &url) {
            UdpOptions opts = UdpOptions::from_url(url);
            opts.local_addr = config.get(keys::MULTICAST_LOCAL_ADDR, DEFAULT_MULTICAST_LOCAL_ADDR);
            opts.multicast_ttl = static_cast<dp::i32>(config.get_int(keys::MULTICAST_TTL, DEFAULT_MULTICAST_TTL));

            auto client = create_udp_client(url, opts);
            if (client.is_err()) {
                return dp::result::err(client.error());
            }

            TransportEndpoint endpoint;
            if (client.value().reader) {
                endpoint.reader = Reader::datagram(client.value().reader);
            }
            endpoint.writer = Writer::datagram(client.value().writer);
            return dp::result::ok(endpoint);
        }

        inline dp::Res<TransportEndpoint> open_log(const CotUrl &url) {
            if (url.host.empty()) {
                return dp::result::err(
                    dp::Error::invalid_argument("log destination needs a target, e.g. log://stdout or log://stderr"));
            }
            std::string target = lower(std::string(url.host.c_str()));
            TransportEndpoint endpoint;
            endpoint.writer = Writer::stream(FdSink::standard(target.find("stderr") != std::string::npos));
            return dp::result::ok(endpoint);
        }

        inline dp::Res<TransportEndpoint> open_file(const dp::String &raw) {
            // Path is everything after the scheme separator: file://out/cot.xml, file:///tmp/cot.xml
            std::string text(raw.c_str());
            std::string path = text.substr(text.find("://") + 3);
            auto sink = FdSink::open_file(dp::String(path.c_str()));
            if (sink.is_err()) {
                return dp::result::err(sink.error());
            }
            TransportEndpoint endpoint;
            endpoint.writer = Writer::stream(sink.value());
            return dp::result::ok(endpoint);
        }

    } // namespace detail

    /// Build the reader/writer pair for the config's COT_URL
    ///
    /// | scheme                         | reader   | writer                    |
    /// |--------------------------------|----------|---------------------------|
    /// | tcp                            | stream   | stream                    |
    /// | tls, ssl                       | stream   | stream                    |
    /// | udp, udp+broadcast, +multicast | datagram | datagram                  |
    /// | udp+wo                         | -        | datagram                  |
    /// | log                            | -        | stdout (stderr if named)  |
    /// | file                           | -        | local file                |
    ///
    /// Configuration errors (no "://", unknown scheme, missing TLS material) fail with invalid_argument.
    /// enrollment is consulted only for TLS destinations configured with enrollment credentials.
    inline dp::Res<TransportEndpoint> protocol_factory(const Config &config,
                                                       const CertificateEnrollment *enrollment = nullptr) {
        dp::String raw = config.get(keys::COT_URL, DEFAULT_COT_URL);
        auto url_res = parse_url(raw);
        if (url_res.is_err()) {
            return dp::result::err(url_res.error());
        }
        const CotUrl &url = url_res.value();

        auto base = detail::scheme_base(std::string(url.scheme.c_str()));
        if (base.is_err()) {
            echo::error("unsupported COT_URL scheme: ", url.scheme.c_str());
            return dp::result::err(base.error());
        }

        echo::debug("protocol_factory ", config.name().c_str(), " -> ", raw.c_str());

        const std::string &kind = base.value();
        if (kind == "tcp") {
            return detail::open_tcp(url);
        }
        if (kind == "tls" || kind == "ssl") {
            return detail::open_tls(config, url, enrollment);
        }
        if (kind == "udp") {
            return detail::open_udp(config, url);
        }
        if (kind == "log") {
            return detail::open_log(url);
        }
        return detail::open_file(raw);
    }

} // namespace takpipe
