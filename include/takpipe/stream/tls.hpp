#pragma once

#include <takpipe/config.hpp>
#include <takpipe/crypto.hpp>
#include <takpipe/stream/tcp.hpp>

#include <openssl/ssl.h>
#include <openssl/x509v3.h>

#include <fcntl.h>
#include <poll.h>

#include <filesystem>
#include <string>

namespace takpipe {

    inline constexpr const char *TLS_VERIFY_HINT =
        "Bypass with TAKPIPE_TLS_DONT_CHECK_HOSTNAME=1 or TAKPIPE_TLS_DONT_VERIFY=1";

    /// Validated TLS settings for one tls:// or ssl:// destination
    struct TlsConfig {
        dp::String client_cert;
        dp::String client_key;
        dp::String client_cafile;
        dp::String client_ciphers = DEFAULT_TLS_CIPHERS;
        dp::String client_password;
        dp::String server_expected_hostname;
        bool dont_check_hostname = false;
        bool dont_verify = false;

        dp::String enrollment_username;
        dp::String enrollment_password;
        dp::String enrollment_passphrase;
        dp::String enrollment_url;

        /// Enrollment replaces a static client certificate when both credentials are set
        bool wants_enrollment() const { return !enrollment_username.empty() && !enrollment_password.empty(); }

        /// Password for the client key or PKCS#12 container
        const dp::String &password() const {
            return enrollment_passphrase.empty() ? client_password : enrollment_passphrase;
        }

        /// Fails if there is neither a client certificate nor enrollment credentials to obtain one
        static dp::Res<TlsConfig> from_config(const Config &config) {
            TlsConfig tls;
            tls.client_cert = config.get(keys::TLS_CLIENT_CERT);
            tls.client_key = config.get(keys::TLS_CLIENT_KEY);
            tls.client_cafile = config.get(keys::TLS_CLIENT_CAFILE);
            tls.client_ciphers = config.get(keys::TLS_CLIENT_CIPHERS, DEFAULT_TLS_CIPHERS);
            tls.client_password = config.get(keys::TLS_CLIENT_PASSWORD);
            tls.server_expected_hostname = config.get(keys::TLS_SERVER_EXPECTED_HOSTNAME);
            tls.dont_verify = config.get_bool(keys::TLS_DONT_VERIFY);
            tls.dont_check_hostname = tls.dont_verify || config.get_bool(keys::TLS_DONT_CHECK_HOSTNAME);
            tls.enrollment_username = config.get(keys::TLS_ENROLLMENT_USERNAME);
            tls.enrollment_password = config.get(keys::TLS_ENROLLMENT_PASSWORD);
            tls.enrollment_passphrase = config.get(keys::TLS_ENROLLMENT_PASSPHRASE);
            tls.enrollment_url = config.get(keys::TLS_ENROLLMENT_URL);

            if (tls.client_cert.empty() && !tls.wants_enrollment()) {
                echo::error("TLS destination without ", keys::TLS_CLIENT_CERT);
                return dp::result::err(
                    dp::Error::invalid_argument(dp::String("Missing value: ") + keys::TLS_CLIENT_CERT));
            }
            return dp::result::ok(tls);
        }
    };

    // Client-side SSL_CTX built from a TlsConfig
    // Minimum protocol TLS 1.2, full chain verification and hostname matching unless overridden
    class TlsContext {
      private:
        SSL_CTX *ctx_;
        std::string password_;
        bool check_hostname_;
        PemBundle pem_; // extracted from a PKCS#12 certificate, removed with the context

        TlsContext(SSL_CTX *ctx, std::string password, bool check_hostname)
            : ctx_(ctx), password_(std::move(password)), check_hostname_(check_hostname) {
            // Key passwords go through OpenSSL's default PEM callback
            SSL_CTX_set_default_passwd_cb_userdata(ctx_, password_.empty() ? nullptr : password_.data());
        }

        static dp::Error resource_error(const TlsConfig &tls, const dp::String &cert, const dp::String &key) {
            echo::error("cannot load client certificate: ", detail::openssl_error().c_str());
            return dp::Error::invalid_argument(dp::String("Error opening resource. Using: ") + keys::TLS_CLIENT_CERT +
                                               "=" + cert + " [" + keys::TLS_CLIENT_KEY + "=" + key +
                                               "] Using Password: " + (tls.password().empty() ? "no" : "yes"));
        }

      public:
        ~TlsContext() {
            if (ctx_ != nullptr) {
                SSL_CTX_free(ctx_);
            }
            remove_pem_files(pem_);
        }

        TlsContext(const TlsContext &) = delete;
        TlsContext &operator=(const TlsContext &) = delete;

        static dp::Res<std::shared_ptr<TlsContext>> create(const TlsConfig &tls) {
            dp::String cert = tls.client_cert;
            dp::String key = tls.client_key;
            dp::String cafile = tls.client_cafile;

            if (cert.empty() || !std::filesystem::exists(cert.c_str())) {
                echo::error("client certificate not found: ", cert.c_str());
                return dp::result::err(dp::Error::invalid_argument(dp::String("Resource not found: ") +
                                                                   keys::TLS_CLIENT_CERT + "=" + cert));
            }
            if (!key.empty() && !std::filesystem::exists(key.c_str())) {
                echo::error("client key not found: ", key.c_str());
                return dp::result::err(
                    dp::Error::invalid_argument(dp::String("Resource not found: ") + keys::TLS_CLIENT_KEY + "=" + key));
            }

            PemBundle pem;
            std::string cert_path(cert.c_str());
            if (cert_path.size() > 4 && cert_path.compare(cert_path.size() - 4, 4, ".p12") == 0) {
                auto converted = convert_p12(cert, tls.password());
                if (converted.is_err()) {
                    return dp::result::err(converted.error());
                }
                pem = converted.value();
                cert = pem.cert_path;
                key = pem.key_path;
                if (cafile.empty()) {
                    cafile = pem.ca_path;
                }
            }

            SSL_CTX *raw = SSL_CTX_new(TLS_client_method());
            if (raw == nullptr) {
                remove_pem_files(pem);
                return dp::result::err(dp::Error::io_error(dp::String("SSL_CTX_new failed: ") + detail::openssl_error()));
            }
            std::shared_ptr<TlsContext> ctx(
                new TlsContext(raw, std::string(tls.password().c_str()), !tls.dont_check_hostname));
            ctx->pem_ = pem;

            SSL_CTX_set_options(raw, SSL_OP_NO_TLSv1 | SSL_OP_NO_TLSv1_1);
#ifdef SSL_OP_IGNORE_UNEXPECTED_EOF
            // OpenSSL 3: a peer closing without close_notify is end of stream, not a protocol error
            SSL_CTX_set_options(raw, SSL_OP_IGNORE_UNEXPECTED_EOF);
#endif
            if (SSL_CTX_set_cipher_list(raw, tls.client_ciphers.c_str()) != 1) {
                echo::error("invalid cipher list: ", tls.client_ciphers.c_str());
                return dp::result::err(dp::Error::invalid_argument(dp::String("invalid ") + keys::TLS_CLIENT_CIPHERS +
                                                                   "=" + tls.client_ciphers));
            }

            if (SSL_CTX_use_certificate_chain_file(raw, cert.c_str()) != 1) {
                return dp::result::err(resource_error(tls, cert, key));
            }
            const dp::String &key_file = key.empty() ? cert : key;
            if (SSL_CTX_use_PrivateKey_file(raw, key_file.c_str(), SSL_FILETYPE_PEM) != 1 ||
                SSL_CTX_check_private_key(raw) != 1) {
                return dp::result::err(resource_error(tls, cert, key));
            }

            SSL_CTX_set_verify(raw, SSL_VERIFY_PEER, nullptr);
            if (SSL_CTX_set_default_verify_paths(raw) != 1) {
                echo::warn("cannot load system CA store: ", detail::openssl_error().c_str());
            }
            if (!cafile.empty() && SSL_CTX_load_verify_locations(raw, cafile.c_str(), nullptr) != 1) {
                echo::error("cannot load CA file ", cafile.c_str(), ": ", detail::openssl_error().c_str());
                return dp::result::err(dp::Error::invalid_argument(dp::String("Resource not found: ") +
                                                                   keys::TLS_CLIENT_CAFILE + "=" + cafile));
            }

            if (tls.dont_check_hostname) {
                echo::warn("Disabled TLS Server Common Name Verification");
            }
            if (tls.dont_verify) {
                echo::warn("Disabled TLS Server Certificate Verification");
                SSL_CTX_set_verify(raw, SSL_VERIFY_NONE, nullptr);
            }

            echo::debug("TLS context ready cert=", cert.c_str(), " ciphers=", tls.client_ciphers.c_str());
            return dp::result::ok(ctx);
        }

        SSL_CTX *get() const { return ctx_; }

        bool check_hostname() const { return check_hostname_; }

        /// PEM files this context extracted; empty paths when the certificate was already PEM
        const PemBundle &pem_files() const { return pem_; }
    };

    // TLS connection over TCP; the reader and writer halves may run on different threads
    // The socket is non-blocking after the handshake and every SSL call holds ssl_mutex_,
    // so a blocked reader never holds the lock while it waits.
    class TlsConnection : public StreamSink, public ByteSource {
      private:
        std::shared_ptr<TlsContext> ctx_;
        TcpConnection tcp_;
        SSL *ssl_;
        std::mutex ssl_mutex_;
        std::mutex write_mutex_;
        Message pending_;
        std::atomic<bool> open_;

        // Wait until the socket is ready for what OpenSSL asked for
        dp::Res<void> wait_for(dp::i32 ssl_error) {
            struct pollfd pfd = {tcp_.fd(), static_cast<short>(ssl_error == SSL_ERROR_WANT_WRITE ? POLLOUT : POLLIN),
                                 0};
            while (true) {
                dp::i32 n = ::poll(&pfd, 1, -1);
                if (n >= 0) {
                    return dp::result::ok();
                }
                if (errno != EINTR) {
                    return dp::result::err(dp::Error::io_error(dp::String("poll failed: ") + strerror(errno)));
                }
            }
        }

      public:
        explicit TlsConnection(std::shared_ptr<TlsContext> ctx) : ctx_(std::move(ctx)), ssl_(nullptr), open_(false) {}

        ~TlsConnection() override {
            close();
            if (ssl_ != nullptr) {
                SSL_free(ssl_);
            }
        }

        TlsConnection(const TlsConnection &) = delete;
        TlsConnection &operator=(const TlsConnection &) = delete;

        /// Connect and complete the handshake
        /// server_hostname is matched against the certificate unless hostname checks are disabled;
        /// empty means endpoint.host
        dp::Res<void> connect(const TcpEndpoint &endpoint, const dp::String &server_hostname = dp::String()) {
            auto res = tcp_.connect(endpoint);
            if (res.is_err()) {
                return res;
            }

            ssl_ = SSL_new(ctx_->get());
            if (ssl_ == nullptr || SSL_set_fd(ssl_, tcp_.fd()) != 1) {
                tcp_.close();
                return dp::result::err(dp::Error::io_error(dp::String("SSL setup failed: ") + detail::openssl_error()));
            }

            dp::String expected = server_hostname.empty() ? endpoint.host : server_hostname;
            in6_addr literal = {};
            bool ip_literal = ::inet_pton(AF_INET, expected.c_str(), &literal) == 1 ||
                              ::inet_pton(AF_INET6, expected.c_str(), &literal) == 1;
            if (!ip_literal) {
                SSL_set_tlsext_host_name(ssl_, expected.c_str());
            }
            if (ctx_->check_hostname()) {
                bool ok = ip_literal ? X509_VERIFY_PARAM_set1_ip_asc(SSL_get0_param(ssl_), expected.c_str()) == 1
                                     : SSL_set1_host(ssl_, expected.c_str()) == 1;
                if (!ok) {
                    tcp_.close();
                    return dp::result::err(
                        dp::Error::invalid_argument(dp::String("invalid server hostname: ") + expected));
                }
            }

            echo::trace("TLS handshake with ", endpoint.to_string());
            dp::i32 ret = SSL_connect(ssl_);
            if (ret != 1) {
                long verify = SSL_get_verify_result(ssl_);
                dp::String reason = detail::openssl_error();
                tcp_.close();
                if (verify != X509_V_OK) {
                    echo::error("TLS certificate verification failed for ", endpoint.to_string(), ": ",
                                X509_verify_cert_error_string(verify));
                    return dp::result::err(dp::Error::io_error(
                        dp::String("Could not verify TLS Certificate for TAK Server (") +
                        X509_verify_cert_error_string(verify) + "). " + TLS_VERIFY_HINT));
                }
                echo::error("TLS handshake with ", endpoint.to_string(), " failed: ", reason.c_str());
                return dp::result::err(dp::Error::io_error(dp::String("TLS handshake failed: ") + reason));
            }

            dp::i32 flags = ::fcntl(tcp_.fd(), F_GETFL, 0);
            if (flags < 0 || ::fcntl(tcp_.fd(), F_SETFL, flags | O_NONBLOCK) < 0) {
                tcp_.close();
                return dp::result::err(dp::Error::io_error("cannot make socket non-blocking"));
            }

            open_ = true;
            echo::info("TlsConnection established with ", endpoint.to_string(), " (", SSL_get_version(ssl_), ", ",
                       SSL_get_cipher_name(ssl_), ")");
            return dp::result::ok();
        }

        dp::Res<void> write(const Message &msg) override {
            std::lock_guard<std::mutex> lock(write_mutex_);
            if (!open_) {
                return dp::result::err(dp::Error::not_found("not connected"));
            }
            pending_.insert(pending_.end(), msg.begin(), msg.end());
            return dp::result::ok();
        }

        dp::Res<void> drain() override {
            std::lock_guard<std::mutex> lock(write_mutex_);
            dp::usize written = 0;
            while (written < pending_.size()) {
                if (!open_) {
                    return dp::result::err(dp::Error::not_found("not connected"));
                }
                dp::i32 n = 0;
                dp::i32 error = SSL_ERROR_NONE;
                {
                    std::lock_guard<std::mutex> ssl_lock(ssl_mutex_);
                    n = SSL_write(ssl_, pending_.data() + written, static_cast<int>(pending_.size() - written));
                    if (n <= 0) {
                        error = SSL_get_error(ssl_, n);
                    }
                }
                if (n > 0) {
                    written += static_cast<dp::usize>(n);
                    continue;
                }
                if (error == SSL_ERROR_WANT_READ || error == SSL_ERROR_WANT_WRITE) {
                    auto res = wait_for(error);
                    if (res.is_err()) {
                        return res;
                    }
                    continue;
                }
                open_ = false;
                dp::String reason = detail::openssl_error();
                echo::error("TLS write failed: ", reason.c_str());
                return dp::result::err(dp::Error::not_found(dp::String("TLS write failed: ") + reason));
            }
            echo::debug("sent ", written, " bytes over TLS");
            pending_.clear();
            return dp::result::ok();
        }

        dp::Res<dp::usize> read_some(dp::u8 *buffer, dp::usize count) override {
            while (true) {
                if (ssl_ == nullptr) {
                    return dp::result::err(dp::Error::not_found("not connected"));
                }
                dp::i32 n = 0;
                dp::i32 error = SSL_ERROR_NONE;
                {
                    std::lock_guard<std::mutex> ssl_lock(ssl_mutex_);
                    n = SSL_read(ssl_, buffer, static_cast<int>(count));
                    if (n <= 0) {
                        error = SSL_get_error(ssl_, n);
                    }
                }
                if (n > 0) {
                    return dp::result::ok(static_cast<dp::usize>(n));
                }
                if (error == SSL_ERROR_WANT_READ || error == SSL_ERROR_WANT_WRITE) {
                    auto res = wait_for(error);
                    if (res.is_err()) {
                        return dp::result::err(res.error());
                    }
                    continue;
                }
                if (error == SSL_ERROR_ZERO_RETURN || (error == SSL_ERROR_SYSCALL && ERR_peek_error() == 0)) {
                    // close_notify, or the socket was shut down underneath us
                    echo::trace("TLS stream ended");
                    return dp::result::ok(dp::usize(0));
                }
                dp::String reason = detail::openssl_error();
                echo::error("TLS read failed: ", reason.c_str());
                return dp::result::err(dp::Error::io_error(dp::String("TLS read failed: ") + reason));
            }
        }

        void close() override {
            if (open_.exchange(false)) {
                std::lock_guard<std::mutex> ssl_lock(ssl_mutex_);
                SSL_shutdown(ssl_);
            }
            tcp_.close();
        }

        bool is_connected() const { return open_; }
    };

} // namespace takpipe
