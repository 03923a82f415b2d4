#pragma once

#include <takpipe/common.hpp>

#include <openssl/err.h>
#include <openssl/evp.h>
#include <openssl/pem.h>
#include <openssl/pkcs12.h>
#include <openssl/rand.h>
#include <openssl/x509.h>

#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <initializer_list>
#include <memory>
#include <string>
#include <system_error>

namespace takpipe {

    // PEM files extracted from a PKCS#12 container
    struct PemBundle {
        dp::String key_path;
        dp::String cert_path;
        dp::String ca_path; // empty if the container carries no CA certificate
    };

    /// Delete the files of a bundle; missing files are ignored
    inline void remove_pem_files(const PemBundle &bundle) {
        for (const dp::String *path : {&bundle.key_path, &bundle.cert_path, &bundle.ca_path}) {
            if (path->empty()) {
                continue;
            }
            std::error_code ec;
            std::filesystem::remove(path->c_str(), ec);
            if (ec) {
                echo::warn("cannot remove ", path->c_str(), ": ", ec.message().c_str());
            } else {
                echo::trace("removed ", path->c_str());
            }
        }
    }

    namespace detail {

        struct BioFree {
            void operator()(BIO *bio) const { BIO_free(bio); }
        };
        struct Pkcs12Free {
            void operator()(PKCS12 *p12) const { PKCS12_free(p12); }
        };
        struct PkeyFree {
            void operator()(EVP_PKEY *pkey) const { EVP_PKEY_free(pkey); }
        };
        struct X509Free {
            void operator()(X509 *cert) const { X509_free(cert); }
        };
        struct X509StackFree {
            void operator()(STACK_OF(X509) * stack) const { sk_X509_pop_free(stack, X509_free); }
        };
        struct FileClose {
            void operator()(FILE *fp) const { std::fclose(fp); }
        };

        // Last OpenSSL error as text, clearing the error queue
        inline dp::String openssl_error() {
            unsigned long code = ERR_get_error();
            ERR_clear_error();
            if (code == 0) {
                return dp::String("unknown error");
            }
            char buf[256];
            ERR_error_string_n(code, buf, sizeof(buf));
            return dp::String(buf);
        }

        struct TempFile {
            dp::String path;
            std::unique_ptr<FILE, FileClose> file;
        };

        // Create a private (0600) file in the temp directory and open it for writing
        inline dp::Res<TempFile> open_temp(const char *suffix) {
            std::error_code ec;
            std::filesystem::path dir = std::filesystem::temp_directory_path(ec);
            if (ec) {
                dir = "/tmp";
            }
            std::string pattern = (dir / "takpipe-XXXXXX").string() + suffix;
            dp::i32 fd = ::mkstemps(pattern.data(), static_cast<int>(std::strlen(suffix)));
            if (fd < 0) {
                echo::error("mkstemps ", pattern.c_str(), " failed: ", strerror(errno));
                return dp::result::err(dp::Error::io_error("cannot create temporary file"));
            }
            FILE *fp = ::fdopen(fd, "wb");
            if (fp == nullptr) {
                ::close(fd);
                return dp::result::err(dp::Error::io_error("cannot open temporary file"));
            }
            echo::trace("temporary file ", pattern.c_str());
            return dp::result::ok(TempFile{dp::String(pattern.c_str()), std::unique_ptr<FILE, FileClose>(fp)});
        }

    } // namespace detail

    /// Reserve a fresh, empty temporary file ending in suffix (e.g. ".p12") and return its path
    inline dp::Res<dp::String> make_temp_path(const char *suffix) {
        auto temp = detail::open_temp(suffix);
        if (temp.is_err()) {
            return dp::result::err(temp.error());
        }
        return dp::result::ok(temp.value().path);
    }

    /// Random URL-safe text from nbytes of entropy (unpadded base64url)
    inline dp::Res<dp::String> generate_passphrase(dp::usize nbytes = DEFAULT_ENROLLMENT_PASSPHRASE_LENGTH) {
        Message raw(nbytes);
        if (RAND_bytes(raw.data(), static_cast<int>(raw.size())) != 1) {
            return dp::result::err(dp::Error::io_error(dp::String("RAND_bytes failed: ") + detail::openssl_error()));
        }

        std::string encoded(4 * ((nbytes + 2) / 3) + 1, '\0');
        int len = EVP_EncodeBlock(reinterpret_cast<unsigned char *>(encoded.data()), raw.data(),
                                  static_cast<int>(raw.size()));
        encoded.resize(static_cast<dp::usize>(len));
        while (!encoded.empty() && encoded.back() == '=') {
            encoded.pop_back();
        }
        for (char &c : encoded) {
            if (c == '+') {
                c = '-';
            } else if (c == '/') {
                c = '_';
            }
        }
        return dp::result::ok(dp::String(encoded.c_str()));
    }

    /// Split a PKCS#12 container into PEM files: PKCS#8 private key, client certificate, first CA
    /// The key is written unencrypted to a 0600 temporary file; the caller removes the files with remove_pem_files
    inline dp::Res<PemBundle> convert_p12(const dp::String &p12_path, const dp::String &password) {
        echo::debug("converting PKCS#12 ", p12_path.c_str(), " to PEM");

        std::unique_ptr<BIO, detail::BioFree> bio(BIO_new_file(p12_path.c_str(), "rb"));
        if (!bio) {
            echo::error("cannot open ", p12_path.c_str());
            return dp::result::err(
                dp::Error::invalid_argument(dp::String("Resource not found: ") + p12_path));
        }

        std::unique_ptr<PKCS12, detail::Pkcs12Free> p12(d2i_PKCS12_bio(bio.get(), nullptr));
        if (!p12) {
            return dp::result::err(dp::Error::invalid_argument(dp::String("not a PKCS#12 file: ") + p12_path));
        }

        EVP_PKEY *pkey_raw = nullptr;
        X509 *cert_raw = nullptr;
        STACK_OF(X509) *ca_raw = nullptr;
        if (PKCS12_parse(p12.get(), password.c_str(), &pkey_raw, &cert_raw, &ca_raw) != 1) {
            dp::String reason = detail::openssl_error();
            echo::error("PKCS12_parse ", p12_path.c_str(), " failed: ", reason.c_str());
            return dp::result::err(
                dp::Error::invalid_argument(dp::String("cannot decrypt PKCS#12 file (wrong password?): ") + p12_path));
        }
        std::unique_ptr<EVP_PKEY, detail::PkeyFree> pkey(pkey_raw);
        std::unique_ptr<X509, detail::X509Free> cert(cert_raw);
        std::unique_ptr<STACK_OF(X509), detail::X509StackFree> ca(ca_raw);

        if (!pkey || !cert) {
            return dp::result::err(
                dp::Error::invalid_argument(dp::String("PKCS#12 file has no key or certificate: ") + p12_path));
        }

        PemBundle bundle;

        auto key_file = detail::open_temp(".pem");
        if (key_file.is_err()) {
            return dp::result::err(key_file.error());
        }
        bundle.key_path = key_file.value().path;
        if (PEM_write_PKCS8PrivateKey(key_file.value().file.get(), pkey.get(), nullptr, nullptr, 0, nullptr,
                                      nullptr) != 1) {
            remove_pem_files(bundle);
            return dp::result::err(dp::Error::io_error(dp::String("cannot write key PEM: ") + detail::openssl_error()));
        }

        auto cert_file = detail::open_temp(".pem");
        if (cert_file.is_err()) {
            remove_pem_files(bundle);
            return dp::result::err(cert_file.error());
        }
        bundle.cert_path = cert_file.value().path;
        if (PEM_write_X509(cert_file.value().file.get(), cert.get()) != 1) {
            remove_pem_files(bundle);
            return dp::result::err(
                dp::Error::io_error(dp::String("cannot write certificate PEM: ") + detail::openssl_error()));
        }

        if (ca && sk_X509_num(ca.get()) > 0) {
            auto ca_file = detail::open_temp(".pem");
            if (ca_file.is_err()) {
                remove_pem_files(bundle);
                return dp::result::err(ca_file.error());
            }
            bundle.ca_path = ca_file.value().path;
            if (PEM_write_X509(ca_file.value().file.get(), sk_X509_value(ca.get(), 0)) != 1) {
                remove_pem_files(bundle);
                return dp::result::err(
                    dp::Error::io_error(dp::String("cannot write CA PEM: ") + detail::openssl_error()));
            }
        }

        echo::info("extracted PEM key=", bundle.key_path.c_str(), " cert=", bundle.cert_path.c_str(),
                   " ca=", bundle.ca_path.empty() ? "(none)" : bundle.ca_path.c_str());
        return dp::result::ok(bundle);
    }

} // namespace takpipe
