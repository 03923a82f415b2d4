#pragma once

#include <takpipe/crypto.hpp>
#include <takpipe/stream/tls.hpp>

namespace takpipe {

    // Parameters handed to the certificate enrollment service
    struct EnrollmentRequest {
        dp::String domain;      // enrollment server host
        dp::String username;
        dp::String password;
        dp::String output_path; // where the PKCS#12 container must be written
        dp::String passphrase;  // protects the PKCS#12 container
    };

    /// Obtains a client certificate from a TAK server's enrollment API
    /// Implementations write a PKCS#12 container to request.output_path, protected by request.passphrase
    class CertificateEnrollment {
      public:
        virtual ~CertificateEnrollment() = default;

        virtual dp::Res<void> begin_enrollment(const EnrollmentRequest &request) const = 0;
    };

    /// Run enrollment for a TLS destination and point the config at the resulting certificate
    /// A random passphrase is generated when none is configured. The enrollment server defaults
    /// to the destination host.
    inline dp::Res<TlsConfig> enroll(TlsConfig tls, const dp::String &host, const CertificateEnrollment *enrollment) {
        if (enrollment == nullptr) {
            echo::error("enrollment credentials configured but no enrollment service available");
            return dp::result::err(dp::Error::invalid_argument(
                dp::String(keys::TLS_ENROLLMENT_USERNAME) + " is set but no certificate enrollment service is available"));
        }

        if (tls.enrollment_passphrase.empty()) {
            auto passphrase = generate_passphrase();
            if (passphrase.is_err()) {
                return dp::result::err(passphrase.error());
            }
            tls.enrollment_passphrase = passphrase.value();
            echo::info("generated a passphrase for enrollment");
        }

        auto output_path = make_temp_path(".p12");
        if (output_path.is_err()) {
            return dp::result::err(output_path.error());
        }

        EnrollmentRequest request;
        request.domain = tls.enrollment_url.empty() ? host : tls.enrollment_url;
        request.username = tls.enrollment_username;
        request.password = tls.enrollment_password;
        request.output_path = output_path.value();
        request.passphrase = tls.enrollment_passphrase;

        echo::info("enrolling ", request.username.c_str(), " with ", request.domain.c_str());
        auto res = enrollment->begin_enrollment(request);
        if (res.is_err()) {
            echo::error("certificate enrollment failed: ", res.error().message.c_str());
            return dp::result::err(res.error());
        }

        tls.client_cert = request.output_path;
        echo::debug("enrolled certificate written to ", tls.client_cert.c_str());
        return dp::result::ok(tls);
    }

} // namespace takpipe
