#pragma once

#include <memory>
#include <string>
#include <core/types.hpp>
#include "https_client.hpp"

// Builds HTTPS clients that trust exactly one self-signed server identity.
class HttpClientFactory {
public:
    HttpClientFactory();
    explicit HttpClientFactory(const TlsConfig& config);

    // Client pinned to the certificate(s) in `certificate_pem`, with the
    // skew-tolerant verifier and a fresh cookie jar. Fails with
    // CertificateParse when the PEM holds no certificate.
    Result<std::unique_ptr<HttpClient>> new_client_for_self_signed_server(
        const std::string& certificate_pem) const;

    const TlsConfig& config() const { return config_; }

private:
    TlsConfig config_;
};
