#include "client_factory.hpp"
#include <core/log.hpp>
#include <chrono>

HttpClientFactory::HttpClientFactory() = default;

HttpClientFactory::HttpClientFactory(const TlsConfig& config) : config_(config) {}

Result<std::unique_ptr<HttpClient>> HttpClientFactory::new_client_for_self_signed_server(
        const std::string& certificate_pem) const {
    using R = Result<std::unique_ptr<HttpClient>>;

    auto verifier = PinnedChainVerifier::from_pem(certificate_pem,
                                                  std::chrono::hours(config_.clock_skew_hours));
    if (verifier.is_err()) {
        log_error("tls", verifier.error);
        return R::Err(verifier.kind, verifier.error);
    }

    TransportOptions options;
    options.min_tls_version = config_.min_version;
    options.timeout_secs = config_.timeout_secs;

    auto client = HttpsClient::create(PinnedChainVerifier::as_strategy(verifier.value), options);
    if (client.is_err()) {
        log_error("tls", client.error);
        return R::Err(client.kind, client.error);
    }
    return R::Ok(std::move(client.value));
}
