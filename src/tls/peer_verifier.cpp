#include "peer_verifier.hpp"
#include <core/log.hpp>
#include <core/utils.hpp>
#include <fmt/format.h>
#include <vector>
#include <openssl/err.h>
#include <openssl/x509v3.h>

static const char* kTag = "tls";

static std::string format_tolerance(std::chrono::seconds tolerance) {
    auto hours = std::chrono::duration_cast<std::chrono::hours>(tolerance);
    if (hours == tolerance) return fmt::format("{}h", hours.count());
    return fmt::format("{}s", tolerance.count());
}

PinnedChainVerifier::PinnedChainVerifier(X509StorePtr store, size_t anchor_count,
                                         std::chrono::seconds tolerance)
    : store_(std::move(store)), anchor_count_(anchor_count), tolerance_(tolerance) {}

Result<std::shared_ptr<PinnedChainVerifier>> PinnedChainVerifier::from_pem(
        const std::string& pem, std::chrono::seconds tolerance) {
    using R = Result<std::shared_ptr<PinnedChainVerifier>>;

    auto parsed = parse_pem_certificates(pem);
    if (parsed.is_err()) {
        return R::Err(parsed.kind, parsed.error);
    }

    X509StorePtr store(X509_STORE_new());
    if (!store) {
        return R::Err(ErrorKind::Config, "cannot allocate trust store: " + openssl_error_string());
    }
    for (const auto& cert : parsed.value) {
        // The store takes its own reference
        if (X509_STORE_add_cert(store.get(), cert.get()) != 1) {
            return R::Err(ErrorKind::CertificateParse,
                "failed to append certificate to pool: " + openssl_error_string());
        }
    }

    size_t count = parsed.value.size();
    log_debug(kTag, fmt::format("pinned {} anchor(s), first {}", count,
                                subject_name(parsed.value.front().get())));
    return R::Ok(std::make_shared<PinnedChainVerifier>(std::move(store), count, tolerance));
}

PeerVerifyFn PinnedChainVerifier::as_strategy(std::shared_ptr<const PinnedChainVerifier> verifier) {
    return [verifier](const CertificateChain& chain) {
        return verifier->verify(chain);
    };
}

Result<void> PinnedChainVerifier::verify(const CertificateChain& chain) const {
    return verify_at(chain, std::time(nullptr));
}

Result<void> PinnedChainVerifier::verify_at(const CertificateChain& chain, std::time_t now) const {
    std::vector<X509Ptr> certs;
    certs.reserve(chain.size());
    for (const auto& der : chain) {
        auto parsed = parse_der_certificate(der);
        if (parsed.is_err()) {
            return Result<void>::Err(parsed.kind, parsed.error);
        }
        certs.push_back(std::move(parsed.value));
    }

    if (certs.empty()) {
        return Result<void>::Err(ErrorKind::Verification, "no certificates provided");
    }

    // Coarse window check before any chain building
    const std::time_t skew = static_cast<std::time_t>(tolerance_.count());
    const std::time_t earliest_valid = now - skew;
    const std::time_t latest_valid = now + skew;

    for (const auto& cert : certs) {
        std::time_t nb = not_before(cert.get());
        std::time_t na = not_after(cert.get());
        if (nb > latest_valid) {
            return Result<void>::Err(ErrorKind::Verification,
                fmt::format("certificate not yet valid: NotBefore {} is after {} (clock skew tolerance: {})",
                            format_utc(nb), format_utc(latest_valid), format_tolerance(tolerance_)));
        }
        if (na < earliest_valid) {
            return Result<void>::Err(ErrorKind::Verification,
                fmt::format("certificate expired: NotAfter {} is before {} (clock skew tolerance: {})",
                            format_utc(na), format_utc(earliest_valid), format_tolerance(tolerance_)));
        }
    }

    // Peer-supplied intermediates are untrusted chain material; the vector
    // keeps ownership, the stack only borrows.
    STACK_OF(X509)* intermediates = sk_X509_new_null();
    if (!intermediates) {
        return Result<void>::Err(ErrorKind::Verification,
            "cannot allocate certificate stack: " + openssl_error_string());
    }
    for (size_t i = 1; i < certs.size(); i++) {
        sk_X509_push(intermediates, certs[i].get());
    }

    Result<void> last = Result<void>::Ok();
    for (std::time_t when : {now, latest_valid, earliest_valid}) {
        last = verify_chain_at(certs[0].get(), intermediates, when);
        if (last.is_ok()) {
            if (when != now) {
                log_debug(kTag, fmt::format("chain for {} verified at skewed time {}",
                                            subject_name(certs[0].get()), format_utc(when)));
            }
            break;
        }
    }
    sk_X509_free(intermediates);

    if (last.is_err()) {
        log_warn(kTag, fmt::format("peer {} rejected: {}", subject_name(certs[0].get()), last.error));
        return Result<void>::Err(ErrorKind::Verification,
                                 "certificate verification failed: " + last.error);
    }
    return Result<void>::Ok();
}

Result<void> PinnedChainVerifier::verify_chain_at(X509* leaf, STACK_OF(X509)* intermediates,
                                                  std::time_t when) const {
    X509StoreCtxPtr ctx(X509_STORE_CTX_new());
    if (!ctx || X509_STORE_CTX_init(ctx.get(), store_.get(), leaf, intermediates) != 1) {
        return Result<void>::Err(ErrorKind::Verification,
            "cannot initialise verification context: " + openssl_error_string());
    }
    X509_STORE_CTX_set_time(ctx.get(), 0, when);
    X509_STORE_CTX_set_purpose(ctx.get(), X509_PURPOSE_SSL_SERVER);

    if (X509_verify_cert(ctx.get()) == 1) {
        return Result<void>::Ok();
    }

    int err = X509_STORE_CTX_get_error(ctx.get());
    // Leave no stale entries behind for the next handshake
    ERR_clear_error();
    return Result<void>::Err(ErrorKind::Verification,
        fmt::format("{} (depth {}, checked at {})", X509_verify_cert_error_string(err),
                    X509_STORE_CTX_get_error_depth(ctx.get()), format_utc(when)));
}
