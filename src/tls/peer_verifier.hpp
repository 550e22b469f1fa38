#pragma once

#include <chrono>
#include <ctime>
#include <functional>
#include <memory>
#include <string>
#include <core/types.hpp>
#include "certificate.hpp"

// Verification strategy invoked with the raw peer chain on every handshake.
// Returning an error aborts the handshake.
using PeerVerifyFn = std::function<Result<void>(const CertificateChain&)>;

// PinnedChainVerifier: trusts only the anchors it was built from.
//
// A chain is accepted when it verifies against the pinned anchors at one of
// three reference times: now, now + tolerance, now - tolerance. Before that,
// any certificate whose validity window lies entirely outside
// [now - tolerance, now + tolerance] is rejected outright.
class PinnedChainVerifier {
public:
    // Trust pool holding every certificate in the PEM (at least one).
    static Result<std::shared_ptr<PinnedChainVerifier>> from_pem(
        const std::string& pem, std::chrono::seconds tolerance);

    Result<void> verify(const CertificateChain& chain) const;
    Result<void> verify_at(const CertificateChain& chain, std::time_t now) const;

    std::chrono::seconds tolerance() const { return tolerance_; }
    size_t anchor_count() const { return anchor_count_; }

    // Strategy object for the TLS transport; keeps the verifier alive.
    static PeerVerifyFn as_strategy(std::shared_ptr<const PinnedChainVerifier> verifier);

    PinnedChainVerifier(X509StorePtr store, size_t anchor_count, std::chrono::seconds tolerance);

private:
    Result<void> verify_chain_at(X509* leaf, STACK_OF(X509)* intermediates, std::time_t when) const;

    X509StorePtr store_;
    size_t anchor_count_;
    std::chrono::seconds tolerance_;
};
