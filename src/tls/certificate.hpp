#pragma once

#include <string>
#include <vector>
#include <memory>
#include <ctime>
#include <openssl/ssl.h>
#include <openssl/x509.h>
#include <core/types.hpp>

// ── OpenSSL ownership ──────────────────────────────────────────

struct X509Deleter          { void operator()(X509* p) const { X509_free(p); } };
struct X509StoreDeleter     { void operator()(X509_STORE* p) const { X509_STORE_free(p); } };
struct X509StoreCtxDeleter  { void operator()(X509_STORE_CTX* p) const { X509_STORE_CTX_free(p); } };
struct SslCtxDeleter        { void operator()(SSL_CTX* p) const { SSL_CTX_free(p); } };
struct SslDeleter           { void operator()(SSL* p) const { SSL_free(p); } };
struct BioDeleter           { void operator()(BIO* p) const { BIO_free(p); } };

using X509Ptr         = std::unique_ptr<X509, X509Deleter>;
using X509StorePtr    = std::unique_ptr<X509_STORE, X509StoreDeleter>;
using X509StoreCtxPtr = std::unique_ptr<X509_STORE_CTX, X509StoreCtxDeleter>;
using SslCtxPtr       = std::unique_ptr<SSL_CTX, SslCtxDeleter>;
using SslPtr          = std::unique_ptr<SSL, SslDeleter>;
using BioPtr          = std::unique_ptr<BIO, BioDeleter>;

// Raw DER certificates as presented by a peer, leaf first.
using CertificateChain = std::vector<std::string>;

// Drain the OpenSSL error queue into one line ("" if empty).
std::string openssl_error_string();

// Every certificate in a PEM bundle. Fails with CertificateParse if the
// input holds no parsable certificate.
Result<std::vector<X509Ptr>> parse_pem_certificates(const std::string& pem);

// Exactly one DER certificate, no trailing bytes.
Result<X509Ptr> parse_der_certificate(const std::string& der);

std::string to_der(X509* cert);
std::string to_pem(X509* cert);

// notBefore / notAfter as UTC time_t.
std::time_t not_before(const X509* cert);
std::time_t not_after(const X509* cert);

// One-line subject, e.g. "CN=localhost".
std::string subject_name(const X509* cert);
