#pragma once

#include <memory>
#include <string>
#include <core/types.hpp>
#include "certificate.hpp"
#include "cookie_jar.hpp"
#include "http_message.hpp"
#include "peer_verifier.hpp"

// Perform one HTTP request, get one HTTP response or an error.
class HttpClient {
public:
    virtual ~HttpClient() = default;
    virtual Result<HttpResponse> send(const HttpRequest& request) = 0;
};

struct TransportOptions {
    std::string min_tls_version = "1.2";   // "1.2" or "1.3"
    int timeout_secs = 30;
};

// HTTPS over OpenSSL with the library's chain verification replaced by a
// PeerVerifyFn. One connection per request.
class HttpsClient : public HttpClient {
public:
    static Result<std::unique_ptr<HttpsClient>> create(PeerVerifyFn verify,
                                                       const TransportOptions& options);
    ~HttpsClient() override;

    HttpsClient(const HttpsClient&) = delete;
    HttpsClient& operator=(const HttpsClient&) = delete;

    Result<HttpResponse> send(const HttpRequest& request) override;

    CookieJar& cookies() { return jar_; }
    const TransportOptions& options() const { return options_; }

private:
    HttpsClient(SslCtxPtr ctx, PeerVerifyFn verify, TransportOptions options);

    static int verify_callback(X509_STORE_CTX* store_ctx, void* arg);
    Result<HttpResponse> exchange(SSL* ssl, const Url& url, const std::string& wire,
                                  bool expect_body);

    SslCtxPtr ctx_;
    PeerVerifyFn verify_;
    TransportOptions options_;
    CookieJar jar_;
    std::string verify_error_;     // message from the last rejected handshake
};
