#include "https_client.hpp"
#include <core/constants.hpp>
#include <core/log.hpp>
#include <platform/socket_util.hpp>
#include <fmt/format.h>
#include <cerrno>
#include <cstring>
#include <ctime>
#include <openssl/err.h>

static const char* kTag = "https";

HttpsClient::HttpsClient(SslCtxPtr ctx, PeerVerifyFn verify, TransportOptions options)
    : ctx_(std::move(ctx)), verify_(std::move(verify)), options_(std::move(options)) {}

HttpsClient::~HttpsClient() = default;

Result<std::unique_ptr<HttpsClient>> HttpsClient::create(PeerVerifyFn verify,
                                                         const TransportOptions& options) {
    using R = Result<std::unique_ptr<HttpsClient>>;

    if (!verify) {
        return R::Err(ErrorKind::Config, "no peer verification strategy supplied");
    }

    int min_version = 0;
    if (options.min_tls_version == "1.2") {
        min_version = TLS1_2_VERSION;
    } else if (options.min_tls_version == "1.3") {
        min_version = TLS1_3_VERSION;
    } else {
        return R::Err(ErrorKind::Config,
            fmt::format("unsupported minimum TLS version '{}'", options.min_tls_version));
    }

    SslCtxPtr ctx(SSL_CTX_new(TLS_client_method()));
    if (!ctx) {
        return R::Err(ErrorKind::Config, "cannot create TLS context: " + openssl_error_string());
    }
    if (SSL_CTX_set_min_proto_version(ctx.get(), min_version) != 1) {
        return R::Err(ErrorKind::Config, "cannot set minimum TLS version: " + openssl_error_string());
    }
#ifdef SSL_OP_IGNORE_UNEXPECTED_EOF
    // Servers answering "Connection: close" often skip close_notify
    SSL_CTX_set_options(ctx.get(), SSL_OP_IGNORE_UNEXPECTED_EOF);
#endif

    std::unique_ptr<HttpsClient> client(new HttpsClient(std::move(ctx), std::move(verify), options));

    // The callback replaces X509_verify_cert entirely; VERIFY_PEER makes a
    // rejection abort the handshake.
    SSL_CTX_set_verify(client->ctx_.get(), SSL_VERIFY_PEER, nullptr);
    SSL_CTX_set_cert_verify_callback(client->ctx_.get(), &HttpsClient::verify_callback, client.get());

    log_debug(kTag, fmt::format("client ready (min TLS {}, timeout {}s)",
                                options.min_tls_version, options.timeout_secs));
    return R::Ok(std::move(client));
}

int HttpsClient::verify_callback(X509_STORE_CTX* store_ctx, void* arg) {
    auto* self = static_cast<HttpsClient*>(arg);

    CertificateChain chain;
    STACK_OF(X509)* presented = X509_STORE_CTX_get0_untrusted(store_ctx);
    if (presented && sk_X509_num(presented) > 0) {
        for (int i = 0; i < sk_X509_num(presented); i++) {
            chain.push_back(to_der(sk_X509_value(presented, i)));
        }
    } else if (X509* leaf = X509_STORE_CTX_get0_cert(store_ctx)) {
        chain.push_back(to_der(leaf));
    }

    auto result = self->verify_(chain);
    if (result.is_err()) {
        self->verify_error_ = result.error;
        X509_STORE_CTX_set_error(store_ctx, X509_V_ERR_APPLICATION_VERIFICATION);
        return 0;
    }
    X509_STORE_CTX_set_error(store_ctx, X509_V_OK);
    return 1;
}

Result<HttpResponse> HttpsClient::send(const HttpRequest& request) {
    auto url = Url::parse(request.url);
    if (url.is_err()) {
        return Result<HttpResponse>::Err(url.kind, url.error);
    }
    if (url.value.scheme != "https") {
        return Result<HttpResponse>::Err(ErrorKind::Transport,
            fmt::format("unsupported URL scheme '{}'", url.value.scheme));
    }

    std::string wire = serialize_request(request, url.value,
                                         jar_.cookie_header(url.value, std::time(nullptr)));

    auto sock = platform::connect_tcp(url.value.host, url.value.port, options_.timeout_secs * 1000);
    if (sock.is_err()) {
        log_warn(kTag, sock.error);
        return Result<HttpResponse>::Err(sock.kind, sock.error);
    }
    platform::SocketGuard guard(sock.value);

    SslPtr ssl(SSL_new(ctx_.get()));
    if (!ssl || SSL_set_fd(ssl.get(), static_cast<int>(sock.value)) != 1) {
        return Result<HttpResponse>::Err(ErrorKind::Transport,
            "cannot create TLS session: " + openssl_error_string());
    }
    if (!url.value.host_is_ip() &&
        SSL_set_tlsext_host_name(ssl.get(), url.value.host.c_str()) != 1) {
        return Result<HttpResponse>::Err(ErrorKind::Transport,
            "cannot set SNI host name: " + openssl_error_string());
    }

    verify_error_.clear();
    if (SSL_connect(ssl.get()) != 1) {
        std::string detail = openssl_error_string();
        if (!verify_error_.empty()) {
            log_warn(kTag, fmt::format("handshake with {}:{} rejected: {}",
                                       url.value.host, url.value.port, verify_error_));
            return Result<HttpResponse>::Err(ErrorKind::Verification, verify_error_);
        }
        std::string msg = fmt::format("TLS handshake with {}:{} failed: {}", url.value.host,
                                      url.value.port, detail.empty() ? "connection closed" : detail);
        log_warn(kTag, msg);
        return Result<HttpResponse>::Err(ErrorKind::Transport, msg);
    }
    log_debug(kTag, fmt::format("{} {} over {}", request.method, request.url,
                                SSL_get_version(ssl.get())));

    auto response = exchange(ssl.get(), url.value, wire, request.method != "HEAD");
    SSL_shutdown(ssl.get());
    if (response.is_err()) {
        log_warn(kTag, response.error);
        return response;
    }

    auto set_cookies = response.value.header_values("Set-Cookie");
    if (!set_cookies.empty()) {
        jar_.set_cookies(url.value, set_cookies, std::time(nullptr));
    }
    log_debug(kTag, fmt::format("{} {} -> {} ({} bytes)", request.method, request.url,
                                response.value.status, response.value.body.size()));
    return response;
}

Result<HttpResponse> HttpsClient::exchange(SSL* ssl, const Url& url, const std::string& wire,
                                           bool expect_body) {
    size_t offset = 0;
    while (offset < wire.size()) {
        errno = 0;
        int rc = SSL_write(ssl, wire.data() + offset, static_cast<int>(wire.size() - offset));
        if (rc <= 0) {
            return Result<HttpResponse>::Err(ErrorKind::Transport,
                fmt::format("write to {} failed: {}", url.host,
                            SSL_get_error(ssl, rc) == SSL_ERROR_SYSCALL
                                ? std::string(strerror(errno)) : openssl_error_string()));
        }
        offset += static_cast<size_t>(rc);
    }

    std::string raw;
    char buf[HTTP_READ_BUF_SIZE];
    HttpResponse response;
    std::string error;
    bool eof = false;

    while (true) {
        auto state = parse_response(raw, eof, expect_body, response, error);
        if (state == ParseState::Complete) break;
        if (state == ParseState::Error) {
            return Result<HttpResponse>::Err(ErrorKind::Transport,
                fmt::format("bad response from {}: {}", url.host, error));
        }

        errno = 0;
        int n = SSL_read(ssl, buf, sizeof(buf));
        if (n > 0) {
            raw.append(buf, static_cast<size_t>(n));
            continue;
        }

        int err = SSL_get_error(ssl, n);
        if (err == SSL_ERROR_ZERO_RETURN) {
            eof = true;
        } else if (err == SSL_ERROR_SYSCALL && errno == 0) {
            eof = true;                 // TCP close without close_notify
        } else if (err == SSL_ERROR_WANT_READ || err == SSL_ERROR_WANT_WRITE ||
                   (err == SSL_ERROR_SYSCALL && (errno == EAGAIN || errno == EWOULDBLOCK))) {
            // SO_RCVTIMEO expired
            return Result<HttpResponse>::Err(ErrorKind::Transport,
                fmt::format("timed out after {}s waiting for {}", options_.timeout_secs, url.host));
        } else {
            std::string detail = err == SSL_ERROR_SYSCALL ? std::string(strerror(errno))
                                                          : openssl_error_string();
            return Result<HttpResponse>::Err(ErrorKind::Transport,
                fmt::format("read from {} failed: {}", url.host, detail));
        }
    }
    return Result<HttpResponse>::Ok(std::move(response));
}
