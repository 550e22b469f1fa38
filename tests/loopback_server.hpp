#pragma once

// Minimal TLS server on 127.0.0.1 for client tests. Serves one canned
// response per accepted connection, in order, then stops.

#include <mutex>
#include <string>
#include <thread>
#include <vector>
#include <tls/certificate.hpp>
#include "cert_fixtures.hpp"

class LoopbackTlsServer {
public:
    LoopbackTlsServer(const fixtures::Identity& identity, std::vector<std::string> responses);
    ~LoopbackTlsServer();

    LoopbackTlsServer(const LoopbackTlsServer&) = delete;
    LoopbackTlsServer& operator=(const LoopbackTlsServer&) = delete;

    int port() const { return port_; }
    std::string url(const std::string& path) const;

    // Wait for the server thread to finish its connections.
    void join();

    // Raw request heads received, one per completed handshake.
    std::vector<std::string> requests();
    int failed_handshakes();

private:
    void run();
    void serve(int fd, const std::string& response);

    SslCtxPtr ctx_;
    int listen_fd_ = -1;
    int port_ = 0;
    std::vector<std::string> responses_;
    std::thread thread_;

    std::mutex mutex_;
    std::vector<std::string> requests_;
    int failed_handshakes_ = 0;
};

// "HTTP/1.1 200 OK" response with Content-Length framing and extra headers.
std::string http_ok(const std::string& body, const std::string& extra_headers = "");
