#pragma once

#include <string>
#include <vector>
#include <optional>
#include <utility>
#include <core/types.hpp>

// Ordered, repeatable header list (Set-Cookie may appear many times).
using HttpHeaders = std::vector<std::pair<std::string, std::string>>;

struct Url {
    std::string scheme;     // lower-case
    std::string host;       // lower-case, IPv6 without brackets
    int port = 0;
    std::string target;     // path + query, always starts with '/'

    static Result<Url> parse(const std::string& text);

    // Path without the query string.
    std::string path() const;
    bool host_is_ip() const;
    // Value for the Host header (port omitted when default for the scheme).
    std::string host_header() const;
};

struct HttpRequest {
    std::string method = "GET";
    std::string url;
    HttpHeaders headers;
    std::string body;
};

struct HttpResponse {
    int status = 0;
    std::string reason;
    HttpHeaders headers;
    std::string body;

    // First value of a header (case-insensitive name).
    std::optional<std::string> header(const std::string& name) const;
    std::vector<std::string> header_values(const std::string& name) const;
};

// Request bytes for one HTTP/1.1 exchange over a fresh connection.
// cookie_header is sent as "Cookie:" when non-empty.
std::string serialize_request(const HttpRequest& request, const Url& url,
                              const std::string& cookie_header);

enum class ParseState { Incomplete, Complete, Error };

// Incremental response parse over everything received so far.
// eof = the peer closed the connection. expect_body = false for HEAD.
ParseState parse_response(const std::string& raw, bool eof, bool expect_body,
                          HttpResponse& out, std::string& error);
