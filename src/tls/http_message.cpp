#include "http_message.hpp"
#include <core/constants.hpp>
#include <core/utils.hpp>
#include <fmt/format.h>
#include <cstdlib>

// ── Url ────────────────────────────────────────────────────────

Result<Url> Url::parse(const std::string& text) {
    Url url;

    auto scheme_end = text.find("://");
    if (scheme_end == std::string::npos || scheme_end == 0) {
        return Result<Url>::Err(ErrorKind::Transport, fmt::format("invalid URL '{}': missing scheme", text));
    }
    url.scheme = to_lower(text.substr(0, scheme_end));

    size_t authority_start = scheme_end + 3;
    size_t authority_end = text.find_first_of("/?#", authority_start);
    std::string authority = text.substr(authority_start,
        authority_end == std::string::npos ? std::string::npos : authority_end - authority_start);

    if (authority.find('@') != std::string::npos) {
        return Result<Url>::Err(ErrorKind::Transport, fmt::format("invalid URL '{}': userinfo not supported", text));
    }

    std::string port_text;
    if (!authority.empty() && authority[0] == '[') {
        auto close = authority.find(']');
        if (close == std::string::npos) {
            return Result<Url>::Err(ErrorKind::Transport, fmt::format("invalid URL '{}': bad IPv6 host", text));
        }
        url.host = authority.substr(1, close - 1);
        if (close + 1 < authority.size()) {
            if (authority[close + 1] != ':') {
                return Result<Url>::Err(ErrorKind::Transport, fmt::format("invalid URL '{}'", text));
            }
            port_text = authority.substr(close + 2);
        }
    } else {
        auto colon = authority.rfind(':');
        if (colon != std::string::npos) {
            url.host = authority.substr(0, colon);
            port_text = authority.substr(colon + 1);
        } else {
            url.host = authority;
        }
    }
    url.host = to_lower(url.host);

    if (url.host.empty()) {
        return Result<Url>::Err(ErrorKind::Transport, fmt::format("invalid URL '{}': missing host", text));
    }

    if (port_text.empty()) {
        url.port = url.scheme == "https" ? HTTPS_DEFAULT_PORT : 80;
    } else {
        auto port = parse_int(port_text);
        if (!port || *port <= 0 || *port > 65535) {
            return Result<Url>::Err(ErrorKind::Transport, fmt::format("invalid URL '{}': bad port", text));
        }
        url.port = *port;
    }

    if (authority_end == std::string::npos) {
        url.target = "/";
    } else {
        std::string rest = text.substr(authority_end);
        auto hash = rest.find('#');
        if (hash != std::string::npos) rest.erase(hash);
        if (rest.empty() || rest[0] != '/') rest.insert(0, "/");
        url.target = rest;
    }
    return Result<Url>::Ok(url);
}

std::string Url::path() const {
    auto q = target.find('?');
    return q == std::string::npos ? target : target.substr(0, q);
}

bool Url::host_is_ip() const {
    if (host.find(':') != std::string::npos) return true;  // IPv6
    if (host.empty()) return false;
    int dots = 0;
    for (char c : host) {
        if (c == '.') { dots++; continue; }
        if (c < '0' || c > '9') return false;
    }
    return dots == 3;
}

std::string Url::host_header() const {
    std::string h = host.find(':') != std::string::npos ? "[" + host + "]" : host;
    bool default_port = (scheme == "https" && port == HTTPS_DEFAULT_PORT) ||
                        (scheme == "http" && port == 80);
    if (!default_port) h += ":" + std::to_string(port);
    return h;
}

// ── HttpResponse ───────────────────────────────────────────────

std::optional<std::string> HttpResponse::header(const std::string& name) const {
    for (const auto& kv : headers) {
        if (iequals(kv.first, name)) return kv.second;
    }
    return std::nullopt;
}

std::vector<std::string> HttpResponse::header_values(const std::string& name) const {
    std::vector<std::string> values;
    for (const auto& kv : headers) {
        if (iequals(kv.first, name)) values.push_back(kv.second);
    }
    return values;
}

// ── Serialization ──────────────────────────────────────────────

static bool has_header(const HttpHeaders& headers, const std::string& name) {
    for (const auto& kv : headers) {
        if (iequals(kv.first, name)) return true;
    }
    return false;
}

std::string serialize_request(const HttpRequest& request, const Url& url,
                              const std::string& cookie_header) {
    std::string out = fmt::format("{} {} HTTP/1.1\r\n", request.method, url.target);
    out += fmt::format("Host: {}\r\n", url.host_header());

    for (const auto& kv : request.headers) {
        // Connection management and framing belong to the transport
        if (iequals(kv.first, "Host") || iequals(kv.first, "Connection") ||
            iequals(kv.first, "Content-Length") || iequals(kv.first, "Cookie")) {
            continue;
        }
        out += fmt::format("{}: {}\r\n", kv.first, kv.second);
    }

    if (!has_header(request.headers, "User-Agent")) {
        out += "User-Agent: mcpcore\r\n";
    }
    if (!cookie_header.empty()) {
        out += fmt::format("Cookie: {}\r\n", cookie_header);
    }
    if (!request.body.empty() || request.method == "POST" || request.method == "PUT") {
        out += fmt::format("Content-Length: {}\r\n", request.body.size());
    }
    out += "Connection: close\r\n\r\n";
    out += request.body;
    return out;
}

// ── Response parsing ───────────────────────────────────────────

static bool parse_status_line(const std::string& line, HttpResponse& out) {
    // HTTP/1.1 200 OK
    if (line.compare(0, 5, "HTTP/") != 0) return false;
    auto sp1 = line.find(' ');
    if (sp1 == std::string::npos) return false;
    auto sp2 = line.find(' ', sp1 + 1);
    std::string code = line.substr(sp1 + 1, sp2 == std::string::npos ? std::string::npos : sp2 - sp1 - 1);
    auto status = parse_int(code);
    if (!status || code.size() != 3 || *status < 100) return false;
    out.status = *status;
    out.reason = sp2 == std::string::npos ? "" : line.substr(sp2 + 1);
    return true;
}

// Decode a chunked body starting at raw[pos]. Returns Incomplete until the
// terminating zero-size chunk (and trailers) have arrived.
static ParseState decode_chunked(const std::string& raw, size_t pos, std::string& body,
                                 std::string& error) {
    body.clear();
    while (true) {
        auto line_end = raw.find("\r\n", pos);
        if (line_end == std::string::npos) return ParseState::Incomplete;

        std::string size_line = raw.substr(pos, line_end - pos);
        auto semi = size_line.find(';');
        if (semi != std::string::npos) size_line.erase(semi);
        trim(size_line);

        char* end = nullptr;
        unsigned long long size = std::strtoull(size_line.c_str(), &end, 16);
        if (size_line.empty() || end != size_line.c_str() + size_line.size()) {
            error = fmt::format("bad chunk size '{}'", size_line);
            return ParseState::Error;
        }
        pos = line_end + 2;

        if (size == 0) {
            // Trailers end with an empty line
            while (true) {
                auto trailer_end = raw.find("\r\n", pos);
                if (trailer_end == std::string::npos) return ParseState::Incomplete;
                if (trailer_end == pos) return ParseState::Complete;
                pos = trailer_end + 2;
            }
        }

        if (size > HTTP_MAX_BODY_BYTES - body.size()) {
            error = fmt::format("chunked body exceeds {} bytes", HTTP_MAX_BODY_BYTES);
            return ParseState::Error;
        }
        if (raw.size() - pos < size + 2) return ParseState::Incomplete;
        body.append(raw, pos, static_cast<size_t>(size));
        pos += static_cast<size_t>(size);
        if (raw.compare(pos, 2, "\r\n") != 0) {
            error = "chunk not terminated by CRLF";
            return ParseState::Error;
        }
        pos += 2;
    }
}

ParseState parse_response(const std::string& raw, bool eof, bool expect_body,
                          HttpResponse& out, std::string& error) {
    auto head_end = raw.find("\r\n\r\n");
    if (head_end == std::string::npos) {
        if (raw.size() > HTTP_MAX_HEADER_BYTES) {
            error = "response headers too large";
            return ParseState::Error;
        }
        if (eof) {
            error = raw.empty() ? "connection closed before response" : "truncated response headers";
            return ParseState::Error;
        }
        return ParseState::Incomplete;
    }

    out = HttpResponse{};
    size_t line_end = raw.find("\r\n");
    if (!parse_status_line(raw.substr(0, line_end), out)) {
        error = fmt::format("malformed status line '{}'", raw.substr(0, line_end));
        return ParseState::Error;
    }

    size_t pos = line_end + 2;
    while (pos < head_end) {
        size_t end = raw.find("\r\n", pos);
        std::string line = raw.substr(pos, end - pos);
        pos = end + 2;

        auto colon = line.find(':');
        if (colon == std::string::npos || colon == 0) {
            error = fmt::format("malformed header line '{}'", line);
            return ParseState::Error;
        }
        std::string name = line.substr(0, colon);
        std::string value = line.substr(colon + 1);
        trim(value);
        out.headers.emplace_back(name, value);
    }

    size_t body_start = head_end + 4;
    bool no_body = !expect_body || out.status / 100 == 1 ||
                   out.status == 204 || out.status == 304;
    if (no_body) return ParseState::Complete;

    auto te = out.header("Transfer-Encoding");
    if (te && to_lower(*te).find("chunked") != std::string::npos) {
        auto state = decode_chunked(raw, body_start, out.body, error);
        if (state == ParseState::Incomplete && eof) {
            error = "connection closed inside chunked body";
            return ParseState::Error;
        }
        return state;
    }

    if (auto cl = out.header("Content-Length")) {
        auto length = parse_int(*cl);
        if (!length || *length < 0) {
            error = fmt::format("bad Content-Length '{}'", *cl);
            return ParseState::Error;
        }
        size_t need = static_cast<size_t>(*length);
        if (need > HTTP_MAX_BODY_BYTES) {
            error = fmt::format("Content-Length {} exceeds {} bytes", need, HTTP_MAX_BODY_BYTES);
            return ParseState::Error;
        }
        if (raw.size() - body_start >= need) {
            out.body = raw.substr(body_start, need);
            return ParseState::Complete;
        }
        if (eof) {
            error = fmt::format("connection closed after {} of {} body bytes",
                                raw.size() - body_start, need);
            return ParseState::Error;
        }
        return ParseState::Incomplete;
    }

    // Body delimited by connection close
    if (raw.size() - body_start > HTTP_MAX_BODY_BYTES) {
        error = fmt::format("response body exceeds {} bytes", HTTP_MAX_BODY_BYTES);
        return ParseState::Error;
    }
    if (!eof) return ParseState::Incomplete;
    out.body = raw.substr(body_start);
    return ParseState::Complete;
}
