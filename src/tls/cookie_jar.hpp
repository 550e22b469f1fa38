#pragma once

#include <ctime>
#include <string>
#include <vector>
#include "http_message.hpp"

struct Cookie {
    std::string name;
    std::string value;
    std::string domain;         // lower-case, no leading dot
    std::string path = "/";
    bool host_only = true;
    bool secure = false;
    bool http_only = false;
    bool persistent = false;    // has an expiry
    std::time_t expires = 0;    // valid when persistent
    std::time_t created = 0;
};

// In-memory cookie store owned by one client. No public-suffix list:
// a Domain attribute is accepted whenever the request host domain-matches it.
class CookieJar {
public:
    // Store every Set-Cookie header from a response to `url`.
    void set_cookies(const Url& url, const std::vector<std::string>& set_cookie_headers,
                     std::time_t now);

    // "a=1; b=2" for a request to `url`, or "" when nothing matches.
    std::string cookie_header(const Url& url, std::time_t now);

    // Cookies that would be sent to `url`, longest path first.
    std::vector<Cookie> cookies(const Url& url, std::time_t now);

    size_t size() const { return cookies_.size(); }
    void clear() { cookies_.clear(); }

private:
    void store(const Url& url, const std::string& header, std::time_t now);
    void purge_expired(std::time_t now);

    std::vector<Cookie> cookies_;
};

// Parse a cookie date (IMF-fixdate or RFC 850 form). Returns false when
// neither matches.
bool parse_http_date(const std::string& text, std::time_t& out);
