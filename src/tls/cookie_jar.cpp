#include "cookie_jar.hpp"
#include <core/log.hpp>
#include <core/utils.hpp>
#include <fmt/format.h>
#include <algorithm>
#include <iomanip>
#include <locale>
#include <sstream>

static const char* kTag = "cookies";

bool parse_http_date(const std::string& text, std::time_t& out) {
    static const char* formats[] = {
        "%a, %d %b %Y %H:%M:%S",    // Sun, 06 Nov 1994 08:49:37 GMT
        "%a, %d-%b-%Y %H:%M:%S",    // Sun, 06-Nov-1994 08:49:37 GMT
        "%A, %d-%b-%y %H:%M:%S",    // Sunday, 06-Nov-94 08:49:37 GMT
    };
    for (const char* format : formats) {
        std::tm tm = {};
        std::istringstream in(text);
        in.imbue(std::locale::classic());
        in >> std::get_time(&tm, format);
        if (in.fail() || tm.tm_year < 0) continue;
        out = utc_mktime(&tm);
        return out != static_cast<std::time_t>(-1);
    }
    return false;
}

static bool domain_match(const std::string& host, const std::string& domain) {
    if (host == domain) return true;
    return host.size() > domain.size() &&
           host.compare(host.size() - domain.size(), domain.size(), domain) == 0 &&
           host[host.size() - domain.size() - 1] == '.';
}

static bool path_match(const std::string& request_path, const std::string& cookie_path) {
    if (request_path == cookie_path) return true;
    if (request_path.compare(0, cookie_path.size(), cookie_path) != 0) return false;
    return cookie_path.back() == '/' || request_path[cookie_path.size()] == '/';
}

// Directory of the request path, e.g. "/a/b/c" -> "/a/b".
static std::string default_path(const std::string& request_path) {
    if (request_path.empty() || request_path[0] != '/') return "/";
    auto last = request_path.rfind('/');
    if (last == 0) return "/";
    return request_path.substr(0, last);
}

void CookieJar::store(const Url& url, const std::string& header, std::time_t now) {
    std::vector<std::string> parts;
    size_t start = 0;
    while (start <= header.size()) {
        auto semi = header.find(';', start);
        if (semi == std::string::npos) semi = header.size();
        parts.push_back(header.substr(start, semi - start));
        start = semi + 1;
    }

    std::string pair = parts[0];
    auto eq = pair.find('=');
    if (eq == std::string::npos) {
        log_debug(kTag, fmt::format("ignoring Set-Cookie without '=': {}", header));
        return;
    }

    Cookie cookie;
    cookie.name = pair.substr(0, eq);
    cookie.value = pair.substr(eq + 1);
    trim(cookie.name);
    trim(cookie.value);
    if (cookie.name.empty()) return;
    if (cookie.value.size() >= 2 && cookie.value.front() == '"' && cookie.value.back() == '"') {
        cookie.value = cookie.value.substr(1, cookie.value.size() - 2);
    }

    std::string domain_attr;
    std::string path_attr;
    bool have_max_age = false;
    bool expired = false;

    for (size_t i = 1; i < parts.size(); i++) {
        std::string attr = parts[i];
        std::string value;
        auto aeq = attr.find('=');
        if (aeq != std::string::npos) {
            value = attr.substr(aeq + 1);
            attr.erase(aeq);
        }
        trim(attr);
        trim(value);
        attr = to_lower(attr);

        if (attr == "domain") {
            domain_attr = to_lower(value);
            if (!domain_attr.empty() && domain_attr[0] == '.') domain_attr.erase(0, 1);
        } else if (attr == "path") {
            if (!value.empty() && value[0] == '/') path_attr = value;
        } else if (attr == "max-age") {
            auto seconds = parse_int(value);
            if (!seconds) continue;
            have_max_age = true;
            cookie.persistent = true;
            if (*seconds <= 0) {
                expired = true;
            } else {
                expired = false;
                cookie.expires = now + *seconds;
            }
        } else if (attr == "expires") {
            if (have_max_age) continue;  // Max-Age wins
            std::time_t when = 0;
            if (!parse_http_date(value, when)) continue;
            cookie.persistent = true;
            cookie.expires = when;
            expired = when <= now;
        } else if (attr == "secure") {
            cookie.secure = true;
        } else if (attr == "httponly") {
            cookie.http_only = true;
        }
    }

    if (domain_attr.empty()) {
        cookie.domain = url.host;
        cookie.host_only = true;
    } else {
        if (url.host_is_ip() ? domain_attr != url.host : !domain_match(url.host, domain_attr)) {
            log_debug(kTag, fmt::format("rejecting cookie '{}': domain {} does not match {}",
                                        cookie.name, domain_attr, url.host));
            return;
        }
        cookie.domain = domain_attr;
        // An IP literal can only carry host-only cookies
        cookie.host_only = url.host_is_ip();
    }
    cookie.path = path_attr.empty() ? default_path(url.path()) : path_attr;
    cookie.created = now;

    auto same = std::find_if(cookies_.begin(), cookies_.end(), [&](const Cookie& c) {
        return c.name == cookie.name && c.domain == cookie.domain && c.path == cookie.path;
    });

    if (expired) {
        if (same != cookies_.end()) cookies_.erase(same);
        log_debug(kTag, fmt::format("deleted cookie '{}' for {}", cookie.name, cookie.domain));
        return;
    }

    if (same != cookies_.end()) {
        cookie.created = same->created;
        *same = cookie;
    } else {
        cookies_.push_back(cookie);
    }
}

void CookieJar::set_cookies(const Url& url, const std::vector<std::string>& set_cookie_headers,
                            std::time_t now) {
    purge_expired(now);
    for (const auto& header : set_cookie_headers) {
        store(url, header, now);
    }
}

void CookieJar::purge_expired(std::time_t now) {
    cookies_.erase(std::remove_if(cookies_.begin(), cookies_.end(), [now](const Cookie& c) {
        return c.persistent && c.expires <= now;
    }), cookies_.end());
}

std::vector<Cookie> CookieJar::cookies(const Url& url, std::time_t now) {
    purge_expired(now);

    std::vector<Cookie> matched;
    std::string request_path = url.path();
    for (const auto& c : cookies_) {
        bool host_ok = c.host_only ? url.host == c.domain : domain_match(url.host, c.domain);
        if (!host_ok) continue;
        if (!path_match(request_path, c.path)) continue;
        if (c.secure && url.scheme != "https") continue;
        matched.push_back(c);
    }

    std::stable_sort(matched.begin(), matched.end(), [](const Cookie& a, const Cookie& b) {
        if (a.path.size() != b.path.size()) return a.path.size() > b.path.size();
        return a.created < b.created;
    });
    return matched;
}

std::string CookieJar::cookie_header(const Url& url, std::time_t now) {
    std::string header;
    for (const auto& c : cookies(url, now)) {
        if (!header.empty()) header += "; ";
        header += c.name + "=" + c.value;
    }
    return header;
}
