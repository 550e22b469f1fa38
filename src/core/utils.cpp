#include "utils.hpp"
#include "types.hpp"
#include <algorithm>
#include <cctype>
#include <cerrno>
#include <climits>
#include <cstdlib>

const char* error_kind_name(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::None:             return "none";
        case ErrorKind::LockIO:           return "lock-io";
        case ErrorKind::LockContention:   return "lock-contention";
        case ErrorKind::KillFailure:      return "kill-failure";
        case ErrorKind::CertificateParse: return "certificate-parse";
        case ErrorKind::Verification:     return "verification";
        case ErrorKind::Config:           return "config";
        case ErrorKind::Transport:        return "transport";
    }
    return "unknown";
}

std::time_t utc_mktime(struct tm* tm) {
#ifdef _WIN32
    return _mkgmtime(tm);
#else
    return timegm(tm);
#endif
}

std::string format_utc(std::time_t t) {
    struct tm tm_buf;
#ifdef _WIN32
    gmtime_s(&tm_buf, &t);
#else
    gmtime_r(&t, &tm_buf);
#endif
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M:%S UTC", &tm_buf);
    return std::string(buf);
}

std::optional<int> parse_int(const std::string& s) {
    std::string str = s;
    trim(str);
    if (str.empty()) return std::nullopt;

    errno = 0;
    char* end = nullptr;
    long v = std::strtol(str.c_str(), &end, 10);
    if (errno != 0 || end != str.c_str() + str.size()) return std::nullopt;
    if (v < INT_MIN || v > INT_MAX) return std::nullopt;
    return static_cast<int>(v);
}

std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

bool iequals(const std::string& a, const std::string& b) {
    if (a.size() != b.size()) return false;
    for (size_t i = 0; i < a.size(); i++) {
        if (std::tolower(static_cast<unsigned char>(a[i])) !=
            std::tolower(static_cast<unsigned char>(b[i]))) {
            return false;
        }
    }
    return true;
}
