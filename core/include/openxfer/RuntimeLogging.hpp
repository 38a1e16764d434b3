// Redaction of paths and host names in engine logs. Full values are logged
// only with OPEN_XFER_ENV=dev and OPEN_XFER_LOG_SENSITIVE=1.
#pragma once

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <string>

namespace openxfer {

namespace detail {

inline std::string envLower(const char *name) {
    const char *raw = std::getenv(name);
    std::string v = raw ? raw : "";
    v.erase(std::remove_if(v.begin(), v.end(),
                           [](unsigned char c) { return std::isspace(c); }),
            v.end());
    std::transform(v.begin(), v.end(), v.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return v;
}

} // namespace detail

// Read once; transfers log from many threads.
inline bool sensitiveLoggingEnabled() {
    static const bool enabled = [] {
        const std::string env = detail::envLower("OPEN_XFER_ENV");
        const std::string flag = detail::envLower("OPEN_XFER_LOG_SENSITIVE");
        const bool dev = env == "dev" || env == "development";
        return dev && (flag == "1" || flag == "true" || flag == "yes");
    }();
    return enabled;
}

// ".../name" for a remote or local path; trailing separators are ignored.
inline std::string redactPath(const std::string &path, bool sensitive) {
    if (sensitive)
        return path;
    std::string p = path;
    while (p.size() > 1 && (p.back() == '/' || p.back() == '\\'))
        p.pop_back();
    const std::size_t cut = p.find_last_of("/\\");
    if (cut == std::string::npos || cut + 1 >= p.size())
        return p;
    return ".../" + p.substr(cut + 1);
}

// Keeps the first label's initial and the top-level domain: "e***.test".
inline std::string redactHost(const std::string &host, bool sensitive) {
    if (sensitive || host.empty())
        return host;
    const std::size_t dot = host.find_last_of('.');
    const std::string tld = dot == std::string::npos ? "" : host.substr(dot);
    return host.substr(0, 1) + "***" + tld;
}

inline std::string loggablePath(const std::string &path) {
    return redactPath(path, sensitiveLoggingEnabled());
}

inline std::string loggableHost(const std::string &host) {
    return redactHost(host, sensitiveLoggingEnabled());
}

} // namespace openxfer
