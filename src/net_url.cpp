#include "net_url.hpp"
#include <algorithm>
#include <cctype>

static std::string default_port(const std::string& scheme) {
    if (scheme == "wss" || scheme == "https") return "443";
    if (scheme == "ws" || scheme == "http") return "80";
    return "";
}

std::optional<Url> parse_url(const std::string& text) {
    auto sep = text.find("://");
    if (sep == std::string::npos || sep == 0) return std::nullopt;
    Url url;
    url.scheme = text.substr(0, sep);
    std::transform(url.scheme.begin(), url.scheme.end(), url.scheme.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (default_port(url.scheme).empty()) return std::nullopt;

    size_t host_start = sep + 3;
    size_t path_start = text.find_first_of("/?", host_start);
    std::string authority = text.substr(host_start, path_start == std::string::npos ? std::string::npos
                                                                                    : path_start - host_start);
    if (authority.empty() || authority.find('@') != std::string::npos) return std::nullopt;

    auto colon = authority.rfind(':');
    if (colon != std::string::npos) {
        url.host = authority.substr(0, colon);
        url.port = authority.substr(colon + 1);
        if (url.port.empty() || !std::all_of(url.port.begin(), url.port.end(),
                                             [](unsigned char c) { return std::isdigit(c); })) {
            return std::nullopt;
        }
    } else {
        url.host = authority;
        url.port = default_port(url.scheme);
    }
    if (url.host.empty()) return std::nullopt;

    url.target = path_start == std::string::npos ? "/" : text.substr(path_start);
    if (url.target[0] == '?') url.target = "/" + url.target;
    return url;
}

bool is_secure(const Url& url) {
    return url.scheme == "wss" || url.scheme == "https";
}
