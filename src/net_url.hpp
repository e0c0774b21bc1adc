#pragma once
#include <optional>
#include <string>

// Pieces of an absolute ws/wss/http/https URL.
struct Url {
    std::string scheme;
    std::string host;
    std::string port;   // defaulted from the scheme when absent
    std::string target; // path plus query, "/" when empty
};

std::optional<Url> parse_url(const std::string& text);
bool is_secure(const Url& url);
