#pragma once

#include <cctype>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <string>

namespace agentrun::utils {

struct ParsedUrl {
    bool https = true;
    std::string host;
    int port = 443;
    std::string path = "/";

    std::string SchemeHostPort() const {
        return std::string(https ? "https://" : "http://") + host + ":" + std::to_string(port);
    }
};

inline ParsedUrl ParseUrl(const std::string& url) {
    ParsedUrl parsed{};
    std::string working = url;
    if (working.rfind("https://", 0) == 0) {
        parsed.https = true;
        working = working.substr(8);
    } else if (working.rfind("http://", 0) == 0) {
        parsed.https = false;
        parsed.port = 80;
        working = working.substr(7);
    }

    const auto slash_pos = working.find('/');
    std::string host_port = working;
    if (slash_pos != std::string::npos) {
        host_port = working.substr(0, slash_pos);
        parsed.path = working.substr(slash_pos);
    }

    const auto colon_pos = host_port.find(':');
    if (colon_pos != std::string::npos) {
        parsed.host = host_port.substr(0, colon_pos);
        try {
            parsed.port = std::stoi(host_port.substr(colon_pos + 1));
        } catch (const std::exception&) {
            parsed.port = parsed.https ? 443 : 80;
        }
    } else {
        parsed.host = host_port;
    }
    return parsed;
}

// Joins a base path ("/api/" or "") and a route ("/x") without doubling slashes.
inline std::string JoinPath(std::string base, const std::string& route) {
    while (!base.empty() && base.back() == '/') {
        base.pop_back();
    }
    return base + route;
}

// Percent-encodes a query parameter value.
inline std::string UrlEncode(const std::string& value) {
    std::ostringstream encoded;
    encoded << std::hex << std::uppercase;
    for (unsigned char c : value) {
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') {
            encoded << c;
        } else {
            encoded << '%' << std::setw(2) << std::setfill('0') << static_cast<int>(c);
        }
    }
    return encoded.str();
}

}  // namespace agentrun::utils
