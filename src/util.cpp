#include "util.hpp"

#include <cctype>
#include <stdexcept>

namespace stock_sync {

namespace {

std::string trim(const std::string& s, const char* chars) {
    const auto begin = s.find_first_not_of(chars);
    if (begin == std::string::npos) return "";
    const auto end = s.find_last_not_of(chars);
    return s.substr(begin, end - begin + 1);
}

} // namespace

UrlParts parseUrl(const std::string& url) {
    UrlParts parts;

    // --- scheme ---
    auto schemeEnd = url.find("://");
    if (schemeEnd == std::string::npos) {
        throw std::invalid_argument("Invalid URL (missing scheme): " + url);
    }
    parts.scheme = url.substr(0, schemeEnd);
    if (parts.scheme != "http" && parts.scheme != "https") {
        throw std::invalid_argument("Invalid URL (unsupported scheme): " + url);
    }

    // --- authority (host[:port]) ---
    auto hostStart = schemeEnd + 3;
    auto pathStart = url.find_first_of("/?", hostStart);

    std::string authority;
    if (pathStart == std::string::npos) {
        authority    = url.substr(hostStart);
        parts.target = "/";
    } else {
        authority    = url.substr(hostStart, pathStart - hostStart);
        parts.target = url.substr(pathStart);
        if (parts.target.front() == '?') {
            parts.target.insert(0, "/");
        }
    }

    // Fragments are never sent to the server.
    auto hash = parts.target.find('#');
    if (hash != std::string::npos) {
        parts.target.erase(hash);
    }

    // --- host / port ---
    auto colon = authority.find(':');
    if (colon == std::string::npos) {
        parts.host = authority;
        parts.port = (parts.scheme == "https") ? "443" : "80";
    } else {
        parts.host = authority.substr(0, colon);
        parts.port = authority.substr(colon + 1);
        if (parts.port.empty()) {
            throw std::invalid_argument("Invalid URL (empty port): " + url);
        }
    }

    if (parts.host.empty()) {
        throw std::invalid_argument("Invalid URL (empty host): " + url);
    }
    return parts;
}

std::optional<std::string> parseNextPageUrl(const std::string& linkHeader) {
    if (linkHeader.find("rel=\"next\"") == std::string::npos) {
        return std::nullopt;
    }

    std::size_t start = 0;
    while (start <= linkHeader.size()) {
        auto comma = linkHeader.find(',', start);
        if (comma == std::string::npos) comma = linkHeader.size();

        const std::string entry = linkHeader.substr(start, comma - start);
        if (entry.find("rel=\"next\"") != std::string::npos) {
            const auto semi = entry.find(';');
            std::string url = trim(entry.substr(0, semi), "<> \t");
            if (url.empty()) return std::nullopt;
            return url;
        }
        start = comma + 1;
    }
    return std::nullopt;
}

std::string urlEncode(const std::string& value) {
    static const char* kHex = "0123456789ABCDEF";

    std::string out;
    out.reserve(value.size() * 3);
    for (unsigned char c : value) {
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') {
            out += static_cast<char>(c);
        } else {
            out += '%';
            out += kHex[c >> 4];
            out += kHex[c & 0x0F];
        }
    }
    return out;
}

std::string trimTrailingSlashes(std::string value) {
    while (!value.empty() && value.back() == '/') {
        value.pop_back();
    }
    return value;
}

} // namespace stock_sync
