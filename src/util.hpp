#pragma once

#include <optional>
#include <string>

namespace stock_sync {

/// Decomposed URL components.
struct UrlParts {
    std::string scheme;   // "http" or "https"
    std::string host;
    std::string port;     // "80", "443", "4000", etc.
    std::string target;   // path plus query (e.g. "/products.json?limit=250")
};

/// Parse an HTTP(S) URL into its components.
/// Throws std::invalid_argument on malformed input.
UrlParts parseUrl(const std::string& url);

/// Extract the rel="next" URL from an RFC 5988 Link header, e.g.
///   <https://shop/admin/api/2024-07/products.json?page_info=abc>; rel="next"
/// Returns std::nullopt when there is no next page.
std::optional<std::string> parseNextPageUrl(const std::string& linkHeader);

/// Percent-encode a query-string component (RFC 3986 unreserved set kept).
std::string urlEncode(const std::string& value);

/// Remove trailing '/' characters.
std::string trimTrailingSlashes(std::string value);

} // namespace stock_sync
