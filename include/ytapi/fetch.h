#pragma once
// ═══════════════════════════════════════════════════════════════════
//  ytapi/fetch.h — Blocking HTTP/HTTPS client
// ═══════════════════════════════════════════════════════════════════
//
//  Usage:
//    auto resp = fetch::get("https://vault.example.net/secrets/x?api-version=7.4",
//                           {{"Authorization", "Bearer " + token}});
//    if (!resp.ok()) console::warn(resp.status, resp.statusText);
//
//  Transport failures never throw: the response carries status 0 and
//  the reason in statusText.
// ═══════════════════════════════════════════════════════════════════

#include <functional>
#include <string>
#include <unordered_map>
#include <vector>
#include <utility>

namespace ytapi::fetch {

// ── HTTP Response ──
struct FetchResponse {
    int status = 0;
    std::string statusText;
    std::string body;
    std::unordered_map<std::string, std::string> headers;   // lowercase keys

    bool ok() const { return status >= 200 && status < 300; }

    // Transport-level failure (DNS, connect, TLS, timeout)
    bool failed() const { return status == 0; }
};

// ── Request options ──
struct RequestOptions {
    std::string url;
    std::string method = "GET";
    std::unordered_map<std::string, std::string> headers;
    std::string body;
    int timeoutMs = 30000;   // covers resolve, connect, handshake, write and read
};

// Anything that can perform a request. Production code uses request();
// tests substitute a scripted function.
using Transport = std::function<FetchResponse(const RequestOptions&)>;

struct ParsedUrl {
    std::string scheme;
    std::string host;
    std::string port;
    std::string target;     // path + query
};

// Throws std::invalid_argument for URLs without a host or with an
// unsupported scheme.
ParsedUrl parseUrl(const std::string& url);

// Percent-encode for application/x-www-form-urlencoded and query strings
std::string urlEncode(const std::string& value);

std::string encodeForm(const std::vector<std::pair<std::string, std::string>>& fields);

// ── Perform one request ──
FetchResponse request(const RequestOptions& opts);

inline Transport defaultTransport() {
    return [](const RequestOptions& opts) { return request(opts); };
}

// ── Convenience methods ──
inline FetchResponse get(const std::string& url,
                         const std::unordered_map<std::string, std::string>& headers = {},
                         int timeoutMs = 30000) {
    return request({.url = url, .method = "GET", .headers = headers, .timeoutMs = timeoutMs});
}

} // namespace ytapi::fetch
