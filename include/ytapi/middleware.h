#pragma once
// ═══════════════════════════════════════════════════════════════════
//  ytapi/middleware.h — Built-in middleware
// ═══════════════════════════════════════════════════════════════════
//
//  Included middleware:
//    • cors()           — Cross-Origin Resource Sharing
//    • requestLogger()  — One log line per request
//
// ═══════════════════════════════════════════════════════════════════

#include "http.h"
#include "console.h"
#include <algorithm>
#include <chrono>
#include <string>
#include <vector>

namespace ytapi::middleware {

// ── CORS Configuration ──
//    "*" in a list allows anything.
struct CorsOptions {
    std::vector<std::string> allowOrigins  = {"*"};
    std::vector<std::string> allowMethods  = {"*"};
    std::vector<std::string> allowHeaders  = {"*"};
    std::vector<std::string> exposeHeaders;
    bool                     allowCredentials = false;
    int                      maxAge = 600;   // seconds
};

namespace detail {

inline bool containsWildcard(const std::vector<std::string>& list) {
    return std::find(list.begin(), list.end(), "*") != list.end();
}

inline std::string joinList(const std::vector<std::string>& list) {
    std::string out;
    for (auto& item : list) {
        if (!out.empty()) out += ", ";
        out += item;
    }
    return out;
}

} // namespace detail

// ═══════════════════════════════════════════
//  cors — Cross-Origin Resource Sharing
// ═══════════════════════════════════════════
//  Requests without an Origin header pass through untouched.
//  Preflight requests (OPTIONS + Access-Control-Request-Method) are
//  answered here with 200, or 400 when the origin is not allowed.
//  With credentials enabled, a wildcard origin is echoed back as the
//  caller's origin wherever browsers reject a literal "*".
//
inline http::MiddlewareFunction cors(CorsOptions options = {}) {
    const bool anyOrigin = detail::containsWildcard(options.allowOrigins);
    const bool anyHeader = detail::containsWildcard(options.allowHeaders);
    const std::string methods = detail::containsWildcard(options.allowMethods)
        ? "DELETE, GET, HEAD, OPTIONS, PATCH, POST, PUT"
        : detail::joinList(options.allowMethods);

    return [options, anyOrigin, anyHeader, methods](
               http::Request& req, http::Response& res, http::NextFunction next) {
        auto origin = req.header("origin");
        if (origin.empty()) {
            next();
            return;
        }

        bool originAllowed = anyOrigin ||
            std::find(options.allowOrigins.begin(), options.allowOrigins.end(), origin)
                != options.allowOrigins.end();

        // ── Preflight ──
        if (req.method == "OPTIONS" && req.hasHeader("access-control-request-method")) {
            if (!originAllowed) {
                res.status(400).send("Disallowed CORS origin");
                return;
            }

            bool echoOrigin = !anyOrigin || options.allowCredentials;
            res.set("Access-Control-Allow-Origin", echoOrigin ? origin : "*");
            if (echoOrigin) res.set("Vary", "Origin");
            res.set("Access-Control-Allow-Methods", methods);
            res.set("Access-Control-Max-Age", std::to_string(options.maxAge));

            auto requested = req.header("access-control-request-headers");
            if (anyHeader) {
                if (!requested.empty()) res.set("Access-Control-Allow-Headers", requested);
            } else {
                res.set("Access-Control-Allow-Headers", detail::joinList(options.allowHeaders));
            }
            if (options.allowCredentials) {
                res.set("Access-Control-Allow-Credentials", "true");
            }

            res.status(200).send("OK");
            return;
        }

        // ── Simple / actual request ──
        if (originAllowed) {
            bool echoOrigin = !anyOrigin ||
                (options.allowCredentials && req.hasHeader("cookie"));
            res.set("Access-Control-Allow-Origin", echoOrigin ? origin : "*");
            if (echoOrigin) res.set("Vary", "Origin");
            if (options.allowCredentials) {
                res.set("Access-Control-Allow-Credentials", "true");
            }
            if (!options.exposeHeaders.empty()) {
                res.set("Access-Control-Expose-Headers", detail::joinList(options.exposeHeaders));
            }
        }

        next();
    };
}

// ═══════════════════════════════════════════
//  requestLogger — Morgan-style request logging
// ═══════════════════════════════════════════
inline http::MiddlewareFunction requestLogger() {
    return [](http::Request& req, http::Response& res, http::NextFunction next) {
        auto start = std::chrono::steady_clock::now();

        next();

        auto elapsed = std::chrono::steady_clock::now() - start;
        auto ms = std::chrono::duration_cast<std::chrono::microseconds>(elapsed).count() / 1000.0;

        int status = res.getStatusCode();
        if (status >= 500) {
            console::error(req.ip, req.method, req.path, status, std::to_string(ms) + "ms");
        } else {
            console::info(req.ip, req.method, req.path, status, std::to_string(ms) + "ms");
        }
    };
}

} // namespace ytapi::middleware
