#pragma once
// ═══════════════════════════════════════════════════════════════════
//  ytapi/http.h — HTTP Server, Router, Request, and Response
// ═══════════════════════════════════════════════════════════════════
//
//  Usage:
//    http::Server app;
//    http::Router api("/api");
//    api.get("/health", [](auto& req, auto& res) {
//        res.json({{"status", "healthy"}});
//    });
//    app.mount(api);
//    app.listen("0.0.0.0", 8000, []{ console::info("Listening on :8000"); });
//
// ═══════════════════════════════════════════════════════════════════

#include <nlohmann/json.hpp>
#include <algorithm>
#include <cctype>
#include <functional>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

namespace ytapi::http {

class Request;
class Response;
class Server;

using NextFunction       = std::function<void()>;
using MiddlewareFunction = std::function<void(Request&, Response&, NextFunction)>;
using RouteHandler       = std::function<void(Request&, Response&)>;

// ═══════════════════════════════════════════════════════════════════
//  class Request
// ═══════════════════════════════════════════════════════════════════
class Request {
public:
    std::string method;
    std::string url;            // Full URL including query string
    std::string path;           // URL path without query string
    std::string rawBody;
    std::string ip;
    std::string protocol;       // "http" or "https"
    std::string hostname;       // Host header value

    std::unordered_map<std::string, std::string> headers;   // lowercase keys
    std::unordered_map<std::string, std::string> params;    // :id -> params["id"]
    std::unordered_map<std::string, std::string> query;

    // ── Header value (case-insensitive), "" when absent ──
    std::string header(const std::string& name) const {
        std::string lower = name;
        std::transform(lower.begin(), lower.end(), lower.begin(), ::tolower);
        auto it = headers.find(lower);
        return it != headers.end() ? it->second : "";
    }

    bool hasHeader(const std::string& name) const {
        std::string lower = name;
        std::transform(lower.begin(), lower.end(), lower.begin(), ::tolower);
        return headers.find(lower) != headers.end();
    }
};

// ═══════════════════════════════════════════════════════════════════
//  class Response
//  The SendCallback decouples it from the transport layer.
// ═══════════════════════════════════════════════════════════════════
class Response {
public:
    using Headers = std::unordered_map<std::string, std::string>;
    using SendCallback = std::function<void(int statusCode, const Headers& headers,
                                            const std::string& body)>;

    explicit Response(SendCallback cb)
        : sendCallback_(std::move(cb)) {}

    // Capture-only response (tests)
    Response() = default;

    Response& status(int code) {
        statusCode_ = code;
        return *this;
    }

    Response& set(const std::string& key, const std::string& value) {
        headers_[key] = value;
        return *this;
    }

    Response& type(const std::string& contentType) {
        return set("Content-Type", contentType);
    }

    void send(const std::string& body) {
        if (sent_) return;
        sent_ = true;
        if (headers_.find("Content-Type") == headers_.end()) {
            headers_["Content-Type"] = "text/plain; charset=utf-8";
        }
        body_ = body;
        if (sendCallback_) {
            sendCallback_(statusCode_, headers_, body_);
        }
    }

    void json(const nlohmann::json& data) {
        set("Content-Type", "application/json");
        send(data.dump());
    }

    // res.json({{"key", "value"}, {"count", 5}})
    void json(nlohmann::json::initializer_list_t init) {
        json(nlohmann::json(init));
    }

    void html(const std::string& page) {
        set("Content-Type", "text/html; charset=utf-8");
        send(page);
    }

    void redirect(int code, const std::string& location) {
        status(code);
        set("Location", location);
        send("");
    }

    void end() {
        if (!sent_) send("");
    }

    bool headersSent() const { return sent_; }

    const std::string& getBody() const { return body_; }
    int getStatusCode() const { return statusCode_; }
    const Headers& getHeaders() const { return headers_; }

    std::string getHeader(const std::string& key) const {
        auto it = headers_.find(key);
        return it != headers_.end() ? it->second : "";
    }

private:
    int statusCode_ = 200;
    Headers headers_;
    bool sent_ = false;
    SendCallback sendCallback_;
    std::string body_;
};

// ═══════════════════════════════════════════════════════════════════
//  class Router
//  A group of routes sharing a path prefix, mounted on a Server.
// ═══════════════════════════════════════════════════════════════════
class Router {
public:
    struct Route {
        std::string method;
        std::string path;       // prefix already applied
        RouteHandler handler;
    };

    explicit Router(std::string prefix = "") : prefix_(std::move(prefix)) {}

    template <typename Handler>
    Router& get(const std::string& path, Handler&& handler) {
        return add("GET", path, std::forward<Handler>(handler));
    }

    template <typename Handler>
    Router& post(const std::string& path, Handler&& handler) {
        return add("POST", path, std::forward<Handler>(handler));
    }

    template <typename Handler>
    Router& add(const std::string& method, const std::string& path, Handler&& handler) {
        routes_.push_back({method, prefix_ + path, RouteHandler(std::forward<Handler>(handler))});
        return *this;
    }

    const std::string& prefix() const { return prefix_; }
    const std::vector<Route>& routes() const { return routes_; }

private:
    std::string prefix_;
    std::vector<Route> routes_;
};

// ═══════════════════════════════════════════════════════════════════
//  class Server
//  Routing and middleware; pimpl hides Boost.Beast.
//
//  Unmatched requests get 404 {"detail":"Not Found"}. A path served only
//  under other methods gets 405 {"detail":"Method Not Allowed"} with an
//  Allow header. A request whose path only lacks (or adds) a trailing
//  slash is redirected with 307.
//  A handler that throws yields 500 {"detail":"Internal Server Error"}.
// ═══════════════════════════════════════════════════════════════════
class Server {
public:
    Server();
    ~Server();
    Server(Server&&) noexcept;
    Server& operator=(Server&&) noexcept;

    Server(const Server&) = delete;
    Server& operator=(const Server&) = delete;

    Server& use(MiddlewareFunction middleware);
    Server& mount(const Router& router);

    template <typename Handler>
    Server& get(const std::string& path, Handler&& handler) {
        addRoute("GET", path, RouteHandler(std::forward<Handler>(handler)));
        return *this;
    }

    template <typename Handler>
    Server& post(const std::string& path, Handler&& handler) {
        addRoute("POST", path, RouteHandler(std::forward<Handler>(handler)));
        return *this;
    }

    Server& redirectSlashes(bool enabled);

    // Stop the event loop on SIGINT/SIGTERM while listening
    Server& enableGracefulShutdown();

    // Blocks until close() or a shutdown signal. Throws std::runtime_error
    // when the address cannot be bound.
    void listen(const std::string& host, int port, std::function<void()> callback = nullptr);

    void close();

    // Run middleware and routing for one request (transport and tests)
    void handleRequest(Request& req, Response& res);

private:
    // Networking classes in http.cpp need Impl
    friend class HttpSession;
    friend class HttpListener;

    struct Impl;
    std::unique_ptr<Impl> impl_;

    void addRoute(const std::string& method, const std::string& pattern, RouteHandler handler);
};

} // namespace ytapi::http
