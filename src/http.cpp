// ═══════════════════════════════════════════════════════════════════
//  src/http.cpp — Routing, dispatch and the Boost.Beast transport
// ═══════════════════════════════════════════════════════════════════

#include "ytapi/http.h"
#include "ytapi/console.h"

#include <boost/asio.hpp>
#include <boost/asio/signal_set.hpp>
#include <boost/asio/strand.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>

#include <algorithm>
#include <cctype>
#include <chrono>
#include <csignal>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace ytapi::http {

namespace beast  = boost::beast;
namespace net    = boost::asio;
namespace bhttp  = beast::http;
using tcp        = net::ip::tcp;

namespace {

// ── Path segments ──
// "/api/health" -> {"", "api", "health"}; "/api/" -> {"", "api", ""}.
// Empty segments are kept so a trailing slash is significant.
std::vector<std::string_view> splitSegments(std::string_view path) {
    std::vector<std::string_view> segments;
    std::size_t start = 0;
    while (true) {
        auto slash = path.find('/', start);
        if (slash == std::string_view::npos) {
            segments.push_back(path.substr(start));
            return segments;
        }
        segments.push_back(path.substr(start, slash - start));
        start = slash + 1;
    }
}

int hexValue(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

// Percent-decoding; '+' becomes a space only inside query strings
std::string decode(std::string_view text, bool plusIsSpace) {
    std::string out;
    out.reserve(text.size());
    for (std::size_t i = 0; i < text.size(); ++i) {
        char c = text[i];
        if (c == '%' && i + 2 < text.size()) {
            int hi = hexValue(text[i + 1]);
            int lo = hexValue(text[i + 2]);
            if (hi >= 0 && lo >= 0) {
                out += static_cast<char>(hi * 16 + lo);
                i += 2;
                continue;
            }
        }
        out += (plusIsSpace && c == '+') ? ' ' : c;
    }
    return out;
}

std::unordered_map<std::string, std::string> parseQuery(std::string_view query) {
    std::unordered_map<std::string, std::string> fields;
    while (!query.empty()) {
        auto amp = query.find('&');
        auto field = query.substr(0, amp);
        query = amp == std::string_view::npos ? std::string_view() : query.substr(amp + 1);
        if (field.empty()) continue;

        auto eq = field.find('=');
        if (eq == std::string_view::npos) {
            fields[decode(field, true)] = "";
        } else {
            fields[decode(field.substr(0, eq), true)] = decode(field.substr(eq + 1), true);
        }
    }
    return fields;
}

// "/api" <-> "/api/"; empty when the path is the root
std::string toggleTrailingSlash(const std::string& path) {
    if (path.empty() || path == "/") return "";
    if (path.back() == '/') return path.substr(0, path.size() - 1);
    return path + "/";
}

} // namespace

// ═══════════════════════════════════════════
//  RouteEntry — a method plus a segment pattern
//  ":name" captures one non-empty segment.
// ═══════════════════════════════════════════
struct RouteEntry {
    struct Segment {
        std::string text;   // literal, or the parameter name
        bool param = false;
    };

    std::string method;
    std::vector<Segment> segments;
    RouteHandler handler;

    RouteEntry(std::string verb, const std::string& pattern, RouteHandler fn)
        : method(std::move(verb)), handler(std::move(fn)) {
        for (auto part : splitSegments(pattern)) {
            if (!part.empty() && part.front() == ':') {
                segments.push_back({std::string(part.substr(1)), true});
            } else {
                segments.push_back({std::string(part), false});
            }
        }
    }

    bool matchesPath(const std::string& path,
                     std::unordered_map<std::string, std::string>* params = nullptr) const {
        auto parts = splitSegments(path);
        if (parts.size() != segments.size()) return false;

        std::unordered_map<std::string, std::string> captured;
        for (std::size_t i = 0; i < parts.size(); ++i) {
            const auto& segment = segments[i];
            if (segment.param) {
                if (parts[i].empty()) return false;
                captured[segment.text] = std::string(parts[i]);
            } else if (parts[i] != segment.text) {
                return false;
            }
        }
        if (params) *params = std::move(captured);
        return true;
    }
};

// ═══════════════════════════════════════════
//  Server::Impl
// ═══════════════════════════════════════════
struct Server::Impl {
    std::vector<MiddlewareFunction>  middlewares;
    std::vector<RouteEntry>          routes;
    std::unique_ptr<net::io_context> ioc;
    bool running = false;
    bool redirectSlashes = true;
    bool gracefulShutdown = false;

    void handleRequest(Request& req, Response& res) {
        try {
            runMiddleware(req, res, 0);
        } catch (const std::exception& e) {
            console::error("Unhandled error in", req.method, req.path + ":", e.what());
            if (!res.headersSent()) {
                res.status(500).json(nlohmann::json{{"detail", "Internal Server Error"}});
            }
        }
    }

    // Middleware i receives a next() that resumes at i + 1; past the end
    // the request is routed.
    void runMiddleware(Request& req, Response& res, std::size_t i) {
        if (res.headersSent()) return;
        if (i == middlewares.size()) {
            dispatch(req, res);
            return;
        }
        middlewares[i](req, res, [this, &req, &res, i] { runMiddleware(req, res, i + 1); });
    }

    void dispatch(Request& req, Response& res) {
        if (res.headersSent()) return;

        std::vector<std::string> allowed;
        for (auto& route : routes) {
            std::unordered_map<std::string, std::string> params;
            if (!route.matchesPath(req.path, &params)) continue;
            if (route.method == req.method) {
                req.params = std::move(params);
                route.handler(req, res);
                return;
            }
            if (std::find(allowed.begin(), allowed.end(), route.method) == allowed.end()) {
                allowed.push_back(route.method);
            }
        }

        if (!allowed.empty()) {
            std::string allow = allowed.front();
            for (std::size_t i = 1; i < allowed.size(); ++i) allow += ", " + allowed[i];
            res.status(405).set("Allow", allow)
               .json(nlohmann::json{{"detail", "Method Not Allowed"}});
            return;
        }

        if (redirectSlashes && redirectToAlternate(req, res)) return;

        res.status(404).json(nlohmann::json{{"detail", "Not Found"}});
    }

    // 307 to the same path with the trailing slash added or removed, when
    // that form is routed for this method. The query string is kept.
    bool redirectToAlternate(const Request& req, Response& res) {
        auto alternate = toggleTrailingSlash(req.path);
        if (alternate.empty()) return false;

        bool routed = std::any_of(routes.begin(), routes.end(), [&](const RouteEntry& route) {
            return route.method == req.method && route.matchesPath(alternate);
        });
        if (!routed) return false;

        auto query = req.url.find('?');
        bool hasQuery = query != std::string::npos && query + 1 < req.url.size();
        res.redirect(307, hasQuery ? alternate + req.url.substr(query) : alternate);
        return true;
    }
};

namespace {

constexpr auto kIdleTimeout = std::chrono::seconds(30);

Request toRequest(const bhttp::request<bhttp::string_body>& message, const std::string& ip) {
    Request req;
    req.method   = std::string(message.method_string());
    req.url      = std::string(message.target());
    req.protocol = "http";
    req.ip       = ip;
    req.rawBody  = message.body();

    std::string_view target = req.url;
    auto question = target.find('?');
    req.path = decode(target.substr(0, question), false);
    if (question != std::string_view::npos) {
        req.query = parseQuery(target.substr(question + 1));
    }

    for (const auto& field : message) {
        std::string name(field.name_string());
        std::transform(name.begin(), name.end(), name.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        req.headers[name] = std::string(field.value());
    }
    req.hostname = req.header("host");
    return req;
}

} // namespace

// ═══════════════════════════════════════════
//  HttpSession — one connection, requests
//  handled in turn while keep-alive holds
// ═══════════════════════════════════════════
class HttpSession : public std::enable_shared_from_this<HttpSession> {
public:
    HttpSession(tcp::socket&& socket, Server::Impl& server)
        : stream_(std::move(socket)), server_(server) {}

    void start() { read(); }

private:
    beast::tcp_stream stream_;
    beast::flat_buffer buffer_;
    bhttp::request<bhttp::string_body> message_;
    Server::Impl& server_;

    void read() {
        message_ = {};
        stream_.expires_after(kIdleTimeout);
        bhttp::async_read(stream_, buffer_, message_,
                          beast::bind_front_handler(&HttpSession::onRead, shared_from_this()));
    }

    void onRead(beast::error_code ec, std::size_t) {
        if (ec == bhttp::error::end_of_stream) {
            closeSend();
            return;
        }
        if (ec) return;   // timeout or reset: the session ends here

        beast::error_code endpointEc;
        auto remote = stream_.socket().remote_endpoint(endpointEc);
        auto req = toRequest(message_, endpointEc ? "unknown" : remote.address().to_string());

        auto self = shared_from_this();
        Response res([self](int status, const Response::Headers& headers, const std::string& body) {
            self->write(status, headers, body);
        });

        server_.handleRequest(req, res);
        if (!res.headersSent()) {
            res.status(500).json(nlohmann::json{{"detail", "No response sent by handler"}});
        }
    }

    void write(int status, const Response::Headers& headers, const std::string& body) {
        auto reply = std::make_shared<bhttp::response<bhttp::string_body>>(
            static_cast<bhttp::status>(status), message_.version());
        for (const auto& [name, value] : headers) {
            if (!value.empty()) reply->set(name, value);
        }
        reply->keep_alive(message_.keep_alive());
        if (message_.method() == bhttp::verb::head) {
            reply->content_length(body.size());
        } else {
            reply->body() = body;
            reply->prepare_payload();
        }

        bhttp::async_write(stream_, *reply,
            [self = shared_from_this(), reply](beast::error_code ec, std::size_t) {
                if (ec) return;
                if (reply->keep_alive()) {
                    self->read();
                } else {
                    self->closeSend();
                }
            });
    }

    void closeSend() {
        beast::error_code ec;
        stream_.socket().shutdown(tcp::socket::shutdown_send, ec);
    }
};

// ═══════════════════════════════════════════
//  HttpListener — accept loop
// ═══════════════════════════════════════════
class HttpListener : public std::enable_shared_from_this<HttpListener> {
public:
    // Throws std::runtime_error naming the step that failed
    HttpListener(net::io_context& ioc, const tcp::endpoint& endpoint, Server::Impl& server)
        : ioc_(ioc), acceptor_(net::make_strand(ioc)), server_(server) {
        auto check = [&](beast::error_code ec, const std::string& step) {
            if (ec) {
                throw std::runtime_error("Cannot " + step + " " + endpoint.address().to_string() +
                                         ":" + std::to_string(endpoint.port()) + ": " +
                                         ec.message());
            }
        };

        beast::error_code ec;
        acceptor_.open(endpoint.protocol(), ec);
        check(ec, "open socket for");
        acceptor_.set_option(net::socket_base::reuse_address(true), ec);
        check(ec, "set reuse_address on");
        acceptor_.bind(endpoint, ec);
        check(ec, "bind to");
        acceptor_.listen(net::socket_base::max_listen_connections, ec);
        check(ec, "listen on");
    }

    void accept() {
        acceptor_.async_accept(
            net::make_strand(ioc_),
            beast::bind_front_handler(&HttpListener::onAccept, shared_from_this()));
    }

private:
    net::io_context& ioc_;
    tcp::acceptor    acceptor_;
    Server::Impl&    server_;

    void onAccept(beast::error_code ec, tcp::socket socket) {
        if (ec == net::error::operation_aborted) return;
        if (ec) {
            console::warn("Accept failed:", ec.message());
        } else {
            std::make_shared<HttpSession>(std::move(socket), server_)->start();
        }
        accept();
    }
};

// ═══════════════════════════════════════════
//  Server
// ═══════════════════════════════════════════

Server::Server() : impl_(std::make_unique<Impl>()) {}

Server::~Server() = default;
Server::Server(Server&&) noexcept = default;
Server& Server::operator=(Server&&) noexcept = default;

Server& Server::use(MiddlewareFunction middleware) {
    impl_->middlewares.push_back(std::move(middleware));
    return *this;
}

Server& Server::mount(const Router& router) {
    for (const auto& route : router.routes()) {
        addRoute(route.method, route.path, route.handler);
    }
    return *this;
}

Server& Server::redirectSlashes(bool enabled) {
    impl_->redirectSlashes = enabled;
    return *this;
}

Server& Server::enableGracefulShutdown() {
    impl_->gracefulShutdown = true;
    return *this;
}

void Server::addRoute(const std::string& method, const std::string& pattern, RouteHandler handler) {
    impl_->routes.emplace_back(method, pattern, std::move(handler));
}

void Server::handleRequest(Request& req, Response& res) {
    impl_->handleRequest(req, res);
}

void Server::listen(const std::string& host, int port, std::function<void()> callback) {
    beast::error_code ec;
    auto address = net::ip::make_address(host, ec);
    if (ec) throw std::runtime_error("Invalid listen address '" + host + "': " + ec.message());

    impl_->ioc = std::make_unique<net::io_context>(1);
    std::make_shared<HttpListener>(
        *impl_->ioc, tcp::endpoint(address, static_cast<unsigned short>(port)), *impl_)
        ->accept();

    net::signal_set signals(*impl_->ioc);
    if (impl_->gracefulShutdown) {
        signals.add(SIGINT);
        signals.add(SIGTERM);
        signals.async_wait([this](beast::error_code waitEc, int signal) {
            if (waitEc) return;
            console::info("Received signal", signal, "- shutting down");
            close();
        });
    }

    impl_->running = true;
    if (callback) callback();

    impl_->ioc->run();
    impl_->running = false;
}

void Server::close() {
    if (!impl_->ioc || !impl_->running) return;
    impl_->running = false;
    impl_->ioc->stop();
}

} // namespace ytapi::http
