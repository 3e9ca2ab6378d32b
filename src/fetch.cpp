// ═══════════════════════════════════════════════════════════════════
//  src/fetch.cpp — Boost.Beast HTTP/HTTPS client with a deadline
// ═══════════════════════════════════════════════════════════════════

#include "ytapi/fetch.h"

#include <boost/asio/connect.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/beast/version.hpp>

#include <openssl/ssl.h>

#include <algorithm>
#include <cctype>
#include <chrono>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace ytapi::fetch {

namespace beast = boost::beast;
namespace bhttp = beast::http;
namespace net   = boost::asio;
namespace ssl   = net::ssl;
using tcp       = net::ip::tcp;

// ═══════════════════════════════════════════
//  URL helpers
// ═══════════════════════════════════════════

ParsedUrl parseUrl(const std::string& url) {
    ParsedUrl parsed;

    std::size_t hostStart = 0;
    auto schemeEnd = url.find("://");
    if (schemeEnd == std::string::npos) {
        parsed.scheme = "http";
    } else {
        parsed.scheme = url.substr(0, schemeEnd);
        std::transform(parsed.scheme.begin(), parsed.scheme.end(),
                       parsed.scheme.begin(), ::tolower);
        hostStart = schemeEnd + 3;
    }
    if (parsed.scheme != "http" && parsed.scheme != "https") {
        throw std::invalid_argument("unsupported URL scheme '" + parsed.scheme + "'");
    }

    auto targetStart = url.find_first_of("/?", hostStart);
    std::string hostPort = targetStart == std::string::npos
        ? url.substr(hostStart)
        : url.substr(hostStart, targetStart - hostStart);

    if (targetStart == std::string::npos) {
        parsed.target = "/";
    } else if (url[targetStart] == '?') {
        parsed.target = "/" + url.substr(targetStart);
    } else {
        parsed.target = url.substr(targetStart);
    }

    // [v6-address]:port
    std::size_t portSep = std::string::npos;
    if (!hostPort.empty() && hostPort.front() == '[') {
        auto close = hostPort.find(']');
        if (close == std::string::npos) {
            throw std::invalid_argument("malformed IPv6 host in '" + url + "'");
        }
        parsed.host = hostPort.substr(1, close - 1);
        if (close + 1 < hostPort.size() && hostPort[close + 1] == ':') portSep = close + 1;
    } else {
        portSep = hostPort.rfind(':');
        parsed.host = hostPort.substr(0, portSep);
    }

    if (portSep != std::string::npos) {
        parsed.port = hostPort.substr(portSep + 1);
    }
    if (parsed.port.empty()) {
        parsed.port = (parsed.scheme == "https") ? "443" : "80";
    }
    if (parsed.host.empty()) {
        throw std::invalid_argument("URL has no host: '" + url + "'");
    }
    return parsed;
}

std::string urlEncode(const std::string& value) {
    std::ostringstream oss;
    oss << std::hex << std::uppercase;
    for (unsigned char c : value) {
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') {
            oss << static_cast<char>(c);
        } else {
            oss << '%' << std::setw(2) << std::setfill('0') << static_cast<int>(c);
        }
    }
    return oss.str();
}

std::string encodeForm(const std::vector<std::pair<std::string, std::string>>& fields) {
    std::string out;
    for (auto& [key, value] : fields) {
        if (!out.empty()) out += '&';
        out += urlEncode(key);
        out += '=';
        out += urlEncode(value);
    }
    return out;
}

// ═══════════════════════════════════════════
//  Exchange — one request/response over a stream,
//  bounded by a single deadline
// ═══════════════════════════════════════════
namespace {

template <typename Stream>
inline constexpr bool kIsTls = false;

template <>
inline constexpr bool kIsTls<beast::ssl_stream<beast::tcp_stream>> = true;

template <typename Stream>
class Exchange {
public:
    Exchange(net::io_context& ioc, Stream& stream, const ParsedUrl& url,
             bhttp::request<bhttp::string_body>& req,
             std::chrono::milliseconds timeout)
        : ioc_(ioc)
        , stream_(stream)
        , url_(url)
        , req_(req)
        , timeout_(timeout)
        , resolver_(ioc)
        , deadline_(ioc)
    {}

    FetchResponse run() {
        deadline_.expires_after(timeout_);
        deadline_.async_wait([this](beast::error_code ec) {
            if (ec) return;   // cancelled: the exchange finished first
            timedOut_ = true;
            resolver_.cancel();
            beast::get_lowest_layer(stream_).cancel();
        });

        resolver_.async_resolve(url_.host, url_.port,
            [this](beast::error_code ec, tcp::resolver::results_type results) {
                onResolve(ec, std::move(results));
            });

        ioc_.run();
        return std::move(response_);
    }

private:
    net::io_context&                     ioc_;
    Stream&                              stream_;
    const ParsedUrl&                     url_;
    bhttp::request<bhttp::string_body>&  req_;
    std::chrono::milliseconds            timeout_;
    tcp::resolver                        resolver_;
    net::steady_timer                    deadline_;
    beast::flat_buffer                   buffer_;
    bhttp::response<bhttp::string_body>  res_;
    FetchResponse                        response_;
    bool                                 timedOut_ = false;

    void onResolve(beast::error_code ec, tcp::resolver::results_type results) {
        if (ec) return fail(ec, "resolve");
        beast::get_lowest_layer(stream_).async_connect(results,
            [this](beast::error_code ec, const tcp::endpoint&) { onConnect(ec); });
    }

    void onConnect(beast::error_code ec) {
        if (ec) return fail(ec, "connect");
        if constexpr (kIsTls<Stream>) {
            stream_.async_handshake(ssl::stream_base::client,
                [this](beast::error_code ec) { onHandshake(ec); });
        } else {
            onHandshake({});
        }
    }

    void onHandshake(beast::error_code ec) {
        if (ec) return fail(ec, "handshake");
        bhttp::async_write(stream_, req_,
            [this](beast::error_code ec, std::size_t) { onWrite(ec); });
    }

    void onWrite(beast::error_code ec) {
        if (ec) return fail(ec, "write");
        bhttp::async_read(stream_, buffer_, res_,
            [this](beast::error_code ec, std::size_t) { onRead(ec); });
    }

    void onRead(beast::error_code ec) {
        if (ec) return fail(ec, "read");

        response_.status     = static_cast<int>(res_.result_int());
        response_.statusText = std::string(res_.reason());
        response_.body       = std::move(res_.body());
        for (auto& field : res_) {
            std::string name(field.name_string());
            std::transform(name.begin(), name.end(), name.begin(), ::tolower);
            response_.headers[name] = std::string(field.value());
        }
        finish();
    }

    void fail(beast::error_code ec, const char* stage) {
        response_.status = 0;
        if (timedOut_) {
            response_.statusText = "request to " + url_.host + " timed out after " +
                                   std::to_string(timeout_.count()) + "ms";
        } else {
            response_.statusText = std::string(stage) + " " + url_.host + ": " + ec.message();
        }
        finish();
    }

    void finish() {
        deadline_.cancel();
    }
};

} // namespace

// ═══════════════════════════════════════════
//  request — public entry point
// ═══════════════════════════════════════════
FetchResponse request(const RequestOptions& opts) {
    FetchResponse response;

    try {
        auto url = parseUrl(opts.url);

        auto verb = bhttp::string_to_verb(opts.method);
        if (verb == bhttp::verb::unknown) {
            response.statusText = "unsupported HTTP method '" + opts.method + "'";
            return response;
        }

        bhttp::request<bhttp::string_body> req{verb, url.target, 11};
        req.set(bhttp::field::host, url.host);
        req.set(bhttp::field::user_agent, "ytapi-fetch/1.0");

        for (auto& [key, val] : opts.headers) {
            req.set(key, val);
        }

        if (!opts.body.empty()) {
            req.body() = opts.body;
            if (req.find(bhttp::field::content_type) == req.end()) {
                req.set(bhttp::field::content_type, "application/json");
            }
            req.prepare_payload();
        }

        net::io_context ioc;
        auto timeout = std::chrono::milliseconds(opts.timeoutMs);

        if (url.scheme == "https") {
            ssl::context ctx(ssl::context::tls_client);
            ctx.set_default_verify_paths();
            ctx.set_verify_mode(ssl::verify_peer);

            beast::ssl_stream<beast::tcp_stream> stream(ioc, ctx);
            stream.set_verify_callback(ssl::host_name_verification(url.host));
            if (!SSL_set_tlsext_host_name(stream.native_handle(), url.host.c_str())) {
                response.statusText = "failed to set TLS server name for " + url.host;
                return response;
            }
            return Exchange<beast::ssl_stream<beast::tcp_stream>>(
                ioc, stream, url, req, timeout).run();
        }

        beast::tcp_stream stream(ioc);
        return Exchange<beast::tcp_stream>(ioc, stream, url, req, timeout).run();

    } catch (const std::exception& e) {
        response.status = 0;
        response.statusText = e.what();
    }

    return response;
}

} // namespace ytapi::fetch
