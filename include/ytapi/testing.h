#pragma once
// ═══════════════════════════════════════════════════════════════════
//  ytapi/testing.h — In-process TestClient and mock factories
// ═══════════════════════════════════════════════════════════════════
//
//  Usage:
//    testing::TestClient client(app);
//    auto result = client.get("/api/health").set("Origin", "http://x").exec();
//    EXPECT_EQ(result.status, 200);
//    EXPECT_EQ(result.json()["status"], "healthy");
// ═══════════════════════════════════════════════════════════════════

#include "http.h"
#include <algorithm>
#include <cctype>
#include <stdexcept>
#include <string>
#include <unordered_map>

namespace ytapi::testing {

// ── Create a mock Request ──
inline http::Request createRequest(
    const std::string& method = "GET",
    const std::string& url = "/",
    const std::string& body = "",
    const std::unordered_map<std::string, std::string>& headers = {}) {
    http::Request req;
    req.method = method;
    req.url = url;
    req.path = url.substr(0, url.find('?'));
    req.rawBody = body;
    req.ip = "127.0.0.1";
    req.protocol = "http";
    req.hostname = "localhost";
    for (auto& [k, v] : headers) {
        std::string lk = k;
        std::transform(lk.begin(), lk.end(), lk.begin(), ::tolower);
        req.headers[lk] = v;
    }
    return req;
}

// ── Capture-mode Response ──
inline http::Response createResponse() {
    return http::Response([](int, const http::Response::Headers&, const std::string&) {});
}

struct TestResult {
    int status = 0;
    std::string body;
    http::Response::Headers headers;

    nlohmann::json json() const {
        return nlohmann::json::parse(body);
    }

    std::string header(const std::string& key) const {
        auto it = headers.find(key);
        return it != headers.end() ? it->second : "";
    }

    bool hasHeader(const std::string& key) const {
        return headers.find(key) != headers.end();
    }
};

// ═══════════════════════════════════════════
//  TestClient — supertest-style API
// ═══════════════════════════════════════════
class TestClient {
public:
    explicit TestClient(http::Server& app) : app_(app) {}

    class RequestBuilder {
    public:
        RequestBuilder(http::Server& app, const std::string& method, const std::string& url)
            : app_(app), method_(method), url_(url) {}

        RequestBuilder& set(const std::string& key, const std::string& value) {
            headers_[key] = value;
            return *this;
        }

        RequestBuilder& send(const std::string& body) {
            body_ = body;
            return *this;
        }

        // Throws std::runtime_error when the status differs
        TestResult expect(int expectedStatus) {
            auto result = exec();
            if (result.status != expectedStatus) {
                throw std::runtime_error(
                    "Expected status " + std::to_string(expectedStatus) +
                    " but got " + std::to_string(result.status));
            }
            return result;
        }

        TestResult exec() {
            auto req = createRequest(method_, url_, body_, headers_);

            TestResult result;
            http::Response res([&result](int status,
                                         const http::Response::Headers& headers,
                                         const std::string& body) {
                result.status = status;
                result.body = body;
                result.headers = headers;
            });

            app_.handleRequest(req, res);
            if (!res.headersSent()) {
                result.status = res.getStatusCode();
                result.body = res.getBody();
                result.headers = res.getHeaders();
            }
            return result;
        }

    private:
        http::Server& app_;
        std::string method_;
        std::string url_;
        std::string body_;
        std::unordered_map<std::string, std::string> headers_;
    };

    RequestBuilder get(const std::string& url) { return {app_, "GET", url}; }
    RequestBuilder post(const std::string& url) { return {app_, "POST", url}; }
    RequestBuilder options(const std::string& url) { return {app_, "OPTIONS", url}; }

private:
    http::Server& app_;
};

} // namespace ytapi::testing
