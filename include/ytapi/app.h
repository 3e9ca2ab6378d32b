#pragma once
// ═══════════════════════════════════════════════════════════════════
//  ytapi/app.h — The YouTube Transcript API service
// ═══════════════════════════════════════════════════════════════════
//
//  Routes (all under /api):
//    GET /            health payload
//    GET /health      health payload
//    GET /debug/urls  documentation URLs
//    GET /openapi.json, /swagger.json   OpenAPI document
//    GET /docs, /redoc                  documentation pages
// ═══════════════════════════════════════════════════════════════════

#include "config.h"
#include "http.h"
#include "openapi.h"

namespace ytapi::app {

inline constexpr const char* kTitle       = "YouTube Transcript API";
inline constexpr const char* kDescription =
    "API to fetch YouTube video transcripts with Azure Key Vault integration";
inline constexpr const char* kVersion     = "1.0.0";

inline constexpr const char* kApiPrefix   = "/api";
inline constexpr const char* kDocsUrl     = "/api/docs";
inline constexpr const char* kRedocUrl    = "/api/redoc";
inline constexpr const char* kOpenApiUrl  = "/api/openapi.json";

struct HealthResponse {
    std::string status;
    std::string message;

    nlohmann::json toJson() const {
        return {{"status", status}, {"message", message}};
    }
};

// OpenAPI description of the schema-visible routes
openapi::Document apiDocument();

// Builds the server with middleware and routes. The context must
// outlive the returned server.
http::Server createApp(const AppContext& ctx);

} // namespace ytapi::app
