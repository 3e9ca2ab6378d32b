// ═══════════════════════════════════════════════════════════════════
//  src/app.cpp — Route table of the service
// ═══════════════════════════════════════════════════════════════════

#include "ytapi/app.h"
#include "ytapi/middleware.h"

namespace ytapi::app {

openapi::Document apiDocument() {
    openapi::Document doc;
    doc.title(kTitle)
       .description(kDescription)
       .version(kVersion)
       .schema("HealthResponse", {
           {"type", "object"},
           {"title", "HealthResponse"},
           {"properties", {
               {"status",  {{"type", "string"}, {"title", "Status"}}},
               {"message", {{"type", "string"}, {"title", "Message"}}}
           }},
           {"required", {"status", "message"}}
       })
       .route({
           .method = "GET",
           .path = "/api/",
           .summary = "Root",
           .description = "Health check endpoint",
           .operationId = "root_api__get",
           .responseRef = "HealthResponse",
       })
       .route({
           .method = "GET",
           .path = "/api/health",
           .summary = "Health Check",
           .description = "Detailed health check endpoint",
           .operationId = "health_check_api_health_get",
           .responseRef = "HealthResponse",
       })
       .route({
           .method = "GET",
           .path = "/api/debug/urls",
           .summary = "Debug Urls",
           .description = "Debug endpoint to check configured URLs",
           .operationId = "debug_urls_api_debug_urls_get",
           .responseSchema = nlohmann::json::object(),
       });
    return doc;
}

http::Server createApp(const AppContext& ctx) {
    http::Server app;

    app.use(middleware::requestLogger());
    app.use(middleware::cors({
        .allowOrigins = {"*"},
        .allowMethods = {"*"},
        .allowHeaders = {"*"},
        .allowCredentials = true,
    }));

    auto doc = apiDocument();
    auto specHandler = doc.serveSpec();

    http::Router api(kApiPrefix);

    api.get("/", [](http::Request&, http::Response& res) {
        res.json(HealthResponse{"healthy", "YouTube Transcript API is running"}.toJson());
    });

    api.get("/health", [](http::Request&, http::Response& res) {
        res.json(HealthResponse{
            "healthy", "Service is running. YouTube Transcript API ready."}.toJson());
    });

    api.get("/debug/urls", [rootPath = ctx.settings.rootPath](http::Request&, http::Response& res) {
        res.json({
            {"docs_url", kDocsUrl},
            {"redoc_url", kRedocUrl},
            {"openapi_url", kOpenApiUrl},
            {"root_path", rootPath},
            {"available_endpoints", {
                "/api/docs",
                "/api/redoc",
                "/api/openapi.json",
                "/api/swagger.json",
                "/api/health",
                "/api/debug/urls"
            }}
        });
    });

    api.get("/openapi.json", specHandler);
    api.get("/swagger.json", specHandler);

    // The pages are opened through the ingress, so they point at the
    // externally visible document URL rather than kOpenApiUrl.
    api.get("/docs", openapi::serveHtml(
        openapi::swaggerUiHtml(ctx.settings.docsOpenApiUrl, kTitle)));
    api.get("/redoc", openapi::serveHtml(
        openapi::redocHtml(ctx.settings.docsOpenApiUrl, kTitle)));

    app.mount(api);
    return app;
}

} // namespace ytapi::app
