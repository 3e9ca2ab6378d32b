#pragma once
// ═══════════════════════════════════════════════════════════════════
//  ytapi/openapi.h — OpenAPI document and documentation pages
// ═══════════════════════════════════════════════════════════════════
//
//  Usage:
//    openapi::Document doc;
//    doc.title("My API").version("1.0.0")
//       .schema("HealthResponse", {...})
//       .route({.method = "GET", .path = "/api/health",
//               .summary = "Health Check",
//               .responseRef = "HealthResponse"});
//    router.get("/openapi.json", doc.serveSpec());
//    router.get("/docs", openapi::serveHtml(openapi::swaggerUiHtml("/api/openapi.json", "My API")));
// ═══════════════════════════════════════════════════════════════════

#include "http.h"
#include <algorithm>
#include <map>
#include <string>
#include <vector>

namespace ytapi::openapi {

// ── Route metadata ──
struct RouteDoc {
    std::string method;
    std::string path;              // ":id" segments become "{id}"
    std::string summary;
    std::string description;
    std::string operationId;
    std::vector<std::string> tags;
    int successStatus = 200;
    std::string responseRef;       // name of a component schema
    nlohmann::json responseSchema; // inline schema when responseRef is empty
};

// ── OpenAPI document builder ──
class Document {
public:
    Document& title(const std::string& t) { title_ = t; return *this; }
    Document& description(const std::string& d) { description_ = d; return *this; }
    Document& version(const std::string& v) { version_ = v; return *this; }

    Document& schema(const std::string& name, nlohmann::json schema) {
        schemas_[name] = std::move(schema);
        return *this;
    }

    Document& route(const RouteDoc& doc) {
        routes_.push_back(doc);
        return *this;
    }

    const std::string& title() const { return title_; }

    nlohmann::json generate() const {
        nlohmann::json spec = {
            {"openapi", "3.1.0"},
            {"info", {
                {"title", title_},
                {"description", description_},
                {"version", version_}
            }},
            {"paths", nlohmann::json::object()}
        };

        for (auto& route : routes_) {
            std::string method = route.method;
            std::transform(method.begin(), method.end(), method.begin(), ::tolower);

            nlohmann::json operation;
            if (!route.tags.empty()) operation["tags"] = route.tags;
            if (!route.summary.empty()) operation["summary"] = route.summary;
            if (!route.description.empty()) operation["description"] = route.description;
            if (!route.operationId.empty()) operation["operationId"] = route.operationId;

            auto [oaPath, params] = convertPath(route.path);
            if (!params.empty()) operation["parameters"] = params;

            nlohmann::json success = {{"description", "Successful Response"}};
            if (!route.responseRef.empty()) {
                success["content"] = {{"application/json", {{"schema", {
                    {"$ref", "#/components/schemas/" + route.responseRef}
                }}}}};
            } else if (!route.responseSchema.is_null()) {
                success["content"] = {{"application/json", {{"schema", route.responseSchema}}}};
            }
            operation["responses"] = {{std::to_string(route.successStatus), success}};

            spec["paths"][oaPath][method] = operation;
        }

        if (!schemas_.empty()) {
            nlohmann::json schemas = nlohmann::json::object();
            for (auto& [name, schema] : schemas_) schemas[name] = schema;
            spec["components"] = {{"schemas", schemas}};
        }

        return spec;
    }

    // ── Endpoint that serves the document ──
    http::RouteHandler serveSpec() const {
        auto spec = generate();
        return [spec](http::Request&, http::Response& res) {
            res.json(spec);
        };
    }

private:
    std::string title_ = "API";
    std::string description_;
    std::string version_ = "1.0.0";
    std::map<std::string, nlohmann::json> schemas_;
    std::vector<RouteDoc> routes_;

    // "/users/:id" → {"/users/{id}", [path parameter "id"]}
    static std::pair<std::string, nlohmann::json> convertPath(const std::string& path) {
        std::string out;
        nlohmann::json params = nlohmann::json::array();
        std::size_t pos = 0;
        while (pos < path.size()) {
            if (path[pos] == ':') {
                auto end = path.find('/', pos);
                if (end == std::string::npos) end = path.size();
                auto name = path.substr(pos + 1, end - pos - 1);
                out += "{" + name + "}";
                params.push_back({
                    {"name", name},
                    {"in", "path"},
                    {"required", true},
                    {"schema", {{"type", "string"}}}
                });
                pos = end;
            } else {
                out += path[pos++];
            }
        }
        return {out, params};
    }
};

// ═══════════════════════════════════════════
//  Documentation pages (assets from jsDelivr)
// ═══════════════════════════════════════════
namespace detail {

inline std::string escapeHtml(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    for (char c : s) {
        switch (c) {
            case '&':  out += "&amp;";  break;
            case '<':  out += "&lt;";   break;
            case '>':  out += "&gt;";   break;
            case '"':  out += "&quot;"; break;
            case '\'': out += "&#x27;"; break;
            default:   out += c;        break;
        }
    }
    return out;
}

} // namespace detail

inline std::string swaggerUiHtml(const std::string& openapiUrl, const std::string& title) {
    // nlohmann::json::dump yields a valid JS string literal; "</" is split
    // so the value cannot close the script element.
    auto url = nlohmann::json(openapiUrl).dump();
    for (std::size_t pos = 0; (pos = url.find("</", pos)) != std::string::npos; pos += 3) {
        url.replace(pos, 2, "<\\/");
    }

    return R"(<!DOCTYPE html>
<html>
<head>
<link type="text/css" rel="stylesheet" href="https://cdn.jsdelivr.net/npm/swagger-ui-dist@5/swagger-ui.css">
<title>)" + detail::escapeHtml(title) + R"(</title>
</head>
<body>
<div id="swagger-ui">
</div>
<script src="https://cdn.jsdelivr.net/npm/swagger-ui-dist@5/swagger-ui-bundle.js"></script>
<script>
const ui = SwaggerUIBundle({
    url: )" + url + R"(,
    "dom_id": "#swagger-ui",
    "layout": "BaseLayout",
    "deepLinking": true,
    "showExtensions": true,
    "showCommonExtensions": true,
    presets: [
        SwaggerUIBundle.presets.apis,
        SwaggerUIBundle.SwaggerUIStandalonePreset
    ],
})
</script>
</body>
</html>
)";
}

inline std::string redocHtml(const std::string& openapiUrl, const std::string& title) {
    return R"(<!DOCTYPE html>
<html>
<head>
<title>)" + detail::escapeHtml(title) + R"(</title>
<meta charset="utf-8"/>
<meta name="viewport" content="width=device-width, initial-scale=1">
<link href="https://fonts.googleapis.com/css?family=Montserrat:300,400,700|Roboto:300,400,700" rel="stylesheet">
<style>
  body {
    margin: 0;
    padding: 0;
  }
</style>
</head>
<body>
<noscript>
    ReDoc requires Javascript to function. Please enable it to browse the documentation.
</noscript>
<redoc spec-url=")" + detail::escapeHtml(openapiUrl) + R"("></redoc>
<script src="https://cdn.jsdelivr.net/npm/redoc@next/bundles/redoc.standalone.js"> </script>
</body>
</html>
)";
}

inline http::RouteHandler serveHtml(std::string page) {
    return [page = std::move(page)](http::Request&, http::Response& res) {
        res.html(page);
    };
}

} // namespace ytapi::openapi
