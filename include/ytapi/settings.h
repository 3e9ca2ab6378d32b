#pragma once
// ═══════════════════════════════════════════════════════════════════
//  ytapi/settings.h — Service settings read from the environment
// ═══════════════════════════════════════════════════════════════════

#include "console.h"
#include "env.h"
#include <string>

namespace ytapi {

struct Settings {
    // ── Listener ──
    std::string host = "0.0.0.0";
    int         port = 8000;

    // ── Logging ──
    console::Level logLevel = console::Level::Info;

    // ── Secret sources, in resolution order ──
    std::string keyVaultUrl;                              // AZURE_KEY_VAULT_URL
    std::string keyVaultSecretName = "YouTubeApiKey";
    int         keyVaultTimeoutMs  = 10000;
    std::string secretEnvVar       = "YOUTUBE_API_KEY";
    std::string settingsFile       = "settings.json";
    std::string settingsField      = "youtube_api_key";

    // ── Documentation pages ──
    // URL the browser uses to fetch the OpenAPI document. The service is
    // published behind an ingress that adds the /yt prefix.
    std::string docsOpenApiUrl = "/yt/api/openapi.json";
    std::string rootPath;

    // Throws std::invalid_argument for malformed PORT or LOG_LEVEL values.
    // A malformed KEY_VAULT_TIMEOUT_MS is logged and the default kept.
    static Settings fromEnvironment(const env::Lookup& lookup);
};

} // namespace ytapi
