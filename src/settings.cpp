// ═══════════════════════════════════════════════════════════════════
//  src/settings.cpp — Environment → Settings
// ═══════════════════════════════════════════════════════════════════

#include "ytapi/settings.h"

#include <charconv>
#include <stdexcept>

namespace ytapi {

namespace {

int parseInt(const std::string& name, const std::string& text, int min, int max) {
    int value = 0;
    auto [end, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc() || end != text.data() + text.size()) {
        throw std::invalid_argument(name + " must be an integer, got '" + text + "'");
    }
    if (value < min || value > max) {
        throw std::invalid_argument(name + " must be between " + std::to_string(min) +
                                    " and " + std::to_string(max) + ", got " + text);
    }
    return value;
}

} // namespace

Settings Settings::fromEnvironment(const env::Lookup& lookup) {
    Settings s;

    s.host = env::getOr(lookup, "HOST", s.host);

    if (auto port = lookup("PORT"); port && !port->empty()) {
        s.port = parseInt("PORT", *port, 1, 65535);
    }

    if (auto level = lookup("LOG_LEVEL"); level && !level->empty()) {
        auto parsed = console::parseLevel(*level);
        if (!parsed) {
            throw std::invalid_argument("LOG_LEVEL must be one of debug, info, warn, error; got '" +
                                        *level + "'");
        }
        s.logLevel = *parsed;
    }

    s.keyVaultUrl = env::getOr(lookup, "AZURE_KEY_VAULT_URL", "");

    // Not fatal: a bad deadline keeps the default
    if (auto timeout = lookup("KEY_VAULT_TIMEOUT_MS"); timeout && !timeout->empty()) {
        try {
            s.keyVaultTimeoutMs = parseInt("KEY_VAULT_TIMEOUT_MS", *timeout, 1, 600000);
        } catch (const std::invalid_argument& e) {
            console::warn("Ignoring", e.what(), "- using", s.keyVaultTimeoutMs, "ms");
        }
    }

    s.settingsFile   = env::getOr(lookup, "SETTINGS_FILE", s.settingsFile);
    s.docsOpenApiUrl = env::getOr(lookup, "DOCS_OPENAPI_URL", s.docsOpenApiUrl);
    s.rootPath       = env::getOr(lookup, "ROOT_PATH", s.rootPath);

    return s;
}

} // namespace ytapi
