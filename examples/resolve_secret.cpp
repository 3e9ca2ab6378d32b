// ═══════════════════════════════════════════════════════════════════
//  resolve_secret.cpp — Show where the YouTube API key would come from
// ═══════════════════════════════════════════════════════════════════
//
//  Runs the same resolution as the server, then prints the winning
//  source and a masked value. Useful when checking a deployment's
//  Key Vault access:
//
//    AZURE_KEY_VAULT_URL=https://myvault.vault.azure.net LOG_LEVEL=debug ./resolve_secret
// ═══════════════════════════════════════════════════════════════════

#include "ytapi/config.h"
#include "ytapi/console.h"
#include "ytapi/dotenv.h"

#include <iostream>
#include <string>

using namespace ytapi;

int main() {
    dotenv::load();
    auto environment = env::processEnvironment();

    Settings settings;
    try {
        settings = Settings::fromEnvironment(environment);
    } catch (const std::exception& e) {
        console::error("Invalid configuration:", e.what());
        return 1;
    }
    console::setLevel(settings.logLevel);

    auto resolver = config::SecretResolver::withDefaults(settings, environment);
    const auto& secret = resolver.resolve();

    std::cout << "source: " << config::sourceName(secret.source) << "\n";
    if (secret.found()) {
        const auto& value = *secret.value;
        auto shown = value.size() > 4 ? value.substr(0, 4) : std::string();
        std::cout << "value:  " << shown << std::string(value.size() - shown.size(), '*')
                  << " (" << value.size() << " chars)\n";
    }
    return secret.found() ? 0 : 2;
}
