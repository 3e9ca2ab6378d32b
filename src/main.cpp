// ═══════════════════════════════════════════════════════════════════
//  src/main.cpp — ytapi service entry point
// ═══════════════════════════════════════════════════════════════════

#include "ytapi/app.h"
#include "ytapi/config.h"
#include "ytapi/console.h"
#include "ytapi/dotenv.h"
#include "ytapi/env.h"
#include "ytapi/settings.h"

#include <exception>
#include <string>

using namespace ytapi;

int main() {
    dotenv::load(".env");

    auto environment = env::processEnvironment();

    Settings settings;
    try {
        settings = Settings::fromEnvironment(environment);
    } catch (const std::exception& e) {
        console::error("Invalid configuration:", e.what());
        return 1;
    }
    console::setLevel(settings.logLevel);

    // Secret resolution finishes before the listener starts.
    auto resolver = config::SecretResolver::withDefaults(settings, environment);
    AppContext ctx{settings, resolver.resolve()};
    console::debug("Secret source:", config::sourceName(ctx.secret.source));

    auto server = app::createApp(ctx);
    server.enableGracefulShutdown();

    try {
        server.listen(settings.host, settings.port, [&settings] {
            console::success("YouTube Transcript API listening on",
                             settings.host + ":" + std::to_string(settings.port));
            console::info("Docs at", std::string(app::kDocsUrl));
        });
    } catch (const std::exception& e) {
        console::error("Failed to start server:", e.what());
        return 1;
    }

    console::info("Server stopped");
    return 0;
}
