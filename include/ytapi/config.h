#pragma once
// ═══════════════════════════════════════════════════════════════════
//  ytapi/config.h — Startup secret resolution
// ═══════════════════════════════════════════════════════════════════
//
//  The YouTube API key is looked up once, in a fixed order:
//
//    1. Azure Key Vault   (only when AZURE_KEY_VAULT_URL is set)
//    2. YOUTUBE_API_KEY   environment variable
//    3. settings.json     field "youtube_api_key"
//
//  The first non-empty value wins. No source failure is fatal; finding
//  nothing is a normal outcome.
//
//  Usage:
//    auto resolver = config::SecretResolver::withDefaults(settings, env);
//    AppContext ctx{settings, resolver.resolve()};
// ═══════════════════════════════════════════════════════════════════

#include "env.h"
#include "fetch.h"
#include "settings.h"
#include <functional>
#include <memory>
#include <optional>
#include <string>

namespace ytapi::config {

enum class SecretSource { KeyVault, Environment, LocalFile, None };

const char* sourceName(SecretSource source);

// ═══════════════════════════════════════════
//  ProbeResult — outcome of one source
// ═══════════════════════════════════════════
enum class ProbeStatus {
    Found,     // non-empty value
    Empty,     // source present but value empty or missing
    Skipped,   // source not configured / not present
    Failed,    // error while reading the source
};

struct ProbeResult {
    ProbeStatus status = ProbeStatus::Skipped;
    std::string value;
    std::string reason;

    static ProbeResult found(std::string value) {
        return {ProbeStatus::Found, std::move(value), {}};
    }
    static ProbeResult empty(std::string reason) {
        return {ProbeStatus::Empty, {}, std::move(reason)};
    }
    static ProbeResult skipped(std::string reason) {
        return {ProbeStatus::Skipped, {}, std::move(reason)};
    }
    static ProbeResult failed(std::string reason) {
        return {ProbeStatus::Failed, {}, std::move(reason)};
    }
};

// ═══════════════════════════════════════════
//  SecretProbe — one secret source
//  probe() must not throw.
// ═══════════════════════════════════════════
class SecretProbe {
public:
    virtual ~SecretProbe() = default;
    virtual SecretSource source() const = 0;
    virtual ProbeResult probe() = 0;
};

// Fetches a secret from a vault; may throw.
using VaultFetcher = std::function<std::string(const std::string& vaultUrl,
                                               const std::string& secretName)>;

class KeyVaultProbe : public SecretProbe {
public:
    KeyVaultProbe(std::string vaultUrl, std::string secretName, VaultFetcher fetcher)
        : vaultUrl_(std::move(vaultUrl))
        , secretName_(std::move(secretName))
        , fetcher_(std::move(fetcher)) {}

    SecretSource source() const override { return SecretSource::KeyVault; }
    ProbeResult probe() override;

private:
    std::string vaultUrl_;
    std::string secretName_;
    VaultFetcher fetcher_;
};

class EnvironmentProbe : public SecretProbe {
public:
    EnvironmentProbe(env::Lookup lookup, std::string variable)
        : lookup_(std::move(lookup)), variable_(std::move(variable)) {}

    SecretSource source() const override { return SecretSource::Environment; }
    ProbeResult probe() override;

private:
    env::Lookup lookup_;
    std::string variable_;
};

class SettingsFileProbe : public SecretProbe {
public:
    SettingsFileProbe(std::string path, std::string field)
        : path_(std::move(path)), field_(std::move(field)) {}

    SecretSource source() const override { return SecretSource::LocalFile; }
    ProbeResult probe() override;

private:
    std::string path_;
    std::string field_;
};

// Production fetcher: DefaultAzureCredential-style chain + SecretClient
VaultFetcher keyVaultFetcher(env::Lookup lookup, fetch::Transport transport, int timeoutMs);

// ═══════════════════════════════════════════
//  ResolvedSecret
// ═══════════════════════════════════════════
struct ResolvedSecret {
    std::optional<std::string> value;
    SecretSource source = SecretSource::None;

    bool found() const { return value.has_value(); }
};

// ═══════════════════════════════════════════
//  SecretResolver
//  Takes one probe per source; the constructor fixes the order.
//  resolve() probes at most once per source for the resolver's
//  lifetime and returns the cached result afterwards.
// ═══════════════════════════════════════════
class SecretResolver {
public:
    SecretResolver(std::unique_ptr<SecretProbe> keyVault,
                   std::unique_ptr<SecretProbe> environment,
                   std::unique_ptr<SecretProbe> localFile);

    static SecretResolver withDefaults(const Settings& settings,
                                       const env::Lookup& lookup,
                                       fetch::Transport transport = fetch::defaultTransport());

    const ResolvedSecret& resolve();

private:
    std::unique_ptr<SecretProbe> probes_[3];
    std::optional<ResolvedSecret> result_;
};

} // namespace ytapi::config

namespace ytapi {

// Process-wide configuration, built once in main and passed by reference.
struct AppContext {
    Settings settings;
    config::ResolvedSecret secret;
};

} // namespace ytapi
