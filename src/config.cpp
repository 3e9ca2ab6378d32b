// ═══════════════════════════════════════════════════════════════════
//  src/config.cpp — Secret probes and the resolution chain
// ═══════════════════════════════════════════════════════════════════

#include "ytapi/config.h"
#include "ytapi/console.h"
#include "ytapi/key_vault.h"

#include <nlohmann/json.hpp>

#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace ytapi::config {

const char* sourceName(SecretSource source) {
    switch (source) {
        case SecretSource::KeyVault:    return "key-vault";
        case SecretSource::Environment: return "environment";
        case SecretSource::LocalFile:   return "local-file";
        case SecretSource::None:        return "none";
    }
    return "none";
}

namespace {

// Wording used in the log lines
const char* sourceLabel(SecretSource source) {
    switch (source) {
        case SecretSource::KeyVault:    return "Azure Key Vault";
        case SecretSource::Environment: return "environment variable";
        case SecretSource::LocalFile:   return "local settings file";
        case SecretSource::None:        return "nowhere";
    }
    return "nowhere";
}

const char* failureLabel(SecretSource source) {
    return source == SecretSource::LocalFile ? "settings file" : sourceLabel(source);
}

} // namespace

// ═══════════════════════════════════════════
//  Probes
// ═══════════════════════════════════════════

ProbeResult KeyVaultProbe::probe() {
    if (vaultUrl_.empty()) {
        return ProbeResult::skipped("AZURE_KEY_VAULT_URL is not set");
    }

    try {
        auto value = fetcher_(vaultUrl_, secretName_);
        if (value.empty()) {
            return ProbeResult::empty("secret '" + secretName_ + "' is empty");
        }
        return ProbeResult::found(std::move(value));
    } catch (const keyvault::KeyVaultError& e) {
        return ProbeResult::failed(std::string(e.what()) + " [" +
                                   keyvault::errorKindName(e.kind()) + "]");
    } catch (const std::exception& e) {
        return ProbeResult::failed(e.what());
    }
}

ProbeResult EnvironmentProbe::probe() {
    auto value = lookup_(variable_);
    if (!value) {
        return ProbeResult::skipped(variable_ + " is not set");
    }
    if (value->empty()) {
        return ProbeResult::empty(variable_ + " is empty");
    }
    return ProbeResult::found(std::move(*value));
}

ProbeResult SettingsFileProbe::probe() {
    std::error_code ec;
    if (!std::filesystem::exists(path_, ec)) {
        if (ec) return ProbeResult::failed("cannot stat '" + path_ + "': " + ec.message());
        return ProbeResult::skipped("'" + path_ + "' does not exist");
    }

    std::ifstream file(path_, std::ios::binary);
    if (!file.is_open()) {
        return ProbeResult::failed("cannot open '" + path_ + "'");
    }
    std::ostringstream oss;
    oss << file.rdbuf();

    nlohmann::json settings;
    try {
        settings = nlohmann::json::parse(oss.str());
    } catch (const nlohmann::json::parse_error& e) {
        return ProbeResult::failed("invalid JSON in '" + path_ + "': " + e.what());
    }

    if (!settings.is_object()) {
        return ProbeResult::failed("'" + path_ + "' is not a JSON object");
    }
    if (!settings.contains(field_) || settings[field_].is_null()) {
        return ProbeResult::empty("'" + path_ + "' has no field '" + field_ + "'");
    }
    if (!settings[field_].is_string()) {
        return ProbeResult::failed("field '" + field_ + "' in '" + path_ + "' is not a string");
    }

    auto value = settings[field_].get<std::string>();
    if (value.empty()) {
        return ProbeResult::empty("field '" + field_ + "' in '" + path_ + "' is empty");
    }
    return ProbeResult::found(std::move(value));
}

VaultFetcher keyVaultFetcher(env::Lookup lookup, fetch::Transport transport, int timeoutMs) {
    return [lookup = std::move(lookup), transport = std::move(transport), timeoutMs](
               const std::string& vaultUrl, const std::string& secretName) {
        auto credential = keyvault::defaultCredential(lookup, transport, timeoutMs);
        keyvault::SecretClient client(vaultUrl, credential, transport, timeoutMs);
        return client.getSecret(secretName);
    };
}

// ═══════════════════════════════════════════
//  SecretResolver
// ═══════════════════════════════════════════

SecretResolver::SecretResolver(std::unique_ptr<SecretProbe> keyVault,
                               std::unique_ptr<SecretProbe> environment,
                               std::unique_ptr<SecretProbe> localFile)
    : probes_{std::move(keyVault), std::move(environment), std::move(localFile)}
{
    const SecretSource expected[] = {
        SecretSource::KeyVault, SecretSource::Environment, SecretSource::LocalFile};
    for (int i = 0; i < 3; ++i) {
        if (!probes_[i] || probes_[i]->source() != expected[i]) {
            throw std::invalid_argument(std::string("SecretResolver: slot ") +
                                        std::to_string(i) + " must be a " +
                                        sourceName(expected[i]) + " probe");
        }
    }
}

SecretResolver SecretResolver::withDefaults(const Settings& settings,
                                            const env::Lookup& lookup,
                                            fetch::Transport transport) {
    return SecretResolver(
        std::make_unique<KeyVaultProbe>(
            settings.keyVaultUrl, settings.keyVaultSecretName,
            keyVaultFetcher(lookup, std::move(transport), settings.keyVaultTimeoutMs)),
        std::make_unique<EnvironmentProbe>(lookup, settings.secretEnvVar),
        std::make_unique<SettingsFileProbe>(settings.settingsFile, settings.settingsField));
}

const ResolvedSecret& SecretResolver::resolve() {
    if (result_) return *result_;

    for (auto& probe : probes_) {
        auto source = probe->source();
        auto outcome = probe->probe();

        switch (outcome.status) {
            case ProbeStatus::Found:
                console::info("YouTube API key loaded from", sourceLabel(source));
                result_ = ResolvedSecret{std::move(outcome.value), source};
                return *result_;
            case ProbeStatus::Failed:
                console::warn(std::string("Failed to load from ") + failureLabel(source) + ":",
                              outcome.reason);
                break;
            case ProbeStatus::Empty:
            case ProbeStatus::Skipped:
                console::debug("No YouTube API key from", sourceLabel(source) + std::string(":"),
                               outcome.reason);
                break;
        }
    }

    console::info("No YouTube API key found - transcript API will work without it");
    result_ = ResolvedSecret{};
    return *result_;
}

} // namespace ytapi::config
