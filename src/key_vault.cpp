// ═══════════════════════════════════════════════════════════════════
//  src/key_vault.cpp — Key Vault REST client and Entra ID credentials
// ═══════════════════════════════════════════════════════════════════

#include "ytapi/key_vault.h"
#include "ytapi/console.h"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cctype>
#include <fstream>
#include <sstream>

namespace ytapi::keyvault {

const char* errorKindName(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::Unreachable:    return "unreachable";
        case ErrorKind::AuthFailure:    return "auth-failure";
        case ErrorKind::SecretNotFound: return "secret-not-found";
        case ErrorKind::Misconfigured:  return "misconfigured";
        case ErrorKind::BadResponse:    return "bad-response";
    }
    return "unknown";
}

namespace {

std::string trimTrailingSlashes(std::string s) {
    while (!s.empty() && s.back() == '/') s.pop_back();
    return s;
}

// "https://vault.azure.net/.default" → "https://vault.azure.net"
std::string scopeToResource(const std::string& scope) {
    const std::string suffix = "/.default";
    if (scope.size() > suffix.size() &&
        scope.compare(scope.size() - suffix.size(), suffix.size(), suffix) == 0) {
        return scope.substr(0, scope.size() - suffix.size());
    }
    return scope;
}

// Best-effort extraction of an error message from an AAD or Key Vault body
std::string errorDetail(const fetch::FetchResponse& resp) {
    auto j = nlohmann::json::parse(resp.body, nullptr, false);
    if (!j.is_discarded() && j.is_object()) {
        if (j.contains("error_description") && j["error_description"].is_string()) {
            return j["error_description"].get<std::string>();
        }
        if (j.contains("error")) {
            const auto& err = j["error"];
            if (err.is_object() && err.contains("message") && err["message"].is_string()) {
                return err["message"].get<std::string>();
            }
            if (err.is_string()) return err.get<std::string>();
        }
    }
    return resp.statusText;
}

AccessToken requestClientToken(const fetch::Transport& transport,
                               const CredentialOptions& options,
                               const std::string& tenantId,
                               const std::vector<std::pair<std::string, std::string>>& fields,
                               const std::string& source) {
    auto url = trimTrailingSlashes(options.authorityHost) + "/" + tenantId + "/oauth2/v2.0/token";
    auto resp = transport({
        .url = url,
        .method = "POST",
        .headers = {{"Content-Type", "application/x-www-form-urlencoded"},
                    {"Accept", "application/json"}},
        .body = fetch::encodeForm(fields),
        .timeoutMs = options.timeoutMs,
    });
    return parseTokenResponse(resp, source);
}

} // namespace

AccessToken parseTokenResponse(const fetch::FetchResponse& resp, const std::string& source) {
    if (resp.failed()) {
        throw KeyVaultError(ErrorKind::Unreachable, source + ": " + resp.statusText);
    }
    if (!resp.ok()) {
        throw KeyVaultError(ErrorKind::AuthFailure,
                            source + ": token request failed with status " +
                            std::to_string(resp.status) + ": " + errorDetail(resp),
                            resp.status);
    }

    auto j = nlohmann::json::parse(resp.body, nullptr, false);
    if (j.is_discarded() || !j.is_object() ||
        !j.contains("access_token") || !j["access_token"].is_string()) {
        throw KeyVaultError(ErrorKind::AuthFailure,
                            source + ": token response has no access_token", resp.status);
    }

    return AccessToken{j["access_token"].get<std::string>()};
}

// ═══════════════════════════════════════════
//  ClientSecretCredential
// ═══════════════════════════════════════════
ClientSecretCredential::ClientSecretCredential(std::string tenantId, std::string clientId,
                                               std::string clientSecret,
                                               fetch::Transport transport,
                                               CredentialOptions options)
    : tenantId_(std::move(tenantId))
    , clientId_(std::move(clientId))
    , clientSecret_(std::move(clientSecret))
    , transport_(std::move(transport))
    , options_(std::move(options))
{}

AccessToken ClientSecretCredential::getToken(const std::string& scope) {
    return requestClientToken(transport_, options_, tenantId_, {
        {"grant_type", "client_credentials"},
        {"client_id", clientId_},
        {"client_secret", clientSecret_},
        {"scope", scope},
    }, name());
}

// ═══════════════════════════════════════════
//  WorkloadIdentityCredential
// ═══════════════════════════════════════════
WorkloadIdentityCredential::WorkloadIdentityCredential(std::string tenantId, std::string clientId,
                                                       std::string tokenFile,
                                                       fetch::Transport transport,
                                                       CredentialOptions options)
    : tenantId_(std::move(tenantId))
    , clientId_(std::move(clientId))
    , tokenFile_(std::move(tokenFile))
    , transport_(std::move(transport))
    , options_(std::move(options))
{}

AccessToken WorkloadIdentityCredential::getToken(const std::string& scope) {
    // The projected token is rotated by the kubelet, so read it per request.
    std::ifstream file(tokenFile_, std::ios::binary);
    if (!file.is_open()) {
        throw KeyVaultError(ErrorKind::AuthFailure,
                            name() + ": cannot read federated token file '" + tokenFile_ + "'");
    }
    std::ostringstream oss;
    oss << file.rdbuf();
    auto assertion = oss.str();
    while (!assertion.empty() && std::isspace(static_cast<unsigned char>(assertion.back()))) {
        assertion.pop_back();
    }
    if (assertion.empty()) {
        throw KeyVaultError(ErrorKind::AuthFailure,
                            name() + ": federated token file '" + tokenFile_ + "' is empty");
    }

    return requestClientToken(transport_, options_, tenantId_, {
        {"grant_type", "client_credentials"},
        {"client_id", clientId_},
        {"client_assertion_type", "urn:ietf:params:oauth:client-assertion-type:jwt-bearer"},
        {"client_assertion", assertion},
        {"scope", scope},
    }, name());
}

// ═══════════════════════════════════════════
//  ManagedIdentityCredential
// ═══════════════════════════════════════════
ManagedIdentityCredential::ManagedIdentityCredential(std::string clientId,
                                                     std::string identityEndpoint,
                                                     std::string identityHeader,
                                                     fetch::Transport transport,
                                                     int timeoutMs)
    : clientId_(std::move(clientId))
    , identityEndpoint_(std::move(identityEndpoint))
    , identityHeader_(std::move(identityHeader))
    , transport_(std::move(transport))
    , timeoutMs_(timeoutMs)
{}

AccessToken ManagedIdentityCredential::getToken(const std::string& scope) {
    auto resource = fetch::urlEncode(scopeToResource(scope));

    fetch::RequestOptions opts;
    opts.method = "GET";
    opts.timeoutMs = timeoutMs_;

    if (!identityEndpoint_.empty() && !identityHeader_.empty()) {
        opts.url = identityEndpoint_ + "?api-version=2019-08-01&resource=" + resource;
        if (!clientId_.empty()) opts.url += "&client_id=" + fetch::urlEncode(clientId_);
        opts.headers["X-IDENTITY-HEADER"] = identityHeader_;
    } else {
        opts.url = std::string(kImdsEndpoint) + "?api-version=2018-02-01&resource=" + resource;
        if (!clientId_.empty()) opts.url += "&client_id=" + fetch::urlEncode(clientId_);
        opts.headers["Metadata"] = "true";
    }

    return parseTokenResponse(transport_(opts), name());
}

// ═══════════════════════════════════════════
//  ChainedTokenCredential
// ═══════════════════════════════════════════
AccessToken ChainedTokenCredential::getToken(const std::string& scope) {
    if (chain_.empty()) {
        throw KeyVaultError(ErrorKind::Misconfigured, "no credential configured");
    }

    std::string failures;
    for (auto& credential : chain_) {
        try {
            auto token = credential->getToken(scope);
            console::debug("Acquired token with", credential->name());
            return token;
        } catch (const KeyVaultError& e) {
            console::debug(credential->name(), "unavailable:", e.what());
            if (!failures.empty()) failures += "; ";
            failures += e.what();
        }
    }

    throw KeyVaultError(ErrorKind::AuthFailure,
                        "no credential in the chain produced a token (" + failures + ")");
}

std::shared_ptr<ChainedTokenCredential> defaultCredential(const env::Lookup& lookup,
                                                          fetch::Transport transport,
                                                          int timeoutMs) {
    auto tenantId      = env::getOr(lookup, "AZURE_TENANT_ID", "");
    auto clientId      = env::getOr(lookup, "AZURE_CLIENT_ID", "");
    auto clientSecret  = env::getOr(lookup, "AZURE_CLIENT_SECRET", "");
    auto tokenFile     = env::getOr(lookup, "AZURE_FEDERATED_TOKEN_FILE", "");

    CredentialOptions options;
    options.authorityHost = env::getOr(lookup, "AZURE_AUTHORITY_HOST", options.authorityHost);
    options.timeoutMs = timeoutMs;

    std::vector<std::unique_ptr<TokenCredential>> chain;

    if (!tenantId.empty() && !clientId.empty() && !clientSecret.empty()) {
        chain.push_back(std::make_unique<ClientSecretCredential>(
            tenantId, clientId, clientSecret, transport, options));
    }
    if (!tenantId.empty() && !clientId.empty() && !tokenFile.empty()) {
        chain.push_back(std::make_unique<WorkloadIdentityCredential>(
            tenantId, clientId, tokenFile, transport, options));
    }
    chain.push_back(std::make_unique<ManagedIdentityCredential>(
        clientId,
        env::getOr(lookup, "IDENTITY_ENDPOINT", ""),
        env::getOr(lookup, "IDENTITY_HEADER", ""),
        transport, timeoutMs));

    return std::make_shared<ChainedTokenCredential>(std::move(chain));
}

// ═══════════════════════════════════════════
//  SecretClient
// ═══════════════════════════════════════════
SecretClient::SecretClient(std::string vaultUrl,
                           std::shared_ptr<TokenCredential> credential,
                           fetch::Transport transport,
                           int timeoutMs)
    : vaultUrl_(trimTrailingSlashes(std::move(vaultUrl)))
    , credential_(std::move(credential))
    , transport_(std::move(transport))
    , timeoutMs_(timeoutMs)
{}

std::string SecretClient::secretUrl(const std::string& name) const {
    return vaultUrl_ + "/secrets/" + name + "?api-version=" + kApiVersion;
}

std::string SecretClient::getSecret(const std::string& name) const {
    fetch::ParsedUrl parsed;
    try {
        parsed = fetch::parseUrl(vaultUrl_);
    } catch (const std::invalid_argument& e) {
        throw KeyVaultError(ErrorKind::Misconfigured, "invalid vault URL: " + std::string(e.what()));
    }
    if (parsed.scheme != "https") {
        throw KeyVaultError(ErrorKind::Misconfigured,
                            "vault URL must use https: '" + vaultUrl_ + "'");
    }

    // Key Vault object names: 1-127 alphanumerics and dashes
    bool validName = !name.empty() && name.size() <= 127 &&
        std::all_of(name.begin(), name.end(), [](unsigned char c) {
            return std::isalnum(c) || c == '-';
        });
    if (!validName) {
        throw KeyVaultError(ErrorKind::Misconfigured, "invalid secret name '" + name + "'");
    }

    if (!credential_) {
        throw KeyVaultError(ErrorKind::Misconfigured, "no credential configured");
    }
    auto token = credential_->getToken(kScope);

    auto resp = transport_({
        .url = secretUrl(name),
        .method = "GET",
        .headers = {{"Authorization", "Bearer " + token.token},
                    {"Accept", "application/json"}},
        .timeoutMs = timeoutMs_,
    });

    if (resp.failed()) {
        throw KeyVaultError(ErrorKind::Unreachable, resp.statusText);
    }
    if (resp.status == 401 || resp.status == 403) {
        throw KeyVaultError(ErrorKind::AuthFailure,
                            "access to secret '" + name + "' denied: " + errorDetail(resp),
                            resp.status);
    }
    if (resp.status == 404) {
        throw KeyVaultError(ErrorKind::SecretNotFound,
                            "secret '" + name + "' not found: " + errorDetail(resp),
                            resp.status);
    }
    if (!resp.ok()) {
        throw KeyVaultError(ErrorKind::BadResponse,
                            "unexpected status " + std::to_string(resp.status) +
                            " for secret '" + name + "': " + errorDetail(resp),
                            resp.status);
    }

    auto j = nlohmann::json::parse(resp.body, nullptr, false);
    if (j.is_discarded() || !j.is_object() || !j.contains("value") || !j["value"].is_string()) {
        throw KeyVaultError(ErrorKind::BadResponse,
                            "secret '" + name + "' response has no string value", resp.status);
    }
    return j["value"].get<std::string>();
}

} // namespace ytapi::keyvault
