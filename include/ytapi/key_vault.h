#pragma once
// ═══════════════════════════════════════════════════════════════════
//  ytapi/key_vault.h — Azure Key Vault secret client
// ═══════════════════════════════════════════════════════════════════
//
//  Usage:
//    auto credential = keyvault::defaultCredential(env::processEnvironment(),
//                                                  fetch::defaultTransport());
//    keyvault::SecretClient client("https://myvault.vault.azure.net",
//                                  credential, fetch::defaultTransport());
//    std::string value = client.getSecret("YouTubeApiKey");
//
//  Every failure is reported as a KeyVaultError.
// ═══════════════════════════════════════════════════════════════════

#include "env.h"
#include "fetch.h"
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

namespace ytapi::keyvault {

enum class ErrorKind {
    Unreachable,      // DNS, connect, TLS or timeout
    AuthFailure,      // no token, or 401/403 from the vault
    SecretNotFound,   // 404 from the vault
    Misconfigured,    // bad vault URL or secret name
    BadResponse,      // unexpected status or body
};

const char* errorKindName(ErrorKind kind);

class KeyVaultError : public std::runtime_error {
public:
    KeyVaultError(ErrorKind kind, const std::string& message, int status = 0)
        : std::runtime_error(message), kind_(kind), status_(status) {}

    ErrorKind kind() const { return kind_; }
    int status() const { return status_; }

private:
    ErrorKind kind_;
    int status_;
};

// Tokens are requested once per resolution and never cached, so the
// expiry fields of the reply are not kept.
struct AccessToken {
    std::string token;
};

// ═══════════════════════════════════════════
//  Credentials
// ═══════════════════════════════════════════
class TokenCredential {
public:
    virtual ~TokenCredential() = default;

    // scope: e.g. "https://vault.azure.net/.default"
    virtual AccessToken getToken(const std::string& scope) = 0;
    virtual std::string name() const = 0;
};

struct CredentialOptions {
    std::string authorityHost = "https://login.microsoftonline.com";
    int timeoutMs = 10000;
};

// Service principal with a client secret (AZURE_TENANT_ID, AZURE_CLIENT_ID,
// AZURE_CLIENT_SECRET).
class ClientSecretCredential : public TokenCredential {
public:
    ClientSecretCredential(std::string tenantId, std::string clientId,
                           std::string clientSecret, fetch::Transport transport,
                           CredentialOptions options = {});

    AccessToken getToken(const std::string& scope) override;
    std::string name() const override { return "ClientSecretCredential"; }

private:
    std::string tenantId_;
    std::string clientId_;
    std::string clientSecret_;
    fetch::Transport transport_;
    CredentialOptions options_;
};

// Federated token projected into the pod (AKS workload identity).
class WorkloadIdentityCredential : public TokenCredential {
public:
    WorkloadIdentityCredential(std::string tenantId, std::string clientId,
                               std::string tokenFile, fetch::Transport transport,
                               CredentialOptions options = {});

    AccessToken getToken(const std::string& scope) override;
    std::string name() const override { return "WorkloadIdentityCredential"; }

private:
    std::string tenantId_;
    std::string clientId_;
    std::string tokenFile_;
    fetch::Transport transport_;
    CredentialOptions options_;
};

// Managed identity through the App Service endpoint when IDENTITY_ENDPOINT
// is set, otherwise through the instance metadata service.
class ManagedIdentityCredential : public TokenCredential {
public:
    static constexpr const char* kImdsEndpoint =
        "http://169.254.169.254/metadata/identity/oauth2/token";

    ManagedIdentityCredential(std::string clientId,
                              std::string identityEndpoint,
                              std::string identityHeader,
                              fetch::Transport transport,
                              int timeoutMs = 10000);

    AccessToken getToken(const std::string& scope) override;
    std::string name() const override { return "ManagedIdentityCredential"; }

private:
    std::string clientId_;
    std::string identityEndpoint_;
    std::string identityHeader_;
    fetch::Transport transport_;
    int timeoutMs_;
};

// First credential that yields a token wins.
class ChainedTokenCredential : public TokenCredential {
public:
    explicit ChainedTokenCredential(std::vector<std::unique_ptr<TokenCredential>> chain)
        : chain_(std::move(chain)) {}

    AccessToken getToken(const std::string& scope) override;
    std::string name() const override { return "ChainedTokenCredential"; }

    std::size_t size() const { return chain_.size(); }
    const TokenCredential& at(std::size_t i) const { return *chain_.at(i); }

private:
    std::vector<std::unique_ptr<TokenCredential>> chain_;
};

// Environment → workload identity → managed identity, each included only
// when its inputs are present (managed identity is always included).
std::shared_ptr<ChainedTokenCredential> defaultCredential(const env::Lookup& lookup,
                                                          fetch::Transport transport,
                                                          int timeoutMs = 10000);

// Parses an OAuth2 token endpoint response. Throws KeyVaultError.
AccessToken parseTokenResponse(const fetch::FetchResponse& resp, const std::string& source);

// ═══════════════════════════════════════════
//  SecretClient
// ═══════════════════════════════════════════
class SecretClient {
public:
    static constexpr const char* kScope      = "https://vault.azure.net/.default";
    static constexpr const char* kApiVersion = "7.4";

    SecretClient(std::string vaultUrl,
                 std::shared_ptr<TokenCredential> credential,
                 fetch::Transport transport,
                 int timeoutMs = 10000);

    // Latest version of the named secret. Throws KeyVaultError.
    std::string getSecret(const std::string& name) const;

    // {vault}/secrets/{name}?api-version=7.4
    std::string secretUrl(const std::string& name) const;

private:
    std::string vaultUrl_;
    std::shared_ptr<TokenCredential> credential_;
    fetch::Transport transport_;
    int timeoutMs_;
};

} // namespace ytapi::keyvault
