// ═══════════════════════════════════════════════════════════════════
//  test_key_vault.cpp — Credentials and SecretClient over a scripted transport
// ═══════════════════════════════════════════════════════════════════

#include <gtest/gtest.h>
#include <ytapi/key_vault.h>

#include <deque>
#include <filesystem>
#include <fstream>
#include <random>

using namespace ytapi;
using namespace ytapi::keyvault;

namespace {

fetch::FetchResponse reply(int status, const std::string& body) {
    fetch::FetchResponse resp;
    resp.status = status;
    resp.statusText = status == 200 ? "OK" : "Error";
    resp.body = body;
    return resp;
}

fetch::FetchResponse unreachable(const std::string& why = "connect: Connection refused") {
    fetch::FetchResponse resp;
    resp.statusText = why;
    return resp;
}

// Replays queued responses and records every request
struct ScriptedTransport {
    std::deque<fetch::FetchResponse> replies;
    std::vector<fetch::RequestOptions> requests;

    fetch::Transport transport() {
        return [this](const fetch::RequestOptions& opts) {
            requests.push_back(opts);
            if (replies.empty()) return unreachable("no scripted reply");
            auto next = replies.front();
            replies.pop_front();
            return next;
        };
    }
};

class FixedCredential : public TokenCredential {
public:
    explicit FixedCredential(std::string token) : token_(std::move(token)) {}

    AccessToken getToken(const std::string& scope) override {
        scopes.push_back(scope);
        return {token_};
    }
    std::string name() const override { return "FixedCredential"; }

    std::vector<std::string> scopes;

private:
    std::string token_;
};

class FailingCredential : public TokenCredential {
public:
    explicit FailingCredential(std::string label) : label_(std::move(label)) {}

    AccessToken getToken(const std::string&) override {
        ++calls;
        throw KeyVaultError(ErrorKind::AuthFailure, label_ + " failed");
    }
    std::string name() const override { return label_; }

    int calls = 0;

private:
    std::string label_;
};

ErrorKind kindOf(const std::function<void()>& fn) {
    try {
        fn();
    } catch (const KeyVaultError& e) {
        return e.kind();
    }
    ADD_FAILURE() << "expected a KeyVaultError";
    return ErrorKind::BadResponse;
}

} // namespace

// ═══════════════════════════════════════════
//  SecretClient
// ═══════════════════════════════════════════

class SecretClientTest : public ::testing::Test {
protected:
    ScriptedTransport script;
    std::shared_ptr<FixedCredential> credential = std::make_shared<FixedCredential>("tok");

    SecretClient client(const std::string& url = "https://kv.vault.azure.net/") {
        return SecretClient(url, credential, script.transport(), 2500);
    }
};

TEST_F(SecretClientTest, FetchesSecretValue) {
    script.replies.push_back(reply(200, R"({"value": "abc123", "id": "x"})"));

    EXPECT_EQ(client().getSecret("YouTubeApiKey"), "abc123");

    ASSERT_EQ(script.requests.size(), 1u);
    auto& req = script.requests[0];
    EXPECT_EQ(req.method, "GET");
    EXPECT_EQ(req.url, "https://kv.vault.azure.net/secrets/YouTubeApiKey?api-version=7.4");
    EXPECT_EQ(req.headers.at("Authorization"), "Bearer tok");
    EXPECT_EQ(req.timeoutMs, 2500);
    ASSERT_EQ(credential->scopes.size(), 1u);
    EXPECT_EQ(credential->scopes[0], "https://vault.azure.net/.default");
}

TEST_F(SecretClientTest, MapsStatusCodes) {
    script.replies.push_back(reply(401, R"({"error": {"message": "no"}})"));
    script.replies.push_back(reply(403, "{}"));
    script.replies.push_back(reply(404, R"({"error": {"code": "SecretNotFound"}})"));
    script.replies.push_back(reply(500, "oops"));
    auto c = client();

    EXPECT_EQ(kindOf([&] { c.getSecret("k"); }), ErrorKind::AuthFailure);
    EXPECT_EQ(kindOf([&] { c.getSecret("k"); }), ErrorKind::AuthFailure);
    EXPECT_EQ(kindOf([&] { c.getSecret("k"); }), ErrorKind::SecretNotFound);
    EXPECT_EQ(kindOf([&] { c.getSecret("k"); }), ErrorKind::BadResponse);
}

TEST_F(SecretClientTest, TransportFailureIsUnreachable) {
    script.replies.push_back(unreachable("request to kv.vault.azure.net timed out after 2500ms"));
    try {
        client().getSecret("YouTubeApiKey");
        FAIL() << "expected KeyVaultError";
    } catch (const KeyVaultError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::Unreachable);
        EXPECT_NE(std::string(e.what()).find("timed out"), std::string::npos);
    }
}

TEST_F(SecretClientTest, BodyWithoutValueIsBadResponse) {
    script.replies.push_back(reply(200, R"({"id": "x"})"));
    script.replies.push_back(reply(200, "not json"));
    auto c = client();

    EXPECT_EQ(kindOf([&] { c.getSecret("k"); }), ErrorKind::BadResponse);
    EXPECT_EQ(kindOf([&] { c.getSecret("k"); }), ErrorKind::BadResponse);
}

TEST_F(SecretClientTest, RejectsMisconfiguration) {
    EXPECT_EQ(kindOf([&] { client("http://kv.vault.azure.net").getSecret("k"); }),
              ErrorKind::Misconfigured);
    EXPECT_EQ(kindOf([&] { client("ftp://kv").getSecret("k"); }), ErrorKind::Misconfigured);
    EXPECT_EQ(kindOf([&] { client().getSecret("bad name"); }), ErrorKind::Misconfigured);
    EXPECT_EQ(kindOf([&] { client().getSecret(""); }), ErrorKind::Misconfigured);

    SecretClient noCredential("https://kv.vault.azure.net", nullptr, script.transport());
    EXPECT_EQ(kindOf([&] { noCredential.getSecret("k"); }), ErrorKind::Misconfigured);

    EXPECT_TRUE(script.requests.empty());
}

// ═══════════════════════════════════════════
//  Token responses
// ═══════════════════════════════════════════

TEST(TokenResponseTest, ParsesAccessToken) {
    auto token = parseTokenResponse(
        reply(200, R"({"access_token": "t1", "expires_in": 3599})"), "test");
    EXPECT_EQ(token.token, "t1");
}

TEST(TokenResponseTest, ExpiryFieldsDoNotAffectParsing) {
    EXPECT_EQ(parseTokenResponse(
        reply(200, R"({"access_token": "t2", "expires_on": "99999999999999999"})"), "test").token,
        "t2");
    EXPECT_EQ(parseTokenResponse(
        reply(200, R"({"access_token": "t3", "expires_in": 9223372036854775807})"), "test").token,
        "t3");
    EXPECT_EQ(parseTokenResponse(
        reply(200, R"({"access_token": "t4", "expires_on": "soon"})"), "test").token,
        "t4");
}

TEST(TokenResponseTest, Failures) {
    EXPECT_EQ(kindOf([] { parseTokenResponse(unreachable(), "test"); }),
              ErrorKind::Unreachable);
    EXPECT_EQ(kindOf([] {
        parseTokenResponse(reply(400, R"({"error": "invalid_client"})"), "test");
    }), ErrorKind::AuthFailure);
    EXPECT_EQ(kindOf([] { parseTokenResponse(reply(200, R"({"token_type": "Bearer"})"), "test"); }),
              ErrorKind::AuthFailure);
}

TEST(TokenResponseTest, ErrorDescriptionIsReported) {
    try {
        parseTokenResponse(reply(401, R"({"error": "invalid_client",
                                           "error_description": "AADSTS7000215"})"), "src");
        FAIL() << "expected KeyVaultError";
    } catch (const KeyVaultError& e) {
        EXPECT_EQ(e.status(), 401);
        EXPECT_NE(std::string(e.what()).find("AADSTS7000215"), std::string::npos);
    }
}

// ═══════════════════════════════════════════
//  Credentials
// ═══════════════════════════════════════════

TEST(ClientSecretCredentialTest, PostsClientCredentialsGrant) {
    ScriptedTransport script;
    script.replies.push_back(reply(200, R"({"access_token": "aad"})"));

    ClientSecretCredential credential("tenant", "client", "s3cr&t", script.transport(),
                                      {.authorityHost = "https://login.example.com/"});
    EXPECT_EQ(credential.getToken("https://vault.azure.net/.default").token, "aad");

    ASSERT_EQ(script.requests.size(), 1u);
    auto& req = script.requests[0];
    EXPECT_EQ(req.method, "POST");
    EXPECT_EQ(req.url, "https://login.example.com/tenant/oauth2/v2.0/token");
    EXPECT_EQ(req.headers.at("Content-Type"), "application/x-www-form-urlencoded");
    EXPECT_NE(req.body.find("grant_type=client_credentials"), std::string::npos);
    EXPECT_NE(req.body.find("client_secret=s3cr%26t"), std::string::npos);
    EXPECT_NE(req.body.find("scope=https%3A%2F%2Fvault.azure.net%2F.default"), std::string::npos);
}

TEST(WorkloadIdentityCredentialTest, SendsFederatedAssertion) {
    std::random_device rd;
    auto path = std::filesystem::temp_directory_path() /
                ("ytapi-token-" + std::to_string(rd()));
    std::ofstream(path) << "eyJ.assertion\n";

    ScriptedTransport script;
    script.replies.push_back(reply(200, R"({"access_token": "wi"})"));
    WorkloadIdentityCredential credential("tenant", "client", path.string(), script.transport());

    EXPECT_EQ(credential.getToken("https://vault.azure.net/.default").token, "wi");
    ASSERT_EQ(script.requests.size(), 1u);
    EXPECT_NE(script.requests[0].body.find("client_assertion=eyJ.assertion&"), std::string::npos);

    std::filesystem::remove(path);
}

TEST(WorkloadIdentityCredentialTest, MissingTokenFileIsAuthFailure) {
    ScriptedTransport script;
    WorkloadIdentityCredential credential("tenant", "client", "/nonexistent/ytapi/token",
                                          script.transport());
    EXPECT_EQ(kindOf([&] { credential.getToken("s"); }), ErrorKind::AuthFailure);
    EXPECT_TRUE(script.requests.empty());
}

TEST(ManagedIdentityCredentialTest, UsesInstanceMetadataService) {
    ScriptedTransport script;
    script.replies.push_back(reply(200, R"({"access_token": "mi", "expires_on": 1700000000})"));

    ManagedIdentityCredential credential("", "", "", script.transport(), 1234);
    EXPECT_EQ(credential.getToken("https://vault.azure.net/.default").token, "mi");

    ASSERT_EQ(script.requests.size(), 1u);
    auto& req = script.requests[0];
    EXPECT_EQ(req.url, std::string(ManagedIdentityCredential::kImdsEndpoint) +
                       "?api-version=2018-02-01&resource=https%3A%2F%2Fvault.azure.net");
    EXPECT_EQ(req.headers.at("Metadata"), "true");
    EXPECT_EQ(req.timeoutMs, 1234);
}

TEST(ManagedIdentityCredentialTest, UsesAppServiceEndpoint) {
    ScriptedTransport script;
    script.replies.push_back(reply(200, R"({"access_token": "mi"})"));

    ManagedIdentityCredential credential("cid", "http://localhost:41741/msi/token", "hdr",
                                         script.transport());
    credential.getToken("https://vault.azure.net/.default");

    auto& req = script.requests.at(0);
    EXPECT_EQ(req.url, "http://localhost:41741/msi/token?api-version=2019-08-01"
                       "&resource=https%3A%2F%2Fvault.azure.net&client_id=cid");
    EXPECT_EQ(req.headers.at("X-IDENTITY-HEADER"), "hdr");
}

TEST(ChainedTokenCredentialTest, FirstSuccessWins) {
    auto first = std::make_unique<FailingCredential>("first");
    auto* firstPtr = first.get();
    std::vector<std::unique_ptr<TokenCredential>> chain;
    chain.push_back(std::move(first));
    chain.push_back(std::make_unique<FixedCredential>("second"));
    chain.push_back(std::make_unique<FailingCredential>("third"));

    ChainedTokenCredential credential(std::move(chain));
    EXPECT_EQ(credential.getToken("s").token, "second");
    EXPECT_EQ(firstPtr->calls, 1);
}

TEST(ChainedTokenCredentialTest, AllFailuresAreCombined) {
    std::vector<std::unique_ptr<TokenCredential>> chain;
    chain.push_back(std::make_unique<FailingCredential>("first"));
    chain.push_back(std::make_unique<FailingCredential>("second"));
    ChainedTokenCredential credential(std::move(chain));

    try {
        credential.getToken("s");
        FAIL() << "expected KeyVaultError";
    } catch (const KeyVaultError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::AuthFailure);
        std::string what = e.what();
        EXPECT_NE(what.find("first failed"), std::string::npos);
        EXPECT_NE(what.find("second failed"), std::string::npos);
    }

    ChainedTokenCredential empty(std::vector<std::unique_ptr<TokenCredential>>{});
    EXPECT_EQ(kindOf([&] { empty.getToken("s"); }), ErrorKind::Misconfigured);
}

TEST(DefaultCredentialTest, ManagedIdentityOnlyByDefault) {
    ScriptedTransport script;
    auto credential = defaultCredential(env::fromMap({}), script.transport());
    ASSERT_EQ(credential->size(), 1u);
    EXPECT_EQ(credential->at(0).name(), "ManagedIdentityCredential");
}

TEST(DefaultCredentialTest, ChainOrderFollowsEnvironment) {
    ScriptedTransport script;
    auto credential = defaultCredential(env::fromMap({
        {"AZURE_TENANT_ID", "t"},
        {"AZURE_CLIENT_ID", "c"},
        {"AZURE_CLIENT_SECRET", "s"},
        {"AZURE_FEDERATED_TOKEN_FILE", "/var/run/secrets/token"},
    }), script.transport());

    ASSERT_EQ(credential->size(), 3u);
    EXPECT_EQ(credential->at(0).name(), "ClientSecretCredential");
    EXPECT_EQ(credential->at(1).name(), "WorkloadIdentityCredential");
    EXPECT_EQ(credential->at(2).name(), "ManagedIdentityCredential");
}

TEST(DefaultCredentialTest, FallsThroughToManagedIdentity) {
    ScriptedTransport script;
    script.replies.push_back(reply(401, R"({"error_description": "bad secret"})"));
    script.replies.push_back(reply(200, R"({"access_token": "from-imds"})"));

    auto credential = defaultCredential(env::fromMap({
        {"AZURE_TENANT_ID", "t"},
        {"AZURE_CLIENT_ID", "c"},
        {"AZURE_CLIENT_SECRET", "s"},
    }), script.transport());

    EXPECT_EQ(credential->getToken(SecretClient::kScope).token, "from-imds");
    ASSERT_EQ(script.requests.size(), 2u);
    EXPECT_NE(script.requests[1].url.find("169.254.169.254"), std::string::npos);
    EXPECT_NE(script.requests[1].url.find("client_id=c"), std::string::npos);
}

TEST(ErrorKindTest, Names) {
    EXPECT_STREQ(errorKindName(ErrorKind::Unreachable), "unreachable");
    EXPECT_STREQ(errorKindName(ErrorKind::AuthFailure), "auth-failure");
    EXPECT_STREQ(errorKindName(ErrorKind::SecretNotFound), "secret-not-found");
    EXPECT_STREQ(errorKindName(ErrorKind::Misconfigured), "misconfigured");
    EXPECT_STREQ(errorKindName(ErrorKind::BadResponse), "bad-response");
}
