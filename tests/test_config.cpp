// ═══════════════════════════════════════════════════════════════════
//  test_config.cpp — Secret probes and resolution order
// ═══════════════════════════════════════════════════════════════════

#include <gtest/gtest.h>
#include <ytapi/config.h>
#include <ytapi/console.h>
#include <ytapi/key_vault.h>

#include <atomic>
#include <filesystem>
#include <fstream>
#include <random>
#include <string>
#include <vector>

using namespace ytapi;
using namespace ytapi::config;

namespace {

// Records every log line while alive
class LogCapture {
public:
    LogCapture() : previous_(console::level()) {
        console::setLevel(console::Level::Debug);
        console::setSink([this](console::Level level, const std::string& msg) {
            lines.push_back({level, msg});
        });
    }
    ~LogCapture() {
        console::setSink(nullptr);
        console::setLevel(previous_);
    }

    std::size_t count(console::Level level) const {
        std::size_t n = 0;
        for (auto& line : lines) if (line.first == level) ++n;
        return n;
    }

    bool contains(const std::string& text) const {
        for (auto& line : lines) {
            if (line.second.find(text) != std::string::npos) return true;
        }
        return false;
    }

    std::vector<std::pair<console::Level, std::string>> lines;

private:
    console::Level previous_;
};

// Scripted probe that counts how often it is consulted
class FakeProbe : public SecretProbe {
public:
    FakeProbe(SecretSource source, ProbeResult result, int* calls)
        : source_(source), result_(std::move(result)), calls_(calls) {}

    SecretSource source() const override { return source_; }
    ProbeResult probe() override {
        ++*calls_;
        return result_;
    }

private:
    SecretSource source_;
    ProbeResult result_;
    int* calls_;
};

class TempDir {
public:
    TempDir() {
        std::random_device rd;
        path_ = std::filesystem::temp_directory_path() /
                ("ytapi-test-" + std::to_string(rd()) + std::to_string(rd()));
        std::filesystem::create_directories(path_);
    }
    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }

    std::string write(const std::string& name, const std::string& content) const {
        auto file = path_ / name;
        std::ofstream(file, std::ios::binary) << content;
        return file.string();
    }

    std::string file(const std::string& name) const { return (path_ / name).string(); }

private:
    std::filesystem::path path_;
};

ProbeResult available(const std::string& value) { return ProbeResult::found(value); }
ProbeResult unavailable() { return ProbeResult::skipped("not configured"); }

} // namespace

// ═══════════════════════════════════════════
//  Resolution order
// ═══════════════════════════════════════════

class ResolverOrderTest : public ::testing::Test {
protected:
    int vaultCalls = 0;
    int envCalls = 0;
    int fileCalls = 0;
    LogCapture logs;

    SecretResolver make(ProbeResult vault, ProbeResult env, ProbeResult file) {
        return SecretResolver(
            std::make_unique<FakeProbe>(SecretSource::KeyVault, std::move(vault), &vaultCalls),
            std::make_unique<FakeProbe>(SecretSource::Environment, std::move(env), &envCalls),
            std::make_unique<FakeProbe>(SecretSource::LocalFile, std::move(file), &fileCalls));
    }
};

TEST_F(ResolverOrderTest, KeyVaultWinsAndStopsResolution) {
    auto resolver = make(available("vault"), available("env"), available("file"));
    auto& result = resolver.resolve();

    EXPECT_EQ(result.value, "vault");
    EXPECT_EQ(result.source, SecretSource::KeyVault);
    EXPECT_EQ(vaultCalls, 1);
    EXPECT_EQ(envCalls, 0);
    EXPECT_EQ(fileCalls, 0);
    EXPECT_TRUE(logs.contains("YouTube API key loaded from Azure Key Vault"));
}

TEST_F(ResolverOrderTest, EnvironmentUsedWhenVaultUnavailable) {
    auto resolver = make(unavailable(), available("env"), available("file"));
    auto& result = resolver.resolve();

    EXPECT_EQ(result.value, "env");
    EXPECT_EQ(result.source, SecretSource::Environment);
    EXPECT_EQ(vaultCalls, 1);
    EXPECT_EQ(envCalls, 1);
    EXPECT_EQ(fileCalls, 0);
    EXPECT_TRUE(logs.contains("YouTube API key loaded from environment variable"));
}

TEST_F(ResolverOrderTest, LocalFileUsedWhenOthersUnavailable) {
    auto resolver = make(unavailable(), unavailable(), available("file"));
    auto& result = resolver.resolve();

    EXPECT_EQ(result.value, "file");
    EXPECT_EQ(result.source, SecretSource::LocalFile);
    EXPECT_EQ(fileCalls, 1);
    EXPECT_TRUE(logs.contains("YouTube API key loaded from local settings file"));
}

TEST_F(ResolverOrderTest, NothingAvailableYieldsNone) {
    auto resolver = make(unavailable(), unavailable(), unavailable());
    auto& result = resolver.resolve();

    EXPECT_FALSE(result.found());
    EXPECT_EQ(result.source, SecretSource::None);
    EXPECT_EQ(vaultCalls + envCalls + fileCalls, 3);
    EXPECT_EQ(logs.count(console::Level::Warn), 0u);
    EXPECT_EQ(logs.count(console::Level::Error), 0u);
    EXPECT_TRUE(logs.contains("No YouTube API key found - transcript API will work without it"));
}

TEST_F(ResolverOrderTest, FailedVaultIsWarnedAndFallsThrough) {
    auto resolver = make(ProbeResult::failed("connection refused"), available("abc123"),
                         available("file"));
    auto& result = resolver.resolve();

    EXPECT_EQ(result.value, "abc123");
    EXPECT_EQ(result.source, SecretSource::Environment);
    EXPECT_EQ(logs.count(console::Level::Warn), 1u);
    EXPECT_TRUE(logs.contains("Failed to load from Azure Key Vault: connection refused"));
}

TEST_F(ResolverOrderTest, EmptyValuesAreNotAccepted) {
    auto resolver = make(ProbeResult::empty("blank"), ProbeResult::empty("blank"),
                         available("file"));
    EXPECT_EQ(resolver.resolve().source, SecretSource::LocalFile);
}

TEST_F(ResolverOrderTest, OneLogLinePerAttemptedSource) {
    auto resolver = make(unavailable(), ProbeResult::failed("boom"), unavailable());
    resolver.resolve();

    // three attempts + the final summary
    EXPECT_EQ(logs.lines.size(), 4u);
}

TEST_F(ResolverOrderTest, ResolveProbesEachSourceOnlyOnce) {
    auto resolver = make(unavailable(), unavailable(), available("file"));
    resolver.resolve();
    auto& second = resolver.resolve();

    EXPECT_EQ(second.value, "file");
    EXPECT_EQ(vaultCalls, 1);
    EXPECT_EQ(envCalls, 1);
    EXPECT_EQ(fileCalls, 1);
}

TEST(SecretResolverTest, RejectsProbesInWrongSlots) {
    int calls = 0;
    EXPECT_THROW(SecretResolver(
        std::make_unique<FakeProbe>(SecretSource::Environment, unavailable(), &calls),
        std::make_unique<FakeProbe>(SecretSource::KeyVault, unavailable(), &calls),
        std::make_unique<FakeProbe>(SecretSource::LocalFile, unavailable(), &calls)),
        std::invalid_argument);
    EXPECT_THROW(SecretResolver(nullptr, nullptr, nullptr), std::invalid_argument);
}

// ═══════════════════════════════════════════
//  KeyVaultProbe
// ═══════════════════════════════════════════

TEST(KeyVaultProbeTest, SkippedWithoutUrl) {
    bool called = false;
    KeyVaultProbe probe("", "YouTubeApiKey", [&](const std::string&, const std::string&) {
        called = true;
        return std::string("x");
    });

    EXPECT_EQ(probe.probe().status, ProbeStatus::Skipped);
    EXPECT_FALSE(called);
}

TEST(KeyVaultProbeTest, PassesUrlAndSecretName) {
    std::string seenUrl, seenName;
    KeyVaultProbe probe("https://kv.vault.azure.net", "YouTubeApiKey",
        [&](const std::string& url, const std::string& name) {
            seenUrl = url;
            seenName = name;
            return std::string("secret");
        });

    auto result = probe.probe();
    EXPECT_EQ(result.status, ProbeStatus::Found);
    EXPECT_EQ(result.value, "secret");
    EXPECT_EQ(seenUrl, "https://kv.vault.azure.net");
    EXPECT_EQ(seenName, "YouTubeApiKey");
}

TEST(KeyVaultProbeTest, ExceptionsBecomeFailures) {
    KeyVaultProbe authFailure("https://kv.vault.azure.net", "YouTubeApiKey",
        [](const std::string&, const std::string&) -> std::string {
            throw keyvault::KeyVaultError(keyvault::ErrorKind::AuthFailure, "denied", 403);
        });
    auto result = authFailure.probe();
    EXPECT_EQ(result.status, ProbeStatus::Failed);
    EXPECT_NE(result.reason.find("denied"), std::string::npos);
    EXPECT_NE(result.reason.find("auth-failure"), std::string::npos);

    KeyVaultProbe anyError("https://kv.vault.azure.net", "YouTubeApiKey",
        [](const std::string&, const std::string&) -> std::string {
            throw std::runtime_error("unexpected");
        });
    EXPECT_EQ(anyError.probe().status, ProbeStatus::Failed);
}

TEST(KeyVaultProbeTest, EmptySecretIsEmpty) {
    KeyVaultProbe probe("https://kv.vault.azure.net", "YouTubeApiKey",
        [](const std::string&, const std::string&) { return std::string(); });
    EXPECT_EQ(probe.probe().status, ProbeStatus::Empty);
}

// ═══════════════════════════════════════════
//  EnvironmentProbe
// ═══════════════════════════════════════════

TEST(EnvironmentProbeTest, UnsetEmptyAndSet) {
    EXPECT_EQ(EnvironmentProbe(env::fromMap({}), "YOUTUBE_API_KEY").probe().status,
              ProbeStatus::Skipped);
    EXPECT_EQ(EnvironmentProbe(env::fromMap({{"YOUTUBE_API_KEY", ""}}), "YOUTUBE_API_KEY")
                  .probe().status,
              ProbeStatus::Empty);

    auto found = EnvironmentProbe(env::fromMap({{"YOUTUBE_API_KEY", "abc123"}}),
                                  "YOUTUBE_API_KEY").probe();
    EXPECT_EQ(found.status, ProbeStatus::Found);
    EXPECT_EQ(found.value, "abc123");
}

// ═══════════════════════════════════════════
//  SettingsFileProbe
// ═══════════════════════════════════════════

TEST(SettingsFileProbeTest, MissingFileIsSkipped) {
    TempDir dir;
    SettingsFileProbe probe(dir.file("settings.json"), "youtube_api_key");
    EXPECT_EQ(probe.probe().status, ProbeStatus::Skipped);
}

TEST(SettingsFileProbeTest, ReadsField) {
    TempDir dir;
    auto path = dir.write("settings.json", R"({"youtube_api_key": "xyz", "other": 1})");
    auto result = SettingsFileProbe(path, "youtube_api_key").probe();
    EXPECT_EQ(result.status, ProbeStatus::Found);
    EXPECT_EQ(result.value, "xyz");
}

TEST(SettingsFileProbeTest, MalformedJsonFails) {
    TempDir dir;
    auto path = dir.write("settings.json", R"({"youtube_api_key": )");
    auto result = SettingsFileProbe(path, "youtube_api_key").probe();
    EXPECT_EQ(result.status, ProbeStatus::Failed);
    EXPECT_NE(result.reason.find("invalid JSON"), std::string::npos);
}

TEST(SettingsFileProbeTest, NonObjectFails) {
    TempDir dir;
    auto path = dir.write("settings.json", R"(["youtube_api_key"])");
    EXPECT_EQ(SettingsFileProbe(path, "youtube_api_key").probe().status, ProbeStatus::Failed);
}

TEST(SettingsFileProbeTest, MissingNullOrEmptyFieldIsEmpty) {
    TempDir dir;
    EXPECT_EQ(SettingsFileProbe(dir.write("a.json", R"({"other": "x"})"), "youtube_api_key")
                  .probe().status, ProbeStatus::Empty);
    EXPECT_EQ(SettingsFileProbe(dir.write("b.json", R"({"youtube_api_key": null})"),
                                "youtube_api_key").probe().status, ProbeStatus::Empty);
    EXPECT_EQ(SettingsFileProbe(dir.write("c.json", R"({"youtube_api_key": ""})"),
                                "youtube_api_key").probe().status, ProbeStatus::Empty);
}

TEST(SettingsFileProbeTest, NonStringFieldFails) {
    TempDir dir;
    auto path = dir.write("settings.json", R"({"youtube_api_key": 42})");
    EXPECT_EQ(SettingsFileProbe(path, "youtube_api_key").probe().status, ProbeStatus::Failed);
}

// ═══════════════════════════════════════════
//  End-to-end with the production probes
// ═══════════════════════════════════════════

class EndToEndTest : public ::testing::Test {
protected:
    TempDir dir;
    LogCapture logs;
    std::atomic<int> transportCalls{0};

    // Every network call fails as if the host were unreachable
    fetch::Transport unreachable() {
        return [this](const fetch::RequestOptions&) {
            ++transportCalls;
            fetch::FetchResponse resp;
            resp.statusText = "connect: Connection refused";
            return resp;
        };
    }

    Settings settingsFor(const env::Lookup& lookup) {
        auto settings = Settings::fromEnvironment(lookup);
        settings.settingsFile = dir.file("settings.json");
        return settings;
    }
};

TEST_F(EndToEndTest, NothingConfigured) {
    auto lookup = env::fromMap({});
    auto resolver = SecretResolver::withDefaults(settingsFor(lookup), lookup, unreachable());

    ResolvedSecret result;
    EXPECT_NO_THROW(result = resolver.resolve());
    EXPECT_FALSE(result.found());
    EXPECT_EQ(result.source, SecretSource::None);
    EXPECT_EQ(transportCalls.load(), 0);
}

TEST_F(EndToEndTest, UnreachableVaultFallsBackToEnvironment) {
    auto lookup = env::fromMap({
        {"AZURE_KEY_VAULT_URL", "https://unreachable.vault.azure.net"},
        {"YOUTUBE_API_KEY", "abc123"},
    });
    auto resolver = SecretResolver::withDefaults(settingsFor(lookup), lookup, unreachable());

    auto& result = resolver.resolve();
    EXPECT_EQ(result.value, "abc123");
    EXPECT_EQ(result.source, SecretSource::Environment);
    EXPECT_GT(transportCalls.load(), 0);
    EXPECT_TRUE(logs.contains("Failed to load from Azure Key Vault"));
}

TEST_F(EndToEndTest, MalformedTimeoutStillResolves) {
    auto lookup = env::fromMap({
        {"AZURE_KEY_VAULT_URL", "https://unreachable.vault.azure.net"},
        {"KEY_VAULT_TIMEOUT_MS", "10s"},
        {"YOUTUBE_API_KEY", "abc123"},
    });
    std::vector<int> timeouts;
    auto transport = [&](const fetch::RequestOptions& opts) {
        timeouts.push_back(opts.timeoutMs);
        return unreachable()(opts);
    };

    Settings settings;
    ASSERT_NO_THROW(settings = settingsFor(lookup));
    EXPECT_TRUE(logs.contains("Ignoring KEY_VAULT_TIMEOUT_MS"));

    auto resolver = SecretResolver::withDefaults(settings, lookup, transport);
    auto& result = resolver.resolve();
    EXPECT_EQ(result.value, "abc123");
    EXPECT_EQ(result.source, SecretSource::Environment);
    ASSERT_FALSE(timeouts.empty());
    for (int timeout : timeouts) EXPECT_EQ(timeout, 10000);
}

TEST_F(EndToEndTest, LocalFileOnly) {
    dir.write("settings.json", R"({"youtube_api_key": "xyz"})");
    auto lookup = env::fromMap({});
    auto resolver = SecretResolver::withDefaults(settingsFor(lookup), lookup, unreachable());

    auto& result = resolver.resolve();
    EXPECT_EQ(result.value, "xyz");
    EXPECT_EQ(result.source, SecretSource::LocalFile);
}

TEST_F(EndToEndTest, MalformedFileIsWarnedNotThrown) {
    dir.write("settings.json", "not json");
    auto lookup = env::fromMap({});
    auto resolver = SecretResolver::withDefaults(settingsFor(lookup), lookup, unreachable());

    EXPECT_FALSE(resolver.resolve().found());
    EXPECT_TRUE(logs.contains("Failed to load from settings file:"));
}

TEST(SourceNameTest, Names) {
    EXPECT_STREQ(sourceName(SecretSource::KeyVault), "key-vault");
    EXPECT_STREQ(sourceName(SecretSource::Environment), "environment");
    EXPECT_STREQ(sourceName(SecretSource::LocalFile), "local-file");
    EXPECT_STREQ(sourceName(SecretSource::None), "none");
}
