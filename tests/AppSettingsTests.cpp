#include <catch2/catch.hpp>

#include <map>
#include <string>

#include "infra/AppSettings.hpp"

using namespace tcec::notifier::infra;

namespace {

using Env = std::map<std::string, QString>;

EnvLookup lookupIn(const Env& env) {
    return [env](const char* name) {
        const auto it = env.find(name);
        return it == env.end() ? QString() : it->second;
    };
}

Env minimalEnv() {
    return Env{
        {"TCEC_CONFIG_URL", QStringLiteral("https://example.org/notify.json")},
        {"TCEC_NOTIFY_WEBHOOK", QStringLiteral("https://discord.example/api/webhooks/1/abc")},
    };
}

} // namespace

TEST_CASE("defaults apply when only the required variables are set", "[settings]") {
    const auto res = loadAppSettings(lookupIn(minimalEnv()));
    REQUIRE(res.ok);

    const AppSettings& s = res.settings;
    CHECK(s.configUrl == QUrl(QStringLiteral("https://example.org/notify.json")));
    CHECK(s.notifyWebhook.host() == QStringLiteral("discord.example"));
    CHECK_FALSE(s.logWebhook);
    CHECK(s.pgnUrl == QUrl(QStringLiteral("https://tcec-chess.com/live.pgn")));
    CHECK(s.stateFile == QStringLiteral("state.bin"));
    CHECK(s.pollIntervalMs == kDefaultPollIntervalMs);
}

TEST_CASE("optional variables override defaults", "[settings]") {
    Env env = minimalEnv();
    env["TCEC_LOG_WEBHOOK"]      = QStringLiteral("https://discord.example/api/webhooks/2/def");
    env["TCEC_PGN_URL"]          = QStringLiteral("http://localhost:8080/live.pgn");
    env["TCEC_STATE_FILE"]       = QStringLiteral(" /var/lib/tcec/seen.txt ");
    env["TCEC_POLL_INTERVAL_MS"] = QStringLiteral("5000");

    const auto res = loadAppSettings(lookupIn(env));
    REQUIRE(res.ok);
    REQUIRE(res.settings.logWebhook);
    CHECK(res.settings.logWebhook->path() == QStringLiteral("/api/webhooks/2/def"));
    CHECK(res.settings.pgnUrl.port() == 8080);
    CHECK(res.settings.stateFile == QStringLiteral("/var/lib/tcec/seen.txt"));
    CHECK(res.settings.pollIntervalMs == 5000);
}

TEST_CASE("poll interval is clamped to the minimum", "[settings]") {
    Env env = minimalEnv();
    env["TCEC_POLL_INTERVAL_MS"] = QStringLiteral("10");
    const auto res = loadAppSettings(lookupIn(env));
    REQUIRE(res.ok);
    CHECK(res.settings.pollIntervalMs == kMinPollIntervalMs);
}

TEST_CASE("a non-numeric poll interval is an error", "[settings]") {
    Env env = minimalEnv();
    env["TCEC_POLL_INTERVAL_MS"] = QStringLiteral("soon");
    const auto res = loadAppSettings(lookupIn(env));
    CHECK_FALSE(res.ok);
    CHECK(res.error.contains(QStringLiteral("TCEC_POLL_INTERVAL_MS")));
}

TEST_CASE("required variables must be present", "[settings]") {
    const std::string missing = GENERATE(as<std::string>{}, "TCEC_CONFIG_URL", "TCEC_NOTIFY_WEBHOOK");
    Env env = minimalEnv();
    env.erase(missing);

    const auto res = loadAppSettings(lookupIn(env));
    CHECK_FALSE(res.ok);
    CHECK(res.error == QStringLiteral("Missing required environment variable %1").arg(QString::fromStdString(missing)));
}

TEST_CASE("urls must be absolute http(s)", "[settings]") {
    const std::string bad = GENERATE(as<std::string>{}, "not a url", "ftp://example.org/x", "/relative/path", "https://");
    Env env = minimalEnv();
    env["TCEC_CONFIG_URL"] = QString::fromStdString(bad);

    const auto res = loadAppSettings(lookupIn(env));
    CHECK_FALSE(res.ok);
    CHECK(res.error.startsWith(QStringLiteral("TCEC_CONFIG_URL is not a valid http(s) URL")));
}
