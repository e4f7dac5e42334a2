#pragma once

#include <functional>
#include <optional>

#include <QString>
#include <QUrl>

namespace tcec::notifier::infra {

inline constexpr int kDefaultPollIntervalMs = 30000;
inline constexpr int kMinPollIntervalMs     = 1000;

struct AppSettings {
    QUrl configUrl;                 // TCEC_CONFIG_URL (required)
    QUrl notifyWebhook;             // TCEC_NOTIFY_WEBHOOK (required)
    std::optional<QUrl> logWebhook; // TCEC_LOG_WEBHOOK
    QUrl pgnUrl{QStringLiteral("https://tcec-chess.com/live.pgn")}; // TCEC_PGN_URL
    QString stateFile{QStringLiteral("state.bin")};                 // TCEC_STATE_FILE
    int pollIntervalMs{kDefaultPollIntervalMs};                     // TCEC_POLL_INTERVAL_MS
};

struct LoadAppSettingsResult {
    bool ok = false;
    AppSettings settings;
    QString error;
};

// Returns the value of an environment variable, or a null QString when unset.
using EnvLookup = std::function<QString(const char* name)>;

LoadAppSettingsResult loadAppSettings(const EnvLookup& env);

// Reads the real process environment.
LoadAppSettingsResult loadAppSettingsFromEnvironment();

} // namespace tcec::notifier::infra
