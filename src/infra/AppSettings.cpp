#include "infra/AppSettings.hpp"

#include <QtGlobal>

namespace tcec::notifier::infra {

namespace {

bool parseHttpUrl(const char* name, const QString& raw, QUrl& out, QString& error) {
    const QUrl url(raw.trimmed(), QUrl::StrictMode);
    const QString scheme = url.scheme().toLower();
    if (!url.isValid() || url.isRelative() || url.host().isEmpty() ||
        (scheme != QStringLiteral("http") && scheme != QStringLiteral("https"))) {
        error = QStringLiteral("%1 is not a valid http(s) URL: '%2'").arg(QLatin1String(name), raw);
        return false;
    }
    out = url;
    return true;
}

bool requireUrl(const EnvLookup& env, const char* name, QUrl& out, QString& error) {
    const QString raw = env(name);
    if (raw.trimmed().isEmpty()) {
        error = QStringLiteral("Missing required environment variable %1").arg(QLatin1String(name));
        return false;
    }
    return parseHttpUrl(name, raw, out, error);
}

} // namespace

LoadAppSettingsResult loadAppSettings(const EnvLookup& env) {
    LoadAppSettingsResult res;
    AppSettings& s = res.settings;

    if (!requireUrl(env, "TCEC_CONFIG_URL", s.configUrl, res.error)) return res;
    if (!requireUrl(env, "TCEC_NOTIFY_WEBHOOK", s.notifyWebhook, res.error)) return res;

    const QString logHook = env("TCEC_LOG_WEBHOOK");
    if (!logHook.trimmed().isEmpty()) {
        QUrl url;
        if (!parseHttpUrl("TCEC_LOG_WEBHOOK", logHook, url, res.error)) return res;
        s.logWebhook = url;
    }

    const QString pgnUrl = env("TCEC_PGN_URL");
    if (!pgnUrl.trimmed().isEmpty()) {
        if (!parseHttpUrl("TCEC_PGN_URL", pgnUrl, s.pgnUrl, res.error)) return res;
    }

    const QString stateFile = env("TCEC_STATE_FILE");
    if (!stateFile.trimmed().isEmpty()) {
        s.stateFile = stateFile.trimmed();
    }

    const QString interval = env("TCEC_POLL_INTERVAL_MS");
    if (!interval.trimmed().isEmpty()) {
        bool ok = false;
        const int ms = interval.trimmed().toInt(&ok);
        if (!ok) {
            res.error = QStringLiteral("TCEC_POLL_INTERVAL_MS is not a number: '%1'").arg(interval);
            return res;
        }
        s.pollIntervalMs = qMax(ms, kMinPollIntervalMs);
    }

    res.ok = true;
    return res;
}

LoadAppSettingsResult loadAppSettingsFromEnvironment() {
    return loadAppSettings([](const char* name) {
        return qEnvironmentVariableIsSet(name) ? qEnvironmentVariable(name) : QString();
    });
}

} // namespace tcec::notifier::infra
