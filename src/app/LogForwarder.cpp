#include "app/LogForwarder.hpp"

#include <QDebug>

#include "net/DiscordWebhook.hpp"

namespace tcec::notifier::app {

using tcec::notifier::net::HttpTransport;

LogForwarder::LogForwarder(QUrl webhook, QObject* parent)
    : QObject(parent)
    , webhook_(std::move(webhook))
    , transport_(this) {
    QObject::connect(&transport_, &HttpTransport::finished,
                     this, &LogForwarder::handleTransportFinished);
}

QString LogForwarder::format(Level level, const QString& text) {
    switch (level) {
        case Level::Info:    return QStringLiteral(":information_source: %1").arg(text);
        case Level::Warning: return QStringLiteral(":warning: %1").arg(text);
        case Level::Error:   return QStringLiteral(":x: %1").arg(text);
    }
    return text;
}

void LogForwarder::forward(Level level, const QString& text) {
    if (webhook_.isEmpty()) {
        return;
    }
    transport_.postJson(HttpTransport::Operation::PostLog,
                        webhook_,
                        tcec::notifier::net::buildWebhookMessage(format(level, text)));
}

void LogForwarder::handleTransportFinished(HttpTransport::Operation op,
                                           bool ok,
                                           QByteArray /*payload*/,
                                           QString errorMessage) {
    if (op == HttpTransport::Operation::PostLog && !ok) {
        qWarning().noquote() << HttpTransport::describe(op) << "failed:" << errorMessage;
    }
}

} // namespace tcec::notifier::app
