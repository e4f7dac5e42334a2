#pragma once

#include <QObject>

#include <QUrl>

#include "net/HttpTransport.hpp"

namespace tcec::notifier::app {

// Mirrors watcher log lines to a chat webhook. Failures are only logged
// locally, never forwarded again.
class LogForwarder final : public QObject {
    Q_OBJECT

public:
    enum class Level { Info, Warning, Error };

    explicit LogForwarder(QUrl webhook, QObject* parent = nullptr);

    void forward(Level level, const QString& text);

    static QString format(Level level, const QString& text);

private:
    void handleTransportFinished(tcec::notifier::net::HttpTransport::Operation op,
                                 bool ok,
                                 QByteArray payload,
                                 QString errorMessage);

    QUrl webhook_;
    tcec::notifier::net::HttpTransport transport_;
};

} // namespace tcec::notifier::app
