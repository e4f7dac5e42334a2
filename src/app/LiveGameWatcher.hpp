#pragma once

#include <QObject>

#include <QTimer>
#include <QUrl>
#include <optional>

#include "app/ISeenGameRepository.hpp"
#include "domain/game_model.hpp"
#include "domain/notify_model.hpp"
#include "net/HttpTransport.hpp"

namespace tcec::notifier::app {

// Orchestrates the polling turns:
//   notify config -> live PGN -> parse/dedupe -> webhook -> remember game.
//
// A turn runs to completion before the next one may start; timer ticks that
// arrive while a turn is in flight are dropped.
class LiveGameWatcher final : public QObject {
    Q_OBJECT

public:
    struct Endpoints {
        QUrl configUrl;
        QUrl pgnUrl;
        QUrl notifyWebhook;
    };

    // Without a transport the watcher creates and owns its own. An injected
    // one is not owned and must outlive the watcher.
    LiveGameWatcher(Endpoints endpoints,
                    ISeenGameRepository& seen,
                    tcec::notifier::net::HttpTransport* transport = nullptr,
                    QObject* parent = nullptr);

    // One turn. Safe to call even if polling is enabled.
    void refreshNow();

    void startPolling(int intervalMs);
    void stopPolling();
    bool isPolling() const;
    bool isBusy() const { return busy_; }

    const std::optional<domain::NotifyConfig>& notifyConfig() const { return config_; }

signals:
    void info(const QString& text);
    void warning(const QString& text);
    void error(const QString& text);

    // The first notify config could not be loaded; nothing can be announced.
    void fatal(const QString& text);

    // The notification for a new game was delivered.
    void gameAnnounced(quint64 identityHash, const QString& message);
    void turnFinished();

private:
    void handleTransportFinished(tcec::notifier::net::HttpTransport::Operation op,
                                 bool ok,
                                 QByteArray payload,
                                 QString errorMessage);

    void handleNotifyConfig(bool ok, const QByteArray& payload, const QString& errorMessage);
    void handleLivePgn(bool ok, const QByteArray& payload, const QString& errorMessage);
    void handleNotificationPosted(bool ok, const QString& errorMessage);

    void finishTurn();

    Endpoints endpoints_;
    ISeenGameRepository& seen_;
    tcec::notifier::net::HttpTransport* transport_;
    QTimer pollTimer_;

    bool busy_{false};
    bool firstGameLogged_{false};
    std::optional<domain::NotifyConfig> config_;
    std::optional<domain::Game> pendingGame_;
    QString lastMessage_;
};

} // namespace tcec::notifier::app
