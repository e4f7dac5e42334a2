#pragma once

#include <QObject>

#include <QNetworkAccessManager>
#include <QNetworkReply>
#include <QUrl>

namespace tcec::notifier::net {

// Minimal HTTP transport for the notifier.
//
// GETs the live PGN and the subscription document, POSTs JSON to webhooks.
// Redirects are not followed; any status outside 2xx is reported as a failure.
// Interpretation of the payload belongs to a higher layer.
//
// get() and postJson() are virtual so a scripted transport can stand in for
// the network.
class HttpTransport : public QObject {
    Q_OBJECT

public:
    enum class Operation {
        FetchNotifyConfig,
        FetchLivePgn,
        PostNotification,
        PostLog,
    };
    Q_ENUM(Operation)

    static constexpr int kTransferTimeoutMs = 20000;

    explicit HttpTransport(QObject* parent = nullptr);

    // Emits finished(op, ok, payload, errorMessage).
    virtual void get(Operation op, const QUrl& url);
    virtual void postJson(Operation op, const QUrl& url, const QByteArray& json);

    static QString describe(Operation op);

signals:
    void finished(tcec::notifier::net::HttpTransport::Operation op,
                  bool ok,
                  QByteArray payload,
                  QString errorMessage);

private:
    QNetworkRequest makeRequest(const QUrl& url) const;
    void track(Operation op, QNetworkReply* reply);

    QNetworkAccessManager nam_;
};

} // namespace tcec::notifier::net
