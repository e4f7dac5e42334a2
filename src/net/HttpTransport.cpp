#include "net/HttpTransport.hpp"

#include <QNetworkRequest>

namespace tcec::notifier::net {

HttpTransport::HttpTransport(QObject* parent)
    : QObject(parent) {
}

QString HttpTransport::describe(Operation op) {
    switch (op) {
        case Operation::FetchNotifyConfig: return QStringLiteral("notify config fetch");
        case Operation::FetchLivePgn:      return QStringLiteral("live PGN fetch");
        case Operation::PostNotification:  return QStringLiteral("notification");
        case Operation::PostLog:           return QStringLiteral("log forward");
    }
    return QString();
}

QNetworkRequest HttpTransport::makeRequest(const QUrl& url) const {
    QNetworkRequest req(url);
    req.setAttribute(QNetworkRequest::RedirectPolicyAttribute, QNetworkRequest::ManualRedirectPolicy);
    // The live feed changes every few seconds; never serve it from a cache.
    req.setAttribute(QNetworkRequest::CacheLoadControlAttribute, QNetworkRequest::AlwaysNetwork);
    req.setTransferTimeout(kTransferTimeoutMs);
    req.setHeader(QNetworkRequest::UserAgentHeader, QStringLiteral("tcec-notifier"));
    return req;
}

void HttpTransport::get(Operation op, const QUrl& url) {
    track(op, nam_.get(makeRequest(url)));
}

void HttpTransport::postJson(Operation op, const QUrl& url, const QByteArray& json) {
    QNetworkRequest req = makeRequest(url);
    req.setHeader(QNetworkRequest::ContentTypeHeader, QStringLiteral("application/json"));
    track(op, nam_.post(req, json));
}

void HttpTransport::track(Operation op, QNetworkReply* reply) {
    QObject::connect(reply, &QNetworkReply::finished, this, [this, op, reply]() {
        const QByteArray payload = reply->readAll();
        const int status = reply->attribute(QNetworkRequest::HttpStatusCodeAttribute).toInt();

        bool ok = (reply->error() == QNetworkReply::NoError);
        QString err;
        if (!ok) {
            err = reply->errorString();
        } else if (status < 200 || status >= 300) {
            ok  = false;
            err = QStringLiteral("Unexpected server response: HTTP %1").arg(status);
        }

        reply->deleteLater();
        emit finished(op, ok, payload, err);
    });
}

} // namespace tcec::notifier::net
