#include "net/DiscordWebhook.hpp"

#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>

namespace tcec::notifier::net {

QByteArray buildWebhookMessage(const QString& content, const QString& username) {
    QJsonObject allowedMentions;
    allowedMentions.insert(QStringLiteral("parse"), QJsonArray{QStringLiteral("users")});

    QJsonObject o;
    o.insert(QStringLiteral("username"), username);
    o.insert(QStringLiteral("allowed_mentions"), allowedMentions);
    o.insert(QStringLiteral("content"), content);

    return QJsonDocument(o).toJson(QJsonDocument::Compact);
}

} // namespace tcec::notifier::net
