#pragma once

#include <QByteArray>
#include <QString>

namespace tcec::notifier::net {

inline constexpr const char* kWebhookUsername = "tcec-notifier";

// JSON body for a chat webhook message. Only user mentions are allowed to ping.
QByteArray buildWebhookMessage(const QString& content,
                               const QString& username = QString::fromLatin1(kWebhookUsername));

} // namespace tcec::notifier::net
