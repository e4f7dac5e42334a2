#pragma once

#include <QByteArray>
#include <QString>

#include "domain/notify_model.hpp"

namespace tcec::notifier::infra {

struct ParseNotifyConfigResult {
    bool ok = false;
    tcec::notifier::domain::NotifyConfig config;
    QString error;
};

// Parses the remote subscription document:
//
//   { "users": { "<recipient id>": ["Engine A", "Engine B"], ... } }
//
// and inverts it into engine -> recipients. Comments, trailing commas and
// single-quoted strings are accepted; keys must still be quoted.
ParseNotifyConfigResult parseNotifyConfig(const QByteArray& json);

} // namespace tcec::notifier::infra
