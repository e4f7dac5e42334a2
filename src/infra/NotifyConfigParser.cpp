#include "infra/NotifyConfigParser.hpp"

#include <memory>
#include <string>

#include <QDebug>

#include <json/json.h>

namespace tcec::notifier::infra {

namespace {

// Hand-edited document: comments, trailing commas and single quotes are allowed.
std::unique_ptr<Json::CharReader> makeLenientReader() {
    Json::CharReaderBuilder builder;
    builder["allowComments"]       = true;
    builder["allowTrailingCommas"] = true;
    builder["allowSingleQuotes"]   = true;
    builder["strictRoot"]          = false;
    builder["rejectDupKeys"]       = false;
    return std::unique_ptr<Json::CharReader>(builder.newCharReader());
}

QString invalid(const QString& why) {
    return QStringLiteral("Invalid notify config: %1").arg(why);
}

} // namespace

ParseNotifyConfigResult parseNotifyConfig(const QByteArray& json) {
    ParseNotifyConfigResult res;

    Json::Value root;
    JSONCPP_STRING errs;
    const auto reader = makeLenientReader();
    if (!reader->parse(json.constData(), json.constData() + json.size(), &root, &errs)) {
        res.error = invalid(QString::fromStdString(errs).trimmed());
        return res;
    }
    if (!root.isObject()) {
        res.error = invalid(QStringLiteral("root is not an object"));
        return res;
    }

    const Json::Value users = root.get("users", Json::Value());
    if (!users.isObject()) {
        res.error = invalid(QStringLiteral("missing 'users' object"));
        return res;
    }

    for (auto it = users.begin(); it != users.end(); ++it) {
        const std::string user = it.name();
        if (!it->isArray()) {
            res.error = invalid(QStringLiteral("engines of user '%1' is not an array")
                                    .arg(QString::fromStdString(user)));
            return res;
        }

        for (const auto& v : *it) {
            if (!v.isString()) {
                qWarning() << "Ignoring non-string engine entry for user" << QString::fromStdString(user);
                continue;
            }
            const QString engine = QString::fromStdString(v.asString()).trimmed();
            if (engine.isEmpty()) {
                continue;
            }
            res.config.engines[engine.toStdString()].insert(user);
        }
    }

    res.ok = true;
    return res;
}

} // namespace tcec::notifier::infra
