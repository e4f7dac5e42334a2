#include "app/LiveGameWatcher.hpp"

#include "app/NotificationComposer.hpp"
#include "app/TurnPlanner.hpp"
#include "infra/NotifyConfigParser.hpp"
#include "net/DiscordWebhook.hpp"

namespace tcec::notifier::app {

using tcec::notifier::net::HttpTransport;

namespace {

QString q(const std::string& s) {
    return QString::fromStdString(s);
}

} // namespace

LiveGameWatcher::LiveGameWatcher(Endpoints endpoints,
                                 ISeenGameRepository& seen,
                                 HttpTransport* transport,
                                 QObject* parent)
    : QObject(parent)
    , endpoints_(std::move(endpoints))
    , seen_(seen)
    , transport_(transport ? transport : new HttpTransport(this)) {
    QObject::connect(transport_, &HttpTransport::finished,
                     this, &LiveGameWatcher::handleTransportFinished);

    pollTimer_.setSingleShot(false);
    QObject::connect(&pollTimer_, &QTimer::timeout, this, &LiveGameWatcher::refreshNow);
}

void LiveGameWatcher::refreshNow() {
    if (busy_) {
        return;
    }
    busy_ = true;
    transport_->get(HttpTransport::Operation::FetchNotifyConfig, endpoints_.configUrl);
}

void LiveGameWatcher::startPolling(int intervalMs) {
    intervalMs = qMax(intervalMs, 1000);
    pollTimer_.setInterval(intervalMs);
    pollTimer_.start();
}

void LiveGameWatcher::stopPolling() {
    pollTimer_.stop();
}

bool LiveGameWatcher::isPolling() const {
    return pollTimer_.isActive();
}

void LiveGameWatcher::handleTransportFinished(HttpTransport::Operation op,
                                              bool ok,
                                              QByteArray payload,
                                              QString errorMessage) {
    switch (op) {
        case HttpTransport::Operation::FetchNotifyConfig:
            handleNotifyConfig(ok, payload, errorMessage);
            break;
        case HttpTransport::Operation::FetchLivePgn:
            handleLivePgn(ok, payload, errorMessage);
            break;
        case HttpTransport::Operation::PostNotification:
            handleNotificationPosted(ok, errorMessage);
            break;
        case HttpTransport::Operation::PostLog:
            break;
    }
}

void LiveGameWatcher::handleNotifyConfig(bool ok, const QByteArray& payload, const QString& errorMessage) {
    QString problem;
    if (!ok) {
        problem = errorMessage;
    } else {
        auto parsed = tcec::notifier::infra::parseNotifyConfig(payload);
        if (!parsed.ok) {
            problem = parsed.error;
        } else if (!config_) {
            config_ = std::move(parsed.config);
            emit info(tr("Loaded config: %1").arg(q(describeNotifyConfig(*config_))));
        } else if (*config_ != parsed.config) {
            config_ = std::move(parsed.config);
            emit info(tr("Config update loaded: %1").arg(q(describeNotifyConfig(*config_))));
        }
    }

    if (!problem.isEmpty()) {
        if (!config_) {
            stopPolling();
            busy_ = false;
            emit fatal(tr("Unable to load notify config: %1").arg(problem));
            return;
        }
        emit warning(tr("Unable to fetch new config: %1").arg(problem));
    }

    transport_->get(HttpTransport::Operation::FetchLivePgn, endpoints_.pgnUrl);
}

void LiveGameWatcher::handleLivePgn(bool ok, const QByteArray& payload, const QString& errorMessage) {
    if (!ok) {
        emit warning(tr("Unable to fetch in-progress game: %1").arg(errorMessage));
        finishTurn();
        return;
    }

    const std::string text = payload.toStdString();
    TurnPlan plan = planTurn(text, seen_, *config_);

    switch (plan.outcome) {
        case TurnOutcome::ParseFailed:
            emit warning(tr("Unable to parse in-progress game (%1): %2")
                             .arg(q(domain::pgn::to_string(plan.parseError)), q(plan.parseMessage)));
            finishTurn();
            return;

        case TurnOutcome::StillInBook:
            finishTurn();
            return;

        case TurnOutcome::AlreadySeen:
        case TurnOutcome::NewGame:
            break;
    }

    const domain::Game& game = *plan.game;
    if (!firstGameLogged_) {
        firstGameLogged_ = true;
        emit info(tr("In progress: `%1` vs `%2` (%3 plies)")
                      .arg(q(game.white().raw()), q(game.black().raw()))
                      .arg(static_cast<qulonglong>(game.moves().size())));
    }

    if (plan.outcome == TurnOutcome::AlreadySeen) {
        finishTurn();
        return;
    }

    emit info(tr("`%1` vs `%2`").arg(q(game.white().raw()), q(game.black().raw())));
    for (const auto& [engine, count] : plan.selection.matchedEngines) {
        emit info(tr("Will notify %1 users for engine `%2`").arg(static_cast<qulonglong>(count)).arg(q(engine)));
    }

    pendingGame_ = std::move(plan.game);
    lastMessage_ = q(plan.message);
    transport_->postJson(HttpTransport::Operation::PostNotification,
                        endpoints_.notifyWebhook,
                        tcec::notifier::net::buildWebhookMessage(lastMessage_));
}

void LiveGameWatcher::handleNotificationPosted(bool ok, const QString& errorMessage) {
    if (!ok) {
        emit error(tr("Unable to send notify: %1").arg(errorMessage));
    }

    if (pendingGame_) {
        std::string err;
        if (!seen_.add(*pendingGame_, &err)) {
            emit error(tr("Unable to write seen game to file: %1").arg(q(err)));
        }
        if (ok) {
            emit gameAnnounced(pendingGame_->identityHash(), lastMessage_);
        }
        pendingGame_.reset();
    }

    finishTurn();
}

void LiveGameWatcher::finishTurn() {
    busy_ = false;
    emit turnFinished();
}

} // namespace tcec::notifier::app
