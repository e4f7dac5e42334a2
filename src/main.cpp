#include <QCommandLineParser>
#include <QCoreApplication>
#include <QDebug>
#include <QFile>
#include <QString>
#include <QTextStream>
#include <QTimer>

#include <memory>

#include "app/LiveGameWatcher.hpp"
#include "app/LogForwarder.hpp"
#include "domain/pgn/PgnParser.hpp"
#include "infra/AppSettings.hpp"
#include "infra/SeenGameStore.hpp"

#ifndef TCEC_NOTIFIER_VERSION
#define TCEC_NOTIFIER_VERSION "0.0.0"
#endif

namespace {

namespace domain = tcec::notifier::domain;
namespace pgn    = tcec::notifier::domain::pgn;
namespace app    = tcec::notifier::app;
namespace infra  = tcec::notifier::infra;

constexpr int kExitOk         = 0;
constexpr int kExitFailure    = 1;
constexpr int kExitParseError = 2;

// Offline check of a PGN file: what the watcher would see for it.
int parsePgnFile(const QString& path) {
    QTextStream out(stdout);

    QFile file(path);
    if (!file.open(QIODevice::ReadOnly)) {
        qCritical() << "Cannot open PGN file" << path << ":" << file.errorString();
        return kExitFailure;
    }

    const std::string text = file.readAll().toStdString();
    const auto parsed = pgn::parseGame(text);
    if (!parsed.ok) {
        qCritical().noquote() << "Parse failed (" << QString::fromStdString(pgn::to_string(parsed.error))
                              << "):" << QString::fromStdString(parsed.message);
        return kExitParseError;
    }

    const domain::Game& g = *parsed.game;
    out << "White:      " << QString::fromStdString(g.white().raw()) << '\n'
        << "Black:      " << QString::fromStdString(g.black().raw()) << '\n'
        << "Date:       " << QString::fromStdString(g.date()) << '\n'
        << "Event:      " << QString::fromStdString(g.event()) << '\n'
        << "Plies:      " << static_cast<qulonglong>(g.moves().size()) << '\n'
        << "Book plies: " << static_cast<qulonglong>(g.openingLength()) << '\n'
        << "Out of book: " << (g.outOfBook() ? "yes" : "no") << '\n'
        << "Identity:   " << static_cast<qulonglong>(g.identityHash()) << '\n';
    return kExitOk;
}

} // namespace

int main(int argc, char* argv[]) {
    QCoreApplication app(argc, argv);
    QCoreApplication::setApplicationName(QStringLiteral("tcec-notifier"));
    QCoreApplication::setApplicationVersion(QStringLiteral(TCEC_NOTIFIER_VERSION));

    qSetMessagePattern(QStringLiteral("%{time yyyy-MM-dd hh:mm:ss.zzz} [%{type}] %{message}"));

    QCommandLineParser cli;
    cli.setApplicationDescription(QStringLiteral("Announces new TCEC games to subscribed users."));
    cli.addHelpOption();
    cli.addVersionOption();
    const QCommandLineOption onceOpt(QStringLiteral("once"),
                                     QStringLiteral("Run a single polling turn and exit."));
    const QCommandLineOption parseOpt(QStringLiteral("parse"),
                                      QStringLiteral("Parse a local PGN file, print its summary and exit."),
                                      QStringLiteral("file"));
    cli.addOption(onceOpt);
    cli.addOption(parseOpt);
    cli.process(app);

    if (cli.isSet(parseOpt)) {
        return parsePgnFile(cli.value(parseOpt));
    }

    const auto loaded = infra::loadAppSettingsFromEnvironment();
    if (!loaded.ok) {
        qCritical().noquote() << "Unable to load config:" << loaded.error;
        return kExitFailure;
    }
    const infra::AppSettings& settings = loaded.settings;

    qInfo().noquote() << "tcec-notifier" << QCoreApplication::applicationVersion() << "starting";
    qInfo().noquote() << "Live feed:" << settings.pgnUrl.toString();
    qInfo().noquote() << "State file:" << settings.stateFile;

    infra::SeenGameStore seenGames(settings.stateFile);
    QString storeErr;
    if (!seenGames.open(&storeErr)) {
        qCritical().noquote() << "Unable to load state:" << storeErr;
        return kExitFailure;
    }

    std::unique_ptr<app::LogForwarder> forwarder;
    if (settings.logWebhook) {
        forwarder = std::make_unique<app::LogForwarder>(*settings.logWebhook);
        forwarder->forward(app::LogForwarder::Level::Info, QStringLiteral("Started"));
    }

    app::LiveGameWatcher watcher({settings.configUrl, settings.pgnUrl, settings.notifyWebhook}, seenGames);

    QObject::connect(&watcher, &app::LiveGameWatcher::info, [&](const QString& text) {
        qInfo().noquote() << text;
        if (forwarder) forwarder->forward(app::LogForwarder::Level::Info, text);
    });
    QObject::connect(&watcher, &app::LiveGameWatcher::warning, [&](const QString& text) {
        qWarning().noquote() << text;
        if (forwarder) forwarder->forward(app::LogForwarder::Level::Warning, text);
    });
    QObject::connect(&watcher, &app::LiveGameWatcher::error, [&](const QString& text) {
        qCritical().noquote() << text;
        if (forwarder) forwarder->forward(app::LogForwarder::Level::Error, text);
    });
    QObject::connect(&watcher, &app::LiveGameWatcher::fatal, [&](const QString& text) {
        qCritical().noquote() << text;
        QCoreApplication::exit(kExitFailure);
    });

    if (cli.isSet(onceOpt)) {
        QObject::connect(&watcher, &app::LiveGameWatcher::turnFinished, &app, &QCoreApplication::quit);
    } else {
        watcher.startPolling(settings.pollIntervalMs);
    }

    // First turn right away instead of waiting a full interval.
    QTimer::singleShot(0, &watcher, &app::LiveGameWatcher::refreshNow);

    return app.exec();
}
