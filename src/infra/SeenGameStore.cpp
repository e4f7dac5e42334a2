#include "infra/SeenGameStore.hpp"

#include <algorithm>

#include <QDebug>
#include <QFileInfo>

namespace tcec::notifier::infra {

using tcec::notifier::domain::Game;
using tcec::notifier::domain::GameHash;

SeenGameStore::SeenGameStore(QString path)
    : path_(std::move(path))
    , file_(path_) {
}

bool SeenGameStore::open(QString* errorOut) {
    if (file_.isOpen()) {
        return true;
    }

    if (!file_.open(QIODevice::ReadWrite | QIODevice::Append)) {
        if (errorOut) {
            *errorOut = QStringLiteral("Cannot open state file %1: %2").arg(path_, file_.errorString());
        }
        return false;
    }

    // Append mode leaves the position at the end.
    file_.seek(0);
    const QByteArray contents = file_.readAll();
    file_.seek(file_.size());

    hashes_.clear();
    const QList<QByteArray> lines = contents.split('\n');
    for (int i = 0; i < lines.size(); ++i) {
        const QByteArray line = lines.at(i).trimmed();
        if (line.isEmpty()) {
            continue;
        }
        bool ok = std::all_of(line.begin(), line.end(), [](char c) { return c >= '0' && c <= '9'; });
        const qulonglong v = ok ? line.toULongLong(&ok, 10) : 0;
        if (!ok) {
            if (errorOut) {
                *errorOut = QStringLiteral("Bad state file %1 at line %2: '%3'")
                                .arg(path_)
                                .arg(i + 1)
                                .arg(QString::fromUtf8(line.left(64)));
            }
            file_.close();
            hashes_.clear();
            return false;
        }
        hashes_.insert(static_cast<GameHash>(v));
    }

    // A crash mid-append can leave an unterminated last line; never glue the next hash onto it.
    if (!contents.isEmpty() && !contents.endsWith('\n')) {
        if (file_.write("\n", 1) != 1 || !file_.flush()) {
            if (errorOut) {
                *errorOut = QStringLiteral("Cannot repair state file %1: %2").arg(path_, file_.errorString());
            }
            file_.close();
            hashes_.clear();
            return false;
        }
    }

    qDebug() << "Loaded" << hashes_.size() << "seen games from" << QFileInfo(path_).absoluteFilePath();
    return true;
}

bool SeenGameStore::contains(const Game& game) const {
    return contains(game.identityHash());
}

bool SeenGameStore::contains(GameHash hash) const {
    return hashes_.find(hash) != hashes_.end();
}

bool SeenGameStore::add(const Game& game, std::string* errorOut) {
    const GameHash h = game.identityHash();
    hashes_.insert(h);

    if (!file_.isOpen()) {
        if (errorOut) *errorOut = "State file is not open";
        return false;
    }

    const QByteArray line = QByteArray::number(static_cast<qulonglong>(h)) + '\n';
    if (file_.write(line) != line.size() || !file_.flush()) {
        if (errorOut) {
            *errorOut = "Failed to append to state file: " + file_.errorString().toStdString();
        }
        return false;
    }
    return true;
}

} // namespace tcec::notifier::infra
