#include <catch2/catch.hpp>

#include <QFile>
#include <QTemporaryDir>

#include "infra/SeenGameStore.hpp"
#include "test_support.hpp"

using tcec::notifier::domain::Game;
using tcec::notifier::infra::SeenGameStore;
using tcec::notifier::test::makeGame;

namespace {

void writeFile(const QString& path, const QByteArray& contents) {
    QFile f(path);
    REQUIRE(f.open(QIODevice::WriteOnly | QIODevice::Truncate));
    REQUIRE(f.write(contents) == contents.size());
}

QByteArray readFile(const QString& path) {
    QFile f(path);
    REQUIRE(f.open(QIODevice::ReadOnly));
    return f.readAll();
}

} // namespace

TEST_CASE("a missing state file is created empty", "[store]") {
    QTemporaryDir dir;
    REQUIRE(dir.isValid());
    const QString path = dir.filePath(QStringLiteral("state.bin"));

    SeenGameStore store(path);
    QString err;
    REQUIRE(store.open(&err));
    CHECK(store.isOpen());
    CHECK(store.size() == 0);
    CHECK(QFile::exists(path));
}

TEST_CASE("added games survive a restart", "[store]") {
    QTemporaryDir dir;
    REQUIRE(dir.isValid());
    const QString path = dir.filePath(QStringLiteral("state.bin"));

    const Game first  = makeGame({{"e4", true}, {"c5", false}});
    const Game second = makeGame({{"d4", true}, {"d5", false}});
    const Game other  = makeGame({{"c4", true}, {"e5", false}});

    {
        SeenGameStore store(path);
        QString err;
        REQUIRE(store.open(&err));
        CHECK_FALSE(store.contains(first));

        std::string addErr;
        REQUIRE(store.add(first, &addErr));
        REQUIRE(store.add(second, &addErr));
        CHECK(store.contains(first));
        CHECK(store.contains(second.identityHash()));
    }

    const QByteArray expected = QByteArray::number(static_cast<qulonglong>(first.identityHash())) + '\n' +
                                QByteArray::number(static_cast<qulonglong>(second.identityHash())) + '\n';
    CHECK(readFile(path) == expected);

    SeenGameStore reopened(path);
    QString err;
    REQUIRE(reopened.open(&err));
    CHECK(reopened.size() == 2);
    CHECK(reopened.contains(first));
    CHECK(reopened.contains(second));
    CHECK_FALSE(reopened.contains(other));
}

TEST_CASE("blank lines and surrounding whitespace are tolerated", "[store]") {
    QTemporaryDir dir;
    REQUIRE(dir.isValid());
    const QString path = dir.filePath(QStringLiteral("state.bin"));
    writeFile(path, "12\n\n  34 \r\n18446744073709551615\n");

    SeenGameStore store(path);
    QString err;
    REQUIRE(store.open(&err));
    CHECK(store.size() == 3);
    CHECK(store.contains(12));
    CHECK(store.contains(34));
    CHECK(store.contains(18446744073709551615ull));
}

TEST_CASE("a corrupt line fails the load", "[store]") {
    QTemporaryDir dir;
    REQUIRE(dir.isValid());
    const QString path = dir.filePath(QStringLiteral("state.bin"));

    const QByteArray contents = GENERATE(QByteArray("123\nabc\n"),
                                         QByteArray("123\n-5\n"),
                                         QByteArray("123\n18446744073709551616\n"));
    writeFile(path, contents);

    SeenGameStore store(path);
    QString err;
    CHECK_FALSE(store.open(&err));
    CHECK_FALSE(store.isOpen());
    CHECK(err.contains(QStringLiteral("line 2")));
}

TEST_CASE("an unterminated last line is repaired before appending", "[store]") {
    QTemporaryDir dir;
    REQUIRE(dir.isValid());
    const QString path = dir.filePath(QStringLiteral("state.bin"));
    writeFile(path, "123");

    const Game game = makeGame({{"e4", true}, {"c5", false}});
    {
        SeenGameStore store(path);
        QString err;
        REQUIRE(store.open(&err));
        CHECK(store.contains(123));

        std::string addErr;
        REQUIRE(store.add(game, &addErr));
    }

    SeenGameStore reopened(path);
    QString err;
    REQUIRE(reopened.open(&err));
    CHECK(reopened.size() == 2);
    CHECK(reopened.contains(123));
    CHECK(reopened.contains(game));
}

TEST_CASE("add without an open file still remembers the game", "[store]") {
    QTemporaryDir dir;
    REQUIRE(dir.isValid());

    SeenGameStore store(dir.filePath(QStringLiteral("never-opened.bin")));
    const Game game = makeGame({{"e4", true}, {"c5", false}});

    std::string err;
    CHECK_FALSE(store.add(game, &err));
    CHECK_FALSE(err.empty());
    CHECK(store.contains(game));
}
