#include <catch2/catch.hpp>

#include "app/TurnPlanner.hpp"
#include "test_support.hpp"

using namespace tcec::notifier;
using tcec::notifier::test::InMemorySeenGames;
using tcec::notifier::test::kInBookPgn;
using tcec::notifier::test::kOutOfBookPgn;

namespace {

domain::NotifyConfig config() {
    domain::NotifyConfig c;
    c.engines["Minic"] = {"10"};
    c.engines["Lunar"] = {"20"};
    return c;
}

} // namespace

TEST_CASE("a game still in its opening is not announced", "[turn]") {
    InMemorySeenGames seen;
    const auto plan = app::planTurn(kInBookPgn, seen, config());
    CHECK(plan.outcome == app::TurnOutcome::StillInBook);
    REQUIRE(plan.game);
    CHECK(plan.message.empty());
}

TEST_CASE("a new game out of book is announced once", "[turn]") {
    InMemorySeenGames seen;

    const auto first = app::planTurn(kOutOfBookPgn, seen, config());
    REQUIRE(first.outcome == app::TurnOutcome::NewGame);
    CHECK(first.selection.recipients == std::set<std::string>{"10"});
    CHECK(first.message ==
          "[`TCEC Season 29 - Category 1 Playoff`](https://tcec-chess.com/) `c4ke 1.1` vs. `Minic 3.44`   cc. <@!10>");

    std::string err;
    REQUIRE(seen.add(*first.game, &err));

    const auto second = app::planTurn(kOutOfBookPgn, seen, config());
    CHECK(second.outcome == app::TurnOutcome::AlreadySeen);
    CHECK(second.message.empty());
}

TEST_CASE("a new game without followers is still announced", "[turn]") {
    InMemorySeenGames seen;
    const auto plan = app::planTurn(kOutOfBookPgn, seen, domain::NotifyConfig{});
    REQUIRE(plan.outcome == app::TurnOutcome::NewGame);
    CHECK(plan.selection.recipients.empty());
    CHECK(plan.message.find("cc.") == std::string::npos);
}

TEST_CASE("an unreadable feed is reported, not announced", "[turn]") {
    InMemorySeenGames seen;

    const auto empty = app::planTurn("", seen, config());
    CHECK(empty.outcome == app::TurnOutcome::ParseFailed);
    CHECK(empty.parseError == domain::pgn::PgnParseError::EmptyInput);
    CHECK_FALSE(empty.game);

    const auto broken = app::planTurn("[Event \"E\"]\n1. e4 {book,", seen, config());
    CHECK(broken.outcome == app::TurnOutcome::ParseFailed);
    CHECK(broken.parseError == domain::pgn::PgnParseError::Malformed);
    CHECK_FALSE(broken.parseMessage.empty());
}

TEST_CASE("outcome names", "[turn]") {
    CHECK(app::to_string(app::TurnOutcome::NewGame) == "NewGame");
    CHECK(app::to_string(app::TurnOutcome::AlreadySeen) == "AlreadySeen");
}
