#pragma once

#include <functional>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "domain/game_model.hpp"
#include "domain/pgn/PgnReader.hpp"

namespace tcec::notifier::domain::pgn {

inline constexpr std::string_view kEventTag = "Event";
inline constexpr std::string_view kWhiteTag = "White";
inline constexpr std::string_view kBlackTag = "Black";
inline constexpr std::string_view kDateTag  = "Date";

enum class PgnParseError {
    None,
    EmptyInput,            // no game in the text
    MissingRequiredHeader, // White, Black, Date or Event absent
    Malformed              // lexical/structural problem in the token stream
};

// What to do with a comment that arrives while no move is pending
// (e.g. the engine options comment the feed puts before move 1).
enum class OrphanCommentPolicy {
    Drop,        // discard it
    AttachToNext // keep it for the next move, unless that move gets its own comment
};

struct PgnParseOptions {
    OrphanCommentPolicy orphanComments{OrphanCommentPolicy::Drop};
};

struct GameParseResult {
    bool ok{false};
    PgnParseError error{PgnParseError::None};
    std::string message;
    std::optional<Game> game;
};

// Visitor that assembles a Game from the reader callbacks.
//
// A move is held back until the next move (or the end of the game) so that
// the comment following it can be attached; the book flag is derived from
// that comment when the move is committed. If a move is followed by several
// comments, the last one wins.
class GameBuilder final : public PgnVisitor {
public:
    explicit GameBuilder(PgnParseOptions options = {});

    void beginGame() override;
    void header(std::string_view key, std::string_view value) override;
    void san(std::string_view san) override;
    void comment(std::string_view text) override;
    bool beginVariation() override { return true; }
    void endGame() override;

    // Valid after endGame().
    GameParseResult takeResult();

private:
    void commitPending();

    PgnParseOptions options_;

    std::map<std::string, std::string, std::less<>> headers_;
    std::vector<Move> moves_;

    std::optional<std::string> pendingSan_;
    std::optional<std::string> pendingComment_;
    std::optional<std::string> orphanComment_;

    GameParseResult result_;
};

// Parses the first game of a PGN text.
GameParseResult parseGame(std::string_view text, const PgnParseOptions& options = {});

std::string to_string(PgnParseError e);

} // namespace tcec::notifier::domain::pgn
