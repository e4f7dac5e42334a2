#pragma once

#include <string>
#include <string_view>

namespace tcec::notifier::domain::pgn {

// Callbacks for one game. Tokens inside a skipped variation are never delivered.
class PgnVisitor {
public:
    virtual ~PgnVisitor() = default;

    virtual void beginGame() {}
    virtual void header(std::string_view key, std::string_view value) = 0;
    virtual void san(std::string_view san) = 0;
    virtual void comment(std::string_view text) = 0;

    // Return true to skip the whole variation subtree.
    virtual bool beginVariation() { return true; }
    virtual void endVariation() {}

    virtual void endGame() = 0;
};

struct PgnReadResult {
    bool ok{false};
    bool gameFound{false};
    std::string error;
};

// Drives the visitor over the first game found in text.
//
// A game starts at its first tag pair or movetext token and ends at the
// result token, at the next game's tag section, or at the end of input.
// endGame() is called only when ok && gameFound; on a lexical error the
// visitor is left unfinished.
PgnReadResult readGame(std::string_view text, PgnVisitor& visitor);

} // namespace tcec::notifier::domain::pgn
