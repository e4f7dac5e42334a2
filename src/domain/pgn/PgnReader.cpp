#include "domain/pgn/PgnReader.hpp"

#include "domain/pgn/PgnTokenizer.hpp"

namespace tcec::notifier::domain::pgn {

namespace {

static PgnReadResult failed(std::string error) {
    PgnReadResult res;
    res.ok    = false;
    res.error = std::move(error);
    return res;
}

static std::string at(const PgnToken& tok, const std::string& what) {
    return "line " + std::to_string(tok.line) + ": " + what;
}

} // namespace

PgnReadResult readGame(std::string_view text, PgnVisitor& visitor) {
    PgnTokenizer tokenizer(text);
    PgnToken tok;

    bool inGame       = false;
    bool haveMovetext = false;
    int  skipDepth    = 0; // > 0 while inside a skipped variation
    int  visitDepth   = 0; // variations the visitor chose to walk
    bool sawResult    = false;

    auto startGame = [&]() {
        if (!inGame) {
            inGame = true;
            visitor.beginGame();
        }
    };

    while (!sawResult) {
        std::string err;
        if (!tokenizer.next(tok, &err)) {
            return failed(err);
        }

        if (tok.type == PgnTokenType::End) {
            break;
        }

        if (skipDepth > 0) {
            switch (tok.type) {
                case PgnTokenType::VariationStart: ++skipDepth; break;
                case PgnTokenType::VariationEnd:   --skipDepth; break;
                case PgnTokenType::TagPair:
                    return failed(at(tok, "tag pair inside a variation"));
                default:
                    break;
            }
            continue;
        }

        if (tok.type == PgnTokenType::TagPair) {
            if (haveMovetext) {
                // Next game's tag section; only the first game is read.
                if (visitDepth > 0) {
                    return failed(at(tok, "tag pair inside a variation"));
                }
                break;
            }
            startGame();
            visitor.header(tok.key, tok.value);
            continue;
        }

        startGame();

        switch (tok.type) {
            case PgnTokenType::MoveNumber:
            case PgnTokenType::Nag:
                haveMovetext = true;
                break;

            case PgnTokenType::San:
                haveMovetext = true;
                visitor.san(tok.value);
                break;

            case PgnTokenType::Comment:
                visitor.comment(tok.value);
                break;

            case PgnTokenType::VariationStart:
                haveMovetext = true;
                if (visitor.beginVariation()) {
                    skipDepth = 1;
                } else {
                    ++visitDepth;
                }
                break;

            case PgnTokenType::VariationEnd:
                if (visitDepth == 0) {
                    return failed(at(tok, "unbalanced ')'"));
                }
                --visitDepth;
                visitor.endVariation();
                break;

            case PgnTokenType::Result:
                if (visitDepth > 0) {
                    return failed(at(tok, "result inside a variation"));
                }
                haveMovetext = true;
                sawResult    = true;
                break;

            case PgnTokenType::TagPair:
            case PgnTokenType::End:
                break;
        }
    }

    if (skipDepth > 0 || visitDepth > 0) {
        return failed("line " + std::to_string(tokenizer.line()) + ": unterminated variation");
    }

    PgnReadResult res;
    res.ok = true;
    res.gameFound = inGame;
    if (inGame) {
        visitor.endGame();
    }
    return res;
}

} // namespace tcec::notifier::domain::pgn
