#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include "domain/EngineName.hpp"

namespace tcec::notifier::domain {

using GameHash = std::uint64_t;

// Comment prefix the feed uses for moves taken from the opening book.
inline constexpr std::string_view kBookCommentPrefix = "book,";

inline bool isBookComment(std::string_view comment) {
    return comment.substr(0, kBookCommentPrefix.size()) == kBookCommentPrefix;
}

// --- Move -------------------------------------------------------------------

struct Move {
    std::string san;   // notation as published, annotation glyphs stripped
    bool        inBook{false};

    static Move fromComment(std::string san, std::string_view comment) {
        return Move{std::move(san), isBookComment(comment)};
    }
};

// --- Game -------------------------------------------------------------------

class Game {
public:
    Game(EngineName white,
         EngineName black,
         std::string date,
         std::string event,
         std::vector<Move> moves);

    const EngineName&        white() const noexcept { return white_; }
    const EngineName&        black() const noexcept { return black_; }
    const std::string&       date() const noexcept { return date_; }
    const std::string&       event() const noexcept { return event_; }
    const std::vector<Move>& moves() const noexcept { return moves_; }

    // True once any played move was not taken from the book.
    bool outOfBook() const;

    // Leading run of book moves. The feed occasionally tags later moves
    // (tablebase hits, moves without engine info) as "book" again; those are
    // not part of the opening.
    std::vector<Move> opening() const;
    std::size_t openingLength() const;

    bool hasPlayer(std::string_view engine) const;

    // Players (normalized), date and opening line. A replay with the same
    // opening on the same day hashes identically.
    GameHash identityHash() const noexcept { return hash_; }

    friend bool operator==(const Game& a, const Game& b) noexcept {
        return a.hash_ == b.hash_;
    }
    friend bool operator!=(const Game& a, const Game& b) noexcept {
        return !(a == b);
    }

private:
    GameHash computeIdentityHash() const;

    EngineName        white_;
    EngineName        black_;
    std::string       date_;
    std::string       event_;
    std::vector<Move> moves_;
    GameHash          hash_{0};
};

} // namespace tcec::notifier::domain
