#include "domain/game_model.hpp"

#include <algorithm>

#include "domain/IdentityHasher.hpp"

namespace tcec::notifier::domain {

Game::Game(EngineName white,
           EngineName black,
           std::string date,
           std::string event,
           std::vector<Move> moves)
    : white_(std::move(white))
    , black_(std::move(black))
    , date_(std::move(date))
    , event_(std::move(event))
    , moves_(std::move(moves)) {
    hash_ = computeIdentityHash();
}

bool Game::outOfBook() const {
    return std::any_of(moves_.begin(), moves_.end(), [](const Move& m) { return !m.inBook; });
}

std::size_t Game::openingLength() const {
    const auto firstOut = std::find_if(moves_.begin(), moves_.end(),
                                       [](const Move& m) { return !m.inBook; });
    return static_cast<std::size_t>(std::distance(moves_.begin(), firstOut));
}

std::vector<Move> Game::opening() const {
    return std::vector<Move>(moves_.begin(),
                             moves_.begin() + static_cast<std::ptrdiff_t>(openingLength()));
}

bool Game::hasPlayer(std::string_view engine) const {
    return white_.matches(engine) || black_.matches(engine);
}

GameHash Game::computeIdentityHash() const {
    IdentityHasher h;
    h.update(white_.normalized());
    h.update(black_.normalized());
    h.update(date_);

    const std::size_t n = openingLength();
    h.updateU64(static_cast<std::uint64_t>(n));
    for (std::size_t i = 0; i < n; ++i) {
        h.update(moves_[i].san);
    }
    return h.finish();
}

} // namespace tcec::notifier::domain
