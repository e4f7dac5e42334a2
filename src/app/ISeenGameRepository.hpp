#pragma once

#include <string>

#include "domain/game_model.hpp"

namespace tcec::notifier::app {

// Port for remembering which games were already announced.
// Implementations live in infra (e.g. append-only text file).
class ISeenGameRepository {
public:
    virtual ~ISeenGameRepository() = default;

    virtual bool contains(const domain::Game& game) const = 0;

    // Marks the game as seen. On a persist failure (false + *errorOut) the
    // in-memory membership is kept anyway.
    virtual bool add(const domain::Game& game, std::string* errorOut) = 0;
};

} // namespace tcec::notifier::app
