#pragma once

#include <optional>
#include <string>
#include <string_view>

#include "app/ISeenGameRepository.hpp"
#include "domain/game_model.hpp"
#include "domain/notify_model.hpp"
#include "domain/pgn/PgnParser.hpp"

namespace tcec::notifier::app {

enum class TurnOutcome {
    ParseFailed, // feed not readable yet; retry next turn
    StillInBook, // game has not left its opening, not "started" yet
    AlreadySeen,
    NewGame
};

struct TurnPlan {
    TurnOutcome outcome{TurnOutcome::ParseFailed};

    domain::pgn::PgnParseError parseError{domain::pgn::PgnParseError::None};
    std::string parseMessage;

    std::optional<domain::Game> game;       // set unless ParseFailed
    domain::RecipientSelection selection;   // NewGame only
    std::string message;                    // NewGame only
};

// Decides what one polling turn does with the fetched feed text.
TurnPlan planTurn(std::string_view pgnText,
                  const ISeenGameRepository& seen,
                  const domain::NotifyConfig& config,
                  const domain::pgn::PgnParseOptions& options = {});

std::string to_string(TurnOutcome o);

} // namespace tcec::notifier::app
