#include "app/TurnPlanner.hpp"

#include "app/NotificationComposer.hpp"

namespace tcec::notifier::app {

TurnPlan planTurn(std::string_view pgnText,
                  const ISeenGameRepository& seen,
                  const domain::NotifyConfig& config,
                  const domain::pgn::PgnParseOptions& options) {
    TurnPlan plan;

    auto parsed = domain::pgn::parseGame(pgnText, options);
    if (!parsed.ok) {
        plan.outcome      = TurnOutcome::ParseFailed;
        plan.parseError   = parsed.error;
        plan.parseMessage = std::move(parsed.message);
        return plan;
    }

    plan.game = std::move(parsed.game);
    const domain::Game& game = *plan.game;

    if (!game.outOfBook()) {
        plan.outcome = TurnOutcome::StillInBook;
        return plan;
    }
    if (seen.contains(game)) {
        plan.outcome = TurnOutcome::AlreadySeen;
        return plan;
    }

    plan.outcome   = TurnOutcome::NewGame;
    plan.selection = selectRecipients(game, config);
    plan.message   = composeNotification(game, plan.selection.recipients);
    return plan;
}

std::string to_string(TurnOutcome o) {
    switch (o) {
        case TurnOutcome::ParseFailed: return "ParseFailed";
        case TurnOutcome::StillInBook: return "StillInBook";
        case TurnOutcome::AlreadySeen: return "AlreadySeen";
        case TurnOutcome::NewGame:     return "NewGame";
    }
    return "Unknown";
}

} // namespace tcec::notifier::app
