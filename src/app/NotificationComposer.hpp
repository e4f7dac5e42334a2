#pragma once

#include <string>

#include "domain/game_model.hpp"
#include "domain/notify_model.hpp"

namespace tcec::notifier::app {

inline constexpr const char* kTcecSiteUrl = "https://tcec-chess.com/";

// Everyone subscribed to an engine that plays in the game.
domain::RecipientSelection selectRecipients(const domain::Game& game,
                                            const domain::NotifyConfig& config);

// [`Event`](site) `White` vs. `Black`   cc. <@!1> <@!2>
std::string composeNotification(const domain::Game& game,
                                const std::set<domain::RecipientId>& recipients,
                                const std::string& siteUrl = kTcecSiteUrl);

// One-line summary for logs: {"Engine": [id, id], ...}
std::string describeNotifyConfig(const domain::NotifyConfig& config);

} // namespace tcec::notifier::app
