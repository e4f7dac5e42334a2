#include "app/NotificationComposer.hpp"

#include <sstream>

namespace tcec::notifier::app {

using tcec::notifier::domain::Game;
using tcec::notifier::domain::NotifyConfig;
using tcec::notifier::domain::RecipientId;
using tcec::notifier::domain::RecipientSelection;

RecipientSelection selectRecipients(const Game& game, const NotifyConfig& config) {
    RecipientSelection sel;
    for (const auto& [engine, recipients] : config.engines) {
        if (!game.hasPlayer(engine)) {
            continue;
        }
        sel.recipients.insert(recipients.begin(), recipients.end());
        sel.matchedEngines.emplace_back(engine, recipients.size());
    }
    return sel;
}

std::string composeNotification(const Game& game,
                                const std::set<RecipientId>& recipients,
                                const std::string& siteUrl) {
    std::ostringstream os;
    os << "[`" << game.event() << "`](" << siteUrl << ") `" << game.white().raw() << "` vs. `"
       << game.black().raw() << '`';

    if (!recipients.empty()) {
        os << "   cc.";
        for (const auto& id : recipients) {
            os << " <@!" << id << '>';
        }
    }
    return os.str();
}

std::string describeNotifyConfig(const NotifyConfig& config) {
    std::ostringstream os;
    os << '{';
    bool firstEngine = true;
    for (const auto& [engine, recipients] : config.engines) {
        if (!firstEngine) os << ", ";
        firstEngine = false;

        os << '"' << engine << "\": [";
        bool firstId = true;
        for (const auto& id : recipients) {
            if (!firstId) os << ", ";
            firstId = false;
            os << id;
        }
        os << ']';
    }
    os << '}';
    return os.str();
}

} // namespace tcec::notifier::app
