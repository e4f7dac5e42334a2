#pragma once

#include <cstddef>
#include <map>
#include <set>
#include <string>
#include <utility>
#include <vector>

namespace tcec::notifier::domain {

using RecipientId = std::string;

// Engine name (as configured, matched loosely against the players) -> recipients.
struct NotifyConfig {
    std::map<std::string, std::set<RecipientId>> engines;

    friend bool operator==(const NotifyConfig& a, const NotifyConfig& b) {
        return a.engines == b.engines;
    }
    friend bool operator!=(const NotifyConfig& a, const NotifyConfig& b) {
        return !(a == b);
    }
};

struct RecipientSelection {
    std::set<RecipientId> recipients;

    // Configured engines that matched a player, with their recipient count.
    std::vector<std::pair<std::string, std::size_t>> matchedEngines;
};

} // namespace tcec::notifier::domain
