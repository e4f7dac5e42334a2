#include "domain/pgn/PgnParser.hpp"

#include <array>

namespace tcec::notifier::domain::pgn {

namespace {

static inline bool isRequiredTag(std::string_view key) {
    return key == kEventTag || key == kWhiteTag || key == kBlackTag || key == kDateTag;
}

static GameParseResult makeError(PgnParseError error, std::string message) {
    GameParseResult res;
    res.ok      = false;
    res.error   = error;
    res.message = std::move(message);
    return res;
}

} // namespace

GameBuilder::GameBuilder(PgnParseOptions options)
    : options_(options) {
    result_ = makeError(PgnParseError::EmptyInput, "No PGN game found");
}

void GameBuilder::beginGame() {
    headers_.clear();
    moves_.clear();
    pendingSan_.reset();
    pendingComment_.reset();
    orphanComment_.reset();
}

void GameBuilder::header(std::string_view key, std::string_view value) {
    if (!isRequiredTag(key)) {
        return;
    }
    headers_[std::string(key)] = std::string(value);
}

void GameBuilder::san(std::string_view san) {
    commitPending();

    pendingSan_ = std::string(san);
    if (orphanComment_) {
        pendingComment_ = std::move(orphanComment_);
        orphanComment_.reset();
    }
}

void GameBuilder::comment(std::string_view text) {
    if (pendingSan_) {
        pendingComment_ = std::string(text);
        return;
    }
    if (options_.orphanComments == OrphanCommentPolicy::AttachToNext) {
        orphanComment_ = std::string(text);
    }
}

void GameBuilder::commitPending() {
    if (!pendingSan_) {
        return;
    }
    moves_.push_back(Move::fromComment(std::move(*pendingSan_), pendingComment_.value_or(std::string())));
    pendingSan_.reset();
    pendingComment_.reset();
}

void GameBuilder::endGame() {
    commitPending();

    static constexpr std::array<std::string_view, 4> kRequired{kWhiteTag, kBlackTag, kDateTag, kEventTag};
    for (const auto tag : kRequired) {
        if (headers_.find(tag) == headers_.end()) {
            result_ = makeError(PgnParseError::MissingRequiredHeader,
                                "Missing required header: " + std::string(tag));
            return;
        }
    }

    result_ = GameParseResult{};
    result_.ok = true;
    result_.game.emplace(EngineName(headers_.find(kWhiteTag)->second),
                         EngineName(headers_.find(kBlackTag)->second),
                         headers_.find(kDateTag)->second,
                         headers_.find(kEventTag)->second,
                         std::move(moves_));
    moves_.clear();
}

GameParseResult GameBuilder::takeResult() {
    GameParseResult out = std::move(result_);
    result_ = makeError(PgnParseError::EmptyInput, "No PGN game found");
    return out;
}

GameParseResult parseGame(std::string_view text, const PgnParseOptions& options) {
    GameBuilder builder(options);

    const PgnReadResult read = readGame(text, builder);
    if (!read.ok) {
        return makeError(PgnParseError::Malformed, read.error);
    }
    if (!read.gameFound) {
        return makeError(PgnParseError::EmptyInput, "No PGN game found");
    }
    return builder.takeResult();
}

std::string to_string(PgnParseError e) {
    switch (e) {
        case PgnParseError::None:                  return "None";
        case PgnParseError::EmptyInput:            return "EmptyInput";
        case PgnParseError::MissingRequiredHeader: return "MissingRequiredHeader";
        case PgnParseError::Malformed:             return "Malformed";
    }
    return "Unknown";
}

} // namespace tcec::notifier::domain::pgn
