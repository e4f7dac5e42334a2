#pragma once

#include <QFile>
#include <QString>
#include <unordered_set>

#include "app/ISeenGameRepository.hpp"
#include "domain/game_model.hpp"

namespace tcec::notifier::infra {

// Identity hashes of announced games, one decimal number per line.
//
// The file is opened once (created empty if missing) and stays open for
// appending for the lifetime of the store.
class SeenGameStore final : public tcec::notifier::app::ISeenGameRepository {
public:
    explicit SeenGameStore(QString path);

    // Reads the whole file into memory. A line that is not an unsigned
    // 64-bit decimal fails the load; corrupt history is never skipped.
    bool open(QString* errorOut);
    bool isOpen() const { return file_.isOpen(); }

    bool contains(const domain::Game& game) const override;
    bool contains(domain::GameHash hash) const;

    bool add(const domain::Game& game, std::string* errorOut) override;

    std::size_t size() const noexcept { return hashes_.size(); }

private:
    QString path_;
    QFile file_;
    std::unordered_set<domain::GameHash> hashes_;
};

} // namespace tcec::notifier::infra
