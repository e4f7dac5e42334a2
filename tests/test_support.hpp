#pragma once

#include <initializer_list>
#include <string>
#include <unordered_set>
#include <utility>
#include <vector>

#include "app/ISeenGameRepository.hpp"
#include "domain/game_model.hpp"

namespace tcec::notifier::test {

// Live feed snapshot: 12 book plies, then engine play.
inline const char* kOutOfBookPgn = R"([Event "TCEC Season 29 - Category 1 Playoff"]
[Site "https://tcec-chess.com"]
[Date "2025.12.02"]
[Round "2.1"]
[White "c4ke 1.1"]
[Black "Minic 3.44"]
[Result "*"]
[BlackElo "3436"]
[ECO "B43"]
[Opening "Sicilian"]
[TimeControl "1800+3"]
[Variation "Kan, 5.Nc3"]
[WhiteElo "3183"]

{WhiteEngineOptions: Protocol=uci; Threads=256; Hash=262144;, BlackEngineOptions: Protocol=uci; Threads=512; Hash=256000;}
1. e4 {book, mb=+0+0+0+0+0,} c5 {book, mb=+0+0+0+0+0,}
2. Nf3 {book, mb=+0+0+0+0+0,} e6 {book, mb=+0+0+0+0+0,}
3. d4 {book, mb=+0+0+0+0+0,} cxd4 {book, mb=-1+0+0+0+0,}
4. Nxd4 {book, mb=+0+0+0+0+0,} a6 {book, mb=+0+0+0+0+0,}
5. Nc3 {book, mb=+0+0+0+0+0,} Qc7 {book, mb=+0+0+0+0+0,}
6. g3 {book, mb=+0+0+0+0+0,} b5 {book, mb=+0+0+0+0+0,}
7. Bg2 {d=32, sd=32, mt=96132, tl=1706868, s=0, n=0, pv=Bg2, tb=null, wv=0.74, mb=+0+0+0+0+0,}
Nc6 {d=33, sd=52, mt=126033, tl=1676967, pv=Bb7 O-O Be7 Re1 d6, tb=1, wv=0.88, mb=+0+0+0+0+0,}
8. O-O {d=34, sd=34, mt=108197, tl=1601671, pv=O-O, tb=null, wv=0.68, mb=+0+0+0+0+0,}
Nxd4 {d=35, sd=53, pd=O-O, mt=150055, tl=1529912, pv=Nxd4 Qxd4 f6 Be3, tb=10, wv=0.92, mb=+0-1+0+0+0,}
*
)";

// Same game while still in its opening.
inline const char* kInBookPgn = R"([Event "TCEC Season 29 - Category 1 Playoff"]
[Site "https://tcec-chess.com"]
[Date "2025.12.02"]
[White "c4ke 1.1"]
[Black "Minic 3.44"]
[Result "*"]

{WhiteEngineOptions: Protocol=uci; Threads=256;}
1. e4 {book, mb=+0+0+0+0+0,} c5 {book, mb=+0+0+0+0+0,}
2. Nf3 {book, mb=+0+0+0+0+0,} e6 {book, mb=+0+0+0+0+0,}
3. d4 {book, mb=+0+0+0+0+0,} cxd4 {book, mb=-1+0+0+0+0,}
*
)";

inline std::string withHeaders(const std::string& movetext,
                               const std::string& white = "Lunar 2.0.1",
                               const std::string& black = "Colossus 2025b",
                               const std::string& date = "2025.12.02",
                               const std::string& event = "TCEC Season 29") {
    return "[Event \"" + event + "\"]\n"
           "[Site \"https://tcec-chess.com\"]\n"
           "[Date \"" + date + "\"]\n"
           "[White \"" + white + "\"]\n"
           "[Black \"" + black + "\"]\n"
           "[Result \"*\"]\n"
           "\n" + movetext + "\n";
}

inline domain::Game makeGame(std::initializer_list<std::pair<const char*, bool>> moves,
                             const std::string& white = "Lunar 2",
                             const std::string& black = "Colossus 2025b",
                             const std::string& date = "2025.12.02",
                             const std::string& event = "TCEC Season 29") {
    std::vector<domain::Move> out;
    for (const auto& [san, inBook] : moves) {
        out.push_back(domain::Move{san, inBook});
    }
    return domain::Game(domain::EngineName(white), domain::EngineName(black), date, event, std::move(out));
}

class InMemorySeenGames final : public app::ISeenGameRepository {
public:
    bool contains(const domain::Game& game) const override {
        return hashes.count(game.identityHash()) > 0;
    }

    bool add(const domain::Game& game, std::string* errorOut) override {
        hashes.insert(game.identityHash());
        if (failWrites) {
            if (errorOut) *errorOut = "disk full";
            return false;
        }
        return true;
    }

    std::unordered_set<domain::GameHash> hashes;
    bool failWrites = false;
};

} // namespace tcec::notifier::test
