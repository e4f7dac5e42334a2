#pragma once

#include <cstddef>
#include <string>
#include <string_view>

namespace tcec::notifier::domain::pgn {

enum class PgnTokenType {
    TagPair,        // [Key "Value"]: key + value
    MoveNumber,     // "12." / "12..."
    San,            // "Nf3", "O-O", "exd8=Q+": value
    Comment,        // {...} or ;... : value (without delimiters)
    Nag,            // $14
    VariationStart, // (
    VariationEnd,   // )
    Result,         // 1-0, 0-1, 1/2-1/2, *
    End
};

struct PgnToken {
    PgnTokenType type{PgnTokenType::End};
    std::string  key;
    std::string  value;
    std::size_t  line{1}; // 1-based line the token starts on
};

// Pull-based lexer for a PGN text held in memory.
//
// Handles a leading UTF-8 BOM, any line ending, '%' escape lines and
// multi-line brace comments. Annotation glyphs ("!", "?", "!?") are stripped
// from SAN tokens; "0-0"/"0-0-0" are reported as "O-O"/"O-O-O".
//
// next() returns false on malformed input and sets *errorOut. After the End
// token it keeps returning End.
class PgnTokenizer {
public:
    explicit PgnTokenizer(std::string_view text);

    bool next(PgnToken& out, std::string* errorOut);

    std::size_t line() const noexcept { return line_; }

private:
    bool atLineStart() const noexcept;
    void skipToLineEnd();
    void skipWhitespace();
    void advance();

    bool readTag(PgnToken& out, std::string* errorOut);
    bool readBraceComment(PgnToken& out, std::string* errorOut);
    void readLineComment(PgnToken& out);
    bool readNumeric(PgnToken& out, std::string* errorOut);
    bool readSan(PgnToken& out, std::string* errorOut);
    bool readNag(PgnToken& out, std::string* errorOut);

    bool fail(std::string* errorOut, const std::string& what) const;

    std::string_view text_;
    std::size_t      begin_{0};
    std::size_t      pos_{0};
    std::size_t      line_{1};
};

} // namespace tcec::notifier::domain::pgn
