#include "domain/pgn/PgnTokenizer.hpp"

#include <cctype>

namespace tcec::notifier::domain::pgn {

namespace {

static inline bool isLineBreak(char c) {
    return c == '\n' || c == '\r';
}

static inline bool isSpace(char c) {
    return std::isspace(static_cast<unsigned char>(c)) != 0;
}

static inline bool isDigit(char c) {
    return std::isdigit(static_cast<unsigned char>(c)) != 0;
}

// Characters that end a SAN token in addition to whitespace.
static inline bool isDelimiter(char c) {
    switch (c) {
        case '{': case '}': case '(': case ')': case '[': case ']': case ';': case '$':
            return true;
        default:
            return false;
    }
}

static inline bool isSanStart(char c) {
    switch (c) {
        case 'a': case 'b': case 'c': case 'd': case 'e': case 'f': case 'g': case 'h':
        case 'K': case 'Q': case 'R': case 'B': case 'N': case 'P': case 'O':
            return true;
        default:
            return false;
    }
}

static inline std::string unescapePgnString(std::string_view v) {
    std::string out;
    out.reserve(v.size());
    for (size_t i = 0; i < v.size(); ++i) {
        const char c = v[i];
        if (c == '\\' && i + 1 < v.size()) {
            const char n = v[i + 1];
            if (n == '\\' || n == '"') {
                out.push_back(n);
                ++i;
                continue;
            }
        }
        out.push_back(c);
    }
    return out;
}

static inline bool isResult(std::string_view s) {
    return s == "1-0" || s == "0-1" || s == "1/2-1/2" || s == "*";
}

// "12", "12.", "12..."
static inline bool isMoveNumber(std::string_view s) {
    size_t i = 0;
    while (i < s.size() && isDigit(s[i])) ++i;
    if (i == 0) return false;
    while (i < s.size() && s[i] == '.') ++i;
    return i == s.size();
}

// Parses a single tag line [Key "Value"] (supports \" and \\ escapes).
static bool parseTagLine(std::string_view line, std::string& outKey, std::string& outVal) {
    // Expected: [Key "Value"]
    if (line.size() < 4) return false;
    if (line.front() != '[') return false;
    if (line.back() != ']') return false;

    std::string_view mid = line.substr(1, line.size() - 2);
    size_t b = 0;
    while (b < mid.size() && isSpace(mid[b])) ++b;
    mid.remove_prefix(b);

    // Key runs until first whitespace or quote.
    size_t sp = 0;
    while (sp < mid.size() && !isSpace(mid[sp]) && mid[sp] != '"') ++sp;
    if (sp == 0 || sp >= mid.size()) return false;

    outKey = std::string(mid.substr(0, sp));

    size_t q1 = mid.find('"', sp);
    if (q1 == std::string_view::npos) return false;
    for (size_t k = sp; k < q1; ++k) {
        if (!isSpace(mid[k])) return false;
    }

    // Find closing quote (scan, respecting escapes).
    size_t q2 = q1 + 1;
    bool escaped = false;
    for (; q2 < mid.size(); ++q2) {
        const char c = mid[q2];
        if (escaped) {
            escaped = false;
            continue;
        }
        if (c == '\\') {
            escaped = true;
            continue;
        }
        if (c == '"') break;
    }
    if (q2 >= mid.size()) return false;

    for (size_t k = q2 + 1; k < mid.size(); ++k) {
        if (!isSpace(mid[k])) return false;
    }

    outVal = unescapePgnString(mid.substr(q1 + 1, q2 - (q1 + 1)));
    return true;
}

} // namespace

PgnTokenizer::PgnTokenizer(std::string_view text)
    : text_(text) {
    // Strip UTF-8 BOM if present.
    if (text_.size() >= 3 &&
        static_cast<unsigned char>(text_[0]) == 0xEF &&
        static_cast<unsigned char>(text_[1]) == 0xBB &&
        static_cast<unsigned char>(text_[2]) == 0xBF) {
        pos_   = 3;
        begin_ = 3;
    }
}

bool PgnTokenizer::atLineStart() const noexcept {
    return pos_ == begin_ || isLineBreak(text_[pos_ - 1]);
}

void PgnTokenizer::advance() {
    const char c = text_[pos_++];
    // "\r\n" counts once; a lone '\r' is a line break too.
    if (c == '\n' || (c == '\r' && (pos_ >= text_.size() || text_[pos_] != '\n'))) {
        ++line_;
    }
}

void PgnTokenizer::skipToLineEnd() {
    while (pos_ < text_.size() && !isLineBreak(text_[pos_])) advance();
}

void PgnTokenizer::skipWhitespace() {
    while (pos_ < text_.size()) {
        if (text_[pos_] == '%' && atLineStart()) {
            skipToLineEnd();
            continue;
        }
        if (!isSpace(text_[pos_])) break;
        advance();
    }
}

bool PgnTokenizer::fail(std::string* errorOut, const std::string& what) const {
    if (errorOut) {
        *errorOut = "line " + std::to_string(line_) + ": " + what;
    }
    return false;
}

bool PgnTokenizer::next(PgnToken& out, std::string* errorOut) {
    out = PgnToken{};
    skipWhitespace();
    out.line = line_;

    if (pos_ >= text_.size()) {
        out.type = PgnTokenType::End;
        return true;
    }

    const char c = text_[pos_];
    switch (c) {
        case '[':
            return readTag(out, errorOut);
        case '{':
            return readBraceComment(out, errorOut);
        case ';':
            readLineComment(out);
            return true;
        case '(':
            advance();
            out.type = PgnTokenType::VariationStart;
            return true;
        case ')':
            advance();
            out.type = PgnTokenType::VariationEnd;
            return true;
        case '$':
            return readNag(out, errorOut);
        case '*':
            advance();
            out.type  = PgnTokenType::Result;
            out.value = "*";
            return true;
        default:
            break;
    }

    if (isDigit(c)) {
        return readNumeric(out, errorOut);
    }
    if (isSanStart(c)) {
        return readSan(out, errorOut);
    }
    return fail(errorOut, std::string("unexpected character '") + c + "'");
}

bool PgnTokenizer::readTag(PgnToken& out, std::string* errorOut) {
    const size_t start = pos_;
    bool inQuotes = false;
    bool escaped  = false;

    while (pos_ < text_.size()) {
        const char c = text_[pos_];
        if (isLineBreak(c)) {
            return fail(errorOut, "unterminated tag pair");
        }
        advance();
        if (escaped) {
            escaped = false;
        } else if (inQuotes && c == '\\') {
            escaped = true;
        } else if (c == '"') {
            inQuotes = !inQuotes;
        } else if (c == ']' && !inQuotes) {
            break;
        }
    }

    const std::string_view raw = text_.substr(start, pos_ - start);
    if (!parseTagLine(raw, out.key, out.value)) {
        return fail(errorOut, "malformed tag pair " + std::string(raw));
    }
    out.type = PgnTokenType::TagPair;
    return true;
}

bool PgnTokenizer::readBraceComment(PgnToken& out, std::string* errorOut) {
    const size_t openLine = line_;
    advance(); // '{'
    const size_t start = pos_;
    while (pos_ < text_.size() && text_[pos_] != '}') advance();
    if (pos_ >= text_.size()) {
        if (errorOut) {
            *errorOut = "line " + std::to_string(openLine) + ": unterminated comment";
        }
        return false;
    }
    out.type  = PgnTokenType::Comment;
    out.value = std::string(text_.substr(start, pos_ - start));
    advance(); // '}'
    return true;
}

void PgnTokenizer::readLineComment(PgnToken& out) {
    advance(); // ';'
    const size_t start = pos_;
    skipToLineEnd();
    out.type  = PgnTokenType::Comment;
    out.value = std::string(text_.substr(start, pos_ - start));
}

bool PgnTokenizer::readNumeric(PgnToken& out, std::string* errorOut) {
    const size_t start = pos_;
    while (pos_ < text_.size()) {
        const char c = text_[pos_];
        if (!(isDigit(c) || c == '.' || c == '/' || c == '-')) break;
        advance();
    }
    const std::string_view word = text_.substr(start, pos_ - start);

    if (isResult(word)) {
        out.type  = PgnTokenType::Result;
        out.value = std::string(word);
        return true;
    }
    if (isMoveNumber(word)) {
        out.type  = PgnTokenType::MoveNumber;
        out.value = std::string(word);
        return true;
    }
    if (word == "0-0" || word == "0-0-0") {
        // Castling written with zeros; may carry a check suffix.
        std::string san(word.size() == 3 ? "O-O" : "O-O-O");
        while (pos_ < text_.size() && (text_[pos_] == '+' || text_[pos_] == '#')) {
            san.push_back(text_[pos_]);
            advance();
        }
        out.type  = PgnTokenType::San;
        out.value = std::move(san);
        return true;
    }
    // "4.0-0": move number written without a space before zero castling.
    // Hand out the number now and lex the castling on the next call.
    const size_t dot = word.find_first_not_of("0123456789");
    if (dot != std::string_view::npos && dot > 0 && word[dot] == '.') {
        const size_t castle = word.find_first_not_of('.', dot);
        const std::string_view tail =
            castle == std::string_view::npos ? std::string_view() : word.substr(castle);
        if (tail == "0-0" || tail == "0-0-0") {
            pos_ = start + castle;
            out.type  = PgnTokenType::MoveNumber;
            out.value = std::string(word.substr(0, castle));
            return true;
        }
    }
    return fail(errorOut, "unexpected token '" + std::string(word) + "'");
}

bool PgnTokenizer::readSan(PgnToken& out, std::string* errorOut) {
    const size_t start = pos_;
    while (pos_ < text_.size() && !isSpace(text_[pos_]) && !isDelimiter(text_[pos_])) advance();

    std::string san(text_.substr(start, pos_ - start));
    while (!san.empty() && (san.back() == '!' || san.back() == '?')) {
        san.pop_back();
    }
    if (san.empty()) {
        return fail(errorOut, "empty move");
    }
    for (char c : san) {
        if (!(std::isalnum(static_cast<unsigned char>(c)) || c == '-' || c == '=' || c == '+' || c == '#')) {
            return fail(errorOut, "malformed move '" + san + "'");
        }
    }
    out.type  = PgnTokenType::San;
    out.value = std::move(san);
    return true;
}

bool PgnTokenizer::readNag(PgnToken& out, std::string* errorOut) {
    advance(); // '$'
    const size_t start = pos_;
    while (pos_ < text_.size() && isDigit(text_[pos_])) advance();
    if (pos_ == start) {
        return fail(errorOut, "'$' without glyph number");
    }
    out.type  = PgnTokenType::Nag;
    out.value = std::string(text_.substr(start, pos_ - start));
    return true;
}

} // namespace tcec::notifier::domain::pgn
