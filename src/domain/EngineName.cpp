#include "domain/EngineName.hpp"

#include <algorithm>
#include <cctype>
#include <regex>

namespace tcec::notifier::domain {

namespace {

// " v1", " 2.0", " v2.0.1" at the very end.
const std::regex& versionSuffix() {
    static const std::regex re(R"( v?\d+(\.\d+)?(\.\d+)?$)");
    return re;
}

// " 2025b" anywhere; the feed sometimes puts further text after the build tag.
const std::regex& dateBuildTag() {
    static const std::regex re(R"( \d{4}[a-zA-Z])");
    return re;
}

static inline std::string trim(std::string_view v) {
    size_t b = 0;
    while (b < v.size() && std::isspace(static_cast<unsigned char>(v[b]))) ++b;
    size_t e = v.size();
    while (e > b && std::isspace(static_cast<unsigned char>(v[e - 1]))) --e;
    return std::string(v.substr(b, e - b));
}

static inline std::string toLowerAscii(std::string_view v) {
    std::string out(v);
    std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return out;
}

} // namespace

EngineName::EngineName(std::string raw)
    : raw_(std::move(raw))
    , normalized_(normalize(raw_)) {
}

std::string EngineName::normalize(std::string_view name) {
    std::string out = trim(toLowerAscii(name));
    out = trim(std::regex_replace(out, versionSuffix(), ""));
    out = trim(std::regex_replace(out, dateBuildTag(), ""));
    return out;
}

bool EngineName::matches(std::string_view candidate) const {
    return normalized_.find(normalize(candidate)) != std::string::npos;
}

} // namespace tcec::notifier::domain
