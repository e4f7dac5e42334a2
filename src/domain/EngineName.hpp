#pragma once

#include <cstddef>
#include <functional>
#include <ostream>
#include <string>
#include <string_view>

namespace tcec::notifier::domain {

// Display name of a chess engine as published by the live feed.
//
// Identity is based on the normalized form: lower-cased, with a trailing
// version ("2", "v1.2.3") and a date-coded build tag ("2025a") removed.
// The raw text is kept verbatim for display.
//
// Known limitation: a name whose digits are part of the proper name
// ("Chess 4") loses them during normalization.
class EngineName {
public:
    explicit EngineName(std::string raw);

    const std::string& raw() const noexcept { return raw_; }
    const std::string& normalized() const noexcept { return normalized_; }

    // True if the normalized candidate is a substring of this name's normalized form,
    // so "Lunar" matches a published "Lunar 2.0.1" (but not the other way round).
    bool matches(std::string_view candidate) const;

    static std::string normalize(std::string_view name);

    friend bool operator==(const EngineName& a, const EngineName& b) {
        return a.normalized_ == b.normalized_;
    }
    friend bool operator!=(const EngineName& a, const EngineName& b) {
        return !(a == b);
    }

private:
    std::string raw_;
    std::string normalized_;
};

inline std::ostream& operator<<(std::ostream& os, const EngineName& name) {
    return os << name.raw();
}

} // namespace tcec::notifier::domain

namespace std {

template <>
struct hash<tcec::notifier::domain::EngineName> {
    size_t operator()(const tcec::notifier::domain::EngineName& name) const noexcept {
        return hash<string>{}(name.normalized());
    }
};

} // namespace std
