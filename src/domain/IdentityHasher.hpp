#pragma once

#include <cstdint>
#include <string_view>

namespace tcec::notifier::domain {

// 64-bit FNV-1a over length-delimited fields.
//
// The value is persisted across restarts, so it must not depend on the
// standard library's std::hash (unspecified, may change between builds).
class IdentityHasher {
public:
    static constexpr std::uint64_t kOffsetBasis = 14695981039346656037ull;
    static constexpr std::uint64_t kPrime       = 1099511628211ull;

    void update(std::string_view field) noexcept {
        updateU64(static_cast<std::uint64_t>(field.size()));
        for (unsigned char c : field) {
            mix(c);
        }
    }

    void updateU64(std::uint64_t v) noexcept {
        for (int i = 0; i < 8; ++i) {
            mix(static_cast<unsigned char>((v >> (8 * i)) & 0xFFu));
        }
    }

    std::uint64_t finish() const noexcept { return state_; }

private:
    void mix(unsigned char c) noexcept {
        state_ ^= c;
        state_ *= kPrime;
    }

    std::uint64_t state_{kOffsetBasis};
};

} // namespace tcec::notifier::domain
