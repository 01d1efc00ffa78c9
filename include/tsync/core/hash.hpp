#pragma once

#include <cstddef>
#include <cstdint>
#include <iomanip>
#include <sstream>
#include <string>

namespace tsync {

/// Streaming FNV-1a (64-bit). Used for content checksums on every transport.
class Fnv1a {
public:
    void update(const std::uint8_t* data, std::size_t size) noexcept {
        for (std::size_t i = 0; i < size; ++i) {
            hash_ ^= static_cast<std::uint64_t>(data[i]);
            hash_ *= kPrime;
        }
    }

    [[nodiscard]] std::uint64_t value() const noexcept { return hash_; }

    [[nodiscard]] std::string hex() const {
        std::ostringstream oss;
        oss << std::hex << std::setw(sizeof(hash_) * 2) << std::setfill('0') << hash_;
        return oss.str();
    }

private:
    static constexpr std::uint64_t kOffset = 0xcbf29ce484222325ULL;
    static constexpr std::uint64_t kPrime = 0x100000001b3ULL;

    std::uint64_t hash_ = kOffset;
};

} // namespace tsync
