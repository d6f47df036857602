#pragma once

#include <cstddef>
#include <cstdint>
#include <string_view>

namespace ripple::internal {

    inline constexpr uint64_t fnv_offset_basis = 0xcbf29ce484222325ULL;
    inline constexpr uint64_t fnv_prime = 0x100000001b3ULL;

    constexpr uint64_t fnv1a(std::string_view bytes, uint64_t seed = fnv_offset_basis) {
        uint64_t hash = seed;
        for (auto c : bytes) {
            hash ^= static_cast<uint8_t>(c);
            hash *= fnv_prime;
        }
        return hash;
    }

    constexpr uint64_t fingerprint_combine(uint64_t a, uint64_t b) {
        return a ^ (b * 0x517cc1b727220a95ULL + 0x9e3779b97f4a7c15ULL + (a << 6) + (a >> 2));
    }

}  // namespace ripple::internal
