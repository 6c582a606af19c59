#pragma once

#include <cstddef>

// Branch prediction hints
#define SHIELD_LIKELY(x) __builtin_expect(!!(x), 1)
#define SHIELD_UNLIKELY(x) __builtin_expect(!!(x), 0)

// Force inline for per-line helpers on the matcher path
#define SHIELD_ALWAYS_INLINE __attribute__((always_inline)) inline

// Cache line alignment for contended atomics
#define SHIELD_CACHE_LINE_SIZE 64
#define SHIELD_CACHE_ALIGNED alignas(SHIELD_CACHE_LINE_SIZE)

namespace Shield::Common {

/// Number of elements in a C array
template <typename T, std::size_t N>
constexpr std::size_t arraySize(const T (&)[N]) noexcept {
    return N;
}

} // namespace Shield::Common
