#pragma once

#if defined(_MSC_VER)
#define BANDITRY_STRONG_INLINE __forceinline
#elif defined(__GNUC__) || defined(__clang__)
#define BANDITRY_STRONG_INLINE inline __attribute__((always_inline))
#else
#define BANDITRY_STRONG_INLINE inline
#endif
