#pragma once

#include <cassert>
#include <cstdio>
#include <cstdlib>

#if defined(_MSC_VER) && !defined(__clang__)
#define CORRAL_ALWAYS_INLINE __forceinline
#elif defined(__GNUC__) || defined(__clang__)
#define CORRAL_ALWAYS_INLINE inline __attribute__((always_inline))
#else
#define CORRAL_ALWAYS_INLINE inline
#endif

#if defined(__GNUC__) || defined(__clang__)
#define CORRAL_UNLIKELY(x) __builtin_expect(!!(x), 0)
#else
#define CORRAL_UNLIKELY(x) (x)
#endif

/// @brief Debug-only contract check. Compiles away with NDEBUG.
#define CORRAL_ASSERT(expr) assert(expr)

/// @brief Contract-fatal termination with a message on stderr.
#define CORRAL_ABORT(message) ::Corral::detail::AbortWithMessage(message)

namespace Corral
{
    namespace detail
    {
        [[noreturn]] inline void AbortWithMessage(const char* message) noexcept
        {
            std::fputs(message, stderr);
            std::fputc('\n', stderr);
            std::abort();
        }
    }// namespace detail
}// namespace Corral
