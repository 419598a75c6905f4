#pragma once

/**
@file
@brief Macros for managing function inlining.

This header defines `FORCE_INLINE`, which forces function inlining and marks the function `inline`.

Register accessors are meant to collapse into a single load or store at the call site, so every accessor in the library
is marked `FORCE_INLINE`.

In Debug builds the macro has no effect in order to not disrupt the debugging experience. Inlining can also be
disabled by defining `Nitro_DISABLE_FORCE_INLINE`.

Note that `FORCE_INLINE` always marks the function `inline` even when disabled.
*/

/**
@def FORCE_INLINE
@brief Forces function inlining and marks the function `inline`.
*/

#if !defined(NDEBUG) || defined(Nitro_DISABLE_FORCE_INLINE)
    #define FORCE_INLINE inline
#elif defined(__clang__) || defined(__GNUC__) || defined(__GNUG__)
    #define FORCE_INLINE [[gnu::always_inline]] inline
#elif defined(_MSC_VER)
    #define FORCE_INLINE [[msvc::forceinline]] inline
#else
    #define FORCE_INLINE inline
#endif
