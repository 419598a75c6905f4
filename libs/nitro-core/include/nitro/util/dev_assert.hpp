#pragma once

/**
@file
@brief Development-time assertions.

Defines the following macro:
- `NITRO_DEV_ASSERT(bool)`: checks for a precondition, trapping if it fails.

This macro is useful to check for register addresses that fall outside the mapped I/O window.

Development assertions must be enabled by defining the `Nitro_DEV_ASSERTIONS` macro with a truthy value.
*/

/**
@def NITRO_DEV_ASSERT
@brief Performs a development-time assertion, trapping if the condition fails.
@param[in] condition the condition to check
*/

#if Nitro_DEV_ASSERTIONS
    #if defined(_MSC_VER)
        #define NITRO_DEV_TRAP() __debugbreak()
    #else
        #define NITRO_DEV_TRAP() __builtin_trap()
    #endif

    #define NITRO_DEV_ASSERT(cond) \
        do {                       \
            if (!(cond)) {         \
                NITRO_DEV_TRAP();  \
            }                      \
        } while (false)
#else
    #define NITRO_DEV_ASSERT(cond)
#endif
