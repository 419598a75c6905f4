#pragma once

/**
@file
@brief Core type definitions.

Defines aliases for all fixed-width integer types.
*/

#include <cstdint>

using uint8 = uint8_t;
using uint16 = uint16_t;
using uint32 = uint32_t;
using uint64 = uint64_t;

using sint8 = int8_t;
using sint16 = int16_t;
using sint32 = int32_t;
using sint64 = int64_t;

using uintptr = uintptr_t;
