#pragma once

/**
@file
@brief Palette color conversion.
*/

#include <nitro/core/types.hpp>

#include <nitro/util/inline.hpp>

namespace nitro::video {

// Converts a 0xRRGGBB color code into the 15-bit palette format.
//
//   bits   description
//    4-0   Red   (color bits 23-19)
//    9-5   Green (color bits 15-11)
//  14-10   Blue  (color bits 7-3)
//
// Bits 31-24 of the color code are ignored.
[[nodiscard]] FORCE_INLINE constexpr uint16 Rgb15(uint32 rgb) {
    return static_cast<uint16>(((rgb & 0xF80000) >> 19) | ((rgb & 0x00F800) >> 6) | ((rgb & 0x0000F8) << 7));
}

} // namespace nitro::video
