#pragma once

/**
@file
@brief Physical addresses of the I/O registers driven by this library.
*/

#include <nitro/core/types.hpp>

namespace nitro::mmio {

// Both graphics engines and the power controller live in the I/O register block.
inline constexpr uint32 kIORegsBase = 0x0400'0000;
inline constexpr uint32 kIORegsSize = 0x2000;

// addr      r/w  access  code                 name
// 4000000   R/W  32      DISPCNT (A)          Display Control (main engine)
// 4000004   R/W  16      DISPSTAT             General LCD Status
// 4000008   R/W  16      BG0CNT..BG3CNT (A)   Background Control, 2 bytes per layer (main engine)
// 400006C   R/W  32      MASTER_BRIGHT (A)    Master Brightness Up/Down (main engine)
// 4000304   R/W  32      POWCNT1              Graphics Power Control
// 4001000   R/W  32      DISPCNT (B)          Display Control (sub engine)
// 4001008   R/W  16      BG0CNT..BG3CNT (B)   Background Control, 2 bytes per layer (sub engine)
// 400106C   R/W  32      MASTER_BRIGHT (B)    Master Brightness Up/Down (sub engine)
inline constexpr uint32 kDISPCNT_MAIN = 0x0400'0000;
inline constexpr uint32 kDISPSTAT = 0x0400'0004;
inline constexpr uint32 kBG0CNT_MAIN = 0x0400'0008;
inline constexpr uint32 kMASTER_BRIGHT_MAIN = 0x0400'006C;
inline constexpr uint32 kPOWCNT1 = 0x0400'0304;
inline constexpr uint32 kDISPCNT_SUB = 0x0400'1000;
inline constexpr uint32 kBG0CNT_SUB = 0x0400'1008;

} // namespace nitro::mmio
