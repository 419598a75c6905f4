#pragma once

/**
@file
@brief Graphics engine register accessors and control operations.

Every operation comes in two flavors:
- a template taking a `mmio::RegisterSpace` as its first argument, used by tests and by code that maps the I/O block
  somewhere else;
- an overload without the space argument that drives the hardware registers directly.

Accessors, power control and brightness only exist in builds for the processor that drives the display hardware
(`Nitro_ARM9`). `SetVCountTrigger` and `Rgb15` are always available.

Concurrency hazard
------------------
`PowerOn`, `PowerOff`, `SetEngineLCD` and `SetVCountTrigger` are read-modify-write sequences of one load followed by one
store. They are not atomic: if an interrupt handler writes the same register between the load and the store, the
handler's change is lost. Disable interrupts around these calls if a handler may touch POWCNT1 or DISPSTAT.
*/

#include "color.hpp"
#include "video_defs.hpp"
#include "video_regs.hpp"

#include <nitro/hw/mmio/mmio.hpp>

#include <nitro/core/types.hpp>

#include <nitro/util/bit_ops.hpp>
#include <nitro/util/dev_log.hpp>
#include <nitro/util/inline.hpp>

#include <cassert>

namespace nitro::video {

namespace grp {

    // -----------------------------------------------------------------------------
    // Dev log groups

    // Hierarchy:
    //
    // base
    //   regs
    //   power

    struct base {
        static constexpr bool enabled = true;
        static constexpr devlog::Level level = devlog::level::debug;
        static constexpr std::string_view name = "Video";
    };

    struct regs : public base {
        static constexpr devlog::Level level = devlog::level::trace;
        static constexpr std::string_view name = "Video-Regs";
    };

    struct power : public base {
        static constexpr std::string_view name = "Video-Power";
    };

} // namespace grp

// -----------------------------------------------------------------------------
// Register math
//
// Pure functions computing the next raw register value from the previous one.

[[nodiscard]] FORCE_INLINE constexpr uint32 CalcPowerOn(uint32 prev, GfxPwr flags) {
    return prev | static_cast<uint32>(flags);
}

[[nodiscard]] FORCE_INLINE constexpr uint32 CalcPowerOff(uint32 prev, GfxPwr flags) {
    return prev & ~static_cast<uint32>(flags);
}

[[nodiscard]] FORCE_INLINE constexpr uint32 CalcEngineLCD(uint32 prev, MainEnginePos pos) {
    return (prev & ~static_cast<uint32>(MainEnginePos::Top)) | static_cast<uint32>(pos);
}

// addr     r/w  access  code               name
// 400006C  R/W  32      MASTER_BRIGHT (A)  Master Brightness Up/Down (main engine)
// 400106C  R/W  32      MASTER_BRIGHT (B)  Master Brightness Up/Down (sub engine)
//
//   bits   r/w  code    description
//    4-0   R/W  FACTOR  Factor (0-16, values above 16 act as 16)
//   13-5   R    -       Reserved - written as zero
//  15-14   R/W  MODE    Mode (see BrightnessMode)
//  31-16   R    -       Reserved - written as zero
//
// Negative levels fade towards black, positive levels towards white. The magnitude is clamped to kMaxBrightness.
[[nodiscard]] FORCE_INLINE constexpr uint32 CalcBrightness(sint32 level) {
    BrightnessMode mode = BrightnessMode::Up;
    uint32 factor = static_cast<uint32>(level);
    if (level < 0) {
        mode = BrightnessMode::Down;
        factor = 0u - factor;
    }
    if (factor > static_cast<uint32>(kMaxBrightness)) {
        factor = kMaxBrightness;
    }

    uint32 value = 0;
    bit::deposit_into<14, 15>(value, static_cast<uint32>(mode));
    bit::deposit_into<0, 4>(value, factor);
    return value;
}

// addr     r/w  access  code      name
// 4000004  R/W  16      DISPSTAT  General LCD Status
//
//   bits   r/w  code        description
//      0   R    VBLANK      V-Blank flag
//      1   R    HBLANK      H-Blank flag
//      2   R    VCOUNT      V-Counter match flag
//      3   R/W  VBLANK_IE   V-Blank IRQ enable
//      4   R/W  HBLANK_IE   H-Blank IRQ enable
//      5   R/W  VCOUNT_IE   V-Counter match IRQ enable
//      6   R    -           Reserved
//      7   R/W  LYC8        V-Count setting, bit 8
//   15-8   R/W  LYC         V-Count setting, bits 0-7
//
// Bits 0-6 are preserved.
[[nodiscard]] FORCE_INLINE constexpr uint16 CalcVCountTrigger(uint16 prev, uint16 line) {
    uint16 value = prev;
    bit::deposit_into<8, 15>(value, bit::extract<0, 7>(line));
    bit::deposit_into<7>(value, bit::extract<8>(line));
    return value;
}

// Computes the address of a layer's BGxCNT register.
// The layer index wraps around: layers 4-7 alias layers 0-3, and so on.
[[nodiscard]] FORCE_INLINE constexpr uint32 BGControlAddress(uint32 base, uint32 index) {
    return base + (index & (kBGLayers - 1)) * sizeof(uint16);
}

[[nodiscard]] FORCE_INLINE constexpr uint32 MasterBrightAddress(GfxEngine engine) {
    return mmio::kMASTER_BRIGHT_MAIN | static_cast<uint32>(engine);
}

// -----------------------------------------------------------------------------
// Register accessors

#if Nitro_ARM9

template <mmio::RegisterSpace TSpace>
FORCE_INLINE void SetMainDisplayControl(const TSpace &space, DisplayControlMain ctl) {
    const uint32 raw = ctl.ToU32();
    devlog::trace<grp::regs>("DISPCNT (A) <- {:08X}", raw);
    space.template Write<uint32>(mmio::kDISPCNT_MAIN, raw);
}

template <mmio::RegisterSpace TSpace>
[[nodiscard]] FORCE_INLINE DisplayControlMain GetMainDisplayControl(const TSpace &space) {
    return DisplayControlMain::FromU32(space.template Read<uint32>(mmio::kDISPCNT_MAIN));
}

template <mmio::RegisterSpace TSpace>
FORCE_INLINE void SetSubDisplayControl(const TSpace &space, DisplayControlSub ctl) {
    const uint32 raw = ctl.ToU32();
    devlog::trace<grp::regs>("DISPCNT (B) <- {:08X}", raw);
    space.template Write<uint32>(mmio::kDISPCNT_SUB, raw);
}

template <mmio::RegisterSpace TSpace>
[[nodiscard]] FORCE_INLINE DisplayControlSub GetSubDisplayControl(const TSpace &space) {
    return DisplayControlSub::FromU32(space.template Read<uint32>(mmio::kDISPCNT_SUB));
}

// The layer index wraps around; see BGControlAddress.
template <mmio::RegisterSpace TSpace>
FORCE_INLINE void SetMainBGControl(const TSpace &space, uint32 index, BackgroundControl ctl) {
    const uint16 raw = ctl.ToU16();
    devlog::trace<grp::regs>("BG{}CNT (A) <- {:04X}", index & (kBGLayers - 1), raw);
    space.template Write<uint16>(BGControlAddress(mmio::kBG0CNT_MAIN, index), raw);
}

template <mmio::RegisterSpace TSpace>
[[nodiscard]] FORCE_INLINE BackgroundControl GetMainBGControl(const TSpace &space, uint32 index) {
    return BackgroundControl::FromU16(space.template Read<uint16>(BGControlAddress(mmio::kBG0CNT_MAIN, index)));
}

// The layer index wraps around; see BGControlAddress.
template <mmio::RegisterSpace TSpace>
FORCE_INLINE void SetSubBGControl(const TSpace &space, uint32 index, BackgroundControl ctl) {
    const uint16 raw = ctl.ToU16();
    devlog::trace<grp::regs>("BG{}CNT (B) <- {:04X}", index & (kBGLayers - 1), raw);
    space.template Write<uint16>(BGControlAddress(mmio::kBG0CNT_SUB, index), raw);
}

template <mmio::RegisterSpace TSpace>
[[nodiscard]] FORCE_INLINE BackgroundControl GetSubBGControl(const TSpace &space, uint32 index) {
    return BackgroundControl::FromU16(space.template Read<uint16>(BGControlAddress(mmio::kBG0CNT_SUB, index)));
}

// -----------------------------------------------------------------------------
// Power and brightness

/// @brief Turns on the specified graphics subsystems (POWCNT1).
///
/// Read-modify-write; not atomic with respect to interrupts.
template <mmio::RegisterSpace TSpace>
void PowerOn(const TSpace &space, GfxPwr flags) {
    const uint32 prev = space.template Read<uint32>(mmio::kPOWCNT1);
    const uint32 next = CalcPowerOn(prev, flags);
    devlog::debug<grp::power>("Power on {:04X}: POWCNT1 {:08X} -> {:08X}", static_cast<uint32>(flags), prev, next);
    space.template Write<uint32>(mmio::kPOWCNT1, next);
}

/// @brief Turns off the specified graphics subsystems (POWCNT1).
///
/// Read-modify-write; not atomic with respect to interrupts.
template <mmio::RegisterSpace TSpace>
void PowerOff(const TSpace &space, GfxPwr flags) {
    const uint32 prev = space.template Read<uint32>(mmio::kPOWCNT1);
    const uint32 next = CalcPowerOff(prev, flags);
    devlog::debug<grp::power>("Power off {:04X}: POWCNT1 {:08X} -> {:08X}", static_cast<uint32>(flags), prev, next);
    space.template Write<uint32>(mmio::kPOWCNT1, next);
}

/// @brief Selects the physical screen driven by the main engine (POWCNT1 bit 15).
///
/// The sub engine drives the other screen. Read-modify-write; not atomic with respect to interrupts.
template <mmio::RegisterSpace TSpace>
void SetEngineLCD(const TSpace &space, MainEnginePos pos) {
    const uint32 prev = space.template Read<uint32>(mmio::kPOWCNT1);
    const uint32 next = CalcEngineLCD(prev, pos);
    devlog::debug<grp::power>("Main engine on {} screen", pos == MainEnginePos::Top ? "top" : "bottom");
    space.template Write<uint32>(mmio::kPOWCNT1, next);
}

/// @brief Sets the master brightness of a graphics engine.
///
/// This is a color adjustment, not the backlight level. The level ranges from -16 (black) to 16 (white); 0 leaves
/// colors unmodified. Levels outside of that range are clamped.
template <mmio::RegisterSpace TSpace>
void SetBrightness(const TSpace &space, GfxEngine engine, sint32 level) {
    if constexpr (devlog::debug_enabled<grp::power>) {
        if (level < -kMaxBrightness || level > kMaxBrightness) {
            devlog::debug<grp::power>("Brightness level {} clamped to +/-{}", level, kMaxBrightness);
        }
    }
    space.template Write<uint32>(MasterBrightAddress(engine), CalcBrightness(level));
}

// -----------------------------------------------------------------------------
// Hardware register overloads

void SetMainDisplayControl(DisplayControlMain ctl);
[[nodiscard]] DisplayControlMain GetMainDisplayControl();
void SetSubDisplayControl(DisplayControlSub ctl);
[[nodiscard]] DisplayControlSub GetSubDisplayControl();

void SetMainBGControl(uint32 index, BackgroundControl ctl);
[[nodiscard]] BackgroundControl GetMainBGControl(uint32 index);
void SetSubBGControl(uint32 index, BackgroundControl ctl);
[[nodiscard]] BackgroundControl GetSubBGControl(uint32 index);

void PowerOn(GfxPwr flags);
void PowerOff(GfxPwr flags);
void SetEngineLCD(MainEnginePos pos);
void SetBrightness(GfxEngine engine, sint32 level);

#endif // Nitro_ARM9

// -----------------------------------------------------------------------------
// V-Count trigger

/// @brief Sets the scan line that raises the V-Counter match (DISPSTAT).
///
/// Lines below `kVisibleLines` (192) are visible, the rest up to 262 are in V-Blank. Lines above 262 trip an assertion
/// in debug builds and are encoded as is otherwise. Read-modify-write; not atomic with respect to interrupts.
template <mmio::RegisterSpace TSpace>
void SetVCountTrigger(const TSpace &space, uint16 line) {
    assert(line < kVCountLines && "V-Count trigger must be between 0 and 262");
    if constexpr (devlog::warn_enabled<grp::regs>) {
        if (line >= kVCountLines) {
            devlog::warn<grp::regs>("V-Count trigger out of range: {}", line);
        }
    }
    const uint16 prev = space.template Read<uint16>(mmio::kDISPSTAT);
    space.template Write<uint16>(mmio::kDISPSTAT, CalcVCountTrigger(prev, line));
}

void SetVCountTrigger(uint16 line);

} // namespace nitro::video
