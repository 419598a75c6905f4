#pragma once

/**
@file
@brief Bit-packed graphics engine register definitions.

Registers are modeled as plain structs of named fields with explicit conversions to and from their raw wire form. The
structs never touch the hardware; use the accessors in `video.hpp` to load and store them.

Each register layout is declared as a table of bit ranges, including the reserved ranges. The tables are checked at
compile time to cover every bit of the register exactly once, and the serializers are written against the same ranges.
*/

#include "video_defs.hpp"

#include <nitro/core/types.hpp>

#include <nitro/util/bit_ops.hpp>
#include <nitro/util/inline.hpp>

#include <array>
#include <climits>
#include <concepts>
#include <cstddef>

namespace nitro::video {

/// @brief An inclusive range of bits within a register.
struct BitRange {
    uint8 start;
    uint8 end;
};

namespace detail {

    template <BitRange range, std::unsigned_integral T>
    [[nodiscard]] FORCE_INLINE constexpr T Extract(T raw) {
        return bit::extract<range.start, range.end>(raw);
    }

    template <BitRange range, std::unsigned_integral T, std::integral TV>
    FORCE_INLINE constexpr void Deposit(T &raw, TV value) {
        bit::deposit_into<range.start, range.end>(raw, value);
    }

    // Builds the mask of bits covered by the range.
    template <std::unsigned_integral T>
    [[nodiscard]] constexpr T Mask(BitRange range) {
        return static_cast<T>((~0ull >> (63 - (range.end - range.start))) << range.start);
    }

    // Checks that the ranges are well-formed, do not overlap and cover every bit of T.
    template <std::unsigned_integral T, std::size_t N>
    constexpr bool CoversExactly(const std::array<BitRange, N> &ranges) {
        constexpr std::size_t kWidth = sizeof(T) * CHAR_BIT;
        uint64 seen = 0;
        for (const BitRange &range : ranges) {
            if (range.end < range.start || range.end >= kWidth) {
                return false;
            }
            const uint64 mask = Mask<uint64>(range);
            if (seen & mask) {
                return false;
            }
            seen |= mask;
        }
        return seen == (~0ull >> (64 - kWidth));
    }

} // namespace detail

// -----------------------------------------------------------------------------
// DISPCNT

// addr     r/w  access  code          name
// 4000000  R/W  32      DISPCNT (A)   Display Control (main engine)
// 4001000  R/W  32      DISPCNT (B)   Display Control (sub engine)
//
//   bits   r/w  A  B  code          description
//    2-0   R/W  x  x  BGMODE        BG mode (see BGMode)
//      3   R/W  x  -  BG0_3D        BG0 2D/3D selection (0=2D, 1=3D)
//      4   R/W  x  x  OBJ_TILE_MAP  Tile object mapping (0=2D, 1=1D)
//      5   R/W  x  x  OBJ_BMP_DIM   Bitmap object 2D dimension (0=128x512 dots, 1=256x256 dots)
//      6   R/W  x  x  OBJ_BMP_MAP   Bitmap object mapping (0=2D, 1=1D)
//      7   R/W  x  x  FBLANK        Forced blank
//   11-8   R/W  x  x  BGn_ON        Display BG3-0
//     12   R/W  x  x  OBJ_ON        Display objects
//     13   R/W  x  x  WIN0_ON       Display window 0
//     14   R/W  x  x  WIN1_ON       Display window 1
//     15   R/W  x  x  OBJWIN_ON     Display object window
//  17-16   R/W  x  x  DMODE         Display mode (see DisplayMode)
//  19-18   R/W  x  -  VRAM_BLOCK    VRAM block displayed in VRAM display mode
//  21-20   R/W  x  x  OBJ_TILE_BND  Tile object 1D boundary (32 << n bytes)
//     22   R/W  x  -  OBJ_BMP_BND   Bitmap object 1D boundary (128 << n bytes)
//     23   R/W  x  x  OBJ_HBLANK    Process objects during H-Blank
//  26-24   R/W  x  -  CHAR_BASE     Tile data base (64 KiB steps)
//  29-27   R/W  x  -  SCREEN_BASE   Tile map base (64 KiB steps)
//     30   R/W  x  x  BG_EXTPAL     BG extended palettes
//     31   R/W  x  x  OBJ_EXTPAL    Object extended palettes
//
// Positions marked "-" are reserved on the sub engine.
namespace dispcnt {
    inline constexpr BitRange kBGMode{0, 2};
    inline constexpr BitRange kBG0As3D{3, 3};
    inline constexpr BitRange kObjTileMapping{4, 4};
    inline constexpr BitRange kObjBitmapDim{5, 5};
    inline constexpr BitRange kObjBitmapMapping{6, 6};
    inline constexpr BitRange kForcedBlank{7, 7};
    inline constexpr BitRange kDisplayBG0{8, 8};
    inline constexpr BitRange kDisplayBG1{9, 9};
    inline constexpr BitRange kDisplayBG2{10, 10};
    inline constexpr BitRange kDisplayBG3{11, 11};
    inline constexpr BitRange kDisplayOBJ{12, 12};
    inline constexpr BitRange kDisplayWIN0{13, 13};
    inline constexpr BitRange kDisplayWIN1{14, 14};
    inline constexpr BitRange kDisplayOBJWIN{15, 15};
    inline constexpr BitRange kDisplayMode{16, 17};
    inline constexpr BitRange kVRAMBlock{18, 19};
    inline constexpr BitRange kObjTileBoundary{20, 21};
    inline constexpr BitRange kObjBitmapBoundary{22, 22};
    inline constexpr BitRange kObjDuringHBlank{23, 23};
    inline constexpr BitRange kTileDataBase{24, 26};
    inline constexpr BitRange kTileMapBase{27, 29};
    inline constexpr BitRange kBGExtPalette{30, 30};
    inline constexpr BitRange kObjExtPalette{31, 31};

    // Sub engine reserved positions
    inline constexpr BitRange kSubReserved3{3, 3};
    inline constexpr BitRange kSubReserved18_19{18, 19};
    inline constexpr BitRange kSubReserved22{22, 22};
    inline constexpr BitRange kSubReserved24_29{24, 29};

    inline constexpr uint32 kSubReservedMask =
        detail::Mask<uint32>(kSubReserved3) | detail::Mask<uint32>(kSubReserved18_19) |
        detail::Mask<uint32>(kSubReserved22) | detail::Mask<uint32>(kSubReserved24_29);

    // Fields present on both engines.
    template <typename TDisplayControl>
    FORCE_INLINE constexpr void ExtractCommon(TDisplayControl &ctl, uint32 raw) {
        ctl.bgMode = static_cast<uint8>(detail::Extract<kBGMode>(raw));
        ctl.objTileMapping = bit::test<kObjTileMapping.start>(raw);
        ctl.objBitmapDim = bit::test<kObjBitmapDim.start>(raw);
        ctl.objBitmapMapping = bit::test<kObjBitmapMapping.start>(raw);
        ctl.forcedBlank = bit::test<kForcedBlank.start>(raw);
        ctl.displayBG0 = bit::test<kDisplayBG0.start>(raw);
        ctl.displayBG1 = bit::test<kDisplayBG1.start>(raw);
        ctl.displayBG2 = bit::test<kDisplayBG2.start>(raw);
        ctl.displayBG3 = bit::test<kDisplayBG3.start>(raw);
        ctl.displayOBJ = bit::test<kDisplayOBJ.start>(raw);
        ctl.displayWIN0 = bit::test<kDisplayWIN0.start>(raw);
        ctl.displayWIN1 = bit::test<kDisplayWIN1.start>(raw);
        ctl.displayOBJWIN = bit::test<kDisplayOBJWIN.start>(raw);
        ctl.displayMode = static_cast<uint8>(detail::Extract<kDisplayMode>(raw));
        ctl.objTileBoundary = static_cast<uint8>(detail::Extract<kObjTileBoundary>(raw));
        ctl.objDuringHBlank = bit::test<kObjDuringHBlank.start>(raw);
        ctl.bgExtPalette = bit::test<kBGExtPalette.start>(raw);
        ctl.objExtPalette = bit::test<kObjExtPalette.start>(raw);
    }

    template <typename TDisplayControl>
    FORCE_INLINE constexpr void DepositCommon(const TDisplayControl &ctl, uint32 &raw) {
        detail::Deposit<kBGMode>(raw, ctl.bgMode);
        detail::Deposit<kObjTileMapping>(raw, ctl.objTileMapping);
        detail::Deposit<kObjBitmapDim>(raw, ctl.objBitmapDim);
        detail::Deposit<kObjBitmapMapping>(raw, ctl.objBitmapMapping);
        detail::Deposit<kForcedBlank>(raw, ctl.forcedBlank);
        detail::Deposit<kDisplayBG0>(raw, ctl.displayBG0);
        detail::Deposit<kDisplayBG1>(raw, ctl.displayBG1);
        detail::Deposit<kDisplayBG2>(raw, ctl.displayBG2);
        detail::Deposit<kDisplayBG3>(raw, ctl.displayBG3);
        detail::Deposit<kDisplayOBJ>(raw, ctl.displayOBJ);
        detail::Deposit<kDisplayWIN0>(raw, ctl.displayWIN0);
        detail::Deposit<kDisplayWIN1>(raw, ctl.displayWIN1);
        detail::Deposit<kDisplayOBJWIN>(raw, ctl.displayOBJWIN);
        detail::Deposit<kDisplayMode>(raw, ctl.displayMode);
        detail::Deposit<kObjTileBoundary>(raw, ctl.objTileBoundary);
        detail::Deposit<kObjDuringHBlank>(raw, ctl.objDuringHBlank);
        detail::Deposit<kBGExtPalette>(raw, ctl.bgExtPalette);
        detail::Deposit<kObjExtPalette>(raw, ctl.objExtPalette);
    }
} // namespace dispcnt

/// @brief Main engine display control (DISPCNT, engine A).
struct DisplayControlMain {
    static constexpr std::array<BitRange, 23> kLayout{
        dispcnt::kBGMode, dispcnt::kBG0As3D, dispcnt::kObjTileMapping, dispcnt::kObjBitmapDim,
        dispcnt::kObjBitmapMapping, dispcnt::kForcedBlank, dispcnt::kDisplayBG0, dispcnt::kDisplayBG1,
        dispcnt::kDisplayBG2, dispcnt::kDisplayBG3, dispcnt::kDisplayOBJ, dispcnt::kDisplayWIN0, dispcnt::kDisplayWIN1,
        dispcnt::kDisplayOBJWIN, dispcnt::kDisplayMode, dispcnt::kVRAMBlock, dispcnt::kObjTileBoundary,
        dispcnt::kObjBitmapBoundary, dispcnt::kObjDuringHBlank, dispcnt::kTileDataBase, dispcnt::kTileMapBase,
        dispcnt::kBGExtPalette, dispcnt::kObjExtPalette,
    };

    uint8 bgMode = 0;
    bool bg0As3D = false;
    bool objTileMapping = false;
    bool objBitmapDim = false;
    bool objBitmapMapping = false;
    bool forcedBlank = false;
    bool displayBG0 = false;
    bool displayBG1 = false;
    bool displayBG2 = false;
    bool displayBG3 = false;
    bool displayOBJ = false;
    bool displayWIN0 = false;
    bool displayWIN1 = false;
    bool displayOBJWIN = false;
    uint8 displayMode = 0;
    uint8 vramBlock = 0;
    uint8 objTileBoundary = 0;
    uint8 objBitmapBoundary = 0;
    bool objDuringHBlank = false;
    uint8 tileDataBase = 0;
    uint8 tileMapBase = 0;
    bool bgExtPalette = false;
    bool objExtPalette = false;

    [[nodiscard]] static constexpr DisplayControlMain FromU32(uint32 raw) {
        DisplayControlMain ctl{};
        dispcnt::ExtractCommon(ctl, raw);
        ctl.bg0As3D = bit::test<dispcnt::kBG0As3D.start>(raw);
        ctl.vramBlock = static_cast<uint8>(detail::Extract<dispcnt::kVRAMBlock>(raw));
        ctl.objBitmapBoundary = static_cast<uint8>(detail::Extract<dispcnt::kObjBitmapBoundary>(raw));
        ctl.tileDataBase = static_cast<uint8>(detail::Extract<dispcnt::kTileDataBase>(raw));
        ctl.tileMapBase = static_cast<uint8>(detail::Extract<dispcnt::kTileMapBase>(raw));
        return ctl;
    }

    [[nodiscard]] constexpr uint32 ToU32() const {
        uint32 raw = 0;
        dispcnt::DepositCommon(*this, raw);
        detail::Deposit<dispcnt::kBG0As3D>(raw, bg0As3D);
        detail::Deposit<dispcnt::kVRAMBlock>(raw, vramBlock);
        detail::Deposit<dispcnt::kObjBitmapBoundary>(raw, objBitmapBoundary);
        detail::Deposit<dispcnt::kTileDataBase>(raw, tileDataBase);
        detail::Deposit<dispcnt::kTileMapBase>(raw, tileMapBase);
        return raw;
    }

    [[nodiscard]] constexpr BGMode GetBGMode() const {
        return static_cast<BGMode>(bgMode);
    }
    constexpr void SetBGMode(BGMode mode) {
        bgMode = static_cast<uint8>(mode);
    }

    [[nodiscard]] constexpr DisplayMode GetDisplayMode() const {
        return static_cast<DisplayMode>(displayMode);
    }
    constexpr void SetDisplayMode(DisplayMode mode) {
        displayMode = static_cast<uint8>(mode);
    }

    [[nodiscard]] constexpr VRAMBlock GetVRAMBlock() const {
        return static_cast<VRAMBlock>(vramBlock);
    }
    constexpr void SetVRAMBlock(VRAMBlock block) {
        vramBlock = static_cast<uint8>(block);
    }

    constexpr void SetObjTileMapping(ObjTileMapping mapping) {
        objTileMapping = mapping == ObjTileMapping::OneDimensional;
    }
    constexpr void SetObjBitmapDim(ObjBitmapDim dim) {
        objBitmapDim = dim == ObjBitmapDim::Width256;
    }
    constexpr void SetObjBitmapMapping(ObjBitmapMapping mapping) {
        objBitmapMapping = mapping == ObjBitmapMapping::OneDimensional;
    }

    constexpr bool operator==(const DisplayControlMain &) const = default;
};

static_assert(detail::CoversExactly<uint32>(DisplayControlMain::kLayout), "DISPCNT (A) layout must cover 32 bits");

/// @brief Sub engine display control (DISPCNT, engine B).
///
/// Not interchangeable with `DisplayControlMain`: the positions of BG0_3D, VRAM_BLOCK, OBJ_BMP_BND, CHAR_BASE and
/// SCREEN_BASE are reserved on this engine. `reserved` keeps whatever `FromU32` found in those positions, in place, so
/// that a value read from the register writes back unchanged. It is zero for values built from fields.
struct DisplayControlSub {
    static constexpr std::array<BitRange, 22> kLayout{
        dispcnt::kBGMode, dispcnt::kSubReserved3, dispcnt::kObjTileMapping, dispcnt::kObjBitmapDim,
        dispcnt::kObjBitmapMapping, dispcnt::kForcedBlank, dispcnt::kDisplayBG0, dispcnt::kDisplayBG1,
        dispcnt::kDisplayBG2, dispcnt::kDisplayBG3, dispcnt::kDisplayOBJ, dispcnt::kDisplayWIN0, dispcnt::kDisplayWIN1,
        dispcnt::kDisplayOBJWIN, dispcnt::kDisplayMode, dispcnt::kSubReserved18_19, dispcnt::kObjTileBoundary,
        dispcnt::kSubReserved22, dispcnt::kObjDuringHBlank, dispcnt::kSubReserved24_29, dispcnt::kBGExtPalette,
        dispcnt::kObjExtPalette,
    };

    uint8 bgMode = 0;
    bool objTileMapping = false;
    bool objBitmapDim = false;
    bool objBitmapMapping = false;
    bool forcedBlank = false;
    bool displayBG0 = false;
    bool displayBG1 = false;
    bool displayBG2 = false;
    bool displayBG3 = false;
    bool displayOBJ = false;
    bool displayWIN0 = false;
    bool displayWIN1 = false;
    bool displayOBJWIN = false;
    uint8 displayMode = 0;
    uint8 objTileBoundary = 0;
    bool objDuringHBlank = false;
    bool bgExtPalette = false;
    bool objExtPalette = false;
    uint32 reserved = 0; ///< Reserved bits at their register positions (masked by `dispcnt::kSubReservedMask`)

    [[nodiscard]] static constexpr DisplayControlSub FromU32(uint32 raw) {
        DisplayControlSub ctl{};
        dispcnt::ExtractCommon(ctl, raw);
        ctl.reserved = raw & dispcnt::kSubReservedMask;
        return ctl;
    }

    [[nodiscard]] constexpr uint32 ToU32() const {
        uint32 raw = reserved & dispcnt::kSubReservedMask;
        dispcnt::DepositCommon(*this, raw);
        return raw;
    }

    [[nodiscard]] constexpr BGMode GetBGMode() const {
        return static_cast<BGMode>(bgMode);
    }
    constexpr void SetBGMode(BGMode mode) {
        bgMode = static_cast<uint8>(mode);
    }

    [[nodiscard]] constexpr DisplayMode GetDisplayMode() const {
        return static_cast<DisplayMode>(displayMode);
    }
    constexpr void SetDisplayMode(DisplayMode mode) {
        displayMode = static_cast<uint8>(mode);
    }

    constexpr void SetObjTileMapping(ObjTileMapping mapping) {
        objTileMapping = mapping == ObjTileMapping::OneDimensional;
    }
    constexpr void SetObjBitmapDim(ObjBitmapDim dim) {
        objBitmapDim = dim == ObjBitmapDim::Width256;
    }
    constexpr void SetObjBitmapMapping(ObjBitmapMapping mapping) {
        objBitmapMapping = mapping == ObjBitmapMapping::OneDimensional;
    }

    constexpr bool operator==(const DisplayControlSub &) const = default;
};

static_assert(detail::CoversExactly<uint32>(DisplayControlSub::kLayout), "DISPCNT (B) layout must cover 32 bits");

// -----------------------------------------------------------------------------
// BGxCNT

// addr     r/w  access  code               name
// 4000008  R/W  16      BG0CNT..BG3CNT (A) Background Control (main engine)
// 4001008  R/W  16      BG0CNT..BG3CNT (B) Background Control (sub engine)
//
//   bits   r/w  code         description
//    1-0   R/W  PRIO         Priority (0=highest, rendered above higher values)
//    5-2   R/W  CHAR_BASE    Tile data base (16 KiB steps)
//      6   R/W  MOSAIC       Mosaic enable
//      7   R/W  COLORS       Palette mode (see PaletteMode)
//   12-8   R/W  SCREEN_BASE  Tile map base (2 KiB steps)
//     13   R/W  EXT_SLOT     BG0/BG1: extended palette slot (see ExtPaletteSlot)
//          R/W  OVERFLOW     BG2/BG3: display area overflow (see AreaOverflow)
//  15-14   R/W  SIZE         Screen size
struct BackgroundControl {
    static constexpr BitRange kPriority{0, 1};
    static constexpr BitRange kTileDataBase{2, 5};
    static constexpr BitRange kMosaic{6, 6};
    static constexpr BitRange kPaletteMode{7, 7};
    static constexpr BitRange kTileMapBase{8, 12};
    static constexpr BitRange kBit13{13, 13};
    static constexpr BitRange kScreenSize{14, 15};

    static constexpr std::array<BitRange, 7> kLayout{
        kPriority, kTileDataBase, kMosaic, kPaletteMode, kTileMapBase, kBit13, kScreenSize,
    };

    uint8 priority = 0;
    uint8 tileDataBase = 0;
    bool mosaic = false;
    uint8 paletteMode = 0;
    uint8 tileMapBase = 0;
    uint8 bit13 = 0; // meaning depends on the layer, see ExtPaletteSlot and AreaOverflow
    uint8 screenSize = 0;

    [[nodiscard]] static constexpr BackgroundControl FromU16(uint16 raw) {
        BackgroundControl ctl{};
        ctl.priority = static_cast<uint8>(detail::Extract<kPriority>(raw));
        ctl.tileDataBase = static_cast<uint8>(detail::Extract<kTileDataBase>(raw));
        ctl.mosaic = bit::test<kMosaic.start>(raw);
        ctl.paletteMode = static_cast<uint8>(detail::Extract<kPaletteMode>(raw));
        ctl.tileMapBase = static_cast<uint8>(detail::Extract<kTileMapBase>(raw));
        ctl.bit13 = static_cast<uint8>(detail::Extract<kBit13>(raw));
        ctl.screenSize = static_cast<uint8>(detail::Extract<kScreenSize>(raw));
        return ctl;
    }

    [[nodiscard]] constexpr uint16 ToU16() const {
        uint16 raw = 0;
        detail::Deposit<kPriority>(raw, priority);
        detail::Deposit<kTileDataBase>(raw, tileDataBase);
        detail::Deposit<kMosaic>(raw, mosaic);
        detail::Deposit<kPaletteMode>(raw, paletteMode);
        detail::Deposit<kTileMapBase>(raw, tileMapBase);
        detail::Deposit<kBit13>(raw, bit13);
        detail::Deposit<kScreenSize>(raw, screenSize);
        return raw;
    }

    [[nodiscard]] constexpr PaletteMode GetPaletteMode() const {
        return static_cast<PaletteMode>(paletteMode);
    }
    constexpr void SetPaletteMode(PaletteMode mode) {
        paletteMode = static_cast<uint8>(mode);
    }

    // Only meaningful on BG0 and BG1.
    [[nodiscard]] constexpr ExtPaletteSlot GetExtPaletteSlot() const {
        return static_cast<ExtPaletteSlot>(bit13);
    }
    constexpr void SetExtPaletteSlot(ExtPaletteSlot slot) {
        bit13 = static_cast<uint8>(slot);
    }

    // Only meaningful on BG2 and BG3.
    [[nodiscard]] constexpr AreaOverflow GetAreaOverflow() const {
        return static_cast<AreaOverflow>(bit13);
    }
    constexpr void SetAreaOverflow(AreaOverflow overflow) {
        bit13 = static_cast<uint8>(overflow);
    }

    constexpr bool operator==(const BackgroundControl &) const = default;
};

static_assert(detail::CoversExactly<uint16>(BackgroundControl::kLayout), "BGxCNT layout must cover 16 bits");

} // namespace nitro::video
