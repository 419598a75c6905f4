#pragma once

/**
@file
@brief Graphics engine definitions shared by the register types and operations.
*/

#include <nitro/core/types.hpp>

#include <nitro/util/bitmask_enum.hpp>

namespace nitro::video {

inline constexpr uint32 kBGLayers = 4;

inline constexpr sint32 kMaxBrightness = 16;

inline constexpr uint16 kVisibleLines = 192;
inline constexpr uint16 kVCountLines = 263;

// -----------------------------------------------------------------------------
// POWCNT1

/// @brief Graphics subsystems switched by the power control register (POWCNT1).
///
/// Used with `PowerOn` and `PowerOff`. Combine flags with `|`, remove them with `a & ~b` and query them with
/// `BitmaskEnum`.
enum class GfxPwr : uint32 {
    None = 0,

    Main2D = 1u << 1,     ///< 2D graphics engine A
    Render3D = 1u << 2,   ///< 3D rendering engine
    Geometry3D = 1u << 3, ///< 3D geometry engine
    Sub2D = 1u << 9,      ///< 2D graphics engine B

    All2D = Main2D | Sub2D,
    All = All2D | Render3D | Geometry3D,
};

/// @brief Physical screen driven by the main engine (POWCNT1 bit 15).
enum class MainEnginePos : uint32 {
    Top = 1u << 15,
    Bottom = 0,
};

/// @brief Selects a graphics engine by the offset between its register block and the main engine's.
enum class GfxEngine : uint32 {
    Main = 0x0000,
    Sub = 0x1000,
};

// -----------------------------------------------------------------------------
// DISPCNT

/// @brief Background modes (DISPCNT bits 0-2).
///
/// Names list the type of BG0, BG1, BG2 and BG3. The sub engine does not support mode 6.
enum class BGMode : uint8 {
    Text4 = 0,            ///< Text, Text, Text, Text
    Text3Affine1 = 1,     ///< Text, Text, Text, Affine
    Text2Affine2 = 2,     ///< Text, Text, Affine, Affine
    Text3Extended1 = 3,   ///< Text, Text, Text, Extended
    Text2Affine1Ext1 = 4, ///< Text, Text, Affine, Extended
    Text2Extended2 = 5,   ///< Text, Text, Extended, Extended
    Large = 6,            ///< 3D, -, Large bitmap, - (main engine only)
};

/// @brief Display modes (DISPCNT bits 16-17). The sub engine only supports `Off` and `Normal`.
enum class DisplayMode : uint8 {
    Off = 0,        ///< Screen becomes white
    Normal = 1,     ///< Graphics display
    VRAM = 2,       ///< Display a VRAM bank as a bitmap (main engine only)
    MainMemory = 3, ///< Display from main memory via DMA (main engine only)
};

/// @brief VRAM bank displayed in `DisplayMode::VRAM` (DISPCNT bits 18-19).
enum class VRAMBlock : uint8 { A = 0, B = 1, C = 2, D = 3 };

/// @brief Tile object mapping (DISPCNT bit 4).
enum class ObjTileMapping : uint8 { TwoDimensional = 0, OneDimensional = 1 };

/// @brief Bitmap object 2D dimension (DISPCNT bit 5).
enum class ObjBitmapDim : uint8 { Width128 = 0, Width256 = 1 };

/// @brief Bitmap object mapping (DISPCNT bit 6).
enum class ObjBitmapMapping : uint8 { TwoDimensional = 0, OneDimensional = 1 };

// -----------------------------------------------------------------------------
// BGxCNT

/// @brief Palette modes (BGxCNT bit 7).
enum class PaletteMode : uint8 {
    Colors16x16 = 0, ///< 16 palettes of 16 colors
    Colors256x1 = 1, ///< 1 palette of 256 colors
};

/// @brief Behavior of BGxCNT bit 13 on BG2 and BG3.
enum class AreaOverflow : uint8 { Transparent = 0, Wraparound = 1 };

/// @brief Behavior of BGxCNT bit 13 on BG0 and BG1: selects the extended palette slot.
enum class ExtPaletteSlot : uint8 {
    Default = 0,   ///< BG0 uses slot 0, BG1 uses slot 1
    Alternate = 1, ///< BG0 uses slot 2, BG1 uses slot 3
};

// -----------------------------------------------------------------------------
// MASTER_BRIGHT

/// @brief Master brightness modes (MASTER_BRIGHT bits 14-15).
enum class BrightnessMode : uint8 {
    None = 0,
    Up = 1,   ///< Fade towards white
    Down = 2, ///< Fade towards black
};

} // namespace nitro::video

ENABLE_BITMASK_OPERATORS(nitro::video::GfxPwr)
