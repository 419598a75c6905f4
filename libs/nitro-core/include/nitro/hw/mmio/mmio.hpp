#pragma once

/**
@file
@brief Volatile access to memory-mapped I/O registers.

Every register operation in the library reaches the hardware through `mmio::Read` and `mmio::Write`. Each call is a
single volatile load or store: the compiler can neither elide it, merge it with another access nor reorder it relative
to other volatile accesses.

Register operations are written against the `RegisterSpace` concept rather than against raw addresses. On hardware,
`IOSpace{}` maps the real I/O block at `kIORegsBase`. On a host, `IOSpace{buffer}` maps an ordinary buffer laid out like
the I/O block, and tests may provide any other type that satisfies the concept.
*/

#include "mmio_defs.hpp"

#include <nitro/hw/hw_defs.hpp>

#include <nitro/util/dev_assert.hpp>
#include <nitro/util/inline.hpp>

#include <concepts>

namespace nitro::mmio {

/// @brief Performs one volatile load of a `T` from the given address.
template <mem_primitive T>
[[nodiscard]] FORCE_INLINE T Read(uintptr address) {
    return *reinterpret_cast<const volatile T *>(address);
}

/// @brief Performs one volatile store of a `T` to the given address.
template <mem_primitive T>
FORCE_INLINE void Write(uintptr address, T value) {
    *reinterpret_cast<volatile T *>(address) = value;
}

/// @brief A space in which registers can be read and written by physical address.
///
/// Implementations must perform exactly one access per call.
template <typename T>
concept RegisterSpace = requires(const T &space, uint32 address, uint16 value16, uint32 value32) {
    { space.template Read<uint16>(address) } -> std::same_as<uint16>;
    { space.template Read<uint32>(address) } -> std::same_as<uint32>;
    space.template Write<uint16>(address, value16);
    space.template Write<uint32>(address, value32);
};

/// @brief A window onto the I/O register block.
class IOSpace {
public:
    /// @brief Maps the hardware I/O register block.
    constexpr IOSpace() = default;

    /// @brief Maps a buffer of at least `kIORegsSize` bytes standing in for the I/O register block.
    ///
    /// The buffer must be aligned to 4 bytes.
    explicit IOSpace(void *window)
        : m_base(reinterpret_cast<uintptr>(window)) {}

    template <mem_primitive T>
    [[nodiscard]] FORCE_INLINE T Read(uint32 address) const {
        return mmio::Read<T>(Translate<T>(address));
    }

    template <mem_primitive T>
    FORCE_INLINE void Write(uint32 address, T value) const {
        mmio::Write<T>(Translate<T>(address), value);
    }

private:
    uintptr m_base = kIORegsBase;

    template <mem_primitive T>
    [[nodiscard]] FORCE_INLINE uintptr Translate(uint32 address) const {
        NITRO_DEV_ASSERT(address >= kIORegsBase && address - kIORegsBase + sizeof(T) <= kIORegsSize);
        NITRO_DEV_ASSERT((address & (sizeof(T) - 1)) == 0);
        return m_base + (address - kIORegsBase);
    }
};

static_assert(RegisterSpace<IOSpace>);

} // namespace nitro::mmio
