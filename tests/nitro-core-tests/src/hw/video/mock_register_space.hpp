#pragma once

#include <nitro/hw/hw_defs.hpp>

#include <nitro/core/types.hpp>

#include <fmt/format.h>

#include <map>
#include <ostream>
#include <vector>

namespace video_test {

// In-memory register space that records every access.
struct MockRegisterSpace {
    struct Access {
        bool write;
        uint32 address;
        uint32 size;
        uint32 value;

        constexpr bool operator==(const Access &) const = default;
    };

    static constexpr Access Load(uint32 address, uint32 size, uint32 value) {
        return {false, address, size, value};
    }

    static constexpr Access Store(uint32 address, uint32 size, uint32 value) {
        return {true, address, size, value};
    }

    mutable std::map<uint32, uint8> memory;
    mutable std::vector<Access> accesses;

    template <nitro::mem_primitive T>
    T Read(uint32 address) const {
        const T value = Peek<T>(address);
        accesses.push_back(Load(address, sizeof(T), value));
        return value;
    }

    template <nitro::mem_primitive T>
    void Write(uint32 address, T value) const {
        Poke<T>(address, value);
        accesses.push_back(Store(address, sizeof(T), value));
    }

    // Reads memory without recording an access.
    template <nitro::mem_primitive T>
    T Peek(uint32 address) const {
        uint32 value = 0;
        for (uint32 i = 0; i < sizeof(T); i++) {
            if (auto it = memory.find(address + i); it != memory.end()) {
                value |= static_cast<uint32>(it->second) << (i * 8);
            }
        }
        return static_cast<T>(value);
    }

    // Writes memory without recording an access.
    template <nitro::mem_primitive T>
    void Poke(uint32 address, T value) const {
        for (uint32 i = 0; i < sizeof(T); i++) {
            memory[address + i] = static_cast<uint8>(static_cast<uint32>(value) >> (i * 8));
        }
    }

    void ClearCaptures() const {
        accesses.clear();
    }
};

inline std::ostream &operator<<(std::ostream &os, const MockRegisterSpace::Access &access) {
    os << fmt::format("{}{}[{:08X}]={:0{}X}", (access.write ? "W" : "R"), access.size * 8, access.address, access.value,
                      access.size * 2);
    return os;
}

} // namespace video_test
