#pragma once

/**
@file
@brief Type-safe enum class bitmasks

To enable enum classes to be used as bitmasks, use the `ENABLE_BITMASK_OPERATORS(x)` macro:

```cpp
enum class Units : uint32 {
    None  = 0,
    Left  = 1u << 0,
    Right = 1u << 3,
};
ENABLE_BITMASK_OPERATORS(Units)
```

From then on, `Units` values can be combined with `|`, intersected with `&` and removed from each other with `a & ~b`.

The macro must be used at the global namespace scope. For types living under a namespace, pass the qualified name:

```cpp
namespace ns {
    enum class Units : uint32 { ... };
}
ENABLE_BITMASK_OPERATORS(ns::Units)
```

Wrap a value in `BitmaskEnum` for set queries:

```cpp
auto units = BitmaskEnum(current);
if (units.AllOf(Units::Left | Units::Right)) { ... } // both set
if (units.AnyOf(Units::Left | Units::Right)) { ... } // at least one set
if (units.NoneOf(Units::Right)) { ... }              // Right is clear
```
*/

#include <type_traits>

/// @brief Enables usage of bitwise operators with type `x`.
///
/// @param x the enum type
#define ENABLE_BITMASK_OPERATORS(x)      \
    template <>                          \
    struct is_bitmask_enum<x> {          \
        static const bool enable = true; \
    };

/// @brief Identifies enumerable types.
/// @tparam T the type to check
template <typename T>
concept Enumerable = std::is_enum_v<T>;

/// @brief Enables or disables bitwise operators for type `Enum`.
///
/// Disabled by default. Use `ENABLE_BITMASK_OPERATORS(x)` to enable them for a type.
///
/// @tparam Enum the enum type
template <Enumerable Enum>
struct is_bitmask_enum {
    static constexpr bool enable = false;
};

/// @brief Identifies enum types with bitwise operators enabled.
/// @tparam Enum the enum type
template <class Enum>
concept BitmaskType = is_bitmask_enum<Enum>::enable;

// ----- Bitwise operators ----------------------------------------------------

template <BitmaskType Enum>
constexpr Enum operator|(Enum lhs, Enum rhs) noexcept {
    using underlying = std::underlying_type_t<Enum>;
    return static_cast<Enum>(static_cast<underlying>(lhs) | static_cast<underlying>(rhs));
}

template <BitmaskType Enum>
constexpr Enum operator&(Enum lhs, Enum rhs) noexcept {
    using underlying = std::underlying_type_t<Enum>;
    return static_cast<Enum>(static_cast<underlying>(lhs) & static_cast<underlying>(rhs));
}

template <BitmaskType Enum>
constexpr Enum operator^(Enum lhs, Enum rhs) noexcept {
    using underlying = std::underlying_type_t<Enum>;
    return static_cast<Enum>(static_cast<underlying>(lhs) ^ static_cast<underlying>(rhs));
}

template <BitmaskType Enum>
constexpr Enum operator~(Enum value) noexcept {
    using underlying = std::underlying_type_t<Enum>;
    return static_cast<Enum>(~static_cast<underlying>(value));
}

template <BitmaskType Enum>
constexpr Enum &operator|=(Enum &lhs, Enum rhs) noexcept {
    lhs = lhs | rhs;
    return lhs;
}

template <BitmaskType Enum>
constexpr Enum &operator&=(Enum &lhs, Enum rhs) noexcept {
    lhs = lhs & rhs;
    return lhs;
}

template <BitmaskType Enum>
constexpr Enum &operator^=(Enum &lhs, Enum rhs) noexcept {
    lhs = lhs ^ rhs;
    return lhs;
}

// ----- Bitwise mask checks --------------------------------------------------

/// @brief Wraps the enumerated type `Enum` to simplify bitmask queries.
/// @tparam Enum the enum type
template <BitmaskType Enum>
struct BitmaskEnum {
    /// @brief The bitmask enum value.
    const Enum value;

    /// @brief An empty bitmask of the `Enum` type.
    static constexpr Enum none = static_cast<Enum>(0);

    constexpr BitmaskEnum(Enum value) noexcept
        : value(value) {}

    constexpr operator Enum() const noexcept {
        return value;
    }

    /// @brief Returns true if any bit is set.
    [[nodiscard]] constexpr bool Any() const noexcept {
        return value != none;
    }

    /// @brief Returns true if all bits are clear.
    [[nodiscard]] constexpr bool None() const noexcept {
        return value == none;
    }

    /// @brief Returns true if any bit in the given mask is set.
    [[nodiscard]] constexpr bool AnyOf(Enum mask) const noexcept {
        return (value & mask) != none;
    }

    /// @brief Returns true if all bits in the given mask are set.
    [[nodiscard]] constexpr bool AllOf(Enum mask) const noexcept {
        return (value & mask) == mask;
    }

    /// @brief Returns true if no bit in the given mask is set.
    [[nodiscard]] constexpr bool NoneOf(Enum mask) const noexcept {
        return (value & mask) == none;
    }
};
