#pragma once

#include <type_traits>
#include <concepts>
#include <cstddef>
#include <cstdint>

namespace WindTftp::Meta {
    template <typename T>
    concept OctetKind = std::is_same_v<T, char> or std::is_same_v<T, unsigned char>;

    /// @note Distance from `from` forward to `to` on the 16-bit block number circle.
    [[nodiscard]] constexpr std::uint16_t wrappingDistance(std::uint16_t from, std::uint16_t to) noexcept {
        return static_cast<std::uint16_t>(to - from);
    }

    [[nodiscard]] constexpr std::uint16_t wrappingAdd(std::uint16_t value, std::size_t delta) noexcept {
        return static_cast<std::uint16_t>(value + delta);
    }
}
