#pragma once

#include <algorithm>
#include <array>
#include <cstddef>
#include "meta/helpers.hpp"

namespace WindTftp::MyBSock {
    /// @note Largest UDP payload an IPv4 datagram can carry.
    inline constexpr auto udp_payload_limit = 65507UL;

    template <Meta::OctetKind T, std::size_t N> requires (N > 0UL)
    class FixedBuffer {
    private:
        std::array<T, N> m_data;
        std::size_t m_length;

    public:
        constexpr FixedBuffer() noexcept
        : m_data {}, m_length {0UL} {}

        [[nodiscard]] T* viewPtr() noexcept {
            return m_data.data();
        }

        [[nodiscard]] const T* viewPtr() const noexcept {
            return m_data.data();
        }

        [[nodiscard]] constexpr std::size_t getLength() const noexcept {
            return m_length;
        }

        void markLength(std::size_t length) noexcept {
            m_length = std::min(length, N);
        }

        [[nodiscard]] constexpr std::size_t getSize() const noexcept {
            return N;
        }

        [[nodiscard]] constexpr bool isEmpty() const noexcept {
            return m_length == 0UL;
        }

        [[nodiscard]] constexpr bool isFull() const noexcept {
            return m_length >= N;
        }

        [[nodiscard]] bool appendOctet(T octet) {
            if (isFull()) {
                return false;
            }

            m_data[m_length++] = octet;

            return true;
        }

        /// @note Only forgets the contents: the octets stay until overwritten.
        constexpr void reset() noexcept {
            m_length = 0UL;
        }
    };

    using DatagramBuffer = FixedBuffer<unsigned char, udp_payload_limit>;
}
