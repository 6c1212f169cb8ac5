#pragma once

#include <algorithm>
#include <array>
#include <cstddef>
#include <string_view>
#include "meta/helpers.hpp"

namespace TftpWire::MyBuf {
    template <Meta::OctetKind T>
    class BufferView {
    private:
        const T* m_ptr;
        std::size_t m_length;

    public:
        constexpr BufferView() noexcept
        : m_ptr {nullptr}, m_length {0UL} {}

        constexpr BufferView(const T* ptr, std::size_t length) noexcept
        : m_ptr {ptr}, m_length {(ptr != nullptr) ? length : 0UL} {}

        [[nodiscard]] constexpr std::size_t getLength() const noexcept {
            return m_length;
        }

        [[nodiscard]] constexpr bool isEmpty() const noexcept {
            return m_length == 0UL;
        }

        /// @note Unchecked, callers test `getLength()` first.
        [[nodiscard]] constexpr T operator[](std::size_t index) const noexcept {
            return m_ptr[index];
        }

        [[nodiscard]] constexpr const T* begin() const noexcept {
            return m_ptr;
        }

        [[nodiscard]] constexpr const T* end() const noexcept {
            return m_ptr + m_length;
        }

        /// @brief Returns the first `n` octets, clamped to the view length.
        [[nodiscard]] constexpr BufferView takeFront(std::size_t n) const noexcept {
            const auto count = std::min(n, m_length);

            return { m_ptr, count };
        }

        /// @brief Returns the view past the first `n` octets, empty if `n` exceeds the length.
        [[nodiscard]] constexpr BufferView dropFront(std::size_t n) const noexcept {
            if (n >= m_length) {
                return { m_ptr + m_length, 0UL };
            }

            return { m_ptr + n, m_length - n };
        }

        [[nodiscard]] constexpr bool operator==(const BufferView& other) const noexcept {
            if (getLength() != other.getLength()) {
                return false;
            }

            if (isEmpty()) {
                return true;
            }

            return std::equal(begin(), end(), other.begin());
        }

        [[nodiscard]] constexpr bool operator==(std::string_view ascii_view) const noexcept {
            if (getLength() != ascii_view.length()) {
                return false;
            }

            return std::equal(begin(), end(), ascii_view.begin(), [](T lhs, char rhs) {
                return static_cast<unsigned char>(lhs) == static_cast<unsigned char>(rhs);
            });
        }
    };

    template <Meta::OctetKind T, std::size_t N> requires (N > 0UL)
    class FixedBuffer {
    private:
        std::array<T, N> m_data;
        std::size_t m_length;

    public:
        constexpr FixedBuffer() noexcept
        : m_data {}, m_length {0UL} {
            reset();
        }

        [[nodiscard]] constexpr const T* viewPtr() const noexcept {
            return m_data.data();
        }

        [[nodiscard]] constexpr std::size_t getLength() const noexcept {
            return m_length;
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

        constexpr void reset() noexcept {
            std::fill(m_data.begin(), m_data.end(), T {});
            m_length = 0UL;
        }

        /// @brief Views the logical contents, i.e. the first `getLength()` octets.
        friend constexpr BufferView<T> makeView(const FixedBuffer& buffer) noexcept {
            return { buffer.viewPtr(), buffer.getLength() };
        }
    };
}
