#pragma once

#include <cstddef>
#include <optional>
#include "meta/helpers.hpp"
#include "mybuf/buffers.hpp"

namespace TftpWire::MyBuf {
    inline constexpr auto u16_size = 2UL;
    inline constexpr auto delim_size = 1UL;

    /// NOTE: every cursor step yields the consumed value and the view left after it, never a position.
    template <typename DataType, typename T>
    struct HelperResult {
        DataType data;
        BufferView<T> remaining;
    };

    template <Meta::OctetKind T>
    [[nodiscard]] constexpr std::optional<HelperResult<unsigned short, T>> takeU16(BufferView<T> input) noexcept {
        if (input.getLength() < u16_size) {
            return {};
        }

        const auto hi = static_cast<unsigned char>(input[0]);
        const auto lo = static_cast<unsigned char>(input[1]);
        const auto value = static_cast<unsigned short>((hi << 8) | lo);

        return HelperResult<unsigned short, T> {value, input.dropFront(u16_size)};
    }

    template <Meta::OctetKind T>
    [[nodiscard]] constexpr std::optional<HelperResult<BufferView<T>, T>> takeUntilNull(BufferView<T> input) noexcept {
        const auto input_len = input.getLength();
        auto scan_offset = 0UL;

        for (; scan_offset < input_len; scan_offset++) {
            if (input[scan_offset] == T {}) {
                break;
            }
        }

        if (scan_offset == input_len) {
            return {};
        }

        /// NOTE: +1 past the offset since 0 only delimits TFTP strings and is not part of the value.
        return HelperResult<BufferView<T>, T> {
            input.takeFront(scan_offset),
            input.dropFront(scan_offset + delim_size)
        };
    }
}
