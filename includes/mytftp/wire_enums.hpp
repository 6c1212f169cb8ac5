#pragma once

#include <optional>
#include <string_view>
#include "mytftp/types.hpp"

namespace TftpWire::MyTftp {
    [[nodiscard]] std::optional<Opcode> toOpcode(tftp_u16 raw) noexcept;
    [[nodiscard]] constexpr tftp_u16 toOpcodeValue(Opcode op) noexcept {
        return static_cast<tftp_u16>(op);
    }
    [[nodiscard]] std::string_view toOpcodeName(Opcode op) noexcept;

    /// @note Matching is exact and case-sensitive: "OCTET" is not a mode.
    [[nodiscard]] std::optional<DataMode> toFileMode(std::string_view name) noexcept;
    [[nodiscard]] std::string_view toFileModeName(DataMode mode) noexcept;

    [[nodiscard]] std::optional<ErrorCode> toErrorCode(tftp_u16 raw) noexcept;
    [[nodiscard]] constexpr tftp_u16 toErrorCodeValue(ErrorCode errcode) noexcept {
        return static_cast<tftp_u16>(errcode);
    }

    /// @brief Gives the RFC 1350 description of an error code, for callers composing ERROR replies.
    [[nodiscard]] std::string_view toErrorMsg(ErrorCode errcode) noexcept;
}
