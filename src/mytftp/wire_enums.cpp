#include <array>
#include <cstddef>
#include "mytftp/wire_enums.hpp"

namespace TftpWire::MyTftp {
    static constexpr auto opcode_count = static_cast<std::size_t>(Opcode::last);
    static constexpr auto mode_count = static_cast<std::size_t>(DataMode::last) + 1;
    static constexpr auto errcode_count = static_cast<std::size_t>(ErrorCode::last) + 1;

    static constexpr std::array<std::string_view, opcode_count> opcode_names = {
        "RRQ",
        "WRQ",
        "DATA",
        "ACK",
        "ERROR"
    };

    static constexpr std::array<std::string_view, mode_count> mode_names = {
        "netascii",
        "octet",
        "mail"
    };

    static constexpr std::array<std::string_view, errcode_count> errcode_msgs = {
        "Not defined, see error message",
        "File not found",
        "Access violation",
        "Disk full or allocation exceeded",
        "Illegal TFTP operation",
        "Unknown transfer ID",
        "File already exists",
        "No such user"
    };

    std::optional<Opcode> toOpcode(tftp_u16 raw) noexcept {
        if (raw < toOpcodeValue(Opcode::first) or raw > toOpcodeValue(Opcode::last)) {
            return {};
        }

        return static_cast<Opcode>(raw);
    }

    std::string_view toOpcodeName(Opcode op) noexcept {
        return opcode_names[toOpcodeValue(op) - toOpcodeValue(Opcode::first)];
    }

    std::optional<DataMode> toFileMode(std::string_view name) noexcept {
        for (auto mode_n = 0UL; mode_n < mode_count; mode_n++) {
            if (mode_names[mode_n] == name) {
                return static_cast<DataMode>(mode_n);
            }
        }

        return {};
    }

    std::string_view toFileModeName(DataMode mode) noexcept {
        return mode_names[static_cast<std::size_t>(mode)];
    }

    std::optional<ErrorCode> toErrorCode(tftp_u16 raw) noexcept {
        if (raw > toErrorCodeValue(ErrorCode::last)) {
            return {};
        }

        return static_cast<ErrorCode>(raw);
    }

    std::string_view toErrorMsg(ErrorCode errcode) noexcept {
        return errcode_msgs[toErrorCodeValue(errcode)];
    }
}
