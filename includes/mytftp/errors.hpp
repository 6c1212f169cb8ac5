#pragma once

#include <string>
#include <variant>
#include "mytftp/types.hpp"

namespace TftpWire::MyTftp {
    /// @brief Malformed field content: bad UTF-8, a missing terminator, an unknown mode or error code, or a truncated field.
    struct InvalidPacket {
        std::string message;

        [[nodiscard]] bool operator==(const InvalidPacket& other) const = default;
    };

    /// @brief Size violation for DATA or ACK, carries the expected length.
    struct InvalidPacketLength {
        tftp_u16 expected;

        [[nodiscard]] bool operator==(const InvalidPacketLength& other) const = default;
    };

    /// @brief Missing, short, or unknown opcode field.
    struct InvalidOpcode {
        std::string message;

        [[nodiscard]] bool operator==(const InvalidOpcode& other) const = default;
    };

    using PacketError = std::variant<InvalidPacket, InvalidPacketLength, InvalidOpcode>;

    [[nodiscard]] std::string toString(const PacketError& error);
}
