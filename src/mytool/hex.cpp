#include <string>
#include <variant>
#include "meta/helpers.hpp"
#include "mytftp/codec.hpp"
#include "mytftp/wire_enums.hpp"
#include "mytool/hex.hpp"

namespace TftpWire::MyTool {
    static constexpr std::string_view hex_digits = "0123456789abcdef";
    static constexpr auto nibble_dud = -1;

    [[nodiscard]] static constexpr int toNibble(char c) noexcept {
        if (c >= '0' and c <= '9') {
            return c - '0';
        } else if (c >= 'a' and c <= 'f') {
            return c - 'a' + 10;
        } else if (c >= 'A' and c <= 'F') {
            return c - 'A' + 10;
        }

        return nibble_dud;
    }

    std::optional<MyTftp::Blob> hexToBytes(std::string_view text) {
        MyTftp::Blob temp;
        auto pending_hi = nibble_dud;

        for (const auto c : text) {
            if (c == ' ') {
                if (pending_hi != nibble_dud) {
                    return {};
                }

                continue;
            }

            const auto nibble = toNibble(c);

            if (nibble == nibble_dud) {
                return {};
            }

            if (pending_hi == nibble_dud) {
                pending_hi = nibble;
            } else {
                temp.push_back(static_cast<MyTftp::tftp_u8>((pending_hi << 4) | nibble));
                pending_hi = nibble_dud;
            }
        }

        if (pending_hi != nibble_dud) {
            return {};
        }

        return temp;
    }

    std::string bytesToHex(MyTftp::ByteView bytes) {
        std::string temp;
        temp.reserve(bytes.getLength() * 2);

        for (const auto octet : bytes) {
            temp += hex_digits[octet >> 4];
            temp += hex_digits[octet & 0x0F];
        }

        return temp;
    }

    std::string describePacket(const MyTftp::Packet& packet) {
        using namespace MyTftp;

        const std::string opcode_name {toOpcodeName(opcodeOf(packet))};

        return std::visit(Meta::Overloaded {
            [&opcode_name](const RrqPayload& payload) {
                return opcode_name + " filename=\"" + payload.filename + "\" mode=" + std::string {toFileModeName(payload.mode)};
            },
            [&opcode_name](const WrqPayload& payload) {
                return opcode_name + " filename=\"" + payload.filename + "\" mode=" + std::string {toFileModeName(payload.mode)};
            },
            [&opcode_name](const DataPayload& payload) {
                return opcode_name + " block=" + std::to_string(payload.block_n) + " size=" + std::to_string(payload.data.size());
            },
            [&opcode_name](const AckPayload& payload) {
                return opcode_name + " block=" + std::to_string(payload.block_n);
            },
            [&opcode_name](const ErrorPayload& payload) {
                return opcode_name + " code=" + std::to_string(toErrorCodeValue(payload.error))
                    + " (" + std::string {toErrorMsg(payload.error)} + ") msg=\"" + payload.message + "\"";
            }
        }, packet);
    }
}
