#pragma once

#include <cstddef>
#include <expected>
#include <string_view>
#include <variant>
#include "meta/helpers.hpp"
#include "mybuf/buffers.hpp"
#include "mytftp/types.hpp"
#include "mytftp/errors.hpp"
#include "mytftp/wire_enums.hpp"

namespace TftpWire::MyTftp {
    [[nodiscard]] std::expected<Packet, PacketError> decode(ByteView bytes);

    template <std::size_t N>
    [[nodiscard]] std::expected<Packet, PacketError> decode(const MyBuf::FixedBuffer<tftp_u8, N>& source) {
        return decode(makeView(source));
    }

    [[nodiscard]] Blob encode(const Packet& packet);

    [[nodiscard]] std::size_t encodedSize(const Packet& packet) noexcept;

    [[nodiscard]] Opcode opcodeOf(const Packet& packet) noexcept;

    template <Meta::OctetSink Target>
    [[nodiscard]] bool writeU16(Target& target, tftp_u16 value) {
        const auto hi = static_cast<tftp_u8>(value >> 8);
        const auto lo = static_cast<tftp_u8>(value & 0xFF);

        return target.appendOctet(hi) and target.appendOctet(lo);
    }

    /// NOTE: writes the text plus its null delimiter, since every TFTP string field is terminated.
    template <Meta::OctetSink Target>
    [[nodiscard]] bool writeText(Target& target, std::string_view value) {
        for (const auto c : value) {
            if (not target.appendOctet(static_cast<tftp_u8>(c))) {
                return false;
            }
        }

        return target.appendOctet(tftp_u8 {0});
    }

    template <Meta::OctetSink Target>
    [[nodiscard]] bool writeBlob(Target& target, const Blob& value) {
        for (const auto octet : value) {
            if (not target.appendOctet(octet)) {
                return false;
            }
        }

        return true;
    }

    template <Meta::OctetSink Target, Opcode Op>
    [[nodiscard]] bool serializePayload(Target& target, const RWPayload<Op>& payload) {
        return writeText(target, payload.filename)
            and writeText(target, toFileModeName(payload.mode));
    }

    template <Meta::OctetSink Target>
    [[nodiscard]] bool serializePayload(Target& target, const DataPayload& payload) {
        return writeU16(target, payload.block_n) and writeBlob(target, payload.data);
    }

    template <Meta::OctetSink Target>
    [[nodiscard]] bool serializePayload(Target& target, const AckPayload& payload) {
        return writeU16(target, payload.block_n);
    }

    template <Meta::OctetSink Target>
    [[nodiscard]] bool serializePayload(Target& target, const ErrorPayload& payload) {
        return writeU16(target, toErrorCodeValue(payload.error))
            and writeText(target, payload.message);
    }

    /// @brief Writes opcode then fields of `packet`, returning false once `target` refuses an octet.
    template <Meta::OctetSink Target>
    [[nodiscard]] bool serializeMessage(Target& target, const Packet& packet) {
        return std::visit([&target](const auto& payload) {
            return writeU16(target, toOpcodeValue(payload.opcode))
                and serializePayload(target, payload);
        }, packet);
    }

    /**
     * @brief Encodes `packet` into a fixed datagram buffer without allocating.
     * @return false if the encoding does not fit, in which case `target` is left empty.
     */
    template <Meta::OctetKind T, std::size_t N>
    [[nodiscard]] bool encodeInto(MyBuf::FixedBuffer<T, N>& target, const Packet& packet) {
        target.reset();

        if (encodedSize(packet) > target.getSize()) {
            return false;
        }

        if (not serializeMessage(target, packet)) {
            target.reset();
            return false;
        }

        return true;
    }
}
