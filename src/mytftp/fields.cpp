#include <string>
#include <string_view>
#include <utility>
#include "mytftp/wire_enums.hpp"
#include "mytftp/fields.hpp"

namespace TftpWire::MyTftp {
    static constexpr tftp_u8 utf8_cont_mask = 0xC0;
    static constexpr tftp_u8 utf8_cont_tag = 0x80;

    [[nodiscard]] static constexpr bool isContinuation(tftp_u8 octet) noexcept {
        return (octet & utf8_cont_mask) == utf8_cont_tag;
    }

    [[nodiscard]] static std::unexpected<PacketError> badField(const char* msg_cstr) {
        return std::unexpected<PacketError> {InvalidPacket {msg_cstr}};
    }

    /// @brief Reads a null-terminated UTF-8 field, `what` names it in errors.
    [[nodiscard]] static FieldResult<std::string> parseText(ByteView bytes, std::string_view what) {
        const auto text_res = MyBuf::takeUntilNull(bytes);

        if (not text_res.has_value()) {
            return std::unexpected<PacketError> {InvalidPacket {
                "Error while parsing " + std::string {what} + ". Missing null terminator."
            }};
        }

        const auto& [raw_text, rest] = text_res.value();

        if (not isValidUtf8(raw_text)) {
            return std::unexpected<PacketError> {InvalidPacket {
                "Error while parsing " + std::string {what} + ". Not a valid UTF-8 string."
            }};
        }

        return MyBuf::HelperResult<std::string, tftp_u8> {
            std::string(raw_text.begin(), raw_text.end()),
            rest
        };
    }

    bool isValidUtf8(ByteView text) noexcept {
        const auto text_len = text.getLength();
        auto pos = 0UL;

        while (pos < text_len) {
            const auto lead = text[pos];
            auto seq_len = 0UL;
            tftp_u8 second_min = 0x80;
            tftp_u8 second_max = 0xBF;

            if (lead < 0x80) {
                pos++;
                continue;
            } else if (lead >= 0xC2 and lead <= 0xDF) {
                seq_len = 2;
            } else if (lead >= 0xE0 and lead <= 0xEF) {
                seq_len = 3;
                /// NOTE: rejects overlong forms after 0xE0 and UTF-16 surrogates after 0xED.
                second_min = (lead == 0xE0) ? 0xA0 : 0x80;
                second_max = (lead == 0xED) ? 0x9F : 0xBF;
            } else if (lead >= 0xF0 and lead <= 0xF4) {
                seq_len = 4;
                second_min = (lead == 0xF0) ? 0x90 : 0x80;
                second_max = (lead == 0xF4) ? 0x8F : 0xBF;
            } else {
                return false;
            }

            if (pos + seq_len > text_len) {
                return false;
            }

            const auto second = text[pos + 1];

            if (second < second_min or second > second_max) {
                return false;
            }

            for (auto cont_pos = pos + 2; cont_pos < pos + seq_len; cont_pos++) {
                if (not isContinuation(text[cont_pos])) {
                    return false;
                }
            }

            pos += seq_len;
        }

        return true;
    }

    FieldResult<Opcode> parseOpcode(ByteView bytes) {
        const auto raw_res = MyBuf::takeU16(bytes);

        if (not raw_res.has_value()) {
            return std::unexpected<PacketError> {InvalidOpcode {"Error while parsing opcode. Opcode not a u16."}};
        }

        const auto [raw_opcode, rest] = raw_res.value();
        const auto opcode = toOpcode(raw_opcode);

        if (not opcode.has_value()) {
            return std::unexpected<PacketError> {InvalidOpcode {
                "Error while parsing opcode: unknown opcode " + std::to_string(raw_opcode)
            }};
        }

        return MyBuf::HelperResult<Opcode, tftp_u8> {opcode.value(), rest};
    }

    FieldResult<std::string> parseFilename(ByteView bytes) {
        return parseText(bytes, "filename");
    }

    FieldResult<DataMode> parseMode(ByteView bytes) {
        auto mode_res = parseText(bytes, "mode");

        if (not mode_res.has_value()) {
            return std::unexpected<PacketError> {std::move(mode_res.error())};
        }

        const auto& [mode_name, rest] = mode_res.value();
        const auto mode = toFileMode(mode_name);

        if (not mode.has_value()) {
            return badField("Error while parsing mode. Not a valid mode string.");
        }

        return MyBuf::HelperResult<DataMode, tftp_u8> {mode.value(), rest};
    }

    FieldResult<tftp_u16> parseBlockNumber(ByteView bytes) {
        const auto block_res = MyBuf::takeU16(bytes);

        if (not block_res.has_value()) {
            return badField("Error while parsing block number. Block number not a u16.");
        }

        return block_res.value();
    }

    FieldResult<ErrorCode> parseErrorCode(ByteView bytes) {
        const auto raw_res = MyBuf::takeU16(bytes);

        if (not raw_res.has_value()) {
            return badField("Error while parsing error code. Error code not a u16.");
        }

        const auto [raw_errcode, rest] = raw_res.value();
        const auto errcode = toErrorCode(raw_errcode);

        if (not errcode.has_value()) {
            return badField("Error while parsing error code. Error code not a valid error code.");
        }

        return MyBuf::HelperResult<ErrorCode, tftp_u8> {errcode.value(), rest};
    }

    FieldResult<std::string> parseErrorMessage(ByteView bytes) {
        return parseText(bytes, "error message");
    }
}
