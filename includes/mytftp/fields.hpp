#pragma once

#include <expected>
#include <string>
#include "mybuf/cursor.hpp"
#include "mytftp/types.hpp"
#include "mytftp/errors.hpp"

namespace TftpWire::MyTftp {
    template <typename DataType>
    using FieldResult = std::expected<MyBuf::HelperResult<DataType, tftp_u8>, PacketError>;

    [[nodiscard]] bool isValidUtf8(ByteView text) noexcept;

    [[nodiscard]] FieldResult<Opcode> parseOpcode(ByteView bytes);
    [[nodiscard]] FieldResult<std::string> parseFilename(ByteView bytes);
    [[nodiscard]] FieldResult<DataMode> parseMode(ByteView bytes);
    [[nodiscard]] FieldResult<tftp_u16> parseBlockNumber(ByteView bytes);
    [[nodiscard]] FieldResult<ErrorCode> parseErrorCode(ByteView bytes);
    [[nodiscard]] FieldResult<std::string> parseErrorMessage(ByteView bytes);
}
