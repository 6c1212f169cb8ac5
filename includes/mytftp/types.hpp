#pragma once

#include <string>
#include <variant>
#include <vector>
#include "mybuf/buffers.hpp"

namespace TftpWire::MyTftp {
    using tftp_u8 = unsigned char;
    using tftp_u16 = unsigned short;

    using Blob = std::vector<tftp_u8>;
    using ByteView = MyBuf::BufferView<tftp_u8>;

    namespace Constants {
        inline constexpr auto opcode_size = 2UL;
        inline constexpr auto block_number_size = 2UL;
        inline constexpr auto error_code_size = 2UL;
        inline constexpr auto delim_size = 1UL;
        inline constexpr tftp_u16 max_data_chunk_size = 512;
        inline constexpr tftp_u16 ack_packet_size = opcode_size + block_number_size;
        inline constexpr auto max_datagram_size = opcode_size + block_number_size + max_data_chunk_size;
    }

    enum class Opcode : tftp_u16 {
        rrq = 1,
        wrq,
        data,
        ack,
        err,
        first = rrq,
        last = err
    };

    enum class DataMode : unsigned char {
        netascii,
        octet,
        mail,
        last = mail
    };

    enum class ErrorCode : tftp_u16 {
        not_defined,
        file_not_found,
        access_violation,
        disk_full,
        illegal_operation,
        unknown_tid,
        file_already_exists,
        no_such_user,
        last = no_such_user
    };

    /// NOTE: RRQ and WRQ share a layout, the opcode parameter keeps them distinct alternatives of `Packet`.
    template <Opcode Op> requires (Op == Opcode::rrq or Op == Opcode::wrq)
    struct RWPayload {
        static constexpr Opcode opcode = Op;

        std::string filename;
        DataMode mode;

        [[nodiscard]] bool operator==(const RWPayload& other) const = default;
    };

    using RrqPayload = RWPayload<Opcode::rrq>;
    using WrqPayload = RWPayload<Opcode::wrq>;

    struct DataPayload {
        static constexpr Opcode opcode = Opcode::data;

        tftp_u16 block_n;
        Blob data;

        [[nodiscard]] bool operator==(const DataPayload& other) const = default;
    };

    struct AckPayload {
        static constexpr Opcode opcode = Opcode::ack;

        tftp_u16 block_n;

        [[nodiscard]] bool operator==(const AckPayload& other) const = default;
    };

    struct ErrorPayload {
        static constexpr Opcode opcode = Opcode::err;

        ErrorCode error;
        std::string message;

        [[nodiscard]] bool operator==(const ErrorPayload& other) const = default;
    };

    using Packet = std::variant<RrqPayload, WrqPayload, DataPayload, AckPayload, ErrorPayload>;
}
