#include <utility>
#include "mytftp/fields.hpp"
#include "mytftp/codec.hpp"

namespace TftpWire::MyTftp {
    using DecodeResult = std::expected<Packet, PacketError>;

    /// @brief Growable sink for `encode`, never refuses an octet.
    class BlobWriter {
    private:
        Blob& m_target;

    public:
        explicit BlobWriter(Blob& target) noexcept
        : m_target {target} {}

        [[nodiscard]] bool appendOctet(tftp_u8 octet) {
            m_target.push_back(octet);
            return true;
        }
    };

    template <Opcode Op>
    [[nodiscard]] static DecodeResult decodePayload(ByteView bytes) {
        auto filename_res = parseFilename(bytes);

        if (not filename_res.has_value()) {
            return std::unexpected<PacketError> {std::move(filename_res.error())};
        }

        auto& [filename, after_filename] = filename_res.value();
        const auto mode_res = parseMode(after_filename);

        if (not mode_res.has_value()) {
            return std::unexpected<PacketError> {mode_res.error()};
        }

        /// NOTE: anything after the mode's terminator is ignored, not rejected.
        return RWPayload<Op> {
            std::move(filename),
            mode_res.value().data
        };
    }

    [[nodiscard]] static DecodeResult decodeData(ByteView bytes) {
        const auto block_res = parseBlockNumber(bytes);

        if (not block_res.has_value()) {
            return std::unexpected<PacketError> {block_res.error()};
        }

        const auto [block_n, payload] = block_res.value();

        if (payload.getLength() > Constants::max_data_chunk_size) {
            return std::unexpected<PacketError> {InvalidPacketLength {Constants::max_data_chunk_size}};
        }

        return DataPayload {
            block_n,
            Blob(payload.begin(), payload.end())
        };
    }

    [[nodiscard]] static DecodeResult decodeAck(ByteView bytes) {
        const auto block_res = parseBlockNumber(bytes);

        if (not block_res.has_value()) {
            return std::unexpected<PacketError> {block_res.error()};
        }

        const auto [block_n, rest] = block_res.value();

        if (not rest.isEmpty()) {
            return std::unexpected<PacketError> {InvalidPacketLength {Constants::ack_packet_size}};
        }

        return AckPayload {block_n};
    }

    [[nodiscard]] static DecodeResult decodeError(ByteView bytes) {
        const auto errcode_res = parseErrorCode(bytes);

        if (not errcode_res.has_value()) {
            return std::unexpected<PacketError> {errcode_res.error()};
        }

        const auto& [errcode, after_errcode] = errcode_res.value();
        auto msg_res = parseErrorMessage(after_errcode);

        if (not msg_res.has_value()) {
            return std::unexpected<PacketError> {std::move(msg_res.error())};
        }

        return ErrorPayload {
            errcode,
            std::move(msg_res.value().data)
        };
    }

    DecodeResult decode(ByteView bytes) {
        const auto opcode_res = parseOpcode(bytes);

        if (not opcode_res.has_value()) {
            return std::unexpected<PacketError> {opcode_res.error()};
        }

        const auto [opcode, body] = opcode_res.value();

        switch (opcode) {
        case Opcode::rrq:
            return decodePayload<Opcode::rrq>(body);
        case Opcode::wrq:
            return decodePayload<Opcode::wrq>(body);
        case Opcode::data:
            return decodeData(body);
        case Opcode::ack:
            return decodeAck(body);
        case Opcode::err:
            return decodeError(body);
        }

        return std::unexpected<PacketError> {InvalidOpcode {"Error while parsing opcode: unhandled opcode"}};
    }

    Blob encode(const Packet& packet) {
        Blob bytes;
        bytes.reserve(encodedSize(packet));

        BlobWriter writer {bytes};

        /// NOTE: BlobWriter accepts every octet, so serialization cannot fail here.
        [[maybe_unused]] const auto written = serializeMessage(writer, packet);

        return bytes;
    }

    std::size_t encodedSize(const Packet& packet) noexcept {
        return Constants::opcode_size + std::visit(Meta::Overloaded {
            [](const RrqPayload& payload) {
                return payload.filename.size() + Constants::delim_size + toFileModeName(payload.mode).size() + Constants::delim_size;
            },
            [](const WrqPayload& payload) {
                return payload.filename.size() + Constants::delim_size + toFileModeName(payload.mode).size() + Constants::delim_size;
            },
            [](const DataPayload& payload) {
                return Constants::block_number_size + payload.data.size();
            },
            [](const AckPayload&) {
                return Constants::block_number_size;
            },
            [](const ErrorPayload& payload) {
                return Constants::error_code_size + payload.message.size() + Constants::delim_size;
            }
        }, packet);
    }

    Opcode opcodeOf(const Packet& packet) noexcept {
        return std::visit([](const auto& payload) {
            return payload.opcode;
        }, packet);
    }
}
