#include <cstddef>
#include <optional>
#include <string>
#include <utility>
#include "mytftp/wire_enums.hpp"
#include "mytool/hex.hpp"
#include "mytool/commands.hpp"

namespace TftpWire::MyTool {
    using BuildResult = std::expected<MyTftp::Packet, std::string>;

    [[nodiscard]] static std::unexpected<std::string> badArgs(std::string msg) {
        return std::unexpected<std::string> {std::move(msg)};
    }

    /// @note Throws from `std::stoul` on non-numeric text, the caller reports it. Trailing characters are rejected.
    [[nodiscard]] static std::optional<MyTftp::tftp_u16> toU16Arg(std::string_view word, unsigned long max_value) {
        std::size_t parsed_n = 0;
        const auto value = std::stoul(std::string {word}, &parsed_n);

        if (parsed_n != word.size() or value > max_value) {
            return {};
        }

        return static_cast<MyTftp::tftp_u16>(value);
    }

    template <MyTftp::Opcode Op>
    [[nodiscard]] static BuildResult buildRequest(std::span<const std::string_view> words) {
        if (words.size() != 3UL) {
            return badArgs("expected <filename> <mode>");
        }

        const auto mode = MyTftp::toFileMode(words[2]);

        if (not mode.has_value()) {
            return badArgs("unknown mode: " + std::string {words[2]});
        }

        return MyTftp::RWPayload<Op> {std::string {words[1]}, mode.value()};
    }

    [[nodiscard]] static BuildResult buildData(std::span<const std::string_view> words) {
        if (words.size() < 2UL or words.size() > 3UL) {
            return badArgs("expected <block> [hex-payload]");
        }

        const auto block_n = toU16Arg(words[1], Constants::max_u16_arg);

        if (not block_n.has_value()) {
            return badArgs("invalid block number: " + std::string {words[1]});
        }

        MyTftp::Blob payload;

        if (words.size() == 3UL) {
            auto payload_opt = hexToBytes(words[2]);

            if (not payload_opt.has_value()) {
                return badArgs("payload is not valid hex");
            }

            payload = std::move(payload_opt.value());
        }

        return MyTftp::DataPayload {block_n.value(), std::move(payload)};
    }

    [[nodiscard]] static BuildResult buildAck(std::span<const std::string_view> words) {
        if (words.size() != 2UL) {
            return badArgs("expected <block>");
        }

        const auto block_n = toU16Arg(words[1], Constants::max_u16_arg);

        if (not block_n.has_value()) {
            return badArgs("invalid block number: " + std::string {words[1]});
        }

        return MyTftp::AckPayload {block_n.value()};
    }

    [[nodiscard]] static BuildResult buildError(std::span<const std::string_view> words) {
        if (words.size() < 2UL or words.size() > 3UL) {
            return badArgs("expected <code> [message]");
        }

        const auto raw_errcode = toU16Arg(words[1], Constants::max_errcode_arg);

        if (not raw_errcode.has_value()) {
            return badArgs("invalid error code: " + std::string {words[1]});
        }

        const auto errcode = MyTftp::toErrorCode(raw_errcode.value());
        std::string message {(words.size() == 3UL) ? words[2] : MyTftp::toErrorMsg(errcode.value())};

        return MyTftp::ErrorPayload {errcode.value(), std::move(message)};
    }

    BuildResult buildPacket(std::span<const std::string_view> words) {
        if (words.empty()) {
            return badArgs("missing packet kind");
        }

        const auto kind = words[0];

        if (kind == "rrq") {
            return buildRequest<MyTftp::Opcode::rrq>(words);
        } else if (kind == "wrq") {
            return buildRequest<MyTftp::Opcode::wrq>(words);
        } else if (kind == "data") {
            return buildData(words);
        } else if (kind == "ack") {
            return buildAck(words);
        } else if (kind == "error") {
            return buildError(words);
        }

        return badArgs("unknown packet kind: " + std::string {kind});
    }
}
