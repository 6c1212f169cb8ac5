#pragma once

#include <expected>
#include <span>
#include <string>
#include <string_view>
#include "mytftp/types.hpp"

namespace TftpWire::MyTool {
    namespace Constants {
        inline constexpr auto min_argc = 3;
        inline constexpr auto max_u16_arg = 65535UL;
        inline constexpr auto max_errcode_arg = 7UL;
        inline constexpr std::string_view usage_text =
            "usage:\n"
            "  tftpwire decode <hex-bytes>\n"
            "  tftpwire encode rrq|wrq <filename> <netascii|octet|mail>\n"
            "  tftpwire encode data <block> [hex-payload]\n"
            "  tftpwire encode ack <block>\n"
            "  tftpwire encode error <code 0-7> [message]\n";
    }

    /**
     * @brief Builds a packet from the words after `encode`, e.g. `{"ack", "42"}`.
     * @return The packet, or a message naming the bad argument.
     * @note Numeric arguments go through `std::stoul`, so malformed numbers throw `std::invalid_argument` or `std::out_of_range`.
     */
    [[nodiscard]] std::expected<MyTftp::Packet, std::string> buildPacket(std::span<const std::string_view> words);
}
