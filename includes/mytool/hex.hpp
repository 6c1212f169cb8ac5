#pragma once

#include <optional>
#include <string>
#include <string_view>
#include "mytftp/types.hpp"

namespace TftpWire::MyTool {
    /// @brief Parses pairs of hex digits, spaces between pairs are skipped. Empty on odd digit counts or non-hex characters.
    [[nodiscard]] std::optional<MyTftp::Blob> hexToBytes(std::string_view text);

    [[nodiscard]] std::string bytesToHex(MyTftp::ByteView bytes);

    /// @brief Renders a one-line summary, e.g. `RRQ filename="CDE" mode=octet`.
    [[nodiscard]] std::string describePacket(const MyTftp::Packet& packet);
}
