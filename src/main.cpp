/**
 * @file main.cpp
 * @brief Implements driver logic for the tftpwire packet tool.
 * @date 10/18/2026
 */

#include <exception>
#include <iostream>
#include <string_view>
#include <vector>
#include "mytftp/codec.hpp"
#include "mytool/commands.hpp"
#include "mytool/hex.hpp"
#include "mytool/logging.hpp"

namespace {
    using namespace TftpWire;

    int runDecode(std::string_view hex_text) {
        const auto bytes = MyTool::hexToBytes(hex_text);

        if (not bytes.has_value()) {
            MyTool::logMessage<MyTool::LogLevel::fatal>("input is not valid hex");
            return 1;
        }

        const auto& raw = bytes.value();
        const auto packet = MyTftp::decode(MyTftp::ByteView {raw.data(), raw.size()});

        if (not packet.has_value()) {
            MyTool::logMessage<MyTool::LogLevel::warning>("decode failed: ", MyTftp::toString(packet.error()));
            return 1;
        }

        std::cout << MyTool::describePacket(packet.value()) << '\n';

        return 0;
    }

    int runEncode(const std::vector<std::string_view>& words) {
        const auto packet = MyTool::buildPacket(words);

        if (not packet.has_value()) {
            MyTool::logMessage<MyTool::LogLevel::fatal>("bad encode arguments: ", packet.error());
            return 1;
        }

        const auto bytes = MyTftp::encode(packet.value());

        if (bytes.size() > MyTftp::Constants::max_datagram_size) {
            MyTool::logMessage<MyTool::LogLevel::warning>("encoded ", bytes.size(), "B exceeds the ", MyTftp::Constants::max_datagram_size, "B datagram limit");
        }

        std::cout << MyTool::bytesToHex(MyTftp::ByteView {bytes.data(), bytes.size()}) << '\n';

        return 0;
    }
}

int main(int argc, char* argv[]) {
    using namespace TftpWire;

    if (argc < MyTool::Constants::min_argc) {
        std::cerr << "Invalid argc.\n" << MyTool::Constants::usage_text;
        return 1;
    }

    const std::string_view command {argv[1]};

    try {
        if (command == "decode") {
            if (argc != MyTool::Constants::min_argc) {
                std::cerr << "Invalid argc.\n" << MyTool::Constants::usage_text;
                return 1;
            }

            return runDecode(argv[2]);
        } else if (command == "encode") {
            const std::vector<std::string_view> words (argv + 2, argv + argc);

            return runEncode(words);
        }
    } catch (const std::exception& err) {
        MyTool::logMessage<MyTool::LogLevel::fatal>("invalid numeric argument: ", err.what());
        return 1;
    }

    std::cerr << "Unknown command: " << command << '\n' << MyTool::Constants::usage_text;

    return 1;
}
