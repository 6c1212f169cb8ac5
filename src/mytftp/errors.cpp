#include <string>
#include <variant>
#include "meta/helpers.hpp"
#include "mytftp/errors.hpp"

namespace TftpWire::MyTftp {
    std::string toString(const PacketError& error) {
        return std::visit(Meta::Overloaded {
            [](const InvalidPacket& e) -> std::string {
                return "InvalidPacket: " + e.message;
            },
            [](const InvalidOpcode& e) -> std::string {
                return "InvalidOpcode: " + e.message;
            },
            [](const InvalidPacketLength& e) -> std::string {
                return "InvalidPacketLength: Expected " + std::to_string(e.expected) + " bytes";
            }
        }, error);
    }
}
