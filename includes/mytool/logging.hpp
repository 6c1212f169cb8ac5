#pragma once

#include <iostream>

namespace TftpWire::MyTool {
    enum class LogLevel {
        info,
        warning,
        fatal
    };

    template <LogLevel L, typename ... Args>
    void logMessage(Args&& ... args) {
        if constexpr (L == LogLevel::info) {
            std::clog << "tftpwire [INFO]: ";
        } else if constexpr (L == LogLevel::warning) {
            std::clog << "tftpwire [WARNING]: ";
        } else if constexpr (L == LogLevel::fatal) {
            std::clog << "tftpwire [FATAL]: ";
        } else {
            std::clog << "tftpwire [LOG]: ";
        }

        (std::clog << ... << args) << '\n';
    }
}
