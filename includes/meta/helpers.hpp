#pragma once

#include <type_traits>
#include <concepts>

namespace TftpWire::Meta {
    template <typename T>
    concept OctetKind = std::is_same_v<T, char> or std::is_same_v<T, unsigned char>;

    template <typename Target>
    concept OctetSink = requires (Target& target, unsigned char octet) {
        { target.appendOctet(octet) } -> std::same_as<bool>;
    };

    /// NOTE: lets `std::visit` take a set of lambdas, one per packet alternative.
    template <typename ... Fs>
    struct Overloaded : Fs ... {
        using Fs::operator() ...;
    };

    template <typename ... Fs>
    Overloaded(Fs ...) -> Overloaded<Fs ...>;
}
