#include "cidr_guess.hpp"
#include "address.hpp"

namespace cidrkit {

std::optional<unsigned int> ClassfulGuess::try_guess(std::string_view address) const {
    auto addr = Address::try_parse(address);
    if (!addr)
        return std::nullopt;
    if (addr.value().is_v6())
        return 64;
    auto first_octet = static_cast<unsigned int>(addr.value().value >> 24);
    if (first_octet <= 127)
        return 8;
    else if (first_octet <= 191)
        return 16;
    else if (first_octet <= 223)
        return 24;
    // class D and E have no network length
    return std::nullopt;
}

std::optional<unsigned int> ClasslessGuess::try_guess(std::string_view address) const {
    auto addr = Address::try_parse(address);
    if (!addr)
        return std::nullopt;
    return family_bits(addr.value().family);
}

const CidrGuess &default_cidr_guess() {
    static const ClassfulGuess guess;
    return guess;
}

} // namespace cidrkit
