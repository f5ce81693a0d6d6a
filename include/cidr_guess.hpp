#pragma once

#include <optional>
#include <string_view>

namespace cidrkit {

// Supplies a prefix length for an address given without one.
class CidrGuess {
public:
    virtual ~CidrGuess() = default;
    virtual std::optional<unsigned int> try_guess(std::string_view address) const = 0;
};

// Legacy class A/B/C lengths for IPv4, /64 for IPv6.
class ClassfulGuess : public CidrGuess {
public:
    std::optional<unsigned int> try_guess(std::string_view address) const override;
};

// Host routes: /32 for IPv4, /128 for IPv6.
class ClasslessGuess : public CidrGuess {
public:
    std::optional<unsigned int> try_guess(std::string_view address) const override;
};

const CidrGuess &default_cidr_guess();

} // namespace cidrkit
