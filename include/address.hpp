#pragma once

#include <compare>
#include <cstdint>
#include <string>
#include <string_view>
#include <netinet/in.h>
#include <boost/multiprecision/cpp_int.hpp>
#include <fmt/format.h>

#include "result.hpp"

namespace cidrkit {

// host-order address value, wide enough for both families
using addr_int = unsigned __int128;
// counts and indices; 2^128 addresses in ::/0 does not fit addr_int
using count_type = boost::multiprecision::cpp_int;

enum class AddressFamily : uint8_t {
    IPv4,
    IPv6,
};

static constexpr unsigned int family_bits(AddressFamily family) noexcept {
    return family == AddressFamily::IPv4 ? 32 : 128;
}

static constexpr addr_int family_mask(AddressFamily family) noexcept {
    return family == AddressFamily::IPv4 ? static_cast<addr_int>(UINT32_MAX) : ~static_cast<addr_int>(0);
}

static constexpr std::strong_ordering compare_int(addr_int a, addr_int b) noexcept {
    if (a < b)
        return std::strong_ordering::less;
    else if (a > b)
        return std::strong_ordering::greater;
    else
        return std::strong_ordering::equal;
}

count_type to_count(addr_int value);
// value must be below 2^128
addr_int from_count(const count_type &value);

struct Address {
    constexpr Address() {
    }
    constexpr Address(AddressFamily _family, addr_int _value) : family(_family), value(_value & family_mask(_family)) {
    }
    explicit Address(const in_addr &addr);
    explicit Address(const in6_addr &addr);

    static result<Address> try_parse(std::string_view str);
    static Address parse(std::string_view str);

    constexpr bool is_v4() const noexcept {
        return family == AddressFamily::IPv4;
    }
    constexpr bool is_v6() const noexcept {
        return family == AddressFamily::IPv6;
    }

    in_addr to_in_addr() const;
    in6_addr to_in6_addr() const;
    std::string to_string() const;

    friend constexpr bool operator==(const Address &a, const Address &b) noexcept {
        return a.family == b.family && a.value == b.value;
    }
    friend constexpr std::strong_ordering operator<=>(const Address &a, const Address &b) noexcept {
        if (a.family != b.family)
            return a.family <=> b.family;
        return compare_int(a.value, b.value);
    }

    AddressFamily family = AddressFamily::IPv4;
    addr_int value = 0;
};

result<addr_int> try_to_integer(std::string_view str);
addr_int to_integer(std::string_view str);

constexpr addr_int to_integer(const Address &addr) noexcept {
    return addr.value;
}

result<Address> try_from_integer(addr_int value, AddressFamily family);
Address from_integer(addr_int value, AddressFamily family);

std::string to_string(AddressFamily family);

} // namespace cidrkit

template <>
struct fmt::formatter<cidrkit::Address> : fmt::formatter<std::string_view> {
    auto format(const cidrkit::Address &addr, fmt::format_context &ctx) const -> decltype(ctx.out()) {
        return fmt::formatter<std::string_view>::format(addr.to_string(), ctx);
    }
};
