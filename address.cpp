#include <array>
#include <string>
#include <arpa/inet.h>
#include <boost/endian.hpp>

#include "address.hpp"

namespace cidrkit {

count_type to_count(addr_int value) {
    count_type ret = static_cast<uint64_t>(value >> 64);
    ret <<= 64;
    ret |= static_cast<uint64_t>(value);
    return ret;
}

addr_int from_count(const count_type &value) {
    auto hi = static_cast<count_type>(value >> 64).convert_to<uint64_t>();
    auto lo = static_cast<count_type>(value & UINT64_MAX).convert_to<uint64_t>();
    return (static_cast<addr_int>(hi) << 64) | lo;
}

Address::Address(const in_addr &addr) : family(AddressFamily::IPv4), value(boost::endian::big_to_native(addr.s_addr)) {
}

Address::Address(const in6_addr &addr) : family(AddressFamily::IPv6) {
    auto ip_hi = boost::endian::load_big_u64(&addr.s6_addr[0]);
    auto ip_lo = boost::endian::load_big_u64(&addr.s6_addr[8]);
    value = (static_cast<addr_int>(ip_hi) << 64) | ip_lo;
}

result<Address> Address::try_parse(std::string_view str) {
    if (str.empty())
        return fail(CidrError::EmptyInput);
    // inet_pton wants a terminated string
    std::string input(str);
    in_addr addr4;
    in6_addr addr6;
    if (inet_pton(AF_INET, input.c_str(), &addr4) > 0)
        return Address(addr4);
    else if (inet_pton(AF_INET6, input.c_str(), &addr6) > 0)
        return Address(addr6);
    else
        return fail(CidrError::MalformedAddress);
}

Address Address::parse(std::string_view str) {
    return try_parse(str).value();
}

in_addr Address::to_in_addr() const {
    in_addr addr{};
    addr.s_addr = boost::endian::native_to_big(static_cast<uint32_t>(value));
    return addr;
}

in6_addr Address::to_in6_addr() const {
    in6_addr addr{};
    boost::endian::store_big_u64(&addr.s6_addr[0], static_cast<uint64_t>(value >> 64));
    boost::endian::store_big_u64(&addr.s6_addr[8], static_cast<uint64_t>(value));
    return addr;
}

std::string Address::to_string() const {
    std::array<char, INET6_ADDRSTRLEN> buf{};
    if (is_v4()) {
        auto addr = to_in_addr();
        inet_ntop(AF_INET, &addr, buf.data(), buf.size());
    } else {
        auto addr = to_in6_addr();
        inet_ntop(AF_INET6, &addr, buf.data(), buf.size());
    }
    return std::string(buf.data());
}

result<addr_int> try_to_integer(std::string_view str) {
    auto addr = Address::try_parse(str);
    if (!addr)
        return addr.as_failure();
    return addr.value().value;
}

addr_int to_integer(std::string_view str) {
    return try_to_integer(str).value();
}

result<Address> try_from_integer(addr_int value, AddressFamily family) {
    if (family != AddressFamily::IPv4 && family != AddressFamily::IPv6)
        return fail(CidrError::InvalidFamily);
    return Address(family, value);
}

Address from_integer(addr_int value, AddressFamily family) {
    return try_from_integer(value, family).value();
}

std::string to_string(AddressFamily family) {
    return family == AddressFamily::IPv4 ? "IPv4" : "IPv6";
}

} // namespace cidrkit
