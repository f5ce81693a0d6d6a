#include <bit>
#include <charconv>
#include <cstdint>

#include "prefix_math.hpp"

namespace cidrkit {

result<addr_int> try_netmask(unsigned int prefix, AddressFamily family) {
    if (family != AddressFamily::IPv4 && family != AddressFamily::IPv6)
        return fail(CidrError::InvalidFamily);
    auto bits = family_bits(family);
    if (prefix > bits)
        return fail(CidrError::PrefixOutOfRange);
    // shifting by the full width is undefined
    if (prefix == 0)
        return static_cast<addr_int>(0);
    return (family_mask(family) << (bits - prefix)) & family_mask(family);
}

addr_int netmask(unsigned int prefix, AddressFamily family) {
    return try_netmask(prefix, family).value();
}

result<addr_int> try_wildcard(unsigned int prefix, AddressFamily family) {
    auto mask = try_netmask(prefix, family);
    if (!mask)
        return mask.as_failure();
    return family_mask(family) - mask.value();
}

addr_int wildcard(unsigned int prefix, AddressFamily family) {
    return try_wildcard(prefix, family).value();
}

bool is_valid_netmask(addr_int mask, AddressFamily family) noexcept {
    auto neg = ~mask & family_mask(family);
    // for ::/0 the complement is all ones and neg + 1 wraps to zero
    return ((neg + 1) & neg) == 0 && (mask & ~family_mask(family)) == 0;
}

result<unsigned int> try_cidr_from_netmask(addr_int mask, AddressFamily family) {
    if (family != AddressFamily::IPv4 && family != AddressFamily::IPv6)
        return fail(CidrError::InvalidFamily);
    if (!is_valid_netmask(mask, family))
        return fail(CidrError::InvalidNetmask);
    return bits_set(mask);
}

unsigned int cidr_from_netmask(addr_int mask, AddressFamily family) {
    return try_cidr_from_netmask(mask, family).value();
}

result<unsigned int> try_cidr_from_netmask(const Address &mask) {
    return try_cidr_from_netmask(mask.value, mask.family);
}

unsigned int cidr_from_netmask(const Address &mask) {
    return try_cidr_from_netmask(mask).value();
}

addr_int broadcast(addr_int base, addr_int mask, AddressFamily family) noexcept {
    return base + (~mask & family_mask(family));
}

unsigned int bits_set(addr_int value) noexcept {
    return static_cast<unsigned int>(
        std::popcount(static_cast<uint64_t>(value >> 64)) + std::popcount(static_cast<uint64_t>(value)));
}

count_type total_count(unsigned int prefix, AddressFamily family) {
    count_type ret = 1;
    ret <<= family_bits(family) - prefix;
    return ret;
}

count_type usable_count(unsigned int prefix, AddressFamily family) {
    if (family == AddressFamily::IPv6)
        return total_count(prefix, family);
    if (prefix > 30)
        return 0;
    return total_count(prefix, family) - 2;
}

result<unsigned int> try_parse_prefix_length(std::string_view str, AddressFamily family) {
    if (str.empty())
        return fail(CidrError::EmptyInput);
    unsigned int prefix = 0;
    auto [ptr, ec] = std::from_chars(str.data(), str.data() + str.size(), prefix, 10);
    if (ec != std::errc() || ptr != str.data() + str.size() || prefix > UINT8_MAX)
        return fail(CidrError::MalformedNetmask);
    if (prefix > family_bits(family))
        return fail(CidrError::PrefixOutOfRange);
    return prefix;
}

} // namespace cidrkit
