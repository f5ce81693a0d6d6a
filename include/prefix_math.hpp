#pragma once

#include <string_view>

#include "address.hpp"
#include "result.hpp"

namespace cidrkit {

result<addr_int> try_netmask(unsigned int prefix, AddressFamily family);
addr_int netmask(unsigned int prefix, AddressFamily family);

// host bits of the given prefix, all set
result<addr_int> try_wildcard(unsigned int prefix, AddressFamily family);
addr_int wildcard(unsigned int prefix, AddressFamily family);

bool is_valid_netmask(addr_int mask, AddressFamily family) noexcept;
result<unsigned int> try_cidr_from_netmask(addr_int mask, AddressFamily family);
unsigned int cidr_from_netmask(addr_int mask, AddressFamily family);
result<unsigned int> try_cidr_from_netmask(const Address &mask);
unsigned int cidr_from_netmask(const Address &mask);

addr_int broadcast(addr_int base, addr_int mask, AddressFamily family) noexcept;

unsigned int bits_set(addr_int value) noexcept;

count_type total_count(unsigned int prefix, AddressFamily family);
// IPv4 reserves the network and broadcast addresses; IPv6 does not
count_type usable_count(unsigned int prefix, AddressFamily family);

// decimal prefix length within the family width
result<unsigned int> try_parse_prefix_length(std::string_view str, AddressFamily family);

} // namespace cidrkit
