#include <array>
#include <iterator>
#include <string>
#include <boost/container_hash/hash.hpp>
#include <fmt/format.h>
#include <xxhash.h>

#include "network.hpp"
#include "prefix_math.hpp"

namespace cidrkit {

Network::Network() : Network(AddressFamily::IPv4, 0, 0) {
}

Network::Network(const Address &addr, unsigned int prefix) : Network(try_create(addr, prefix).value()) {
}

Network::Network(const Address &addr, const Address &mask) : Network(try_create(addr, mask).value()) {
}

Network::Network(AddressFamily family, addr_int value, unsigned int prefix)
    : _family(family), _base(value & cidrkit::netmask(prefix, family)), _prefix(prefix) {
    _hash = compute_hash();
}

result<Network> Network::try_create(addr_int value, AddressFamily family, unsigned int prefix) {
    if (family != AddressFamily::IPv4 && family != AddressFamily::IPv6)
        return fail(CidrError::InvalidFamily);
    if (prefix > family_bits(family))
        return fail(CidrError::PrefixOutOfRange);
    return Network(family, value & family_mask(family), prefix);
}

result<Network> Network::try_create(const Address &addr, unsigned int prefix) {
    return try_create(addr.value, addr.family, prefix);
}

result<Network> Network::try_create(const Address &addr, const Address &mask) {
    if (addr.family != mask.family)
        return fail(CidrError::MixedAddressFamily);
    auto prefix = try_cidr_from_netmask(mask);
    if (!prefix)
        return prefix.as_failure();
    return try_create(addr, prefix.value());
}

size_t Network::compute_hash() const noexcept {
    size_t seed = XXH3_64bits(&_base, sizeof(_base));
    boost::hash_combine(seed, _prefix);
    boost::hash_combine(seed, static_cast<int>(_family));
    return seed;
}

addr_int Network::netmask_int() const {
    return cidrkit::netmask(_prefix, _family);
}

addr_int Network::broadcast_int() const {
    auto cached = _broadcast.synchronize();
    if (!*cached)
        *cached = cidrkit::broadcast(_base, netmask_int(), _family);
    return **cached;
}

Address Network::network() const {
    return Address(_family, _base);
}

Address Network::netmask() const {
    return Address(_family, netmask_int());
}

Address Network::wildcard_mask() const {
    return Address(_family, family_mask(_family) - netmask_int());
}

std::optional<Address> Network::broadcast() const {
    if (_family == AddressFamily::IPv6)
        return std::nullopt;
    return Address(_family, broadcast_int());
}

Address Network::first_usable() const {
    if (_family == AddressFamily::IPv4 && _prefix <= 30)
        return Address(_family, _base + 1);
    return network();
}

Address Network::last_usable() const {
    if (_family == AddressFamily::IPv6)
        return Address(_family, broadcast_int());
    if (_prefix <= 30)
        return Address(_family, broadcast_int() - 1);
    return network();
}

count_type Network::usable() const {
    return usable_count(_prefix, _family);
}

count_type Network::total() const {
    return total_count(_prefix, _family);
}

bool Network::contains(const Address &addr) const {
    if (addr.family != _family)
        return false;
    return addr.value >= _base && addr.value <= broadcast_int();
}

bool Network::contains(const Network &other) const {
    if (other._family != _family)
        return false;
    return other._base >= _base && other.broadcast_int() <= broadcast_int();
}

bool Network::overlaps(const Network &other) const {
    if (other._family != _family)
        return false;
    auto first = other._base;
    auto last = other.broadcast_int();
    auto net = _base;
    auto bcast = broadcast_int();
    return (first >= net && first <= bcast) || (last >= net && last <= bcast) || (first <= net && last >= bcast);
}

static const std::array<Network, 3> &iana_reserved_blocks() {
    static const std::array<Network, 3> blocks{
        Network(Address(AddressFamily::IPv4, 0x0a000000), 8),
        Network(Address(AddressFamily::IPv4, 0xac100000), 12),
        Network(Address(AddressFamily::IPv4, 0xc0a80000), 16),
    };
    return blocks;
}

bool Network::is_iana_reserved() const {
    for (const auto &block : iana_reserved_blocks())
        if (block.contains(*this))
            return true;
    return false;
}

bool Network::is_iana_reserved(const Address &addr) {
    for (const auto &block : iana_reserved_blocks())
        if (block.contains(addr))
            return true;
    return false;
}

std::string Network::to_string() const {
    return fmt::format("{}/{}", network(), _prefix);
}

std::string Network::print() const {
    auto bcast = broadcast();
    std::string out;
    fmt::format_to(std::back_inserter(out), "IPNetwork   : {}\n", *this);
    fmt::format_to(std::back_inserter(out), "Network     : {}\n", network());
    fmt::format_to(std::back_inserter(out), "Netmask     : {}\n", netmask());
    fmt::format_to(std::back_inserter(out), "Cidr        : {}\n", _prefix);
    fmt::format_to(std::back_inserter(out), "Broadcast   : {}\n", bcast ? bcast->to_string() : std::string());
    fmt::format_to(std::back_inserter(out), "FirstUsable : {}\n", first_usable());
    fmt::format_to(std::back_inserter(out), "LastUsable  : {}\n", last_usable());
    fmt::format_to(std::back_inserter(out), "Usable      : {}\n", usable().str());
    return out;
}

} // namespace cidrkit
