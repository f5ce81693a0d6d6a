#pragma once

#include <compare>
#include <cstddef>
#include <optional>
#include <string>
#include <boost/thread/synchronized_value.hpp>
#include <fmt/format.h>

#include "address.hpp"
#include "result.hpp"

namespace cidrkit {

/*
 * An IPv4 or IPv6 prefix. The base address is always masked to the prefix
 * length, so 192.168.168.100/24 is stored as 192.168.168.0/24.
 * Instances are immutable after construction; only the broadcast cache is
 * written, at most once, under its own lock.
 */
class Network {
public:
    // 0.0.0.0/0
    Network();
    Network(const Address &addr, unsigned int prefix);
    Network(const Address &addr, const Address &mask);

    static result<Network> try_create(const Address &addr, unsigned int prefix);
    static result<Network> try_create(const Address &addr, const Address &mask);
    static result<Network> try_create(addr_int value, AddressFamily family, unsigned int prefix);

    constexpr AddressFamily family() const noexcept {
        return _family;
    }
    constexpr unsigned int prefix_length() const noexcept {
        return _prefix;
    }
    constexpr bool is_v4() const noexcept {
        return _family == AddressFamily::IPv4;
    }

    constexpr addr_int network_int() const noexcept {
        return _base;
    }
    addr_int netmask_int() const;
    addr_int broadcast_int() const;

    Address network() const;
    Address netmask() const;
    Address wildcard_mask() const;
    // IPv6 has no broadcast address
    std::optional<Address> broadcast() const;
    Address first_usable() const;
    Address last_usable() const;
    count_type usable() const;
    count_type total() const;

    bool contains(const Address &addr) const;
    bool contains(const Network &other) const;
    bool overlaps(const Network &other) const;

    // within 10.0.0.0/8, 172.16.0.0/12 or 192.168.0.0/16
    bool is_iana_reserved() const;
    static bool is_iana_reserved(const Address &addr);

    // network/prefix, the form parse() reads back
    std::string to_string() const;
    // multi-line dump of the derived fields
    std::string print() const;

    constexpr size_t hash() const noexcept {
        return _hash;
    }

    friend bool operator==(const Network &a, const Network &b) noexcept {
        return a._family == b._family && a._base == b._base && a._prefix == b._prefix;
    }
    friend std::strong_ordering operator<=>(const Network &a, const Network &b) noexcept {
        if (a._family != b._family)
            return a._family <=> b._family;
        if (a._base != b._base)
            return compare_int(a._base, b._base);
        return a._prefix <=> b._prefix;
    }

private:
    Network(AddressFamily family, addr_int value, unsigned int prefix);

    size_t compute_hash() const noexcept;

    AddressFamily _family = AddressFamily::IPv4;
    addr_int _base = 0;
    unsigned int _prefix = 0;
    size_t _hash = 0;
    mutable boost::synchronized_value<std::optional<addr_int>> _broadcast;
};

} // namespace cidrkit

namespace std {
template <>
struct hash<cidrkit::Network> {
    size_t operator()(const cidrkit::Network &a) const noexcept {
        return a.hash();
    }
};
} // namespace std

template <>
struct fmt::formatter<cidrkit::Network> : fmt::formatter<std::string_view> {
    auto format(const cidrkit::Network &net, fmt::format_context &ctx) const -> decltype(ctx.out()) {
        return fmt::formatter<std::string_view>::format(net.to_string(), ctx);
    }
};
