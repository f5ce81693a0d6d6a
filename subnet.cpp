#include "subnet.hpp"

namespace cidrkit {

NetworkRange::NetworkRange(const Network &parent, unsigned int prefix)
    : _parent(parent), _prefix(prefix), _count(1) {
    _count <<= prefix - parent.prefix_length();
}

result<Network> NetworkRange::try_at(const count_type &index) const {
    if (index < 0 || index >= _count)
        return fail(CidrError::IndexOutOfRange);
    auto shift = family_bits(_parent.family()) - _prefix;
    // a shift of 128 only happens for ::/0 split into ::/0, where index is 0
    addr_int offset = shift < 128 ? from_count(index) << shift : 0;
    return Network::try_create(_parent.network_int() + offset, _parent.family(), _prefix);
}

Network NetworkRange::at(const count_type &index) const {
    return try_at(index).value();
}

result<NetworkRange> try_subnet(const Network &network, unsigned int prefix) {
    if (prefix < network.prefix_length() || prefix > family_bits(network.family()))
        return fail(CidrError::InvalidSplit);
    return NetworkRange(network, prefix);
}

NetworkRange subnet(const Network &network, unsigned int prefix) {
    return try_subnet(network, prefix).value();
}

} // namespace cidrkit
