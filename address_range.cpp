#include "address_range.hpp"

namespace cidrkit {

AddressRange::AddressRange(const Network &network, AddressFilter filter) : _network(network), _filter(filter) {
    switch (filter) {
    case AddressFilter::All:
        _count = network.total();
        break;
    case AddressFilter::Usable:
        _count = network.usable();
        break;
    case AddressFilter::Unusable:
        _count = network.total() - network.usable();
        break;
    case AddressFilter::Broadcast:
        _count = network.is_v4() ? 1 : 0;
        break;
    case AddressFilter::Network:
        _count = 1;
        break;
    }
}

result<Address> AddressRange::try_at(const count_type &index) const {
    if (index < 0 || index >= _count)
        return fail(CidrError::IndexOutOfRange);
    auto family = _network.family();
    auto base = _network.network_int();
    auto offset = from_count(index);
    switch (_filter) {
    case AddressFilter::All:
        return Address(family, base + offset);
    case AddressFilter::Usable:
        // IPv6 reserves nothing
        return Address(family, _network.is_v4() ? base + 1 + offset : base + offset);
    case AddressFilter::Unusable:
        // /31 and /32 have no usable addresses, so every address is listed
        if (_network.usable() == 0)
            return Address(family, base + offset);
        return Address(family, offset == 0 ? base : _network.broadcast_int());
    case AddressFilter::Broadcast:
        return Address(family, _network.broadcast_int());
    case AddressFilter::Network:
        return Address(family, base);
    }
    return fail(CidrError::IndexOutOfRange);
}

Address AddressRange::at(const count_type &index) const {
    return try_at(index).value();
}

AddressRange list_addresses(const Network &network, AddressFilter filter) {
    return AddressRange(network, filter);
}

} // namespace cidrkit
