#pragma once

#include <cstddef>
#include <iterator>
#include <utility>

#include "address.hpp"
#include "network.hpp"
#include "result.hpp"

namespace cidrkit {

enum class AddressFilter {
    All,
    // IPv4 excludes the network and broadcast addresses
    Usable,
    // All minus Usable
    Unusable,
    Broadcast,
    Network,
};

// Addresses of a network under a filter, computed on access.
class AddressRange {
public:
    class Iterator {
    public:
        using iterator_category = std::input_iterator_tag;
        using difference_type = std::ptrdiff_t;
        using value_type = Address;
        using pointer = void;
        using reference = Address;

        Iterator() {
        }
        Iterator(const AddressRange *range, count_type index) : _range(range), _index(std::move(index)) {
        }

        Iterator &operator++() {
            ++_index;
            return *this;
        }
        Iterator operator++(int) {
            Iterator old = *this;
            ++*this;
            return old;
        }

        Address operator*() const {
            return _range->at(_index);
        }

        friend bool operator==(const Iterator &a, const Iterator &b) {
            return a._range == b._range && a._index == b._index;
        }

    private:
        const AddressRange *_range = nullptr;
        count_type _index;
    };

    AddressRange(const Network &network, AddressFilter filter);

    const Network &network() const noexcept {
        return _network;
    }
    AddressFilter filter() const noexcept {
        return _filter;
    }
    const count_type &size() const noexcept {
        return _count;
    }
    bool empty() const {
        return _count == 0;
    }

    result<Address> try_at(const count_type &index) const;
    Address at(const count_type &index) const;
    Address operator[](const count_type &index) const {
        return at(index);
    }

    Iterator begin() const {
        return Iterator(this, 0);
    }
    Iterator end() const {
        return Iterator(this, _count);
    }

private:
    Network _network;
    AddressFilter _filter;
    count_type _count;
};

AddressRange list_addresses(const Network &network, AddressFilter filter = AddressFilter::All);

} // namespace cidrkit
