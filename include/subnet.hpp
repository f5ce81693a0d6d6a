#pragma once

#include <cstddef>
#include <iterator>
#include <utility>

#include "network.hpp"
#include "result.hpp"

namespace cidrkit {

/*
 * The children of a network at a longer prefix length, in address order.
 * Children are computed on access; nothing is stored besides the parent,
 * so splitting ::/0 into /128s is as cheap as splitting a /24.
 */
class NetworkRange {
public:
    class Iterator {
    public:
        using iterator_category = std::input_iterator_tag;
        using difference_type = std::ptrdiff_t;
        using value_type = Network;
        using pointer = void;
        using reference = Network;

        Iterator() {
        }
        Iterator(const NetworkRange *range, count_type index) : _range(range), _index(std::move(index)) {
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

        Network operator*() const {
            return _range->at(_index);
        }

        friend bool operator==(const Iterator &a, const Iterator &b) {
            return a._range == b._range && a._index == b._index;
        }

    private:
        const NetworkRange *_range = nullptr;
        count_type _index;
    };

    const Network &parent() const noexcept {
        return _parent;
    }
    unsigned int prefix_length() const noexcept {
        return _prefix;
    }
    const count_type &size() const noexcept {
        return _count;
    }

    result<Network> try_at(const count_type &index) const;
    Network at(const count_type &index) const;
    Network operator[](const count_type &index) const {
        return at(index);
    }

    Iterator begin() const {
        return Iterator(this, 0);
    }
    Iterator end() const {
        return Iterator(this, _count);
    }

private:
    friend result<NetworkRange> try_subnet(const Network &network, unsigned int prefix);

    NetworkRange(const Network &parent, unsigned int prefix);

    Network _parent;
    unsigned int _prefix;
    count_type _count;
};

result<NetworkRange> try_subnet(const Network &network, unsigned int prefix);
NetworkRange subnet(const Network &network, unsigned int prefix);

} // namespace cidrkit
