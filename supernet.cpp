#include <algorithm>
#include <array>
#include <utility>

#include "supernet.hpp"
#include "dbgprint.hpp"

namespace cidrkit {

result<Network> try_supernet(const Network &a, const Network &b) {
    if (a.family() != b.family())
        return fail(CidrError::MixedAddressFamily);
    if (a.contains(b))
        return a;
    if (b.contains(a))
        return b;
    if (a.prefix_length() != b.prefix_length())
        return fail(CidrError::NotAdjacent);

    const Network &first = a.network_int() < b.network_int() ? a : b;
    const Network &last = a.network_int() < b.network_int() ? b : a;
    if (first.broadcast_int() + 1 != last.network_int())
        return fail(CidrError::NotAdjacent);

    // neither contains the other, so the length is at least 1
    auto merged = Network::try_create(first.network_int(), first.family(), first.prefix_length() - 1);
    if (!merged)
        return merged.as_failure();
    if (merged.value().network_int() != first.network_int())
        return fail(CidrError::MisalignedBoundary);
    return merged;
}

Network supernet(const Network &a, const Network &b) {
    return try_supernet(a, b).value();
}

std::vector<Network> supernet_all(std::span<const Network> networks) {
    std::vector<Network> sorted(networks.begin(), networks.end());
    // (family, base, prefix length), so one family never sits between two
    // networks of the other
    std::stable_sort(sorted.begin(), sorted.end());

    // back() is the top of the stack, so the lowest network is popped first
    std::vector<Network> current(sorted.rbegin(), sorted.rend());
    std::vector<Network> merged;
    size_t previous = 0;
    size_t count = current.size();
    while (previous != count) {
        merged.clear();
        while (current.size() > 1) {
            Network top = std::move(current.back());
            current.pop_back();
            auto joined = try_supernet(top, current.back());
            if (joined)
                current.back() = std::move(joined).value();
            else
                merged.push_back(std::move(top));
        }
        if (current.size() == 1) {
            merged.push_back(std::move(current.back()));
            current.pop_back();
        }
        previous = count;
        count = merged.size();
        DBG_PRINT("supernet pass: {} -> {} networks\n", previous, count);
        // merged is ascending, every pass starts again from the lowest network
        current.assign(merged.rbegin(), merged.rend());
    }
    return merged;
}

std::vector<Network> supernet_all(std::span<const std::optional<Network>> networks) {
    std::vector<Network> present;
    present.reserve(networks.size());
    for (const auto &net : networks)
        if (net)
            present.push_back(*net);
    return supernet_all(std::span<const Network>(present));
}

result<Network> try_wide_subnet(std::span<const Network> networks) {
    if (networks.empty())
        return fail(CidrError::EmptyInput);

    auto family = networks.front().family();
    const Network *lowest = &networks.front();
    addr_int highest = networks.front().broadcast_int();
    for (const auto &net : networks) {
        if (net.family() != family)
            return fail(CidrError::MixedAddressFamily);
        if (net < *lowest)
            lowest = &net;
        highest = std::max(highest, net.broadcast_int());
    }

    Address last(family, highest);
    for (unsigned int prefix = lowest->prefix_length() + 1; prefix-- > 0;) {
        auto wide = Network::try_create(lowest->network_int(), family, prefix);
        if (!wide)
            return wide.as_failure();
        if (wide.value().contains(last))
            return wide;
    }
    // unreachable: the /0 network contains every address of its family
    return fail(CidrError::PrefixOutOfRange);
}

Network wide_subnet(std::span<const Network> networks) {
    return try_wide_subnet(networks).value();
}

result<Network> try_wide_subnet(std::string_view start, std::string_view end) {
    auto first = Address::try_parse(start);
    if (!first)
        return first.as_failure();
    auto last = Address::try_parse(end);
    if (!last)
        return last.as_failure();
    if (first.value().family != last.value().family)
        return fail(CidrError::MixedAddressFamily);

    auto [lo, hi] = std::minmax(first.value(), last.value());
    auto family = lo.family;
    std::array<Network, 2> networks{
        Network(lo, family_bits(family)),
        Network(hi, family_bits(family)),
    };
    return try_wide_subnet(std::span<const Network>(networks));
}

Network wide_subnet(std::string_view start, std::string_view end) {
    return try_wide_subnet(start, end).value();
}

} // namespace cidrkit
