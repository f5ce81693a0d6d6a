#pragma once

#include <optional>
#include <span>
#include <string_view>
#include <vector>

#include "network.hpp"
#include "result.hpp"

namespace cidrkit {

/*
 * Merge two networks into one:
 *   192.168.0.0/24 + 192.168.1.0/24 = 192.168.0.0/23
 *   192.168.0.0/24 + 192.168.0.0/25 = 192.168.0.0/24
 * Equal-length networks must be adjacent and the lower one must sit on the
 * boundary of the merged prefix (192.168.1.0/24 + 192.168.2.0/24 fails).
 */
result<Network> try_supernet(const Network &a, const Network &b);
Network supernet(const Network &a, const Network &b);

/*
 * Repeatedly merge neighbouring networks until a pass merges nothing.
 * This is greedy: it finds every merge reachable from the sorted order, but
 * the result is not guaranteed to be the smallest possible cover for
 * arbitrary input.
 */
std::vector<Network> supernet_all(std::span<const Network> networks);
// absent entries are skipped
std::vector<Network> supernet_all(std::span<const std::optional<Network>> networks);

// smallest single network covering all of the given networks
result<Network> try_wide_subnet(std::span<const Network> networks);
Network wide_subnet(std::span<const Network> networks);

// smallest single network covering the addresses from start to end
result<Network> try_wide_subnet(std::string_view start, std::string_view end);
Network wide_subnet(std::string_view start, std::string_view end);

} // namespace cidrkit
